#include "hunt/book/Checksum.hpp"

#include <boost/crc.hpp>
#include <cstdio>

namespace hunt {

namespace {

void appendRounded(std::string& out, double v) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.0f", v);
  if (n > 0) out.append(buf, static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n) : sizeof(buf) - 1);
}

void appendSide(std::string& out, const std::vector<std::pair<double, double>>& side) {
  size_t i = 0;
  for (const auto& lv : side) {
    if (i++ == kChecksumDepth) break;
    appendRounded(out, lv.first);
    out.push_back(':');
    appendRounded(out, lv.second);
    out.push_back(':');
  }
}

} // namespace

std::string checksumPayload(const std::vector<std::pair<double, double>>& bids,
                            const std::vector<std::pair<double, double>>& asks) {
  std::string out;
  out.reserve((bids.size() + asks.size()) * 16);
  appendSide(out, bids);
  appendSide(out, asks);
  return out;
}

uint32_t checksumOf(const std::string& payload) {
  boost::crc_32_type crc;
  crc.process_bytes(payload.data(), payload.size());
  return static_cast<uint32_t>(crc.checksum()) & 0xFFFFFFFFu;
}

} // namespace hunt

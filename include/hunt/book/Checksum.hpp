#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace hunt {

// Levels that enter the book checksum on each side.
constexpr size_t kChecksumDepth = 25;

// "price:size:" for each bid (best first) then each ask (best first),
// values rendered as integer-rounded decimals.
std::string checksumPayload(const std::vector<std::pair<double, double>>& bids,
                            const std::vector<std::pair<double, double>>& asks);

// CRC32 of the payload bytes, masked to 32 bits.
uint32_t checksumOf(const std::string& payload);

inline uint32_t bookChecksum(const std::vector<std::pair<double, double>>& bids,
                             const std::vector<std::pair<double, double>>& asks) {
  return checksumOf(checksumPayload(bids, asks));
}

// The exchange transmits the checksum as a signed 32-bit integer.
inline uint32_t wireChecksum(int64_t v) {
  return static_cast<uint32_t>(static_cast<uint64_t>(v) & 0xFFFFFFFFULL);
}

} // namespace hunt

#include "hunt/book/TradeTape.hpp"

#include <utility>

namespace hunt {

TradeTape::TradeTape(size_t capacity)
  : capacity_(capacity == 0 ? 1 : capacity) {}

void TradeTape::push(TradeEvent t) {
  if (trades_.size() == capacity_) trades_.pop_front();
  trades_.push_back(std::move(t));
  ++totalSeen_;
}

std::optional<TradeEvent> TradeTape::last() const {
  if (trades_.empty()) return std::nullopt;
  return trades_.back();
}

TradeFlow TradeTape::flow(int64_t windowMs) const {
  TradeFlow f;
  if (trades_.empty()) return f;
  const int64_t cutoff = trades_.back().timestampMs - windowMs;
  for (auto it = trades_.rbegin(); it != trades_.rend(); ++it) {
    if (it->timestampMs <= cutoff) break;
    if (it->side == TradeSide::Buy) f.buyVolume += it->size;
    else                            f.sellVolume += it->size;
    ++f.trades;
  }
  return f;
}

void TradeTape::clear() {
  trades_.clear();
}

} // namespace hunt

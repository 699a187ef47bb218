#pragma once

#include "hunt/book/Types.hpp"

#include <cstdint>
#include <deque>
#include <optional>

namespace hunt {

struct TradeFlow {
  double buyVolume  = 0.0;
  double sellVolume = 0.0;
  size_t trades     = 0;

  double netVolume() const { return buyVolume - sellVolume; }
  // buy / (buy + sell); 0.5 when nothing traded
  double buyRatio() const {
    const double t = buyVolume + sellVolume;
    return t > 0.0 ? buyVolume / t : 0.5;
  }
};

// Bounded rolling tape of public trades; the oldest trade is evicted
// once capacity is reached.
class TradeTape {
public:
  explicit TradeTape(size_t capacity = 1000);

  void push(TradeEvent t);

  size_t size() const { return trades_.size(); }
  size_t capacity() const { return capacity_; }
  bool empty() const { return trades_.empty(); }
  uint64_t totalSeen() const { return totalSeen_; }

  std::optional<TradeEvent> last() const;
  const std::deque<TradeEvent>& trades() const { return trades_; }

  // Volume split by aggressor over trades with timestamp > (newest - windowMs).
  TradeFlow flow(int64_t windowMs) const;

  void clear();

private:
  size_t capacity_;
  std::deque<TradeEvent> trades_;
  uint64_t totalSeen_ = 0;
};

} // namespace hunt

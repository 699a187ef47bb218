#include "hunt/exec/StorageSink.hpp"
#include "hunt/util/Logger.hpp"

#include <iterator>

namespace hunt {

HotMirror::HotMirror(size_t maxTrades, size_t maxDepth)
  : maxTrades_(maxTrades), maxDepth_(maxDepth == 0 ? 1 : maxDepth) {}

HotMirror::Book& HotMirror::bookFor(const std::string& instrument) {
  auto it = books_.find(instrument);
  if (it == books_.end()) it = books_.emplace(instrument, Book(maxTrades_)).first;
  return it->second;
}

const HotMirror::Book* HotMirror::findBook(const std::string& instrument) const {
  auto it = books_.find(instrument);
  return it == books_.end() ? nullptr : &it->second;
}

void HotMirror::onLevel(const std::string& instrument, Side side, const LevelUpdate& lv) {
  std::lock_guard<std::mutex> lk(mx_);
  Book& b = bookFor(instrument);
  ++stats_.levelUpdates;

  auto apply = [&](auto& ladder) {
    if (lv.size <= 0.0) {
      ladder.erase(lv.price);
      return;
    }
    ladder[lv.price] = lv.size;
    // Keep the levels nearest the touch.
    while (ladder.size() > maxDepth_) ladder.erase(std::prev(ladder.end()));
  };
  if (side == Side::Bid) apply(b.bids);
  else                   apply(b.asks);
}

void HotMirror::onTrade(const TradeEvent& trade) {
  std::lock_guard<std::mutex> lk(mx_);
  bookFor(trade.instrument).trades.push(trade);
  ++stats_.trades;
}

void HotMirror::sync() {
  MirrorStats s;
  {
    std::lock_guard<std::mutex> lk(mx_);
    ++stats_.syncs;
    stats_.instruments = books_.size();
    s = stats_;
  }
  util::logger().log(util::LogLevel::Debug, "storage.hot.sync",
                     { {"instruments", std::to_string(s.instruments)},
                       {"levels", std::to_string(s.levelUpdates)},
                       {"trades", std::to_string(s.trades)} });
}

std::optional<std::pair<double, double>> HotMirror::bestBid(const std::string& instrument) const {
  std::lock_guard<std::mutex> lk(mx_);
  const Book* b = findBook(instrument);
  if (!b || b->bids.empty()) return std::nullopt;
  return *b->bids.begin();
}

std::optional<std::pair<double, double>> HotMirror::bestAsk(const std::string& instrument) const {
  std::lock_guard<std::mutex> lk(mx_);
  const Book* b = findBook(instrument);
  if (!b || b->asks.empty()) return std::nullopt;
  return *b->asks.begin();
}

double HotMirror::depthAt(const std::string& instrument, Side side, double price) const {
  std::lock_guard<std::mutex> lk(mx_);
  const Book* b = findBook(instrument);
  if (!b) return 0.0;
  if (side == Side::Bid) {
    auto it = b->bids.find(price);
    return it == b->bids.end() ? 0.0 : it->second;
  }
  auto it = b->asks.find(price);
  return it == b->asks.end() ? 0.0 : it->second;
}

std::vector<TradeEvent> HotMirror::recentTrades(const std::string& instrument, size_t n) const {
  std::vector<TradeEvent> out;
  std::lock_guard<std::mutex> lk(mx_);
  const Book* b = findBook(instrument);
  if (!b) return out;
  const auto& q = b->trades.trades();
  const size_t start = q.size() > n ? q.size() - n : 0;
  for (size_t i = start; i < q.size(); ++i) out.push_back(q[i]);
  return out;
}

double HotMirror::buySellRatio(const std::string& instrument, int64_t windowMs) const {
  std::lock_guard<std::mutex> lk(mx_);
  const Book* b = findBook(instrument);
  if (!b) return 0.5;
  return b->trades.flow(windowMs).buyRatio();
}

MirrorStats HotMirror::stats() const {
  std::lock_guard<std::mutex> lk(mx_);
  MirrorStats s = stats_;
  s.instruments = books_.size();
  return s;
}

void HotMirror::reset() {
  std::lock_guard<std::mutex> lk(mx_);
  books_.clear();
  stats_ = MirrorStats{};
}

} // namespace hunt

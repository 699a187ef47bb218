#pragma once

#include "hunt/book/TradeTape.hpp"
#include "hunt/book/Types.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hunt {

// Best-effort archival / observability pushes. Never blocks the core.
class StorageSink {
public:
  virtual ~StorageSink() = default;

  virtual void onLevel(const std::string& instrument, Side side, const LevelUpdate& lv) = 0;
  virtual void onTrade(const TradeEvent& trade) = 0;
  // Periodic flush from the sync timer.
  virtual void sync() = 0;
};

struct MirrorStats {
  uint64_t levelUpdates = 0;
  uint64_t trades       = 0;
  uint64_t syncs        = 0;
  size_t   instruments  = 0;
};

// In-memory mirror of the latest levels and recent trades per instrument.
class HotMirror final : public StorageSink {
public:
  explicit HotMirror(size_t maxTrades = 1000, size_t maxDepth = 400);

  void onLevel(const std::string& instrument, Side side, const LevelUpdate& lv) override;
  void onTrade(const TradeEvent& trade) override;
  void sync() override;

  std::optional<std::pair<double, double>> bestBid(const std::string& instrument) const;
  std::optional<std::pair<double, double>> bestAsk(const std::string& instrument) const;
  double depthAt(const std::string& instrument, Side side, double price) const;
  std::vector<TradeEvent> recentTrades(const std::string& instrument, size_t n) const;
  // buy / (buy + sell) volume over trades newer than newest - windowMs
  double buySellRatio(const std::string& instrument, int64_t windowMs) const;

  MirrorStats stats() const;
  void reset();

private:
  struct Book {
    std::map<double, double, std::greater<double>> bids;
    std::map<double, double> asks;
    TradeTape trades;
    explicit Book(size_t maxTrades) : trades(maxTrades) {}
  };

  Book& bookFor(const std::string& instrument);
  const Book* findBook(const std::string& instrument) const;

  size_t maxTrades_;
  size_t maxDepth_;

  mutable std::mutex mx_;
  std::unordered_map<std::string, Book> books_;
  MirrorStats stats_;
};

} // namespace hunt

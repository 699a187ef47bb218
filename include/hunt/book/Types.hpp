#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace hunt {

// --------- Sides ---------
enum class Side : uint8_t { Bid = 0, Ask = 1 };
enum class TradeSide : uint8_t { Buy = 0, Sell = 1 };

inline const char* sideName(Side s) { return s == Side::Bid ? "bid" : "ask"; }
inline const char* tradeSideName(TradeSide s) { return s == TradeSide::Buy ? "buy" : "sell"; }

// --------- Resting liquidity ---------
struct PriceLevel {
  double   price = 0.0;
  double   size  = 0.0;      // > 0 while stored
  uint32_t orderCount = 0;
};

// One entry of a snapshot or delta; size 0 means "remove".
struct LevelUpdate {
  double   price = 0.0;
  double   size  = 0.0;
  uint32_t orderCount = 0;
};
using LevelUpdates = std::vector<LevelUpdate>;

// Optional exchange sequencing carried by incremental feeds.
struct BookSeq {
  int64_t seqId     = -1;
  int64_t prevSeqId = -1;
};

// --------- Trades ---------
struct TradeEvent {
  std::string instrument;
  double      price = 0.0;
  double      size  = 0.0;
  TradeSide   side  = TradeSide::Buy;
  int64_t     timestampMs = 0;
  std::string tradeId;
};

// --------- Detection results ---------
enum class VoidDirection : uint8_t { Above, Below, Both };

// (low, high) price pair spanning a gap between adjacent resting levels.
using PriceGap = std::pair<double, double>;

struct WallHit {
  Side   side  = Side::Bid;
  double price = 0.0;
  double depth = 0.0;
};

} // namespace hunt

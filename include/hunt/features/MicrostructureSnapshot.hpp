#pragma once

#include "hunt/Time.hpp"
#include "hunt/book/TradeTape.hpp"
#include "hunt/book/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hunt {

enum class SpreadStatus : uint8_t { Normal, Wide, Extreme };
enum class OfiTrend : uint8_t { Stable, Rising, Falling };

const char* spreadStatusName(SpreadStatus s);
const char* ofiTrendName(OfiTrend t);

struct PressureIndex {
  double buyPressure  = 0.0;
  double sellPressure = 0.0;
  double netPressure  = 0.0;
  double imbalance    = 0.0;   // ofi / (bidDepth5 + askDepth5)
};

struct SpoofAlert {
  Side   side = Side::Bid;
  double price = 0.0;
  double priorDepth = 0.0;
  double currentDepth = 0.0;
};

struct GamblerSignals {
  bool panicSelling  = false;
  bool fomoBuying    = false;
  bool chasingRally  = false;
  bool panicCovering = false;
  std::vector<std::string> reasons;

  bool any() const { return panicSelling || fomoBuying || chasingRally || panicCovering; }
};

// Immutable view of one instrument's microstructure at the newest sample.
struct MicrostructureSnapshot {
  std::string instrument;
  TimePoint   time{};

  double bestBid = 0.0;
  double bestAsk = 0.0;
  double bestBidSize = 0.0;
  double bestAskSize = 0.0;
  double mid = 0.0;
  double wmp = 0.0;
  double spread = 0.0;
  double spreadBps = 0.0;
  SpreadStatus spreadStatus = SpreadStatus::Normal;

  double   ofi1s = 0.0;
  double   ofi5s = 0.0;
  OfiTrend ofiTrend = OfiTrend::Stable;
  PressureIndex pressure;

  double bidDepth5 = 0.0;
  double askDepth5 = 0.0;

  std::vector<PriceGap>  voidsAbove;
  std::vector<PriceGap>  voidsBelow;
  std::optional<WallHit> wall;
  bool liquiditySqueeze = false;

  TradeFlow tradeFlow;
  bool bookConsistent = false;
};

bool operator==(const MicrostructureSnapshot& a, const MicrostructureSnapshot& b);
inline bool operator!=(const MicrostructureSnapshot& a, const MicrostructureSnapshot& b) { return !(a == b); }

} // namespace hunt

#include "hunt/features/FeatureExtractor.hpp"
#include "hunt/util/Config.hpp"
#include "hunt/util/Logger.hpp"

#include <algorithm>
#include <cmath>

namespace hunt {

using util::LogLevel;
using util::logger;

namespace {

constexpr size_t kTopDepth = 5;
constexpr double kSpoofPriorMin = 10.0;
constexpr double kSpoofRemaining = 0.3;
constexpr size_t kSpoofMinSamples = 5;
constexpr double kGamblerPressure = 100.0;
constexpr double kChasingOfi = 50.0;
constexpr double kChasingWmpPremium = 1.001;

bool sameWall(const std::optional<WallHit>& a, const std::optional<WallHit>& b) {
  if (a.has_value() != b.has_value()) return false;
  if (!a) return true;
  return a->side == b->side && a->price == b->price && a->depth == b->depth;
}

} // namespace

// --------- Names / equality ---------
const char* spreadStatusName(SpreadStatus s) {
  switch (s) {
    case SpreadStatus::Normal:  return "normal";
    case SpreadStatus::Wide:    return "wide";
    case SpreadStatus::Extreme: return "extreme";
  }
  return "normal";
}

const char* ofiTrendName(OfiTrend t) {
  switch (t) {
    case OfiTrend::Stable:  return "stable";
    case OfiTrend::Rising:  return "rising";
    case OfiTrend::Falling: return "falling";
  }
  return "stable";
}

bool operator==(const MicrostructureSnapshot& a, const MicrostructureSnapshot& b) {
  return a.instrument == b.instrument && a.time == b.time
      && a.bestBid == b.bestBid && a.bestAsk == b.bestAsk
      && a.bestBidSize == b.bestBidSize && a.bestAskSize == b.bestAskSize
      && a.mid == b.mid && a.wmp == b.wmp
      && a.spread == b.spread && a.spreadBps == b.spreadBps
      && a.spreadStatus == b.spreadStatus
      && a.ofi1s == b.ofi1s && a.ofi5s == b.ofi5s && a.ofiTrend == b.ofiTrend
      && a.pressure.buyPressure == b.pressure.buyPressure
      && a.pressure.sellPressure == b.pressure.sellPressure
      && a.pressure.netPressure == b.pressure.netPressure
      && a.pressure.imbalance == b.pressure.imbalance
      && a.bidDepth5 == b.bidDepth5 && a.askDepth5 == b.askDepth5
      && a.voidsAbove == b.voidsAbove && a.voidsBelow == b.voidsBelow
      && sameWall(a.wall, b.wall)
      && a.liquiditySqueeze == b.liquiditySqueeze
      && a.tradeFlow.buyVolume == b.tradeFlow.buyVolume
      && a.tradeFlow.sellVolume == b.tradeFlow.sellVolume
      && a.tradeFlow.trades == b.tradeFlow.trades
      && a.bookConsistent == b.bookConsistent;
}

FeatureParams FeatureParams::fromConfig(const util::Config& cfg) {
  FeatureParams p;
  p.historyCapacity  = cfg.historyCapacity;
  p.voidGapThreshold = cfg.voidGapThreshold;
  p.voidScanLevels   = cfg.voidScanLevels;
  p.wallDepth        = cfg.featureWallDepth;
  p.wallScanLevels   = cfg.featureWallLevels;
  p.squeezeThreshold = cfg.squeezeThreshold;
  return p;
}

FeatureExtractor::FeatureExtractor(std::string instrument,
                                   const OrderBookReplica& book,
                                   const TradeTape& tape,
                                   FeatureParams params)
  : instrument_(std::move(instrument)), book_(book), tape_(tape), params_(params) {
  if (params_.historyCapacity == 0) params_.historyCapacity = 1;
}

// --------- Update ---------
MicrostructureSnapshot FeatureExtractor::update(TimePoint now) {
  DepthSample s;
  s.time = now;
  if (auto b = book_.bestBid()) s.bestBidSize = b->size;
  if (auto a = book_.bestAsk()) s.bestAskSize = a->size;
  s.bidDepth5 = book_.depth(Side::Bid, kTopDepth);
  s.askDepth5 = book_.depth(Side::Ask, kTopDepth);
  pushBounded(depth_, s);

  pushBounded(ofiHist_, ofi(1.0));
  pushBounded(spreadHist_, book_.spreadBps());
  ++updates_;

  MicrostructureSnapshot snap = snapshot();

  if (snap.liquiditySqueeze) {
    logger().log(LogLevel::Warn, "features.squeeze",
                 { {"inst", instrument_},
                   {"bid_depth5", util::fmt(snap.bidDepth5)},
                   {"ask_depth5", util::fmt(snap.askDepth5)} });
  }
  if (auto spoof = detectSpoofing()) {
    logger().log(LogLevel::Warn, "features.spoofing",
                 { {"inst", instrument_},
                   {"side", sideName(spoof->side)},
                   {"price", util::fmt(spoof->price)},
                   {"prior", util::fmt(spoof->priorDepth)},
                   {"now", util::fmt(spoof->currentDepth)} });
  }
  return snap;
}

MicrostructureSnapshot FeatureExtractor::snapshot() const {
  MicrostructureSnapshot s;
  s.instrument = instrument_;
  if (!depth_.empty()) s.time = depth_.back().time;

  if (auto b = book_.bestBid()) { s.bestBid = b->price; s.bestBidSize = b->size; }
  if (auto a = book_.bestAsk()) { s.bestAsk = a->price; s.bestAskSize = a->size; }
  s.mid       = book_.midPrice();
  s.wmp       = book_.weightedMidPrice();
  s.spread    = book_.spread();
  s.spreadBps = book_.spreadBps();
  s.spreadStatus = classifySpread(s.spreadBps);

  s.ofi1s    = ofi(1.0);
  s.ofi5s    = ofi(5.0);
  s.ofiTrend = ofiTrend(params_.trendWindow);
  s.pressure = pressureIndex();

  s.bidDepth5 = book_.depth(Side::Bid, kTopDepth);
  s.askDepth5 = book_.depth(Side::Ask, kTopDepth);

  s.voidsAbove = book_.detectLiquidityVoid(VoidDirection::Above, params_.voidGapThreshold, params_.voidScanLevels);
  s.voidsBelow = book_.detectLiquidityVoid(VoidDirection::Below, params_.voidGapThreshold, params_.voidScanLevels);
  s.wall = book_.detectWall(params_.wallDepth, params_.wallScanLevels);
  s.liquiditySqueeze = detectLiquiditySqueeze(params_.squeezeThreshold);

  s.tradeFlow = tape_.flow(params_.flowWindowMs);
  s.bookConsistent = book_.consistent();
  return s;
}

// --------- OFI ---------
double FeatureExtractor::ofi(double windowSec) const {
  if (depth_.size() < 2) return 0.0;
  const TimePoint newest = depth_.back().time;

  // Oldest sample still inside the window.
  const DepthSample* first = nullptr;
  size_t inWindow = 0;
  for (auto it = depth_.rbegin(); it != depth_.rend(); ++it) {
    if (secondsBetween(it->time, newest) > windowSec) break;
    first = &*it;
    ++inWindow;
  }
  if (inWindow < 2 || first == nullptr) return 0.0;

  const DepthSample& last = depth_.back();
  const double bidChange = last.bestBidSize - first->bestBidSize;
  const double askChange = last.bestAskSize - first->bestAskSize;
  return bidChange - askChange;
}

OfiTrend FeatureExtractor::ofiTrend(size_t window) const {
  if (window < 2 || ofiHist_.size() < window) return OfiTrend::Stable;

  // OLS slope over x = 0..n-1
  const size_t n = window;
  const size_t start = ofiHist_.size() - n;
  const double xMean = (static_cast<double>(n) - 1.0) / 2.0;
  double yMean = 0.0;
  for (size_t i = 0; i < n; ++i) yMean += ofiHist_[start + i];
  yMean /= static_cast<double>(n);

  double num = 0.0, den = 0.0;
  for (size_t i = 0; i < n; ++i) {
    const double dx = static_cast<double>(i) - xMean;
    num += dx * (ofiHist_[start + i] - yMean);
    den += dx * dx;
  }
  if (den == 0.0) return OfiTrend::Stable;
  return classifySlope(num / den);
}

OfiTrend FeatureExtractor::classifySlope(double slope) {
  if (slope > 0.01)  return OfiTrend::Rising;
  if (slope < -0.01) return OfiTrend::Falling;
  return OfiTrend::Stable;
}

// --------- Spread / depth ---------
SpreadStatus FeatureExtractor::classifySpread(double spreadBps) {
  if (spreadBps > 50.0) return SpreadStatus::Extreme;
  if (spreadBps > 20.0) return SpreadStatus::Wide;
  return SpreadStatus::Normal;
}

SpreadStatus FeatureExtractor::spreadStatus() const {
  return classifySpread(book_.spreadBps());
}

bool FeatureExtractor::detectLiquiditySqueeze(double threshold) const {
  const double bid = book_.depth(Side::Bid, kTopDepth);
  const double ask = book_.depth(Side::Ask, kTopDepth);
  const double total = bid + ask;
  if (total == 0.0) return false;
  return std::fabs(bid - ask) / total > threshold;
}

std::optional<SpoofAlert> FeatureExtractor::detectSpoofing() const {
  if (depth_.size() < kSpoofMinSamples) return std::nullopt;
  auto best = book_.bestBid();
  if (!best) return std::nullopt;

  const double prior = depth_[depth_.size() - 2].bestBidSize;
  if (prior > kSpoofPriorMin && best->size < prior * kSpoofRemaining) {
    return SpoofAlert{ Side::Bid, best->price, prior, best->size };
  }
  return std::nullopt;
}

PressureIndex FeatureExtractor::pressureIndex() const {
  PressureIndex p;
  const double o = ofi(1.0);
  p.buyPressure  = std::max(0.0, o);
  p.sellPressure = std::max(0.0, -o);
  p.netPressure  = p.buyPressure - p.sellPressure;
  const double total = book_.depth(Side::Bid, kTopDepth) + book_.depth(Side::Ask, kTopDepth);
  p.imbalance = total > 0.0 ? o / total : 0.0;
  return p;
}

// --------- Gambler behaviour ---------
GamblerSignals FeatureExtractor::classifyGamblerBehavior(const MicrostructureSnapshot& s) {
  GamblerSignals g;

  if (s.spreadStatus == SpreadStatus::Extreme
      && s.pressure.sellPressure > kGamblerPressure
      && s.ofiTrend == OfiTrend::Falling) {
    g.panicSelling = true;
    g.reasons.emplace_back("panic selling: extreme spread with heavy sell pressure");
  }

  if (s.spreadStatus == SpreadStatus::Wide
      && s.pressure.buyPressure > kGamblerPressure
      && s.ofiTrend == OfiTrend::Rising) {
    g.fomoBuying = true;
    g.reasons.emplace_back("fomo buying: wide spread with heavy buy pressure");
  }

  if (s.wmp > s.mid * kChasingWmpPremium && s.ofi1s > kChasingOfi) {
    g.chasingRally = true;
    g.reasons.emplace_back("chasing rally: weighted mid above mid with strong buying");
  }

  if (s.spreadStatus == SpreadStatus::Extreme
      && s.pressure.buyPressure > kGamblerPressure
      && s.ofiTrend == OfiTrend::Rising) {
    g.panicCovering = true;
    g.reasons.emplace_back("panic covering: shorts buying back into an extreme spread");
  }

  return g;
}

} // namespace hunt

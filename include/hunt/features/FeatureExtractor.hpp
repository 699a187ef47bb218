#pragma once

#include "hunt/Time.hpp"
#include "hunt/book/OrderBookReplica.hpp"
#include "hunt/book/TradeTape.hpp"
#include "hunt/features/MicrostructureSnapshot.hpp"

#include <deque>
#include <optional>
#include <string>

namespace hunt {

namespace util { class Config; }

struct FeatureParams {
  size_t historyCapacity  = 100;
  size_t trendWindow      = 10;
  double voidGapThreshold = 0.002;
  size_t voidScanLevels   = 50;
  double wallDepth        = 50.0;
  size_t wallScanLevels   = 20;
  double squeezeThreshold = 0.7;
  int64_t flowWindowMs    = 1000;

  static FeatureParams fromConfig(const util::Config& cfg);
};

// One top-of-book observation taken by update().
struct DepthSample {
  TimePoint time{};
  double bestBidSize = 0.0;
  double bestAskSize = 0.0;
  double bidDepth5   = 0.0;
  double askDepth5   = 0.0;
};

// Derives microstructure features from one replica and its trade tape.
// Reads the book synchronously on the writer's thread; holds references,
// so both must outlive the extractor.
class FeatureExtractor {
public:
  FeatureExtractor(std::string instrument,
                   const OrderBookReplica& book,
                   const TradeTape& tape,
                   FeatureParams params = {});

  // Record one sample, extend the bounded histories, return the new snapshot.
  MicrostructureSnapshot update(TimePoint now);

  // Recomputed from current state; identical between updates.
  MicrostructureSnapshot snapshot() const;

  // Best-level size change (bid minus ask) across samples within windowSec
  // of the newest one; 0 with fewer than two samples.
  double ofi(double windowSec) const;
  OfiTrend ofiTrend(size_t window) const;
  SpreadStatus spreadStatus() const;
  bool detectLiquiditySqueeze(double threshold) const;
  std::optional<SpoofAlert> detectSpoofing() const;
  PressureIndex pressureIndex() const;

  static SpreadStatus classifySpread(double spreadBps);
  static OfiTrend classifySlope(double slope);
  static GamblerSignals classifyGamblerBehavior(const MicrostructureSnapshot& s);

  const std::string& instrument() const { return instrument_; }
  const std::deque<DepthSample>& depthHistory() const { return depth_; }
  const std::deque<double>& ofiHistory() const { return ofiHist_; }
  const std::deque<double>& spreadHistory() const { return spreadHist_; }
  size_t updates() const { return updates_; }

private:
  template <typename T>
  void pushBounded(std::deque<T>& q, T v) {
    if (q.size() == params_.historyCapacity) q.pop_front();
    q.push_back(std::move(v));
  }

  std::string instrument_;
  const OrderBookReplica& book_;
  const TradeTape& tape_;
  FeatureParams params_;

  std::deque<DepthSample> depth_;
  std::deque<double> ofiHist_;
  std::deque<double> spreadHist_;
  size_t updates_ = 0;
};

} // namespace hunt

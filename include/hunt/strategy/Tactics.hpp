#pragma once

#include "hunt/Time.hpp"
#include "hunt/book/OrderBookReplica.hpp"
#include "hunt/book/Types.hpp"
#include "hunt/features/FeatureExtractor.hpp"
#include "hunt/strategy/Signal.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hunt {

namespace util { class Config; }

// What a tactic sees for one event.
struct TacticContext {
  const std::string&      instrument;
  const OrderBookReplica& book;
  const FeatureExtractor& features;
  TimePoint               now;
};

// ---------------------------------------------------------------------------
// Front-running: a large aggressive trade hitting a side whose resting depth
// has just collapsed. Trade ahead of the cascade, away from the shrinking side.
// ---------------------------------------------------------------------------
class FrontRunning {
public:
  static constexpr const char* kName = "front_running";

  struct Params {
    double largeTradeThreshold = 10.0;
    double depthDropThreshold  = 0.5;
    size_t historyLength       = 10;   // feature samples the peak is taken over
    double size                = 0.01;

    static Params fromConfig(const util::Config& cfg);
  };

  FrontRunning() : FrontRunning(Params{}) {}
  explicit FrontRunning(Params p) : p_(p) {}

  const char* name() const { return kName; }

  std::optional<Signal> onMarketData(const TacticContext&) { return std::nullopt; }
  std::optional<Signal> onOrderBook(const TacticContext&) { return std::nullopt; }
  std::optional<Signal> onTrade(const TacticContext& ctx, const TradeEvent& trade);

  // (prev - current) / prev >= threshold; false when prev is 0.
  bool checkDepthDrop(double current, double prev) const;

  const Params& params() const { return p_; }

private:
  Params p_;
};

// ---------------------------------------------------------------------------
// Wall-riding: rest a bid one tick above a large bid that has persisted long
// enough to be trusted.
// ---------------------------------------------------------------------------
struct WallObservation {
  double    price = 0.0;
  double    depth = 0.0;
  TimePoint firstSeen{};
  TimePoint lastSeen{};
};

class WallRiding {
public:
  static constexpr const char* kName = "wall_riding";

  struct Params {
    double depthThreshold = 100.0;
    double persistenceSec = 5.0;
    double absenceSec     = 2.0;
    size_t scanLevels     = 20;
    double tickSize       = 0.1;
    double size           = 0.01;
    double confidence     = 0.7;

    static Params fromConfig(const util::Config& cfg);
  };

  WallRiding() : WallRiding(Params{}) {}
  explicit WallRiding(Params p) : p_(p) {}

  const char* name() const { return kName; }

  std::optional<Signal> onMarketData(const TacticContext&) { return std::nullopt; }
  std::optional<Signal> onOrderBook(const TacticContext& ctx);
  std::optional<Signal> onTrade(const TacticContext&, const TradeEvent&) { return std::nullopt; }

  // Highest-priced wall whose age reached the persistence threshold.
  std::optional<WallObservation> canRideWall(const std::string& instrument, TimePoint now) const;

  // Observed walls for one instrument, highest price first.
  std::vector<WallObservation> walls(const std::string& instrument) const;

  const Params& params() const { return p_; }

private:
  void observe(const TacticContext& ctx);

  using WallMap = std::map<double, WallObservation, std::greater<double>>;

  Params p_;
  std::unordered_map<std::string, WallMap> walls_;
};

// ---------------------------------------------------------------------------
// Spread-capturing: quote both sides while the spread sits in a wide band.
// ---------------------------------------------------------------------------
class SpreadCapturing {
public:
  static constexpr const char* kName = "spread_capturing";

  struct Params {
    double minSpreadBps = 50.0;
    double maxSpreadBps = 200.0;
    double size         = 0.01;
    double confidence   = 0.8;

    static Params fromConfig(const util::Config& cfg);
  };

  SpreadCapturing() : SpreadCapturing(Params{}) {}
  explicit SpreadCapturing(Params p) : p_(p) {}

  const char* name() const { return kName; }

  std::optional<Signal> onMarketData(const TacticContext&) { return std::nullopt; }
  std::optional<Signal> onOrderBook(const TacticContext& ctx);
  std::optional<Signal> onTrade(const TacticContext&, const TradeEvent&) { return std::nullopt; }

  const Params& params() const { return p_; }

private:
  Params p_;
};

} // namespace hunt

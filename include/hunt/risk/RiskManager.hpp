#pragma once

#include "hunt/exec/ExecutionClient.hpp"
#include "hunt/strategy/Signal.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hunt {

namespace util { class Config; }

struct RiskLimits {
  double maxPositionSize = 1000.0;   // notional per order
  double maxDailyLoss    = 0.05;
  double leverageLimit   = 20.0;
  double kellyWinRate    = 0.55;
  double kellyAvgWin     = 0.02;
  double kellyAvgLoss    = 0.015;

  static RiskLimits fromConfig(const util::Config& cfg);
};

enum class RejectReason : uint8_t {
  None,
  CircuitBreaker,
  EmergencyStop,
  DailyLoss,
  PositionSize,
  Margin,
  Leverage
};

const char* rejectReasonName(RejectReason r);

// Outcome of the pre-trade gate. Rejections are values, never exceptions.
struct RiskDecision {
  bool         approved = false;
  RejectReason code = RejectReason::None;
  std::string  reason;
  double       kellySize = 0.0;      // advisory notional cap
  bool         aboveKelly = false;

  explicit operator bool() const { return approved; }
};

struct RiskMetrics {
  double totalBalance       = 0.0;
  double availableBalance   = 0.0;
  double totalPositionValue = 0.0;
  double unrealizedPnl      = 0.0;
  double dailyPnl           = 0.0;
  double leverage           = 0.0;
  double dailyLossRatio     = 0.0;   // negative = loss
};

struct TradeResult {
  std::string instrument;
  std::optional<double> realizedPnl;
};

struct RiskSummary {
  RiskMetrics metrics;
  double   dailyStartBalance = 0.0;
  double   dailyPnlPercent   = 0.0;
  uint64_t totalTrades   = 0;
  uint64_t winningTrades = 0;
  uint64_t losingTrades  = 0;
  double   winRate       = 0.0;
  bool     emergencyStop = false;
};

// Synchronous pre-trade / post-trade gate.
class RiskManager {
public:
  explicit RiskManager(RiskLimits limits = {});

  // Optional breaker gate consulted before every other check.
  void setBreakerGate(std::function<bool()> isSafe) { breakerSafe_ = std::move(isSafe); }

  void updateMetrics(const Balance& balance, const std::vector<Position>& positions);

  RiskDecision preTradeCheck(const std::string& instrument, OrderSide side, double size, double price);
  RiskDecision check(const Signal& s);

  void postTradeCheck(const TradeResult& r);

  // Sets the emergency stop once the hard daily loss is reached.
  bool checkEmergencyStop();

  // Kelly fraction of the total balance, clamped to [0, 0.25].
  double kellySize() const;

  void enableEmergencyStop(const std::string& reason = "manual");
  void disableEmergencyStop();
  bool emergencyStopped() const;

  void resetDaily();

  RiskMetrics metrics() const;
  RiskSummary summary() const;
  const RiskLimits& limits() const { return limits_; }

private:
  double kellyUnlocked() const;
  RiskDecision reject(RejectReason code, std::string reason);

  RiskLimits limits_;
  std::function<bool()> breakerSafe_;

  mutable std::mutex mx_;
  RiskMetrics m_;
  double startBalance_      = 0.0;
  double dailyStartBalance_ = 0.0;
  TimePoint dailyStartTime_ = Clock::now();
  uint64_t totalTrades_   = 0;
  uint64_t winningTrades_ = 0;
  uint64_t losingTrades_  = 0;
  bool emergencyStop_ = false;
};

} // namespace hunt

#include "hunt/risk/RiskManager.hpp"
#include "hunt/util/Config.hpp"
#include "hunt/util/Logger.hpp"
#include "hunt/util/Metrics.hpp"

#include <algorithm>
#include <cmath>

namespace hunt {

using util::LogLevel;
using util::logger;

namespace {
constexpr double kKellyCap      = 0.25;
constexpr double kWarnLossRatio = -0.03;
constexpr double kAlarmLossRatio = -0.04;
} // namespace

const char* rejectReasonName(RejectReason r) {
  switch (r) {
    case RejectReason::None:           return "none";
    case RejectReason::CircuitBreaker: return "circuit_breaker";
    case RejectReason::EmergencyStop:  return "emergency_stop";
    case RejectReason::DailyLoss:      return "daily_loss";
    case RejectReason::PositionSize:   return "position_size";
    case RejectReason::Margin:         return "margin";
    case RejectReason::Leverage:       return "leverage";
  }
  return "none";
}

RiskLimits RiskLimits::fromConfig(const util::Config& cfg) {
  RiskLimits l;
  l.maxPositionSize = cfg.maxPositionSize;
  l.maxDailyLoss    = cfg.maxDailyLoss;
  l.leverageLimit   = cfg.leverageLimit;
  l.kellyWinRate    = cfg.kellyWinRate;
  l.kellyAvgWin     = cfg.kellyAvgWin;
  l.kellyAvgLoss    = cfg.kellyAvgLoss;
  return l;
}

RiskManager::RiskManager(RiskLimits limits) : limits_(limits) {
  logger().log(LogLevel::Info, "risk.limits",
               { {"max_daily_loss", util::fmt(limits_.maxDailyLoss)},
                 {"leverage_limit", util::fmt(limits_.leverageLimit)},
                 {"max_position", util::fmt(limits_.maxPositionSize)} });
}

// --------- Metrics ---------
void RiskManager::updateMetrics(const Balance& balance, const std::vector<Position>& positions) {
  std::lock_guard<std::mutex> lk(mx_);
  m_.totalBalance     = balance.total;
  m_.availableBalance = balance.available;

  if (startBalance_ == 0.0) {
    startBalance_      = m_.totalBalance;
    dailyStartBalance_ = m_.totalBalance;
    logger().log(LogLevel::Info, "risk.start_balance", { {"balance", util::fmt(startBalance_)} });
  }

  double exposure = 0.0, upl = 0.0;
  for (const auto& p : positions) {
    exposure += std::fabs(p.notional);
    upl      += p.unrealizedPnl;
  }
  m_.totalPositionValue = exposure;
  m_.unrealizedPnl      = upl;
  if (m_.totalBalance > 0.0) m_.leverage = exposure / m_.totalBalance;

  m_.dailyPnl = m_.totalBalance - dailyStartBalance_;
  if (dailyStartBalance_ > 0.0) m_.dailyLossRatio = m_.dailyPnl / dailyStartBalance_;

  logger().log(LogLevel::Debug, "risk.metrics",
               { {"balance", util::fmt(m_.totalBalance)},
                 {"exposure", util::fmt(m_.totalPositionValue)},
                 {"leverage", util::fmt(m_.leverage, 4)},
                 {"daily_pnl", util::fmt(m_.dailyPnl)} });
}

// --------- Pre-trade ---------
RiskDecision RiskManager::reject(RejectReason code, std::string reason) {
  RiskDecision d;
  d.approved = false;
  d.code     = code;
  d.reason   = std::move(reason);
  HUNT_METRIC_HIT(std::string("risk.rejected.") + rejectReasonName(code));
  logger().log(LogLevel::Warn, "risk.rejected",
               { {"code", rejectReasonName(code)}, {"reason", d.reason} });
  return d;
}

RiskDecision RiskManager::preTradeCheck(const std::string& instrument, OrderSide side,
                                        double size, double price) {
  logger().log(LogLevel::Debug, "risk.pre_trade",
               { {"inst", instrument}, {"side", orderSideName(side)},
                 {"size", util::fmt(size)}, {"price", util::fmt(price)} });

  if (breakerSafe_ && !breakerSafe_()) {
    return reject(RejectReason::CircuitBreaker, "circuit breaker tripped");
  }

  std::lock_guard<std::mutex> lk(mx_);

  if (emergencyStop_) {
    return reject(RejectReason::EmergencyStop, "emergency stop active");
  }

  if (m_.dailyLossRatio <= -limits_.maxDailyLoss) {
    emergencyStop_ = true;
    logger().log(LogLevel::Critical, "risk.emergency_stop",
                 { {"daily_loss_ratio", util::fmt(m_.dailyLossRatio, 4)} });
    return reject(RejectReason::DailyLoss,
                  "daily loss " + util::fmt(m_.dailyLossRatio * 100.0, 4) + "% reached the hard stop");
  }

  const double notional = size * price;
  if (notional > limits_.maxPositionSize) {
    return reject(RejectReason::PositionSize,
                  "notional " + util::fmt(notional) + " exceeds " + util::fmt(limits_.maxPositionSize));
  }

  const double margin = notional / limits_.leverageLimit;
  if (m_.availableBalance < margin) {
    return reject(RejectReason::Margin,
                  "margin " + util::fmt(margin) + " exceeds available " + util::fmt(m_.availableBalance));
  }

  if (m_.totalBalance <= 0.0) {
    return reject(RejectReason::Leverage, "no balance to carry leverage");
  }
  const double newLeverage = (m_.totalPositionValue + notional) / m_.totalBalance;
  if (newLeverage > limits_.leverageLimit) {
    return reject(RejectReason::Leverage,
                  "leverage " + util::fmt(newLeverage, 4) + "x exceeds " + util::fmt(limits_.leverageLimit) + "x");
  }

  RiskDecision d;
  d.approved  = true;
  d.reason    = "ok";
  d.kellySize = kellyUnlocked();
  if (notional > d.kellySize) {
    d.aboveKelly = true;
    logger().log(LogLevel::Warn, "risk.above_kelly",
                 { {"inst", instrument}, {"notional", util::fmt(notional)},
                   {"kelly", util::fmt(d.kellySize)} });
  }
  HUNT_METRIC_HIT("risk.approved");
  return d;
}

RiskDecision RiskManager::check(const Signal& s) {
  const OrderSide side = s.action == SignalAction::Sell ? OrderSide::Sell : OrderSide::Buy;
  return preTradeCheck(s.instrument, side, s.size, s.price);
}

double RiskManager::kellyUnlocked() const {
  if (limits_.kellyAvgWin <= 0.0) return 0.0;
  const double p = limits_.kellyWinRate;
  double f = (p * limits_.kellyAvgWin - (1.0 - p) * limits_.kellyAvgLoss) / limits_.kellyAvgWin;
  f = std::clamp(f, 0.0, kKellyCap);
  return m_.totalBalance * f;
}

double RiskManager::kellySize() const {
  std::lock_guard<std::mutex> lk(mx_);
  return kellyUnlocked();
}

// --------- Post-trade ---------
void RiskManager::postTradeCheck(const TradeResult& r) {
  std::lock_guard<std::mutex> lk(mx_);
  ++totalTrades_;
  if (r.realizedPnl) {
    const bool win = *r.realizedPnl > 0.0;
    if (win) ++winningTrades_;
    else     ++losingTrades_;
    logger().log(LogLevel::Info, win ? "risk.trade_profit" : "risk.trade_loss",
                 { {"inst", r.instrument}, {"pnl", util::fmt(*r.realizedPnl)},
                   {"trade", std::to_string(totalTrades_)} });
  }

  if (m_.dailyLossRatio < kWarnLossRatio) {
    logger().log(LogLevel::Warn, "risk.daily_loss_warning",
                 { {"ratio", util::fmt(m_.dailyLossRatio, 4)}, {"advice", "reduce size"} });
  }
  if (m_.dailyLossRatio < kAlarmLossRatio) {
    logger().log(LogLevel::Warn, "risk.daily_loss_alarm",
                 { {"ratio", util::fmt(m_.dailyLossRatio, 4)}, {"advice", "consider closing positions"} });
  }
}

bool RiskManager::checkEmergencyStop() {
  std::lock_guard<std::mutex> lk(mx_);
  if (m_.dailyLossRatio <= -limits_.maxDailyLoss) {
    if (!emergencyStop_) {
      logger().log(LogLevel::Critical, "risk.emergency_stop",
                   { {"daily_loss_ratio", util::fmt(m_.dailyLossRatio, 4)} });
    }
    emergencyStop_ = true;
    return true;
  }
  return false;
}

// --------- Admin ---------
void RiskManager::enableEmergencyStop(const std::string& reason) {
  std::lock_guard<std::mutex> lk(mx_);
  emergencyStop_ = true;
  logger().log(LogLevel::Critical, "risk.emergency_stop_enabled", { {"reason", reason} });
}

void RiskManager::disableEmergencyStop() {
  std::lock_guard<std::mutex> lk(mx_);
  emergencyStop_ = false;
  logger().log(LogLevel::Info, "risk.emergency_stop_disabled", {});
}

bool RiskManager::emergencyStopped() const {
  std::lock_guard<std::mutex> lk(mx_);
  return emergencyStop_;
}

void RiskManager::resetDaily() {
  std::lock_guard<std::mutex> lk(mx_);
  dailyStartBalance_ = m_.totalBalance;
  dailyStartTime_    = Clock::now();
  m_.dailyPnl        = 0.0;
  m_.dailyLossRatio  = 0.0;
  logger().log(LogLevel::Info, "risk.daily_reset", { {"start_balance", util::fmt(dailyStartBalance_)} });
}

RiskMetrics RiskManager::metrics() const {
  std::lock_guard<std::mutex> lk(mx_);
  return m_;
}

RiskSummary RiskManager::summary() const {
  std::lock_guard<std::mutex> lk(mx_);
  RiskSummary s;
  s.metrics           = m_;
  s.dailyStartBalance = dailyStartBalance_;
  s.dailyPnlPercent   = dailyStartBalance_ > 0.0 ? m_.dailyPnl / dailyStartBalance_ * 100.0 : 0.0;
  s.totalTrades       = totalTrades_;
  s.winningTrades     = winningTrades_;
  s.losingTrades      = losingTrades_;
  s.winRate           = totalTrades_ > 0 ? static_cast<double>(winningTrades_) / static_cast<double>(totalTrades_) : 0.0;
  s.emergencyStop     = emergencyStop_;
  return s;
}

} // namespace hunt

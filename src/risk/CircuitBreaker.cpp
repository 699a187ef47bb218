#include "hunt/risk/CircuitBreaker.hpp"
#include "hunt/util/Config.hpp"
#include "hunt/util/Logger.hpp"
#include "hunt/util/Metrics.hpp"

#include <numeric>
#include <vector>

namespace hunt {

using util::LogLevel;
using util::logger;

BreakerParams BreakerParams::fromConfig(const util::Config& cfg) {
  BreakerParams p;
  p.maxDailyLoss  = cfg.maxDailyLoss;
  p.maxLatencyMs  = cfg.maxLatencyMs;
  p.period        = std::chrono::milliseconds(cfg.monitorPeriodMs);
  p.latencyWindow = cfg.latencyWindow;
  return p;
}

CircuitBreaker::CircuitBreaker(ExecutionClient& exec, BreakerParams p)
  : exec_(exec), p_(p) {
  if (p_.latencyWindow == 0) p_.latencyWindow = 1;
}

CircuitBreaker::~CircuitBreaker() {
  stop();
}

void CircuitBreaker::start() {
  if (task_) return;

  auto bal = exec_.balance();
  if (bal) {
    std::lock_guard<std::mutex> lk(mx_);
    state_.dailyStartBalance = bal->total;
    state_.currentBalance    = bal->total;
  } else {
    logger().log(LogLevel::Warn, "breaker.start_balance_failed", { {"err", bal.error().describe()} });
  }
  logger().log(LogLevel::Info, "breaker.started",
               { {"start_balance", util::fmt(bal ? bal->total : 0.0)},
                 {"max_loss", util::fmt(p_.maxDailyLoss)},
                 {"max_latency_ms", util::fmt(p_.maxLatencyMs)} });

  task_ = std::make_unique<rt::PeriodicTask>("risk-monitor", p_.period, [this] { tick(); });
  task_->start();
}

void CircuitBreaker::stop() {
  if (!task_) return;
  task_->stop();
  task_.reset();
  logger().log(LogLevel::Info, "breaker.stopped", {});
}

void CircuitBreaker::watch(const std::string& instrument) {
  std::lock_guard<std::mutex> lk(mx_);
  watched_.insert(instrument);
}

double CircuitBreaker::averageLatency() const {
  if (state_.latencyMs.empty()) return 0.0;
  const double sum = std::accumulate(state_.latencyMs.begin(), state_.latencyMs.end(), 0.0);
  return sum / static_cast<double>(state_.latencyMs.size());
}

// --------- Monitor ---------
void CircuitBreaker::tick() {
  if (!isSafe()) return;   // tripped: wait for a manual reset

  auto bal = exec_.balance();
  const double latency = exec_.averageLatencyMs();

  std::string reason, detail;
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (bal) {
      state_.currentBalance = bal->total;
      if (state_.dailyStartBalance <= 0.0) state_.dailyStartBalance = bal->total;
    }
    if (latency > 0.0) {
      state_.latencyMs.push_back(latency);
      while (state_.latencyMs.size() > p_.latencyWindow) state_.latencyMs.pop_front();
    }

    if (state_.dailyStartBalance > 0.0) {
      const double loss = (state_.dailyStartBalance - state_.currentBalance) / state_.dailyStartBalance;
      if (loss > p_.maxDailyLoss) {
        reason = "daily_loss";
        detail = "daily loss " + util::fmt(loss * 100.0, 4) + "% over limit";
      }
    }
    if (reason.empty() && !state_.latencyMs.empty()) {
      const double avg = averageLatency();
      if (avg > p_.maxLatencyMs) {
        reason = "latency";
        detail = "average latency " + util::fmt(avg, 4) + "ms over limit";
      }
    }
  }
  if (!bal) {
    logger().log(LogLevel::Warn, "breaker.balance_failed", { {"err", bal.error().describe()} });
  }
  HUNT_METRIC_SET("risk.latency_ms", latency);

  if (!reason.empty()) trip(reason, detail);
}

void CircuitBreaker::trip(const std::string& reason, const std::string& detail) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (state_.triggered) return;
    state_.triggered     = true;
    state_.triggerReason = reason;
    state_.triggerTime   = Clock::now();
    state_.triggerTimeMs = nowMs();
    ++trips_;
  }
  triggered_.store(true, std::memory_order_release);
  HUNT_METRIC_HIT("risk.breaker_trips");
  logger().log(LogLevel::Critical, "breaker.tripped", { {"reason", reason}, {"detail", detail} });

  cancelEverything();
}

void CircuitBreaker::cancelEverything() {
  std::set<std::string> targets;
  {
    std::lock_guard<std::mutex> lk(mx_);
    targets = watched_;
  }
  auto pos = exec_.positions();
  if (pos) {
    for (const auto& p : *pos) targets.insert(p.instrument);
  } else {
    logger().log(LogLevel::Error, "breaker.positions_failed", { {"err", pos.error().describe()} });
  }

  size_t cancelled = 0;
  for (const auto& inst : targets) {
    auto r = exec_.cancelAll(inst);
    if (r) {
      cancelled += *r;
    } else {
      logger().log(LogLevel::Error, "breaker.cancel_failed",
                   { {"inst", inst}, {"err", r.error().describe()} });
    }
  }
  logger().log(LogLevel::Critical, "breaker.cancelled_all",
               { {"instruments", std::to_string(targets.size())},
                 {"orders", std::to_string(cancelled)} });
}

void CircuitBreaker::reset() {
  double start = 0.0;
  {
    std::lock_guard<std::mutex> lk(mx_);
    state_.triggered = false;
    state_.triggerReason.clear();
    state_.triggerTime = TimePoint{};
    state_.triggerTimeMs = 0;
    state_.dailyStartBalance = state_.currentBalance;
    state_.latencyMs.clear();
    start = state_.dailyStartBalance;
  }
  triggered_.store(false, std::memory_order_release);
  logger().log(LogLevel::Warn, "breaker.reset", { {"start_balance", util::fmt(start)} });
}

BreakerStatus CircuitBreaker::status() const {
  std::lock_guard<std::mutex> lk(mx_);
  BreakerStatus s;
  s.triggered         = state_.triggered;
  s.reason            = state_.triggerReason;
  s.triggerTimeMs     = state_.triggerTimeMs;
  s.maxDailyLoss      = p_.maxDailyLoss;
  s.maxLatencyMs      = p_.maxLatencyMs;
  s.avgLatencyMs      = averageLatency();
  s.dailyStartBalance = state_.dailyStartBalance;
  s.currentBalance    = state_.currentBalance;
  s.trips             = trips_;
  if (state_.dailyStartBalance > 0.0) {
    s.dailyLoss = (state_.dailyStartBalance - state_.currentBalance) / state_.dailyStartBalance;
  }
  return s;
}

} // namespace hunt

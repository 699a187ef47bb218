#pragma once

#include "hunt/Time.hpp"
#include "hunt/exec/ExecutionClient.hpp"
#include "hunt/rt/PeriodicTask.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace hunt {

namespace util { class Config; }

struct BreakerParams {
  double maxDailyLoss = 0.05;     // ratio of the day's starting balance
  double maxLatencyMs = 100.0;
  std::chrono::milliseconds period{1000};
  size_t latencyWindow = 100;

  static BreakerParams fromConfig(const util::Config& cfg);
};

// Written only by the monitor loop.
struct RiskState {
  double dailyStartBalance = 0.0;
  double currentBalance    = 0.0;
  std::deque<double> latencyMs;
  bool        triggered = false;
  std::string triggerReason;
  TimePoint   triggerTime{};
  int64_t     triggerTimeMs = 0;
};

struct BreakerStatus {
  bool        triggered = false;
  std::string reason;
  int64_t     triggerTimeMs = 0;
  double      dailyLoss = 0.0;       // positive = loss
  double      maxDailyLoss = 0.0;
  double      avgLatencyMs = 0.0;
  double      maxLatencyMs = 0.0;
  double      dailyStartBalance = 0.0;
  double      currentBalance = 0.0;
  uint64_t    trips = 0;
};

// Independent kill switch. Polls balance and request latency every period,
// trips on excessive daily loss or latency, cancels resting orders once per
// trip and stays tripped until reset().
class CircuitBreaker {
public:
  CircuitBreaker(ExecutionClient& exec, BreakerParams p = {});
  ~CircuitBreaker();

  CircuitBreaker(const CircuitBreaker&)            = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  // Takes the day's starting balance, then runs tick() every period.
  void start();
  void stop();

  // One monitor iteration.
  void tick();

  bool isSafe() const { return !triggered_.load(std::memory_order_acquire); }

  // Manual recovery; the current balance becomes the day's start.
  void reset();

  // Instruments cancelled on a trip in addition to open positions.
  void watch(const std::string& instrument);

  BreakerStatus status() const;

private:
  void trip(const std::string& reason, const std::string& detail);
  void cancelEverything();
  double averageLatency() const;   // expects mx_ held

  ExecutionClient& exec_;
  BreakerParams p_;

  mutable std::mutex mx_;
  RiskState state_;
  std::set<std::string> watched_;
  uint64_t trips_ = 0;

  std::atomic<bool> triggered_{false};
  std::unique_ptr<rt::PeriodicTask> task_;
};

} // namespace hunt

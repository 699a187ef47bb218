#pragma once

#include "hunt/strategy/Signal.hpp"
#include "hunt/strategy/Tactics.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace hunt {

namespace util { class Config; }

using Tactic = std::variant<FrontRunning, WallRiding, SpreadCapturing>;

struct TacticStats {
  std::string name;
  bool     enabled   = true;
  uint64_t generated = 0;
  uint64_t executed  = 0;

  double executionRate() const {
    return generated == 0 ? 0.0 : static_cast<double>(executed) / static_cast<double>(generated);
  }
};

// Runs every enabled tactic once per event, in registration order, while the
// safety gate (the circuit breaker) allows it.
class StrategyEngine {
public:
  using SafetyGate = std::function<bool()>;

  StrategyEngine() = default;
  explicit StrategyEngine(std::vector<Tactic> tactics);

  // front_running, wall_riding, spread_capturing with configured parameters
  static StrategyEngine fromConfig(const util::Config& cfg);

  void setSafetyGate(SafetyGate gate) { gate_ = std::move(gate); }
  void add(Tactic t);

  std::vector<Signal> onMarketData(const TacticContext& ctx);
  std::vector<Signal> onOrderBook(const TacticContext& ctx);
  std::vector<Signal> onTrade(const TacticContext& ctx, const TradeEvent& trade);

  // Called by the orchestrator once a signal reached execution.
  void markExecuted(const std::string& strategy);

  bool enable(const std::string& name);
  bool disable(const std::string& name);
  bool enabled(const std::string& name) const;

  std::vector<TacticStats> stats() const;
  void resetStats();

  uint64_t suppressed() const { return suppressed_; }
  size_t size() const { return slots_.size(); }

  // Typed access, e.g. engine.find<WallRiding>()
  template <typename T>
  T* find() {
    for (auto& s : slots_) if (auto* t = std::get_if<T>(&s.tactic)) return t;
    return nullptr;
  }

private:
  struct Slot {
    Tactic      tactic;
    TacticStats stats;
  };

  template <typename Fn>
  std::vector<Signal> run(const char* hook, Fn&& fn);

  Slot* slot(const std::string& name);
  const Slot* slot(const std::string& name) const;

  std::vector<Slot> slots_;
  SafetyGate gate_;
  uint64_t suppressed_ = 0;
};

} // namespace hunt

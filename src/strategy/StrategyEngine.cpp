#include "hunt/strategy/StrategyEngine.hpp"
#include "hunt/util/Config.hpp"
#include "hunt/util/Logger.hpp"
#include "hunt/util/Metrics.hpp"

namespace hunt {

using util::LogLevel;
using util::logger;

namespace {

const char* tacticName(const Tactic& t) {
  return std::visit([](const auto& x) { return x.name(); }, t);
}

} // namespace

StrategyEngine::StrategyEngine(std::vector<Tactic> tactics) {
  for (auto& t : tactics) add(std::move(t));
}

StrategyEngine StrategyEngine::fromConfig(const util::Config& cfg) {
  std::vector<Tactic> t;
  t.emplace_back(FrontRunning(FrontRunning::Params::fromConfig(cfg)));
  t.emplace_back(WallRiding(WallRiding::Params::fromConfig(cfg)));
  t.emplace_back(SpreadCapturing(SpreadCapturing::Params::fromConfig(cfg)));
  return StrategyEngine(std::move(t));
}

void StrategyEngine::add(Tactic t) {
  Slot s{ std::move(t), {} };
  s.stats.name = tacticName(s.tactic);
  logger().log(LogLevel::Info, "strategy.registered", { {"name", s.stats.name} });
  slots_.push_back(std::move(s));
}

template <typename Fn>
std::vector<Signal> StrategyEngine::run(const char* hook, Fn&& fn) {
  std::vector<Signal> out;
  if (gate_ && !gate_()) {
    ++suppressed_;
    return out;
  }
  for (auto& s : slots_) {
    if (!s.stats.enabled) continue;
    std::optional<Signal> sig = std::visit(fn, s.tactic);
    if (!sig) continue;

    ++s.stats.generated;
    HUNT_METRIC_HIT("strategy.signals." + s.stats.name);
    logger().log(LogLevel::Info, "strategy.signal",
                 { {"strategy", sig->strategy}, {"hook", hook},
                   {"inst", sig->instrument}, {"action", actionName(sig->action)},
                   {"type", orderTypeName(sig->type)},
                   {"price", util::fmt(sig->price)}, {"size", util::fmt(sig->size)},
                   {"confidence", util::fmt(sig->confidence, 3)},
                   {"reason", sig->reason} });
    out.push_back(std::move(*sig));
  }
  return out;
}

std::vector<Signal> StrategyEngine::onMarketData(const TacticContext& ctx) {
  return run("market_data", [&](auto& t) { return t.onMarketData(ctx); });
}

std::vector<Signal> StrategyEngine::onOrderBook(const TacticContext& ctx) {
  return run("orderbook", [&](auto& t) { return t.onOrderBook(ctx); });
}

std::vector<Signal> StrategyEngine::onTrade(const TacticContext& ctx, const TradeEvent& trade) {
  return run("trade", [&](auto& t) { return t.onTrade(ctx, trade); });
}

// --------- Bookkeeping ---------
StrategyEngine::Slot* StrategyEngine::slot(const std::string& name) {
  for (auto& s : slots_) if (s.stats.name == name) return &s;
  return nullptr;
}

const StrategyEngine::Slot* StrategyEngine::slot(const std::string& name) const {
  for (const auto& s : slots_) if (s.stats.name == name) return &s;
  return nullptr;
}

void StrategyEngine::markExecuted(const std::string& strategy) {
  if (Slot* s = slot(strategy)) ++s->stats.executed;
}

bool StrategyEngine::enable(const std::string& name) {
  Slot* s = slot(name);
  if (!s) return false;
  s->stats.enabled = true;
  logger().log(LogLevel::Info, "strategy.enabled", { {"name", name} });
  return true;
}

bool StrategyEngine::disable(const std::string& name) {
  Slot* s = slot(name);
  if (!s) return false;
  s->stats.enabled = false;
  logger().log(LogLevel::Info, "strategy.disabled", { {"name", name} });
  return true;
}

bool StrategyEngine::enabled(const std::string& name) const {
  const Slot* s = slot(name);
  return s && s->stats.enabled;
}

std::vector<TacticStats> StrategyEngine::stats() const {
  std::vector<TacticStats> out;
  out.reserve(slots_.size());
  for (const auto& s : slots_) out.push_back(s.stats);
  return out;
}

void StrategyEngine::resetStats() {
  for (auto& s : slots_) {
    s.stats.generated = 0;
    s.stats.executed  = 0;
  }
  suppressed_ = 0;
  logger().log(LogLevel::Info, "strategy.stats_reset", {});
}

} // namespace hunt

#pragma once

#include "hunt/book/BookRegistry.hpp"
#include "hunt/exec/ExecutionClient.hpp"
#include "hunt/exec/StorageSink.hpp"
#include "hunt/risk/CircuitBreaker.hpp"
#include "hunt/risk/RiskManager.hpp"
#include "hunt/rt/IStoppable.hpp"
#include "hunt/rt/PeriodicTask.hpp"
#include "hunt/rt/ShutdownCoordinator.hpp"
#include "hunt/strategy/StrategyEngine.hpp"
#include "hunt/util/Config.hpp"
#include "hunt/ws/StreamClient.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hunt {

struct OrchestratorStats {
  uint64_t bookUpdates  = 0;
  uint64_t bookErrors   = 0;
  uint64_t resyncs      = 0;
  uint64_t trades       = 0;
  uint64_t signals      = 0;
  uint64_t approved     = 0;
  uint64_t rejected     = 0;
  uint64_t executed     = 0;
  uint64_t execFailures = 0;
  uint64_t syncs        = 0;
};

// Wires the stream into books, features, tactics, the risk gate and the
// execution client. The stream listener is the only writer of the books.
class Orchestrator final : public rt::IStoppable {
public:
  // Null exec / storage fall back to the dry-run client and the hot mirror.
  Orchestrator(util::Config cfg,
               std::unique_ptr<ws::Transport> transport,
               std::unique_ptr<ExecutionClient> exec = nullptr,
               std::unique_ptr<StorageSink> storage = nullptr);
  ~Orchestrator() override;

  Orchestrator(const Orchestrator&)            = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Connects, subscribes the configured instrument and starts the breaker
  // and the sync timer. Throws what StreamClient::connect throws.
  void start();

  // start() then listen until stop(); shuts down on return.
  void run();

  void stop() override;

  // Subscriber bodies, public for direct feeding.
  void onBookMessage(const ws::Message& m);
  void onTradeMessage(const ws::Message& m);
  void onTickerMessage(const ws::Message& m);

  // One pass of the sync timer.
  void syncOnce();

  const util::Config& config() const { return cfg_; }
  BookRegistry& registry() { return registry_; }
  ws::StreamClient& stream() { return stream_; }
  StrategyEngine& engine() { return engine_; }
  CircuitBreaker& breaker() { return breaker_; }
  RiskManager& risk() { return risk_; }
  ExecutionClient& exec() { return *exec_; }
  StorageSink& storage() { return *storage_; }
  rt::ShutdownCoordinator& shutdown() { return shutdown_; }

  OrchestratorStats stats() const;

private:
  void wireSubscribers();
  void registerShutdown();
  void dispatch(std::vector<Signal> signals);
  bool execute(const Signal& s);
  void resync(InstrumentState& st);
  void pushLevels(const std::string& instrument, const ws::BookUpdate& u);

  util::Config cfg_;
  std::unique_ptr<ExecutionClient> exec_;
  std::unique_ptr<StorageSink> storage_;

  BookRegistry     registry_;
  ws::StreamClient stream_;
  StrategyEngine   engine_;
  CircuitBreaker   breaker_;
  RiskManager      risk_;

  rt::ShutdownCoordinator shutdown_;
  std::unique_ptr<rt::PeriodicTask> sync_;

  std::atomic<uint64_t> bookUpdates_{0};
  std::atomic<uint64_t> bookErrors_{0};
  std::atomic<uint64_t> resyncs_{0};
  std::atomic<uint64_t> trades_{0};
  std::atomic<uint64_t> signals_{0};
  std::atomic<uint64_t> approved_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> executed_{0};
  std::atomic<uint64_t> execFailures_{0};
  std::atomic<uint64_t> syncs_{0};
};

} // namespace hunt

#include "hunt/app/Orchestrator.hpp"
#include "hunt/exec/DryRunExecutionClient.hpp"
#include "hunt/util/Logger.hpp"
#include "hunt/util/Metrics.hpp"
#include "hunt/ws/Protocol.hpp"

#include <chrono>
#include <exception>

namespace hunt {

using util::LogLevel;
using util::logger;

namespace {

std::unique_ptr<ExecutionClient> orDryRun(std::unique_ptr<ExecutionClient> exec, const util::Config& cfg) {
  if (exec) return exec;
  return std::make_unique<DryRunExecutionClient>(cfg.dryRunBalance);
}

std::unique_ptr<StorageSink> orMirror(std::unique_ptr<StorageSink> storage, const util::Config& cfg) {
  if (storage) return storage;
  return std::make_unique<HotMirror>(cfg.tradeTapeCapacity);
}

} // namespace

Orchestrator::Orchestrator(util::Config cfg,
                           std::unique_ptr<ws::Transport> transport,
                           std::unique_ptr<ExecutionClient> exec,
                           std::unique_ptr<StorageSink> storage)
  : cfg_(std::move(cfg))
  , exec_(orDryRun(std::move(exec), cfg_))
  , storage_(orMirror(std::move(storage), cfg_))
  , registry_(cfg_.tradeTapeCapacity, FeatureParams::fromConfig(cfg_))
  , stream_(std::move(transport), ws::StreamSettings::fromConfig(cfg_))
  , engine_(StrategyEngine::fromConfig(cfg_))
  , breaker_(*exec_, BreakerParams::fromConfig(cfg_))
  , risk_(RiskLimits::fromConfig(cfg_))
{
  engine_.setSafetyGate([this] { return breaker_.isSafe(); });
  risk_.setBreakerGate([this] { return breaker_.isSafe(); });

  wireSubscribers();
  registerShutdown();

  sync_ = std::make_unique<rt::PeriodicTask>(
    "sync", std::chrono::seconds(cfg_.syncPeriodSec), [this] { syncOnce(); });
}

Orchestrator::~Orchestrator() {
  stop();
}

void Orchestrator::wireSubscribers() {
  stream_.addSubscriber(ws::Route::OrderBook, [this](const ws::Message& m) { onBookMessage(m); });
  stream_.addSubscriber(ws::Route::Trades,    [this](const ws::Message& m) { onTradeMessage(m); });
  stream_.addSubscriber(ws::Route::Ticker,    [this](const ws::Message& m) { onTickerMessage(m); });
}

void Orchestrator::registerShutdown() {
  shutdown_.registerStep("stream-stop",   10, [this] { stream_.stop(); });
  shutdown_.registerStep("sync-stop",     20, [this] { if (sync_) sync_->stop(); });
  shutdown_.registerStep("breaker-stop",  30, [this] { breaker_.stop(); });
  shutdown_.registerStep("storage-flush", 40, [this] { storage_->sync(); });
  shutdown_.registerStep("metrics-stop",  50, [] { util::MetricRegistry::instance().stopReporter(); });
}

// --------- Lifecycle ---------
void Orchestrator::start() {
  logger().log(LogLevel::Info, "orch.start",
               { {"inst", cfg_.instrument}, {"mode", cfg_.tradingMode},
                 {"book_channel", cfg_.bookChannel} });

  // the initial snapshot is requested by the first subscribe
  stream_.subscribe({ {cfg_.bookChannel, cfg_.instrument}, {cfg_.tradeChannel, cfg_.instrument} });
  stream_.connect(cfg_.needsPrivateChannel());

  breaker_.watch(cfg_.instrument);
  breaker_.start();
  // risk needs a balance before the first signal
  syncOnce();
  sync_->start();
}

void Orchestrator::run() {
  start();
  stream_.listen();
  stop();
  logger().log(LogLevel::Info, "orch.stopped", {});
}

void Orchestrator::stop() {
  shutdown_.stop();
}

// --------- Stream handlers ---------
void Orchestrator::onBookMessage(const ws::Message& m) {
  auto updates = ws::decodeBooks(m);
  if (!updates) {
    bookErrors_.fetch_add(1, std::memory_order_relaxed);
    logger().log(LogLevel::Warn, "orch.book_decode_failed", { {"err", updates.error().describe()} });
    return;
  }

  const TimePoint now = Clock::now();
  for (const auto& u : *updates) {
    InstrumentState& st = registry_.getOrCreate(u.instrument);

    if (u.snapshot) {
      st.book.applySnapshot(u.bids, u.asks, u.checksum, u.seq);
      st.publish();
      if (!st.book.consistent()) {
        bookErrors_.fetch_add(1, std::memory_order_relaxed);
        resync(st);
        continue;
      }
      st.resyncPending = false;
    } else {
      auto applied = st.book.applyDelta(u.bids, u.asks, u.checksum, u.seq);
      st.publish();
      if (!applied) {
        bookErrors_.fetch_add(1, std::memory_order_relaxed);
        logger().log(LogLevel::Warn, "orch.book_rejected", { {"err", applied.error().describe()} });
        resync(st);
        continue;
      }
      // still waiting for the snapshot the resync asked for
      if (!st.book.consistent()) continue;
    }
    bookUpdates_.fetch_add(1, std::memory_order_relaxed);
    pushLevels(u.instrument, u);

    st.features.update(now);
    TacticContext ctx{u.instrument, st.book, st.features, now};
    dispatch(engine_.onOrderBook(ctx));
  }
}

void Orchestrator::onTradeMessage(const ws::Message& m) {
  auto decoded = ws::decodeTrades(m);
  if (!decoded) {
    logger().log(LogLevel::Warn, "orch.trade_decode_failed", { {"err", decoded.error().describe()} });
    return;
  }

  const TimePoint now = Clock::now();
  for (const auto& t : *decoded) {
    trades_.fetch_add(1, std::memory_order_relaxed);
    storage_->onTrade(t);

    InstrumentState& st = registry_.getOrCreate(t.instrument);
    st.tape.push(t);
    if (!st.book.consistent()) continue;

    st.features.update(now);
    TacticContext ctx{t.instrument, st.book, st.features, now};
    dispatch(engine_.onTrade(ctx, t));
  }
}

void Orchestrator::onTickerMessage(const ws::Message& m) {
  InstrumentState* st = registry_.find(m.instId);
  if (!st || !st->book.consistent()) return;
  TacticContext ctx{m.instId, st->book, st->features, Clock::now()};
  dispatch(engine_.onMarketData(ctx));
}

void Orchestrator::pushLevels(const std::string& instrument, const ws::BookUpdate& u) {
  for (const auto& lv : u.bids) storage_->onLevel(instrument, Side::Bid, lv);
  for (const auto& lv : u.asks) storage_->onLevel(instrument, Side::Ask, lv);
}

// Drop the channel and subscribe again so the exchange sends a fresh snapshot.
// One request per divergence; the next consistent snapshot re-arms it.
void Orchestrator::resync(InstrumentState& st) {
  const std::string& instrument = st.book.instrument();
  if (st.resyncPending) {
    logger().log(LogLevel::Debug, "orch.resync_pending", { {"inst", instrument} });
    return;
  }
  const std::vector<ws::ChannelArg> args{ {cfg_.bookChannel, instrument} };
  try {
    stream_.unsubscribe(args);
    stream_.subscribe(args);
    st.resyncPending = true;
    resyncs_.fetch_add(1, std::memory_order_relaxed);
    HUNT_METRIC_HIT("orch.resyncs");
    logger().log(LogLevel::Info, "orch.resync", { {"inst", instrument} });
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "orch.resync_failed", { {"inst", instrument}, {"err", ex.what()} });
  }
}

// --------- Signals ---------
void Orchestrator::dispatch(std::vector<Signal> signals) {
  for (const auto& s : signals) {
    signals_.fetch_add(1, std::memory_order_relaxed);

    const RiskDecision d = risk_.check(s);
    if (!d) {
      rejected_.fetch_add(1, std::memory_order_relaxed);
      continue;
    }
    approved_.fetch_add(1, std::memory_order_relaxed);

    if (execute(s)) {
      executed_.fetch_add(1, std::memory_order_relaxed);
      engine_.markExecuted(s.strategy);
      risk_.postTradeCheck({s.instrument, std::nullopt});
    } else {
      execFailures_.fetch_add(1, std::memory_order_relaxed);
    }
  }
}

bool Orchestrator::execute(const Signal& s) {
  std::vector<OrderRequest> legs;
  if (s.action == SignalAction::MarketMake) {
    legs.push_back({s.instrument, OrderSide::Buy,  OrderType::Limit, s.size, s.price, s.strategy});
    legs.push_back({s.instrument, OrderSide::Sell, OrderType::Limit, s.size, s.counterPrice, s.strategy});
  } else {
    OrderRequest req{s.instrument,
                     s.action == SignalAction::Buy ? OrderSide::Buy : OrderSide::Sell,
                     s.type, s.size, std::nullopt, s.strategy};
    if (s.type == OrderType::Limit) req.price = s.price;
    legs.push_back(std::move(req));
  }

  bool ok = true;
  for (const auto& req : legs) {
    auto placed = exec_->placeOrder(req);
    if (!placed) {
      ok = false;
      logger().log(LogLevel::Error, "orch.order_failed",
                   { {"strategy", s.strategy}, {"inst", req.instrument},
                     {"side", orderSideName(req.side)}, {"err", placed.error().describe()} });
      continue;
    }
    logger().log(LogLevel::Info, "orch.order_placed",
                 { {"strategy", s.strategy}, {"inst", req.instrument}, {"id", *placed},
                   {"side", orderSideName(req.side)}, {"type", orderTypeName(req.type)},
                   {"size", util::fmt(req.size)},
                   {"price", req.price ? util::fmt(*req.price) : std::string("market")} });
  }
  return ok;
}

// --------- Sync timer ---------
void Orchestrator::syncOnce() {
  syncs_.fetch_add(1, std::memory_order_relaxed);

  auto bal = exec_->balance();
  auto pos = exec_->positions();
  if (bal && pos) {
    risk_.updateMetrics(*bal, *pos);
    if (risk_.checkEmergencyStop()) {
      logger().log(LogLevel::Critical, "orch.emergency_stop", {});
    }
  } else {
    logger().log(LogLevel::Warn, "orch.sync_account_failed",
                 { {"err", bal ? pos.error().describe() : bal.error().describe()} });
  }

  storage_->sync();

  const BreakerStatus bs = breaker_.status();
  const RiskSummary rs = risk_.summary();
  const BookMetricsSnapshot bm = registry_.stats();
  logger().log(LogLevel::Info, "orch.status",
               { {"safe", bs.triggered ? "0" : "1"},
                 {"breaker_reason", bs.reason},
                 {"balance", util::fmt(rs.metrics.totalBalance)},
                 {"daily_pnl_pct", util::fmt(rs.dailyPnlPercent, 4)},
                 {"trades", std::to_string(rs.totalTrades)},
                 {"books", std::to_string(registry_.size())},
                 {"deltas", std::to_string(bm.deltas)},
                 {"checksum_failures", std::to_string(bm.checksumFailures)},
                 {"signals", std::to_string(signals_.load(std::memory_order_relaxed))},
                 {"executed", std::to_string(executed_.load(std::memory_order_relaxed))},
                 {"stream", ws::stateName(stream_.state())} });
  for (const auto& line : registry_.summaries()) {
    logger().log(LogLevel::Debug, "orch.book", { {"summary", line} });
  }
}

OrchestratorStats Orchestrator::stats() const {
  OrchestratorStats s;
  s.bookUpdates  = bookUpdates_.load(std::memory_order_relaxed);
  s.bookErrors   = bookErrors_.load(std::memory_order_relaxed);
  s.resyncs      = resyncs_.load(std::memory_order_relaxed);
  s.trades       = trades_.load(std::memory_order_relaxed);
  s.signals      = signals_.load(std::memory_order_relaxed);
  s.approved     = approved_.load(std::memory_order_relaxed);
  s.rejected     = rejected_.load(std::memory_order_relaxed);
  s.executed     = executed_.load(std::memory_order_relaxed);
  s.execFailures = execFailures_.load(std::memory_order_relaxed);
  s.syncs        = syncs_.load(std::memory_order_relaxed);
  return s;
}

} // namespace hunt

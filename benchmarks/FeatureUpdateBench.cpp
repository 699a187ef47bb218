#include <benchmark/benchmark.h>
#include "hunt/Time.hpp"
#include "hunt/book/OrderBookReplica.hpp"
#include "hunt/book/TradeTape.hpp"
#include "hunt/features/FeatureExtractor.hpp"

static void BM_FeatureUpdate(benchmark::State& state) {
    hunt::OrderBookReplica book("BENCH");
    hunt::LevelUpdates bids, asks;
    for (int i = 0; i < 100; ++i) {
        bids.push_back({42000.0 - i * 0.5, 1.0 + i % 5, 1});
        asks.push_back({42000.5 + i * 0.5, 1.0 + i % 3, 1});
    }
    book.applySnapshot(bids, asks, 0);

    hunt::TradeTape tape(1000);
    for (int i = 0; i < 1000; ++i) {
        tape.push({"BENCH", 42000.0, 0.1, i % 2 ? hunt::TradeSide::Buy : hunt::TradeSide::Sell, i, std::to_string(i)});
    }

    hunt::FeatureExtractor fx("BENCH", book, tape);
    hunt::TimePoint now = hunt::Clock::now();
    for (auto _ : state) {
        now += std::chrono::milliseconds(100);
        benchmark::DoNotOptimize(fx.update(now));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_FeatureUpdate)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();

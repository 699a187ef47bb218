#include <benchmark/benchmark.h>
#include "hunt/book/OrderBookReplica.hpp"

namespace {

hunt::LevelUpdates side(double start, double step, size_t n) {
    hunt::LevelUpdates out;
    for (size_t i = 0; i < n; ++i) out.push_back({start + step * static_cast<double>(i), 2.0, 1});
    return out;
}

} // namespace

// Each iteration toggles the size of the third bid; the expected checksum is
// precomputed for both states so the replica always verifies cleanly.
static void BM_DeltaApply(benchmark::State& state) {
    const size_t depth = static_cast<size_t>(state.range(0));
    const auto bids = side(42000.0, -0.5, depth);
    const auto asks = side(42000.5, 0.5, depth);

    hunt::OrderBookReplica probe("probe");
    probe.applySnapshot(bids, asks, 0);
    const int64_t baseSum = static_cast<int32_t>(probe.checksum());

    const hunt::LevelUpdates grow{{bids[2].price, 3.0, 1}};
    const hunt::LevelUpdates shrink{{bids[2].price, 2.0, 1}};
    (void)probe.applyDelta(grow, {}, 0);
    const int64_t grownSum = static_cast<int32_t>(probe.checksum());

    hunt::OrderBookReplica book("BENCH");
    book.applySnapshot(bids, asks, baseSum);

    bool grown = false;
    for (auto _ : state) {
        auto r = grown ? book.applyDelta(shrink, {}, baseSum) : book.applyDelta(grow, {}, grownSum);
        benchmark::DoNotOptimize(r);
        grown = !grown;
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_DeltaApply)->Arg(25)->Arg(400)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();

#include <benchmark/benchmark.h>
#include "hunt/book/Checksum.hpp"

#include <utility>
#include <vector>

namespace {

std::vector<std::pair<double, double>> ladder(double start, double step, size_t n) {
    std::vector<std::pair<double, double>> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) out.emplace_back(start + step * static_cast<double>(i), 1.0 + i % 7);
    return out;
}

} // namespace

static void BM_ChecksumFullDepth(benchmark::State& state) {
    const auto bids = ladder(42000.0, -0.1, 25);
    const auto asks = ladder(42000.1, 0.1, 25);
    for (auto _ : state) {
        benchmark::DoNotOptimize(hunt::bookChecksum(bids, asks));
    }
    state.SetItemsProcessed(state.iterations());
}

static void BM_ChecksumCrcOnly(benchmark::State& state) {
    const std::string payload = hunt::checksumPayload(ladder(42000.0, -0.1, 25), ladder(42000.1, 0.1, 25));
    for (auto _ : state) {
        benchmark::DoNotOptimize(hunt::checksumOf(payload));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(payload.size()));
}

BENCHMARK(BM_ChecksumFullDepth)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_ChecksumCrcOnly)->Unit(benchmark::kNanosecond);

BENCHMARK_MAIN();

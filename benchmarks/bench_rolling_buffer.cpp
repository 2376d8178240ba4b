#include <benchmark/benchmark.h>
#include "trade/rolling_buffer.hpp"

using namespace surge;

// Benchmark append on a full buffer (every append evicts)
static void BM_RollingBufferAppend(benchmark::State& state) {
    RollingBuffer buffer(static_cast<std::size_t>(state.range(0)));
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        buffer.append(TradeSample{static_cast<double>(i), 42150.0, 0.01});
    }

    double t = static_cast<double>(state.range(0));
    for (auto _ : state) {
        buffer.append(TradeSample{t, 42150.0, 0.01});
        t += 1.0;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RollingBufferAppend)->Range(64, 4096);

// Benchmark reading the baseline window
static void BM_RollingBufferLastN(benchmark::State& state) {
    RollingBuffer buffer(3600);
    for (int i = 0; i < 3600; ++i) {
        buffer.append(TradeSample{static_cast<double>(i), 42150.0 + i, 0.01});
    }

    auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(buffer.last_n(n));
    }
}
BENCHMARK(BM_RollingBufferLastN)->Arg(3)->Arg(60)->Arg(3600);

BENCHMARK_MAIN();

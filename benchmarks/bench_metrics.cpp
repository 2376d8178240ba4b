#include <benchmark/benchmark.h>
#include "settings/tunable_settings.hpp"
#include "trade/alert_engine.hpp"
#include "trade/metrics_engine.hpp"
#include "trade/volume_monitor.hpp"
#include <random>

using namespace surge;

namespace {

class NullSink : public output::NotificationSink {
public:
    void send(std::string, CompletionHandler on_complete) override {
        if (on_complete) {
            on_complete(true);
        }
    }
};

RollingBuffer random_buffer(std::size_t count) {
    std::mt19937 rng(42);
    std::lognormal_distribution<double> qty(-3.0, 1.5);

    RollingBuffer buffer(3600);
    for (std::size_t i = 0; i < count; ++i) {
        buffer.append(TradeSample{static_cast<double>(i), 42150.0, qty(rng)});
    }
    return buffer;
}

}  // namespace

// Benchmark one metrics computation over a full buffer
static void BM_MetricsCompute(benchmark::State& state) {
    auto buffer = random_buffer(3600);

    for (auto _ : state) {
        benchmark::DoNotOptimize(MetricsEngine::compute(buffer, 100000.0));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MetricsCompute);

// Benchmark the full per-trade path: append, metrics, decision
static void BM_ProcessTrade(benchmark::State& state) {
    TunableSettings settings;
    AlertEngine alerts;
    NullSink sink;
    VolumeMonitor monitor(3600, settings, alerts, sink, "btcusdt");

    std::mt19937 rng(7);
    std::lognormal_distribution<double> qty(-3.0, 1.5);

    double t = 0.0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(monitor.process_trade(TradeSample{t, 42150.0, qty(rng)}));
        t += 0.1;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ProcessTrade);

// Benchmark snapshot reads under no contention
static void BM_SettingsSnapshot(benchmark::State& state) {
    TunableSettings settings;

    for (auto _ : state) {
        benchmark::DoNotOptimize(settings.snapshot());
    }
}
BENCHMARK(BM_SettingsSnapshot);

BENCHMARK_MAIN();

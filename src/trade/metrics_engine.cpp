#include "trade/metrics_engine.hpp"
#include <cmath>

namespace surge {

namespace {

Notional sum_notional(const std::vector<TradeSample>& samples) {
    Notional total = 0.0;
    for (const auto& sample : samples) {
        total += sample.notional();
    }
    return total;
}

}  // namespace

std::optional<MetricsSnapshot> MetricsEngine::compute(
    const RollingBuffer& buffer,
    double whale_threshold
) {
    if (buffer.size() < kBaselineWindow) {
        return std::nullopt;
    }

    auto recent = buffer.last_n(kRecentWindow);
    auto baseline = buffer.last_n(kBaselineWindow);

    Notional recent_volume = sum_notional(recent);
    Notional mean = sum_notional(baseline) / static_cast<double>(kBaselineWindow);
    double std_dev = sample_std_dev(baseline);

    // Flat volume: no spread to measure against
    double z_score = 0.0;
    if (std_dev > 0.0) {
        z_score = (recent_volume - mean) / std_dev;
    }

    return MetricsSnapshot{
        .recent_volume = recent_volume,
        .baseline_average = mean,
        .z_score = z_score,
        .is_whale = recent_volume > whale_threshold,
        .price = baseline.back().price
    };
}

double MetricsEngine::sample_std_dev(const std::vector<TradeSample>& samples) {
    if (samples.size() < 2) {
        return 0.0;
    }

    // A constant series must give exactly zero, not rounding noise
    const Notional first = samples.front().notional();
    bool all_equal = true;
    for (const auto& sample : samples) {
        if (sample.notional() != first) {
            all_equal = false;
            break;
        }
    }
    if (all_equal) {
        return 0.0;
    }

    const auto n = static_cast<double>(samples.size());
    const Notional mean = sum_notional(samples) / n;

    // Corrected two-pass algorithm: the second term cancels the
    // rounding error left in the mean
    double sum_sq = 0.0;
    double sum_dev = 0.0;
    for (const auto& sample : samples) {
        double dev = sample.notional() - mean;
        sum_sq += dev * dev;
        sum_dev += dev;
    }

    double variance = (sum_sq - (sum_dev * sum_dev) / n) / (n - 1.0);
    if (variance <= 0.0) {
        return 0.0;
    }
    return std::sqrt(variance);
}

}  // namespace surge

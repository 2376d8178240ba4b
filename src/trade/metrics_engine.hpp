#pragma once

#include "core/types.hpp"
#include "trade/rolling_buffer.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace surge {

/// Derived volume statistics for the latest buffer state
struct MetricsSnapshot {
    Notional recent_volume{0.0};     // Sum of notional over the last kRecentWindow trades
    Notional baseline_average{0.0};  // Mean notional over the last kBaselineWindow trades
    double z_score{0.0};             // (recent_volume - mean) / sample stdev, 0 if flat
    bool is_whale{false};            // recent_volume > whale threshold
    Price price{0.0};                // Price of the latest trade
};

/// Stateless computation of MetricsSnapshot from a RollingBuffer
///
/// The standard deviation is the sample estimator (n - 1 denominator),
/// the same as Python's statistics.stdev. Z-score thresholds are
/// calibrated against that estimator.
class MetricsEngine {
public:
    /// Number of trades summed into recent_volume
    static constexpr std::size_t kRecentWindow = 3;

    /// Number of trades in the baseline mean / stdev window
    static constexpr std::size_t kBaselineWindow = 60;

    /// Compute metrics for the current buffer contents
    /// @param buffer Trade history
    /// @param whale_threshold Notional above which recent volume is a whale
    /// @return Snapshot, or nullopt while fewer than kBaselineWindow trades exist
    [[nodiscard]] static std::optional<MetricsSnapshot> compute(
        const RollingBuffer& buffer,
        double whale_threshold
    );

    /// Sample standard deviation of notional values
    /// Returns exactly 0.0 when all values are equal or fewer than two exist
    [[nodiscard]] static double sample_std_dev(const std::vector<TradeSample>& samples);
};

}  // namespace surge

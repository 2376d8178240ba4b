#pragma once

#include "core/types.hpp"
#include "settings/tunable_settings.hpp"
#include "trade/metrics_engine.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

namespace surge {

/// Which decision rule fired
enum class AlertKind {
    HighVolume,
    Whale
};

/// Convert AlertKind to string for logging
[[nodiscard]] constexpr std::string_view to_string(AlertKind kind) noexcept {
    switch (kind) {
        case AlertKind::HighVolume: return "HighVolume";
        case AlertKind::Whale:      return "Whale";
    }
    return "Unknown";
}

/// Decided alert, handed to the notification sink
struct AlertEvent {
    AlertKind kind;
    MetricsSnapshot metrics;
    Settings settings;         // Settings in effect at decision time
    double volume_ratio;       // recent_volume / baseline_average (0 if baseline is 0)
    std::uint64_t sequence;    // alert_count or whale_count after this alert
    EpochSeconds timestamp;
};

/// Alert counters and the last observed market values
struct AlertState {
    EpochSeconds last_alert_timestamp{0.0};  // 0 = never
    std::uint64_t alert_count{0};
    std::uint64_t whale_count{0};

    Price last_price{0.0};
    Notional last_recent_volume{0.0};
    double last_z_score{0.0};
};

/// Threshold + cooldown decision unit
///
/// One cooldown clock is shared by both alert kinds. Mutated only from the
/// ingestion loop; state() may be called from any thread.
class AlertEngine {
public:
    /// Secondary z-score gate for whale alerts
    /// Fixed, unlike the operator-tunable thresholds
    static constexpr double kWhaleZScoreGate = 2.0;

    AlertEngine() = default;

    // Non-copyable (owns a mutex)
    AlertEngine(const AlertEngine&) = delete;
    AlertEngine& operator=(const AlertEngine&) = delete;

    /// Decide whether the snapshot fires an alert
    /// @param metrics Current metrics
    /// @param settings Settings snapshot to decide with
    /// @param now Decision time (epoch seconds)
    /// @return Event if an alert fired; counters and cooldown already updated
    [[nodiscard]] std::optional<AlertEvent> evaluate(
        const MetricsSnapshot& metrics,
        const Settings& settings,
        EpochSeconds now
    );

    /// Record the latest trade price (every trade)
    void record_price(Price price);

    /// Record the latest computed metrics (every evaluated trade)
    void record_metrics(const MetricsSnapshot& metrics);

    /// Consistent copy of counters and last observations
    [[nodiscard]] AlertState state() const;

    /// True while inside the cooldown window at `now`
    [[nodiscard]] bool is_cooling(EpochSeconds now, int cooldown_seconds) const;

    /// recent_volume / baseline_average, 0 on zero baseline
    [[nodiscard]] static double volume_ratio(const MetricsSnapshot& metrics) noexcept;

private:
    [[nodiscard]] bool cooling_locked(EpochSeconds now, int cooldown_seconds) const noexcept;

    mutable std::mutex mutex_;
    AlertState state_;
};

}  // namespace surge

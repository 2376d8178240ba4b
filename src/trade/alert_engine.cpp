#include "trade/alert_engine.hpp"

namespace surge {

std::optional<AlertEvent> AlertEngine::evaluate(
    const MetricsSnapshot& metrics,
    const Settings& settings,
    EpochSeconds now
) {
    if (settings.paused) {
        return std::nullopt;
    }

    std::lock_guard lock(mutex_);

    if (cooling_locked(now, settings.cooldown_seconds)) {
        return std::nullopt;
    }

    const double ratio = volume_ratio(metrics);

    std::optional<AlertKind> kind;
    if (metrics.z_score >= settings.z_threshold &&
        ratio >= settings.volume_ratio_threshold) {
        kind = AlertKind::HighVolume;
    } else if (metrics.is_whale && metrics.z_score >= kWhaleZScoreGate) {
        kind = AlertKind::Whale;
    }

    if (!kind) {
        return std::nullopt;
    }

    std::uint64_t sequence = 0;
    if (*kind == AlertKind::HighVolume) {
        sequence = ++state_.alert_count;
    } else {
        sequence = ++state_.whale_count;
    }
    state_.last_alert_timestamp = now;

    return AlertEvent{
        .kind = *kind,
        .metrics = metrics,
        .settings = settings,
        .volume_ratio = ratio,
        .sequence = sequence,
        .timestamp = now
    };
}

void AlertEngine::record_price(Price price) {
    std::lock_guard lock(mutex_);
    state_.last_price = price;
}

void AlertEngine::record_metrics(const MetricsSnapshot& metrics) {
    std::lock_guard lock(mutex_);
    state_.last_recent_volume = metrics.recent_volume;
    state_.last_z_score = metrics.z_score;
}

AlertState AlertEngine::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool AlertEngine::is_cooling(EpochSeconds now, int cooldown_seconds) const {
    std::lock_guard lock(mutex_);
    return cooling_locked(now, cooldown_seconds);
}

double AlertEngine::volume_ratio(const MetricsSnapshot& metrics) noexcept {
    // Guard against division by zero
    if (metrics.baseline_average <= 0.0) {
        return 0.0;
    }
    return metrics.recent_volume / metrics.baseline_average;
}

bool AlertEngine::cooling_locked(EpochSeconds now, int cooldown_seconds) const noexcept {
    if (state_.last_alert_timestamp == 0.0) {
        return false;
    }
    return (now - state_.last_alert_timestamp) < static_cast<double>(cooldown_seconds);
}

}  // namespace surge

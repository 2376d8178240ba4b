#include "settings/tunable_settings.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstddef>
#include <string>

namespace surge {

namespace {

/// Inclusive range check that also rejects NaN and infinities
bool in_range(double value, double min_val, double max_val) {
    return std::isfinite(value) && value >= min_val && value <= max_val;
}

std::string format_limit(double value) {
    // Drop the trailing zeros std::to_string adds
    std::string s = std::to_string(value);
    s.erase(s.find_last_not_of('0') + 1);
    if (!s.empty() && s.back() == '.') {
        s.pop_back();
    }
    return s;
}

}  // namespace

TunableSettings::TunableSettings(Settings initial)
    : settings_(initial)
{}

Settings TunableSettings::snapshot() const {
    std::lock_guard lock(mutex_);
    return settings_;
}

Result<Settings, Error> TunableSettings::set_z_threshold(double value) {
    if (!in_range(value, kMinZThreshold, kMaxZThreshold)) {
        return Result<Settings, Error>::Err(Error::invalid_argument(
            "Z-score must be between " + format_limit(kMinZThreshold) +
            " and " + format_limit(kMaxZThreshold)));
    }

    std::lock_guard lock(mutex_);
    settings_.z_threshold = value;
    return Result<Settings, Error>::Ok(settings_);
}

Result<Settings, Error> TunableSettings::set_volume_ratio_threshold(double value) {
    if (!in_range(value, kMinVolumeRatio, kMaxVolumeRatio)) {
        return Result<Settings, Error>::Err(Error::invalid_argument(
            "Volume must be between " + format_limit(kMinVolumeRatio) +
            " and " + format_limit(kMaxVolumeRatio)));
    }

    std::lock_guard lock(mutex_);
    settings_.volume_ratio_threshold = value;
    return Result<Settings, Error>::Ok(settings_);
}

Result<Settings, Error> TunableSettings::set_cooldown_seconds(int value) {
    if (value < kMinCooldownSeconds || value > kMaxCooldownSeconds) {
        return Result<Settings, Error>::Err(Error::invalid_argument(
            "Cooldown must be between " + std::to_string(kMinCooldownSeconds) +
            " and " + std::to_string(kMaxCooldownSeconds) + " seconds"));
    }

    std::lock_guard lock(mutex_);
    settings_.cooldown_seconds = value;
    return Result<Settings, Error>::Ok(settings_);
}

Result<Settings, Error> TunableSettings::set_whale_threshold(double value) {
    if (!std::isfinite(value) || value < kMinWhaleThreshold) {
        return Result<Settings, Error>::Err(Error::invalid_argument(
            "Whale threshold must be at least $" + format_limit(kMinWhaleThreshold)));
    }

    std::lock_guard lock(mutex_);
    settings_.whale_threshold = value;
    return Result<Settings, Error>::Ok(settings_);
}

Result<Settings, Error> TunableSettings::set_paused(bool paused) {
    std::lock_guard lock(mutex_);
    settings_.paused = paused;
    return Result<Settings, Error>::Ok(settings_);
}

std::size_t TunableSettings::restore(const Settings& persisted) {
    std::size_t rejected = 0;

    auto check = [&rejected](const char* field, const Result<Settings, Error>& result) {
        if (result.is_err()) {
            spdlog::warn("Ignoring persisted {}: {}", field, result.error().message);
            ++rejected;
        }
    };

    check("z_threshold", set_z_threshold(persisted.z_threshold));
    check("volume_threshold", set_volume_ratio_threshold(persisted.volume_ratio_threshold));
    check("alert_cooldown", set_cooldown_seconds(persisted.cooldown_seconds));
    check("whale_threshold", set_whale_threshold(persisted.whale_threshold));
    check("paused", set_paused(persisted.paused));

    return rejected;
}

}  // namespace surge

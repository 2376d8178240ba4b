#pragma once

#include "core/status.hpp"
#include <cstddef>
#include <mutex>

namespace surge {

/// Operator-tunable alert parameters (plain value type)
struct Settings {
    double z_threshold = 3.0;
    double volume_ratio_threshold = 2.0;
    int cooldown_seconds = 60;
    double whale_threshold = 100000.0;
    bool paused = false;

    [[nodiscard]] static Settings defaults() {
        return Settings{};
    }

    friend bool operator==(const Settings&, const Settings&) = default;
};

/// Settings shared between the ingestion loop and the control loop
///
/// Every read returns a full snapshot taken under the lock, so a reader
/// never observes a partially applied update. Each setter validates its
/// argument and leaves the settings untouched on failure.
class TunableSettings {
public:
    static constexpr double kMinZThreshold = 0.5;
    static constexpr double kMaxZThreshold = 20.0;
    static constexpr double kMinVolumeRatio = 1.0;
    static constexpr double kMaxVolumeRatio = 100.0;
    static constexpr int kMinCooldownSeconds = 10;
    static constexpr int kMaxCooldownSeconds = 3600;
    static constexpr double kMinWhaleThreshold = 10000.0;

    explicit TunableSettings(Settings initial = Settings::defaults());

    // Non-copyable (owns a mutex)
    TunableSettings(const TunableSettings&) = delete;
    TunableSettings& operator=(const TunableSettings&) = delete;

    /// Consistent copy of all fields
    [[nodiscard]] Settings snapshot() const;

    /// Setters return the full post-update snapshot, or InvalidArgument
    [[nodiscard]] Result<Settings, Error> set_z_threshold(double value);
    [[nodiscard]] Result<Settings, Error> set_volume_ratio_threshold(double value);
    [[nodiscard]] Result<Settings, Error> set_cooldown_seconds(int value);
    [[nodiscard]] Result<Settings, Error> set_whale_threshold(double value);
    [[nodiscard]] Result<Settings, Error> set_paused(bool paused);

    /// Apply persisted values field by field through the setters
    /// Invalid fields are logged and skipped
    /// @return Number of fields rejected
    std::size_t restore(const Settings& persisted);

private:
    mutable std::mutex mutex_;
    Settings settings_;
};

}  // namespace surge

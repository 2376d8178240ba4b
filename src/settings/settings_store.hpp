#pragma once

#include "core/status.hpp"
#include "settings/tunable_settings.hpp"
#include <string>

namespace surge {

/// Durable storage for the tunable settings snapshot
class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    /// Load the last persisted snapshot
    [[nodiscard]] virtual Result<Settings, Error> load() = 0;

    /// Persist a full snapshot, replacing any previous one
    [[nodiscard]] virtual Result<bool, Error> persist(const Settings& settings) = 0;
};

/// Settings stored as a small JSON document on disk
///
/// Keys: z_threshold, volume_threshold, alert_cooldown, whale_threshold, paused.
/// Missing keys load as the defaults.
class JsonSettingsStore final : public SettingsStore {
public:
    explicit JsonSettingsStore(std::string path);

    [[nodiscard]] Result<Settings, Error> load() override;
    [[nodiscard]] Result<bool, Error> persist(const Settings& settings) override;

    [[nodiscard]] const std::string& path() const noexcept;

private:
    std::string path_;
};

}  // namespace surge

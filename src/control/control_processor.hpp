#pragma once

#include "control/command_parser.hpp"
#include "core/clock.hpp"
#include "settings/settings_store.hpp"
#include "settings/tunable_settings.hpp"
#include "trade/alert_engine.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace surge::control {

/// Applies operator commands to the shared settings and renders replies
///
/// Holds references only to the state it needs: the tunables it mutates,
/// the alert engine it reports on, and the store it persists to.
/// Runs on the control loop.
class ControlProcessor {
public:
    /// @param settings Shared tunables (mutated)
    /// @param alerts Alert engine (read for status/stats)
    /// @param store Persistence target for every successful change
    /// @param clock Wall clock for uptime and "last alert" ages
    /// @param symbol Instrument shown in reports
    ControlProcessor(
        TunableSettings& settings,
        const AlertEngine& alerts,
        SettingsStore& store,
        const Clock& clock,
        std::string symbol
    );

    /// Handle one line of operator text
    /// @return Reply text, or nullopt for unrecognized input
    [[nodiscard]] std::optional<std::string> handle(std::string_view text);

    /// Handle an already parsed command
    [[nodiscard]] std::optional<std::string> execute(const Command& command);

private:
    std::string apply(
        const Result<Settings, Error>& result,
        const std::string& success_message
    );
    void persist(const Settings& snapshot);

    TunableSettings& settings_;
    const AlertEngine& alerts_;
    SettingsStore& store_;
    const Clock& clock_;
    std::string symbol_;
    EpochSeconds started_at_;
};

}  // namespace surge::control

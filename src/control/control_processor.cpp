#include "control/control_processor.hpp"
#include "output/message_formatter.hpp"
#include <spdlog/spdlog.h>
#include <type_traits>

namespace surge::control {

using output::MessageFormatter;

ControlProcessor::ControlProcessor(
    TunableSettings& settings,
    const AlertEngine& alerts,
    SettingsStore& store,
    const Clock& clock,
    std::string symbol
)
    : settings_(settings)
    , alerts_(alerts)
    , store_(store)
    , clock_(clock)
    , symbol_(std::move(symbol))
    , started_at_(clock.now())
{}

std::optional<std::string> ControlProcessor::handle(std::string_view text) {
    auto command = CommandParser::parse(text);
    if (!std::holds_alternative<Unrecognized>(command)) {
        spdlog::info("Command: {}", command_name(command));
    }
    return execute(command);
}

std::optional<std::string> ControlProcessor::execute(const Command& command) {
    return std::visit([this](const auto& cmd) -> std::optional<std::string> {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, GetStatus>) {
            return MessageFormatter::format_status(
                settings_.snapshot(),
                alerts_.state(),
                output::RuntimeInfo{started_at_, clock_.now(), symbol_});
        } else if constexpr (std::is_same_v<T, GetStats>) {
            return MessageFormatter::format_stats(
                settings_.snapshot(),
                alerts_.state(),
                output::RuntimeInfo{started_at_, clock_.now(), symbol_});
        } else if constexpr (std::is_same_v<T, SetZThreshold>) {
            return apply(settings_.set_z_threshold(cmd.value),
                         "Z-score threshold set to: " + MessageFormatter::format_number(cmd.value));
        } else if constexpr (std::is_same_v<T, SetVolumeRatio>) {
            return apply(settings_.set_volume_ratio_threshold(cmd.value),
                         "Volume multiplier set to: " + MessageFormatter::format_number(cmd.value) + "x");
        } else if constexpr (std::is_same_v<T, SetCooldown>) {
            return apply(settings_.set_cooldown_seconds(cmd.value),
                         "Cooldown set to: " + std::to_string(cmd.value) + " seconds");
        } else if constexpr (std::is_same_v<T, SetWhaleThreshold>) {
            return apply(settings_.set_whale_threshold(cmd.value),
                         "Whale threshold set to: $" + MessageFormatter::with_thousands(cmd.value));
        } else if constexpr (std::is_same_v<T, Pause>) {
            persist(settings_.set_paused(true).value());
            return std::string("⏸️ Alerts paused. Use /resume to continue.");
        } else if constexpr (std::is_same_v<T, Resume>) {
            persist(settings_.set_paused(false).value());
            return std::string("▶️ Alerts resumed!");
        } else if constexpr (std::is_same_v<T, Help>) {
            return MessageFormatter::format_help();
        } else if constexpr (std::is_same_v<T, SendTest>) {
            return MessageFormatter::format_test(clock_.now());
        } else if constexpr (std::is_same_v<T, InvalidArgument>) {
            return "❌ Usage: " + cmd.usage;
        } else {
            return std::nullopt;
        }
    }, command);
}

std::string ControlProcessor::apply(
    const Result<Settings, Error>& result,
    const std::string& success_message
) {
    if (result.is_err()) {
        spdlog::info("Rejected setting change: {}", result.error().message);
        return "❌ " + result.error().message;
    }

    persist(result.value());
    return "✅ " + success_message;
}

void ControlProcessor::persist(const Settings& snapshot) {
    auto saved = store_.persist(snapshot);
    if (saved.is_err()) {
        spdlog::error("Failed to persist settings ({}): {}",
                      to_string(saved.error().code), saved.error().message);
    }
}

}  // namespace surge::control

#pragma once

#include "core/types.hpp"
#include "settings/tunable_settings.hpp"
#include "trade/alert_engine.hpp"
#include <string>
#include <string_view>

namespace surge::output {

/// Process-level facts quoted in status and stats reports
struct RuntimeInfo {
    EpochSeconds started_at{0.0};
    EpochSeconds now{0.0};
    std::string symbol;
};

/// Renders operator-facing messages (Telegram HTML parse mode)
class MessageFormatter {
public:
    /// Alert text for a decided HighVolume or Whale event
    [[nodiscard]] static std::string format_alert(const AlertEvent& event, std::string_view symbol);

    /// Reply to /status
    [[nodiscard]] static std::string format_status(
        const Settings& settings,
        const AlertState& state,
        const RuntimeInfo& runtime
    );

    /// Reply to /stats
    [[nodiscard]] static std::string format_stats(
        const Settings& settings,
        const AlertState& state,
        const RuntimeInfo& runtime
    );

    /// Reply to /help
    [[nodiscard]] static std::string format_help();

    /// Reply to /test
    [[nodiscard]] static std::string format_test(EpochSeconds now);

    /// Sent once when the feed first connects
    [[nodiscard]] static std::string format_startup(const Settings& settings, std::string_view symbol);

    /// "Hh Mm"
    [[nodiscard]] static std::string format_uptime(double seconds);

    /// "None", "Ns ago", "Nm ago" or "Nh ago"
    [[nodiscard]] static std::string format_since(EpochSeconds last, EpochSeconds now);

    /// Fixed-point with thousands separators, e.g. 1234567.8 -> "1,234,568"
    [[nodiscard]] static std::string with_thousands(double value, int decimals = 0);

    /// Shortest representation of a threshold (3 -> "3", 2.5 -> "2.5")
    [[nodiscard]] static std::string format_number(double value);

    /// Local time "YYYY-MM-DD HH:MM:SS" (or "HH:MM:SS" with time_only)
    [[nodiscard]] static std::string local_time(EpochSeconds t, bool time_only = false);
};

}  // namespace surge::output

#include "output/message_formatter.hpp"
#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>

namespace surge::output {

namespace {

std::string upper_symbol(std::string_view symbol) {
    std::string result;
    result.reserve(symbol.size());
    for (char c : symbol) {
        result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string paused_label(bool paused) {
    return paused ? "⏸️ Paused" : "▶️ Active";
}

}  // namespace

std::string MessageFormatter::format_alert(const AlertEvent& event, std::string_view symbol) {
    const auto& m = event.metrics;

    if (event.kind == AlertKind::HighVolume) {
        return fmt::format(
            "🚨 <b>HIGH VOLUME ALERT #{}</b>\n\n"
            "📊 <b>{}</b>: ${:.2f}\n"
            "📈 <b>Volume (3 trades)</b>: ${}\n"
            "📉 <b>Avg (60 trades)</b>: ${}\n"
            "⚡ <b>Ratio</b>: {:.1f}x\n"
            "📐 <b>Z-Score</b>: {:.2f}\n\n"
            "⚙️ Settings: Z≥{} Vol≥{}x",
            event.sequence,
            upper_symbol(symbol), m.price,
            with_thousands(m.recent_volume),
            with_thousands(m.baseline_average),
            event.volume_ratio,
            m.z_score,
            format_number(event.settings.z_threshold),
            format_number(event.settings.volume_ratio_threshold)
        );
    }

    return fmt::format(
        "🐋 <b>WHALE DETECTED #{}</b>\n\n"
        "💰 <b>Large Volume</b>: ${}\n"
        "📊 <b>Price</b>: ${:.2f}\n"
        "📐 <b>Z-Score</b>: {:.2f}\n"
        "🎯 <b>Threshold</b>: ${}",
        event.sequence,
        with_thousands(m.recent_volume),
        m.price,
        m.z_score,
        with_thousands(event.settings.whale_threshold)
    );
}

std::string MessageFormatter::format_status(
    const Settings& settings,
    const AlertState& state,
    const RuntimeInfo& runtime
) {
    return fmt::format(
        "📊 <b>{} Tracker Status</b>\n\n"
        "<b>Settings:</b>\n"
        "• Z-Score Threshold: {}\n"
        "• Volume Multiplier: {}x\n"
        "• Cooldown: {}s\n"
        "• Whale Threshold: ${}\n"
        "• Status: {}\n\n"
        "<b>Statistics:</b>\n"
        "• Alerts sent: {}\n"
        "• Whale detections: {}\n"
        "• Uptime: {}\n"
        "• Last alert: {}\n\n"
        "<b>Last Values:</b>\n"
        "• Price: ${:.2f}\n"
        "• Volume (3 trades): ${}\n"
        "• Z-Score: {:.2f}\n\n"
        "<b>Commands:</b>\n"
        "/help - Show all commands\n"
        "/stats - Show statistics",
        upper_symbol(runtime.symbol),
        format_number(settings.z_threshold),
        format_number(settings.volume_ratio_threshold),
        settings.cooldown_seconds,
        with_thousands(settings.whale_threshold),
        paused_label(settings.paused),
        state.alert_count,
        state.whale_count,
        format_uptime(runtime.now - runtime.started_at),
        format_since(state.last_alert_timestamp, runtime.now),
        state.last_price,
        with_thousands(state.last_recent_volume),
        state.last_z_score
    );
}

std::string MessageFormatter::format_stats(
    const Settings& settings,
    const AlertState& state,
    const RuntimeInfo& runtime
) {
    return fmt::format(
        "📈 <b>Tracker Statistics</b>\n\n"
        "<b>Performance:</b>\n"
        "• Total alerts: {}\n"
        "• Whale detections: {}\n"
        "• Uptime: {}\n"
        "• Start time: {}\n"
        "• Last alert: {}\n\n"
        "<b>Last Values:</b>\n"
        "• Price: ${:.2f}\n"
        "• Volume (3 trades): ${}\n"
        "• Z-Score: {:.2f}\n\n"
        "<b>Current Settings:</b>\n"
        "• Z-threshold: {}\n"
        "• Vol multiplier: {}x\n"
        "• Cooldown: {}s\n"
        "• Whale threshold: ${}\n"
        "• Status: {}",
        state.alert_count,
        state.whale_count,
        format_uptime(runtime.now - runtime.started_at),
        local_time(runtime.started_at),
        format_since(state.last_alert_timestamp, runtime.now),
        state.last_price,
        with_thousands(state.last_recent_volume),
        state.last_z_score,
        format_number(settings.z_threshold),
        format_number(settings.volume_ratio_threshold),
        settings.cooldown_seconds,
        with_thousands(settings.whale_threshold),
        paused_label(settings.paused)
    );
}

std::string MessageFormatter::format_help() {
    return
        "📖 <b>Available Commands</b>\n\n"
        "<b>View Settings:</b>\n"
        "/status - Show current settings\n"
        "/stats - Show statistics\n\n"
        "<b>Modify Settings:</b>\n"
        "/z &lt;value&gt; - Set Z-score (0.5-20)\n"
        "  Example: /z 3.5\n\n"
        "/vol &lt;value&gt; - Set volume multiplier (1-100)\n"
        "  Example: /vol 2.5\n\n"
        "/cooldown &lt;seconds&gt; - Set cooldown (10-3600)\n"
        "  Example: /cooldown 60\n\n"
        "/whale &lt;amount&gt; - Set whale threshold (min 10000)\n"
        "  Example: /whale 100000\n\n"
        "<b>Control:</b>\n"
        "/pause - Pause alerts\n"
        "/resume - Resume alerts\n"
        "/test - Send test notification\n\n"
        "<b>Examples:</b>\n"
        "• Less alerts: /z 5\n"
        "• More alerts: /z 2\n"
        "• Only big moves: /vol 5\n"
        "• Detect smaller whales: /whale 50000";
}

std::string MessageFormatter::format_test(EpochSeconds now) {
    return fmt::format(
        "🧪 <b>Test Alert</b>\n\n"
        "If you see this, notifications are working!\n"
        "Time: {}",
        local_time(now, true)
    );
}

std::string MessageFormatter::format_startup(const Settings& settings, std::string_view symbol) {
    return fmt::format(
        "🟢 <b>{} Tracker Started</b>\n\n"
        "<b>Monitoring:</b> {}\n"
        "<b>Settings:</b>\n"
        "• Z-Score: ≥{}\n"
        "• Volume: ≥{}x average\n"
        "• Cooldown: {}s\n"
        "• Whale: >${}\n"
        "• Status: {}\n\n"
        "<b>Commands:</b>\n"
        "/status - View settings\n"
        "/help - Show all commands\n\n"
        "<i>You can modify settings anytime!</i>",
        upper_symbol(symbol),
        upper_symbol(symbol),
        format_number(settings.z_threshold),
        format_number(settings.volume_ratio_threshold),
        settings.cooldown_seconds,
        with_thousands(settings.whale_threshold),
        paused_label(settings.paused)
    );
}

std::string MessageFormatter::format_uptime(double seconds) {
    auto total = static_cast<long long>(std::max(0.0, seconds));
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    return fmt::format("{}h {}m", hours, minutes);
}

std::string MessageFormatter::format_since(EpochSeconds last, EpochSeconds now) {
    if (last == 0.0) {
        return "None";
    }

    // Alert times come from trade timestamps; tolerate small clock skew
    double delta = std::max(0.0, now - last);
    if (delta < 60.0) {
        return fmt::format("{}s ago", static_cast<long long>(delta));
    }
    if (delta < 3600.0) {
        return fmt::format("{}m ago", static_cast<long long>(delta / 60.0));
    }
    return fmt::format("{}h ago", static_cast<long long>(delta / 3600.0));
}

std::string MessageFormatter::with_thousands(double value, int decimals) {
    std::string digits = fmt::format("{:.{}f}", std::fabs(value), decimals);

    auto dot = digits.find('.');
    std::string int_part = digits.substr(0, dot);
    std::string frac_part = dot == std::string::npos ? "" : digits.substr(dot);

    std::string grouped;
    grouped.reserve(int_part.size() + int_part.size() / 3);
    int count = 0;
    for (auto it = int_part.rbegin(); it != int_part.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped += ',';
        }
        grouped += *it;
        ++count;
    }
    std::reverse(grouped.begin(), grouped.end());

    bool negative = std::signbit(value) && digits.find_first_not_of("0.") != std::string::npos;
    return (negative ? "-" : "") + grouped + frac_part;
}

std::string MessageFormatter::format_number(double value) {
    return fmt::format("{}", value);
}

std::string MessageFormatter::local_time(EpochSeconds t, bool time_only) {
    auto time_t_value = static_cast<std::time_t>(t);
    std::tm tm_value{};
    localtime_r(&time_t_value, &tm_value);

    if (time_only) {
        return fmt::format("{:%H:%M:%S}", tm_value);
    }
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", tm_value);
}

}  // namespace surge::output

#include "output/console_logger.hpp"
#include <spdlog/spdlog.h>

namespace surge::output {

ConsoleLogger::ConsoleLogger(std::chrono::milliseconds interval)
    : interval_(interval)
    , last_output_(std::chrono::steady_clock::now() - interval)
{}

bool ConsoleLogger::log_market(const TradeSample& trade, const std::optional<MetricsSnapshot>& metrics) {
    auto now = std::chrono::steady_clock::now();

    if (!force_next_ && (now - last_output_) < interval_) {
        return false;
    }

    force_next_ = false;
    last_output_ = now;

    if (!metrics) {
        spdlog::info("PRICE: {:.2f} | VOL: {:.0f} | warming up", trade.price, trade.notional());
        return true;
    }

    // Format: PRICE: X | VOL(3): X | AVG(60): X | Z: X
    spdlog::info(
        "PRICE: {:.2f} | VOL(3): {:.0f} | AVG(60): {:.0f} | Z: {:.2f}{}",
        trade.price,
        metrics->recent_volume,
        metrics->baseline_average,
        metrics->z_score,
        metrics->is_whale ? " | WHALE" : ""
    );

    return true;
}

void ConsoleLogger::log_alert(const AlertEvent& event) {
    spdlog::warn(
        "ALERT: {} #{} VOL(3) {:.0f} @ {:.2f} (z={:.2f}, ratio={:.1f}x)",
        to_string(event.kind),
        event.sequence,
        event.metrics.recent_volume,
        event.metrics.price,
        event.metrics.z_score,
        event.volume_ratio
    );
}

void ConsoleLogger::log_connection_status(bool connected, const std::string& details) {
    if (connected) {
        spdlog::info("Connection established{}", details.empty() ? "" : ": " + details);
    } else {
        spdlog::warn("Connection lost{}", details.empty() ? "" : ": " + details);
    }
}

void ConsoleLogger::force_next() {
    force_next_ = true;
}

}  // namespace surge::output

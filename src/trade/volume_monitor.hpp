#pragma once

#include "core/types.hpp"
#include "output/notification_sink.hpp"
#include "settings/tunable_settings.hpp"
#include "trade/alert_engine.hpp"
#include "trade/metrics_engine.hpp"
#include "trade/rolling_buffer.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace surge {

/// Result of processing one trade
struct TradeOutcome {
    std::optional<MetricsSnapshot> metrics;
    std::optional<AlertEvent> alert;
};

/// Ingestion pipeline: buffer -> metrics -> alert decision -> sink
///
/// Owns the rolling buffer; must only be driven from the ingestion loop.
/// Settings are read once per trade as a full snapshot.
class VolumeMonitor {
public:
    /// @param capacity Rolling buffer capacity
    /// @param settings Shared tunables (read every trade)
    /// @param alerts Alert decision unit (counters readable elsewhere)
    /// @param sink Where alert text is sent
    /// @param symbol Instrument name used in alert text
    VolumeMonitor(
        std::size_t capacity,
        const TunableSettings& settings,
        AlertEngine& alerts,
        output::NotificationSink& sink,
        std::string symbol
    );

    /// Process a trade and dispatch any resulting alert
    /// The trade timestamp is the decision clock for the cooldown
    [[nodiscard]] TradeOutcome process_trade(const TradeSample& trade);

    [[nodiscard]] const RollingBuffer& buffer() const noexcept;

    /// Alerts whose delivery failed (decided alerts are never retried)
    [[nodiscard]] std::size_t undelivered_count() const noexcept;

private:
    void dispatch(const AlertEvent& event);

    RollingBuffer buffer_;
    const TunableSettings& settings_;
    AlertEngine& alerts_;
    output::NotificationSink& sink_;
    std::string symbol_;
    std::shared_ptr<std::atomic<std::size_t>> undelivered_;
};

}  // namespace surge

#include "trade/volume_monitor.hpp"
#include "output/message_formatter.hpp"
#include <spdlog/spdlog.h>

namespace surge {

VolumeMonitor::VolumeMonitor(
    std::size_t capacity,
    const TunableSettings& settings,
    AlertEngine& alerts,
    output::NotificationSink& sink,
    std::string symbol
)
    : buffer_(capacity)
    , settings_(settings)
    , alerts_(alerts)
    , sink_(sink)
    , symbol_(std::move(symbol))
    , undelivered_(std::make_shared<std::atomic<std::size_t>>(0))
{}

TradeOutcome VolumeMonitor::process_trade(const TradeSample& trade) {
    buffer_.append(trade);
    alerts_.record_price(trade.price);

    // One snapshot per trade: thresholds never change mid-decision
    const Settings settings = settings_.snapshot();

    TradeOutcome outcome;
    outcome.metrics = MetricsEngine::compute(buffer_, settings.whale_threshold);
    if (!outcome.metrics) {
        return outcome;
    }

    alerts_.record_metrics(*outcome.metrics);

    outcome.alert = alerts_.evaluate(*outcome.metrics, settings, trade.timestamp);
    if (outcome.alert) {
        dispatch(*outcome.alert);
    }

    return outcome;
}

const RollingBuffer& VolumeMonitor::buffer() const noexcept {
    return buffer_;
}

std::size_t VolumeMonitor::undelivered_count() const noexcept {
    return undelivered_->load();
}

void VolumeMonitor::dispatch(const AlertEvent& event) {
    auto text = output::MessageFormatter::format_alert(event, symbol_);

    // The handler may run on another thread after this object is gone
    sink_.send(std::move(text), [undelivered = undelivered_, kind = event.kind,
                                 sequence = event.sequence](bool delivered) {
        if (delivered) {
            spdlog::info("Alert sent: {} #{}", to_string(kind), sequence);
        } else {
            undelivered->fetch_add(1);
            spdlog::error("Alert {} #{} could not be delivered", to_string(kind), sequence);
        }
    });
}

}  // namespace surge

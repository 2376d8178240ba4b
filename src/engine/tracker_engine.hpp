#pragma once

#include "binance/feed_handler.hpp"
#include "control/command_poller.hpp"
#include "control/control_processor.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/messages.hpp"
#include "output/console_logger.hpp"
#include "settings/settings_store.hpp"
#include "settings/tunable_settings.hpp"
#include "telegram/telegram_bot.hpp"
#include "trade/alert_engine.hpp"
#include "trade/volume_monitor.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace surge {

/// Volume surge tracker
/// Wires the trade feed into the volume monitor and the Telegram bot into
/// the control processor, and owns both loops
///
/// Threads:
///   main     - feed io_context: WebSocket, parsing, metrics, alert decisions
///   control  - Telegram io_context: command polling, replies, alert delivery
class TrackerEngine {
public:
    /// @param config Application configuration (must outlive the engine)
    explicit TrackerEngine(const Config& config);

    ~TrackerEngine();

    // Non-copyable, non-movable
    TrackerEngine(const TrackerEngine&) = delete;
    TrackerEngine& operator=(const TrackerEngine&) = delete;

    /// Start both loops (blocks until shutdown)
    void run();

    /// Request graceful shutdown (thread-safe)
    void request_shutdown();

    [[nodiscard]] bool shutdown_requested() const noexcept;

private:
    void setup_logging();
    void restore_settings();
    void start_control_thread();
    void stop_control_thread();
    void run_feed_loop();

    void process_event(const FeedEvent& event);
    void handle_trade(const TradeMsg& msg);
    void handle_connection_lost(const ConnectionLost& msg);
    void handle_connection_restored(const ConnectionRestored& msg);

    const Config& config_;
    std::string display_symbol_;

    // Shared between loops (internally synchronized)
    SystemClock clock_;
    TunableSettings settings_;
    AlertEngine alerts_;
    JsonSettingsStore store_;

    // Control loop
    boost::asio::io_context telegram_ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> telegram_work_;
    std::unique_ptr<telegram::TelegramBot> bot_;
    std::unique_ptr<control::ControlProcessor> processor_;
    std::shared_ptr<control::CommandPoller> poller_;
    std::thread control_thread_;

    // Ingestion loop
    boost::asio::io_context feed_ioc_;
    std::shared_ptr<binance::FeedHandler> feed_handler_;
    std::unique_ptr<VolumeMonitor> monitor_;
    std::unique_ptr<output::ConsoleLogger> console_;
    bool startup_announced_{false};

    std::atomic<bool> shutdown_requested_{false};
};

}  // namespace surge

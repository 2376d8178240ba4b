#include "engine/tracker_engine.hpp"
#include "network/ssl_context.hpp"
#include "output/message_formatter.hpp"
#include <boost/asio/post.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <type_traits>
#include <variant>

namespace surge {

namespace {

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

/// Startup defaults from the config file and environment
Settings configured_defaults(const Config::Alerts& alerts) {
    Settings settings = Settings::defaults();
    settings.z_threshold = alerts.z_threshold;
    settings.volume_ratio_threshold = alerts.volume_ratio_threshold;
    settings.cooldown_seconds = alerts.cooldown_seconds;
    settings.whale_threshold = alerts.whale_threshold;
    return settings;
}

}  // namespace

TrackerEngine::TrackerEngine(const Config& config)
    : config_(config)
    , display_symbol_(to_upper(config.network.symbol))
    , store_(config.alerts.settings_path)
{
    setup_logging();

    auto telegram_ssl = network::create_ssl_context(config.network.tls_verify);
    auto feed_ssl = network::create_ssl_context(config.network.tls_verify);

    bot_ = std::make_unique<telegram::TelegramBot>(telegram_ioc_, telegram_ssl, config.telegram);

    processor_ = std::make_unique<control::ControlProcessor>(
        settings_, alerts_, store_, clock_, display_symbol_);

    poller_ = std::make_shared<control::CommandPoller>(
        telegram_ioc_, *bot_, *bot_, *processor_, config.telegram.poll_interval);

    monitor_ = std::make_unique<VolumeMonitor>(
        config.engine.buffer_capacity, settings_, alerts_, *bot_, display_symbol_);

    console_ = std::make_unique<output::ConsoleLogger>(config.output.console_interval);

    feed_handler_ = std::make_shared<binance::FeedHandler>(
        feed_ioc_,
        feed_ssl,
        config_,
        [this](FeedEvent event) {
            process_event(event);
        }
    );
}

TrackerEngine::~TrackerEngine() {
    request_shutdown();
    stop_control_thread();
}

void TrackerEngine::setup_logging() {
    // Async logging keeps console I/O off the ingestion path
    spdlog::init_thread_pool(8192, 1);

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::async_logger>(
        "surge",
        stdout_sink,
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    auto level = spdlog::level::from_str(config_.output.log_level);
    if (level == spdlog::level::off && config_.output.log_level != "off") {
        spdlog::warn("Unknown log level '{}', using info", config_.output.log_level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
}

void TrackerEngine::restore_settings() {
    auto rejected = settings_.restore(configured_defaults(config_.alerts));
    if (rejected > 0) {
        spdlog::warn("{} configured alert default(s) out of range, built-in defaults kept", rejected);
    }

    auto persisted = store_.load();
    if (persisted.is_err()) {
        if (persisted.error().code == ErrorCode::IoError) {
            spdlog::info("No saved settings at {}, using defaults", store_.path());
        } else {
            spdlog::warn("Ignoring saved settings: {}", persisted.error().message);
        }
        return;
    }

    rejected = settings_.restore(persisted.value());
    spdlog::info("Loaded saved settings from {}{}", store_.path(),
                 rejected > 0 ? " (some fields rejected)" : "");
}

void TrackerEngine::run() {
    spdlog::info("Starting surge volume tracker");
    spdlog::info("Symbol: {}", display_symbol_);

    restore_settings();

    auto settings = settings_.snapshot();
    spdlog::info("Settings: z>={} vol>={}x cooldown={}s whale>${} {}",
                 settings.z_threshold, settings.volume_ratio_threshold,
                 settings.cooldown_seconds, settings.whale_threshold,
                 settings.paused ? "(paused)" : "");

    start_control_thread();

    // Ingestion runs on the calling thread
    run_feed_loop();

    stop_control_thread();

    spdlog::info("Tracker shutdown complete ({} alerts, {} whales, {} undelivered)",
                 alerts_.state().alert_count, alerts_.state().whale_count,
                 monitor_->undelivered_count());
    spdlog::info("Telegram messages: {} sent, {} failed",
                 bot_->sent_count(), bot_->failed_count());
}

void TrackerEngine::start_control_thread() {
    telegram_work_.emplace(boost::asio::make_work_guard(telegram_ioc_));

    boost::asio::post(telegram_ioc_, [poller = poller_]() {
        poller->start();
    });

    control_thread_ = std::thread([this]() {
        spdlog::debug("Control thread started");
        for (;;) {
            try {
                telegram_ioc_.run();
                break;
            } catch (const std::exception& e) {
                spdlog::error("Control thread exception: {}", e.what());
            }
        }
        spdlog::debug("Control thread stopped");
    });
}

void TrackerEngine::stop_control_thread() {
    if (!control_thread_.joinable()) {
        return;
    }

    boost::asio::post(telegram_ioc_, [poller = poller_]() {
        poller->stop();
    });

    // Let queued alerts and replies finish (each bounded by the request timeout)
    telegram_work_.reset();
    control_thread_.join();
}

void TrackerEngine::run_feed_loop() {
    spdlog::debug("Feed loop started");

    feed_handler_->start();

    while (!shutdown_requested_.load()) {
        try {
            feed_ioc_.run_for(std::chrono::milliseconds(100));
            feed_ioc_.restart();
        } catch (const std::exception& e) {
            spdlog::error("Feed loop exception: {}", e.what());
        }
    }

    feed_handler_->stop();
    process_event(Shutdown{});

    spdlog::debug("Feed loop stopped");
}

void TrackerEngine::process_event(const FeedEvent& event) {
    std::visit([this](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;

        if constexpr (std::is_same_v<T, TradeMsg>) {
            handle_trade(msg);
        } else if constexpr (std::is_same_v<T, ConnectionLost>) {
            handle_connection_lost(msg);
        } else if constexpr (std::is_same_v<T, ConnectionRestored>) {
            handle_connection_restored(msg);
        } else if constexpr (std::is_same_v<T, Shutdown>) {
            spdlog::info("Shutdown event received");
        }
    }, event);
}

void TrackerEngine::handle_trade(const TradeMsg& msg) {
    auto outcome = monitor_->process_trade(msg.trade);

    console_->log_market(msg.trade, outcome.metrics);

    if (outcome.alert) {
        console_->log_alert(*outcome.alert);
    }
}

void TrackerEngine::handle_connection_lost(const ConnectionLost& msg) {
    console_->log_connection_status(false, msg.reason);
}

void TrackerEngine::handle_connection_restored(const ConnectionRestored& /*msg*/) {
    console_->log_connection_status(true);
    console_->force_next();

    if (startup_announced_) {
        return;
    }
    startup_announced_ = true;

    bot_->send(output::MessageFormatter::format_startup(settings_.snapshot(), display_symbol_),
               [](bool delivered) {
                   if (delivered) {
                       spdlog::info("Startup message sent");
                   } else {
                       spdlog::warn("Startup message could not be delivered");
                   }
               });
}

void TrackerEngine::request_shutdown() {
    shutdown_requested_.store(true);
    feed_ioc_.stop();
}

bool TrackerEngine::shutdown_requested() const noexcept {
    return shutdown_requested_.load();
}

}  // namespace surge

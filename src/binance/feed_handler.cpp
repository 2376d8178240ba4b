#include "binance/feed_handler.hpp"
#include "binance/message_parser.hpp"
#include <spdlog/spdlog.h>

namespace surge::binance {

FeedHandler::FeedHandler(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    const Config& config,
    EventCallback on_event
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , config_(config)
    , on_event_(std::move(on_event))
    , reconnect_timer_(ioc)
    , reconnect_strategy_(config.network)
{}

FeedHandler::~FeedHandler() {
    stop();
}

void FeedHandler::start() {
    spdlog::info("FeedHandler starting for {}", config_.network.symbol);
    stopped_.store(false);
    connect();
}

void FeedHandler::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    spdlog::info("FeedHandler stopping");
    set_state(FeedState::Disconnected);

    reconnect_timer_.cancel();

    if (ws_client_) {
        ws_client_->close();
        ws_client_.reset();
    }
}

void FeedHandler::connect() {
    set_state(FeedState::Connecting);

    // Callbacks hold a weak reference so a dropped handler is not kept alive
    std::weak_ptr<FeedHandler> weak = weak_from_this();

    network::WebSocketClient::Handlers handlers;
    handlers.on_message = [weak](std::string_view msg) {
        if (auto self = weak.lock()) {
            self->on_ws_message(msg);
        }
    };
    handlers.on_error = [weak](boost::system::error_code ec, std::string_view what) {
        if (auto self = weak.lock()) {
            self->on_connection_lost(std::string(what) + ": " + ec.message());
        }
    };
    handlers.on_connected = [weak]() {
        if (auto self = weak.lock()) {
            self->on_ws_connected();
        }
    };
    handlers.on_closed = [weak]() {
        if (auto self = weak.lock()) {
            self->on_connection_lost("Connection closed by server");
        }
    };

    ws_client_ = std::make_shared<network::WebSocketClient>(ioc_, ssl_ctx_, std::move(handlers));
    ws_client_->connect(config_.network.ws_host, config_.network.ws_port, config_.ws_stream_path());
}

void FeedHandler::on_ws_connected() {
    spdlog::info("Connected to Binance ({})", config_.network.symbol);

    reconnect_strategy_.reset();
    set_state(FeedState::Live);

    emit_event(ConnectionRestored{std::chrono::steady_clock::now()});
}

void FeedHandler::on_ws_message(std::string_view message) {
    auto trade = MessageParser::parse_agg_trade(message);
    if (trade.is_err()) {
        ++rejected_;
        spdlog::warn("Skipping malformed trade message: {}", trade.error());
        return;
    }

    emit_event(TradeMsg{trade.value().to_sample(), std::chrono::steady_clock::now()});
}

void FeedHandler::on_connection_lost(std::string reason) {
    if (stopped_.load()) {
        return;  // Intentional shutdown
    }

    auto current = state_.load();
    if (current == FeedState::Reconnecting || current == FeedState::Disconnected) {
        return;
    }

    spdlog::warn("Feed connection lost: {}", reason);
    emit_event(ConnectionLost{std::move(reason), std::chrono::steady_clock::now()});

    schedule_reconnect();
}

void FeedHandler::schedule_reconnect() {
    set_state(FeedState::Reconnecting);

    if (ws_client_) {
        ws_client_->close();
        ws_client_.reset();
    }

    auto delay = reconnect_strategy_.next_delay();
    spdlog::info("Reconnecting in {}ms (attempt {})",
                 delay.count(), reconnect_strategy_.attempt_count());

    reconnect_timer_.expires_after(delay);
    reconnect_timer_.async_wait([weak = weak_from_this()](boost::system::error_code ec) {
        auto self = weak.lock();
        if (ec || !self || self->stopped_.load()) {
            return;
        }
        self->connect();
    });
}

void FeedHandler::set_state(FeedState new_state) {
    auto old_state = state_.exchange(new_state);
    if (old_state != new_state) {
        spdlog::debug("FeedState: {} -> {}", to_string(old_state), to_string(new_state));
    }
}

void FeedHandler::emit_event(FeedEvent event) {
    if (on_event_ && !stopped_.load()) {
        on_event_(std::move(event));
    }
}

FeedState FeedHandler::state() const noexcept {
    return state_.load();
}

std::uint64_t FeedHandler::rejected_count() const noexcept {
    return rejected_.load();
}

}  // namespace surge::binance

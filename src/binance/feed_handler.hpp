#pragma once

#include "binance/feed_state.hpp"
#include "binance/types.hpp"
#include "core/config.hpp"
#include "core/messages.hpp"
#include "engine/reconnect_strategy.hpp"
#include "network/websocket_client.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace surge::binance {

/// Binance Futures aggTrade feed
/// Owns the WebSocket connection, reconnects with backoff and turns
/// raw messages into FeedEvents
class FeedHandler : public std::enable_shared_from_this<FeedHandler> {
public:
    /// Callback for feed events (runs on the io_context thread)
    using EventCallback = std::function<void(FeedEvent)>;

    /// @param ioc IO context for async operations
    /// @param ssl_ctx Shared SSL context
    /// @param config Application configuration (must outlive the handler)
    /// @param on_event Callback for feed events
    FeedHandler(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        const Config& config,
        EventCallback on_event
    );

    ~FeedHandler();

    // Non-copyable, non-movable
    FeedHandler(const FeedHandler&) = delete;
    FeedHandler& operator=(const FeedHandler&) = delete;

    /// Connect and start streaming
    void start();

    /// Stop streaming; no events are emitted afterwards
    void stop();

    [[nodiscard]] FeedState state() const noexcept;

    /// Messages that failed to parse or validate
    [[nodiscard]] std::uint64_t rejected_count() const noexcept;

    /// Handle one raw stream message (exposed for tests)
    void on_ws_message(std::string_view message);

private:
    void connect();
    void on_ws_connected();
    void on_connection_lost(std::string reason);

    void schedule_reconnect();

    void set_state(FeedState new_state);
    void emit_event(FeedEvent event);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    const Config& config_;
    EventCallback on_event_;

    std::shared_ptr<network::WebSocketClient> ws_client_;
    boost::asio::steady_timer reconnect_timer_;
    ReconnectStrategy reconnect_strategy_;

    std::atomic<FeedState> state_{FeedState::Disconnected};
    std::atomic<bool> stopped_{false};
    std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace surge::binance

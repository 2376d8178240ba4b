#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace surge::network {

/// Where a WebSocketClient is in its single connection attempt
enum class SocketState {
    Idle,
    Resolving,
    Connecting,
    TlsHandshake,
    Upgrading,     // HTTP -> WebSocket
    Open,
    Closing,
    Failed
};

/// Async read-only WebSocket client over TLS
///
/// Each instance makes one connection attempt. Exactly one of
/// on_error / on_closed fires when the connection ends, unless close()
/// was requested locally.
class WebSocketClient : public std::enable_shared_from_this<WebSocketClient> {
public:
    using tcp = boost::asio::ip::tcp;
    using tcp_stream = boost::beast::tcp_stream;
    using ssl_stream = boost::asio::ssl::stream<tcp_stream>;
    using ws_stream = boost::beast::websocket::stream<ssl_stream>;

    /// Callbacks, all invoked on the io_context thread
    struct Handlers {
        std::function<void(std::string_view)> on_message;
        std::function<void(boost::system::error_code, std::string_view)> on_error;
        std::function<void()> on_connected;
        std::function<void()> on_closed;   // Server closed the stream
    };

    /// @param ioc IO context for async operations
    /// @param ssl_ctx Shared SSL context
    /// @param handlers Connection callbacks
    /// @param handshake_timeout Limit for each of TCP connect, TLS and WS handshakes
    WebSocketClient(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        Handlers handlers,
        std::chrono::seconds handshake_timeout = std::chrono::seconds{30}
    );

    ~WebSocketClient();

    // Non-copyable, non-movable
    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    /// Connect to a WebSocket server
    /// @param host Hostname (e.g., "fstream.binance.com")
    /// @param port Port (e.g., "443")
    /// @param path Path (e.g., "/ws/btcusdt@aggTrade")
    void connect(std::string_view host, std::string_view port, std::string_view path);

    /// Close the connection; no further callbacks are made
    void close();

    [[nodiscard]] SocketState state() const noexcept;

    [[nodiscard]] bool is_connected() const noexcept;

    /// Messages received on this connection
    [[nodiscard]] std::uint64_t messages_received() const noexcept;

private:
    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void on_connect(boost::system::error_code ec);
    void on_ssl_handshake(boost::system::error_code ec);
    void on_ws_handshake(boost::system::error_code ec);
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void fail(boost::system::error_code ec, std::string_view what);
    void set_state(SocketState new_state);
    [[nodiscard]] bool closing() const noexcept;

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    tcp::resolver resolver_;
    std::unique_ptr<ws_stream> ws_;
    boost::beast::flat_buffer buffer_;
    Handlers handlers_;
    std::chrono::seconds handshake_timeout_;

    std::string host_;
    std::string port_;
    std::string path_;

    std::atomic<SocketState> state_{SocketState::Idle};
    std::atomic<bool> close_requested_{false};
    std::atomic<std::uint64_t> messages_received_{0};
};

}  // namespace surge::network

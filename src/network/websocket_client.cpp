#include "network/websocket_client.hpp"
#include "network/ssl_context.hpp"
#include <boost/asio/connect.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <openssl/err.h>
#include <spdlog/spdlog.h>

namespace surge::network {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

WebSocketClient::WebSocketClient(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    Handlers handlers,
    std::chrono::seconds handshake_timeout
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , resolver_(ioc)
    , handlers_(std::move(handlers))
    , handshake_timeout_(handshake_timeout)
{}

WebSocketClient::~WebSocketClient() {
    if (ws_ && ws_->is_open()) {
        boost::system::error_code ec;
        beast::get_lowest_layer(*ws_).socket().close(ec);
    }
}

void WebSocketClient::connect(std::string_view host, std::string_view port, std::string_view path) {
    host_ = std::string(host);
    port_ = std::string(port);
    path_ = std::string(path);

    spdlog::info("WebSocket connecting to {}:{}{}", host_, port_, path_);
    set_state(SocketState::Resolving);

    resolver_.async_resolve(
        host_,
        port_,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, results);
        }
    );
}

void WebSocketClient::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    if (closing()) {
        return;
    }
    if (ec) {
        return fail(ec, "resolve");
    }

    spdlog::debug("Resolved {} endpoints", results.size());

    ws_ = std::make_unique<ws_stream>(ioc_, *ssl_ctx_);

    if (!prepare_client_stream(ws_->next_layer(), host_)) {
        boost::system::error_code ssl_ec{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()
        };
        return fail(ssl_ec, "ssl_sni");
    }

    set_state(SocketState::Connecting);

    // Try every resolved endpoint in turn
    beast::get_lowest_layer(*ws_).expires_after(handshake_timeout_);
    beast::get_lowest_layer(*ws_).async_connect(
        results,
        [self = shared_from_this()](auto ec, auto /*endpoint*/) {
            self->on_connect(ec);
        }
    );
}

void WebSocketClient::on_connect(boost::system::error_code ec) {
    if (closing()) {
        return;
    }
    if (ec) {
        return fail(ec, "connect");
    }

    spdlog::debug("TCP connected to {}:{}", host_, port_);
    set_state(SocketState::TlsHandshake);

    beast::get_lowest_layer(*ws_).expires_after(handshake_timeout_);
    ws_->next_layer().async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void WebSocketClient::on_ssl_handshake(boost::system::error_code ec) {
    if (closing()) {
        return;
    }
    if (ec) {
        return fail(ec, "ssl_handshake");
    }

    spdlog::debug("SSL handshake complete");

    // The websocket stream manages its own timeouts from here on
    beast::get_lowest_layer(*ws_).expires_never();

    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_->set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "surge/1.0");
        }
    ));

    set_state(SocketState::Upgrading);
    ws_->async_handshake(
        host_,
        path_,
        [self = shared_from_this()](auto ec) {
            self->on_ws_handshake(ec);
        }
    );
}

void WebSocketClient::on_ws_handshake(boost::system::error_code ec) {
    if (closing()) {
        return;
    }
    if (ec) {
        return fail(ec, "ws_handshake");
    }

    spdlog::info("WebSocket connected to {}:{}{}", host_, port_, path_);
    set_state(SocketState::Open);

    if (handlers_.on_connected) {
        handlers_.on_connected();
    }

    do_read();
}

void WebSocketClient::do_read() {
    ws_->async_read(
        buffer_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void WebSocketClient::on_read(boost::system::error_code ec, std::size_t bytes_transferred) {
    if (closing()) {
        return;
    }

    if (ec) {
        if (ec == websocket::error::closed) {
            spdlog::info("WebSocket closed by server (code {})", ws_->reason().code);
            set_state(SocketState::Idle);
            if (handlers_.on_closed) {
                handlers_.on_closed();
            }
            return;
        }
        return fail(ec, "read");
    }

    ++messages_received_;
    if (handlers_.on_message) {
        auto data = beast::buffers_to_string(buffer_.data());
        handlers_.on_message(data);
    }

    buffer_.consume(bytes_transferred);
    do_read();
}

void WebSocketClient::close() {
    if (close_requested_.exchange(true)) {
        return;
    }

    auto previous = state_.exchange(SocketState::Closing);
    if (previous == SocketState::Idle || previous == SocketState::Failed) {
        set_state(SocketState::Idle);
        return;
    }

    resolver_.cancel();

    if (!ws_) {
        set_state(SocketState::Idle);
        return;
    }

    if (previous != SocketState::Open) {
        // Handshake in progress: abort the socket
        boost::system::error_code ec;
        beast::get_lowest_layer(*ws_).socket().close(ec);
        set_state(SocketState::Idle);
        return;
    }

    ws_->async_close(
        websocket::close_code::normal,
        [self = shared_from_this()](auto ec) {
            if (ec) {
                spdlog::debug("WebSocket close: {}", ec.message());
            }
            spdlog::info("WebSocket connection closed");
            self->set_state(SocketState::Idle);
        }
    );
}

void WebSocketClient::fail(boost::system::error_code ec, std::string_view what) {
    spdlog::error("WebSocket {} error: {}", what, ec.message());
    set_state(SocketState::Failed);

    if (handlers_.on_error) {
        handlers_.on_error(ec, what);
    }
}

void WebSocketClient::set_state(SocketState new_state) {
    state_.store(new_state, std::memory_order_release);
}

bool WebSocketClient::closing() const noexcept {
    return close_requested_.load(std::memory_order_acquire);
}

SocketState WebSocketClient::state() const noexcept {
    return state_.load(std::memory_order_acquire);
}

bool WebSocketClient::is_connected() const noexcept {
    return state() == SocketState::Open;
}

std::uint64_t WebSocketClient::messages_received() const noexcept {
    return messages_received_.load(std::memory_order_relaxed);
}

}  // namespace surge::network

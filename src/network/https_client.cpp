#include "network/https_client.hpp"
#include "network/ssl_context.hpp"
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <openssl/err.h>
#include <spdlog/spdlog.h>

namespace surge::network {

namespace beast = boost::beast;
namespace http = boost::beast::http;

namespace {

/// Keep error bodies short in logs and replies
constexpr std::size_t kMaxErrorBody = 200;

}  // namespace

HttpsClient::HttpsClient(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , resolver_(ioc)
{}

void HttpsClient::request(HttpsRequest request, ResponseHandler handler) {
    request_ = std::move(request);
    handler_ = std::move(handler);

    spdlog::debug("HTTPS {} https://{}:{}{}",
                  request_.body ? "POST" : "GET",
                  request_.host, request_.port, request_.target);

    resolver_.async_resolve(
        request_.host,
        request_.port,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, results);
        }
    );
}

void HttpsClient::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
        return fail("resolve", ec);
    }

    stream_ = std::make_unique<ssl_stream>(ioc_, *ssl_ctx_);

    if (!prepare_client_stream(*stream_, request_.host)) {
        boost::system::error_code ssl_ec{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()
        };
        return fail("ssl_sni", ssl_ec);
    }

    // One deadline for the whole exchange
    beast::get_lowest_layer(*stream_).expires_after(request_.timeout);
    beast::get_lowest_layer(*stream_).async_connect(
        results,
        [self = shared_from_this()](auto ec, auto /*endpoint*/) {
            self->on_connect(ec);
        }
    );
}

void HttpsClient::on_connect(boost::system::error_code ec) {
    if (ec) {
        return fail("connect", ec);
    }

    stream_->async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void HttpsClient::on_ssl_handshake(boost::system::error_code ec) {
    if (ec) {
        return fail("ssl_handshake", ec);
    }

    req_.method(request_.body ? http::verb::post : http::verb::get);
    req_.target(request_.target);
    req_.version(11);
    req_.set(http::field::host, request_.host);
    req_.set(http::field::user_agent, "surge/1.0");
    req_.set(http::field::accept, "application/json");
    if (request_.body) {
        req_.set(http::field::content_type, "application/json");
        req_.body() = *request_.body;
    }
    req_.prepare_payload();

    http::async_write(
        *stream_,
        req_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_write(ec, bytes);
        }
    );
}

void HttpsClient::on_write(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        return fail("write", ec);
    }

    http::async_read(
        *stream_,
        buffer_,
        res_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void HttpsClient::on_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        return fail("read", ec);
    }

    auto status = res_.result();
    if (status != http::status::ok) {
        std::string error = "HTTP " + std::to_string(res_.result_int()) +
                            ": " + res_.body().substr(0, kMaxErrorBody);
        complete(Result<std::string, std::string>::Err(std::move(error)));
    } else {
        spdlog::debug("HTTPS response: {} bytes", res_.body().size());
        complete(Result<std::string, std::string>::Ok(std::move(res_.body())));
    }

    do_shutdown();
}

void HttpsClient::do_shutdown() {
    beast::get_lowest_layer(*stream_).expires_after(std::chrono::seconds(2));
    stream_->async_shutdown(
        [self = shared_from_this()](auto ec) {
            // Servers routinely skip close_notify
            if (ec && ec != boost::asio::error::eof &&
                ec != boost::asio::ssl::error::stream_truncated) {
                spdlog::debug("SSL shutdown: {}", ec.message());
            }
        }
    );
}

void HttpsClient::fail(std::string_view what, boost::system::error_code ec) {
    std::string error = std::string(what) + ": " +
        (ec == beast::error::timeout ? std::string("timed out") : ec.message());
    complete(Result<std::string, std::string>::Err(std::move(error)));
}

void HttpsClient::complete(Result<std::string, std::string> result) {
    if (!handler_) {
        return;
    }
    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(std::move(result));
}

}  // namespace surge::network

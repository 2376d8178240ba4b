#pragma once

#include "core/status.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace surge::network {

/// Target of a single HTTPS request
struct HttpsRequest {
    std::string host;
    std::string port = "443";
    std::string target;                // Path with query
    std::optional<std::string> body;   // POSTed as application/json when set
    std::chrono::milliseconds timeout{10000};
};

/// One-shot async HTTPS client
///
/// Each instance performs exactly one request and calls the handler
/// exactly once. The whole exchange (connect, handshake, write, read) is
/// bounded by the request timeout.
class HttpsClient : public std::enable_shared_from_this<HttpsClient> {
public:
    using tcp = boost::asio::ip::tcp;
    using ssl_stream = boost::asio::ssl::stream<boost::beast::tcp_stream>;

    /// Response body on HTTP 200, otherwise a description of the failure
    using ResponseHandler = std::function<void(Result<std::string, std::string>)>;

    HttpsClient(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx
    );

    // Non-copyable, non-movable
    HttpsClient(const HttpsClient&) = delete;
    HttpsClient& operator=(const HttpsClient&) = delete;

    /// Start the request
    void request(HttpsRequest request, ResponseHandler handler);

private:
    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void on_connect(boost::system::error_code ec);
    void on_ssl_handshake(boost::system::error_code ec);
    void on_write(boost::system::error_code ec, std::size_t bytes_transferred);
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void do_shutdown();
    void fail(std::string_view what, boost::system::error_code ec);
    void complete(Result<std::string, std::string> result);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    tcp::resolver resolver_;
    std::unique_ptr<ssl_stream> stream_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> req_;
    boost::beast::http::response<boost::beast::http::string_body> res_;

    HttpsRequest request_;
    ResponseHandler handler_;
};

}  // namespace surge::network

#pragma once

#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/ssl.h>
#include <memory>
#include <string>

namespace surge::network {

/// Create an SSL context for TLS 1.2+ client connections
/// @param verify_peer Verify server certificates against the system store
[[nodiscard]] std::shared_ptr<boost::asio::ssl::context> create_ssl_context(bool verify_peer = true);

/// Set SNI and hostname verification on a freshly created client stream
/// @return false if OpenSSL rejected the hostname
template <typename SslStream>
[[nodiscard]] bool prepare_client_stream(SslStream& stream, const std::string& host) {
    // SSL_set_tlsext_host_name is a macro with an old-style cast
    if (SSL_ctrl(stream.native_handle(), SSL_CTRL_SET_TLSEXT_HOSTNAME,
                 TLSEXT_NAMETYPE_host_name, const_cast<char*>(host.c_str())) == 0) {
        return false;
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(host));
    return true;
}

}  // namespace surge::network

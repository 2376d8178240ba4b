#pragma once

#include "core/config.hpp"
#include "output/notification_sink.hpp"
#include "telegram/types.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace surge::telegram {

/// Telegram Bot API client
///
/// Outbound: sendMessage (HTML parse mode) to the configured chat.
/// Inbound: getUpdates with offset tracking.
/// All requests run on the bot's io_context; send() may be called from
/// any thread.
class TelegramBot : public output::NotificationSink, public UpdateSource {
public:
    /// @param ioc IO context that runs all bot requests
    /// @param ssl_ctx SSL context for api.telegram.org
    /// @param config Telegram settings (token, chat, timeouts)
    TelegramBot(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        Config::Telegram config
    );

    // Non-copyable, non-movable
    TelegramBot(const TelegramBot&) = delete;
    TelegramBot& operator=(const TelegramBot&) = delete;

    /// Post a sendMessage request; never blocks the caller
    void send(std::string text, CompletionHandler on_complete = {}) override;

    /// Long-poll getUpdates from the current offset
    void fetch_updates(UpdatesHandler handler) override;

    /// Next update_id to request (last consumed + 1)
    [[nodiscard]] std::int64_t offset() const noexcept;

    [[nodiscard]] std::uint64_t sent_count() const noexcept;
    [[nodiscard]] std::uint64_t failed_count() const noexcept;

    /// Request target for a Bot API method, e.g. "/bot<token>/sendMessage"
    [[nodiscard]] std::string method_target(std::string_view method) const;

private:
    void do_send(std::string text, CompletionHandler on_complete);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    Config::Telegram config_;

    std::atomic<std::int64_t> offset_{0};
    std::atomic<std::uint64_t> sent_{0};
    std::atomic<std::uint64_t> failed_{0};
};

}  // namespace surge::telegram

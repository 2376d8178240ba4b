#include "telegram/telegram_bot.hpp"
#include "network/https_client.hpp"
#include "telegram/update_parser.hpp"
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace surge::telegram {

TelegramBot::TelegramBot(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    Config::Telegram config
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , config_(std::move(config))
{}

void TelegramBot::send(std::string text, CompletionHandler on_complete) {
    boost::asio::post(ioc_, [this, text = std::move(text), on_complete = std::move(on_complete)]() mutable {
        do_send(std::move(text), std::move(on_complete));
    });
}

void TelegramBot::do_send(std::string text, CompletionHandler on_complete) {
    nlohmann::json payload = {
        {"chat_id", config_.chat_id},
        {"text", std::move(text)},
        {"parse_mode", "HTML"},
        {"disable_web_page_preview", true}
    };

    network::HttpsRequest request;
    request.host = config_.api_host;
    request.port = config_.api_port;
    request.target = method_target("sendMessage");
    request.body = payload.dump();
    request.timeout = config_.request_timeout;

    auto client = std::make_shared<network::HttpsClient>(ioc_, ssl_ctx_);
    client->request(std::move(request), [this, on_complete = std::move(on_complete)](auto result) {
        bool delivered = false;
        if (result.is_err()) {
            spdlog::error("Telegram sendMessage failed: {}", result.error());
        } else {
            auto ack = UpdateParser::parse_send_result(result.value());
            if (ack.is_err()) {
                spdlog::error("Telegram sendMessage rejected: {}", ack.error());
            } else {
                delivered = true;
            }
        }

        if (delivered) {
            ++sent_;
        } else {
            ++failed_;
        }
        if (on_complete) {
            on_complete(delivered);
        }
    });
}

void TelegramBot::fetch_updates(UpdatesHandler handler) {
    network::HttpsRequest request;
    request.host = config_.api_host;
    request.port = config_.api_port;
    request.target = method_target("getUpdates") +
        "?offset=" + std::to_string(offset_.load()) +
        "&timeout=" + std::to_string(config_.long_poll_timeout_s);
    request.timeout = config_.request_timeout;

    auto client = std::make_shared<network::HttpsClient>(ioc_, ssl_ctx_);
    client->request(std::move(request), [this, handler = std::move(handler)](auto result) {
        if (result.is_err()) {
            handler(Result<std::vector<Update>, std::string>::Err(result.error()));
            return;
        }

        auto updates = UpdateParser::parse_updates(result.value());
        if (updates.is_ok()) {
            for (const auto& update : updates.value()) {
                if (update.update_id >= offset_.load()) {
                    offset_.store(update.update_id + 1);
                }
            }
        }
        handler(std::move(updates));
    });
}

std::int64_t TelegramBot::offset() const noexcept {
    return offset_.load();
}

std::uint64_t TelegramBot::sent_count() const noexcept {
    return sent_.load();
}

std::uint64_t TelegramBot::failed_count() const noexcept {
    return failed_.load();
}

std::string TelegramBot::method_target(std::string_view method) const {
    std::string target = "/bot";
    target += config_.bot_token;
    target += '/';
    target += method;
    return target;
}

}  // namespace surge::telegram

#include "telegram/update_parser.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace surge::telegram {

using json = nlohmann::json;

namespace {

/// Telegram error responses carry a "description"
std::string api_error(const json& j) {
    if (j.contains("description") && j["description"].is_string()) {
        return j["description"].get<std::string>();
    }
    return "Telegram API returned ok=false";
}

std::string chat_id_of(const json& chat) {
    if (!chat.contains("id")) {
        return {};
    }
    const auto& id = chat["id"];
    if (id.is_number_integer()) {
        return std::to_string(id.get<std::int64_t>());
    }
    if (id.is_string()) {
        return id.get<std::string>();
    }
    return {};
}

}  // namespace

Result<std::vector<Update>, std::string> UpdateParser::parse_updates(std::string_view json_str) {
    try {
        auto j = json::parse(json_str);

        if (!j.is_object() || !j.value("ok", false)) {
            return Result<std::vector<Update>, std::string>::Err(
                j.is_object() ? api_error(j) : "getUpdates response is not an object");
        }

        std::vector<Update> updates;
        if (!j.contains("result") || !j["result"].is_array()) {
            return Result<std::vector<Update>, std::string>::Ok(std::move(updates));
        }

        updates.reserve(j["result"].size());
        for (const auto& item : j["result"]) {
            if (!item.contains("update_id") || !item["update_id"].is_number_integer()) {
                continue;
            }

            Update update;
            update.update_id = item["update_id"].get<std::int64_t>();

            if (item.contains("message") && item["message"].is_object()) {
                const auto& message = item["message"];
                if (message.contains("chat") && message["chat"].is_object()) {
                    update.chat_id = chat_id_of(message["chat"]);
                }
                if (message.contains("text") && message["text"].is_string()) {
                    update.text = message["text"].get<std::string>();
                }
            }

            updates.push_back(std::move(update));
        }

        return Result<std::vector<Update>, std::string>::Ok(std::move(updates));

    } catch (const json::exception& e) {
        return Result<std::vector<Update>, std::string>::Err(
            std::string("JSON parse error: ") + e.what()
        );
    }
}

Result<bool, std::string> UpdateParser::parse_send_result(std::string_view json_str) {
    try {
        auto j = json::parse(json_str);
        if (!j.is_object()) {
            return Result<bool, std::string>::Err("sendMessage response is not an object");
        }
        if (!j.value("ok", false)) {
            return Result<bool, std::string>::Err(api_error(j));
        }
        return Result<bool, std::string>::Ok(true);
    } catch (const json::exception& e) {
        return Result<bool, std::string>::Err(std::string("JSON parse error: ") + e.what());
    }
}

}  // namespace surge::telegram

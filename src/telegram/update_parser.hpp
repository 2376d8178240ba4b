#pragma once

#include "core/status.hpp"
#include "telegram/types.hpp"
#include <string_view>
#include <vector>

namespace surge::telegram {

/// Parser for Telegram Bot API responses
class UpdateParser {
public:
    /// Parse a getUpdates response body
    /// Updates without a text message are kept (empty text) so the
    /// offset still advances past them
    [[nodiscard]] static Result<std::vector<Update>, std::string>
    parse_updates(std::string_view json);

    /// Check a sendMessage response body for "ok": true
    [[nodiscard]] static Result<bool, std::string>
    parse_send_result(std::string_view json);
};

}  // namespace surge::telegram

#pragma once

#include "binance/types.hpp"
#include "core/status.hpp"
#include <string>
#include <string_view>

namespace surge::binance {

/// Parser for Binance WebSocket trade messages
class MessageParser {
public:
    /// Parse a raw-stream aggTrade message
    /// Rejects other event types and non-positive price or quantity
    [[nodiscard]] static Result<AggTrade, std::string>
    parse_agg_trade(std::string_view json);

    /// Parse a decimal string field ("p", "q") strictly
    [[nodiscard]] static Result<double, std::string>
    parse_decimal(std::string_view text);
};

}  // namespace surge::binance

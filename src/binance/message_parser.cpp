#include "binance/message_parser.hpp"
#include <cmath>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace surge::binance {

using json = nlohmann::json;

Result<double, std::string> MessageParser::parse_decimal(std::string_view text) {
    if (text.empty()) {
        return Result<double, std::string>::Err("empty decimal");
    }

    try {
        std::string s(text);
        std::size_t pos = 0;
        double value = std::stod(s, &pos);
        if (pos != s.size() || !std::isfinite(value)) {
            return Result<double, std::string>::Err("invalid decimal: " + s);
        }
        return Result<double, std::string>::Ok(value);
    } catch (const std::invalid_argument&) {
        return Result<double, std::string>::Err("invalid decimal: " + std::string(text));
    } catch (const std::out_of_range&) {
        return Result<double, std::string>::Err("decimal out of range: " + std::string(text));
    }
}

Result<AggTrade, std::string> MessageParser::parse_agg_trade(std::string_view json_str) {
    try {
        auto j = json::parse(json_str);

        if (!j.is_object()) {
            return Result<AggTrade, std::string>::Err("aggTrade payload is not an object");
        }

        // Validate required fields
        if (!j.contains("e") || !j.contains("s") || !j.contains("p") ||
            !j.contains("q") || !j.contains("T")) {
            return Result<AggTrade, std::string>::Err("Missing required fields in aggTrade");
        }

        AggTrade trade;
        trade.event_type = j["e"].get<std::string>();
        if (trade.event_type != "aggTrade") {
            return Result<AggTrade, std::string>::Err("Unexpected event type: " + trade.event_type);
        }

        auto price = parse_decimal(j["p"].get<std::string>());
        if (price.is_err()) {
            return Result<AggTrade, std::string>::Err("price: " + price.error());
        }
        auto quantity = parse_decimal(j["q"].get<std::string>());
        if (quantity.is_err()) {
            return Result<AggTrade, std::string>::Err("quantity: " + quantity.error());
        }
        if (price.value() <= 0.0 || quantity.value() <= 0.0) {
            return Result<AggTrade, std::string>::Err("Non-positive price or quantity");
        }

        trade.price = price.value();
        trade.quantity = quantity.value();
        trade.symbol = j["s"].get<std::string>();
        trade.trade_time = j["T"].get<std::uint64_t>();
        trade.event_time = j.value("E", trade.trade_time);
        trade.agg_trade_id = j.value("a", TradeId{0});
        trade.is_buyer_maker = j.value("m", false);

        return Result<AggTrade, std::string>::Ok(std::move(trade));

    } catch (const json::exception& e) {
        return Result<AggTrade, std::string>::Err(
            std::string("JSON parse error: ") + e.what()
        );
    }
}

}  // namespace surge::binance

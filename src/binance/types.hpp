#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace surge::binance {

/// Aggregated trade from the @aggTrade stream
struct AggTrade {
    std::string event_type;       // "aggTrade"
    std::uint64_t event_time;     // Event time in ms
    std::string symbol;
    TradeId agg_trade_id;
    Price price;
    Quantity quantity;
    std::uint64_t trade_time;     // Trade time in ms
    bool is_buyer_maker;          // true = sell aggressor, false = buy aggressor

    /// Rolling-buffer view of this trade (timestamp from trade_time)
    [[nodiscard]] TradeSample to_sample() const noexcept {
        return TradeSample{convert::ms_to_seconds(trade_time), price, quantity};
    }
};

}  // namespace surge::binance

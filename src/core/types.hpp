#pragma once

#include <chrono>
#include <cstdint>

namespace surge {

// Price in quote currency (e.g., USDT)
using Price = double;

// Quantity in base currency (e.g., BTC)
using Quantity = double;

// Notional value in quote currency (price * quantity)
using Notional = double;

// Seconds since the Unix epoch, fractional
using EpochSeconds = double;

// High-resolution timestamp for internal tracking
using Timestamp = std::chrono::steady_clock::time_point;

// Binance trade identifiers
using TradeId = std::uint64_t;

/// A single executed trade, as consumed by the rolling buffer
struct TradeSample {
    EpochSeconds timestamp{0.0};
    Price price{0.0};
    Quantity quantity{0.0};

    /// Traded value in quote currency
    [[nodiscard]] Notional notional() const noexcept {
        return price * quantity;
    }
};

namespace convert {

/// Convert a millisecond epoch timestamp (Binance wire format) to seconds
[[nodiscard]] constexpr EpochSeconds ms_to_seconds(std::uint64_t ms) noexcept {
    return static_cast<EpochSeconds>(ms) / 1000.0;
}

}  // namespace convert

}  // namespace surge

#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace surge {

/// Validated trade with receive timestamp
struct TradeMsg {
    TradeSample trade;
    Timestamp received_at;
};

/// Connection lost event
struct ConnectionLost {
    std::string reason;
    Timestamp occurred_at;
};

/// Connection (re)established event
struct ConnectionRestored {
    Timestamp occurred_at;
};

/// Shutdown request
struct Shutdown {};

/// Events delivered from the feed to the ingestion loop
using FeedEvent = std::variant<
    TradeMsg,
    ConnectionLost,
    ConnectionRestored,
    Shutdown
>;

/// Helper to get event type name for logging
[[nodiscard]] inline std::string_view event_type_name(const FeedEvent& event) {
    return std::visit([](const auto& e) -> std::string_view {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TradeMsg>) return "Trade";
        else if constexpr (std::is_same_v<T, ConnectionLost>) return "ConnectionLost";
        else if constexpr (std::is_same_v<T, ConnectionRestored>) return "ConnectionRestored";
        else if constexpr (std::is_same_v<T, Shutdown>) return "Shutdown";
        else return "Unknown";
    }, event);
}

}  // namespace surge

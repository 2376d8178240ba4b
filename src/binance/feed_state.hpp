#pragma once

#include <string_view>

namespace surge::binance {

/// Feed handler state machine states
enum class FeedState {
    Disconnected,      // Initial state, or stopped
    Connecting,        // TCP/SSL/WS handshake in progress
    Live,              // Receiving trades
    Reconnecting       // Connection lost, backing off before retry
};

/// Convert FeedState to string for logging
[[nodiscard]] constexpr std::string_view to_string(FeedState state) noexcept {
    switch (state) {
        case FeedState::Disconnected: return "Disconnected";
        case FeedState::Connecting:   return "Connecting";
        case FeedState::Live:         return "Live";
        case FeedState::Reconnecting: return "Reconnecting";
    }
    return "Unknown";
}

}  // namespace surge::binance

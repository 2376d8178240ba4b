#pragma once

#include "core/config.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace surge {

/// Exponential backoff with random jitter for reconnection
class ReconnectStrategy {
public:
    /// @param base_delay Initial delay
    /// @param max_delay Maximum delay cap (applied before jitter)
    /// @param multiplier Backoff multiplier
    /// @param jitter_factor Random jitter factor (e.g., 0.3 for +/-30%)
    /// @param seed RNG seed; random_device when not given
    ReconnectStrategy(
        std::chrono::milliseconds base_delay,
        std::chrono::milliseconds max_delay,
        double multiplier,
        double jitter_factor,
        std::optional<std::uint32_t> seed = std::nullopt
    );

    /// Build from the feed's network settings
    explicit ReconnectStrategy(const Config::Network& network,
                               std::optional<std::uint32_t> seed = std::nullopt);

    /// Get the next delay with jitter applied
    /// Increases internal delay for subsequent calls
    [[nodiscard]] std::chrono::milliseconds next_delay();

    /// Reset delay back to base (after a successful connection)
    void reset();

    /// Get current delay (without jitter, without incrementing)
    [[nodiscard]] std::chrono::milliseconds current_delay() const noexcept;

    /// Get attempt count since last reset
    [[nodiscard]] std::size_t attempt_count() const noexcept;

private:
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    std::chrono::milliseconds current_delay_;
    double multiplier_;
    double jitter_factor_;
    std::size_t attempt_count_{0};

    std::mt19937 rng_;
};

}  // namespace surge

#include "engine/reconnect_strategy.hpp"
#include <algorithm>

namespace surge {

ReconnectStrategy::ReconnectStrategy(
    std::chrono::milliseconds base_delay,
    std::chrono::milliseconds max_delay,
    double multiplier,
    double jitter_factor,
    std::optional<std::uint32_t> seed
)
    : base_delay_(base_delay)
    , max_delay_(std::max(max_delay, base_delay))
    , current_delay_(base_delay)
    , multiplier_(std::max(multiplier, 1.0))
    , jitter_factor_(std::clamp(jitter_factor, 0.0, 1.0))
    , rng_(seed ? *seed : std::random_device{}())
{}

ReconnectStrategy::ReconnectStrategy(const Config::Network& network, std::optional<std::uint32_t> seed)
    : ReconnectStrategy(
        network.reconnect_delay_initial,
        network.reconnect_delay_max,
        network.reconnect_backoff_multiplier,
        network.reconnect_jitter_factor,
        seed
    )
{}

std::chrono::milliseconds ReconnectStrategy::next_delay() {
    ++attempt_count_;

    auto delay = std::min(current_delay_, max_delay_);

    // delay * (1 +/- jitter_factor)
    std::uniform_real_distribution<double> dist(1.0 - jitter_factor_, 1.0 + jitter_factor_);
    auto jittered = std::chrono::milliseconds{
        static_cast<std::int64_t>(static_cast<double>(delay.count()) * dist(rng_))
    };

    // Grow for next time, but stop growing once capped
    if (current_delay_ < max_delay_) {
        current_delay_ = std::min(
            max_delay_,
            std::chrono::milliseconds{static_cast<std::int64_t>(
                static_cast<double>(current_delay_.count()) * multiplier_)}
        );
    }

    return jittered;
}

void ReconnectStrategy::reset() {
    current_delay_ = base_delay_;
    attempt_count_ = 0;
}

std::chrono::milliseconds ReconnectStrategy::current_delay() const noexcept {
    return current_delay_;
}

std::size_t ReconnectStrategy::attempt_count() const noexcept {
    return attempt_count_;
}

}  // namespace surge

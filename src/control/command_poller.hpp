#pragma once

#include "control/control_processor.hpp"
#include "output/notification_sink.hpp"
#include "telegram/types.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace surge::control {

/// Control loop driver
///
/// Fetches updates, hands each text to the ControlProcessor and sends the
/// reply. The next poll is scheduled a fixed interval after the previous
/// one completes, so polls never overlap. Fetch failures are logged and
/// the loop continues.
class CommandPoller : public std::enable_shared_from_this<CommandPoller> {
public:
    /// @param ioc IO context of the control loop
    /// @param source Where updates come from
    /// @param replies Where replies go
    /// @param processor Command handling
    /// @param interval Delay between the end of one poll and the next
    CommandPoller(
        boost::asio::io_context& ioc,
        telegram::UpdateSource& source,
        output::NotificationSink& replies,
        ControlProcessor& processor,
        std::chrono::milliseconds interval
    );

    // Non-copyable, non-movable
    CommandPoller(const CommandPoller&) = delete;
    CommandPoller& operator=(const CommandPoller&) = delete;

    /// Start polling immediately
    void start();

    /// Stop polling; a fetch in flight completes but is not acted on
    void stop();

    /// Apply a batch of updates (exposed for tests)
    void handle_updates(const std::vector<telegram::Update>& updates);

    [[nodiscard]] std::uint64_t polls_completed() const noexcept;
    [[nodiscard]] std::uint64_t poll_failures() const noexcept;
    [[nodiscard]] std::uint64_t commands_handled() const noexcept;

private:
    void poll();
    void schedule_next();

    boost::asio::steady_timer timer_;
    telegram::UpdateSource& source_;
    output::NotificationSink& replies_;
    ControlProcessor& processor_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> stopped_{false};
    std::atomic<std::uint64_t> polls_{0};
    std::atomic<std::uint64_t> failures_{0};
    std::atomic<std::uint64_t> handled_{0};
};

}  // namespace surge::control

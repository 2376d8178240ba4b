#include "control/command_poller.hpp"
#include <spdlog/spdlog.h>

namespace surge::control {

CommandPoller::CommandPoller(
    boost::asio::io_context& ioc,
    telegram::UpdateSource& source,
    output::NotificationSink& replies,
    ControlProcessor& processor,
    std::chrono::milliseconds interval
)
    : timer_(ioc)
    , source_(source)
    , replies_(replies)
    , processor_(processor)
    , interval_(interval)
{}

void CommandPoller::start() {
    stopped_.store(false);
    spdlog::info("Command poller started (every {}ms)", interval_.count());
    poll();
}

void CommandPoller::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    timer_.cancel();
    spdlog::info("Command poller stopped");
}

void CommandPoller::poll() {
    if (stopped_.load()) {
        return;
    }

    source_.fetch_updates([self = shared_from_this()](auto result) {
        ++self->polls_;
        if (self->stopped_.load()) {
            return;
        }

        if (result.is_err()) {
            ++self->failures_;
            spdlog::warn("Update poll failed: {}", result.error());
        } else {
            self->handle_updates(result.value());
        }

        self->schedule_next();
    });
}

void CommandPoller::schedule_next() {
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](boost::system::error_code ec) {
        if (ec) {
            return;  // Cancelled
        }
        self->poll();
    });
}

void CommandPoller::handle_updates(const std::vector<telegram::Update>& updates) {
    for (const auto& update : updates) {
        if (update.text.empty()) {
            continue;
        }

        auto reply = processor_.handle(update.text);
        if (!reply) {
            spdlog::debug("Ignoring update {}: not a command", update.update_id);
            continue;
        }

        ++handled_;
        replies_.send(std::move(*reply), [id = update.update_id](bool delivered) {
            if (!delivered) {
                spdlog::warn("Reply to update {} was not delivered", id);
            }
        });
    }
}

std::uint64_t CommandPoller::polls_completed() const noexcept {
    return polls_.load();
}

std::uint64_t CommandPoller::poll_failures() const noexcept {
    return failures_.load();
}

std::uint64_t CommandPoller::commands_handled() const noexcept {
    return handled_.load();
}

}  // namespace surge::control

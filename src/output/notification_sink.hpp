#pragma once

#include <functional>
#include <string>

namespace surge::output {

/// Outbound text channel for alerts and command replies
///
/// send() must not block the caller on network I/O. Delivery is
/// best-effort: failures are reported once through the handler and
/// never retried.
class NotificationSink {
public:
    /// Called once with true if the message was delivered
    using CompletionHandler = std::function<void(bool delivered)>;

    virtual ~NotificationSink() = default;

    /// Queue a message for delivery
    virtual void send(std::string text, CompletionHandler on_complete = {}) = 0;
};

}  // namespace surge::output

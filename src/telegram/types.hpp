#pragma once

#include "core/status.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace surge::telegram {

/// One incoming bot update, reduced to what the control loop needs
struct Update {
    std::int64_t update_id{0};
    std::string chat_id;   // Empty for non-message updates
    std::string text;      // Empty when the message carries no text
};

/// Source of operator updates
class UpdateSource {
public:
    /// Called once per fetch, on the source's io_context thread
    using UpdatesHandler = std::function<void(Result<std::vector<Update>, std::string>)>;

    virtual ~UpdateSource() = default;

    /// Fetch updates newer than the last one consumed
    /// Consumption is at-most-once: fetched updates are never redelivered
    virtual void fetch_updates(UpdatesHandler handler) = 0;
};

}  // namespace surge::telegram

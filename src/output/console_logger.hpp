#pragma once

#include "core/types.hpp"
#include "trade/alert_engine.hpp"
#include "trade/metrics_engine.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace surge::output {

/// Console output for market activity
class ConsoleLogger {
public:
    /// Create a console logger
    /// @param interval Minimum time between market lines
    explicit ConsoleLogger(std::chrono::milliseconds interval);

    /// Log the latest trade and metrics (respects rate limiting)
    /// @return true if logged, false if rate limited
    bool log_market(const TradeSample& trade, const std::optional<MetricsSnapshot>& metrics);

    /// Log a decided alert (always logs, not rate limited)
    void log_alert(const AlertEvent& event);

    /// Log connection status change
    void log_connection_status(bool connected, const std::string& details = "");

    /// Force next log_market to output regardless of rate limit
    void force_next();

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_output_;
    bool force_next_{true};  // Always log first one
};

}  // namespace surge::output

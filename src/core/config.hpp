#pragma once

#include "core/status.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace surge {

/// Immutable configuration for surge
struct Config {
    /// Trade feed configuration
    struct Network {
        std::string ws_host = "fstream.binance.com";
        std::string ws_port = "443";
        std::string symbol = "btcusdt";
        bool tls_verify = true;

        // Reconnection settings
        std::chrono::milliseconds reconnect_delay_initial{5000};
        std::chrono::milliseconds reconnect_delay_max{60000};
        double reconnect_backoff_multiplier = 2.0;
        double reconnect_jitter_factor = 0.3;  // +/- 30%
    };

    /// Telegram bot (alerts out, commands in)
    struct Telegram {
        std::string api_host = "api.telegram.org";
        std::string api_port = "443";
        std::string bot_token;   // Required
        std::string chat_id;     // Required
        std::chrono::milliseconds poll_interval{2000};
        int long_poll_timeout_s = 1;
        std::chrono::milliseconds request_timeout{10000};
    };

    /// Ingestion configuration
    struct Engine {
        std::size_t buffer_capacity = 3600;
    };

    /// Alert defaults, used until a persisted snapshot overrides them
    struct Alerts {
        double z_threshold = 3.0;
        double volume_ratio_threshold = 2.0;
        int cooldown_seconds = 60;
        double whale_threshold = 100000.0;
        std::string settings_path = "settings.json";
    };

    /// Output configuration
    struct Output {
        std::chrono::milliseconds console_interval{30000};
        std::string log_level = "info";
    };

    Network network;
    Telegram telegram;
    Engine engine;
    Alerts alerts;
    Output output;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    /// @param config_path Optional path to JSON config file
    /// @return Loaded configuration
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);

    /// Check required fields and cross-field consistency
    /// @return Description of the first problem, or nullopt if usable
    [[nodiscard]] std::optional<std::string> validate() const;

    /// WebSocket path for the raw aggTrade stream
    [[nodiscard]] std::string ws_stream_path() const {
        return "/ws/" + network.symbol + "@aggTrade";
    }
};

}  // namespace surge

#include "core/config.hpp"
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace surge {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer (with optional range validation)
std::optional<int> get_env_int(const char* name, int min_val = std::numeric_limits<int>::min(),
                               int max_val = std::numeric_limits<int>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        int result = std::stoi(*value, &pos);
        if (pos != value->size()) {
            throw std::invalid_argument("trailing characters");
        }
        if (result < min_val || result > max_val) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid integer value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Get environment variable as double (with range validation)
std::optional<double> get_env_double(const char* name, double min_val, double max_val) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        double result = std::stod(*value);
        if (!(result >= min_val && result <= max_val)) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid numeric value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    // Credentials use the names the bot has always been deployed with
    if (auto v = get_env("TELEGRAM_BOT_TOKEN")) {
        config.telegram.bot_token = *v;
    }
    if (auto v = get_env("TELEGRAM_CHAT_ID")) {
        config.telegram.chat_id = *v;
    }

    // Network overrides
    if (auto v = get_env("SURGE_WS_HOST")) {
        config.network.ws_host = *v;
    }
    if (auto v = get_env("SURGE_WS_PORT")) {
        config.network.ws_port = *v;
    }
    if (auto v = get_env("SURGE_SYMBOL")) {
        config.network.symbol = *v;
    }
    // Reconnect delay: 100ms to 5 minutes
    if (auto v = get_env_int("SURGE_RECONNECT_DELAY_INITIAL_MS", 100, 300000)) {
        config.network.reconnect_delay_initial = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env_int("SURGE_RECONNECT_DELAY_MAX_MS", 1000, 600000)) {
        config.network.reconnect_delay_max = std::chrono::milliseconds(*v);
    }

    // Telegram overrides
    if (auto v = get_env("SURGE_TELEGRAM_API_HOST")) {
        config.telegram.api_host = *v;
    }
    if (auto v = get_env_int("SURGE_POLL_INTERVAL_MS", 250, 60000)) {
        config.telegram.poll_interval = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env_int("SURGE_REQUEST_TIMEOUT_MS", 1000, 120000)) {
        config.telegram.request_timeout = std::chrono::milliseconds(*v);
    }

    // Engine overrides
    if (auto v = get_env_int("SURGE_BUFFER_CAPACITY", 60, 1000000)) {
        config.engine.buffer_capacity = static_cast<std::size_t>(*v);
    }

    // Alert defaults, same ranges the operator commands enforce
    if (auto v = get_env_double("SURGE_Z_THRESHOLD", 0.5, 20.0)) {
        config.alerts.z_threshold = *v;
    }
    if (auto v = get_env_double("SURGE_VOLUME_THRESHOLD", 1.0, 100.0)) {
        config.alerts.volume_ratio_threshold = *v;
    }
    if (auto v = get_env_int("SURGE_ALERT_COOLDOWN", 10, 3600)) {
        config.alerts.cooldown_seconds = *v;
    }
    if (auto v = get_env_double("SURGE_WHALE_THRESHOLD", 10000.0,
                                std::numeric_limits<double>::max())) {
        config.alerts.whale_threshold = *v;
    }
    if (auto v = get_env("SURGE_SETTINGS_PATH")) {
        config.alerts.settings_path = *v;
    }

    // Output overrides
    if (auto v = get_env_int("SURGE_CONSOLE_INTERVAL_MS", 100, 3600000)) {
        config.output.console_interval = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env("SURGE_LOG_LEVEL")) {
        config.output.log_level = *v;
    }
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    // Read file contents
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    // Parse JSON
    json j;
    try {
        j = json::parse(content);
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    // Start with defaults
    Config config = Config::defaults();

    try {
        // Network section
        if (j.contains("network")) {
            const auto& net = j["network"];
            if (net.contains("ws_host")) {
                config.network.ws_host = net["ws_host"].get<std::string>();
            }
            if (net.contains("ws_port")) {
                config.network.ws_port = net["ws_port"].get<std::string>();
            }
            if (net.contains("symbol")) {
                config.network.symbol = net["symbol"].get<std::string>();
            }
            if (net.contains("tls_verify")) {
                config.network.tls_verify = net["tls_verify"].get<bool>();
            }
            if (net.contains("reconnect_delay_initial_ms")) {
                config.network.reconnect_delay_initial =
                    std::chrono::milliseconds(net["reconnect_delay_initial_ms"].get<int>());
            }
            if (net.contains("reconnect_delay_max_ms")) {
                config.network.reconnect_delay_max =
                    std::chrono::milliseconds(net["reconnect_delay_max_ms"].get<int>());
            }
            if (net.contains("reconnect_backoff_multiplier")) {
                config.network.reconnect_backoff_multiplier =
                    net["reconnect_backoff_multiplier"].get<double>();
            }
            if (net.contains("reconnect_jitter_factor")) {
                config.network.reconnect_jitter_factor =
                    net["reconnect_jitter_factor"].get<double>();
            }
        }

        // Telegram section
        if (j.contains("telegram")) {
            const auto& tg = j["telegram"];
            if (tg.contains("api_host")) {
                config.telegram.api_host = tg["api_host"].get<std::string>();
            }
            if (tg.contains("api_port")) {
                config.telegram.api_port = tg["api_port"].get<std::string>();
            }
            if (tg.contains("bot_token")) {
                config.telegram.bot_token = tg["bot_token"].get<std::string>();
            }
            if (tg.contains("chat_id")) {
                // Chat ids are numeric in Telegram's API; accept either form
                const auto& id = tg["chat_id"];
                config.telegram.chat_id = id.is_string() ? id.get<std::string>()
                                                         : std::to_string(id.get<std::int64_t>());
            }
            if (tg.contains("poll_interval_ms")) {
                config.telegram.poll_interval =
                    std::chrono::milliseconds(tg["poll_interval_ms"].get<int>());
            }
            if (tg.contains("long_poll_timeout_s")) {
                config.telegram.long_poll_timeout_s = tg["long_poll_timeout_s"].get<int>();
            }
            if (tg.contains("request_timeout_ms")) {
                config.telegram.request_timeout =
                    std::chrono::milliseconds(tg["request_timeout_ms"].get<int>());
            }
        }

        // Engine section
        if (j.contains("engine")) {
            const auto& eng = j["engine"];
            if (eng.contains("buffer_capacity")) {
                config.engine.buffer_capacity = eng["buffer_capacity"].get<std::size_t>();
            }
        }

        // Alerts section
        if (j.contains("alerts")) {
            const auto& al = j["alerts"];
            if (al.contains("z_threshold")) {
                config.alerts.z_threshold = al["z_threshold"].get<double>();
            }
            if (al.contains("volume_threshold")) {
                config.alerts.volume_ratio_threshold = al["volume_threshold"].get<double>();
            }
            if (al.contains("alert_cooldown")) {
                config.alerts.cooldown_seconds = al["alert_cooldown"].get<int>();
            }
            if (al.contains("whale_threshold")) {
                config.alerts.whale_threshold = al["whale_threshold"].get<double>();
            }
            if (al.contains("settings_path")) {
                config.alerts.settings_path = al["settings_path"].get<std::string>();
            }
        }

        // Output section
        if (j.contains("output")) {
            const auto& out = j["output"];
            if (out.contains("console_interval_ms")) {
                config.output.console_interval =
                    std::chrono::milliseconds(out["console_interval_ms"].get<int>());
            }
            if (out.contains("log_level")) {
                config.output.log_level = out["log_level"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    // Load from file if path provided
    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error()
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    // Apply environment variable overrides (highest priority)
    apply_env_overrides(config);

    return config;
}

std::optional<std::string> Config::validate() const {
    if (telegram.bot_token.empty() || telegram.chat_id.empty()) {
        return "TELEGRAM_BOT_TOKEN and TELEGRAM_CHAT_ID must be set";
    }
    if (network.symbol.empty()) {
        return "symbol must not be empty";
    }
    if (engine.buffer_capacity < 60) {
        return "engine.buffer_capacity must be at least 60 (the baseline window)";
    }
    if (network.reconnect_delay_initial.count() <= 0 ||
        network.reconnect_delay_max < network.reconnect_delay_initial) {
        return "reconnect delays must be positive and max >= initial";
    }
    if (telegram.poll_interval.count() <= 0 || telegram.request_timeout.count() <= 0) {
        return "telegram poll interval and request timeout must be positive";
    }
    if (telegram.long_poll_timeout_s < 0 ||
        std::chrono::seconds(telegram.long_poll_timeout_s) >= telegram.request_timeout) {
        return "telegram.long_poll_timeout_s must be shorter than the request timeout";
    }
    return std::nullopt;
}

}  // namespace surge

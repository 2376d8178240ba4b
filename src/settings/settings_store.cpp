#include "settings/settings_store.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace surge {

using json = nlohmann::json;

JsonSettingsStore::JsonSettingsStore(std::string path)
    : path_(std::move(path))
{}

Result<Settings, Error> JsonSettingsStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return Result<Settings, Error>::Err(
            Error::io_error("Failed to open settings file: " + path_));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return Result<Settings, Error>::Err(
            Error::parse_error("Failed to parse settings JSON: " + std::string(e.what())));
    }

    if (!j.is_object()) {
        return Result<Settings, Error>::Err(
            Error::parse_error("Settings JSON must be an object"));
    }

    Settings settings = Settings::defaults();

    try {
        if (j.contains("z_threshold")) {
            settings.z_threshold = j["z_threshold"].get<double>();
        }
        if (j.contains("volume_threshold")) {
            settings.volume_ratio_threshold = j["volume_threshold"].get<double>();
        }
        if (j.contains("alert_cooldown")) {
            settings.cooldown_seconds = j["alert_cooldown"].get<int>();
        }
        if (j.contains("whale_threshold")) {
            settings.whale_threshold = j["whale_threshold"].get<double>();
        }
        if (j.contains("paused")) {
            settings.paused = j["paused"].get<bool>();
        }
    } catch (const json::exception& e) {
        return Result<Settings, Error>::Err(
            Error::parse_error("Error reading settings field: " + std::string(e.what())));
    }

    return Result<Settings, Error>::Ok(settings);
}

Result<bool, Error> JsonSettingsStore::persist(const Settings& settings) {
    json j = {
        {"z_threshold", settings.z_threshold},
        {"volume_threshold", settings.volume_ratio_threshold},
        {"alert_cooldown", settings.cooldown_seconds},
        {"whale_threshold", settings.whale_threshold},
        {"paused", settings.paused}
    };

    // Write to a sibling file and rename so a crash never leaves half a file
    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            return Result<bool, Error>::Err(
                Error::io_error("Failed to open settings file for writing: " + tmp_path));
        }
        file << j.dump(2) << '\n';
        if (!file) {
            return Result<bool, Error>::Err(
                Error::io_error("Failed to write settings file: " + tmp_path));
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        std::remove(tmp_path.c_str());
        return Result<bool, Error>::Err(
            Error::io_error("Failed to replace settings file: " + path_));
    }

    spdlog::info("Settings saved to {}", path_);
    return Result<bool, Error>::Ok(true);
}

const std::string& JsonSettingsStore::path() const noexcept {
    return path_;
}

}  // namespace surge

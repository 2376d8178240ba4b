#include "control/command_parser.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace surge::control {

namespace {

std::string to_lower(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

}  // namespace

Command CommandParser::parse(std::string_view text) {
    auto tokens = split_whitespace(to_lower(text));
    if (tokens.empty() || tokens[0].front() != '/') {
        return Unrecognized{};
    }

    std::string word = tokens[0];
    if (auto at = word.find('@'); at != std::string::npos) {
        word.erase(at);
    }

    const std::string* arg = tokens.size() > 1 ? &tokens[1] : nullptr;

    if (word == "/status" || word == "/start") {
        return GetStatus{};
    }
    if (word == "/stats") {
        return GetStats{};
    }
    if (word == "/pause") {
        return Pause{};
    }
    if (word == "/resume") {
        return Resume{};
    }
    if (word == "/help") {
        return Help{};
    }
    if (word == "/test") {
        return SendTest{};
    }

    if (word == "/z") {
        double value = 0.0;
        if (arg && parse_double(*arg, value)) {
            return SetZThreshold{value};
        }
        return InvalidArgument{"/z 3.5"};
    }
    if (word == "/vol") {
        double value = 0.0;
        if (arg && parse_double(*arg, value)) {
            return SetVolumeRatio{value};
        }
        return InvalidArgument{"/vol 2.5"};
    }
    if (word == "/cooldown") {
        int value = 0;
        if (arg && parse_int(*arg, value)) {
            return SetCooldown{value};
        }
        return InvalidArgument{"/cooldown 60"};
    }
    if (word == "/whale") {
        double value = 0.0;
        if (arg && parse_double(*arg, value)) {
            return SetWhaleThreshold{value};
        }
        return InvalidArgument{"/whale 100000"};
    }

    return Unrecognized{};
}

bool CommandParser::parse_double(std::string_view token, double& out) {
    if (token.empty()) {
        return false;
    }
    try {
        std::string s(token);
        std::size_t pos = 0;
        double value = std::stod(s, &pos);
        if (pos != s.size() || !std::isfinite(value)) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool CommandParser::parse_int(std::string_view token, int& out) {
    if (token.empty()) {
        return false;
    }
    try {
        std::string s(token);
        std::size_t pos = 0;
        int value = std::stoi(s, &pos);
        if (pos != s.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::string_view command_name(const Command& command) {
    return std::visit([](const auto& c) -> std::string_view {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, GetStatus>) return "GetStatus";
        else if constexpr (std::is_same_v<T, GetStats>) return "GetStats";
        else if constexpr (std::is_same_v<T, SetZThreshold>) return "SetZThreshold";
        else if constexpr (std::is_same_v<T, SetVolumeRatio>) return "SetVolumeRatio";
        else if constexpr (std::is_same_v<T, SetCooldown>) return "SetCooldown";
        else if constexpr (std::is_same_v<T, SetWhaleThreshold>) return "SetWhaleThreshold";
        else if constexpr (std::is_same_v<T, Pause>) return "Pause";
        else if constexpr (std::is_same_v<T, Resume>) return "Resume";
        else if constexpr (std::is_same_v<T, Help>) return "Help";
        else if constexpr (std::is_same_v<T, SendTest>) return "SendTest";
        else if constexpr (std::is_same_v<T, InvalidArgument>) return "InvalidArgument";
        else return "Unrecognized";
    }, command);
}

}  // namespace surge::control

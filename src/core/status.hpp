#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace surge {

/// Broad category of a recoverable failure
enum class ErrorCode {
    InvalidArgument,   // Value outside its documented range
    ParseError,        // Malformed text, JSON or number
    IoError            // File or network failure
};

/// Convert ErrorCode to string for logging
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ParseError:      return "ParseError";
        case ErrorCode::IoError:         return "IoError";
    }
    return "Unknown";
}

/// Error value carried by Result
struct Error {
    ErrorCode code;
    std::string message;

    [[nodiscard]] static Error invalid_argument(std::string message) {
        return Error{ErrorCode::InvalidArgument, std::move(message)};
    }

    [[nodiscard]] static Error parse_error(std::string message) {
        return Error{ErrorCode::ParseError, std::move(message)};
    }

    [[nodiscard]] static Error io_error(std::string message) {
        return Error{ErrorCode::IoError, std::move(message)};
    }
};

/// Result monad for error handling without exceptions
template <typename T, typename E = std::string>
class Result {
public:
    /// Create a successful result
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /// Create an error result
    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Check if result is successful
    /// Uses index-based check to handle T==E case
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    /// Check if result is an error
    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Get the value (throws if error)
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(data_);
    }

    /// Get the value (throws if error) - rvalue version
    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Get the error (throws if ok)
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<1>(data_);
    }

private:
    template <size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

}  // namespace surge

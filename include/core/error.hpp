#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace vaultclient {

/**
 * @brief Error categories for the client
 */
enum class ErrorCategory {
    NONE,
    RESOLUTION_ERROR,       // Expected: a single source had nothing usable
    CONFIGURATION_ERROR,
    UNEXPECTED_ERROR,
    CREDENTIALS_EXHAUSTED,  // Every provider in a chain failed
    TRANSPORT_ERROR,
    SERVER_ERROR,
    PARSE_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                  return "none";
        case ErrorCategory::RESOLUTION_ERROR:      return "resolution_error";
        case ErrorCategory::CONFIGURATION_ERROR:   return "configuration_error";
        case ErrorCategory::UNEXPECTED_ERROR:      return "unexpected_error";
        case ErrorCategory::CREDENTIALS_EXHAUSTED: return "credentials_exhausted";
        case ErrorCategory::TRANSPORT_ERROR:       return "transport_error";
        case ErrorCategory::SERVER_ERROR:          return "server_error";
        case ErrorCategory::PARSE_ERROR:           return "parse_error";
        default:                                   return "unknown";
    }
}

/**
 * @brief Thrown for misuse detected at construction time (empty provider
 * list, invalid base URL) and by Result::value_or_throw().
 */
class VaultClientException : public std::runtime_error {
public:
    VaultClientException(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    // Re-tag another Result's error (any payload type)
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    T value_or_throw() && {
        if (!success_) {
            throw VaultClientException(error_category_, error_message_);
        }
        return std::move(*value_);
    }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    void value_or_throw() const {
        if (!success_) {
            throw VaultClientException(error_category_, error_message_);
        }
    }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace vaultclient

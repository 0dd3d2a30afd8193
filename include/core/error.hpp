#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace polystore {

/**
 * @brief Error taxonomy shared by every layer of the engine
 */
enum class ErrorCategory {
    NONE,
    CONNECTION_ERROR,
    NO_PROVIDERS_AVAILABLE,
    UNSUPPORTED_OPERATION,
    NO_CONNECTION,
    NOT_FOUND,
    VALIDATION_ERROR,
    MIGRATION_FAILURE,
    DRIVER_ERROR,
    INTERNAL_ERROR
};

/// Machine-readable category name carried in user-visible error bodies
[[nodiscard]] inline std::string_view error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "None";
        case ErrorCategory::CONNECTION_ERROR: return "ConnectionError";
        case ErrorCategory::NO_PROVIDERS_AVAILABLE: return "NoProvidersAvailable";
        case ErrorCategory::UNSUPPORTED_OPERATION: return "UnsupportedOperation";
        case ErrorCategory::NO_CONNECTION: return "NoConnection";
        case ErrorCategory::NOT_FOUND: return "NotFound";
        case ErrorCategory::VALIDATION_ERROR: return "ValidationError";
        case ErrorCategory::MIGRATION_FAILURE: return "MigrationFailure";
        case ErrorCategory::DRIVER_ERROR: return "DriverError";
        case ErrorCategory::INTERNAL_ERROR: return "InternalError";
        default: return "InternalError";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value = T{}) {
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

    /// Carry the error of another result across a type boundary
    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/// Result of an operation with no payload
using Status = Result<std::monostate>;

} // namespace polystore

#pragma once

#include <string>
#include <optional>

namespace ormaudit {

/**
 * @brief Error categories for the analyzer
 */
enum class ErrorCategory {
    NONE,
    IO_ERROR,
    PARSE_ERROR,
    SCHEMA_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "none";
        case ErrorCategory::IO_ERROR:       return "io";
        case ErrorCategory::PARSE_ERROR:    return "parse";
        case ErrorCategory::SCHEMA_ERROR:   return "schema";
        case ErrorCategory::CONFIG_ERROR:   return "config";
        case ErrorCategory::INTERNAL_ERROR: return "internal";
    }
    return "unknown";
}

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

    /**
     * @brief Forward the failure of another Result unchanged
     */
    template<typename U>
    static Result propagate(const Result<U>& failed) {
        return error(failed.error_category(), failed.error_message());
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

} // namespace ormaudit

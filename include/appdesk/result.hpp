#pragma once

/**
 * @file result.hpp
 * @brief Error handling types shared by every appdesk component
 *
 * Fallible operations return Result<T>. Filesystem exceptions are caught
 * where they happen and converted into an Error carrying an ErrorCode.
 */

#include <optional>
#include <string>
#include <utility>

namespace appdesk {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for appdesk operations
 */
enum class ErrorCode {
    // System / IO
    PERMISSION_DENIED,
    IO_ERROR,

    // Lookup of a descriptor or bundle by name
    NOT_FOUND,

    // Configuration file or override values
    INVALID_CONFIGURATION,

    // External collaborator (package manager, launcher index)
    COMMAND_FAILED,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::PERMISSION_DENIED: return "permission_denied";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::INVALID_CONFIGURATION: return "invalid_configuration";
        case ErrorCode::COMMAND_FAILED: return "command_failed";
    }
    return "unknown";
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace appdesk

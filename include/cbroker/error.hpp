#pragma once

/**
 * @file error.hpp
 * @brief Error and Result types shared by every broker module
 *
 * Fallible operations return Result<T>. Check isOk() before accessing
 * value(), or isErr() before error().
 *
 * @example
 * ```cpp
 * auto contract = registry.get("services/weather/v1");
 * auto result = engine.transform(data, consumer, provider, Direction::Forward);
 * if (result.isErr()) {
 *     spdlog::warn("transform failed: {}", result.error().message());
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace cbroker {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Request validation
    INVALID_PARAMS,

    // Schema loading
    SCHEMA_NOT_FOUND,
    INVALID_JSON,
    INVALID_SCHEMA,

    // Routing
    NO_PROVIDER,
    PROVIDER_FAILED,

    // Sandbox
    SCRIPT_TIMEOUT,
    SCRIPT_ERROR,
    SANDBOX_FAILURE,

    INTERNAL,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_PARAMS: return "INVALID_PARAMS";
        case ErrorCode::SCHEMA_NOT_FOUND: return "SCHEMA_NOT_FOUND";
        case ErrorCode::INVALID_JSON: return "INVALID_JSON";
        case ErrorCode::INVALID_SCHEMA: return "INVALID_SCHEMA";
        case ErrorCode::NO_PROVIDER: return "NO_PROVIDER";
        case ErrorCode::PROVIDER_FAILED: return "PROVIDER_FAILED";
        case ErrorCode::SCRIPT_TIMEOUT: return "SCRIPT_TIMEOUT";
        case ErrorCode::SCRIPT_ERROR: return "SCRIPT_ERROR";
        case ErrorCode::SANDBOX_FAILURE: return "SANDBOX_FAILURE";
        case ErrorCode::INTERNAL: return "INTERNAL";
        default: return "UNKNOWN";
    }
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
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

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

} // namespace cbroker

#pragma once

/**
 * Error handling utilities shared by the matching stages.
 *
 * Stages throw inside and return tagged results at their boundary, so the
 * batch processor decides what a failure means (abort vs. isolate) instead
 * of a catch-all at the top.
 */

#include <string>
#include <exception>
#include <stdexcept>
#include <functional>
#include <optional>
#include <utility>
#include "logging/log_helper.hpp"

namespace error_handling {

enum class ErrorKind {
    NONE,
    DECODE,     // payload matches no known layout; fatal for the batch
    CONFIG,     // runtime tuple rejected; defaults apply
    MATCHING    // internal fault while matching one instrument
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::DECODE: return "DecodeError";
        case ErrorKind::CONFIG: return "ConfigError";
        case ErrorKind::MATCHING: return "MatchingError";
        default: return "UnknownError";
    }
}

/**
 * Thrown for invariant breaches inside the matching engine.
 */
class MatchingError : public std::runtime_error {
public:
    explicit MatchingError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Thrown by the codec on malformed payloads.
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Result type for operations that can fail
 * Similar to Rust's Result<T, E> or std::expected
 */
template<typename T>
class Result {
public:
    static Result success(T value) {
        Result result;
        result.value_ = std::move(value);
        result.kind_ = ErrorKind::NONE;
        return result;
    }

    static Result error(ErrorKind kind, const std::string& error_message) {
        Result result;
        result.error_message_ = error_message;
        result.kind_ = kind;
        return result;
    }

    bool is_success() const { return kind_ == ErrorKind::NONE; }
    bool is_error() const { return kind_ != ErrorKind::NONE; }

    // Only call if is_success() == true
    const T& value() const {
        if (!is_success()) {
            throw std::runtime_error("Attempted to get value from error Result: " + error_message_);
        }
        return value_.value();
    }

    T& value() {
        if (!is_success()) {
            throw std::runtime_error("Attempted to get value from error Result: " + error_message_);
        }
        return value_.value();
    }

    // Only call if is_error() == true
    const std::string& error() const {
        if (is_success()) {
            throw std::runtime_error("Attempted to get error from success Result");
        }
        return error_message_;
    }

    ErrorKind kind() const { return kind_; }

    explicit operator bool() const { return is_success(); }
    const T& operator*() const { return value(); }
    T& operator*() { return value(); }

private:
    std::optional<T> value_;
    std::string error_message_;
    ErrorKind kind_{ErrorKind::NONE};
};

/**
 * Execute a function and convert a thrown std::exception into an error
 * Result of the given kind, logging it under the component name.
 *
 * @param func Function to execute
 * @param kind Error kind recorded on failure
 * @param component_name Component name for logging
 * @param operation_name Operation name for logging
 */
template<typename Func>
auto safe_execute(Func&& func, ErrorKind kind, const std::string& component_name,
                  const std::string& operation_name)
    -> Result<decltype(func())> {
    using ValueType = decltype(func());
    try {
        return Result<ValueType>::success(func());
    } catch (const std::exception& e) {
        LOG_ERROR_COMP(component_name, operation_name + " failed: " + std::string(e.what()));
        return Result<ValueType>::error(kind, std::string(e.what()));
    }
}

} // namespace error_handling

// include/order_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace order_ngin {

/**
 * @brief Error codes for the execution engine
 * Defines all possible error conditions that can occur
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Plan errors
    INVALID_PLAN = 4,
    INVALID_RANGE = 5,
    PLAN_NOT_FOUND = 6,
    INVALID_STATE_TRANSITION = 7,

    // Transient exchange errors
    NETWORK_ERROR = 8,
    TIMEOUT_ERROR = 9,
    RATE_LIMITED = 10,

    // Permanent exchange errors
    AUTH_ERROR = 11,
    ORDER_REJECTED = 12,
    INVALID_SYMBOL = 13,
    ORDER_ALREADY_FILLED = 14,
    ORDER_NOT_FOUND = 15,

    // File and parsing errors
    FILE_IO_ERROR = 16,
    JSON_PARSE_ERROR = 17,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Errors the exchange may clear up on its own (retried with backoff)
 */
inline bool is_transient_error(ErrorCode code) {
    return code == ErrorCode::NETWORK_ERROR ||
           code == ErrorCode::TIMEOUT_ERROR ||
           code == ErrorCode::RATE_LIMITED;
}

/**
 * @brief Exchange errors that are never retried
 */
inline bool is_permanent_exchange_error(ErrorCode code) {
    return code == ErrorCode::AUTH_ERROR ||
           code == ErrorCode::ORDER_REJECTED ||
           code == ErrorCode::INVALID_SYMBOL ||
           code == ErrorCode::ORDER_ALREADY_FILLED ||
           code == ErrorCode::ORDER_NOT_FOUND;
}

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::INVALID_PLAN:
            return "INVALID_PLAN";
        case ErrorCode::INVALID_RANGE:
            return "INVALID_RANGE";
        case ErrorCode::PLAN_NOT_FOUND:
            return "PLAN_NOT_FOUND";
        case ErrorCode::INVALID_STATE_TRANSITION:
            return "INVALID_STATE_TRANSITION";
        case ErrorCode::NETWORK_ERROR:
            return "NETWORK_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::RATE_LIMITED:
            return "RATE_LIMITED";
        case ErrorCode::AUTH_ERROR:
            return "AUTH_ERROR";
        case ErrorCode::ORDER_REJECTED:
            return "ORDER_REJECTED";
        case ErrorCode::INVALID_SYMBOL:
            return "INVALID_SYMBOL";
        case ErrorCode::ORDER_ALREADY_FILLED:
            return "ORDER_ALREADY_FILLED";
        case ErrorCode::ORDER_NOT_FOUND:
            return "ORDER_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Error raised or returned by engine components
 */
class EngineError : public std::runtime_error {
public:
    /**
     * @brief Constructor for EngineError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    EngineError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    /**
     * @brief Get the error code
     * @return ErrorCode representing the type of error
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     * @return String identifying the component
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() +
               " (Code: " + error_code_to_string(code_) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<EngineError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws EngineError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const EngineError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<EngineError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<EngineError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const EngineError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<EngineError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<EngineError>(code, message, component));
}

}  // namespace order_ngin

// include/fund_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace fund_ngin {

/**
 * @brief Error codes for the fund engine
 * Defines all possible error conditions that can occur
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATABASE_ERROR = 4,
    DATA_NOT_FOUND = 5,
    INVALID_DATA = 6,
    CONVERSION_ERROR = 7,

    // Ledger errors
    INVALID_TRANSACTION = 8,
    INSUFFICIENT_POSITION = 9,
    UNKNOWN_INVESTOR = 10,
    INACTIVE_INVESTOR = 11,

    // Fund accounting errors
    PRECONDITION_FAILED = 12,
    INVALID_STATE = 13,
    STALE_VERSION = 14,

    // System errors
    CONNECTION_ERROR = 16,
    TIMEOUT_ERROR = 17,
    API_ERROR = 18,
    CANCELLED = 19,

    // Market data errors
    MARKET_DATA_ERROR = 20,

    // File and I/O errors
    FILE_NOT_FOUND = 21,
    FILE_IO_ERROR = 22,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 23,
    PARSE_ERROR = 24,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Exception type carried by failed results
 */
class FundError : public std::runtime_error {
public:
    /**
     * @brief Constructor for FundError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    FundError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() +
               " (Code: " + std::to_string(static_cast<int>(code_)) + ")";
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
    Result(std::unique_ptr<FundError> error) : error_(std::move(error)) {}

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
     * @throws FundError if result represents an error
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
    const FundError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<FundError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<FundError> error) : error_(std::move(error)) {}

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

    const FundError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<FundError> error_;
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
    return Result<T>(std::make_unique<FundError>(code, message, component));
}

/**
 * @brief Re-wrap the error of one result into a result of another type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed) {
    return make_error<T>(failed.error()->code(), failed.error()->what(),
                         failed.error()->component());
}

}  // namespace fund_ngin

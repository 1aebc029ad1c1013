// include/paper_ngin/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace paper_ngin {

/**
 * @brief Error codes for the paper trading engine
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    INVALID_DATA = 4,
    DATA_NOT_FOUND = 5,
    CONVERSION_ERROR = 6,

    // Capital and position errors
    INSUFFICIENT_FUNDS = 7,
    POSITION_NOT_FOUND = 8,
    POSITION_LIMIT_EXCEEDED = 9,
    INVALID_SIGNAL = 10,

    // Bookkeeping errors (bug class, never retried)
    INVARIANT_VIOLATION = 11,
    PORTFOLIO_HALTED = 12,

    // Persistence errors
    FILE_NOT_FOUND = 13,
    FILE_IO_ERROR = 14,
    JSON_PARSE_ERROR = 15,
    DATABASE_ERROR = 16,
    CONNECTION_ERROR = 17,

    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::INSUFFICIENT_FUNDS:
            return "INSUFFICIENT_FUNDS";
        case ErrorCode::POSITION_NOT_FOUND:
            return "POSITION_NOT_FOUND";
        case ErrorCode::POSITION_LIMIT_EXCEEDED:
            return "POSITION_LIMIT_EXCEEDED";
        case ErrorCode::INVALID_SIGNAL:
            return "INVALID_SIGNAL";
        case ErrorCode::INVARIANT_VIOLATION:
            return "INVARIANT_VIOLATION";
        case ErrorCode::PORTFOLIO_HALTED:
            return "PORTFOLIO_HALTED";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Exception carrying an error code and the component that raised it
 */
class TradeError : public std::runtime_error {
public:
    /**
     * @brief Constructor for TradeError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    TradeError(ErrorCode code, const std::string& message, const std::string& component = "")
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
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Raise an invariant violation
 *
 * Bookkeeping invariants (non-negative cash, share counts, target monotonicity)
 * are checked at the point of mutation. A breach is a bug: the caller must not
 * persist the state it was building.
 */
[[noreturn]] inline void throw_invariant_violation(const std::string& message,
                                                   const std::string& component) {
    throw TradeError(ErrorCode::INVARIANT_VIOLATION, message, component);
}

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

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
     * @throws TradeError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws TradeError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    const TradeError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<TradeError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

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

    const TradeError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<TradeError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<TradeError>(code, message, component));
}

/**
 * @brief Forward an error from one result type into another
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& other) {
    return make_error<T>(other.error()->code(), other.error()->what(),
                         other.error()->component());
}

}  // namespace paper_ngin

// include/tempo_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace tempo_ngin {

/**
 * @brief Error codes for the walk-forward pipeline
 * Each code maps to one failure class of the run
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,
    INVALID_CONFIG = 4,
    INVALID_STATE = 5,
    INVALID_DATA = 6,

    // Timing errors
    ALIGNMENT_ERROR = 10,
    INTENT_VALIDATION_ERROR = 11,
    LOOKAHEAD_VIOLATION = 12,

    // Warmup errors
    INSUFFICIENT_WARMUP = 20,
    INSUFFICIENT_HISTORY = 21,

    // Allocation errors
    ALLOCATOR_CONTRACT_VIOLATION = 30,
    SOLVER_ERROR = 31,

    // Accounting errors
    ATTRIBUTION_CONSERVATION_ERROR = 40,

    // Strategy errors
    STRATEGY_ERROR = 50,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::INVALID_CONFIG:
            return "INVALID_CONFIG";
        case ErrorCode::INVALID_STATE:
            return "INVALID_STATE";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::ALIGNMENT_ERROR:
            return "ALIGNMENT_ERROR";
        case ErrorCode::INTENT_VALIDATION_ERROR:
            return "INTENT_VALIDATION_ERROR";
        case ErrorCode::LOOKAHEAD_VIOLATION:
            return "LOOKAHEAD_VIOLATION";
        case ErrorCode::INSUFFICIENT_WARMUP:
            return "INSUFFICIENT_WARMUP";
        case ErrorCode::INSUFFICIENT_HISTORY:
            return "INSUFFICIENT_HISTORY";
        case ErrorCode::ALLOCATOR_CONTRACT_VIOLATION:
            return "ALLOCATOR_CONTRACT_VIOLATION";
        case ErrorCode::SOLVER_ERROR:
            return "SOLVER_ERROR";
        case ErrorCode::ATTRIBUTION_CONSERVATION_ERROR:
            return "ATTRIBUTION_CONSERVATION_ERROR";
        case ErrorCode::STRATEGY_ERROR:
            return "STRATEGY_ERROR";
        default:
            return "CUSTOM_ERROR";
    }
}

/**
 * @brief Exception type carried by failed results
 */
class TempoError : public std::runtime_error {
public:
    TempoError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    // Layer that raised the error, e.g. "Allocator"
    const std::string& component() const noexcept {
        return component_;
    }

    // "Error in <component>: <message> (<CODE>)"
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Value or error returned by every fallible pipeline operation
 *
 * Move-only. A failed result owns its TempoError, so callers forward it
 * with forward_error() instead of copying the result.
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<TempoError> error) : error_(std::move(error)) {}

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
     * @throws TempoError if the result holds an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    // Moves the value out; throws like value()
    T take() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    const TempoError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<TempoError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<TempoError> error) : error_(std::move(error)) {}

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

    const TempoError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<TempoError> error_;
};

/**
 * @brief Build a failed Result<T> carrying a TempoError
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<TempoError>(code, message, component));
}

// Propagates a failure across layers that return different value types
template <typename T>
Result<T> forward_error(const TempoError* error) {
    return make_error<T>(error->code(), error->what(), error->component());
}

}  // namespace tempo_ngin

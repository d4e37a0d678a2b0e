// include/trade_sim/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace trade_sim {

/**
 * @brief Error codes for the simulation core
 * Defines all error conditions reported through Result
 */
enum class ErrorCode {
    INVALID_ARGUMENT = 1,

    // Configuration errors
    INVALID_CONFIGURATION = 2,

    // Data errors
    INVALID_DATA = 3,

    // Trading errors
    INVALID_ORDER = 4,
    POSITION_NOT_FOUND = 5,

    // Strategy errors
    STRATEGY_ERROR = 6,

    // File and parsing errors
    FILE_NOT_FOUND = 7,
    FILE_IO_ERROR = 8,
    JSON_PARSE_ERROR = 9
};

/**
 * @brief Base error type of the simulation core
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
               " (Code: " + std::to_string(static_cast<int>(code_)) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Configuration error carrying every violated constraint at once
 */
class ValidationError : public TradeError {
public:
    ValidationError(std::vector<std::string> violations, const std::string& component = "")
        : TradeError(ErrorCode::INVALID_CONFIGURATION, join(violations), component),
          violations_(std::move(violations)) {}

    const std::vector<std::string>& violations() const noexcept {
        return violations_;
    }

private:
    static std::string join(const std::vector<std::string>& violations) {
        std::string message = "Invalid configuration (" + std::to_string(violations.size()) +
                              " violation" + (violations.size() == 1 ? "" : "s") + ")";
        for (const auto& v : violations) {
            message += "; " + v;
        }
        return message;
    }

    std::vector<std::string> violations_;
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
     * @tparam U The type of the successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
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

    /**
     * @brief Check if result represents success
     * @return true if operation was successful
     */
    bool is_ok() const {
        return error_ == nullptr;
    }

    /**
     * @brief Check if result represents error
     * @return true if operation failed
     */
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
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
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
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<TradeError>(code, message, component));
}

/**
 * @brief Helper for creating a configuration error listing all violations
 */
template <typename T>
Result<T> make_validation_error(std::vector<std::string> violations,
                                const std::string& component = "") {
    std::unique_ptr<TradeError> error =
        std::make_unique<ValidationError>(std::move(violations), component);
    return Result<T>(std::move(error));
}

}  // namespace trade_sim

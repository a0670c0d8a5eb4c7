// include/finpipe/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace finpipe {

/**
 * @brief Error codes for the pipeline
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

    // Ingestion errors
    QUOTA_EXCEEDED = 8,
    SOURCE_UNAVAILABLE = 9,
    INSUFFICIENT_HISTORY = 10,
    CONSTRAINT_VIOLATION = 11,

    // System errors
    CONNECTION_ERROR = 16,
    TIMEOUT_ERROR = 17,
    API_ERROR = 18,

    // File and I/O errors
    FILE_NOT_FOUND = 20,
    FILE_IO_ERROR = 21,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 23,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Symbol absent from a provider. Terminal for that symbol only.
 */
constexpr ErrorCode NOT_FOUND = ErrorCode::DATA_NOT_FOUND;

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::DATA_NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::QUOTA_EXCEEDED:
            return "QUOTA_EXCEEDED";
        case ErrorCode::SOURCE_UNAVAILABLE:
            return "SOURCE_UNAVAILABLE";
        case ErrorCode::INSUFFICIENT_HISTORY:
            return "INSUFFICIENT_HISTORY";
        case ErrorCode::CONSTRAINT_VIOLATION:
            return "CONSTRAINT_VIOLATION";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::API_ERROR:
            return "API_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Whether a failure with this code may succeed on a later attempt
 */
inline bool is_recoverable(ErrorCode code) {
    switch (code) {
        case ErrorCode::QUOTA_EXCEEDED:
        case ErrorCode::SOURCE_UNAVAILABLE:
        case ErrorCode::TIMEOUT_ERROR:
        case ErrorCode::CONNECTION_ERROR:
        case ErrorCode::DATABASE_ERROR:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Exception type carried by failed results
 */
class PipelineError : public std::runtime_error {
public:
    /**
     * @brief Constructor for PipelineError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    PipelineError(ErrorCode code, const std::string& message, const std::string& component = "")
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
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
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
    Result(std::unique_ptr<PipelineError> error) : value_(), error_(std::move(error)) {}

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
     * @throws PipelineError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws PipelineError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const PipelineError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<PipelineError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<PipelineError> error) : error_(std::move(error)) {}

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

    const PipelineError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<PipelineError> error_;
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
    return Result<T>(std::make_unique<PipelineError>(code, message, component));
}

/**
 * @brief Re-wrap an error from one result type into another
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed, const std::string& component = "") {
    const PipelineError* err = failed.error();
    return make_error<T>(err->code(), err->what(),
                         component.empty() ? err->component() : component);
}

}  // namespace finpipe

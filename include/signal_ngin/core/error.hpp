// include/signal_ngin/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace signal_ngin {

/**
 * @brief Failure classes reported by engine calls
 *
 * Short or degenerate windows are not errors: classifiers answer them with
 * an unknown / neutral result. INSUFFICIENT_DATA is only reported by model
 * objects asked to fit too few observations.
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Input windows
    INVALID_DATA = 4,
    INSUFFICIENT_DATA = 5,

    // Models
    NUMERIC_ERROR = 6,
    MODEL_ERROR = 7,

    // Files and configuration
    FILE_NOT_FOUND = 8,
    FILE_IO_ERROR = 9,
    JSON_PARSE_ERROR = 10
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case ErrorCode::NUMERIC_ERROR:
            return "NUMERIC_ERROR";
        case ErrorCode::MODEL_ERROR:
            return "MODEL_ERROR";
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
 * @brief Error raised by an engine component
 * Thrown only by Result::value() on an error result.
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief "[INVALID_DATA] RuleClassifier: message", component omitted when empty
     */
    std::string to_string() const {
        std::string text = std::string("[") + signal_ngin::to_string(code_) + "] ";
        if (!component_.empty())
            text += component_ + ": ";
        return text + what();
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Value or error of a fallible engine call
 *
 * Move-only. value() on an error rethrows the stored EngineError, so check
 * is_ok() first wherever the error is expected.
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

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

    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    // nullptr on success
    const EngineError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<EngineError> error_;
};

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

template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<EngineError>(code, message, component));
}

}  // namespace signal_ngin

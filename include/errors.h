#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace luna_voice {

/**
 * @brief Failure taxonomy shared by every component
 *
 * Providers tag errors with their best guess; ErrorClassifier makes the
 * final decision from type and message.
 */
enum class ErrorType {
    None,
    MicrophoneAccess,
    AudioContext,
    MediaRecorder,
    NetworkError,
    APIError,
    TranscriptionError,
    TTSError,
    PermissionDenied,
    BrowserCompatibility,
    ResourceExhausted,
    Timeout,
    Unknown
};

inline const char* error_type_to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::MicrophoneAccess: return "MicrophoneAccess";
        case ErrorType::AudioContext: return "AudioContext";
        case ErrorType::MediaRecorder: return "MediaRecorder";
        case ErrorType::NetworkError: return "NetworkError";
        case ErrorType::APIError: return "APIError";
        case ErrorType::TranscriptionError: return "TranscriptionError";
        case ErrorType::TTSError: return "TTSError";
        case ErrorType::PermissionDenied: return "PermissionDenied";
        case ErrorType::BrowserCompatibility: return "BrowserCompatibility";
        case ErrorType::ResourceExhausted: return "ResourceExhausted";
        case ErrorType::Timeout: return "Timeout";
        case ErrorType::Unknown: return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;
    bool cancelled = false;     ///< Aborted by a CancellationToken, not a failure of the callee

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

using VoidResult = Result<void>;

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_api_error(const std::string& message) {
    return Error(ErrorType::APIError, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

inline Error make_cancelled_error(const std::string& message = "Operation cancelled") {
    Error error(ErrorType::Unknown, "cancelled: " + message);
    error.cancelled = true;
    return error;
}

inline bool is_cancelled_error(const Error& error) {
    return error.cancelled;
}

} // namespace luna_voice

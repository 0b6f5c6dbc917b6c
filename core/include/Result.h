#pragma once

/**
 * @file Result.h
 * @brief Consistent error handling types for BlockSync
 *
 * Provides a Result<T, E> type similar to Rust's Result or C++23's std::expected.
 * Engines and protocol code return it instead of mixing exceptions and return codes.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace bsync {

/**
 * @brief Error codes for BlockSync operations
 */
enum class ErrorCode {
    Success = 0,

    // Transport errors (100-199)
    NetworkError = 100,
    ConnectionFailed = 101,
    ConnectionClosed = 102,
    SendFailed = 105,
    ReceiveFailed = 106,
    FrameTooLarge = 107,

    // File system errors (200-299)
    FileNotFound = 200,
    FileAccessDenied = 201,
    FileReadError = 202,
    FileWriteError = 203,
    DirectoryNotFound = 204,
    RenameFailed = 206,

    // Sync errors (500-599)
    SyncError = 500,
    DeltaApplyFailed = 502,
    BlockIndexOutOfRange = 504,

    // Configuration errors (600-699)
    ConfigError = 600,
    InvalidConfig = 601,
    MissingConfig = 602,

    // Protocol errors (700-799)
    ProtocolError = 700,
    MalformedFrame = 701,
    MalformedPayload = 702,
    PathOutsideRoot = 703,
    UnexpectedResponse = 704,
    RemoteFailure = 705,
    InvalidPath = 706,

    // General errors (900-999)
    InvalidArgument = 900,
    InternalError = 999
};

/**
 * @brief Coarse error classes reported to protocol peers
 */
enum class ErrorKind {
    None,
    IOError,
    ProtocolError,
    AlgorithmError,
    InternalError
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::FrameTooLarge: return "Frame too large";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileAccessDenied: return "File access denied";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";
        case ErrorCode::DirectoryNotFound: return "Directory not found";
        case ErrorCode::RenameFailed: return "Rename failed";
        case ErrorCode::SyncError: return "Sync error";
        case ErrorCode::DeltaApplyFailed: return "Delta apply failed";
        case ErrorCode::BlockIndexOutOfRange: return "Block index out of range";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::MissingConfig: return "Missing configuration";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::MalformedFrame: return "Malformed frame";
        case ErrorCode::MalformedPayload: return "Malformed payload";
        case ErrorCode::PathOutsideRoot: return "Path outside root directory";
        case ErrorCode::UnexpectedResponse: return "Unexpected response";
        case ErrorCode::RemoteFailure: return "Remote failure";
        case ErrorCode::InvalidPath: return "Invalid path";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Map an error code to the kind reported on the wire
 *
 * File system codes are IOError, sync codes AlgorithmError and protocol
 * codes ProtocolError. Everything else is internal.
 */
inline ErrorKind errorKindOf(ErrorCode code) {
    int value = static_cast<int>(code);
    if (value == 0) return ErrorKind::None;
    if (value >= 200 && value < 300) return ErrorKind::IOError;
    if (value >= 500 && value < 600) return ErrorKind::AlgorithmError;
    if (value >= 700 && value < 800) return ErrorKind::ProtocolError;
    return ErrorKind::InternalError;
}

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::IOError: return "IOError";
        case ErrorKind::ProtocolError: return "ProtocolError";
        case ErrorKind::AlgorithmError: return "AlgorithmError";
        case ErrorKind::InternalError: return "InternalError";
        default: return "Unknown";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    ErrorKind kind() const { return errorKindOf(code); }

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

/**
 * @brief Result type for operations that can fail
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 *
 * Usage:
 * @code
 * Result<SignatureSet> sigs = SignatureEngine::calculateSignature(path, 4096);
 * if (!sigs) {
 *     logger.error(sigs.error().message, "Example");
 *     return sigs.error();
 * }
 * for (const auto& sig : *sigs) { ... }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}

    /// Construct error result
    Result(E error) : data_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return std::holds_alternative<T>(data_); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return std::holds_alternative<E>(data_); }

    /// Get success value (throws if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get success value with default
    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    /// Get error (throws if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    /// Dereference operator (get value)
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    /// Arrow operator (access value members)
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    /// Construct success result
    Result() : error_(std::nullopt) {}

    /// Construct error result
    Result(E error) : error_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return !error_.has_value(); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return error_.has_value(); }

    /// Get error (undefined if success)
    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

/// Create a success result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result
template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

/// Create an error result with message
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace bsync

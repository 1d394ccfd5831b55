#pragma once

/**
 * @file Result.h
 * @brief Error handling types for DriveSync
 *
 * Engine operations that can fail return Result<T> instead of throwing.
 * Low-level primitives (Crypto, Compression, PreparedStatement) throw and the
 * engine converts those exceptions at its boundary.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace DriveSync {

/**
 * @brief Error codes for DriveSync operations
 */
enum class ErrorCode {
    Success = 0,

    // Filesystem errors (100-199)
    IOFault = 100,              // Root path unreadable/unwritable, aborts the operation
    FileTransferError = 101,    // Per-file copy/read/write failure
    NotFound = 102,

    // Integrity errors (200-299)
    IntegrityError = 200,       // Checksum mismatch or AEAD tag failure

    // Concurrency / lifecycle (300-399)
    Locked = 300,               // Another operation holds the group lock
    Cancelled = 301,
    ConflictUnresolved = 302,

    // Scheduling (400-499)
    ScheduleFault = 400,

    // Storage errors (500-599)
    DatabaseError = 500,

    // Configuration errors (600-699)
    ConfigError = 600,

    // General errors (900-999)
    InvalidArgument = 900,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::IOFault: return "I/O fault";
        case ErrorCode::FileTransferError: return "File transfer error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::IntegrityError: return "Integrity error";
        case ErrorCode::Locked: return "Group is locked by another operation";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::ConflictUnresolved: return "Conflict unresolved";
        case ErrorCode::ScheduleFault: return "Schedule fault";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
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
 * auto stats = synchronizer.sync(group, options);
 * if (!stats) {
 *     LOG_ERROR_COMP(stats.error().message, "CLI");
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}

    /// Construct error result
    Result(E error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return std::holds_alternative<E>(data_); }

    /// Get success value (throws std::bad_variant_access if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

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
    Result() : error_(std::nullopt) {}
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return error_.has_value(); }

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

} // namespace DriveSync

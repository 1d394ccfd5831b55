#pragma once

/**
 * @file SyncExceptions.h
 * @brief Exceptions thrown by low-level primitives.
 *
 * The Synchronizer catches these per file and maps them onto ErrorCode.
 */

#include <stdexcept>
#include <string>

namespace DriveSync {

/// Authentication tag mismatch, truncated ciphertext or post-copy checksum mismatch
class IntegrityError : public std::runtime_error {
public:
    explicit IntegrityError(const std::string& what) : std::runtime_error(what) {}
};

/// Cancellation observed inside a chunk loop
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("Operation cancelled") {}
};

/// Read/write failure on a single file
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace DriveSync

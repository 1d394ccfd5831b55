#pragma once

/**
 * @file SyncTypes.h
 * @brief Value types shared by every DriveSync component
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace DriveSync {

/**
 * @brief Direction in which a storage group propagates changes
 */
enum class SyncMode {
    Bidirectional,
    MasterToBackup,
    BackupToMaster
};

enum class SyncKind {
    Manual,
    Scheduled,
    Realtime
};

/**
 * @brief SyncOperation status; Running moves to exactly one terminal state
 */
enum class OperationStatus {
    Running,
    Completed,
    Failed,
    Cancelled
};

enum class Side {
    Master,
    Backup
};

enum class ConflictKind {
    ModifiedBoth,
    DeletedMaster,
    DeletedBackup,
    SizeMismatch
};

enum class Resolution {
    KeepMaster,
    KeepBackup,
    KeepBoth,
    Skip,
    Unresolved
};

/**
 * @brief Filesystem change reported by a watcher
 */
enum class WatchEventType {
    Create,
    Modify,
    Delete,
    Move
};

/**
 * @brief Outcome reported for a scheduled run
 */
enum class ScheduledStatus {
    Started,
    Completed,
    Failed,
    Conflict
};

/**
 * @brief Operation state machine shared by all trigger sources
 */
enum class SyncPhase {
    Idle,
    Scanning,
    ConflictDetection,
    Transferring,
    UpdatingStore,
    Failed,
    Cancelled
};

/**
 * @brief Master/backup pairing, resolved by the caller
 */
struct StorageGroup {
    std::string id;
    std::filesystem::path masterPath;
    std::vector<std::filesystem::path> backupPaths;
    SyncMode mode = SyncMode::MasterToBackup;
};

/**
 * @brief State of one file on one side at scan time
 */
struct FileSnapshot {
    std::string relativePath;
    uint64_t size = 0;
    int64_t mtimeNs = 0;
    std::string checksum;       // Plaintext SHA-256
    std::string storedChecksum; // Hash of the bytes on disk (backup side only)
};

/**
 * @brief Last tracked state of (group, path)
 */
struct FileRecord {
    std::string groupId;
    std::string relativePath;
    std::string checksum;        // Plaintext SHA-256
    std::string storedChecksum;  // Hash of the bytes stored on the backup side
    uint64_t size = 0;
    int64_t mtimeNs = 0;         // Master-side mtime at sync time, advisory
    int64_t lastSynced = 0;      // Unix seconds
    Side sourceSide = Side::Master;
    int64_t operationId = 0;

    /// The one change test shared by planning and needsSync(); mtime never decides it
    bool differsFrom(const std::string& otherChecksum, uint64_t otherSize) const {
        return checksum != otherChecksum || size != otherSize;
    }
};

struct Conflict {
    std::string relativePath;
    ConflictKind kind = ConflictKind::ModifiedBoth;
    std::optional<FileSnapshot> master;
    std::optional<FileSnapshot> backup;
    Resolution resolution = Resolution::Unresolved;
    size_t backupIndex = 0;
    int64_t id = 0;              // Store id once persisted for review
};

/**
 * @brief Compression savings over one operation
 */
struct SpaceSavingsReport {
    uint64_t originalSize = 0;
    uint64_t storedSize = 0;
    uint64_t filesProcessed = 0;
    double compressionRatio = 0.0;   // stored / original
    int64_t spaceSaved = 0;          // original - stored
    double spaceSavedPercent = 0.0;

    static SpaceSavingsReport calculate(uint64_t originalSize, uint64_t storedSize, uint64_t filesProcessed);
};

/**
 * @brief Terminal report of a Sync call
 */
struct SyncStatistics {
    int64_t operationId = 0;
    OperationStatus status = OperationStatus::Running;
    uint64_t filesCopied = 0;
    uint64_t filesSkipped = 0;
    uint64_t filesFailed = 0;
    uint64_t filesDeleted = 0;
    uint64_t bytesCopied = 0;
    uint64_t conflictsDetected = 0;
    std::vector<Conflict> conflicts;
    std::chrono::system_clock::time_point startTime{};
    std::chrono::system_clock::time_point endTime{};
    SpaceSavingsReport spaceSavings;
    std::string errorMessage;

    double durationSeconds() const {
        return std::chrono::duration<double>(endTime - startTime).count();
    }
};

/**
 * @brief One row of operation history
 */
struct OperationSummary {
    int64_t id = 0;
    std::string groupId;
    SyncKind kind = SyncKind::Manual;
    OperationStatus status = OperationStatus::Running;
    int64_t startedAt = 0;      // Unix milliseconds
    int64_t completedAt = 0;    // 0 while running
    uint64_t filesCopied = 0;
    uint64_t filesSkipped = 0;
    uint64_t filesFailed = 0;
    uint64_t filesDeleted = 0;
    uint64_t bytesCopied = 0;
    uint64_t conflictsDetected = 0;
    uint64_t originalBytes = 0;
    uint64_t storedBytes = 0;
    std::string errorMessage;
};

/**
 * @brief Result of a read-only comparison of master and one backup
 */
struct VerifyReport {
    size_t backupIndex = 0;
    std::vector<std::string> inSync;
    std::vector<std::string> masterOnly;
    std::vector<std::string> backupOnly;
    std::vector<std::string> differing;
    std::vector<std::string> unreadable;

    bool consistent() const {
        return masterOnly.empty() && backupOnly.empty() && differing.empty() && unreadable.empty();
    }
};

const char* toString(SyncMode mode);
const char* toString(SyncKind kind);
const char* toString(OperationStatus status);
const char* toString(Side side);
const char* toString(ConflictKind kind);
const char* toString(Resolution resolution);
const char* toString(SyncPhase phase);
const char* toString(WatchEventType type);
const char* toString(ScheduledStatus status);

std::optional<SyncMode> parseSyncMode(const std::string& text);
std::optional<SyncKind> parseSyncKind(const std::string& text);
std::optional<OperationStatus> parseOperationStatus(const std::string& text);
std::optional<Side> parseSide(const std::string& text);
std::optional<ConflictKind> parseConflictKind(const std::string& text);
std::optional<Resolution> parseResolution(const std::string& text);

inline bool isTerminal(OperationStatus status) {
    return status != OperationStatus::Running;
}

/// Tracking scope for the backup at @p backupIndex ("id", "id#1", "id#2", ...)
std::string trackingScope(const std::string& groupId, size_t backupIndex);

int64_t nowUnixMillis();

} // namespace DriveSync

#pragma once

#include "DatabaseManager.h"
#include "Result.h"
#include "SyncTypes.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace DriveSync {

/**
 * @brief Record changes collected during one Sync call.
 *
 * Workers append concurrently; the store applies everything in the same
 * transaction that finalizes the operation, so a crash never leaves
 * records that disagree with the operation's terminal status.
 */
class OperationBatch {
public:
    void upsert(FileRecord record);
    void remove(const std::string& scope, const std::string& relativePath);
    void addConflict(const std::string& groupId, Conflict conflict);

    struct Removal {
        std::string scope;
        std::string relativePath;
    };

    std::vector<FileRecord> upserts() const;
    std::vector<Removal> removals() const;
    std::vector<std::pair<std::string, Conflict>> conflicts() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<FileRecord> upserts_;
    std::vector<Removal> removals_;
    std::vector<std::pair<std::string, Conflict>> conflicts_;
};

/**
 * @brief SQLite-backed baseline of (group, path) state and operation history.
 *
 * Tables:
 *   file_records     UNIQUE(group_id, relative_path)
 *   sync_operations  status CHECK-constrained, immutable once terminal (trigger),
 *                    at most one 'running' row per group (partial unique index)
 *   conflicts        unresolved conflicts kept for manual review
 */
class ChangeTrackingStore {
public:
    explicit ChangeTrackingStore(const std::string& dbPath);

    ChangeTrackingStore(const ChangeTrackingStore&) = delete;
    ChangeTrackingStore& operator=(const ChangeTrackingStore&) = delete;

    /**
     * @brief Open the database and apply schema migrations
     */
    Result<void> open();
    bool isOpen() const { return db_.isOpen(); }

    /**
     * @brief true if no record exists or checksum/size differ from it.
     *
     * mtime is accepted for callers that track it but never decides the answer.
     */
    Result<bool> needsSync(const std::string& groupId, const std::string& relativePath,
                           const std::string& checksum, int64_t mtimeNs, uint64_t size);

    Result<std::optional<FileRecord>> lookup(const std::string& groupId, const std::string& relativePath);

    /**
     * @brief Atomic upsert of a single record outside any operation batch
     */
    Result<void> updateRecord(const std::string& groupId, const std::string& relativePath,
                              const std::string& checksum, uint64_t size, SyncKind operationKind);
    Result<void> updateRecord(const FileRecord& record, SyncKind operationKind);

    Result<void> removeRecord(const std::string& groupId, const std::string& relativePath);

    /**
     * @brief All records of a tracking scope keyed by relative path
     */
    Result<std::map<std::string, FileRecord>> baseline(const std::string& groupId);

    /**
     * @brief Insert a 'running' operation owned by this process
     *
     * A running row left by a process that no longer exists is failed first.
     * @return operation id, or ErrorCode::Locked if a live process already runs the group
     */
    Result<int64_t> startOperation(const std::string& groupId, SyncKind kind);

    /**
     * @brief Finalize an operation exactly once.
     *
     * Applies @p batch and the terminal status in one transaction. A second
     * call for an already-terminal operation changes nothing and returns
     * the stored result, unless it carries a non-empty batch: that batch
     * would be lost, so the call fails with DatabaseError.
     */
    Result<SyncStatistics> completeOperation(int64_t operationId, const SyncStatistics& stats,
                                             OperationStatus status, const OperationBatch* batch = nullptr);

    /**
     * @brief Most recent first
     */
    Result<std::vector<OperationSummary>> history(const std::string& groupId, size_t limit = 20);

    Result<std::optional<OperationSummary>> operation(int64_t operationId);

    /**
     * @brief Records last written by the given operation
     */
    Result<std::vector<FileRecord>> operationFiles(int64_t operationId);

    /**
     * @brief Delete records (all scopes), operations and conflicts of a group
     * @return number of file records removed
     */
    Result<int> clearGroup(const std::string& groupId);

    Result<int64_t> saveConflict(const std::string& groupId, const Conflict& conflict, int64_t operationId = 0);
    Result<std::vector<Conflict>> pendingConflicts(const std::string& groupId);
    Result<void> markConflictResolved(int64_t conflictId, Resolution resolution);

    /**
     * @brief Mark operations left 'running' by a dead process as failed
     *
     * Rows whose owner pid still runs with the recorded start time are kept.
     * @return number of operations recovered
     */
    Result<int> recoverInterrupted();

    static const std::vector<DatabaseManager::Migration>& migrations();

private:
    DatabaseManager db_;

    void upsertLocked(const FileRecord& record, SyncKind kind);
    int64_t insertConflictLocked(const std::string& groupId, const Conflict& conflict, int64_t operationId);
    std::optional<OperationSummary> loadOperationLocked(int64_t operationId);
    /// Fails running rows of @p groupId (all groups if empty) whose owner is gone
    int recoverOrphansLocked(const std::string& groupId);
    static OperationSummary readOperation(PreparedStatement& stmt);
    static FileRecord readRecord(PreparedStatement& stmt);

    template<typename T>
    static Result<T> databaseError(const std::string& action, const std::exception& e);
};

} // namespace DriveSync

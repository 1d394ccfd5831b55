#include "ChangeTrackingStore.h"
#include "Logger.h"
#include "ProcessIdentity.h"

#include <chrono>
#include <ctime>

namespace DriveSync {

namespace {

const char* kComponent = "ChangeTrackingStore";

const char* kRecordColumns =
    "group_id, relative_path, checksum, stored_checksum, size, mtime_ns, last_synced, source_side, operation_id";

const char* kOperationColumns =
    "id, group_id, kind, status, started_at, completed_at, files_copied, files_skipped, files_failed, "
    "files_deleted, bytes_copied, conflicts_detected, original_bytes, stored_bytes, error_message";

const char* kConflictColumns =
    "id, relative_path, kind, backup_index, resolution, master_size, master_mtime, master_checksum, "
    "backup_size, backup_mtime, backup_checksum";

int64_t unixSeconds() {
    return static_cast<int64_t>(std::time(nullptr));
}

SyncStatistics toStatistics(const OperationSummary& summary) {
    SyncStatistics stats;
    stats.operationId = summary.id;
    stats.status = summary.status;
    stats.filesCopied = summary.filesCopied;
    stats.filesSkipped = summary.filesSkipped;
    stats.filesFailed = summary.filesFailed;
    stats.filesDeleted = summary.filesDeleted;
    stats.bytesCopied = summary.bytesCopied;
    stats.conflictsDetected = summary.conflictsDetected;
    stats.errorMessage = summary.errorMessage;
    stats.startTime = std::chrono::system_clock::time_point(std::chrono::milliseconds(summary.startedAt));
    stats.endTime = std::chrono::system_clock::time_point(std::chrono::milliseconds(summary.completedAt));
    stats.spaceSavings = SpaceSavingsReport::calculate(summary.originalBytes, summary.storedBytes, summary.filesCopied);
    return stats;
}

} // namespace

// OperationBatch

void OperationBatch::upsert(FileRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    upserts_.push_back(std::move(record));
}

void OperationBatch::remove(const std::string& scope, const std::string& relativePath) {
    std::lock_guard<std::mutex> lock(mutex_);
    removals_.push_back({scope, relativePath});
}

void OperationBatch::addConflict(const std::string& groupId, Conflict conflict) {
    std::lock_guard<std::mutex> lock(mutex_);
    conflicts_.emplace_back(groupId, std::move(conflict));
}

std::vector<FileRecord> OperationBatch::upserts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return upserts_;
}

std::vector<OperationBatch::Removal> OperationBatch::removals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return removals_;
}

std::vector<std::pair<std::string, Conflict>> OperationBatch::conflicts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conflicts_;
}

size_t OperationBatch::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return upserts_.size() + removals_.size() + conflicts_.size();
}

// ChangeTrackingStore

ChangeTrackingStore::ChangeTrackingStore(const std::string& dbPath) : db_(dbPath) {
}

const std::vector<DatabaseManager::Migration>& ChangeTrackingStore::migrations() {
    static const std::vector<DatabaseManager::Migration> kMigrations = {
        {1, "file records and sync operations", R"SQL(
            CREATE TABLE IF NOT EXISTS sync_operations (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                group_id TEXT NOT NULL,
                kind TEXT NOT NULL CHECK (kind IN ('manual', 'scheduled', 'realtime')),
                status TEXT NOT NULL CHECK (status IN ('running', 'completed', 'failed', 'cancelled')),
                started_at INTEGER NOT NULL,
                completed_at INTEGER,
                files_copied INTEGER NOT NULL DEFAULT 0,
                files_skipped INTEGER NOT NULL DEFAULT 0,
                files_failed INTEGER NOT NULL DEFAULT 0,
                files_deleted INTEGER NOT NULL DEFAULT 0,
                bytes_copied INTEGER NOT NULL DEFAULT 0,
                conflicts_detected INTEGER NOT NULL DEFAULT 0,
                original_bytes INTEGER NOT NULL DEFAULT 0,
                stored_bytes INTEGER NOT NULL DEFAULT 0,
                error_message TEXT
            );
            CREATE INDEX IF NOT EXISTS idx_sync_operations_recent
                ON sync_operations (group_id, started_at DESC, id DESC);
            CREATE UNIQUE INDEX IF NOT EXISTS idx_sync_operations_one_running
                ON sync_operations (group_id) WHERE status = 'running';
            CREATE TRIGGER IF NOT EXISTS trg_sync_operations_terminal
                BEFORE UPDATE ON sync_operations
                WHEN OLD.status <> 'running'
                BEGIN
                    SELECT RAISE(ABORT, 'sync operation already finalized');
                END;

            CREATE TABLE IF NOT EXISTS file_records (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                group_id TEXT NOT NULL,
                relative_path TEXT NOT NULL,
                checksum TEXT NOT NULL,
                stored_checksum TEXT NOT NULL DEFAULT '',
                size INTEGER NOT NULL,
                mtime_ns INTEGER NOT NULL DEFAULT 0,
                last_synced INTEGER NOT NULL,
                source_side TEXT NOT NULL CHECK (source_side IN ('master', 'backup')),
                sync_kind TEXT NOT NULL DEFAULT 'manual',
                operation_id INTEGER REFERENCES sync_operations (id) ON DELETE SET NULL,
                UNIQUE (group_id, relative_path)
            );
            CREATE INDEX IF NOT EXISTS idx_file_records_operation ON file_records (operation_id);
        )SQL"},
        {2, "conflicts kept for manual review", R"SQL(
            CREATE TABLE IF NOT EXISTS conflicts (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                group_id TEXT NOT NULL,
                backup_index INTEGER NOT NULL DEFAULT 0,
                relative_path TEXT NOT NULL,
                kind TEXT NOT NULL CHECK (kind IN ('modified_both', 'deleted_master', 'deleted_backup', 'size_mismatch')),
                resolution TEXT NOT NULL DEFAULT 'unresolved'
                    CHECK (resolution IN ('keep_master', 'keep_backup', 'keep_both', 'skip', 'unresolved')),
                master_size INTEGER,
                master_mtime INTEGER,
                master_checksum TEXT,
                backup_size INTEGER,
                backup_mtime INTEGER,
                backup_checksum TEXT,
                operation_id INTEGER REFERENCES sync_operations (id) ON DELETE CASCADE,
                detected_at INTEGER NOT NULL,
                resolved_at INTEGER
            );
            CREATE INDEX IF NOT EXISTS idx_conflicts_group ON conflicts (group_id, resolution);
        )SQL"},
        {3, "owner process of each operation", R"SQL(
            ALTER TABLE sync_operations ADD COLUMN owner_pid INTEGER NOT NULL DEFAULT 0;
            ALTER TABLE sync_operations ADD COLUMN owner_start INTEGER NOT NULL DEFAULT 0;
        )SQL"},
    };
    return kMigrations;
}

template<typename T>
Result<T> ChangeTrackingStore::databaseError(const std::string& action, const std::exception& e) {
    Logger::instance().log(LogLevel::ERROR, action + " failed: " + e.what(), kComponent);
    return Err<T>(ErrorCode::DatabaseError, action + " failed: " + e.what());
}

Result<void> ChangeTrackingStore::open() {
    if (db_.isOpen()) {
        return Ok();
    }
    if (!db_.initialize(migrations())) {
        return Err(ErrorCode::DatabaseError, "Cannot open tracking database: " + db_.path());
    }
    return Ok();
}

FileRecord ChangeTrackingStore::readRecord(PreparedStatement& stmt) {
    FileRecord record;
    record.groupId = stmt.getColumnString(0);
    record.relativePath = stmt.getColumnString(1);
    record.checksum = stmt.getColumnString(2);
    record.storedChecksum = stmt.getColumnString(3);
    record.size = static_cast<uint64_t>(stmt.getColumnInt64(4));
    record.mtimeNs = stmt.getColumnInt64(5);
    record.lastSynced = stmt.getColumnInt64(6);
    record.sourceSide = parseSide(stmt.getColumnString(7)).value_or(Side::Master);
    record.operationId = stmt.isColumnNull(8) ? 0 : stmt.getColumnInt64(8);
    return record;
}

OperationSummary ChangeTrackingStore::readOperation(PreparedStatement& stmt) {
    OperationSummary summary;
    summary.id = stmt.getColumnInt64(0);
    summary.groupId = stmt.getColumnString(1);
    summary.kind = parseSyncKind(stmt.getColumnString(2)).value_or(SyncKind::Manual);
    summary.status = parseOperationStatus(stmt.getColumnString(3)).value_or(OperationStatus::Failed);
    summary.startedAt = stmt.getColumnInt64(4);
    summary.completedAt = stmt.isColumnNull(5) ? 0 : stmt.getColumnInt64(5);
    summary.filesCopied = static_cast<uint64_t>(stmt.getColumnInt64(6));
    summary.filesSkipped = static_cast<uint64_t>(stmt.getColumnInt64(7));
    summary.filesFailed = static_cast<uint64_t>(stmt.getColumnInt64(8));
    summary.filesDeleted = static_cast<uint64_t>(stmt.getColumnInt64(9));
    summary.bytesCopied = static_cast<uint64_t>(stmt.getColumnInt64(10));
    summary.conflictsDetected = static_cast<uint64_t>(stmt.getColumnInt64(11));
    summary.originalBytes = static_cast<uint64_t>(stmt.getColumnInt64(12));
    summary.storedBytes = static_cast<uint64_t>(stmt.getColumnInt64(13));
    summary.errorMessage = stmt.getColumnString(14);
    return summary;
}

Result<bool> ChangeTrackingStore::needsSync(const std::string& groupId, const std::string& relativePath,
                                            const std::string& checksum, int64_t /*mtimeNs*/, uint64_t size) {
    try {
        auto lock = db_.lock();
        auto stmt = db_.prepare("SELECT checksum, size FROM file_records WHERE group_id = ? AND relative_path = ?");
        stmt->bind(1, groupId).bind(2, relativePath);
        if (!stmt->step()) {
            return true;
        }
        FileRecord record;
        record.checksum = stmt->getColumnString(0);
        record.size = static_cast<uint64_t>(stmt->getColumnInt64(1));
        stmt->reset();
        return record.differsFrom(checksum, size);
    } catch (const DatabaseException& e) {
        return databaseError<bool>("needsSync", e);
    }
}

Result<std::optional<FileRecord>> ChangeTrackingStore::lookup(const std::string& groupId, const std::string& relativePath) {
    try {
        auto lock = db_.lock();
        auto stmt = db_.prepare(std::string("SELECT ") + kRecordColumns +
                                " FROM file_records WHERE group_id = ? AND relative_path = ?");
        stmt->bind(1, groupId).bind(2, relativePath);
        std::optional<FileRecord> record;
        if (stmt->step()) {
            record = readRecord(*stmt);
        }
        stmt->reset();
        return record;
    } catch (const DatabaseException& e) {
        return databaseError<std::optional<FileRecord>>("lookup", e);
    }
}

void ChangeTrackingStore::upsertLocked(const FileRecord& record, SyncKind kind) {
    auto stmt = db_.prepare(
        "INSERT INTO file_records (group_id, relative_path, checksum, stored_checksum, size, mtime_ns, "
        "last_synced, source_side, sync_kind, operation_id) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT (group_id, relative_path) DO UPDATE SET "
        "checksum = excluded.checksum, stored_checksum = excluded.stored_checksum, size = excluded.size, "
        "mtime_ns = excluded.mtime_ns, last_synced = excluded.last_synced, source_side = excluded.source_side, "
        "sync_kind = excluded.sync_kind, operation_id = excluded.operation_id");
    stmt->bind(1, record.groupId)
        .bind(2, record.relativePath)
        .bind(3, record.checksum)
        .bind(4, record.storedChecksum.empty() ? record.checksum : record.storedChecksum)
        .bind(5, record.size)
        .bind(6, record.mtimeNs)
        .bind(7, record.lastSynced != 0 ? record.lastSynced : unixSeconds())
        .bind(8, std::string(toString(record.sourceSide)))
        .bind(9, std::string(toString(kind)));
    if (record.operationId > 0) {
        stmt->bind(10, record.operationId);
    } else {
        stmt->bindNull(10);
    }
    stmt->run();
}

Result<void> ChangeTrackingStore::updateRecord(const FileRecord& record, SyncKind operationKind) {
    if (record.groupId.empty() || record.relativePath.empty()) {
        return Err(ErrorCode::InvalidArgument, "FileRecord needs group id and relative path");
    }
    try {
        auto lock = db_.lock();
        upsertLocked(record, operationKind);
        return Ok();
    } catch (const DatabaseException& e) {
        return databaseError<void>("updateRecord", e);
    }
}

Result<void> ChangeTrackingStore::updateRecord(const std::string& groupId, const std::string& relativePath,
                                               const std::string& checksum, uint64_t size, SyncKind operationKind) {
    FileRecord record;
    record.groupId = groupId;
    record.relativePath = relativePath;
    record.checksum = checksum;
    record.size = size;
    return updateRecord(record, operationKind);
}

Result<void> ChangeTrackingStore::removeRecord(const std::string& groupId, const std::string& relativePath) {
    try {
        auto lock = db_.lock();
        auto stmt = db_.prepare("DELETE FROM file_records WHERE group_id = ? AND relative_path = ?");
        stmt->bind(1, groupId).bind(2, relativePath);
        stmt->run();
        return Ok();
    } catch (const DatabaseException& e) {
        return databaseError<void>("removeRecord", e);
    }
}

Result<std::map<std::string, FileRecord>> ChangeTrackingStore::baseline(const std::string& groupId) {
    try {
        auto lock = db_.lock();
        auto stmt = db_.prepare(std::string("SELECT ") + kRecordColumns + " FROM file_records WHERE group_id = ?");
        stmt->bind(1, groupId);
        std::map<std::string, FileRecord> records;
        while (stmt->step()) {
            auto record = readRecord(*stmt);
            records.emplace(record.relativePath, std::move(record));
        }
        return records;
    } catch (const DatabaseException& e) {
        return databaseError<std::map<std::string, FileRecord>>("baseline", e);
    }
}

Result<int64_t> ChangeTrackingStore::startOperation(const std::string& groupId, SyncKind kind) {
    try {
        auto lock = db_.lock();
        const ProcessIdentity owner = ProcessIdentity::current();
        auto insert = [&]() {
            auto stmt = db_.prepare("INSERT INTO sync_operations (group_id, kind, status, started_at, owner_pid, owner_start) "
                                    "VALUES (?, ?, 'running', ?, ?, ?)");
            stmt->bind(1, groupId).bind(2, std::string(toString(kind))).bind(3, nowUnixMillis())
                .bind(4, owner.pid).bind(5, owner.startTicks);
            stmt->run();
        };
        try {
            insert();
        } catch (const DatabaseException& e) {
            // A running row whose process died would otherwise hold the group forever
            if (e.code() != SQLITE_CONSTRAINT || recoverOrphansLocked(groupId) == 0) {
                throw;
            }
            insert();
        }
        int64_t id = db_.lastInsertRowId();
        Logger::instance().log(LogLevel::DEBUG, "Started operation " + std::to_string(id) + " for group " + groupId, kComponent);
        return id;
    } catch (const DatabaseException& e) {
        if (e.code() == SQLITE_CONSTRAINT) {
            return Err<int64_t>(ErrorCode::Locked, "Group " + groupId + " already has a running operation");
        }
        return databaseError<int64_t>("startOperation", e);
    }
}

int ChangeTrackingStore::recoverOrphansLocked(const std::string& groupId) {
    std::string sql = "SELECT id, owner_pid, owner_start FROM sync_operations WHERE status = 'running'";
    if (!groupId.empty()) {
        sql += " AND group_id = ?";
    }
    auto select = db_.prepare(sql);
    if (!groupId.empty()) {
        select->bind(1, groupId);
    }
    std::vector<int64_t> orphaned;
    while (select->step()) {
        ProcessIdentity owner;
        owner.pid = select->getColumnInt64(1);
        owner.startTicks = select->getColumnInt64(2);
        if (!owner.alive()) {
            orphaned.push_back(select->getColumnInt64(0));
        }
    }
    select->reset();

    for (int64_t id : orphaned) {
        auto stmt = db_.prepare("UPDATE sync_operations SET status = 'failed', completed_at = ?, "
                                "error_message = 'Interrupted before completion' WHERE id = ? AND status = 'running'");
        stmt->bind(1, nowUnixMillis()).bind(2, id);
        stmt->run();
    }
    if (!orphaned.empty()) {
        Logger::instance().log(LogLevel::WARN, "Marked " + std::to_string(orphaned.size()) +
                               " interrupted operation(s) as failed", kComponent);
    }
    return static_cast<int>(orphaned.size());
}

std::optional<OperationSummary> ChangeTrackingStore::loadOperationLocked(int64_t operationId) {
    auto stmt = db_.prepare(std::string("SELECT ") + kOperationColumns + " FROM sync_operations WHERE id = ?");
    stmt->bind(1, operationId);
    std::optional<OperationSummary> summary;
    if (stmt->step()) {
        summary = readOperation(*stmt);
    }
    stmt->reset();
    return summary;
}

Result<SyncStatistics> ChangeTrackingStore::completeOperation(int64_t operationId, const SyncStatistics& stats,
                                                              OperationStatus status, const OperationBatch* batch) {
    if (!isTerminal(status)) {
        return Err<SyncStatistics>(ErrorCode::InvalidArgument, "completeOperation requires a terminal status");
    }

    try {
        auto lock = db_.lock();
        auto existing = loadOperationLocked(operationId);
        if (!existing) {
            return Err<SyncStatistics>(ErrorCode::NotFound, "Unknown operation " + std::to_string(operationId));
        }
        if (isTerminal(existing->status)) {
            if (batch && batch->size() > 0) {
                Logger::instance().log(LogLevel::ERROR, "Operation " + std::to_string(operationId) +
                                       " was already finalized as " + toString(existing->status) + "; " +
                                       std::to_string(batch->size()) + " tracking change(s) not applied", kComponent);
                return Err<SyncStatistics>(ErrorCode::DatabaseError,
                                           "Operation " + std::to_string(operationId) +
                                           " already finalized, batch not applied");
            }
            Logger::instance().log(LogLevel::DEBUG, "Operation " + std::to_string(operationId) +
                                   " already finalized as " + toString(existing->status), kComponent);
            return toStatistics(*existing);
        }

        auto txn = db_.beginTransaction();

        if (batch) {
            for (const auto& removal : batch->removals()) {
                auto del = db_.prepare("DELETE FROM file_records WHERE group_id = ? AND relative_path = ?");
                del->bind(1, removal.scope).bind(2, removal.relativePath);
                del->run();
            }
            for (auto record : batch->upserts()) {
                record.operationId = operationId;
                upsertLocked(record, existing->kind);
            }
            // A finished scan supersedes the previous review list
            if (status != OperationStatus::Failed) {
                auto clear = db_.prepare("DELETE FROM conflicts WHERE group_id = ? AND resolution = 'unresolved'");
                clear->bind(1, existing->groupId);
                clear->run();
                for (const auto& entry : batch->conflicts()) {
                    insertConflictLocked(entry.first, entry.second, operationId);
                }
            }
        }

        auto stmt = db_.prepare(
            "UPDATE sync_operations SET status = ?, completed_at = ?, files_copied = ?, files_skipped = ?, "
            "files_failed = ?, files_deleted = ?, bytes_copied = ?, conflicts_detected = ?, original_bytes = ?, "
            "stored_bytes = ?, error_message = ? WHERE id = ?");
        stmt->bind(1, std::string(toString(status)))
            .bind(2, nowUnixMillis())
            .bind(3, stats.filesCopied)
            .bind(4, stats.filesSkipped)
            .bind(5, stats.filesFailed)
            .bind(6, stats.filesDeleted)
            .bind(7, stats.bytesCopied)
            .bind(8, stats.conflictsDetected)
            .bind(9, stats.spaceSavings.originalSize)
            .bind(10, stats.spaceSavings.storedSize);
        if (stats.errorMessage.empty()) {
            stmt->bindNull(11);
        } else {
            stmt->bind(11, stats.errorMessage);
        }
        stmt->bind(12, operationId);
        stmt->run();

        txn->commit();

        SyncStatistics stored = stats;
        stored.operationId = operationId;
        stored.status = status;
        return stored;
    } catch (const DatabaseException& e) {
        return databaseError<SyncStatistics>("completeOperation", e);
    }
}

Result<std::vector<OperationSummary>> ChangeTrackingStore::history(const std::string& groupId, size_t limit) {
    try {
        auto lock = db_.lock();
        auto stmt = db_.prepare(std::string("SELECT ") + kOperationColumns +
                                " FROM sync_operations WHERE group_id = ? ORDER BY started_at DESC, id DESC LIMIT ?");
        stmt->bind(1, groupId).bind(2, static_cast<int64_t>(limit));
        std::vector<OperationSummary> summaries;
        while (stmt->step()) {
            summaries.push_back(readOperation(*stmt));
        }
        return summaries;
    } catch (const DatabaseException& e) {
        return databaseError<std::vector<OperationSummary>>("history", e);
    }
}

Result<std::optional<OperationSummary>> ChangeTrackingStore::operation(int64_t operationId) {
    try {
        auto lock = db_.lock();
        return loadOperationLocked(operationId);
    } catch (const DatabaseException& e) {
        return databaseError<std::optional<OperationSummary>>("operation", e);
    }
}

Result<std::vector<FileRecord>> ChangeTrackingStore::operationFiles(int64_t operationId) {
    try {
        auto lock = db_.lock();
        auto stmt = db_.prepare(std::string("SELECT ") + kRecordColumns +
                                " FROM file_records WHERE operation_id = ? ORDER BY group_id, relative_path");
        stmt->bind(1, operationId);
        std::vector<FileRecord> records;
        while (stmt->step()) {
            records.push_back(readRecord(*stmt));
        }
        return records;
    } catch (const DatabaseException& e) {
        return databaseError<std::vector<FileRecord>>("operationFiles", e);
    }
}

Result<int> ChangeTrackingStore::clearGroup(const std::string& groupId) {
    try {
        auto lock = db_.lock();
        auto txn = db_.beginTransaction();

        // Scopes of additional backups are "<id>#<n>"; escape LIKE wildcards in the id
        std::string escaped;
        for (char c : groupId) {
            if (c == '%' || c == '_' || c == '\\') escaped += '\\';
            escaped += c;
        }

        auto records = db_.prepare("DELETE FROM file_records WHERE group_id = ? OR group_id LIKE ? ESCAPE '\\'");
        records->bind(1, groupId).bind(2, escaped + "#%");
        records->run();
        int removed = db_.changes();

        auto conflicts = db_.prepare("DELETE FROM conflicts WHERE group_id = ?");
        conflicts->bind(1, groupId);
        conflicts->run();

        auto operations = db_.prepare("DELETE FROM sync_operations WHERE group_id = ? AND status <> 'running'");
        operations->bind(1, groupId);
        operations->run();

        txn->commit();
        Logger::instance().log(LogLevel::INFO, "Cleared tracking for group " + groupId + " (" +
                               std::to_string(removed) + " records)", kComponent);
        return removed;
    } catch (const DatabaseException& e) {
        return databaseError<int>("clearGroup", e);
    }
}

int64_t ChangeTrackingStore::insertConflictLocked(const std::string& groupId, const Conflict& conflict, int64_t operationId) {
    auto stmt = db_.prepare(
        "INSERT INTO conflicts (group_id, backup_index, relative_path, kind, resolution, master_size, master_mtime, "
        "master_checksum, backup_size, backup_mtime, backup_checksum, operation_id, detected_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt->bind(1, groupId)
        .bind(2, static_cast<int64_t>(conflict.backupIndex))
        .bind(3, conflict.relativePath)
        .bind(4, std::string(toString(conflict.kind)))
        .bind(5, std::string(toString(conflict.resolution)));
    if (conflict.master) {
        stmt->bind(6, conflict.master->size).bind(7, conflict.master->mtimeNs).bind(8, conflict.master->checksum);
    } else {
        stmt->bindNull(6).bindNull(7).bindNull(8);
    }
    if (conflict.backup) {
        stmt->bind(9, conflict.backup->size).bind(10, conflict.backup->mtimeNs).bind(11, conflict.backup->checksum);
    } else {
        stmt->bindNull(9).bindNull(10).bindNull(11);
    }
    if (operationId > 0) {
        stmt->bind(12, operationId);
    } else {
        stmt->bindNull(12);
    }
    stmt->bind(13, unixSeconds());
    stmt->run();
    return db_.lastInsertRowId();
}

Result<int64_t> ChangeTrackingStore::saveConflict(const std::string& groupId, const Conflict& conflict, int64_t operationId) {
    try {
        auto lock = db_.lock();
        return insertConflictLocked(groupId, conflict, operationId);
    } catch (const DatabaseException& e) {
        return databaseError<int64_t>("saveConflict", e);
    }
}

Result<std::vector<Conflict>> ChangeTrackingStore::pendingConflicts(const std::string& groupId) {
    try {
        auto lock = db_.lock();
        auto stmt = db_.prepare(std::string("SELECT ") + kConflictColumns +
                                " FROM conflicts WHERE group_id = ? AND resolution = 'unresolved' "
                                "ORDER BY backup_index, relative_path");
        stmt->bind(1, groupId);
        std::vector<Conflict> conflicts;
        while (stmt->step()) {
            Conflict conflict;
            conflict.id = stmt->getColumnInt64(0);
            conflict.relativePath = stmt->getColumnString(1);
            conflict.kind = parseConflictKind(stmt->getColumnString(2)).value_or(ConflictKind::ModifiedBoth);
            conflict.backupIndex = static_cast<size_t>(stmt->getColumnInt64(3));
            conflict.resolution = parseResolution(stmt->getColumnString(4)).value_or(Resolution::Unresolved);
            if (!stmt->isColumnNull(5)) {
                FileSnapshot master;
                master.relativePath = conflict.relativePath;
                master.size = static_cast<uint64_t>(stmt->getColumnInt64(5));
                master.mtimeNs = stmt->getColumnInt64(6);
                master.checksum = stmt->getColumnString(7);
                conflict.master = master;
            }
            if (!stmt->isColumnNull(8)) {
                FileSnapshot backup;
                backup.relativePath = conflict.relativePath;
                backup.size = static_cast<uint64_t>(stmt->getColumnInt64(8));
                backup.mtimeNs = stmt->getColumnInt64(9);
                backup.checksum = stmt->getColumnString(10);
                conflict.backup = backup;
            }
            conflicts.push_back(std::move(conflict));
        }
        return conflicts;
    } catch (const DatabaseException& e) {
        return databaseError<std::vector<Conflict>>("pendingConflicts", e);
    }
}

Result<void> ChangeTrackingStore::markConflictResolved(int64_t conflictId, Resolution resolution) {
    try {
        auto lock = db_.lock();
        auto stmt = db_.prepare("UPDATE conflicts SET resolution = ?, resolved_at = ? WHERE id = ?");
        stmt->bind(1, std::string(toString(resolution))).bind(2, unixSeconds()).bind(3, conflictId);
        stmt->run();
        if (db_.changes() == 0) {
            return Err(ErrorCode::NotFound, "Unknown conflict " + std::to_string(conflictId));
        }
        return Ok();
    } catch (const DatabaseException& e) {
        return databaseError<void>("markConflictResolved", e);
    }
}

Result<int> ChangeTrackingStore::recoverInterrupted() {
    try {
        auto lock = db_.lock();
        return recoverOrphansLocked("");
    } catch (const DatabaseException& e) {
        return databaseError<int>("recoverInterrupted", e);
    }
}

} // namespace DriveSync

#include "SyncTypes.h"

namespace DriveSync {

SpaceSavingsReport SpaceSavingsReport::calculate(uint64_t originalSize, uint64_t storedSize, uint64_t filesProcessed) {
    SpaceSavingsReport report;
    report.originalSize = originalSize;
    report.storedSize = storedSize;
    report.filesProcessed = filesProcessed;
    report.spaceSaved = static_cast<int64_t>(originalSize) - static_cast<int64_t>(storedSize);
    if (originalSize > 0) {
        report.compressionRatio = static_cast<double>(storedSize) / static_cast<double>(originalSize);
        report.spaceSavedPercent = static_cast<double>(report.spaceSaved) * 100.0 / static_cast<double>(originalSize);
    }
    return report;
}

const char* toString(SyncMode mode) {
    switch (mode) {
        case SyncMode::Bidirectional: return "bidirectional";
        case SyncMode::MasterToBackup: return "master_to_backup";
        case SyncMode::BackupToMaster: return "backup_to_master";
    }
    return "unknown";
}

const char* toString(SyncKind kind) {
    switch (kind) {
        case SyncKind::Manual: return "manual";
        case SyncKind::Scheduled: return "scheduled";
        case SyncKind::Realtime: return "realtime";
    }
    return "unknown";
}

const char* toString(OperationStatus status) {
    switch (status) {
        case OperationStatus::Running: return "running";
        case OperationStatus::Completed: return "completed";
        case OperationStatus::Failed: return "failed";
        case OperationStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* toString(Side side) {
    return side == Side::Master ? "master" : "backup";
}

const char* toString(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::ModifiedBoth: return "modified_both";
        case ConflictKind::DeletedMaster: return "deleted_master";
        case ConflictKind::DeletedBackup: return "deleted_backup";
        case ConflictKind::SizeMismatch: return "size_mismatch";
    }
    return "unknown";
}

const char* toString(Resolution resolution) {
    switch (resolution) {
        case Resolution::KeepMaster: return "keep_master";
        case Resolution::KeepBackup: return "keep_backup";
        case Resolution::KeepBoth: return "keep_both";
        case Resolution::Skip: return "skip";
        case Resolution::Unresolved: return "unresolved";
    }
    return "unknown";
}

const char* toString(SyncPhase phase) {
    switch (phase) {
        case SyncPhase::Idle: return "idle";
        case SyncPhase::Scanning: return "scanning";
        case SyncPhase::ConflictDetection: return "conflict_detection";
        case SyncPhase::Transferring: return "transferring";
        case SyncPhase::UpdatingStore: return "updating_store";
        case SyncPhase::Failed: return "failed";
        case SyncPhase::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* toString(WatchEventType type) {
    switch (type) {
        case WatchEventType::Create: return "create";
        case WatchEventType::Modify: return "modify";
        case WatchEventType::Delete: return "delete";
        case WatchEventType::Move: return "move";
    }
    return "unknown";
}

const char* toString(ScheduledStatus status) {
    switch (status) {
        case ScheduledStatus::Started: return "started";
        case ScheduledStatus::Completed: return "completed";
        case ScheduledStatus::Failed: return "failed";
        case ScheduledStatus::Conflict: return "conflict";
    }
    return "unknown";
}

std::optional<SyncMode> parseSyncMode(const std::string& text) {
    if (text == "bidirectional") return SyncMode::Bidirectional;
    if (text == "master_to_backup") return SyncMode::MasterToBackup;
    if (text == "backup_to_master") return SyncMode::BackupToMaster;
    return std::nullopt;
}

std::optional<SyncKind> parseSyncKind(const std::string& text) {
    if (text == "manual") return SyncKind::Manual;
    if (text == "scheduled") return SyncKind::Scheduled;
    if (text == "realtime") return SyncKind::Realtime;
    return std::nullopt;
}

std::optional<OperationStatus> parseOperationStatus(const std::string& text) {
    if (text == "running") return OperationStatus::Running;
    if (text == "completed") return OperationStatus::Completed;
    if (text == "failed") return OperationStatus::Failed;
    if (text == "cancelled") return OperationStatus::Cancelled;
    return std::nullopt;
}

std::optional<Side> parseSide(const std::string& text) {
    if (text == "master") return Side::Master;
    if (text == "backup") return Side::Backup;
    return std::nullopt;
}

std::optional<ConflictKind> parseConflictKind(const std::string& text) {
    if (text == "modified_both") return ConflictKind::ModifiedBoth;
    if (text == "deleted_master") return ConflictKind::DeletedMaster;
    if (text == "deleted_backup") return ConflictKind::DeletedBackup;
    if (text == "size_mismatch") return ConflictKind::SizeMismatch;
    return std::nullopt;
}

std::optional<Resolution> parseResolution(const std::string& text) {
    if (text == "keep_master" || text == "master") return Resolution::KeepMaster;
    if (text == "keep_backup" || text == "backup") return Resolution::KeepBackup;
    if (text == "keep_both" || text == "both") return Resolution::KeepBoth;
    if (text == "skip") return Resolution::Skip;
    if (text == "unresolved") return Resolution::Unresolved;
    return std::nullopt;
}

std::string trackingScope(const std::string& groupId, size_t backupIndex) {
    if (backupIndex == 0) {
        return groupId;
    }
    return groupId + "#" + std::to_string(backupIndex);
}

int64_t nowUnixMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace DriveSync

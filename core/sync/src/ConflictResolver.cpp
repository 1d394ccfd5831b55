#include "ConflictResolver.h"
#include "FileTransfer.h"
#include "LoggerMacros.h"
#include "SyncExceptions.h"
#include "TransferPipeline.h"
#include "TreeScanner.h"

#include <filesystem>
#include <memory>
#include <system_error>

namespace DriveSync {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "ConflictResolver";

FileRecord recordFrom(const std::string& scope, const std::string& path, const TransferOutcome& outcome,
                      int64_t masterMtimeNs, Side source) {
    FileRecord record;
    record.groupId = scope;
    record.relativePath = path;
    record.checksum = outcome.checksum;
    record.storedChecksum = outcome.storedChecksum;
    record.size = outcome.plainSize;
    record.mtimeNs = masterMtimeNs;
    record.lastSynced = nowUnixMillis() / 1000;
    record.sourceSide = source;
    return record;
}

int64_t mtimeOf(const fs::path& file) {
    std::error_code ec;
    auto time = fs::last_write_time(file, ec);
    return ec ? 0 : toNanoseconds(time);
}

bool isRegularFile(const fs::path& file) {
    std::error_code ec;
    return fs::is_regular_file(fs::symlink_status(file, ec)) && !ec;
}

Result<std::unique_ptr<TransferPipeline>> pipelineFor(const AdvancedSyncOptions& options) {
    auto valid = options.validate();
    if (!valid) {
        return valid.error();
    }
    try {
        return TransferPipeline::fromOptions(options);
    } catch (const std::exception& e) {
        return Err<std::unique_ptr<TransferPipeline>>(ErrorCode::InvalidArgument, e.what());
    }
}

} // namespace

const char* toString(ResolutionAction action) {
    switch (action) {
        case ResolutionAction::None: return "none";
        case ResolutionAction::CopiedToBackup: return "copied_to_backup";
        case ResolutionAction::CopiedToMaster: return "copied_to_master";
        case ResolutionAction::DeletedBackup: return "deleted_backup";
        case ResolutionAction::DeletedMaster: return "deleted_master";
        case ResolutionAction::RenamedBackupAndCopied: return "renamed_backup_and_copied";
        case ResolutionAction::Forgotten: return "forgotten";
    }
    return "none";
}

ConflictResolver::ConflictResolver(ChangeTrackingStore& store, GroupLockRegistry& locks)
    : store_(store), locks_(locks) {
}

Result<ResolutionAction> ConflictResolver::resolve(const StorageGroup& group, const Conflict& conflict,
                                                   Resolution choice, const AdvancedSyncOptions& options) {
    if (conflict.backupIndex >= group.backupPaths.size()) {
        return Err<ResolutionAction>(ErrorCode::InvalidArgument,
                                     "Conflict refers to backup #" + std::to_string(conflict.backupIndex));
    }
    auto pipeline = pipelineFor(options);
    if (!pipeline) {
        return pipeline.error();
    }

    auto guard = locks_.acquireFor(group.id, LOCK_TIMEOUT);
    if (!guard) {
        return Err<ResolutionAction>(ErrorCode::Locked, "Group " + group.id + " is being synchronized");
    }

    FileTransfer transfer(**pipeline);
    return apply(group, conflict, choice, transfer);
}

Result<ConflictResolver::BatchResult> ConflictResolver::resolveAll(const StorageGroup& group,
                                                                   const std::vector<Conflict>& conflicts,
                                                                   Resolution choice,
                                                                   const AdvancedSyncOptions& options) {
    auto pipeline = pipelineFor(options);
    if (!pipeline) {
        return pipeline.error();
    }

    auto guard = locks_.acquireFor(group.id, LOCK_TIMEOUT);
    if (!guard) {
        return Err<BatchResult>(ErrorCode::Locked, "Group " + group.id + " is being synchronized");
    }

    FileTransfer transfer(**pipeline);
    BatchResult result;
    for (const auto& conflict : conflicts) {
        if (conflict.backupIndex >= group.backupPaths.size()) {
            result.failed++;
            result.failedPaths.push_back(conflict.relativePath);
            continue;
        }
        auto action = apply(group, conflict, choice, transfer);
        if (!action) {
            result.failed++;
            result.failedPaths.push_back(conflict.relativePath);
        } else if (*action == ResolutionAction::None) {
            result.skipped++;
        } else {
            result.resolved++;
        }
    }

    LOG_INFO_COMP("Resolved " + std::to_string(result.resolved) + " of " + std::to_string(conflicts.size()) +
                  " conflicts in " + group.id + " with " + toString(choice) +
                  (result.failed ? " (" + std::to_string(result.failed) + " failed)" : std::string()), kComponent);
    return result;
}

Result<ResolutionAction> ConflictResolver::apply(const StorageGroup& group, const Conflict& conflict,
                                                 Resolution choice, const FileTransfer& transfer) {
    if (choice == Resolution::Skip || choice == Resolution::Unresolved) {
        LOG_DEBUG_COMP_IF("Leaving " + conflict.relativePath + " unresolved", kComponent);
        return ResolutionAction::None;
    }

    const fs::path& backupRoot = group.backupPaths[conflict.backupIndex];
    const std::string scope = trackingScope(group.id, conflict.backupIndex);
    const fs::path masterFile = group.masterPath / fs::path(conflict.relativePath);
    const fs::path backupFile = backupRoot / fs::path(conflict.relativePath);

    const bool hasMaster = isRegularFile(masterFile);
    const bool hasBackup = isRegularFile(backupFile);

    ResolutionAction action = ResolutionAction::None;
    std::optional<FileRecord> record;

    try {
        auto copyToBackup = [&]() {
            auto outcome = transfer.store(masterFile, backupFile);
            record = recordFrom(scope, conflict.relativePath, outcome, mtimeOf(masterFile), Side::Master);
        };
        auto copyToMaster = [&]() {
            auto outcome = transfer.retrieve(backupFile, masterFile);
            record = recordFrom(scope, conflict.relativePath, outcome, outcome.destinationMtimeNs, Side::Backup);
        };

        if (!hasMaster && !hasBackup) {
            action = ResolutionAction::Forgotten;
        } else if (choice == Resolution::KeepMaster) {
            if (hasMaster) {
                copyToBackup();
                action = ResolutionAction::CopiedToBackup;
            } else {
                FileTransfer::removeFile(backupFile, backupRoot);
                action = ResolutionAction::DeletedBackup;
            }
        } else if (choice == Resolution::KeepBackup) {
            if (hasBackup) {
                copyToMaster();
                action = ResolutionAction::CopiedToMaster;
            } else {
                FileTransfer::removeFile(masterFile, group.masterPath);
                action = ResolutionAction::DeletedMaster;
            }
        } else if (hasMaster && hasBackup) {
            const fs::path keptAs = FileTransfer::keepBothName(backupFile);
            fs::rename(backupFile, keptAs);
            LOG_INFO_COMP("Kept backup copy of " + conflict.relativePath + " as " + keptAs.filename().string(),
                          kComponent);
            copyToBackup();
            action = ResolutionAction::RenamedBackupAndCopied;
        } else if (hasMaster) {
            copyToBackup();
            action = ResolutionAction::CopiedToBackup;
        } else {
            copyToMaster();
            action = ResolutionAction::CopiedToMaster;
        }
    } catch (const IntegrityError& e) {
        LOG_ERROR_COMP("Integrity failure resolving " + conflict.relativePath + ": " + e.what(), kComponent);
        return Err<ResolutionAction>(ErrorCode::IntegrityError, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR_COMP("Cannot resolve " + conflict.relativePath + ": " + e.what(), kComponent);
        return Err<ResolutionAction>(ErrorCode::FileTransferError, e.what());
    }

    auto tracked = record ? store_.updateRecord(*record, SyncKind::Manual)
                          : store_.removeRecord(scope, conflict.relativePath);
    if (!tracked) {
        return tracked.error();
    }
    if (conflict.id > 0) {
        auto marked = store_.markConflictResolved(conflict.id, choice);
        if (!marked) {
            return marked.error();
        }
    }

    LOG_INFO_COMP(std::string(toString(conflict.kind)) + " on " + conflict.relativePath + " resolved with " +
                  toString(choice) + ": " + toString(action), kComponent);
    return action;
}

} // namespace DriveSync

#pragma once

#include "AdvancedSyncOptions.h"
#include "ChangeTrackingStore.h"
#include "GroupLockRegistry.h"
#include "Result.h"
#include "SyncTypes.h"

#include <chrono>
#include <string>
#include <vector>

namespace DriveSync {

class FileTransfer;

/**
 * @brief What a resolution did on disk
 */
enum class ResolutionAction {
    None,            // skip
    CopiedToBackup,
    CopiedToMaster,
    DeletedBackup,
    DeletedMaster,
    RenamedBackupAndCopied,
    Forgotten        // Both sides already gone, record dropped
};

const char* toString(ResolutionAction action);

/**
 * @brief Applies a user's choice to a detected conflict.
 *
 * Strategies:
 *   keep_master  master content wins (backup deleted if master is gone)
 *   keep_backup  backup content wins (master deleted if backup is gone)
 *   keep_both    backup renamed to "<name>.backup" (".backup.1", ...) and
 *                master copied in; a missing side is restored from the other
 *   skip         nothing changes and the conflict stays unresolved
 *
 * The conflict is re-evaluated against the files as they are now. Afterwards
 * the tracked record is refreshed so the next sync sees the pair in sync,
 * and a persisted conflict is marked resolved.
 */
class ConflictResolver {
public:
    ConflictResolver(ChangeTrackingStore& store, GroupLockRegistry& locks);

    /**
     * @return Locked while the group is being synchronized,
     *         FileTransferError / IntegrityError if the copy fails
     */
    Result<ResolutionAction> resolve(const StorageGroup& group,
                                     const Conflict& conflict,
                                     Resolution choice,
                                     const AdvancedSyncOptions& options);

    struct BatchResult {
        size_t resolved = 0;
        size_t skipped = 0;
        size_t failed = 0;
        std::vector<std::string> failedPaths;
    };

    /**
     * @brief Same choice for every conflict; the group lock is held for the whole batch
     */
    Result<BatchResult> resolveAll(const StorageGroup& group,
                                   const std::vector<Conflict>& conflicts,
                                   Resolution choice,
                                   const AdvancedSyncOptions& options);

    static constexpr std::chrono::milliseconds LOCK_TIMEOUT{2000};

private:
    Result<ResolutionAction> apply(const StorageGroup& group, const Conflict& conflict, Resolution choice,
                                   const FileTransfer& transfer);

    ChangeTrackingStore& store_;
    GroupLockRegistry& locks_;
};

} // namespace DriveSync

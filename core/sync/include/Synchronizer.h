#pragma once

#include "AdvancedSyncOptions.h"
#include "ChangeTrackingStore.h"
#include "ConflictDetector.h"
#include "GroupLockRegistry.h"
#include "Result.h"
#include "SyncTypes.h"
#include "TreeScanner.h"

#include <memory>
#include <string>
#include <vector>

namespace DriveSync {

class CancellationToken;
class TransferPipeline;

/**
 * @brief Core orchestrator: scan, detect, transfer, track.
 *
 * One sync() call runs on the caller's thread (plus a WorkerPool when
 * parallelFiles > 1) while holding the group lock:
 *
 *   Scanning -> ConflictDetection -> Transferring -> UpdatingStore -> Idle
 *
 * Each backup root is handled in turn against the master. Per-file
 * failures are counted and logged; only infrastructure faults (an
 * unreadable root, an unavailable store) fail the operation.
 */
class Synchronizer {
public:
    Synchronizer(ChangeTrackingStore& store, GroupLockRegistry& locks);

    /**
     * @brief Synchronize every backup of @p group with its master
     * @return statistics (status Completed or Cancelled), or
     *         Locked / InvalidArgument / IOFault / DatabaseError
     */
    Result<SyncStatistics> sync(const StorageGroup& group,
                                const AdvancedSyncOptions& options,
                                SyncKind kind = SyncKind::Manual,
                                const CancellationToken* cancel = nullptr);

    /**
     * @brief Copy the whole backup at @p backupIndex into the master through the decode pipeline.
     *
     * Master files already holding the same content are left alone.
     */
    Result<SyncStatistics> restore(const StorageGroup& group,
                                   size_t backupIndex,
                                   const AdvancedSyncOptions& options,
                                   const CancellationToken* cancel = nullptr);

    /**
     * @brief Compare master with each backup without writing anything
     */
    Result<std::vector<VerifyReport>> verifyStatus(const StorageGroup& group,
                                                   const AdvancedSyncOptions& options,
                                                   const CancellationToken* cancel = nullptr);

    /**
     * @brief Forget every tracked record and operation of the group
     * @return Locked while a sync of the group runs
     */
    Result<int> clearTracking(const std::string& groupId);

    static Result<void> validateGroup(const StorageGroup& group);

    ChangeTrackingStore& store() { return store_; }
    GroupLockRegistry& locks() { return locks_; }

private:
    ChangeTrackingStore& store_;
    GroupLockRegistry& locks_;
};

} // namespace DriveSync

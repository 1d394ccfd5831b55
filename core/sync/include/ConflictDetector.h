#pragma once

#include "SyncTypes.h"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace DriveSync {

using SnapshotMap = std::map<std::string, FileSnapshot>;
using Baseline = std::map<std::string, FileRecord>;

/**
 * @brief What the Synchronizer does with one path
 */
enum class ActionKind {
    CopyToBackup,
    CopyToMaster,
    DeleteBackup,
    DeleteMaster,
    RecordOnly,    // Sides already agree; refresh the tracked state
    ForgetRecord,  // Gone from both sides
    Skip
};

const char* toString(ActionKind kind);

struct PlannedAction {
    ActionKind kind = ActionKind::Skip;
    std::string relativePath;
};

/**
 * @brief Work for one master/backup pair
 */
struct SyncPlan {
    std::vector<PlannedAction> actions;   // Everything except Skip
    std::vector<Conflict> conflicts;
    size_t skipped = 0;

    size_t count(ActionKind kind) const;
};

/**
 * @brief Three-way comparison of master, backup and the tracked baseline.
 *
 * A side is "changed" when its checksum or size differs from the record.
 * detect() reports only what the group's mode cannot settle on its own:
 * in master_to_backup a deleted master propagates unless the backup was
 * edited. Bidirectional treats the master as the reference copy: master
 * edits propagate, deletions on either side and anything edited or added
 * only on the backup are reported for review.
 */
class ConflictDetector {
public:
    explicit ConflictDetector(uint64_t sizeTolerance = 0);

    std::vector<Conflict> detect(const StorageGroup& group,
                                 const SnapshotMap& master,
                                 const SnapshotMap& backup,
                                 const Baseline& baseline,
                                 size_t backupIndex = 0) const;

    /**
     * @brief Decide the action for every path not in @p conflicts
     * @param incremental When false, tracked paths already in sync are copied
     *                    again from the authoritative side
     */
    SyncPlan plan(SyncMode mode,
                  bool incremental,
                  const SnapshotMap& master,
                  const SnapshotMap& backup,
                  const Baseline& baseline,
                  std::vector<Conflict> conflicts) const;

    uint64_t sizeTolerance() const { return sizeTolerance_; }

    static bool changedSince(const FileSnapshot& snapshot, const FileRecord& record);

private:
    static std::set<std::string> allPaths(const SnapshotMap& master, const SnapshotMap& backup,
                                          const Baseline& baseline);

    uint64_t sizeTolerance_;
};

} // namespace DriveSync

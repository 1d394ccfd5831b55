#include "ConflictDetector.h"

namespace DriveSync {

namespace {

template<typename Map>
const typename Map::mapped_type* find(const Map& map, const std::string& key) {
    auto it = map.find(key);
    return it == map.end() ? nullptr : &it->second;
}

uint64_t sizeDifference(uint64_t a, uint64_t b) {
    return a > b ? a - b : b - a;
}

} // namespace

const char* toString(ActionKind kind) {
    switch (kind) {
        case ActionKind::CopyToBackup: return "copy_to_backup";
        case ActionKind::CopyToMaster: return "copy_to_master";
        case ActionKind::DeleteBackup: return "delete_backup";
        case ActionKind::DeleteMaster: return "delete_master";
        case ActionKind::RecordOnly: return "record_only";
        case ActionKind::ForgetRecord: return "forget_record";
        case ActionKind::Skip: return "skip";
    }
    return "skip";
}

size_t SyncPlan::count(ActionKind kind) const {
    size_t n = 0;
    for (const auto& action : actions) {
        if (action.kind == kind) {
            n++;
        }
    }
    return n;
}

ConflictDetector::ConflictDetector(uint64_t sizeTolerance) : sizeTolerance_(sizeTolerance) {
}

bool ConflictDetector::changedSince(const FileSnapshot& snapshot, const FileRecord& record) {
    return record.differsFrom(snapshot.checksum, snapshot.size);
}

std::set<std::string> ConflictDetector::allPaths(const SnapshotMap& master, const SnapshotMap& backup,
                                                 const Baseline& baseline) {
    std::set<std::string> paths;
    for (const auto& entry : master) paths.insert(entry.first);
    for (const auto& entry : backup) paths.insert(entry.first);
    for (const auto& entry : baseline) paths.insert(entry.first);
    return paths;
}

std::vector<Conflict> ConflictDetector::detect(const StorageGroup& group,
                                               const SnapshotMap& master,
                                               const SnapshotMap& backup,
                                               const Baseline& baseline,
                                               size_t backupIndex) const {
    std::vector<Conflict> conflicts;

    for (const auto& path : allPaths(master, backup, baseline)) {
        const FileSnapshot* m = find(master, path);
        const FileSnapshot* b = find(backup, path);
        const FileRecord* r = find(baseline, path);

        std::optional<ConflictKind> kind;

        if (r) {
            if (m && b) {
                const bool backupChanged = changedSince(*b, *r);
                if (backupChanged && changedSince(*m, *r) && m->checksum != b->checksum) {
                    kind = ConflictKind::ModifiedBoth;
                } else if (backupChanged && group.mode == SyncMode::Bidirectional && m->checksum != b->checksum) {
                    // The master is the reference copy; edits made only on a backup need review
                    kind = sizeDifference(m->size, b->size) > sizeTolerance_ ? ConflictKind::SizeMismatch
                                                                            : ConflictKind::ModifiedBoth;
                }
            } else if (!m && b) {
                // master_to_backup propagates the deletion unless the backup was edited meanwhile
                if (group.mode == SyncMode::Bidirectional ||
                    (group.mode == SyncMode::MasterToBackup && changedSince(*b, *r))) {
                    kind = ConflictKind::DeletedMaster;
                }
            } else if (m && !b) {
                if (group.mode == SyncMode::Bidirectional ||
                    (group.mode == SyncMode::BackupToMaster && changedSince(*m, *r))) {
                    kind = ConflictKind::DeletedBackup;
                }
            }
        } else if (m && b && m->checksum != b->checksum) {
            if (sizeDifference(m->size, b->size) > sizeTolerance_) {
                kind = ConflictKind::SizeMismatch;
            } else if (group.mode == SyncMode::Bidirectional) {
                kind = ConflictKind::ModifiedBoth;
            }
        } else if (!m && b && group.mode == SyncMode::Bidirectional) {
            kind = ConflictKind::DeletedMaster;
        }

        if (kind) {
            Conflict conflict;
            conflict.relativePath = path;
            conflict.kind = *kind;
            if (m) conflict.master = *m;
            if (b) conflict.backup = *b;
            conflict.backupIndex = backupIndex;
            conflicts.push_back(std::move(conflict));
        }
    }

    return conflicts;
}

SyncPlan ConflictDetector::plan(SyncMode mode,
                                bool incremental,
                                const SnapshotMap& master,
                                const SnapshotMap& backup,
                                const Baseline& baseline,
                                std::vector<Conflict> conflicts) const {
    SyncPlan plan;
    std::set<std::string> conflicted;
    for (const auto& conflict : conflicts) {
        conflicted.insert(conflict.relativePath);
    }
    plan.conflicts = std::move(conflicts);

    const ActionKind fromAuthority =
        mode == SyncMode::BackupToMaster ? ActionKind::CopyToMaster : ActionKind::CopyToBackup;

    for (const auto& path : allPaths(master, backup, baseline)) {
        if (conflicted.count(path)) {
            continue;
        }
        const FileSnapshot* m = find(master, path);
        const FileSnapshot* b = find(backup, path);
        const FileRecord* r = find(baseline, path);

        ActionKind action = ActionKind::Skip;

        if (r) {
            if (m && b) {
                const bool masterChanged = changedSince(*m, *r);
                const bool backupChanged = changedSince(*b, *r);
                if (!masterChanged && !backupChanged) {
                    action = incremental ? ActionKind::Skip : fromAuthority;
                } else if (m->checksum == b->checksum && m->size == b->size) {
                    action = ActionKind::RecordOnly;
                } else {
                    // Mirror the authoritative side over whatever changed
                    action = fromAuthority;
                }
            } else if (!m && b) {
                action = mode == SyncMode::BackupToMaster ? ActionKind::CopyToMaster : ActionKind::DeleteBackup;
            } else if (m && !b) {
                action = mode == SyncMode::BackupToMaster ? ActionKind::DeleteMaster : ActionKind::CopyToBackup;
            } else {
                action = ActionKind::ForgetRecord;
            }
        } else {
            if (m && b) {
                action = m->checksum == b->checksum ? ActionKind::RecordOnly : fromAuthority;
            } else if (m) {
                action = mode == SyncMode::BackupToMaster ? ActionKind::Skip : ActionKind::CopyToBackup;
            } else if (b) {
                action = mode == SyncMode::BackupToMaster ? ActionKind::CopyToMaster : ActionKind::Skip;
            }
        }

        if (action == ActionKind::Skip) {
            plan.skipped++;
        } else {
            plan.actions.push_back(PlannedAction{action, path});
        }
    }

    return plan;
}

} // namespace DriveSync

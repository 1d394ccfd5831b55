#include "Synchronizer.h"
#include "CancellationToken.h"
#include "Checksum.h"
#include "FileTransfer.h"
#include "LoggerMacros.h"
#include "PathUtils.h"
#include "SyncExceptions.h"
#include "WorkerPool.h"
#include "TransferPipeline.h"

#include <fstream>
#include <future>
#include <iterator>
#include <mutex>
#include <set>

namespace DriveSync {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "Synchronizer";

struct Snapshots {
    SnapshotMap files;
    std::vector<std::string> unreadable;
};

std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

Snapshots snapshotMaster(const ScanMap& scan, const Baseline& baseline, bool incremental,
                         SnapshotMap& hashCache, const CancellationToken* cancel) {
    Snapshots out;
    for (const auto& [path, entry] : scan) {
        if (cancel) {
            cancel->throwIfCancelled();
        }
        FileSnapshot snapshot;
        snapshot.relativePath = path;
        snapshot.size = entry.size;
        snapshot.mtimeNs = entry.mtimeNs;

        auto record = baseline.find(path);
        auto cached = hashCache.find(path);
        if (incremental && record != baseline.end() &&
            record->second.size == entry.size && record->second.mtimeNs == entry.mtimeNs) {
            snapshot.checksum = record->second.checksum;
        } else if (cached != hashCache.end() &&
                   cached->second.size == entry.size && cached->second.mtimeNs == entry.mtimeNs) {
            snapshot.checksum = cached->second.checksum;
        } else {
            try {
                snapshot.checksum = Checksum::ofFile(entry.absolutePath, cancel);
            } catch (const OperationCancelled&) {
                throw;
            } catch (const std::exception& e) {
                LOG_WARN_COMP("Cannot read " + entry.absolutePath.string() + ": " + e.what(), kComponent);
                out.unreadable.push_back(path);
                continue;
            }
            hashCache[path] = snapshot;
        }
        snapshot.storedChecksum = snapshot.checksum;
        out.files.emplace(path, std::move(snapshot));
    }
    return out;
}

/// Plaintext checksum and size of a backup file, decoding it when the pipeline transforms data
Snapshots snapshotBackup(const ScanMap& scan, const Baseline& baseline, const TransferPipeline& pipeline,
                         bool incremental, const CancellationToken* cancel) {
    Snapshots out;
    for (const auto& [path, entry] : scan) {
        if (cancel) {
            cancel->throwIfCancelled();
        }
        FileSnapshot snapshot;
        snapshot.relativePath = path;
        snapshot.size = entry.size;
        snapshot.mtimeNs = entry.mtimeNs;

        auto record = baseline.find(path);
        const bool tracked = record != baseline.end();
        try {
            if (!pipeline.transformsData()) {
                if (incremental && tracked &&
                    record->second.size == entry.size && record->second.mtimeNs == entry.mtimeNs) {
                    snapshot.checksum = record->second.checksum;
                } else {
                    snapshot.checksum = Checksum::ofFile(entry.absolutePath, cancel);
                }
                snapshot.storedChecksum = snapshot.checksum;
            } else {
                snapshot.storedChecksum = Checksum::ofFile(entry.absolutePath, cancel);
                if (incremental && tracked && snapshot.storedChecksum == record->second.storedChecksum) {
                    snapshot.checksum = record->second.checksum;
                    snapshot.size = record->second.size;
                } else {
                    std::ifstream in(entry.absolutePath, std::ios::binary);
                    if (!in) {
                        throw TransferError("Cannot open " + entry.absolutePath.string());
                    }
                    auto decoded = pipeline.inspect(in, cancel);
                    snapshot.checksum = decoded.outputChecksum;
                    snapshot.size = decoded.bytesWritten;
                }
            }
        } catch (const OperationCancelled&) {
            throw;
        } catch (const std::exception& e) {
            LOG_WARN_COMP("Cannot read " + entry.absolutePath.string() + ": " + e.what(), kComponent);
            out.unreadable.push_back(path);
            continue;
        }
        out.files.emplace(path, std::move(snapshot));
    }
    return out;
}

/// Drops every key at or below one of @p unknown
template<typename Map>
void eraseUnknown(Map& map, const std::vector<std::string>& unknown) {
    for (auto it = map.begin(); it != map.end();) {
        bool hidden = false;
        for (const auto& path : unknown) {
            if (isAtOrBelow(it->first, path)) {
                hidden = true;
                break;
            }
        }
        it = hidden ? map.erase(it) : std::next(it);
    }
}

Result<std::unique_ptr<TransferPipeline>> buildPipeline(const AdvancedSyncOptions& options) {
    try {
        return TransferPipeline::fromOptions(options);
    } catch (const std::exception& e) {
        return Err<std::unique_ptr<TransferPipeline>>(ErrorCode::InvalidArgument,
                                                      std::string("Cannot build transfer pipeline: ") + e.what());
    }
}

/// Roots of the group nested below @p self, excluded from its scan
std::vector<fs::path> otherRoots(const StorageGroup& group, const fs::path& self) {
    std::vector<fs::path> roots;
    if (group.masterPath != self) {
        roots.push_back(group.masterPath);
    }
    for (const auto& backup : group.backupPaths) {
        if (backup != self) {
            roots.push_back(backup);
        }
    }
    return roots;
}

int phaseRank(SyncPhase phase) {
    switch (phase) {
        case SyncPhase::Scanning: return 1;
        case SyncPhase::ConflictDetection: return 2;
        case SyncPhase::Transferring: return 3;
        case SyncPhase::UpdatingStore: return 4;
        default: return 5;
    }
}

/// Forwards phase changes once each, in state machine order
class PhaseReporter {
public:
    explicit PhaseReporter(const AdvancedSyncOptions::PhaseCallback& callback) : callback_(callback) {}

    void enter(SyncPhase phase) {
        if (phaseRank(phase) <= phaseRank(current_) && current_ != SyncPhase::Idle) {
            return;
        }
        current_ = phase;
        LOG_DEBUG_COMP_IF(std::string("Phase: ") + toString(phase), kComponent);
        if (callback_) {
            callback_(phase);
        }
    }

    void settle(SyncPhase terminal) {
        current_ = SyncPhase::Idle;
        enter(terminal);
    }

private:
    const AdvancedSyncOptions::PhaseCallback& callback_;
    SyncPhase current_ = SyncPhase::Idle;
};

/**
 * @brief State of one sync() or restore() call
 */
class SyncRun {
public:
    SyncRun(ChangeTrackingStore& store, const StorageGroup& group, const AdvancedSyncOptions& options,
            const TransferPipeline& pipeline, const CancellationToken* cancel, int64_t operationId)
        : store_(store)
        , group_(group)
        , options_(options)
        , pipeline_(pipeline)
        , cancel_(cancel)
        , operationId_(operationId)
        , phases_(options.onPhase)
        , transfer_(pipeline)
        , detector_(options.sizeTolerance) {
        stats_.operationId = operationId;
        stats_.startTime = now();
        if (options.parallelFiles > 1) {
            pool_ = std::make_unique<WorkerPool>("transfers", options.parallelFiles);
        }
    }

    Result<SyncStatistics> runSync() {
        for (size_t i = 0; i < group_.backupPaths.size(); ++i) {
            unplanned_.insert(i);
        }
        try {
            auto scanned = scanAll(group_.backupPaths.size());
            if (!scanned) {
                return scanFailure(scanned.error());
            }
            for (size_t i = 0; i < backupScans_.size(); ++i) {
                if (CancellationToken::cancelled(cancel_)) {
                    break;
                }
                auto done = syncBackup(i);
                if (!done) {
                    return fail(done.error());
                }
            }
        } catch (const OperationCancelled&) {
            LOG_INFO_COMP("Sync of " + group_.id + " cancelled", kComponent);
        } catch (const std::exception& e) {
            return fail(Error(ErrorCode::InternalError, e.what()));
        }
        return finish();
    }

    Result<SyncStatistics> runRestore(size_t index) {
        restoring_ = true;
        unplanned_.insert(index);
        try {
            auto scanned = scanAll(index + 1);
            if (!scanned) {
                return scanFailure(scanned.error());
            }
            const std::string scope = trackingScope(group_.id, index);
            auto baseline = store_.baseline(scope);
            if (!baseline) {
                return fail(baseline.error());
            }
            auto master = snapshotMaster(masterScan_, *baseline, options_.incremental, masterHashes_, cancel_);
            auto backup = snapshotBackup(backupScans_[index].files, *baseline, pipeline_, options_.incremental,
                                         cancel_);
            stats_.filesFailed += backupScans_[index].unreadable.size() + backup.unreadable.size();

            SyncPlan plan;
            for (const auto& [path, snapshot] : backup.files) {
                auto existing = master.files.find(path);
                const bool same = existing != master.files.end() && existing->second.checksum == snapshot.checksum;
                plan.actions.push_back(PlannedAction{same ? ActionKind::RecordOnly : ActionKind::CopyToMaster, path});
            }
            unplanned_.erase(index);
            LOG_INFO_COMP("Restoring " + std::to_string(plan.count(ActionKind::CopyToMaster)) + " of " +
                          std::to_string(backup.files.size()) + " files from " +
                          group_.backupPaths[index].string(), kComponent);

            phases_.enter(SyncPhase::Transferring);
            runActions(index, plan, master.files, backup.files);
        } catch (const OperationCancelled&) {
            LOG_INFO_COMP("Restore of " + group_.id + " cancelled", kComponent);
        } catch (const std::exception& e) {
            return fail(Error(ErrorCode::InternalError, e.what()));
        }
        return finish();
    }

private:
    /// Listing only reads metadata; cancellation is honoured from hashing on, once every path is known
    Result<void> scanAll(size_t backupCount) {
        phases_.enter(SyncPhase::Scanning);
        TreeScanner scanner{PathFilter(options_.excludePatterns)};

        auto master = scanner.scan(group_.masterPath, nullptr, otherRoots(group_, group_.masterPath));
        if (!master) {
            return master.error();
        }
        masterScan_ = std::move(master->files);
        masterUnreadable_ = std::move(master->unreadable);

        for (size_t i = 0; i < backupCount; ++i) {
            const auto& root = group_.backupPaths[i];
            auto backup = scanner.scan(root, nullptr, otherRoots(group_, root));
            if (!backup) {
                return backup.error();
            }
            backupScans_.push_back(std::move(*backup));
        }
        LOG_DEBUG_COMP_IF("Scanned master (" + std::to_string(masterScan_.size()) + " files) and " +
                          std::to_string(backupScans_.size()) + " backup root(s)", kComponent);
        return Ok();
    }

    Result<void> syncBackup(size_t index) {
        const fs::path& root = group_.backupPaths[index];
        const std::string scope = trackingScope(group_.id, index);

        auto loaded = store_.baseline(scope);
        if (!loaded) {
            return loaded.error();
        }
        Baseline baseline = std::move(*loaded);

        ScanMap masterScan;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            masterScan = masterScan_;
        }
        auto master = snapshotMaster(masterScan, baseline, options_.incremental, masterHashes_, cancel_);
        auto backup = snapshotBackup(backupScans_[index].files, baseline, pipeline_, options_.incremental, cancel_);

        // A path unreadable on either side is left out entirely, not treated as missing
        std::vector<std::string> masterSide = masterUnreadable_;
        masterSide.insert(masterSide.end(), master.unreadable.begin(), master.unreadable.end());
        std::vector<std::string> backupSide = backupScans_[index].unreadable;
        backupSide.insert(backupSide.end(), backup.unreadable.begin(), backup.unreadable.end());

        std::vector<std::string> unknown = masterSide;
        unknown.insert(unknown.end(), backupSide.begin(), backupSide.end());
        if (!unknown.empty()) {
            eraseUnknown(master.files, unknown);
            eraseUnknown(backup.files, unknown);
            eraseUnknown(baseline, unknown);
            LOG_WARN_COMP(std::to_string(unknown.size()) + " unreadable path(s) left untouched in " + root.string(),
                          kComponent);
        }
        countUnreadable(masterSide, backupSide);

        phases_.enter(SyncPhase::ConflictDetection);
        auto conflicts = detector_.detect(group_, master.files, backup.files, baseline, index);
        SyncPlan plan = detector_.plan(group_.mode, options_.incremental, master.files, backup.files,
                                       baseline, std::move(conflicts));
        unplanned_.erase(index);

        stats_.filesSkipped += plan.skipped;
        stats_.conflictsDetected += plan.conflicts.size();
        for (const auto& conflict : plan.conflicts) {
            LOG_WARN_COMP("Conflict (" + std::string(toString(conflict.kind)) + "): " + conflict.relativePath +
                          " [" + root.string() + "]", kComponent);
            batch_.addConflict(group_.id, conflict);
            stats_.conflicts.push_back(conflict);
        }

        LOG_INFO_COMP("Backup " + std::to_string(index) + " (" + root.string() + "): " +
                      std::to_string(plan.count(ActionKind::CopyToBackup) + plan.count(ActionKind::CopyToMaster)) +
                      " to copy, " +
                      std::to_string(plan.count(ActionKind::DeleteBackup) + plan.count(ActionKind::DeleteMaster)) +
                      " to delete, " + std::to_string(plan.conflicts.size()) + " conflicts, " +
                      std::to_string(plan.skipped) + " unchanged", kComponent);

        phases_.enter(SyncPhase::Transferring);
        runActions(index, plan, master.files, backup.files);
        return Ok();
    }

    void runActions(size_t index, const SyncPlan& plan, const SnapshotMap& master, const SnapshotMap& backup) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            total_ += plan.actions.size();
        }

        if (!pool_) {
            for (const auto& action : plan.actions) {
                perform(index, action, master, backup);
            }
            return;
        }

        std::vector<std::future<void>> pending;
        pending.reserve(plan.actions.size());
        for (const auto& action : plan.actions) {
            pending.push_back(pool_->submit([this, index, &action, &master, &backup]() {
                perform(index, action, master, backup);
            }));
        }
        for (auto& task : pending) {
            task.get();
        }
    }

    void perform(size_t index, const PlannedAction& action, const SnapshotMap& master, const SnapshotMap& backup) {
        if (CancellationToken::cancelled(cancel_)) {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.filesSkipped++;
            tick();
            return;
        }

        try {
            apply(index, action, master, backup);
        } catch (const OperationCancelled&) {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.filesSkipped++;
        } catch (const IntegrityError& e) {
            LOG_ERROR_COMP("Integrity failure on " + action.relativePath + ": " + e.what(), kComponent);
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.filesFailed++;
        } catch (const std::exception& e) {
            LOG_ERROR_COMP(std::string("Failed to ") + toString(action.kind) + " " + action.relativePath + ": " +
                           e.what(), kComponent);
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.filesFailed++;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        tick();
    }

    void apply(size_t index, const PlannedAction& action, const SnapshotMap& master, const SnapshotMap& backup) {
        const fs::path& backupRoot = group_.backupPaths[index];
        const std::string scope = trackingScope(group_.id, index);
        const fs::path masterFile = group_.masterPath / fs::path(action.relativePath);
        const fs::path backupFile = backupRoot / fs::path(action.relativePath);

        switch (action.kind) {
            case ActionKind::CopyToBackup: {
                const FileSnapshot& source = master.at(action.relativePath);
                TransferOutcome outcome = transfer_.store(masterFile, backupFile, cancel_);
                batch_.upsert(makeRecord(scope, action.relativePath, outcome, source.mtimeNs, Side::Master));

                std::lock_guard<std::mutex> lock(mutex_);
                stats_.filesCopied++;
                stats_.bytesCopied += outcome.storedSize;
                originalBytes_ += outcome.plainSize;
                storedBytes_ += outcome.storedSize;
                break;
            }
            case ActionKind::CopyToMaster: {
                TransferOutcome outcome = transfer_.retrieve(backupFile, masterFile, cancel_);
                batch_.upsert(makeRecord(scope, action.relativePath, outcome, outcome.destinationMtimeNs, Side::Backup));

                std::lock_guard<std::mutex> lock(mutex_);
                stats_.filesCopied++;
                stats_.bytesCopied += outcome.plainSize;
                originalBytes_ += outcome.plainSize;
                storedBytes_ += outcome.storedSize;

                // Later backups compare against the master as it is now
                masterScan_[action.relativePath] = ScanEntry{masterFile, outcome.plainSize, outcome.destinationMtimeNs};
                FileSnapshot refreshed;
                refreshed.relativePath = action.relativePath;
                refreshed.size = outcome.plainSize;
                refreshed.mtimeNs = outcome.destinationMtimeNs;
                refreshed.checksum = outcome.checksum;
                refreshed.storedChecksum = outcome.checksum;
                masterHashes_[action.relativePath] = refreshed;
                break;
            }
            case ActionKind::DeleteBackup: {
                FileTransfer::removeFile(backupFile, backupRoot);
                batch_.remove(scope, action.relativePath);
                LOG_DEBUG_COMP_IF("Deleted " + backupFile.string(), kComponent);

                std::lock_guard<std::mutex> lock(mutex_);
                stats_.filesDeleted++;
                break;
            }
            case ActionKind::DeleteMaster: {
                FileTransfer::removeFile(masterFile, group_.masterPath);
                batch_.remove(scope, action.relativePath);
                LOG_DEBUG_COMP_IF("Deleted " + masterFile.string(), kComponent);

                std::lock_guard<std::mutex> lock(mutex_);
                stats_.filesDeleted++;
                masterScan_.erase(action.relativePath);
                masterHashes_.erase(action.relativePath);
                break;
            }
            case ActionKind::RecordOnly: {
                const FileSnapshot& m = master.at(action.relativePath);
                const FileSnapshot& b = backup.at(action.relativePath);
                FileRecord record;
                record.groupId = scope;
                record.relativePath = action.relativePath;
                record.checksum = m.checksum;
                record.storedChecksum = b.storedChecksum;
                record.size = m.size;
                record.mtimeNs = m.mtimeNs;
                record.lastSynced = nowUnixMillis() / 1000;
                record.sourceSide = Side::Master;
                batch_.upsert(record);

                std::lock_guard<std::mutex> lock(mutex_);
                stats_.filesSkipped++;
                break;
            }
            case ActionKind::ForgetRecord:
                batch_.remove(scope, action.relativePath);
                break;
            case ActionKind::Skip: {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.filesSkipped++;
                break;
            }
        }
    }

    static FileRecord makeRecord(const std::string& scope, const std::string& path, const TransferOutcome& outcome,
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

    /// Master-side failures count once per run, not once per backup root
    void countUnreadable(const std::vector<std::string>& masterSide, const std::vector<std::string>& backupSide) {
        for (const auto& path : masterSide) {
            if (masterFailed_.insert(path).second) {
                stats_.filesFailed++;
            }
        }
        std::set<std::string> backupFailed(backupSide.begin(), backupSide.end());
        for (const auto& path : backupFailed) {
            if (!masterFailed_.count(path)) {
                stats_.filesFailed++;
            }
        }
    }

    /// Paths of backup roots whose plan was never built
    size_t unplannedPaths() const {
        size_t remaining = 0;
        for (size_t index : unplanned_) {
            if (index >= backupScans_.size()) {
                continue;
            }
            const ScanMap& backup = backupScans_[index].files;
            if (restoring_) {
                remaining += backup.size();
                continue;
            }
            std::set<std::string> paths;
            for (const auto& entry : masterScan_) paths.insert(entry.first);
            for (const auto& entry : backup) paths.insert(entry.first);
            remaining += paths.size();
        }
        return remaining;
    }

    /// Caller holds mutex_
    void tick() {
        processed_++;
        if (options_.onProgress) {
            options_.onProgress(processed_, total_);
        }
    }

    Result<SyncStatistics> scanFailure(const Error& error) {
        if (error.code == ErrorCode::Cancelled) {
            return finish();
        }
        return fail(Error(ErrorCode::IOFault, error.message));
    }

    Result<SyncStatistics> finish() {
        const OperationStatus status =
            CancellationToken::cancelled(cancel_) ? OperationStatus::Cancelled : OperationStatus::Completed;
        if (status == OperationStatus::Cancelled) {
            stats_.filesSkipped += unplannedPaths();
        }

        phases_.enter(SyncPhase::UpdatingStore);
        stats_.status = status;
        stats_.endTime = now();
        if (options_.calculateSpaceSavings) {
            stats_.spaceSavings = SpaceSavingsReport::calculate(originalBytes_, storedBytes_, stats_.filesCopied);
        }

        auto stored = store_.completeOperation(operationId_, stats_, status, &batch_);
        if (!stored) {
            phases_.settle(SyncPhase::Failed);
            LOG_ERROR_COMP("Cannot finalize operation " + std::to_string(operationId_) + ": " +
                           stored.error().message, kComponent);
            return stored.error();
        }

        phases_.settle(status == OperationStatus::Cancelled ? SyncPhase::Cancelled : SyncPhase::Idle);
        LOG_INFO_COMP("Group " + group_.id + " " + toString(status) + ": " +
                      std::to_string(stats_.filesCopied) + " copied, " +
                      std::to_string(stats_.filesDeleted) + " deleted, " +
                      std::to_string(stats_.filesSkipped) + " skipped, " +
                      std::to_string(stats_.filesFailed) + " failed, " +
                      std::to_string(stats_.conflictsDetected) + " conflicts", kComponent);
        return stats_;
    }

    Result<SyncStatistics> fail(const Error& error) {
        phases_.settle(SyncPhase::Failed);
        stats_.status = OperationStatus::Failed;
        stats_.endTime = now();
        stats_.errorMessage = error.message;
        LOG_ERROR_COMP("Sync of " + group_.id + " failed: " + error.message, kComponent);

        auto stored = store_.completeOperation(operationId_, stats_, OperationStatus::Failed);
        if (!stored) {
            LOG_ERROR_COMP("Cannot record failure of operation " + std::to_string(operationId_) + ": " +
                           stored.error().message, kComponent);
        }
        return Err<SyncStatistics>(error.code, error.message);
    }

    ChangeTrackingStore& store_;
    const StorageGroup& group_;
    const AdvancedSyncOptions& options_;
    const TransferPipeline& pipeline_;
    const CancellationToken* cancel_;
    int64_t operationId_;

    PhaseReporter phases_;
    FileTransfer transfer_;
    ConflictDetector detector_;
    std::unique_ptr<WorkerPool> pool_;

    ScanMap masterScan_;
    std::vector<std::string> masterUnreadable_;
    std::vector<ScanResult> backupScans_;
    std::set<std::string> masterFailed_;
    std::set<size_t> unplanned_;
    bool restoring_ = false;
    SnapshotMap masterHashes_;
    OperationBatch batch_;

    std::mutex mutex_;
    SyncStatistics stats_;
    uint64_t originalBytes_ = 0;
    uint64_t storedBytes_ = 0;
    size_t processed_ = 0;
    size_t total_ = 0;
};

} // namespace

Synchronizer::Synchronizer(ChangeTrackingStore& store, GroupLockRegistry& locks)
    : store_(store), locks_(locks) {
}

Result<void> Synchronizer::validateGroup(const StorageGroup& group) {
    if (group.id.empty()) {
        return Err(ErrorCode::InvalidArgument, "Group id must not be empty");
    }
    if (group.id.find('#') != std::string::npos) {
        return Err(ErrorCode::InvalidArgument, "Group id must not contain '#': " + group.id);
    }
    if (group.masterPath.empty()) {
        return Err(ErrorCode::InvalidArgument, "Group " + group.id + " has no master path");
    }
    if (group.backupPaths.empty()) {
        return Err(ErrorCode::InvalidArgument, "Group " + group.id + " has no backup path");
    }

    std::set<fs::path> roots{PathUtils::normalize(group.masterPath)};
    for (const auto& backup : group.backupPaths) {
        if (backup.empty() || !roots.insert(PathUtils::normalize(backup)).second) {
            return Err(ErrorCode::InvalidArgument,
                       "Backup path of " + group.id + " is empty or repeats another root: " + backup.string());
        }
    }
    return Ok();
}

Result<SyncStatistics> Synchronizer::sync(const StorageGroup& group, const AdvancedSyncOptions& options,
                                          SyncKind kind, const CancellationToken* cancel) {
    auto valid = validateGroup(group);
    if (!valid) {
        return Err<SyncStatistics>(valid.error().code, valid.error().message);
    }
    auto validOptions = options.validate();
    if (!validOptions) {
        return Err<SyncStatistics>(validOptions.error().code, validOptions.error().message);
    }

    auto guard = locks_.tryAcquire(group.id);
    if (!guard) {
        LOG_WARN_COMP("Group " + group.id + " is already being synchronized", kComponent);
        return Err<SyncStatistics>(ErrorCode::Locked, "Group " + group.id + " is locked by another operation");
    }

    auto pipeline = buildPipeline(options);
    if (!pipeline) {
        return pipeline.error();
    }

    auto operationId = store_.startOperation(group.id, kind);
    if (!operationId) {
        return operationId.error();
    }

    SCOPED_TIMER_COMP("Sync of " + group.id, kComponent);
    LOG_INFO_COMP(std::string("Starting ") + toString(kind) + " sync of " + group.id + " (" + toString(group.mode) +
                  ", " + std::to_string(group.backupPaths.size()) + " backup(s), " + (*pipeline)->describe() + ")",
                  kComponent);

    SyncRun run(store_, group, options, **pipeline, cancel, *operationId);
    return run.runSync();
}

Result<SyncStatistics> Synchronizer::restore(const StorageGroup& group, size_t backupIndex,
                                             const AdvancedSyncOptions& options, const CancellationToken* cancel) {
    auto valid = validateGroup(group);
    if (!valid) {
        return Err<SyncStatistics>(valid.error().code, valid.error().message);
    }
    if (backupIndex >= group.backupPaths.size()) {
        return Err<SyncStatistics>(ErrorCode::InvalidArgument,
                                   "Group " + group.id + " has no backup #" + std::to_string(backupIndex));
    }
    auto validOptions = options.validate();
    if (!validOptions) {
        return Err<SyncStatistics>(validOptions.error().code, validOptions.error().message);
    }

    auto guard = locks_.tryAcquire(group.id);
    if (!guard) {
        return Err<SyncStatistics>(ErrorCode::Locked, "Group " + group.id + " is locked by another operation");
    }

    auto pipeline = buildPipeline(options);
    if (!pipeline) {
        return pipeline.error();
    }

    auto operationId = store_.startOperation(group.id, SyncKind::Manual);
    if (!operationId) {
        return operationId.error();
    }

    LOG_INFO_COMP("Restoring " + group.id + " from " + group.backupPaths[backupIndex].string(), kComponent);
    SyncRun run(store_, group, options, **pipeline, cancel, *operationId);
    return run.runRestore(backupIndex);
}

Result<std::vector<VerifyReport>> Synchronizer::verifyStatus(const StorageGroup& group,
                                                             const AdvancedSyncOptions& options,
                                                             const CancellationToken* cancel) {
    auto valid = validateGroup(group);
    if (!valid) {
        return Err<std::vector<VerifyReport>>(valid.error().code, valid.error().message);
    }
    auto pipeline = buildPipeline(options);
    if (!pipeline) {
        return pipeline.error();
    }

    try {
        TreeScanner scanner{PathFilter(options.excludePatterns)};
        auto masterScan = scanner.scan(group.masterPath, cancel, otherRoots(group, group.masterPath));
        if (!masterScan) {
            return masterScan.error();
        }

        SnapshotMap hashCache;
        std::vector<VerifyReport> reports;
        for (size_t i = 0; i < group.backupPaths.size(); ++i) {
            const auto& root = group.backupPaths[i];
            auto backupScan = scanner.scan(root, cancel, otherRoots(group, root));
            if (!backupScan) {
                return backupScan.error();
            }
            auto baseline = store_.baseline(trackingScope(group.id, i));
            if (!baseline) {
                return baseline.error();
            }

            auto master = snapshotMaster(masterScan->files, *baseline, options.incremental, hashCache, cancel);
            auto backup = snapshotBackup(backupScan->files, *baseline, **pipeline, options.incremental, cancel);

            VerifyReport report;
            report.backupIndex = i;
            std::set<std::string> unreadable(master.unreadable.begin(), master.unreadable.end());
            unreadable.insert(backup.unreadable.begin(), backup.unreadable.end());
            unreadable.insert(masterScan->unreadable.begin(), masterScan->unreadable.end());
            unreadable.insert(backupScan->unreadable.begin(), backupScan->unreadable.end());
            report.unreadable.assign(unreadable.begin(), unreadable.end());
            std::vector<std::string> unknown(unreadable.begin(), unreadable.end());
            eraseUnknown(master.files, unknown);
            eraseUnknown(backup.files, unknown);

            for (const auto& [path, snapshot] : master.files) {
                auto other = backup.files.find(path);
                if (other == backup.files.end()) {
                    report.masterOnly.push_back(path);
                } else if (other->second.checksum == snapshot.checksum) {
                    report.inSync.push_back(path);
                } else {
                    report.differing.push_back(path);
                }
            }
            for (const auto& [path, snapshot] : backup.files) {
                if (!master.files.count(path)) {
                    report.backupOnly.push_back(path);
                }
            }

            LOG_INFO_COMP("Verify " + group.id + " backup " + std::to_string(i) + ": " +
                          std::to_string(report.inSync.size()) + " in sync, " +
                          std::to_string(report.masterOnly.size()) + " master only, " +
                          std::to_string(report.backupOnly.size()) + " backup only, " +
                          std::to_string(report.differing.size()) + " differing", kComponent);
            reports.push_back(std::move(report));
        }
        return reports;
    } catch (const OperationCancelled&) {
        return Err<std::vector<VerifyReport>>(ErrorCode::Cancelled, "Verification cancelled");
    }
}

Result<int> Synchronizer::clearTracking(const std::string& groupId) {
    auto guard = locks_.tryAcquire(groupId);
    if (!guard) {
        return Err<int>(ErrorCode::Locked, "Group " + groupId + " is locked by another operation");
    }
    auto cleared = store_.clearGroup(groupId);
    if (cleared) {
        LOG_INFO_COMP("Cleared " + std::to_string(*cleared) + " tracked records of " + groupId, kComponent);
    }
    return cleared;
}

} // namespace DriveSync

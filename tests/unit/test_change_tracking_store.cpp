#include <gtest/gtest.h>
#include <filesystem>

#include "ChangeTrackingStore.h"
#include "ConflictDetector.h"
#include "ProcessIdentity.h"

using namespace DriveSync;

namespace fs = std::filesystem;

class ChangeTrackingStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() /
                   ("drivesync_store_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(testDir_);
        fs::create_directories(testDir_);
        dbPath_ = (testDir_ / "tracking.db").string();

        store_ = std::make_unique<ChangeTrackingStore>(dbPath_);
        ASSERT_TRUE(store_->open().ok());
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    static FileRecord record(const std::string& scope, const std::string& path, const std::string& checksum,
                             uint64_t size) {
        FileRecord r;
        r.groupId = scope;
        r.relativePath = path;
        r.checksum = checksum;
        r.size = size;
        return r;
    }

    static Conflict conflict(const std::string& path, ConflictKind kind) {
        Conflict c;
        c.relativePath = path;
        c.kind = kind;
        FileSnapshot master;
        master.relativePath = path;
        master.size = 10;
        master.checksum = "m";
        c.master = master;
        if (kind != ConflictKind::DeletedBackup) {
            FileSnapshot backup;
            backup.relativePath = path;
            backup.size = 12;
            backup.checksum = "b";
            c.backup = backup;
        }
        return c;
    }

    /// Rewrites the owner of a running operation through a second connection
    void setOwner(int64_t operationId, int64_t pid, int64_t startTicks) {
        DatabaseManager db(dbPath_);
        ASSERT_TRUE(db.initialize());
        db.execute("UPDATE sync_operations SET owner_pid = " + std::to_string(pid) +
                   ", owner_start = " + std::to_string(startTicks) + " WHERE id = " + std::to_string(operationId));
    }

    fs::path testDir_;
    std::string dbPath_;
    std::unique_ptr<ChangeTrackingStore> store_;
};

TEST_F(ChangeTrackingStoreTest, OpenIsIdempotent) {
    EXPECT_TRUE(store_->isOpen());
    EXPECT_TRUE(store_->open().ok());
    EXPECT_TRUE(fs::exists(dbPath_));
}

TEST_F(ChangeTrackingStoreTest, NeedsSyncComparesChecksumAndSize) {
    auto fresh = store_->needsSync("docs", "a.txt", "abc", 100, 5);
    ASSERT_TRUE(fresh.ok());
    EXPECT_TRUE(*fresh);

    ASSERT_TRUE(store_->updateRecord("docs", "a.txt", "abc", 5, SyncKind::Manual).ok());

    EXPECT_FALSE(*store_->needsSync("docs", "a.txt", "abc", 100, 5));
    EXPECT_TRUE(*store_->needsSync("docs", "a.txt", "abd", 100, 5));
    EXPECT_TRUE(*store_->needsSync("docs", "a.txt", "abc", 100, 6));

    // mtime alone never decides
    EXPECT_FALSE(*store_->needsSync("docs", "a.txt", "abc", 999999, 5));

    // Scoped per group
    EXPECT_TRUE(*store_->needsSync("photos", "a.txt", "abc", 100, 5));
}

TEST_F(ChangeTrackingStoreTest, NeedsSyncAgreesWithPlanning) {
    ASSERT_TRUE(store_->updateRecord("docs", "a.txt", "abc", 5, SyncKind::Manual).ok());
    auto stored = store_->lookup("docs", "a.txt");
    ASSERT_TRUE(stored.ok() && stored->has_value());

    struct Observed {
        std::string checksum;
        uint64_t size;
        int64_t mtimeNs;
    };
    for (const auto& seen : {Observed{"abc", 5, 0}, Observed{"abc", 5, 777}, Observed{"abd", 5, 0},
                             Observed{"abc", 6, 0}, Observed{"xyz", 9, 1}}) {
        FileSnapshot snapshot;
        snapshot.relativePath = "a.txt";
        snapshot.checksum = seen.checksum;
        snapshot.size = seen.size;
        snapshot.mtimeNs = seen.mtimeNs;

        auto needs = store_->needsSync("docs", "a.txt", seen.checksum, seen.mtimeNs, seen.size);
        ASSERT_TRUE(needs.ok());
        EXPECT_EQ(*needs, ConflictDetector::changedSince(snapshot, **stored))
            << seen.checksum << "/" << seen.size << "/" << seen.mtimeNs;
    }
}

TEST_F(ChangeTrackingStoreTest, UpdateLookupAndRemove) {
    FileRecord r = record("docs", "dir/b.bin", "sum1", 42);
    r.storedChecksum = "stored1";
    r.mtimeNs = 1234;
    r.sourceSide = Side::Backup;
    ASSERT_TRUE(store_->updateRecord(r, SyncKind::Scheduled).ok());

    auto found = store_->lookup("docs", "dir/b.bin");
    ASSERT_TRUE(found.ok());
    ASSERT_TRUE(found->has_value());
    const FileRecord& stored = **found;
    EXPECT_EQ(stored.checksum, "sum1");
    EXPECT_EQ(stored.storedChecksum, "stored1");
    EXPECT_EQ(stored.size, 42u);
    EXPECT_EQ(stored.mtimeNs, 1234);
    EXPECT_EQ(stored.sourceSide, Side::Backup);
    EXPECT_GT(stored.lastSynced, 0);
    EXPECT_EQ(stored.operationId, 0);

    // Upsert keeps one row per (group, path)
    ASSERT_TRUE(store_->updateRecord("docs", "dir/b.bin", "sum2", 43, SyncKind::Manual).ok());
    auto all = store_->baseline("docs");
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all->size(), 1u);
    EXPECT_EQ(all->at("dir/b.bin").checksum, "sum2");
    EXPECT_EQ(all->at("dir/b.bin").storedChecksum, "sum2");

    ASSERT_TRUE(store_->removeRecord("docs", "dir/b.bin").ok());
    EXPECT_FALSE(store_->lookup("docs", "dir/b.bin")->has_value());

    auto invalid = store_->updateRecord(record("", "x", "y", 1), SyncKind::Manual);
    ASSERT_FALSE(invalid.ok());
    EXPECT_EQ(invalid.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ChangeTrackingStoreTest, RecordsSurviveReopen) {
    ASSERT_TRUE(store_->updateRecord("docs", "a.txt", "abc", 3, SyncKind::Manual).ok());
    store_.reset();

    ChangeTrackingStore reopened(dbPath_);
    ASSERT_TRUE(reopened.open().ok());
    EXPECT_FALSE(*reopened.needsSync("docs", "a.txt", "abc", 0, 3));
}

TEST_F(ChangeTrackingStoreTest, OneRunningOperationPerGroup) {
    auto first = store_->startOperation("docs", SyncKind::Manual);
    ASSERT_TRUE(first.ok());

    auto second = store_->startOperation("docs", SyncKind::Realtime);
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.error().code, ErrorCode::Locked);

    auto other = store_->startOperation("photos", SyncKind::Scheduled);
    EXPECT_TRUE(other.ok());

    SyncStatistics stats;
    ASSERT_TRUE(store_->completeOperation(*first, stats, OperationStatus::Completed).ok());

    auto third = store_->startOperation("docs", SyncKind::Manual);
    EXPECT_TRUE(third.ok());
}

TEST_F(ChangeTrackingStoreTest, CompleteOperationAppliesBatchOnce) {
    ASSERT_TRUE(store_->updateRecord("docs", "old.txt", "o", 1, SyncKind::Manual).ok());

    auto op = store_->startOperation("docs", SyncKind::Scheduled);
    ASSERT_TRUE(op.ok());

    OperationBatch batch;
    batch.upsert(record("docs", "new.txt", "n", 7));
    batch.upsert(record("docs#1", "new.txt", "n", 7));
    batch.remove("docs", "old.txt");
    EXPECT_EQ(batch.size(), 3u);

    SyncStatistics stats;
    stats.filesCopied = 2;
    stats.filesDeleted = 1;
    stats.bytesCopied = 14;
    stats.spaceSavings = SpaceSavingsReport::calculate(14, 10, 2);

    auto done = store_->completeOperation(*op, stats, OperationStatus::Completed, &batch);
    ASSERT_TRUE(done.ok());
    EXPECT_EQ(done->status, OperationStatus::Completed);
    EXPECT_EQ(done->operationId, *op);

    EXPECT_FALSE(store_->lookup("docs", "old.txt")->has_value());
    auto added = store_->lookup("docs", "new.txt");
    ASSERT_TRUE(added->has_value());
    EXPECT_EQ((*added)->operationId, *op);

    auto files = store_->operationFiles(*op);
    ASSERT_TRUE(files.ok());
    ASSERT_EQ(files->size(), 2u);
    EXPECT_EQ((*files)[0].groupId, "docs");
    EXPECT_EQ((*files)[1].groupId, "docs#1");

    // Terminal state is immutable: a second finalize reports the stored result
    SyncStatistics other;
    other.filesFailed = 9;
    auto again = store_->completeOperation(*op, other, OperationStatus::Failed);
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again->status, OperationStatus::Completed);
    EXPECT_EQ(again->filesCopied, 2u);
    EXPECT_EQ(again->filesFailed, 0u);
    EXPECT_EQ(again->spaceSavings.storedSize, 10u);

    auto summary = store_->operation(*op);
    ASSERT_TRUE(summary.ok());
    ASSERT_TRUE(summary->has_value());
    EXPECT_EQ((*summary)->status, OperationStatus::Completed);
    EXPECT_EQ((*summary)->kind, SyncKind::Scheduled);
    EXPECT_EQ((*summary)->filesDeleted, 1u);
    EXPECT_EQ((*summary)->originalBytes, 14u);
    EXPECT_GE((*summary)->completedAt, (*summary)->startedAt);
}

TEST_F(ChangeTrackingStoreTest, CompleteOperationRejectsBadInput) {
    SyncStatistics stats;
    auto unknown = store_->completeOperation(4242, stats, OperationStatus::Completed);
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);

    auto op = store_->startOperation("docs", SyncKind::Manual);
    ASSERT_TRUE(op.ok());
    auto running = store_->completeOperation(*op, stats, OperationStatus::Running);
    ASSERT_FALSE(running.ok());
    EXPECT_EQ(running.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ChangeTrackingStoreTest, HistoryIsMostRecentFirst) {
    SyncStatistics stats;
    std::vector<int64_t> ids;
    for (int i = 0; i < 3; ++i) {
        auto op = store_->startOperation("docs", SyncKind::Manual);
        ASSERT_TRUE(op.ok());
        stats.filesCopied = static_cast<uint64_t>(i);
        stats.errorMessage = i == 1 ? "disk full" : "";
        auto status = i == 1 ? OperationStatus::Failed : OperationStatus::Completed;
        ASSERT_TRUE(store_->completeOperation(*op, stats, status).ok());
        ids.push_back(*op);
    }

    auto history = store_->history("docs");
    ASSERT_TRUE(history.ok());
    ASSERT_EQ(history->size(), 3u);
    EXPECT_EQ((*history)[0].id, ids[2]);
    EXPECT_EQ((*history)[1].status, OperationStatus::Failed);
    EXPECT_EQ((*history)[1].errorMessage, "disk full");
    EXPECT_EQ((*history)[2].id, ids[0]);

    EXPECT_EQ(store_->history("docs", 2)->size(), 2u);
    EXPECT_TRUE(store_->history("photos")->empty());
}

TEST_F(ChangeTrackingStoreTest, ConflictsForReview) {
    auto saved = store_->saveConflict("docs", conflict("a.txt", ConflictKind::ModifiedBoth));
    ASSERT_TRUE(saved.ok());
    Conflict deleted = conflict("b.txt", ConflictKind::DeletedBackup);
    deleted.backupIndex = 1;
    ASSERT_TRUE(store_->saveConflict("docs", deleted).ok());

    auto pending = store_->pendingConflicts("docs");
    ASSERT_TRUE(pending.ok());
    ASSERT_EQ(pending->size(), 2u);
    EXPECT_EQ((*pending)[0].relativePath, "a.txt");
    EXPECT_EQ((*pending)[0].kind, ConflictKind::ModifiedBoth);
    ASSERT_TRUE((*pending)[0].backup.has_value());
    EXPECT_EQ((*pending)[0].backup->size, 12u);
    EXPECT_EQ((*pending)[1].backupIndex, 1u);
    EXPECT_FALSE((*pending)[1].backup.has_value());

    ASSERT_TRUE(store_->markConflictResolved(*saved, Resolution::KeepMaster).ok());
    EXPECT_EQ(store_->pendingConflicts("docs")->size(), 1u);

    auto missing = store_->markConflictResolved(999, Resolution::Skip);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(ChangeTrackingStoreTest, FinishedScanReplacesReviewList) {
    ASSERT_TRUE(store_->saveConflict("docs", conflict("stale.txt", ConflictKind::ModifiedBoth)).ok());

    // A failed operation keeps the previous list
    auto failed = store_->startOperation("docs", SyncKind::Manual);
    OperationBatch failedBatch;
    failedBatch.addConflict("docs", conflict("ignored.txt", ConflictKind::SizeMismatch));
    ASSERT_TRUE(store_->completeOperation(*failed, SyncStatistics{}, OperationStatus::Failed, &failedBatch).ok());
    auto afterFailure = store_->pendingConflicts("docs");
    ASSERT_EQ(afterFailure->size(), 1u);
    EXPECT_EQ((*afterFailure)[0].relativePath, "stale.txt");

    auto op = store_->startOperation("docs", SyncKind::Manual);
    OperationBatch batch;
    batch.addConflict("docs", conflict("fresh.txt", ConflictKind::ModifiedBoth));
    ASSERT_TRUE(store_->completeOperation(*op, SyncStatistics{}, OperationStatus::Completed, &batch).ok());

    auto pending = store_->pendingConflicts("docs");
    ASSERT_EQ(pending->size(), 1u);
    EXPECT_EQ((*pending)[0].relativePath, "fresh.txt");
}

TEST_F(ChangeTrackingStoreTest, ClearGroupRemovesEveryScope) {
    ASSERT_TRUE(store_->updateRecord("docs", "a", "1", 1, SyncKind::Manual).ok());
    ASSERT_TRUE(store_->updateRecord("docs#1", "a", "1", 1, SyncKind::Manual).ok());
    ASSERT_TRUE(store_->updateRecord("docs#2", "b", "1", 1, SyncKind::Manual).ok());
    ASSERT_TRUE(store_->updateRecord("docs_x", "a", "1", 1, SyncKind::Manual).ok());
    ASSERT_TRUE(store_->saveConflict("docs", conflict("a", ConflictKind::ModifiedBoth)).ok());
    auto op = store_->startOperation("docs", SyncKind::Manual);
    ASSERT_TRUE(store_->completeOperation(*op, SyncStatistics{}, OperationStatus::Completed).ok());

    auto removed = store_->clearGroup("docs");
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(*removed, 3);

    EXPECT_TRUE(store_->baseline("docs")->empty());
    EXPECT_TRUE(store_->baseline("docs#1")->empty());
    EXPECT_EQ(store_->baseline("docs_x")->size(), 1u);
    EXPECT_TRUE(store_->pendingConflicts("docs")->empty());
    EXPECT_TRUE(store_->history("docs")->empty());
}

TEST_F(ChangeTrackingStoreTest, RecoverInterruptedFailsOperationsOfDeadOwners) {
    auto op = store_->startOperation("docs", SyncKind::Realtime);
    ASSERT_TRUE(op.ok());
    auto live = store_->startOperation("photos", SyncKind::Manual);
    ASSERT_TRUE(live.ok());
    // Same pid, different start time: the pid was reused after the owner died
    setOwner(*op, ProcessIdentity::current().pid, 1);
    store_.reset();

    ChangeTrackingStore restarted(dbPath_);
    ASSERT_TRUE(restarted.open().ok());
    auto recovered = restarted.recoverInterrupted();
    ASSERT_TRUE(recovered.ok());
    EXPECT_EQ(*recovered, 1);

    auto summary = restarted.operation(*op);
    ASSERT_TRUE(summary->has_value());
    EXPECT_EQ((*summary)->status, OperationStatus::Failed);
    EXPECT_FALSE((*summary)->errorMessage.empty());

    // The operation of this still-running process is left alone
    EXPECT_EQ((*restarted.operation(*live))->status, OperationStatus::Running);
    EXPECT_EQ(*restarted.recoverInterrupted(), 0);
}

TEST_F(ChangeTrackingStoreTest, RowsWithoutOwnerAreRecovered) {
    auto op = store_->startOperation("docs", SyncKind::Scheduled);
    ASSERT_TRUE(op.ok());
    setOwner(*op, 0, 0);

    auto recovered = store_->recoverInterrupted();
    ASSERT_TRUE(recovered.ok());
    EXPECT_EQ(*recovered, 1);
}

TEST_F(ChangeTrackingStoreTest, StartOperationTakesOverFromDeadOwner) {
    auto stale = store_->startOperation("docs", SyncKind::Scheduled);
    ASSERT_TRUE(stale.ok());

    // Still owned by this process: the group stays locked
    auto blocked = store_->startOperation("docs", SyncKind::Manual);
    ASSERT_FALSE(blocked.ok());
    EXPECT_EQ(blocked.error().code, ErrorCode::Locked);

    setOwner(*stale, ProcessIdentity::current().pid, 1);
    auto next = store_->startOperation("docs", SyncKind::Manual);
    ASSERT_TRUE(next.ok()) << next.error().message;
    EXPECT_NE(*next, *stale);
    EXPECT_EQ((*store_->operation(*stale))->status, OperationStatus::Failed);
    EXPECT_EQ((*store_->operation(*next))->status, OperationStatus::Running);
}

TEST_F(ChangeTrackingStoreTest, BatchForRecoveredOperationIsRejected) {
    auto op = store_->startOperation("docs", SyncKind::Manual);
    ASSERT_TRUE(op.ok());
    setOwner(*op, 0, 0);
    ASSERT_EQ(*store_->recoverInterrupted(), 1);

    OperationBatch batch;
    batch.upsert(record("docs", "late.txt", "l", 4));
    auto late = store_->completeOperation(*op, SyncStatistics{}, OperationStatus::Completed, &batch);
    ASSERT_FALSE(late.ok());
    EXPECT_EQ(late.error().code, ErrorCode::DatabaseError);
    EXPECT_FALSE(store_->lookup("docs", "late.txt")->has_value());

    // Without a batch nothing is lost; the stored result is reported
    OperationBatch empty;
    auto plain = store_->completeOperation(*op, SyncStatistics{}, OperationStatus::Completed, &empty);
    ASSERT_TRUE(plain.ok());
    EXPECT_EQ(plain->status, OperationStatus::Failed);
}

TEST(ProcessIdentityTest, CurrentProcessIsAlive) {
    auto self = ProcessIdentity::current();
    EXPECT_GT(self.pid, 0);
    EXPECT_GT(self.startTicks, 0);
    EXPECT_TRUE(self.alive());

    ProcessIdentity reused = self;
    reused.startTicks = self.startTicks + 1;
    EXPECT_FALSE(reused.alive());

    EXPECT_FALSE(ProcessIdentity{}.alive());
}

TEST(TrackingScopeTest, ScopesPerBackupIndex) {
    EXPECT_EQ(trackingScope("docs", 0), "docs");
    EXPECT_EQ(trackingScope("docs", 1), "docs#1");
    EXPECT_EQ(trackingScope("docs", 2), "docs#2");
}

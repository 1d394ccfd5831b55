/**
 * @file sync_integration_test.cpp
 * @brief End-to-end Synchronizer runs against real directory trees
 *
 * Covers:
 * - One-way copy, deletion propagation and idempotent re-runs
 * - Bidirectional propagation and conflict reporting
 * - Group locking and cancellation
 * - Multiple backups, encrypted and compressed backups, restore and verify
 */

#include <atomic>
#include <unistd.h>
#include <vector>

#include "CancellationToken.h"
#include "Crypto.h"
#include "SyncTestFixture.h"

using namespace DriveSync;

namespace fs = std::filesystem;

class SyncIntegrationTest : public SyncTestFixture {};

namespace {

/// Removes all access to a directory for the guard's lifetime
class LockedDirectory {
public:
    explicit LockedDirectory(fs::path dir) : dir_(std::move(dir)) {
        fs::permissions(dir_, fs::perms::none, fs::perm_options::replace);
    }
    ~LockedDirectory() {
        std::error_code ec;
        fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace, ec);
    }

private:
    fs::path dir_;
};

} // namespace

TEST_F(SyncIntegrationTest, MasterToBackupCopiesNewFiles) {
    writeFile(masterDir_ / "report.txt", "quarterly numbers");
    writeFile(masterDir_ / "notes" / "meeting.md", "# Agenda");

    auto result = synchronizer_->sync(makeGroup(), AdvancedSyncOptions());
    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(result->status, OperationStatus::Completed);
    EXPECT_EQ(result->filesCopied, 2u);
    EXPECT_EQ(result->filesFailed, 0u);
    EXPECT_EQ(result->conflictsDetected, 0u);
    EXPECT_GT(result->operationId, 0);

    EXPECT_EQ(readFile(backupDir_ / "report.txt"), "quarterly numbers");
    EXPECT_EQ(readFile(backupDir_ / "notes" / "meeting.md"), "# Agenda");

    auto record = store_->lookup("docs", "notes/meeting.md");
    ASSERT_TRUE(record.ok());
    ASSERT_TRUE(record->has_value());
    EXPECT_EQ((*record)->size, 8u);
    EXPECT_EQ((*record)->sourceSide, Side::Master);

    auto history = store_->history("docs");
    ASSERT_TRUE(history.ok());
    ASSERT_EQ(history->size(), 1u);
    EXPECT_EQ(history->front().status, OperationStatus::Completed);
    EXPECT_EQ(history->front().filesCopied, 2u);
}

TEST_F(SyncIntegrationTest, SecondRunCopiesNothing) {
    writeFile(masterDir_ / "a.txt", "alpha");
    writeFile(masterDir_ / "b.txt", "bravo");
    ASSERT_TRUE(synchronizer_->sync(makeGroup(), AdvancedSyncOptions()).ok());

    auto again = synchronizer_->sync(makeGroup(), AdvancedSyncOptions());
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again->filesCopied, 0u);
    EXPECT_EQ(again->filesSkipped, 2u);
    EXPECT_EQ(again->bytesCopied, 0u);
}

TEST_F(SyncIntegrationTest, ModifiedAndDeletedMasterFilesPropagate) {
    writeFile(masterDir_ / "keep.txt", "v1");
    writeFile(masterDir_ / "drop.txt", "temporary");
    ASSERT_TRUE(synchronizer_->sync(makeGroup(), AdvancedSyncOptions()).ok());

    writeFile(masterDir_ / "keep.txt", "version two");
    fs::remove(masterDir_ / "drop.txt");

    auto result = synchronizer_->sync(makeGroup(), AdvancedSyncOptions());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->filesCopied, 1u);
    EXPECT_EQ(result->filesDeleted, 1u);
    EXPECT_EQ(readFile(backupDir_ / "keep.txt"), "version two");
    EXPECT_FALSE(fs::exists(backupDir_ / "drop.txt"));

    auto record = store_->lookup("docs", "drop.txt");
    ASSERT_TRUE(record.ok());
    EXPECT_FALSE(record->has_value());
}

TEST_F(SyncIntegrationTest, MasterToBackupLeavesBackupOnlyFilesAlone) {
    writeFile(backupDir_ / "archive.txt", "older material");

    auto result = synchronizer_->sync(makeGroup(), AdvancedSyncOptions());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->filesCopied, 0u);
    EXPECT_EQ(result->filesSkipped, 1u);
    EXPECT_FALSE(fs::exists(masterDir_ / "archive.txt"));
    EXPECT_TRUE(fs::exists(backupDir_ / "archive.txt"));
}

TEST_F(SyncIntegrationTest, BackupToMasterCopiesTheOtherWay) {
    writeFile(backupDir_ / "restored.txt", "from the backup drive");

    auto result = synchronizer_->sync(makeGroup(SyncMode::BackupToMaster), AdvancedSyncOptions());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->filesCopied, 1u);
    EXPECT_EQ(readFile(masterDir_ / "restored.txt"), "from the backup drive");

    auto record = store_->lookup("docs", "restored.txt");
    ASSERT_TRUE(record.ok() && record->has_value());
    EXPECT_EQ((*record)->sourceSide, Side::Backup);
}

TEST_F(SyncIntegrationTest, BidirectionalPropagatesMasterEdits) {
    writeFile(masterDir_ / "plan.txt", "draft");
    ASSERT_TRUE(synchronizer_->sync(makeGroup(SyncMode::Bidirectional), AdvancedSyncOptions()).ok());

    writeFile(masterDir_ / "plan.txt", "draft, second pass");
    writeFile(masterDir_ / "agenda.txt", "new on master");

    auto result = synchronizer_->sync(makeGroup(SyncMode::Bidirectional), AdvancedSyncOptions());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->conflictsDetected, 0u);
    EXPECT_EQ(result->filesCopied, 2u);
    EXPECT_EQ(readFile(backupDir_ / "plan.txt"), "draft, second pass");
    EXPECT_EQ(readFile(backupDir_ / "agenda.txt"), "new on master");
}

TEST_F(SyncIntegrationTest, BidirectionalBackupEditsNeedReview) {
    writeFile(masterDir_ / "plan.txt", "draft");
    ASSERT_TRUE(synchronizer_->sync(makeGroup(SyncMode::Bidirectional), AdvancedSyncOptions()).ok());

    writeFile(backupDir_ / "plan.txt", "draft edited on backup");
    writeFile(backupDir_ / "only_backup.txt", "fresh");

    auto result = synchronizer_->sync(makeGroup(SyncMode::Bidirectional), AdvancedSyncOptions());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->filesCopied, 0u);
    ASSERT_EQ(result->conflictsDetected, 2u);
    ASSERT_EQ(result->conflicts.size(), 2u);
    EXPECT_EQ(result->conflicts[0].relativePath, "only_backup.txt");
    EXPECT_EQ(result->conflicts[0].kind, ConflictKind::DeletedMaster);
    EXPECT_EQ(result->conflicts[1].relativePath, "plan.txt");
    EXPECT_EQ(result->conflicts[1].kind, ConflictKind::SizeMismatch);

    // The master keeps its content until someone resolves
    EXPECT_EQ(readFile(masterDir_ / "plan.txt"), "draft");
    EXPECT_FALSE(fs::exists(masterDir_ / "only_backup.txt"));

    // Same-size backup edits are reported as modified_both
    writeFile(backupDir_ / "plan.txt", "DRAFT");
    auto sameSize = synchronizer_->sync(makeGroup(SyncMode::Bidirectional), AdvancedSyncOptions());
    ASSERT_TRUE(sameSize.ok());
    ASSERT_EQ(sameSize->conflicts.size(), 2u);
    EXPECT_EQ(sameSize->conflicts[1].kind, ConflictKind::ModifiedBoth);
    EXPECT_EQ(readFile(masterDir_ / "plan.txt"), "draft");
}

TEST_F(SyncIntegrationTest, BidirectionalEditOnBothSidesIsConflict) {
    // Same length, different content, never tracked
    writeFile(masterDir_ / "shared.txt", "master version 1");
    writeFile(backupDir_ / "shared.txt", "backup version 1");

    auto result = synchronizer_->sync(makeGroup(SyncMode::Bidirectional), AdvancedSyncOptions());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->status, OperationStatus::Completed);
    EXPECT_EQ(result->conflictsDetected, 1u);
    ASSERT_EQ(result->conflicts.size(), 1u);
    EXPECT_EQ(result->conflicts[0].relativePath, "shared.txt");
    EXPECT_EQ(result->conflicts[0].kind, ConflictKind::ModifiedBoth);
    ASSERT_TRUE(result->conflicts[0].master.has_value());
    ASSERT_TRUE(result->conflicts[0].backup.has_value());

    // Neither side is touched
    EXPECT_EQ(readFile(masterDir_ / "shared.txt"), "master version 1");
    EXPECT_EQ(readFile(backupDir_ / "shared.txt"), "backup version 1");

    auto pending = store_->pendingConflicts("docs");
    ASSERT_TRUE(pending.ok());
    ASSERT_EQ(pending->size(), 1u);
    EXPECT_GT(pending->front().id, 0);
    EXPECT_EQ(pending->front().resolution, Resolution::Unresolved);
}

TEST_F(SyncIntegrationTest, SizeMismatchBeyondToleranceIsConflict) {
    writeFile(masterDir_ / "video.bin", std::string(1000, 'm'));
    writeFile(backupDir_ / "video.bin", std::string(400, 'b'));

    AdvancedSyncOptions options;
    options.sizeTolerance = 100;
    auto result = synchronizer_->sync(makeGroup(), options);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->conflicts.size(), 1u);
    EXPECT_EQ(result->conflicts[0].kind, ConflictKind::SizeMismatch);
    EXPECT_EQ(readFile(backupDir_ / "video.bin"), std::string(400, 'b'));
}

TEST_F(SyncIntegrationTest, LockedGroupIsRejected) {
    writeFile(masterDir_ / "a.txt", "alpha");

    auto guard = locks_.tryAcquire("docs");
    ASSERT_TRUE(guard.owns());

    auto blocked = synchronizer_->sync(makeGroup(), AdvancedSyncOptions());
    ASSERT_FALSE(blocked.ok());
    EXPECT_EQ(blocked.error().code, ErrorCode::Locked);
    EXPECT_FALSE(fs::exists(backupDir_ / "a.txt"));

    // A locked attempt leaves no operation behind
    auto history = store_->history("docs");
    ASSERT_TRUE(history.ok());
    EXPECT_TRUE(history->empty());

    guard.release();
    auto result = synchronizer_->sync(makeGroup(), AdvancedSyncOptions());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->filesCopied, 1u);
    EXPECT_FALSE(locks_.isLocked("docs"));
}

TEST_F(SyncIntegrationTest, CancelledBeforeStartCopiesNothing) {
    writeFile(masterDir_ / "a.txt", "alpha");

    CancellationToken token;
    token.cancel();
    auto result = synchronizer_->sync(makeGroup(), AdvancedSyncOptions(), SyncKind::Manual, &token);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->status, OperationStatus::Cancelled);
    EXPECT_EQ(result->filesCopied, 0u);
    EXPECT_EQ(result->filesSkipped, 1u);
    EXPECT_EQ(result->filesFailed, 0u);
    EXPECT_FALSE(fs::exists(backupDir_ / "a.txt"));

    auto history = store_->history("docs");
    ASSERT_TRUE(history.ok());
    ASSERT_EQ(history->size(), 1u);
    EXPECT_EQ(history->front().status, OperationStatus::Cancelled);
}

TEST_F(SyncIntegrationTest, CancelMidTransferSkipsTheRest) {
    for (int i = 0; i < 10; ++i) {
        writeFile(masterDir_ / ("file" + std::to_string(i) + ".txt"), "payload " + std::to_string(i));
    }

    CancellationToken token;
    AdvancedSyncOptions options;
    options.onProgress = [&token](size_t processed, size_t) {
        if (processed == 3) {
            token.cancel();
        }
    };

    auto result = synchronizer_->sync(makeGroup(), options, SyncKind::Manual, &token);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->status, OperationStatus::Cancelled);
    EXPECT_EQ(result->filesCopied, 3u);
    EXPECT_EQ(result->filesSkipped, 7u);

    // Completed copies stay tracked; the next run picks up the rest
    auto next = synchronizer_->sync(makeGroup(), AdvancedSyncOptions());
    ASSERT_TRUE(next.ok());
    EXPECT_EQ(next->filesCopied, 7u);
}

TEST_F(SyncIntegrationTest, CancelDuringFirstBackupSkipsTheOthers) {
    const fs::path second = testDir_ / "backup2";
    fs::create_directories(second);
    for (int i = 0; i < 10; ++i) {
        writeFile(masterDir_ / ("file" + std::to_string(i) + ".txt"), "payload " + std::to_string(i));
    }

    StorageGroup group = makeGroup();
    group.backupPaths.push_back(second);

    CancellationToken token;
    AdvancedSyncOptions options;
    options.onProgress = [&token](size_t processed, size_t) {
        if (processed == 3) {
            token.cancel();
        }
    };

    auto result = synchronizer_->sync(group, options, SyncKind::Manual, &token);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->status, OperationStatus::Cancelled);
    EXPECT_EQ(result->filesCopied, 3u);
    // 7 left in the first backup plus all 10 for the backup never planned
    EXPECT_EQ(result->filesSkipped, 17u);
    EXPECT_EQ(result->filesFailed, 0u);
    EXPECT_TRUE(fs::is_empty(second));
}

TEST_F(SyncIntegrationTest, PhasesAndProgressAreReported) {
    writeFile(masterDir_ / "a.txt", "alpha");
    writeFile(masterDir_ / "b.txt", "bravo");
    writeFile(masterDir_ / "c.txt", "charlie");

    std::vector<SyncPhase> phases;
    std::vector<std::pair<size_t, size_t>> progress;
    AdvancedSyncOptions options;
    options.onPhase = [&phases](SyncPhase phase) { phases.push_back(phase); };
    options.onProgress = [&progress](size_t processed, size_t total) { progress.emplace_back(processed, total); };

    ASSERT_TRUE(synchronizer_->sync(makeGroup(), options).ok());

    const std::vector<SyncPhase> expected{SyncPhase::Scanning, SyncPhase::ConflictDetection,
                                          SyncPhase::Transferring, SyncPhase::UpdatingStore, SyncPhase::Idle};
    EXPECT_EQ(phases, expected);
    ASSERT_EQ(progress.size(), 3u);
    EXPECT_EQ(progress.back(), std::make_pair(size_t{3}, size_t{3}));
}

TEST_F(SyncIntegrationTest, ParallelTransfersCopyEverything) {
    for (int i = 0; i < 24; ++i) {
        writeFile(masterDir_ / ("dir" + std::to_string(i % 4)) / ("f" + std::to_string(i)),
                  std::string(1000 + i, static_cast<char>('a' + i % 26)));
    }

    std::atomic<size_t> ticks{0};
    AdvancedSyncOptions options;
    options.parallelFiles = 4;
    options.onProgress = [&ticks](size_t, size_t) { ticks++; };

    auto result = synchronizer_->sync(makeGroup(), options);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->filesCopied, 24u);
    EXPECT_EQ(ticks.load(), 24u);
    EXPECT_EQ(readFile(backupDir_ / "dir3" / "f23"), std::string(1023, 'x'));
}

TEST_F(SyncIntegrationTest, ExcludedFilesAreNotCopied) {
    writeFile(masterDir_ / "src" / "main.cpp", "int main() {}");
    writeFile(masterDir_ / "src" / "main.o", "object");
    writeFile(masterDir_ / "build" / "output.bin", "binary");
    writeFile(masterDir_ / "half.dsync-tmp", "in flight");

    AdvancedSyncOptions options;
    options.excludePatterns = {"*.o", "build/"};
    auto result = synchronizer_->sync(makeGroup(), options);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->filesCopied, 1u);
    EXPECT_TRUE(fs::exists(backupDir_ / "src" / "main.cpp"));
    EXPECT_FALSE(fs::exists(backupDir_ / "src" / "main.o"));
    EXPECT_FALSE(fs::exists(backupDir_ / "build"));
    EXPECT_FALSE(fs::exists(backupDir_ / "half.dsync-tmp"));
}

TEST_F(SyncIntegrationTest, EveryBackupGetsItsOwnTrackingScope) {
    const fs::path second = testDir_ / "backup2";
    fs::create_directories(second);
    writeFile(masterDir_ / "a.txt", "alpha");

    StorageGroup group = makeGroup();
    group.backupPaths.push_back(second);

    auto result = synchronizer_->sync(group, AdvancedSyncOptions());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->filesCopied, 2u);
    EXPECT_EQ(readFile(backupDir_ / "a.txt"), "alpha");
    EXPECT_EQ(readFile(second / "a.txt"), "alpha");

    auto first = store_->lookup("docs", "a.txt");
    auto other = store_->lookup("docs#1", "a.txt");
    ASSERT_TRUE(first.ok() && first->has_value());
    ASSERT_TRUE(other.ok() && other->has_value());

    // Only the second backup falls behind
    fs::remove(second / "a.txt");
    auto again = synchronizer_->sync(group, AdvancedSyncOptions());
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again->filesCopied, 1u);
    EXPECT_TRUE(fs::exists(second / "a.txt"));
}

TEST_F(SyncIntegrationTest, BackupNestedInsideMasterIsNotScanned) {
    const fs::path nested = masterDir_ / ".mirror";
    fs::create_directories(nested);
    writeFile(masterDir_ / "a.txt", "alpha");

    StorageGroup group = makeGroup();
    group.backupPaths = {nested};

    auto result = synchronizer_->sync(group, AdvancedSyncOptions());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->filesCopied, 1u);

    auto again = synchronizer_->sync(group, AdvancedSyncOptions());
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again->filesCopied, 0u);
    EXPECT_FALSE(fs::exists(nested / ".mirror"));
}

TEST_F(SyncIntegrationTest, EncryptedCompressedBackupRestores) {
    const std::string text(20000, 'q');
    writeFile(masterDir_ / "ledger.csv", text);
    writeFile(masterDir_ / "photos" / "trip.txt", "beach, day two");

    AdvancedSyncOptions options;
    options.compressionEnabled = true;
    options.encryptionEnabled = true;
    options.encryptionPassword = "correct horse battery staple";

    auto result = synchronizer_->sync(makeGroup(), options);
    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(result->filesCopied, 2u);
    EXPECT_GT(result->spaceSavings.spaceSaved, 0);
    EXPECT_EQ(result->spaceSavings.filesProcessed, 2u);

    const std::string stored = readFile(backupDir_ / "ledger.csv");
    EXPECT_EQ(stored.substr(0, Crypto::MAGIC_SIZE), "DSE1");
    EXPECT_LT(stored.size(), text.size());

    // Stored bytes are decoded before comparing
    auto again = synchronizer_->sync(makeGroup(), options);
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again->filesCopied, 0u);

    auto verified = synchronizer_->verifyStatus(makeGroup(), options);
    ASSERT_TRUE(verified.ok());
    ASSERT_EQ(verified->size(), 1u);
    EXPECT_TRUE(verified->front().consistent());
    EXPECT_EQ(verified->front().inSync.size(), 2u);

    fs::remove_all(masterDir_);
    fs::create_directories(masterDir_);

    auto restored = synchronizer_->restore(makeGroup(), 0, options);
    ASSERT_TRUE(restored.ok()) << restored.error().message;
    EXPECT_EQ(restored->filesCopied, 2u);
    EXPECT_EQ(readFile(masterDir_ / "ledger.csv"), text);
    EXPECT_EQ(readFile(masterDir_ / "photos" / "trip.txt"), "beach, day two");
}

TEST_F(SyncIntegrationTest, WrongPasswordMakesBackupUnreadable) {
    writeFile(masterDir_ / "secret.txt", "launch codes");

    AdvancedSyncOptions options;
    options.encryptionEnabled = true;
    options.encryptionPassword = "right";
    ASSERT_TRUE(synchronizer_->sync(makeGroup(), options).ok());

    AdvancedSyncOptions wrong = options;
    wrong.encryptionPassword = "wrong";
    wrong.incremental = false;
    auto verified = synchronizer_->verifyStatus(makeGroup(), wrong);
    ASSERT_TRUE(verified.ok());
    ASSERT_EQ(verified->front().unreadable.size(), 1u);
    EXPECT_FALSE(verified->front().consistent());

    // Unreadable files are counted as failures and never overwritten
    auto result = synchronizer_->sync(makeGroup(), wrong);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->filesFailed, 1u);
    EXPECT_EQ(result->filesCopied, 0u);
}

TEST_F(SyncIntegrationTest, RestoreLeavesIdenticalFilesAlone) {
    writeFile(masterDir_ / "same.txt", "unchanged");
    writeFile(masterDir_ / "lost.txt", "will be deleted");
    ASSERT_TRUE(synchronizer_->sync(makeGroup(), AdvancedSyncOptions()).ok());
    fs::remove(masterDir_ / "lost.txt");

    auto restored = synchronizer_->restore(makeGroup(), 0, AdvancedSyncOptions());
    ASSERT_TRUE(restored.ok());
    EXPECT_EQ(restored->filesCopied, 1u);
    EXPECT_EQ(restored->filesSkipped, 1u);
    EXPECT_EQ(readFile(masterDir_ / "lost.txt"), "will be deleted");

    auto missing = synchronizer_->restore(makeGroup(), 3, AdvancedSyncOptions());
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidArgument);
}

TEST_F(SyncIntegrationTest, VerifyReportsEveryDifference) {
    writeFile(masterDir_ / "both.txt", "same");
    writeFile(masterDir_ / "master_only.txt", "m");
    writeFile(masterDir_ / "changed.txt", "master side");
    writeFile(backupDir_ / "both.txt", "same");
    writeFile(backupDir_ / "backup_only.txt", "b");
    writeFile(backupDir_ / "changed.txt", "backup side");

    auto verified = synchronizer_->verifyStatus(makeGroup(), AdvancedSyncOptions());
    ASSERT_TRUE(verified.ok());
    ASSERT_EQ(verified->size(), 1u);
    const VerifyReport& report = verified->front();
    EXPECT_FALSE(report.consistent());
    EXPECT_EQ(report.inSync, std::vector<std::string>{"both.txt"});
    EXPECT_EQ(report.masterOnly, std::vector<std::string>{"master_only.txt"});
    EXPECT_EQ(report.backupOnly, std::vector<std::string>{"backup_only.txt"});
    EXPECT_EQ(report.differing, std::vector<std::string>{"changed.txt"});

    // Read-only: nothing copied, nothing recorded
    EXPECT_FALSE(fs::exists(backupDir_ / "master_only.txt"));
    auto history = store_->history("docs");
    ASSERT_TRUE(history.ok());
    EXPECT_TRUE(history->empty());
}

TEST_F(SyncIntegrationTest, ClearTrackingForgetsTheGroup) {
    writeFile(masterDir_ / "a.txt", "alpha");
    writeFile(masterDir_ / "b.txt", "bravo");
    ASSERT_TRUE(synchronizer_->sync(makeGroup(), AdvancedSyncOptions()).ok());

    {
        auto guard = locks_.tryAcquire("docs");
        auto busy = synchronizer_->clearTracking("docs");
        ASSERT_FALSE(busy.ok());
        EXPECT_EQ(busy.error().code, ErrorCode::Locked);
    }

    auto cleared = synchronizer_->clearTracking("docs");
    ASSERT_TRUE(cleared.ok());
    EXPECT_EQ(*cleared, 2);

    auto baseline = store_->baseline("docs");
    ASSERT_TRUE(baseline.ok());
    EXPECT_TRUE(baseline->empty());
    auto history = store_->history("docs");
    ASSERT_TRUE(history.ok());
    EXPECT_TRUE(history->empty());

    // Untracked identical pairs are only recorded, not copied again
    auto result = synchronizer_->sync(makeGroup(), AdvancedSyncOptions());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->filesCopied, 0u);
    EXPECT_EQ(result->filesSkipped, 2u);
}

TEST_F(SyncIntegrationTest, MissingRootFailsTheOperation) {
    StorageGroup group = makeGroup();
    group.masterPath = testDir_ / "unplugged";

    auto result = synchronizer_->sync(group, AdvancedSyncOptions());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::IOFault);
    EXPECT_FALSE(locks_.isLocked("docs"));

    auto history = store_->history("docs");
    ASSERT_TRUE(history.ok());
    ASSERT_EQ(history->size(), 1u);
    EXPECT_EQ(history->front().status, OperationStatus::Failed);
    EXPECT_FALSE(history->front().errorMessage.empty());
}

TEST_F(SyncIntegrationTest, InvalidGroupsAreRejected) {
    StorageGroup hashed = makeGroup();
    hashed.id = "docs#2";
    auto result = synchronizer_->sync(hashed, AdvancedSyncOptions());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);

    StorageGroup noBackups = makeGroup();
    noBackups.backupPaths.clear();
    EXPECT_EQ(synchronizer_->sync(noBackups, AdvancedSyncOptions()).error().code, ErrorCode::InvalidArgument);

    StorageGroup sameRoot = makeGroup();
    sameRoot.backupPaths = {masterDir_};
    EXPECT_EQ(synchronizer_->sync(sameRoot, AdvancedSyncOptions()).error().code, ErrorCode::InvalidArgument);

    AdvancedSyncOptions noSecret;
    noSecret.encryptionEnabled = true;
    EXPECT_EQ(synchronizer_->sync(makeGroup(), noSecret).error().code, ErrorCode::InvalidArgument);
}

TEST_F(SyncIntegrationTest, UnreadableMasterDirectoryKeepsBackupCopies) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission bits do not restrict root";
    }
    writeFile(masterDir_ / "open" / "a.txt", "alpha");
    writeFile(masterDir_ / "private" / "secret.txt", "keep me");
    ASSERT_TRUE(synchronizer_->sync(makeGroup(), AdvancedSyncOptions()).ok());
    ASSERT_EQ(readFile(backupDir_ / "private" / "secret.txt"), "keep me");

    writeFile(masterDir_ / "open" / "a.txt", "alpha edited");
    {
        LockedDirectory locked(masterDir_ / "private");
        auto result = synchronizer_->sync(makeGroup(), AdvancedSyncOptions());
        ASSERT_TRUE(result.ok()) << result.error().message;
        EXPECT_EQ(result->status, OperationStatus::Completed);
        EXPECT_EQ(result->filesCopied, 1u);
        EXPECT_EQ(result->filesDeleted, 0u);
        EXPECT_EQ(result->filesFailed, 1u);
    }

    // Neither the backup copy nor its tracking record was touched
    EXPECT_EQ(readFile(backupDir_ / "private" / "secret.txt"), "keep me");
    EXPECT_EQ(readFile(backupDir_ / "open" / "a.txt"), "alpha edited");
    auto record = store_->lookup("docs", "private/secret.txt");
    ASSERT_TRUE(record.ok());
    EXPECT_TRUE(record->has_value());

    auto next = synchronizer_->sync(makeGroup(), AdvancedSyncOptions());
    ASSERT_TRUE(next.ok());
    EXPECT_EQ(next->filesFailed, 0u);
    EXPECT_EQ(next->filesCopied, 0u);
}

TEST_F(SyncIntegrationTest, UnreadableMasterPathCountsOnceAcrossBackups) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission bits do not restrict root";
    }
    const fs::path second = testDir_ / "backup2";
    fs::create_directories(second);
    writeFile(masterDir_ / "a.txt", "alpha");
    writeFile(masterDir_ / "private" / "secret.txt", "keep me");

    StorageGroup group = makeGroup();
    group.backupPaths.push_back(second);

    LockedDirectory locked(masterDir_ / "private");
    auto result = synchronizer_->sync(group, AdvancedSyncOptions());
    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(result->filesCopied, 2u);
    EXPECT_EQ(result->filesFailed, 1u);
    EXPECT_FALSE(fs::exists(second / "private"));
}

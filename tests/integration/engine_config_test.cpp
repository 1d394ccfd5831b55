/**
 * @file engine_config_test.cpp
 * @brief Group definitions read from configuration and activated on a SyncEngine
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "Config.h"
#include "DatabaseManager.h"
#include "ProcessIdentity.h"
#include "SyncEngine.h"

using namespace DriveSync;

namespace fs = std::filesystem;

namespace {

class NullWatcher : public IFileWatcher {
public:
    bool initialize(EventCallback) override { return true; }
    void shutdown() override {}
    bool addWatch(const std::string&, const std::vector<std::string>&) override { return true; }
    bool removeWatch(const std::string&) override { return true; }
};

bool mentions(const Error& error, const std::string& text) {
    return error.message.find(text) != std::string::npos;
}

} // namespace

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() /
                   ("drivesync_engine_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::error_code ec;
        fs::remove_all(testDir_, ec);
        fs::create_directories(testDir_ / "master");
        fs::create_directories(testDir_ / "usb");
        fs::create_directories(testDir_ / "nas");

        config_.set("group.docs.master", (testDir_ / "master").string());
        config_.set("group.docs.backups", (testDir_ / "usb").string() + ", " + (testDir_ / "nas").string());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    EngineConfig engineConfig() const {
        EngineConfig config;
        config.databasePath = (testDir_ / "tracking.db").string();
        config.watcherFactory = []() { return std::unique_ptr<IFileWatcher>(new NullWatcher()); };
        return config;
    }

    fs::path testDir_;
    Config config_;
};

TEST_F(EngineConfigTest, MinimalGroupUsesDefaults) {
    auto loaded = SyncEngine::loadGroup(config_, "docs");
    ASSERT_TRUE(loaded.ok()) << loaded.error().message;

    const GroupDefinition& definition = *loaded;
    EXPECT_EQ(definition.group.id, "docs");
    EXPECT_EQ(definition.group.masterPath, testDir_ / "master");
    ASSERT_EQ(definition.group.backupPaths.size(), 2u);
    EXPECT_EQ(definition.group.backupPaths[1], testDir_ / "nas");
    EXPECT_EQ(definition.group.mode, SyncMode::MasterToBackup);
    EXPECT_TRUE(definition.schedule.empty());
    EXPECT_EQ(definition.interval.count(), 0);
    EXPECT_FALSE(definition.realtime);
    EXPECT_EQ(definition.debounce, RealtimeController::DEFAULT_DEBOUNCE);
    EXPECT_TRUE(definition.options.incremental);
    EXPECT_FALSE(definition.options.compressionEnabled);
}

TEST_F(EngineConfigTest, GroupOverridesLayerOverGlobalOptions) {
    config_.set("sync.compression", "true");
    config_.set("sync.compression_level", "3");
    config_.set("sync.exclude", "*.tmp");
    config_.set("group.docs.sync.compression_level", "9");
    config_.set("group.docs.sync.exclude", "*.bak, build/");

    config_.set("group.music.master", (testDir_ / "nas").string());
    config_.set("group.music.backups", (testDir_ / "usb").string());

    auto groups = SyncEngine::loadGroups(config_);
    ASSERT_TRUE(groups.ok()) << groups.error().message;
    ASSERT_EQ(groups->size(), 2u);

    const GroupDefinition& docs = (*groups)[0];
    EXPECT_EQ(docs.group.id, "docs");
    EXPECT_TRUE(docs.options.compressionEnabled);
    EXPECT_EQ(docs.options.compressionLevel, 9);
    EXPECT_EQ(docs.options.excludePatterns, (std::vector<std::string>{"*.bak", "build/"}));

    const GroupDefinition& music = (*groups)[1];
    EXPECT_EQ(music.group.id, "music");
    EXPECT_TRUE(music.options.compressionEnabled);
    EXPECT_EQ(music.options.compressionLevel, 3);
    EXPECT_EQ(music.options.excludePatterns, std::vector<std::string>{"*.tmp"});
}

TEST_F(EngineConfigTest, SchedulesAndTriggers) {
    config_.set("group.docs.mode", "bidirectional");
    config_.set("group.docs.schedule", "*/10 * * * *");
    config_.set("group.docs.realtime", "true");
    config_.set("group.docs.debounce_ms", "750");

    auto cron = SyncEngine::loadGroup(config_, "docs");
    ASSERT_TRUE(cron.ok());
    EXPECT_EQ(cron->group.mode, SyncMode::Bidirectional);
    EXPECT_EQ(cron->schedule, "*/10 * * * *");
    EXPECT_TRUE(cron->realtime);
    EXPECT_EQ(cron->debounce, std::chrono::milliseconds(750));

    config_.set("group.docs.schedule", "daily at 2 am");
    auto daily = SyncEngine::loadGroup(config_, "docs");
    ASSERT_TRUE(daily.ok());
    EXPECT_EQ(daily->schedule, "0 2 * * *");

    config_.set("group.docs.schedule", "every 2 hours");
    auto every = SyncEngine::loadGroup(config_, "docs");
    ASSERT_TRUE(every.ok());
    EXPECT_TRUE(every->schedule.empty());
    EXPECT_EQ(every->interval, std::chrono::minutes(120));

    config_.set("group.docs.schedule", "");
    config_.set("group.docs.interval_minutes", "15");
    auto interval = SyncEngine::loadGroup(config_, "docs");
    ASSERT_TRUE(interval.ok());
    EXPECT_EQ(interval->interval, std::chrono::minutes(15));
}

TEST_F(EngineConfigTest, InvalidValuesNameTheKey) {
    Config badMode = config_;
    badMode.set("group.docs.mode", "sideways");
    auto mode = SyncEngine::loadGroup(badMode, "docs");
    ASSERT_FALSE(mode.ok());
    EXPECT_EQ(mode.error().code, ErrorCode::ConfigError);
    EXPECT_TRUE(mentions(mode.error(), "group.docs.mode"));

    Config badSchedule = config_;
    badSchedule.set("group.docs.schedule", "whenever you like");
    auto schedule = SyncEngine::loadGroup(badSchedule, "docs");
    ASSERT_FALSE(schedule.ok());
    EXPECT_TRUE(mentions(schedule.error(), "group.docs.schedule"));

    Config badInterval = config_;
    badInterval.set("group.docs.interval_minutes", "0");
    auto interval = SyncEngine::loadGroup(badInterval, "docs");
    ASSERT_FALSE(interval.ok());
    EXPECT_TRUE(mentions(interval.error(), "group.docs.interval_minutes"));

    Config badDebounce = config_;
    badDebounce.set("group.docs.debounce_ms", "-5");
    auto debounce = SyncEngine::loadGroup(badDebounce, "docs");
    ASSERT_FALSE(debounce.ok());
    EXPECT_TRUE(mentions(debounce.error(), "group.docs.debounce_ms"));

    Config badOverride = config_;
    badOverride.set("group.docs.sync.compression_level", "12");
    auto level = SyncEngine::loadGroup(badOverride, "docs");
    ASSERT_FALSE(level.ok());
    EXPECT_EQ(level.error().code, ErrorCode::ConfigError);
    EXPECT_TRUE(mentions(level.error(), "compression_level"));

    Config noBackups = config_;
    noBackups.set("group.docs.backups", "");
    auto backups = SyncEngine::loadGroup(noBackups, "docs");
    ASSERT_FALSE(backups.ok());
    EXPECT_EQ(backups.error().code, ErrorCode::ConfigError);

    Config malformed = config_;
    malformed.set("group.orphan", "value");
    auto groups = SyncEngine::loadGroups(malformed);
    ASSERT_FALSE(groups.ok());
    EXPECT_TRUE(mentions(groups.error(), "group.orphan"));
}

TEST_F(EngineConfigTest, ActivateRegistersScheduleAndWatch) {
    config_.set("group.docs.interval_minutes", "60");
    config_.set("group.docs.realtime", "true");
    auto definition = SyncEngine::loadGroup(config_, "docs");
    ASSERT_TRUE(definition.ok());

    SyncEngine engine(engineConfig());
    auto early = engine.activate(*definition);
    ASSERT_FALSE(early.ok());
    EXPECT_EQ(early.error().code, ErrorCode::InternalError);

    ASSERT_TRUE(engine.initialize().ok());
    EXPECT_TRUE(engine.isInitialized());

    auto ids = engine.activate(*definition);
    ASSERT_TRUE(ids.ok()) << ids.error().message;
    EXPECT_EQ(ids->first, "docs.schedule");
    EXPECT_EQ(ids->second, "docs:1");

    auto schedule = engine.scheduler().get("docs.schedule");
    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->interval, std::chrono::minutes(60));
    ASSERT_EQ(engine.realtime().list().size(), 1u);
    EXPECT_EQ(engine.realtime().list()[0].debounce, RealtimeController::DEFAULT_DEBOUNCE);

    // A second activation of the same group collides on the schedule id
    auto again = engine.activate(*definition);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidArgument);

    engine.shutdown();
    EXPECT_TRUE(engine.realtime().list().empty());
    EXPECT_FALSE(engine.scheduler().isRunning());
}

TEST_F(EngineConfigTest, EngineRunsManualSyncs) {
    {
        std::ofstream file(testDir_ / "master" / "a.txt");
        file << "alpha";
    }
    auto definition = SyncEngine::loadGroup(config_, "docs");
    ASSERT_TRUE(definition.ok());

    SyncEngine engine(engineConfig());
    ASSERT_TRUE(engine.initialize().ok());

    auto result = engine.synchronizer().sync(definition->group, definition->options);
    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(result->filesCopied, 2u);
    EXPECT_TRUE(fs::exists(testDir_ / "usb" / "a.txt"));
    EXPECT_TRUE(fs::exists(testDir_ / "nas" / "a.txt"));

    auto history = engine.store().history("docs");
    ASSERT_TRUE(history.ok());
    EXPECT_EQ(history->size(), 1u);
}

TEST_F(EngineConfigTest, StartupRecoversInterruptedOperations) {
    const std::string dbPath = (testDir_ / "tracking.db").string();
    int64_t orphan = 0;
    {
        ChangeTrackingStore store(dbPath);
        ASSERT_TRUE(store.open().ok());
        auto started = store.startOperation("docs", SyncKind::Scheduled);
        ASSERT_TRUE(started.ok());
        orphan = *started;
    }
    {
        // Owned by an earlier process that held this pid
        DatabaseManager db(dbPath);
        ASSERT_TRUE(db.initialize());
        db.execute("UPDATE sync_operations SET owner_start = 1, owner_pid = " +
                   std::to_string(ProcessIdentity::current().pid) + " WHERE id = " + std::to_string(orphan));
    }

    EngineConfig config = engineConfig();
    config.recoverInterrupted = true;
    SyncEngine engine(config);
    ASSERT_TRUE(engine.initialize().ok());

    auto operation = engine.store().operation(orphan);
    ASSERT_TRUE(operation.ok());
    ASSERT_TRUE(operation->has_value());
    EXPECT_EQ((*operation)->status, OperationStatus::Failed);

    // The group is free for a new run
    auto next = engine.store().startOperation("docs", SyncKind::Manual);
    EXPECT_TRUE(next.ok());
}

TEST_F(EngineConfigTest, StartupKeepsOperationsOfLiveProcesses) {
    const std::string dbPath = (testDir_ / "tracking.db").string();
    ChangeTrackingStore other(dbPath);
    ASSERT_TRUE(other.open().ok());
    auto running = other.startOperation("docs", SyncKind::Scheduled);
    ASSERT_TRUE(running.ok());

    EngineConfig config = engineConfig();
    config.recoverInterrupted = true;
    SyncEngine engine(config);
    ASSERT_TRUE(engine.initialize().ok());

    auto operation = engine.store().operation(*running);
    ASSERT_TRUE(operation.ok() && operation->has_value());
    EXPECT_EQ((*operation)->status, OperationStatus::Running);

    auto blocked = engine.store().startOperation("docs", SyncKind::Manual);
    ASSERT_FALSE(blocked.ok());
    EXPECT_EQ(blocked.error().code, ErrorCode::Locked);
}

TEST_F(EngineConfigTest, EnginesDoNotShareLocks) {
    EngineConfig firstConfig = engineConfig();
    EngineConfig secondConfig = engineConfig();
    secondConfig.databasePath = (testDir_ / "other.db").string();

    SyncEngine first(firstConfig);
    SyncEngine second(secondConfig);
    ASSERT_TRUE(first.initialize().ok());
    ASSERT_TRUE(second.initialize().ok());

    auto guard = first.locks().tryAcquire("docs");
    ASSERT_TRUE(guard.owns());
    EXPECT_TRUE(first.locks().isLocked("docs"));
    EXPECT_FALSE(second.locks().isLocked("docs"));
}

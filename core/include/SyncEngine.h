#pragma once

#include "AdvancedSyncOptions.h"
#include "ChangeTrackingStore.h"
#include "Config.h"
#include "ConflictResolver.h"
#include "GroupLockRegistry.h"
#include "INotificationSink.h"
#include "RealtimeController.h"
#include "Result.h"
#include "ScheduledController.h"
#include "Synchronizer.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace DriveSync {

/**
 * @brief Startup settings for a SyncEngine
 */
struct EngineConfig {
    std::string databasePath;
    size_t schedulerWorkers = 2;
    bool recoverInterrupted = false;          // Fail operations left running by a dead process
    INotificationSink* sink = nullptr;        // Null: log notifications
    RealtimeController::WatcherFactory watcherFactory;  // Null: inotify
};

/**
 * @brief A group as declared in configuration, with its triggers
 *
 *   group.<id>.master       master root
 *   group.<id>.backups      comma-separated backup roots
 *   group.<id>.mode         bidirectional | master_to_backup | backup_to_master
 *   group.<id>.schedule     cron expression or friendly phrase ("daily at 2 am")
 *   group.<id>.interval_minutes
 *   group.<id>.realtime     true to watch the master root
 *   group.<id>.debounce_ms
 *   group.<id>.sync.*       overrides of the global sync.* options
 */
struct GroupDefinition {
    StorageGroup group;
    AdvancedSyncOptions options;
    std::string schedule;                     // Cron form, empty if none
    std::chrono::minutes interval{0};         // 0 if none
    bool realtime = false;
    std::chrono::milliseconds debounce = RealtimeController::DEFAULT_DEBOUNCE;
};

/**
 * @brief Owns every registry of a running engine.
 *
 * Store, group locks, schedules and watches live here instead of in
 * process globals, so tests can run several engines side by side.
 * Members are destroyed in reverse order: controllers stop before the
 * synchronizer and store they use.
 */
class SyncEngine {
public:
    explicit SyncEngine(EngineConfig config);
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /**
     * @brief Open the store and start the controllers
     * @return DatabaseError if the store cannot be opened
     */
    Result<void> initialize();

    /**
     * @brief Register the schedule and watch a definition asks for
     * @return ids of the created schedule and watch (empty when not requested)
     */
    Result<std::pair<std::string, std::string>> activate(const GroupDefinition& definition);

    /**
     * @brief Stop triggers; running scheduled syncs finish when @p waitForRunning
     */
    void shutdown(bool waitForRunning = true);

    bool isInitialized() const { return synchronizer_ != nullptr; }

    ChangeTrackingStore& store() { return store_; }
    GroupLockRegistry& locks() { return locks_; }
    Synchronizer& synchronizer() { return *synchronizer_; }
    ConflictResolver& resolver() { return *resolver_; }
    ScheduledController& scheduler() { return *scheduler_; }
    RealtimeController& realtime() { return *realtime_; }
    INotificationSink& sink() { return *sink_; }

    /**
     * @brief Read every group.<id>.* block of @p config
     * @return ConfigError naming the offending key
     */
    static Result<std::vector<GroupDefinition>> loadGroups(const Config& config);

    static Result<GroupDefinition> loadGroup(const Config& config, const std::string& groupId);

private:
    EngineConfig config_;
    LoggingNotificationSink loggingSink_;
    INotificationSink* sink_;

    ChangeTrackingStore store_;
    GroupLockRegistry locks_;
    std::unique_ptr<Synchronizer> synchronizer_;
    std::unique_ptr<ConflictResolver> resolver_;
    std::unique_ptr<ScheduledController> scheduler_;
    std::unique_ptr<RealtimeController> realtime_;
};

} // namespace DriveSync

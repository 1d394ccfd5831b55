#pragma once

#include "AdvancedSyncOptions.h"
#include "CancellationToken.h"
#include "CronExpression.h"
#include "Result.h"
#include "SyncTypes.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace DriveSync {

class INotificationSink;
class Synchronizer;
class WorkerPool;

/**
 * @brief Public view of a registered schedule
 */
struct ScheduleInfo {
    enum class Type { Interval, Cron };

    std::string id;
    std::string groupId;
    Type type = Type::Interval;
    std::chrono::milliseconds interval{0};
    std::string cronExpression;
    bool enabled = true;
    bool running = false;
    std::optional<std::chrono::system_clock::time_point> lastRun;
    std::optional<std::chrono::system_clock::time_point> nextRun;
    uint64_t runs = 0;
    uint64_t skippedFires = 0;
};

/**
 * @brief Timer/cron driven invocation of Synchronizer::sync().
 *
 * A single timer thread sleeps until the earliest due schedule and hands
 * the fire to a WorkerPool thread. A fire is skipped (and logged) while
 * the previous run of the same schedule is still going; a fire that finds
 * the group locked by another operation is skipped the same way. Job
 * failures are reported to the notification sink and never stop the timer.
 */
class ScheduledController {
public:
    /**
     * @param sink May be null
     * @param workers Threads for running fired schedules
     */
    ScheduledController(Synchronizer& synchronizer, INotificationSink* sink, size_t workers = 2);
    ~ScheduledController();

    ScheduledController(const ScheduledController&) = delete;
    ScheduledController& operator=(const ScheduledController&) = delete;

    /**
     * @return InvalidArgument for a duplicate id or non-positive interval
     */
    Result<ScheduleInfo> addIntervalSchedule(const std::string& id, const StorageGroup& group,
                                             std::chrono::milliseconds interval,
                                             AdvancedSyncOptions options = AdvancedSyncOptions());

    /**
     * @return ScheduleFault for an invalid expression, InvalidArgument for a duplicate id
     */
    Result<ScheduleInfo> addCronSchedule(const std::string& id, const StorageGroup& group,
                                         const std::string& expression,
                                         AdvancedSyncOptions options = AdvancedSyncOptions());

    Result<void> pause(const std::string& id);
    Result<void> resume(const std::string& id);

    /// A run already in progress finishes; no further fires happen
    Result<void> remove(const std::string& id);

    std::optional<ScheduleInfo> get(const std::string& id) const;
    std::vector<ScheduleInfo> list() const;

    /**
     * @brief Stop firing. With @p waitForRunning false, running syncs are cancelled.
     *
     * Blocks until workers have drained in both cases.
     */
    void shutdown(bool waitForRunning = true);

    bool isRunning() const { return !stopping_.load(); }

private:
    struct Schedule {
        ScheduleInfo info;
        StorageGroup group;
        AdvancedSyncOptions options;
        std::optional<CronExpression> cron;
    };

    Result<ScheduleInfo> add(Schedule schedule);
    std::optional<std::chrono::system_clock::time_point> computeNext(const Schedule& schedule,
                                                                     std::chrono::system_clock::time_point from) const;
    void timerLoop();
    void fire(const std::string& id);
    void execute(const std::string& id, StorageGroup group, AdvancedSyncOptions options);
    void notify(const std::string& groupId, ScheduledStatus status, const std::string& message);

    Synchronizer& synchronizer_;
    INotificationSink* sink_;
    std::unique_ptr<WorkerPool> workers_;
    CancellationToken cancel_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::map<std::string, Schedule> schedules_;
    std::atomic<bool> stopping_{false};
    std::thread timer_;
};

} // namespace DriveSync

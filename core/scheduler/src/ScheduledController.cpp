#include "ScheduledController.h"
#include "INotificationSink.h"
#include "LoggerMacros.h"
#include "Synchronizer.h"
#include "WorkerPool.h"

#include <iomanip>
#include <sstream>

namespace DriveSync {

namespace {

constexpr const char* kComponent = "ScheduledController";

std::string describeStats(const SyncStatistics& stats) {
    std::ostringstream out;
    out << "Files copied: " << stats.filesCopied
        << ", deleted: " << stats.filesDeleted
        << ", failed: " << stats.filesFailed
        << ", bytes: " << std::fixed << std::setprecision(2)
        << static_cast<double>(stats.bytesCopied) / (1024.0 * 1024.0) << " MB"
        << ", duration: " << std::setprecision(1) << stats.durationSeconds() << "s";
    return out.str();
}

} // namespace

ScheduledController::ScheduledController(Synchronizer& synchronizer, INotificationSink* sink, size_t workers)
    : synchronizer_(synchronizer)
    , sink_(sink)
    , workers_(std::make_unique<WorkerPool>("schedules", workers == 0 ? 1 : workers)) {
    timer_ = std::thread(&ScheduledController::timerLoop, this);
    LOG_INFO_COMP("Scheduler started with " + std::to_string(workers_->size()) + " worker(s)", kComponent);
}

ScheduledController::~ScheduledController() {
    shutdown(true);
}

Result<ScheduleInfo> ScheduledController::addIntervalSchedule(const std::string& id, const StorageGroup& group,
                                                              std::chrono::milliseconds interval,
                                                              AdvancedSyncOptions options) {
    if (interval.count() <= 0) {
        return Err<ScheduleInfo>(ErrorCode::InvalidArgument, "Interval of schedule " + id + " must be positive");
    }
    Schedule schedule;
    schedule.info.id = id;
    schedule.info.groupId = group.id;
    schedule.info.type = ScheduleInfo::Type::Interval;
    schedule.info.interval = interval;
    schedule.group = group;
    schedule.options = std::move(options);
    return add(std::move(schedule));
}

Result<ScheduleInfo> ScheduledController::addCronSchedule(const std::string& id, const StorageGroup& group,
                                                          const std::string& expression,
                                                          AdvancedSyncOptions options) {
    auto cron = CronExpression::parse(expression);
    if (!cron) {
        LOG_WARN_COMP("Rejected schedule " + id + ": " + cron.error().message, kComponent);
        return cron.error();
    }
    Schedule schedule;
    schedule.info.id = id;
    schedule.info.groupId = group.id;
    schedule.info.type = ScheduleInfo::Type::Cron;
    schedule.info.cronExpression = expression;
    schedule.group = group;
    schedule.options = std::move(options);
    schedule.cron = std::move(*cron);
    return add(std::move(schedule));
}

Result<ScheduleInfo> ScheduledController::add(Schedule schedule) {
    if (schedule.info.id.empty()) {
        return Err<ScheduleInfo>(ErrorCode::InvalidArgument, "Schedule id must not be empty");
    }
    auto valid = Synchronizer::validateGroup(schedule.group);
    if (!valid) {
        return valid.error();
    }

    ScheduleInfo info;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return Err<ScheduleInfo>(ErrorCode::ScheduleFault, "Scheduler is shut down");
        }
        if (schedules_.count(schedule.info.id)) {
            return Err<ScheduleInfo>(ErrorCode::InvalidArgument,
                                     "Schedule with id '" + schedule.info.id + "' already exists");
        }
        schedule.info.nextRun = computeNext(schedule, std::chrono::system_clock::now());
        if (!schedule.info.nextRun) {
            return Err<ScheduleInfo>(ErrorCode::ScheduleFault,
                                     "Schedule " + schedule.info.id + " has no upcoming run");
        }
        info = schedule.info;
        schedules_.emplace(info.id, std::move(schedule));
    }
    wake_.notify_all();

    LOG_INFO_COMP("Added " + std::string(info.type == ScheduleInfo::Type::Cron ? "cron" : "interval") +
                  " schedule " + info.id + " for group " + info.groupId +
                  (info.type == ScheduleInfo::Type::Cron
                       ? " (" + info.cronExpression + ")"
                       : " (every " + std::to_string(info.interval.count()) + " ms)"), kComponent);
    return info;
}

std::optional<std::chrono::system_clock::time_point> ScheduledController::computeNext(
    const Schedule& schedule, std::chrono::system_clock::time_point from) const {
    if (schedule.cron) {
        return schedule.cron->nextAfter(from);
    }
    return from + schedule.info.interval;
}

Result<void> ScheduledController::pause(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schedules_.find(id);
    if (it == schedules_.end()) {
        return Err(ErrorCode::NotFound, "Schedule '" + id + "' not found");
    }
    it->second.info.enabled = false;
    it->second.info.nextRun.reset();
    LOG_INFO_COMP("Paused schedule " + id, kComponent);
    return Ok();
}

Result<void> ScheduledController::resume(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = schedules_.find(id);
        if (it == schedules_.end()) {
            return Err(ErrorCode::NotFound, "Schedule '" + id + "' not found");
        }
        it->second.info.enabled = true;
        it->second.info.nextRun = computeNext(it->second, std::chrono::system_clock::now());
    }
    wake_.notify_all();
    LOG_INFO_COMP("Resumed schedule " + id, kComponent);
    return Ok();
}

Result<void> ScheduledController::remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (schedules_.erase(id) == 0) {
            return Err(ErrorCode::NotFound, "Schedule '" + id + "' not found");
        }
    }
    wake_.notify_all();
    LOG_INFO_COMP("Removed schedule " + id, kComponent);
    return Ok();
}

std::optional<ScheduleInfo> ScheduledController::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schedules_.find(id);
    if (it == schedules_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

std::vector<ScheduleInfo> ScheduledController::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ScheduleInfo> infos;
    infos.reserve(schedules_.size());
    for (const auto& entry : schedules_) {
        infos.push_back(entry.second.info);
    }
    return infos;
}

void ScheduledController::shutdown(bool waitForRunning) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.exchange(true)) {
            return;
        }
    }
    wake_.notify_all();
    if (timer_.joinable()) {
        timer_.join();
    }
    if (!waitForRunning) {
        cancel_.cancel();
    }
    if (size_t running = workers_->pending()) {
        LOG_INFO_COMP("Waiting for " + std::to_string(running) + " scheduled run(s) to finish", kComponent);
    }
    workers_->close();
    LOG_INFO_COMP("Scheduler stopped", kComponent);
}

void ScheduledController::timerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        const auto now = std::chrono::system_clock::now();
        std::optional<std::chrono::system_clock::time_point> earliest;
        std::vector<std::string> due;

        for (auto& entry : schedules_) {
            auto& info = entry.second.info;
            if (!info.enabled || !info.nextRun) {
                continue;
            }
            if (*info.nextRun <= now) {
                due.push_back(entry.first);
                info.nextRun = computeNext(entry.second, now);
            }
            if (info.nextRun && (!earliest || *info.nextRun < *earliest)) {
                earliest = info.nextRun;
            }
        }

        if (!due.empty()) {
            lock.unlock();
            for (const auto& id : due) {
                fire(id);
            }
            lock.lock();
            continue;
        }

        if (earliest) {
            wake_.wait_until(lock, *earliest);
        } else {
            wake_.wait(lock);
        }
    }
}

void ScheduledController::fire(const std::string& id) {
    StorageGroup group;
    AdvancedSyncOptions options;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = schedules_.find(id);
        if (it == schedules_.end() || stopping_) {
            return;
        }
        auto& info = it->second.info;
        if (info.running) {
            info.skippedFires++;
            LOG_WARN_COMP("Skipping fire of " + id + ": previous run still in progress", kComponent);
            return;
        }
        info.running = true;
        info.lastRun = std::chrono::system_clock::now();
        group = it->second.group;
        options = it->second.options;
    }

    try {
        workers_->submit([this, id, group, options]() {
            execute(id, group, options);
        });
    } catch (const std::runtime_error& e) {
        LOG_WARN_COMP("Cannot run schedule " + id + ": " + e.what(), kComponent);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = schedules_.find(id);
        if (it != schedules_.end()) {
            it->second.info.running = false;
        }
    }
}

void ScheduledController::execute(const std::string& id, StorageGroup group, AdvancedSyncOptions options) {
    LOG_INFO_COMP("Executing scheduled sync " + id + " (group " + group.id + ")", kComponent);
    bool ran = false;

    try {
        notify(group.id, ScheduledStatus::Started, "Scheduled sync " + id + " started");
        auto result = synchronizer_.sync(group, options, SyncKind::Scheduled, &cancel_);

        if (!result) {
            if (result.error().code == ErrorCode::Locked) {
                LOG_WARN_COMP("Skipping scheduled sync " + id + ": group " + group.id + " is busy", kComponent);
            } else {
                ran = true;
                notify(group.id, ScheduledStatus::Failed, "Scheduled sync failed: " + result.error().message);
            }
        } else {
            ran = true;
            const SyncStatistics& stats = *result;
            if (stats.status == OperationStatus::Cancelled) {
                notify(group.id, ScheduledStatus::Failed, "Scheduled sync cancelled. " + describeStats(stats));
            } else if (stats.conflictsDetected > 0) {
                notify(group.id, ScheduledStatus::Conflict,
                       std::to_string(stats.conflictsDetected) + " conflict(s) need review. " + describeStats(stats));
            } else {
                notify(group.id, ScheduledStatus::Completed,
                       "Scheduled sync completed successfully. " + describeStats(stats));
            }
        }
    } catch (const std::exception& e) {
        ran = true;
        LOG_ERROR_COMP("Scheduled sync " + id + " failed: " + e.what(), kComponent);
        notify(group.id, ScheduledStatus::Failed, std::string("Schedule fault: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schedules_.find(id);
    if (it != schedules_.end()) {
        it->second.info.running = false;
        if (ran) {
            it->second.info.runs++;
        } else {
            it->second.info.skippedFires++;
        }
    }
}

void ScheduledController::notify(const std::string& groupId, ScheduledStatus status, const std::string& message) {
    if (!sink_) {
        return;
    }
    try {
        sink_->onScheduled(groupId, status, message);
    } catch (const std::exception& e) {
        LOG_ERROR_COMP("Notification sink failed: " + std::string(e.what()), kComponent);
    }
}

} // namespace DriveSync

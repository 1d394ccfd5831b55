#include "RealtimeController.h"
#include "INotificationSink.h"
#include "InotifyWatcher.h"
#include "LoggerMacros.h"
#include "PathUtils.h"
#include "Synchronizer.h"

namespace DriveSync {

namespace {

constexpr const char* kComponent = "RealtimeController";

// Poll interval while another operation holds the group
constexpr std::chrono::milliseconds LOCK_POLL{50};

std::unique_ptr<IFileWatcher> makeInotifyWatcher() {
    return std::make_unique<InotifyWatcher>();
}

} // namespace

RealtimeController::RealtimeController(Synchronizer& synchronizer, INotificationSink* sink, WatcherFactory factory)
    : synchronizer_(synchronizer)
    , sink_(sink)
    , factory_(factory ? std::move(factory) : WatcherFactory(makeInotifyWatcher)) {
}

RealtimeController::~RealtimeController() {
    shutdown();
}

Result<std::string> RealtimeController::enable(const StorageGroup& group,
                                               const std::filesystem::path& watchPath,
                                               std::chrono::milliseconds debounce,
                                               AdvancedSyncOptions options) {
    if (!isRunning()) {
        return Err<std::string>(ErrorCode::InternalError, "Realtime controller is shut down");
    }
    auto valid = Synchronizer::validateGroup(group);
    if (!valid) {
        return valid.error();
    }
    if (debounce.count() < 0) {
        return Err<std::string>(ErrorCode::InvalidArgument, "Debounce must not be negative");
    }

    const auto master = PathUtils::normalize(group.masterPath);
    const auto target = PathUtils::normalize(watchPath.empty() ? group.masterPath : watchPath);
    if (!PathUtils::isWithin(target, master)) {
        return Err<std::string>(ErrorCode::InvalidArgument,
                                "Watch path " + target.string() + " is outside master root " + master.string());
    }

    auto watch = std::make_unique<Watch>();
    watch->info.groupId = group.id;
    watch->info.watchPath = target;
    watch->info.debounce = debounce;
    watch->group = group;
    watch->filter = PathFilter(options.excludePatterns);
    watch->options = std::move(options);

    std::vector<std::string> excluded;
    for (const auto& backup : group.backupPaths) {
        const auto root = PathUtils::normalize(backup);
        watch->excludedRoots.push_back(root);
        excluded.push_back(root.string());
    }

    watch->watcher = factory_();
    if (!watch->watcher) {
        return Err<std::string>(ErrorCode::InternalError, "Watcher factory returned no watcher");
    }

    Watch* raw = watch.get();
    if (!watch->watcher->initialize([this, raw](const WatchEvent& event) { onEvent(*raw, event); })) {
        return Err<std::string>(ErrorCode::IOFault, "Cannot initialize file watcher for group " + group.id);
    }
    if (!watch->watcher->addWatch(target.string(), excluded)) {
        watch->watcher->shutdown();
        return Err<std::string>(ErrorCode::IOFault, "Cannot watch " + target.string());
    }

    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            watch->watcher->shutdown();
            return Err<std::string>(ErrorCode::InternalError, "Realtime controller is shut down");
        }
        id = group.id + ":" + std::to_string(nextId_++);
        watch->info.id = id;
        watch->worker = std::thread(&RealtimeController::workerLoop, this, std::ref(*raw));
        watches_.emplace(id, std::move(watch));
    }

    LOG_INFO_COMP("Realtime watch " + id + " enabled on " + target.string() +
                  " (debounce " + std::to_string(debounce.count()) + " ms)", kComponent);
    return id;
}

Result<void> RealtimeController::disable(const std::string& watchId) {
    std::unique_ptr<Watch> watch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = watches_.find(watchId);
        if (it == watches_.end()) {
            return Err(ErrorCode::NotFound, "Watch '" + watchId + "' not found");
        }
        watch = std::move(it->second);
        watches_.erase(it);
    }
    stopWatch(*watch);
    LOG_INFO_COMP("Realtime watch " + watchId + " disabled", kComponent);
    return Ok();
}

std::vector<WatchInfo> RealtimeController::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WatchInfo> infos;
    for (const auto& entry : watches_) {
        std::lock_guard<std::mutex> watchLock(entry.second->mutex);
        infos.push_back(entry.second->info);
    }
    return infos;
}

bool RealtimeController::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopped_;
}

std::optional<WatchInfo> RealtimeController::get(const std::string& watchId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = watches_.find(watchId);
    if (it == watches_.end()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> watchLock(it->second->mutex);
    return it->second->info;
}

void RealtimeController::shutdown() {
    std::map<std::string, std::unique_ptr<Watch>> watches;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        watches.swap(watches_);
    }
    if (watches.empty()) {
        return;
    }
    cancel_.cancel();
    for (auto& entry : watches) {
        stopWatch(*entry.second);
    }
    LOG_INFO_COMP("Realtime controller stopped", kComponent);
}

void RealtimeController::stopWatch(Watch& watch) {
    // Stop the event source first so no callback touches the watch afterwards
    watch.watcher->shutdown();
    {
        std::lock_guard<std::mutex> lock(watch.mutex);
        watch.stopping = true;
    }
    watch.wake.notify_all();
    if (watch.worker.joinable()) {
        watch.worker.join();
    }
}

void RealtimeController::onEvent(Watch& watch, const WatchEvent& event) {
    const std::filesystem::path path = PathUtils::normalize(event.path);
    const auto master = PathUtils::normalize(watch.group.masterPath);
    if (!PathUtils::isWithin(path, master)) {
        return;
    }
    for (const auto& root : watch.excludedRoots) {
        if (PathUtils::isWithin(path, root)) {
            return;
        }
    }
    if (PathFilter::isInternalTempName(path.filename().string())) {
        return;
    }

    const std::string relative = PathUtils::relativeKey(path, master);
    if (relative != "." && watch.filter.isExcluded(relative, event.isDirectory)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(watch.mutex);
        if (watch.stopping) {
            return;
        }
        watch.pending[event.type].insert(relative);
        watch.lastEvent = std::chrono::steady_clock::now();
        watch.info.eventsReceived++;
    }
    watch.wake.notify_all();
}

void RealtimeController::workerLoop(Watch& watch) {
    std::unique_lock<std::mutex> lock(watch.mutex);
    while (!watch.stopping) {
        if (watch.pending.empty()) {
            watch.wake.wait(lock, [&watch]() { return watch.stopping || !watch.pending.empty(); });
            continue;
        }

        // Wait until no event arrived for the whole debounce window
        const auto quietAt = watch.lastEvent + watch.info.debounce;
        if (std::chrono::steady_clock::now() < quietAt) {
            watch.wake.wait_until(lock, quietAt);
            continue;
        }

        // Defer while a sync or resolution holds the group
        if (synchronizer_.locks().isLocked(watch.group.id)) {
            watch.wake.wait_for(lock, LOCK_POLL);
            continue;
        }

        auto batch = std::move(watch.pending);
        watch.pending.clear();
        lock.unlock();

        trigger(watch, batch);

        lock.lock();
    }
}

void RealtimeController::trigger(Watch& watch, const std::map<WatchEventType, std::set<std::string>>& batch) {
    if (sink_) {
        for (const auto& entry : batch) {
            try {
                sink_->onRealtime(watch.group.id, entry.first,
                                  std::vector<std::string>(entry.second.begin(), entry.second.end()));
            } catch (const std::exception& e) {
                LOG_ERROR_COMP("Notification sink failed: " + std::string(e.what()), kComponent);
            }
        }
    }

    size_t paths = 0;
    for (const auto& entry : batch) {
        paths += entry.second.size();
    }
    LOG_INFO_COMP("Realtime sync of group " + watch.group.id + " triggered by " +
                  std::to_string(paths) + " changed path(s)", kComponent);

    auto result = synchronizer_.sync(watch.group, watch.options, SyncKind::Realtime, &cancel_);

    std::lock_guard<std::mutex> lock(watch.mutex);
    if (!result && result.error().code == ErrorCode::Locked) {
        // Lost the race for the group lock; merge back for the next window
        LOG_DEBUG_COMP_IF("Group " + watch.group.id + " became busy, re-queueing events", kComponent);
        for (const auto& entry : batch) {
            watch.pending[entry.first].insert(entry.second.begin(), entry.second.end());
        }
        watch.lastEvent = std::chrono::steady_clock::now();
        return;
    }

    watch.info.triggers++;
    if (!result) {
        LOG_ERROR_COMP("Realtime sync of group " + watch.group.id + " failed: " + result.error().message,
                       kComponent);
    } else if (result->conflictsDetected > 0) {
        LOG_WARN_COMP("Realtime sync of group " + watch.group.id + " left " +
                      std::to_string(result->conflictsDetected) + " conflict(s) for review", kComponent);
    }
}

} // namespace DriveSync

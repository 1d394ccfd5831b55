#pragma once

#include "AdvancedSyncOptions.h"
#include "CancellationToken.h"
#include "IFileWatcher.h"
#include "PathFilter.h"
#include "Result.h"
#include "SyncTypes.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace DriveSync {

class INotificationSink;
class Synchronizer;

/**
 * @brief Public view of an enabled watch
 */
struct WatchInfo {
    std::string id;
    std::string groupId;
    std::filesystem::path watchPath;
    std::chrono::milliseconds debounce{0};
    uint64_t eventsReceived = 0;
    uint64_t triggers = 0;
};

/**
 * @brief Filesystem-event-driven invocation of Synchronizer::sync().
 *
 * Each watch owns a watcher and one worker thread consuming a debounced
 * event queue: events are collected until the tree has been quiet for the
 * debounce window, then one sync runs. Events arriving while it runs go
 * into the next window. While any operation holds the group lock the
 * trigger is deferred, not dropped.
 */
class RealtimeController {
public:
    using WatcherFactory = std::function<std::unique_ptr<IFileWatcher>()>;

    static constexpr std::chrono::milliseconds DEFAULT_DEBOUNCE{2000};

    /**
     * @param sink May be null
     * @param factory Creates the watcher for each watch; inotify by default
     */
    RealtimeController(Synchronizer& synchronizer, INotificationSink* sink, WatcherFactory factory = nullptr);
    ~RealtimeController();

    RealtimeController(const RealtimeController&) = delete;
    RealtimeController& operator=(const RealtimeController&) = delete;

    /**
     * @brief Start observing @p watchPath (the master root or a directory under it).
     *
     * Backup roots of the group are excluded from observation.
     * @return watch id, InvalidArgument for a path outside the master root,
     *         IOFault if the watcher cannot start, InternalError after shutdown()
     */
    Result<std::string> enable(const StorageGroup& group,
                               const std::filesystem::path& watchPath,
                               std::chrono::milliseconds debounce = DEFAULT_DEBOUNCE,
                               AdvancedSyncOptions options = AdvancedSyncOptions());

    /**
     * @brief Stop observing; a sync already running finishes first
     */
    Result<void> disable(const std::string& watchId);

    std::vector<WatchInfo> list() const;
    std::optional<WatchInfo> get(const std::string& watchId) const;

    /// Disable every watch and cancel running syncs; no watch can be enabled afterwards
    void shutdown();

    bool isRunning() const;

private:
    struct Watch {
        WatchInfo info;
        StorageGroup group;
        AdvancedSyncOptions options;
        PathFilter filter;
        std::vector<std::filesystem::path> excludedRoots;
        std::unique_ptr<IFileWatcher> watcher;

        std::mutex mutex;
        std::condition_variable wake;
        std::map<WatchEventType, std::set<std::string>> pending;
        std::chrono::steady_clock::time_point lastEvent;
        bool stopping = false;
        std::thread worker;
    };

    void onEvent(Watch& watch, const WatchEvent& event);
    void workerLoop(Watch& watch);
    void trigger(Watch& watch, const std::map<WatchEventType, std::set<std::string>>& batch);
    void stopWatch(Watch& watch);

    Synchronizer& synchronizer_;
    INotificationSink* sink_;
    WatcherFactory factory_;
    CancellationToken cancel_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Watch>> watches_;
    uint64_t nextId_ = 1;
    bool stopped_ = false;
};

} // namespace DriveSync

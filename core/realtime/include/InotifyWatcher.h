#pragma once

#include <string>
#include <thread>
#include <atomic>
#include <map>
#include <mutex>
#include <vector>
#include "IFileWatcher.h"

namespace DriveSync {

/**
 * @brief Monitors a directory tree using inotify.
 *        Linux implementation of IFileWatcher.
 *
 * inotify is not recursive, so every subdirectory gets its own watch and
 * directories created later are added as they appear.
 */
class InotifyWatcher : public IFileWatcher {
public:
    InotifyWatcher();
    ~InotifyWatcher() override;

    // Prevent copying
    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    /**
     * @brief Initialize inotify and start monitoring thread
     */
    bool initialize(EventCallback callback) override;

    /**
     * @brief Stop monitoring and cleanup
     */
    void shutdown() override;

    bool addWatch(const std::string& root, const std::vector<std::string>& excluded) override;
    bool removeWatch(const std::string& root) override;

    size_t watchCount() const;

private:
    int inotifyFd_ = -1;
    std::thread watcherThread_;
    std::atomic<bool> running_{false};
    mutable std::mutex watchMutex_;
    std::map<int, std::string> watchDescriptors_;
    std::vector<std::string> excluded_;
    std::vector<std::string> roots_;
    EventCallback callback_;

    bool addSingleWatch(const std::string& path);
    void addWatchRecursive(const std::string& path);
    bool isExcluded(const std::string& path) const;
    std::string getWatchPath(int wd) const;

    /**
     * @brief Main monitoring loop
     */
    void monitorLoop();
};

} // namespace DriveSync

#pragma once

#include "SyncTypes.h"

#include <functional>
#include <string>
#include <vector>

namespace DriveSync {

    struct WatchEvent {
        WatchEventType type;
        std::string path;         // absolute
        bool isDirectory = false;
    };

    /**
     * @brief Filesystem watcher interface used by the RealtimeController.
     */
    class IFileWatcher {
    public:
        using EventCallback = std::function<void(const WatchEvent&)>;

        virtual ~IFileWatcher() = default;

        virtual bool initialize(EventCallback callback) = 0;
        virtual void shutdown() = 0;

        /**
         * @brief Watch @p root and every directory below it, except @p excluded subtrees
         */
        virtual bool addWatch(const std::string& root, const std::vector<std::string>& excluded) = 0;
        virtual bool removeWatch(const std::string& root) = 0;
    };

} // namespace DriveSync

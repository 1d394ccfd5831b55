#include "InotifyWatcher.h"
#include "Logger.h"
#include "PathUtils.h"
#include <sys/inotify.h>
#include <sys/select.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace DriveSync {

namespace {
constexpr uint32_t WATCH_MASK = IN_MODIFY | IN_CLOSE_WRITE | IN_CREATE | IN_DELETE |
                                IN_MOVED_TO | IN_MOVED_FROM | IN_DELETE_SELF;
}

InotifyWatcher::InotifyWatcher() = default;

InotifyWatcher::~InotifyWatcher() {
    shutdown();
}

bool InotifyWatcher::initialize(EventCallback callback) {
    auto& logger = Logger::instance();

    if (running_) {
        return true;
    }
    callback_ = std::move(callback);

    // Use non-blocking inotify
    inotifyFd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotifyFd_ < 0) {
        logger.log(LogLevel::ERROR, "Failed to initialize inotify: " + std::string(strerror(errno)), "InotifyWatcher");
        return false;
    }

    running_ = true;
    watcherThread_ = std::thread(&InotifyWatcher::monitorLoop, this);
    logger.log(LogLevel::DEBUG, "Inotify watcher initialized", "InotifyWatcher");
    return true;
}

void InotifyWatcher::shutdown() {
    running_ = false;

    if (watcherThread_.joinable()) {
        watcherThread_.join();
    }

    if (inotifyFd_ >= 0) {
        close(inotifyFd_);
        inotifyFd_ = -1;
        Logger::instance().log(LogLevel::DEBUG, "Inotify watcher shut down", "InotifyWatcher");
    }

    std::lock_guard<std::mutex> lock(watchMutex_);
    watchDescriptors_.clear();
}

bool InotifyWatcher::addWatch(const std::string& root, const std::vector<std::string>& excluded) {
    namespace fs = std::filesystem;
    auto& logger = Logger::instance();

    if (inotifyFd_ < 0) {
        logger.log(LogLevel::ERROR, "Cannot add watch - inotify not initialized", "InotifyWatcher");
        return false;
    }

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        logger.log(LogLevel::ERROR, "Cannot watch " + root + ": not a directory", "InotifyWatcher");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(watchMutex_);
        roots_.push_back(PathUtils::normalize(root).string());
        for (const auto& path : excluded) {
            excluded_.push_back(PathUtils::normalize(path).string());
        }
    }

    if (!addSingleWatch(root)) {
        return false;
    }
    addWatchRecursive(root);

    logger.log(LogLevel::INFO, "Now watching " + root + " (" + std::to_string(watchCount()) + " directories)",
               "InotifyWatcher");
    return true;
}

bool InotifyWatcher::removeWatch(const std::string& root) {
    const auto normalized = PathUtils::normalize(root);
    size_t removed = 0;

    std::lock_guard<std::mutex> lock(watchMutex_);
    for (auto it = watchDescriptors_.begin(); it != watchDescriptors_.end();) {
        if (PathUtils::isWithin(it->second, normalized)) {
            if (inotify_rm_watch(inotifyFd_, it->first) < 0) {
                Logger::instance().log(LogLevel::WARN, "Failed to remove watch for " + it->second + ": " +
                                       std::string(strerror(errno)), "InotifyWatcher");
            }
            it = watchDescriptors_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    roots_.erase(std::remove(roots_.begin(), roots_.end(), normalized.string()), roots_.end());
    return removed > 0;
}

size_t InotifyWatcher::watchCount() const {
    std::lock_guard<std::mutex> lock(watchMutex_);
    return watchDescriptors_.size();
}

bool InotifyWatcher::isExcluded(const std::string& path) const {
    std::lock_guard<std::mutex> lock(watchMutex_);
    for (const auto& excluded : excluded_) {
        if (PathUtils::isWithin(path, excluded)) {
            return true;
        }
    }
    return false;
}

bool InotifyWatcher::addSingleWatch(const std::string& path) {
    if (isExcluded(path)) {
        return false;
    }

    int wd = inotify_add_watch(inotifyFd_, path.c_str(), WATCH_MASK);
    if (wd < 0) {
        Logger::instance().log(LogLevel::ERROR, "Failed to add watch for " + path + ": " +
                               std::string(strerror(errno)), "InotifyWatcher");
        return false;
    }

    std::lock_guard<std::mutex> lock(watchMutex_);
    watchDescriptors_[wd] = path;
    return true;
}

void InotifyWatcher::addWatchRecursive(const std::string& path) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory(ec) || it->is_symlink(ec)) {
            continue;
        }
        const std::string dir = it->path().string();
        if (isExcluded(dir)) {
            it.disable_recursion_pending();
            continue;
        }
        addSingleWatch(dir);
    }
    if (ec) {
        Logger::instance().log(LogLevel::WARN, "Error iterating " + path + ": " + ec.message(), "InotifyWatcher");
    }
}

std::string InotifyWatcher::getWatchPath(int wd) const {
    std::lock_guard<std::mutex> lock(watchMutex_);
    auto it = watchDescriptors_.find(wd);
    if (it != watchDescriptors_.end()) {
        return it->second;
    }
    return "";
}

void InotifyWatcher::monitorLoop() {
    auto& logger = Logger::instance();

    const int EVENT_SIZE = sizeof(struct inotify_event);
    const int BUF_LEN = 1024 * (EVENT_SIZE + 256);
    std::vector<char> buffer(BUF_LEN);

    while (running_) {
        // Use select with timeout to allow clean shutdown
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(inotifyFd_, &fds);

        struct timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = 100000;  // 100ms timeout

        int ret = select(inotifyFd_ + 1, &fds, nullptr, nullptr, &timeout);
        if (ret < 0) {
            if (errno == EINTR) continue;
            if (running_) {
                logger.log(LogLevel::ERROR, "Select error: " + std::string(strerror(errno)), "InotifyWatcher");
            }
            break;
        }
        if (ret == 0) {
            continue;
        }

        ssize_t length = read(inotifyFd_, buffer.data(), buffer.size());
        if (length < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            if (running_) {
                logger.log(LogLevel::ERROR, "Inotify read error: " + std::string(strerror(errno)), "InotifyWatcher");
            }
            break;
        }

        ssize_t i = 0;
        while (i < length) {
            auto* event = reinterpret_cast<struct inotify_event*>(&buffer[i]);
            i += EVENT_SIZE + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                // Events were lost; report the roots so a full pass runs
                logger.log(LogLevel::WARN, "Inotify queue overflow", "InotifyWatcher");
                std::vector<std::string> roots;
                {
                    std::lock_guard<std::mutex> lock(watchMutex_);
                    roots = roots_;
                }
                for (const auto& root : roots) {
                    if (callback_) callback_(WatchEvent{WatchEventType::Modify, root, true});
                }
                continue;
            }
            if (event->mask & IN_IGNORED) {
                std::lock_guard<std::mutex> lock(watchMutex_);
                watchDescriptors_.erase(event->wd);
                continue;
            }
            if (event->len == 0) {
                continue;
            }

            std::string dirPath = getWatchPath(event->wd);
            if (dirPath.empty()) {
                continue;
            }
            const std::string fullPath = dirPath + "/" + event->name;
            const bool isDir = (event->mask & IN_ISDIR) != 0;

            WatchEventType type;
            if (event->mask & (IN_MOVED_FROM | IN_MOVED_TO)) {
                type = WatchEventType::Move;
                if (isDir && (event->mask & IN_MOVED_TO)) {
                    addSingleWatch(fullPath);
                    addWatchRecursive(fullPath);
                }
            } else if (event->mask & IN_CREATE) {
                type = WatchEventType::Create;
                // A new directory needs its own watch
                if (isDir) {
                    addSingleWatch(fullPath);
                    addWatchRecursive(fullPath);
                }
            } else if (event->mask & IN_DELETE) {
                type = WatchEventType::Delete;
            } else if (!isDir && (event->mask & (IN_MODIFY | IN_CLOSE_WRITE))) {
                type = WatchEventType::Modify;
            } else {
                continue;
            }

            if (callback_) {
                callback_(WatchEvent{type, fullPath, isDir});
            }
        }
    }

    logger.log(LogLevel::DEBUG, "Monitor loop ended", "InotifyWatcher");
}

} // namespace DriveSync

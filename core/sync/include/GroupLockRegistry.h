#pragma once

#include <condition_variable>
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_set>

namespace DriveSync {

/**
 * @brief Per-group exclusion: at most one sync or resolution per group at a time.
 *
 * Owned by SyncEngine (or a test) rather than living in a process global.
 */
class GroupLockRegistry {
public:
    /**
     * @brief RAII hold on one group; move-only, releases on destruction
     */
    class Guard {
    public:
        Guard() = default;
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool owns() const { return registry_ != nullptr; }
        explicit operator bool() const { return owns(); }

        const std::string& groupId() const { return groupId_; }

        void release();

    private:
        friend class GroupLockRegistry;
        Guard(GroupLockRegistry* registry, std::string groupId);

        GroupLockRegistry* registry_ = nullptr;
        std::string groupId_;
    };

    /// Empty guard if the group is already held
    Guard tryAcquire(const std::string& groupId);

    /// Wait up to @p timeout for the group to become free
    Guard acquireFor(const std::string& groupId, std::chrono::milliseconds timeout);

    bool isLocked(const std::string& groupId) const;

private:
    void release(const std::string& groupId);

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::unordered_set<std::string> held_;
};

} // namespace DriveSync

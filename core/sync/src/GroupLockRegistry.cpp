#include "GroupLockRegistry.h"

#include <utility>

namespace DriveSync {

GroupLockRegistry::Guard::Guard(GroupLockRegistry* registry, std::string groupId)
    : registry_(registry), groupId_(std::move(groupId)) {
}

GroupLockRegistry::Guard::Guard(Guard&& other) noexcept
    : registry_(other.registry_), groupId_(std::move(other.groupId_)) {
    other.registry_ = nullptr;
}

GroupLockRegistry::Guard& GroupLockRegistry::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = other.registry_;
        groupId_ = std::move(other.groupId_);
        other.registry_ = nullptr;
    }
    return *this;
}

GroupLockRegistry::Guard::~Guard() {
    release();
}

void GroupLockRegistry::Guard::release() {
    if (registry_) {
        registry_->release(groupId_);
        registry_ = nullptr;
    }
}

GroupLockRegistry::Guard GroupLockRegistry::tryAcquire(const std::string& groupId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_.insert(groupId).second) {
        return Guard();
    }
    return Guard(this, groupId);
}

GroupLockRegistry::Guard GroupLockRegistry::acquireFor(const std::string& groupId, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool freed = released_.wait_for(lock, timeout, [&] { return held_.count(groupId) == 0; });
    if (!freed) {
        return Guard();
    }
    held_.insert(groupId);
    return Guard(this, groupId);
}

bool GroupLockRegistry::isLocked(const std::string& groupId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(groupId) > 0;
}

void GroupLockRegistry::release(const std::string& groupId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.erase(groupId);
    }
    released_.notify_all();
}

} // namespace DriveSync

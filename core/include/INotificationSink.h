#pragma once

#include "SyncTypes.h"

#include <string>
#include <vector>

namespace DriveSync {

/**
 * @brief Receives outcomes of background triggers.
 *
 * Called synchronously on the worker that ran the trigger, so
 * implementations must be thread-safe and should return quickly.
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual void onScheduled(const std::string& groupId, ScheduledStatus status, const std::string& message) = 0;

    /// One call per event type seen in a debounce window
    virtual void onRealtime(const std::string& groupId, WatchEventType event,
                            const std::vector<std::string>& affectedPaths) = 0;
};

/**
 * @brief Writes notifications to the Logger under the "Notification" component
 */
class LoggingNotificationSink : public INotificationSink {
public:
    void onScheduled(const std::string& groupId, ScheduledStatus status, const std::string& message) override;
    void onRealtime(const std::string& groupId, WatchEventType event,
                    const std::vector<std::string>& affectedPaths) override;
};

} // namespace DriveSync

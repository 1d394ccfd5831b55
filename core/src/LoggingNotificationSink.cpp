#include "INotificationSink.h"
#include "Logger.h"

#include <algorithm>

namespace DriveSync {

void LoggingNotificationSink::onScheduled(const std::string& groupId, ScheduledStatus status,
                                          const std::string& message) {
    auto& logger = Logger::instance();
    std::string line = "[" + groupId + "] scheduled sync " + toString(status);
    if (!message.empty()) {
        line += ": " + message;
    }

    switch (status) {
        case ScheduledStatus::Failed:
            logger.log(LogLevel::ERROR, line, "Notification");
            break;
        case ScheduledStatus::Conflict:
            logger.log(LogLevel::WARN, line, "Notification");
            break;
        default:
            logger.log(LogLevel::INFO, line, "Notification");
            break;
    }
}

void LoggingNotificationSink::onRealtime(const std::string& groupId, WatchEventType event,
                                         const std::vector<std::string>& affectedPaths) {
    std::string line = "[" + groupId + "] " + toString(event) + " x" + std::to_string(affectedPaths.size());
    const size_t shown = std::min<size_t>(affectedPaths.size(), 5);
    for (size_t i = 0; i < shown; ++i) {
        line += (i == 0 ? ": " : ", ") + affectedPaths[i];
    }
    if (affectedPaths.size() > shown) {
        line += ", ...";
    }
    Logger::instance().log(LogLevel::INFO, line, "Notification");
}

} // namespace DriveSync

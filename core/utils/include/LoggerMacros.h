/**
 * @file LoggerMacros.h
 * @brief Logging macros that skip message construction when the level is off
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("Hashing " + path, "Synchronizer");
 */

#pragma once

#include "Logger.h"
#include <chrono>
#include <string>

namespace DriveSync {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::DriveSync::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::DriveSync::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP(msg, component) ::DriveSync::Logger::instance().info(msg, component)
#define LOG_WARN_COMP(msg, component) ::DriveSync::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::DriveSync::Logger::instance().error(msg, component)
#define LOG_CRITICAL_COMP(msg, component) ::DriveSync::Logger::instance().critical(msg, component)

/**
 * @brief Logs elapsed wall time at DEBUG level on destruction
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_).count();
            logger.debug(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::DriveSync::ScopedTimer timer__(name, component)

} // namespace DriveSync

#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <optional>

namespace DriveSync {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Process-wide, component-tagged logger.
     *
     * Writes to the console (coloured by severity) and, when a log file is
     * set, appends to it with size-based rotation.
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB);
        void setComponent(const std::string& component);
        void setConsoleOutput(bool enabled);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        /**
         * @brief Parse "debug", "info", "warn", "error" or "critical" (case-insensitive)
         */
        static std::optional<LogLevel> parseLevel(const std::string& name);

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        LogLevel currentLevel_ = LogLevel::INFO;
        std::string defaultComponent_ = "DriveSync";
        size_t maxFileSizeMB_ = 50;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;

        std::string levelToString(LogLevel level);
        std::string getCurrentTime();
        void rotateLogFile();
        void checkAndRotate();
        size_t getFileSize();
    };

}

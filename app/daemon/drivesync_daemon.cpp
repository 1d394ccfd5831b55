#include "Config.h"
#include "Logger.h"
#include "PathUtils.h"
#include "SyncEngine.h"
#include "Version.h"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

using namespace DriveSync;

namespace {
    // Signal-safe flags, read by the main loop
    volatile sig_atomic_t signalReceived = 0;
    volatile sig_atomic_t receivedSignalNum = 0;

    void signalHandler(int signal) {
        receivedSignalNum = signal;
        signalReceived = 1;
    }

    void writeTemplate(const std::filesystem::path& path) {
        std::ofstream templateFile(path);
        if (!templateFile.is_open()) {
            Logger::instance().warn("Cannot write configuration template " + path.string(), "Daemon");
            return;
        }
        templateFile << "# DriveSync configuration\n";
        templateFile << "# database=~/.local/share/drivesync/tracking.db\n";
        templateFile << "log_level=info\n";
        templateFile << "scheduler_workers=2\n";
        templateFile << "\n";
        templateFile << "# Defaults for every group\n";
        templateFile << "sync.bandwidth_limit_mbps=0\n";
        templateFile << "sync.compression=false\n";
        templateFile << "sync.compression_algorithm=gzip\n";
        templateFile << "sync.compression_level=6\n";
        templateFile << "sync.encryption=false\n";
        templateFile << "sync.parallel_files=1\n";
        templateFile << "sync.incremental=true\n";
        templateFile << "sync.exclude=*.tmp,.Trash-*/\n";
        templateFile << "\n";
        templateFile << "# Example group\n";
        templateFile << "# group.docs.master=/home/me/Documents\n";
        templateFile << "# group.docs.backups=/media/backup/Documents\n";
        templateFile << "# group.docs.mode=master_to_backup\n";
        templateFile << "# group.docs.schedule=daily at 2 am\n";
        templateFile << "# group.docs.realtime=true\n";
        templateFile << "# group.docs.debounce_ms=2000\n";
        templateFile << "# group.docs.sync.compression=true\n";
    }

    std::string expandTilde(const std::string& path) {
        if (path.empty() || path[0] != '~') {
            return path;
        }
        return (PathUtils::getHome() / path.substr(path.size() > 1 && path[1] == '/' ? 2 : 1)).string();
    }
}

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setComponent("Daemon");

    std::string configOverride;
    std::string logFileOverride;
    bool foreground = true;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            configOverride = argv[++i];
        }
        else if (arg == "--log-file" && i + 1 < argc) {
            logFileOverride = argv[++i];
        }
        else if (arg == "--quiet") {
            foreground = false;
        }
        else if (arg == "--version") {
            std::cout << Version::toString() << std::endl;
            return 0;
        }
        else if (arg == "--help") {
            std::cout << "DriveSync Daemon - scheduled and realtime drive synchronization" << std::endl;
            std::cout << "\nUsage: " << argv[0] << " [OPTIONS]" << std::endl;
            std::cout << "\nOptions:" << std::endl;
            std::cout << "  --config <FILE>     Configuration file (default: ~/.config/drivesync/drivesync.conf)" << std::endl;
            std::cout << "  --log-file <FILE>   Log file (default: ~/.local/share/drivesync/drivesync.log)" << std::endl;
            std::cout << "  --quiet             Log to the file only" << std::endl;
            std::cout << "  --version           Show version" << std::endl;
            std::cout << "  --help              Show this help message" << std::endl;
            return 0;
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 2;
        }
    }

    PathUtils::ensureDirectory(PathUtils::getConfigDir());
    PathUtils::ensureDirectory(PathUtils::getDataDir());

    logger.setLogFile(logFileOverride.empty() ? PathUtils::getLogPath().string() : logFileOverride);
    logger.setMaxFileSize(100);
    logger.setConsoleOutput(foreground);

    logger.info("=== " + Version::toString() + " daemon starting ===", "Daemon");

    Config config;
    const std::filesystem::path configPath = configOverride.empty() ? PathUtils::getConfigPath()
                                                                    : std::filesystem::path(configOverride);
    if (!config.loadFromFile(configPath.string())) {
        logger.info("No configuration at " + configPath.string() + ", writing a template", "Daemon");
        writeTemplate(configPath);
        config.loadFromFile(configPath.string());
    }

    auto level = Logger::parseLevel(config.get("log_level", "info"));
    if (!level) {
        logger.warn("Unknown log_level '" + config.get("log_level") + "', using info", "Daemon");
    }
    logger.setLevel(level.value_or(LogLevel::INFO));

    auto groups = SyncEngine::loadGroups(config);
    if (!groups) {
        logger.critical("Invalid configuration: " + groups.error().message, "Daemon");
        std::cerr << "Error: " << groups.error().message << std::endl;
        return 1;
    }

    EngineConfig engineConfig;
    engineConfig.databasePath = expandTilde(config.get("database", PathUtils::getDatabasePath().string()));
    engineConfig.schedulerWorkers = config.getSize("scheduler_workers", 2);
    engineConfig.recoverInterrupted = true;

    SyncEngine engine(engineConfig);
    auto initialized = engine.initialize();
    if (!initialized) {
        logger.critical("Engine startup failed: " + initialized.error().message, "Daemon");
        std::cerr << "Error: " << initialized.error().message << std::endl;
        return 1;
    }

    size_t active = 0;
    for (const auto& definition : *groups) {
        auto ids = engine.activate(definition);
        if (!ids) {
            // One bad group must not keep the others from running
            logger.error("Group " + definition.group.id + " not activated: " + ids.error().message, "Daemon");
            continue;
        }
        if (ids->first.empty() && ids->second.empty()) {
            logger.info("Group " + definition.group.id + " has no schedule or realtime watch", "Daemon");
            continue;
        }
        active++;
    }
    logger.info(std::to_string(groups->size()) + " group(s) configured, " + std::to_string(active) + " active",
                "Daemon");

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    logger.info("Daemon running. Press Ctrl+C to stop.", "Daemon");
    while (!signalReceived) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    int sigNum = receivedSignalNum;
    logger.info("Received signal " + std::to_string(sigNum) + ", shutting down", "Daemon");

    // Running syncs finish before exit
    engine.shutdown(true);
    logger.info("=== DriveSync daemon stopped ===", "Daemon");
    return 0;
}

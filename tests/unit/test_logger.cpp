#include "Logger.h"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

using namespace DriveSync;

namespace fs = std::filesystem;

void test_singleton() {
    std::cout << "Running test_singleton..." << std::endl;
    Logger& first = Logger::instance();
    Logger& second = Logger::instance();
    assert(&first == &second);
    std::cout << "test_singleton passed." << std::endl;
}

void test_parse_level() {
    std::cout << "Running test_parse_level..." << std::endl;
    assert(Logger::parseLevel("debug") == LogLevel::DEBUG);
    assert(Logger::parseLevel("INFO") == LogLevel::INFO);
    assert(Logger::parseLevel("Warning") == LogLevel::WARN);
    assert(Logger::parseLevel("warn") == LogLevel::WARN);
    assert(Logger::parseLevel("error") == LogLevel::ERROR);
    assert(Logger::parseLevel("critical") == LogLevel::CRITICAL);
    assert(!Logger::parseLevel("verbose").has_value());
    assert(!Logger::parseLevel("").has_value());
    std::cout << "test_parse_level passed." << std::endl;
}

void test_level_filtering() {
    std::cout << "Running test_level_filtering..." << std::endl;
    fs::path dir = fs::temp_directory_path() / "drivesync_logger_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    fs::path logPath = dir / "drivesync.log";

    Logger& logger = Logger::instance();
    logger.setConsoleOutput(false);
    logger.setLogFile(logPath.string());

    logger.setLevel(LogLevel::WARN);
    assert(logger.getLevel() == LogLevel::WARN);
    assert(!logger.isDebugEnabled());
    logger.info("hidden info line", "Synchronizer");
    logger.warn("visible warn line", "Synchronizer");

    logger.setLevel(LogLevel::DEBUG);
    assert(logger.isDebugEnabled());
    logger.debug("visible debug line");

    std::ifstream file(logPath);
    assert(file.is_open());
    std::string line;
    bool sawInfo = false;
    bool sawWarn = false;
    bool sawDebug = false;
    while (std::getline(file, line)) {
        if (line.find("hidden info line") != std::string::npos) sawInfo = true;
        if (line.find("visible warn line") != std::string::npos) {
            sawWarn = true;
            assert(line.find("[WARN]") != std::string::npos);
            assert(line.find("[Synchronizer]") != std::string::npos);
        }
        if (line.find("visible debug line") != std::string::npos) sawDebug = true;
    }
    assert(!sawInfo);
    assert(sawWarn);
    assert(sawDebug);

    // Release the file before cleanup
    logger.setLogFile("");
    logger.setLevel(LogLevel::INFO);
    logger.setConsoleOutput(true);
    fs::remove_all(dir);
    std::cout << "test_level_filtering passed." << std::endl;
}

int main() {
    try {
        test_singleton();
        test_parse_level();
        test_level_filtering();
        std::cout << "All Logger tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}

#include "PathUtils.h"
#include <cstdlib>
#include <stdexcept>

namespace DriveSync {

std::filesystem::path PathUtils::getHome() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home);
    }
    throw std::runtime_error("HOME environment variable is not set");
}

std::filesystem::path PathUtils::getConfigDir() {
    if (const char* config = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(config) / "drivesync";
    }
    return getHome() / ".config" / "drivesync";
}

std::filesystem::path PathUtils::getDataDir() {
    if (const char* data = std::getenv("XDG_DATA_HOME")) {
        return std::filesystem::path(data) / "drivesync";
    }
    return getHome() / ".local" / "share" / "drivesync";
}

std::filesystem::path PathUtils::getConfigPath() {
    return getConfigDir() / "drivesync.conf";
}

std::filesystem::path PathUtils::getDatabasePath() {
    return getDataDir() / "tracking.db";
}

std::filesystem::path PathUtils::getLogPath() {
    return getDataDir() / "drivesync.log";
}

void PathUtils::ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
    }
    if (ec) {
        throw std::runtime_error("Failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    }
}

std::filesystem::path PathUtils::normalize(const std::filesystem::path& path) {
    auto normalized = std::filesystem::absolute(path).lexically_normal();
    if (!normalized.has_filename() && normalized.has_parent_path() && normalized != normalized.root_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

bool PathUtils::isWithin(const std::filesystem::path& child, const std::filesystem::path& parent) {
    auto c = normalize(child);
    auto p = normalize(parent);
    auto cit = c.begin();
    for (auto pit = p.begin(); pit != p.end(); ++pit, ++cit) {
        if (cit == c.end() || *cit != *pit) {
            return false;
        }
    }
    return true;
}

std::string PathUtils::relativeKey(const std::filesystem::path& child, const std::filesystem::path& root) {
    return normalize(child).lexically_relative(normalize(root)).generic_string();
}

} // namespace DriveSync

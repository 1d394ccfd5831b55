#pragma once

#include <filesystem>
#include <string>

namespace DriveSync {

/**
 * @brief XDG locations and path helpers shared by the engine and apps.
 */
class PathUtils {
public:
    static std::filesystem::path getHome();
    static std::filesystem::path getConfigDir();
    static std::filesystem::path getDataDir();
    static std::filesystem::path getConfigPath();
    static std::filesystem::path getDatabasePath();
    static std::filesystem::path getLogPath();
    static void ensureDirectory(const std::filesystem::path& dir);

    /**
     * @brief Lexically normalized absolute form, without a trailing separator
     */
    static std::filesystem::path normalize(const std::filesystem::path& path);

    /**
     * @brief True if child equals parent or lies beneath it (lexical check)
     */
    static bool isWithin(const std::filesystem::path& child, const std::filesystem::path& parent);

    /**
     * @brief Relative path of child under root, always '/'-separated
     */
    static std::string relativeKey(const std::filesystem::path& child, const std::filesystem::path& root);
};

} // namespace DriveSync

#pragma once

#include <string>
#include <vector>

namespace DriveSync {

/**
 * @brief Exclude-pattern matcher for tree scans and watcher events.
 *
 * A pattern matches when fnmatch() accepts the file name or the relative
 * path. Patterns ending in '/' name directories: they match the directory
 * itself and everything below it, at any depth.
 */
class PathFilter {
public:
    PathFilter() = default;
    explicit PathFilter(std::vector<std::string> patterns);

    void addPattern(const std::string& pattern);
    const std::vector<std::string>& patterns() const { return patterns_; }

    /**
     * @param relativePath '/'-separated path relative to the scanned root
     * @param isDirectory  true when the entry is a directory
     */
    bool isExcluded(const std::string& relativePath, bool isDirectory = false) const;

    /**
     * @brief Names that are always skipped (in-flight temp files written by DriveSync)
     */
    static bool isInternalTempName(const std::string& filename);

    static constexpr const char* TEMP_SUFFIX = ".dsync-tmp";

private:
    std::vector<std::string> patterns_;
};

} // namespace DriveSync

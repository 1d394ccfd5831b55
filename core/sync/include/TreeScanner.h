#pragma once

#include "PathFilter.h"
#include "Result.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace DriveSync {

class CancellationToken;

/**
 * @brief Regular file found by a scan
 */
struct ScanEntry {
    std::filesystem::path absolutePath;
    uint64_t size = 0;
    int64_t mtimeNs = 0;
};

/// Sorted by '/'-separated relative path
using ScanMap = std::map<std::string, ScanEntry>;

struct ScanResult {
    ScanMap files;
    /// Relative paths that could not be opened or stat'ed; their contents are unknown
    std::vector<std::string> unreadable;

    /// True if @p relativePath is an unreadable path or lies below one
    bool isUnknown(const std::string& relativePath) const;
};

/// True if @p relativePath equals @p prefix or lies below it
bool isAtOrBelow(const std::string& relativePath, const std::string& prefix);

int64_t toNanoseconds(std::filesystem::file_time_type time);
std::filesystem::file_time_type fromNanoseconds(int64_t nanoseconds);

/**
 * @brief Walks one root applying exclude patterns.
 *
 * Excluded directories are not descended into. Symlinks and special files
 * are skipped. A subdirectory or entry that cannot be opened is reported in
 * ScanResult::unreadable so callers never mistake it for a deletion; an
 * unreadable root is a fault.
 */
class TreeScanner {
public:
    explicit TreeScanner(PathFilter filter = PathFilter());

    /**
     * @param excludedRoots Absolute roots nested under @p root that belong to
     *                      another tree (e.g. a backup inside the master)
     * @return IOFault if the root is missing or cannot be enumerated,
     *         Cancelled if the token fires
     */
    Result<ScanResult> scan(const std::filesystem::path& root,
                            const CancellationToken* cancel = nullptr,
                            const std::vector<std::filesystem::path>& excludedRoots = {}) const;

    const PathFilter& filter() const { return filter_; }

private:
    PathFilter filter_;
};

} // namespace DriveSync

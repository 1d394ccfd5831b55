#include "TreeScanner.h"
#include "CancellationToken.h"
#include "LoggerMacros.h"
#include "PathUtils.h"

#include <chrono>
#include <system_error>

namespace DriveSync {

namespace fs = std::filesystem;

int64_t toNanoseconds(fs::file_time_type time) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
}

fs::file_time_type fromNanoseconds(int64_t nanoseconds) {
    return fs::file_time_type(std::chrono::duration_cast<fs::file_time_type::duration>(
        std::chrono::nanoseconds(nanoseconds)));
}

bool isAtOrBelow(const std::string& relativePath, const std::string& prefix) {
    if (relativePath.size() < prefix.size() || relativePath.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return relativePath.size() == prefix.size() || relativePath[prefix.size()] == '/';
}

bool ScanResult::isUnknown(const std::string& relativePath) const {
    for (const auto& path : unreadable) {
        if (isAtOrBelow(relativePath, path)) {
            return true;
        }
    }
    return false;
}

TreeScanner::TreeScanner(PathFilter filter) : filter_(std::move(filter)) {
}

Result<ScanResult> TreeScanner::scan(const fs::path& root, const CancellationToken* cancel,
                                     const std::vector<fs::path>& excludedRoots) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Err<ScanResult>(ErrorCode::IOFault, "Not a readable directory: " + root.string());
    }

    std::vector<fs::path> nested;
    for (const auto& excluded : excludedRoots) {
        auto normalized = PathUtils::normalize(excluded);
        if (normalized != PathUtils::normalize(root) && PathUtils::isWithin(normalized, root)) {
            nested.push_back(normalized);
        }
    }

    ScanResult result;
    size_t ignored = 0;

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return Err<ScanResult>(ErrorCode::IOFault, "Cannot enumerate " + root.string() + ": " + ec.message());
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            // The iterator cannot continue past this; a partial listing would read as deletions
            return Err<ScanResult>(ErrorCode::IOFault, "Enumeration of " + root.string() + " failed: " + ec.message());
        }
        if (CancellationToken::cancelled(cancel)) {
            return Err<ScanResult>(ErrorCode::Cancelled, "Scan cancelled");
        }

        const fs::path& current = it->path();
        std::string relative = PathUtils::relativeKey(current, root);
        auto status = it->symlink_status(ec);
        if (ec) {
            LOG_WARN_COMP("Cannot stat " + current.string() + ": " + ec.message(), "TreeScanner");
            ec.clear();
            result.unreadable.push_back(std::move(relative));
            continue;
        }

        if (fs::is_directory(status)) {
            bool skip = filter_.isExcluded(relative, true);
            for (const auto& excluded : nested) {
                if (PathUtils::normalize(current) == excluded) {
                    skip = true;
                }
            }
            if (skip) {
                ignored++;
                it.disable_recursion_pending();
                LOG_DEBUG_COMP_IF("Ignoring directory and its children: " + relative, "TreeScanner");
                continue;
            }

            fs::directory_iterator readable(current, ec);
            if (ec) {
                LOG_WARN_COMP("Cannot open directory " + current.string() + ": " + ec.message(), "TreeScanner");
                ec.clear();
                it.disable_recursion_pending();
                result.unreadable.push_back(std::move(relative));
            }
            continue;
        }

        if (!fs::is_regular_file(status)) {
            LOG_DEBUG_COMP_IF("Skipping non-regular file: " + relative, "TreeScanner");
            continue;
        }

        if (PathFilter::isInternalTempName(current.filename().string()) || filter_.isExcluded(relative, false)) {
            ignored++;
            continue;
        }

        ScanEntry entry;
        entry.absolutePath = current;
        entry.size = static_cast<uint64_t>(it->file_size(ec));
        if (!ec) {
            entry.mtimeNs = toNanoseconds(it->last_write_time(ec));
        }
        if (ec) {
            LOG_WARN_COMP("Cannot stat " + current.string() + ": " + ec.message(), "TreeScanner");
            ec.clear();
            result.unreadable.push_back(std::move(relative));
            continue;
        }
        result.files.emplace(std::move(relative), std::move(entry));
    }

    LOG_DEBUG_COMP_IF("Scanned " + root.string() + ": " + std::to_string(result.files.size()) + " files, " +
                      std::to_string(ignored) + " ignored, " + std::to_string(result.unreadable.size()) +
                      " unreadable", "TreeScanner");
    return result;
}

} // namespace DriveSync

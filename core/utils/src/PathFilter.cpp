#include "PathFilter.h"
#include <fnmatch.h>

namespace DriveSync {

PathFilter::PathFilter(std::vector<std::string> patterns) {
    for (auto& pattern : patterns) {
        addPattern(pattern);
    }
}

void PathFilter::addPattern(const std::string& pattern) {
    if (!pattern.empty()) {
        patterns_.push_back(pattern);
    }
}

bool PathFilter::isInternalTempName(const std::string& filename) {
    std::string suffix = TEMP_SUFFIX;
    return filename.size() > suffix.size() &&
           filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool PathFilter::isExcluded(const std::string& relativePath, bool isDirectory) const {
    auto slash = relativePath.find_last_of('/');
    std::string filename = slash == std::string::npos ? relativePath : relativePath.substr(slash + 1);

    if (!isDirectory && isInternalTempName(filename)) {
        return true;
    }

    for (const auto& pattern : patterns_) {
        if (pattern.back() == '/') {
            std::string dirName = pattern.substr(0, pattern.size() - 1);

            // The directory itself
            if (isDirectory && (fnmatch(dirName.c_str(), filename.c_str(), 0) == 0 ||
                                fnmatch(dirName.c_str(), relativePath.c_str(), 0) == 0)) {
                return true;
            }

            // Anything below it (e.g. "build/" vs "src/build/obj.o")
            std::string prefix;
            size_t start = 0;
            while ((slash = relativePath.find('/', start)) != std::string::npos) {
                std::string component = relativePath.substr(start, slash - start);
                prefix = prefix.empty() ? component : prefix + "/" + component;
                if (fnmatch(dirName.c_str(), component.c_str(), 0) == 0 ||
                    fnmatch(dirName.c_str(), prefix.c_str(), 0) == 0) {
                    return true;
                }
                start = slash + 1;
            }
            continue;
        }

        if (fnmatch(pattern.c_str(), filename.c_str(), 0) == 0) {
            return true;
        }
        if (fnmatch(pattern.c_str(), relativePath.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace DriveSync

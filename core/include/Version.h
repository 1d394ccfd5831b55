#pragma once

#include <string>

namespace DriveSync {

    struct Version {
        static constexpr int MAJOR = 0;
        static constexpr int MINOR = 3;
        static constexpr int PATCH = 0;
        static constexpr const char* STRING = "0.3.0";

        // Tracking database layout, bumped with each store migration
        static constexpr int SCHEMA = 2;

        static std::string toString() {
            return std::string("DriveSync ") + STRING;
        }
    };

}

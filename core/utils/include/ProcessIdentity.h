#pragma once

#include <cstdint>

namespace DriveSync {

/**
 * @brief A process named by pid plus its start time.
 *
 * The start time (clock ticks since boot, from /proc/<pid>/stat) tells a
 * live owner apart from an unrelated process that later reused its pid.
 * It is 0 where /proc is not available; only the pid is compared then.
 */
struct ProcessIdentity {
    int64_t pid = 0;
    int64_t startTicks = 0;

    static ProcessIdentity current();

    /// 0 if the process does not exist or /proc cannot be read
    static int64_t startTicksOf(int64_t pid);

    /**
     * @brief true while the recorded process is still running.
     *
     * A pid of 0 names no process (rows written before owners were tracked).
     */
    bool alive() const;
};

} // namespace DriveSync

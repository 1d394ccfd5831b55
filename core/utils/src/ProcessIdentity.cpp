#include "ProcessIdentity.h"

#include <cerrno>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <string>
#include <unistd.h>

namespace DriveSync {

namespace {

// starttime is field 22 of /proc/<pid>/stat; field 3 is the first one after the command name
constexpr int kStartTimeAfterName = 22 - 3;

} // namespace

ProcessIdentity ProcessIdentity::current() {
    ProcessIdentity self;
    self.pid = static_cast<int64_t>(::getpid());
    self.startTicks = startTicksOf(self.pid);
    return self;
}

int64_t ProcessIdentity::startTicksOf(int64_t pid) {
    std::ifstream statFile("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!statFile || !std::getline(statFile, line)) {
        return 0;
    }

    // The command name may itself contain spaces and parentheses
    size_t nameEnd = line.rfind(')');
    if (nameEnd == std::string::npos) {
        return 0;
    }
    std::istringstream fields(line.substr(nameEnd + 1));
    std::string field;
    for (int i = 0; i < kStartTimeAfterName && fields >> field; ++i) {
    }
    int64_t ticks = 0;
    if (!(fields >> ticks)) {
        return 0;
    }
    return ticks;
}

bool ProcessIdentity::alive() const {
    if (pid <= 0) {
        return false;
    }
    // sig == 0 only checks for existence; EPERM means it exists under another user
    if (::kill(static_cast<pid_t>(pid), 0) != 0 && errno != EPERM) {
        return false;
    }
    if (startTicks == 0) {
        return true;
    }
    int64_t running = startTicksOf(pid);
    return running == 0 || running == startTicks;
}

} // namespace DriveSync

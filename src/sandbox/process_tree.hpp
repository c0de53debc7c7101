#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <sys/types.h>

namespace pyexec::sandbox {

// The /proc/<pid>/stat fields needed to follow a process tree.
struct ProcStat {
    pid_t pid = 0;
    char state = '?';
    pid_t ppid = 0;
    // Clock ticks since boot; tells a live process apart from a reused pid.
    unsigned long long start_time = 0;
};

std::optional<ProcStat> ParseProcStat(const std::string& contents);
std::optional<ProcStat> ReadProcStat(pid_t pid);

// Remembers every descendant of a root process seen so far. A descendant that
// moved to another process group or session is still signalled, even after the
// root is gone and it was reparented.
class ProcessTracker {
public:
    explicit ProcessTracker(pid_t root);

    // Adds the processes currently reachable through parent links from the root
    // or from an already tracked process.
    void Refresh();

    // Sends sig to each tracked process that is still alive with the same start time.
    std::size_t Signal(int sig) const;

    std::size_t Size() const { return seen_.size(); }

private:
    pid_t root_;
    std::map<pid_t, unsigned long long> seen_;
};

}  // namespace pyexec::sandbox

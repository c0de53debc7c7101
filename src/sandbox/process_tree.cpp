#include "sandbox/process_tree.hpp"

#include <cctype>
#include <deque>
#include <filesystem>
#include <fstream>
#include <set>
#include <signal.h>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace pyexec::sandbox {
namespace {

bool IsNumeric(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (const char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool IsLive(const ProcStat& stat) {
    return stat.state != 'Z' && stat.state != 'X';
}

}  // namespace

std::optional<ProcStat> ParseProcStat(const std::string& contents) {
    // "pid (comm) state ppid ..."; comm may itself contain spaces and parentheses.
    const auto open = contents.find('(');
    const auto close = contents.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    ProcStat stat{};
    std::istringstream head(contents.substr(0, open));
    if (!(head >> stat.pid)) {
        return std::nullopt;
    }

    // Fields from the 3rd (state) on; start time is the 22nd.
    std::istringstream rest(contents.substr(close + 1));
    std::vector<std::string> fields;
    std::string field;
    while (rest >> field) {
        fields.push_back(field);
    }
    if (fields.size() < 20 || fields[0].size() != 1 || !IsNumeric(fields[19])) {
        return std::nullopt;
    }
    stat.state = fields[0][0];
    std::istringstream ppid(fields[1]);
    if (!(ppid >> stat.ppid)) {
        return std::nullopt;
    }
    std::istringstream start_time(fields[19]);
    if (!(start_time >> stat.start_time)) {
        return std::nullopt;
    }
    return stat;
}

std::optional<ProcStat> ReadProcStat(pid_t pid) {
    std::ifstream input("/proc/" + std::to_string(pid) + "/stat");
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::string contents;
    std::getline(input, contents);
    return ParseProcStat(contents);
}

ProcessTracker::ProcessTracker(pid_t root)
    : root_(root) {}

void ProcessTracker::Refresh() {
    std::unordered_map<pid_t, std::vector<ProcStat>> children;
    std::unordered_map<pid_t, unsigned long long> live;
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc", ec);
    const std::filesystem::directory_iterator end;
    while (!ec && it != end) {
        const auto name = it->path().filename().string();
        if (IsNumeric(name)) {
            // Processes come and go during the scan; a vanished one is simply skipped.
            const auto stat = ReadProcStat(static_cast<pid_t>(std::stol(name)));
            if (stat && IsLive(*stat)) {
                children[stat->ppid].push_back(*stat);
                live[stat->pid] = stat->start_time;
            }
        }
        it.increment(ec);
    }

    std::deque<pid_t> pending{root_};
    for (const auto& [pid, start_time] : seen_) {
        const auto current = live.find(pid);
        if (current != live.end() && current->second == start_time) {
            pending.push_back(pid);
        }
    }
    std::set<pid_t> visited;
    while (!pending.empty()) {
        const auto parent = pending.front();
        pending.pop_front();
        if (!visited.insert(parent).second) {
            continue;
        }
        const auto found = children.find(parent);
        if (found == children.end()) {
            continue;
        }
        for (const auto& child : found->second) {
            seen_[child.pid] = child.start_time;
            pending.push_back(child.pid);
        }
    }
}

std::size_t ProcessTracker::Signal(int sig) const {
    std::size_t signalled = 0;
    for (const auto& [pid, start_time] : seen_) {
        const auto stat = ReadProcStat(pid);
        if (!stat || !IsLive(*stat) || stat->start_time != start_time) {
            continue;
        }
        if (::kill(pid, sig) == 0) {
            ++signalled;
        }
    }
    return signalled;
}

}  // namespace pyexec::sandbox

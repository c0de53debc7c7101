#include <gtest/gtest.h>
#include <boost/process.hpp>
#include <chrono>
#include <filesystem>
#include <signal.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "sandbox/process_tree.hpp"
#include "test_util.hpp"

using pyexec::sandbox::ParseProcStat;
using pyexec::sandbox::ProcessTracker;
using pyexec::sandbox::ReadProcStat;
using pyexec::test::TempWorkspace;

namespace bp = boost::process;

namespace {

std::string WaitForPidFile(const std::filesystem::path& path) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        auto pid = pyexec::test::Trimmed(pyexec::test::ReadFile(path));
        if (!pid.empty()) {
            return pid;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return {};
}

}  // namespace

// NOLINTNEXTLINE
TEST(proc_stat, parses_fields_around_a_tricky_command_name) {
    const std::string line =
        "4242 (my (odd) name) S 17 4242 4242 0 -1 4194560 100 0 0 0 1 2 0 0 20 0 1 0 987654 1000 10";
    const auto stat = ParseProcStat(line);
    ASSERT_TRUE(stat.has_value());
    EXPECT_EQ(stat->pid, 4242);
    EXPECT_EQ(stat->state, 'S');
    EXPECT_EQ(stat->ppid, 17);
    EXPECT_EQ(stat->start_time, 987654u);
}

// NOLINTNEXTLINE
TEST(proc_stat, rejects_truncated_lines) {
    EXPECT_FALSE(ParseProcStat("").has_value());
    EXPECT_FALSE(ParseProcStat("12 (sh) S 1 12").has_value());
    EXPECT_FALSE(ParseProcStat("12 sh S 1").has_value());
}

// NOLINTNEXTLINE
TEST(proc_stat, reads_own_process) {
    const auto stat = ReadProcStat(::getpid());
    ASSERT_TRUE(stat.has_value());
    EXPECT_EQ(stat->pid, ::getpid());
    EXPECT_EQ(stat->ppid, ::getppid());
    EXPECT_EQ(stat->state, 'R');
}

// NOLINTNEXTLINE
TEST(process_tracker, follows_descendant_that_left_the_session_after_root_dies) {
    TempWorkspace ws;
    const auto pid_file = ws.path() / "escaped.pid";
    bp::child root(bp::exe = "/bin/sh",
                   bp::args = std::vector<std::string>{
                       "-c", "setsid sleep 30 & echo $! > '" + pid_file.string() + "'; wait"});
    const auto escaped_pid = WaitForPidFile(pid_file);
    ASSERT_FALSE(escaped_pid.empty());

    ProcessTracker tracker(root.id());
    tracker.Refresh();
    EXPECT_GE(tracker.Size(), 1u);

    root.terminate();
    ASSERT_FALSE(pyexec::test::ProcessGone(escaped_pid));

    EXPECT_EQ(tracker.Signal(SIGKILL), 1u);
    EXPECT_TRUE(pyexec::test::WaitProcessGone(escaped_pid, std::chrono::milliseconds(2000)));
    EXPECT_EQ(tracker.Signal(SIGKILL), 0u);
}

// NOLINTNEXTLINE
TEST(process_tracker, unrelated_processes_are_not_tracked) {
    bp::child lone(bp::exe = "/bin/sh", bp::args = std::vector<std::string>{"-c", "exec sleep 30"});
    bp::child other(bp::exe = "/bin/sh", bp::args = std::vector<std::string>{"-c", "exec sleep 30"});

    ProcessTracker tracker(lone.id());
    tracker.Refresh();
    EXPECT_EQ(tracker.Size(), 0u);
    EXPECT_EQ(tracker.Signal(SIGKILL), 0u);
    EXPECT_TRUE(other.running());

    lone.terminate();
    other.terminate();
}

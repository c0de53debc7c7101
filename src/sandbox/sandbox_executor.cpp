#include "sandbox/sandbox_executor.hpp"

#include <algorithm>
#include <boost/process.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <thread>
#include <utility>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/process_tree.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/uuid.hpp"

namespace pyexec::sandbox {
namespace bp = boost::process;

namespace {

constexpr const char* kWorkspacePlaceholder = "{workspace}";
constexpr const char* kTruncatedMarker = "\n... [output truncated]";

// stdout/stderr are spooled to files so a chatty child never blocks on a full pipe.
struct CaptureFiles {
    std::filesystem::path stdout_path;
    std::filesystem::path stderr_path;

    CaptureFiles() {
        const auto stamp = pyexec::utils::GenerateUuid();
        const auto dir = std::filesystem::temp_directory_path();
        stdout_path = dir / ("pyexec_stdout_" + stamp + ".log");
        stderr_path = dir / ("pyexec_stderr_" + stamp + ".log");
    }

    ~CaptureFiles() {
        std::error_code ec;
        std::filesystem::remove(stdout_path, ec);
        std::filesystem::remove(stderr_path, ec);
    }

    CaptureFiles(const CaptureFiles&) = delete;
    CaptureFiles& operator=(const CaptureFiles&) = delete;
};

bool ReadCapture(const std::filesystem::path& path, std::size_t limit, std::string& target) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return false;
    }
    const bool truncated = limit > 0 && size > limit;
    const auto to_read = truncated ? limit : static_cast<std::size_t>(size);
    target.resize(to_read);
    input.read(target.data(), static_cast<std::streamsize>(to_read));
    target.resize(static_cast<std::size_t>(input.gcount()));
    if (truncated) {
        target += kTruncatedMarker;
    }
    return true;
}

enum class WaitState {
    kExited,
    kRunning,
    kFailed
};

WaitState PollChild(pid_t pid, int& status) {
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return WaitState::kExited;
        }
        if (waited == 0) {
            return WaitState::kRunning;
        }
        if (errno != EINTR) {
            return WaitState::kFailed;
        }
    }
}

// Polls until the child exits or the deadline passes, recording its descendants on every tick.
WaitState WaitUntil(pid_t pid,
                    int& status,
                    std::chrono::steady_clock::time_point deadline,
                    std::chrono::milliseconds interval,
                    ProcessTracker& tracker) {
    while (true) {
        const auto state = PollChild(pid, status);
        if (state != WaitState::kRunning) {
            return state;
        }
        tracker.Refresh();
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return WaitState::kRunning;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(interval, remaining + std::chrono::milliseconds(1)));
    }
}

// Blocking reap after SIGKILL; the child cannot survive it.
void Reap(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

SandboxExecutor::SandboxExecutor(RunnerOptions options)
    : options_(std::move(options)) {}

std::vector<std::string> SandboxExecutor::BuildArguments(const ScratchFile& script) const {
    std::vector<std::string> args;
    args.reserve(options_.launcher_args.size() + 1);
    const std::string placeholder = kWorkspacePlaceholder;
    const auto workspace = options_.workspace.string();
    for (auto arg : options_.launcher_args) {
        std::size_t pos = 0;
        while ((pos = arg.find(placeholder, pos)) != std::string::npos) {
            arg.replace(pos, placeholder.size(), workspace);
            pos += workspace.size();
        }
        args.push_back(std::move(arg));
    }
    args.push_back(script.relative_path);
    return args;
}

Result<ExecutionResult> SandboxExecutor::Run(const ScratchFile& script,
                                             std::chrono::seconds timeout) const {
    boost::filesystem::path launcher_path;
    if (options_.launcher.find('/') != std::string::npos) {
        std::error_code ec;
        const auto absolute = std::filesystem::absolute(options_.launcher, ec);
        if (ec) {
            return MakeError(ErrorKind::kLaunch, "cannot resolve launcher '" + options_.launcher + "'");
        }
        launcher_path = absolute.string();
    } else {
        launcher_path = bp::search_path(options_.launcher);
    }
    if (launcher_path.empty()) {
        return MakeError(ErrorKind::kLaunch, "launcher '" + options_.launcher + "' not found in PATH");
    }

    const auto args = BuildArguments(script);
    CaptureFiles capture;

    bp::environment env = boost::this_process::environment();
    env["PYTHONUNBUFFERED"] = "1";
    env["PYTHONIOENCODING"] = "utf-8";

    pyexec::utils::LogDebug("exec", "launch " + launcher_path.string() + " " + pyexec::utils::Join(args, " ")
                                        + " cwd=" + options_.workspace.string());

    ExecutionResult result{};
    const auto start = std::chrono::steady_clock::now();
    bp::group group;
    // A default child has pid -1; it must never reach its destructor attached.
    bp::child child_process;
    child_process.detach();
    try {
        child_process = bp::child(
            bp::exe = launcher_path,
            bp::args = args,
            env,
            bp::start_dir = options_.workspace.string(),
            bp::std_in < bp::null,
            bp::std_out > capture.stdout_path.string(),
            bp::std_err > capture.stderr_path.string(),
            group);
    } catch (const bp::process_error& ex) {
        return MakeError(ErrorKind::kLaunch, std::string("exec failed: ") + ex.what());
    }

    const pid_t pid = child_process.id();
    // Reaped by hand below; keep boost::process from waiting on a stale pid.
    child_process.detach();

    ProcessTracker tracker(pid);
    int status = 0;
    int wait_errno = 0;
    auto state = WaitUntil(pid, status, start + timeout, options_.poll_interval, tracker);
    if (state == WaitState::kFailed) {
        wait_errno = errno;
    }
    if (state == WaitState::kRunning) {
        result.timed_out = true;
        // Elapsed time stops at the deadline, not after the kill grace.
        result.elapsed_seconds = SecondsSince(start);
        pyexec::utils::LogWarn("exec", "timeout after " + std::to_string(timeout.count())
                                           + "s, terminating process group " + std::to_string(pid));
        tracker.Refresh();
        ::killpg(pid, SIGTERM);
        tracker.Signal(SIGTERM);
        state = WaitUntil(pid, status, std::chrono::steady_clock::now() + options_.kill_grace,
                          options_.poll_interval, tracker);
        if (state == WaitState::kRunning) {
            pyexec::utils::LogWarn("exec", "process group " + std::to_string(pid) + " ignored SIGTERM, killing");
            ::killpg(pid, SIGKILL);
            Reap(pid, status);
            state = WaitState::kExited;
        } else if (state == WaitState::kFailed) {
            wait_errno = errno;
        }
    }
    if (!result.timed_out) {
        result.elapsed_seconds = SecondsSince(start);
    }

    // Anything the script left running goes down with it: its group, and any
    // descendant that moved to another group or session.
    std::error_code group_ec;
    group.terminate(group_ec);
    if (group_ec && group_ec.value() != ESRCH) {
        pyexec::utils::LogDebug("exec", "group cleanup for " + std::to_string(pid) + ": " + group_ec.message());
    }
    const auto stray = tracker.Signal(SIGKILL);
    if (stray > 0) {
        pyexec::utils::LogDebug("exec", "signalled " + std::to_string(stray) + " leftover descendant(s) of "
                                            + std::to_string(pid));
    }

    if (state == WaitState::kFailed) {
        return MakeError(ErrorKind::kUnexpected,
                         "waitpid failed for pid " + std::to_string(pid) + ": " + std::strerror(wait_errno));
    }

    if (result.timed_out) {
        result.exit_code = kTimedOutExitCode;
    } else {
        result.exit_code = DecodeStatus(status);
    }

    if (!ReadCapture(capture.stdout_path, options_.max_output_bytes, result.output)) {
        return MakeError(ErrorKind::kUnexpected, "failed to read captured stdout");
    }
    if (!ReadCapture(capture.stderr_path, options_.max_output_bytes, result.error)) {
        return MakeError(ErrorKind::kUnexpected, "failed to read captured stderr");
    }

    if (result.timed_out) {
        pyexec::utils::LogInfo("exec", script.relative_path + " timed out after "
                                           + std::to_string(result.elapsed_seconds) + "s");
    } else {
        pyexec::utils::LogInfo("exec", script.relative_path + " exit code " + std::to_string(result.exit_code)
                                           + " in " + std::to_string(result.elapsed_seconds) + "s");
    }
    return result;
}

}  // namespace pyexec::sandbox

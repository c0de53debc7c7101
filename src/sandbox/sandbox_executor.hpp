#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "sandbox/exec_types.hpp"

namespace pyexec::sandbox {

struct RunnerOptions {
    std::filesystem::path workspace;
    std::string launcher = "uv";
    std::vector<std::string> launcher_args;
    // Per stream; 0 disables the cap.
    std::size_t max_output_bytes = 0;
    std::chrono::milliseconds kill_grace{2000};
    std::chrono::milliseconds poll_interval{50};
};

// Runs one materialized script per call under a hard wall-clock deadline.
// The child gets its own process group; on timeout the whole group is
// terminated and the child is reaped before Run returns. Descendants seen
// while it ran are killed too, including ones that left the group.
class SandboxExecutor {
public:
    explicit SandboxExecutor(RunnerOptions options);

    Result<ExecutionResult> Run(const ScratchFile& script, std::chrono::seconds timeout) const;

    // Launcher arguments with "{workspace}" substituted, followed by the script path.
    std::vector<std::string> BuildArguments(const ScratchFile& script) const;

    const RunnerOptions& Options() const { return options_; }

private:
    RunnerOptions options_;
};

}  // namespace pyexec::sandbox

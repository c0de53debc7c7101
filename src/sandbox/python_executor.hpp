#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/exec_types.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "sandbox/script_materializer.hpp"

namespace pyexec::sandbox {

struct ExecutionRequest {
    std::string code;
    std::optional<std::string> filename;
    std::optional<int> timeout_seconds;
};

struct Outcome {
    // Effective (clamped) timeout; 0 when the requested one was rejected.
    int timeout_seconds = 0;
    std::optional<ScratchFile> script;
    Result<ExecutionResult> result;

    // True for any error, a timeout, or a non-zero return code.
    bool HasError() const;
};

// Resolve workspace -> materialize -> run -> format, once per request.
// Immutable after Create, so one instance can serve concurrent requests.
class PythonExecutor {
public:
    // Fails when the configuration is unusable or the workspace cannot be resolved.
    static Result<PythonExecutor> Create(const pyexec::config::ExecutorConfig& config);

    Result<int> EffectiveTimeout(const std::optional<int>& requested) const;

    Outcome ExecuteDetailed(const ExecutionRequest& request) const;

    // Always returns text: the report, or an "=== ERROR ===" block.
    std::string Execute(const std::string& code,
                        const std::optional<std::string>& filename = std::nullopt,
                        const std::optional<int>& timeout_seconds = std::nullopt) const;

    static std::string Render(const Outcome& outcome);

    const std::filesystem::path& Workspace() const { return workspace_; }
    const std::filesystem::path& ScratchDir() const { return materializer_.ScratchDir(); }
    const pyexec::config::ExecutorConfig& Config() const { return config_; }

private:
    PythonExecutor(pyexec::config::ExecutorConfig config, std::filesystem::path workspace);

    pyexec::config::ExecutorConfig config_;
    std::filesystem::path workspace_;
    ScriptMaterializer materializer_;
    SandboxExecutor runner_;
};

}  // namespace pyexec::sandbox

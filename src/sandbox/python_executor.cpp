#include "sandbox/python_executor.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "config/config_loader.hpp"
#include "sandbox/report_formatter.hpp"
#include "sandbox/workspace.hpp"
#include "utils/logging.hpp"

namespace pyexec::sandbox {
namespace {

RunnerOptions MakeRunnerOptions(const pyexec::config::ExecutorConfig& config,
                                const std::filesystem::path& workspace) {
    RunnerOptions options{};
    options.workspace = workspace;
    options.launcher = config.launcher;
    options.launcher_args = config.launcher_args;
    options.max_output_bytes = config.max_output_bytes;
    options.kill_grace = std::chrono::milliseconds(config.kill_grace_ms);
    return options;
}

}  // namespace

bool Outcome::HasError() const {
    const auto* executed = std::get_if<ExecutionResult>(&result);
    if (!executed) {
        return true;
    }
    return executed->timed_out || executed->exit_code != 0;
}

PythonExecutor::PythonExecutor(pyexec::config::ExecutorConfig config, std::filesystem::path workspace)
    : config_(std::move(config)),
      workspace_(std::move(workspace)),
      materializer_(workspace_, config_.tmp_dir_name, config_.script_extension),
      runner_(MakeRunnerOptions(config_, workspace_)) {}

Result<PythonExecutor> PythonExecutor::Create(const pyexec::config::ExecutorConfig& config) {
    const auto problem = pyexec::config::ValidateConfig(config);
    if (!problem.empty()) {
        return MakeError(ErrorKind::kUnexpected, "invalid executor configuration: " + problem);
    }
    auto workspace = ResolveWorkspace(config.workspace);
    if (!IsOk(workspace)) {
        return std::get<ExecError>(std::move(workspace));
    }
    return PythonExecutor(config, std::get<std::filesystem::path>(std::move(workspace)));
}

Result<int> PythonExecutor::EffectiveTimeout(const std::optional<int>& requested) const {
    if (!requested) {
        return config_.default_timeout_s;
    }
    if (*requested <= 0) {
        return MakeError(ErrorKind::kInvalidTimeout,
                         "timeout must be a positive number of seconds, got " + std::to_string(*requested));
    }
    return std::min(*requested, config_.max_timeout_s);
}

Outcome PythonExecutor::ExecuteDetailed(const ExecutionRequest& request) const {
    Outcome outcome{};
    try {
        auto timeout = EffectiveTimeout(request.timeout_seconds);
        if (!IsOk(timeout)) {
            outcome.result = std::get<ExecError>(std::move(timeout));
            return outcome;
        }
        outcome.timeout_seconds = std::get<int>(timeout);

        auto script = materializer_.Materialize(request.code, request.filename);
        if (!IsOk(script)) {
            outcome.result = std::get<ExecError>(std::move(script));
            return outcome;
        }
        outcome.script = std::get<ScratchFile>(std::move(script));

        outcome.result = runner_.Run(*outcome.script, std::chrono::seconds(outcome.timeout_seconds));
    } catch (const std::exception& ex) {
        outcome.result = MakeError(ErrorKind::kUnexpected, ex.what());
    }

    if (const auto* error = std::get_if<ExecError>(&outcome.result)) {
        pyexec::utils::LogWarn("executor", std::string(ToString(error->kind)) + ": " + error->message);
    }
    return outcome;
}

std::string PythonExecutor::Execute(const std::string& code,
                                    const std::optional<std::string>& filename,
                                    const std::optional<int>& timeout_seconds) const {
    ExecutionRequest request{};
    request.code = code;
    request.filename = filename;
    request.timeout_seconds = timeout_seconds;
    return Render(ExecuteDetailed(request));
}

std::string PythonExecutor::Render(const Outcome& outcome) {
    if (const auto* error = std::get_if<ExecError>(&outcome.result)) {
        return FormatError(*error);
    }
    return FormatReport(std::get<ExecutionResult>(outcome.result), outcome.timeout_seconds);
}

}  // namespace pyexec::sandbox

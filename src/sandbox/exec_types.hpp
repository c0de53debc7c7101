#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <variant>

namespace pyexec::sandbox {

enum class ErrorKind {
    kInvalidName,
    kInvalidTimeout,
    kLaunch,
    kUnexpected
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kInvalidName: return "Invalid filename";
        case ErrorKind::kInvalidTimeout: return "Invalid timeout";
        case ErrorKind::kLaunch: return "Launch failed";
        case ErrorKind::kUnexpected: return "Execution failed";
    }
    return "Error";
}

struct ExecError {
    ErrorKind kind = ErrorKind::kUnexpected;
    std::string message;
};

template <typename T>
using Result = std::variant<T, ExecError>;

template <typename T>
bool IsOk(const Result<T>& result) {
    return std::holds_alternative<T>(result);
}

inline ExecError MakeError(ErrorKind kind, std::string message) {
    return ExecError{kind, std::move(message)};
}

struct ScratchFile {
    std::filesystem::path path;
    // Relative to the workspace root, e.g. "./.python_tmp/abc.py".
    std::string relative_path;
};

// Never produced by a process that terminated on its own.
constexpr int kTimedOutExitCode = -1;

struct ExecutionResult {
    std::string output;
    std::string error;
    int exit_code = 0;
    bool timed_out = false;
    double elapsed_seconds = 0.0;
};

}  // namespace pyexec::sandbox

#pragma once

#include <string>

#include "sandbox/exec_types.hpp"

namespace pyexec::sandbox {

inline constexpr const char* kNoOutputMarker = "No console output produced.";
inline constexpr const char* kStdoutHeader = "=== STDOUT ===";
inline constexpr const char* kStderrHeader = "=== STDERR ===";
inline constexpr const char* kTimeoutHeader = "=== EXECUTION TIMEOUT ===";
inline constexpr const char* kInfoHeader = "=== EXECUTION INFO ===";
inline constexpr const char* kErrorHeader = "=== ERROR ===";

// Sections in order: no-output marker, STDOUT, STDERR, EXECUTION TIMEOUT, EXECUTION INFO.
// Only the last one is always present.
std::string FormatReport(const ExecutionResult& result, int timeout_seconds);

std::string FormatError(const ExecError& error);

}  // namespace pyexec::sandbox

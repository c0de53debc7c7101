#pragma once

#include <filesystem>
#include <string>

#include "sandbox/exec_types.hpp"

namespace pyexec::sandbox {

// Absolute, normalized workspace root for a configured path. "" means the current directory.
Result<std::filesystem::path> ResolveWorkspace(const std::string& configured_path);

}  // namespace pyexec::sandbox

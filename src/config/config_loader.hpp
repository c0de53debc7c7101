#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "config/config_schema.hpp"

namespace pyexec::config {

std::filesystem::path GetDefaultConfigPath();

// Defaults, then the JSON file (when present), then PYEXEC_* environment overrides.
Config LoadConfig(const std::optional<std::filesystem::path>& path = std::nullopt);

// Returns an empty string when the executor settings are usable, otherwise the reason.
std::string ValidateConfig(const ExecutorConfig& config);

}  // namespace pyexec::config

#include "config/config_loader.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pyexec::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

int ParseInt(const std::string& value, int fallback) {
    int parsed = 0;
    if (!pyexec::utils::ParseStrictInt(value, parsed)) {
        pyexec::utils::LogWarn("config", "ignoring non-integer value '" + value + "'");
        return fallback;
    }
    return parsed;
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = pyexec::utils::Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyIntField(const nlohmann::json& source, const char* key, int& target) {
    if (!source.contains(key) || !source[key].is_number_integer()) {
        return;
    }
    const auto& value = source[key];
    const bool in_range = value.is_number_unsigned()
        ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : value.get<std::int64_t>() >= std::numeric_limits<int>::min()
              && value.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        pyexec::utils::LogWarn("config", std::string("ignoring out-of-range value for ") + key + ": " + value.dump());
        return;
    }
    target = static_cast<int>(value.get<std::int64_t>());
}

void ApplyExecutorConfig(ExecutorConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("workspace") && source["workspace"].is_string()) {
        target.workspace = source["workspace"].get<std::string>();
    }
    if (source.contains("tmpDirName") && source["tmpDirName"].is_string()) {
        target.tmp_dir_name = source["tmpDirName"].get<std::string>();
    }
    if (source.contains("scriptExtension") && source["scriptExtension"].is_string()) {
        target.script_extension = source["scriptExtension"].get<std::string>();
    }
    ApplyIntField(source, "defaultTimeoutS", target.default_timeout_s);
    ApplyIntField(source, "maxTimeoutS", target.max_timeout_s);
    if (source.contains("launcher") && source["launcher"].is_string()) {
        target.launcher = source["launcher"].get<std::string>();
    }
    if (source.contains("launcherArgs") && source["launcherArgs"].is_array()) {
        target.launcher_args.clear();
        for (const auto& item : source["launcherArgs"]) {
            if (item.is_string()) {
                target.launcher_args.push_back(item.get<std::string>());
            }
        }
    }
    if (source.contains("maxOutputBytes") && source["maxOutputBytes"].is_number_unsigned()) {
        target.max_output_bytes = source["maxOutputBytes"].get<std::size_t>();
    }
    ApplyIntField(source, "killGraceMs", target.kill_grace_ms);
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    if (data.contains("executor")) {
        ApplyExecutorConfig(config.executor, data["executor"]);
    }
    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            const auto level = pyexec::utils::ParseLogLevel(logging["level"].get<std::string>());
            if (level) {
                config.logging.min_level = *level;
            }
        }
    }
}

}  // namespace

std::filesystem::path GetDefaultConfigPath() {
    return GetHomePath() / ".pyexec" / "config.json";
}

Config LoadConfig(const std::optional<std::filesystem::path>& path) {
    Config config{};

    const auto config_path = path ? *path : GetDefaultConfigPath();
    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        std::ifstream input(config_path);
        if (!input.is_open()) {
            pyexec::utils::LogWarn("config", "cannot open " + config_path.string());
        } else {
            try {
                nlohmann::json data;
                input >> data;
                ApplyConfigFromJson(config, data);
            } catch (const nlohmann::json::exception& ex) {
                // Keep defaults on parse errors
                pyexec::utils::LogWarn("config", "failed to parse " + config_path.string() + ": " + ex.what());
            }
        }
    } else if (path) {
        pyexec::utils::LogWarn("config", "config file not found: " + config_path.string());
    }

    const auto workspace = GetEnvFallback(
        "PYEXEC_EXECUTOR__WORKSPACE",
        "PYTHON_EXECUTE_WORKSPACE");
    if (!workspace.empty()) {
        config.executor.workspace = workspace;
    }

    const auto tmp_dir_name = GetEnv("PYEXEC_EXECUTOR__TMP_DIR_NAME");
    if (!tmp_dir_name.empty()) {
        config.executor.tmp_dir_name = tmp_dir_name;
    }

    const auto default_timeout = GetEnv("PYEXEC_EXECUTOR__DEFAULT_TIMEOUT_S");
    if (!default_timeout.empty()) {
        config.executor.default_timeout_s = ParseInt(default_timeout, config.executor.default_timeout_s);
    }

    const auto max_timeout = GetEnv("PYEXEC_EXECUTOR__MAX_TIMEOUT_S");
    if (!max_timeout.empty()) {
        config.executor.max_timeout_s = ParseInt(max_timeout, config.executor.max_timeout_s);
    }

    const auto launcher = GetEnv("PYEXEC_EXECUTOR__LAUNCHER");
    if (!launcher.empty()) {
        config.executor.launcher = launcher;
    }

    const auto launcher_args = GetEnv("PYEXEC_EXECUTOR__LAUNCHER_ARGS");
    if (!launcher_args.empty()) {
        config.executor.launcher_args = SplitCsv(launcher_args);
    }

    const auto max_output = GetEnv("PYEXEC_EXECUTOR__MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        const auto value = ParseInt(max_output, -1);
        if (value >= 0) {
            config.executor.max_output_bytes = static_cast<std::size_t>(value);
        }
    }

    const auto kill_grace = GetEnv("PYEXEC_EXECUTOR__KILL_GRACE_MS");
    if (!kill_grace.empty()) {
        config.executor.kill_grace_ms = ParseInt(kill_grace, config.executor.kill_grace_ms);
    }

    const auto log_level = GetEnv("PYEXEC_LOG_LEVEL");
    if (!log_level.empty()) {
        const auto level = pyexec::utils::ParseLogLevel(log_level);
        if (level) {
            config.logging.min_level = *level;
        } else {
            pyexec::utils::LogWarn("config", "unknown log level '" + log_level + "'");
        }
    }

    return config;
}

std::string ValidateConfig(const ExecutorConfig& config) {
    if (config.default_timeout_s <= 0) {
        return "default timeout must be positive";
    }
    if (config.max_timeout_s <= 0) {
        return "max timeout must be positive";
    }
    if (config.default_timeout_s > config.max_timeout_s) {
        return "default timeout exceeds max timeout";
    }
    if (config.launcher.empty()) {
        return "launcher is empty";
    }
    if (config.tmp_dir_name.empty() || config.tmp_dir_name == "." || config.tmp_dir_name == ".."
        || config.tmp_dir_name.find('/') != std::string::npos) {
        return "scratch directory name must be a single path component";
    }
    if (config.script_extension.size() < 2 || config.script_extension[0] != '.'
        || config.script_extension.find('/') != std::string::npos) {
        return "script extension must start with '.'";
    }
    if (config.kill_grace_ms < 0) {
        return "kill grace must not be negative";
    }
    return {};
}

}  // namespace pyexec::config

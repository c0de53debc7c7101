#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace pyexec::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_output_mutex;

}  // namespace

std::optional<LogLevel> ParseLogLevel(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(config.min_level);
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = g_min_level.load();
    return config;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(g_min_level.load())) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << "[" << tag << "] " << ToString(level) << " " << message << std::endl;
}

}  // namespace pyexec::utils

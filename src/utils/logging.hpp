#pragma once

#include <optional>
#include <string>

namespace pyexec::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

// Accepts the names above case-insensitively, plus "warning".
std::optional<LogLevel> ParseLogLevel(const std::string& value);

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Writes "[tag] LEVEL message" to stderr when level passes the configured minimum.
void Log(LogLevel level, const std::string& tag, const std::string& message);

inline void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogLevel::kDebug, tag, message);
}

inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogLevel::kInfo, tag, message);
}

inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}

inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogLevel::kError, tag, message);
}

}  // namespace pyexec::utils

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace cronkeeper::utils {

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

LogLevel LogLevelFromString(const std::string& value, LogLevel fallback = LogLevel::kInfo);

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);

// Writes "[tag] LEVEL message key=value ..." to stderr.
void Log(LogLevel level, const std::string& tag, const std::string& message, const LogFields& fields = {});

inline void LogDebug(const std::string& tag, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kDebug, tag, message, fields);
}

inline void LogInfo(const std::string& tag, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kInfo, tag, message, fields);
}

inline void LogWarn(const std::string& tag, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kWarn, tag, message, fields);
}

inline void LogError(const std::string& tag, const std::string& message, const LogFields& fields = {}) {
    Log(LogLevel::kError, tag, message, fields);
}

}  // namespace cronkeeper::utils

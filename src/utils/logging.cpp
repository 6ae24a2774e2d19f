#include "utils/logging.hpp"

#include <iostream>
#include <mutex>

#include "utils/common.hpp"

namespace cronkeeper::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config;
    return config;
}

}  // namespace

LogLevel LogLevelFromString(const std::string& value, LogLevel fallback) {
    const auto lowered = ToLower(Trim(value));
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
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

void Log(LogLevel level, const std::string& tag, const std::string& message, const LogFields& fields) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (static_cast<int>(level) < static_cast<int>(MutableConfig().min_level)) {
        return;
    }
    std::cerr << "[" << tag << "] " << ToString(level) << " " << message;
    for (const auto& [key, value] : fields) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

}  // namespace cronkeeper::utils

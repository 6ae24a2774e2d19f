#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include "nlohmann/json.hpp"

#include "utils/common.hpp"

namespace cronkeeper::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

long long ParseLongLong(const std::string& value, long long fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("cron") && data["cron"].is_object()) {
        const auto& cron = data["cron"];
        if (cron.contains("enabled") && cron["enabled"].is_boolean()) {
            config.cron.enabled = cron["enabled"].get<bool>();
        }
        if (cron.contains("storePath") && cron["storePath"].is_string()) {
            config.cron.store_path = cron["storePath"].get<std::string>();
        }
        if (cron.contains("stuckRunMs") && cron["stuckRunMs"].is_number_integer()) {
            config.cron.stuck_run_ms = cron["stuckRunMs"].get<long long>();
        }
        if (cron.contains("persistAttempts") && cron["persistAttempts"].is_number_integer()) {
            config.cron.persist_attempts = cron["persistAttempts"].get<int>();
        }
    }

    if (data.contains("http") && data["http"].is_object()) {
        const auto& http = data["http"];
        if (http.contains("enabled") && http["enabled"].is_boolean()) {
            config.http.enabled = http["enabled"].get<bool>();
        }
        if (http.contains("host") && http["host"].is_string()) {
            config.http.host = http["host"].get<std::string>();
        }
        if (http.contains("port") && http["port"].is_number_integer()) {
            config.http.port = http["port"].get<int>();
        }
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            config.log.min_level = utils::LogLevelFromString(log["level"].get<std::string>(), config.log.min_level);
        }
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto cron_enabled = GetEnv("CRONKEEPER_CRON_ENABLED");
    if (!cron_enabled.empty()) {
        config.cron.enabled = utils::ParseBool(cron_enabled, config.cron.enabled);
    }

    const auto store_path = GetEnv("CRONKEEPER_CRON_STORE_PATH");
    if (!store_path.empty()) {
        config.cron.store_path = store_path;
    }

    const auto stuck_run_ms = GetEnv("CRONKEEPER_CRON_STUCK_RUN_MS");
    if (!stuck_run_ms.empty()) {
        config.cron.stuck_run_ms = ParseLongLong(stuck_run_ms, config.cron.stuck_run_ms);
    }

    const auto persist_attempts = GetEnv("CRONKEEPER_CRON_PERSIST_ATTEMPTS");
    if (!persist_attempts.empty()) {
        config.cron.persist_attempts = ParseInt(persist_attempts, config.cron.persist_attempts);
    }

    const auto http_enabled = GetEnv("CRONKEEPER_HTTP_ENABLED");
    if (!http_enabled.empty()) {
        config.http.enabled = utils::ParseBool(http_enabled, config.http.enabled);
    }

    const auto http_host = GetEnv("CRONKEEPER_HTTP_HOST");
    if (!http_host.empty()) {
        config.http.host = http_host;
    }

    const auto http_port = GetEnv("CRONKEEPER_HTTP_PORT");
    if (!http_port.empty()) {
        config.http.port = ParseInt(http_port, config.http.port);
    }

    const auto log_level = GetEnv("CRONKEEPER_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.min_level = utils::LogLevelFromString(log_level, config.log.min_level);
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".cronkeeper" / "config.json";
}

std::string ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath().string();
    }
    if (path.rfind("~/", 0) == 0) {
        return (GetHomePath() / path.substr(2)).string();
    }
    return path;
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception&) {
            // Keep defaults on parse errors
        }
    }

    ApplyEnvOverrides(config);
    config.cron.store_path = ExpandHome(config.cron.store_path);
    return config;
}

Config LoadConfig() {
    return LoadConfigFromFile(GetConfigPath());
}

}  // namespace cronkeeper::config

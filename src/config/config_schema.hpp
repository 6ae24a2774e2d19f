#pragma once

#include <string>

#include "utils/logging.hpp"

namespace cronkeeper::config {

struct CronConfig {
    bool enabled = true;
    std::string store_path = "~/.cronkeeper/cron/jobs.json";
    long long stuck_run_ms = 2LL * 60 * 60 * 1000;
    int persist_attempts = 3;
};

struct HttpConfig {
    bool enabled = false;
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct Config {
    CronConfig cron;
    HttpConfig http;
    cronkeeper::utils::LogConfig log;
};

}  // namespace cronkeeper::config

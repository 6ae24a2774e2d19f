#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <unordered_map>

#include "config/config_loader.hpp"
#include "cron/cron_json.hpp"
#include "cron/cron_service.hpp"
#include "tools/cron_tool.hpp"
#include "utils/logging.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage: cronkeeper daemon\n"
              << "       cronkeeper <status|list|add|update|enable|disable|remove|run> [--key=value ...]\n"
              << "Examples:\n"
              << "  cronkeeper add --kind=cron --expr=\"0 9 * * *\" --message=\"daily report\"\n"
              << "  cronkeeper add --kind=every --every_seconds=300 --mode=reminder --message=ping\n"
              << "  cronkeeper run --id=<job id>" << std::endl;
}

std::unordered_map<std::string, std::string> ParseArgs(int argc, char** argv, int first) {
    std::unordered_map<std::string, std::string> params;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            continue;
        }
        arg = arg.substr(2);
        const auto eq = arg.find('=');
        if (eq != std::string::npos) {
            params[arg.substr(0, eq)] = arg.substr(eq + 1);
        } else if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
            params[arg] = argv[++i];
        } else {
            params[arg] = "true";
        }
    }
    return params;
}

// Stand-in executor for a standalone daemon: no agent is attached, so system
// events are logged and agent turns are reported as skipped.
cronkeeper::cron::ExecutionResult LogJob(const cronkeeper::cron::CronJob& job,
                                        const cronkeeper::cron::CancellationToken&) {
    cronkeeper::cron::ExecutionResult result;
    const auto& message = cronkeeper::cron::MessageOf(job.payload);
    if (cronkeeper::cron::KindOf(job.payload) == cronkeeper::cron::PayloadKind::SystemEvent) {
        cronkeeper::utils::LogInfo("job", "system event", {{"id", job.id}, {"message", message}});
        result.summary = message;
        return result;
    }
    cronkeeper::utils::LogWarn("job", "agent turn without an agent", {{"id", job.id}, {"message", message}});
    result.status = cronkeeper::cron::RunStatus::Skipped;
    result.summary = "no agent attached";
    return result;
}

cronkeeper::cron::CronServiceDeps BuildDeps(const cronkeeper::config::Config& config, bool enabled) {
    cronkeeper::cron::CronServiceDeps deps;
    deps.store_path = config.cron.store_path;
    deps.enabled = enabled;
    deps.stuck_run_ms = config.cron.stuck_run_ms;
    deps.persist_attempts = config.cron.persist_attempts;
    deps.execute_job = LogJob;
    return deps;
}

int RunDaemon(const cronkeeper::config::Config& config) {
    auto deps = BuildDeps(config, config.cron.enabled);
    deps.on_event = [](const cronkeeper::cron::CronEvent& event) {
        cronkeeper::utils::LogDebug("event", cronkeeper::cron::EventToJson(event).dump());
    };
    cronkeeper::cron::CronService service(std::move(deps));

    httplib::Server http_server;
    http_server.Get("/cron", [&service](const httplib::Request&, httplib::Response& res) {
        nlohmann::json json = nlohmann::json::array();
        for (const auto& job : service.List(true)) {
            json.push_back(cronkeeper::cron::JobToJson(job));
        }
        res.set_content(json.dump(2), "application/json");
    });
    http_server.Get("/cron/status", [&service](const httplib::Request&, httplib::Response& res) {
        const auto status = service.GetStatus();
        nlohmann::json json = {
            {"started", status.started},
            {"enabled", status.enabled},
            {"jobs", status.jobs},
            {"next_wake_at_ms", status.next_wake_at_ms.has_value() ? nlohmann::json(*status.next_wake_at_ms)
                                                                     : nlohmann::json(nullptr)}
        };
        res.set_content(json.dump(2), "application/json");
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);

    std::thread http_thread;
    if (config.http.enabled) {
        const std::string host = config.http.host;
        const int port = config.http.port;
        http_thread = std::thread([&http_server, host, port]() {
            if (!http_server.listen(host, port)) {
                cronkeeper::utils::LogError("http", "failed to listen",
                                            {{"host", host}, {"port", std::to_string(port)}});
            }
        });
    }

    service.Start();
    std::cout << "cronkeeper daemon started. Press Ctrl+C to stop." << std::endl;

    bool running = true;
    while (running) {
        if (g_signal != 0) {
            const int signal = g_signal;
            g_signal = 0;
            if (signal == SIGHUP) {
                service.Reload();
            } else {
                running = false;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    service.Stop();
    if (http_thread.joinable()) {
        http_server.stop();
        http_thread.join();
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }

    const auto config = cronkeeper::config::LoadConfig();
    cronkeeper::utils::SetLogConfig(config.log);

    const std::string command = argv[1];
    if (command == "daemon") {
        return RunDaemon(config);
    }
    if (command == "help" || command == "--help" || command == "-h") {
        PrintUsage();
        return 0;
    }

    // One-shot commands edit the store without arming a timer; a running
    // daemon picks the changes up on SIGHUP.
    cronkeeper::cron::CronService service(BuildDeps(config, false));
    cronkeeper::tools::CronTool tool(&service);

    auto params = ParseArgs(argc, argv, 2);
    params["action"] = command;
    const auto output = tool.Execute(params);
    std::cout << output << std::endl;
    return output.rfind("Error:", 0) == 0 ? 1 : 0;
}

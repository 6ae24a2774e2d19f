#pragma once

#include <string>
#include <unordered_map>

#include "cron/cron_service.hpp"
#include "tools/tool.hpp"

namespace cronkeeper::tools {

// String-parameter facade over CronService for agent tool calls and the CLI.
// Replies are JSON documents, or "Error: ..." lines.
class CronTool : public Tool {
public:
    explicit CronTool(cronkeeper::cron::CronService* cron);

    // Delivery target used by agentTurn jobs that do not name one.
    void SetContext(const std::string& channel, const std::string& to);

    std::string Name() const override { return "cron"; }
    std::string Description() const override { return "Manage scheduled jobs."; }
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    std::string HandleAdd(const std::unordered_map<std::string, std::string>& params);
    std::string HandleUpdate(const std::unordered_map<std::string, std::string>& params);

    cronkeeper::cron::CronService* cron_ = nullptr;
    std::string default_channel_;
    std::string default_to_;
};

}  // namespace cronkeeper::tools

#include "tools/cron_tool.hpp"

#include <ctime>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>

#include "nlohmann/json.hpp"

#include "cron/cron_json.hpp"
#include "cron/cron_schedule.hpp"
#include "utils/common.hpp"

namespace cronkeeper::tools {
namespace {

using Params = std::unordered_map<std::string, std::string>;
namespace cron = cronkeeper::cron;

std::string GetParam(const Params& params, const std::string& name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return {};
    }
    return it->second;
}

std::string GetParamAlias(const Params& params, const std::string& primary, const std::string& fallback) {
    auto value = GetParam(params, primary);
    if (!value.empty()) {
        return value;
    }
    return GetParam(params, fallback);
}

std::optional<std::string> GetOptionalParam(const Params& params, const std::string& name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<long long> ParseLongLong(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> ParseOptionalBool(const Params& params, const std::string& name) {
    const auto value = GetOptionalParam(params, name);
    if (!value.has_value() || value->empty()) {
        return std::nullopt;
    }
    return utils::ParseBool(value.value());
}

// Local wall-clock time "YYYY-MM-DDTHH:MM:SS".
std::optional<long long> ParseIsoMs(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    std::tm tm{};
    std::istringstream ss(value);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    tm.tm_isdst = -1;
    const auto seconds = std::mktime(&tm);
    if (seconds < 0) {
        return std::nullopt;
    }
    return static_cast<long long>(seconds) * 1000;
}

nlohmann::json OptionalMs(const std::optional<long long>& value) {
    return value.has_value() ? nlohmann::json(value.value()) : nlohmann::json(nullptr);
}

nlohmann::json BuildJobJson(const cron::CronJob& job) {
    auto json = cron::JobToJson(job);
    json["scheduleText"] = cron::FormatSchedule(job.schedule);
    return json;
}

// Reads kind/at/every/expr parameters; nullopt with `error` set on bad input.
std::optional<cron::CronSchedule> BuildSchedule(const Params& params, const std::string& kind, std::string& error) {
    if (kind.empty() || kind == "every") {
        auto every_ms = ParseLongLong(GetParam(params, "every_ms"));
        if (!every_ms.has_value()) {
            const auto every_s = ParseLongLong(GetParamAlias(params, "every_seconds", "every_s"));
            if (every_s.has_value() && every_s.value() > 0) {
                if (every_s.value() > std::numeric_limits<long long>::max() / 1000) {
                    error = "every_seconds is too large";
                    return std::nullopt;
                }
                every_ms = every_s.value() * 1000;
            }
        }
        if (!every_ms.has_value() || every_ms.value() <= 0) {
            error = "every_ms or every_seconds is required for kind=every";
            return std::nullopt;
        }
        return cron::CronSchedule::Every(every_ms.value(), ParseLongLong(GetParam(params, "anchor_ms")));
    }
    if (kind == "at") {
        auto at_ms = ParseLongLong(GetParam(params, "at_ms"));
        if (!at_ms.has_value()) {
            at_ms = ParseIsoMs(GetParam(params, "at"));
        }
        if (!at_ms.has_value()) {
            error = "at or at_ms is required for kind=at";
            return std::nullopt;
        }
        return cron::CronSchedule::At(at_ms.value());
    }
    if (kind == "cron") {
        const auto expr = GetParamAlias(params, "expr", "cron_expr");
        if (expr.empty()) {
            error = "expr is required for kind=cron";
            return std::nullopt;
        }
        return cron::CronSchedule::Cron(expr, GetParam(params, "tz"));
    }
    error = "invalid kind";
    return std::nullopt;
}

}  // namespace

CronTool::CronTool(cronkeeper::cron::CronService* cron)
    : cron_(cron) {}

void CronTool::SetContext(const std::string& channel, const std::string& to) {
    default_channel_ = channel;
    default_to_ = to;
}

std::string CronTool::ParametersJson() const {
    return R"({"type":"object","properties":{"action":{"type":"string","enum":["add","update","list","remove","enable","disable","run","status"]},"job_id":{"type":"string"},"id":{"type":"string"},"name":{"type":"string"},"description":{"type":"string"},"mode":{"type":"string","enum":["reminder","task"]},"kind":{"type":"string","enum":["at","every","cron"]},"at":{"type":"string","description":"ISO local time: YYYY-MM-DDTHH:MM:SS"},"at_ms":{"type":"integer"},"every_seconds":{"type":"integer"},"every_ms":{"type":"integer"},"anchor_ms":{"type":"integer"},"expr":{"type":"string","description":"5 or 6 field cron expression, e.g. '0 9 * * *'"},"tz":{"type":"string"},"message":{"type":"string"},"model":{"type":"string"},"timeout_seconds":{"type":"integer"},"deliver":{"type":"boolean"},"channel":{"type":"string"},"to":{"type":"string"},"delete_after_run":{"type":"boolean"},"include_disabled":{"type":"boolean"},"force":{"type":"boolean"},"enabled":{"type":"boolean"}},"required":["action"]})";
}

std::string CronTool::Execute(const Params& params) {
    if (!cron_) {
        return "Error: cron service not configured";
    }
    const auto action_raw = GetParam(params, "action");
    if (action_raw.empty()) {
        return "Error: action is required";
    }
    const auto action = utils::ToLower(action_raw);

    if (action == "status") {
        const auto status = cron_->GetStatus();
        nlohmann::json json = {
            {"started", status.started},
            {"enabled", status.enabled},
            {"jobs", status.jobs},
            {"next_wake_at_ms", OptionalMs(status.next_wake_at_ms)}
        };
        return json.dump(2);
    }

    if (action == "list") {
        const bool include_disabled = ParseOptionalBool(params, "include_disabled").value_or(true);
        nlohmann::json json = nlohmann::json::array();
        for (const auto& job : cron_->List(include_disabled)) {
            json.push_back(BuildJobJson(job));
        }
        return json.dump(2);
    }

    if (action == "add") {
        return HandleAdd(params);
    }

    if (action == "update") {
        return HandleUpdate(params);
    }

    const auto id = GetParamAlias(params, "job_id", "id");
    if (id.empty()) {
        return "Error: id is required";
    }

    if (action == "remove") {
        return cron_->Remove(id) ? "OK" : "Error: job not found";
    }

    if (action == "enable" || action == "disable") {
        cron::CronJobUpdate patch;
        patch.enabled = ParseOptionalBool(params, "enabled").value_or(action == "enable");
        const auto result = cron_->Update(id, patch);
        if (!result.ok()) {
            return "Error: " + result.error;
        }
        nlohmann::json json = {
            {"id", result.value->id},
            {"enabled", result.value->enabled},
            {"next_run_at_ms", OptionalMs(result.value->state.next_run_at_ms)}
        };
        return json.dump(2);
    }

    if (action == "run") {
        const bool force = ParseOptionalBool(params, "force").value_or(true);
        const auto result = cron_->Run(id, force);
        if (!result.found) {
            return "Error: job not found";
        }
        nlohmann::json json = {
            {"status", cron::ToString(result.status)},
            {"error", result.error.has_value() ? nlohmann::json(*result.error) : nlohmann::json(nullptr)},
            {"summary", result.summary.has_value() ? nlohmann::json(*result.summary) : nlohmann::json(nullptr)}
        };
        return json.dump(2);
    }

    return "Error: unsupported action";
}

std::string CronTool::HandleAdd(const Params& params) {
    cron::CronJobCreate input;
    input.name = GetParam(params, "name");
    input.description = GetOptionalParam(params, "description");

    const auto message = GetParam(params, "message");
    if (message.empty()) {
        return "Error: message is required";
    }
    if (input.name.empty()) {
        input.name = message.substr(0, 40);
    }

    const auto mode = utils::ToLower(GetParam(params, "mode"));
    if (mode == "reminder") {
        input.payload = cron::SystemEventPayload{message};
    } else {
        cron::AgentTurnPayload agent;
        agent.message = message;
        if (const auto model = GetOptionalParam(params, "model"); model && !model->empty()) {
            agent.model = model;
        }
        if (const auto timeout = ParseLongLong(GetParam(params, "timeout_seconds"))) {
            agent.timeout_seconds = static_cast<int>(timeout.value());
        }
        agent.deliver = ParseOptionalBool(params, "deliver");
        const auto channel = GetParam(params, "channel");
        const auto to = GetParam(params, "to");
        if (!channel.empty() || !default_channel_.empty()) {
            agent.channel = channel.empty() ? default_channel_ : channel;
        }
        if (!to.empty() || !default_to_.empty()) {
            agent.to = to.empty() ? default_to_ : to;
        }
        input.payload = agent;
    }

    const auto kind = utils::ToLower(GetParam(params, "kind"));
    std::string error;
    const auto schedule = BuildSchedule(params, kind, error);
    if (!schedule.has_value()) {
        return "Error: " + error;
    }
    input.schedule = schedule.value();
    input.delete_after_run = ParseOptionalBool(params, "delete_after_run")
                                 .value_or(schedule->kind == cron::CronScheduleKind::At);

    const auto result = cron_->Add(input);
    if (!result.ok()) {
        return "Error: " + result.error;
    }
    const auto& added = result.value.value();
    nlohmann::json json = {
        {"id", added.id},
        {"name", added.name},
        {"enabled", added.enabled},
        {"schedule", cron::FormatSchedule(added.schedule)},
        {"next_run_at_ms", OptionalMs(added.state.next_run_at_ms)}
    };
    return json.dump(2);
}

std::string CronTool::HandleUpdate(const Params& params) {
    const auto id = GetParamAlias(params, "job_id", "id");
    if (id.empty()) {
        return "Error: id is required";
    }

    cron::CronJobUpdate patch;
    if (const auto name = GetOptionalParam(params, "name"); name && !name->empty()) {
        patch.name = name;
    }
    patch.description = GetOptionalParam(params, "description");
    patch.enabled = ParseOptionalBool(params, "enabled");
    patch.delete_after_run = ParseOptionalBool(params, "delete_after_run");

    const auto kind = utils::ToLower(GetParam(params, "kind"));
    if (!kind.empty()) {
        std::string error;
        patch.schedule = BuildSchedule(params, kind, error);
        if (!patch.schedule.has_value()) {
            return "Error: " + error;
        }
    }

    cron::PayloadPatch payload;
    bool has_payload = false;
    const auto mode = utils::ToLower(GetParam(params, "mode"));
    if (!mode.empty()) {
        payload.kind = mode == "reminder" ? cron::PayloadKind::SystemEvent : cron::PayloadKind::AgentTurn;
        has_payload = true;
    }
    if (const auto message = GetOptionalParam(params, "message"); message && !message->empty()) {
        payload.message = message;
        has_payload = true;
    }
    if (const auto model = GetOptionalParam(params, "model"); model && !model->empty()) {
        payload.model = model;
        has_payload = true;
    }
    if (const auto timeout = ParseLongLong(GetParam(params, "timeout_seconds"))) {
        payload.timeout_seconds = static_cast<int>(timeout.value());
        has_payload = true;
    }
    if (const auto deliver = ParseOptionalBool(params, "deliver")) {
        payload.deliver = deliver;
        has_payload = true;
    }
    if (const auto channel = GetOptionalParam(params, "channel"); channel && !channel->empty()) {
        payload.channel = channel;
        has_payload = true;
    }
    if (const auto to = GetOptionalParam(params, "to"); to && !to->empty()) {
        payload.to = to;
        has_payload = true;
    }
    if (has_payload) {
        patch.payload = payload;
    }

    const auto result = cron_->Update(id, patch);
    if (!result.ok()) {
        return "Error: " + result.error;
    }
    return BuildJobJson(result.value.value()).dump(2);
}

}  // namespace cronkeeper::tools

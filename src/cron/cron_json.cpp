#include "cron/cron_json.hpp"

#include <stdexcept>
#include <string>

namespace cronkeeper::cron {
namespace {

template <typename T>
void PutOptional(nlohmann::json& json, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        json[key] = value.value();
    }
}

template <typename T>
std::optional<T> GetOptional(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json[key].is_null()) {
        return std::nullopt;
    }
    return json[key].get<T>();
}

const nlohmann::json& RequireObject(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || !json[key].is_object()) {
        throw std::invalid_argument(std::string("missing object: ") + key);
    }
    return json[key];
}

}  // namespace

nlohmann::json ScheduleToJson(const CronSchedule& schedule) {
    nlohmann::json json = nlohmann::json::object();
    json["kind"] = ToString(schedule.kind);
    switch (schedule.kind) {
        case CronScheduleKind::At:
            PutOptional(json, "atMs", schedule.at_ms);
            break;
        case CronScheduleKind::Every:
            PutOptional(json, "everyMs", schedule.every_ms);
            PutOptional(json, "anchorMs", schedule.anchor_ms);
            break;
        case CronScheduleKind::Cron:
            json["expr"] = schedule.expr;
            if (!schedule.tz.empty()) {
                json["tz"] = schedule.tz;
            }
            break;
    }
    return json;
}

nlohmann::json PayloadToJson(const CronPayload& payload) {
    nlohmann::json json = nlohmann::json::object();
    json["kind"] = ToString(KindOf(payload));
    if (const auto* agent = std::get_if<AgentTurnPayload>(&payload)) {
        json["message"] = agent->message;
        PutOptional(json, "model", agent->model);
        PutOptional(json, "timeoutSeconds", agent->timeout_seconds);
        PutOptional(json, "deliver", agent->deliver);
        PutOptional(json, "channel", agent->channel);
        PutOptional(json, "to", agent->to);
    } else {
        json["message"] = std::get<SystemEventPayload>(payload).message;
    }
    return json;
}

nlohmann::json StateToJson(const CronJobState& state) {
    nlohmann::json json = nlohmann::json::object();
    PutOptional(json, "nextRunAtMs", state.next_run_at_ms);
    PutOptional(json, "lastRunAtMs", state.last_run_at_ms);
    if (state.last_status.has_value()) {
        json["lastStatus"] = ToString(state.last_status.value());
    }
    PutOptional(json, "lastDurationMs", state.last_duration_ms);
    PutOptional(json, "lastError", state.last_error);
    PutOptional(json, "runningAtMs", state.running_at_ms);
    json["runCount"] = state.run_count;
    return json;
}

nlohmann::json JobToJson(const CronJob& job) {
    nlohmann::json json = nlohmann::json::object();
    json["id"] = job.id;
    json["name"] = job.name;
    PutOptional(json, "description", job.description);
    json["enabled"] = job.enabled;
    json["schedule"] = ScheduleToJson(job.schedule);
    json["payload"] = PayloadToJson(job.payload);
    json["createdAtMs"] = job.created_at_ms;
    json["updatedAtMs"] = job.updated_at_ms;
    if (job.delete_after_run) {
        json["deleteAfterRun"] = true;
    }
    json["state"] = StateToJson(job.state);
    return json;
}

nlohmann::json StoreToJson(const CronStoreFile& store) {
    nlohmann::json json = nlohmann::json::object();
    json["version"] = store.version;
    json["jobs"] = nlohmann::json::array();
    for (const auto& job : store.jobs) {
        json["jobs"].push_back(JobToJson(job));
    }
    return json;
}

nlohmann::json EventToJson(const CronEvent& event) {
    nlohmann::json json = nlohmann::json::object();
    json["jobId"] = event.job_id;
    json["action"] = ToString(event.action);
    json["timestamp"] = event.timestamp;
    PutOptional(json, "runAtMs", event.run_at_ms);
    PutOptional(json, "durationMs", event.duration_ms);
    if (event.status.has_value()) {
        json["status"] = ToString(event.status.value());
    }
    PutOptional(json, "error", event.error);
    PutOptional(json, "summary", event.summary);
    PutOptional(json, "nextRunAtMs", event.next_run_at_ms);
    return json;
}

CronSchedule ScheduleFromJson(const nlohmann::json& json) {
    const auto kind = ScheduleKindFromString(json.value("kind", ""));
    if (!kind.has_value()) {
        throw std::invalid_argument("unknown schedule kind");
    }
    CronSchedule schedule;
    schedule.kind = kind.value();
    schedule.at_ms = GetOptional<long long>(json, "atMs");
    schedule.every_ms = GetOptional<long long>(json, "everyMs");
    schedule.anchor_ms = GetOptional<long long>(json, "anchorMs");
    schedule.expr = GetOptional<std::string>(json, "expr").value_or("");
    schedule.tz = GetOptional<std::string>(json, "tz").value_or("");
    return schedule;
}

CronPayload PayloadFromJson(const nlohmann::json& json) {
    const auto kind = PayloadKindFromString(json.value("kind", ""));
    if (!kind.has_value()) {
        throw std::invalid_argument("unknown payload kind");
    }
    const auto message = GetOptional<std::string>(json, "message").value_or("");
    if (kind.value() == PayloadKind::SystemEvent) {
        return SystemEventPayload{message};
    }
    AgentTurnPayload agent;
    agent.message = message;
    agent.model = GetOptional<std::string>(json, "model");
    agent.timeout_seconds = GetOptional<int>(json, "timeoutSeconds");
    agent.deliver = GetOptional<bool>(json, "deliver");
    agent.channel = GetOptional<std::string>(json, "channel");
    agent.to = GetOptional<std::string>(json, "to");
    return agent;
}

CronJobState StateFromJson(const nlohmann::json& json) {
    CronJobState state;
    state.next_run_at_ms = GetOptional<long long>(json, "nextRunAtMs");
    state.last_run_at_ms = GetOptional<long long>(json, "lastRunAtMs");
    const auto status = GetOptional<std::string>(json, "lastStatus");
    if (status.has_value()) {
        state.last_status = RunStatusFromString(status.value());
    }
    state.last_duration_ms = GetOptional<long long>(json, "lastDurationMs");
    state.last_error = GetOptional<std::string>(json, "lastError");
    state.running_at_ms = GetOptional<long long>(json, "runningAtMs");
    state.run_count = GetOptional<long long>(json, "runCount").value_or(0);
    return state;
}

CronJob JobFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("job is not an object");
    }
    CronJob job;
    job.id = json.at("id").get<std::string>();
    if (job.id.empty()) {
        throw std::invalid_argument("job id is empty");
    }
    job.name = GetOptional<std::string>(json, "name").value_or("");
    job.description = GetOptional<std::string>(json, "description");
    job.enabled = GetOptional<bool>(json, "enabled").value_or(true);
    job.schedule = ScheduleFromJson(RequireObject(json, "schedule"));
    job.payload = PayloadFromJson(RequireObject(json, "payload"));
    job.created_at_ms = GetOptional<long long>(json, "createdAtMs").value_or(0);
    job.updated_at_ms = GetOptional<long long>(json, "updatedAtMs").value_or(job.created_at_ms);
    job.delete_after_run = GetOptional<bool>(json, "deleteAfterRun").value_or(false);
    if (json.contains("state") && json["state"].is_object()) {
        job.state = StateFromJson(json["state"]);
    }
    return job;
}

CronStoreFile StoreFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("store is not an object");
    }
    if (!json.contains("version") || !json["version"].is_number_integer() ||
        json["version"].get<int>() != 1) {
        throw std::invalid_argument("unsupported store version");
    }
    if (!json.contains("jobs") || !json["jobs"].is_array()) {
        throw std::invalid_argument("store has no jobs array");
    }
    CronStoreFile store;
    store.version = 1;
    for (const auto& item : json["jobs"]) {
        store.jobs.push_back(JobFromJson(item));
    }
    return store;
}

}  // namespace cronkeeper::cron

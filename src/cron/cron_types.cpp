#include "cron/cron_types.hpp"

#include <utility>

namespace cronkeeper::cron {

CronSchedule CronSchedule::At(long long at_ms) {
    CronSchedule schedule;
    schedule.kind = CronScheduleKind::At;
    schedule.at_ms = at_ms;
    return schedule;
}

CronSchedule CronSchedule::Every(long long every_ms, std::optional<long long> anchor_ms) {
    CronSchedule schedule;
    schedule.kind = CronScheduleKind::Every;
    schedule.every_ms = every_ms;
    schedule.anchor_ms = anchor_ms;
    return schedule;
}

CronSchedule CronSchedule::Cron(std::string expr, std::string tz) {
    CronSchedule schedule;
    schedule.kind = CronScheduleKind::Cron;
    schedule.expr = std::move(expr);
    schedule.tz = std::move(tz);
    return schedule;
}

PayloadKind KindOf(const CronPayload& payload) {
    return std::holds_alternative<AgentTurnPayload>(payload) ? PayloadKind::AgentTurn
                                                             : PayloadKind::SystemEvent;
}

const std::string& MessageOf(const CronPayload& payload) {
    if (const auto* agent = std::get_if<AgentTurnPayload>(&payload)) {
        return agent->message;
    }
    return std::get<SystemEventPayload>(payload).message;
}

const char* ToString(CronScheduleKind kind) {
    switch (kind) {
        case CronScheduleKind::At:
            return "at";
        case CronScheduleKind::Every:
            return "every";
        case CronScheduleKind::Cron:
            return "cron";
    }
    return "every";
}

std::optional<CronScheduleKind> ScheduleKindFromString(const std::string& value) {
    if (value == "at") {
        return CronScheduleKind::At;
    }
    if (value == "every") {
        return CronScheduleKind::Every;
    }
    if (value == "cron") {
        return CronScheduleKind::Cron;
    }
    return std::nullopt;
}

const char* ToString(PayloadKind kind) {
    switch (kind) {
        case PayloadKind::SystemEvent:
            return "systemEvent";
        case PayloadKind::AgentTurn:
            return "agentTurn";
    }
    return "systemEvent";
}

std::optional<PayloadKind> PayloadKindFromString(const std::string& value) {
    if (value == "systemEvent") {
        return PayloadKind::SystemEvent;
    }
    if (value == "agentTurn") {
        return PayloadKind::AgentTurn;
    }
    return std::nullopt;
}

const char* ToString(RunStatus status) {
    switch (status) {
        case RunStatus::Ok:
            return "ok";
        case RunStatus::Error:
            return "error";
        case RunStatus::Skipped:
            return "skipped";
        case RunStatus::Cancelled:
            return "cancelled";
    }
    return "error";
}

std::optional<RunStatus> RunStatusFromString(const std::string& value) {
    if (value == "ok") {
        return RunStatus::Ok;
    }
    if (value == "error") {
        return RunStatus::Error;
    }
    if (value == "skipped") {
        return RunStatus::Skipped;
    }
    if (value == "cancelled") {
        return RunStatus::Cancelled;
    }
    return std::nullopt;
}

const char* ToString(CronEventAction action) {
    switch (action) {
        case CronEventAction::Added:
            return "added";
        case CronEventAction::Updated:
            return "updated";
        case CronEventAction::Removed:
            return "removed";
        case CronEventAction::Started:
            return "started";
        case CronEventAction::Finished:
            return "finished";
    }
    return "updated";
}

const char* ToString(CronErrorCode code) {
    switch (code) {
        case CronErrorCode::kNone:
            return "none";
        case CronErrorCode::kNotFound:
            return "not_found";
        case CronErrorCode::kInvalidSchedule:
            return "invalid_schedule";
        case CronErrorCode::kInvalidPayload:
            return "invalid_payload";
    }
    return "none";
}

}  // namespace cronkeeper::cron

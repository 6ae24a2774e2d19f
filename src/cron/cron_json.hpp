#pragma once

#include "nlohmann/json.hpp"

#include "cron/cron_types.hpp"

namespace cronkeeper::cron {

nlohmann::json ScheduleToJson(const CronSchedule& schedule);
nlohmann::json PayloadToJson(const CronPayload& payload);
nlohmann::json StateToJson(const CronJobState& state);
nlohmann::json JobToJson(const CronJob& job);
nlohmann::json StoreToJson(const CronStoreFile& store);
nlohmann::json EventToJson(const CronEvent& event);

// The decoders throw nlohmann::json::exception or std::invalid_argument on
// malformed input.
CronSchedule ScheduleFromJson(const nlohmann::json& json);
CronPayload PayloadFromJson(const nlohmann::json& json);
CronJobState StateFromJson(const nlohmann::json& json);
CronJob JobFromJson(const nlohmann::json& json);
CronStoreFile StoreFromJson(const nlohmann::json& json);

}  // namespace cronkeeper::cron

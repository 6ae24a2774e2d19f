#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cron/cron_types.hpp"

namespace cronkeeper::cron {

// Admissible values per cron field, each sorted ascending.
struct CronFields {
    std::vector<int> seconds;
    std::vector<int> minutes;
    std::vector<int> hours;
    std::vector<int> days;
    std::vector<int> months;
    std::vector<int> weekdays;

    bool AnyEmpty() const;
};

struct CronValidation {
    bool valid = false;
    std::string error;
};

// Tokens that do not parse contribute no values; they are not errors.
std::vector<int> ParseCronField(const std::string& field, int min, int max);

// Accepts "min hour dom month dow" (second fixed to 0) or
// "sec min hour dom month dow". Any other field count yields nullopt.
std::optional<CronFields> ParseCronExpression(const std::string& expr);

// Day-of-month and weekday are both required to match (AND), unlike POSIX
// cron which ORs them when both are restricted.
std::optional<long long> ComputeNextCronRun(const std::string& expr, long long now_ms);

std::optional<long long> ComputeNextRun(const CronSchedule& schedule, long long now_ms);

// Disabled jobs never run; an interval without an explicit anchor is aligned
// to the job's creation time.
std::optional<long long> ComputeJobNextRun(const CronJob& job, long long now_ms);

CronValidation ValidateCronExpr(const std::string& expr, long long now_ms);

std::optional<std::string> ValidateSchedule(const CronSchedule& schedule, long long now_ms);

std::string FormatSchedule(const CronSchedule& schedule);

std::string FormatIsoUtc(long long ms);

}  // namespace cronkeeper::cron

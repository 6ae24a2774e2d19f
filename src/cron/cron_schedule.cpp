#include "cron/cron_schedule.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>
#include <utility>

#include "croncpp.h"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace cronkeeper::cron {
namespace {

// Leading-integer parse: "12abc" -> 12, "abc" -> nullopt.
std::optional<long long> ParseLeadingInt(const std::string& value) {
    std::size_t pos = 0;
    while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos]))) {
        ++pos;
    }
    bool negative = false;
    if (pos < value.size() && (value[pos] == '+' || value[pos] == '-')) {
        negative = value[pos] == '-';
        ++pos;
    }
    const auto digits_start = pos;
    long long result = 0;
    while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
        if (result < 1000000000LL) {
            result = result * 10 + (value[pos] - '0');
        }
        ++pos;
    }
    if (pos == digits_start) {
        return std::nullopt;
    }
    return negative ? -result : result;
}

std::pair<std::string, std::string> SplitOnce(const std::string& value, char delimiter) {
    const auto pos = value.find(delimiter);
    if (pos == std::string::npos) {
        return {value, std::string()};
    }
    auto rest = value.substr(pos + 1);
    const auto next = rest.find(delimiter);
    if (next != std::string::npos) {
        rest = rest.substr(0, next);
    }
    return {value.substr(0, pos), rest};
}

void AddRange(std::set<int>& values, long long start, long long end, long long step, int min, int max) {
    if (step <= 0) {
        return;
    }
    const long long bounded_end = std::min<long long>(end, max);
    for (long long i = start; i <= bounded_end; i += step) {
        if (i >= min) {
            values.insert(static_cast<int>(i));
        }
    }
}

std::string FieldToCroncpp(const std::vector<int>& values, int min, int max) {
    if (static_cast<int>(values.size()) == max - min + 1) {
        return "*";
    }
    std::vector<std::string> items;
    items.reserve(values.size());
    for (const auto value : values) {
        items.push_back(std::to_string(value));
    }
    return utils::Join(items, ",");
}

std::string ToCroncppExpression(const CronFields& fields) {
    std::ostringstream oss;
    oss << FieldToCroncpp(fields.seconds, 0, 59) << ' '
        << FieldToCroncpp(fields.minutes, 0, 59) << ' '
        << FieldToCroncpp(fields.hours, 0, 23) << ' '
        << FieldToCroncpp(fields.days, 1, 31) << ' '
        << FieldToCroncpp(fields.months, 1, 12) << ' '
        << FieldToCroncpp(fields.weekdays, 0, 6);
    return oss.str();
}

long long FloorDiv(long long value, long long divisor) {
    long long quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

}  // namespace

bool CronFields::AnyEmpty() const {
    return seconds.empty() || minutes.empty() || hours.empty() ||
           days.empty() || months.empty() || weekdays.empty();
}

std::vector<int> ParseCronField(const std::string& field, int min, int max) {
    std::set<int> values;
    std::stringstream stream(field);
    std::string part;
    while (std::getline(stream, part, ',')) {
        const auto trimmed = utils::Trim(part);
        if (trimmed.find('/') != std::string::npos) {
            const auto [range_part, step_part] = SplitOnce(trimmed, '/');
            const auto step = ParseLeadingInt(step_part);
            if (!step.has_value() || step.value() <= 0) {
                continue;
            }
            std::optional<long long> start = min;
            std::optional<long long> end = max;
            if (range_part != "*") {
                if (range_part.find('-') != std::string::npos) {
                    const auto [a, b] = SplitOnce(range_part, '-');
                    start = ParseLeadingInt(a);
                    end = ParseLeadingInt(b);
                } else {
                    start = ParseLeadingInt(range_part);
                }
            }
            if (start.has_value() && end.has_value()) {
                AddRange(values, start.value(), end.value(), step.value(), min, max);
            }
        } else if (trimmed.find('-') != std::string::npos) {
            const auto [a, b] = SplitOnce(trimmed, '-');
            const auto start = ParseLeadingInt(a);
            const auto end = ParseLeadingInt(b);
            if (start.has_value() && end.has_value()) {
                AddRange(values, start.value(), end.value(), 1, min, max);
            }
        } else if (trimmed == "*") {
            AddRange(values, min, max, 1, min, max);
        } else {
            const auto value = ParseLeadingInt(trimmed);
            if (value.has_value() && value.value() >= min && value.value() <= max) {
                values.insert(static_cast<int>(value.value()));
            }
        }
    }
    return std::vector<int>(values.begin(), values.end());
}

std::optional<CronFields> ParseCronExpression(const std::string& expr) {
    const auto parts = utils::SplitWhitespace(expr);
    CronFields fields;
    std::size_t offset = 0;
    if (parts.size() == 6) {
        fields.seconds = ParseCronField(parts[0], 0, 59);
        offset = 1;
    } else if (parts.size() == 5) {
        fields.seconds = {0};
    } else {
        return std::nullopt;
    }
    fields.minutes = ParseCronField(parts[offset], 0, 59);
    fields.hours = ParseCronField(parts[offset + 1], 0, 23);
    fields.days = ParseCronField(parts[offset + 2], 1, 31);
    fields.months = ParseCronField(parts[offset + 3], 1, 12);
    fields.weekdays = ParseCronField(parts[offset + 4], 0, 6);
    return fields;
}

std::optional<long long> ComputeNextCronRun(const std::string& expr, long long now_ms) {
    const auto fields = ParseCronExpression(expr);
    if (!fields.has_value() || fields->AnyEmpty()) {
        return std::nullopt;
    }
    try {
        const auto cron_expr = ::cron::make_cron(ToCroncppExpression(*fields));
        const auto now_s = static_cast<std::time_t>(FloorDiv(now_ms, 1000));
        const std::time_t next_s = ::cron::cron_next(cron_expr, now_s);
        if (next_s <= now_s) {
            return std::nullopt;
        }
        const auto next_ms = static_cast<long long>(next_s) * 1000;
        if (next_ms >= now_ms + kCronSearchHorizonMs) {
            return std::nullopt;
        }
        return next_ms;
    } catch (const ::cron::bad_cronexpr& ex) {
        utils::LogDebug("cron", "expression rejected", {{"expr", expr}, {"error", ex.what()}});
        return std::nullopt;
    }
}

std::optional<long long> ComputeNextRun(const CronSchedule& schedule, long long now_ms) {
    switch (schedule.kind) {
        case CronScheduleKind::At:
            if (schedule.at_ms.has_value() && schedule.at_ms.value() > now_ms) {
                return schedule.at_ms;
            }
            return std::nullopt;
        case CronScheduleKind::Every: {
            if (!schedule.every_ms.has_value() || schedule.every_ms.value() <= 0) {
                return std::nullopt;
            }
            const auto every = schedule.every_ms.value();
            const auto anchor = schedule.anchor_ms.value_or(now_ms);
            if (now_ms < anchor) {
                return anchor;
            }
            constexpr auto kMax = std::numeric_limits<long long>::max();
            if (anchor < 0 && now_ms > kMax + anchor) {
                return std::nullopt;
            }
            const auto step = every - (now_ms - anchor) % every;
            if (now_ms > 0 && step > kMax - now_ms) {
                return std::nullopt;
            }
            return now_ms + step;
        }
        case CronScheduleKind::Cron:
            return ComputeNextCronRun(schedule.expr, now_ms);
    }
    return std::nullopt;
}

std::optional<long long> ComputeJobNextRun(const CronJob& job, long long now_ms) {
    if (!job.enabled) {
        return std::nullopt;
    }
    if (job.schedule.kind == CronScheduleKind::Every && !job.schedule.anchor_ms.has_value()) {
        auto anchored = job.schedule;
        anchored.anchor_ms = job.created_at_ms;
        return ComputeNextRun(anchored, now_ms);
    }
    return ComputeNextRun(job.schedule, now_ms);
}

CronValidation ValidateCronExpr(const std::string& expr, long long now_ms) {
    const auto parts = utils::SplitWhitespace(expr);
    if (parts.size() != 5 && parts.size() != 6) {
        return {false, "Expected 5 or 6 fields, got " + std::to_string(parts.size())};
    }
    if (!ComputeNextCronRun(expr, now_ms).has_value()) {
        return {false, "Expression never matches (within 2 years)"};
    }
    return {true, {}};
}

std::optional<std::string> ValidateSchedule(const CronSchedule& schedule, long long now_ms) {
    switch (schedule.kind) {
        case CronScheduleKind::At:
            if (!schedule.at_ms.has_value()) {
                return std::string("at schedule requires atMs");
            }
            return std::nullopt;
        case CronScheduleKind::Every:
            if (!schedule.every_ms.has_value() || schedule.every_ms.value() <= 0) {
                return std::string("every schedule requires a positive everyMs");
            }
            return std::nullopt;
        case CronScheduleKind::Cron: {
            const auto validation = ValidateCronExpr(schedule.expr, now_ms);
            if (!validation.valid) {
                return "invalid cron expression: " + validation.error;
            }
            return std::nullopt;
        }
    }
    return std::string("unknown schedule kind");
}

std::string FormatIsoUtc(long long ms) {
    const auto seconds = static_cast<std::time_t>(FloorDiv(ms, 1000));
    const auto millis = ms - static_cast<long long>(seconds) * 1000;
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

std::string FormatSchedule(const CronSchedule& schedule) {
    switch (schedule.kind) {
        case CronScheduleKind::At:
            return "Once at " + FormatIsoUtc(schedule.at_ms.value_or(0));
        case CronScheduleKind::Every: {
            const auto ms = static_cast<double>(schedule.every_ms.value_or(0));
            if (ms >= kDayMs) {
                return "Every " + std::to_string(std::llround(ms / kDayMs)) + "d";
            }
            if (ms >= kHourMs) {
                return "Every " + std::to_string(std::llround(ms / kHourMs)) + "h";
            }
            if (ms >= kMinuteMs) {
                return "Every " + std::to_string(std::llround(ms / kMinuteMs)) + "m";
            }
            return "Every " + std::to_string(std::llround(ms / kSecondMs)) + "s";
        }
        case CronScheduleKind::Cron:
            return "Cron: " + schedule.expr + (schedule.tz.empty() ? "" : " (" + schedule.tz + ")");
    }
    return "Unknown schedule";
}

}  // namespace cronkeeper::cron

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cronkeeper::cron {

constexpr long long kSecondMs = 1000;
constexpr long long kMinuteMs = 60 * kSecondMs;
constexpr long long kHourMs = 60 * kMinuteMs;
constexpr long long kDayMs = 24 * kHourMs;
constexpr long long kWeekMs = 7 * kDayMs;

// Runs older than this are treated as abandoned by a crashed process.
constexpr long long kStuckRunMs = 2 * kHourMs;

// Largest delay a 32-bit millisecond timer can express (~24.8 days).
constexpr long long kMaxTimerDelayMs = 2147483647LL;

constexpr long long kCronSearchHorizonMs = 2 * 365 * kDayMs;

enum class CronScheduleKind {
    At,
    Every,
    Cron
};

struct CronSchedule {
    CronScheduleKind kind = CronScheduleKind::Every;
    std::optional<long long> at_ms;
    std::optional<long long> every_ms;
    std::optional<long long> anchor_ms;
    std::string expr;
    std::string tz;

    static CronSchedule At(long long at_ms);
    static CronSchedule Every(long long every_ms, std::optional<long long> anchor_ms = std::nullopt);
    static CronSchedule Cron(std::string expr, std::string tz = {});
};

struct SystemEventPayload {
    std::string message;
};

struct AgentTurnPayload {
    std::string message;
    std::optional<std::string> model;
    std::optional<int> timeout_seconds;
    std::optional<bool> deliver;
    std::optional<std::string> channel;
    std::optional<std::string> to;
};

// Opaque to the scheduler; interpreted only by the executor.
using CronPayload = std::variant<SystemEventPayload, AgentTurnPayload>;

enum class PayloadKind {
    SystemEvent,
    AgentTurn
};

PayloadKind KindOf(const CronPayload& payload);
const std::string& MessageOf(const CronPayload& payload);

struct PayloadPatch {
    std::optional<PayloadKind> kind;
    std::optional<std::string> message;
    std::optional<std::string> model;
    std::optional<int> timeout_seconds;
    std::optional<bool> deliver;
    std::optional<std::string> channel;
    std::optional<std::string> to;

    bool HasAgentFields() const {
        return model || timeout_seconds || deliver || channel || to;
    }
};

enum class RunStatus {
    Ok,
    Error,
    Skipped,
    Cancelled
};

struct CronJobState {
    std::optional<long long> next_run_at_ms;
    std::optional<long long> last_run_at_ms;
    std::optional<RunStatus> last_status;
    std::optional<long long> last_duration_ms;
    std::optional<std::string> last_error;
    std::optional<long long> running_at_ms;
    long long run_count = 0;
};

struct CronJob {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    bool enabled = true;
    CronSchedule schedule;
    CronPayload payload;
    CronJobState state;
    long long created_at_ms = 0;
    long long updated_at_ms = 0;
    bool delete_after_run = false;
};

struct CronJobCreate {
    std::string name;
    std::optional<std::string> description;
    bool enabled = true;
    CronSchedule schedule;
    CronPayload payload;
    bool delete_after_run = false;
};

struct CronJobUpdate {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<bool> enabled;
    std::optional<CronSchedule> schedule;
    std::optional<PayloadPatch> payload;
    std::optional<bool> delete_after_run;
};

struct CronStoreFile {
    int version = 1;
    std::vector<CronJob> jobs;
};

enum class CronEventAction {
    Added,
    Updated,
    Removed,
    Started,
    Finished
};

struct CronEvent {
    std::string job_id;
    CronEventAction action = CronEventAction::Added;
    long long timestamp = 0;
    std::optional<long long> run_at_ms;
    std::optional<long long> duration_ms;
    std::optional<RunStatus> status;
    std::optional<std::string> error;
    std::optional<std::string> summary;
    std::optional<long long> next_run_at_ms;
};

// What the executor reports back for one run.
struct ExecutionResult {
    RunStatus status = RunStatus::Ok;
    std::optional<std::string> error;
    std::optional<std::string> summary;
};

struct RunResult {
    bool found = true;
    RunStatus status = RunStatus::Ok;
    std::optional<std::string> error;
    std::optional<std::string> summary;

    static RunResult NotFound() {
        RunResult result;
        result.found = false;
        result.status = RunStatus::Skipped;
        result.error = "Job not found";
        return result;
    }
};

enum class CronErrorCode {
    kNone,
    kNotFound,
    kInvalidSchedule,
    kInvalidPayload
};

template <typename T>
struct CronResult {
    std::optional<T> value;
    CronErrorCode code = CronErrorCode::kNone;
    std::string error;

    bool ok() const { return value.has_value(); }

    static CronResult Success(T item) {
        CronResult result;
        result.value = std::move(item);
        return result;
    }

    static CronResult Failure(CronErrorCode code, std::string message) {
        CronResult result;
        result.code = code;
        result.error = std::move(message);
        return result;
    }
};

// Shared flag a caller flips to ask an in-flight manual run to stop.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() const { flag_->store(true); }
    bool IsCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

const char* ToString(CronScheduleKind kind);
std::optional<CronScheduleKind> ScheduleKindFromString(const std::string& value);
const char* ToString(PayloadKind kind);
std::optional<PayloadKind> PayloadKindFromString(const std::string& value);
const char* ToString(RunStatus status);
std::optional<RunStatus> RunStatusFromString(const std::string& value);
const char* ToString(CronEventAction action);
const char* ToString(CronErrorCode code);

}  // namespace cronkeeper::cron

#include "cron/cron_service.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <limits>
#include <random>
#include <utility>

#include "cron/cron_schedule.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace cronkeeper::cron {
namespace {

std::string GenerateId() {
    static const char* kChars = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            id.push_back('-');
        }
        int nibble = dist(gen);
        if (i == 12) {
            nibble = 4;
        } else if (i == 16) {
            nibble = 8 | (nibble & 0x3);
        }
        id.push_back(kChars[nibble]);
    }
    return id;
}

CronServiceDeps WithDefaults(CronServiceDeps deps) {
    if (deps.store_path.empty()) {
        deps.store_path = DefaultCronStorePath();
    }
    if (!deps.now_ms) {
        deps.now_ms = &utils::SystemNowMs;
    }
    if (!deps.execute_job) {
        deps.execute_job = [](const CronJob&, const CancellationToken&) {
            return ExecutionResult{};
        };
    }
    if (!deps.timer && deps.enabled) {
        deps.timer = std::make_shared<ThreadTimer>();
    }
    return deps;
}

std::optional<CronPayload> MergePayload(const CronPayload& current, const PayloadPatch& patch, std::string& error) {
    const auto current_kind = KindOf(current);
    if (patch.kind.has_value() && patch.kind.value() != current_kind) {
        if (!patch.message.has_value()) {
            error = "changing the payload kind requires a complete payload";
            return std::nullopt;
        }
        if (patch.kind.value() == PayloadKind::SystemEvent) {
            if (patch.HasAgentFields()) {
                error = "agentTurn fields do not apply to a systemEvent payload";
                return std::nullopt;
            }
            return SystemEventPayload{patch.message.value()};
        }
        AgentTurnPayload agent;
        agent.message = patch.message.value();
        agent.model = patch.model;
        agent.timeout_seconds = patch.timeout_seconds;
        agent.deliver = patch.deliver;
        agent.channel = patch.channel;
        agent.to = patch.to;
        return agent;
    }

    if (current_kind == PayloadKind::SystemEvent) {
        if (patch.HasAgentFields()) {
            error = "agentTurn fields do not apply to a systemEvent payload";
            return std::nullopt;
        }
        auto merged = std::get<SystemEventPayload>(current);
        if (patch.message.has_value()) {
            merged.message = patch.message.value();
        }
        return merged;
    }

    auto merged = std::get<AgentTurnPayload>(current);
    if (patch.message.has_value()) {
        merged.message = patch.message.value();
    }
    if (patch.model.has_value()) {
        merged.model = patch.model;
    }
    if (patch.timeout_seconds.has_value()) {
        merged.timeout_seconds = patch.timeout_seconds;
    }
    if (patch.deliver.has_value()) {
        merged.deliver = patch.deliver;
    }
    if (patch.channel.has_value()) {
        merged.channel = patch.channel;
    }
    if (patch.to.has_value()) {
        merged.to = patch.to;
    }
    return merged;
}

CronResult<CronJob> Reject(const std::string& operation, const std::string& target, CronErrorCode code,
                           std::string message) {
    utils::LogWarn("cron", operation + " rejected",
                   {{"target", target}, {"code", ToString(code)}, {"error", message}});
    return CronResult<CronJob>::Failure(code, std::move(message));
}

std::string FormatOptionalMs(const std::optional<long long>& value) {
    return value.has_value() ? std::to_string(value.value()) : std::string("none");
}

}  // namespace

CronService::CronService(CronServiceDeps deps)
    : deps_(WithDefaults(std::move(deps)))
    , store_(deps_.store_path, deps_.now_ms, deps_.persist_attempts)
    , timer_(std::move(deps_.timer)) {}

CronService::~CronService() {
    Stop();
    {
        std::unique_lock<std::mutex> lock(gate_->mutex);
        gate_->open = false;
        // A callback that destroys the service from the timer thread cannot be waited on.
        gate_->idle.wait(lock, [this]() {
            return gate_->in_flight == 0 || gate_->runner == std::this_thread::get_id();
        });
    }
    std::shared_ptr<Timer> timer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timer.swap(timer_);
    }
    if (timer) {
        timer->Cancel();
    }
}

void CronService::Start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_) {
            return;
        }
        started_ = true;
        Reconcile();
        utils::LogInfo("cron", "service started",
                       {{"jobs", std::to_string(store_.GetAll().size())},
                        {"store", store_.Path().string()}});
    }
    ArmTimer();
}

void CronService::Stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
        return;
    }
    started_ = false;
    if (timer_) {
        timer_->Cancel();
    }
    utils::LogInfo("cron", "service stopped");
}

std::vector<CronJob> CronService::List(bool include_disabled) const {
    std::vector<CronJob> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& job : store_.GetAll()) {
            if (include_disabled || job.enabled) {
                jobs.push_back(job);
            }
        }
    }
    std::stable_sort(jobs.begin(), jobs.end(), [](const CronJob& a, const CronJob& b) {
        const auto left = a.state.next_run_at_ms.value_or(std::numeric_limits<long long>::max());
        const auto right = b.state.next_run_at_ms.value_or(std::numeric_limits<long long>::max());
        return left < right;
    });
    return jobs;
}

std::optional<CronJob> CronService::Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.GetById(id);
}

std::optional<CronJob> CronService::GetByName(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.GetByName(name);
}

CronResult<CronJob> CronService::Add(const CronJobCreate& input) {
    CronJob job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = NowMs();
        if (const auto error = ValidateSchedule(input.schedule, now)) {
            return Reject("add", input.name, CronErrorCode::kInvalidSchedule, error.value());
        }

        do {
            job.id = GenerateId();
        } while (store_.GetById(job.id).has_value());
        job.name = input.name;
        job.description = input.description;
        job.enabled = input.enabled;
        job.schedule = input.schedule;
        job.payload = input.payload;
        job.delete_after_run = input.delete_after_run;
        job.created_at_ms = now;
        job.updated_at_ms = now;
        job.state.next_run_at_ms = ComputeJobNextRun(job, now);

        store_.Add(job);
        PersistLocked();
    }

    utils::LogInfo("cron", "job added",
                   {{"id", job.id}, {"name", job.name}, {"schedule", FormatSchedule(job.schedule)},
                    {"next", FormatOptionalMs(job.state.next_run_at_ms)}});
    CronEvent event;
    event.job_id = job.id;
    event.action = CronEventAction::Added;
    event.next_run_at_ms = job.state.next_run_at_ms;
    Emit(std::move(event));
    ArmTimer();
    return CronResult<CronJob>::Success(job);
}

CronResult<CronJob> CronService::Update(const std::string& id, const CronJobUpdate& patch) {
    CronJob updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto existing = store_.GetById(id);
        if (!existing.has_value()) {
            return Reject("update", id, CronErrorCode::kNotFound, "Job not found");
        }
        const auto now = NowMs();
        if (patch.schedule.has_value()) {
            if (const auto error = ValidateSchedule(patch.schedule.value(), now)) {
                return Reject("update", id, CronErrorCode::kInvalidSchedule, error.value());
            }
        }
        std::optional<CronPayload> payload;
        if (patch.payload.has_value()) {
            std::string error;
            payload = MergePayload(existing->payload, patch.payload.value(), error);
            if (!payload.has_value()) {
                return Reject("update", id, CronErrorCode::kInvalidPayload, error);
            }
        }

        const auto result = store_.Update(id, [&](CronJob& job) {
            if (patch.name.has_value()) {
                job.name = patch.name.value();
            }
            if (patch.description.has_value()) {
                job.description = patch.description;
            }
            if (patch.enabled.has_value()) {
                job.enabled = patch.enabled.value();
            }
            if (patch.schedule.has_value()) {
                job.schedule = patch.schedule.value();
            }
            if (patch.delete_after_run.has_value()) {
                job.delete_after_run = patch.delete_after_run.value();
            }
            if (payload.has_value()) {
                job.payload = std::move(payload.value());
            }
            job.state.next_run_at_ms = ComputeJobNextRun(job, now);
        });
        updated = result.value();
        PersistLocked();
    }

    utils::LogInfo("cron", "job updated",
                   {{"id", updated.id}, {"enabled", updated.enabled ? "true" : "false"},
                    {"next", FormatOptionalMs(updated.state.next_run_at_ms)}});
    CronEvent event;
    event.job_id = updated.id;
    event.action = CronEventAction::Updated;
    event.next_run_at_ms = updated.state.next_run_at_ms;
    Emit(std::move(event));
    ArmTimer();
    return CronResult<CronJob>::Success(updated);
}

bool CronService::Remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!store_.Remove(id)) {
            return false;
        }
        PersistLocked();
    }
    utils::LogInfo("cron", "job removed", {{"id", id}});
    CronEvent event;
    event.job_id = id;
    event.action = CronEventAction::Removed;
    Emit(std::move(event));
    ArmTimer();
    return true;
}

RunResult CronService::Run(const std::string& id, bool forced, CancellationToken token) {
    auto result = ExecuteJob(id, forced, token);
    ArmTimer();
    return result;
}

void CronService::Reload() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.Reload();
        Reconcile();
        utils::LogInfo("cron", "store reloaded", {{"jobs", std::to_string(store_.GetAll().size())}});
    }
    ArmTimer();
}

CronService::Status CronService::GetStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Status status{};
    status.started = started_;
    status.enabled = deps_.enabled;
    status.jobs = store_.GetAll().size();
    status.next_wake_at_ms = NextWakeLocked();
    return status;
}

void CronService::OnTimer() {
    if (sweeping_.exchange(true)) {
        return;
    }
    try {
        RunDueJobs();
    } catch (const std::exception& ex) {
        utils::LogError("cron", "sweep failed", {{"error", ex.what()}});
    }
    sweeping_.store(false);
    ArmTimer();
}

void CronService::RunDueJobs() {
    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = NowMs();
        for (const auto& job : store_.GetAll()) {
            if (!job.enabled || job.state.running_at_ms.has_value() ||
                !job.state.next_run_at_ms.has_value()) {
                continue;
            }
            if (now >= job.state.next_run_at_ms.value()) {
                due.push_back(job.id);
            }
        }
    }
    if (!due.empty()) {
        utils::LogDebug("cron", "sweep", {{"due", std::to_string(due.size())}});
    }
    for (const auto& id : due) {
        ExecuteJob(id, false, CancellationToken{});
    }
}

RunResult CronService::ExecuteJob(const std::string& id, bool forced, const CancellationToken& token) {
    CronJob snapshot;
    long long start_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto job = store_.GetById(id);
        if (!job.has_value()) {
            return RunResult::NotFound();
        }
        if (job->state.running_at_ms.has_value()) {
            utils::LogWarn("cron", "job already running", {{"id", id}});
            RunResult busy;
            busy.status = RunStatus::Skipped;
            busy.error = "Job is already running";
            return busy;
        }
        start_ms = NowMs();
        // The sweep snapshot may be stale by the time this job's turn comes.
        if (!forced && (!job->enabled || !job->state.next_run_at_ms.has_value() ||
                        start_ms < job->state.next_run_at_ms.value())) {
            RunResult stale;
            stale.status = RunStatus::Skipped;
            stale.error = "Job is no longer due";
            return stale;
        }
        snapshot = store_.Update(id, [&](CronJob& item) {
            item.state.running_at_ms = start_ms;
        }).value();
        PersistLocked();
    }

    CronEvent started;
    started.job_id = id;
    started.action = CronEventAction::Started;
    started.run_at_ms = start_ms;
    Emit(std::move(started));
    utils::LogInfo("cron", "job started", {{"id", id}, {"name", snapshot.name}, {"forced", forced ? "true" : "false"}});

    ExecutionResult result;
    try {
        result = deps_.execute_job(snapshot, token);
    } catch (const std::exception& ex) {
        result = ExecutionResult{};
        result.status = RunStatus::Error;
        result.error = ex.what();
    } catch (...) {
        result = ExecutionResult{};
        result.status = RunStatus::Error;
        result.error = "unknown error";
    }
    if (token.IsCancelled()) {
        result.status = RunStatus::Cancelled;
    }

    long long duration_ms = 0;
    std::optional<long long> next_run;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto end_ms = NowMs();
        duration_ms = end_ms - start_ms;
        const auto current = store_.GetById(id);
        if (current.has_value()) {
            // A one-shot is consumed by any completed attempt, failed or not.
            const bool consumed = current->schedule.kind == CronScheduleKind::At &&
                                  (result.status == RunStatus::Ok || result.status == RunStatus::Error);
            if (consumed && current->delete_after_run) {
                store_.Remove(id);
            } else {
                const auto updated = store_.Update(id, [&](CronJob& job) {
                    job.state.running_at_ms.reset();
                    job.state.last_run_at_ms = start_ms;
                    job.state.last_status = result.status;
                    job.state.last_duration_ms = duration_ms;
                    job.state.last_error = result.error;
                    job.state.run_count += 1;
                    if (consumed) {
                        job.enabled = false;
                    }
                    if (!job.enabled) {
                        job.state.next_run_at_ms.reset();
                    } else if (!forced) {
                        job.state.next_run_at_ms = ComputeJobNextRun(job, end_ms);
                    }
                });
                next_run = updated->state.next_run_at_ms;
            }
            PersistLocked();
        }
    }

    utils::LogInfo("cron", "job finished",
                   {{"id", id}, {"status", ToString(result.status)},
                    {"duration_ms", std::to_string(duration_ms)}, {"next", FormatOptionalMs(next_run)}});
    CronEvent finished;
    finished.job_id = id;
    finished.action = CronEventAction::Finished;
    finished.run_at_ms = start_ms;
    finished.duration_ms = duration_ms;
    finished.status = result.status;
    finished.error = result.error;
    finished.summary = result.summary;
    finished.next_run_at_ms = next_run;
    Emit(std::move(finished));

    RunResult run;
    run.status = result.status;
    run.error = result.error;
    run.summary = result.summary;
    return run;
}

void CronService::Reconcile() {
    const auto now = NowMs();
    std::vector<CronJob> changed;
    for (const auto& job : store_.GetAll()) {
        auto next = job;
        if (next.state.running_at_ms.has_value() &&
            now - next.state.running_at_ms.value() > deps_.stuck_run_ms) {
            utils::LogWarn("cron", "clearing stuck run",
                           {{"id", next.id}, {"running_at_ms", std::to_string(next.state.running_at_ms.value())}});
            next.state.running_at_ms.reset();
        }
        next.state.next_run_at_ms = ComputeJobNextRun(next, now);
        if (next.state.running_at_ms != job.state.running_at_ms ||
            next.state.next_run_at_ms != job.state.next_run_at_ms) {
            changed.push_back(std::move(next));
        }
    }
    for (const auto& job : changed) {
        store_.Update(job.id, [&](CronJob& item) {
            item.state.running_at_ms = job.state.running_at_ms;
            item.state.next_run_at_ms = job.state.next_run_at_ms;
        }, false);
    }
    if (!changed.empty()) {
        PersistLocked();
    }
}

void CronService::ArmTimer() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!timer_) {
        return;
    }
    timer_->Cancel();
    if (!started_ || !deps_.enabled) {
        return;
    }
    const auto nearest = NextWakeLocked();
    if (!nearest.has_value()) {
        return;
    }
    const auto delay = std::clamp(nearest.value() - NowMs(), 0LL, kMaxTimerDelayMs);
    timer_->Arm(std::chrono::milliseconds(delay), [this, gate = gate_]() {
        {
            std::lock_guard<std::mutex> lock(gate->mutex);
            if (!gate->open) {
                return;
            }
            ++gate->in_flight;
            gate->runner = std::this_thread::get_id();
        }
        try {
            OnTimer();
        } catch (const std::exception& ex) {
            utils::LogError("cron", "timer callback failed", {{"error", ex.what()}});
        }
        std::lock_guard<std::mutex> lock(gate->mutex);
        --gate->in_flight;
        gate->runner = std::thread::id();
        gate->idle.notify_all();
    });
    utils::LogDebug("cron", "timer armed", {{"delay_ms", std::to_string(delay)}});
}

std::optional<long long> CronService::NextWakeLocked() const {
    std::optional<long long> next;
    for (const auto& job : store_.GetAll()) {
        if (!job.enabled || !job.state.next_run_at_ms.has_value()) {
            continue;
        }
        if (!next.has_value() || job.state.next_run_at_ms.value() < next.value()) {
            next = job.state.next_run_at_ms;
        }
    }
    return next;
}

void CronService::PersistLocked() {
    if (!store_.Persist()) {
        utils::LogWarn("cron", "changes kept in memory until the next successful write");
    }
}

void CronService::Emit(CronEvent event) {
    if (!deps_.on_event) {
        return;
    }
    event.timestamp = NowMs();
    try {
        deps_.on_event(event);
    } catch (const std::exception& ex) {
        utils::LogWarn("cron", "event sink threw", {{"action", ToString(event.action)}, {"error", ex.what()}});
    } catch (...) {
        utils::LogWarn("cron", "event sink threw", {{"action", ToString(event.action)}});
    }
}

}  // namespace cronkeeper::cron

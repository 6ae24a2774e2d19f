#pragma once

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cron/cron_store.hpp"
#include "cron/cron_types.hpp"
#include "cron/timer.hpp"

namespace cronkeeper::cron {

struct CronServiceDeps {
    using Clock = std::function<long long()>;
    using JobExecutor = std::function<ExecutionResult(const CronJob&, const CancellationToken&)>;
    using EventSink = std::function<void(const CronEvent&)>;

    std::filesystem::path store_path;
    // When false the timer is never armed; due jobs only run through Run()
    // or an explicit OnTimer().
    bool enabled = true;
    Clock now_ms;
    JobExecutor execute_job;
    EventSink on_event;
    std::shared_ptr<Timer> timer;
    long long stuck_run_ms = kStuckRunMs;
    int persist_attempts = 3;
};

class CronService {
public:
    struct Status {
        bool started = false;
        bool enabled = false;
        std::size_t jobs = 0;
        std::optional<long long> next_wake_at_ms;
    };

    explicit CronService(CronServiceDeps deps);
    ~CronService();

    CronService(const CronService&) = delete;
    CronService& operator=(const CronService&) = delete;

    void Start();
    void Stop();

    std::vector<CronJob> List(bool include_disabled = false) const;
    std::optional<CronJob> Get(const std::string& id) const;
    std::optional<CronJob> GetByName(const std::string& name) const;

    CronResult<CronJob> Add(const CronJobCreate& input);
    CronResult<CronJob> Update(const std::string& id, const CronJobUpdate& patch);
    bool Remove(const std::string& id);

    // Manual run. A forced run leaves next_run_at_ms as it was.
    RunResult Run(const std::string& id, bool forced = true, CancellationToken token = {});

    // Re-reads the store file, reconciles and re-arms.
    void Reload();

    Status GetStatus() const;

    // Timer entry point: runs every due job once, then re-arms.
    void OnTimer();

private:
    // Outlives the service inside armed timer callbacks, so a callback that
    // fires during destruction either sees the service closed or is waited on.
    struct CallbackGate {
        std::mutex mutex;
        std::condition_variable idle;
        bool open = true;
        int in_flight = 0;
        std::thread::id runner;
    };

    RunResult ExecuteJob(const std::string& id, bool forced, const CancellationToken& token);
    void RunDueJobs();
    void Reconcile();
    void ArmTimer();
    std::optional<long long> NextWakeLocked() const;
    void PersistLocked();
    void Emit(CronEvent event);
    long long NowMs() const { return deps_.now_ms(); }

    CronServiceDeps deps_;
    mutable std::mutex mutex_;
    CronStore store_;
    bool started_ = false;
    std::atomic<bool> sweeping_{false};
    std::shared_ptr<Timer> timer_;
    std::shared_ptr<CallbackGate> gate_ = std::make_shared<CallbackGate>();
};

}  // namespace cronkeeper::cron

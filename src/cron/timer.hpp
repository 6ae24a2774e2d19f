#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace cronkeeper::cron {

// Single-shot wakeup. Arming again replaces whatever was pending.
class Timer {
public:
    using Callback = std::function<void()>;

    virtual ~Timer() = default;
    virtual void Arm(std::chrono::milliseconds delay, Callback callback) = 0;
    virtual void Cancel() = 0;
};

// Timer backed by one worker thread. The worker is started on first Arm and
// joined on destruction, so it never outlives its owner.
class ThreadTimer : public Timer {
public:
    ThreadTimer() = default;
    ~ThreadTimer() override;

    ThreadTimer(const ThreadTimer&) = delete;
    ThreadTimer& operator=(const ThreadTimer&) = delete;

    void Arm(std::chrono::milliseconds delay, Callback callback) override;
    void Cancel() override;

private:
    void RunLoop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    Callback callback_;
    bool stopping_ = false;
    std::thread worker_;
};

}  // namespace cronkeeper::cron

#include "cron/timer.hpp"

#include <exception>
#include <utility>

#include "utils/logging.hpp"

namespace cronkeeper::cron {

ThreadTimer::~ThreadTimer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        deadline_.reset();
        callback_ = nullptr;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void ThreadTimer::Arm(std::chrono::milliseconds delay, Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        deadline_ = std::chrono::steady_clock::now() + delay;
        callback_ = std::move(callback);
        if (!worker_.joinable()) {
            worker_ = std::thread([this]() { RunLoop(); });
        }
    }
    cv_.notify_all();
}

void ThreadTimer::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_.reset();
        callback_ = nullptr;
    }
    cv_.notify_all();
}

void ThreadTimer::RunLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (!deadline_.has_value()) {
            cv_.wait(lock, [this]() { return stopping_ || deadline_.has_value(); });
            continue;
        }
        const auto deadline = deadline_.value();
        if (cv_.wait_until(lock, deadline) != std::cv_status::timeout) {
            continue;
        }
        if (stopping_ || !deadline_.has_value() || deadline_.value() != deadline) {
            continue;
        }
        deadline_.reset();
        auto callback = std::move(callback_);
        callback_ = nullptr;
        lock.unlock();
        if (callback) {
            try {
                callback();
            } catch (const std::exception& ex) {
                utils::LogError("timer", "callback threw", {{"error", ex.what()}});
            }
        }
        lock.lock();
    }
}

}  // namespace cronkeeper::cron

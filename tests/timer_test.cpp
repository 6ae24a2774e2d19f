#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "cron/timer.hpp"

using namespace cronkeeper::cron;
using namespace std::chrono_literals;

namespace {

// Counts callback invocations and lets a test wait for them.
class FireCounter {
public:
    Timer::Callback Callback() {
        return [this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            ++count_;
            cv_.notify_all();
        };
    }

    bool WaitFor(int expected, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return count_ >= expected; });
    }

    int count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int count_ = 0;
};

}  // namespace

TEST(ThreadTimerTest, FiresAfterDelay) {
    FireCounter counter;
    ThreadTimer timer;
    const auto start = std::chrono::steady_clock::now();
    timer.Arm(20ms, counter.Callback());
    ASSERT_TRUE(counter.WaitFor(1, 2s));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(ThreadTimerTest, ZeroDelayFiresPromptly) {
    FireCounter counter;
    ThreadTimer timer;
    timer.Arm(0ms, counter.Callback());
    EXPECT_TRUE(counter.WaitFor(1, 2s));
}

TEST(ThreadTimerTest, CancelPreventsFiring) {
    FireCounter counter;
    ThreadTimer timer;
    timer.Arm(50ms, counter.Callback());
    timer.Cancel();
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(counter.count(), 0);
}

TEST(ThreadTimerTest, RearmReplacesPendingCallback) {
    FireCounter slow;
    FireCounter fast;
    ThreadTimer timer;
    timer.Arm(10s, slow.Callback());
    timer.Arm(10ms, fast.Callback());
    ASSERT_TRUE(fast.WaitFor(1, 2s));
    EXPECT_EQ(slow.count(), 0);
}

TEST(ThreadTimerTest, CanBeArmedAgainAfterFiring) {
    FireCounter counter;
    ThreadTimer timer;
    timer.Arm(5ms, counter.Callback());
    ASSERT_TRUE(counter.WaitFor(1, 2s));
    timer.Arm(5ms, counter.Callback());
    EXPECT_TRUE(counter.WaitFor(2, 2s));
}

TEST(ThreadTimerTest, CallbackMayRearm) {
    FireCounter counter;
    std::atomic<int> remaining{3};
    std::function<void()> tick;
    ThreadTimer timer;
    tick = [&]() {
        counter.Callback()();
        if (--remaining > 0) {
            timer.Arm(1ms, tick);
        }
    };
    timer.Arm(1ms, tick);
    EXPECT_TRUE(counter.WaitFor(3, 2s));
}

TEST(ThreadTimerTest, ThrowingCallbackDoesNotStopTimer) {
    FireCounter counter;
    ThreadTimer timer;
    timer.Arm(1ms, []() { throw std::runtime_error("boom"); });
    std::this_thread::sleep_for(50ms);
    timer.Arm(1ms, counter.Callback());
    EXPECT_TRUE(counter.WaitFor(1, 2s));
}

TEST(ThreadTimerTest, DestroyingPendingTimerDoesNotFire) {
    FireCounter counter;
    {
        ThreadTimer timer;
        timer.Arm(50ms, counter.Callback());
    }
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(counter.count(), 0);
}

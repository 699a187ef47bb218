#include "hunt/rt/PeriodicTask.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace hunt::rt;
using namespace std::chrono_literals;

namespace {
template <typename Pred>
bool waitFor(Pred p, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!p()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}
} // namespace

TEST(PeriodicTaskTest, TicksUntilStopped) {
    std::atomic<int> calls{0};
    PeriodicTask task("t", 2ms, [&] { ++calls; });
    task.start();
    EXPECT_TRUE(task.running());
    EXPECT_TRUE(waitFor([&] { return calls.load() >= 3; }));
    task.stop();
    EXPECT_FALSE(task.running());

    const int after = calls.load();
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(calls.load(), after);
    EXPECT_GE(task.ticks(), 3u);
}

TEST(PeriodicTaskTest, ThrowingTickIsCountedAndLoopContinues) {
    std::atomic<int> calls{0};
    PeriodicTask task("t", 2ms, [&] {
        ++calls;
        throw std::runtime_error("boom");
    });
    task.start();
    EXPECT_TRUE(waitFor([&] { return calls.load() >= 2; }));
    task.stop();
    EXPECT_GE(task.failures(), 2u);
}

TEST(PeriodicTaskTest, StopInterruptsLongWait) {
    PeriodicTask task("slow", std::chrono::hours(1), [] {});
    task.start();
    const auto t0 = std::chrono::steady_clock::now();
    task.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
    EXPECT_EQ(task.ticks(), 0u);
}

TEST(PeriodicTaskTest, StopWithoutStartAndTwice) {
    PeriodicTask task("idle", 1ms, [] {});
    task.stop();
    task.start();
    task.stop();
    task.stop();
    EXPECT_FALSE(task.running());
}

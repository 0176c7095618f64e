#include "coaccess/stackless/event_loop.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

using coaccess::Clock;
using coaccess::EventLoop;

TEST(EventLoopTest, PollRunsPostedTasksInOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&] { order.push_back(1); });
    loop.post([&] {
        order.push_back(2);
        loop.post([&] { order.push_back(4); });
    });
    loop.post([&] { order.push_back(3); });

    EXPECT_EQ(loop.poll(), 4u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3, 4}));
    EXPECT_EQ(loop.poll(), 0u);
}

TEST(EventLoopTest, PollDoesNotWaitForTimers) {
    EventLoop loop;
    bool fired = false;
    auto handle = loop.schedule(1h, [&] { fired = true; });

    EXPECT_TRUE(handle);
    EXPECT_EQ(loop.poll(), 0u);
    EXPECT_FALSE(fired);
    EXPECT_EQ(loop.pending_timers(), 1u);
    EXPECT_TRUE(handle.cancel());
    EXPECT_EQ(loop.pending_timers(), 0u);
}

TEST(EventLoopTest, RunWaitsForTimersInDeadlineOrder) {
    EventLoop loop;
    std::vector<int> order;
    auto start = Clock::now();
    (void)loop.schedule(30ms, [&] { order.push_back(2); });
    (void)loop.schedule(10ms, [&] { order.push_back(1); });

    loop.run();

    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_GE(Clock::now() - start, 30ms);
}

TEST(EventLoopTest, CancelledTimerNeverFires) {
    EventLoop loop;
    bool fired = false;
    auto handle = loop.schedule(10ms, [&] { fired = true; });

    EXPECT_TRUE(handle.cancel());
    EXPECT_FALSE(handle.cancel());
    loop.run();

    EXPECT_FALSE(fired);
}

TEST(EventLoopTest, CancelAfterExpiryReportsFalse) {
    EventLoop loop;
    int fired = 0;
    auto handle = loop.schedule(0ms, [&] { fired++; });

    loop.run();

    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(handle.cancel());
}

TEST(EventLoopTest, RunReturnsImmediatelyWhenIdle) {
    EventLoop loop;
    loop.run();
    SUCCEED();
}

TEST(EventLoopTest, HoldKeepsRunAliveUntilReleased) {
    EventLoop loop;
    bool posted_ran = false;
    loop.hold();

    std::thread other([&] {
        std::this_thread::sleep_for(20ms);
        loop.post([&] { posted_ran = true; });
        loop.release();
    });

    loop.run();
    other.join();

    EXPECT_TRUE(posted_ran);
}

TEST(EventLoopTest, PostFromAnotherThreadWakesSleepingRun) {
    EventLoop loop;
    auto handle = loop.schedule(500ms, [] {});

    std::thread other([&] {
        std::this_thread::sleep_for(10ms);
        loop.post([&] { EXPECT_TRUE(handle.cancel()); });
    });

    auto start = Clock::now();
    loop.run();
    other.join();

    EXPECT_LT(Clock::now() - start, 400ms);
    EXPECT_EQ(loop.pending_timers(), 0u);
}

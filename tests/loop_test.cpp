#include "loop.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace sfuctl;
using namespace std::chrono_literals;

TEST(LoopTest, queuedTasksRunInOrder)
{
    Loop loop;
    std::vector<int> order;
    loop.EnqueueTask([&] { order.push_back(1); });
    loop.EnqueueTask([&] { order.push_back(2); });

    EXPECT_EQ(2u, loop.RunOnce(Clock::now()));
    EXPECT_EQ((std::vector<int>{1, 2}), order);
    EXPECT_EQ(0u, loop.RunOnce(Clock::now()));
}

TEST(LoopTest, periodicTimerFiresOncePerInterval)
{
    Loop loop;
    int fired = 0;
    auto start = Clock::now();
    auto id = loop.SchedulePeriodic(5s, [&] { ++fired; });

    loop.RunOnce(start + 4s);
    EXPECT_EQ(0, fired);

    loop.RunOnce(start + 6s);
    EXPECT_EQ(1, fired);

    loop.RunOnce(start + 7s);
    EXPECT_EQ(1, fired);

    loop.RunOnce(start + 11s);
    EXPECT_EQ(2, fired);
    EXPECT_TRUE(loop.HasTimer(id));
}

TEST(LoopTest, overdueTimerFiresOnce)
{
    Loop loop;
    int fired = 0;
    auto start = Clock::now();
    loop.SchedulePeriodic(5s, [&] { ++fired; });

    loop.RunOnce(start + 60s);
    EXPECT_EQ(1, fired);

    loop.RunOnce(start + 61s);
    EXPECT_EQ(1, fired);
}

TEST(LoopTest, cancelledTimerNeverFires)
{
    Loop loop;
    int fired = 0;
    auto start = Clock::now();
    auto id = loop.SchedulePeriodic(5s, [&] { ++fired; });

    loop.CancelTimer(id);
    EXPECT_FALSE(loop.HasTimer(id));

    loop.RunOnce(start + 6s);
    EXPECT_EQ(0, fired);
}

TEST(LoopTest, timerCancelledByEarlierTimerIsSkipped)
{
    Loop loop;
    int secondFired = 0;
    auto start = Clock::now();
    TimerId second = 0;
    loop.SchedulePeriodic(5s, [&] { loop.CancelTimer(second); });
    second = loop.SchedulePeriodic(5s, [&] { ++secondFired; });

    loop.RunOnce(start + 6s);
    EXPECT_EQ(0, secondFired);
}

TEST(LoopTest, failingTaskDoesNotStopOthers)
{
    Loop loop;
    bool ran = false;
    loop.EnqueueTask([] { throw std::runtime_error("boom"); });
    loop.EnqueueTask([&] { ran = true; });

    loop.RunOnce(Clock::now());
    EXPECT_TRUE(ran);
}

TEST(LoopTest, runProcessesTasksUntilStopped)
{
    auto loop = std::make_shared<Loop>();
    std::thread t{&Loop::Run, loop};

    std::promise<void> done;
    loop->EnqueueTask([&] { done.set_value(); });
    EXPECT_EQ(std::future_status::ready, done.get_future().wait_for(5s));

    loop->Stop();
    t.join();
}

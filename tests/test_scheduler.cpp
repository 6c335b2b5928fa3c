#include <atomic>
#include <chrono>
#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

#include "util/scheduler.hpp"

using namespace std::chrono_literals;

TEST(ManualScheduler, RunsInDeadlineThenFifoOrder)
{
    sched::ManualScheduler s;
    std::vector<int>       order;
    s.post_after(20, [&] { order.push_back(3); });
    s.post([&] { order.push_back(1); });
    s.post([&] { order.push_back(2); });

    s.run_ready();
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    s.advance(19);
    EXPECT_EQ(order.size(), 2u);
    s.advance(1);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(s.now_ms(), 1020u);
}

TEST(ManualScheduler, CancelledTaskNeverRuns)
{
    sched::ManualScheduler s;
    bool                   ran = false;
    auto                   id  = s.post_after(100, [&] { ran = true; });
    EXPECT_TRUE(s.cancel(id));
    EXPECT_FALSE(s.cancel(id));
    s.advance(1000);
    EXPECT_FALSE(ran);
    EXPECT_EQ(s.pending(), 0u);
}

TEST(ManualScheduler, TasksPostedFromTasksRunInSameAdvance)
{
    sched::ManualScheduler s;
    std::vector<std::uint64_t> at;
    s.post_after(10, [&] {
        at.push_back(s.now_ms());
        s.post_after(5, [&] { at.push_back(s.now_ms()); });
    });
    s.advance(100);
    EXPECT_EQ(at, (std::vector<std::uint64_t>{1010, 1015}));
    EXPECT_EQ(s.now_ms(), 1100u);
}

TEST(ThreadScheduler, RunsPostedTasks)
{
    sched::ThreadScheduler s;
    ASSERT_TRUE(s.start());

    std::mutex              mu;
    std::condition_variable cv;
    std::vector<int>        order;

    s.post_after(30, [&] {
        std::lock_guard<std::mutex> lk(mu);
        order.push_back(2);
        cv.notify_all();
    });
    s.post([&] {
        std::lock_guard<std::mutex> lk(mu);
        order.push_back(1);
    });

    std::unique_lock<std::mutex> lk(mu);
    ASSERT_TRUE(cv.wait_for(lk, 2s, [&] { return order.size() == 2; }));
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    lk.unlock();
    s.stop();
}

TEST(ThreadScheduler, CancelAndStop)
{
    sched::ThreadScheduler s;
    EXPECT_EQ(s.post([] {}), sched::INVALID_TASK);  // not running yet

    ASSERT_TRUE(s.start());
    std::atomic<bool> ran{false};
    auto              id = s.post_after(200, [&] { ran = true; });
    EXPECT_NE(id, sched::INVALID_TASK);
    EXPECT_TRUE(s.cancel(id));
    std::this_thread::sleep_for(300ms);
    EXPECT_FALSE(ran.load());

    s.post_after(10000, [&] { ran = true; });
    s.stop();  // pending task dropped
    EXPECT_FALSE(ran.load());
    EXPECT_EQ(s.post([] {}), sched::INVALID_TASK);
}

TEST(ThreadScheduler, StopRightAfterWorkNeverHangs)
{
    std::atomic<bool> done{false};
    std::atomic<int>  iterations{0};

    // the worker goes back to wait() while stop() races it
    std::thread runner([&] {
        for (int i = 0; i < 5000; ++i)
        {
            sched::ThreadScheduler s;
            s.start();
            std::atomic<bool> ran{false};
            s.post([&] { ran = true; });
            while (!ran.load())
                std::this_thread::yield();
            for (volatile int spin = 0; spin < i % 64; ++spin)
            {
            }
            s.stop();
            ++iterations;
        }
        done = true;
    });

    const auto deadline = std::chrono::steady_clock::now() + 60s;
    while (!done.load() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(10ms);

    if (!done.load())
    {
        runner.detach();
        FAIL() << "stop() hung after " << iterations.load() << " iterations";
    }
    runner.join();
    EXPECT_EQ(iterations.load(), 5000);
}

#include "courier/core/TaskScheduler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using courier::core::TaskScheduler;

TEST(TaskSchedulerTest, SubmitReturnsResultThroughFuture) {
    TaskScheduler scheduler(2);
    auto fut = scheduler.submit([]() { return std::string("done"); });
    EXPECT_EQ(fut.get(), "done");
}

TEST(TaskSchedulerTest, ExceptionIsStoredInFuture) {
    TaskScheduler scheduler(1);
    auto fut = scheduler.submit([]() -> int { throw std::out_of_range("bad index"); });
    EXPECT_THROW(fut.get(), std::out_of_range);
}

TEST(TaskSchedulerTest, TasksRunConcurrently) {
    TaskScheduler scheduler(2);
    std::promise<void> aStarted;
    std::promise<void> bStarted;
    auto aSeen = aStarted.get_future().share();
    auto bSeen = bStarted.get_future().share();

    // each task only finishes in time if the other one runs at the same moment
    auto a = scheduler.submit([&aStarted, bSeen]() {
        aStarted.set_value();
        return bSeen.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
    });
    auto b = scheduler.submit([&bStarted, aSeen]() {
        bStarted.set_value();
        return aSeen.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
    });

    EXPECT_TRUE(a.get());
    EXPECT_TRUE(b.get());
}

TEST(TaskSchedulerTest, StopDrainsQueuedWork) {
    TaskScheduler scheduler(1);
    std::atomic<int> counter{0};
    for (int i = 0; i < 10; ++i) {
        scheduler.submit([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            counter.fetch_add(1);
        });
    }
    scheduler.stop();
    EXPECT_EQ(counter.load(), 10);
    EXPECT_TRUE(scheduler.isStopped());
}

TEST(TaskSchedulerTest, SubmitAfterStopThrows) {
    TaskScheduler scheduler(1);
    scheduler.stop();
    EXPECT_THROW(scheduler.submit([]() {}), std::runtime_error);
}

TEST(TaskSchedulerTest, ZeroThreadsFallsBackToOne) {
    TaskScheduler scheduler(0);
    EXPECT_EQ(scheduler.threadCount(), 1u);
    EXPECT_EQ(scheduler.submit([]() { return 7; }).get(), 7);
}

TEST(TaskSchedulerTest, SubmitFromWorkerRunsInlineOnSingleWorker) {
    TaskScheduler scheduler(1);
    auto outer = scheduler.submit([&scheduler]() {
        auto inner = scheduler.submit([]() { return std::this_thread::get_id(); });
        // with one worker this only completes if inner did not need a free worker
        if (inner.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            return false;
        }
        return inner.get() == std::this_thread::get_id();
    });
    ASSERT_EQ(outer.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    EXPECT_TRUE(outer.get());
}

TEST(TaskSchedulerTest, StopRacingSubmitNeverStrandsAFuture) {
    for (int round = 0; round < 20; ++round) {
        TaskScheduler scheduler(2);
        std::vector<std::future<int>> accepted;
        std::thread producer([&scheduler, &accepted]() {
            for (int i = 0; i < 1000; ++i) {
                try {
                    accepted.push_back(scheduler.submit([i]() { return i; }));
                } catch (const std::runtime_error&) {
                    return;
                }
            }
        });
        std::this_thread::sleep_for(std::chrono::microseconds(50 * round));
        scheduler.stop();
        producer.join();

        // everything accepted before stop() ran during the drain
        for (auto& fut : accepted) {
            ASSERT_EQ(fut.wait_for(std::chrono::seconds(0)), std::future_status::ready);
        }
    }
}

/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for WorkerPool.
 */

#include "executor/worker_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace taskpipe;

TEST(WorkerPoolTest, BasicSubmit) {
    WorkerPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(WorkerPoolTest, MultipleSubmissions) {
    WorkerPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(WorkerPoolTest, ConcurrentExecution) {
    WorkerPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(WorkerPoolTest, ThreadCount) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(WorkerPoolTest, DefaultUsesHardwareConcurrency) {
    WorkerPool pool;
    EXPECT_GE(pool.thread_count(), 1u);
}

TEST(WorkerPoolTest, ExceptionReachesFuture) {
    WorkerPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("job failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives a throwing job.
    EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

TEST(WorkerPoolTest, BoundsParallelism) {
    WorkerPool pool(2);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool.submit([&] {
            int now = active.fetch_add(1) + 1;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            active.fetch_sub(1);
        }));
    }
    for (auto& f : futures) f.get();
    EXPECT_LE(peak.load(), 2);
}

TEST(WorkerPoolTest, ShutdownResolvesQueuedJobs) {
    std::future<bool> queued;
    std::promise<void> release;
    std::future<void> blocker;
    {
        WorkerPool pool(1);
        auto gate = release.get_future().share();
        blocker = pool.submit([gate] { gate.wait(); });
        queued = pool.submit_cancellable([](std::stop_token stop) {
            return stop.stop_requested();
        });
        release.set_value();
    }
    blocker.get();
    // Whether the job ran before or during shutdown, its future is ready.
    EXPECT_EQ(queued.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    (void)queued.get();
}

TEST(WorkerPoolTest, PostRunsEveryJob) {
    std::atomic<int> counter{0};
    {
        WorkerPool pool(3);
        for (int i = 0; i < 200; ++i) {
            pool.post([&counter] { counter.fetch_add(1); });
        }
    }
    // Jobs still queued at destruction run before the pool is gone.
    EXPECT_EQ(counter.load(), 200);
}

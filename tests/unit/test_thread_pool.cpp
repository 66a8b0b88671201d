/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace spawner;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
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

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, WaitIdleBlocksUntilDrained) {
    ThreadPool pool(2);
    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        pool.submit([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            done.fetch_add(1);
        });
    }
    pool.wait_idle();
    EXPECT_EQ(done.load(), 10);
    EXPECT_EQ(pool.active_count(), 0u);
    EXPECT_EQ(pool.queued_count(), 0u);
}

TEST(ThreadPoolTest, ShutdownLetsRunningTaskFinish) {
    ThreadPool pool(1);
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};

    auto running = pool.submit([&] {
        started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished = true;
    });
    while (!started) std::this_thread::yield();

    auto queued = pool.submit([] {});
    pool.shutdown();

    EXPECT_TRUE(finished.load());
    running.get();
    EXPECT_EQ(pool.queued_count(), 0u);
}

TEST(ThreadPoolTest, SubmitAfterShutdownReturnsInvalidFuture) {
    ThreadPool pool(1);
    pool.shutdown();
    auto future = pool.submit([] { return 1; });
    EXPECT_FALSE(future.valid());
}

TEST(ThreadPoolTest, ExceptionPropagatesThroughFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

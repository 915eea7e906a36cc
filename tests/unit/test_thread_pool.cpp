/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <latch>

using namespace vm_sandbox;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    ASSERT_TRUE(future.has_value());
    EXPECT_EQ(future->get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        auto submitted = pool.submit([i] { return static_cast<int>(i * i); });
        ASSERT_TRUE(submitted.has_value());
        futures.push_back(std::move(*submitted));
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
        auto submitted = pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        });
        ASSERT_TRUE(submitted.has_value());
        futures.push_back(std::move(*submitted));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, NeverExceedsWorkerCount) {
    ThreadPool pool(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 8; ++i) {
        auto submitted = pool.submit([&] {
            int now = running.fetch_add(1) + 1;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            running.fetch_sub(1);
        });
        ASSERT_TRUE(submitted.has_value());
        futures.push_back(std::move(*submitted));
    }
    for (auto& f : futures) f.get();

    EXPECT_LE(peak.load(), 2);
    EXPECT_LE(pool.peak_active_count(), 2u);
    EXPECT_GE(pool.peak_active_count(), 1u);
}

TEST(ThreadPoolTest, RejectsWhenQueueFull) {
    ThreadPool pool(1, 1);
    std::latch release(1);
    std::atomic<bool> started{false};

    auto blocker = pool.submit([&] {
        started = true;
        release.wait();
    });
    ASSERT_TRUE(blocker.has_value());
    while (!started) std::this_thread::yield();

    auto queued = pool.submit([] {});
    ASSERT_TRUE(queued.has_value());
    EXPECT_EQ(pool.queued_count(), 1u);

    auto rejected = pool.submit([] {});
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::QueueRejected);

    release.count_down();
    blocker->get();
    queued->get();
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedWork) {
    std::atomic<int> done{0};
    ThreadPool pool(1);
    for (int i = 0; i < 5; ++i) {
        auto submitted = pool.submit([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            done.fetch_add(1);
        });
        ASSERT_TRUE(submitted.has_value());
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 5);
    EXPECT_FALSE(pool.is_accepting());
}

TEST(ThreadPoolTest, RejectsAfterShutdown) {
    ThreadPool pool(2);
    pool.shutdown();
    auto rejected = pool.submit([] { return 1; });
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::QueueRejected);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
    ASSERT_TRUE(future.has_value());
    EXPECT_THROW(future->get(), std::runtime_error);
}

/**
 * @file thread_pool.hpp
 * @brief Bounded std::jthread worker pool used for VM admission control.
 * @author Dimitris Kafetzis
 *
 * The worker count is the hard cap on concurrently running job pipelines.
 * Submissions beyond the queue limit, or after shutdown(), are rejected
 * immediately instead of blocking the caller.
 */

#pragma once

#include "core/result.hpp"

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace vm_sandbox {

/**
 * @brief Fixed-size pool with a bounded FIFO queue.
 */
class ThreadPool {
public:
    /// @param max_queued  Pending-task limit; 0 = unbounded.
    explicit ThreadPool(size_t num_threads, size_t max_queued = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable; fails with QueueRejected when saturated or shut down.
    template <std::invocable F>
    Result<std::future<std::invoke_result_t<F>>> submit(F&& func);

    /// Stop accepting work, run everything already queued, join workers.
    void shutdown();

    [[nodiscard]] bool is_accepting() const noexcept { return accepting_.load(); }
    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t peak_active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    size_t max_queued_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::mutex shutdown_mutex_;
    std::atomic<bool> accepting_{true};
    std::atomic<size_t> active_tasks_{0};
    std::atomic<size_t> peak_active_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
Result<std::future<std::invoke_result_t<F>>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_.load()) {
            return Error{ErrorCode::QueueRejected, "Worker pool is shut down"};
        }
        if (max_queued_ > 0 && task_queue_.size() >= max_queued_) {
            return Error{ErrorCode::QueueRejected,
                         "Worker pool queue is full (" + std::to_string(max_queued_) + " pending)"};
        }
        task_queue_.push([p = std::move(promise), f = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    queue_cv_.notify_one();
    return std::move(future);
}

}  // namespace vm_sandbox

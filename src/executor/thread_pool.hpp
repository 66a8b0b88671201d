/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool for reconciliation passes.
 * @author Dimitris Kafetzis
 *
 * shutdown() lets tasks that are already running complete and discards
 * tasks that have not started yet.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace spawner {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution. Returns an invalid future after shutdown().
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Stop accepting work, drop queued tasks and join the workers.
    void shutdown();

    /// Block until the queue is empty and no task is running.
    void wait_idle();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);
    void task_finished();

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable_any idle_cv_;
    std::atomic<size_t> active_tasks_{0};
    bool accepting_{true};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return {};
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
    return future;
}

}  // namespace spawner

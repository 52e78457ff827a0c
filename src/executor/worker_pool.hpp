/**
 * @file worker_pool.hpp
 * @brief std::jthread-based worker pool used as an in-process task executor.
 *
 * Callers inject a pool into task bodies through the "executor" run option;
 * the default Task::start_run then runs task bodies here, bounding how many
 * run at once. The scheduler keeps a separate pool of its own for the units
 * that start invocations.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace taskpipe {

class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads = 0);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Submit a callable; its result or exception is delivered through the future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Fire-and-forget submission. `func` reports its own outcome and must
    /// not throw.
    template <std::invocable F>
    void post(F&& func);

    /// Submit a callable that observes the pool's shutdown through a stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] size_t completed_count() const noexcept;

private:
    using Job = std::function<void(std::stop_token)>;

    void enqueue(Job job);
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_jobs_{0};
    std::atomic<size_t> completed_jobs_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> WorkerPool::submit(F&& func) {
    return submit_cancellable([f = std::forward<F>(func)](std::stop_token) mutable {
        return f();
    });
}

template <std::invocable F>
void WorkerPool::post(F&& func) {
    enqueue([f = std::forward<F>(func)](std::stop_token) mutable { f(); });
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> WorkerPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

}  // namespace taskpipe

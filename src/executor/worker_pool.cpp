/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 */

#include "executor/worker_pool.hpp"

#include <future>

namespace taskpipe {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    try {
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this](std::stop_token stop) {
                worker_loop(stop);
            });
        }
    } catch (...) {
        // The queue and its condition variable die before workers_ would be
        // joined, so stop the workers started so far while both still exist.
        for (auto& worker : workers_) worker.request_stop();
        queue_cv_.notify_all();
        workers_.clear();
        throw;
    }
}

WorkerPool::~WorkerPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    workers_.clear();

    // Jobs never picked up must not leave their futures hanging.
    while (!job_queue_.empty()) {
        auto job = std::move(job_queue_.front());
        job_queue_.pop();
        std::stop_source stopped;
        stopped.request_stop();
        job(stopped.get_token());
    }
}

void WorkerPool::enqueue(Job job) {
    {
        std::lock_guard lock(queue_mutex_);
        job_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
}

void WorkerPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        Job job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !job_queue_.empty(); });

            if (job_queue_.empty()) continue;

            job = std::move(job_queue_.front());
            job_queue_.pop();
        }

        ++active_jobs_;
        job(stop);
        --active_jobs_;
        ++completed_jobs_;
    }
}

size_t WorkerPool::active_count() const noexcept {
    return active_jobs_.load();
}

size_t WorkerPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return job_queue_.size();
}

size_t WorkerPool::thread_count() const noexcept {
    return workers_.size();
}

size_t WorkerPool::completed_count() const noexcept {
    return completed_jobs_.load();
}

}  // namespace taskpipe

/**
 * @file completion_queue.hpp
 * @brief Channel from unit threads back to the coordinating loop.
 */

#pragma once

#include "core/types.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <stop_token>

namespace taskpipe {

enum class Phase : uint8_t {
    Run,
    Cleanup
};

/**
 * @brief Message posted by a unit thread when its invocation finished.
 *
 * `error` is empty on success.
 */
struct Completion {
    NodeIndex node = 0;
    Phase phase = Phase::Run;
    std::exception_ptr error;
    SteadyTime finished_at{};
};

/**
 * @brief Multi-producer, single-consumer queue of completions.
 *
 * Unit threads only push; the coordinating loop is the only consumer and
 * the only code that touches node state.
 */
class CompletionQueue {
public:
    void push(Completion completion) {
        {
            std::lock_guard lock(mutex_);
            items_.push_back(std::move(completion));
        }
        cv_.notify_one();
    }

    /// Block until a completion arrives. Returns nullopt once `stop` is
    /// requested and nothing is queued.
    [[nodiscard]] std::optional<Completion> pop(std::stop_token stop = {}) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait(lock, stop, [this] { return !items_.empty(); })) {
            return std::nullopt;
        }
        auto item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Completion> items_;
};

}  // namespace taskpipe

/**
 * @file run_report.hpp
 * @brief Per-task outcome report returned by the scheduler.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "task/task.hpp"

#include <optional>
#include <string>
#include <vector>

namespace taskpipe {

/**
 * @brief Terminal state of one node after a run.
 *
 * `error` is set for Failed (TaskExecution), SkippedDependencyFailure
 * (FailedDependency, whose root_cause() is the original failure) and
 * Cancelled nodes.
 */
struct NodeOutcome {
    TaskPtr task;
    std::string name;
    NodeStatus status = NodeStatus::Pending;
    std::optional<Error> error;
    CleanupStatus cleanup = CleanupStatus::NotApplicable;
    std::optional<Error> cleanup_error;
    Duration run_duration{0};
};

/**
 * @brief Counts per outcome category.
 */
struct RunSummary {
    size_t total = 0;
    size_t already_done = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t skipped = 0;
    size_t cancelled = 0;
    size_t not_started = 0;
    size_t cleanups_total = 0;
    size_t cleanups_succeeded = 0;
    size_t cleanups_failed = 0;
    size_t cleanups_skipped = 0;
};

struct RunReport {
    std::vector<NodeOutcome> outcomes;   ///< Indexed like the graph's nodes
    bool cancelled = false;
    Duration wall_time{0};

    [[nodiscard]] const NodeOutcome* find(const TaskPtr& task) const;

    /// Status of `task`; Pending when the task is not part of the run.
    [[nodiscard]] NodeStatus status_of(const TaskPtr& task) const;

    [[nodiscard]] RunSummary summary() const;

    /// Every node reached a terminal status.
    [[nodiscard]] bool complete() const;

    /// Complete, and no run or cleanup failed.
    [[nodiscard]] bool all_ok() const;

    [[nodiscard]] std::vector<const NodeOutcome*> failures() const;

    /// Log failure details followed by the status summary.
    void log_summary(Logger& logger) const;
};

}  // namespace taskpipe

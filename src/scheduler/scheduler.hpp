/**
 * @file scheduler.hpp
 * @brief Dependency-gated execution of a TaskGraph.
 *
 * One coordinating loop owns all node state. Every run or cleanup
 * invocation is started from a bounded pool of unit threads and reports
 * back through a Completion posted to the loop. Eligible nodes all start at
 * once. Work dispatched to an injected executor frees its unit immediately,
 * so only bodies running inline are bounded by the unit pool; any other
 * throttling is left to the executor or resource pool the caller forwards
 * through RunOptions.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/run_options.hpp"
#include "graph/task_graph.hpp"
#include "scheduler/run_report.hpp"

#include <cstddef>
#include <stop_token>

namespace taskpipe {

class MetricsCollector;

/// Unit threads per run when none are configured.
inline constexpr size_t kDefaultUnitThreads = 64;

class Scheduler {
public:
    Scheduler();

    /// `unit_threads` caps the threads starting invocations; 0 selects
    /// kDefaultUnitThreads. A run never starts more units than it has nodes.
    explicit Scheduler(Logger logger, MetricsCollector* metrics = nullptr,
                       size_t unit_threads = 0);

    /**
     * @brief Drive every node of `graph` to a terminal status.
     *
     * Task failures never abort the run: they are recorded on the failing
     * node and every transitive dependent is skipped. The returned error is
     * reserved for scheduler invariant violations. When `stop` is requested,
     * nothing new is launched, in-flight invocations see the stop through
     * their RunContext, and nodes never started stay Pending. An invocation
     * that cannot be dispatched fails its node like a thrown run would.
     */
    [[nodiscard]] Result<RunReport> run(const TaskGraph& graph,
                                        const RunOptions& options,
                                        std::stop_token stop = {});

private:
    Logger logger_;
    MetricsCollector* metrics_;
    size_t unit_threads_;
};

/// Convenience wrapper: build-free execution with a silent logger.
[[nodiscard]] Result<RunReport> run_graph(const TaskGraph& graph,
                                          const RunOptions& options = {},
                                          std::stop_token stop = {});

}  // namespace taskpipe

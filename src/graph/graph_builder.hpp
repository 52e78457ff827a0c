/**
 * @file graph_builder.hpp
 * @brief Discovers the task DAG reachable from a set of root tasks.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "graph/task_graph.hpp"
#include "task/task.hpp"

#include <vector>

namespace taskpipe {

/**
 * @brief Builds a TaskGraph by expanding requirements() depth-first.
 *
 * Equal tasks collapse into one node. A task whose done() is true becomes a
 * DoneAlready node and its requirements() is never called, so the subtree
 * behind it is pruned. Revisiting a task on the active expansion chain fails
 * the build with a CyclicDependency error; an exception from done() or
 * requirements() fails it with a Discovery error. No partial graph is ever
 * returned.
 */
class GraphBuilder {
public:
    GraphBuilder();
    explicit GraphBuilder(Logger logger);

    [[nodiscard]] Result<TaskGraph> build(const std::vector<TaskPtr>& roots);

private:
    Logger logger_;
};

/// Convenience wrapper: build with a silent logger.
[[nodiscard]] Result<TaskGraph> build_graph(const std::vector<TaskPtr>& roots);

}  // namespace taskpipe

/**
 * @file task_graph.hpp
 * @brief Deduplicated task DAG produced by the graph builder.
 *
 * Nodes wrap one task each and carry both dependency and dependent edges.
 * The graph is immutable once finalized; per-run status lives in the
 * scheduler.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "task/task.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace taskpipe {

/**
 * @brief A single deduplicated task in the graph.
 */
struct TaskNode {
    TaskPtr task;
    std::vector<NodeIndex> dependencies;   ///< requirements() order, no duplicates
    std::vector<NodeIndex> dependents;
    NodeStatus initial_status = NodeStatus::Pending;   ///< Pending or DoneAlready

    [[nodiscard]] bool done_already() const noexcept {
        return initial_status == NodeStatus::DoneAlready;
    }
};

/**
 * @brief Directed acyclic graph of tasks plus a topological ordering.
 */
class TaskGraph {
public:
    TaskGraph() = default;

    // ── Construction ──────────────────────────
    NodeIndex add_node(TaskPtr task);
    void mark_done_already(NodeIndex index);

    /// Add the edge dependency -> dependent; repeated edges are merged.
    void add_dependency(NodeIndex dependency, NodeIndex dependent);

    /// Compute the topological order (Kahn). Fails if the edges form a cycle.
    Result<void> finalize();

    // ── Queries ───────────────────────────────
    [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }
    [[nodiscard]] const TaskNode& node(NodeIndex index) const { return nodes_.at(index); }
    [[nodiscard]] const std::vector<TaskNode>& nodes() const noexcept { return nodes_; }
    [[nodiscard]] std::optional<NodeIndex> find(const TaskPtr& task) const;

    /// Every dependency precedes its dependents.
    [[nodiscard]] const std::vector<NodeIndex>& topological_order() const noexcept { return order_; }

    /// Nodes nothing depends on (the requested roots and done roots).
    [[nodiscard]] std::vector<NodeIndex> roots() const;

    /// Nodes without dependencies.
    [[nodiscard]] std::vector<NodeIndex> leaves() const;

    [[nodiscard]] size_t done_already_count() const noexcept;
    [[nodiscard]] size_t edge_count() const noexcept;

    /// Check that `order` is a permutation of the nodes respecting every edge.
    [[nodiscard]] bool is_topologically_sorted(const std::vector<NodeIndex>& order) const;

    /// Each node in topological order with `<=` dependencies and `=>` dependents.
    [[nodiscard]] std::string describe() const;

private:
    std::vector<TaskNode> nodes_;
    std::unordered_map<TaskPtr, NodeIndex, TaskPtrHash, TaskPtrEqual> index_;
    std::vector<NodeIndex> order_;
};

}  // namespace taskpipe

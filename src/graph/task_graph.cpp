/**
 * @file task_graph.cpp
 * @brief TaskGraph implementation.
 *
 * Kahn's algorithm for the topological order, O(V+E) over the adjacency
 * vectors.
 */

#include "graph/task_graph.hpp"

#include <algorithm>
#include <queue>
#include <sstream>

namespace taskpipe {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

NodeIndex TaskGraph::add_node(TaskPtr task) {
    NodeIndex index = nodes_.size();
    index_.emplace(task, index);
    nodes_.push_back(TaskNode{.task = std::move(task)});
    return index;
}

void TaskGraph::mark_done_already(NodeIndex index) {
    nodes_.at(index).initial_status = NodeStatus::DoneAlready;
}

void TaskGraph::add_dependency(NodeIndex dependency, NodeIndex dependent) {
    auto& deps = nodes_.at(dependent).dependencies;
    if (std::find(deps.begin(), deps.end(), dependency) != deps.end()) return;
    deps.push_back(dependency);
    nodes_.at(dependency).dependents.push_back(dependent);
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

Result<void> TaskGraph::finalize() {
    std::vector<size_t> in_degree(nodes_.size(), 0);
    for (NodeIndex i = 0; i < nodes_.size(); ++i) {
        in_degree[i] = nodes_[i].dependencies.size();
    }

    std::queue<NodeIndex> zero_in;
    for (NodeIndex i = 0; i < nodes_.size(); ++i) {
        if (in_degree[i] == 0) zero_in.push(i);
    }

    std::vector<NodeIndex> order;
    order.reserve(nodes_.size());

    while (!zero_in.empty()) {
        auto current = zero_in.front();
        zero_in.pop();
        order.push_back(current);

        for (auto dependent : nodes_[current].dependents) {
            if (--in_degree[dependent] == 0) {
                zero_in.push(dependent);
            }
        }
    }

    if (order.size() != nodes_.size()) {
        std::ostringstream oss;
        oss << "cycle among nodes:";
        for (NodeIndex i = 0; i < nodes_.size(); ++i) {
            if (in_degree[i] != 0) oss << ' ' << nodes_[i].task->describe();
        }
        return Error{ErrorKind::CyclicDependency, oss.str()};
    }

    order_ = std::move(order);
    return {};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<NodeIndex> TaskGraph::find(const TaskPtr& task) const {
    if (!task) return std::nullopt;
    auto it = index_.find(task);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::vector<NodeIndex> TaskGraph::roots() const {
    std::vector<NodeIndex> out;
    for (NodeIndex i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].dependents.empty()) out.push_back(i);
    }
    return out;
}

std::vector<NodeIndex> TaskGraph::leaves() const {
    std::vector<NodeIndex> out;
    for (NodeIndex i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].dependencies.empty()) out.push_back(i);
    }
    return out;
}

size_t TaskGraph::done_already_count() const noexcept {
    return static_cast<size_t>(std::count_if(nodes_.begin(), nodes_.end(),
        [](const TaskNode& n) { return n.done_already(); }));
}

size_t TaskGraph::edge_count() const noexcept {
    size_t edges = 0;
    for (const auto& n : nodes_) edges += n.dependencies.size();
    return edges;
}

bool TaskGraph::is_topologically_sorted(const std::vector<NodeIndex>& order) const {
    if (order.size() != nodes_.size()) return false;

    std::vector<size_t> position(nodes_.size(), nodes_.size());
    for (size_t pos = 0; pos < order.size(); ++pos) {
        if (order[pos] >= nodes_.size() || position[order[pos]] != nodes_.size()) {
            return false;
        }
        position[order[pos]] = pos;
    }

    for (NodeIndex i = 0; i < nodes_.size(); ++i) {
        for (auto dep : nodes_[i].dependencies) {
            if (position[dep] >= position[i]) return false;
        }
    }
    return true;
}

std::string TaskGraph::describe() const {
    std::ostringstream oss;
    for (auto index : order_) {
        const auto& n = nodes_[index];
        oss << n.task->describe();
        if (n.done_already()) oss << " [done]";
        oss << '\n';
        for (auto dep : n.dependencies) {
            oss << "\t<= " << nodes_[dep].task->describe() << '\n';
        }
        for (auto dependent : n.dependents) {
            oss << "\t=> " << nodes_[dependent].task->describe() << '\n';
        }
    }
    return oss.str();
}

}  // namespace taskpipe

/**
 * @file graph_builder.cpp
 * @brief GraphBuilder implementation: iterative DFS with an explicit chain.
 */

#include "graph/graph_builder.hpp"

#include "telemetry/json_sink.hpp"

#include <exception>
#include <string>

namespace taskpipe {

namespace {

struct Frame {
    NodeIndex node;
    std::vector<TaskPtr> requirements;
    size_t next = 0;
};

Error discovery_error(const TaskPtr& task, std::string_view what, std::exception_ptr ex) {
    auto name = task->describe();
    auto err = error_from_exception(ErrorKind::Discovery, name, std::move(ex));
    err.message = std::string{what} + " of " + name + " failed: " + err.message;
    return err;
}

}  // namespace

GraphBuilder::GraphBuilder()
    : logger_(std::make_shared<NullSink>(), LogLevel::Error, "graph") {}

GraphBuilder::GraphBuilder(Logger logger) : logger_(std::move(logger)) {}

Result<TaskGraph> GraphBuilder::build(const std::vector<TaskPtr>& roots) {
    TaskGraph graph;
    std::vector<Frame> stack;
    std::vector<bool> on_chain;

    // Create a node for a newly seen task and queue its expansion.
    auto discover = [&](const TaskPtr& task) -> Result<NodeIndex> {
        auto index = graph.add_node(task);
        on_chain.resize(graph.size(), false);

        bool is_done = false;
        try {
            is_done = task->done();
        } catch (...) {
            return discovery_error(task, "done()", std::current_exception());
        }

        if (is_done) {
            graph.mark_done_already(index);
            logger_.debug(task->describe() + " already done, not expanded");
            return index;
        }

        std::vector<TaskPtr> requirements;
        try {
            requirements = task->requirements();
        } catch (...) {
            return discovery_error(task, "requirements()", std::current_exception());
        }

        logger_.debug(task->describe() + " requires " + std::to_string(requirements.size())
                      + " task(s)");
        stack.push_back(Frame{.node = index, .requirements = std::move(requirements)});
        on_chain[index] = true;
        return index;
    };

    for (const auto& root : roots) {
        if (!root) {
            return Error{ErrorKind::Discovery, "null root task"};
        }
        if (graph.find(root)) continue;

        if (auto started = discover(root); !started) {
            return started.error();
        }

        while (!stack.empty()) {
            auto& top = stack.back();
            if (top.next == top.requirements.size()) {
                on_chain[top.node] = false;
                stack.pop_back();
                continue;
            }

            // `top` is invalidated once discover() pushes a frame.
            NodeIndex parent = top.node;
            TaskPtr required = top.requirements[top.next++];

            if (!required) {
                Error err{ErrorKind::Discovery,
                          "requirements() of " + graph.node(parent).task->describe()
                          + " returned a null task"};
                err.task = graph.node(parent).task->describe();
                return err;
            }

            if (auto existing = graph.find(required)) {
                if (on_chain[*existing]) {
                    std::string chain;
                    bool in_cycle = false;
                    for (const auto& frame : stack) {
                        if (frame.node == *existing) in_cycle = true;
                        if (in_cycle) {
                            chain += graph.node(frame.node).task->describe() + " -> ";
                        }
                    }
                    chain += graph.node(*existing).task->describe();

                    Error err{ErrorKind::CyclicDependency, "cyclic dependency: " + chain};
                    err.task = graph.node(*existing).task->describe();
                    logger_.error(err.message);
                    return err;
                }
                graph.add_dependency(*existing, parent);
                continue;
            }

            auto child = discover(required);
            if (!child) return child.error();
            graph.add_dependency(*child, parent);
        }
    }

    if (auto sorted = graph.finalize(); !sorted) {
        return sorted.error();
    }

    logger_.info("Graph built: " + std::to_string(graph.size()) + " node(s), "
                 + std::to_string(graph.edge_count()) + " edge(s), "
                 + std::to_string(graph.done_already_count()) + " already done");
    return graph;
}

Result<TaskGraph> build_graph(const std::vector<TaskPtr>& roots) {
    return GraphBuilder{}.build(roots);
}

}  // namespace taskpipe

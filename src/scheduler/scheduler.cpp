/**
 * @file scheduler.cpp
 * @brief Scheduler implementation: coordinating loop, failure propagation
 *        and reference-counted cleanup.
 */

#include "scheduler/scheduler.hpp"

#include "executor/worker_pool.hpp"
#include "scheduler/completion_queue.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

namespace taskpipe {

namespace {

/// Mutable per-run state of one node. Touched only by the coordinating loop.
struct NodeState {
    NodeStatus status = NodeStatus::Pending;
    size_t unresolved_dependencies = 0;     ///< Dependencies not yet succeeded
    size_t outstanding_dependents = 0;      ///< Dependents not yet terminal
    CleanupStatus cleanup = CleanupStatus::NotApplicable;
    std::optional<Error> error;
    std::optional<Error> cleanup_error;
    SteadyTime started{};
    Duration duration{0};
};

/**
 * @brief One execution of a graph.
 */
class Execution {
public:
    Execution(const TaskGraph& graph, const RunOptions& options,
              Logger& logger, MetricsCollector* metrics, size_t unit_threads)
        : graph_(graph), options_(options), logger_(logger), metrics_(metrics)
        , unit_threads_(unit_threads), states_(graph.size()), names_(graph.size()) {}

    Result<RunReport> run(std::stop_token stop);

private:
    Result<void> start_units(size_t wanted);
    void initialize();
    void launch_ready();
    void launch_run(NodeIndex index);
    void launch_cleanup(NodeIndex index);
    void dispatch(NodeIndex index, Phase phase, Inputs inputs);
    Continuation make_continuation(NodeIndex index, Phase phase) const;
    void handle(Completion completion);
    void handle_run(const Completion& completion);
    void handle_cleanup(const Completion& completion);
    void record_cleanup(NodeIndex index, std::exception_ptr error);
    void settle(NodeIndex index);
    void maybe_cleanup(NodeIndex index);
    void fail(NodeIndex index, Error error);
    void begin_cancel();
    RunReport make_report(Duration wall_time) const;

    const TaskGraph& graph_;
    const RunOptions& options_;
    Logger& logger_;
    MetricsCollector* metrics_;
    size_t unit_threads_;

    std::vector<NodeState> states_;
    std::vector<std::string> names_;
    std::vector<NodeIndex> ready_;
    size_t terminal_ = 0;
    size_t running_ = 0;
    size_t cleaning_ = 0;
    bool cancelled_ = false;

    std::stop_source cancel_;
    // Shared with continuations, which may still be returning from push()
    // on an executor thread after the run is over.
    std::shared_ptr<CompletionQueue> queue_ = std::make_shared<CompletionQueue>();
    // Declared last: unit threads are joined before the rest of the state.
    std::unique_ptr<WorkerPool> units_;
};

Result<RunReport> Execution::run(std::stop_token stop) {
    if (graph_.topological_order().size() != graph_.size()) {
        return Error{ErrorKind::Internal, "graph was not finalized"};
    }

    auto started = std::chrono::steady_clock::now();
    if (!graph_.empty()) {
        auto started_units = start_units(std::min(unit_threads_, graph_.size()));
        if (!started_units) return started_units.error();
    }
    initialize();

    while (true) {
        if (!cancelled_ && stop.stop_requested()) begin_cancel();
        if (!cancelled_) launch_ready();
        if (running_ == 0 && cleaning_ == 0) break;

        // After cancellation, keep draining until every unit has reported.
        auto completion = queue_->pop(cancelled_ ? std::stop_token{} : stop);
        if (!completion) {
            begin_cancel();
            continue;
        }
        handle(std::move(*completion));
    }

    if (!cancelled_ && terminal_ != graph_.size()) {
        return Error{ErrorKind::Internal,
                     "scheduler stalled: " + std::to_string(graph_.size() - terminal_)
                     + " node(s) never became eligible"};
    }

    auto wall = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
    auto report = make_report(wall);
    if (metrics_) {
        metrics_->record_run_summary(report.summary(), wall);
    }
    return report;
}

// Fewer units only lower how many inline bodies run at once, so a thread
// shortage halves the pool instead of failing the run.
Result<void> Execution::start_units(size_t wanted) {
    for (auto count = wanted; count > 0; count /= 2) {
        try {
            units_ = std::make_unique<WorkerPool>(count);
            if (count < wanted) {
                logger_.warn("Started " + std::to_string(count) + " of "
                             + std::to_string(wanted) + " scheduler unit(s)");
            }
            return {};
        } catch (const std::system_error& e) {
            if (count == 1) {
                return Error{ErrorKind::Internal,
                             std::string("cannot start a scheduler unit: ") + e.what()};
            }
        }
    }
    return Error{ErrorKind::Internal, "no scheduler unit requested"};
}

void Execution::initialize() {
    for (NodeIndex i = 0; i < graph_.size(); ++i) {
        const auto& node = graph_.node(i);
        auto& state = states_[i];
        names_[i] = node.task->describe();
        state.status = node.initial_status;
        state.unresolved_dependencies = node.dependencies.size();
        state.outstanding_dependents = node.dependents.size();
        state.cleanup = node.task->has_cleanup() ? CleanupStatus::NotStarted
                                                 : CleanupStatus::NotApplicable;
    }

    for (auto index : graph_.topological_order()) {
        if (states_[index].status == NodeStatus::DoneAlready) {
            logger_.info(names_[index] + " already done.");
            settle(index);
        } else if (graph_.node(index).dependencies.empty()) {
            ready_.push_back(index);
        }
    }
}

void Execution::launch_ready() {
    while (!ready_.empty()) {
        auto index = ready_.back();
        ready_.pop_back();
        launch_run(index);
    }
}

void Execution::launch_run(NodeIndex index) {
    const auto& node = graph_.node(index);

    Inputs inputs;
    inputs.reserve(node.dependencies.size());
    try {
        for (auto dep : node.dependencies) {
            inputs.push_back(graph_.node(dep).task->output());
        }
    } catch (...) {
        auto err = error_from_exception(ErrorKind::TaskExecution, names_[index],
                                        std::current_exception());
        err.message = "collecting inputs of " + names_[index] + " failed: " + err.message;
        fail(index, std::move(err));
        return;
    }

    auto& state = states_[index];
    state.status = NodeStatus::Running;
    state.started = std::chrono::steady_clock::now();
    ++running_;
    logger_.info("Run " + names_[index] + " entered.");
    try {
        dispatch(index, Phase::Run, std::move(inputs));
    } catch (...) {
        --running_;
        auto err = error_from_exception(ErrorKind::TaskExecution, names_[index],
                                        std::current_exception());
        err.message = "dispatching " + names_[index] + " failed: " + err.message;
        fail(index, std::move(err));
    }
}

void Execution::launch_cleanup(NodeIndex index) {
    states_[index].cleanup = CleanupStatus::Running;
    ++cleaning_;
    logger_.info("Cleanup " + names_[index] + " entered.");
    try {
        dispatch(index, Phase::Cleanup, {});
    } catch (...) {
        --cleaning_;
        record_cleanup(index, std::current_exception());
    }
}

// The unit only starts the invocation. A task dispatching to an executor
// returns at once and reports from there; an inline body keeps its unit
// until it finishes.
void Execution::dispatch(NodeIndex index, Phase phase, Inputs inputs) {
    units_->post([task = graph_.node(index).task, phase, inputs = std::move(inputs),
                  done = make_continuation(index, phase), &options = options_,
                  token = cancel_.get_token()] {
        RunContext ctx{options, token};
        try {
            if (phase == Phase::Run) {
                task->start_run(inputs, ctx, done);
            } else {
                task->start_cleanup(ctx, done);
            }
        } catch (...) {
            done(std::current_exception());
        }
    });
}

// Only the first report of an invocation reaches the loop.
Continuation Execution::make_continuation(NodeIndex index, Phase phase) const {
    auto reported = std::make_shared<std::atomic<bool>>(false);
    return [queue = queue_, reported, index, phase](std::exception_ptr error) {
        if (reported->exchange(true)) return;
        queue->push(Completion{.node = index, .phase = phase, .error = std::move(error),
                               .finished_at = std::chrono::steady_clock::now()});
    };
}

void Execution::handle(Completion completion) {
    if (completion.phase == Phase::Run) {
        handle_run(completion);
    } else {
        handle_cleanup(completion);
    }
}

void Execution::handle_run(const Completion& completion) {
    auto index = completion.node;
    auto& state = states_[index];
    --running_;
    state.duration = std::chrono::duration_cast<Duration>(completion.finished_at - state.started);

    if (!completion.error) {
        state.status = NodeStatus::Succeeded;
        logger_.info("Run " + names_[index] + " done.");
        settle(index);
        return;
    }

    if (cancelled_) {
        auto err = error_from_exception(ErrorKind::Cancelled, names_[index], completion.error);
        err.message = "cancelled: " + err.message;
        state.status = NodeStatus::Cancelled;
        state.error = std::move(err);
        logger_.warn("Run " + names_[index] + " cancelled.");
        settle(index);
        return;
    }

    fail(index, error_from_exception(ErrorKind::TaskExecution, names_[index], completion.error));
}

void Execution::handle_cleanup(const Completion& completion) {
    --cleaning_;
    record_cleanup(completion.node, completion.error);
}

void Execution::record_cleanup(NodeIndex index, std::exception_ptr error) {
    auto& state = states_[index];
    if (!error) {
        state.cleanup = CleanupStatus::Succeeded;
        logger_.info("Cleanup " + names_[index] + " done.");
    } else {
        state.cleanup = CleanupStatus::Failed;
        state.cleanup_error = error_from_exception(ErrorKind::Cleanup, names_[index], error);
        logger_.error("Cleanup " + names_[index] + " failed: " + state.cleanup_error->message);
    }
    if (metrics_) metrics_->record_cleanup_event(names_[index], state.cleanup);
}

void Execution::fail(NodeIndex index, Error error) {
    auto& state = states_[index];
    state.status = NodeStatus::Failed;
    logger_.error("Run " + names_[index] + " failed: " + error.message);
    state.error = std::move(error);
    settle(index);
}

// Account for nodes that just became terminal: release their dependencies'
// cleanups, unblock or skip their dependents. Skipped dependents become
// terminal in turn, so this walks a worklist instead of recursing.
void Execution::settle(NodeIndex first) {
    std::vector<NodeIndex> work{first};

    while (!work.empty()) {
        auto index = work.back();
        work.pop_back();
        const auto& node = graph_.node(index);
        auto& state = states_[index];

        ++terminal_;
        if (metrics_) metrics_->record_node_event(names_[index], state.status, state.duration);

        for (auto dep : node.dependencies) {
            if (--states_[dep].outstanding_dependents == 0) maybe_cleanup(dep);
        }
        maybe_cleanup(index);

        if (is_success(state.status)) {
            for (auto dependent : node.dependents) {
                auto& next = states_[dependent];
                if (--next.unresolved_dependencies == 0 && next.status == NodeStatus::Pending) {
                    ready_.push_back(dependent);
                }
            }
            continue;
        }

        if (state.status != NodeStatus::Failed
            && state.status != NodeStatus::SkippedDependencyFailure) {
            continue;
        }

        auto origin = std::make_shared<const Error>(state.error->root_cause());
        for (auto dependent : node.dependents) {
            auto& next = states_[dependent];
            if (next.status != NodeStatus::Pending) continue;

            Error skipped{ErrorKind::FailedDependency,
                          "dependency " + names_[index] + " failed"};
            skipped.task = names_[dependent];
            skipped.cause = origin;
            next.status = NodeStatus::SkippedDependencyFailure;
            next.error = std::move(skipped);
            logger_.warn("Run " + names_[dependent] + " skipped: dependency "
                         + names_[index] + " failed.");
            work.push_back(dependent);
        }
    }
}

// Cleanup fires once every dependent is terminal. Roots have no dependents,
// so theirs fires right after they finish.
void Execution::maybe_cleanup(NodeIndex index) {
    auto& state = states_[index];
    if (state.cleanup != CleanupStatus::NotStarted) return;
    if (state.outstanding_dependents != 0 || !is_terminal(state.status)) return;

    if (!is_success(state.status)) {
        state.cleanup = CleanupStatus::Skipped;
        if (metrics_) metrics_->record_cleanup_event(names_[index], state.cleanup);
        return;
    }
    if (cancelled_) return;

    launch_cleanup(index);
}

void Execution::begin_cancel() {
    if (cancelled_) return;
    cancelled_ = true;
    cancel_.request_stop();
    logger_.warn("Run cancelled: waiting for " + std::to_string(running_) + " run(s) and "
                 + std::to_string(cleaning_) + " cleanup(s) in flight");
}

RunReport Execution::make_report(Duration wall_time) const {
    RunReport report;
    report.cancelled = cancelled_;
    report.wall_time = wall_time;
    report.outcomes.reserve(graph_.size());

    for (NodeIndex i = 0; i < graph_.size(); ++i) {
        const auto& state = states_[i];
        report.outcomes.push_back(NodeOutcome{
            .task = graph_.node(i).task,
            .name = names_[i],
            .status = state.status,
            .error = state.error,
            .cleanup = state.cleanup,
            .cleanup_error = state.cleanup_error,
            .run_duration = state.duration
        });
    }
    return report;
}

}  // namespace

// ─────────────────────────────────────────────
// Scheduler
// ─────────────────────────────────────────────

Scheduler::Scheduler()
    : logger_(std::make_shared<NullSink>(), LogLevel::Error, "scheduler")
    , metrics_(nullptr)
    , unit_threads_(kDefaultUnitThreads) {}

Scheduler::Scheduler(Logger logger, MetricsCollector* metrics, size_t unit_threads)
    : logger_(std::move(logger)), metrics_(metrics)
    , unit_threads_(unit_threads == 0 ? kDefaultUnitThreads : unit_threads) {}

Result<RunReport> Scheduler::run(const TaskGraph& graph,
                                 const RunOptions& options,
                                 std::stop_token stop) {
    logger_.info("Scheduler starting run of " + std::to_string(graph.size()) + " node(s)");
    Execution execution(graph, options, logger_, metrics_, unit_threads_);
    return execution.run(std::move(stop));
}

Result<RunReport> run_graph(const TaskGraph& graph,
                            const RunOptions& options,
                            std::stop_token stop) {
    return Scheduler{}.run(graph, options, std::move(stop));
}

}  // namespace taskpipe

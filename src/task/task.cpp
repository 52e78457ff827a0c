/**
 * @file task.cpp
 * @brief Default capability implementations of the Task contract.
 */

#include "task/task.hpp"

#include "executor/worker_pool.hpp"

#include <exception>
#include <utility>

namespace taskpipe {

namespace {

/// Run `body` on the calling thread, carrying its outcome in a ready future.
template <typename Body>
std::future<void> ready_future(Body&& body) {
    std::promise<void> promise;
    try {
        body();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

/// Wait for the future `invoke` returns and hand its outcome to `done`.
template <typename Invoke>
void await_and_report(const Invoke& invoke, const Continuation& done) {
    std::exception_ptr error;
    try {
        invoke().get();
    } catch (...) {
        error = std::current_exception();
    }
    done(error);
}

/// Await `invoke` on the injected executor if any, otherwise inline.
template <typename Invoke>
void dispatch(const RunContext& ctx, Invoke invoke, Continuation done) {
    if (const auto* pool = ctx.options.find<std::shared_ptr<WorkerPool>>(kExecutorOption);
        pool != nullptr && *pool) {
        (*pool)->post([invoke = std::move(invoke), done = std::move(done)] {
            await_and_report(invoke, done);
        });
        return;
    }
    await_and_report(invoke, done);
}

}  // namespace

TargetPtr Task::output() const {
    return std::make_shared<NoTarget>();
}

void Task::run(const Inputs& /*inputs*/, const RunContext& /*ctx*/) const {}

void Task::cleanup(const RunContext& /*ctx*/) const {}

std::future<void> Task::run_async(const Inputs& inputs, const RunContext& ctx) const {
    return ready_future([&] { run(inputs, ctx); });
}

std::future<void> Task::cleanup_async(const RunContext& ctx) const {
    return ready_future([&] { cleanup(ctx); });
}

void Task::start_run(const Inputs& inputs, const RunContext& ctx, Continuation done) const {
    // The scheduler keeps the task and the options alive until `done` runs.
    dispatch(ctx, [this, inputs, ctx] { return run_async(inputs, ctx); }, std::move(done));
}

void Task::start_cleanup(const RunContext& ctx, Continuation done) const {
    dispatch(ctx, [this, ctx] { return cleanup_async(ctx); }, std::move(done));
}

}  // namespace taskpipe

/**
 * @file task.hpp
 * @brief Task contract consumed by the graph builder and the scheduler.
 *
 * A task is an immutable value record. Its identity is structural: two tasks
 * of the same kind with equal declared fields are the same task and collapse
 * into one graph node. Each task kind implements the fixed capability set
 * below; ValueTask<Derived> derives the identity half from the record's
 * declared fields.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/run_options.hpp"
#include "target/target.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <ostream>
#include <sstream>
#include <stop_token>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace taskpipe {

class Task;

using TaskPtr = std::shared_ptr<const Task>;

/// Outputs of a node's dependencies, in requirements() order.
using Inputs = std::vector<TargetPtr>;

/**
 * @brief Per-invocation context handed to run and cleanup entry points.
 *
 * `options` is the caller's forwarded configuration, untouched by the
 * scheduler. `stop` is signalled when the whole run is cancelled; long task
 * bodies should poll it.
 */
struct RunContext {
    const RunOptions& options;
    std::stop_token stop;
};

/// Reports the end of an invocation: null on success, the thrown error
/// otherwise.
using Continuation = std::function<void(std::exception_ptr)>;

// ─────────────────────────────────────────────
// Task
// ─────────────────────────────────────────────

class Task {
public:
    virtual ~Task() = default;

    // ── Identity ──────────────────────────────
    [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;
    [[nodiscard]] virtual bool equals(const Task& other) const = 0;
    [[nodiscard]] virtual std::size_t hash() const = 0;
    [[nodiscard]] virtual std::string describe() const = 0;

    // ── Capabilities ──────────────────────────

    /// Tasks whose outputs this task consumes, in input order.
    [[nodiscard]] virtual std::vector<TaskPtr> requirements() const { return {}; }

    [[nodiscard]] virtual TargetPtr output() const;

    /// Whether the output is already available; a done task is never expanded
    /// nor run.
    [[nodiscard]] virtual bool done() const { return output()->exists(); }

    /// Produce the output. Throwing marks the task as failed.
    virtual void run(const Inputs& inputs, const RunContext& ctx) const;

    /**
     * @brief Asynchronous form of run().
     *
     * The default calls run() on the calling thread and returns a ready
     * future. Override it to hand the work to an external service.
     */
    [[nodiscard]] virtual std::future<void> run_async(const Inputs& inputs,
                                                      const RunContext& ctx) const;

    /**
     * @brief Scheduler entry point for a run; `done` is called exactly once.
     *
     * The default awaits run_async() on a WorkerPool found under the
     * "executor" option and reports from that job, so no scheduler thread
     * waits on it. Without an executor it awaits run_async() on the calling
     * thread. If start_run() throws, that error is the outcome and a later
     * call to `done` is ignored.
     */
    virtual void start_run(const Inputs& inputs, const RunContext& ctx,
                           Continuation done) const;

    [[nodiscard]] virtual bool has_cleanup() const noexcept { return false; }

    /// Release the output once no dependent needs it anymore.
    virtual void cleanup(const RunContext& ctx) const;

    /// Asynchronous form of cleanup(), ready when returned by default.
    [[nodiscard]] virtual std::future<void> cleanup_async(const RunContext& ctx) const;

    /// Scheduler entry point for a cleanup, dispatched like start_run().
    virtual void start_cleanup(const RunContext& ctx, Continuation done) const;
};

inline std::ostream& operator<<(std::ostream& os, const Task& task) {
    return os << task.describe();
}

/// Hash functor keyed on task value identity.
struct TaskPtrHash {
    std::size_t operator()(const TaskPtr& task) const { return task->hash(); }
};

/// Equality functor keyed on task value identity.
struct TaskPtrEqual {
    bool operator()(const TaskPtr& a, const TaskPtr& b) const {
        return a == b || a->equals(*b);
    }
};

// ─────────────────────────────────────────────
// ValueTask
// ─────────────────────────────────────────────

namespace detail {

template <typename T>
concept Streamable = requires(std::ostream& os, const T& value) {
    { os << value } -> std::convertible_to<std::ostream&>;
};

template <typename T>
void print_field(std::ostream& os, const T& value) {
    using V = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<V, std::string> || std::is_same_v<V, std::string_view>) {
        os << '\'' << value << '\'';
    } else if constexpr (std::is_same_v<V, bool>) {
        os << (value ? "true" : "false");
    } else if constexpr (Streamable<V>) {
        os << value;
    } else {
        os << '<' << typeid(V).name() << '>';
    }
}

}  // namespace detail

/**
 * @brief CRTP base deriving task identity from a ValueRecord.
 *
 * Derived must provide `static constexpr std::string_view kName` and a
 * `fields()` member returning `std::tie(...)` of its declared fields.
 * Members left out of fields() (caches, memory slots) do not take part in
 * identity.
 */
template <typename Derived, typename Base = Task>
class ValueTask : public Base {
public:
    [[nodiscard]] std::string_view type_name() const noexcept override {
        return Derived::kName;
    }

    [[nodiscard]] bool equals(const Task& other) const override {
        static_assert(ValueRecord<Derived>, "task records must satisfy ValueRecord");
        if (typeid(other) != typeid(Derived)) return false;
        return self().fields() == static_cast<const Derived&>(other).fields();
    }

    [[nodiscard]] std::size_t hash() const override {
        static_assert(ValueRecord<Derived>, "task records must satisfy ValueRecord");
        std::size_t seed = std::hash<std::string_view>{}(Derived::kName);
        std::apply([&seed](const auto&... field) {
            (hash_combine(seed, std::hash<std::remove_cvref_t<decltype(field)>>{}(field)), ...);
        }, self().fields());
        return seed;
    }

    [[nodiscard]] std::string describe() const override {
        std::ostringstream oss;
        oss << Derived::kName << '(';
        bool first = true;
        std::apply([&](const auto&... field) {
            ((oss << (first ? "" : ", "), detail::print_field(oss, field), first = false), ...);
        }, self().fields());
        oss << ')';
        return oss.str();
    }

private:
    const Derived& self() const { return static_cast<const Derived&>(*this); }
};

}  // namespace taskpipe

/**
 * @file result.hpp
 * @brief Error taxonomy and the monadic Result type for taskpipe.
 *
 * Result<T, E> is the primary error-handling mechanism of the library. Errors
 * raised by user task code are captured as std::exception_ptr and carried
 * inside an Error, so the original exception can still be rethrown by the
 * caller.
 */

#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace taskpipe {

// ─────────────────────────────────────────────
// Error Kinds
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    Generic,
    CyclicDependency,   ///< Discovery chain revisited a task
    Discovery,          ///< done() or requirements() threw
    TaskExecution,      ///< run threw
    FailedDependency,   ///< An upstream node failed
    Cleanup,            ///< cleanup threw
    Cancelled,          ///< Aborted by a stop request
    Config,
    Resource,
    Target,
    Internal            ///< Scheduler invariant violation
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Generic:          return "error";
        case ErrorKind::CyclicDependency: return "cyclic_dependency";
        case ErrorKind::Discovery:        return "discovery_error";
        case ErrorKind::TaskExecution:    return "task_execution_failure";
        case ErrorKind::FailedDependency: return "failed_dependency";
        case ErrorKind::Cleanup:          return "cleanup_failure";
        case ErrorKind::Cancelled:        return "cancelled";
        case ErrorKind::Config:           return "config_error";
        case ErrorKind::Resource:         return "resource_error";
        case ErrorKind::Target:           return "target_error";
        case ErrorKind::Internal:         return "internal_error";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Error
// ─────────────────────────────────────────────

/**
 * @brief Error record carrying a kind, a message and an optional cause chain.
 *
 * `task` names the task the error is attributed to (empty when the error is
 * not attributable). `exception` holds the exception thrown by user code, if
 * any. `cause` links FailedDependency errors to the originating failure.
 */
struct Error {
    ErrorKind kind = ErrorKind::Generic;
    std::string message;
    std::string task;
    std::exception_ptr exception;
    std::shared_ptr<const Error> cause;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// Follows the cause chain to the originating error.
    [[nodiscard]] const Error& root_cause() const noexcept {
        const Error* e = this;
        while (e->cause) e = e->cause.get();
        return *e;
    }

    /// Rethrows the captured user exception; no-op when there is none.
    void rethrow_if_exception() const {
        if (exception) std::rethrow_exception(exception);
    }
};

/// Message of an in-flight exception, "unknown exception" for non-std types.
[[nodiscard]] inline std::string describe_exception(const std::exception_ptr& ex) {
    if (!ex) return "no exception";
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

/// Build an error of the given kind from a captured exception.
[[nodiscard]] inline Error error_from_exception(ErrorKind kind,
                                                std::string task,
                                                std::exception_ptr ex) {
    Error err{kind, describe_exception(ex)};
    err.task = std::move(task);
    err.exception = std::move(ex);
    return err;
}

// ─────────────────────────────────────────────
// Result
// ─────────────────────────────────────────────

/**
 * @brief Result<T, E>: holds either a success value of type T or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error(describe_failure());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error(describe_failure());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error(describe_failure());
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::string describe_failure() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).message;
        } else {
            return "Result has no value";
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Result<void, E> for operations that can fail but return nothing.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    /// Throws when the result holds an error; used inside task bodies where
    /// a thrown error becomes the task's failure.
    void value() const {
        if (has_value_) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error(error_->message);
        } else {
            throw std::runtime_error("Result has no value");
        }
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

template <typename T, typename E = Error>
Result<T, E> make_error(ErrorKind kind, std::string message) {
    return Result<T, E>(E{kind, std::move(message)});
}

}  // namespace taskpipe

/**
 * @file types.hpp
 * @brief Fundamental types used throughout taskpipe.
 *
 * Defines node status, cleanup status, clock aliases and other shared
 * vocabulary types.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace taskpipe {

// ─────────────────────────────────────────────
// Clock Types
// ─────────────────────────────────────────────

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Index of a node inside a TaskGraph.
using NodeIndex = std::size_t;

// ─────────────────────────────────────────────
// Node Status
// ─────────────────────────────────────────────

enum class NodeStatus : uint8_t {
    Pending,                    ///< Not started (never started, if the run ended)
    DoneAlready,                ///< Output existed at discovery, never executed
    Running,                    ///< Run invocation in flight
    Succeeded,                  ///< Run returned normally
    Failed,                     ///< Run threw
    SkippedDependencyFailure,   ///< An upstream node failed, run never invoked
    Cancelled                   ///< In flight when the run was cancelled
};

[[nodiscard]] constexpr std::string_view to_string(NodeStatus status) noexcept {
    switch (status) {
        case NodeStatus::Pending:                  return "pending";
        case NodeStatus::DoneAlready:              return "done_already";
        case NodeStatus::Running:                  return "running";
        case NodeStatus::Succeeded:                return "succeeded";
        case NodeStatus::Failed:                   return "failed";
        case NodeStatus::SkippedDependencyFailure: return "skipped_dependency_failure";
        case NodeStatus::Cancelled:                return "cancelled";
    }
    return "unknown";
}

/// A terminal node will not change status again during the run.
[[nodiscard]] constexpr bool is_terminal(NodeStatus status) noexcept {
    return status != NodeStatus::Pending && status != NodeStatus::Running;
}

/// Output is available to dependents.
[[nodiscard]] constexpr bool is_success(NodeStatus status) noexcept {
    return status == NodeStatus::Succeeded || status == NodeStatus::DoneAlready;
}

// ─────────────────────────────────────────────
// Cleanup Status
// ─────────────────────────────────────────────

enum class CleanupStatus : uint8_t {
    NotApplicable,   ///< Task has no cleanup capability
    NotStarted,      ///< Waiting for dependents to become terminal
    Running,
    Succeeded,
    Failed,
    Skipped          ///< Node did not produce its output, nothing to release
};

[[nodiscard]] constexpr std::string_view to_string(CleanupStatus status) noexcept {
    switch (status) {
        case CleanupStatus::NotApplicable: return "not_applicable";
        case CleanupStatus::NotStarted:    return "not_started";
        case CleanupStatus::Running:       return "running";
        case CleanupStatus::Succeeded:     return "succeeded";
        case CleanupStatus::Failed:        return "failed";
        case CleanupStatus::Skipped:       return "skipped";
    }
    return "unknown";
}

}  // namespace taskpipe

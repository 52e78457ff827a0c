/**
 * @file run_report.cpp
 * @brief RunReport queries and summary logging.
 */

#include "scheduler/run_report.hpp"

#include <algorithm>

namespace taskpipe {

const NodeOutcome* RunReport::find(const TaskPtr& task) const {
    if (!task) return nullptr;
    TaskPtrEqual equal;
    for (const auto& outcome : outcomes) {
        if (equal(outcome.task, task)) return &outcome;
    }
    return nullptr;
}

NodeStatus RunReport::status_of(const TaskPtr& task) const {
    const auto* outcome = find(task);
    return outcome ? outcome->status : NodeStatus::Pending;
}

RunSummary RunReport::summary() const {
    RunSummary s;
    s.total = outcomes.size();
    for (const auto& o : outcomes) {
        switch (o.status) {
            case NodeStatus::DoneAlready:              ++s.already_done; break;
            case NodeStatus::Succeeded:                ++s.succeeded; break;
            case NodeStatus::Failed:                   ++s.failed; break;
            case NodeStatus::SkippedDependencyFailure: ++s.skipped; break;
            case NodeStatus::Cancelled:                ++s.cancelled; break;
            case NodeStatus::Pending:
            case NodeStatus::Running:                  ++s.not_started; break;
        }
        if (o.cleanup != CleanupStatus::NotApplicable) ++s.cleanups_total;
        if (o.cleanup == CleanupStatus::Succeeded) ++s.cleanups_succeeded;
        if (o.cleanup == CleanupStatus::Failed) ++s.cleanups_failed;
        if (o.cleanup == CleanupStatus::Skipped) ++s.cleanups_skipped;
    }
    return s;
}

bool RunReport::complete() const {
    return !cancelled && std::all_of(outcomes.begin(), outcomes.end(),
        [](const NodeOutcome& o) { return is_terminal(o.status); });
}

bool RunReport::all_ok() const {
    if (!complete()) return false;
    return std::all_of(outcomes.begin(), outcomes.end(), [](const NodeOutcome& o) {
        return is_success(o.status) && o.cleanup != CleanupStatus::Failed;
    });
}

std::vector<const NodeOutcome*> RunReport::failures() const {
    std::vector<const NodeOutcome*> out;
    for (const auto& o : outcomes) {
        if (o.status == NodeStatus::Failed || o.cleanup == CleanupStatus::Failed) {
            out.push_back(&o);
        }
    }
    return out;
}

void RunReport::log_summary(Logger& logger) const {
    auto s = summary();

    bool run_errors = s.failed > 0;
    bool clean_errors = s.cleanups_failed > 0;

    if (run_errors) {
        logger.warn("======== RUN ERRORS ==========");
        for (const auto& o : outcomes) {
            if (o.status == NodeStatus::Failed && o.error) {
                logger.error(o.name + ": " + o.error->message);
            }
        }
    }
    if (clean_errors) {
        logger.warn("======= CLEANUP ERRORS =======");
        for (const auto& o : outcomes) {
            if (o.cleanup == CleanupStatus::Failed && o.cleanup_error) {
                logger.error(o.name + ": " + o.cleanup_error->message);
            }
        }
    }

    logger.info("======== RUN STATUS ==========");
    if (run_errors || clean_errors) {
        logger.warn("Run failures          : " + std::to_string(s.failed));
        logger.warn("  dependency failures : " + std::to_string(s.skipped));
        logger.warn("Clean failures        : " + std::to_string(s.cleanups_failed));
        logger.warn("  skipped cleanups    : " + std::to_string(s.cleanups_skipped));
    }
    if (cancelled) {
        logger.warn("Cancelled             : " + std::to_string(s.cancelled));
        logger.warn("Not started           : " + std::to_string(s.not_started));
    }

    auto to_run = s.total - s.already_done;
    logger.info("Already existing : " + std::to_string(s.already_done));
    logger.info("Run successes    : " + std::to_string(s.succeeded) + " / " + std::to_string(to_run));
    logger.info("Clean successes  : " + std::to_string(s.cleanups_succeeded) + " / "
                + std::to_string(s.cleanups_total));

    if (all_ok()) {
        logger.info("All tasks successful");
    } else {
        logger.warn("There were failed or unfinished tasks");
    }
}

}  // namespace taskpipe

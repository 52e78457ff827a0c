/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "scheduler/run_report.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace taskpipe {

/**
 * @brief Collects node lifecycle events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::shared_ptr<ILogSink> sink);

    void record_node_event(std::string_view task, NodeStatus status, Duration duration);
    void record_cleanup_event(std::string_view task, CleanupStatus status);
    void record_run_summary(const RunSummary& summary, Duration wall_time);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::shared_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace taskpipe

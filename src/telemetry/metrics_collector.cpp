/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace taskpipe {

MetricsCollector::MetricsCollector(std::shared_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_node_event(std::string_view task, NodeStatus status,
                                         Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"node_status")"
        << R"(,"task":")" << json_escape(task) << "\""
        << R"(,"status":")" << to_string(status) << "\""
        << R"(,"duration_us":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_cleanup_event(std::string_view task, CleanupStatus status) {
    std::ostringstream oss;
    oss << R"({"event":"cleanup_status")"
        << R"(,"task":")" << json_escape(task) << "\""
        << R"(,"status":")" << to_string(status) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_run_summary(const RunSummary& summary, Duration wall_time) {
    std::ostringstream oss;
    oss << R"({"event":"run_summary")"
        << R"(,"total":)" << summary.total
        << R"(,"already_done":)" << summary.already_done
        << R"(,"succeeded":)" << summary.succeeded
        << R"(,"failed":)" << summary.failed
        << R"(,"skipped":)" << summary.skipped
        << R"(,"cancelled":)" << summary.cancelled
        << R"(,"not_started":)" << summary.not_started
        << R"(,"cleanups_succeeded":)" << summary.cleanups_succeeded
        << R"(,"cleanups_failed":)" << summary.cleanups_failed
        << R"(,"wall_time_us":)" << wall_time.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace taskpipe

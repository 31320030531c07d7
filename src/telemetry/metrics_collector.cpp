/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace render_batch {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_budget(const ResourceBudget& budget, size_t running) {
    std::ostringstream oss;
    oss << R"({"event":"budget_sample")"
        << R"(,"max_workers":)" << budget.max_workers
        << R"(,"by_cpu":)" << budget.workers_by_cpu
        << R"(,"by_memory":)" << budget.workers_by_memory
        << R"(,"running":)" << running
        << R"(,"cpu_pct":)" << budget.host.cpu_load_percent
        << R"(,"mem_avail_mb":)" << (budget.host.memory_available_bytes / (1024 * 1024))
        << R"(,"accelerator":")" << to_string(budget.accelerator_class) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_job_event(const JobId& id, JobState state,
                                        uint32_t attempt, Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"job_state_change")"
        << R"(,"job":")" << json_escape(id) << "\""
        << R"(,"state":")" << to_string(state) << "\""
        << R"(,"attempt":)" << attempt
        << R"(,"duration_us":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_retry(const JobId& id, uint32_t attempt,
                                    FailureClass cls, Duration delay) {
    std::ostringstream oss;
    oss << R"({"event":"retry_scheduled")"
        << R"(,"job":")" << json_escape(id) << "\""
        << R"(,"after_attempt":)" << attempt
        << R"(,"failure_class":")" << to_string(cls) << "\""
        << R"(,"delay_us":)" << delay.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_run_summary(const RunSummary& summary) {
    std::ostringstream oss;
    oss << R"({"event":"run_summary")"
        << R"(,"total":)" << summary.total
        << R"(,"completed":)" << summary.completed
        << R"(,"failed":)" << summary.failed
        << R"(,"cancelled":)" << summary.cancelled
        << R"(,"retries":)" << summary.retries
        << R"(,"peak_running":)" << summary.peak_running
        << R"(,"duration_us":)" << summary.duration.count()
        << R"(,"avg_job_us":)" << summary.average_job_duration().count()
        << R"(,"throughput":)" << summary.throughput()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
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

}  // namespace render_batch

/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "scheduler/run_summary.hpp"

#include <memory>
#include <mutex>

namespace render_batch {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_budget(const ResourceBudget& budget, size_t running);
    void record_job_event(const JobId& id, JobState state, uint32_t attempt, Duration duration);
    void record_retry(const JobId& id, uint32_t attempt, FailureClass cls, Duration delay);
    void record_run_summary(const RunSummary& summary);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace render_batch

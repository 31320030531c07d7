/**
 * @file run_summary.hpp
 * @brief Aggregate outcome of one drain() call.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <string>

namespace render_batch {

struct RunSummary {
    size_t total = 0;               ///< Jobs that reached a terminal state during the run
    size_t completed = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    size_t retries = 0;             ///< Retries scheduled (failed → pending)
    size_t peak_running = 0;

    Duration duration{0};           ///< Wall time of the run
    Duration total_job_time{0};     ///< Sum of attempt durations

    [[nodiscard]] Duration average_job_duration() const noexcept {
        size_t attempts = completed + failed + retries;
        if (attempts == 0) return Duration{0};
        return Duration{total_job_time.count() / static_cast<Duration::rep>(attempts)};
    }

    /// Terminal jobs per second of wall time.
    [[nodiscard]] double throughput() const noexcept {
        if (duration.count() <= 0) return 0.0;
        return static_cast<double>(total) * 1e6 / static_cast<double>(duration.count());
    }

    [[nodiscard]] double success_rate() const noexcept {
        if (total == 0) return 0.0;
        return static_cast<double>(completed) / static_cast<double>(total);
    }
};

}  // namespace render_batch

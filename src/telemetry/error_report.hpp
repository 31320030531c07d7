/**
 * @file error_report.hpp
 * @brief Plain-text post-mortem for terminally failed jobs.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "store/job.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace render_batch {

/// Report file name: error_<id>_a<attempt>_<YYYYmmdd_HHMMSS>.log (UTC).
[[nodiscard]] std::string error_report_filename(const JobId& id, uint32_t attempt, Timestamp at);

/// Human-readable report body: id, time, attempts, payload size, failure history.
[[nodiscard]] std::string format_error_report(const Job& job, Timestamp at);

/**
 * @brief Write a report for a failed job into dir (created if missing).
 * @return Path of the written file.
 */
Result<std::filesystem::path> write_error_report(const std::filesystem::path& dir,
                                                 const Job& job,
                                                 Timestamp at = now_us());

}  // namespace render_batch

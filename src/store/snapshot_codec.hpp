/**
 * @file snapshot_codec.hpp
 * @brief TOML serialization of the queue snapshot.
 * @author Dimitris Kafetzis
 *
 * On-disk layout (schema_version = 1):
 *
 *   schema_version = 1
 *
 *   [[jobs]]                  # one table per job, insertion order
 *   id = "job-..."
 *   payload = "68656c6c6f"    # hex-encoded blob
 *   state = "pending"
 *   attempt_count = 0
 *   max_attempts = 3
 *   created_at_us = 1729200000000000
 *   eligible_at_us = 0
 *   # optional: started_at_us, finished_at_us, last_error, last_failure_class,
 *   #           timeout_us, timeout_retryable, result
 *
 *   [[jobs.failure_history]]
 *   attempt = 1
 *   class = "timeout"
 *   message = "..."
 *   at_us = 1729200000000000
 *
 * All timestamps are microseconds since the Unix epoch, so a save/load
 * round trip reproduces every field exactly.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "store/job.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace render_batch {

inline constexpr int64_t kSnapshotSchemaVersion = 1;

struct SnapshotCodec {
    [[nodiscard]] static std::string encode(const std::vector<Job>& jobs);

    /// Fails with ErrorCode::CorruptState on any parse, schema or field error.
    [[nodiscard]] static Result<std::vector<Job>> decode(std::string_view text);

    [[nodiscard]] static std::string hex_encode(const Blob& blob);
    [[nodiscard]] static bool hex_decode(std::string_view hex, Blob& out);
};

}  // namespace render_batch

/**
 * @file job.hpp
 * @brief Job record, failure history, and the job state machine.
 * @author Dimitris Kafetzis
 *
 * A Job is mutated only through apply_mutation(), which enforces the
 * legal transitions:
 *
 *   pending  → running | cancelled
 *   running  → completed | failed | cancelled
 *   failed   → pending              (only while attempt_count < max_attempts)
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace render_batch {

/**
 * @brief One failed attempt, kept for diagnostics.
 */
struct FailureRecord {
    uint32_t attempt{0};
    FailureClass failure_class{FailureClass::Transient};
    std::string message;
    Timestamp at;

    bool operator==(const FailureRecord&) const = default;
};

/**
 * @brief The unit of schedulable work.
 */
struct Job {
    JobId id;
    Blob payload;
    JobState state{JobState::Pending};

    uint32_t attempt_count{0};
    uint32_t max_attempts{1};

    std::optional<std::string> last_error;
    std::optional<FailureClass> last_failure_class;
    std::vector<FailureRecord> failure_history;

    Timestamp created_at;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> finished_at;
    Timestamp eligible_at{};                ///< Retry backoff gate; epoch when unset

    std::optional<Duration> timeout;        ///< Overrides the configured job timeout
    std::optional<bool> timeout_retryable;  ///< Overrides the configured timeout class

    std::optional<Blob> result;

    [[nodiscard]] bool attempts_remaining() const noexcept {
        return attempt_count < max_attempts;
    }

    bool operator==(const Job&) const = default;
};

/// Read-only copy of a job handed to administrative callers.
using JobView = Job;

[[nodiscard]] constexpr bool is_terminal(JobState state) noexcept {
    return state == JobState::Completed
        || state == JobState::Failed
        || state == JobState::Cancelled;
}

[[nodiscard]] constexpr bool is_legal_transition(JobState from, JobState to) noexcept {
    switch (from) {
        case JobState::Pending:
            return to == JobState::Running || to == JobState::Cancelled;
        case JobState::Running:
            return to == JobState::Completed || to == JobState::Failed
                || to == JobState::Cancelled;
        case JobState::Failed:
            return to == JobState::Pending;
        case JobState::Completed:
        case JobState::Cancelled:
            return false;
    }
    return false;
}

/**
 * @brief A requested state transition plus the data it carries.
 */
struct JobMutation {
    JobState target{JobState::Pending};
    Timestamp at;

    std::optional<Blob> result;             ///< → completed
    FailureClass failure_class{FailureClass::Transient};
    std::string error;                      ///< → failed
    std::optional<Timestamp> eligible_at;   ///< → pending (retry)

    static JobMutation start(Timestamp at = now_us());
    static JobMutation complete(Blob result, Timestamp at = now_us());
    static JobMutation fail(FailureClass cls, std::string error, Timestamp at = now_us());
    static JobMutation retry(Timestamp eligible_at, Timestamp at = now_us());
    static JobMutation cancel(Timestamp at = now_us());
};

/**
 * @brief Apply a mutation to a job in place.
 *
 * Fails with ErrorCode::InvalidTransition and leaves the job untouched if
 * the transition is not legal from the job's current state.
 */
Result<void> apply_mutation(Job& job, const JobMutation& mutation);

/**
 * @brief Generate a process-unique, time-ordered job id.
 */
[[nodiscard]] JobId generate_job_id();

/// 1-128 characters from [A-Za-z0-9._:-]; ids end up in file names.
[[nodiscard]] bool is_valid_job_id(std::string_view id) noexcept;

/// Replace invalid UTF-8 sequences with '?' so messages can be persisted.
[[nodiscard]] std::string sanitize_utf8(std::string_view text);

}  // namespace render_batch

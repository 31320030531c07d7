/**
 * @file retry_policy.hpp
 * @brief Decides whether and when a failed job re-enters the queue.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "store/job.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace render_batch {

enum class BackoffAnchor : uint8_t {
    FailureTime,   ///< Delay counts from the job's finished_at
    DecisionTime   ///< Delay counts from when the retry decision is made
};

struct RetrySettings {
    Duration base_backoff{std::chrono::seconds(1)};
    double multiplier = 2.0;
    Duration max_backoff{std::chrono::minutes(5)};
    double jitter_fraction = 0.25;
    BackoffAnchor anchor = BackoffAnchor::FailureTime;
    bool timeout_retryable = true;

    [[nodiscard]] static RetrySettings from_config(const Config& config);
};

/**
 * @brief Exponential backoff with jitter, gated by failure class and attempt budget.
 *
 *   delay(n) = min(max_backoff, base * multiplier^(n-1)) + U[0, jitter * delay]
 *
 * where n is the job's attempt_count after the failed attempt. Thread-safe.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(RetrySettings settings, uint64_t seed = std::random_device{}());

    /// True iff the last failure class permits another attempt for this job.
    [[nodiscard]] bool is_retryable(const Job& job) const noexcept;

    /// True iff attempts remain and the last failure is retryable.
    [[nodiscard]] bool should_retry(const Job& job) const noexcept;

    /// Deterministic part of the delay for the given attempt number.
    [[nodiscard]] Duration base_delay(uint32_t attempt) const noexcept;

    /// Delay including jitter.
    [[nodiscard]] Duration backoff(const Job& job);

    /// Earliest admission time for the retried job.
    [[nodiscard]] Timestamp next_eligible(const Job& job, Timestamp now);

    [[nodiscard]] const RetrySettings& settings() const noexcept { return settings_; }

private:
    RetrySettings settings_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

}  // namespace render_batch

/**
 * @file retry_policy.cpp
 * @brief RetryPolicy implementation.
 * @author Dimitris Kafetzis
 */

#include "retry/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace render_batch {

RetrySettings RetrySettings::from_config(const Config& config) {
    RetrySettings s;
    s.base_backoff = std::chrono::milliseconds(config.retry.base_backoff_ms);
    s.multiplier = config.retry.backoff_multiplier;
    s.max_backoff = std::chrono::milliseconds(config.retry.max_backoff_ms);
    s.jitter_fraction = config.retry.jitter_fraction;
    s.anchor = config.retry.backoff_anchor == "decision" ? BackoffAnchor::DecisionTime
                                                         : BackoffAnchor::FailureTime;
    s.timeout_retryable = config.queue.timeout_retryable;
    return s;
}

RetryPolicy::RetryPolicy(RetrySettings settings, uint64_t seed)
    : settings_(settings), rng_(seed) {}

bool RetryPolicy::is_retryable(const Job& job) const noexcept {
    if (!job.last_failure_class) return false;
    switch (*job.last_failure_class) {
        case FailureClass::Transient: return true;
        case FailureClass::Permanent: return false;
        case FailureClass::Timeout:
            return job.timeout_retryable.value_or(settings_.timeout_retryable);
    }
    return false;
}

bool RetryPolicy::should_retry(const Job& job) const noexcept {
    return job.state == JobState::Failed
        && job.attempts_remaining()
        && is_retryable(job);
}

Duration RetryPolicy::base_delay(uint32_t attempt) const noexcept {
    double exponent = attempt > 0 ? static_cast<double>(attempt - 1) : 0.0;
    double scaled = static_cast<double>(settings_.base_backoff.count())
                  * std::pow(settings_.multiplier, exponent);
    double capped = std::min(scaled, static_cast<double>(settings_.max_backoff.count()));
    return Duration{static_cast<int64_t>(capped)};
}

Duration RetryPolicy::backoff(const Job& job) {
    auto delay = base_delay(job.attempt_count);
    double jitter_span = static_cast<double>(delay.count()) * settings_.jitter_fraction;
    if (jitter_span < 1.0) {
        return delay;
    }

    std::uniform_real_distribution<double> dist(0.0, jitter_span);
    double jitter;
    {
        std::lock_guard lock(rng_mutex_);
        jitter = dist(rng_);
    }
    return delay + Duration{static_cast<int64_t>(jitter)};
}

Timestamp RetryPolicy::next_eligible(const Job& job, Timestamp now) {
    Timestamp anchor = now;
    if (settings_.anchor == BackoffAnchor::FailureTime && job.finished_at) {
        anchor = *job.finished_at;
    }
    return from_epoch_us(to_epoch_us(anchor + backoff(job)));
}

}  // namespace render_batch

/**
 * @file scheduler.hpp
 * @brief Resource-aware batch scheduler: admission loop and admin surface.
 * @author Dimitris Kafetzis
 *
 * The Scheduler owns the TaskStore, a resource monitor, the RetryPolicy and
 * a WorkerPool. drain() runs the admission loop on the calling thread:
 *
 *   1. sample the ResourceBudget
 *   2. admit up to (max_workers - running) eligible pending jobs, FIFO
 *   3. wait for a completion, a deadline, a retry eligibility time or the
 *      budget poll interval
 *   4. record outcomes and apply the RetryPolicy
 *
 * until no pending or running jobs remain. Workers never touch the store;
 * they hand outcomes back through a completion queue.
 *
 * Template-parameterized on MonitorT for testability (LinuxMonitor or MockMonitor).
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/job_runner.hpp"
#include "executor/worker_pool.hpp"
#include "resource_monitor/monitor.hpp"
#include "retry/retry_policy.hpp"
#include "scheduler/run_summary.hpp"
#include "store/task_store.hpp"
#include "telemetry/error_report.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <iomanip>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace render_batch {

/**
 * @brief Per-job overrides accepted by enqueue().
 */
struct EnqueueOptions {
    std::optional<JobId> id;                 ///< Generated when absent
    std::optional<uint32_t> max_attempts;    ///< Defaults to [queue] max_attempts
    std::optional<Duration> timeout;         ///< Defaults to [queue] job_timeout_ms
    std::optional<bool> timeout_retryable;   ///< Defaults to [queue] timeout_retryable
};

template <ResourceMonitorLike MonitorT = LinuxMonitor>
class Scheduler {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ILogSink> metrics_sink;
        JobRunner runner;
        uint64_t seed = std::random_device{}();
    };

    explicit Scheduler(Options opts);
    ~Scheduler();

    // Non-copyable, non-movable
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // ── Lifecycle ────────────────────────────

    /**
     * @brief Validate configuration, load the queue and recover interrupted jobs.
     *
     * Fails on configuration errors and on a corrupt state file (unless
     * [queue] recover_corrupt_state is set, in which case the file is moved
     * aside and the scheduler starts with an empty queue).
     */
    Result<void> start();
    void stop();
    [[nodiscard]] bool is_started() const;

    // ── Administrative surface ───────────────
    Result<JobId> enqueue(Blob payload, const EnqueueOptions& options = {});
    Result<void> cancel(const JobId& id);
    /// Cancel every pending job now and signal every running one. Returns the number cancelled.
    Result<size_t> cancel_all();
    [[nodiscard]] Result<JobView> status(const JobId& id) const;
    [[nodiscard]] std::vector<JobView> list_failed() const;
    /// Manually re-queue a failed job, bypassing class and backoff but not max_attempts.
    Result<void> retry_failed(const JobId& id);
    [[nodiscard]] QueueStatistics statistics() const;

    /// Run until no pending or running job remains (or until cancel_all() settles).
    Result<RunSummary> drain();

    // ── Accessors (for testing) ─────────────
    MonitorT& monitor() { return monitor_; }
    TaskStore& store() { return store_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }
    [[nodiscard]] size_t running_count() const;

private:
    struct Inflight {
        std::stop_source stop;
        SteadyTime started;
        SteadyTime deadline;
        uint32_t attempt{0};
        bool cancel_requested{false};
    };

    struct Completion {
        JobId id;
        uint32_t attempt{0};
        RunOutcome outcome;
        Duration elapsed{0};
    };

    ResourceBudget sample_budget_locked();
    Result<void> admit_locked(size_t slots);
    void dispatch_locked(const Job& job);
    Result<void> process_completions_locked();
    Result<void> expire_deadlines_locked();
    Result<void> handle_failure_locked(const Job& job);
    Result<void> recover_orphans_locked(const std::string& reason);
    SteadyTime next_wakeup_locked(SteadyTime now) const;

    void note_terminal_locked(const Job& job);
    void log_progress_locked();
    void abort_inflight_locked();
    void settle_inflight_locked(std::unique_lock<std::mutex>& lock);
    [[nodiscard]] Duration job_timeout(const Job& job) const;

    Config config_;
    Logger logger_;
    MonitorT monitor_;
    TaskStore store_;
    RetryPolicy retry_;
    JobRunner runner_;
    MetricsCollector metrics_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool started_{false};
    bool draining_{false};
    bool cancelling_{false};
    AcceleratorClass accelerator_{AcceleratorClass::None};
    uint32_t last_budget_{0};

    std::unordered_map<JobId, Inflight> inflight_;      ///< Running in the store, worker attached
    std::unordered_set<JobId> live_bodies_;             ///< Job bodies that have not returned yet
    std::deque<Completion> completions_;

    // Run accounting
    RunSummary run_;
    SteadyTime run_started_{};
    size_t progress_total_{0};
    size_t next_progress_mark_{0};

    // Declared last: joined before the members the workers touch are destroyed
    WorkerPool pool_;
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <ResourceMonitorLike MonitorT>
Scheduler<MonitorT>::Scheduler(Options opts)
    : config_(std::move(opts.config))
    , logger_(opts.log_sink ? std::move(opts.log_sink) : std::make_unique<NullSink>(),
              opts.log_level, "scheduler")
    , monitor_(config_.resources)
    , store_(config_.queue.state_file)
    , retry_(RetrySettings::from_config(config_), opts.seed)
    , runner_(std::move(opts.runner))
    , metrics_(opts.metrics_sink ? std::move(opts.metrics_sink) : std::make_unique<NullSink>()) {
}

template <ResourceMonitorLike MonitorT>
Scheduler<MonitorT>::~Scheduler() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

template <ResourceMonitorLike MonitorT>
Result<void> Scheduler<MonitorT>::start() {
    std::lock_guard lock(mutex_);
    if (started_) {
        return Error{"Already started"};
    }

    auto valid = validate_config(config_);
    if (!valid) {
        logger_.error("Invalid configuration: " + valid.error().message);
        return valid.error();
    }

    auto loaded = store_.load();
    if (!loaded) {
        if (!loaded.error().is(ErrorCode::CorruptState) || !config_.queue.recover_corrupt_state) {
            logger_.error("Cannot load queue " + store_.path().string() + ": "
                          + loaded.error().message);
            return loaded.error();
        }
        logger_.warn("Queue state is corrupt: " + loaded.error().message);
        auto moved = store_.quarantine();
        if (!moved) {
            return moved.error();
        }
        logger_.warn("Corrupt state moved to " + moved->string() + "; starting with an empty queue");
    }

    monitor_.start();
    accelerator_ = monitor_.accelerator();

    // Jobs persisted as running lost their worker with the previous process.
    if (auto r = recover_orphans_locked("interrupted: scheduler stopped while the job was running"); !r) {
        return r;
    }

    started_ = true;

    auto stats = store_.statistics();
    logger_.info("Scheduler started: state=" + store_.path().string()
                 + " jobs=" + std::to_string(stats.total)
                 + " pending=" + std::to_string(stats.pending)
                 + " failed=" + std::to_string(stats.failed)
                 + " accelerator=" + std::string{to_string(accelerator_)});
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
void Scheduler<MonitorT>::stop() {
    std::lock_guard lock(mutex_);
    if (!started_) return;

    abort_inflight_locked();
    monitor_.stop();
    started_ = false;
    logger_.info("Scheduler stopped");
    logger_.flush();
    metrics_.flush();
}

template <ResourceMonitorLike MonitorT>
bool Scheduler<MonitorT>::is_started() const {
    std::lock_guard lock(mutex_);
    return started_;
}

template <ResourceMonitorLike MonitorT>
size_t Scheduler<MonitorT>::running_count() const {
    std::lock_guard lock(mutex_);
    return inflight_.size();
}

// ─────────────────────────────────────────────
// Administrative surface
// ─────────────────────────────────────────────

template <ResourceMonitorLike MonitorT>
Result<JobId> Scheduler<MonitorT>::enqueue(Blob payload, const EnqueueOptions& options) {
    std::lock_guard lock(mutex_);
    if (!started_) {
        return make_error<JobId>(ErrorCode::Unavailable, "Scheduler not started");
    }

    Job job;
    job.id = options.id.value_or(generate_job_id());
    if (!is_valid_job_id(job.id)) {
        return make_error<JobId>(ErrorCode::Generic, "Invalid job id '" + job.id + "'");
    }
    job.max_attempts = options.max_attempts.value_or(config_.queue.max_attempts);
    if (job.max_attempts == 0) {
        return make_error<JobId>(ErrorCode::Generic, "max_attempts must be at least 1");
    }
    job.payload = std::move(payload);
    job.created_at = now_us();
    job.timeout = options.timeout;
    job.timeout_retryable = options.timeout_retryable;

    auto id = job.id;
    auto appended = store_.append(std::move(job));
    if (!appended) {
        return appended.error();
    }

    if (draining_) ++progress_total_;
    logger_.debug("Enqueued " + id);
    cv_.notify_all();
    return id;
}

template <ResourceMonitorLike MonitorT>
Result<void> Scheduler<MonitorT>::cancel(const JobId& id) {
    std::lock_guard lock(mutex_);
    if (!started_) {
        return Error{ErrorCode::Unavailable, "Scheduler not started"};
    }

    auto job = store_.get(id);
    if (!job) {
        return Error{ErrorCode::NotFound, "Unknown job: " + id};
    }
    if (is_terminal(job->state)) {
        return Result<void>{};
    }

    if (job->state == JobState::Running) {
        auto it = inflight_.find(id);
        if (it != inflight_.end()) {
            // The worker acknowledges; the job is recorded when it returns.
            it->second.cancel_requested = true;
            it->second.stop.request_stop();
            logger_.info("Cancellation requested for running job " + id);
            cv_.notify_all();
            return Result<void>{};
        }
    }

    auto cancelled = store_.update(id, JobMutation::cancel());
    if (!cancelled) {
        return cancelled.error();
    }
    note_terminal_locked(*cancelled);
    logger_.info("Cancelled " + id);
    cv_.notify_all();
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
Result<size_t> Scheduler<MonitorT>::cancel_all() {
    std::lock_guard lock(mutex_);
    if (!started_) {
        return make_error<size_t>(ErrorCode::Unavailable, "Scheduler not started");
    }

    std::vector<JobId> pending;
    for (const auto& entry : store_.pending_fifo()) {
        pending.push_back(entry.id);
    }

    auto cancelled = store_.update_batch(pending, JobMutation::cancel());
    if (!cancelled) {
        return cancelled.error();
    }
    for (const auto& id : pending) {
        auto job = store_.get(id);
        if (job) note_terminal_locked(*job);
    }

    for (auto& [id, flight] : inflight_) {
        flight.cancel_requested = true;
        flight.stop.request_stop();
    }
    if (draining_) cancelling_ = true;

    logger_.info("Cancel all: " + std::to_string(*cancelled) + " pending cancelled, "
                 + std::to_string(inflight_.size()) + " running signalled");
    cv_.notify_all();
    return *cancelled;
}

template <ResourceMonitorLike MonitorT>
Result<JobView> Scheduler<MonitorT>::status(const JobId& id) const {
    auto job = store_.get(id);
    if (!job) {
        return make_error<JobView>(ErrorCode::NotFound, "Unknown job: " + id);
    }
    return *job;
}

template <ResourceMonitorLike MonitorT>
std::vector<JobView> Scheduler<MonitorT>::list_failed() const {
    return store_.jobs_in(JobState::Failed);
}

template <ResourceMonitorLike MonitorT>
Result<void> Scheduler<MonitorT>::retry_failed(const JobId& id) {
    std::lock_guard lock(mutex_);
    if (!started_) {
        return Error{ErrorCode::Unavailable, "Scheduler not started"};
    }

    auto job = store_.get(id);
    if (!job) {
        return Error{ErrorCode::NotFound, "Unknown job: " + id};
    }
    if (job->state != JobState::Failed) {
        return Error{ErrorCode::InvalidTransition,
                     "Job " + id + " is " + std::string{to_string(job->state)} + ", not failed"};
    }
    if (!job->attempts_remaining()) {
        return Error{ErrorCode::InvalidTransition,
                     "Job " + id + " has exhausted its " + std::to_string(job->max_attempts)
                     + " attempts"};
    }

    auto now = now_us();
    auto requeued = store_.update(id, JobMutation::retry(now, now));
    if (!requeued) {
        return requeued.error();
    }
    if (draining_) ++progress_total_;
    logger_.info("Manual retry of " + id);
    cv_.notify_all();
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
QueueStatistics Scheduler<MonitorT>::statistics() const {
    return store_.statistics();
}

// ─────────────────────────────────────────────
// Admission loop
// ─────────────────────────────────────────────

template <ResourceMonitorLike MonitorT>
Result<RunSummary> Scheduler<MonitorT>::drain() {
    std::unique_lock lock(mutex_);
    if (!started_) {
        return make_error<RunSummary>(ErrorCode::Unavailable, "Scheduler not started");
    }
    if (draining_) {
        return make_error<RunSummary>(ErrorCode::Generic, "drain() already in progress");
    }

    // Left behind by a previous run that aborted on a store error.
    if (auto r = recover_orphans_locked("interrupted: previous run aborted"); !r) {
        return r.error();
    }

    draining_ = true;
    cancelling_ = false;
    run_ = RunSummary{};
    run_started_ = std::chrono::steady_clock::now();
    progress_total_ = store_.statistics().active();
    next_progress_mark_ = 0;
    log_progress_locked();

    logger_.info("Run started: " + std::to_string(progress_total_) + " active jobs");

    auto fail_run = [this, &lock](const Error& err) -> Result<RunSummary> {
        logger_.error("Run aborted: " + err.message);
        settle_inflight_locked(lock);
        draining_ = false;
        cancelling_ = false;
        return err;
    };

    while (true) {
        if (auto r = process_completions_locked(); !r) return fail_run(r.error());
        if (auto r = expire_deadlines_locked(); !r) return fail_run(r.error());

        auto stats = store_.statistics();
        if (inflight_.empty() && (stats.active() == 0 || cancelling_)) break;

        if (!cancelling_) {
            auto budget = sample_budget_locked();
            if (inflight_.size() < budget.max_workers) {
                auto admitted = admit_locked(budget.max_workers - inflight_.size());
                if (!admitted) return fail_run(admitted.error());
            }
        }

        if (completions_.empty()) {
            auto now = std::chrono::steady_clock::now();
            cv_.wait_until(lock, next_wakeup_locked(now));
        }
    }

    run_.duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - run_started_);
    draining_ = false;
    cancelling_ = false;

    auto summary = run_;
    metrics_.record_run_summary(summary);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "Run finished: total=" << summary.total
        << " completed=" << summary.completed
        << " failed=" << summary.failed
        << " cancelled=" << summary.cancelled
        << " retries=" << summary.retries
        << " peak_running=" << summary.peak_running
        << " duration_s=" << static_cast<double>(summary.duration.count()) / 1e6
        << " throughput=" << summary.throughput() << "/s";
    logger_.info(oss.str());
    logger_.flush();
    metrics_.flush();
    return summary;
}

template <ResourceMonitorLike MonitorT>
ResourceBudget Scheduler<MonitorT>::sample_budget_locked() {
    auto budget = monitor_.sample();
    if (!budget) {
        logger_.warn("Resource sample failed (" + budget.error().message
                     + "); admitting one job at a time");
        ResourceBudget fallback;
        fallback.accelerator_class = accelerator_;
        return fallback;
    }

    if (budget->max_workers != last_budget_) {
        logger_.info("Budget: " + std::to_string(budget->max_workers) + " workers (cpu "
                     + std::to_string(budget->workers_by_cpu) + ", memory "
                     + std::to_string(budget->workers_by_memory) + ")");
        metrics_.record_budget(*budget, inflight_.size());
        last_budget_ = budget->max_workers;
    }
    return *budget;
}

template <ResourceMonitorLike MonitorT>
Result<void> Scheduler<MonitorT>::admit_locked(size_t slots) {
    auto now = now_us();
    for (const auto& job : store_.pending_fifo()) {
        if (slots == 0) break;
        if (job.eligible_at > now) continue;
        if (live_bodies_.contains(job.id)) continue;

        auto started = store_.update(job.id, JobMutation::start(now));
        if (!started) {
            return started.error();
        }
        dispatch_locked(*started);
        --slots;
    }
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
void Scheduler<MonitorT>::dispatch_locked(const Job& job) {
    auto now = std::chrono::steady_clock::now();
    Inflight flight;
    flight.started = now;
    flight.deadline = now + job_timeout(job);
    flight.attempt = job.attempt_count;
    auto token = flight.stop.get_token();

    inflight_.emplace(job.id, std::move(flight));
    live_bodies_.insert(job.id);
    run_.peak_running = std::max(run_.peak_running, inflight_.size());

    metrics_.record_job_event(job.id, JobState::Running, job.attempt_count, Duration{0});
    logger_.debug("Admitted " + job.id + " attempt " + std::to_string(job.attempt_count)
                  + "/" + std::to_string(job.max_attempts));

    pool_.submit([this, id = job.id, payload = job.payload, attempt = job.attempt_count,
                  accel = accelerator_, token]() {
        auto begin = std::chrono::steady_clock::now();
        RunContext ctx{id, payload, attempt, accel, token};
        auto outcome = invoke_runner(runner_, ctx);
        auto elapsed = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - begin);

        {
            std::lock_guard lock(mutex_);
            completions_.push_back(Completion{id, attempt, std::move(outcome), elapsed});
        }
        cv_.notify_all();
    });
}

template <ResourceMonitorLike MonitorT>
Result<void> Scheduler<MonitorT>::process_completions_locked() {
    while (!completions_.empty()) {
        auto done = std::move(completions_.front());
        completions_.pop_front();
        live_bodies_.erase(done.id);

        auto it = inflight_.find(done.id);
        if (it == inflight_.end() || it->second.attempt != done.attempt) {
            logger_.debug("Discarding late result of " + done.id
                          + " attempt " + std::to_string(done.attempt));
            continue;
        }
        bool cancel_requested = it->second.cancel_requested;
        inflight_.erase(it);
        run_.total_job_time += done.elapsed;

        if (done.outcome.has_value()) {
            auto completed = store_.update(done.id, JobMutation::complete(std::move(*done.outcome)));
            if (!completed) return completed.error();
            metrics_.record_job_event(done.id, JobState::Completed, done.attempt, done.elapsed);
            logger_.debug("Completed " + done.id);
            note_terminal_locked(*completed);
            continue;
        }

        if (cancel_requested) {
            auto cancelled = store_.update(done.id, JobMutation::cancel());
            if (!cancelled) return cancelled.error();
            metrics_.record_job_event(done.id, JobState::Cancelled, done.attempt, done.elapsed);
            logger_.info("Cancelled running job " + done.id);
            note_terminal_locked(*cancelled);
            continue;
        }

        const auto& failure = done.outcome.error();
        auto failed = store_.update(done.id, JobMutation::fail(failure.failure_class,
                                                               failure.message));
        if (!failed) return failed.error();
        metrics_.record_job_event(done.id, JobState::Failed, done.attempt, done.elapsed);
        if (auto r = handle_failure_locked(*failed); !r) return r;
    }
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
Result<void> Scheduler<MonitorT>::expire_deadlines_locked() {
    auto now = std::chrono::steady_clock::now();
    for (auto it = inflight_.begin(); it != inflight_.end();) {
        if (it->second.deadline > now) {
            ++it;
            continue;
        }

        // The body is abandoned; it stays in live_bodies_ until it returns.
        it->second.stop.request_stop();
        auto id = it->first;
        auto attempt = it->second.attempt;
        bool cancel_requested = it->second.cancel_requested;
        auto elapsed = std::chrono::duration_cast<Duration>(now - it->second.started);
        it = inflight_.erase(it);
        run_.total_job_time += elapsed;

        if (cancel_requested) {
            auto cancelled = store_.update(id, JobMutation::cancel());
            if (!cancelled) return cancelled.error();
            metrics_.record_job_event(id, JobState::Cancelled, attempt, elapsed);
            logger_.warn("Job " + id + " ignored cancellation; abandoned at its deadline");
            note_terminal_locked(*cancelled);
            continue;
        }

        auto limit_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        auto failed = store_.update(id, JobMutation::fail(
            FailureClass::Timeout, "Deadline exceeded after " + std::to_string(limit_ms) + " ms"));
        if (!failed) return failed.error();
        metrics_.record_job_event(id, JobState::Failed, attempt, elapsed);
        if (auto r = handle_failure_locked(*failed); !r) return r;
    }
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
Result<void> Scheduler<MonitorT>::handle_failure_locked(const Job& job) {
    auto cls = job.last_failure_class.value_or(FailureClass::Transient);
    const auto& message = job.last_error.value_or("");

    if (!cancelling_ && retry_.should_retry(job)) {
        auto now = now_us();
        auto eligible = retry_.next_eligible(job, now);
        auto requeued = store_.update(job.id, JobMutation::retry(eligible, now));
        if (!requeued) return requeued.error();

        auto delay = std::chrono::duration_cast<Duration>(eligible - now);
        if (delay.count() < 0) delay = Duration{0};
        ++run_.retries;
        metrics_.record_retry(job.id, job.attempt_count, cls, delay);
        logger_.warn("Job " + job.id + " attempt " + std::to_string(job.attempt_count)
                     + " failed [" + std::string{to_string(cls)} + "] " + message
                     + "; retry in "
                     + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(delay).count())
                     + " ms");
        return Result<void>{};
    }

    logger_.error("Job " + job.id + " failed permanently after "
                  + std::to_string(job.attempt_count) + " attempt(s) ["
                  + std::string{to_string(cls)} + "] " + message);
    note_terminal_locked(job);

    if (config_.telemetry.save_error_reports) {
        auto report = write_error_report(config_.telemetry.error_report_dir, job);
        if (!report) {
            logger_.warn("Could not write error report for " + job.id + ": "
                         + report.error().message);
        } else {
            logger_.info("Error report saved to " + report->string());
        }
    }
    return Result<void>{};
}

/// Fail every job recorded as running with no worker attached and apply the RetryPolicy.
template <ResourceMonitorLike MonitorT>
Result<void> Scheduler<MonitorT>::recover_orphans_locked(const std::string& reason) {
    for (const auto& job : store_.jobs_in(JobState::Running)) {
        if (inflight_.contains(job.id)) continue;

        auto failed = store_.update(job.id, JobMutation::fail(FailureClass::Transient, reason));
        if (!failed) {
            return failed.error();
        }
        logger_.warn("Recovered interrupted job " + job.id
                     + " (attempt " + std::to_string(job.attempt_count) + ")");
        if (auto handled = handle_failure_locked(*failed); !handled) {
            return handled;
        }
    }
    return Result<void>{};
}

template <ResourceMonitorLike MonitorT>
SteadyTime Scheduler<MonitorT>::next_wakeup_locked(SteadyTime now) const {
    auto wake = now + std::chrono::milliseconds(config_.resources.budget_poll_interval_ms);

    for (const auto& [id, flight] : inflight_) {
        wake = std::min(wake, flight.deadline);
    }

    if (!cancelling_) {
        auto sys_now = std::chrono::system_clock::now();
        for (const auto& job : store_.pending_fifo()) {
            if (job.eligible_at <= sys_now) continue;
            auto until = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                job.eligible_at - sys_now);
            wake = std::min(wake, now + until);
        }
    }
    return wake;
}

// ─────────────────────────────────────────────
// Bookkeeping
// ─────────────────────────────────────────────

template <ResourceMonitorLike MonitorT>
void Scheduler<MonitorT>::note_terminal_locked(const Job& job) {
    if (!draining_) return;

    ++run_.total;
    switch (job.state) {
        case JobState::Completed: ++run_.completed; break;
        case JobState::Failed:    ++run_.failed; break;
        case JobState::Cancelled: ++run_.cancelled; break;
        default: break;
    }
    log_progress_locked();
}

template <ResourceMonitorLike MonitorT>
void Scheduler<MonitorT>::log_progress_locked() {
    if (progress_total_ == 0) return;

    size_t done = run_.total;
    if (done < next_progress_mark_) return;

    size_t step = std::max<size_t>(1, progress_total_ / 10);
    next_progress_mark_ = (done / step + 1) * step;
    if (done == 0) return;

    auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - run_started_).count();
    double remaining = done >= progress_total_
        ? 0.0
        : elapsed * static_cast<double>(progress_total_ - done) / static_cast<double>(done);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "Progress: " << done << "/" << progress_total_
        << " (" << 100.0 * static_cast<double>(done) / static_cast<double>(progress_total_) << "%)"
        << " elapsed " << elapsed << "s, ETA " << remaining << "s";
    logger_.info(oss.str());
}

template <ResourceMonitorLike MonitorT>
void Scheduler<MonitorT>::abort_inflight_locked() {
    for (auto& [id, flight] : inflight_) {
        flight.stop.request_stop();
    }
}

/**
 * @brief Stop every in-flight job and wait until each has reported or passed its deadline.
 *
 * Used when the run aborts on a store error. Outcomes that arrive are
 * recorded if the store accepts them. Jobs whose record cannot be written
 * stay `running` on disk: a later drain() records them, and a restart
 * recovers them as interrupted.
 */
template <ResourceMonitorLike MonitorT>
void Scheduler<MonitorT>::settle_inflight_locked(std::unique_lock<std::mutex>& lock) {
    abort_inflight_locked();

    auto reported = [this](const JobId& id, uint32_t attempt) {
        return std::any_of(completions_.begin(), completions_.end(),
                           [&](const Completion& c) { return c.id == id && c.attempt == attempt; });
    };

    while (true) {
        auto now = std::chrono::steady_clock::now();
        std::optional<SteadyTime> wake;
        for (const auto& [id, flight] : inflight_) {
            if (flight.deadline <= now || reported(id, flight.attempt)) continue;
            wake = wake ? std::min(*wake, flight.deadline) : flight.deadline;
        }
        if (!wake) break;
        cv_.wait_until(lock, *wake);
    }

    if (auto r = process_completions_locked(); !r) {
        logger_.warn("Could not record outcomes after abort: " + r.error().message);
    } else if (auto e = expire_deadlines_locked(); !e) {
        logger_.warn("Could not record expired jobs after abort: " + e.error().message);
    }
    if (!inflight_.empty()) {
        // Kept so the next drain() records them once the store accepts writes.
        logger_.warn(std::to_string(inflight_.size())
                     + " job(s) still running in the store after abort");
    }
}

template <ResourceMonitorLike MonitorT>
Duration Scheduler<MonitorT>::job_timeout(const Job& job) const {
    return job.timeout.value_or(
        std::chrono::duration_cast<Duration>(std::chrono::milliseconds(config_.queue.job_timeout_ms)));
}

}  // namespace render_batch

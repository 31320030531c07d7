/**
 * @file test_batch_scenarios.cpp
 * @brief Integration tests exercising the full batch pipeline.
 * @author Dimitris Kafetzis
 *
 * Store → monitor → admission loop → worker pool → retry policy → store,
 * with MockMonitor standing in for the host.
 */

#include "core/config.hpp"
#include "core/types.hpp"
#include "executor/job_runner.hpp"
#include "executor/synthetic_runner.hpp"
#include "resource_monitor/monitor.hpp"
#include "scheduler/scheduler.hpp"
#include "store/task_store.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <latch>
#include <memory>
#include <thread>

using namespace render_batch;
using namespace std::chrono_literals;

namespace {

using TestScheduler = Scheduler<MockMonitor>;

/// Tracks how many job bodies run at once.
struct ConcurrencyGauge {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    void enter() {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
    }
    void leave() { --running; }
};

bool wait_until(const std::function<bool()>& pred, Duration limit = Duration{5s}) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

}  // namespace

class BatchScenario : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "rb_test_batch";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path state_file() const { return dir_ / "state" / "queue.toml"; }

    Config make_config() const {
        Config config;
        config.queue.state_file = state_file();
        config.queue.job_timeout_ms = 10'000;
        config.resources.budget_poll_interval_ms = 10;
        config.retry.base_backoff_ms = 1;
        config.retry.max_backoff_ms = 10;
        config.retry.jitter_fraction = 0.0;
        config.telemetry.error_report_dir = dir_ / "errors";
        return config;
    }

    std::unique_ptr<TestScheduler> make(JobRunner runner, Config config) const {
        return std::make_unique<TestScheduler>(TestScheduler::Options{
            .config = std::move(config),
            .runner = std::move(runner),
            .seed = 7,
        });
    }

    std::unique_ptr<TestScheduler> make(JobRunner runner) const {
        return make(std::move(runner), make_config());
    }
};

// ═══════════════════════════════════════════════
// Batch Runs
// ═══════════════════════════════════════════════

TEST_F(BatchScenario, TenJobsAllComplete) {
    auto sched = make(SyntheticRunner{});
    ASSERT_TRUE(sched->start().has_value());

    SyntheticSpec spec;
    spec.duration = 5ms;
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(sched->enqueue(SyntheticRunner::make_payload(spec)).has_value());
    }

    auto summary = sched->drain();
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary->total, 10u);
    EXPECT_EQ(summary->completed, 10u);
    EXPECT_EQ(summary->failed, 0u);
    EXPECT_EQ(summary->retries, 0u);
    EXPECT_LE(summary->peak_running, 5u);    // MockMonitor default budget
    EXPECT_GT(summary->throughput(), 0.0);

    auto stats = sched->statistics();
    EXPECT_EQ(stats.completed, 10u);
    EXPECT_EQ(stats.active(), 0u);
}

TEST_F(BatchScenario, PermanentFailureDoesNotStopOthers) {
    auto sched = make(SyntheticRunner{});
    ASSERT_TRUE(sched->start().has_value());

    SyntheticSpec ok;
    ok.duration = 2ms;
    SyntheticSpec broken = ok;
    broken.fail_attempts = 99;
    broken.fail_class = FailureClass::Permanent;

    for (int i = 1; i <= 5; ++i) {
        auto payload = SyntheticRunner::make_payload(i == 3 ? broken : ok);
        ASSERT_TRUE(sched->enqueue(payload, {.id = "job-" + std::to_string(i)}).has_value());
    }

    auto summary = sched->drain();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->completed, 4u);
    EXPECT_EQ(summary->failed, 1u);

    auto job3 = sched->status("job-3");
    ASSERT_TRUE(job3.has_value());
    EXPECT_EQ(job3->state, JobState::Failed);
    EXPECT_EQ(job3->attempt_count, 1u);
    EXPECT_EQ(job3->last_failure_class, FailureClass::Permanent);
}

TEST_F(BatchScenario, TimeoutsRetriedUntilSuccess) {
    auto sched = make(SyntheticRunner{});
    ASSERT_TRUE(sched->start().has_value());

    SyntheticSpec spec;
    spec.duration = 1ms;
    spec.fail_attempts = 2;
    spec.fail_class = FailureClass::Timeout;

    ASSERT_TRUE(sched->enqueue(SyntheticRunner::make_payload(spec),
                               {.id = "slow", .max_attempts = 3u,
                                .timeout = Duration{40ms}}).has_value());

    auto summary = sched->drain();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->completed, 1u);
    EXPECT_EQ(summary->retries, 2u);

    auto job = sched->status("slow");
    EXPECT_EQ(job->state, JobState::Completed);
    EXPECT_EQ(job->attempt_count, 3u);
    ASSERT_EQ(job->failure_history.size(), 2u);
    EXPECT_EQ(job->failure_history[0].failure_class, FailureClass::Timeout);
    EXPECT_EQ(job->failure_history[1].attempt, 2u);
}

TEST_F(BatchScenario, AbandonedBodyBlocksReadmission) {
    using std::chrono::duration_cast;
    using std::chrono::microseconds;
    using std::chrono::steady_clock;
    auto steady_us = [] {
        return duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count();
    };

    ConcurrencyGauge gauge;
    std::atomic<int64_t> first_returned_us{0};
    std::atomic<int64_t> second_started_us{0};

    auto sched = make([&](const RunContext& ctx) -> RunOutcome {
        gauge.enter();
        if (ctx.attempt == 1) {
            // Ignores ctx.stop: keeps running well past its deadline.
            std::this_thread::sleep_for(100ms);
            gauge.leave();
            first_returned_us = steady_us();
            return to_blob("late");
        }
        second_started_us = steady_us();
        gauge.leave();
        return to_blob("done");
    });
    ASSERT_TRUE(sched->start().has_value());
    ASSERT_TRUE(sched->enqueue(to_blob("p"),
                               {.id = "stubborn", .max_attempts = 2u,
                                .timeout = Duration{10ms}}).has_value());

    auto summary = sched->drain();
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary->completed, 1u);
    EXPECT_EQ(summary->retries, 1u);

    auto job = sched->status("stubborn");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, JobState::Completed);
    EXPECT_EQ(job->attempt_count, 2u);
    ASSERT_EQ(job->failure_history.size(), 1u);
    EXPECT_EQ(job->failure_history[0].failure_class, FailureClass::Timeout);
    EXPECT_EQ(to_text(*job->result), "done");

    EXPECT_EQ(gauge.peak.load(), 1);
    ASSERT_GT(first_returned_us.load(), 0);
    EXPECT_GE(second_started_us.load(), first_returned_us.load());
}

TEST_F(BatchScenario, HardCapBoundsConcurrency) {
    ConcurrencyGauge gauge;
    auto config = make_config();
    config.resources.hard_worker_cap = 2;

    auto sched = make([&gauge](const RunContext& ctx) -> RunOutcome {
        gauge.enter();
        std::this_thread::sleep_for(10ms);
        gauge.leave();
        return to_blob(ctx.job_id);
    }, config);
    ASSERT_TRUE(sched->start().has_value());
    for (int i = 0; i < 8; ++i) {
        ASSERT_TRUE(sched->enqueue(to_blob("p")).has_value());
    }

    auto summary = sched->drain();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->completed, 8u);
    EXPECT_LE(summary->peak_running, 2u);
    EXPECT_LE(gauge.peak.load(), 2);
}

TEST_F(BatchScenario, MemoryPressureShrinksBudget) {
    ConcurrencyGauge gauge;
    auto sched = make([&gauge](const RunContext& ctx) -> RunOutcome {
        gauge.enter();
        std::this_thread::sleep_for(5ms);
        gauge.leave();
        return to_blob(ctx.job_id);
    });
    ASSERT_TRUE(sched->start().has_value());
    // 3 GiB free at 2 GiB per job leaves room for one
    sched->monitor().set_memory(3ULL << 30, 32ULL << 30);
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(sched->enqueue(to_blob("p")).has_value());
    }

    auto summary = sched->drain();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->completed, 4u);
    EXPECT_EQ(gauge.peak.load(), 1);
}

TEST_F(BatchScenario, CancelAllStopsRunningAndPending) {
    auto config = make_config();
    config.resources.hard_worker_cap = 3;
    std::latch started{3};

    auto sched = make([&started](const RunContext& ctx) -> RunOutcome {
        started.count_down();
        while (!ctx.stop.stop_requested()) {
            std::this_thread::sleep_for(1ms);
        }
        return RunnerFailure{FailureClass::Transient, "stopped"};
    }, config);
    ASSERT_TRUE(sched->start().has_value());
    for (int i = 0; i < 7; ++i) {
        ASSERT_TRUE(sched->enqueue(to_blob("p"), {.id = "job-" + std::to_string(i)}).has_value());
    }

    Result<RunSummary> summary = Error{"not run"};
    std::thread runner([&] { summary = sched->drain(); });

    started.wait();
    auto cancelled = sched->cancel_all();
    runner.join();

    ASSERT_TRUE(cancelled.has_value());
    EXPECT_EQ(*cancelled, 4u);

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->cancelled, 7u);
    EXPECT_EQ(summary->retries, 0u);

    auto stats = sched->statistics();
    EXPECT_EQ(stats.cancelled, 7u);
    EXPECT_EQ(stats.active(), 0u);
}

TEST_F(BatchScenario, EnqueueWhileDraining) {
    auto sched = make(SyntheticRunner{});
    ASSERT_TRUE(sched->start().has_value());

    SyntheticSpec spec;
    spec.duration = 50ms;
    ASSERT_TRUE(sched->enqueue(SyntheticRunner::make_payload(spec), {.id = "first"}).has_value());

    Result<RunSummary> summary = Error{"not run"};
    std::thread runner([&] { summary = sched->drain(); });

    EXPECT_TRUE(wait_until([&] { return sched->running_count() == 1; }));
    spec.duration = 1ms;
    ASSERT_TRUE(sched->enqueue(SyntheticRunner::make_payload(spec), {.id = "late"}).has_value());
    runner.join();

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->completed, 2u);
    EXPECT_EQ(sched->status("late")->state, JobState::Completed);
}

// ═══════════════════════════════════════════════
// Persistence and Recovery
// ═══════════════════════════════════════════════

TEST_F(BatchScenario, QueueSurvivesRestart) {
    {
        auto sched = make(SyntheticRunner{});
        ASSERT_TRUE(sched->start().has_value());
        ASSERT_TRUE(sched->enqueue(to_blob("duration_ms=1"), {.id = "a"}).has_value());
        ASSERT_TRUE(sched->enqueue(to_blob("duration_ms=1"), {.id = "b", .max_attempts = 7u}).has_value());
        sched->stop();
    }

    auto sched = make(SyntheticRunner{});
    ASSERT_TRUE(sched->start().has_value());
    auto b = sched->status("b");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->state, JobState::Pending);
    EXPECT_EQ(b->max_attempts, 7u);

    auto dup = sched->enqueue(to_blob("x"), {.id = "a"});
    ASSERT_FALSE(dup.has_value());
    EXPECT_TRUE(dup.error().is(ErrorCode::DuplicateId));

    auto summary = sched->drain();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->completed, 2u);
}

TEST_F(BatchScenario, InterruptedJobRecoveredAsTransientFailure) {
    // Simulate a crash: a job persisted as running with nobody executing it
    {
        TaskStore store(state_file());
        Job job;
        job.id = "orphan";
        job.payload = to_blob("duration_ms=1");
        job.max_attempts = 3;
        job.created_at = now_us();
        ASSERT_TRUE(store.append(job).has_value());
        ASSERT_TRUE(store.update("orphan", JobMutation::start()).has_value());
    }

    auto sched = make(SyntheticRunner{});
    ASSERT_TRUE(sched->start().has_value());

    auto job = sched->status("orphan");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, JobState::Pending);
    ASSERT_EQ(job->failure_history.size(), 1u);
    EXPECT_NE(job->failure_history[0].message.find("interrupted"), std::string::npos);

    auto summary = sched->drain();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(sched->status("orphan")->state, JobState::Completed);
    EXPECT_EQ(sched->status("orphan")->attempt_count, 2u);
}

TEST_F(BatchScenario, InterruptedJobWithoutAttemptsLeftFails) {
    {
        TaskStore store(state_file());
        Job job;
        job.id = "orphan";
        job.payload = to_blob("duration_ms=1");
        job.max_attempts = 1;
        job.created_at = now_us();
        ASSERT_TRUE(store.append(job).has_value());
        ASSERT_TRUE(store.update("orphan", JobMutation::start()).has_value());
    }

    auto sched = make(SyntheticRunner{});
    ASSERT_TRUE(sched->start().has_value());
    EXPECT_EQ(sched->status("orphan")->state, JobState::Failed);
    EXPECT_EQ(sched->list_failed().size(), 1u);
}

TEST_F(BatchScenario, CorruptStateIsFatalByDefault) {
    std::filesystem::create_directories(state_file().parent_path());
    {
        std::ofstream ofs(state_file());
        ofs << "schema_version = \"what\"\n[[jobs]\n";
    }

    auto sched = make(SyntheticRunner{});
    auto r = sched->start();
    ASSERT_FALSE(r.has_value());
    EXPECT_TRUE(r.error().is(ErrorCode::CorruptState));
    EXPECT_FALSE(sched->is_started());
    EXPECT_TRUE(std::filesystem::exists(state_file()));
}

TEST_F(BatchScenario, CorruptStateQuarantinedWhenAllowed) {
    std::filesystem::create_directories(state_file().parent_path());
    {
        std::ofstream ofs(state_file());
        ofs << "not toml at all {{{";
    }

    auto config = make_config();
    config.queue.recover_corrupt_state = true;
    auto sched = make(SyntheticRunner{}, config);
    ASSERT_TRUE(sched->start().has_value());
    EXPECT_EQ(sched->statistics().total, 0u);

    bool found_quarantine = false;
    for (const auto& entry : std::filesystem::directory_iterator(state_file().parent_path())) {
        if (entry.path().filename().string().starts_with("queue.toml.corrupt-")) {
            found_quarantine = true;
        }
    }
    EXPECT_TRUE(found_quarantine);
}

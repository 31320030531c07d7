/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace render_batch;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "rb_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.queue.max_attempts, 3u);
    EXPECT_EQ(config.queue.job_timeout_ms, 3'600'000u);
    EXPECT_TRUE(config.queue.timeout_retryable);
    EXPECT_EQ(config.resources.per_job_memory_mb, 2048u);
    EXPECT_EQ(config.resources.hard_worker_cap, 8u);
    EXPECT_EQ(config.resources.accelerator, "auto");
    EXPECT_EQ(config.retry.base_backoff_ms, 1000u);
    EXPECT_DOUBLE_EQ(config.retry.backoff_multiplier, 2.0);
    EXPECT_EQ(config.retry.backoff_anchor, "failure");
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [queue]
        state_file = "/var/lib/render/queue.toml"
        max_attempts = 5
        job_timeout_ms = 120000
        timeout_retryable = false
        recover_corrupt_state = true

        [resources]
        per_job_memory_mb = 4096
        hard_worker_cap = 0
        cpu_oversubscription = 1.5
        accelerator = "cuda"
        budget_poll_interval_ms = 250

        [retry]
        base_backoff_ms = 200
        backoff_multiplier = 3.0
        max_backoff_ms = 60000
        jitter_fraction = 0.1
        backoff_anchor = "decision"

        [telemetry]
        log_dir = "/tmp/rb_logs"
        log_level = "debug"
        max_file_size_mb = 10
        rotate_count = 3
        error_report_dir = "/tmp/rb_logs/errors"
        save_error_reports = false
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.queue.state_file.string(), "/var/lib/render/queue.toml");
    EXPECT_EQ(config.queue.max_attempts, 5u);
    EXPECT_EQ(config.queue.job_timeout_ms, 120'000u);
    EXPECT_FALSE(config.queue.timeout_retryable);
    EXPECT_TRUE(config.queue.recover_corrupt_state);
    EXPECT_EQ(config.resources.per_job_memory_mb, 4096u);
    EXPECT_EQ(config.resources.hard_worker_cap, 0u);
    EXPECT_DOUBLE_EQ(config.resources.cpu_oversubscription, 1.5);
    EXPECT_EQ(config.resources.accelerator, "cuda");
    EXPECT_EQ(config.resources.budget_poll_interval_ms, 250u);
    EXPECT_EQ(config.retry.base_backoff_ms, 200u);
    EXPECT_DOUBLE_EQ(config.retry.backoff_multiplier, 3.0);
    EXPECT_EQ(config.retry.max_backoff_ms, 60'000u);
    EXPECT_DOUBLE_EQ(config.retry.jitter_fraction, 0.1);
    EXPECT_EQ(config.retry.backoff_anchor, "decision");
    EXPECT_EQ(config.telemetry.log_dir.string(), "/tmp/rb_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.rotate_count, 3u);
    EXPECT_FALSE(config.telemetry.save_error_reports);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [queue]
        max_attempts = 7
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->queue.max_attempts, 7u);
    // Defaults for everything else
    EXPECT_EQ(result->resources.hard_worker_cap, 8u);
    EXPECT_EQ(result->retry.backoff_anchor, "failure");
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Config));
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Config));
}

TEST_F(ConfigTest, RejectsZeroMaxAttempts) {
    auto path = write_toml(R"(
        [queue]
        max_attempts = 0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Config));
}

TEST_F(ConfigTest, RejectsUnknownAccelerator) {
    auto path = write_toml(R"(
        [resources]
        accelerator = "tpu"
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, RejectsUnknownAnchor) {
    auto path = write_toml(R"(
        [retry]
        backoff_anchor = "enqueue"
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST(ValidateConfigTest, RejectsImpossibleValues) {
    auto config = default_config();
    config.retry.backoff_multiplier = 0.5;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.retry.jitter_fraction = 1.5;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.retry.max_backoff_ms = 10;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.resources.cpu_oversubscription = 0.0;
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.telemetry.log_level = "verbose";
    EXPECT_FALSE(validate_config(config).has_value());

    config = default_config();
    config.queue.job_timeout_ms = 0;
    EXPECT_FALSE(validate_config(config).has_value());
}

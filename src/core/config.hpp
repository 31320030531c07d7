/**
 * @file config.hpp
 * @brief Scheduler configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace render_batch {

struct QueueConfig {
    std::filesystem::path state_file = "./state/queue.toml";
    uint32_t max_attempts = 3;              ///< Default per-job retry ceiling
    uint64_t job_timeout_ms = 3'600'000;    ///< Per-attempt deadline
    bool timeout_retryable = true;          ///< Classify timeouts as transient
    bool recover_corrupt_state = false;     ///< Start empty instead of failing on corruption
};

struct ResourceConfig {
    uint64_t per_job_memory_mb = 2048;
    uint32_t hard_worker_cap = 8;           ///< 0 = no cap
    double cpu_oversubscription = 0.67;     ///< Workers per logical core
    std::string accelerator = "auto";       ///< "auto", "none", "cuda", "rocm", "integrated"
    uint32_t budget_poll_interval_ms = 500;
};

struct RetryConfig {
    uint64_t base_backoff_ms = 1000;
    double backoff_multiplier = 2.0;
    uint64_t max_backoff_ms = 300'000;
    double jitter_fraction = 0.25;
    std::string backoff_anchor = "failure"; ///< "failure" or "decision"
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::filesystem::path error_report_dir = "./logs/errors";
    bool save_error_reports = true;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    QueueConfig queue;
    ResourceConfig resources;
    RetryConfig retry;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file. The result is validated.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Reject values the scheduler cannot run with.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace render_batch

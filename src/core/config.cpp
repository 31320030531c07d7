/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include "core/logger.hpp"
#include "core/types.hpp"

#include <toml++/toml.hpp>

namespace render_batch {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [queue]
        if (auto queue = tbl["queue"]; queue.is_table()) {
            config.queue.state_file = queue["state_file"].value_or(config.queue.state_file.string());
            config.queue.max_attempts = static_cast<uint32_t>(
                queue["max_attempts"].value_or(int64_t{3}));
            config.queue.job_timeout_ms = static_cast<uint64_t>(
                queue["job_timeout_ms"].value_or(int64_t{3'600'000}));
            config.queue.timeout_retryable = queue["timeout_retryable"].value_or(true);
            config.queue.recover_corrupt_state = queue["recover_corrupt_state"].value_or(false);
        }

        // [resources]
        if (auto res = tbl["resources"]; res.is_table()) {
            config.resources.per_job_memory_mb = static_cast<uint64_t>(
                res["per_job_memory_mb"].value_or(int64_t{2048}));
            config.resources.hard_worker_cap = static_cast<uint32_t>(
                res["hard_worker_cap"].value_or(int64_t{8}));
            config.resources.cpu_oversubscription =
                res["cpu_oversubscription"].value_or(0.67);
            config.resources.accelerator = res["accelerator"].value_or(std::string{"auto"});
            config.resources.budget_poll_interval_ms = static_cast<uint32_t>(
                res["budget_poll_interval_ms"].value_or(int64_t{500}));
        }

        // [retry]
        if (auto retry = tbl["retry"]; retry.is_table()) {
            config.retry.base_backoff_ms = static_cast<uint64_t>(
                retry["base_backoff_ms"].value_or(int64_t{1000}));
            config.retry.backoff_multiplier = retry["backoff_multiplier"].value_or(2.0);
            config.retry.max_backoff_ms = static_cast<uint64_t>(
                retry["max_backoff_ms"].value_or(int64_t{300'000}));
            config.retry.jitter_fraction = retry["jitter_fraction"].value_or(0.25);
            config.retry.backoff_anchor = retry["backoff_anchor"].value_or(std::string{"failure"});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.error_report_dir =
                telemetry["error_report_dir"].value_or(std::string{"./logs/errors"});
            config.telemetry.save_error_reports = telemetry["save_error_reports"].value_or(true);
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_config(const Config& config) {
    if (config.queue.max_attempts == 0) {
        return Error{ErrorCode::Config, "queue.max_attempts must be at least 1"};
    }
    if (config.queue.job_timeout_ms == 0) {
        return Error{ErrorCode::Config, "queue.job_timeout_ms must be positive"};
    }
    if (config.queue.state_file.empty()) {
        return Error{ErrorCode::Config, "queue.state_file must not be empty"};
    }
    if (config.resources.per_job_memory_mb == 0) {
        return Error{ErrorCode::Config, "resources.per_job_memory_mb must be positive"};
    }
    if (config.resources.cpu_oversubscription <= 0.0) {
        return Error{ErrorCode::Config, "resources.cpu_oversubscription must be positive"};
    }
    if (config.resources.accelerator != "auto"
        && !parse_accelerator_class(config.resources.accelerator)) {
        return Error{ErrorCode::Config,
                     "resources.accelerator: unknown class '" + config.resources.accelerator + "'"};
    }
    if (config.resources.budget_poll_interval_ms == 0) {
        return Error{ErrorCode::Config, "resources.budget_poll_interval_ms must be positive"};
    }
    if (config.retry.backoff_multiplier < 1.0) {
        return Error{ErrorCode::Config, "retry.backoff_multiplier must be >= 1.0"};
    }
    if (config.retry.jitter_fraction < 0.0 || config.retry.jitter_fraction > 1.0) {
        return Error{ErrorCode::Config, "retry.jitter_fraction must be within [0, 1]"};
    }
    if (config.retry.max_backoff_ms < config.retry.base_backoff_ms) {
        return Error{ErrorCode::Config, "retry.max_backoff_ms must be >= retry.base_backoff_ms"};
    }
    if (config.retry.backoff_anchor != "failure" && config.retry.backoff_anchor != "decision") {
        return Error{ErrorCode::Config,
                     "retry.backoff_anchor must be \"failure\" or \"decision\""};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::Config,
                     "telemetry.log_level: unknown level '" + config.telemetry.log_level + "'"};
    }
    return Result<void>{};
}

Config default_config() {
    return Config{};
}

}  // namespace render_batch

/**
 * @file main.cpp
 * @brief render_batch command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into the batch pipeline:
 *   Config → Logger → TaskStore → Monitor → Scheduler → WorkerPool → Telemetry
 *
 * Jobs executed by `run` use the synthetic runner; embedding applications
 * supply their own JobRunner through the library.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/synthetic_runner.hpp"
#include "resource_monitor/monitor.hpp"
#include "scheduler/scheduler.hpp"
#include "telemetry/json_sink.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace render_batch;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cout << "Usage: render_batch [OPTIONS] <command> [ARGS]\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --state <path>     Override [queue] state_file\n"
              << "  --log-dir <path>   Override [telemetry] log_dir\n"
              << "  --verbose          Log to stdout instead of the log directory\n"
              << "  --help, -h         Show this help message\n"
              << "\n"
              << "Commands:\n"
              << "  enqueue [--id ID] [--max-attempts N] [--timeout-ms N]\n"
              << "          [--timeout-permanent] (--file PATH | PAYLOAD)\n"
              << "  status <id>\n"
              << "  list-failed\n"
              << "  retry <id>\n"
              << "  cancel <id> | --all\n"
              << "  stats\n"
              << "  run [--demo N]     Drain the queue (optionally after enqueuing N demo jobs)\n";
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::optional<std::filesystem::path> state_file;
    std::optional<std::filesystem::path> log_dir;
    bool verbose = false;
    std::string command;
    std::vector<std::string> rest;
};

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--state" && i + 1 < argc) {
            args.state_file = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(kExitOk);
        } else if (arg.starts_with("--")) {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            break;
        }
    }
    if (i >= argc) return std::nullopt;

    args.command = argv[i++];
    for (; i < argc; ++i) args.rest.emplace_back(argv[i]);
    return args;
}

std::string format_time(const std::optional<Timestamp>& ts) {
    if (!ts) return "-";
    auto t = std::chrono::system_clock::to_time_t(*ts);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%TZ");
    return oss.str();
}

void print_job(const JobView& job) {
    std::cout << "id:            " << job.id << "\n"
              << "state:         " << to_string(job.state) << "\n"
              << "attempts:      " << job.attempt_count << "/" << job.max_attempts << "\n"
              << "payload bytes: " << job.payload.size() << "\n"
              << "created:       " << format_time(job.created_at) << "\n"
              << "started:       " << format_time(job.started_at) << "\n"
              << "finished:      " << format_time(job.finished_at) << "\n";
    if (job.state == JobState::Pending && job.eligible_at > job.created_at) {
        std::cout << "eligible:      " << format_time(job.eligible_at) << "\n";
    }
    if (job.last_error) {
        std::cout << "last error:    [" << to_string(job.last_failure_class.value_or(FailureClass::Transient))
                  << "] " << *job.last_error << "\n";
    }
    if (job.result) {
        std::cout << "result:        " << to_text(*job.result) << "\n";
    }
}

void print_statistics(const QueueStatistics& stats) {
    std::cout << "total:     " << stats.total << "\n"
              << "pending:   " << stats.pending << "\n"
              << "running:   " << stats.running << "\n"
              << "completed: " << stats.completed << "\n"
              << "failed:    " << stats.failed << "\n"
              << "cancelled: " << stats.cancelled << "\n";
}

void print_summary(const RunSummary& summary) {
    std::cout << std::fixed << std::setprecision(2)
              << "Run summary\n"
              << "  jobs finished:   " << summary.total << "\n"
              << "  completed:       " << summary.completed << "\n"
              << "  failed:          " << summary.failed << "\n"
              << "  cancelled:       " << summary.cancelled << "\n"
              << "  retries:         " << summary.retries << "\n"
              << "  success rate:    " << 100.0 * summary.success_rate() << "%\n"
              << "  duration:        " << static_cast<double>(summary.duration.count()) / 1e6 << " s\n"
              << "  avg job time:    "
              << static_cast<double>(summary.average_job_duration().count()) / 1e3 << " ms\n"
              << "  throughput:      " << summary.throughput() << " jobs/s\n"
              << "  peak running:    " << summary.peak_running << "\n";
}

int report(const Error& err) {
    std::cerr << "error (" << to_string(err.code) << "): " << err.message << "\n";
    return kExitFailure;
}

using CliScheduler = Scheduler<LinuxMonitor>;

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

int cmd_enqueue(CliScheduler& scheduler, const std::vector<std::string>& args) {
    EnqueueOptions options;
    std::optional<Blob> payload;

    try {
        for (size_t i = 0; i < args.size(); ++i) {
            const auto& arg = args[i];
            if (arg == "--id" && i + 1 < args.size()) {
                options.id = args[++i];
            } else if (arg == "--max-attempts" && i + 1 < args.size()) {
                options.max_attempts = static_cast<uint32_t>(std::stoul(args[++i]));
            } else if (arg == "--timeout-ms" && i + 1 < args.size()) {
                options.timeout = std::chrono::milliseconds(std::stoull(args[++i]));
            } else if (arg == "--timeout-permanent") {
                options.timeout_retryable = false;
            } else if (arg == "--file" && i + 1 < args.size()) {
                std::ifstream in(args[++i], std::ios::binary);
                if (!in) {
                    std::cerr << "Cannot read payload file " << args[i] << "\n";
                    return kExitUsage;
                }
                payload = Blob(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
            } else if (!payload) {
                payload = to_blob(arg);
            } else {
                std::cerr << "Unexpected argument: " << arg << "\n";
                return kExitUsage;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid number: " << e.what() << "\n";
        return kExitUsage;
    }

    if (!payload) {
        std::cerr << "enqueue: missing payload\n";
        return kExitUsage;
    }

    auto id = scheduler.enqueue(std::move(*payload), options);
    if (!id) return report(id.error());
    std::cout << *id << "\n";
    return kExitOk;
}

int cmd_status(CliScheduler& scheduler, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "status: expected a job id\n";
        return kExitUsage;
    }
    auto job = scheduler.status(args[0]);
    if (!job) return report(job.error());
    print_job(*job);
    return kExitOk;
}

int cmd_list_failed(CliScheduler& scheduler) {
    auto failed = scheduler.list_failed();
    for (const auto& job : failed) {
        std::cout << job.id << "\t" << job.attempt_count << "/" << job.max_attempts
                  << "\t" << to_string(job.last_failure_class.value_or(FailureClass::Transient))
                  << "\t" << job.last_error.value_or("") << "\n";
    }
    if (failed.empty()) std::cout << "No failed jobs\n";
    return kExitOk;
}

int cmd_retry(CliScheduler& scheduler, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "retry: expected a job id\n";
        return kExitUsage;
    }
    auto retried = scheduler.retry_failed(args[0]);
    if (!retried) return report(retried.error());
    std::cout << "Requeued " << args[0] << "\n";
    return kExitOk;
}

int cmd_cancel(CliScheduler& scheduler, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "cancel: expected a job id or --all\n";
        return kExitUsage;
    }
    if (args[0] == "--all") {
        auto cancelled = scheduler.cancel_all();
        if (!cancelled) return report(cancelled.error());
        std::cout << "Cancelled " << *cancelled << " pending job(s)\n";
        return kExitOk;
    }
    auto cancelled = scheduler.cancel(args[0]);
    if (!cancelled) return report(cancelled.error());
    std::cout << "Cancelled " << args[0] << "\n";
    return kExitOk;
}

/**
 * @brief Enqueue a mix of synthetic jobs: mostly clean renders, some transient
 *        failures that recover, and one permanent failure.
 */
Result<void> enqueue_demo_jobs(CliScheduler& scheduler, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        SyntheticSpec spec;
        spec.duration = std::chrono::milliseconds(50 + static_cast<int64_t>(i % 5) * 30);
        spec.result = "frame_" + std::to_string(i) + ".png";
        if (i % 7 == 3) {
            spec.fail_attempts = 1;
            spec.fail_class = FailureClass::Transient;
        } else if (i == count / 2) {
            spec.fail_attempts = 1;
            spec.fail_class = FailureClass::Permanent;
        }

        auto id = scheduler.enqueue(SyntheticRunner::make_payload(spec));
        if (!id) return id.error();
    }
    return Result<void>{};
}

int cmd_run(CliScheduler& scheduler, const std::vector<std::string>& args) {
    size_t demo_jobs = 0;
    try {
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--demo") {
                demo_jobs = (i + 1 < args.size()) ? std::stoul(args[++i]) : 20;
            } else {
                std::cerr << "run: unexpected argument " << args[i] << "\n";
                return kExitUsage;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid number: " << e.what() << "\n";
        return kExitUsage;
    }

    if (demo_jobs > 0) {
        auto seeded = enqueue_demo_jobs(scheduler, demo_jobs);
        if (!seeded) return report(seeded.error());
        std::cout << "Enqueued " << demo_jobs << " demo jobs\n";
    }

    // Ctrl+C cancels the run; drain() returns once workers acknowledge.
    std::jthread watcher([&scheduler](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                std::cerr << "\nShutdown requested, cancelling jobs...\n";
                auto cancelled = scheduler.cancel_all();
                if (!cancelled) {
                    std::cerr << "cancel failed: " << cancelled.error().message << "\n";
                }
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto summary = scheduler.drain();
    watcher.request_stop();
    if (!summary) return report(summary.error());

    print_summary(*summary);
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return kExitUsage;
    }
    auto args = std::move(*parsed);

    // Load configuration
    Config config = default_config();
    if (std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return kExitUsage;
        }
        config = *config_result;
    } else {
        std::cerr << "Config " << args.config_path << " not found, using defaults" << std::endl;
    }

    // Apply CLI overrides
    if (args.state_file) config.queue.state_file = *args.state_file;
    if (args.log_dir) config.telemetry.log_dir = *args.log_dir;

    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    // ── Initialize sinks ─────────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (args.verbose || config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<StdoutSink>();
        metrics_sink = std::make_unique<NullSink>();
    } else {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "render_batch",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    CliScheduler scheduler(CliScheduler::Options{
        .config = config,
        .log_sink = std::move(log_sink),
        .log_level = level,
        .metrics_sink = std::move(metrics_sink),
        .runner = SyntheticRunner{},
    });

    auto started = scheduler.start();
    if (!started) return report(started.error());

    const auto& cmd = args.command;
    if (cmd == "enqueue")     return cmd_enqueue(scheduler, args.rest);
    if (cmd == "status")      return cmd_status(scheduler, args.rest);
    if (cmd == "list-failed") return cmd_list_failed(scheduler);
    if (cmd == "retry")       return cmd_retry(scheduler, args.rest);
    if (cmd == "cancel")      return cmd_cancel(scheduler, args.rest);
    if (cmd == "stats") {
        print_statistics(scheduler.statistics());
        return kExitOk;
    }
    if (cmd == "run")         return cmd_run(scheduler, args.rest);

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return kExitUsage;
}

/**
 * @file monitor.hpp
 * @brief Resource monitor interface, budget policy, and concrete implementations.
 * @author Dimitris Kafetzis
 *
 * Provides LinuxMonitor (reads from /proc, /sys, /dev) and MockMonitor (testing).
 * Both satisfy the ResourceMonitorLike concept for zero-cost static dispatch.
 *
 * Budget rule:
 *   workers_by_memory = floor(memory_available / per_job_memory)
 *   workers_by_cpu    = floor(cpu_cores * cpu_oversubscription)
 *   max_workers       = max(1, min(workers_by_memory, workers_by_cpu, hard_cap))
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace render_batch {

// ─────────────────────────────────────────────
// Budget Policy
// ─────────────────────────────────────────────

struct BudgetPolicy {
    uint64_t per_job_memory_bytes = 2048ULL * 1024 * 1024;
    uint32_t hard_worker_cap = 8;               ///< 0 = no cap
    double cpu_oversubscription = 0.67;

    [[nodiscard]] static BudgetPolicy from_config(const ResourceConfig& config);
};

/**
 * @brief Derive a worker budget from host figures. Never returns max_workers < 1.
 */
[[nodiscard]] ResourceBudget compute_budget(const HostSnapshot& host,
                                            const BudgetPolicy& policy,
                                            AcceleratorClass accelerator);

/**
 * @brief Detect the accelerator class from device nodes and DRM vendor ids.
 *
 * @param root Filesystem root to probe under (tests point this at a fixture tree).
 */
[[nodiscard]] AcceleratorClass probe_accelerator(const std::filesystem::path& root = "/");

// ─────────────────────────────────────────────
// LinuxMonitor
// ─────────────────────────────────────────────

/**
 * @brief Reads host resources from Linux pseudo-filesystems on demand.
 *
 * Satisfies ResourceMonitorLike. Sampling is synchronous: the scheduler
 * calls sample() before each admission round. The accelerator class is
 * probed once in start() and cached.
 *
 * Data sources:
 *   /proc/stat          logical core count and aggregate CPU load
 *   /proc/meminfo       MemTotal and MemAvailable
 *   /dev, /sys/class/drm  accelerator presence and vendor
 */
class LinuxMonitor {
public:
    explicit LinuxMonitor(const ResourceConfig& config,
                          std::filesystem::path proc_root = "/proc",
                          std::filesystem::path device_root = "/");

    // Non-copyable
    LinuxMonitor(const LinuxMonitor&) = delete;
    LinuxMonitor& operator=(const LinuxMonitor&) = delete;

    // ResourceMonitorLike interface
    Result<ResourceBudget> sample();
    AcceleratorClass accelerator();
    void start();
    void stop();

    /// Raw host figures without budget derivation.
    Result<HostSnapshot> read_host();

    // Internal type exposed for implementation (do not use externally)
    struct CpuTimesInternal {
        uint64_t user{0}, nice{0}, system{0}, idle{0};
        uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};
    };

private:
    BudgetPolicy policy_;
    std::optional<AcceleratorClass> forced_accelerator_;
    std::filesystem::path proc_root_;
    std::filesystem::path device_root_;

    std::mutex mutex_;
    std::optional<AcceleratorClass> accelerator_;   ///< Cached after first probe
    std::optional<CpuTimesInternal> prev_cpu_times_;
};

// ─────────────────────────────────────────────
// MockMonitor
// ─────────────────────────────────────────────

/**
 * @brief Mock resource monitor for testing and simulation.
 *
 * Returns a configurable static host snapshot or a predetermined sequence,
 * run through the same budget rule as LinuxMonitor. Thread-safe, so tests
 * can change host figures while a scheduler is sampling.
 */
class MockMonitor {
public:
    explicit MockMonitor(const ResourceConfig& config = ResourceConfig{});

    // ResourceMonitorLike interface
    Result<ResourceBudget> sample();
    AcceleratorClass accelerator();
    void start();
    void stop();

    // Test helpers: configure what snapshots are returned
    void push_host(HostSnapshot host);
    void set_static_host(HostSnapshot host);
    void set_cpu_cores(uint32_t cores);
    void set_memory(uint64_t available, uint64_t total);
    void set_accelerator(AcceleratorClass cls);
    void set_policy(BudgetPolicy policy);
    void set_unavailable(bool unavailable);

    [[nodiscard]] size_t sample_count();

private:
    std::mutex mutex_;
    BudgetPolicy policy_;
    AcceleratorClass accelerator_{AcceleratorClass::None};
    std::vector<HostSnapshot> sequence_;
    size_t index_{0};
    HostSnapshot static_host_;
    bool use_static_{true};
    bool unavailable_{false};
    size_t samples_{0};
};

// Verify concept satisfaction at compile time
static_assert(ResourceMonitorLike<LinuxMonitor>);
static_assert(ResourceMonitorLike<MockMonitor>);

}  // namespace render_batch

/**
 * @file linux_monitor.cpp
 * @brief LinuxMonitor: reads core count, CPU load and memory from /proc.
 * @author Dimitris Kafetzis
 *
 * CPU load is the busy fraction between two consecutive sample() calls;
 * the first sample reports 0%.
 */

#include "resource_monitor/monitor.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace render_batch {

using CpuTimes = LinuxMonitor::CpuTimesInternal;

// ─────────────────────────────────────────────
// Internal helpers for /proc parsing
// ─────────────────────────────────────────────
namespace {

std::vector<std::string> read_file_lines(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

/**
 * @brief Parse a CPU line from /proc/stat.
 * Format: "cpu[N] user nice system idle iowait irq softirq steal ..."
 */
CpuTimes parse_cpu_line(const std::string& line) {
    CpuTimes times;
    std::istringstream iss(line);
    std::string label;
    iss >> label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return times;
}

float compute_cpu_percent(const CpuTimes& prev, const CpuTimes& curr) {
    auto prev_total = prev.user + prev.nice + prev.system + prev.idle
                    + prev.iowait + prev.irq + prev.softirq + prev.steal;
    auto curr_total = curr.user + curr.nice + curr.system + curr.idle
                    + curr.iowait + curr.irq + curr.softirq + curr.steal;
    auto prev_active = prev.user + prev.nice + prev.system
                     + prev.irq + prev.softirq + prev.steal;
    auto curr_active = curr.user + curr.nice + curr.system
                     + curr.irq + curr.softirq + curr.steal;

    if (curr_total <= prev_total || curr_active < prev_active) return 0.0f;
    uint64_t total_delta = curr_total - prev_total;
    uint64_t active_delta = curr_active - prev_active;
    return 100.0f * static_cast<float>(active_delta) / static_cast<float>(total_delta);
}

struct MemInfo {
    uint64_t total_kb{0};
    uint64_t available_kb{0};
    bool has_total{false};
    bool has_available{false};
};

MemInfo parse_meminfo(const std::filesystem::path& path) {
    MemInfo info;
    for (const auto& line : read_file_lines(path)) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            info.has_total = static_cast<bool>(iss >> info.total_kb);
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            info.has_available = static_cast<bool>(iss >> info.available_kb);
        }
    }
    return info;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// LinuxMonitor implementation
// ─────────────────────────────────────────────

LinuxMonitor::LinuxMonitor(const ResourceConfig& config,
                           std::filesystem::path proc_root,
                           std::filesystem::path device_root)
    : policy_(BudgetPolicy::from_config(config))
    , forced_accelerator_(parse_accelerator_class(config.accelerator))
    , proc_root_(std::move(proc_root))
    , device_root_(std::move(device_root)) {}

void LinuxMonitor::start() {
    std::lock_guard lock(mutex_);
    if (!accelerator_) {
        accelerator_ = forced_accelerator_ ? *forced_accelerator_
                                           : probe_accelerator(device_root_);
    }
}

void LinuxMonitor::stop() { /* nothing to release: sampling is synchronous */ }

AcceleratorClass LinuxMonitor::accelerator() {
    start();
    std::lock_guard lock(mutex_);
    return *accelerator_;
}

Result<HostSnapshot> LinuxMonitor::read_host() {
    HostSnapshot snap;
    snap.timestamp = std::chrono::system_clock::now();

    // Cores and load
    auto stat_lines = read_file_lines(proc_root_ / "stat");
    if (stat_lines.empty() || !stat_lines[0].starts_with("cpu ")) {
        return Error{ErrorCode::Unavailable, "Cannot read " + (proc_root_ / "stat").string()};
    }

    uint32_t cores = 0;
    for (size_t i = 1; i < stat_lines.size(); ++i) {
        const auto& line = stat_lines[i];
        if (line.size() > 3 && line.starts_with("cpu")
            && line[3] >= '0' && line[3] <= '9') {
            ++cores;
        }
    }
    if (cores == 0) {
        cores = std::max(1u, std::thread::hardware_concurrency());
    }
    snap.cpu_cores = cores;

    auto curr = parse_cpu_line(stat_lines[0]);
    {
        std::lock_guard lock(mutex_);
        if (prev_cpu_times_) {
            snap.cpu_load_percent = compute_cpu_percent(*prev_cpu_times_, curr);
        }
        prev_cpu_times_ = curr;
    }

    // Memory
    auto mem = parse_meminfo(proc_root_ / "meminfo");
    if (!mem.has_total || !mem.has_available) {
        return Error{ErrorCode::Unavailable,
                     "MemTotal/MemAvailable missing from " + (proc_root_ / "meminfo").string()};
    }
    snap.memory_total_bytes = mem.total_kb * 1024;
    snap.memory_available_bytes = mem.available_kb * 1024;

    return snap;
}

Result<ResourceBudget> LinuxMonitor::sample() {
    auto host = read_host();
    if (!host) {
        return host.error();
    }
    return compute_budget(*host, policy_, accelerator());
}

}  // namespace render_batch

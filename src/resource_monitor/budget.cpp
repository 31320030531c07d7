/**
 * @file budget.cpp
 * @brief Worker budget derivation and accelerator discovery.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/monitor.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <string>

namespace render_batch {

namespace {

uint32_t clamp_u32(uint64_t value) noexcept {
    return static_cast<uint32_t>(
        std::min<uint64_t>(value, std::numeric_limits<uint32_t>::max()));
}

std::string read_first_line(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

std::optional<AcceleratorClass> vendor_to_class(const std::string& vendor) {
    if (vendor.starts_with("0x10de")) return AcceleratorClass::Cuda;
    if (vendor.starts_with("0x1002")) return AcceleratorClass::Rocm;
    if (vendor.starts_with("0x8086")) return AcceleratorClass::Integrated;
    return std::nullopt;
}

int rank(AcceleratorClass cls) noexcept {
    switch (cls) {
        case AcceleratorClass::Cuda:       return 3;
        case AcceleratorClass::Rocm:       return 2;
        case AcceleratorClass::Integrated: return 1;
        case AcceleratorClass::None:       return 0;
    }
    return 0;
}

}  // anonymous namespace

BudgetPolicy BudgetPolicy::from_config(const ResourceConfig& config) {
    BudgetPolicy policy;
    policy.per_job_memory_bytes = config.per_job_memory_mb * 1024 * 1024;
    policy.hard_worker_cap = config.hard_worker_cap;
    policy.cpu_oversubscription = config.cpu_oversubscription;
    return policy;
}

ResourceBudget compute_budget(const HostSnapshot& host,
                              const BudgetPolicy& policy,
                              AcceleratorClass accelerator) {
    ResourceBudget budget;
    budget.host = host;
    budget.accelerator_class = accelerator;

    uint64_t per_job = std::max<uint64_t>(policy.per_job_memory_bytes, 1);
    budget.workers_by_memory = clamp_u32(host.memory_available_bytes / per_job);

    double by_cpu = std::floor(static_cast<double>(host.cpu_cores) * policy.cpu_oversubscription);
    budget.workers_by_cpu = by_cpu <= 0.0 ? 0u : clamp_u32(static_cast<uint64_t>(by_cpu));

    uint32_t limit = std::min(budget.workers_by_memory, budget.workers_by_cpu);
    if (policy.hard_worker_cap > 0) {
        limit = std::min(limit, policy.hard_worker_cap);
    }
    // Liveness floor: a constrained host still runs one job at a time.
    budget.max_workers = std::max<uint32_t>(1, limit);
    return budget;
}

AcceleratorClass probe_accelerator(const std::filesystem::path& root) {
    std::error_code ec;
    if (std::filesystem::exists(root / "dev/nvidiactl", ec)
        || std::filesystem::exists(root / "dev/nvidia0", ec)) {
        return AcceleratorClass::Cuda;
    }

    AcceleratorClass best = AcceleratorClass::None;
    if (std::filesystem::exists(root / "dev/kfd", ec)) {
        best = AcceleratorClass::Rocm;
    }

    auto drm = root / "sys/class/drm";
    if (std::filesystem::is_directory(drm, ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(drm, ec)) {
            auto name = entry.path().filename().string();
            if (!name.starts_with("card") || name.find('-') != std::string::npos) continue;

            auto cls = vendor_to_class(read_first_line(entry.path() / "device/vendor"));
            if (cls && rank(*cls) > rank(best)) {
                best = *cls;
            }
        }
    }
    return best;
}

}  // namespace render_batch

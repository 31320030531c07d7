/**
 * @file mock_monitor.cpp
 * @brief MockMonitor implementation with configurable host snapshots for testing.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/monitor.hpp"

namespace render_batch {

MockMonitor::MockMonitor(const ResourceConfig& config)
    : policy_(BudgetPolicy::from_config(config)) {
    // Sensible defaults resembling a small render box
    static_host_.cpu_cores = 8;
    static_host_.cpu_load_percent = 20.0f;
    static_host_.memory_total_bytes = 32ULL * 1024 * 1024 * 1024;      // 32 GB
    static_host_.memory_available_bytes = 16ULL * 1024 * 1024 * 1024;  // 16 GB

    if (auto forced = parse_accelerator_class(config.accelerator)) {
        accelerator_ = *forced;
    }
}

Result<ResourceBudget> MockMonitor::sample() {
    std::lock_guard lock(mutex_);
    ++samples_;

    if (unavailable_) {
        return Error{ErrorCode::Unavailable, "Mock monitor unavailable"};
    }

    HostSnapshot host;
    if (use_static_) {
        host = static_host_;
    } else {
        if (index_ >= sequence_.size()) {
            return Error{ErrorCode::Unavailable, "Mock sequence exhausted"};
        }
        host = sequence_[index_++];
    }
    host.timestamp = std::chrono::system_clock::now();
    return compute_budget(host, policy_, accelerator_);
}

AcceleratorClass MockMonitor::accelerator() {
    std::lock_guard lock(mutex_);
    return accelerator_;
}

void MockMonitor::start() { /* no-op for mock */ }
void MockMonitor::stop()  { /* no-op for mock */ }

void MockMonitor::push_host(HostSnapshot host) {
    std::lock_guard lock(mutex_);
    use_static_ = false;
    sequence_.push_back(host);
}

void MockMonitor::set_static_host(HostSnapshot host) {
    std::lock_guard lock(mutex_);
    use_static_ = true;
    static_host_ = host;
}

void MockMonitor::set_cpu_cores(uint32_t cores) {
    std::lock_guard lock(mutex_);
    static_host_.cpu_cores = cores;
}

void MockMonitor::set_memory(uint64_t available, uint64_t total) {
    std::lock_guard lock(mutex_);
    static_host_.memory_available_bytes = available;
    static_host_.memory_total_bytes = total;
}

void MockMonitor::set_accelerator(AcceleratorClass cls) {
    std::lock_guard lock(mutex_);
    accelerator_ = cls;
}

void MockMonitor::set_policy(BudgetPolicy policy) {
    std::lock_guard lock(mutex_);
    policy_ = policy;
}

void MockMonitor::set_unavailable(bool unavailable) {
    std::lock_guard lock(mutex_);
    unavailable_ = unavailable;
}

size_t MockMonitor::sample_count() {
    std::lock_guard lock(mutex_);
    return samples_;
}

}  // namespace render_batch

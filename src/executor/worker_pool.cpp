/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/worker_pool.hpp"

namespace render_batch {

WorkerPool::~WorkerPool() {
    std::vector<std::jthread> workers;
    {
        std::lock_guard lock(queue_mutex_);
        // Request stop on all jthreads first
        for (auto& worker : workers_) {
            worker.request_stop();
        }
        workers.swap(workers_);
    }
    // Wake all threads so they can observe the stop request
    queue_cv_.notify_all();
    // jthreads auto-join when `workers` goes out of scope
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push(std::move(task));
        if (idle_ < task_queue_.size()) {
            workers_.emplace_back([this](std::stop_token stop) {
                worker_loop(stop);
            });
        }
    }
    queue_cv_.notify_one();
}

void WorkerPool::worker_loop(std::stop_token stop) {
    std::unique_lock lock(queue_mutex_);
    while (true) {
        ++idle_;
        bool has_task = queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });
        --idle_;
        // Queued work is drained even after a stop request.
        if (!has_task) return;

        auto task = std::move(task_queue_.front());
        task_queue_.pop();

        lock.unlock();
        ++active_tasks_;
        task();
        --active_tasks_;
        lock.lock();
    }
}

size_t WorkerPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t WorkerPool::idle_count() const {
    std::lock_guard lock(queue_mutex_);
    return idle_;
}

size_t WorkerPool::thread_count() const {
    std::lock_guard lock(queue_mutex_);
    return workers_.size();
}

}  // namespace render_batch

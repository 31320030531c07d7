/**
 * @file worker_pool.hpp
 * @brief Elastic std::jthread worker pool.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace render_batch {

/**
 * @brief Worker pool that grows on demand.
 *
 * submit() spawns a new thread whenever no idle worker can take the task,
 * so a job body that ignores cancellation and outlives its deadline never
 * blocks later admissions. Concurrency is bounded by the caller (the
 * scheduler's admission budget), not by the pool. Idle threads are reused;
 * all threads are joined on destruction after draining queued tasks.
 *
 * Submitted tasks must not throw.
 */
class WorkerPool {
public:
    WorkerPool() = default;
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t idle_count() const;
    [[nodiscard]] size_t thread_count() const;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    size_t idle_{0};
    std::atomic<size_t> active_tasks_{0};
};

}  // namespace render_batch

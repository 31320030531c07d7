/**
 * @file task_store.hpp
 * @brief Durable, crash-consistent storage of the queue snapshot.
 * @author Dimitris Kafetzis
 *
 * The TaskStore is the single source of truth for job state. Every
 * mutating call persists the complete snapshot (temp file, fsync, rename)
 * before returning; if persisting fails the in-memory change is rolled
 * back, so readers never observe state that is not on disk.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "store/job.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace render_batch {

/**
 * @brief Job counts per state.
 */
struct QueueStatistics {
    size_t total = 0;
    size_t pending = 0;
    size_t running = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t cancelled = 0;

    [[nodiscard]] size_t active() const noexcept { return pending + running; }
};

/**
 * @brief Scheduling view of a pending job: what admission needs, without payload or history.
 */
struct PendingEntry {
    JobId id;
    Timestamp created_at{};
    Timestamp eligible_at{};
};

class TaskStore {
public:
    explicit TaskStore(std::filesystem::path path);

    // Non-copyable
    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    // ── Persistence ─────────────────────────
    /// Replace the in-memory view with the persisted snapshot. A missing file is an empty queue.
    Result<void> load();
    Result<void> save();

    /// Move an unreadable state file aside and start from an empty queue.
    Result<std::filesystem::path> quarantine();

    // ── Mutations ───────────────────────────
    Result<void> append(Job job);
    Result<Job> update(const JobId& id, const JobMutation& mutation);

    /// Apply one mutation to several jobs with a single save; all or nothing.
    Result<size_t> update_batch(const std::vector<JobId>& ids, const JobMutation& mutation);

    // ── Queries ─────────────────────────────
    [[nodiscard]] std::optional<Job> get(const JobId& id) const;
    [[nodiscard]] bool contains(const JobId& id) const;
    [[nodiscard]] std::vector<Job> jobs() const;
    [[nodiscard]] std::vector<Job> jobs_in(JobState state) const;
    /// Pending jobs in admission order: created_at, then insertion order.
    [[nodiscard]] std::vector<PendingEntry> pending_fifo() const;
    [[nodiscard]] QueueStatistics statistics() const;
    [[nodiscard]] size_t size() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    Result<void> persist_locked() const;
    void rebuild_index_locked();

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::vector<Job> jobs_;                         ///< Insertion order
    std::unordered_map<JobId, size_t> index_;       ///< id → position in jobs_
};

}  // namespace render_batch

/**
 * @file task_store.cpp
 * @brief TaskStore implementation with atomic write-then-rename persistence.
 * @author Dimitris Kafetzis
 */

#include "store/task_store.hpp"

#include "store/snapshot_codec.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace render_batch {

namespace {

Error io_error(const std::string& what) {
    return Error{ErrorCode::Io, what + ": " + std::strerror(errno)};
}

/**
 * @brief Write data to path so that a crash leaves either the old or the new file.
 *
 * Sequence: write <path>.tmp → fsync → rename over <path> → fsync directory.
 */
Result<void> write_file_atomic(const std::filesystem::path& path, const std::string& data) {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::Io, "create_directories(" + parent.string() + "): " + ec.message()};
        }
    }

    auto tmp = path;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return io_error("open(" + tmp.string() + ")");

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = io_error("write(" + tmp.string() + ")");
            ::close(fd);
            ::unlink(tmp.c_str());
            return err;
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        auto err = io_error("fsync(" + tmp.string() + ")");
        ::close(fd);
        ::unlink(tmp.c_str());
        return err;
    }
    if (::close(fd) != 0) {
        auto err = io_error("close(" + tmp.string() + ")");
        ::unlink(tmp.c_str());
        return err;
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        auto err = io_error("rename(" + tmp.string() + ")");
        ::unlink(tmp.c_str());
        return err;
    }

    // Make the rename itself durable.
    auto dir = parent.empty() ? std::filesystem::path{"."} : parent;
    int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd < 0) return io_error("open(" + dir.string() + ")");
    if (::fsync(dir_fd) != 0) {
        auto err = io_error("fsync(" + dir.string() + ")");
        ::close(dir_fd);
        return err;
    }
    ::close(dir_fd);
    return Result<void>{};
}

}  // anonymous namespace

TaskStore::TaskStore(std::filesystem::path path)
    : path_(std::move(path)) {}

// ─────────────────────────────────────────────
// Persistence
// ─────────────────────────────────────────────

Result<void> TaskStore::load() {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        jobs_.clear();
        index_.clear();
        return Result<void>{};
    }

    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs.is_open()) {
        return Error{ErrorCode::Io, "Cannot open queue state " + path_.string()};
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();

    auto decoded = SnapshotCodec::decode(buffer.str());
    if (!decoded) {
        return Error{decoded.error().code,
                     decoded.error().message + " (" + path_.string() + ")"};
    }

    jobs_ = std::move(*decoded);
    rebuild_index_locked();
    return Result<void>{};
}

Result<void> TaskStore::save() {
    std::lock_guard lock(mutex_);
    return persist_locked();
}

Result<std::filesystem::path> TaskStore::quarantine() {
    std::lock_guard lock(mutex_);

    auto stamp = std::to_string(to_epoch_us(now_us()));
    auto aside = path_;
    aside += ".corrupt-" + stamp;

    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) {
        std::filesystem::rename(path_, aside, ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot move corrupt state aside: " + ec.message()};
        }
    }

    jobs_.clear();
    index_.clear();
    if (auto saved = persist_locked(); !saved) {
        return saved.error();
    }
    return aside;
}

Result<void> TaskStore::persist_locked() const {
    return write_file_atomic(path_, SnapshotCodec::encode(jobs_));
}

void TaskStore::rebuild_index_locked() {
    index_.clear();
    for (size_t i = 0; i < jobs_.size(); ++i) {
        index_.emplace(jobs_[i].id, i);
    }
}

// ─────────────────────────────────────────────
// Mutations
// ─────────────────────────────────────────────

Result<void> TaskStore::append(Job job) {
    std::lock_guard lock(mutex_);

    if (index_.contains(job.id)) {
        return Error{ErrorCode::DuplicateId, "Job id already exists: " + job.id};
    }
    if (job.state != JobState::Pending) {
        return Error{ErrorCode::InvalidTransition,
                     "Job " + job.id + " must be appended as pending"};
    }

    auto id = job.id;
    jobs_.push_back(std::move(job));
    index_.emplace(id, jobs_.size() - 1);

    if (auto saved = persist_locked(); !saved) {
        jobs_.pop_back();
        index_.erase(id);
        return saved;
    }
    return Result<void>{};
}

Result<Job> TaskStore::update(const JobId& id, const JobMutation& mutation) {
    std::lock_guard lock(mutex_);

    auto it = index_.find(id);
    if (it == index_.end()) {
        return Error{ErrorCode::NotFound, "Unknown job id: " + id};
    }

    Job& slot = jobs_[it->second];
    Job updated = slot;
    if (auto applied = apply_mutation(updated, mutation); !applied) {
        return applied.error();
    }

    Job previous = std::exchange(slot, updated);
    if (auto saved = persist_locked(); !saved) {
        slot = std::move(previous);
        return saved.error();
    }
    return updated;
}

Result<size_t> TaskStore::update_batch(const std::vector<JobId>& ids, const JobMutation& mutation) {
    std::lock_guard lock(mutex_);

    std::vector<std::pair<size_t, Job>> staged;
    staged.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = index_.find(id);
        if (it == index_.end()) {
            return Error{ErrorCode::NotFound, "Unknown job id: " + id};
        }
        Job updated = jobs_[it->second];
        if (auto applied = apply_mutation(updated, mutation); !applied) {
            return applied.error();
        }
        staged.emplace_back(it->second, std::move(updated));
    }
    if (staged.empty()) {
        return size_t{0};
    }

    std::vector<Job> previous;
    previous.reserve(staged.size());
    for (auto& [pos, job] : staged) {
        previous.push_back(std::exchange(jobs_[pos], job));
    }

    if (auto saved = persist_locked(); !saved) {
        for (size_t i = 0; i < staged.size(); ++i) {
            jobs_[staged[i].first] = std::move(previous[i]);
        }
        return saved.error();
    }
    return staged.size();
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::optional<Job> TaskStore::get(const JobId& id) const {
    std::lock_guard lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return jobs_[it->second];
}

bool TaskStore::contains(const JobId& id) const {
    std::lock_guard lock(mutex_);
    return index_.contains(id);
}

std::vector<Job> TaskStore::jobs() const {
    std::lock_guard lock(mutex_);
    return jobs_;
}

std::vector<Job> TaskStore::jobs_in(JobState state) const {
    std::lock_guard lock(mutex_);
    std::vector<Job> out;
    for (const auto& job : jobs_) {
        if (job.state == state) out.push_back(job);
    }
    return out;
}

std::vector<PendingEntry> TaskStore::pending_fifo() const {
    std::lock_guard lock(mutex_);
    std::vector<PendingEntry> out;
    for (const auto& job : jobs_) {
        if (job.state == JobState::Pending) {
            out.push_back(PendingEntry{job.id, job.created_at, job.eligible_at});
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const PendingEntry& a, const PendingEntry& b) {
        return a.created_at < b.created_at;
    });
    return out;
}

QueueStatistics TaskStore::statistics() const {
    std::lock_guard lock(mutex_);
    QueueStatistics stats;
    stats.total = jobs_.size();
    for (const auto& job : jobs_) {
        switch (job.state) {
            case JobState::Pending:   ++stats.pending; break;
            case JobState::Running:   ++stats.running; break;
            case JobState::Completed: ++stats.completed; break;
            case JobState::Failed:    ++stats.failed; break;
            case JobState::Cancelled: ++stats.cancelled; break;
        }
    }
    return stats;
}

size_t TaskStore::size() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}

}  // namespace render_batch

/**
 * @file types.hpp
 * @brief Fundamental types used throughout RenderBatch.
 * @author Dimitris Kafetzis
 *
 * Defines JobId, Blob, JobState, FailureClass, AcceleratorClass,
 * ResourceBudget, and other shared vocabulary types.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace render_batch {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Opaque byte payload. The scheduler never looks inside.
using Blob = std::vector<uint8_t>;

[[nodiscard]] inline Blob to_blob(std::string_view text) {
    return Blob(text.begin(), text.end());
}

[[nodiscard]] inline std::string to_text(const Blob& blob) {
    return std::string(blob.begin(), blob.end());
}

/// Microseconds since the Unix epoch; the on-disk time representation.
[[nodiscard]] inline int64_t to_epoch_us(Timestamp ts) noexcept {
    return std::chrono::duration_cast<Duration>(ts.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_epoch_us(int64_t us) noexcept {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(Duration{us})};
}

/// Current wall-clock time truncated to microseconds so values survive persistence.
[[nodiscard]] inline Timestamp now_us() noexcept {
    return from_epoch_us(to_epoch_us(std::chrono::system_clock::now()));
}

// ─────────────────────────────────────────────
// Job State
// ─────────────────────────────────────────────

enum class JobState : uint8_t {
    Pending,       ///< Waiting for admission (possibly until a retry backoff elapses)
    Running,       ///< Held by exactly one worker
    Completed,     ///< Finished successfully, result stored
    Failed,        ///< Last attempt failed; terminal unless retried
    Cancelled      ///< Cancelled on request
};

[[nodiscard]] constexpr std::string_view to_string(JobState state) noexcept {
    switch (state) {
        case JobState::Pending:    return "pending";
        case JobState::Running:    return "running";
        case JobState::Completed:  return "completed";
        case JobState::Failed:     return "failed";
        case JobState::Cancelled:  return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<JobState> parse_job_state(std::string_view text) noexcept {
    if (text == "pending")   return JobState::Pending;
    if (text == "running")   return JobState::Running;
    if (text == "completed") return JobState::Completed;
    if (text == "failed")    return JobState::Failed;
    if (text == "cancelled") return JobState::Cancelled;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Failure Classification
// ─────────────────────────────────────────────

enum class FailureClass : uint8_t {
    Transient,     ///< Rate limit, network hiccup, interrupted attempt
    Permanent,     ///< Malformed payload, unsupported input
    Timeout        ///< Deadline exceeded; retryable unless configured otherwise
};

[[nodiscard]] constexpr std::string_view to_string(FailureClass cls) noexcept {
    switch (cls) {
        case FailureClass::Transient: return "transient";
        case FailureClass::Permanent: return "permanent";
        case FailureClass::Timeout:   return "timeout";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<FailureClass> parse_failure_class(std::string_view text) noexcept {
    if (text == "transient") return FailureClass::Transient;
    if (text == "permanent") return FailureClass::Permanent;
    if (text == "timeout")   return FailureClass::Timeout;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Accelerator Class
// ─────────────────────────────────────────────

/**
 * @brief Coarse accelerator category exposed to job bodies.
 *
 * The scheduler performs no GPU work itself; job bodies use this to pick
 * a GPU-capable variant when one is available.
 */
enum class AcceleratorClass : uint8_t {
    None,
    Cuda,          ///< NVIDIA device
    Rocm,          ///< AMD device
    Integrated     ///< Intel / shared-memory GPU
};

[[nodiscard]] constexpr std::string_view to_string(AcceleratorClass cls) noexcept {
    switch (cls) {
        case AcceleratorClass::None:       return "none";
        case AcceleratorClass::Cuda:       return "cuda";
        case AcceleratorClass::Rocm:       return "rocm";
        case AcceleratorClass::Integrated: return "integrated";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<AcceleratorClass> parse_accelerator_class(std::string_view text) noexcept {
    if (text == "none")       return AcceleratorClass::None;
    if (text == "cuda")       return AcceleratorClass::Cuda;
    if (text == "rocm")       return AcceleratorClass::Rocm;
    if (text == "integrated") return AcceleratorClass::Integrated;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Host Snapshot & Resource Budget
// ─────────────────────────────────────────────

/**
 * @brief Raw host figures read by a resource monitor.
 */
struct HostSnapshot {
    Timestamp timestamp;

    uint32_t cpu_cores{1};
    float cpu_load_percent{0.0f};           ///< Aggregate busy time since previous sample

    uint64_t memory_available_bytes{0};
    uint64_t memory_total_bytes{0};

    [[nodiscard]] constexpr float memory_usage_percent() const noexcept {
        if (memory_total_bytes == 0) return 0.0f;
        return 100.0f * static_cast<float>(memory_total_bytes - memory_available_bytes)
               / static_cast<float>(memory_total_bytes);
    }
};

/**
 * @brief A point-in-time capacity decision.
 *
 * Computed only by the resource monitor; read-only everywhere else.
 * max_workers is never below 1.
 */
struct ResourceBudget {
    uint32_t max_workers{1};
    AcceleratorClass accelerator_class{AcceleratorClass::None};

    uint32_t workers_by_cpu{1};
    uint32_t workers_by_memory{1};
    HostSnapshot host;
};

}  // namespace render_batch

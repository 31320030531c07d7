/**
 * @file job.cpp
 * @brief Job state machine and id generation.
 * @author Dimitris Kafetzis
 */

#include "store/job.hpp"

#include <atomic>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace render_batch {

JobMutation JobMutation::start(Timestamp at) {
    JobMutation m;
    m.target = JobState::Running;
    m.at = at;
    return m;
}

JobMutation JobMutation::complete(Blob result, Timestamp at) {
    JobMutation m;
    m.target = JobState::Completed;
    m.at = at;
    m.result = std::move(result);
    return m;
}

JobMutation JobMutation::fail(FailureClass cls, std::string error, Timestamp at) {
    JobMutation m;
    m.target = JobState::Failed;
    m.at = at;
    m.failure_class = cls;
    m.error = sanitize_utf8(error);
    return m;
}

JobMutation JobMutation::retry(Timestamp eligible_at, Timestamp at) {
    JobMutation m;
    m.target = JobState::Pending;
    m.at = at;
    m.eligible_at = eligible_at;
    return m;
}

JobMutation JobMutation::cancel(Timestamp at) {
    JobMutation m;
    m.target = JobState::Cancelled;
    m.at = at;
    return m;
}

Result<void> apply_mutation(Job& job, const JobMutation& mutation) {
    if (!is_legal_transition(job.state, mutation.target)) {
        return Error{ErrorCode::InvalidTransition,
                     "Job " + job.id + ": illegal transition "
                     + std::string{to_string(job.state)} + " -> "
                     + std::string{to_string(mutation.target)}};
    }
    if (mutation.target == JobState::Pending && !job.attempts_remaining()) {
        return Error{ErrorCode::InvalidTransition,
                     "Job " + job.id + ": attempts exhausted ("
                     + std::to_string(job.attempt_count) + "/"
                     + std::to_string(job.max_attempts) + ")"};
    }
    if (mutation.target == JobState::Running && !job.attempts_remaining()) {
        return Error{ErrorCode::InvalidTransition,
                     "Job " + job.id + ": cannot start, attempts exhausted"};
    }

    switch (mutation.target) {
        case JobState::Running:
            ++job.attempt_count;
            job.started_at = mutation.at;
            job.finished_at.reset();
            break;

        case JobState::Completed:
            job.result = mutation.result.value_or(Blob{});
            job.last_error.reset();
            job.last_failure_class.reset();
            job.finished_at = mutation.at;
            break;

        case JobState::Failed:
            job.last_error = mutation.error;
            job.last_failure_class = mutation.failure_class;
            job.failure_history.push_back(FailureRecord{
                .attempt = job.attempt_count,
                .failure_class = mutation.failure_class,
                .message = mutation.error,
                .at = mutation.at
            });
            job.finished_at = mutation.at;
            break;

        case JobState::Pending:
            job.eligible_at = mutation.eligible_at.value_or(mutation.at);
            break;

        case JobState::Cancelled:
            job.finished_at = mutation.at;
            break;
    }

    job.state = mutation.target;
    return Result<void>{};
}

JobId generate_job_id() {
    static std::atomic<uint32_t> counter{0};
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t noise;
    {
        std::lock_guard lock(rng_mutex);
        noise = rng();
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream oss;
    oss << "job-" << std::hex << std::setfill('0')
        << std::setw(11) << ms << '-'
        << std::setw(4) << (counter.fetch_add(1) & 0xFFFF) << '-'
        << std::setw(6) << (noise & 0xFFFFFF);
    return oss.str();
}

bool is_valid_job_id(std::string_view id) noexcept {
    if (id.empty() || id.size() > 128) return false;
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
               || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == ':' || c == '-';
        if (!ok) return false;
    }
    return id != "." && id != "..";
}

std::string sanitize_utf8(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        // Allowed range of the second byte (RFC 3629 table 3-7).
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (lead < 0x80) {
            len = 1;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            len = 3;
            if (lead == 0xE0) lo = 0xA0;       // overlong
            else if (lead == 0xED) hi = 0x9F;  // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            len = 4;
            if (lead == 0xF0) lo = 0x90;       // overlong
            else if (lead == 0xF4) hi = 0x8F;  // above U+10FFFF
        }

        bool valid = len > 0 && i + len <= text.size();
        for (size_t k = 1; valid && k < len; ++k) {
            auto byte = static_cast<unsigned char>(text[i + k]);
            valid = k == 1 ? (byte >= lo && byte <= hi) : (byte & 0xC0) == 0x80;
        }

        if (valid) {
            out.append(text.substr(i, len));
            i += len;
        } else {
            out.push_back('?');
            ++i;
        }
    }
    return out;
}

}  // namespace render_batch

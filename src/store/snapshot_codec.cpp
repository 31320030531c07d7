/**
 * @file snapshot_codec.cpp
 * @brief SnapshotCodec: job list <-> TOML using toml++.
 * @author Dimitris Kafetzis
 */

#include "store/snapshot_codec.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <sstream>
#include <unordered_set>

namespace render_batch {

namespace {

Error corrupt(const std::string& what) {
    return Error{ErrorCode::CorruptState, "Corrupt queue state: " + what};
}

template <typename T>
std::optional<T> field(const toml::table& tbl, std::string_view key) {
    return tbl[key].value<T>();
}

toml::table encode_failure(const FailureRecord& rec) {
    toml::table t;
    t.insert("attempt", static_cast<int64_t>(rec.attempt));
    t.insert("class", std::string{to_string(rec.failure_class)});
    t.insert("message", rec.message);
    t.insert("at_us", to_epoch_us(rec.at));
    return t;
}

toml::table encode_job(const Job& job) {
    toml::table t;
    t.insert("id", job.id);
    t.insert("payload", SnapshotCodec::hex_encode(job.payload));
    t.insert("state", std::string{to_string(job.state)});
    t.insert("attempt_count", static_cast<int64_t>(job.attempt_count));
    t.insert("max_attempts", static_cast<int64_t>(job.max_attempts));
    t.insert("created_at_us", to_epoch_us(job.created_at));
    t.insert("eligible_at_us", to_epoch_us(job.eligible_at));

    if (job.started_at)         t.insert("started_at_us", to_epoch_us(*job.started_at));
    if (job.finished_at)        t.insert("finished_at_us", to_epoch_us(*job.finished_at));
    if (job.last_error)         t.insert("last_error", *job.last_error);
    if (job.last_failure_class) {
        t.insert("last_failure_class", std::string{to_string(*job.last_failure_class)});
    }
    if (job.timeout)            t.insert("timeout_us", static_cast<int64_t>(job.timeout->count()));
    if (job.timeout_retryable)  t.insert("timeout_retryable", *job.timeout_retryable);
    if (job.result)             t.insert("result", SnapshotCodec::hex_encode(*job.result));

    if (!job.failure_history.empty()) {
        toml::array history;
        for (const auto& rec : job.failure_history) {
            history.push_back(encode_failure(rec));
        }
        t.insert("failure_history", std::move(history));
    }
    return t;
}

Result<FailureRecord> decode_failure(const toml::table& t, const JobId& id) {
    auto attempt = field<int64_t>(t, "attempt");
    auto cls = field<std::string>(t, "class");
    auto message = field<std::string>(t, "message");
    auto at = field<int64_t>(t, "at_us");
    if (!attempt || !cls || !message || !at || *attempt < 0) {
        return corrupt("job " + id + ": malformed failure_history entry");
    }
    auto parsed_cls = parse_failure_class(*cls);
    if (!parsed_cls) {
        return corrupt("job " + id + ": unknown failure class '" + *cls + "'");
    }
    return FailureRecord{
        .attempt = static_cast<uint32_t>(*attempt),
        .failure_class = *parsed_cls,
        .message = *message,
        .at = from_epoch_us(*at)
    };
}

Result<Job> decode_job(const toml::table& t, size_t index) {
    auto id = field<std::string>(t, "id");
    if (!id || id->empty()) {
        return corrupt("jobs[" + std::to_string(index) + "] has no id");
    }

    auto payload = field<std::string>(t, "payload");
    auto state = field<std::string>(t, "state");
    auto attempt_count = field<int64_t>(t, "attempt_count");
    auto max_attempts = field<int64_t>(t, "max_attempts");
    auto created_at = field<int64_t>(t, "created_at_us");
    auto eligible_at = field<int64_t>(t, "eligible_at_us");
    if (!payload || !state || !attempt_count || !max_attempts || !created_at || !eligible_at) {
        return corrupt("job " + *id + ": missing required field");
    }

    Job job;
    job.id = *id;
    if (!SnapshotCodec::hex_decode(*payload, job.payload)) {
        return corrupt("job " + *id + ": payload is not valid hex");
    }

    auto parsed_state = parse_job_state(*state);
    if (!parsed_state) {
        return corrupt("job " + *id + ": unknown state '" + *state + "'");
    }
    job.state = *parsed_state;

    if (*max_attempts < 1 || *attempt_count < 0 || *attempt_count > *max_attempts) {
        return corrupt("job " + *id + ": attempt counters out of range");
    }
    job.attempt_count = static_cast<uint32_t>(*attempt_count);
    job.max_attempts = static_cast<uint32_t>(*max_attempts);
    job.created_at = from_epoch_us(*created_at);
    job.eligible_at = from_epoch_us(*eligible_at);

    if (auto v = field<int64_t>(t, "started_at_us"))  job.started_at = from_epoch_us(*v);
    if (auto v = field<int64_t>(t, "finished_at_us")) job.finished_at = from_epoch_us(*v);
    if (auto v = field<std::string>(t, "last_error")) job.last_error = *v;
    if (auto v = field<std::string>(t, "last_failure_class")) {
        auto cls = parse_failure_class(*v);
        if (!cls) return corrupt("job " + *id + ": unknown failure class '" + *v + "'");
        job.last_failure_class = *cls;
    }
    if (auto v = field<int64_t>(t, "timeout_us")) job.timeout = Duration{*v};
    if (auto v = field<bool>(t, "timeout_retryable")) job.timeout_retryable = *v;
    if (auto v = field<std::string>(t, "result")) {
        Blob result;
        if (!SnapshotCodec::hex_decode(*v, result)) {
            return corrupt("job " + *id + ": result is not valid hex");
        }
        job.result = std::move(result);
    }

    if (auto node = t["failure_history"]; node) {
        const auto* history = node.as_array();
        if (!history) return corrupt("job " + *id + ": failure_history is not an array");
        for (const auto& entry : *history) {
            const auto* rec_tbl = entry.as_table();
            if (!rec_tbl) return corrupt("job " + *id + ": failure_history entry is not a table");
            auto rec = decode_failure(*rec_tbl, *id);
            if (!rec) return rec.error();
            job.failure_history.push_back(std::move(*rec));
        }
    }

    return job;
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Hex helpers
// ─────────────────────────────────────────────

std::string SnapshotCodec::hex_encode(const Blob& blob) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(blob.size() * 2);
    for (uint8_t byte : blob) {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0F]);
    }
    return out;
}

bool SnapshotCodec::hex_decode(std::string_view hex, Blob& out) {
    if (hex.size() % 2 != 0) return false;
    out.clear();
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

// ─────────────────────────────────────────────
// Snapshot
// ─────────────────────────────────────────────

std::string SnapshotCodec::encode(const std::vector<Job>& jobs) {
    toml::table root;
    root.insert("schema_version", kSnapshotSchemaVersion);

    toml::array jobs_array;
    for (const auto& job : jobs) {
        jobs_array.push_back(encode_job(job));
    }
    root.insert("jobs", std::move(jobs_array));

    std::ostringstream oss;
    oss << root << '\n';
    return oss.str();
}

Result<std::vector<Job>> SnapshotCodec::decode(std::string_view text) {
    toml::table root;
    try {
        root = toml::parse(text);
    } catch (const toml::parse_error& err) {
        return corrupt(std::string{"TOML parse error: "} + std::string{err.description()});
    }

    auto version = root["schema_version"].value<int64_t>();
    if (!version) {
        return corrupt("missing schema_version");
    }
    if (*version != kSnapshotSchemaVersion) {
        return corrupt("unsupported schema_version " + std::to_string(*version)
                       + " (expected " + std::to_string(kSnapshotSchemaVersion) + ")");
    }

    std::vector<Job> jobs;
    auto jobs_node = root["jobs"];
    if (!jobs_node) {
        return jobs;
    }
    const auto* jobs_array = jobs_node.as_array();
    if (!jobs_array) {
        return corrupt("'jobs' is not an array");
    }

    std::unordered_set<JobId> seen;
    jobs.reserve(jobs_array->size());
    for (size_t i = 0; i < jobs_array->size(); ++i) {
        const auto* tbl = (*jobs_array)[i].as_table();
        if (!tbl) {
            return corrupt("jobs[" + std::to_string(i) + "] is not a table");
        }
        auto job = decode_job(*tbl, i);
        if (!job) return job.error();
        if (!seen.insert(job->id).second) {
            return corrupt("duplicate job id " + job->id);
        }
        jobs.push_back(std::move(*job));
    }
    return jobs;
}

}  // namespace render_batch

/**
 * @file error_report.cpp
 * @brief Error report formatting and writing.
 * @author Dimitris Kafetzis
 */

#include "telemetry/error_report.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace render_batch {

namespace {

std::string format_utc(Timestamp at, const char* fmt) {
    auto time_t_at = std::chrono::system_clock::to_time_t(at);
    std::tm utc{};
    gmtime_r(&time_t_at, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, fmt);
    return oss.str();
}

}  // namespace

std::string error_report_filename(const JobId& id, uint32_t attempt, Timestamp at) {
    return "error_" + id + "_a" + std::to_string(attempt) + "_" + format_utc(at, "%Y%m%d_%H%M%S") + ".log";
}

std::string format_error_report(const Job& job, Timestamp at) {
    std::ostringstream oss;
    oss << "Job ID: " << job.id << '\n'
        << "Reported: " << format_utc(at, "%FT%TZ") << '\n'
        << "State: " << to_string(job.state) << '\n'
        << "Attempts: " << job.attempt_count << " of " << job.max_attempts << '\n'
        << "Payload size: " << job.payload.size() << " bytes\n"
        << "Created: " << format_utc(job.created_at, "%FT%TZ") << '\n';

    if (job.last_failure_class) {
        oss << "Last failure class: " << to_string(*job.last_failure_class) << '\n';
    }
    if (job.last_error) {
        oss << "Last error: " << *job.last_error << '\n';
    }

    oss << "\nFailure history:\n";
    if (job.failure_history.empty()) {
        oss << "  (none)\n";
    }
    for (const auto& record : job.failure_history) {
        oss << "  attempt " << record.attempt
            << " at " << format_utc(record.at, "%FT%TZ")
            << " [" << to_string(record.failure_class) << "] "
            << record.message << '\n';
    }
    return oss.str();
}

Result<std::filesystem::path> write_error_report(const std::filesystem::path& dir,
                                                 const Job& job,
                                                 Timestamp at) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::Io, "create_directories(" + dir.string() + "): " + ec.message()};
    }

    auto path = dir / error_report_filename(job.id, job.attempt_count, at);
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return Error{ErrorCode::Io, "Cannot open error report: " + path.string()};
    }
    file << format_error_report(job, at);
    file.flush();
    if (!file) {
        return Error{ErrorCode::Io, "Failed writing error report: " + path.string()};
    }
    return path;
}

}  // namespace render_batch

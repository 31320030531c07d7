/**
 * @file synthetic_runner.cpp
 * @brief SyntheticRunner implementation with simulated render work.
 * @author Dimitris Kafetzis
 */

#include "executor/synthetic_runner.hpp"

#include <chrono>
#include <sstream>
#include <thread>

namespace render_batch {

Result<SyntheticSpec> SyntheticRunner::parse(const Blob& payload) {
    SyntheticSpec spec;
    std::istringstream iss(to_text(payload));
    std::string item;

    while (std::getline(iss, item, ';')) {
        if (item.empty()) continue;
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            return Error{"Malformed payload entry '" + item + "'"};
        }
        auto key = item.substr(0, eq);
        auto value = item.substr(eq + 1);

        try {
            if (key == "duration_ms") {
                spec.duration = std::chrono::milliseconds(std::stoll(value));
            } else if (key == "busy") {
                spec.busy = (value == "true" || value == "1");
            } else if (key == "fail_attempts") {
                spec.fail_attempts = static_cast<uint32_t>(std::stoul(value));
            } else if (key == "fail_class") {
                auto cls = parse_failure_class(value);
                if (!cls) return Error{"Unknown fail_class '" + value + "'"};
                spec.fail_class = *cls;
            } else if (key == "result") {
                spec.result = value;
            } else {
                return Error{"Unknown payload key '" + key + "'"};
            }
        } catch (const std::logic_error&) {
            return Error{"Invalid number for '" + key + "': " + value};
        }
    }
    return spec;
}

Blob SyntheticRunner::make_payload(const SyntheticSpec& spec) {
    std::ostringstream oss;
    oss << "duration_ms="
        << std::chrono::duration_cast<std::chrono::milliseconds>(spec.duration).count();
    if (spec.busy) oss << ";busy=true";
    if (spec.fail_attempts > 0) {
        oss << ";fail_attempts=" << spec.fail_attempts
            << ";fail_class=" << to_string(spec.fail_class);
    }
    if (spec.result) oss << ";result=" << *spec.result;
    return to_blob(oss.str());
}

RunOutcome SyntheticRunner::operator()(const RunContext& ctx) const {
    auto spec = parse(ctx.payload);
    if (!spec) {
        return RunnerFailure{FailureClass::Permanent, spec.error().message};
    }

    if (ctx.attempt <= spec->fail_attempts) {
        if (spec->fail_class == FailureClass::Timeout) {
            // Hang until the scheduler gives up on us.
            while (!ctx.stop.stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return RunnerFailure{FailureClass::Transient, "Cancelled via stop token"};
        }
        if (!simulate_work(spec->duration, spec->busy, ctx.stop)) {
            return RunnerFailure{FailureClass::Transient, "Cancelled via stop token"};
        }
        return RunnerFailure{spec->fail_class,
                             "Simulated " + std::string{to_string(spec->fail_class)}
                             + " failure on attempt " + std::to_string(ctx.attempt)};
    }

    if (!simulate_work(spec->duration, spec->busy, ctx.stop)) {
        return RunnerFailure{FailureClass::Transient, "Cancelled via stop token"};
    }
    return to_blob(spec->result.value_or("rendered:" + ctx.job_id));
}

bool SyntheticRunner::simulate_work(Duration target, bool busy, const std::stop_token& stop) {
    auto start = std::chrono::steady_clock::now();
    volatile uint64_t counter = 0;

    while (!stop.stop_requested()) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<Duration>(elapsed) >= target) return true;

        if (busy) {
            // Synthetic work to burn CPU cycles
            for (int i = 0; i < 1000; ++i) {
                counter = counter + static_cast<uint64_t>(i) * static_cast<uint64_t>(i);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::microseconds(500));
        }
    }
    return false;
}

}  // namespace render_batch

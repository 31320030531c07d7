/**
 * @file synthetic_runner.hpp
 * @brief Simulated job body for demos, benchmarks and tests.
 * @author Dimitris Kafetzis
 *
 * The payload is a ';'-separated key=value list:
 *
 *   duration_ms=200       simulated render time
 *   busy=true             burn CPU instead of sleeping
 *   fail_attempts=2       attempts 1..N fail
 *   fail_class=timeout    transient | permanent | timeout (timeout = hang until stopped)
 *   result=out.mp4        result blob on success (default "rendered:<job id>")
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/job_runner.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace render_batch {

struct SyntheticSpec {
    Duration duration{std::chrono::milliseconds(10)};
    bool busy = false;
    uint32_t fail_attempts = 0;
    FailureClass fail_class = FailureClass::Transient;
    std::optional<std::string> result;
};

class SyntheticRunner {
public:
    [[nodiscard]] static Result<SyntheticSpec> parse(const Blob& payload);
    [[nodiscard]] static Blob make_payload(const SyntheticSpec& spec);

    RunOutcome operator()(const RunContext& ctx) const;

private:
    /// Returns false if the stop token fired before the target duration.
    static bool simulate_work(Duration target, bool busy, const std::stop_token& stop);
};

}  // namespace render_batch

/**
 * @file job_runner.hpp
 * @brief The execution contract between the scheduler and job bodies.
 * @author Dimitris Kafetzis
 *
 * A job body is a single callable: it receives a RunContext (payload plus
 * a stop_token it must poll) and returns either a result blob or a
 * classified RunnerFailure. Bodies may also throw TransientRunnerError or
 * PermanentRunnerError; any other exception counts as transient.
 * Bodies must be safe to invoke concurrently.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <stdexcept>
#include <stop_token>
#include <string>

namespace render_batch {

struct RunContext {
    JobId job_id;
    const Blob& payload;
    uint32_t attempt{1};
    AcceleratorClass accelerator{AcceleratorClass::None};
    std::stop_token stop;
};

struct RunnerFailure {
    FailureClass failure_class{FailureClass::Transient};
    std::string message;
};

using RunOutcome = Result<Blob, RunnerFailure>;
using JobRunner = std::function<RunOutcome(const RunContext&)>;

class TransientRunnerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PermanentRunnerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Invoke a runner and translate thrown exceptions into RunnerFailure.
 *
 * Exceptions escaping the job body never propagate; a job's failure stays
 * contained in its outcome.
 */
[[nodiscard]] RunOutcome invoke_runner(const JobRunner& runner, const RunContext& ctx);

}  // namespace render_batch

/**
 * @file job_runner.cpp
 * @brief Exception classification at the job body boundary.
 * @author Dimitris Kafetzis
 */

#include "executor/job_runner.hpp"

namespace render_batch {

RunOutcome invoke_runner(const JobRunner& runner, const RunContext& ctx) {
    if (!runner) {
        return RunnerFailure{FailureClass::Permanent, "No job runner configured"};
    }
    try {
        return runner(ctx);
    } catch (const PermanentRunnerError& e) {
        return RunnerFailure{FailureClass::Permanent, e.what()};
    } catch (const TransientRunnerError& e) {
        return RunnerFailure{FailureClass::Transient, e.what()};
    } catch (const std::exception& e) {
        return RunnerFailure{FailureClass::Transient,
                             std::string{"Unhandled exception: "} + e.what()};
    } catch (...) {
        return RunnerFailure{FailureClass::Transient, "Unhandled non-standard exception"};
    }
}

}  // namespace render_batch

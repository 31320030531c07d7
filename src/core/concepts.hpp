/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for RenderBatch interfaces.
 * @author Dimitris Kafetzis
 *
 * Defines compile-time interface constraints for components the scheduler
 * calls on every admission round.
 */

#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <concepts>

namespace render_batch {

// ─────────────────────────────────────────────
// ResourceMonitorLike
// ─────────────────────────────────────────────

/**
 * @concept ResourceMonitorLike
 * @brief Constrains types that can produce a worker budget.
 *
 * sample() is invoked before each admission round, so we use
 * concept-based static polymorphism instead of virtual dispatch.
 */
template <typename T>
concept ResourceMonitorLike = requires(T monitor) {
    { monitor.sample() } -> std::same_as<Result<ResourceBudget>>;
    { monitor.accelerator() } -> std::same_as<AcceleratorClass>;
    { monitor.start() } -> std::same_as<void>;
    { monitor.stop() } -> std::same_as<void>;
};

}  // namespace render_batch

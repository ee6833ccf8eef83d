// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>

#include "src/simulation/random_stream.hpp"
#include "src/support/error_types.hpp"

namespace mcopt {

/// Control variate applied to the discounted payoff
enum class ControlVariate {
    None,
    TerminalSpot,    ///< e^{-rT} S_T, mean S·e^{-qT}
    GeometricAsian   ///< discounted geometric-average Asian payoff, closed-form mean
};

/// Configuration of a Monte Carlo run
struct SimulationConfig {
    size_t n_simulations = 10000;      ///< Paths per run (>= 2)
    size_t n_steps = 252;              ///< Time steps per path (>= 1)
    uint64_t seed = 42;                ///< Run seed; equal seeds give equal results
    bool antithetic = false;           ///< Simulate (Z, -Z) pairs; a pair is one sample
    ControlVariate control_variate = ControlVariate::None;
    SamplingScheme sampling = SamplingScheme::PseudoRandom;
    double confidence_level = 0.95;    ///< Two-sided confidence interval level
    size_t batch_size = 0;             ///< Paths per convergence batch (0 = one batch)
    double target_std_error = 0.0;     ///< Early-stop threshold (<= 0 disables)
    bool store_paths = false;          ///< Return simulated paths with the price
};

/**
 * @brief Validate a simulation configuration
 *
 * Checks for:
 * - At least two paths and one time step
 * - Confidence level strictly inside (0, 1)
 * - Finite standard error target
 *
 * @param config Configuration to validate
 * @return void on success, ValidationError on failure
 */
std::expected<void, ValidationError> validate_simulation_config(const SimulationConfig& config);

}  // namespace mcopt

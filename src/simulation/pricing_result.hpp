// SPDX-License-Identifier: MIT
/**
 * @file pricing_result.hpp
 * @brief Monte Carlo pricing result types for std::expected API
 */

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "src/simulation/path_matrix.hpp"

namespace mcopt {

/// Running estimate after a batch of paths
struct ConvergencePoint {
    size_t n_paths;      ///< Cumulative paths simulated
    double estimate;     ///< Price estimate so far
    double std_error;    ///< Standard error so far
};

/// Success result from MonteCarloEngine::price()
struct PricingResult {
    double price = 0.0;              ///< Discounted mean payoff
    double std_error = 0.0;          ///< Standard error of price
    double ci_lower = 0.0;           ///< price - z·std_error
    double ci_upper = 0.0;           ///< price + z·std_error
    double confidence_level = 0.0;   ///< Level of [ci_lower, ci_upper]
    size_t n_paths = 0;              ///< Paths simulated
    size_t n_samples = 0;            ///< Statistical units (pairs when antithetic)
    std::optional<double> control_beta;   ///< Estimated β when a control variate is used
    double variance_reduction_ratio = 1.0; ///< Plain variance over control-adjusted variance
    bool converged = false;          ///< True when the standard error target was met
    std::vector<ConvergencePoint> convergence;  ///< One point per batch
    PathMatrix paths;                ///< Simulated paths (empty unless store_paths)

    /// Half width of the confidence interval
    double half_width() const { return 0.5 * (ci_upper - ci_lower); }
};

}  // namespace mcopt

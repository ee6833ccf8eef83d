// SPDX-License-Identifier: MIT
#pragma once

#include <expected>

#include "src/support/error_types.hpp"

namespace mcopt {

/// Estimator used for delta, gamma and vega
enum class GreeksMethod {
    FiniteDifference,   ///< Bump and reprice with common random numbers
    Pathwise,           ///< Derivative of the payoff along each path
    LikelihoodRatio     ///< Payoff times the score of the S_T density
};

/// Configuration of a Greeks run
///
/// Theta and rho are always finite differences. Time is in years.
struct GreeksConfig {
    GreeksMethod method = GreeksMethod::FiniteDifference;
    double spot_bump_rel = 0.01;          ///< Relative spot bump (delta, gamma), in (0, 1)
    double vol_bump_abs = 0.01;           ///< Absolute volatility bump (vega)
    double rate_bump_abs = 1e-4;          ///< Absolute rate bump (rho)
    double time_bump_abs = 1.0 / 365.0;   ///< Absolute maturity bump (theta)
};

/**
 * @brief Validate bump sizes
 *
 * Every bump must be finite and positive, and the relative spot bump
 * must be below one so that S(1 - h) stays positive.
 */
std::expected<void, ValidationError> validate_greeks_config(const GreeksConfig& config);

/// Short name of a Greeks method ("finite-difference", ...)
const char* method_name(GreeksMethod method);

}  // namespace mcopt

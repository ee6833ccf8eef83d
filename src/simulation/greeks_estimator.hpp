// SPDX-License-Identifier: MIT
/**
 * @file greeks_estimator.hpp
 * @brief Monte Carlo sensitivities of option prices
 *
 * All estimators reuse the engine's random stream, so every bumped or
 * weighted run sees the same normals as the base run (common random
 * numbers). Each Greek is the mean of per-sample contributions and carries
 * its own standard error.
 *
 * Supported combinations:
 *
 *   method            | payoffs                 | delta, vega | gamma
 *   ------------------+-------------------------+-------------+---------------------
 *   FiniteDifference  | all                     | central FD  | central FD
 *   Pathwise          | Vanilla, Asian          | pathwise    | FD of pathwise delta
 *   LikelihoodRatio   | Vanilla, Digital        | score       | score
 *
 * Theta and rho are finite differences for every method. Control variates
 * configured on the engine are not applied.
 */

#pragma once

#include <cstddef>
#include <expected>

#include "src/option/option_spec.hpp"
#include "src/option/payoff.hpp"
#include "src/simulation/greeks_config.hpp"
#include "src/simulation/monte_carlo_engine.hpp"
#include "src/support/error_types.hpp"

namespace mcopt {

/// Monte Carlo estimate of one quantity
struct GreekEstimate {
    double value = 0.0;
    double std_error = 0.0;
};

/// Price and first/second order sensitivities
struct GreeksResult {
    GreekEstimate price;
    GreekEstimate delta;   ///< ∂V/∂S
    GreekEstimate gamma;   ///< ∂²V/∂S²
    GreekEstimate vega;    ///< ∂V/∂σ
    GreekEstimate theta;   ///< -∂V/∂T (per year)
    GreekEstimate rho;     ///< ∂V/∂r
    GreeksMethod method = GreeksMethod::FiniteDifference;
    size_t n_samples = 0;  ///< Statistical units per estimate
};

class GreeksEstimator {
public:
    GreeksEstimator(const MonteCarloEngine& engine, const GreeksConfig& config = {});

    /// Factory with validation via validate_greeks_config()
    static std::expected<GreeksEstimator, ValidationError>
    create(const MonteCarloEngine& engine, const GreeksConfig& config);

    const GreeksConfig& config() const { return config_; }

    /**
     * @brief Estimate price and Greeks of a contract
     *
     * @return GreeksResult, or SimulationError with IncompatibleMethod when
     *         the method does not support the payoff or σ = 0
     */
    std::expected<GreeksResult, SimulationError>
    estimate(const PricingParams& params, const Payoff& payoff = VanillaPayoff{}) const;

private:
    std::expected<void, SimulationError>
    check_method(const PricingParams& params, const Payoff& payoff) const;

    MonteCarloEngine engine_;
    GreeksConfig config_;
};

}  // namespace mcopt

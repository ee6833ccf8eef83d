// SPDX-License-Identifier: MIT
/**
 * @file monte_carlo_engine.hpp
 * @brief Monte Carlo pricing of options on a GBM underlying
 *
 * The engine ties together the random stream, the GBM path generator, the
 * payoff evaluator and the statistical aggregator:
 *
 *   normals (per block) -> GBM path -> discounted payoff -> running stats
 *
 * Example:
 *   auto engine = MonteCarloEngine::create({.n_simulations = 100000}).value();
 *   PricingParams params(100.0, 105.0, 1.0, 0.05, 0.0, OptionType::CALL, 0.20);
 *   auto result = engine.price(params);
 *   if (result) {
 *       // result->price, result->ci_lower, result->ci_upper
 *   }
 *
 * Reproducibility: results depend only on the configuration and the
 * parameters, never on the number of OpenMP threads.
 */

#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <vector>

#include "src/option/option_spec.hpp"
#include "src/option/payoff.hpp"
#include "src/risk/tail_risk.hpp"
#include "src/simulation/path_matrix.hpp"
#include "src/simulation/pricing_result.hpp"
#include "src/simulation/simulation_config.hpp"
#include "src/support/error_types.hpp"

namespace mcopt {

class MonteCarloEngine {
public:
    /// Path functional evaluated once per simulated path. Called concurrently
    /// from several threads, so it must not mutate shared state. An exception
    /// it throws reaches the caller of sample_functional().
    using PathFunctional = std::function<double(std::span<const double> path)>;

    /// Construct engine from a configuration (no validation)
    explicit MonteCarloEngine(const SimulationConfig& config = {});

    /// Factory with validation via validate_simulation_config()
    static std::expected<MonteCarloEngine, ValidationError>
    create(const SimulationConfig& config) noexcept;

    const SimulationConfig& config() const { return config_; }

    /// Statistical units per run: paths, or antithetic pairs
    size_t n_units() const;

    /// 2 with antithetic sampling, 1 otherwise
    size_t paths_per_unit() const { return config_.antithetic ? 2 : 1; }

    /// Simulate n_simulations GBM paths
    ///
    /// With antithetic sampling, rows come in (Z, -Z) pairs: row 2k is the
    /// path, row 2k+1 its mirror.
    ///
    /// @return Matrix of shape n_simulations × (n_steps + 1)
    std::expected<PathMatrix, SimulationError>
    simulate_paths(const PricingParams& params) const;

    /**
     * @brief Price a contract as the discounted mean payoff
     *
     * Applies antithetic sampling and the configured control variate, runs
     * in batches when batch_size > 0 and stops early once target_std_error
     * is reached.
     *
     * @param params Contract, market and volatility
     * @param payoff Contract payoff (vanilla by default)
     * @return Price with standard error and confidence interval
     */
    std::expected<PricingResult, SimulationError>
    price(const PricingParams& params, const Payoff& payoff = VanillaPayoff{}) const;

    /**
     * @brief Evaluate an arbitrary path functional on the engine's paths
     *
     * Uses the same random stream as price(), so two calls with the same
     * configuration see the same normals (common random numbers) even when
     * params differ. Batching and early stopping do not apply.
     *
     * @param params Parameters of the simulated GBM
     * @param fn Functional of one path
     * @param average_pairs With antithetic sampling, return one value per pair
     *        (the pair mean) instead of one value per path
     */
    std::expected<std::vector<double>, SimulationError>
    sample_functional(const PricingParams& params, const PathFunctional& fn,
                      bool average_pairs = true) const;

    /// Discounted payoff samples, one per unit (or per path)
    std::expected<std::vector<double>, SimulationError>
    discounted_payoffs(const PricingParams& params, const Payoff& payoff,
                       bool average_pairs = true) const;

    /**
     * @brief Tail risk of a long position bought at the simulated fair value
     *
     * P&L per path is the discounted payoff minus the mean discounted payoff.
     *
     * @param confidence_level VaR level in (0, 1)
     */
    std::expected<TailRiskMetrics, SimulationError>
    risk_metrics(const PricingParams& params, const Payoff& payoff,
                 double confidence_level) const;

private:
    std::expected<void, SimulationError> check_inputs(const PricingParams& params) const;

    SimulationConfig config_;
};

}  // namespace mcopt

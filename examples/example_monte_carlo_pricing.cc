/**
 * @file example_monte_carlo_pricing.cc
 * @brief Monte Carlo pricing of European and path-dependent options
 *
 * Demonstrates:
 * - Pricing a European call with the default 10,000 paths x 252 steps
 * - Comparing the estimate with the Black-Scholes closed form
 * - Variance reduction (antithetic pairs, control variates, Latin Hypercube)
 * - Asian, barrier and lookback payoffs
 * - VaR and Expected Shortfall of the simulated P&L
 */

#include "src/option/black_scholes.hpp"
#include "src/simulation/monte_carlo_engine.hpp"
#include <iomanip>
#include <iostream>
#include <string>

namespace {

void print_row(const std::string& label, const mcopt::PricingResult& result) {
    std::cout << std::left << std::setw(28) << label << std::right
              << std::fixed << std::setprecision(4)
              << std::setw(10) << result.price
              << std::setw(10) << result.std_error
              << "   [" << result.ci_lower << ", " << result.ci_upper << "]";
    if (result.control_beta.has_value()) {
        std::cout << "  beta=" << *result.control_beta
                  << " var ratio=" << std::setprecision(1) << result.variance_reduction_ratio;
    }
    std::cout << "\n";
}

}  // namespace

int main() {
    std::cout << "=== Monte Carlo Option Pricing Example ===\n\n";

    mcopt::PricingParams params(100.0, 105.0, 1.0, 0.05, 0.0, mcopt::OptionType::CALL, 0.20);

    auto engine = mcopt::MonteCarloEngine::create(mcopt::SimulationConfig{});
    if (!engine) {
        std::cerr << "Invalid configuration: " << engine.error() << "\n";
        return 1;
    }

    auto result = engine->price(params);
    if (!result) {
        std::cerr << "Pricing failed: " << result.error() << "\n";
        return 1;
    }

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Option Price: $" << result->price << "\n";
    std::cout << "Standard Error: $" << result->std_error << "\n";
    std::cout << "95% CI: [$" << result->ci_lower << ", $" << result->ci_upper << "]\n";
    std::cout << "Black-Scholes: $" << mcopt::bs_price(params) << "\n\n";

    // Variance reduction on the same contract
    std::cout << std::left << std::setw(28) << "Method" << std::right
              << std::setw(10) << "Price" << std::setw(10) << "StdErr" << "   95% CI\n";
    std::cout << std::string(90, '-') << "\n";
    print_row("plain", *result);

    mcopt::SimulationConfig config;
    config.antithetic = true;
    if (auto r = mcopt::MonteCarloEngine(config).price(params)) {
        print_row("antithetic", *r);
    }

    config = mcopt::SimulationConfig{};
    config.control_variate = mcopt::ControlVariate::TerminalSpot;
    if (auto r = mcopt::MonteCarloEngine(config).price(params)) {
        print_row("control variate (S_T)", *r);
    }

    config = mcopt::SimulationConfig{};
    config.sampling = mcopt::SamplingScheme::LatinHypercube;
    if (auto r = mcopt::MonteCarloEngine(config).price(params)) {
        print_row("latin hypercube", *r);
    }

    // Path-dependent contracts
    std::cout << "\nPath-dependent payoffs (K=105, daily monitoring):\n";
    std::cout << std::string(90, '-') << "\n";

    config = mcopt::SimulationConfig{};
    config.control_variate = mcopt::ControlVariate::GeometricAsian;
    if (auto r = mcopt::MonteCarloEngine(config).price(params, mcopt::AsianPayoff{})) {
        print_row("asian (arithmetic) + CV", *r);
    }

    mcopt::MonteCarloEngine plain(mcopt::SimulationConfig{});
    if (auto r = plain.price(params, mcopt::BarrierPayoff{mcopt::BarrierKind::UpAndOut, 130.0, 0.0})) {
        print_row("up-and-out call, B=130", *r);
    }
    if (auto r = plain.price(params, mcopt::LookbackPayoff{mcopt::LookbackStrike::Floating})) {
        print_row("floating lookback call", *r);
    }

    // Convergence with a standard error target
    config = mcopt::SimulationConfig{};
    config.n_simulations = 200000;
    config.batch_size = 10000;
    config.target_std_error = 0.05;
    config.n_steps = 1;
    auto converged = mcopt::MonteCarloEngine(config).price(params);
    if (converged) {
        std::cout << "\nConvergence (target std error 0.05):\n";
        for (const auto& point : converged->convergence) {
            std::cout << "  paths=" << std::setw(7) << point.n_paths
                      << "  estimate=" << std::setprecision(4) << point.estimate
                      << "  se=" << point.std_error << "\n";
        }
        std::cout << "  converged: " << (converged->converged ? "yes" : "no") << "\n";
    }

    // Tail risk of a long call bought at fair value
    auto risk = engine->risk_metrics(params, mcopt::VanillaPayoff{}, 0.99);
    if (risk) {
        std::cout << "\n99% VaR: $" << risk->value_at_risk
                  << "   99% ES: $" << risk->expected_shortfall << "\n";
    }

    return 0;
}

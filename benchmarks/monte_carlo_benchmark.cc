// SPDX-License-Identifier: MIT
/// @file monte_carlo_benchmark.cc
/// @brief Throughput of Monte Carlo pricing and Greeks
///
/// Reports paths/second for plain, antithetic, control-variate and Latin
/// Hypercube runs, and wall time for each Greeks method.
///
/// Usage:
///   ./build/benchmarks/monte_carlo_benchmark --benchmark_filter=Price

#include "src/simulation/greeks_estimator.hpp"
#include "src/simulation/monte_carlo_engine.hpp"
#include <benchmark/benchmark.h>
#include <stdexcept>

using namespace mcopt;

namespace {

PricingParams MakeParams() {
    return PricingParams(
        OptionSpec{.spot = 100.0, .strike = 105.0, .maturity = 1.0,
            .rate = 0.05, .dividend_yield = 0.0, .type = OptionType::CALL},
        0.20);
}

SimulationConfig MakeConfig(benchmark::State& state) {
    SimulationConfig config;
    config.n_simulations = static_cast<size_t>(state.range(0));
    config.n_steps = static_cast<size_t>(state.range(1));
    return config;
}

void RunPricing(benchmark::State& state, const SimulationConfig& config, const Payoff& payoff) {
    MonteCarloEngine engine(config);
    auto params = MakeParams();

    for (auto _ : state) {
        auto result = engine.price(params, payoff);
        if (!result) {
            throw std::runtime_error("Monte Carlo pricing failed");
        }
        benchmark::DoNotOptimize(result->price);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(config.n_simulations));
}

}  // namespace

static void BM_Price_Vanilla(benchmark::State& state) {
    RunPricing(state, MakeConfig(state), VanillaPayoff{});
}
BENCHMARK(BM_Price_Vanilla)
    ->Args({10000, 1})
    ->Args({10000, 252})
    ->Args({100000, 52})
    ->Unit(benchmark::kMillisecond);

static void BM_Price_Antithetic(benchmark::State& state) {
    auto config = MakeConfig(state);
    config.antithetic = true;
    RunPricing(state, config, VanillaPayoff{});
}
BENCHMARK(BM_Price_Antithetic)->Args({10000, 252})->Unit(benchmark::kMillisecond);

static void BM_Price_ControlVariate(benchmark::State& state) {
    auto config = MakeConfig(state);
    config.control_variate = ControlVariate::GeometricAsian;
    RunPricing(state, config, AsianPayoff{AverageType::Arithmetic});
}
BENCHMARK(BM_Price_ControlVariate)->Args({10000, 252})->Unit(benchmark::kMillisecond);

static void BM_Price_LatinHypercube(benchmark::State& state) {
    auto config = MakeConfig(state);
    config.sampling = SamplingScheme::LatinHypercube;
    RunPricing(state, config, VanillaPayoff{});
}
BENCHMARK(BM_Price_LatinHypercube)->Args({10000, 252})->Unit(benchmark::kMillisecond);

static void BM_Price_Barrier(benchmark::State& state) {
    RunPricing(state, MakeConfig(state), BarrierPayoff{BarrierKind::UpAndOut, 130.0, 0.0});
}
BENCHMARK(BM_Price_Barrier)->Args({10000, 252})->Unit(benchmark::kMillisecond);

static void BM_Greeks(benchmark::State& state) {
    SimulationConfig config;
    config.n_simulations = 50000;
    config.n_steps = 1;

    GreeksConfig greeks_config;
    greeks_config.method = static_cast<GreeksMethod>(state.range(0));
    GreeksEstimator estimator(MonteCarloEngine(config), greeks_config);
    auto params = MakeParams();

    for (auto _ : state) {
        auto result = estimator.estimate(params);
        if (!result) {
            throw std::runtime_error("Greeks estimation failed");
        }
        benchmark::DoNotOptimize(result->delta.value);
    }

    state.SetLabel(method_name(greeks_config.method));
}
BENCHMARK(BM_Greeks)
    ->Arg(static_cast<int>(GreeksMethod::FiniteDifference))
    ->Arg(static_cast<int>(GreeksMethod::Pathwise))
    ->Arg(static_cast<int>(GreeksMethod::LikelihoodRatio))
    ->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();

// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/math/running_stats.hpp"
#include "src/option/black_scholes.hpp"
#include "src/simulation/monte_carlo_engine.hpp"
#include <cmath>
#include <limits>
#include <span>
#include <stdexcept>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace mcopt {
namespace {

PricingParams otm_call() {
    return PricingParams(100.0, 105.0, 1.0, 0.05, 0.0, OptionType::CALL, 0.20);
}

PricingParams atm(OptionType type) {
    return PricingParams(100.0, 100.0, 1.0, 0.05, 0.0, type, 0.20);
}

SimulationConfig single_step(size_t n_simulations) {
    SimulationConfig config;
    config.n_simulations = n_simulations;
    config.n_steps = 1;
    return config;
}

TEST(MonteCarloEngineTest, DefaultConfiguration) {
    SimulationConfig config;
    EXPECT_EQ(config.n_simulations, 10000u);
    EXPECT_EQ(config.n_steps, 252u);
    EXPECT_EQ(config.seed, 42u);
    EXPECT_DOUBLE_EQ(config.confidence_level, 0.95);
    EXPECT_FALSE(config.antithetic);
    EXPECT_EQ(config.control_variate, ControlVariate::None);
}

TEST(MonteCarloEngineTest, DefaultRunMatchesBlackScholes) {
    MonteCarloEngine engine;
    auto result = engine.price(otm_call());
    ASSERT_TRUE(result.has_value()) << result.error();

    double bs = bs_price(otm_call());
    EXPECT_NEAR(result->price, bs, 4.0 * result->std_error);
    EXPECT_EQ(result->n_paths, 10000u);
    EXPECT_EQ(result->n_samples, 10000u);
    EXPECT_GT(result->std_error, 0.0);
    EXPECT_LT(result->std_error, 0.25);
    EXPECT_DOUBLE_EQ(result->confidence_level, 0.95);
    EXPECT_FALSE(result->control_beta.has_value());
    EXPECT_TRUE(result->paths.empty());
}

TEST(MonteCarloEngineTest, ConfidenceIntervalMatchesStandardError) {
    MonteCarloEngine engine(single_step(5000));
    auto result = engine.price(atm(OptionType::PUT));
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->half_width(), 1.959963984540054 * result->std_error, 1e-9);
    EXPECT_NEAR(0.5 * (result->ci_lower + result->ci_upper), result->price, 1e-12);
}

TEST(MonteCarloEngineTest, SameSeedSameResult) {
    MonteCarloEngine engine(single_step(3000));
    auto a = engine.price(atm(OptionType::CALL));
    auto b = engine.price(atm(OptionType::CALL));
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_DOUBLE_EQ(a->price, b->price);
    EXPECT_DOUBLE_EQ(a->std_error, b->std_error);
}

TEST(MonteCarloEngineTest, DifferentSeedDifferentResult) {
    auto config = single_step(3000);
    MonteCarloEngine a(config);
    config.seed = 7;
    MonteCarloEngine b(config);
    auto ra = a.price(atm(OptionType::CALL));
    auto rb = b.price(atm(OptionType::CALL));
    ASSERT_TRUE(ra.has_value());
    ASSERT_TRUE(rb.has_value());
    EXPECT_NE(ra->price, rb->price);
}

#ifdef _OPENMP
TEST(MonteCarloEngineTest, ResultIndependentOfThreadCount) {
    MonteCarloEngine engine(SimulationConfig{.n_simulations = 5000, .n_steps = 8});
    int saved = omp_get_max_threads();

    omp_set_num_threads(1);
    auto serial = engine.price(atm(OptionType::CALL));
    omp_set_num_threads(4);
    auto parallel = engine.price(atm(OptionType::CALL));
    omp_set_num_threads(saved);

    ASSERT_TRUE(serial.has_value());
    ASSERT_TRUE(parallel.has_value());
    EXPECT_DOUBLE_EQ(serial->price, parallel->price);
    EXPECT_DOUBLE_EQ(serial->std_error, parallel->std_error);
}
#endif

TEST(MonteCarloEngineTest, PutPrice) {
    MonteCarloEngine engine(single_step(20000));
    auto result = engine.price(atm(OptionType::PUT));
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->price, 5.5735, 4.0 * result->std_error);
}

TEST(MonteCarloEngineTest, ZeroVolatilityIsDeterministic) {
    auto params = atm(OptionType::CALL);
    params.volatility = 0.0;
    MonteCarloEngine engine(SimulationConfig{.n_simulations = 100, .n_steps = 12});
    auto result = engine.price(params);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->price, 100.0 - 100.0 * std::exp(-0.05), 1e-9);
    EXPECT_DOUBLE_EQ(result->std_error, 0.0);
}

TEST(MonteCarloEngineTest, AntitheticReducesStandardError) {
    auto config = single_step(10000);
    MonteCarloEngine plain(config);
    config.antithetic = true;
    MonteCarloEngine anti(config);

    auto rp = plain.price(atm(OptionType::CALL));
    auto ra = anti.price(atm(OptionType::CALL));
    ASSERT_TRUE(rp.has_value());
    ASSERT_TRUE(ra.has_value());

    EXPECT_EQ(ra->n_paths, 10000u);
    EXPECT_EQ(ra->n_samples, 5000u);
    EXPECT_LT(ra->std_error, rp->std_error);
    EXPECT_NEAR(ra->price, 10.4506, 4.0 * ra->std_error);
}

TEST(MonteCarloEngineTest, AntitheticOddPathCountRoundsUpToPairs) {
    auto config = single_step(1001);
    config.antithetic = true;
    MonteCarloEngine engine(config);
    EXPECT_EQ(engine.n_units(), 501u);

    auto result = engine.price(atm(OptionType::CALL));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->n_samples, 501u);
    EXPECT_EQ(result->n_paths, 1002u);
}

TEST(MonteCarloEngineTest, TerminalSpotControlVariate) {
    auto config = single_step(10000);
    MonteCarloEngine plain(config);
    config.control_variate = ControlVariate::TerminalSpot;
    MonteCarloEngine controlled(config);

    auto rp = plain.price(atm(OptionType::CALL));
    auto rc = controlled.price(atm(OptionType::CALL));
    ASSERT_TRUE(rp.has_value());
    ASSERT_TRUE(rc.has_value());

    ASSERT_TRUE(rc->control_beta.has_value());
    EXPECT_GT(*rc->control_beta, 0.0);
    EXPECT_GT(rc->variance_reduction_ratio, 2.0);
    EXPECT_LT(rc->std_error, rp->std_error);
    EXPECT_NEAR(rc->price, 10.4506, 4.0 * rc->std_error);
}

TEST(MonteCarloEngineTest, ControlVariateRestoresPutCallParity) {
    // Call minus put is linear in S_T, so the control removes all noise
    auto config = single_step(2000);
    config.control_variate = ControlVariate::TerminalSpot;
    MonteCarloEngine engine(config);

    auto call = engine.price(atm(OptionType::CALL));
    auto put = engine.price(atm(OptionType::PUT));
    ASSERT_TRUE(call.has_value());
    ASSERT_TRUE(put.has_value());
    EXPECT_NEAR(call->price - put->price, 100.0 - 100.0 * std::exp(-0.05), 1e-8);
}

TEST(MonteCarloEngineTest, GeometricAsianControlForArithmeticAsian) {
    SimulationConfig config{.n_simulations = 5000, .n_steps = 12};
    MonteCarloEngine plain(config);
    config.control_variate = ControlVariate::GeometricAsian;
    MonteCarloEngine controlled(config);

    AsianPayoff asian{AverageType::Arithmetic};
    auto rp = plain.price(atm(OptionType::CALL), asian);
    auto rc = controlled.price(atm(OptionType::CALL), asian);
    ASSERT_TRUE(rp.has_value());
    ASSERT_TRUE(rc.has_value());

    EXPECT_GT(rc->variance_reduction_ratio, 20.0);
    EXPECT_NEAR(rc->price, rp->price, 4.0 * rp->std_error);
    // Arithmetic average dominates the geometric one
    EXPECT_GT(rc->price, geometric_asian_price(atm(OptionType::CALL), 12));
}

TEST(MonteCarloEngineTest, GeometricAsianMatchesClosedForm) {
    MonteCarloEngine engine(SimulationConfig{.n_simulations = 20000, .n_steps = 12});
    auto result = engine.price(atm(OptionType::CALL), AsianPayoff{AverageType::Geometric});
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->price, 5.9402, 4.0 * result->std_error);
}

TEST(MonteCarloEngineTest, GeometricControlOnGeometricPayoffIsExact) {
    SimulationConfig config{.n_simulations = 1000, .n_steps = 12};
    config.control_variate = ControlVariate::GeometricAsian;
    MonteCarloEngine engine(config);
    auto result = engine.price(atm(OptionType::CALL), AsianPayoff{AverageType::Geometric});
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->price, geometric_asian_price(atm(OptionType::CALL), 12), 1e-9);
    EXPECT_GT(result->variance_reduction_ratio, 1e6);
}

TEST(MonteCarloEngineTest, LatinHypercubeSingleStepIsAccurate) {
    auto config = single_step(10000);
    config.sampling = SamplingScheme::LatinHypercube;
    MonteCarloEngine engine(config);
    auto result = engine.price(atm(OptionType::CALL));
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->price, 10.4506, 0.05);
}

TEST(MonteCarloEngineTest, LatinHypercubeMultiStep) {
    SimulationConfig config;
    config.sampling = SamplingScheme::LatinHypercube;
    config.n_steps = 50;
    MonteCarloEngine engine(config);
    auto result = engine.price(otm_call());
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->price, 8.0214, 4.0 * result->std_error);
}

TEST(MonteCarloEngineTest, KnockInPlusKnockOutIsVanilla) {
    MonteCarloEngine engine(SimulationConfig{.n_simulations = 4000, .n_steps = 50});
    auto params = atm(OptionType::CALL);
    auto in = engine.price(params, BarrierPayoff{BarrierKind::UpAndIn, 120.0, 0.0});
    auto out = engine.price(params, BarrierPayoff{BarrierKind::UpAndOut, 120.0, 0.0});
    auto vanilla = engine.price(params);
    ASSERT_TRUE(in.has_value());
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(vanilla.has_value());
    EXPECT_NEAR(in->price + out->price, vanilla->price, 1e-9);
    EXPECT_LT(out->price, vanilla->price);
}

TEST(MonteCarloEngineTest, FloatingLookbackExceedsVanilla) {
    MonteCarloEngine engine(SimulationConfig{.n_simulations = 4000, .n_steps = 50});
    auto lookback = engine.price(atm(OptionType::CALL), LookbackPayoff{});
    auto vanilla = engine.price(atm(OptionType::CALL));
    ASSERT_TRUE(lookback.has_value());
    ASSERT_TRUE(vanilla.has_value());
    EXPECT_GT(lookback->price, vanilla->price);
}

TEST(MonteCarloEngineTest, DigitalPrice) {
    MonteCarloEngine engine(single_step(20000));
    auto result = engine.price(atm(OptionType::CALL), DigitalPayoff{});
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->price, 0.532325, 4.0 * result->std_error);
}

TEST(MonteCarloEngineTest, BatchesRecordConvergence) {
    auto config = single_step(10000);
    config.batch_size = 2048;
    MonteCarloEngine batched(config);
    MonteCarloEngine single(single_step(10000));

    auto rb = batched.price(atm(OptionType::CALL));
    auto rs = single.price(atm(OptionType::CALL));
    ASSERT_TRUE(rb.has_value());
    ASSERT_TRUE(rs.has_value());

    ASSERT_EQ(rb->convergence.size(), 5u);
    EXPECT_EQ(rb->convergence[0].n_paths, 2048u);
    EXPECT_EQ(rb->convergence[3].n_paths, 8192u);
    EXPECT_EQ(rb->convergence.back().n_paths, 10000u);
    EXPECT_DOUBLE_EQ(rb->convergence.back().estimate, rb->price);
    EXPECT_FALSE(rb->converged);

    // Batching only changes reporting
    EXPECT_DOUBLE_EQ(rb->price, rs->price);
    ASSERT_EQ(rs->convergence.size(), 1u);
}

TEST(MonteCarloEngineTest, EarlyStopWhenTargetMet) {
    auto config = single_step(10000);
    config.batch_size = 2048;
    config.target_std_error = 1.0;
    MonteCarloEngine engine(config);

    auto result = engine.price(atm(OptionType::CALL));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->converged);
    EXPECT_EQ(result->n_paths, 2048u);
    EXPECT_EQ(result->convergence.size(), 1u);
    EXPECT_LE(result->std_error, 1.0);
}

TEST(MonteCarloEngineTest, UnreachableTargetRunsAllPaths) {
    auto config = single_step(4096);
    config.batch_size = 1024;
    config.target_std_error = 1e-6;
    MonteCarloEngine engine(config);

    auto result = engine.price(atm(OptionType::CALL));
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->converged);
    EXPECT_EQ(result->n_paths, 4096u);
    EXPECT_EQ(result->convergence.size(), 4u);
}

TEST(MonteCarloEngineTest, StoredPathsReproducePrice) {
    SimulationConfig config{.n_simulations = 3000, .n_steps = 4};
    config.store_paths = true;
    MonteCarloEngine engine(config);
    auto params = atm(OptionType::CALL);

    auto result = engine.price(params);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->paths.n_paths(), 3000u);
    ASSERT_EQ(result->paths.n_columns(), 5u);

    double discount = std::exp(-params.rate * params.maturity);
    double sum = 0.0;
    for (size_t i = 0; i < result->paths.n_paths(); ++i) {
        EXPECT_DOUBLE_EQ(result->paths(i, 0), 100.0);
        sum += discount * evaluate_payoff(VanillaPayoff{}, result->paths.row(i), params);
    }
    EXPECT_NEAR(sum / 3000.0, result->price, 1e-9);
}

TEST(MonteCarloEngineTest, SimulatePathsShape) {
    MonteCarloEngine engine(SimulationConfig{.n_simulations = 2500, .n_steps = 10});
    auto paths = engine.simulate_paths(atm(OptionType::CALL));
    ASSERT_TRUE(paths.has_value());
    EXPECT_EQ(paths->n_paths(), 2500u);
    EXPECT_EQ(paths->n_steps(), 10u);
    for (double s0 : paths->column(0)) {
        EXPECT_DOUBLE_EQ(s0, 100.0);
    }
}

TEST(MonteCarloEngineTest, SimulatedTerminalMeanIsForward) {
    MonteCarloEngine engine(SimulationConfig{.n_simulations = 20000, .n_steps = 5});
    auto params = atm(OptionType::CALL);
    params.dividend_yield = 0.02;
    auto paths = engine.simulate_paths(params);
    ASSERT_TRUE(paths.has_value());

    RunningStats stats;
    for (double s : paths->terminal_prices()) {
        stats.add(s);
    }
    EXPECT_NEAR(stats.mean(), 100.0 * std::exp(0.03), 4.0 * stats.std_error());
}

TEST(MonteCarloEngineTest, SimulatePathsMatchesPricingPaths) {
    SimulationConfig config{.n_simulations = 1500, .n_steps = 3};
    MonteCarloEngine engine(config);
    config.store_paths = true;
    MonteCarloEngine storing(config);

    auto paths = engine.simulate_paths(atm(OptionType::CALL));
    auto priced = storing.price(atm(OptionType::CALL));
    ASSERT_TRUE(paths.has_value());
    ASSERT_TRUE(priced.has_value());
    ASSERT_EQ(paths->data().size(), priced->paths.data().size());
    for (size_t i = 0; i < paths->data().size(); ++i) {
        EXPECT_DOUBLE_EQ(paths->data()[i], priced->paths.data()[i]);
    }
}

TEST(MonteCarloEngineTest, AntitheticPathsComeInMirroredPairs) {
    SimulationConfig config{.n_simulations = 5, .n_steps = 2};
    config.antithetic = true;
    MonteCarloEngine engine(config);
    auto params = atm(OptionType::CALL);
    auto paths = engine.simulate_paths(params);
    ASSERT_TRUE(paths.has_value());
    EXPECT_EQ(paths->n_paths(), 5u);

    double mu = params.rate - 0.5 * params.volatility * params.volatility;
    for (size_t k = 0; k < 2; ++k) {
        double log_sum = std::log(paths->row(2 * k)[2] / 100.0) +
                         std::log(paths->row(2 * k + 1)[2] / 100.0);
        EXPECT_NEAR(log_sum, 2.0 * mu * params.maturity, 1e-12);
    }
}

TEST(MonteCarloEngineTest, SampleFunctionalPerPathOrPerPair) {
    SimulationConfig config{.n_simulations = 10, .n_steps = 1};
    config.antithetic = true;
    MonteCarloEngine engine(config);
    auto terminal = [](std::span<const double> path) { return path.back(); };

    auto pairs = engine.sample_functional(atm(OptionType::CALL), terminal);
    auto per_path = engine.sample_functional(atm(OptionType::CALL), terminal, false);
    ASSERT_TRUE(pairs.has_value());
    ASSERT_TRUE(per_path.has_value());
    ASSERT_EQ(pairs->size(), 5u);
    ASSERT_EQ(per_path->size(), 10u);
    for (size_t k = 0; k < 5; ++k) {
        EXPECT_NEAR((*pairs)[k], 0.5 * ((*per_path)[2 * k] + (*per_path)[2 * k + 1]), 1e-12);
    }
}

TEST(MonteCarloEngineTest, NonFiniteSampleReported) {
    MonteCarloEngine engine(single_step(100));
    auto result = engine.sample_functional(atm(OptionType::CALL),
        [](std::span<const double> path) {
            return path.back() > 100.0 ? std::numeric_limits<double>::quiet_NaN() : 1.0;
        });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SimulationErrorCode::NonFiniteSample);
}

TEST(MonteCarloEngineTest, NonFiniteControlSampleReported) {
    // S_T overflows: the put pays nothing but the S_T control is not finite
    auto params = atm(OptionType::PUT);
    params.rate = 800.0;
    auto config = single_step(100);
    config.control_variate = ControlVariate::TerminalSpot;
    MonteCarloEngine engine(config);

    auto result = engine.price(params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SimulationErrorCode::NonFiniteSample);
}

TEST(MonteCarloEngineTest, FunctionalExceptionReachesCaller) {
    MonteCarloEngine engine(SimulationConfig{.n_simulations = 3000, .n_steps = 2});
    auto throwing = [](std::span<const double>) -> double {
        throw std::runtime_error("functional failed");
    };
    EXPECT_THROW((void)engine.sample_functional(atm(OptionType::CALL), throwing),
                 std::runtime_error);
}

TEST(MonteCarloEngineTest, FunctionalExceptionInOneBlockReachesCaller) {
    MonteCarloEngine engine(SimulationConfig{.n_simulations = 3000, .n_steps = 1});
    auto throwing = [](std::span<const double> path) -> double {
        if (path.back() > 160.0) {
            throw std::domain_error("path out of range");
        }
        return path.back();
    };
    EXPECT_THROW((void)engine.sample_functional(atm(OptionType::CALL), throwing),
                 std::domain_error);
}

TEST(MonteCarloEngineTest, OversizedStepCountThrowsInsteadOfTerminating) {
    // Passes validation, but one block of normals exceeds vector::max_size()
    SimulationConfig config{.n_simulations = 16, .n_steps = size_t{1} << 58};
    ASSERT_TRUE(validate_simulation_config(config).has_value());
    MonteCarloEngine engine(config);
    EXPECT_THROW((void)engine.price(atm(OptionType::CALL)), std::exception);
}

TEST(MonteCarloEngineTest, CreateRejectsBadConfig) {
    auto engine = MonteCarloEngine::create(SimulationConfig{.n_simulations = 1});
    ASSERT_FALSE(engine.has_value());
    EXPECT_EQ(engine.error().code, ValidationErrorCode::InvalidPathCount);

    SimulationConfig level;
    level.confidence_level = 1.0;
    auto bad_level = MonteCarloEngine::create(level);
    ASSERT_FALSE(bad_level.has_value());
    EXPECT_EQ(bad_level.error().code, ValidationErrorCode::InvalidConfidenceLevel);

    EXPECT_TRUE(MonteCarloEngine::create(SimulationConfig{}).has_value());
}

TEST(MonteCarloEngineTest, UnvalidatedBadConfigRejectedAtPricing) {
    MonteCarloEngine engine(SimulationConfig{.n_simulations = 100, .n_steps = 0});
    auto result = engine.price(atm(OptionType::CALL));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SimulationErrorCode::InvalidConfiguration);
    ASSERT_TRUE(result.error().detail.has_value());
    EXPECT_EQ(result.error().detail->code, ValidationErrorCode::InvalidStepCount);
}

TEST(MonteCarloEngineTest, InvalidParametersRejected) {
    MonteCarloEngine engine(single_step(100));
    auto params = atm(OptionType::CALL);
    params.spot = -1.0;
    auto result = engine.price(params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SimulationErrorCode::InvalidParameters);
    ASSERT_TRUE(result.error().detail.has_value());
    EXPECT_EQ(result.error().detail->code, ValidationErrorCode::InvalidSpotPrice);

    EXPECT_FALSE(engine.simulate_paths(params).has_value());
}

TEST(MonteCarloEngineTest, InvalidPayoffRejected) {
    MonteCarloEngine engine(single_step(100));
    auto result = engine.price(atm(OptionType::CALL), BarrierPayoff{BarrierKind::UpAndOut, -1.0, 0.0});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SimulationErrorCode::InvalidPayoff);
}

TEST(MonteCarloEngineTest, SinglePairIsInsufficient) {
    auto config = single_step(2);
    config.antithetic = true;
    MonteCarloEngine engine(config);
    auto result = engine.price(atm(OptionType::CALL));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SimulationErrorCode::InsufficientSamples);
    EXPECT_EQ(result.error().samples, 1u);
}

}  // namespace
}  // namespace mcopt

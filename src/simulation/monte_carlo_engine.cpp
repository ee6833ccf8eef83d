// SPDX-License-Identifier: MIT
#include "src/simulation/monte_carlo_engine.hpp"
#include "src/math/running_stats.hpp"
#include "src/option/black_scholes.hpp"
#include "src/simulation/path_generator.hpp"
#include "src/simulation/random_stream.hpp"
#include "src/support/mcopt_trace.h"
#include "src/support/parallel.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <numeric>

namespace mcopt {

namespace {

constexpr size_t kNoBadSample = std::numeric_limits<size_t>::max();

size_t ceil_div(size_t a, size_t b) {
    return (a + b - 1) / b;
}

/// Run body(b) for blocks [begin, end) in parallel
///
/// An exception cannot cross an OpenMP region, so each block stores its own
/// and the first one in block order is rethrown after the loop.
template <typename Body>
void for_each_block(size_t begin, size_t end, Body&& body) {
    std::vector<std::exception_ptr> errors(end - begin);

    MCOPT_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t b = begin; b < end; ++b) {
        try {
            body(b);
        } catch (...) {
            errors[b - begin] = std::current_exception();
        }
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}

/// Simulate every unit of one block and hand its path(s) to `visit`
///
/// visit(unit, path, mirror): mirror is empty unless antithetic sampling
/// is enabled. Buffers are reused between units.
template <typename Visitor>
void simulate_block(const SimulationConfig& config, const GbmPathGenerator& generator,
                    size_t n_units, size_t block, Visitor&& visit) {
    const size_t n_steps = config.n_steps;
    const size_t first = block * kPathBlockSize;
    const size_t count = std::min(kPathBlockSize, n_units - first);

    std::vector<double> normals(count * n_steps);
    fill_block_normals(config.sampling, config.seed, block, count, n_steps, normals);

    std::vector<double> path(n_steps + 1);
    std::vector<double> mirror(config.antithetic ? n_steps + 1 : 0);
    const std::span<const double> all_normals(normals);

    for (size_t u = 0; u < count; ++u) {
        auto z = all_normals.subspan(u * n_steps, n_steps);
        generator.generate(z, path, 1.0);
        if (config.antithetic) {
            generator.generate(z, mirror, -1.0);
        }
        visit(first + u, std::span<const double>(path), std::span<const double>(mirror));
    }
}

/// Control variate sample and its known expectation
struct ControlSpec {
    ControlVariate kind = ControlVariate::None;
    double discount = 1.0;
    double mean = 0.0;
};

ControlSpec make_control(ControlVariate kind, const PricingParams& params, size_t n_steps,
                         double discount) {
    ControlSpec control{kind, discount, 0.0};
    switch (kind) {
        case ControlVariate::None:
            break;
        case ControlVariate::TerminalSpot:
            // E[e^{-rT} S_T] = S e^{-qT}
            control.mean = params.spot * std::exp(-params.dividend_yield * params.maturity);
            break;
        case ControlVariate::GeometricAsian:
            control.mean = geometric_asian_price(params, n_steps);
            break;
    }
    return control;
}

double control_value(const ControlSpec& control, std::span<const double> path,
                     const OptionSpec& spec) {
    switch (control.kind) {
        case ControlVariate::None:
            return 0.0;
        case ControlVariate::TerminalSpot:
            return control.discount * path.back();
        case ControlVariate::GeometricAsian:
            return control.discount *
                   evaluate_payoff(AsianPayoff{AverageType::Geometric}, path, spec);
    }
    return 0.0;
}

}  // namespace

MonteCarloEngine::MonteCarloEngine(const SimulationConfig& config)
    : config_(config)
{}

std::expected<MonteCarloEngine, ValidationError>
MonteCarloEngine::create(const SimulationConfig& config) noexcept {
    auto validation = validate_simulation_config(config);
    if (!validation.has_value()) {
        return std::unexpected(validation.error());
    }
    return MonteCarloEngine(config);
}

size_t MonteCarloEngine::n_units() const {
    return config_.antithetic ? (config_.n_simulations + 1) / 2 : config_.n_simulations;
}

std::expected<void, SimulationError>
MonteCarloEngine::check_inputs(const PricingParams& params) const {
    auto config_check = validate_simulation_config(config_);
    if (!config_check) {
        return std::unexpected(make_simulation_error(
            SimulationErrorCode::InvalidConfiguration, config_check.error()));
    }

    auto params_check = validate_pricing_params(params);
    if (!params_check) {
        return std::unexpected(make_simulation_error(
            SimulationErrorCode::InvalidParameters, params_check.error()));
    }

    // A variance needs two samples; antithetic runs of 2-3 paths have fewer
    if (n_units() < 2) {
        MCOPT_TRACE_RUNTIME_ERROR(MODULE_MC_ENGINE,
            static_cast<int>(SimulationErrorCode::InsufficientSamples), n_units());
        return std::unexpected(SimulationError{
            SimulationErrorCode::InsufficientSamples, n_units(), 0.0, std::nullopt});
    }

    return {};
}

std::expected<PathMatrix, SimulationError>
MonteCarloEngine::simulate_paths(const PricingParams& params) const {
    auto checked = check_inputs(params);
    if (!checked) {
        return std::unexpected(checked.error());
    }

    MCOPT_TRACE_ALGO_START(MODULE_PATH_GENERATOR, config_.n_simulations, config_.n_steps,
                           config_.seed);

    const GbmPathGenerator generator(params, config_.n_steps);
    const size_t units = n_units();
    const size_t ppu = paths_per_unit();
    const size_t n_blocks = ceil_div(units, kPathBlockSize);

    PathMatrix paths(units * ppu, config_.n_steps);

    for_each_block(0, n_blocks, [&](size_t b) {
        simulate_block(config_, generator, units, b,
            [&](size_t unit, std::span<const double> path, std::span<const double> mirror) {
                std::copy(path.begin(), path.end(), paths.row(unit * ppu).begin());
                if (!mirror.empty()) {
                    std::copy(mirror.begin(), mirror.end(), paths.row(unit * ppu + 1).begin());
                }
            });
    });

    // Odd antithetic runs drop the mirror of the last pair
    paths.truncate(config_.n_simulations);

    MCOPT_TRACE_ALGO_COMPLETE(MODULE_PATH_GENERATOR, paths.n_paths(), 0.0);
    return paths;
}

std::expected<PricingResult, SimulationError>
MonteCarloEngine::price(const PricingParams& params, const Payoff& payoff) const {
    auto checked = check_inputs(params);
    if (!checked) {
        return std::unexpected(checked.error());
    }
    auto payoff_check = validate_payoff(payoff);
    if (!payoff_check) {
        return std::unexpected(make_simulation_error(
            SimulationErrorCode::InvalidPayoff, payoff_check.error()));
    }

    MCOPT_TRACE_ALGO_START(MODULE_MC_ENGINE, config_.n_simulations, config_.n_steps,
                           config_.seed);

    const GbmPathGenerator generator(params, config_.n_steps);
    const double discount = std::exp(-params.rate * params.maturity);
    const ControlSpec control = make_control(config_.control_variate, params,
                                             config_.n_steps, discount);
    const bool use_control = control.kind != ControlVariate::None;
    const bool store = config_.store_paths;

    const size_t units = n_units();
    const size_t ppu = paths_per_unit();
    const size_t n_blocks = ceil_div(units, kPathBlockSize);

    size_t batch_blocks = n_blocks;
    if (config_.batch_size > 0) {
        size_t batch_units = ceil_div(config_.batch_size, ppu);
        batch_blocks = std::max<size_t>(1, ceil_div(batch_units, kPathBlockSize));
    }

    PricingResult result;
    result.confidence_level = config_.confidence_level;
    if (store) {
        result.paths = PathMatrix(units * ppu, config_.n_steps);
    }

    std::vector<PairedStats> block_stats(n_blocks);
    std::vector<size_t> bad_unit(n_blocks, kNoBadSample);
    std::vector<double> bad_value(n_blocks, 0.0);

    PairedStats total;
    Estimate estimate;
    size_t blocks_done = 0;
    size_t batch = 0;

    while (blocks_done < n_blocks) {
        const size_t begin = blocks_done;
        const size_t end = std::min(n_blocks, begin + batch_blocks);

        for_each_block(begin, end, [&](size_t b) {
            simulate_block(config_, generator, units, b,
                [&](size_t unit, std::span<const double> path, std::span<const double> mirror) {
                    double y = discount * evaluate_payoff(payoff, path, params);
                    double c = control_value(control, path, params);
                    if (!mirror.empty()) {
                        y = 0.5 * (y + discount * evaluate_payoff(payoff, mirror, params));
                        c = 0.5 * (c + control_value(control, mirror, params));
                    }
                    bool finite = std::isfinite(y) && std::isfinite(c);
                    if (!finite && bad_unit[b] == kNoBadSample) {
                        bad_unit[b] = unit;
                        bad_value[b] = std::isfinite(y) ? c : y;
                    }
                    block_stats[b].add(y, c);

                    if (store) {
                        std::copy(path.begin(), path.end(),
                                  result.paths.row(unit * ppu).begin());
                        if (!mirror.empty()) {
                            std::copy(mirror.begin(), mirror.end(),
                                      result.paths.row(unit * ppu + 1).begin());
                        }
                    }
                });
        });

        // Merge in block order so the result is independent of scheduling
        for (size_t b = begin; b < end; ++b) {
            if (bad_unit[b] != kNoBadSample) {
                MCOPT_TRACE_RUNTIME_ERROR(MODULE_MC_ENGINE,
                    static_cast<int>(SimulationErrorCode::NonFiniteSample), bad_unit[b]);
                return std::unexpected(SimulationError{
                    SimulationErrorCode::NonFiniteSample, bad_unit[b], bad_value[b], std::nullopt});
            }
            total.merge(block_stats[b]);
        }
        blocks_done = end;

        double mean = use_control ? total.adjusted_mean(control.mean) : total.mean_y();
        double variance = use_control ? total.adjusted_variance() : total.variance_y();
        estimate = make_estimate(mean, variance, total.count(), config_.confidence_level);

        const size_t paths_so_far = total.count() * ppu;
        result.convergence.push_back({paths_so_far, estimate.mean, estimate.std_error});
        MCOPT_TRACE_MC_BATCH(batch, paths_so_far, estimate.mean, estimate.std_error);
        ++batch;

        if (config_.target_std_error > 0.0 && estimate.std_error <= config_.target_std_error) {
            result.converged = true;
            if (blocks_done < n_blocks) {
                MCOPT_TRACE_MC_EARLY_STOP(paths_so_far, estimate.std_error,
                                          config_.target_std_error);
                break;
            }
        }
    }

    result.price = estimate.mean;
    result.std_error = estimate.std_error;
    result.ci_lower = estimate.ci_lower;
    result.ci_upper = estimate.ci_upper;
    result.n_samples = total.count();
    result.n_paths = total.count() * ppu;

    if (use_control) {
        double adjusted = total.adjusted_variance();
        double plain = total.variance_y();
        result.control_beta = total.beta();
        if (adjusted > 0.0) {
            result.variance_reduction_ratio = plain / adjusted;
        } else if (plain > 0.0) {
            result.variance_reduction_ratio = std::numeric_limits<double>::infinity();
        }
        MCOPT_TRACE_MC_CONTROL_VARIATE(static_cast<int>(control.kind), total.beta(),
                                       result.variance_reduction_ratio);
    }

    if (store) {
        result.paths.truncate(result.n_paths);
    }

    MCOPT_TRACE_ALGO_COMPLETE(MODULE_MC_ENGINE, result.n_paths, result.price);
    return result;
}

std::expected<std::vector<double>, SimulationError>
MonteCarloEngine::sample_functional(const PricingParams& params, const PathFunctional& fn,
                                    bool average_pairs) const {
    auto checked = check_inputs(params);
    if (!checked) {
        return std::unexpected(checked.error());
    }

    const GbmPathGenerator generator(params, config_.n_steps);
    const size_t units = n_units();
    const size_t n_blocks = ceil_div(units, kPathBlockSize);
    const size_t stride = (config_.antithetic && !average_pairs) ? 2 : 1;

    std::vector<double> samples(units * stride);
    std::vector<size_t> bad_unit(n_blocks, kNoBadSample);
    std::vector<double> bad_value(n_blocks, 0.0);

    for_each_block(0, n_blocks, [&](size_t b) {
        simulate_block(config_, generator, units, b,
            [&](size_t unit, std::span<const double> path, std::span<const double> mirror) {
                double value = fn(path);
                double value_mirror = mirror.empty() ? 0.0 : fn(mirror);

                bool finite = std::isfinite(value) && std::isfinite(value_mirror);
                if (!finite && bad_unit[b] == kNoBadSample) {
                    bad_unit[b] = unit;
                    bad_value[b] = std::isfinite(value) ? value_mirror : value;
                }

                if (mirror.empty()) {
                    samples[unit] = value;
                } else if (average_pairs) {
                    samples[unit] = 0.5 * (value + value_mirror);
                } else {
                    samples[2 * unit] = value;
                    samples[2 * unit + 1] = value_mirror;
                }
            });
    });

    for (size_t b = 0; b < n_blocks; ++b) {
        if (bad_unit[b] != kNoBadSample) {
            MCOPT_TRACE_RUNTIME_ERROR(MODULE_MC_ENGINE,
                static_cast<int>(SimulationErrorCode::NonFiniteSample), bad_unit[b]);
            return std::unexpected(SimulationError{
                SimulationErrorCode::NonFiniteSample, bad_unit[b], bad_value[b], std::nullopt});
        }
    }

    return samples;
}

std::expected<std::vector<double>, SimulationError>
MonteCarloEngine::discounted_payoffs(const PricingParams& params, const Payoff& payoff,
                                     bool average_pairs) const {
    auto payoff_check = validate_payoff(payoff);
    if (!payoff_check) {
        return std::unexpected(make_simulation_error(
            SimulationErrorCode::InvalidPayoff, payoff_check.error()));
    }

    const double discount = std::exp(-params.rate * params.maturity);
    const OptionSpec& spec = params;
    return sample_functional(params,
        [&payoff, &spec, discount](std::span<const double> path) {
            return discount * evaluate_payoff(payoff, path, spec);
        },
        average_pairs);
}

std::expected<TailRiskMetrics, SimulationError>
MonteCarloEngine::risk_metrics(const PricingParams& params, const Payoff& payoff,
                               double confidence_level) const {
    auto samples = discounted_payoffs(params, payoff, /*average_pairs=*/false);
    if (!samples) {
        return std::unexpected(samples.error());
    }

    std::vector<double>& pnl = *samples;
    double premium = std::accumulate(pnl.begin(), pnl.end(), 0.0) /
                     static_cast<double>(pnl.size());
    for (double& v : pnl) {
        v -= premium;
    }

    auto metrics = compute_tail_risk(pnl, confidence_level);
    if (!metrics) {
        return std::unexpected(make_simulation_error(
            SimulationErrorCode::InvalidConfiguration, metrics.error()));
    }
    return *metrics;
}

}  // namespace mcopt

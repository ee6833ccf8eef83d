// SPDX-License-Identifier: MIT
#include "src/simulation/greeks_estimator.hpp"
#include "src/math/running_stats.hpp"
#include "src/support/mcopt_trace.h"
#include <cmath>
#include <initializer_list>
#include <span>
#include <variant>
#include <vector>

namespace mcopt {

namespace {

using Samples = std::vector<double>;

/// One term of a per-sample linear combination
struct Term {
    const Samples* samples;
    double weight;
};

/// Mean and standard error of sum_k weight_k · samples_k[i] over i
GreekEstimate combine(std::initializer_list<Term> terms) {
    RunningStats stats;
    const size_t n = terms.begin()->samples->size();
    for (size_t i = 0; i < n; ++i) {
        double x = 0.0;
        for (const Term& t : terms) {
            x += t.weight * (*t.samples)[i];
        }
        stats.add(x);
    }
    return GreekEstimate{stats.mean(), stats.std_error()};
}

double payoff_sign(OptionType type) {
    return type == OptionType::CALL ? 1.0 : -1.0;
}

/// Quantity the payoff is written on, and its derivative in σ along the path
struct PathwiseTerms {
    double underlying;   ///< S_T, or the arithmetic/geometric average
    double d_sigma;      ///< ∂underlying/∂σ
};

// ∂S_t/∂σ = S_t · (ln(S_t/S_0) - (r - q + σ²/2)t) / σ
PathwiseTerms pathwise_terms(const Payoff& payoff, std::span<const double> path,
                             const PricingParams& params) {
    const double sigma = params.volatility;
    const double s0 = path.front();
    const double shift = params.rate - params.dividend_yield + 0.5 * sigma * sigma;
    const size_t n = path.size() - 1;
    const double dt = params.maturity / static_cast<double>(n);

    auto log_sensitivity = [&](size_t j) {
        return (std::log(path[j] / s0) - shift * dt * static_cast<double>(j)) / sigma;
    };

    const auto* asian = std::get_if<AsianPayoff>(&payoff);
    if (asian == nullptr) {
        return PathwiseTerms{path.back(), path.back() * log_sensitivity(n)};
    }

    if (asian->average == AverageType::Arithmetic) {
        double sum = 0.0;
        double d_sum = 0.0;
        for (size_t j = 1; j <= n; ++j) {
            sum += path[j];
            d_sum += path[j] * log_sensitivity(j);
        }
        return PathwiseTerms{sum / static_cast<double>(n), d_sum / static_cast<double>(n)};
    }

    double log_sum = 0.0;
    double d_log_sum = 0.0;
    for (size_t j = 1; j <= n; ++j) {
        log_sum += std::log(path[j]);
        d_log_sum += log_sensitivity(j);
    }
    double g = std::exp(log_sum / static_cast<double>(n));
    return PathwiseTerms{g, g * d_log_sum / static_cast<double>(n)};
}

bool in_the_money(double underlying, double strike, OptionType type) {
    return type == OptionType::CALL ? underlying > strike : underlying < strike;
}

}  // namespace

GreeksEstimator::GreeksEstimator(const MonteCarloEngine& engine, const GreeksConfig& config)
    : engine_(engine)
    , config_(config)
{}

std::expected<GreeksEstimator, ValidationError>
GreeksEstimator::create(const MonteCarloEngine& engine, const GreeksConfig& config) {
    auto engine_check = validate_simulation_config(engine.config());
    if (!engine_check) {
        return std::unexpected(engine_check.error());
    }
    auto config_check = validate_greeks_config(config);
    if (!config_check) {
        return std::unexpected(config_check.error());
    }
    return GreeksEstimator(engine, config);
}

std::expected<void, SimulationError>
GreeksEstimator::check_method(const PricingParams& params, const Payoff& payoff) const {
    auto incompatible = [&]() -> std::expected<void, SimulationError> {
        MCOPT_TRACE_RUNTIME_ERROR(MODULE_GREEKS,
            static_cast<int>(SimulationErrorCode::IncompatibleMethod),
            static_cast<int>(config_.method));
        return std::unexpected(SimulationError{
            SimulationErrorCode::IncompatibleMethod, 0, params.volatility, std::nullopt});
    };

    switch (config_.method) {
        case GreeksMethod::FiniteDifference:
            return {};
        case GreeksMethod::Pathwise:
            if (!std::holds_alternative<VanillaPayoff>(payoff) &&
                !std::holds_alternative<AsianPayoff>(payoff)) {
                return incompatible();
            }
            break;
        case GreeksMethod::LikelihoodRatio:
            if (is_path_dependent(payoff)) {
                return incompatible();
            }
            break;
    }

    // Both estimators divide by σ
    if (params.volatility <= 0.0) {
        return incompatible();
    }
    return {};
}

std::expected<GreeksResult, SimulationError>
GreeksEstimator::estimate(const PricingParams& params, const Payoff& payoff) const {
    auto config_check = validate_greeks_config(config_);
    if (!config_check) {
        return std::unexpected(make_simulation_error(
            SimulationErrorCode::InvalidConfiguration, config_check.error()));
    }

    auto params_check = validate_pricing_params(params);
    if (!params_check) {
        return std::unexpected(make_simulation_error(
            SimulationErrorCode::InvalidParameters, params_check.error()));
    }

    // Reject unsupported payoffs before any path is simulated
    auto method_check = check_method(params, payoff);
    if (!method_check) {
        return std::unexpected(method_check.error());
    }

    auto base = engine_.discounted_payoffs(params, payoff);
    if (!base) {
        return std::unexpected(base.error());
    }

    MCOPT_TRACE_GREEKS_START(static_cast<int>(config_.method), params.spot, params.volatility);

    auto reprice = [&](const PricingParams& bumped) {
        return engine_.discounted_payoffs(bumped, payoff);
    };

    GreeksResult result;
    result.method = config_.method;
    result.n_samples = base->size();
    result.price = combine({{&*base, 1.0}});

    // Rho: central in r
    const double h_r = config_.rate_bump_abs;
    PricingParams rate_up = params;
    PricingParams rate_down = params;
    rate_up.rate += h_r;
    rate_down.rate -= h_r;
    auto v_rate_up = reprice(rate_up);
    if (!v_rate_up) return std::unexpected(v_rate_up.error());
    auto v_rate_down = reprice(rate_down);
    if (!v_rate_down) return std::unexpected(v_rate_down.error());
    result.rho = combine({{&*v_rate_up, 0.5 / h_r}, {&*v_rate_down, -0.5 / h_r}});

    // Theta = -∂V/∂T: shorten maturity by h, or lengthen it when T <= h
    const double h_t = config_.time_bump_abs;
    PricingParams time_bumped = params;
    const bool shorten = params.maturity > h_t;
    time_bumped.maturity += shorten ? -h_t : h_t;
    auto v_time = reprice(time_bumped);
    if (!v_time) return std::unexpected(v_time.error());
    result.theta = shorten ? combine({{&*v_time, 1.0 / h_t}, {&*base, -1.0 / h_t}})
                           : combine({{&*base, 1.0 / h_t}, {&*v_time, -1.0 / h_t}});

    const double h_s = config_.spot_bump_rel * params.spot;
    PricingParams spot_up = params;
    PricingParams spot_down = params;
    spot_up.spot += h_s;
    spot_down.spot -= h_s;

    const double discount = std::exp(-params.rate * params.maturity);

    switch (config_.method) {
        case GreeksMethod::FiniteDifference: {
            auto v_up = reprice(spot_up);
            if (!v_up) return std::unexpected(v_up.error());
            auto v_down = reprice(spot_down);
            if (!v_down) return std::unexpected(v_down.error());
            result.delta = combine({{&*v_up, 0.5 / h_s}, {&*v_down, -0.5 / h_s}});
            result.gamma = combine({{&*v_up, 1.0 / (h_s * h_s)},
                                    {&*base, -2.0 / (h_s * h_s)},
                                    {&*v_down, 1.0 / (h_s * h_s)}});

            const double h_v = config_.vol_bump_abs;
            PricingParams vol_up = params;
            vol_up.volatility += h_v;
            auto v_vol_up = reprice(vol_up);
            if (!v_vol_up) return std::unexpected(v_vol_up.error());

            if (params.volatility >= h_v) {
                PricingParams vol_down = params;
                vol_down.volatility -= h_v;
                auto v_vol_down = reprice(vol_down);
                if (!v_vol_down) return std::unexpected(v_vol_down.error());
                result.vega = combine({{&*v_vol_up, 0.5 / h_v}, {&*v_vol_down, -0.5 / h_v}});
            } else {
                result.vega = combine({{&*v_vol_up, 1.0 / h_v}, {&*base, -1.0 / h_v}});
            }
            break;
        }

        case GreeksMethod::Pathwise: {
            const double sign = payoff_sign(params.type);
            const double strike = params.strike;
            const OptionType type = params.type;

            // d(payoff)/dS_0 = sign · 1{ITM} · underlying / S_0 (GBM is linear in S_0)
            auto delta_at = [&](const PricingParams& p) {
                return engine_.sample_functional(p,
                    [&payoff, p, sign, strike, type, discount](std::span<const double> path) {
                        PathwiseTerms terms = pathwise_terms(payoff, path, p);
                        if (!in_the_money(terms.underlying, strike, type)) return 0.0;
                        return discount * sign * terms.underlying / p.spot;
                    });
            };

            auto d = delta_at(params);
            if (!d) return std::unexpected(d.error());
            auto d_up = delta_at(spot_up);
            if (!d_up) return std::unexpected(d_up.error());
            auto d_down = delta_at(spot_down);
            if (!d_down) return std::unexpected(d_down.error());

            auto v = engine_.sample_functional(params,
                [&payoff, &params, sign, strike, type, discount](std::span<const double> path) {
                    PathwiseTerms terms = pathwise_terms(payoff, path, params);
                    if (!in_the_money(terms.underlying, strike, type)) return 0.0;
                    return discount * sign * terms.d_sigma;
                });
            if (!v) return std::unexpected(v.error());

            result.delta = combine({{&*d, 1.0}});
            result.gamma = combine({{&*d_up, 0.5 / h_s}, {&*d_down, -0.5 / h_s}});
            result.vega = combine({{&*v, 1.0}});
            break;
        }

        case GreeksMethod::LikelihoodRatio: {
            const double sigma = params.volatility;
            const double sqrt_t = std::sqrt(params.maturity);
            const double vol_sqrt_t = sigma * sqrt_t;
            const double drift = (params.rate - params.dividend_yield - 0.5 * sigma * sigma) *
                                 params.maturity;
            const double s0 = params.spot;

            // ζ: standardized log return of S_T
            auto weighted = [&](auto weight) {
                return engine_.sample_functional(params,
                    [&payoff, &params, weight, discount, drift, vol_sqrt_t, s0](
                        std::span<const double> path) {
                        double f = evaluate_payoff(payoff, path, params);
                        if (f == 0.0) return 0.0;
                        double zeta = (std::log(path.back() / s0) - drift) / vol_sqrt_t;
                        return discount * f * weight(zeta);
                    });
            };

            auto d = weighted([=](double zeta) { return zeta / (s0 * vol_sqrt_t); });
            if (!d) return std::unexpected(d.error());
            auto g = weighted([=](double zeta) {
                return (zeta * zeta - 1.0 - zeta * vol_sqrt_t) / (s0 * s0 * vol_sqrt_t * vol_sqrt_t);
            });
            if (!g) return std::unexpected(g.error());
            auto v = weighted([=](double zeta) {
                return (zeta * zeta - 1.0) / sigma - zeta * sqrt_t;
            });
            if (!v) return std::unexpected(v.error());

            result.delta = combine({{&*d, 1.0}});
            result.gamma = combine({{&*g, 1.0}});
            result.vega = combine({{&*v, 1.0}});
            break;
        }
    }

    MCOPT_TRACE_GREEKS_COMPLETE(static_cast<int>(config_.method), result.delta.value,
                                result.vega.value, result.n_samples);
    return result;
}

}  // namespace mcopt

// SPDX-License-Identifier: MIT
#include "src/option/black_scholes.hpp"
#include <algorithm>
#include <cmath>

namespace mcopt {

namespace {

struct GeometricMoments {
    double m;  // E[ln G]
    double v;  // Var[ln G]
};

GeometricMoments geometric_moments(const PricingParams& params, size_t n_steps) {
    double n = static_cast<double>(std::max<size_t>(n_steps, 1));
    double T = params.maturity;
    double sigma = params.volatility;
    double drift = params.rate - params.dividend_yield - 0.5 * sigma * sigma;
    double m = std::log(params.spot) + drift * T * (n + 1.0) / (2.0 * n);
    double v = sigma * sigma * T * (n + 1.0) * (2.0 * n + 1.0) / (6.0 * n * n);
    return {m, v};
}

}  // namespace

BlackScholesGreeks black_scholes_greeks(const PricingParams& params) {
    double tau = params.maturity;
    double sigma = params.volatility;
    double S = params.spot;
    double K = params.strike;
    double r = params.rate;
    double q = params.dividend_yield;

    BlackScholesGreeks g;
    g.price = bs_price(params);

    if (tau <= 0.0 || sigma <= 0.0) {
        // Edge case: discounted delta for ITM, 0 for OTM
        double exp_qt = std::exp(-q * tau);
        if (params.type == OptionType::PUT) {
            g.delta = (S * exp_qt < K * std::exp(-r * tau)) ? -exp_qt : 0.0;
        } else {
            g.delta = (S * exp_qt > K * std::exp(-r * tau)) ? exp_qt : 0.0;
        }
        return g;
    }

    double sqrt_tau = std::sqrt(tau);
    double d1 = bs_d1(S, K, tau, sigma, r, q);
    double d2 = d1 - sigma * sqrt_tau;
    double exp_qt = std::exp(-q * tau);
    double exp_rt = std::exp(-r * tau);

    g.gamma = exp_qt * norm_pdf(d1) / (S * sigma * sqrt_tau);
    g.vega = bs_vega(S, K, tau, sigma, r, q);

    // Common term: -S·e^(-qτ)·φ(d1)·σ/(2√τ)
    double common = -S * exp_qt * norm_pdf(d1) * sigma / (2.0 * sqrt_tau);

    if (params.type == OptionType::PUT) {
        g.delta = -exp_qt * norm_cdf(-d1);
        g.theta = common + r * K * exp_rt * norm_cdf(-d2) - q * S * exp_qt * norm_cdf(-d1);
        g.rho = -K * tau * exp_rt * norm_cdf(-d2);
    } else {
        g.delta = exp_qt * norm_cdf(d1);
        g.theta = common - r * K * exp_rt * norm_cdf(d2) + q * S * exp_qt * norm_cdf(d1);
        g.rho = K * tau * exp_rt * norm_cdf(d2);
    }

    return g;
}

double geometric_average_forward(const PricingParams& params, size_t n_steps) {
    auto [m, v] = geometric_moments(params, n_steps);
    return std::exp(m + 0.5 * v);
}

double geometric_asian_price(const PricingParams& params, size_t n_steps) {
    auto [m, v] = geometric_moments(params, n_steps);
    double K = params.strike;
    double discount = std::exp(-params.rate * params.maturity);
    double forward = std::exp(m + 0.5 * v);

    if (v <= 0.0) {
        return discount * intrinsic_value(forward, K, params.type);
    }

    double sqrt_v = std::sqrt(v);
    double d1 = (m - std::log(K) + v) / sqrt_v;
    double d2 = d1 - sqrt_v;

    if (params.type == OptionType::PUT) {
        return discount * (K * norm_cdf(-d2) - forward * norm_cdf(-d1));
    }
    return discount * (forward * norm_cdf(d1) - K * norm_cdf(d2));
}

}  // namespace mcopt

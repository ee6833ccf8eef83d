// SPDX-License-Identifier: MIT
/**
 * @file black_scholes.hpp
 * @brief Closed-form Black-Scholes-Merton prices and Greeks
 *
 * Reference values for the Monte Carlo engine: control variate means,
 * analytical Greeks to validate simulated estimators against, and the
 * discretely monitored geometric-average Asian option.
 */

#pragma once

#include <cmath>
#include <cstddef>

#include "src/math/normal_distribution.hpp"
#include "src/option/option_spec.hpp"

namespace mcopt {

/// Black-Scholes d1 = [ln(S/K) + (r - q + σ²/2)τ] / (σ√τ)
inline double bs_d1(double spot, double strike, double tau, double sigma, double rate,
                    double dividend_yield = 0.0) {
    double sigma_sqrt_tau = sigma * std::sqrt(tau);
    return (std::log(spot / strike) + (rate - dividend_yield + 0.5 * sigma * sigma) * tau) /
           sigma_sqrt_tau;
}

/// Black-Scholes Vega: ∂V/∂σ = S · e^(-qτ) · √τ · φ(d1)
/// Same for puts and calls
inline double bs_vega(double spot, double strike, double tau, double sigma, double rate,
                      double dividend_yield = 0.0) {
    if (tau <= 0.0 || sigma <= 0.0) {
        return 0.0;
    }
    double d1 = bs_d1(spot, strike, tau, sigma, rate, dividend_yield);
    return spot * std::exp(-dividend_yield * tau) * std::sqrt(tau) * norm_pdf(d1);
}

/// Black-Scholes European option price
///
/// @param spot Current underlying price
/// @param strike Strike price
/// @param tau Time to expiry in years
/// @param sigma Volatility
/// @param rate Risk-free rate
/// @param dividend_yield Continuous dividend yield
/// @param option_type PUT or CALL
/// @return European option price
inline double bs_price(double spot, double strike, double tau, double sigma, double rate,
                       double dividend_yield, OptionType option_type) {
    // Edge cases: zero maturity or zero vol -> intrinsic value
    if (tau <= 0.0 || sigma <= 0.0) {
        if (tau <= 0.0) {
            return intrinsic_value(spot, strike, option_type);
        }
        // Zero vol, positive maturity: discounted intrinsic
        double S_fwd = spot * std::exp(-dividend_yield * tau);
        double K_disc = strike * std::exp(-rate * tau);
        return intrinsic_value(S_fwd, K_disc, option_type);
    }

    double d1 = bs_d1(spot, strike, tau, sigma, rate, dividend_yield);
    double d2 = d1 - sigma * std::sqrt(tau);
    double exp_qt = std::exp(-dividend_yield * tau);
    double exp_rt = std::exp(-rate * tau);

    if (option_type == OptionType::PUT) {
        return strike * exp_rt * norm_cdf(-d2) - spot * exp_qt * norm_cdf(-d1);
    } else {
        return spot * exp_qt * norm_cdf(d1) - strike * exp_rt * norm_cdf(d2);
    }
}

inline double bs_price(const PricingParams& params) {
    return bs_price(params.spot, params.strike, params.maturity, params.volatility,
                    params.rate, params.dividend_yield, params.type);
}

/// Price and first/second order sensitivities of a European option
struct BlackScholesGreeks {
    double price = 0.0;
    double delta = 0.0;   ///< ∂V/∂S
    double gamma = 0.0;   ///< ∂²V/∂S²
    double vega = 0.0;    ///< ∂V/∂σ
    double theta = 0.0;   ///< ∂V/∂t, per year (typically negative)
    double rho = 0.0;     ///< ∂V/∂r
};

/// Closed-form price and Greeks of a European option
BlackScholesGreeks black_scholes_greeks(const PricingParams& params);

/// Discretely monitored geometric-average Asian option
///
/// The average runs over S(t_j), t_j = jT/n for j = 1..n (spot excluded),
/// matching the arithmetic AsianPayoff convention. ln G is normal with
///   m = ln S + (r - q - σ²/2) T (n+1)/(2n)
///   v = σ² T (n+1)(2n+1)/(6n²)
///
/// @param params Pricing parameters
/// @param n_steps Number of monitoring dates (>= 1)
/// @return Discounted option value
double geometric_asian_price(const PricingParams& params, size_t n_steps);

/// Expected geometric average E[G] under the same monitoring convention
double geometric_average_forward(const PricingParams& params, size_t n_steps);

}  // namespace mcopt

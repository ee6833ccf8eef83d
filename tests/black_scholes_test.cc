// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/option/black_scholes.hpp"
#include <cmath>

namespace mcopt {
namespace {

TEST(BlackScholesTest, AtmCallAndPut) {
    // S=K=100, τ=1, σ=0.20, r=0.05
    EXPECT_NEAR(bs_price(100.0, 100.0, 1.0, 0.20, 0.05, 0.0, OptionType::CALL), 10.4506, 1e-4);
    EXPECT_NEAR(bs_price(100.0, 100.0, 1.0, 0.20, 0.05, 0.0, OptionType::PUT), 5.5735, 1e-4);
}

TEST(BlackScholesTest, OtmCall) {
    PricingParams params(100.0, 105.0, 1.0, 0.05, 0.0, OptionType::CALL, 0.20);
    EXPECT_NEAR(bs_price(params), 8.0214, 1e-4);
}

TEST(BlackScholesTest, PutCallParityWithDividend) {
    double S = 100.0, K = 110.0, T = 0.5, r = 0.03, q = 0.02, sigma = 0.25;
    double call = bs_price(S, K, T, sigma, r, q, OptionType::CALL);
    double put = bs_price(S, K, T, sigma, r, q, OptionType::PUT);
    EXPECT_NEAR(call - put, S * std::exp(-q * T) - K * std::exp(-r * T), 1e-10);
    EXPECT_NEAR(put, 12.9109, 1e-4);
}

TEST(BlackScholesTest, ZeroVolatilityIsDiscountedForwardIntrinsic) {
    double price = bs_price(100.0, 100.0, 1.0, 0.0, 0.05, 0.0, OptionType::CALL);
    EXPECT_NEAR(price, 100.0 - 100.0 * std::exp(-0.05), 1e-12);
}

TEST(BlackScholesTest, VegaATM) {
    // N'(0.35) · 100 ≈ 37.52
    EXPECT_NEAR(bs_vega(100.0, 100.0, 1.0, 0.20, 0.05), 37.524, 1e-3);
}

TEST(BlackScholesTest, GreeksAtmCall) {
    PricingParams params(100.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, 0.20);
    auto g = black_scholes_greeks(params);
    EXPECT_NEAR(g.price, 10.4506, 1e-4);
    EXPECT_NEAR(g.delta, 0.63683, 1e-5);
    EXPECT_NEAR(g.gamma, 0.018762, 1e-6);
    EXPECT_NEAR(g.vega, 37.524, 1e-3);
    EXPECT_NEAR(g.theta, -6.4140, 1e-4);
    EXPECT_NEAR(g.rho, 53.2325, 1e-4);
}

TEST(BlackScholesTest, GreeksAtmPut) {
    PricingParams params(100.0, 100.0, 1.0, 0.05, 0.0, OptionType::PUT, 0.20);
    auto g = black_scholes_greeks(params);
    EXPECT_NEAR(g.delta, -0.36317, 1e-5);
    EXPECT_NEAR(g.gamma, 0.018762, 1e-6);
    EXPECT_NEAR(g.theta, -1.6579, 1e-4);
    EXPECT_NEAR(g.rho, -41.8905, 1e-4);
}

TEST(BlackScholesTest, DeltaMatchesFiniteDifference) {
    PricingParams params(100.0, 110.0, 0.5, 0.03, 0.02, OptionType::PUT, 0.25);
    auto g = black_scholes_greeks(params);

    double h = 1e-4;
    PricingParams up = params;
    PricingParams down = params;
    up.spot += h;
    down.spot -= h;
    EXPECT_NEAR(g.delta, (bs_price(up) - bs_price(down)) / (2.0 * h), 1e-6);
    EXPECT_NEAR(g.delta, -0.65706, 1e-5);
}

TEST(GeometricAsianTest, SingleMonitoringDateIsEuropean) {
    PricingParams params(100.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, 0.20);
    EXPECT_NEAR(geometric_asian_price(params, 1), bs_price(params), 1e-10);
}

TEST(GeometricAsianTest, MonthlyMonitoring) {
    PricingParams params(100.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, 0.20);
    EXPECT_NEAR(geometric_asian_price(params, 12), 5.9402, 1e-4);
    EXPECT_NEAR(geometric_average_forward(params, 12), 102.4058, 1e-4);
}

TEST(GeometricAsianTest, CheaperThanEuropean) {
    PricingParams params(100.0, 100.0, 1.0, 0.05, 0.0, OptionType::CALL, 0.20);
    EXPECT_LT(geometric_asian_price(params, 252), bs_price(params));
    EXPECT_NEAR(geometric_asian_price(params, 252), 5.5655, 1e-4);
}

TEST(GeometricAsianTest, PutCallParity) {
    PricingParams call(100.0, 95.0, 1.0, 0.04, 0.01, OptionType::CALL, 0.30);
    PricingParams put = call;
    put.type = OptionType::PUT;
    double forward = geometric_average_forward(call, 50);
    EXPECT_NEAR(geometric_asian_price(call, 50) - geometric_asian_price(put, 50),
                std::exp(-0.04) * (forward - 95.0), 1e-10);
}

}  // namespace
}  // namespace mcopt

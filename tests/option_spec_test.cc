// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/option/option_spec.hpp"
#include <cmath>
#include <limits>

namespace mcopt {
namespace {

PricingParams make_params() {
    return PricingParams(100.0, 105.0, 1.0, 0.05, 0.0, OptionType::CALL, 0.20);
}

TEST(OptionSpecTest, ValidParamsAccepted) {
    EXPECT_TRUE(validate_pricing_params(make_params()).has_value());
}

TEST(OptionSpecTest, DefaultsAreCallWithZeroYield) {
    OptionSpec spec;
    EXPECT_EQ(spec.type, OptionType::CALL);
    EXPECT_DOUBLE_EQ(spec.dividend_yield, 0.0);
}

TEST(OptionSpecTest, ConstructFromSpec) {
    OptionSpec spec{.spot = 90.0, .strike = 100.0, .maturity = 0.5, .rate = 0.01,
                    .dividend_yield = 0.02, .type = OptionType::PUT};
    PricingParams params(spec, 0.3);
    EXPECT_DOUBLE_EQ(params.spot, 90.0);
    EXPECT_DOUBLE_EQ(params.dividend_yield, 0.02);
    EXPECT_EQ(params.type, OptionType::PUT);
    EXPECT_DOUBLE_EQ(params.volatility, 0.3);
}

TEST(OptionSpecTest, RejectsNonPositiveSpot) {
    auto params = make_params();
    params.spot = 0.0;
    auto result = validate_pricing_params(params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidSpotPrice);
}

TEST(OptionSpecTest, RejectsNonPositiveStrike) {
    auto params = make_params();
    params.strike = -1.0;
    auto result = validate_pricing_params(params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidStrike);
    EXPECT_DOUBLE_EQ(result.error().value, -1.0);
}

TEST(OptionSpecTest, RejectsZeroMaturity) {
    auto params = make_params();
    params.maturity = 0.0;
    auto result = validate_pricing_params(params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidMaturity);
}

TEST(OptionSpecTest, NegativeRateAllowed) {
    auto params = make_params();
    params.rate = -0.01;
    EXPECT_TRUE(validate_pricing_params(params).has_value());
}

TEST(OptionSpecTest, RejectsNonFiniteRate) {
    auto params = make_params();
    params.rate = std::numeric_limits<double>::quiet_NaN();
    auto result = validate_pricing_params(params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidRate);
}

TEST(OptionSpecTest, RejectsNegativeDividend) {
    auto params = make_params();
    params.dividend_yield = -0.01;
    auto result = validate_pricing_params(params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidDividend);
}

TEST(OptionSpecTest, ZeroVolatilityAllowed) {
    auto params = make_params();
    params.volatility = 0.0;
    EXPECT_TRUE(validate_pricing_params(params).has_value());
}

TEST(OptionSpecTest, RejectsNegativeVolatility) {
    auto params = make_params();
    params.volatility = -0.2;
    auto result = validate_pricing_params(params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::InvalidVolatility);
}

TEST(OptionSpecTest, RejectsInfiniteVolatility) {
    auto params = make_params();
    params.volatility = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(validate_pricing_params(params).has_value());
}

TEST(OptionSpecTest, IntrinsicValue) {
    EXPECT_DOUBLE_EQ(intrinsic_value(110.0, 100.0, OptionType::CALL), 10.0);
    EXPECT_DOUBLE_EQ(intrinsic_value(90.0, 100.0, OptionType::CALL), 0.0);
    EXPECT_DOUBLE_EQ(intrinsic_value(90.0, 100.0, OptionType::PUT), 10.0);
    EXPECT_DOUBLE_EQ(intrinsic_value(110.0, 100.0, OptionType::PUT), 0.0);
}

}  // namespace
}  // namespace mcopt

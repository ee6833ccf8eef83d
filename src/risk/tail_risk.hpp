// SPDX-License-Identifier: MIT
/**
 * @file tail_risk.hpp
 * @brief Value at Risk and Expected Shortfall from simulated P&L
 */

#pragma once

#include <cstddef>
#include <expected>
#include <span>

#include "src/support/error_types.hpp"

namespace mcopt {

/// Tail-loss metrics of a P&L distribution (losses reported as positive numbers)
struct TailRiskMetrics {
    double confidence_level = 0.0;
    double value_at_risk = 0.0;       ///< -quantile_{1-α}(P&L)
    double expected_shortfall = 0.0;  ///< -E[P&L | P&L in the worst (1-α) tail]
    double mean_pnl = 0.0;
    size_t n_samples = 0;
};

/**
 * @brief Historical-simulation VaR and ES of a P&L sample
 *
 * With the P&L sorted ascending and m = max(1, ceil((1 - α)·n)) tail
 * samples, VaR = -pnl[m-1] and ES = -mean(pnl[0..m)). ES >= VaR always.
 *
 * @param pnl P&L samples (gains positive); order does not matter
 * @param confidence_level α in (0, 1), e.g. 0.99
 * @return Metrics, or ValidationError for an empty sample, a non-finite
 *         sample or α outside (0, 1)
 */
std::expected<TailRiskMetrics, ValidationError>
compute_tail_risk(std::span<const double> pnl, double confidence_level);

}  // namespace mcopt

// SPDX-License-Identifier: MIT
#include "src/risk/tail_risk.hpp"
#include "src/support/mcopt_trace.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace mcopt {

std::expected<TailRiskMetrics, ValidationError>
compute_tail_risk(std::span<const double> pnl, double confidence_level) {
    if (pnl.empty()) {
        MCOPT_TRACE_VALIDATION_ERROR(MODULE_TAIL_RISK,
            static_cast<int>(ValidationErrorCode::EmptySample), 0.0, 0);
        return std::unexpected(ValidationError(ValidationErrorCode::EmptySample));
    }
    if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
        MCOPT_TRACE_VALIDATION_ERROR(MODULE_TAIL_RISK,
            static_cast<int>(ValidationErrorCode::InvalidConfidenceLevel), confidence_level, 0);
        return std::unexpected(ValidationError(
            ValidationErrorCode::InvalidConfidenceLevel, confidence_level));
    }

    // NaN has no place in a strict weak ordering
    for (size_t i = 0; i < pnl.size(); ++i) {
        if (!std::isfinite(pnl[i])) {
            MCOPT_TRACE_VALIDATION_ERROR(MODULE_TAIL_RISK,
                static_cast<int>(ValidationErrorCode::NonFiniteSample), pnl[i], i);
            return std::unexpected(ValidationError(
                ValidationErrorCode::NonFiniteSample, pnl[i], i));
        }
    }

    const size_t n = pnl.size();
    // 1 - 0.95 is not exact in binary; the slack keeps ceil(5.0000000000000044) at 5
    double tail = (1.0 - confidence_level) * static_cast<double>(n);
    size_t m = static_cast<size_t>(std::ceil(tail - 1e-9));
    m = std::clamp<size_t>(m, 1, n);

    // Only the m smallest values need to be ordered
    std::vector<double> sorted(pnl.begin(), pnl.end());
    std::partial_sort(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(m), sorted.end());

    double tail_sum = std::accumulate(sorted.begin(),
                                      sorted.begin() + static_cast<std::ptrdiff_t>(m), 0.0);
    double total = std::accumulate(pnl.begin(), pnl.end(), 0.0);

    TailRiskMetrics metrics;
    metrics.confidence_level = confidence_level;
    metrics.value_at_risk = -sorted[m - 1];
    metrics.expected_shortfall = -tail_sum / static_cast<double>(m);
    metrics.mean_pnl = total / static_cast<double>(n);
    metrics.n_samples = n;

    MCOPT_TRACE_TAIL_RISK_COMPLETE(n, confidence_level, metrics.value_at_risk,
                                   metrics.expected_shortfall);
    return metrics;
}

}  // namespace mcopt

// SPDX-License-Identifier: MIT
#pragma once

#include <cmath>
#include <limits>

namespace mcopt {

/// Standard normal PDF: φ(x) = exp(-x²/2) / sqrt(2π)
inline double norm_pdf(double x) {
    static constexpr double kInvSqrt2Pi = 0.3989422804014327;  // 1/sqrt(2π)
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

/// Standard normal CDF: Φ(x)
inline double norm_cdf(double x) {
    // Use erfc for numerical stability in the lower tail
    return 0.5 * std::erfc(-x * M_SQRT1_2);
}

/// Inverse standard normal CDF: Φ⁻¹(p)
///
/// Acklam's rational approximation (relative error 1.15e-9) followed by
/// one Halley step against norm_cdf, which brings the result to near
/// machine precision.
///
/// @param p Probability in [0, 1]
/// @return -inf at 0, +inf at 1, NaN outside [0, 1]
inline double inverse_norm_cdf(double p) {
    if (!(p >= 0.0 && p <= 1.0)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (p == 0.0) return -std::numeric_limits<double>::infinity();
    if (p == 1.0) return std::numeric_limits<double>::infinity();

    static constexpr double a[] = {-3.969683028665376e+01, 2.209460984245205e+02,
                                   -2.759285104469687e+02, 1.383577518672690e+02,
                                   -3.066479806614716e+01, 2.506628277459239e+00};
    static constexpr double b[] = {-5.447609879822406e+01, 1.615858368580409e+02,
                                   -1.556989798598866e+02, 6.680131188771972e+01,
                                   -1.328068155288572e+01};
    static constexpr double c[] = {-7.784894002430293e-03, -3.223964580411365e-01,
                                   -2.400758277161838e+00, -2.549732539343734e+00,
                                   4.374664141464968e+00, 2.938163982698783e+00};
    static constexpr double d[] = {7.784695709041462e-03, 3.224671290700398e-01,
                                   2.445134137142996e+00, 3.754408661907416e+00};
    static constexpr double kLow = 0.02425;
    static constexpr double kHigh = 1.0 - kLow;

    double x;
    if (p < kLow) {
        double q = std::sqrt(-2.0 * std::log(p));
        x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    } else if (p <= kHigh) {
        double q = p - 0.5;
        double r = q * q;
        x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
            (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
    } else {
        double q = std::sqrt(-2.0 * std::log1p(-p));
        x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }

    // Halley refinement
    static constexpr double kSqrt2Pi = 2.5066282746310002;
    double e = norm_cdf(x) - p;
    double u = e * kSqrt2Pi * std::exp(0.5 * x * x);
    x = x - u / (1.0 + 0.5 * x * u);

    return x;
}

/// Two-sided critical value z such that P(|Z| <= z) = confidence_level
inline double two_sided_z(double confidence_level) {
    return inverse_norm_cdf(0.5 + 0.5 * confidence_level);
}

}  // namespace mcopt

// SPDX-License-Identifier: MIT
/**
 * @file running_stats.hpp
 * @brief Streaming mean/variance accumulators and confidence intervals
 *
 * Welford's update for single samples, Chan et al.'s pairwise formula for
 * merging partial results. Merging is order-sensitive in floating point, so
 * callers that need reproducible output merge partial results in a fixed
 * order.
 */

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "src/math/normal_distribution.hpp"

namespace mcopt {

/// Univariate running mean and variance
class RunningStats {
public:
    void add(double x) {
        ++n_;
        double delta = x - mean_;
        mean_ += delta / static_cast<double>(n_);
        m2_ += delta * (x - mean_);
    }

    void merge(const RunningStats& other) {
        if (other.n_ == 0) return;
        if (n_ == 0) {
            *this = other;
            return;
        }
        double n_a = static_cast<double>(n_);
        double n_b = static_cast<double>(other.n_);
        double n = n_a + n_b;
        double delta = other.mean_ - mean_;
        mean_ += delta * n_b / n;
        m2_ += other.m2_ + delta * delta * n_a * n_b / n;
        n_ += other.n_;
    }

    size_t count() const { return n_; }
    double mean() const { return mean_; }

    /// Unbiased sample variance (0 for fewer than two samples)
    double variance() const {
        return n_ > 1 ? m2_ / static_cast<double>(n_ - 1) : 0.0;
    }

    double stddev() const { return std::sqrt(variance()); }

    /// Standard error of the mean
    double std_error() const {
        return n_ > 0 ? std::sqrt(variance() / static_cast<double>(n_)) : 0.0;
    }

private:
    size_t n_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
};

/// Bivariate running statistics (Y, C) with covariance, for control variates
class PairedStats {
public:
    void add(double y, double c) {
        ++n_;
        double n = static_cast<double>(n_);
        double dy = y - mean_y_;
        double dc = c - mean_c_;
        mean_y_ += dy / n;
        mean_c_ += dc / n;
        m2_y_ += dy * (y - mean_y_);
        m2_c_ += dc * (c - mean_c_);
        c_yc_ += dy * (c - mean_c_);
    }

    void merge(const PairedStats& other) {
        if (other.n_ == 0) return;
        if (n_ == 0) {
            *this = other;
            return;
        }
        double n_a = static_cast<double>(n_);
        double n_b = static_cast<double>(other.n_);
        double n = n_a + n_b;
        double dy = other.mean_y_ - mean_y_;
        double dc = other.mean_c_ - mean_c_;
        double w = n_a * n_b / n;
        mean_y_ += dy * n_b / n;
        mean_c_ += dc * n_b / n;
        m2_y_ += other.m2_y_ + dy * dy * w;
        m2_c_ += other.m2_c_ + dc * dc * w;
        c_yc_ += other.c_yc_ + dy * dc * w;
        n_ += other.n_;
    }

    size_t count() const { return n_; }
    double mean_y() const { return mean_y_; }
    double mean_c() const { return mean_c_; }

    double variance_y() const { return n_ > 1 ? m2_y_ / static_cast<double>(n_ - 1) : 0.0; }
    double variance_c() const { return n_ > 1 ? m2_c_ / static_cast<double>(n_ - 1) : 0.0; }
    double covariance() const { return n_ > 1 ? c_yc_ / static_cast<double>(n_ - 1) : 0.0; }

    /// Optimal control coefficient β = Cov(Y, C) / Var(C); 0 for a constant control
    double beta() const {
        double var_c = variance_c();
        return var_c > 0.0 ? covariance() / var_c : 0.0;
    }

    /// Variance of Y - β(C - μ_C) at the estimated β
    double adjusted_variance() const {
        double var_c = variance_c();
        if (var_c <= 0.0) return variance_y();
        double cov = covariance();
        return std::max(variance_y() - cov * cov / var_c, 0.0);
    }

    /// Control-variate estimate of E[Y] given the known mean of C
    double adjusted_mean(double control_mean) const {
        return mean_y_ - beta() * (mean_c_ - control_mean);
    }

private:
    size_t n_ = 0;
    double mean_y_ = 0.0;
    double mean_c_ = 0.0;
    double m2_y_ = 0.0;
    double m2_c_ = 0.0;
    double c_yc_ = 0.0;
};

/// Point estimate with symmetric normal confidence interval
struct Estimate {
    double mean = 0.0;
    double std_error = 0.0;
    double ci_lower = 0.0;
    double ci_upper = 0.0;
};

/// Build an Estimate from a mean, a sample variance and a sample count
inline Estimate make_estimate(double mean, double variance, size_t n,
                              double confidence_level) {
    double se = n > 0 ? std::sqrt(variance / static_cast<double>(n)) : 0.0;
    double half_width = two_sided_z(confidence_level) * se;
    return Estimate{mean, se, mean - half_width, mean + half_width};
}

inline Estimate make_estimate(const RunningStats& stats, double confidence_level) {
    return make_estimate(stats.mean(), stats.variance(), stats.count(), confidence_level);
}

}  // namespace mcopt

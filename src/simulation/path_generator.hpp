// SPDX-License-Identifier: MIT
/**
 * @file path_generator.hpp
 * @brief Geometric Brownian motion paths under the risk-neutral measure
 */

#pragma once

#include <cstddef>
#include <span>

#include "src/option/option_spec.hpp"

namespace mcopt {

/**
 * @brief Exact log-Euler GBM path builder
 *
 * S_{t+dt} = S_t · exp((r - q - σ²/2)dt + σ√dt·Z) with dt = T / n_steps.
 * The scheme is exact at every grid point, so the number of steps only
 * affects path-dependent payoffs.
 *
 * Thread-safety: All methods are const and thread-safe.
 */
class GbmPathGenerator {
public:
    GbmPathGenerator(const PricingParams& params, size_t n_steps);

    /// Build one path from n_steps standard normals
    ///
    /// @param normals n_steps standard normal draws
    /// @param path Output of size n_steps + 1, path[0] = spot
    /// @param sign +1 for the path itself, -1 for its antithetic mirror
    void generate(std::span<const double> normals, std::span<double> path,
                  double sign = 1.0) const;

    size_t n_steps() const { return n_steps_; }
    double dt() const { return dt_; }
    double spot() const { return spot_; }

    /// Time of grid point j (j = 0..n_steps)
    double time_at(size_t j) const { return static_cast<double>(j) * dt_; }

private:
    double spot_;
    double log_spot_;
    double dt_;
    double drift_;      ///< (r - q - σ²/2)·dt
    double diffusion_;  ///< σ·√dt
    size_t n_steps_;
};

}  // namespace mcopt

// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <random>
#include <span>
#include <vector>

#include "src/math/normal_distribution.hpp"

namespace mcopt {

/// Fill a row-major [n_samples x n_dims] span with Latin Hypercube samples in [0,1)
///
/// Latin Hypercube ensures each dimension has exactly one sample per
/// stratum (bin), providing better space coverage than random sampling.
/// Strata are paired across dimensions by independent random permutations.
///
/// @param n_samples Number of samples (rows)
/// @param n_dims Number of dimensions (columns)
/// @param rng Uniform random bit generator, advanced in place
/// @param out Output span of size n_samples * n_dims
template <typename URBG>
void latin_hypercube_uniform(size_t n_samples, size_t n_dims, URBG& rng,
                             std::span<double> out) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    std::vector<size_t> indices(n_samples);
    const double stratum_width = 1.0 / static_cast<double>(n_samples);

    for (size_t d = 0; d < n_dims; ++d) {
        std::iota(indices.begin(), indices.end(), size_t{0});
        std::shuffle(indices.begin(), indices.end(), rng);

        for (size_t i = 0; i < n_samples; ++i) {
            double stratum_start = static_cast<double>(indices[i]) * stratum_width;
            out[i * n_dims + d] = stratum_start + uniform(rng) * stratum_width;
        }
    }
}

/// Latin Hypercube standard normals: stratified uniforms mapped through Φ⁻¹
///
/// Uniforms are clamped into the open interval (0, 1) so every output is finite.
template <typename URBG>
void latin_hypercube_normals(size_t n_samples, size_t n_dims, URBG& rng,
                             std::span<double> out) {
    latin_hypercube_uniform(n_samples, n_dims, rng, out);

    constexpr double kLower = std::numeric_limits<double>::min();
    const double upper = std::nextafter(1.0, 0.0);
    for (size_t i = 0; i < n_samples * n_dims; ++i) {
        out[i] = inverse_norm_cdf(std::clamp(out[i], kLower, upper));
    }
}

}  // namespace mcopt

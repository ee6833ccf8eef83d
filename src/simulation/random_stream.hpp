// SPDX-License-Identifier: MIT
/**
 * @file random_stream.hpp
 * @brief Block-partitioned normal variates for path simulation
 *
 * Statistical units are grouped into blocks of kPathBlockSize. Every block
 * owns an independent std::mt19937_64 seeded from (seed, block index), so a
 * block produces the same numbers no matter which thread runs it or how
 * many blocks run before it.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>

#include "src/math/latin_hypercube.hpp"

namespace mcopt {

/// Statistical units (paths, or antithetic pairs) per random stream block
inline constexpr size_t kPathBlockSize = 1024;

/// How standard normals are drawn inside a block
enum class SamplingScheme {
    PseudoRandom,    ///< i.i.d. draws
    LatinHypercube   ///< one draw per stratum in every time-step dimension
};

/// SplitMix64 finalizer: decorrelates nearby integer seeds
inline uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

/// Seed of the engine that serves block `block_index`
inline uint64_t derive_block_seed(uint64_t seed, uint64_t block_index) {
    return splitmix64(splitmix64(seed) ^ splitmix64(block_index + 1));
}

/// Fill a row-major [n_units x n_dims] span with standard normals for one block
///
/// @param scheme Sampling scheme
/// @param seed Run seed
/// @param block_index Block whose stream to use
/// @param n_units Units in this block (<= kPathBlockSize)
/// @param n_dims Normals per unit (time steps)
/// @param out Output span of size n_units * n_dims
inline void fill_block_normals(SamplingScheme scheme, uint64_t seed, size_t block_index,
                               size_t n_units, size_t n_dims, std::span<double> out) {
    std::mt19937_64 rng(derive_block_seed(seed, block_index));

    if (scheme == SamplingScheme::LatinHypercube) {
        latin_hypercube_normals(n_units, n_dims, rng, out);
        return;
    }

    std::normal_distribution<double> normal(0.0, 1.0);
    for (size_t i = 0; i < n_units * n_dims; ++i) {
        out[i] = normal(rng);
    }
}

}  // namespace mcopt

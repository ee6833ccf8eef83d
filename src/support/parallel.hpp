// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macros for OpenMP and sequential execution
 *
 * Path blocks are the unit of parallel work. Every block owns its random
 * stream, so the macros below only decide who runs a block, never what it
 * draws.
 *
 * Usage:
 *   MCOPT_PRAGMA_PARALLEL_FOR_DYNAMIC
 *   for (size_t b = 0; b < n_blocks; ++b) { ... }
 */

#if defined(_OPENMP)
    #include <omp.h>
    #define MCOPT_PRAGMA_PARALLEL_FOR_DYNAMIC           _Pragma("omp parallel for schedule(dynamic, 1)")
#else
    // Sequential execution (no parallelization)
    #define MCOPT_PRAGMA_PARALLEL_FOR_DYNAMIC
#endif

/**
 * Design notes:
 *
 * 1. OpenMP: `omp parallel for schedule(dynamic, 1)` hands out whole path
 *    blocks. Blocks are uniform in cost, but the last block of a batch may
 *    be short.
 *
 * 2. Sequential: No-op for debugging or environments without OpenMP.
 *
 * 3. _Pragma is used instead of #pragma so the pragmas can live in macros.
 */

// SPDX-License-Identifier: MIT
/**
 * @file mcopt_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the mcopt library
 *
 * This header provides zero-overhead tracing points that can be dynamically
 * enabled at runtime using tools like bpftrace, systemtap, or perf.
 *
 * When tracing is disabled (default), probes compile to single NOP instructions.
 * When enabled via tracing tools, probes capture structured data without
 * modifying the library binary.
 *
 * Example usage with bpftrace:
 *   # Watch batch convergence of every pricing run
 *   sudo bpftrace -e 'usdt:./libmcopt.so:mcopt:mc_batch { printf("%d %f\n", arg1, arg3); }'
 *
 *   # Catch rejected inputs across all modules
 *   sudo bpftrace -e 'usdt:./libmcopt.so:mcopt:validation_error { ... }'
 */

#ifndef MCOPT_TRACE_H
#define MCOPT_TRACE_H

#include <stddef.h>

/**
 * USDT Configuration
 *
 * On Linux with systemtap-sdt-dev installed, use sys/sdt.h
 * Otherwise, define no-op macros for compatibility
 */
#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
// Fallback: define empty macros when SDT is not available
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all mcopt library probes
 */
#define MCOPT_PROVIDER mcopt

/**
 * Module identifiers for multi-module tracing
 * These are passed as the first parameter to many probes
 */
#define MODULE_PATH_GENERATOR   1
#define MODULE_MC_ENGINE        2
#define MODULE_GREEKS           3
#define MODULE_TAIL_RISK        4
#define MODULE_VALIDATION       5

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (MODULE_* constant)
 * @param param1: Module-specific parameter (e.g., n_simulations)
 * @param param2: Module-specific parameter (e.g., n_steps)
 * @param param3: Module-specific parameter (e.g., seed)
 */
#define MCOPT_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(MCOPT_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: Module identifier
 * @param work: Units of work completed (e.g., paths simulated)
 * @param final_metric: Final metric value (e.g., price estimate)
 */
#define MCOPT_TRACE_ALGO_COMPLETE(module_id, work, final_metric) \
    DTRACE_PROBE3(MCOPT_PROVIDER, algo_complete, module_id, work, final_metric)

/**
 * ============================================================================
 * Validation and Error Probes
 * ============================================================================
 */

/**
 * Fired when input validation fails
 * @param module_id: Module identifier
 * @param error_code: ValidationErrorCode as int
 * @param param1: Offending value
 * @param param2: Index or threshold (0 if not applicable)
 */
#define MCOPT_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(MCOPT_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * Fired when a runtime error occurs
 * @param module_id: Module identifier
 * @param error_code: SimulationErrorCode as int
 * @param context: Context value (e.g., sample index)
 */
#define MCOPT_TRACE_RUNTIME_ERROR(module_id, error_code, context) \
    DTRACE_PROBE3(MCOPT_PROVIDER, runtime_error, module_id, error_code, context)

/**
 * ============================================================================
 * Monte Carlo Engine Probes
 * ============================================================================
 */

/**
 * Fired after every batch of paths
 * @param batch: Batch index (0-based)
 * @param n_paths: Cumulative paths simulated
 * @param estimate: Current price estimate
 * @param std_error: Current standard error
 */
#define MCOPT_TRACE_MC_BATCH(batch, n_paths, estimate, std_error) \
    DTRACE_PROBE4(MCOPT_PROVIDER, mc_batch, batch, n_paths, estimate, std_error)

/**
 * Fired when the standard error target is met before the path budget
 * @param n_paths: Paths simulated when stopping
 * @param std_error: Standard error reached
 * @param target: Configured target
 */
#define MCOPT_TRACE_MC_EARLY_STOP(n_paths, std_error, target) \
    DTRACE_PROBE3(MCOPT_PROVIDER, mc_early_stop, n_paths, std_error, target)

/**
 * Fired once the control variate coefficient is estimated
 * @param kind: ControlVariate as int
 * @param beta: Estimated coefficient
 * @param variance_ratio: Plain variance over adjusted variance
 */
#define MCOPT_TRACE_MC_CONTROL_VARIATE(kind, beta, variance_ratio) \
    DTRACE_PROBE3(MCOPT_PROVIDER, mc_control_variate, kind, beta, variance_ratio)

/**
 * ============================================================================
 * Greeks Probes
 * ============================================================================
 */

/**
 * @param method: GreeksMethod as int
 * @param spot: Spot price
 * @param volatility: Volatility
 */
#define MCOPT_TRACE_GREEKS_START(method, spot, volatility) \
    DTRACE_PROBE3(MCOPT_PROVIDER, greeks_start, method, spot, volatility)

/**
 * @param method: GreeksMethod as int
 * @param delta: Delta estimate
 * @param vega: Vega estimate
 * @param n_samples: Statistical units per Greek
 */
#define MCOPT_TRACE_GREEKS_COMPLETE(method, delta, vega, n_samples) \
    DTRACE_PROBE4(MCOPT_PROVIDER, greeks_complete, method, delta, vega, n_samples)

/**
 * ============================================================================
 * Tail Risk Probes
 * ============================================================================
 */

/**
 * @param n_samples: Number of P&L samples
 * @param confidence_level: VaR confidence level
 * @param var: Value at Risk
 * @param es: Expected Shortfall
 */
#define MCOPT_TRACE_TAIL_RISK_COMPLETE(n_samples, confidence_level, var, es) \
    DTRACE_PROBE4(MCOPT_PROVIDER, tail_risk_complete, n_samples, confidence_level, var, es)

#endif // MCOPT_TRACE_H

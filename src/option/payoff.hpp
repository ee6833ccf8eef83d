// SPDX-License-Identifier: MIT
/**
 * @file payoff.hpp
 * @brief Contract payoffs evaluated on simulated price paths
 *
 * A path is the sequence S_0, S_1, ..., S_n with S_0 = spot and
 * S_n = S_T. Strike and call/put direction come from the OptionSpec,
 * so one payoff value describes a family of contracts.
 */

#pragma once

#include <expected>
#include <span>
#include <variant>

#include "src/option/option_spec.hpp"
#include "src/support/error_types.hpp"

namespace mcopt {

/// European payoff on S_T
struct VanillaPayoff {};

/// Cash-or-nothing: pays `cash` if S_T finishes in the money
struct DigitalPayoff {
    double cash = 1.0;
};

enum class AverageType {
    Arithmetic,
    Geometric
};

/// Average-price option on S_1..S_n (spot excluded)
struct AsianPayoff {
    AverageType average = AverageType::Arithmetic;
};

enum class BarrierKind {
    UpAndOut,
    UpAndIn,
    DownAndOut,
    DownAndIn
};

/// Discretely monitored knock-in/knock-out vanilla
///
/// Every path point including S_0 is a monitoring date. Touching the
/// barrier counts as crossing it. A contract that is knocked out, or never
/// knocked in, pays `rebate` at expiry.
struct BarrierPayoff {
    BarrierKind kind = BarrierKind::UpAndOut;
    double barrier = 0.0;
    double rebate = 0.0;
};

enum class LookbackStrike {
    Floating,
    Fixed
};

/// Lookback on the path extremes (S_0 included)
struct LookbackPayoff {
    LookbackStrike strike = LookbackStrike::Floating;
};

using Payoff = std::variant<VanillaPayoff,
                            DigitalPayoff,
                            AsianPayoff,
                            BarrierPayoff,
                            LookbackPayoff>;

/// Undiscounted payoff of one path
///
/// @param payoff Contract payoff
/// @param path Simulated prices S_0..S_n (at least one element)
/// @param spec Strike and option type
double evaluate_payoff(const Payoff& payoff, std::span<const double> path,
                       const OptionSpec& spec);

/// True when the payoff depends on more than S_T
bool is_path_dependent(const Payoff& payoff);

/// Short human-readable name ("vanilla", "asian-arithmetic", ...)
const char* payoff_name(const Payoff& payoff);

/// Validate payoff-specific fields (barrier level, rebate, cash amount)
std::expected<void, ValidationError> validate_payoff(const Payoff& payoff);

}  // namespace mcopt

// SPDX-License-Identifier: MIT
#include "src/option/payoff.hpp"
#include "src/support/mcopt_trace.h"
#include <algorithm>
#include <cmath>

namespace mcopt {

namespace {

// Overload set for std::visit
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

double average_price(std::span<const double> path, AverageType average) {
    // Monitoring dates are S_1..S_n; a one-point path degenerates to S_0
    auto monitored = path.size() > 1 ? path.subspan(1) : path;
    double n = static_cast<double>(monitored.size());

    if (average == AverageType::Geometric) {
        double log_sum = 0.0;
        for (double s : monitored) {
            log_sum += std::log(s);
        }
        return std::exp(log_sum / n);
    }

    double sum = 0.0;
    for (double s : monitored) {
        sum += s;
    }
    return sum / n;
}

double barrier_payoff(const BarrierPayoff& p, std::span<const double> path,
                      const OptionSpec& spec) {
    bool up = (p.kind == BarrierKind::UpAndOut || p.kind == BarrierKind::UpAndIn);
    bool knock_in = (p.kind == BarrierKind::UpAndIn || p.kind == BarrierKind::DownAndIn);

    bool touched;
    if (up) {
        touched = *std::max_element(path.begin(), path.end()) >= p.barrier;
    } else {
        touched = *std::min_element(path.begin(), path.end()) <= p.barrier;
    }

    bool alive = knock_in ? touched : !touched;
    if (!alive) {
        return p.rebate;
    }
    return intrinsic_value(path.back(), spec.strike, spec.type);
}

double lookback_payoff(const LookbackPayoff& p, std::span<const double> path,
                       const OptionSpec& spec) {
    auto [min_it, max_it] = std::minmax_element(path.begin(), path.end());
    double s_min = *min_it;
    double s_max = *max_it;
    double s_T = path.back();

    if (p.strike == LookbackStrike::Floating) {
        return spec.type == OptionType::CALL ? s_T - s_min : s_max - s_T;
    }
    return spec.type == OptionType::CALL ? std::max(s_max - spec.strike, 0.0)
                                         : std::max(spec.strike - s_min, 0.0);
}

}  // namespace

double evaluate_payoff(const Payoff& payoff, std::span<const double> path,
                       const OptionSpec& spec) {
    return std::visit(overloaded{
        [&](const VanillaPayoff&) {
            return intrinsic_value(path.back(), spec.strike, spec.type);
        },
        [&](const DigitalPayoff& p) {
            double s_T = path.back();
            bool in_the_money = spec.type == OptionType::CALL ? s_T > spec.strike
                                                              : s_T < spec.strike;
            return in_the_money ? p.cash : 0.0;
        },
        [&](const AsianPayoff& p) {
            return intrinsic_value(average_price(path, p.average), spec.strike, spec.type);
        },
        [&](const BarrierPayoff& p) {
            return barrier_payoff(p, path, spec);
        },
        [&](const LookbackPayoff& p) {
            return lookback_payoff(p, path, spec);
        },
    }, payoff);
}

bool is_path_dependent(const Payoff& payoff) {
    return !std::holds_alternative<VanillaPayoff>(payoff) &&
           !std::holds_alternative<DigitalPayoff>(payoff);
}

const char* payoff_name(const Payoff& payoff) {
    return std::visit(overloaded{
        [](const VanillaPayoff&) { return "vanilla"; },
        [](const DigitalPayoff&) { return "digital"; },
        [](const AsianPayoff& p) {
            return p.average == AverageType::Arithmetic ? "asian-arithmetic"
                                                        : "asian-geometric";
        },
        [](const BarrierPayoff& p) {
            switch (p.kind) {
                case BarrierKind::UpAndOut: return "barrier-up-and-out";
                case BarrierKind::UpAndIn: return "barrier-up-and-in";
                case BarrierKind::DownAndOut: return "barrier-down-and-out";
                case BarrierKind::DownAndIn: return "barrier-down-and-in";
            }
            return "barrier";
        },
        [](const LookbackPayoff& p) {
            return p.strike == LookbackStrike::Floating ? "lookback-floating"
                                                        : "lookback-fixed";
        },
    }, payoff);
}

std::expected<void, ValidationError> validate_payoff(const Payoff& payoff) {
    auto reject = [](ValidationErrorCode code, double value)
        -> std::expected<void, ValidationError> {
        MCOPT_TRACE_VALIDATION_ERROR(MODULE_VALIDATION, static_cast<int>(code), value, 0);
        return std::unexpected(ValidationError(code, value));
    };

    if (const auto* digital = std::get_if<DigitalPayoff>(&payoff)) {
        if (digital->cash < 0.0 || !std::isfinite(digital->cash)) {
            return reject(ValidationErrorCode::InvalidCashAmount, digital->cash);
        }
    }

    if (const auto* barrier = std::get_if<BarrierPayoff>(&payoff)) {
        if (barrier->barrier <= 0.0 || !std::isfinite(barrier->barrier)) {
            return reject(ValidationErrorCode::InvalidBarrier, barrier->barrier);
        }
        if (barrier->rebate < 0.0 || !std::isfinite(barrier->rebate)) {
            return reject(ValidationErrorCode::InvalidRebate, barrier->rebate);
        }
    }

    return {};
}

}  // namespace mcopt

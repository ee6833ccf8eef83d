// SPDX-License-Identifier: MIT
#include "src/simulation/greeks_config.hpp"
#include "src/support/mcopt_trace.h"
#include <cmath>
#include <cstddef>
#include <iterator>

namespace mcopt {

std::expected<void, ValidationError> validate_greeks_config(const GreeksConfig& config) {
    const double bumps[] = {
        config.spot_bump_rel,
        config.vol_bump_abs,
        config.rate_bump_abs,
        config.time_bump_abs,
    };

    for (size_t i = 0; i < std::size(bumps); ++i) {
        double h = bumps[i];
        bool valid = std::isfinite(h) && h > 0.0 && (i != 0 || h < 1.0);
        if (!valid) {
            MCOPT_TRACE_VALIDATION_ERROR(MODULE_GREEKS,
                static_cast<int>(ValidationErrorCode::InvalidBumpSize), h, i);
            return std::unexpected(ValidationError(ValidationErrorCode::InvalidBumpSize, h, i));
        }
    }

    return {};
}

const char* method_name(GreeksMethod method) {
    switch (method) {
        case GreeksMethod::FiniteDifference:
            return "finite-difference";
        case GreeksMethod::Pathwise:
            return "pathwise";
        case GreeksMethod::LikelihoodRatio:
            return "likelihood-ratio";
    }
    return "unknown";
}

}  // namespace mcopt

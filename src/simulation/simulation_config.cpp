// SPDX-License-Identifier: MIT
#include "src/simulation/simulation_config.hpp"
#include "src/support/mcopt_trace.h"
#include <cmath>

namespace mcopt {

std::expected<void, ValidationError> validate_simulation_config(const SimulationConfig& config) {
    auto reject = [](ValidationErrorCode code, double value)
        -> std::expected<void, ValidationError> {
        MCOPT_TRACE_VALIDATION_ERROR(MODULE_MC_ENGINE, static_cast<int>(code), value, 0);
        return std::unexpected(ValidationError(code, value));
    };

    if (config.n_simulations < 2) {
        return reject(ValidationErrorCode::InvalidPathCount,
                      static_cast<double>(config.n_simulations));
    }

    if (config.n_steps < 1) {
        return reject(ValidationErrorCode::InvalidStepCount,
                      static_cast<double>(config.n_steps));
    }

    if (!(config.confidence_level > 0.0 && config.confidence_level < 1.0)) {
        return reject(ValidationErrorCode::InvalidConfidenceLevel, config.confidence_level);
    }

    if (!std::isfinite(config.target_std_error)) {
        return reject(ValidationErrorCode::InvalidTolerance, config.target_std_error);
    }

    return {};
}

}  // namespace mcopt

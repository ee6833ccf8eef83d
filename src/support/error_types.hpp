// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

namespace mcopt {

/// Error codes for parameter validation failures
enum class ValidationErrorCode {
    InvalidSpotPrice,
    InvalidStrike,
    InvalidMaturity,
    InvalidVolatility,
    InvalidRate,
    InvalidDividend,
    InvalidPathCount,
    InvalidStepCount,
    InvalidConfidenceLevel,
    InvalidTolerance,
    InvalidBarrier,
    InvalidRebate,
    InvalidCashAmount,
    InvalidBumpSize,
    EmptySample,
    NonFiniteSample
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The invalid value that was provided
    size_t index;  // Optional index for array errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                   double value = 0.0,
                   size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// High-level simulation error categories surfaced through expected results
enum class SimulationErrorCode {
    InvalidParameters,
    InvalidPayoff,
    InvalidConfiguration,
    IncompatibleMethod,
    NonFiniteSample,
    InsufficientSamples
};

/// Detailed simulation error passed through expected failure path
struct SimulationError {
    SimulationErrorCode code;
    size_t samples = 0;      ///< Units simulated before failure
    double value = 0.0;      ///< Offending value (sample, parameter)
    std::optional<ValidationError> detail;  ///< Underlying validation failure
};

/// Wrap a validation failure into a simulation error
inline SimulationError make_simulation_error(SimulationErrorCode code,
                                             const ValidationError& detail) {
    return SimulationError{code, 0, detail.value, detail};
}

/// Combined error type that can hold any of our specific error types
using ErrorVariant = std::variant<
    ValidationError,
    SimulationError,
    std::string  // Generic error message
>;

/// Get error code as integer for diagnostics
inline int error_code(const ErrorVariant& error) {
    return std::visit([](const auto& e) -> int {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ValidationError>) {
            return static_cast<int>(e.code);
        } else if constexpr (std::is_same_v<T, SimulationError>) {
            return static_cast<int>(e.code);
        } else {
            return -1;  // Generic string error
        }
    }, error);
}

inline const char* to_string(ValidationErrorCode code) {
    switch (code) {
        case ValidationErrorCode::InvalidSpotPrice: return "InvalidSpotPrice";
        case ValidationErrorCode::InvalidStrike: return "InvalidStrike";
        case ValidationErrorCode::InvalidMaturity: return "InvalidMaturity";
        case ValidationErrorCode::InvalidVolatility: return "InvalidVolatility";
        case ValidationErrorCode::InvalidRate: return "InvalidRate";
        case ValidationErrorCode::InvalidDividend: return "InvalidDividend";
        case ValidationErrorCode::InvalidPathCount: return "InvalidPathCount";
        case ValidationErrorCode::InvalidStepCount: return "InvalidStepCount";
        case ValidationErrorCode::InvalidConfidenceLevel: return "InvalidConfidenceLevel";
        case ValidationErrorCode::InvalidTolerance: return "InvalidTolerance";
        case ValidationErrorCode::InvalidBarrier: return "InvalidBarrier";
        case ValidationErrorCode::InvalidRebate: return "InvalidRebate";
        case ValidationErrorCode::InvalidCashAmount: return "InvalidCashAmount";
        case ValidationErrorCode::InvalidBumpSize: return "InvalidBumpSize";
        case ValidationErrorCode::EmptySample: return "EmptySample";
        case ValidationErrorCode::NonFiniteSample: return "NonFiniteSample";
    }
    return "Unknown";
}

inline const char* to_string(SimulationErrorCode code) {
    switch (code) {
        case SimulationErrorCode::InvalidParameters: return "InvalidParameters";
        case SimulationErrorCode::InvalidPayoff: return "InvalidPayoff";
        case SimulationErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case SimulationErrorCode::IncompatibleMethod: return "IncompatibleMethod";
        case SimulationErrorCode::NonFiniteSample: return "NonFiniteSample";
        case SimulationErrorCode::InsufficientSamples: return "InsufficientSamples";
    }
    return "Unknown";
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << to_string(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for SimulationError
inline std::ostream& operator<<(std::ostream& os, const SimulationError& err) {
    os << "SimulationError{code=" << to_string(err.code)
       << ", samples=" << err.samples
       << ", value=" << err.value;
    if (err.detail.has_value()) {
        os << ", detail=" << *err.detail;
    }
    os << "}";
    return os;
}

} // namespace mcopt

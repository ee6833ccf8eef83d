// SPDX-License-Identifier: MIT
#include "src/simulation/path_generator.hpp"
#include <cmath>

namespace mcopt {

GbmPathGenerator::GbmPathGenerator(const PricingParams& params, size_t n_steps)
    : spot_(params.spot)
    , log_spot_(std::log(params.spot))
    , dt_(params.maturity / static_cast<double>(n_steps))
    , drift_((params.rate - params.dividend_yield -
              0.5 * params.volatility * params.volatility) * dt_)
    , diffusion_(params.volatility * std::sqrt(dt_))
    , n_steps_(n_steps)
{}

void GbmPathGenerator::generate(std::span<const double> normals, std::span<double> path,
                                double sign) const {
    // Accumulate ln S; path[j] = exp(ln S_j)
    double log_s = log_spot_;
    double signed_diffusion = sign * diffusion_;
    path[0] = spot_;
    for (size_t j = 0; j < n_steps_; ++j) {
        log_s += drift_ + signed_diffusion * normals[j];
        path[j + 1] = std::exp(log_s);
    }
}

}  // namespace mcopt

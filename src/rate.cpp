// =============================================================================
// rate.cpp - Interest rate curves
// =============================================================================

#include "lendpool/rate.hpp"
#include "lendpool/errors.hpp"

#include <algorithm>

namespace lendpool {

namespace {

uint64_t clamp_rate(const U256& rate, uint64_t min_rate, uint64_t max_rate) {
    if (rate < min_rate) return min_rate;
    if (rate > max_rate) return max_rate;
    return static_cast<uint64_t>(rate);
}

} // namespace

// =============================================================================
// Validation
// =============================================================================

void validate(const VariableRateParams& p) {
    if (p.utilization_precision == 0) {
        throw ConfigurationError("variable rate: utilization_precision must be nonzero");
    }
    if (p.min_utilization == 0 || p.min_utilization > p.max_utilization) {
        throw ConfigurationError("variable rate: require 0 < min_utilization <= max_utilization");
    }
    if (p.max_utilization >= p.utilization_precision) {
        throw ConfigurationError("variable rate: max_utilization must be below utilization_precision");
    }
    // A zero floor would let the multiplicative update stall at zero forever
    if (p.min_interest == 0 || p.min_interest > p.max_interest) {
        throw ConfigurationError("variable rate: require 0 < min_interest <= max_interest");
    }
    if (p.half_life == 0) {
        throw ConfigurationError("variable rate: half_life must be nonzero");
    }
}

void validate(const LinearRateParams& p) {
    if (p.min_interest > p.vertex_interest || p.vertex_interest > p.max_interest) {
        throw ConfigurationError("linear rate: require min_interest <= vertex_interest <= max_interest");
    }
    if (p.vertex_utilization == 0 || p.vertex_utilization >= precision::UTILIZATION) {
        throw ConfigurationError("linear rate: vertex_utilization must be in (0, 100%)");
    }
}

// =============================================================================
// Variable (half-life) curve
// =============================================================================

uint64_t variable_rate(const VariableRateParams& p, uint64_t utilization,
                       uint64_t current_rate, uint64_t elapsed) {
    utilization = std::min(utilization, p.utilization_precision);

    const U256 scale = precision::DECAY_SCALE;
    const U256 half_life = U256(p.half_life) * scale * scale;
    U256 rate = current_rate;

    if (utilization < p.min_utilization) {
        U256 delta = (U256(p.min_utilization - utilization) * scale) / p.min_utilization;
        U256 decay = half_life + delta * delta * elapsed;
        rate = (rate * half_life) / decay;
    } else if (utilization > p.max_utilization) {
        U256 delta = (U256(utilization - p.max_utilization) * scale)
                   / (p.utilization_precision - p.max_utilization);
        U256 growth = half_life + delta * delta * elapsed;
        rate = (rate * growth) / half_life;
    }

    return clamp_rate(rate, p.min_interest, p.max_interest);
}

VariableRateCalculator::VariableRateCalculator(const VariableRateParams& params)
    : params_(params) {
    validate(params_);
}

uint64_t VariableRateCalculator::update_rate(uint64_t utilization, uint64_t current_rate,
                                             uint64_t elapsed) const {
    return variable_rate(params_, utilization, current_rate, elapsed);
}

// =============================================================================
// Linear (kinked) curve
// =============================================================================

uint64_t linear_rate(const LinearRateParams& p, uint64_t utilization) {
    const U256 prec = precision::UTILIZATION;
    utilization = std::min<uint64_t>(utilization, precision::UTILIZATION);

    U256 rate;
    if (utilization < p.vertex_utilization) {
        U256 slope = (U256(p.vertex_interest - p.min_interest) * prec) / p.vertex_utilization;
        rate = U256(p.min_interest) + (U256(utilization) * slope) / prec;
    } else if (utilization > p.vertex_utilization) {
        U256 slope = (U256(p.max_interest - p.vertex_interest) * prec)
                   / (prec - p.vertex_utilization);
        rate = U256(p.vertex_interest) + (U256(utilization - p.vertex_utilization) * slope) / prec;
    } else {
        rate = p.vertex_interest;
    }

    return clamp_rate(rate, p.min_interest, p.max_interest);
}

LinearRateCalculator::LinearRateCalculator(const LinearRateParams& params)
    : params_(params) {
    validate(params_);
}

uint64_t LinearRateCalculator::update_rate(uint64_t utilization, uint64_t current_rate,
                                           uint64_t elapsed) const {
    (void)current_rate;  // stateless curve
    (void)elapsed;
    return linear_rate(params_, utilization);
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<IRateCalculator> make_rate_calculator(const RateModel& model) {
    if (const auto* variable = std::get_if<VariableRateParams>(&model)) {
        return std::make_unique<VariableRateCalculator>(*variable);
    }
    return std::make_unique<LinearRateCalculator>(std::get<LinearRateParams>(model));
}

} // namespace lendpool

#ifndef LENDPOOL_RATE_HPP
#define LENDPOOL_RATE_HPP

#include <memory>
#include <variant>

#include "types.hpp"

namespace lendpool {

// =============================================================================
// Rate Model Constants
// =============================================================================

// Utilization-seeking curve: the rate decays toward min_interest while
// utilization is below the band and grows toward max_interest above it.
struct VariableRateParams {
    uint64_t min_utilization = 75000;          // 75%
    uint64_t max_utilization = 85000;          // 85%
    uint64_t utilization_precision = precision::UTILIZATION;
    uint64_t min_interest = rates::MIN_VARIABLE_RATE;
    uint64_t max_interest = rates::MAX_VARIABLE_RATE;
    uint64_t half_life = 43200;                // seconds (12 hours)
};

// Kinked linear curve over utilization at precision::UTILIZATION
struct LinearRateParams {
    uint64_t min_interest = 0;
    uint64_t vertex_interest = rates::DEFAULT_RATE_PER_SEC;
    uint64_t max_interest = rates::MAX_VARIABLE_RATE;
    uint64_t vertex_utilization = 80000;       // 80%
};

using RateModel = std::variant<VariableRateParams, LinearRateParams>;

// Both throw ConfigurationError on inconsistent constants
void validate(const VariableRateParams& params);
void validate(const LinearRateParams& params);

// Pure curve functions. Utilization above the precision is treated as 100%.
uint64_t variable_rate(const VariableRateParams& params, uint64_t utilization,
                       uint64_t current_rate, uint64_t elapsed);
uint64_t linear_rate(const LinearRateParams& params, uint64_t utilization);

// =============================================================================
// IRateCalculator - capability selected per pool at creation
// =============================================================================

class IRateCalculator {
public:
    virtual ~IRateCalculator() = default;

    virtual const char* name() const = 0;

    // Precision the pool must use when computing utilization for this curve
    virtual uint64_t utilization_precision() const = 0;

    virtual uint64_t min_rate() const = 0;
    virtual uint64_t max_rate() const = 0;

    // Result is always within [min_rate(), max_rate()]
    virtual uint64_t update_rate(uint64_t utilization, uint64_t current_rate,
                                 uint64_t elapsed) const = 0;
};

class VariableRateCalculator final : public IRateCalculator {
public:
    explicit VariableRateCalculator(const VariableRateParams& params);

    const char* name() const override { return "variable"; }
    uint64_t utilization_precision() const override { return params_.utilization_precision; }
    uint64_t min_rate() const override { return params_.min_interest; }
    uint64_t max_rate() const override { return params_.max_interest; }
    uint64_t update_rate(uint64_t utilization, uint64_t current_rate,
                         uint64_t elapsed) const override;

    const VariableRateParams& params() const { return params_; }

private:
    VariableRateParams params_;
};

class LinearRateCalculator final : public IRateCalculator {
public:
    explicit LinearRateCalculator(const LinearRateParams& params);

    const char* name() const override { return "linear"; }
    uint64_t utilization_precision() const override { return precision::UTILIZATION; }
    uint64_t min_rate() const override { return params_.min_interest; }
    uint64_t max_rate() const override { return params_.max_interest; }
    uint64_t update_rate(uint64_t utilization, uint64_t current_rate,
                         uint64_t elapsed) const override;

    const LinearRateParams& params() const { return params_; }

private:
    LinearRateParams params_;
};

// Validates the constants and builds the matching calculator
std::unique_ptr<IRateCalculator> make_rate_calculator(const RateModel& model);

} // namespace lendpool

#endif // LENDPOOL_RATE_HPP

// lendpool - Pool configuration
// Builder pattern for fluent configuration, JSON loading

#ifndef LENDPOOL_CONFIG_HPP
#define LENDPOOL_CONFIG_HPP

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

#include "types.hpp"
#include "rate.hpp"
#include "oracle.hpp"

namespace lendpool {

// Process-level settings
struct GeneralConfig {
    std::string log_level = "info";
};

// Immutable once a pool is created from it
class PoolConfig {
public:
    std::string name;
    GeneralConfig general;

    uint64_t max_ltv = 75000;                // precision::LTV
    uint64_t liquidation_fee = 10000;        // precision::LIQUIDATION
    uint64_t fee_to_protocol_rate = 0;       // precision::FEE
    uint64_t maturity = 0;                   // unix seconds, 0 = none
    uint64_t penalty_rate = 0;               // precision::RATE, after maturity
    uint64_t initial_rate_per_sec = rates::DEFAULT_RATE_PER_SEC;
    Address fee_recipient{};

    RateModel rate_model = VariableRateParams{};
    OracleSettings oracle;

    std::optional<std::set<Address>> approved_borrowers;
    std::optional<std::set<Address>> approved_lenders;

    PoolConfig() = default;

    // Load from JSON file
    static PoolConfig from_file(std::string_view path);

    // Load from JSON string
    static PoolConfig from_json(std::string_view content);

    // Throws ConfigurationError on the first invalid parameter
    void validate() const;

    // Builder methods
    PoolConfig& with_name(std::string_view n) {
        name = std::string(n);
        return *this;
    }

    PoolConfig& with_max_ltv(uint64_t ltv) {
        max_ltv = ltv;
        return *this;
    }

    PoolConfig& with_liquidation_fee(uint64_t fee) {
        liquidation_fee = fee;
        return *this;
    }

    PoolConfig& with_protocol_fee(uint64_t rate, const Address& recipient) {
        fee_to_protocol_rate = rate;
        fee_recipient = recipient;
        return *this;
    }

    PoolConfig& with_maturity(uint64_t timestamp, uint64_t penalty) {
        maturity = timestamp;
        penalty_rate = penalty;
        return *this;
    }

    PoolConfig& with_initial_rate(uint64_t rate_per_sec) {
        initial_rate_per_sec = rate_per_sec;
        return *this;
    }

    PoolConfig& with_rate_model(RateModel model) {
        rate_model = std::move(model);
        return *this;
    }

    PoolConfig& with_oracle(OracleSettings settings) {
        oracle = settings;
        return *this;
    }

    PoolConfig& approve_borrower(const Address& who) {
        if (!approved_borrowers) approved_borrowers.emplace();
        approved_borrowers->insert(who);
        return *this;
    }

    PoolConfig& approve_lender(const Address& who) {
        if (!approved_lenders) approved_lenders.emplace();
        approved_lenders->insert(who);
        return *this;
    }

    PoolConfig& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }
};

} // namespace lendpool

#endif // LENDPOOL_CONFIG_HPP

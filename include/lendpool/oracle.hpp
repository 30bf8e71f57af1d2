#ifndef LENDPOOL_ORACLE_HPP
#define LENDPOOL_ORACLE_HPP

#include <memory>
#include <optional>
#include <string>

#include "types.hpp"

namespace lendpool {

// =============================================================================
// Price Reading from a Single Feed
// =============================================================================

struct PriceReading {
    U128 price;          // scaled by 10^decimals
    uint8_t decimals;
    uint64_t timestamp;  // when the feed last updated
};

// =============================================================================
// Price Feed Interface
// =============================================================================

class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    virtual std::string description() const = 0;

    // nullopt when the feed has no answer
    virtual std::optional<PriceReading> latest_price() const = 0;
};

// Feed whose answer is pushed by its owner (keeper, test, simulation)
class ManualPriceFeed : public IPriceFeed {
public:
    explicit ManualPriceFeed(std::string description, uint8_t decimals = 8);

    std::string description() const override { return description_; }
    std::optional<PriceReading> latest_price() const override;

    void set_price(U128 price, uint64_t timestamp);
    void clear();

private:
    std::string description_;
    uint8_t decimals_;
    std::optional<PriceReading> reading_;
};

// =============================================================================
// Oracle Settings
// =============================================================================

struct OracleSettings {
    uint64_t max_staleness = 86400;    // seconds
    int32_t normalization_exponent = 0; // rate is scaled by 10^exponent
};

// Throws ConfigurationError when the exponent is out of range
void validate(const OracleSettings& settings);

// =============================================================================
// ExchangeRateOracle - combines the divide and multiply feeds
// =============================================================================
//
// rate = EXCHANGE * 10^div_decimals * mult_price
//        / (div_price * 10^mult_decimals) * 10^normalization_exponent
//
// i.e. collateral units per asset unit when the divide feed prices the
// collateral in the asset and the exponent accounts for token decimals.

class ExchangeRateOracle {
public:
    ExchangeRateOracle(std::shared_ptr<IPriceFeed> divide,
                       std::shared_ptr<IPriceFeed> multiply,
                       OracleSettings settings);

    // Throws OracleError on a missing, non-positive or stale reading, or a
    // zero result; ArithmeticOverflowError when the rate exceeds 128 bits.
    U128 exchange_rate(uint64_t now) const;

    bool has_multiply() const { return multiply_ != nullptr; }

private:
    std::shared_ptr<IPriceFeed> divide_;
    std::shared_ptr<IPriceFeed> multiply_;
    OracleSettings settings_;

    PriceReading read(const IPriceFeed& feed, uint64_t now) const;
};

} // namespace lendpool

#endif // LENDPOOL_ORACLE_HPP

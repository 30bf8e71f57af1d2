// =============================================================================
// oracle.cpp - Exchange rate from divide/multiply price feeds
// =============================================================================

#include "lendpool/oracle.hpp"
#include "lendpool/errors.hpp"
#include "lendpool/math.hpp"

#include <utility>

namespace lendpool {

namespace {
constexpr int32_t MAX_NORMALIZATION_EXPONENT = 36;
constexpr uint8_t MAX_FEED_DECIMALS = 36;
}

// =============================================================================
// ManualPriceFeed
// =============================================================================

ManualPriceFeed::ManualPriceFeed(std::string description, uint8_t decimals)
    : description_(std::move(description)), decimals_(decimals) {}

std::optional<PriceReading> ManualPriceFeed::latest_price() const {
    return reading_;
}

void ManualPriceFeed::set_price(U128 price, uint64_t timestamp) {
    reading_ = PriceReading{price, decimals_, timestamp};
}

void ManualPriceFeed::clear() {
    reading_.reset();
}

// =============================================================================
// Settings
// =============================================================================

void validate(const OracleSettings& settings) {
    if (settings.normalization_exponent > MAX_NORMALIZATION_EXPONENT ||
        settings.normalization_exponent < -MAX_NORMALIZATION_EXPONENT) {
        throw ConfigurationError("oracle normalization exponent out of range");
    }
    if (settings.max_staleness == 0) {
        throw ConfigurationError("oracle max_staleness must be nonzero");
    }
}

// =============================================================================
// ExchangeRateOracle
// =============================================================================

ExchangeRateOracle::ExchangeRateOracle(std::shared_ptr<IPriceFeed> divide,
                                       std::shared_ptr<IPriceFeed> multiply,
                                       OracleSettings settings)
    : divide_(std::move(divide)), multiply_(std::move(multiply)), settings_(settings) {
    if (!divide_) {
        throw ConfigurationError("divide price feed is required");
    }
    validate(settings_);
}

PriceReading ExchangeRateOracle::read(const IPriceFeed& feed, uint64_t now) const {
    auto reading = feed.latest_price();
    if (!reading) {
        throw OracleError(feed.description() + ": no price available");
    }
    if (reading->price == 0) {
        throw OracleError(feed.description() + ": price is zero");
    }
    if (reading->decimals > MAX_FEED_DECIMALS) {
        throw OracleError(feed.description() + ": unsupported decimals");
    }
    if (now > reading->timestamp && now - reading->timestamp > settings_.max_staleness) {
        throw OracleError(feed.description() + ": price is stale");
    }
    return *reading;
}

U128 ExchangeRateOracle::exchange_rate(uint64_t now) const {
    PriceReading div = read(*divide_, now);

    U512 num = U512(precision::EXCHANGE) * static_cast<U512>(wide::pow10(div.decimals));
    U512 den = static_cast<U512>(wide::widen(div.price));

    if (multiply_) {
        PriceReading mul = read(*multiply_, now);
        num *= static_cast<U512>(wide::widen(mul.price));
        den *= static_cast<U512>(wide::pow10(mul.decimals));
    }

    if (settings_.normalization_exponent >= 0) {
        num *= static_cast<U512>(wide::pow10(static_cast<uint32_t>(settings_.normalization_exponent)));
    } else {
        den *= static_cast<U512>(wide::pow10(static_cast<uint32_t>(-settings_.normalization_exponent)));
    }

    U256 rate = wide::narrow256(num / den, "exchange rate");
    if (rate == 0) {
        throw OracleError("exchange rate rounds to zero");
    }
    return wide::narrow(rate, "exchange rate");
}

} // namespace lendpool

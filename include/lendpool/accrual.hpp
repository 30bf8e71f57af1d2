#ifndef LENDPOOL_ACCRUAL_HPP
#define LENDPOOL_ACCRUAL_HPP

#include "types.hpp"
#include "ledger.hpp"
#include "rate.hpp"

namespace lendpool {

// =============================================================================
// Rate State
// =============================================================================

struct RateInfo {
    uint64_t last_timestamp = 0;
    uint64_t fee_to_protocol_rate = 0;   // precision::FEE
    uint64_t rate_per_sec = 0;           // precision::RATE

    bool operator==(const RateInfo& other) const {
        return last_timestamp == other.last_timestamp &&
               fee_to_protocol_rate == other.fee_to_protocol_rate &&
               rate_per_sec == other.rate_per_sec;
    }
    bool operator!=(const RateInfo& other) const { return !(*this == other); }
};

// Past maturity (0 = never) the curve is replaced by penalty_rate
struct MaturityTerms {
    uint64_t maturity = 0;
    uint64_t penalty_rate = 0;

    bool matured(uint64_t now) const { return maturity != 0 && now > maturity; }
};

// =============================================================================
// Accrual Result
// =============================================================================

struct AccrualResult {
    U128 interest_earned = 0;
    U128 fee_amount = 0;
    U128 fee_shares = 0;                 // asset shares minted to the fee recipient
    uint64_t new_rate = 0;
    uint64_t utilization = 0;            // before accrual, at the curve's precision

    LedgerTotals total_asset;
    LedgerTotals total_borrow;
    RateInfo rate_info;

    bool accrued = false;                // interest was booked
};

// Utilization of the pool at the given precision, capped at 100%.
// Zero when there are no assets.
uint64_t utilization_of(const LedgerTotals& total_asset, const LedgerTotals& total_borrow,
                        uint64_t utilization_precision);

// Advances both ledgers from rate_info.last_timestamp to now. Pure: the caller
// decides whether to commit the returned totals.
AccrualResult accrue_interest(const LedgerTotals& total_asset,
                              const LedgerTotals& total_borrow,
                              const RateInfo& rate_info,
                              const IRateCalculator& calculator,
                              const MaturityTerms& terms,
                              uint64_t now);

} // namespace lendpool

#endif // LENDPOOL_ACCRUAL_HPP

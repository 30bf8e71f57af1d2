#ifndef LENDPOOL_LEDGER_HPP
#define LENDPOOL_LEDGER_HPP

#include "types.hpp"

namespace lendpool {

// =============================================================================
// Share Conversions
// =============================================================================
//
// result = input * other_total / divisor_total, truncated. With round_up the
// truncated result is checked by converting it back; if that falls short of
// the input the result is incremented by one.
//
// A zero divisor total converts 1:1. A zero non-divisor total yields zero.
// Results beyond 128 bits throw ArithmeticOverflowError.

U128 amount_for_shares(U128 total_amount, U128 total_shares, U128 shares, bool round_up);
U128 shares_for_amount(U128 total_amount, U128 total_shares, U128 amount, bool round_up);

// =============================================================================
// LedgerTotals - one side of the pool (assets or borrows)
// =============================================================================

struct LedgerTotals {
    U128 amount = 0;
    U128 shares = 0;

    U128 to_amount(U128 share_count, bool round_up) const {
        return amount_for_shares(amount, shares, share_count, round_up);
    }

    U128 to_shares(U128 amount_value, bool round_up) const {
        return shares_for_amount(amount, shares, amount_value, round_up);
    }

    bool operator==(const LedgerTotals& other) const {
        return amount == other.amount && shares == other.shares;
    }
    bool operator!=(const LedgerTotals& other) const { return !(*this == other); }
};

} // namespace lendpool

#endif // LENDPOOL_LEDGER_HPP

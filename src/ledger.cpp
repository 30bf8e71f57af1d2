// =============================================================================
// ledger.cpp - Amount/share conversions
// =============================================================================

#include "lendpool/ledger.hpp"
#include "lendpool/math.hpp"

namespace lendpool {

namespace {

// input * numerator_total / divisor_total with reconstruction rounding.
// divisor_total is nonzero here.
U128 convert(U128 input, U128 numerator_total, U128 divisor_total, bool round_up) {
    if (numerator_total == 0) {
        return 0;
    }

    U256 in = wide::widen(input);
    U256 num = wide::widen(numerator_total);
    U256 div = wide::widen(divisor_total);

    U256 result = (in * num) / div;
    if (round_up && (result * div) / num < in) {
        result += 1;
    }
    return wide::narrow(result, "share conversion");
}

} // namespace

U128 amount_for_shares(U128 total_amount, U128 total_shares, U128 shares, bool round_up) {
    if (total_shares == 0) {
        return shares;
    }
    return convert(shares, total_amount, total_shares, round_up);
}

U128 shares_for_amount(U128 total_amount, U128 total_shares, U128 amount, bool round_up) {
    if (total_amount == 0) {
        return amount;
    }
    return convert(amount, total_shares, total_amount, round_up);
}

} // namespace lendpool

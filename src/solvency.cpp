// =============================================================================
// solvency.cpp - Collateral requirements and liquidation quotes
// =============================================================================

#include "lendpool/solvency.hpp"
#include "lendpool/errors.hpp"
#include "lendpool/math.hpp"

#include <algorithm>
#include <limits>

namespace lendpool {

namespace {

U512 ceil_div(const U512& num, const U512& den) {
    U512 q = num / den;
    if (q * den != num) q += 1;
    return q;
}

} // namespace

U256 required_collateral(U128 borrow_amount, U128 exchange_rate, uint64_t target_ltv) {
    if (exchange_rate == 0) {
        throw OracleError("exchange rate is zero");
    }
    if (target_ltv == 0) {
        throw ConfigurationError("target LTV is zero");
    }
    if (borrow_amount == 0) {
        return 0;
    }

    U512 num = static_cast<U512>(wide::widen(borrow_amount))
             * static_cast<U512>(wide::widen(exchange_rate))
             * precision::LTV;
    U512 den = U512(target_ltv) * precision::EXCHANGE;
    return wide::narrow256(ceil_div(num, den), "required collateral");
}

bool is_solvent(const U256& collateral, U128 borrow_amount, U128 exchange_rate,
                uint64_t max_ltv) {
    if (borrow_amount == 0) return true;
    return collateral >= required_collateral(borrow_amount, exchange_rate, max_ltv);
}

U256 loan_to_value(const U256& collateral, U128 borrow_amount, U128 exchange_rate) {
    if (borrow_amount == 0) return 0;
    if (collateral == 0) return (std::numeric_limits<U256>::max)();

    U512 num = static_cast<U512>(wide::widen(borrow_amount))
             * static_cast<U512>(wide::widen(exchange_rate))
             * precision::LTV;
    U512 den = static_cast<U512>(collateral) * precision::EXCHANGE;
    U512 ltv = ceil_div(num, den);
    if (ltv > static_cast<U512>((std::numeric_limits<U256>::max)())) {
        return (std::numeric_limits<U256>::max)();
    }
    return static_cast<U256>(ltv);
}

LiquidationQuote quote_liquidation(const LedgerTotals& total_borrow,
                                   U128 borrower_shares,
                                   const U256& borrower_collateral,
                                   U128 shares_to_liquidate,
                                   U128 exchange_rate,
                                   uint64_t liquidation_fee) {
    if (exchange_rate == 0) {
        throw OracleError("exchange rate is zero");
    }

    LiquidationQuote quote;
    quote.shares_liquidated = std::min(shares_to_liquidate, borrower_shares);
    quote.amount_to_repay = total_borrow.to_amount(quote.shares_liquidated, true);

    // Value of the liquidated debt in collateral units, rounded against the liquidator
    U512 debt_value = static_cast<U512>(wide::widen(total_borrow.to_amount(quote.shares_liquidated, false)))
                    * static_cast<U512>(wide::widen(exchange_rate))
                    / precision::EXCHANGE;
    U512 with_fee = debt_value * (U512(precision::LIQUIDATION) + liquidation_fee)
                  / precision::LIQUIDATION;

    if (with_fee < static_cast<U512>(borrower_collateral)) {
        quote.collateral_seized = static_cast<U256>(with_fee);
        return quote;
    }

    // Collateral exhausted: whatever debt is left cannot be recovered
    quote.collateral_seized = borrower_collateral;
    quote.bad_debt_shares = borrower_shares - quote.shares_liquidated;
    if (quote.bad_debt_shares > 0) {
        LedgerTotals after_repay;
        after_repay.amount = wide::sub(total_borrow.amount, quote.amount_to_repay, "borrow amount");
        after_repay.shares = wide::sub(total_borrow.shares, quote.shares_liquidated, "borrow shares");
        quote.bad_debt_amount = after_repay.to_amount(quote.bad_debt_shares, false);
    }
    return quote;
}

} // namespace lendpool

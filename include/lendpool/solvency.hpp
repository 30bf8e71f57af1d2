#ifndef LENDPOOL_SOLVENCY_HPP
#define LENDPOOL_SOLVENCY_HPP

#include "types.hpp"
#include "ledger.hpp"

namespace lendpool {

// =============================================================================
// Collateral Requirements
// =============================================================================
//
// exchange_rate is collateral units per asset unit at precision::EXCHANGE, so
// borrow_amount * exchange_rate / EXCHANGE is the debt in collateral units.

// borrow_amount * exchange_rate * LTV / (target_ltv * EXCHANGE), rounded up.
// Throws OracleError on a zero rate, ConfigurationError on a zero LTV.
U256 required_collateral(U128 borrow_amount, U128 exchange_rate, uint64_t target_ltv);

// collateral >= required_collateral(borrow_amount, exchange_rate, max_ltv).
// Zero debt is always solvent.
bool is_solvent(const U256& collateral, U128 borrow_amount, U128 exchange_rate,
                uint64_t max_ltv);

// Current LTV at precision::LTV, rounded up. Debt with no collateral reports
// the maximum value of U256.
U256 loan_to_value(const U256& collateral, U128 borrow_amount, U128 exchange_rate);

// =============================================================================
// Liquidation Quote
// =============================================================================

struct LiquidationQuote {
    U128 shares_liquidated = 0;
    U128 amount_to_repay = 0;        // paid by the liquidator
    U256 collateral_seized = 0;      // debt value plus liquidation fee, capped
    U128 bad_debt_shares = 0;        // borrower shares written off
    U128 bad_debt_amount = 0;
};

// shares_to_liquidate is clamped to borrower_shares. When the debt value plus
// fee reaches the borrower's collateral, all collateral is seized and any
// remaining borrower shares become bad debt.
LiquidationQuote quote_liquidation(const LedgerTotals& total_borrow,
                                   U128 borrower_shares,
                                   const U256& borrower_collateral,
                                   U128 shares_to_liquidate,
                                   U128 exchange_rate,
                                   uint64_t liquidation_fee);

} // namespace lendpool

#endif // LENDPOOL_SOLVENCY_HPP

#ifndef LENDPOOL_POOL_HPP
#define LENDPOOL_POOL_HPP

#include <functional>
#include <map>
#include <memory>

#include "types.hpp"
#include "access.hpp"
#include "accrual.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "rate.hpp"
#include "snapshot.hpp"

namespace lendpool {

// =============================================================================
// Exchange Rate State
// =============================================================================

struct ExchangeRateInfo {
    uint64_t last_timestamp = 0;
    U128 exchange_rate = 0;      // collateral per asset, precision::EXCHANGE
};

// =============================================================================
// Action Results
// =============================================================================

struct BorrowReceipt {
    U128 shares_owed;            // borrow shares added by this call
    U256 collateral_balance;     // borrower's collateral afterwards
};

struct InterestReport {
    U128 interest_earned;
    U128 fee_amount;
    uint64_t new_rate;
    uint64_t utilization;
};

struct LiquidationResult {
    Address liquidator;
    Address borrower;
    U128 shares_liquidated;
    U128 amount_repaid;          // owed by the liquidator
    U256 collateral_seized;      // released to the liquidator
    U128 bad_debt_shares;
    U128 bad_debt_amount;
    bool matured;                // eligible through maturity rather than insolvency
};

// =============================================================================
// LendingPool - one asset lent against one collateral
// =============================================================================
//
// Every mutating call first accrues interest up to the clock's time, then
// applies its change to a pending copy of the touched state. The copy is
// committed only once every check has passed, so a thrown PoolError leaves
// the pool unchanged. Calls must be serialized by the caller.

class LendingPool {
public:
    using Clock = std::function<uint64_t()>;  // unix seconds

    // Throws ConfigurationError when the config is invalid. An empty clock
    // uses the system clock.
    LendingPool(PoolConfig config, ExchangeRateOracle oracle, Clock clock = {});
    ~LendingPool() = default;

    // Non-copyable
    LendingPool(const LendingPool&) = delete;
    LendingPool& operator=(const LendingPool&) = delete;

    // =========================================================================
    // Queries (stored state, no accrual)
    // =========================================================================

    const PoolConfig& config() const { return config_; }
    const IRateCalculator& rate_calculator() const { return *calculator_; }

    LedgerTotals total_asset() const { return total_asset_; }
    LedgerTotals total_borrow() const { return total_borrow_; }
    U256 total_collateral() const { return total_collateral_; }
    RateInfo current_rate_info() const { return rate_info_; }
    ExchangeRateInfo exchange_rate_info() const { return exchange_info_; }

    U128 asset_shares(const Address& user) const;
    U128 borrow_shares(const Address& user) const;
    U256 collateral_balance(const Address& user) const;
    UserPosition user_position(const Address& user) const;
    const std::map<Address, UserPosition>& positions() const { return positions_; }

    PoolAccountingSnapshot snapshot() const;

    U128 to_asset_amount(U128 shares, bool round_up) const { return total_asset_.to_amount(shares, round_up); }
    U128 to_asset_shares(U128 amount, bool round_up) const { return total_asset_.to_shares(amount, round_up); }
    U128 to_borrow_amount(U128 shares, bool round_up) const { return total_borrow_.to_amount(shares, round_up); }
    U128 to_borrow_shares(U128 amount, bool round_up) const { return total_borrow_.to_shares(amount, round_up); }

    uint64_t utilization() const;

    // Against the last recorded exchange rate; throws OracleError if none
    bool is_solvent(const Address& borrower) const;

    // Current LTV at precision::LTV against the last recorded exchange rate
    U256 loan_to_value(const Address& borrower) const;

    // =========================================================================
    // Lending
    // =========================================================================

    // Returns asset shares credited to receiver (rounded down)
    U128 deposit(U128 amount, const Address& receiver);

    // Burns shares, returns the asset amount released (rounded down)
    U128 redeem(const Address& owner, U128 shares);

    // Releases amount, returns the shares burned (rounded up)
    U128 withdraw(const Address& owner, U128 amount);

    // =========================================================================
    // Collateral
    // =========================================================================

    // Returns the borrower's new collateral balance
    U256 add_collateral(const Address& borrower, const U256& amount);
    U256 remove_collateral(const Address& borrower, const U256& amount);

    // =========================================================================
    // Borrowing
    // =========================================================================

    BorrowReceipt borrow_asset(const Address& borrower, U128 amount, const U256& collateral_amount);

    // Returns the borrower's remaining borrow shares
    U128 repay_asset(const Address& borrower, U128 shares);

    // =========================================================================
    // Liquidation
    // =========================================================================

    LiquidationResult liquidate(const Address& liquidator, const Address& borrower, U128 shares);

    // =========================================================================
    // Maintenance
    // =========================================================================

    InterestReport add_interest();
    U128 update_exchange_rate();

private:
    struct PendingState {
        uint64_t now = 0;
        AccrualResult accrual;             // holds the working totals and rate info
        U256 total_collateral = 0;
        ExchangeRateInfo exchange_info;
        std::map<Address, UserPosition> touched;
    };

    PoolConfig config_;
    ExchangeRateOracle oracle_;
    Clock clock_;
    std::unique_ptr<IRateCalculator> calculator_;
    AccessPolicy access_;
    MaturityTerms terms_;

    LedgerTotals total_asset_;
    LedgerTotals total_borrow_;
    U256 total_collateral_ = 0;
    RateInfo rate_info_;
    ExchangeRateInfo exchange_info_;
    std::map<Address, UserPosition> positions_;

    // Accrues into a fresh pending state
    PendingState begin() const;
    void commit(PendingState& state);

    UserPosition& position(PendingState& state, const Address& user) const;
    U128 refresh_exchange_rate(PendingState& state) const;
    void require_not_matured(const PendingState& state, const char* action) const;
};

} // namespace lendpool

#endif // LENDPOOL_POOL_HPP

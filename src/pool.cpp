// =============================================================================
// pool.cpp - LendingPool Implementation
// =============================================================================

#include "lendpool/pool.hpp"
#include "lendpool/errors.hpp"
#include "lendpool/log.hpp"
#include "lendpool/math.hpp"
#include "lendpool/solvency.hpp"

#include <chrono>
#include <limits>
#include <sstream>
#include <utility>

namespace lendpool {

namespace {

uint64_t system_timestamp() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

U256 add_collateral_checked(const U256& a, const U256& b) {
    if ((std::numeric_limits<U256>::max)() - a < b) {
        throw ArithmeticOverflowError("collateral exceeds 256 bits");
    }
    return a + b;
}

// Logs a rejected action at debug level and lets the error propagate
template <typename Fn>
auto guarded(const char* action, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const PoolError& e) {
        if (log::enabled(log::Level::DEBUG)) {
            std::ostringstream msg;
            msg << action << " rejected (" << to_string(e.kind()) << "): " << e.what();
            log::debug(msg.str());
        }
        throw;
    }
}

} // namespace

// =============================================================================
// Constructor
// =============================================================================

LendingPool::LendingPool(PoolConfig config, ExchangeRateOracle oracle, Clock clock)
    : config_(std::move(config)),
      oracle_(std::move(oracle)),
      clock_(clock ? std::move(clock) : Clock(system_timestamp)) {
    config_.validate();

    calculator_ = make_rate_calculator(config_.rate_model);
    access_ = AccessPolicy(config_.approved_borrowers, config_.approved_lenders);
    terms_ = MaturityTerms{config_.maturity, config_.penalty_rate};

    uint64_t initial = config_.initial_rate_per_sec;
    if (initial < calculator_->min_rate()) initial = calculator_->min_rate();
    if (initial > calculator_->max_rate()) initial = calculator_->max_rate();

    rate_info_.last_timestamp = clock_();
    rate_info_.fee_to_protocol_rate = config_.fee_to_protocol_rate;
    rate_info_.rate_per_sec = initial;

    std::ostringstream msg;
    msg << "pool '" << config_.name << "' created: rate model=" << calculator_->name()
        << " max_ltv=" << config_.max_ltv << " liquidation_fee=" << config_.liquidation_fee;
    log::info(msg.str());
}

// =============================================================================
// Queries
// =============================================================================

U128 LendingPool::asset_shares(const Address& user) const {
    return user_position(user).asset_shares;
}

U128 LendingPool::borrow_shares(const Address& user) const {
    return user_position(user).borrow_shares;
}

U256 LendingPool::collateral_balance(const Address& user) const {
    return user_position(user).collateral_balance;
}

UserPosition LendingPool::user_position(const Address& user) const {
    auto it = positions_.find(user);
    return (it != positions_.end()) ? it->second : UserPosition{};
}

PoolAccountingSnapshot LendingPool::snapshot() const {
    PoolAccountingSnapshot snap;
    snap.total_asset_amount = total_asset_.amount;
    snap.total_asset_shares = total_asset_.shares;
    snap.total_borrow_amount = total_borrow_.amount;
    snap.total_borrow_shares = total_borrow_.shares;
    snap.total_collateral = total_collateral_;
    return snap;
}

uint64_t LendingPool::utilization() const {
    return utilization_of(total_asset_, total_borrow_, calculator_->utilization_precision());
}

bool LendingPool::is_solvent(const Address& borrower) const {
    UserPosition pos = user_position(borrower);
    return lendpool::is_solvent(pos.collateral_balance,
                                total_borrow_.to_amount(pos.borrow_shares, true),
                                exchange_info_.exchange_rate, config_.max_ltv);
}

U256 LendingPool::loan_to_value(const Address& borrower) const {
    UserPosition pos = user_position(borrower);
    return lendpool::loan_to_value(pos.collateral_balance,
                                   total_borrow_.to_amount(pos.borrow_shares, true),
                                   exchange_info_.exchange_rate);
}

// =============================================================================
// Lending
// =============================================================================

U128 LendingPool::deposit(U128 amount, const Address& receiver) {
    return guarded("deposit", [&] {
        access_.require_lender(receiver);

        PendingState s = begin();
        require_not_matured(s, "deposit");

        LedgerTotals& assets = s.accrual.total_asset;
        U128 shares = assets.to_shares(amount, false);
        if (shares == 0) {
            throw InsufficientBalanceError("deposit of " + wide::to_string(amount) + " mints no shares");
        }

        assets.amount = wide::add(assets.amount, amount, "total asset amount");
        assets.shares = wide::add(assets.shares, shares, "total asset shares");
        UserPosition& pos = position(s, receiver);
        pos.asset_shares += shares;

        commit(s);
        return shares;
    });
}

U128 LendingPool::redeem(const Address& owner, U128 shares) {
    return guarded("redeem", [&] {
        PendingState s = begin();
        LedgerTotals& assets = s.accrual.total_asset;
        const LedgerTotals& borrows = s.accrual.total_borrow;

        UserPosition& pos = position(s, owner);
        if (pos.asset_shares < shares) {
            throw InsufficientBalanceError("redeem exceeds asset shares of " + to_hex(owner));
        }

        U128 amount = assets.to_amount(shares, false);
        if (assets.amount - borrows.amount < amount) {
            throw InsolvencyError("insufficient unborrowed assets to redeem");
        }

        assets.amount -= amount;
        assets.shares -= shares;
        pos.asset_shares -= shares;

        commit(s);
        return amount;
    });
}

U128 LendingPool::withdraw(const Address& owner, U128 amount) {
    return guarded("withdraw", [&] {
        PendingState s = begin();
        LedgerTotals& assets = s.accrual.total_asset;
        const LedgerTotals& borrows = s.accrual.total_borrow;

        U128 shares = assets.to_shares(amount, true);

        UserPosition& pos = position(s, owner);
        if (pos.asset_shares < shares) {
            throw InsufficientBalanceError("withdraw exceeds asset shares of " + to_hex(owner));
        }
        if (assets.amount - borrows.amount < amount) {
            throw InsolvencyError("insufficient unborrowed assets to withdraw");
        }

        assets.amount -= amount;
        assets.shares = wide::sub(assets.shares, shares, "total asset shares");
        pos.asset_shares -= shares;

        commit(s);
        return shares;
    });
}

// =============================================================================
// Collateral
// =============================================================================

U256 LendingPool::add_collateral(const Address& borrower, const U256& amount) {
    return guarded("add_collateral", [&] {
        PendingState s = begin();

        UserPosition& pos = position(s, borrower);
        s.total_collateral = add_collateral_checked(s.total_collateral, amount);
        pos.collateral_balance += amount;

        commit(s);
        return pos.collateral_balance;
    });
}

U256 LendingPool::remove_collateral(const Address& borrower, const U256& amount) {
    return guarded("remove_collateral", [&] {
        PendingState s = begin();

        UserPosition& pos = position(s, borrower);
        if (pos.collateral_balance < amount) {
            throw InsufficientBalanceError("remove exceeds collateral of " + to_hex(borrower));
        }
        pos.collateral_balance -= amount;
        s.total_collateral -= amount;

        if (pos.borrow_shares > 0) {
            U128 rate = refresh_exchange_rate(s);
            U128 debt = s.accrual.total_borrow.to_amount(pos.borrow_shares, true);
            if (!lendpool::is_solvent(pos.collateral_balance, debt, rate, config_.max_ltv)) {
                throw InsolvencyError("removing collateral would leave " + to_hex(borrower) + " insolvent");
            }
        }

        commit(s);
        return pos.collateral_balance;
    });
}

// =============================================================================
// Borrowing
// =============================================================================

BorrowReceipt LendingPool::borrow_asset(const Address& borrower, U128 amount,
                                        const U256& collateral_amount) {
    return guarded("borrow_asset", [&] {
        access_.require_borrower(borrower);

        PendingState s = begin();
        require_not_matured(s, "borrow");
        U128 rate = refresh_exchange_rate(s);

        UserPosition& pos = position(s, borrower);
        if (collateral_amount > 0) {
            s.total_collateral = add_collateral_checked(s.total_collateral, collateral_amount);
            pos.collateral_balance += collateral_amount;
        }

        const LedgerTotals& assets = s.accrual.total_asset;
        LedgerTotals& borrows = s.accrual.total_borrow;
        if (assets.amount - borrows.amount < amount) {
            throw InsolvencyError("insufficient unborrowed assets to lend");
        }

        U128 shares = borrows.to_shares(amount, true);
        borrows.amount += amount;
        borrows.shares = wide::add(borrows.shares, shares, "total borrow shares");
        pos.borrow_shares += shares;

        U128 debt = borrows.to_amount(pos.borrow_shares, true);
        if (!lendpool::is_solvent(pos.collateral_balance, debt, rate, config_.max_ltv)) {
            throw InsolvencyError("borrow would leave " + to_hex(borrower) + " insolvent");
        }

        commit(s);
        return BorrowReceipt{shares, pos.collateral_balance};
    });
}

U128 LendingPool::repay_asset(const Address& borrower, U128 shares) {
    return guarded("repay_asset", [&] {
        PendingState s = begin();
        LedgerTotals& borrows = s.accrual.total_borrow;

        UserPosition& pos = position(s, borrower);
        if (pos.borrow_shares < shares) {
            throw InsufficientBalanceError("repay exceeds borrow shares of " + to_hex(borrower));
        }

        U128 amount = borrows.to_amount(shares, true);
        borrows.amount = wide::sub(borrows.amount, amount, "total borrow amount");
        borrows.shares -= shares;
        pos.borrow_shares -= shares;

        commit(s);
        return pos.borrow_shares;
    });
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult LendingPool::liquidate(const Address& liquidator, const Address& borrower,
                                         U128 shares) {
    return guarded("liquidate", [&] {
        PendingState s = begin();
        U128 rate = refresh_exchange_rate(s);

        LedgerTotals& assets = s.accrual.total_asset;
        LedgerTotals& borrows = s.accrual.total_borrow;
        UserPosition& pos = position(s, borrower);

        if (pos.borrow_shares == 0) {
            throw LiquidationNotEligibleError(to_hex(borrower) + " has no debt");
        }
        if (shares == 0) {
            throw InsufficientBalanceError("nothing to liquidate");
        }

        bool matured = terms_.matured(s.now);
        U128 debt = borrows.to_amount(pos.borrow_shares, true);
        if (!matured && lendpool::is_solvent(pos.collateral_balance, debt, rate, config_.max_ltv)) {
            throw LiquidationNotEligibleError(to_hex(borrower) + " is solvent");
        }

        LiquidationQuote quote = quote_liquidation(borrows, pos.borrow_shares, pos.collateral_balance,
                                                   shares, rate, config_.liquidation_fee);

        borrows.amount = wide::sub(borrows.amount, quote.amount_to_repay, "total borrow amount");
        borrows.shares -= quote.shares_liquidated;
        pos.borrow_shares -= quote.shares_liquidated;

        pos.collateral_balance -= quote.collateral_seized;
        s.total_collateral -= quote.collateral_seized;

        if (quote.bad_debt_shares > 0) {
            borrows.amount = wide::sub(borrows.amount, quote.bad_debt_amount, "total borrow amount");
            borrows.shares -= quote.bad_debt_shares;
            assets.amount = wide::sub(assets.amount, quote.bad_debt_amount, "total asset amount");
            pos.borrow_shares -= quote.bad_debt_shares;
        }

        commit(s);

        LiquidationResult result{};
        result.liquidator = liquidator;
        result.borrower = borrower;
        result.shares_liquidated = quote.shares_liquidated;
        result.amount_repaid = quote.amount_to_repay;
        result.collateral_seized = quote.collateral_seized;
        result.bad_debt_shares = quote.bad_debt_shares;
        result.bad_debt_amount = quote.bad_debt_amount;
        result.matured = matured;

        std::ostringstream msg;
        msg << "liquidated " << to_hex(borrower) << " by " << to_hex(liquidator)
            << ": shares=" << wide::to_string(result.shares_liquidated)
            << " repaid=" << wide::to_string(result.amount_repaid)
            << " seized=" << result.collateral_seized
            << " bad_debt=" << wide::to_string(result.bad_debt_amount);
        log::info(msg.str());

        return result;
    });
}

// =============================================================================
// Maintenance
// =============================================================================

InterestReport LendingPool::add_interest() {
    return guarded("add_interest", [&] {
        PendingState s = begin();
        InterestReport report{s.accrual.interest_earned, s.accrual.fee_amount,
                              s.accrual.new_rate, s.accrual.utilization};
        commit(s);
        return report;
    });
}

U128 LendingPool::update_exchange_rate() {
    return guarded("update_exchange_rate", [&] {
        PendingState s = begin();
        U128 rate = refresh_exchange_rate(s);
        commit(s);
        return rate;
    });
}

// =============================================================================
// Internal Helpers
// =============================================================================

LendingPool::PendingState LendingPool::begin() const {
    PendingState s;
    s.now = clock_();
    s.accrual = accrue_interest(total_asset_, total_borrow_, rate_info_, *calculator_, terms_, s.now);
    s.total_collateral = total_collateral_;
    s.exchange_info = exchange_info_;

    if (s.accrual.fee_shares > 0) {
        UserPosition& fee_pos = position(s, config_.fee_recipient);
        fee_pos.asset_shares += s.accrual.fee_shares;
    }
    return s;
}

void LendingPool::commit(PendingState& s) {
    total_asset_ = s.accrual.total_asset;
    total_borrow_ = s.accrual.total_borrow;
    rate_info_ = s.accrual.rate_info;
    total_collateral_ = s.total_collateral;
    exchange_info_ = s.exchange_info;

    for (auto& [user, pos] : s.touched) {
        if (pos.empty()) {
            positions_.erase(user);
        } else {
            positions_[user] = pos;
        }
    }
}

UserPosition& LendingPool::position(PendingState& s, const Address& user) const {
    auto it = s.touched.find(user);
    if (it == s.touched.end()) {
        it = s.touched.emplace(user, user_position(user)).first;
    }
    return it->second;
}

U128 LendingPool::refresh_exchange_rate(PendingState& s) const {
    U128 rate = oracle_.exchange_rate(s.now);
    s.exchange_info.exchange_rate = rate;
    s.exchange_info.last_timestamp = s.now;
    return rate;
}

void LendingPool::require_not_matured(const PendingState& s, const char* action) const {
    if (terms_.matured(s.now)) {
        throw PastMaturityError(std::string(action) + " not allowed after maturity");
    }
}

} // namespace lendpool

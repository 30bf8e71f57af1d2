// =============================================================================
// accrual.cpp - Interest accrual
// =============================================================================

#include "lendpool/accrual.hpp"
#include "lendpool/log.hpp"
#include "lendpool/math.hpp"

#include <sstream>

namespace lendpool {

uint64_t utilization_of(const LedgerTotals& total_asset, const LedgerTotals& total_borrow,
                        uint64_t utilization_precision) {
    if (total_asset.amount == 0) return 0;

    U256 util = (wide::widen(total_borrow.amount) * utilization_precision)
              / wide::widen(total_asset.amount);
    if (util > utilization_precision) return utilization_precision;
    return static_cast<uint64_t>(util);
}

AccrualResult accrue_interest(const LedgerTotals& total_asset,
                              const LedgerTotals& total_borrow,
                              const RateInfo& rate_info,
                              const IRateCalculator& calculator,
                              const MaturityTerms& terms,
                              uint64_t now) {
    AccrualResult result;
    result.total_asset = total_asset;
    result.total_borrow = total_borrow;
    result.rate_info = rate_info;
    result.new_rate = rate_info.rate_per_sec;
    result.utilization = utilization_of(total_asset, total_borrow, calculator.utilization_precision());

    // Already current (or clock went backwards)
    if (now <= rate_info.last_timestamp) {
        return result;
    }

    // Empty pool; move the clock so idle time is never billed later
    if (total_asset.amount == 0) {
        result.rate_info.last_timestamp = now;
        return result;
    }

    uint64_t elapsed = now - rate_info.last_timestamp;

    uint64_t new_rate = terms.matured(now)
        ? terms.penalty_rate
        : calculator.update_rate(result.utilization, rate_info.rate_per_sec, elapsed);

    result.new_rate = new_rate;
    result.rate_info.rate_per_sec = new_rate;
    result.rate_info.last_timestamp = now;

    // Rate still follows zero utilization, but there is no debt to charge
    if (total_borrow.shares == 0) {
        return result;
    }

    // Truncates toward zero
    U256 interest = (wide::widen(total_borrow.amount) * new_rate * elapsed) / precision::RATE;

    const U256 limit = wide::widen(U128_MAX);
    if (wide::widen(total_borrow.amount) + interest > limit ||
        wide::widen(total_asset.amount) + interest > limit) {
        std::ostringstream msg;
        msg << "accrual skipped: interest " << interest << " would overflow pool totals";
        log::warn(msg.str());
        return result;
    }

    U128 earned = wide::narrow(interest, "interest earned");
    result.interest_earned = earned;
    result.total_borrow.amount += earned;
    result.total_asset.amount += earned;
    result.accrued = true;

    if (rate_info.fee_to_protocol_rate > 0 && earned > 0) {
        U128 fee = wide::narrow(
            (interest * rate_info.fee_to_protocol_rate) / precision::FEE, "protocol fee");
        // Fee is paid by diluting lenders: shares priced against the
        // post-interest amount and the pre-mint share count
        U128 fee_shares = shares_for_amount(result.total_asset.amount, total_asset.shares, fee, false);
        result.fee_amount = fee;
        result.fee_shares = fee_shares;
        result.total_asset.shares = wide::add(result.total_asset.shares, fee_shares, "asset shares");
    }

    if (log::enabled(log::Level::DEBUG)) {
        std::ostringstream msg;
        msg << "accrued interest=" << wide::to_string(earned)
            << " fee=" << wide::to_string(result.fee_amount)
            << " rate_per_sec=" << new_rate
            << " utilization=" << result.utilization
            << " elapsed=" << elapsed;
        log::debug(msg.str());
    }

    return result;
}

} // namespace lendpool

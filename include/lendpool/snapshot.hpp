#ifndef LENDPOOL_SNAPSHOT_HPP
#define LENDPOOL_SNAPSHOT_HPP

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace lendpool {

// =============================================================================
// Per-User Position
// =============================================================================

struct UserPosition {
    U128 asset_shares = 0;       // lender claim
    U128 borrow_shares = 0;      // debt claim
    U256 collateral_balance = 0;

    bool empty() const {
        return asset_shares == 0 && borrow_shares == 0 && collateral_balance == 0;
    }

    bool operator==(const UserPosition& other) const {
        return asset_shares == other.asset_shares &&
               borrow_shares == other.borrow_shares &&
               collateral_balance == other.collateral_balance;
    }
    bool operator!=(const UserPosition& other) const { return !(*this == other); }
};

// =============================================================================
// PoolAccountingSnapshot - read-only aggregate view between actions
// =============================================================================

struct PoolAccountingSnapshot {
    U128 total_asset_amount = 0;
    U128 total_asset_shares = 0;
    U128 total_borrow_amount = 0;
    U128 total_borrow_shares = 0;
    U256 total_collateral = 0;

    bool operator==(const PoolAccountingSnapshot& other) const {
        return total_asset_amount == other.total_asset_amount &&
               total_asset_shares == other.total_asset_shares &&
               total_borrow_amount == other.total_borrow_amount &&
               total_borrow_shares == other.total_borrow_shares &&
               total_collateral == other.total_collateral;
    }
    bool operator!=(const PoolAccountingSnapshot& other) const { return !(*this == other); }
};

// JSON with every value as a decimal string
void to_json(nlohmann::json& j, const UserPosition& position);
void to_json(nlohmann::json& j, const PoolAccountingSnapshot& snapshot);

} // namespace lendpool

#endif // LENDPOOL_SNAPSHOT_HPP

// =============================================================================
// snapshot.cpp - JSON projection of accounting state
// =============================================================================

#include "lendpool/snapshot.hpp"
#include "lendpool/math.hpp"

#include <nlohmann/json.hpp>

namespace lendpool {

void to_json(nlohmann::json& j, const UserPosition& position) {
    j = nlohmann::json{
        {"asset_shares", wide::to_string(position.asset_shares)},
        {"borrow_shares", wide::to_string(position.borrow_shares)},
        {"collateral_balance", position.collateral_balance.str()}
    };
}

void to_json(nlohmann::json& j, const PoolAccountingSnapshot& snapshot) {
    j = nlohmann::json{
        {"total_asset_amount", wide::to_string(snapshot.total_asset_amount)},
        {"total_asset_shares", wide::to_string(snapshot.total_asset_shares)},
        {"total_borrow_amount", wide::to_string(snapshot.total_borrow_amount)},
        {"total_borrow_shares", wide::to_string(snapshot.total_borrow_shares)},
        {"total_collateral", snapshot.total_collateral.str()}
    };
}

} // namespace lendpool

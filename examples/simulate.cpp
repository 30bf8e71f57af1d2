// lendpool - Simulation Example
// Runs a lender, a borrower and a liquidator through one pool and prints the
// accounting state as JSON

#include <lendpool/config.hpp>
#include <lendpool/errors.hpp>
#include <lendpool/log.hpp>
#include <lendpool/math.hpp>
#include <lendpool/pool.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>

using namespace lendpool;

namespace {

constexpr uint64_t START = 1700000000;
constexpr U128 UNIT = static_cast<U128>(1000000000000000000ULL);

nlohmann::json state_of(const LendingPool& pool) {
    nlohmann::json out;
    out["snapshot"] = pool.snapshot();
    out["rate_per_sec"] = pool.current_rate_info().rate_per_sec;
    out["utilization"] = pool.utilization();

    nlohmann::json positions = nlohmann::json::object();
    for (const auto& [user, position] : pool.positions()) {
        positions[to_hex(user)] = position;
    }
    out["positions"] = positions;
    return out;
}

} // namespace

int main(int argc, char** argv) {
    PoolConfig config;

    try {
        if (argc > 1) {
            config = PoolConfig::from_file(argv[1]);
        } else {
            config.with_name("WETH/USDC")
                  .with_protocol_fee(10000, address_from_id(99));
        }
        log::set_level(log::parse_level(config.general.log_level));
    } catch (const ConfigurationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    auto now = std::make_shared<uint64_t>(START);
    auto clock = [now] { return *now; };

    // Collateral priced at 1 asset unit
    auto feed = std::make_shared<ManualPriceFeed>("collateral/asset", 18);
    feed->set_price(UNIT, START);

    const Address lender = address_from_id(1);
    const Address borrower = address_from_id(2);
    const Address liquidator = address_from_id(3);

    try {
        LendingPool pool(config, ExchangeRateOracle(feed, nullptr, config.oracle), clock);

        std::cout << "Depositing 10000 units...\n";
        pool.deposit(10000 * UNIT, lender);

        std::cout << "Borrowing 7000 units against 10000 collateral...\n";
        auto receipt = pool.borrow_asset(borrower, 7000 * UNIT, wide::widen(10000 * UNIT));
        std::cout << "  borrow shares: " << wide::to_string(receipt.shares_owed) << "\n";

        for (int day = 1; day <= 30; ++day) {
            *now += 86400;
            feed->set_price(UNIT, *now);
            auto report = pool.add_interest();
            if (day % 10 == 0) {
                std::cout << "Day " << day
                          << ": interest=" << wide::to_string(report.interest_earned)
                          << " rate_per_sec=" << report.new_rate
                          << " utilization=" << report.utilization << "\n";
            }
        }

        std::cout << "Collateral price drops 40%...\n";
        feed->set_price(UNIT * 6 / 10, *now);
        pool.update_exchange_rate();

        if (!pool.is_solvent(borrower)) {
            auto result = pool.liquidate(liquidator, borrower, pool.borrow_shares(borrower) / 2);
            std::cout << "Liquidated " << wide::to_string(result.shares_liquidated)
                      << " shares, seized " << result.collateral_seized << " collateral\n";
        }

        std::cout << state_of(pool).dump(2) << "\n";
    } catch (const PoolError& e) {
        std::cerr << "Error (" << to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }

    return 0;
}

// lendpool - Interest Accrual Tests

#include <catch2/catch.hpp>
#include <lendpool/accrual.hpp>
#include <lendpool/log.hpp>

#include "test_helpers.hpp"

using namespace lendpool;
using lendpool::testing::START_TIME;

namespace {

VariableRateCalculator band_calculator() {
    VariableRateParams p;
    p.min_utilization = 50000;
    p.max_utilization = 80000;
    p.min_interest = 1000;
    p.max_interest = 1000000000000000ULL;
    p.half_life = 3600;
    return VariableRateCalculator(p);
}

RateInfo rate_at(uint64_t timestamp, uint64_t rate, uint64_t fee = 0) {
    RateInfo info;
    info.last_timestamp = timestamp;
    info.fee_to_protocol_rate = fee;
    info.rate_per_sec = rate;
    return info;
}

} // namespace

TEST_CASE("Utilization", "[accrual]") {
    REQUIRE(utilization_of({0, 0}, {0, 0}, 100000) == 0);
    REQUIRE(utilization_of({1000, 1000}, {600, 600}, 100000) == 60000);
    REQUIRE(utilization_of({1000, 1000}, {600, 600}, 1000000000000000000ULL) == 600000000000000000ULL);
    // Never reported above 100%
    REQUIRE(utilization_of({1000, 1000}, {5000, 5000}, 100000) == 100000);
}

TEST_CASE("Accrual without elapsed time is a no-op", "[accrual]") {
    auto calc = band_calculator();
    LedgerTotals assets{1000000, 1000000};
    LedgerTotals borrows{600000, 600000};
    RateInfo info = rate_at(START_TIME, 1000000000000ULL);

    SECTION("Same timestamp") {
        auto r = accrue_interest(assets, borrows, info, calc, {}, START_TIME);
        REQUIRE_FALSE(r.accrued);
        REQUIRE(r.interest_earned == U128(0));
        REQUIRE(r.total_asset == assets);
        REQUIRE(r.total_borrow == borrows);
        REQUIRE(r.rate_info == info);
    }

    SECTION("Clock behind the last accrual") {
        auto r = accrue_interest(assets, borrows, info, calc, {}, START_TIME - 100);
        REQUIRE(r.rate_info == info);
        REQUIRE(r.total_borrow == borrows);
    }

    SECTION("Second accrual at the same time changes nothing") {
        auto first = accrue_interest(assets, borrows, info, calc, {}, START_TIME + 1000);
        auto second = accrue_interest(first.total_asset, first.total_borrow, first.rate_info,
                                      calc, {}, START_TIME + 1000);
        REQUIRE(second.total_asset == first.total_asset);
        REQUIRE(second.total_borrow == first.total_borrow);
        REQUIRE(second.rate_info == first.rate_info);
        REQUIRE(second.interest_earned == U128(0));
    }
}

TEST_CASE("Idle pool charges no interest", "[accrual]") {
    auto calc = band_calculator();
    RateInfo info = rate_at(START_TIME, 1000000000000ULL);

    SECTION("No assets") {
        auto r = accrue_interest({0, 0}, {0, 0}, info, calc, {}, START_TIME + 5000);
        REQUIRE(r.rate_info.last_timestamp == START_TIME + 5000);
        REQUIRE(r.rate_info.rate_per_sec == info.rate_per_sec);
        REQUIRE(r.interest_earned == U128(0));
        REQUIRE_FALSE(r.accrued);
    }

    SECTION("Assets but no borrows") {
        // Zero utilization sits below the band, so the rate decays
        LedgerTotals assets{1000000, 1000000};
        auto r = accrue_interest(assets, {0, 0}, info, calc, {}, START_TIME + 5000);
        REQUIRE(r.rate_info.last_timestamp == START_TIME + 5000);
        REQUIRE(r.utilization == 0);
        REQUIRE(r.new_rate < info.rate_per_sec);
        REQUIRE(r.new_rate >= calc.min_rate());
        REQUIRE(r.rate_info.rate_per_sec == r.new_rate);
        REQUIRE(r.new_rate == calc.update_rate(0, info.rate_per_sec, 5000));
        REQUIRE(r.interest_earned == U128(0));
        REQUIRE(r.total_asset == assets);
        REQUIRE(r.total_borrow == LedgerTotals{});
        REQUIRE_FALSE(r.accrued);
    }

    SECTION("Assets but no borrows after maturity") {
        MaturityTerms terms{START_TIME + 100, 2000000000000ULL};
        auto r = accrue_interest({1000000, 1000000}, {0, 0}, info, calc, terms, START_TIME + 5000);
        REQUIRE(r.new_rate == 2000000000000ULL);
        REQUIRE(r.interest_earned == U128(0));
    }
}

TEST_CASE("Interest is booked to both sides", "[accrual]") {
    auto calc = band_calculator();
    LedgerTotals assets{1000000, 1000000};
    LedgerTotals borrows{600000, 600000};

    SECTION("Exact interest without fee") {
        // 600000 * 1e12 * 1000 / 1e18 = 600
        auto r = accrue_interest(assets, borrows, rate_at(START_TIME, 1000000000000ULL), calc, {},
                                 START_TIME + 1000);
        REQUIRE(r.accrued);
        REQUIRE(r.interest_earned == U128(600));
        REQUIRE(r.total_borrow.amount == U128(600600));
        REQUIRE(r.total_asset.amount == U128(1000600));
        REQUIRE(r.total_borrow.shares == borrows.shares);
        REQUIRE(r.total_asset.shares == assets.shares);
        REQUIRE(r.utilization == 60000);
        REQUIRE(r.new_rate == 1000000000000ULL);
        REQUIRE(r.rate_info.last_timestamp == START_TIME + 1000);
        REQUIRE(r.fee_shares == U128(0));
    }

    SECTION("Protocol fee dilutes lenders") {
        // fee = 600 * 10% = 60, shares = 60 * 1000000 / 1000600 = 59
        auto r = accrue_interest(assets, borrows, rate_at(START_TIME, 1000000000000ULL, 10000),
                                 calc, {}, START_TIME + 1000);
        REQUIRE(r.fee_amount == U128(60));
        REQUIRE(r.fee_shares == U128(59));
        REQUIRE(r.total_asset.shares == U128(1000059));
        REQUIRE(r.total_asset.amount == U128(1000600));
        REQUIRE(r.rate_info.fee_to_protocol_rate == 10000);
    }

    SECTION("Truncation never rounds interest up") {
        // 600000 * 1000 * 1 / 1e18 truncates to zero
        auto r = accrue_interest(assets, borrows, rate_at(START_TIME, 1000), calc, {},
                                 START_TIME + 1);
        REQUIRE(r.interest_earned == U128(0));
        REQUIRE(r.total_borrow == borrows);
        REQUIRE(r.rate_info.last_timestamp == START_TIME + 1);
    }

    SECTION("Rate moves with utilization") {
        LedgerTotals busy{900000, 900000};
        auto r = accrue_interest(assets, busy, rate_at(START_TIME, 1000000000000ULL), calc, {},
                                 START_TIME + 3600);
        REQUIRE(r.new_rate > 1000000000000ULL);
        REQUIRE(r.rate_info.rate_per_sec == r.new_rate);
        // Interest is charged at the updated rate
        U128 expected = (U128(900000) * r.new_rate * 3600) / U128(precision::RATE);
        REQUIRE(r.interest_earned == expected);
    }
}

TEST_CASE("Penalty rate applies after maturity", "[accrual]") {
    auto calc = band_calculator();
    LedgerTotals assets{1000000, 1000000};
    LedgerTotals borrows{600000, 600000};
    MaturityTerms terms{START_TIME + 500, 2000000000000ULL};

    SECTION("Before maturity the curve is used") {
        auto r = accrue_interest(assets, borrows, rate_at(START_TIME, 1000000000000ULL), calc,
                                 terms, START_TIME + 500);
        REQUIRE(r.new_rate == 1000000000000ULL);
    }

    SECTION("After maturity the penalty replaces the curve") {
        // 600000 * 2e12 * 1000 / 1e18 = 1200
        auto r = accrue_interest(assets, borrows, rate_at(START_TIME, 1000000000000ULL), calc,
                                 terms, START_TIME + 1000);
        REQUIRE(r.new_rate == 2000000000000ULL);
        REQUIRE(r.interest_earned == U128(1200));
    }
}

TEST_CASE("Borrow amount never decreases across accruals", "[accrual]") {
    auto calc = band_calculator();
    LedgerTotals assets{1000000000, 1000000000};
    LedgerTotals borrows{850000000, 850000000};
    RateInfo info = rate_at(START_TIME, 5000000000000ULL);

    uint64_t now = START_TIME;
    for (int i = 0; i < 50; ++i) {
        now += 97 * (i + 1);
        auto r = accrue_interest(assets, borrows, info, calc, {}, now);
        REQUIRE(r.total_borrow.amount >= borrows.amount);
        REQUIRE(r.total_asset.amount >= assets.amount);
        REQUIRE(r.new_rate >= calc.min_rate());
        REQUIRE(r.new_rate <= calc.max_rate());
        assets = r.total_asset;
        borrows = r.total_borrow;
        info = r.rate_info;
    }
}

TEST_CASE("Interest beyond 128 bits is skipped", "[accrual]") {
    log::set_level(log::Level::OFF);

    auto calc = band_calculator();
    LedgerTotals assets{U128_MAX - 10, U128_MAX - 10};
    LedgerTotals borrows{U128_MAX - 10, U128_MAX - 10};
    RateInfo info = rate_at(START_TIME, 1000000000000ULL);

    auto r = accrue_interest(assets, borrows, info, calc, {}, START_TIME + 86400);
    REQUIRE_FALSE(r.accrued);
    REQUIRE(r.interest_earned == U128(0));
    REQUIRE(r.total_asset == assets);
    REQUIRE(r.total_borrow == borrows);
    REQUIRE(r.rate_info.last_timestamp == START_TIME + 86400);
    REQUIRE(r.rate_info.rate_per_sec > info.rate_per_sec);

    log::set_level(log::Level::INFO);
}

// lendpool - Pool Configuration Tests

#include <catch2/catch.hpp>
#include <lendpool/access.hpp>
#include <lendpool/config.hpp>
#include <lendpool/errors.hpp>
#include <lendpool/log.hpp>

#include <variant>

#include "test_helpers.hpp"

using namespace lendpool;

TEST_CASE("Config defaults", "[config]") {
    PoolConfig config;

    REQUIRE(config.max_ltv == 75000);
    REQUIRE(config.liquidation_fee == 10000);
    REQUIRE(config.fee_to_protocol_rate == 0);
    REQUIRE(config.maturity == 0);
    REQUIRE(config.initial_rate_per_sec == rates::DEFAULT_RATE_PER_SEC);
    REQUIRE(config.general.log_level == "info");
    REQUIRE(std::holds_alternative<VariableRateParams>(config.rate_model));
    REQUIRE_FALSE(config.approved_borrowers.has_value());
    REQUIRE_FALSE(config.approved_lenders.has_value());
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config builder", "[config]") {
    const Address treasury = address_from_id(99);
    const Address alice = address_from_id(1);

    PoolConfig config;
    config.with_name("WETH/USDC")
          .with_max_ltv(80000)
          .with_liquidation_fee(5000)
          .with_protocol_fee(10000, treasury)
          .with_maturity(1800000000, 5000000000ULL)
          .approve_borrower(alice)
          .set_log_level("debug");

    REQUIRE(config.name == "WETH/USDC");
    REQUIRE(config.max_ltv == 80000);
    REQUIRE(config.liquidation_fee == 5000);
    REQUIRE(config.fee_to_protocol_rate == 10000);
    REQUIRE(config.fee_recipient == treasury);
    REQUIRE(config.maturity == 1800000000);
    REQUIRE(config.penalty_rate == 5000000000ULL);
    REQUIRE(config.approved_borrowers->count(alice) == 1);
    REQUIRE_FALSE(config.approved_lenders.has_value());
    REQUIRE(config.general.log_level == "debug");
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config from JSON", "[config]") {
    SECTION("Full document") {
        auto config = PoolConfig::from_json(R"({
            "name": "test pool",
            "log_level": "warn",
            "max_ltv": 70000,
            "liquidation_fee": "8000",
            "fee_to_protocol_rate": 5000,
            "fee_recipient": "0x00000000000000000000000000000000000000ff",
            "maturity": 0,
            "initial_rate_per_sec": 200000000,
            "rate_model": {
                "kind": "linear",
                "min_interest": 1000,
                "vertex_interest": 5000,
                "max_interest": 105000,
                "vertex_utilization": 90000
            },
            "oracle": {
                "max_staleness": 600,
                "normalization_exponent": -12
            },
            "approved_lenders": ["0x0000000000000000000000000000000000000001"]
        })");

        REQUIRE(config.name == "test pool");
        REQUIRE(config.general.log_level == "warn");
        REQUIRE(config.max_ltv == 70000);
        REQUIRE(config.liquidation_fee == 8000);
        REQUIRE(config.fee_to_protocol_rate == 5000);
        REQUIRE(config.fee_recipient == address_from_id(255));
        REQUIRE(config.initial_rate_per_sec == 200000000);
        REQUIRE(config.oracle.max_staleness == 600);
        REQUIRE(config.oracle.normalization_exponent == -12);

        const auto* linear = std::get_if<LinearRateParams>(&config.rate_model);
        REQUIRE(linear != nullptr);
        REQUIRE(linear->vertex_utilization == 90000);
        REQUIRE(linear->max_interest == 105000);

        REQUIRE_FALSE(config.approved_borrowers.has_value());
        REQUIRE(config.approved_lenders.has_value());
        REQUIRE(config.approved_lenders->count(address_from_id(1)) == 1);
    }

    SECTION("Missing keys keep defaults") {
        auto config = PoolConfig::from_json(R"({"rate_model": {"kind": "variable", "half_life": 3600}})");
        REQUIRE(config.max_ltv == 75000);
        const auto& variable = std::get<VariableRateParams>(config.rate_model);
        REQUIRE(variable.half_life == 3600);
        REQUIRE(variable.min_utilization == 75000);
        REQUIRE(variable.max_interest == rates::MAX_VARIABLE_RATE);
    }

    SECTION("Empty allow-list admits nobody but is present") {
        auto config = PoolConfig::from_json(R"({"approved_borrowers": []})");
        REQUIRE(config.approved_borrowers.has_value());
        REQUIRE(config.approved_borrowers->empty());
    }
}

TEST_CASE("Invalid configs are rejected", "[config]") {
    SECTION("Zero LTV") {
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"max_ltv": 0})"), ConfigurationError);
        PoolConfig config;
        config.with_max_ltv(0);
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("LTV above 100%") {
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"max_ltv": 100001})"), ConfigurationError);
    }

    SECTION("Fee above 100%") {
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"fee_to_protocol_rate": 100001})"),
                          ConfigurationError);
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"liquidation_fee": 100001})"),
                          ConfigurationError);
    }

    SECTION("Fee without recipient") {
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"fee_to_protocol_rate": 50000})"),
                          ConfigurationError);
        PoolConfig config;
        config.fee_to_protocol_rate = 50000;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
        config.with_protocol_fee(50000, address_from_id(99));
        REQUIRE_NOTHROW(config.validate());
        // A recipient alone is harmless
        REQUIRE_NOTHROW(PoolConfig::from_json(
            R"({"fee_recipient": "0x0000000000000000000000000000000000000063"})"));
    }

    SECTION("Malformed rate constants") {
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"rate_model": {"kind": "cubic"}})"),
                          ConfigurationError);
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"rate_model": {"half_life": 0}})"),
                          ConfigurationError);
        REQUIRE_THROWS_AS(
            PoolConfig::from_json(R"({"rate_model": {"min_utilization": 90000, "max_utilization": 80000}})"),
            ConfigurationError);
    }

    SECTION("Bad value types") {
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"max_ltv": -5})"), ConfigurationError);
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"max_ltv": "7x"})"), ConfigurationError);
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"approved_lenders": "0x01"})"), ConfigurationError);
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"approved_lenders": [42]})"), ConfigurationError);
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"fee_recipient": "0x1234"})"), ConfigurationError);
    }

    SECTION("Malformed documents") {
        REQUIRE_THROWS_AS(PoolConfig::from_json("{not json"), ConfigurationError);
        REQUIRE_THROWS_AS(PoolConfig::from_json("[1, 2]"), ConfigurationError);
    }

    SECTION("Unknown log level") {
        REQUIRE_THROWS_AS(PoolConfig::from_json(R"({"log_level": "verbose"})"), ConfigurationError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(PoolConfig::from_file("/nonexistent/pool.json"), ConfigurationError);
    }
}

TEST_CASE("Log levels", "[config][log]") {
    REQUIRE(log::parse_level("debug") == log::Level::DEBUG);
    REQUIRE(log::parse_level("off") == log::Level::OFF);
    REQUIRE(std::string(log::level_name(log::Level::WARN)) == "warn");
    REQUIRE_THROWS_AS(log::parse_level("loud"), ConfigurationError);

    log::set_level(log::Level::WARN);
    REQUIRE_FALSE(log::enabled(log::Level::INFO));
    REQUIRE(log::enabled(log::Level::ERROR));
    log::set_level(log::Level::INFO);
}

TEST_CASE("Addresses", "[config]") {
    Address a = address_from_id(0x1234);
    REQUIRE(to_hex(a) == "0x0000000000000000000000000000000000001234");
    REQUIRE(address_from_hex(to_hex(a)) == a);
    REQUIRE(address_from_hex("0000000000000000000000000000000000001234") == a);
    REQUIRE_THROWS_AS(address_from_hex("0xzz00000000000000000000000000000000001234"), ConfigurationError);
}

TEST_CASE("Access policy", "[config][access]") {
    const Address alice = address_from_id(1);
    const Address bob = address_from_id(2);

    SECTION("No lists admit everyone") {
        AccessPolicy open;
        REQUIRE_FALSE(open.borrowers_restricted());
        REQUIRE(open.borrower_allowed(bob));
        REQUIRE_NOTHROW(open.require_lender(alice));
    }

    SECTION("A list admits only its members") {
        AccessPolicy policy(std::set<Address>{alice}, std::set<Address>{});
        REQUIRE(policy.borrowers_restricted());
        REQUIRE(policy.lenders_restricted());
        REQUIRE(policy.borrower_allowed(alice));
        REQUIRE_THROWS_AS(policy.require_borrower(bob), ConfigurationError);
        REQUIRE_THROWS_AS(policy.require_lender(alice), ConfigurationError);
    }
}

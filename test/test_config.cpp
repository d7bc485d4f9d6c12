// Predix - Configuration Tests

#include <catch2/catch.hpp>

#include "predix/config.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"

using namespace predix;

namespace {

ErrorCode load_error(const char* text) {
    try {
        Config::from_json(text);
    } catch (const Error& e) {
        return e.code();
    }
    FAIL("expected predix::Error");
    return ErrorCode::InvalidInput;
}

} // namespace

TEST_CASE("Default configuration", "[config]") {
    Config config;
    REQUIRE_NOTHROW(config.validate());

    REQUIRE(config.general.log_level == "info");
    REQUIRE(config.pricing.lmsr_liquidity_x18 == x18::from_int(100));
    REQUIRE(config.solver.max_iterations == 10);
    REQUIRE(config.solver.tolerance_x18 == X18_ONE / 1000000);
    REQUIRE(config.integration.points == 10);
    REQUIRE(config.coverage.min_coverage_x18 == X18_HALF);
    REQUIRE(config.coverage.cooldown_cycles == 3);
    REQUIRE(config.leverage.base_max == 100);
    REQUIRE(config.liquidation.cap_min_bps == 200);
    REQUIRE(config.liquidation.cap_max_bps == 800);
    REQUIRE(config.liquidation.keeper_incentive_bps == 5);
    REQUIRE(config.chain.borrow_multiplier_x18 == x18::parse("1.5"));
}

TEST_CASE("Builder methods", "[config]") {
    Config config;
    config.with_fee_bps(30)
          .with_lmsr_liquidity(x18::from_int(250))
          .with_integration_points(16)
          .with_keeper_incentive_bps(10)
          .with_period_seconds(60);

    REQUIRE(config.pricing.fee_bps == 30);
    REQUIRE(config.pricing.lmsr_liquidity_x18 == x18::from_int(250));
    REQUIRE(config.integration.points == 16);
    REQUIRE(config.liquidation.keeper_incentive_bps == 10);
    REQUIRE(config.liquidation.period_seconds == 60);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Loading from JSON", "[config]") {
    SECTION("Sections override defaults") {
        Config config = Config::from_json(R"({
            "general": {"log_level": "debug"},
            "pricing": {"fee_bps": 25, "lmsr_liquidity": "250.5", "spread_tolerance": 0.1},
            "solver": {"max_iterations": 12},
            "integration": {"points": 14, "tolerance": "1e-9"},
            "liquidation": {"period_seconds": 600, "sigma_scale": 2},
            "chain": {"stake_multiplier": "1.05"}
        })");

        REQUIRE(config.general.log_level == "debug");
        REQUIRE(config.pricing.fee_bps == 25);
        REQUIRE(config.pricing.lmsr_liquidity_x18 == x18::parse("250.5"));
        REQUIRE(config.pricing.spread_tolerance_x18 == X18_ONE / 10);
        REQUIRE(config.solver.max_iterations == 12);
        REQUIRE(config.integration.points == 14);
        REQUIRE(config.integration.tolerance_x18 == X18_ONE / 1000000000);
        REQUIRE(config.liquidation.period_seconds == 600);
        REQUIRE(config.liquidation.sigma_scale_x18 == 2 * X18_ONE);
        REQUIRE(config.chain.stake_multiplier_x18 == x18::parse("1.05"));

        // untouched sections keep their defaults
        REQUIRE(config.coverage.window == 8);
    }

    SECTION("Unknown keys are ignored") {
        Config config = Config::from_json(R"({"pricing": {"colour": "blue"}, "extra": 1})");
        REQUIRE(config.pricing.fee_bps == 0);
    }

    SECTION("Wrong types") {
        REQUIRE(load_error(R"({"pricing": {"fee_bps": "ten"}})") == ErrorCode::ConfigError);
        REQUIRE(load_error(R"({"solver": {"max_iterations": -1}})") == ErrorCode::ConfigError);
        REQUIRE(load_error(R"({"pricing": {"lmsr_liquidity": true}})") == ErrorCode::ConfigError);
        REQUIRE(load_error(R"({"pricing": {"lmsr_liquidity": "lots"}})") == ErrorCode::ConfigError);
        REQUIRE(load_error(R"({"general": {"log_level": 3}})") == ErrorCode::ConfigError);
        REQUIRE(load_error(R"({"coverage": 5})") == ErrorCode::ConfigError);
    }

    SECTION("Malformed documents") {
        REQUIRE(load_error("{not json") == ErrorCode::ConfigError);
        REQUIRE(load_error("[1, 2]") == ErrorCode::ConfigError);
    }

    SECTION("Loaded values are validated") {
        REQUIRE(load_error(R"({"integration": {"points": 11}})") == ErrorCode::ConfigError);
        REQUIRE(load_error(R"({"general": {"log_level": "loud"}})") == ErrorCode::ConfigError);
        REQUIRE(load_error(R"({"liquidation": {"cap_min_bps": 900}})") == ErrorCode::ConfigError);
    }

    SECTION("Missing files") {
        try {
            Config::from_file("/nonexistent/predix.json");
            FAIL("expected ConfigError");
        } catch (const Error& e) {
            REQUIRE(e.code() == ErrorCode::ConfigError);
        }
    }
}

TEST_CASE("Validation ranges", "[config]") {
    auto rejects = [](Config c) {
        try {
            c.validate();
        } catch (const Error& e) {
            return e.code() == ErrorCode::ConfigError;
        }
        return false;
    };

    Config c;
    c.pricing.lmsr_liquidity_x18 = 0;
    REQUIRE(rejects(c));

    c = Config{};
    c.pricing.fee_bps = 10000;
    REQUIRE(rejects(c));

    c = Config{};
    c.solver.damping_x18 = 2 * X18_ONE;
    REQUIRE(rejects(c));

    c = Config{};
    c.integration.tolerance_x18 = X18_ONE / 100;
    REQUIRE(rejects(c));

    c = Config{};
    c.integration.max_refinements = 6;
    REQUIRE(rejects(c));

    c = Config{};
    c.coverage.drop_fraction_x18 = X18_ONE;
    REQUIRE(rejects(c));

    c = Config{};
    c.chain.borrow_multiplier_x18 = X18_HALF;
    REQUIRE(rejects(c));

    c = Config{};
    c.liquidation.period_seconds = 0;
    REQUIRE(rejects(c));
}

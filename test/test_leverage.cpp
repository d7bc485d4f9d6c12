// Predix - Leverage Cap Tests

#include <catch2/catch.hpp>

#include "predix/error.hpp"
#include "predix/fixed_point.hpp"
#include "predix/leverage.hpp"

using namespace predix;

TEST_CASE("Tier caps by outcome count", "[leverage]") {
    REQUIRE(LeverageCapResolver::tier_cap(1) == 100);
    REQUIRE(LeverageCapResolver::tier_cap(2) == 70);
    REQUIRE(LeverageCapResolver::tier_cap(3) == 25);
    REQUIRE(LeverageCapResolver::tier_cap(4) == 25);
    REQUIRE(LeverageCapResolver::tier_cap(5) == 15);
    REQUIRE(LeverageCapResolver::tier_cap(8) == 15);
    REQUIRE(LeverageCapResolver::tier_cap(16) == 12);
    REQUIRE(LeverageCapResolver::tier_cap(64) == 10);
    REQUIRE(LeverageCapResolver::tier_cap(65) == 5);
    REQUIRE_THROWS_AS(LeverageCapResolver::tier_cap(0), Error);
}

TEST_CASE("Depth and coverage caps", "[leverage]") {
    LeverageCapResolver resolver;

    REQUIRE(resolver.depth_cap(0) == x18::from_int(100));
    REQUIRE(resolver.depth_cap(2) == x18::from_int(120));
    REQUIRE(resolver.coverage_cap(X18_ONE, 4) == x18::from_int(50));
    REQUIRE(resolver.coverage_cap(0, 4) == 0);
    REQUIRE(resolver.coverage_cap(-X18_ONE, 4) == 0);
}

TEST_CASE("Resolved leverage takes the tightest cap", "[leverage]") {
    LeverageCapResolver resolver;
    const X18 sentinel = CoverageConfig{}.sentinel_x18;

    SECTION("Empty market is bounded by the base cap") {
        REQUIRE(resolver.resolve(sentinel, 1, 0) == 100);
    }

    SECTION("Tier cap binds") {
        REQUIRE(resolver.resolve(X18_ONE, 4, 0) == 25);
        REQUIRE(resolver.resolve(sentinel, 65, 3) == 5);
    }

    SECTION("Coverage cap binds") {
        REQUIRE(resolver.resolve(X18_ONE / 5, 1, 0) == 20);
        REQUIRE(resolver.resolve(X18_ONE / 5, 4, 0) == 10);
        REQUIRE(resolver.resolve(3 * X18_ONE / 10, 2, 0) == 21);
    }

    SECTION("Depth raises only the base cap") {
        LeverageConfig config;
        config.base_max = 50;
        LeverageCapResolver shallow(config);
        REQUIRE(shallow.resolve(sentinel, 1, 0) == 50);
        REQUIRE(shallow.resolve(sentinel, 1, 4) == 70);
    }

    SECTION("No coverage means no leverage") {
        REQUIRE(resolver.resolve(0, 2, 0) == 0);
    }
}

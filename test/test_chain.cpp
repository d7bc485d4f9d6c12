// Predix - Chain Unwind Tests

#include <catch2/catch.hpp>

#include "predix/chain.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"

#include <vector>

using namespace predix;

namespace {

ChainLeg leg(LegRole role, std::vector<uint32_t> deps = {}) {
    ChainLeg l;
    l.role = role;
    l.depends_on = std::move(deps);
    return l;
}

} // namespace

TEST_CASE("Chain cycle detection", "[chain]") {
    SECTION("A diamond is acyclic") {
        ChainPosition chain{1, {leg(LegRole::STAKE), leg(LegRole::LEVERAGE, {0}), leg(LegRole::LEVERAGE, {0}),
                                leg(LegRole::BORROW, {1, 2})}};
        REQUIRE_NOTHROW(ChainUnwindCoordinator::check_acyclic(chain));
    }

    SECTION("A back-edge is a cycle") {
        ChainPosition chain{2, {leg(LegRole::STAKE, {2}), leg(LegRole::LEVERAGE, {0}), leg(LegRole::BORROW, {1})}};
        try {
            ChainUnwindCoordinator::check_acyclic(chain);
            FAIL("expected CyclicChainDependency");
        } catch (const Error& e) {
            REQUIRE(e.code() == ErrorCode::CyclicChainDependency);
        }
    }

    SECTION("A self-dependency is a cycle") {
        ChainPosition chain{3, {leg(LegRole::STAKE, {0})}};
        REQUIRE_THROWS_AS(ChainUnwindCoordinator::check_acyclic(chain), Error);
    }

    SECTION("A dangling leg id is invalid input") {
        ChainPosition chain{4, {leg(LegRole::STAKE, {5})}};
        try {
            ChainUnwindCoordinator::check_acyclic(chain);
            FAIL("expected InvalidInput");
        } catch (const Error& e) {
            REQUIRE(e.code() == ErrorCode::InvalidInput);
        }
    }

    SECTION("A long line does not recurse") {
        ChainPosition chain;
        chain.legs.push_back(leg(LegRole::STAKE));
        for (uint32_t i = 1; i < 100000; ++i) chain.legs.push_back(leg(LegRole::STAKE, {i - 1}));
        REQUIRE_NOTHROW(ChainUnwindCoordinator::check_acyclic(chain));
    }
}

TEST_CASE("Chain unwind order and multiplier", "[chain]") {
    ChainPosition chain{9, {leg(LegRole::STAKE), leg(LegRole::LEVERAGE, {0}), leg(LegRole::BORROW, {1}),
                            leg(LegRole::STAKE), leg(LegRole::BORROW, {3})}};

    SECTION("Borrow, then leverage, then stake") {
        REQUIRE(ChainUnwindCoordinator::unwind_order(chain) == std::vector<uint32_t>{2, 4, 1, 0, 3});
    }

    SECTION("Multiplier is the product over legs") {
        ChainUnwindCoordinator coordinator;
        ChainPosition three{1, {leg(LegRole::BORROW), leg(LegRole::LEVERAGE), leg(LegRole::STAKE)}};
        REQUIRE(coordinator.chain_multiplier(three) == x18::parse("1.98"));
        REQUIRE(coordinator.chain_multiplier(ChainPosition{}) == X18_ONE);
        REQUIRE(coordinator.role_multiplier(LegRole::BORROW) == 3 * X18_HALF);
    }

    SECTION("Unwind closes every leg in order") {
        ChainUnwindCoordinator coordinator;
        std::vector<uint32_t> seen;
        auto closures = coordinator.unwind(chain, [&seen](uint32_t id, const ChainLeg& l) {
            seen.push_back(id);
            LegClosure c;
            c.leg = id;
            c.role = l.role;
            return c;
        });
        REQUIRE(seen == std::vector<uint32_t>{2, 4, 1, 0, 3});
        REQUIRE(closures.size() == 5);
        REQUIRE(closures.front().role == LegRole::BORROW);
        REQUIRE(closures.back().role == LegRole::STAKE);
    }

    SECTION("A cyclic chain closes nothing") {
        ChainUnwindCoordinator coordinator;
        ChainPosition cyclic{5, {leg(LegRole::BORROW, {1}), leg(LegRole::STAKE, {0})}};
        int calls = 0;
        REQUIRE_THROWS_AS(coordinator.unwind(cyclic, [&calls](uint32_t id, const ChainLeg&) {
            ++calls;
            LegClosure c;
            c.leg = id;
            return c;
        }), Error);
        REQUIRE(calls == 0);
    }
}

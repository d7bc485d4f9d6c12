// Predix - Coverage Engine Tests

#include <catch2/catch.hpp>

#include "predix/coverage.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"

using namespace predix;
using Catch::Detail::Approx;

namespace {

CoverageInputs inputs(int64_t vault, int64_t open_interest, uint32_t outcomes = 2) {
    CoverageInputs in;
    in.vault_x18 = x18::from_int(vault);
    in.open_interest_x18 = x18::from_int(open_interest);
    in.outcome_count = outcomes;
    return in;
}

} // namespace

TEST_CASE("Coverage ratios", "[coverage]") {
    CoverageEngine engine;

    SECTION("Base coverage against half the open interest") {
        REQUIRE(engine.base_coverage(x18::from_int(5000), x18::from_int(10000)) == X18_ONE);
        REQUIRE(engine.base_coverage(x18::from_int(5000), x18::from_int(50000)) == X18_ONE / 5);
        REQUIRE(engine.base_coverage(x18::from_int(5000), 0) == engine.config().sentinel_x18);
    }

    SECTION("Tail loss") {
        REQUIRE(CoverageEngine::tail_loss(2, 0) == X18_HALF);
        REQUIRE(CoverageEngine::tail_loss(1, 0) == X18_HALF);
        REQUIRE(CoverageEngine::tail_loss(4, 0) == 3 * X18_ONE / 4);
        REQUIRE(CoverageEngine::tail_loss(4, X18_ONE) == X18_ONE);
        REQUIRE(CoverageEngine::tail_loss(2, X18_HALF) == 3 * X18_ONE / 4);
    }

    SECTION("Full measure") {
        CoverageMeasure m = engine.measure(inputs(5000, 10000, 4));
        REQUIRE(m.tail_loss_x18 == 3 * X18_ONE / 4);
        REQUIRE(x18::to_double(m.coverage_x18) == Approx(5000.0 / 7500.0).margin(1e-15));
        REQUIRE(m.base_x18 == X18_ONE);

        CoverageMeasure empty = engine.measure(inputs(5000, 0));
        REQUIRE(empty.coverage_x18 == engine.config().sentinel_x18);
    }
}

TEST_CASE("Correlation factor", "[coverage]") {
    CorrelationInputs in;
    in.weights_x18 = {X18_ONE, X18_ONE, X18_ONE};
    in.correlations_x18 = {
        X18_ONE,  X18_HALF, -X18_HALF,
        X18_HALF, X18_ONE,  X18_ONE,
        -X18_HALF, X18_ONE, X18_ONE,
    };

    SECTION("Negative correlations count as zero") {
        REQUIRE(CoverageEngine::correlation_factor(in) == X18_HALF);
    }

    SECTION("A single market has no pairs") {
        CorrelationInputs one;
        one.weights_x18 = {X18_ONE};
        one.correlations_x18 = {X18_ONE};
        REQUIRE(CoverageEngine::correlation_factor(one) == 0);
    }

    SECTION("Malformed inputs") {
        CorrelationInputs bad = in;
        bad.correlations_x18.pop_back();
        REQUIRE_THROWS_AS(CoverageEngine::correlation_factor(bad), Error);

        bad = in;
        bad.correlations_x18[1] = 2 * X18_ONE;
        REQUIRE_THROWS_AS(CoverageEngine::correlation_factor(bad), Error);

        bad = in;
        bad.weights_x18[0] = -X18_ONE;
        REQUIRE_THROWS_AS(CoverageEngine::validate(bad), Error);
    }
}

TEST_CASE("Coverage halts", "[coverage]") {
    CoverageEngine engine;

    SECTION("Healthy coverage is not halted") {
        CoverageState s = engine.recompute(CoverageState{}, inputs(5000, 10000));
        REQUIRE_FALSE(s.halted);
        REQUIRE(s.reason == HaltReason::NONE);
        REQUIRE(s.window.size() == 1);
        REQUIRE(s.cycles == 1);
    }

    SECTION("A drop over half latches a cooldown") {
        CoverageState s = engine.recompute(CoverageState{}, inputs(5000, 10000));
        s = engine.recompute(s, inputs(2000, 10000));
        REQUIRE(s.halted);
        REQUIRE(s.reason == HaltReason::COVERAGE_DROP);
        REQUIRE(s.cooldown == 3);

        // recovered coverage still waits out the cooldown
        s = engine.recompute(s, inputs(5000, 10000));
        REQUIRE(s.halted);
        REQUIRE(s.cooldown == 2);
        s = engine.recompute(s, inputs(5000, 10000));
        REQUIRE(s.halted);
        REQUIRE(s.cooldown == 1);
        s = engine.recompute(s, inputs(5000, 10000));
        REQUIRE_FALSE(s.halted);
        REQUIRE(s.cooldown == 0);
    }

    SECTION("Gradual decline halts below the minimum") {
        CoverageState s = engine.recompute(CoverageState{}, inputs(3000, 10000));
        REQUIRE_FALSE(s.halted);
        s = engine.recompute(s, inputs(2000, 10000));
        REQUIRE(s.halted);
        REQUIRE(s.reason == HaltReason::BELOW_MINIMUM);
        REQUIRE(s.cooldown == 0);

        s = engine.recompute(s, inputs(3000, 10000));
        REQUIRE_FALSE(s.halted);
    }

    SECTION("Leaving the empty-market sentinel is not a drop") {
        CoverageState s = engine.recompute(CoverageState{}, inputs(5000, 0));
        REQUIRE(s.current.coverage_x18 == engine.config().sentinel_x18);
        s = engine.recompute(s, inputs(5000, 10000));
        REQUIRE_FALSE(s.halted);
        REQUIRE(s.cooldown == 0);
    }

    SECTION("The window keeps the most recent ratios") {
        CoverageState s;
        for (int i = 0; i < 12; ++i) s = engine.recompute(s, inputs(5000 + i, 10000));
        REQUIRE(s.window.size() == engine.config().window);
        REQUIRE(s.window.back() == s.current.coverage_x18);
    }

    SECTION("Fresh measures are judged under the committed latch") {
        CoverageState s = engine.recompute(CoverageState{}, inputs(5000, 10000));
        s = engine.recompute(s, inputs(2000, 10000));
        CoverageMeasure fresh = engine.measure(inputs(9000, 10000));
        REQUIRE(engine.halt_reason(s, fresh) == HaltReason::COVERAGE_DROP);

        CoverageState calm = engine.recompute(CoverageState{}, inputs(5000, 10000));
        REQUIRE(engine.halt_reason(calm, engine.measure(inputs(1000, 10000))) == HaltReason::BELOW_MINIMUM);
        REQUIRE_FALSE(engine.halted(calm, engine.measure(inputs(9000, 10000))));
    }
}

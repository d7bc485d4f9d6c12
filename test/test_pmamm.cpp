// Predix - PM-AMM Pricer and Newton Solver Tests

#include <catch2/catch.hpp>

#include "predix/error.hpp"
#include "predix/fixed_point.hpp"
#include "predix/pmamm.hpp"

#include <cmath>
#include <vector>

using namespace predix;
using Catch::Detail::Approx;

namespace {

const X18 RESERVE = x18::from_int(1000);

double d(X18 v) { return x18::to_double(v); }

double reserve_product(const std::vector<X18>& r) {
    double p = 1.0;
    for (X18 v : r) p *= d(v) / 1000.0;
    return p;
}

} // namespace

TEST_CASE("Newton solver on a synthetic curve", "[pmamm][solver]") {
    // f(x) = x^3 - 2, root 2^(1/3)
    auto cube = [](X18 x) {
        X18 x2 = x18::mul(x, x);
        return Residual{x18::mul(x2, x) - 2 * X18_ONE, 3 * x2};
    };
    auto positive = [](X18 x) { return x > 0; };

    SECTION("Converges within the ceiling") {
        NewtonRaphsonSolver solver;
        SolverResult r = solver.solve(cube, X18_ONE, positive);
        REQUIRE(r.iterations <= 10);
        REQUIRE(x18::abs(r.residual_x18) < X18_ONE / 1000000);
        REQUIRE(d(r.root_x18) == Approx(1.2599210499).margin(1e-6));
        REQUIRE(solver.stats().solves == 1);
        REQUIRE(solver.stats().max_iterations == r.iterations);
    }

    SECTION("A far start exhausts the ceiling and diverges") {
        NewtonRaphsonSolver solver;
        try {
            solver.solve(cube, 5 * X18_ONE, positive);
            FAIL("expected PricingDivergence");
        } catch (const Error& e) {
            REQUIRE(e.code() == ErrorCode::PricingDivergence);
        }
        REQUIRE(solver.stats().solves == 0);
    }

    SECTION("An initial guess outside the domain is rejected") {
        NewtonRaphsonSolver solver;
        REQUIRE_THROWS_AS(solver.solve(cube, -X18_ONE, positive), Error);
    }
}

TEST_CASE("PM-AMM iteration counts over a trade-size distribution", "[pmamm][solver]") {
    const std::vector<uint32_t> outcome_counts{2, 3, 4, 8, 16};
    const std::vector<int64_t> sizes{25, 50, 100, 200, 400, 800};

    uint64_t total = 0;
    uint64_t solves = 0;
    uint32_t worst = 0;
    for (uint32_t n : outcome_counts) {
        PmAmmPricer pricer = PmAmmPricer::uniform(n, RESERVE, 0);
        for (int64_t s : sizes) {
            Quote q = pricer.quote_buy(0, x18::from_int(s));
            total += q.iterations;
            ++solves;
            if (q.iterations > worst) worst = q.iterations;
        }
        REQUIRE(pricer.solver_stats().solves == sizes.size());
        REQUIRE(pricer.solver_stats().max_iterations <= 10);
    }

    double average = static_cast<double>(total) / static_cast<double>(solves);
    REQUIRE(average >= 3.0);
    REQUIRE(average <= 5.0);
    REQUIRE(worst <= 10);
}

TEST_CASE("PM-AMM prices", "[pmamm]") {
    SECTION("Uniform reserves price every outcome equally") {
        PmAmmPricer pricer = PmAmmPricer::uniform(4, RESERVE, 0);
        for (X18 p : pricer.prices()) REQUIRE(p == X18_ONE / 4);
    }

    SECTION("Prices always sum to one") {
        PmAmmPricer pricer({x18::from_int(300), x18::from_int(700), x18::from_int(1100)}, 0);
        X18 sum = 0;
        for (X18 p : pricer.prices()) sum += p;
        REQUIRE(sum == X18_ONE);
        REQUIRE(pricer.price(0) > pricer.price(1));
    }

    SECTION("Reserves solved from target probabilities") {
        std::vector<X18> targets{x18::parse("0.5"), x18::parse("0.3"), x18::parse("0.2")};
        std::vector<X18> reserves = PmAmmPricer::solve_for_reserves(RESERVE, targets);
        REQUIRE(reserves.size() == 3);
        REQUIRE(d(reserves[0]) == Approx(621.4465011908).margin(1e-6));

        double geo = std::cbrt(d(reserves[0]) * d(reserves[1]) * d(reserves[2]));
        REQUIRE(geo == Approx(1000.0).margin(1e-6));

        PmAmmPricer pricer(reserves, 0);
        for (size_t i = 0; i < targets.size(); ++i) {
            REQUIRE(d(pricer.price(static_cast<uint32_t>(i))) == Approx(d(targets[i])).margin(1e-9));
        }
    }

    SECTION("Invalid shapes") {
        REQUIRE_THROWS_AS(PmAmmPricer::uniform(1, RESERVE, 0), Error);
        REQUIRE_THROWS_AS(PmAmmPricer::uniform(65, RESERVE, 0), Error);
        REQUIRE_THROWS_AS(PmAmmPricer({RESERVE, 0}, 0), Error);
        REQUIRE_THROWS_AS(PmAmmPricer::solve_for_reserves(RESERVE, {X18_ONE, 0}), Error);
    }
}

TEST_CASE("PM-AMM trades", "[pmamm]") {
    PmAmmPricer pricer = PmAmmPricer::uniform(4, RESERVE, 0);

    SECTION("Buying preserves the reserve product") {
        Quote q = pricer.quote_buy(2, x18::from_int(200));
        REQUIRE(d(q.cost_x18) == Approx(54.0116336372).margin(1e-6));
        REQUIRE(q.sets_x18 == q.cost_x18);
        REQUIRE(q.spot_before_x18 == X18_ONE / 4);
        REQUIRE(q.fill_price_x18 > q.spot_before_x18);
        REQUIRE(q.spot_after_x18 > q.fill_price_x18);

        pricer.apply(q);
        REQUIRE(reserve_product(pricer.reserves()) == Approx(1.0).margin(1e-6));
        REQUIRE(pricer.reserves()[2] == RESERVE + q.sets_x18 - x18::from_int(200));
        REQUIRE(pricer.reserves()[0] == RESERVE + q.sets_x18);
    }

    SECTION("Selling back returns the cost") {
        Quote buy = pricer.quote_buy(1, x18::from_int(200));
        pricer.apply(buy);
        Quote sell = pricer.quote_sell(1, x18::from_int(200));
        REQUIRE(d(sell.cost_x18) == Approx(d(buy.cost_x18)).margin(1e-6));
        pricer.apply(sell);
        REQUIRE(reserve_product(pricer.reserves()) == Approx(1.0).margin(1e-6));
        REQUIRE(d(pricer.price(1)) == Approx(0.25).margin(1e-6));
    }

    SECTION("Fees apply to cost and proceeds") {
        PmAmmPricer charged = PmAmmPricer::uniform(4, RESERVE, 30);
        Quote q = charged.quote_buy(0, x18::from_int(100));
        REQUIRE(q.fee_x18 == x18::mul(q.cost_x18, x18::from_bps(30)));
        REQUIRE(q.total_x18 == q.cost_x18 + q.fee_x18);

        Quote s = charged.quote_sell(0, x18::from_int(100));
        REQUIRE(s.total_x18 == s.cost_x18 - s.fee_x18);
    }

    SECTION("A tight iteration ceiling surfaces divergence") {
        SolverConfig tight;
        tight.max_iterations = 3;
        PmAmmPricer strict = PmAmmPricer::uniform(16, RESERVE, 0, tight);
        try {
            strict.quote_buy(0, x18::from_int(800));
            FAIL("expected PricingDivergence");
        } catch (const Error& e) {
            REQUIRE(e.code() == ErrorCode::PricingDivergence);
        }
        REQUIRE(strict.reserves()[0] == RESERVE);
    }
}

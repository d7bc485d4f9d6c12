// Predix - LMSR Pricer Tests

#include <catch2/catch.hpp>

#include "predix/error.hpp"
#include "predix/fixed_point.hpp"
#include "predix/lmsr.hpp"

using namespace predix;
using Catch::Detail::Approx;

namespace {

const X18 B = x18::from_int(100);

double d(X18 v) { return x18::to_double(v); }

} // namespace

TEST_CASE("LMSR prices", "[lmsr]") {
    SECTION("Equal quantities price at one half") {
        LmsrPricer p(B, 0);
        REQUIRE(p.price(LmsrPricer::YES) == X18_HALF);
        REQUIRE(p.price(LmsrPricer::NO) == X18_HALF);
    }

    SECTION("Prices sum to one") {
        LmsrPricer p(B, 0, x18::from_int(37), x18::from_int(5));
        auto prices = p.prices();
        REQUIRE(prices.size() == 2);
        REQUIRE(prices[0] + prices[1] == X18_ONE);
        REQUIRE(prices[0] > prices[1]);
    }

    SECTION("Price follows the softmax of q / b") {
        LmsrPricer p(B, 0, x18::from_int(50), 0);
        REQUIRE(d(p.price(LmsrPricer::YES)) == Approx(0.6224593312).margin(1e-3));
    }

    SECTION("Extreme quantities stay inside (0, 1)") {
        LmsrPricer p(B, 0, x18::from_int(5000), 0);
        REQUIRE(p.price(LmsrPricer::YES) < X18_ONE);
        REQUIRE(p.price(LmsrPricer::NO) > 0);
    }
}

TEST_CASE("LMSR quotes", "[lmsr]") {
    LmsrPricer p(B, 0);

    SECTION("Buy cost is the change in the cost function") {
        Quote q = p.quote_buy(LmsrPricer::YES, x18::from_int(10));
        REQUIRE(d(q.cost_x18) == Approx(5.1249479514).margin(1e-2));
        REQUIRE(q.spot_before_x18 == X18_HALF);
        REQUIRE(d(q.spot_after_x18) == Approx(0.5249791875).margin(1e-3));
        REQUIRE(q.fill_price_x18 > q.spot_before_x18);
        REQUIRE(q.fill_price_x18 < q.spot_after_x18);
        REQUIRE(q.fee_x18 == 0);
        REQUIRE(q.total_x18 == q.cost_x18);
    }

    SECTION("Quoting does not move the state") {
        X18 before = p.cost();
        p.quote_buy(LmsrPricer::YES, x18::from_int(10));
        REQUIRE(p.cost() == before);
        REQUIRE(p.quantity(LmsrPricer::YES) == 0);
    }

    SECTION("Selling back what was bought returns the same amount") {
        Quote buy = p.quote_buy(LmsrPricer::NO, x18::from_int(25));
        p.apply(buy);
        REQUIRE(p.quantity(LmsrPricer::NO) == x18::from_int(25));

        Quote sell = p.quote_sell(LmsrPricer::NO, x18::from_int(25));
        REQUIRE(sell.cost_x18 == buy.cost_x18);
        p.apply(sell);
        REQUIRE(p.price(LmsrPricer::NO) == X18_HALF);
    }

    SECTION("Selling more than outstanding is rejected") {
        try {
            p.quote_sell(LmsrPricer::YES, X18_ONE);
            FAIL("expected InsufficientLiquidity");
        } catch (const Error& e) {
            REQUIRE(e.code() == ErrorCode::InsufficientLiquidity);
        }
    }

    SECTION("Invalid requests") {
        REQUIRE_THROWS_AS(p.quote_buy(2, X18_ONE), Error);
        REQUIRE_THROWS_AS(p.quote_buy(LmsrPricer::YES, 0), Error);
        REQUIRE_THROWS_AS(LmsrPricer(0, 0), Error);
        REQUIRE_THROWS_AS(LmsrPricer(B, 0, -X18_ONE, 0), Error);
    }
}

TEST_CASE("LMSR fees", "[lmsr]") {
    LmsrPricer p(B, 100);  // 1%

    Quote buy = p.quote(OutcomeRef::discrete(LmsrPricer::YES), Side::BUY, x18::from_int(10));
    REQUIRE(buy.fee_x18 == x18::mul(buy.cost_x18, x18::from_bps(100)));
    REQUIRE(buy.total_x18 == buy.cost_x18 + buy.fee_x18);

    p.apply(buy);
    Quote sell = p.quote(OutcomeRef::discrete(LmsrPricer::YES), Side::SELL, x18::from_int(10));
    REQUIRE(sell.total_x18 == sell.cost_x18 - sell.fee_x18);
    REQUIRE(sell.total_x18 < buy.total_x18);
}

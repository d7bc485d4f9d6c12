// Predix - Fixed-Point Tests

#include <catch2/catch.hpp>

#include "predix/error.hpp"
#include "predix/fixed_point.hpp"
#include "predix/tables.hpp"

using namespace predix;
using Catch::Detail::Approx;

namespace {

template <typename Fn>
ErrorCode code_of(Fn&& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    FAIL("expected predix::Error");
    return ErrorCode::InvalidInput;
}

} // namespace

TEST_CASE("Decimal parsing and formatting", "[fixed_point]") {
    SECTION("Plain decimals") {
        REQUIRE(x18::parse("1.5") == 3 * X18_HALF);
        REQUIRE(x18::parse("-12.5") == -(x18::from_int(12) + X18_HALF));
        REQUIRE(x18::parse("0.000001") == X18_ONE / 1000000);
        REQUIRE(x18::parse("+7") == x18::from_int(7));
    }

    SECTION("Exponent notation") {
        REQUIRE(x18::parse("1e-6") == X18_ONE / 1000000);
        REQUIRE(x18::parse("2.5E3") == x18::from_int(2500));
    }

    SECTION("Digits beyond 18 places are truncated") {
        REQUIRE(x18::parse("0.0000000000000000019") == 1);
    }

    SECTION("Rejects malformed text") {
        REQUIRE(code_of([] { x18::parse("abc"); }) == ErrorCode::InvalidInput);
        REQUIRE(code_of([] { x18::parse("1.2.3"); }) == ErrorCode::InvalidInput);
        REQUIRE(code_of([] { x18::parse("1e"); }) == ErrorCode::InvalidInput);
        REQUIRE(code_of([] { x18::parse("1e60"); }) == ErrorCode::ArithmeticOverflow);
    }

    SECTION("Formatting drops trailing zeros") {
        REQUIRE(x18::to_string(x18::from_int(3)) == "3");
        REQUIRE(x18::to_string(X18_ONE / 4) == "0.25");
        REQUIRE(x18::to_string(-X18_HALF) == "-0.5");
        REQUIRE(x18::to_string(1) == "0.000000000000000001");
        REQUIRE(x18::to_string(0) == "0");
    }
}

TEST_CASE("Conversions", "[fixed_point]") {
    REQUIRE(x18::from_bps(5) == X18_ONE / 2000);
    REQUIRE(x18::from_bps(10000) == X18_ONE);
    REQUIRE(x18::from_ratio(1, 3) == 333333333333333333LL);
    REQUIRE(x18::from_ratio(-1, 4) == -X18_ONE / 4);
    REQUIRE(x18::to_int(x18::parse("41.99")) == 41);
    REQUIRE(code_of([] { x18::from_ratio(1, 0); }) == ErrorCode::InvalidInput);
}

TEST_CASE("Checked arithmetic", "[fixed_point]") {
    SECTION("mul and div round toward zero") {
        REQUIRE(x18::mul(3 * X18_HALF, 2 * X18_ONE) == 3 * X18_ONE);
        REQUIRE(x18::div(X18_ONE, 3 * X18_ONE) == 333333333333333333LL);
        REQUIRE(x18::div(-X18_ONE, 3 * X18_ONE) == -333333333333333333LL);
    }

    SECTION("256-bit intermediate keeps exact results") {
        REQUIRE(x18::mul_div(x18::MAX, X18_ONE, X18_ONE) == x18::MAX);
        REQUIRE(x18::mul_div(x18::MAX, 3, 3) == x18::MAX);
    }

    SECTION("Overflow throws") {
        REQUIRE(code_of([] { x18::add(x18::MAX, 1); }) == ErrorCode::ArithmeticOverflow);
        REQUIRE(code_of([] { x18::sub(x18::MIN, 1); }) == ErrorCode::ArithmeticOverflow);
        REQUIRE(code_of([] { x18::mul(x18::MAX, 2 * X18_ONE); }) == ErrorCode::ArithmeticOverflow);
        REQUIRE(code_of([] { x18::div(X18_ONE, 0); }) == ErrorCode::InvalidInput);
    }

    SECTION("Saturating variants clamp") {
        REQUIRE(x18::sat_add(x18::MAX, 1) == x18::MAX);
        REQUIRE(x18::sat_sub(x18::MIN, 1) == x18::MIN);
        REQUIRE(x18::sat_mul(x18::MAX, -2 * X18_ONE) == x18::MIN);
        REQUIRE(x18::sat_mul(2 * X18_ONE, 3 * X18_ONE) == 6 * X18_ONE);
    }
}

TEST_CASE("Square roots", "[fixed_point]") {
    REQUIRE(x18::isqrt(144) == 12);
    REQUIRE(x18::isqrt(145) == 12);
    REQUIRE(x18::isqrt(U128(1) << 100) == (U128(1) << 50));
    REQUIRE(x18::sqrt(x18::from_int(4)) == x18::from_int(2));
    REQUIRE(x18::sqrt(X18_ONE / 4) == X18_HALF);
    REQUIRE(x18::sqrt(0) == 0);
    REQUIRE(x18::to_double(x18::sqrt(x18::from_int(2))) == Approx(1.41421356237).margin(1e-12));
    REQUIRE(x18::to_double(x18::sqrt(x18::from_int(1000000000000LL))) == Approx(1e6));
    REQUIRE(code_of([] { x18::sqrt(-1); }) == ErrorCode::InvalidInput);
}

TEST_CASE("Transcendentals", "[fixed_point]") {
    SECTION("ln") {
        REQUIRE(x18::ln(X18_ONE) == 0);
        REQUIRE(x18::to_double(x18::ln(x18::from_int(2))) == Approx(0.693147180559945).margin(1e-12));
        REQUIRE(x18::to_double(x18::ln(X18_ONE / 10)) == Approx(-2.302585092994046).margin(1e-12));
        REQUIRE(code_of([] { x18::ln(0); }) == ErrorCode::InvalidInput);
    }

    SECTION("exp") {
        REQUIRE(x18::exp(0) == X18_ONE);
        REQUIRE(x18::to_double(x18::exp(X18_ONE)) == Approx(2.718281828459045).margin(1e-12));
        REQUIRE(x18::to_double(x18::exp(-x18::from_int(5))) == Approx(0.006737946999085).margin(1e-14));
        REQUIRE(x18::exp(-x18::from_int(50)) == 0);
        REQUIRE(code_of([] { x18::exp(x18::from_int(47)); }) == ErrorCode::ArithmeticOverflow);
    }

    SECTION("exp inverts ln") {
        X18 x = x18::parse("3.75");
        REQUIRE(x18::to_double(x18::exp(x18::ln(x))) == Approx(3.75).margin(1e-12));
    }
}

TEST_CASE("Exponential table", "[fixed_point][tables]") {
    const ExpTable& table = ExpTable::instance();

    SECTION("Layout") {
        REQUIRE(ExpTable::SIZE == 1281);
        REQUIRE(table.entry(ExpTable::SIZE - 1) == X18_ONE);
        REQUIRE(&table == &ExpTable::instance());
    }

    SECTION("Grid points are exact exponentials") {
        REQUIRE(table.lookup(0) == X18_ONE);
        REQUIRE(table.lookup(-X18_ONE) == x18::exp(-X18_ONE));
    }

    SECTION("Interpolation stays within 1e-3") {
        for (int i = 1; i < 400; i += 7) {
            X18 x = -x18::from_ratio(i, 37);
            double exact = x18::to_double(x18::exp(x));
            REQUIRE(x18::to_double(table.lookup(x)) == Approx(exact).margin(1e-3));
        }
    }

    SECTION("Arguments below the table clamp") {
        REQUIRE(table.lookup(-x18::from_int(100)) == table.entry(0));
    }

    SECTION("Positive arguments are rejected") {
        REQUIRE(code_of([&] { table.lookup(1); }) == ErrorCode::InvalidInput);
    }
}

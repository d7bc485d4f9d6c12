#ifndef PREDIX_FIXED_POINT_HPP
#define PREDIX_FIXED_POINT_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace predix {
namespace x18 {

// =============================================================================
// Constants
// =============================================================================

constexpr I128 MAX = static_cast<I128>(~U128(0) >> 1);
constexpr I128 MIN = -MAX - 1;
constexpr I128 LN2 = 693147180559945309LL;          // ln(2)
constexpr I128 INV_SQRT_2PI = 398942280401432678LL; // 1/sqrt(2*pi)

// =============================================================================
// Conversions
// =============================================================================

inline constexpr X18 from_int(int64_t v) {
    return static_cast<X18>(v) * X18_ONE;
}

inline constexpr X18 from_bps(uint32_t bps) {
    return static_cast<X18>(bps) * (X18_ONE / 10000);
}

// num / den as X18, truncated toward zero
X18 from_ratio(int64_t num, int64_t den);

// Diagnostics and tests only; never on a pricing or risk path.
double to_double(X18 v);

inline constexpr int64_t to_int(X18 v) {
    return static_cast<int64_t>(v / X18_ONE);
}

// Exact decimal text ("-12.5", "0.000001", "1e-6") <-> X18
X18 parse(std::string_view text);
std::string to_string(X18 v);

// =============================================================================
// Checked Arithmetic (throw ArithmeticOverflow / InvalidInput)
// =============================================================================

X18 add(X18 a, X18 b);
X18 sub(X18 a, X18 b);

// a * b / d with a 256-bit intermediate, truncated toward zero
I128 mul_div(I128 a, I128 b, I128 d);

inline X18 mul(X18 a, X18 b) { return mul_div(a, b, X18_ONE); }
inline X18 div(X18 a, X18 b) { return mul_div(a, X18_ONE, b); }

// =============================================================================
// Saturating Arithmetic
// =============================================================================

X18 sat_add(X18 a, X18 b) noexcept;
X18 sat_sub(X18 a, X18 b) noexcept;
X18 sat_mul(X18 a, X18 b) noexcept;

// =============================================================================
// Roots and Transcendentals
// =============================================================================

// Bit-by-bit integer square root, at most 64 steps
U128 isqrt(U128 n) noexcept;

// sqrt of an X18 value, floored
X18 sqrt(X18 x);

// Natural log; x <= 0 throws InvalidInput
X18 ln(X18 x);

// e^x; underflows to 0 below -42, throws ArithmeticOverflow above 46
X18 exp(X18 x);

inline constexpr X18 abs(X18 v) { return v < 0 ? -v : v; }
inline constexpr X18 min(X18 a, X18 b) { return a < b ? a : b; }
inline constexpr X18 max(X18 a, X18 b) { return a > b ? a : b; }
inline constexpr X18 clamp(X18 v, X18 lo, X18 hi) { return v < lo ? lo : (v > hi ? hi : v); }

} // namespace x18
} // namespace predix

#endif // PREDIX_FIXED_POINT_HPP

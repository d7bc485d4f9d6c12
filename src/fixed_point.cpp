// =============================================================================
// fixed_point.cpp - X18 Fixed-Point Arithmetic
// Checked 256-bit mul_div, integer sqrt, deterministic exp/ln, decimal text
// =============================================================================

#include "predix/fixed_point.hpp"
#include "predix/error.hpp"

#include <cctype>

namespace predix {
namespace x18 {

namespace {

constexpr U128 U128_MAX = ~U128(0);

inline U128 uabs(I128 v) {
    return v < 0 ? U128(-(v + 1)) + 1 : U128(v);
}

// =============================================================================
// 256-bit Arithmetic (two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo = 0;
    U128 hi = 0;
};

inline U256 mul_u128(U128 a, U128 b) {
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 r;
    r.lo = (p0 & MASK64) | (mid << 64);
    r.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return r;
}

// Restoring long division; requires n.hi < d so the quotient fits in 128 bits.
inline U128 div_u256_u128(U256 n, U128 d) {
    if (n.hi == 0) return n.lo / d;

    U128 rem = n.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((n.lo >> i) & 1);
        quot <<= 1;
        if (carry || rem >= d) {
            rem -= d;
            quot |= 1;
        }
    }
    return quot;
}

bool try_mul_div(I128 a, I128 b, I128 d, I128& out) {
    bool neg = (a < 0) ^ (b < 0) ^ (d < 0);
    U128 ud = uabs(d);
    U256 p = mul_u128(uabs(a), uabs(b));
    if (p.hi >= ud) return false;

    U128 q = div_u256_u128(p, ud);
    U128 limit = neg ? U128(MAX) + 1 : U128(MAX);
    if (q > limit) return false;

    if (neg) {
        out = q == U128(MAX) + 1 ? MIN : -static_cast<I128>(q);
    } else {
        out = static_cast<I128>(q);
    }
    return true;
}

constexpr U128 pow10_u128(int p) {
    U128 r = 1;
    for (int i = 0; i < p; ++i) r *= 10;
    return r;
}

} // namespace

// =============================================================================
// Conversions
// =============================================================================

X18 from_ratio(int64_t num, int64_t den) {
    if (den == 0) {
        throw Error(ErrorCode::InvalidInput, "ratio with zero denominator");
    }
    return mul_div(num, X18_ONE, den);
}

double to_double(X18 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

X18 parse(std::string_view text) {
    size_t pos = 0;
    bool neg = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        neg = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    int frac_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
            seen_digit = true;
            if (seen_dot) ++frac_digits;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            break;
        }
    }
    if (!seen_digit) {
        throw Error(ErrorCode::InvalidInput, "not a decimal number: " + std::string(text));
    }

    int exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool exp_neg = false;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
            exp_neg = text[pos] == '-';
            ++pos;
        }
        if (pos >= text.size()) {
            throw Error(ErrorCode::InvalidInput, "missing exponent: " + std::string(text));
        }
        for (; pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos) {
            exponent = exponent * 10 + (text[pos] - '0');
            if (exponent > 80) {
                throw Error(ErrorCode::ArithmeticOverflow, "exponent out of range: " + std::string(text));
            }
        }
        if (exp_neg) exponent = -exponent;
    }
    if (pos != text.size()) {
        throw Error(ErrorCode::InvalidInput, "trailing characters: " + std::string(text));
    }

    // value = digits * 10^(18 + exponent - frac_digits), truncated
    int scale = 18 + exponent - frac_digits;
    if (scale >= 0) {
        digits.append(static_cast<size_t>(scale), '0');
    } else if (static_cast<size_t>(-scale) >= digits.size()) {
        digits.clear();
    } else {
        digits.resize(digits.size() - static_cast<size_t>(-scale));
    }

    U128 limit = neg ? U128(MAX) + 1 : U128(MAX);
    U128 acc = 0;
    for (char c : digits) {
        U128 d = static_cast<U128>(c - '0');
        if (acc > (limit - d) / 10) {
            throw Error(ErrorCode::ArithmeticOverflow, "decimal out of range: " + std::string(text));
        }
        acc = acc * 10 + d;
    }

    if (neg) return acc == U128(MAX) + 1 ? MIN : -static_cast<I128>(acc);
    return static_cast<I128>(acc);
}

std::string to_string(X18 v) {
    U128 u = uabs(v);
    U128 ip = u / U128(X18_ONE);
    U128 fp = u % U128(X18_ONE);

    std::string int_part;
    do {
        int_part.insert(int_part.begin(), static_cast<char>('0' + static_cast<int>(ip % 10)));
        ip /= 10;
    } while (ip != 0);

    std::string out = v < 0 ? "-" + int_part : int_part;
    if (fp != 0) {
        std::string frac(18, '0');
        for (int i = 17; i >= 0; --i) {
            frac[static_cast<size_t>(i)] = static_cast<char>('0' + static_cast<int>(fp % 10));
            fp /= 10;
        }
        while (!frac.empty() && frac.back() == '0') frac.pop_back();
        out += "." + frac;
    }
    return out;
}

// =============================================================================
// Checked Arithmetic
// =============================================================================

X18 add(X18 a, X18 b) {
    X18 r;
    if (__builtin_add_overflow(a, b, &r)) {
        throw Error(ErrorCode::ArithmeticOverflow, "x18 add overflow");
    }
    return r;
}

X18 sub(X18 a, X18 b) {
    X18 r;
    if (__builtin_sub_overflow(a, b, &r)) {
        throw Error(ErrorCode::ArithmeticOverflow, "x18 sub overflow");
    }
    return r;
}

I128 mul_div(I128 a, I128 b, I128 d) {
    if (d == 0) {
        throw Error(ErrorCode::InvalidInput, "division by zero");
    }
    I128 out = 0;
    if (!try_mul_div(a, b, d, out)) {
        throw Error(ErrorCode::ArithmeticOverflow, "x18 mul_div overflow");
    }
    return out;
}

// =============================================================================
// Saturating Arithmetic
// =============================================================================

X18 sat_add(X18 a, X18 b) noexcept {
    X18 r;
    if (__builtin_add_overflow(a, b, &r)) return b > 0 ? MAX : MIN;
    return r;
}

X18 sat_sub(X18 a, X18 b) noexcept {
    X18 r;
    if (__builtin_sub_overflow(a, b, &r)) return b < 0 ? MAX : MIN;
    return r;
}

X18 sat_mul(X18 a, X18 b) noexcept {
    I128 out = 0;
    if (!try_mul_div(a, b, X18_ONE, out)) {
        return ((a < 0) ^ (b < 0)) ? MIN : MAX;
    }
    return out;
}

// =============================================================================
// Roots
// =============================================================================

U128 isqrt(U128 n) noexcept {
    U128 result = 0;
    U128 bit = U128(1) << 126;
    while (bit > n) bit >>= 2;

    while (bit != 0) {
        if (n >= result + bit) {
            n -= result + bit;
            result = (result >> 1) + bit;
        } else {
            result >>= 1;
        }
        bit >>= 2;
    }
    return result;
}

X18 sqrt(X18 x) {
    if (x < 0) {
        throw Error(ErrorCode::InvalidInput, "sqrt of negative value");
    }
    if (x == 0) return 0;

    // Scale by the largest even power of ten that still fits, then restore.
    U128 ux = static_cast<U128>(x);
    for (int p = 18; p > 0; p -= 2) {
        U128 scale = pow10_u128(p);
        if (ux <= U128_MAX / scale) {
            U128 root = isqrt(ux * scale) * pow10_u128((18 - p) / 2);
            return static_cast<X18>(root);
        }
    }
    return static_cast<X18>(isqrt(ux) * pow10_u128(9));
}

// =============================================================================
// Transcendentals
// =============================================================================

X18 ln(X18 x) {
    if (x <= 0) {
        throw Error(ErrorCode::InvalidInput, "ln of non-positive value");
    }

    // x = m * 2^k with m in [1, 2)
    int k = 0;
    X18 m = x;
    while (m >= 2 * X18_ONE) {
        m >>= 1;
        ++k;
    }
    while (m < X18_ONE) {
        m <<= 1;
        --k;
    }

    // ln(m) = 2 * atanh((m - 1) / (m + 1))
    X18 s = div(m - X18_ONE, m + X18_ONE);
    X18 s2 = mul(s, s);
    X18 term = s;
    X18 sum = 0;
    for (int n = 1; term != 0; n += 2) {
        sum += term / n;
        term = mul(term, s2);
    }

    return 2 * sum + static_cast<X18>(k) * LN2;
}

X18 exp(X18 x) {
    if (x > from_int(46)) {
        throw Error(ErrorCode::ArithmeticOverflow, "exp argument too large");
    }
    if (x < from_int(-42)) return 0;

    // x = k * ln2 + r, |r| <= ln2 / 2
    I128 k = x / LN2;
    X18 r = x - k * LN2;
    if (r > LN2 / 2) {
        ++k;
        r -= LN2;
    } else if (r < -LN2 / 2) {
        --k;
        r += LN2;
    }

    X18 sum = X18_ONE;
    X18 term = X18_ONE;
    for (int i = 1; i <= 40; ++i) {
        term = mul(term, r) / i;
        if (term == 0) break;
        sum += term;
    }

    if (k >= 0) {
        if (sum > (MAX >> static_cast<int>(k))) {
            throw Error(ErrorCode::ArithmeticOverflow, "exp result too large");
        }
        return sum << static_cast<int>(k);
    }
    return sum >> static_cast<int>(-k);
}

} // namespace x18
} // namespace predix

// =============================================================================
// tables.cpp - Precomputed exponential table
// =============================================================================

#include "predix/tables.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"

namespace predix {

ExpTable::ExpTable() : values_(SIZE) {
    const X18 step = X18_ONE / STEPS_PER_UNIT;
    for (size_t i = 0; i < SIZE; ++i) {
        X18 arg = x18::from_int(MIN_ARG) + static_cast<X18>(i) * step;
        values_[i] = x18::exp(arg);
    }
}

const ExpTable& ExpTable::instance() {
    static const ExpTable table;
    return table;
}

X18 ExpTable::lookup(X18 x) const {
    if (x > 0) {
        throw Error(ErrorCode::InvalidInput, "exp table argument must be non-positive");
    }
    X18 offset = x - x18::from_int(MIN_ARG);
    if (offset <= 0) return values_.front();

    // position in table steps, X18
    X18 pos = offset * STEPS_PER_UNIT;
    size_t idx = static_cast<size_t>(pos / X18_ONE);
    X18 frac = pos % X18_ONE;
    if (idx + 1 >= SIZE) return values_.back();

    X18 lo = values_[idx];
    X18 hi = values_[idx + 1];
    return lo + x18::mul(hi - lo, frac);
}

} // namespace predix

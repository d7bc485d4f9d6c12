#ifndef PREDIX_TABLES_HPP
#define PREDIX_TABLES_HPP

#include <cstdint>
#include <vector>

#include "types.hpp"

namespace predix {

// =============================================================================
// ExpTable - e^x for x in [-20, 0], step 1/64, linear interpolation
// =============================================================================

class ExpTable {
public:
    static constexpr int64_t MIN_ARG = -20;
    static constexpr int64_t STEPS_PER_UNIT = 64;
    static constexpr size_t SIZE = static_cast<size_t>(-MIN_ARG * STEPS_PER_UNIT) + 1;

    // Process-wide table, built on first use
    static const ExpTable& instance();

    // x must be <= 0; arguments below -20 clamp to e^-20
    X18 lookup(X18 x) const;

    X18 entry(size_t i) const { return values_[i]; }

private:
    ExpTable();

    std::vector<X18> values_;
};

} // namespace predix

#endif // PREDIX_TABLES_HPP

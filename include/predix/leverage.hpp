#ifndef PREDIX_LEVERAGE_HPP
#define PREDIX_LEVERAGE_HPP

#include <cstdint>

#include "config.hpp"
#include "types.hpp"

namespace predix {

// =============================================================================
// LeverageCapResolver
// =============================================================================
//
// lev_max = floor(min(base * (1 + 0.1 * depth),
//                     coverage * 100 / sqrt(N),
//                     tier_cap(N)))

class LeverageCapResolver {
public:
    explicit LeverageCapResolver(const LeverageConfig& config = {});

    // N=1 -> 100, 2 -> 70, 3..4 -> 25, 5..8 -> 15, 9..16 -> 12, 17..64 -> 10, >64 -> 5
    static uint32_t tier_cap(uint32_t outcome_count);

    [[nodiscard]] X18 depth_cap(uint32_t depth) const;
    [[nodiscard]] X18 coverage_cap(X18 coverage_x18, uint32_t outcome_count) const;

    [[nodiscard]] uint32_t resolve(X18 coverage_x18, uint32_t outcome_count, uint32_t depth) const;

private:
    LeverageConfig config_;
};

} // namespace predix

#endif // PREDIX_LEVERAGE_HPP

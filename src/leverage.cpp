// =============================================================================
// leverage.cpp - Maximum leverage resolution
// =============================================================================

#include "predix/leverage.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"

namespace predix {

LeverageCapResolver::LeverageCapResolver(const LeverageConfig& config) : config_(config) {}

uint32_t LeverageCapResolver::tier_cap(uint32_t outcome_count) {
    if (outcome_count == 0) {
        throw Error(ErrorCode::InvalidOutcomeCount, "tier cap needs at least one outcome");
    }
    if (outcome_count == 1) return 100;
    if (outcome_count == 2) return 70;
    if (outcome_count <= 4) return 25;
    if (outcome_count <= 8) return 15;
    if (outcome_count <= 16) return 12;
    if (outcome_count <= 64) return 10;
    return 5;
}

X18 LeverageCapResolver::depth_cap(uint32_t depth) const {
    X18 bonus = x18::mul(x18::from_bps(config_.depth_bonus_bps), x18::from_int(depth));
    return x18::mul(x18::from_int(config_.base_max), X18_ONE + bonus);
}

X18 LeverageCapResolver::coverage_cap(X18 coverage_x18, uint32_t outcome_count) const {
    if (outcome_count == 0) {
        throw Error(ErrorCode::InvalidOutcomeCount, "coverage cap needs at least one outcome");
    }
    if (coverage_x18 <= 0) return 0;
    X18 root = x18::sqrt(x18::from_int(outcome_count));
    return x18::div(x18::sat_mul(coverage_x18, x18::from_int(100)), root);
}

uint32_t LeverageCapResolver::resolve(X18 coverage_x18, uint32_t outcome_count, uint32_t depth) const {
    X18 cap = x18::min(depth_cap(depth), coverage_cap(coverage_x18, outcome_count));
    cap = x18::min(cap, x18::from_int(tier_cap(outcome_count)));
    if (cap <= 0) return 0;
    return static_cast<uint32_t>(cap / X18_ONE);
}

} // namespace predix

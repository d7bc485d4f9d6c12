#ifndef PREDIX_CONFIG_HPP
#define PREDIX_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace predix {

// =============================================================================
// Configuration Sections
// =============================================================================

struct GeneralConfig {
    std::string log_level = "info";
};

struct PricingConfig {
    X18 lmsr_liquidity_x18 = 100 * X18_ONE;       // b
    uint32_t fee_bps = 0;
    X18 spread_tolerance_x18 = X18_ONE / 20;      // |sum(prices) - 1| <= 0.05
    X18 l2_liquidity_x18 = 1000 * X18_ONE;        // L
    X18 l2_weight_floor_x18 = X18_ONE / 1000;
};

struct SolverConfig {
    uint32_t max_iterations = 10;
    X18 tolerance_x18 = X18_ONE / 1000000;        // |f| < 1e-6
    X18 damping_x18 = 8 * X18_ONE / 10;
    X18 damping_threshold_x18 = X18_ONE / 10000;  // damp while |f| > 1e-4
};

struct IntegrationConfig {
    uint32_t points = 10;                         // even, 10..16
    uint32_t max_refinements = 5;
    X18 tolerance_x18 = X18_ONE / 1000000;        // 1e-6 .. 1e-12
};

struct CoverageConfig {
    X18 min_coverage_x18 = X18_HALF;
    X18 drop_fraction_x18 = X18_HALF;             // halt on a >50% single-cycle drop
    uint32_t cooldown_cycles = 3;
    uint32_t window = 8;
    X18 sentinel_x18 = 1000000000 * X18_ONE;      // coverage with zero open interest
};

struct LeverageConfig {
    uint32_t base_max = 100;
    uint32_t depth_bonus_bps = 1000;              // +10% per hierarchy level
};

struct LiquidationConfig {
    uint32_t cap_min_bps = 200;
    uint32_t cap_max_bps = 800;
    X18 sigma_scale_x18 = 3 * X18_HALF;           // 1.5
    uint32_t keeper_incentive_bps = 5;
    uint32_t close_factor_bps = 5000;
    uint32_t max_effective_leverage = 500;
    X18 min_notional_x18 = X18_ONE;
    uint64_t period_seconds = 3600;
    X18 maintenance_fraction_x18 = X18_ONE;
    X18 pnl_floor_x18 = X18_ONE / 10;             // effective leverage factor floor
    X18 position_count_step_x18 = X18_ONE / 10;   // f(n) = 1 + step * (n - 1)
};

struct ChainConfig {
    X18 borrow_multiplier_x18 = 15 * X18_ONE / 10;
    X18 leverage_multiplier_x18 = 12 * X18_ONE / 10;
    X18 stake_multiplier_x18 = 11 * X18_ONE / 10;
};

// =============================================================================
// Config
// =============================================================================

class Config {
public:
    GeneralConfig general;
    PricingConfig pricing;
    SolverConfig solver;
    IntegrationConfig integration;
    CoverageConfig coverage;
    LeverageConfig leverage;
    LiquidationConfig liquidation;
    ChainConfig chain;

    Config() = default;

    // Load from JSON file
    static Config from_file(std::string_view path);

    // Load from JSON string; unknown keys are ignored
    static Config from_json(std::string_view content);

    // Throws Error(ConfigError) on out-of-range values
    void validate() const;

    // Builder methods
    Config& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& with_fee_bps(uint32_t bps) {
        pricing.fee_bps = bps;
        return *this;
    }

    Config& with_lmsr_liquidity(X18 b) {
        pricing.lmsr_liquidity_x18 = b;
        return *this;
    }

    Config& with_l2_liquidity(X18 l) {
        pricing.l2_liquidity_x18 = l;
        return *this;
    }

    Config& with_integration_points(uint32_t points) {
        integration.points = points;
        return *this;
    }

    Config& with_integration_tolerance(X18 tol) {
        integration.tolerance_x18 = tol;
        return *this;
    }

    Config& with_min_coverage(X18 min) {
        coverage.min_coverage_x18 = min;
        return *this;
    }

    Config& with_keeper_incentive_bps(uint32_t bps) {
        liquidation.keeper_incentive_bps = bps;
        return *this;
    }

    Config& with_period_seconds(uint64_t seconds) {
        liquidation.period_seconds = seconds;
        return *this;
    }
};

} // namespace predix

#endif // PREDIX_CONFIG_HPP

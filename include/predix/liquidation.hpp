#ifndef PREDIX_LIQUIDATION_HPP
#define PREDIX_LIQUIDATION_HPP

#include <cstdint>

#include "config.hpp"
#include "types.hpp"

namespace predix {

// =============================================================================
// Liquidation Types
// =============================================================================

struct RiskFlags {
    bool at_risk = false;       // observed margin ratio below the required ratio
    bool liquidatable = false;  // observed margin ratio below 1 / coverage
};

// Inputs shared by every position of a market within one cycle
struct LiquidationContext {
    X18 coverage_x18 = 0;
    X18 sigma_x18 = 0;
    uint32_t open_positions = 1;           // owner's concurrent positions
    X18 chain_multiplier_x18 = X18_ONE;
};

struct Evaluation {
    Position position;
    RiskFlags flags;
};

struct PeriodAccumulator {
    uint64_t period_index = 0;
    X18 liquidated_x18 = 0;
};

enum class LiquidationStatus : uint8_t {
    EXECUTED = 0,          // partial liquidation, position remains open
    CLOSED = 1,            // remainder at or below the minimum notional was closed
    NOT_LIQUIDATABLE = 2,  // no-op
    CAP_EXHAUSTED = 3      // no-op, period allowance used up
};

inline const char* to_string(LiquidationStatus s) {
    switch (s) {
        case LiquidationStatus::EXECUTED: return "executed";
        case LiquidationStatus::CLOSED: return "closed";
        case LiquidationStatus::NOT_LIQUIDATABLE: return "not_liquidatable";
        case LiquidationStatus::CAP_EXHAUSTED: return "cap_exhausted";
    }
    return "unknown";
}

struct LiquidationResult {
    PositionId position_id = 0;
    AccountId keeper = 0;
    X18 liquidated_x18 = 0;
    X18 incentive_x18 = 0;
    X18 remaining_x18 = 0;
    X18 margin_released_x18 = 0;
    X18 vault_credit_x18 = 0;   // released margin net of the incentive
    uint64_t period_index = 0;
    LiquidationStatus status = LiquidationStatus::NOT_LIQUIDATABLE;

    [[nodiscard]] bool is_noop() const noexcept {
        return status == LiquidationStatus::NOT_LIQUIDATABLE ||
               status == LiquidationStatus::CAP_EXHAUSTED;
    }
};

struct ExecutionContext {
    X18 open_interest_x18 = 0;
    X18 sigma_x18 = 0;
    uint64_t timestamp = 0;
    X18 max_size_x18 = 0;
    AccountId keeper = 0;
};

// Staged outcome of an execution; the caller commits all three or none
struct Execution {
    LiquidationResult result;
    Position position;
    PeriodAccumulator accumulator;
};

// =============================================================================
// LiquidationEngine
// =============================================================================

class LiquidationEngine {
public:
    explicit LiquidationEngine(const LiquidationConfig& config = {});

    // (mark - entry) / entry, negated for shorts
    [[nodiscard]] X18 pnl_pct(PositionSide side, X18 entry_x18, X18 mark_x18) const;

    // base * max(floor, 1 - pnl_pct) * chain_multiplier, capped
    [[nodiscard]] X18 effective_leverage(uint32_t base_leverage, X18 pnl_pct_x18,
                                         X18 chain_multiplier_x18 = X18_ONE) const;

    // 1/eff + sigma * sqrt(eff) * (1 + step * (n - 1))
    [[nodiscard]] X18 required_margin_ratio(X18 effective_x18, X18 sigma_x18, uint32_t open_positions) const;

    // max(0, margin + pnl) / (notional * mark / entry)
    [[nodiscard]] X18 observed_margin_ratio(const Position& p, X18 mark_x18, X18 pnl_abs_x18) const;

    // entry * (1 -/+ m / eff)
    [[nodiscard]] X18 liquidation_price(PositionSide side, X18 entry_x18, X18 effective_x18) const;

    // Pure: the position re-marked at `mark` plus its risk flags
    [[nodiscard]] Evaluation evaluate(const Position& p, X18 mark_x18, const LiquidationContext& ctx) const;

    // clamp(cap_min, sigma * scale, cap_max) * open interest
    [[nodiscard]] X18 period_cap(X18 open_interest_x18, X18 sigma_x18) const;
    [[nodiscard]] uint64_t period_index(uint64_t timestamp) const;
    [[nodiscard]] PeriodAccumulator roll(const PeriodAccumulator& acc, uint64_t timestamp) const;

    // Bounded partial liquidation of an already-liquidatable position
    [[nodiscard]] Execution execute(const Position& p, const PeriodAccumulator& acc,
                                    const ExecutionContext& ctx) const;

    [[nodiscard]] const LiquidationConfig& config() const noexcept { return config_; }

private:
    LiquidationConfig config_;
};

} // namespace predix

#endif // PREDIX_LIQUIDATION_HPP

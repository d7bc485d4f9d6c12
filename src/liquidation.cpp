// =============================================================================
// liquidation.cpp - Margin evaluation and capped partial liquidation
// =============================================================================

#include "predix/liquidation.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"

namespace predix {

namespace {

// Observed ratio reported when exposure is zero but equity remains
constexpr X18 UNBOUNDED_RATIO = 1000000000 * X18_ONE;

} // namespace

LiquidationEngine::LiquidationEngine(const LiquidationConfig& config) : config_(config) {}

// =============================================================================
// Margin Math
// =============================================================================

X18 LiquidationEngine::pnl_pct(PositionSide side, X18 entry_x18, X18 mark_x18) const {
    if (entry_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "entry price must be positive");
    }
    X18 pct = x18::div(x18::sub(mark_x18, entry_x18), entry_x18);
    return side == PositionSide::LONG ? pct : -pct;
}

X18 LiquidationEngine::effective_leverage(uint32_t base_leverage, X18 pnl_pct_x18,
                                          X18 chain_multiplier_x18) const {
    X18 factor = x18::max(config_.pnl_floor_x18, x18::sub(X18_ONE, pnl_pct_x18));
    X18 eff = x18::mul(x18::from_int(base_leverage), factor);
    eff = x18::mul(eff, chain_multiplier_x18);
    return x18::min(eff, x18::from_int(config_.max_effective_leverage));
}

X18 LiquidationEngine::required_margin_ratio(X18 effective_x18, X18 sigma_x18, uint32_t open_positions) const {
    if (effective_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "effective leverage must be positive");
    }
    uint32_t n = open_positions == 0 ? 1 : open_positions;
    X18 crowding = X18_ONE + x18::mul(config_.position_count_step_x18, x18::from_int(n - 1));
    X18 vol_term = x18::mul(x18::mul(sigma_x18, x18::sqrt(effective_x18)), crowding);
    return x18::add(x18::div(X18_ONE, effective_x18), vol_term);
}

X18 LiquidationEngine::observed_margin_ratio(const Position& p, X18 mark_x18, X18 pnl_abs_x18) const {
    X18 equity = x18::max(x18::add(p.margin_x18, pnl_abs_x18), 0);
    X18 exposure = x18::mul_div(p.notional_x18, mark_x18, p.entry_price_x18);
    if (exposure <= 0) return equity > 0 ? UNBOUNDED_RATIO : 0;
    return x18::div(equity, exposure);
}

X18 LiquidationEngine::liquidation_price(PositionSide side, X18 entry_x18, X18 effective_x18) const {
    X18 move = x18::div(config_.maintenance_fraction_x18, effective_x18);
    if (side == PositionSide::LONG) {
        return x18::max(x18::mul(entry_x18, X18_ONE - move), 0);
    }
    return x18::mul(entry_x18, X18_ONE + move);
}

Evaluation LiquidationEngine::evaluate(const Position& p, X18 mark_x18, const LiquidationContext& ctx) const {
    Evaluation out{p, RiskFlags{}};
    Position& next = out.position;
    if (p.state == PositionState::CLOSED) return out;

    next.mark_price_x18 = mark_x18;
    next.pnl_pct_x18 = pnl_pct(p.side, p.entry_price_x18, mark_x18);
    next.pnl_abs_x18 = x18::mul(p.notional_x18, next.pnl_pct_x18);
    next.effective_leverage_x18 = effective_leverage(p.base_leverage, next.pnl_pct_x18, ctx.chain_multiplier_x18);
    next.required_ratio_x18 = required_margin_ratio(next.effective_leverage_x18, ctx.sigma_x18, ctx.open_positions);
    next.observed_ratio_x18 = observed_margin_ratio(p, mark_x18, next.pnl_abs_x18);
    next.liquidation_price_x18 = liquidation_price(p.side, p.entry_price_x18, next.effective_leverage_x18);

    // Coverage trigger takes precedence; AtRisk is the softer maintenance breach.
    if (ctx.coverage_x18 <= 0) {
        out.flags.liquidatable = true;
    } else {
        out.flags.liquidatable = next.observed_ratio_x18 < x18::div(X18_ONE, ctx.coverage_x18);
    }
    out.flags.at_risk = out.flags.liquidatable || next.observed_ratio_x18 < next.required_ratio_x18;

    if (!out.flags.at_risk) {
        next.state = PositionState::HEALTHY;
    } else if (p.state != PositionState::PARTIALLY_LIQUIDATED) {
        next.state = PositionState::AT_RISK;
    }
    return out;
}

// =============================================================================
// Period Cap
// =============================================================================

X18 LiquidationEngine::period_cap(X18 open_interest_x18, X18 sigma_x18) const {
    if (open_interest_x18 <= 0) return 0;
    X18 scaled = x18::mul(sigma_x18, config_.sigma_scale_x18);
    X18 fraction = x18::clamp(scaled, x18::from_bps(config_.cap_min_bps), x18::from_bps(config_.cap_max_bps));
    return x18::mul(fraction, open_interest_x18);
}

uint64_t LiquidationEngine::period_index(uint64_t timestamp) const {
    return timestamp / config_.period_seconds;
}

PeriodAccumulator LiquidationEngine::roll(const PeriodAccumulator& acc, uint64_t timestamp) const {
    uint64_t idx = period_index(timestamp);
    if (idx > acc.period_index) return PeriodAccumulator{idx, 0};
    return acc;
}

// =============================================================================
// Execution
// =============================================================================

Execution LiquidationEngine::execute(const Position& p, const PeriodAccumulator& acc,
                                     const ExecutionContext& ctx) const {
    if (ctx.max_size_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "liquidation size must be positive");
    }

    Execution out{LiquidationResult{}, p, roll(acc, ctx.timestamp)};
    LiquidationResult& r = out.result;
    r.position_id = p.id;
    r.keeper = ctx.keeper;
    r.remaining_x18 = p.notional_x18;
    r.period_index = out.accumulator.period_index;

    X18 allowance = period_cap(ctx.open_interest_x18, ctx.sigma_x18) - out.accumulator.liquidated_x18;
    if (allowance <= 0 || p.notional_x18 <= 0) {
        r.status = LiquidationStatus::CAP_EXHAUSTED;
        return out;
    }

    X18 limit = x18::min(allowance, ctx.max_size_x18);
    X18 close_cap = x18::mul(p.notional_x18, x18::from_bps(config_.close_factor_bps));
    X18 amount = x18::min(limit, close_cap);
    if (p.notional_x18 - amount <= config_.min_notional_x18 && p.notional_x18 <= limit) {
        amount = p.notional_x18;
    }

    X18 released = x18::mul_div(p.margin_x18, amount, p.notional_x18);
    X18 incentive = x18::mul(amount, x18::from_bps(config_.keeper_incentive_bps));

    Position& next = out.position;
    next.notional_x18 = p.notional_x18 - amount;
    next.margin_x18 = p.margin_x18 - released;
    next.pnl_abs_x18 = x18::mul(next.notional_x18, next.pnl_pct_x18);
    next.state = next.notional_x18 == 0 ? PositionState::CLOSED : PositionState::PARTIALLY_LIQUIDATED;

    out.accumulator.liquidated_x18 = x18::add(out.accumulator.liquidated_x18, amount);

    r.liquidated_x18 = amount;
    r.incentive_x18 = incentive;
    r.remaining_x18 = next.notional_x18;
    r.margin_released_x18 = released;
    r.vault_credit_x18 = released - incentive;
    r.status = next.notional_x18 == 0 ? LiquidationStatus::CLOSED : LiquidationStatus::EXECUTED;
    return out;
}

} // namespace predix

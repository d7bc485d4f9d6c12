#ifndef PREDIX_TYPES_HPP
#define PREDIX_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace predix {

// =============================================================================
// Fixed-Point Representation (X18 = 18 decimal places)
// =============================================================================

using X18 = __int128;  // value * 1e18
using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;   // 1e18
constexpr I128 X18_HALF = 500000000000000000LL;   // 0.5e18

// =============================================================================
// Identifiers
// =============================================================================

using MarketId = uint64_t;
using PositionId = uint64_t;
using ChainId = uint64_t;
using AccountId = uint64_t;

// =============================================================================
// Structural Limits
// =============================================================================

namespace limits {
constexpr uint32_t MAX_DISCRETE_OUTCOMES = 64;  // PM-AMM upper bound
constexpr uint32_t MAX_MODES = 4;               // L2 mixture components
constexpr uint32_t BPS_DENOMINATOR = 10000;
constexpr uint32_t LMSR_OUTCOMES = 2;           // one yes/no pair
}

// =============================================================================
// Enumerations
// =============================================================================

enum class AmmType : uint8_t {
    LMSR = 0,
    PMAMM = 1,
    L2 = 2
};

enum class Side : uint8_t {
    BUY = 0,
    SELL = 1
};

enum class PositionSide : uint8_t {
    LONG = 0,
    SHORT = 1
};

// Healthy -> AtRisk -> PartiallyLiquidated -> (Healthy | Closed)
enum class PositionState : uint8_t {
    HEALTHY = 0,
    AT_RISK = 1,
    PARTIALLY_LIQUIDATED = 2,
    CLOSED = 3
};

enum class LegRole : uint8_t {
    STAKE = 0,
    LEVERAGE = 1,
    BORROW = 2
};

inline const char* to_string(AmmType t) {
    switch (t) {
        case AmmType::LMSR: return "lmsr";
        case AmmType::PMAMM: return "pmamm";
        case AmmType::L2: return "l2";
    }
    return "unknown";
}

inline const char* to_string(Side s) {
    return s == Side::BUY ? "buy" : "sell";
}

inline const char* to_string(PositionSide s) {
    return s == PositionSide::LONG ? "long" : "short";
}

inline const char* to_string(PositionState s) {
    switch (s) {
        case PositionState::HEALTHY: return "healthy";
        case PositionState::AT_RISK: return "at_risk";
        case PositionState::PARTIALLY_LIQUIDATED: return "partially_liquidated";
        case PositionState::CLOSED: return "closed";
    }
    return "unknown";
}

inline const char* to_string(LegRole r) {
    switch (r) {
        case LegRole::STAKE: return "stake";
        case LegRole::LEVERAGE: return "leverage";
        case LegRole::BORROW: return "borrow";
    }
    return "unknown";
}

// =============================================================================
// Outcome Selector
// =============================================================================

// Discrete markets use `index`; L2 markets use the [lower, upper) range.
struct OutcomeRef {
    uint32_t index = 0;
    X18 lower_x18 = 0;
    X18 upper_x18 = 0;

    static OutcomeRef discrete(uint32_t i) {
        OutcomeRef ref;
        ref.index = i;
        return ref;
    }

    static OutcomeRef range(X18 lower, X18 upper) {
        OutcomeRef ref;
        ref.lower_x18 = lower;
        ref.upper_x18 = upper;
        return ref;
    }
};

// =============================================================================
// Trade Quote (shared by every pricer)
// =============================================================================

struct Quote {
    OutcomeRef outcome;
    Side side = Side::BUY;
    X18 shares_x18 = 0;
    X18 cost_x18 = 0;          // gross cost (buy) or gross proceeds (sell)
    X18 fee_x18 = 0;
    X18 total_x18 = 0;         // cost + fee (buy), proceeds - fee (sell)
    X18 fill_price_x18 = 0;    // cost / shares
    X18 spot_before_x18 = 0;
    X18 spot_after_x18 = 0;
    X18 sets_x18 = 0;          // complete sets minted or burned (PM-AMM)
    uint32_t iterations = 0;   // solver iterations (PM-AMM)
};

// =============================================================================
// Position
// =============================================================================

struct Position {
    PositionId id = 0;
    AccountId owner = 0;
    MarketId market_id = 0;
    OutcomeRef outcome;
    PositionSide side = PositionSide::LONG;
    X18 notional_x18 = 0;
    X18 entry_price_x18 = 0;
    uint32_t base_leverage = 1;
    X18 margin_x18 = 0;
    X18 mark_price_x18 = 0;
    X18 pnl_pct_x18 = 0;
    X18 pnl_abs_x18 = 0;
    X18 effective_leverage_x18 = 0;
    X18 required_ratio_x18 = 0;    // maintenance margin ratio
    X18 observed_ratio_x18 = 0;    // equity / exposure
    X18 liquidation_price_x18 = 0;
    uint32_t depth = 0;
    std::optional<ChainId> chain_id;
    PositionState state = PositionState::HEALTHY;
    uint64_t opened_at = 0;

    bool is_long() const { return side == PositionSide::LONG; }
};

} // namespace predix

#endif // PREDIX_TYPES_HPP

#ifndef PREDIX_ENGINE_HPP
#define PREDIX_ENGINE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "amm_selector.hpp"
#include "chain.hpp"
#include "config.hpp"
#include "coverage.hpp"
#include "l2.hpp"
#include "leverage.hpp"
#include "liquidation.hpp"
#include "pricer.hpp"
#include "types.hpp"

namespace predix {

// =============================================================================
// Requests
// =============================================================================

struct MarketSpec {
    MarketId market_id = 0;
    uint32_t outcome_count = 0;
    bool continuous = false;
    std::optional<AmmType> requested_amm;   // ignored when it disagrees with the structure

    // Discrete markets: optional opening prices (2 for LMSR, N for PM-AMM)
    std::vector<X18> initial_prices_x18;
    X18 initial_reserve_x18 = 1000 * X18_ONE;   // PM-AMM geometric-mean reserve

    // Continuous markets
    X18 lower_x18 = 0;
    X18 upper_x18 = X18_ONE;
    std::vector<NormalMode> modes;           // default: one mode over the support

    X18 initial_vault_x18 = 0;
};

struct PriceUpdate {
    MarketId market_id = 0;
    std::vector<X18> prices_x18;             // discrete markets
    std::vector<NormalMode> modes;           // L2: replaces the mark density
    std::vector<DensitySample> samples;      // L2: refits the mark density
    uint64_t timestamp = 0;
    std::optional<X18> sigma_x18;            // keeps the previous sigma when absent
};

struct TradeRequest {
    MarketId market_id = 0;
    AccountId owner = 0;
    OutcomeRef outcome;
    Side side = Side::BUY;                   // BUY opens a long, SELL a short
    X18 shares_x18 = 0;
    uint32_t leverage = 1;
    uint32_t max_slippage_bps = limits::BPS_DENOMINATOR;
    uint32_t depth = 0;
};

// =============================================================================
// Results
// =============================================================================

struct TradeResult {
    X18 fill_price_x18 = 0;
    Quote quote;
    Position position;
    uint32_t leverage_cap = 0;
};

struct PositionReport {
    PositionId position_id = 0;
    PositionState state = PositionState::HEALTHY;
    RiskFlags flags;
    X18 mark_price_x18 = 0;
    X18 observed_ratio_x18 = 0;
    X18 required_ratio_x18 = 0;
    X18 effective_leverage_x18 = 0;
};

struct CycleReport {
    MarketId market_id = 0;
    uint64_t timestamp = 0;
    X18 coverage_x18 = 0;
    bool halted = false;
    HaltReason reason = HaltReason::NONE;
    std::vector<PositionReport> positions;
};

struct CoverageReport {
    MarketId market_id = 0;
    X18 ratio_x18 = 0;
    X18 base_x18 = 0;
    X18 tail_loss_x18 = 0;
    bool halted = false;
    HaltReason reason = HaltReason::NONE;
    uint32_t cooldown = 0;
};

struct VaultState {
    X18 balance_x18 = 0;
    X18 open_interest_x18 = 0;
};

struct EngineStats {
    uint64_t markets = 0;
    uint64_t open_positions = 0;
    uint64_t chains = 0;
    uint64_t trades = 0;
    uint64_t price_updates = 0;
    uint64_t liquidations = 0;
    X18 total_liquidated_x18 = 0;
    X18 total_incentives_x18 = 0;
};

// =============================================================================
// RiskEngine - per-market pricing, coverage and liquidation
// =============================================================================

// Every call runs under one shared_mutex (writers exclusive, queries shared)
// and either commits fully or throws with no state change.
class RiskEngine {
public:
    explicit RiskEngine(Config config = {});

    // Non-copyable
    RiskEngine(const RiskEngine&) = delete;
    RiskEngine& operator=(const RiskEngine&) = delete;

    // Market management
    AmmType create_market(const MarketSpec& spec);
    bool has_market(MarketId market_id) const;

    // Price cycle: commit marks, recompute coverage, evaluate positions
    CycleReport update_price(const PriceUpdate& update);

    // Position operations
    TradeResult trade(const TradeRequest& request);
    LiquidationResult liquidate(PositionId position_id, X18 max_size_x18, AccountId keeper);
    LegClosure close(PositionId position_id);

    // Chains
    ChainId register_chain(const ChainPosition& chain);
    std::vector<LegClosure> unwind_chain(ChainId chain_id);

    // Vault
    void deposit(MarketId market_id, X18 amount_x18);
    void withdraw(MarketId market_id, X18 amount_x18);
    void set_correlations(MarketId market_id, const CorrelationInputs& inputs);

    // Queries
    CoverageReport coverage(MarketId market_id) const;
    std::optional<Position> position(PositionId position_id) const;
    std::vector<Position> positions(MarketId market_id) const;
    VaultState vault(MarketId market_id) const;
    std::vector<X18> market_prices(MarketId market_id) const;
    AmmType amm_type(MarketId market_id) const;
    X18 keeper_rewards(AccountId keeper) const;
    EngineStats stats() const;

    const Config& config() const noexcept { return config_; }

private:
    struct MarketContext {
        MarketContext(MarketId id, uint32_t outcomes, AmmSlot slot, Pricer p)
            : market_id(id), outcome_count(outcomes), amm(slot), pricer(std::move(p)) {}

        MarketId market_id;
        uint32_t outcome_count;
        AmmSlot amm;
        Pricer pricer;
        std::vector<X18> marks_x18;                      // discrete markets
        std::optional<L2DistributionPricer> density;     // L2 mark model
        uint64_t last_timestamp = 0;
        X18 sigma_x18 = 0;
        VaultState vault;
        X18 corr_factor_x18 = 0;
        CoverageState coverage;
        PeriodAccumulator accumulator;
    };

    MarketContext& market_ref(MarketId market_id);
    const MarketContext& market_ref(MarketId market_id) const;
    const Position& position_ref(PositionId position_id) const;

    Pricer make_pricer(const MarketSpec& spec, AmmType type) const;
    CoverageInputs coverage_inputs(const MarketContext& m) const;
    X18 mark_price(const MarketContext& m, const OutcomeRef& outcome) const;
    LiquidationContext risk_context(const MarketContext& m, X18 coverage_x18, const Position& p,
                                    uint32_t extra_positions = 0) const;
    uint32_t open_positions_of(AccountId owner) const;
    X18 chain_multiplier_of(const Position& p) const;

    // Settles a full close at the committed mark against a staged vault
    LegClosure settle_close(const Position& p, VaultState& vault) const;

    Config config_;
    CoverageEngine coverage_engine_;
    LeverageCapResolver leverage_;
    LiquidationEngine liquidation_;
    ChainUnwindCoordinator chains_;

    std::unordered_map<MarketId, MarketContext> markets_;
    std::map<PositionId, Position> positions_;
    std::map<ChainId, ChainPosition> chain_registry_;
    std::unordered_map<AccountId, X18> keeper_rewards_;
    EngineStats stats_;

    PositionId next_position_id_ = 1;
    ChainId next_chain_id_ = 1;

    mutable std::shared_mutex mutex_;
};

} // namespace predix

#endif // PREDIX_ENGINE_HPP

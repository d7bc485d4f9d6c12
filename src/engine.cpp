// =============================================================================
// engine.cpp - Per-market pricing, coverage and liquidation orchestration
// =============================================================================

#include "predix/engine.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"
#include "predix/log.hpp"

#include <set>
#include <string>

namespace predix {

namespace {

X18 sum_of(const std::vector<X18>& values) {
    X18 sum = 0;
    for (X18 v : values) sum = x18::add(sum, v);
    return sum;
}

std::string market_label(MarketId id) {
    return "market " + std::to_string(id);
}

} // namespace

RiskEngine::RiskEngine(Config config)
    : config_(std::move(config)),
      coverage_engine_(config_.coverage),
      leverage_(config_.leverage),
      liquidation_(config_.liquidation),
      chains_(config_.chain) {
    config_.validate();
    log::set_level(config_.general.log_level);
}

// =============================================================================
// Lookups
// =============================================================================

RiskEngine::MarketContext& RiskEngine::market_ref(MarketId market_id) {
    auto it = markets_.find(market_id);
    if (it == markets_.end()) {
        throw Error(ErrorCode::MarketNotFound, market_label(market_id));
    }
    return it->second;
}

const RiskEngine::MarketContext& RiskEngine::market_ref(MarketId market_id) const {
    auto it = markets_.find(market_id);
    if (it == markets_.end()) {
        throw Error(ErrorCode::MarketNotFound, market_label(market_id));
    }
    return it->second;
}

const Position& RiskEngine::position_ref(PositionId position_id) const {
    auto it = positions_.find(position_id);
    if (it == positions_.end()) {
        throw Error(ErrorCode::PositionNotFound, "position " + std::to_string(position_id));
    }
    return it->second;
}

CoverageInputs RiskEngine::coverage_inputs(const MarketContext& m) const {
    return CoverageInputs{m.vault.balance_x18, m.vault.open_interest_x18, m.outcome_count, m.corr_factor_x18};
}

X18 RiskEngine::mark_price(const MarketContext& m, const OutcomeRef& outcome) const {
    if (m.density) {
        return m.density->probability(outcome.lower_x18, outcome.upper_x18);
    }
    if (outcome.index >= m.marks_x18.size()) {
        throw Error(ErrorCode::InvalidInput, "outcome " + std::to_string(outcome.index) +
                    " out of range for " + market_label(m.market_id));
    }
    return m.marks_x18[outcome.index];
}

uint32_t RiskEngine::open_positions_of(AccountId owner) const {
    uint32_t n = 0;
    for (const auto& [id, p] : positions_) {
        if (p.owner == owner && p.state != PositionState::CLOSED) ++n;
    }
    return n;
}

X18 RiskEngine::chain_multiplier_of(const Position& p) const {
    if (!p.chain_id) return X18_ONE;
    auto it = chain_registry_.find(*p.chain_id);
    if (it == chain_registry_.end()) return X18_ONE;
    return chains_.chain_multiplier(it->second);
}

LiquidationContext RiskEngine::risk_context(const MarketContext& m, X18 coverage_x18, const Position& p,
                                            uint32_t extra_positions) const {
    LiquidationContext ctx;
    ctx.coverage_x18 = coverage_x18;
    ctx.sigma_x18 = m.sigma_x18;
    ctx.open_positions = open_positions_of(p.owner) + extra_positions;
    ctx.chain_multiplier_x18 = chain_multiplier_of(p);
    return ctx;
}

// =============================================================================
// Market Management
// =============================================================================

Pricer RiskEngine::make_pricer(const MarketSpec& spec, AmmType type) const {
    const PricingConfig& pricing = config_.pricing;
    const std::vector<X18>& opening = spec.initial_prices_x18;

    switch (type) {
        case AmmType::LMSR: {
            X18 b = pricing.lmsr_liquidity_x18;
            if (opening.empty()) return Pricer(LmsrPricer(b, pricing.fee_bps));
            if (opening.size() != limits::LMSR_OUTCOMES || opening[0] <= 0 || opening[1] <= 0) {
                throw Error(ErrorCode::InvalidInput, "LMSR opening prices must be two positive values");
            }
            // q_yes - q_no = b * ln(p_yes / p_no)
            X18 spread = x18::mul(b, x18::sub(x18::ln(opening[0]), x18::ln(opening[1])));
            if (spread >= 0) return Pricer(LmsrPricer(b, pricing.fee_bps, spread, 0));
            return Pricer(LmsrPricer(b, pricing.fee_bps, 0, -spread));
        }
        case AmmType::PMAMM: {
            if (opening.empty()) {
                return Pricer(PmAmmPricer::uniform(spec.outcome_count, spec.initial_reserve_x18,
                                                   pricing.fee_bps, config_.solver));
            }
            if (opening.size() != spec.outcome_count) {
                throw Error(ErrorCode::InvalidInput, "opening prices must cover every outcome");
            }
            return Pricer(PmAmmPricer(PmAmmPricer::solve_for_reserves(spec.initial_reserve_x18, opening),
                                      pricing.fee_bps, config_.solver));
        }
        case AmmType::L2: {
            std::vector<NormalMode> modes = spec.modes;
            if (modes.empty()) {
                NormalMode mode;
                mode.mean_x18 = spec.lower_x18 + (spec.upper_x18 - spec.lower_x18) / 2;
                mode.stddev_x18 = (spec.upper_x18 - spec.lower_x18) / 4;
                mode.weight_x18 = X18_ONE;
                modes.push_back(mode);
            }
            return Pricer(L2DistributionPricer(spec.lower_x18, spec.upper_x18, std::move(modes),
                                               pricing.l2_liquidity_x18, pricing.fee_bps,
                                               pricing.l2_weight_floor_x18, config_.integration));
        }
    }
    throw Error(ErrorCode::InvalidInput, "unknown AMM type");
}

AmmType RiskEngine::create_market(const MarketSpec& spec) {
    std::unique_lock lock(mutex_);

    if (markets_.find(spec.market_id) != markets_.end()) {
        throw Error(ErrorCode::MarketExists, market_label(spec.market_id));
    }
    if (spec.initial_vault_x18 < 0) {
        throw Error(ErrorCode::InvalidInput, "initial vault balance must be non-negative");
    }

    AmmSlot slot;
    AmmType type = slot.assign(spec.outcome_count, spec.continuous, spec.requested_amm);
    MarketContext m(spec.market_id, spec.outcome_count, slot, make_pricer(spec, type));

    if (const auto* l2 = m.pricer.get_if<L2DistributionPricer>()) {
        m.density = *l2;
    } else {
        m.marks_x18 = m.pricer.prices();
    }
    m.vault.balance_x18 = spec.initial_vault_x18;
    m.coverage.current = coverage_engine_.measure(coverage_inputs(m));

    markets_.emplace(spec.market_id, std::move(m));
    log::logger()->info("created {} with {} outcomes ({})", market_label(spec.market_id),
                        spec.outcome_count, to_string(type));
    return type;
}

bool RiskEngine::has_market(MarketId market_id) const {
    std::shared_lock lock(mutex_);
    return markets_.find(market_id) != markets_.end();
}

// =============================================================================
// Price Cycle
// =============================================================================

CycleReport RiskEngine::update_price(const PriceUpdate& update) {
    std::unique_lock lock(mutex_);

    MarketContext& current = market_ref(update.market_id);
    if (update.timestamp < current.last_timestamp) {
        throw Error(ErrorCode::StaleUpdate, "timestamp " + std::to_string(update.timestamp) +
                    " precedes " + std::to_string(current.last_timestamp));
    }
    if (update.sigma_x18 && *update.sigma_x18 < 0) {
        throw Error(ErrorCode::InvalidInput, "sigma must be non-negative");
    }

    MarketContext next = current;
    if (next.density) {
        if (!update.prices_x18.empty()) {
            throw Error(ErrorCode::InvalidInput, "continuous markets take a density, not prices");
        }
        if (!update.modes.empty()) {
            next.density->set_modes(update.modes);
        } else if (!update.samples.empty()) {
            next.density->set_modes(next.density->fit_modes(update.samples));
        }
    } else {
        if (update.prices_x18.size() != next.marks_x18.size()) {
            throw Error(ErrorCode::InvalidInput, "expected " + std::to_string(next.marks_x18.size()) +
                        " prices, got " + std::to_string(update.prices_x18.size()));
        }
        for (X18 p : update.prices_x18) {
            if (p < 0 || p > X18_ONE) {
                throw Error(ErrorCode::InvalidInput, "prices must lie in [0, 1]");
            }
        }
        X18 deviation = x18::abs(sum_of(update.prices_x18) - X18_ONE);
        if (deviation > config_.pricing.spread_tolerance_x18) {
            throw Error(ErrorCode::SpreadExceeded, "prices sum deviates from 1 by " + x18::to_string(deviation));
        }
        next.marks_x18 = update.prices_x18;
    }
    next.last_timestamp = update.timestamp;
    if (update.sigma_x18) next.sigma_x18 = *update.sigma_x18;
    next.coverage = coverage_engine_.recompute(current.coverage, coverage_inputs(next));

    CycleReport report;
    report.market_id = update.market_id;
    report.timestamp = update.timestamp;
    report.coverage_x18 = next.coverage.current.coverage_x18;
    report.halted = next.coverage.halted;
    report.reason = next.coverage.reason;

    // Every position sees the same coverage snapshot
    std::vector<Position> staged;
    for (const auto& [id, p] : positions_) {
        if (p.market_id != update.market_id) continue;
        Evaluation ev = liquidation_.evaluate(p, mark_price(next, p.outcome),
                                              risk_context(next, report.coverage_x18, p));
        PositionReport pr;
        pr.position_id = id;
        pr.state = ev.position.state;
        pr.flags = ev.flags;
        pr.mark_price_x18 = ev.position.mark_price_x18;
        pr.observed_ratio_x18 = ev.position.observed_ratio_x18;
        pr.required_ratio_x18 = ev.position.required_ratio_x18;
        pr.effective_leverage_x18 = ev.position.effective_leverage_x18;
        report.positions.push_back(pr);
        staged.push_back(std::move(ev.position));
    }

    bool was_halted = current.coverage.halted;
    current = std::move(next);
    for (auto& p : staged) positions_[p.id] = std::move(p);
    ++stats_.price_updates;

    if (report.halted && !was_halted) {
        log::logger()->warn("{} halted ({}), coverage {}", market_label(update.market_id),
                            to_string(report.reason), x18::to_string(report.coverage_x18));
    } else if (!report.halted && was_halted) {
        log::logger()->info("{} resumed, coverage {}", market_label(update.market_id),
                            x18::to_string(report.coverage_x18));
    }
    return report;
}

// =============================================================================
// Trading
// =============================================================================

TradeResult RiskEngine::trade(const TradeRequest& request) {
    std::unique_lock lock(mutex_);

    MarketContext& m = market_ref(request.market_id);
    if (request.shares_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "shares must be positive");
    }
    if (request.leverage == 0) {
        throw Error(ErrorCode::InvalidInput, "leverage must be at least 1");
    }

    CoverageMeasure fresh = coverage_engine_.measure(coverage_inputs(m));
    if (request.leverage > 1 && coverage_engine_.halted(m.coverage, fresh)) {
        throw Error(ErrorCode::CoverageBelowThreshold,
                    market_label(request.market_id) + " halted (" +
                    to_string(coverage_engine_.halt_reason(m.coverage, fresh)) + "), coverage " +
                    x18::to_string(fresh.coverage_x18));
    }

    // Unlevered trades stay open when coverage drives the cap below 1x
    uint32_t cap = leverage_.resolve(fresh.coverage_x18, m.outcome_count, request.depth);
    if (request.leverage > 1 && request.leverage > cap) {
        throw Error(ErrorCode::LeverageExceeded, "requested " + std::to_string(request.leverage) +
                    "x, maximum " + std::to_string(cap) + "x");
    }

    Pricer staged = m.pricer;
    Quote q = staged.quote(request.outcome, request.side, request.shares_x18);
    if (q.spot_before_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "outcome has no price");
    }
    X18 slippage = x18::div(x18::abs(q.fill_price_x18 - q.spot_before_x18), q.spot_before_x18);
    if (slippage > x18::from_bps(request.max_slippage_bps)) {
        throw Error(ErrorCode::SlippageExceeded, "fill " + x18::to_string(q.fill_price_x18) +
                    " vs spot " + x18::to_string(q.spot_before_x18));
    }
    staged.apply(q);

    Position p;
    p.id = next_position_id_;
    p.owner = request.owner;
    p.market_id = request.market_id;
    p.outcome = request.outcome;
    p.side = request.side == Side::BUY ? PositionSide::LONG : PositionSide::SHORT;
    p.notional_x18 = q.cost_x18;
    p.entry_price_x18 = q.fill_price_x18;
    p.base_leverage = request.leverage;
    p.margin_x18 = x18::div(q.cost_x18, x18::from_int(request.leverage));
    p.depth = request.depth;
    p.opened_at = m.last_timestamp;
    if (p.notional_x18 <= 0 || p.entry_price_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "trade too small to price");
    }

    VaultState vault = m.vault;
    vault.balance_x18 = x18::add(vault.balance_x18, q.fee_x18);
    vault.open_interest_x18 = x18::add(vault.open_interest_x18, p.notional_x18);
    CoverageMeasure after = coverage_engine_.measure(
        CoverageInputs{vault.balance_x18, vault.open_interest_x18, m.outcome_count, m.corr_factor_x18});

    Evaluation ev = liquidation_.evaluate(p, mark_price(m, p.outcome), risk_context(m, after.coverage_x18, p, 1));

    // Commit
    m.pricer = std::move(staged);
    m.vault = vault;
    positions_.emplace(p.id, ev.position);
    ++next_position_id_;
    ++stats_.trades;

    log::logger()->debug("position {} opened: {} {} shares at {} ({}x)", p.id, to_string(p.side),
                         x18::to_string(q.shares_x18), x18::to_string(q.fill_price_x18), request.leverage);

    TradeResult result;
    result.fill_price_x18 = q.fill_price_x18;
    result.quote = q;
    result.position = ev.position;
    result.leverage_cap = cap;
    return result;
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult RiskEngine::liquidate(PositionId position_id, X18 max_size_x18, AccountId keeper) {
    std::unique_lock lock(mutex_);

    const Position p = position_ref(position_id);
    MarketContext& m = market_ref(p.market_id);
    if (max_size_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "liquidation size must be positive");
    }

    CoverageMeasure fresh = coverage_engine_.measure(coverage_inputs(m));
    Evaluation ev = liquidation_.evaluate(p, mark_price(m, p.outcome), risk_context(m, fresh.coverage_x18, p));
    if (!ev.flags.liquidatable) {
        LiquidationResult noop;
        noop.position_id = position_id;
        noop.keeper = keeper;
        noop.remaining_x18 = p.notional_x18;
        noop.period_index = liquidation_.period_index(m.last_timestamp);
        noop.status = LiquidationStatus::NOT_LIQUIDATABLE;
        return noop;
    }

    ExecutionContext ctx;
    ctx.open_interest_x18 = m.vault.open_interest_x18;
    ctx.sigma_x18 = m.sigma_x18;
    ctx.timestamp = m.last_timestamp;
    ctx.max_size_x18 = max_size_x18;
    ctx.keeper = keeper;
    Execution ex = liquidation_.execute(ev.position, m.accumulator, ctx);
    const LiquidationResult& r = ex.result;

    if (r.is_noop()) {
        m.accumulator = ex.accumulator;
        log::logger()->debug("position {} not liquidated: {}", position_id, to_string(r.status));
        return r;
    }

    VaultState vault = m.vault;
    vault.balance_x18 = x18::add(vault.balance_x18, r.vault_credit_x18);
    if (vault.balance_x18 < 0) {
        throw Error(ErrorCode::InsufficientBalance, market_label(p.market_id) + " cannot fund the keeper incentive");
    }
    vault.open_interest_x18 = x18::max(x18::sub(vault.open_interest_x18, r.liquidated_x18), 0);

    // Commit
    m.vault = vault;
    m.accumulator = ex.accumulator;
    keeper_rewards_[keeper] = x18::add(keeper_rewards_[keeper], r.incentive_x18);
    ++stats_.liquidations;
    stats_.total_liquidated_x18 = x18::add(stats_.total_liquidated_x18, r.liquidated_x18);
    stats_.total_incentives_x18 = x18::add(stats_.total_incentives_x18, r.incentive_x18);
    if (r.status == LiquidationStatus::CLOSED) {
        positions_.erase(position_id);
    } else {
        positions_[position_id] = ex.position;
    }

    log::logger()->info("position {} liquidated {} by keeper {} (incentive {}, remaining {})", position_id,
                        x18::to_string(r.liquidated_x18), keeper, x18::to_string(r.incentive_x18),
                        x18::to_string(r.remaining_x18));
    return r;
}

// =============================================================================
// Closing and Chains
// =============================================================================

LegClosure RiskEngine::settle_close(const Position& p, VaultState& vault) const {
    const MarketContext& m = market_ref(p.market_id);
    X18 pct = liquidation_.pnl_pct(p.side, p.entry_price_x18, mark_price(m, p.outcome));
    X18 pnl = x18::mul(p.notional_x18, pct);

    LegClosure c;
    c.position_id = p.id;
    c.notional_closed_x18 = p.notional_x18;
    c.pnl_x18 = pnl;
    if (pnl >= 0) {
        if (vault.balance_x18 < pnl) {
            throw Error(ErrorCode::InsufficientBalance, market_label(p.market_id) + " cannot pay profit of " +
                        x18::to_string(pnl) + " on position " + std::to_string(p.id));
        }
        vault.balance_x18 -= pnl;
        c.margin_returned_x18 = x18::add(p.margin_x18, pnl);
    } else {
        X18 loss = x18::min(-pnl, p.margin_x18);
        vault.balance_x18 = x18::add(vault.balance_x18, loss);
        c.margin_returned_x18 = p.margin_x18 - loss;
    }
    vault.open_interest_x18 = x18::max(vault.open_interest_x18 - p.notional_x18, 0);
    return c;
}

LegClosure RiskEngine::close(PositionId position_id) {
    std::unique_lock lock(mutex_);

    const Position& p = position_ref(position_id);
    MarketContext& m = market_ref(p.market_id);
    VaultState vault = m.vault;
    LegClosure c = settle_close(p, vault);

    m.vault = vault;
    positions_.erase(position_id);
    log::logger()->debug("position {} closed, pnl {}", position_id, x18::to_string(c.pnl_x18));
    return c;
}

ChainId RiskEngine::register_chain(const ChainPosition& chain) {
    std::unique_lock lock(mutex_);

    if (chain.legs.empty()) {
        throw Error(ErrorCode::InvalidInput, "chain has no legs");
    }
    ChainUnwindCoordinator::check_acyclic(chain);

    std::set<PositionId> seen;
    for (const auto& leg : chain.legs) {
        if (!leg.position_id) continue;
        const Position& p = position_ref(*leg.position_id);
        if (p.chain_id) {
            throw Error(ErrorCode::InvalidInput, "position " + std::to_string(p.id) +
                        " already belongs to chain " + std::to_string(*p.chain_id));
        }
        if (!seen.insert(p.id).second) {
            throw Error(ErrorCode::InvalidInput, "position " + std::to_string(p.id) + " appears twice");
        }
    }

    ChainId id = next_chain_id_++;
    ChainPosition stored = chain;
    stored.chain_id = id;
    for (PositionId pid : seen) positions_[pid].chain_id = id;
    chain_registry_.emplace(id, std::move(stored));

    log::logger()->info("chain {} registered with {} legs, multiplier {}", id, chain.legs.size(),
                        x18::to_string(chains_.chain_multiplier(chain)));
    return id;
}

std::vector<LegClosure> RiskEngine::unwind_chain(ChainId chain_id) {
    std::unique_lock lock(mutex_);

    auto it = chain_registry_.find(chain_id);
    if (it == chain_registry_.end()) {
        throw Error(ErrorCode::ChainNotFound, "chain " + std::to_string(chain_id));
    }

    // Closures settle against staged vaults and commit only after every leg
    std::unordered_map<MarketId, VaultState> staged;
    std::vector<PositionId> closed;
    auto closer = [&](uint32_t leg, const ChainLeg& l) {
        LegClosure c;
        if (l.position_id) {
            auto pit = positions_.find(*l.position_id);
            if (pit != positions_.end()) {
                const Position& p = pit->second;
                auto vit = staged.try_emplace(p.market_id, market_ref(p.market_id).vault).first;
                c = settle_close(p, vit->second);
                closed.push_back(p.id);
            }
        }
        c.leg = leg;
        c.role = l.role;
        c.position_id = l.position_id;
        return c;
    };
    std::vector<LegClosure> closures = chains_.unwind(it->second, closer);

    for (auto& [market_id, vault] : staged) market_ref(market_id).vault = vault;
    for (PositionId pid : closed) positions_.erase(pid);
    chain_registry_.erase(it);

    log::logger()->info("chain {} unwound, {} positions closed", chain_id, closed.size());
    return closures;
}

// =============================================================================
// Vault
// =============================================================================

void RiskEngine::deposit(MarketId market_id, X18 amount_x18) {
    std::unique_lock lock(mutex_);
    MarketContext& m = market_ref(market_id);
    if (amount_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "deposit must be positive");
    }
    m.vault.balance_x18 = x18::add(m.vault.balance_x18, amount_x18);
}

void RiskEngine::withdraw(MarketId market_id, X18 amount_x18) {
    std::unique_lock lock(mutex_);
    MarketContext& m = market_ref(market_id);
    if (amount_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "withdrawal must be positive");
    }
    if (amount_x18 > m.vault.balance_x18) {
        throw Error(ErrorCode::InsufficientBalance, market_label(market_id) + " holds " +
                    x18::to_string(m.vault.balance_x18));
    }
    m.vault.balance_x18 -= amount_x18;
}

void RiskEngine::set_correlations(MarketId market_id, const CorrelationInputs& inputs) {
    std::unique_lock lock(mutex_);
    MarketContext& m = market_ref(market_id);
    m.corr_factor_x18 = CoverageEngine::correlation_factor(inputs);
}

// =============================================================================
// Queries
// =============================================================================

CoverageReport RiskEngine::coverage(MarketId market_id) const {
    std::shared_lock lock(mutex_);
    const MarketContext& m = market_ref(market_id);
    CoverageMeasure fresh = coverage_engine_.measure(coverage_inputs(m));

    CoverageReport report;
    report.market_id = market_id;
    report.ratio_x18 = fresh.coverage_x18;
    report.base_x18 = fresh.base_x18;
    report.tail_loss_x18 = fresh.tail_loss_x18;
    report.reason = coverage_engine_.halt_reason(m.coverage, fresh);
    report.halted = report.reason != HaltReason::NONE;
    report.cooldown = m.coverage.cooldown;
    return report;
}

std::optional<Position> RiskEngine::position(PositionId position_id) const {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(position_id);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::vector<Position> RiskEngine::positions(MarketId market_id) const {
    std::shared_lock lock(mutex_);
    market_ref(market_id);
    std::vector<Position> result;
    for (const auto& [id, p] : positions_) {
        if (p.market_id == market_id) result.push_back(p);
    }
    return result;
}

VaultState RiskEngine::vault(MarketId market_id) const {
    std::shared_lock lock(mutex_);
    return market_ref(market_id).vault;
}

std::vector<X18> RiskEngine::market_prices(MarketId market_id) const {
    std::shared_lock lock(mutex_);
    return market_ref(market_id).marks_x18;
}

AmmType RiskEngine::amm_type(MarketId market_id) const {
    std::shared_lock lock(mutex_);
    return market_ref(market_id).amm.get();
}

X18 RiskEngine::keeper_rewards(AccountId keeper) const {
    std::shared_lock lock(mutex_);
    auto it = keeper_rewards_.find(keeper);
    return it == keeper_rewards_.end() ? 0 : it->second;
}

EngineStats RiskEngine::stats() const {
    std::shared_lock lock(mutex_);
    EngineStats s = stats_;
    s.markets = markets_.size();
    s.open_positions = positions_.size();
    s.chains = chain_registry_.size();
    return s;
}

} // namespace predix

// =============================================================================
// lmsr.cpp - LMSR binary pricer
// =============================================================================

#include "predix/lmsr.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"
#include "predix/tables.hpp"

#include <string>

namespace predix {

LmsrPricer::LmsrPricer(X18 liquidity_x18, uint32_t fee_bps, X18 q_yes_x18, X18 q_no_x18)
    : q_x18_{q_yes_x18, q_no_x18}, b_x18_(liquidity_x18), fee_bps_(fee_bps) {
    if (liquidity_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "LMSR liquidity must be positive");
    }
    if (q_yes_x18 < 0 || q_no_x18 < 0) {
        throw Error(ErrorCode::InvalidInput, "LMSR quantities must be non-negative");
    }
}

// =============================================================================
// Scoring Rule
// =============================================================================

X18 LmsrPricer::cost_of(const std::array<X18, 2>& q, X18 b) {
    const ExpTable& table = ExpTable::instance();
    X18 m = x18::max(q[0], q[1]);
    X18 sum = table.lookup(x18::div(q[0] - m, b)) + table.lookup(x18::div(q[1] - m, b));
    return x18::add(m, x18::mul(b, x18::ln(sum)));
}

X18 LmsrPricer::price_of(const std::array<X18, 2>& q, X18 b, uint32_t outcome) {
    const ExpTable& table = ExpTable::instance();
    X18 m = x18::max(q[0], q[1]);
    X18 e0 = table.lookup(x18::div(q[0] - m, b));
    X18 e1 = table.lookup(x18::div(q[1] - m, b));
    return x18::div(outcome == YES ? e0 : e1, e0 + e1);
}

void LmsrPricer::check_outcome(uint32_t outcome) const {
    if (outcome >= limits::LMSR_OUTCOMES) {
        throw Error(ErrorCode::InvalidInput, "LMSR outcome must be 0 (yes) or 1 (no), got " +
                    std::to_string(outcome));
    }
}

X18 LmsrPricer::price(uint32_t outcome) const {
    check_outcome(outcome);
    return price_of(q_x18_, b_x18_, outcome);
}

std::vector<X18> LmsrPricer::prices() const {
    X18 yes = price_of(q_x18_, b_x18_, YES);
    return {yes, X18_ONE - yes};
}

X18 LmsrPricer::cost() const {
    return cost_of(q_x18_, b_x18_);
}

X18 LmsrPricer::quantity(uint32_t outcome) const {
    check_outcome(outcome);
    return q_x18_[outcome];
}

// =============================================================================
// Quotes
// =============================================================================

Quote LmsrPricer::quote_buy(uint32_t outcome, X18 shares_x18) const {
    check_outcome(outcome);
    if (shares_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "share amount must be positive");
    }

    std::array<X18, 2> next = q_x18_;
    next[outcome] = x18::add(next[outcome], shares_x18);

    Quote q;
    q.outcome = OutcomeRef::discrete(outcome);
    q.side = Side::BUY;
    q.shares_x18 = shares_x18;
    q.cost_x18 = cost_of(next, b_x18_) - cost_of(q_x18_, b_x18_);
    q.fee_x18 = x18::mul(q.cost_x18, x18::from_bps(fee_bps_));
    q.total_x18 = q.cost_x18 + q.fee_x18;
    q.fill_price_x18 = x18::div(q.cost_x18, shares_x18);
    q.spot_before_x18 = price_of(q_x18_, b_x18_, outcome);
    q.spot_after_x18 = price_of(next, b_x18_, outcome);
    return q;
}

Quote LmsrPricer::quote_sell(uint32_t outcome, X18 shares_x18) const {
    check_outcome(outcome);
    if (shares_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "share amount must be positive");
    }
    if (shares_x18 > q_x18_[outcome]) {
        throw Error(ErrorCode::InsufficientLiquidity, "sell of " + x18::to_string(shares_x18) +
                    " exceeds outstanding " + x18::to_string(q_x18_[outcome]));
    }

    std::array<X18, 2> next = q_x18_;
    next[outcome] -= shares_x18;

    Quote q;
    q.outcome = OutcomeRef::discrete(outcome);
    q.side = Side::SELL;
    q.shares_x18 = shares_x18;
    q.cost_x18 = cost_of(q_x18_, b_x18_) - cost_of(next, b_x18_);
    q.fee_x18 = x18::mul(q.cost_x18, x18::from_bps(fee_bps_));
    q.total_x18 = q.cost_x18 - q.fee_x18;
    q.fill_price_x18 = x18::div(q.cost_x18, shares_x18);
    q.spot_before_x18 = price_of(q_x18_, b_x18_, outcome);
    q.spot_after_x18 = price_of(next, b_x18_, outcome);
    return q;
}

Quote LmsrPricer::quote(const OutcomeRef& outcome, Side side, X18 shares_x18) const {
    return side == Side::BUY ? quote_buy(outcome.index, shares_x18)
                             : quote_sell(outcome.index, shares_x18);
}

void LmsrPricer::apply(const Quote& q) {
    uint32_t i = q.outcome.index;
    check_outcome(i);
    if (q.side == Side::BUY) {
        q_x18_[i] = x18::add(q_x18_[i], q.shares_x18);
        return;
    }
    if (q.shares_x18 > q_x18_[i]) {
        throw Error(ErrorCode::InsufficientLiquidity, "stale sell quote");
    }
    q_x18_[i] -= q.shares_x18;
}

} // namespace predix

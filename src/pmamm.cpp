// =============================================================================
// pmamm.cpp - PM-AMM pricer and Newton-Raphson solver
// =============================================================================

#include "predix/pmamm.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"
#include "predix/log.hpp"

#include <string>
#include <utility>

namespace predix {

// =============================================================================
// NewtonRaphsonSolver
// =============================================================================

NewtonRaphsonSolver::NewtonRaphsonSolver(const SolverConfig& config) : config_(config) {}

void NewtonRaphsonSolver::record(uint32_t iterations) {
    if (stats_.solves == 0) {
        stats_.min_iterations = iterations;
        stats_.max_iterations = iterations;
    } else {
        if (iterations < stats_.min_iterations) stats_.min_iterations = iterations;
        if (iterations > stats_.max_iterations) stats_.max_iterations = iterations;
    }
    ++stats_.solves;
    stats_.total_iterations += iterations;
}

SolverResult NewtonRaphsonSolver::solve(const Function& fn, X18 x0, const Domain& in_domain) {
    if (in_domain && !in_domain(x0)) {
        throw Error(ErrorCode::InvalidInput, "initial guess outside the solver domain");
    }

    X18 x = x0;
    Residual r = fn(x);
    for (uint32_t it = 0;; ++it) {
        if (x18::abs(r.value_x18) < config_.tolerance_x18) {
            record(it);
            return SolverResult{x, r.value_x18, it};
        }
        if (it == config_.max_iterations || r.derivative_x18 == 0) break;

        X18 step = x18::div(r.value_x18, r.derivative_x18);
        if (x18::abs(r.value_x18) > config_.damping_threshold_x18) {
            step = x18::mul(step, config_.damping_x18);
        }

        X18 next = x18::sub(x, step);
        while (in_domain && !in_domain(next)) {
            step /= 2;
            if (step == 0) {
                throw Error(ErrorCode::PricingDivergence, "solver step collapsed at the domain boundary");
            }
            next = x - step;
        }
        x = next;
        r = fn(x);
    }

    log::logger()->warn("newton solver did not converge in {} iterations, residual {}",
                        config_.max_iterations, x18::to_string(r.value_x18));
    throw Error(ErrorCode::PricingDivergence,
                "no convergence after " + std::to_string(config_.max_iterations) + " iterations");
}

// =============================================================================
// PmAmmPricer
// =============================================================================

PmAmmPricer::PmAmmPricer(std::vector<X18> reserves_x18, uint32_t fee_bps, const SolverConfig& solver)
    : reserves_x18_(std::move(reserves_x18)), fee_bps_(fee_bps), solver_(solver) {
    if (reserves_x18_.size() < 2 || reserves_x18_.size() > limits::MAX_DISCRETE_OUTCOMES) {
        throw Error(ErrorCode::InvalidOutcomeCount,
                    "PM-AMM needs 2..64 outcomes, got " + std::to_string(reserves_x18_.size()));
    }
    for (X18 r : reserves_x18_) {
        if (r <= 0) throw Error(ErrorCode::InvalidInput, "PM-AMM reserves must be positive");
    }
}

PmAmmPricer PmAmmPricer::uniform(uint32_t outcomes, X18 reserve_x18, uint32_t fee_bps,
                                 const SolverConfig& solver) {
    return PmAmmPricer(std::vector<X18>(outcomes, reserve_x18), fee_bps, solver);
}

std::vector<X18> PmAmmPricer::solve_for_reserves(X18 geometric_mean_x18,
                                                 const std::vector<X18>& targets_x18) {
    if (targets_x18.size() < 2 || targets_x18.size() > limits::MAX_DISCRETE_OUTCOMES) {
        throw Error(ErrorCode::InvalidOutcomeCount, "target vector needs 2..64 probabilities");
    }
    if (geometric_mean_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "geometric mean must be positive");
    }

    // r_i = c / p_i with c = g * (prod p_i)^(1/N)
    X18 ln_sum = 0;
    for (X18 p : targets_x18) {
        if (p <= 0 || p >= X18_ONE) {
            throw Error(ErrorCode::InvalidInput, "target probabilities must lie in (0, 1)");
        }
        ln_sum = x18::add(ln_sum, x18::ln(p));
    }
    X18 n = static_cast<X18>(targets_x18.size());
    X18 c = x18::mul(geometric_mean_x18, x18::exp(ln_sum / n));

    std::vector<X18> reserves;
    reserves.reserve(targets_x18.size());
    for (X18 p : targets_x18) reserves.push_back(x18::div(c, p));
    return reserves;
}

std::vector<X18> PmAmmPricer::normalized_prices(const std::vector<X18>& reserves) {
    std::vector<X18> inv(reserves.size());
    X18 total = 0;
    for (size_t j = 0; j < reserves.size(); ++j) {
        inv[j] = x18::div(X18_ONE, reserves[j]);
        total += inv[j];
    }

    std::vector<X18> p(reserves.size());
    X18 sum = 0;
    size_t largest = 0;
    for (size_t j = 0; j < reserves.size(); ++j) {
        p[j] = x18::div(inv[j], total);
        sum += p[j];
        if (p[j] > p[largest]) largest = j;
    }
    // rounding remainder goes to the largest probability
    p[largest] += X18_ONE - sum;
    return p;
}

void PmAmmPricer::check_outcome(uint32_t outcome) const {
    if (outcome >= reserves_x18_.size()) {
        throw Error(ErrorCode::InvalidInput, "outcome " + std::to_string(outcome) + " out of range");
    }
}

X18 PmAmmPricer::price(uint32_t outcome) const {
    check_outcome(outcome);
    return normalized_prices(reserves_x18_)[outcome];
}

std::vector<X18> PmAmmPricer::prices() const {
    return normalized_prices(reserves_x18_);
}

std::vector<X18> PmAmmPricer::reserves_after(uint32_t outcome, Side side, X18 shares, X18 sets) const {
    std::vector<X18> next = reserves_x18_;
    for (size_t j = 0; j < next.size(); ++j) {
        if (side == Side::BUY) {
            next[j] = x18::add(next[j], sets);
            if (j == outcome) next[j] -= shares;
        } else {
            next[j] -= sets;
            if (j == outcome) next[j] = x18::add(next[j], shares);
        }
        if (next[j] <= 0) {
            throw Error(ErrorCode::InsufficientLiquidity, "trade would exhaust reserve " + std::to_string(j));
        }
    }
    return next;
}

Quote PmAmmPricer::make_quote(uint32_t outcome, Side side, X18 shares, const SolverResult& solved) const {
    std::vector<X18> next = reserves_after(outcome, side, shares, solved.root_x18);

    Quote q;
    q.outcome = OutcomeRef::discrete(outcome);
    q.side = side;
    q.shares_x18 = shares;
    q.sets_x18 = solved.root_x18;
    q.cost_x18 = solved.root_x18;
    q.fee_x18 = x18::mul(q.cost_x18, x18::from_bps(fee_bps_));
    q.total_x18 = side == Side::BUY ? q.cost_x18 + q.fee_x18 : q.cost_x18 - q.fee_x18;
    q.fill_price_x18 = x18::div(q.cost_x18, shares);
    q.spot_before_x18 = normalized_prices(reserves_x18_)[outcome];
    q.spot_after_x18 = normalized_prices(next)[outcome];
    q.iterations = solved.iterations;
    return q;
}

Quote PmAmmPricer::quote_buy(uint32_t outcome, X18 shares_x18) const {
    check_outcome(outcome);
    if (shares_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "share amount must be positive");
    }

    const std::vector<X18>& r = reserves_x18_;
    const X18 ri = r[outcome];
    const X18 x = shares_x18;

    auto residual = [&](X18 d) {
        X18 held = x18::sub(x18::add(ri, d), x);
        X18 a = x18::div(held, ri);
        X18 s = x18::div(X18_ONE, held);
        for (size_t j = 0; j < r.size(); ++j) {
            if (j == outcome) continue;
            X18 rj = x18::add(r[j], d);
            a = x18::mul(a, x18::div(rj, r[j]));
            s += x18::div(X18_ONE, rj);
        }
        return Residual{a - X18_ONE, x18::mul(a, s)};
    };
    auto in_domain = [&](X18 d) { return d > 0 && ri + d - x > 0; };

    X18 guess = x18::mul(price(outcome), x);
    if (!in_domain(guess)) guess = x;

    SolverResult solved = solver_.solve(residual, guess, in_domain);
    return make_quote(outcome, Side::BUY, x, solved);
}

Quote PmAmmPricer::quote_sell(uint32_t outcome, X18 shares_x18) const {
    check_outcome(outcome);
    if (shares_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "share amount must be positive");
    }

    const std::vector<X18>& r = reserves_x18_;
    const X18 ri = r[outcome];
    const X18 x = shares_x18;

    X18 bound = x18::add(ri, x);
    for (size_t j = 0; j < r.size(); ++j) {
        if (j != outcome) bound = x18::min(bound, r[j]);
    }

    auto residual = [&](X18 d) {
        X18 held = ri + x - d;
        X18 a = x18::div(held, ri);
        X18 s = x18::div(X18_ONE, held);
        for (size_t j = 0; j < r.size(); ++j) {
            if (j == outcome) continue;
            X18 rj = r[j] - d;
            a = x18::mul(a, x18::div(rj, r[j]));
            s += x18::div(X18_ONE, rj);
        }
        return Residual{a - X18_ONE, -x18::mul(a, s)};
    };
    auto in_domain = [&](X18 d) { return d > 0 && d < bound; };

    X18 guess = x18::mul(price(outcome), x);
    if (!in_domain(guess)) guess = bound / 2;

    SolverResult solved = solver_.solve(residual, guess, in_domain);
    return make_quote(outcome, Side::SELL, x, solved);
}

Quote PmAmmPricer::quote(const OutcomeRef& outcome, Side side, X18 shares_x18) const {
    return side == Side::BUY ? quote_buy(outcome.index, shares_x18)
                             : quote_sell(outcome.index, shares_x18);
}

void PmAmmPricer::apply(const Quote& q) {
    check_outcome(q.outcome.index);
    reserves_x18_ = reserves_after(q.outcome.index, q.side, q.shares_x18, q.sets_x18);
}

} // namespace predix

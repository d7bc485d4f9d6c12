// =============================================================================
// coverage.cpp - Solvency ratio, tail loss and halt detection
// =============================================================================

#include "predix/coverage.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"
#include "predix/log.hpp"

#include <algorithm>

namespace predix {

CoverageEngine::CoverageEngine(const CoverageConfig& config) : config_(config) {}

X18 CoverageEngine::base_coverage(X18 vault_x18, X18 open_interest_x18) const {
    if (open_interest_x18 <= 0) return config_.sentinel_x18;
    return x18::min(x18::div(vault_x18, open_interest_x18 / 2), config_.sentinel_x18);
}

void CoverageEngine::validate(const CorrelationInputs& inputs) {
    const size_t n = inputs.weights_x18.size();
    if (inputs.correlations_x18.size() != n * n) {
        throw Error(ErrorCode::InvalidInput, "correlation matrix must be n x n for n weights");
    }
    for (X18 w : inputs.weights_x18) {
        if (w < 0) throw Error(ErrorCode::InvalidInput, "exposure weights must be non-negative");
    }
    for (X18 rho : inputs.correlations_x18) {
        if (rho < -X18_ONE || rho > X18_ONE) {
            throw Error(ErrorCode::InvalidInput, "correlations must lie in [-1, 1]");
        }
    }
}

X18 CoverageEngine::correlation_factor(const CorrelationInputs& inputs) {
    validate(inputs);
    const size_t n = inputs.weights_x18.size();

    X18 num = 0;
    X18 den = 0;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            X18 ww = x18::mul(inputs.weights_x18[i], inputs.weights_x18[j]);
            X18 rho = x18::max(inputs.correlations_x18[i * n + j], 0);
            num = x18::add(num, x18::mul(ww, rho));
            den = x18::add(den, ww);
        }
    }
    if (den == 0) return 0;
    return x18::clamp(x18::div(num, den), 0, X18_ONE);
}

X18 CoverageEngine::tail_loss(uint32_t outcome_count, X18 corr_factor_x18) {
    X18 n = static_cast<X18>(std::max<uint32_t>(outcome_count, 2));
    X18 corr = x18::clamp(corr_factor_x18, 0, X18_ONE);
    return X18_ONE - (X18_ONE - corr) / n;
}

CoverageMeasure CoverageEngine::measure(const CoverageInputs& in) const {
    CoverageMeasure m;
    m.corr_factor_x18 = x18::clamp(in.corr_factor_x18, 0, X18_ONE);
    m.tail_loss_x18 = tail_loss(in.outcome_count, m.corr_factor_x18);
    m.base_x18 = base_coverage(in.vault_x18, in.open_interest_x18);
    if (in.open_interest_x18 <= 0) {
        m.coverage_x18 = config_.sentinel_x18;
    } else {
        X18 loss = x18::mul(m.tail_loss_x18, in.open_interest_x18);
        m.coverage_x18 = x18::min(x18::div(in.vault_x18, loss), config_.sentinel_x18);
    }
    return m;
}

CoverageState CoverageEngine::recompute(const CoverageState& prev, const CoverageInputs& inputs) const {
    CoverageState next = prev;
    next.current = measure(inputs);
    const X18 now = next.current.coverage_x18;

    // A move off the zero-OI sentinel is not a drop.
    bool dropped = false;
    if (!prev.window.empty()) {
        X18 before = prev.window.back();
        if (before > 0 && before < config_.sentinel_x18 && now < before) {
            dropped = x18::div(before - now, before) > config_.drop_fraction_x18;
        }
    }

    if (dropped) {
        next.cooldown = std::max<uint32_t>(config_.cooldown_cycles, 1);
        log::logger()->warn("coverage dropped from {} to {}, halting for {} cycles",
                            x18::to_string(prev.window.back()), x18::to_string(now), next.cooldown);
    } else if (next.cooldown > 0) {
        --next.cooldown;
    }

    next.window.push_back(now);
    while (next.window.size() > config_.window) next.window.pop_front();

    if (next.cooldown > 0) {
        next.halted = true;
        next.reason = HaltReason::COVERAGE_DROP;
    } else if (now < config_.min_coverage_x18) {
        next.halted = true;
        next.reason = HaltReason::BELOW_MINIMUM;
    } else {
        next.halted = false;
        next.reason = HaltReason::NONE;
    }
    ++next.cycles;
    return next;
}

HaltReason CoverageEngine::halt_reason(const CoverageState& committed, const CoverageMeasure& fresh) const {
    if (committed.cooldown > 0) return HaltReason::COVERAGE_DROP;
    if (fresh.coverage_x18 < config_.min_coverage_x18) return HaltReason::BELOW_MINIMUM;
    return HaltReason::NONE;
}

bool CoverageEngine::halted(const CoverageState& committed, const CoverageMeasure& fresh) const {
    return halt_reason(committed, fresh) != HaltReason::NONE;
}

} // namespace predix

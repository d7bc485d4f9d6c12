// =============================================================================
// l2.cpp - Continuous-outcome pricer over a normal mixture
// =============================================================================

#include "predix/l2.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"

#include <string>
#include <utility>

namespace predix {

L2DistributionPricer::L2DistributionPricer(X18 lower_x18, X18 upper_x18, std::vector<NormalMode> modes,
                                           X18 liquidity_x18, uint32_t fee_bps, X18 weight_floor_x18,
                                           const IntegrationConfig& integration)
    : lower_x18_(lower_x18),
      upper_x18_(upper_x18),
      liquidity_x18_(liquidity_x18),
      fee_bps_(fee_bps),
      weight_floor_x18_(weight_floor_x18),
      integrator_(integration) {
    if (upper_x18 <= lower_x18) {
        throw Error(ErrorCode::InvalidInput, "L2 support must have upper > lower");
    }
    if (liquidity_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "L2 liquidity must be positive");
    }
    set_modes(std::move(modes));
}

// =============================================================================
// Density
// =============================================================================

X18 L2DistributionPricer::normal_pdf(const NormalMode& mode, X18 x) {
    X18 z = x18::div(x - mode.mean_x18, mode.stddev_x18);
    X18 half = x18::sat_mul(z, z) / 2;
    if (half > x18::from_int(42)) return 0;
    X18 e = x18::exp(-half);
    return x18::div(x18::mul(e, x18::INV_SQRT_2PI), mode.stddev_x18);
}

void L2DistributionPricer::validate_modes(const std::vector<NormalMode>& modes) {
    if (modes.empty() || modes.size() > limits::MAX_MODES) {
        throw Error(ErrorCode::InvalidInput,
                    "density needs 1..4 modes, got " + std::to_string(modes.size()));
    }
    X18 total = 0;
    for (const auto& m : modes) {
        if (m.stddev_x18 <= 0) throw Error(ErrorCode::InvalidInput, "mode stddev must be positive");
        if (m.weight_x18 < 0) throw Error(ErrorCode::InvalidInput, "mode weight must be non-negative");
        total = x18::add(total, m.weight_x18);
    }
    if (total <= 0) throw Error(ErrorCode::InvalidInput, "mode weights sum to zero");
}

void L2DistributionPricer::normalize_weights(std::vector<NormalMode>& modes) {
    X18 total = 0;
    for (const auto& m : modes) total += m.weight_x18;

    X18 sum = 0;
    size_t largest = 0;
    for (size_t i = 0; i < modes.size(); ++i) {
        modes[i].weight_x18 = x18::div(modes[i].weight_x18, total);
        sum += modes[i].weight_x18;
        if (modes[i].weight_x18 > modes[largest].weight_x18) largest = i;
    }
    modes[largest].weight_x18 += X18_ONE - sum;
}

void L2DistributionPricer::set_modes(std::vector<NormalMode> modes) {
    validate_modes(modes);
    normalize_weights(modes);

    std::vector<X18> support(modes.size());
    for (size_t i = 0; i < modes.size(); ++i) {
        support[i] = raw_mass(modes[i], lower_x18_, upper_x18_);
        if (support[i] <= 0) {
            throw Error(ErrorCode::InvalidInput,
                        "mode " + std::to_string(i) + " carries no mass on the support");
        }
    }

    modes_ = std::move(modes);
    support_mass_x18_ = std::move(support);
}

X18 L2DistributionPricer::raw_mass(const NormalMode& mode, X18 lo, X18 hi) const {
    Integral r = integrator_.integrate([&mode](X18 x) { return normal_pdf(mode, x); }, lo, hi);
    return x18::max(r.value_x18, 0);
}

X18 L2DistributionPricer::density(X18 x) const {
    if (x < lower_x18_ || x > upper_x18_) return 0;
    X18 total = 0;
    for (size_t i = 0; i < modes_.size(); ++i) {
        X18 pdf = x18::div(normal_pdf(modes_[i], x), support_mass_x18_[i]);
        total = x18::add(total, x18::mul(modes_[i].weight_x18, pdf));
    }
    return total;
}

X18 L2DistributionPricer::mode_mass(size_t mode, X18 lo, X18 hi) const {
    if (mode >= modes_.size()) {
        throw Error(ErrorCode::InvalidInput, "mode index out of range");
    }
    X18 a = x18::max(lo, lower_x18_);
    X18 b = x18::min(hi, upper_x18_);
    if (b <= a) return 0;
    X18 mass = x18::div(raw_mass(modes_[mode], a, b), support_mass_x18_[mode]);
    return x18::clamp(mass, 0, X18_ONE);
}

std::vector<X18> L2DistributionPricer::mode_masses(X18 lo, X18 hi) const {
    std::vector<X18> masses(modes_.size());
    for (size_t i = 0; i < modes_.size(); ++i) masses[i] = mode_mass(i, lo, hi);
    return masses;
}

X18 L2DistributionPricer::probability(X18 lo, X18 hi) const {
    std::vector<X18> masses = mode_masses(lo, hi);
    X18 total = 0;
    for (size_t i = 0; i < modes_.size(); ++i) {
        total += x18::mul(modes_[i].weight_x18, masses[i]);
    }
    return x18::clamp(total, 0, X18_ONE);
}

// =============================================================================
// Trading
// =============================================================================

void L2DistributionPricer::check_range(const OutcomeRef& range) const {
    if (range.upper_x18 <= range.lower_x18) {
        throw Error(ErrorCode::InvalidInput, "range needs upper > lower");
    }
    if (range.upper_x18 <= lower_x18_ || range.lower_x18 >= upper_x18_) {
        throw Error(ErrorCode::InvalidInput, "range lies outside the support");
    }
}

std::vector<NormalMode> L2DistributionPricer::reweighted(const std::vector<X18>& masses, Side side,
                                                         X18 shares) const {
    X18 ratio = x18::div(shares, liquidity_x18_);
    std::vector<NormalMode> next = modes_;
    for (size_t i = 0; i < next.size(); ++i) {
        X18 factor = x18::mul(ratio, masses[i]);
        X18 scale = side == Side::BUY ? X18_ONE + factor : X18_ONE - factor;
        next[i].weight_x18 = x18::max(x18::mul(next[i].weight_x18, scale), weight_floor_x18_);
    }
    normalize_weights(next);
    return next;
}

Quote L2DistributionPricer::quote(const OutcomeRef& range, Side side, X18 shares_x18) const {
    check_range(range);
    if (shares_x18 <= 0) {
        throw Error(ErrorCode::InvalidInput, "share amount must be positive");
    }

    std::vector<X18> masses = mode_masses(range.lower_x18, range.upper_x18);
    X18 before = 0;
    for (size_t i = 0; i < modes_.size(); ++i) before += x18::mul(modes_[i].weight_x18, masses[i]);
    if (before <= 0) {
        throw Error(ErrorCode::InvalidInput, "range carries no probability mass");
    }

    std::vector<NormalMode> next = reweighted(masses, side, shares_x18);
    X18 after = 0;
    for (size_t i = 0; i < next.size(); ++i) after += x18::mul(next[i].weight_x18, masses[i]);

    Quote q;
    q.outcome = range;
    q.side = side;
    q.shares_x18 = shares_x18;
    q.fill_price_x18 = (before + after) / 2;
    q.cost_x18 = x18::mul(shares_x18, q.fill_price_x18);
    q.fee_x18 = x18::mul(q.cost_x18, x18::from_bps(fee_bps_));
    q.total_x18 = side == Side::BUY ? q.cost_x18 + q.fee_x18 : q.cost_x18 - q.fee_x18;
    q.spot_before_x18 = before;
    q.spot_after_x18 = after;
    return q;
}

void L2DistributionPricer::apply(const Quote& q) {
    check_range(q.outcome);
    std::vector<X18> masses = mode_masses(q.outcome.lower_x18, q.outcome.upper_x18);
    modes_ = reweighted(masses, q.side, q.shares_x18);
}

// =============================================================================
// Multi-modal Fit
// =============================================================================

std::vector<NormalMode> L2DistributionPricer::fit_modes(const std::vector<DensitySample>& samples) const {
    if (samples.empty()) {
        throw Error(ErrorCode::InvalidInput, "fit needs at least one sample");
    }

    const size_t k = modes_.size();
    std::vector<X18> mass(k, 0);
    std::vector<X18> first(k, 0);
    std::vector<std::vector<X18>> resp(samples.size(), std::vector<X18>(k, 0));

    for (size_t s = 0; s < samples.size(); ++s) {
        const DensitySample& sample = samples[s];
        if (sample.weight_x18 < 0) {
            throw Error(ErrorCode::InvalidInput, "sample weight must be non-negative");
        }
        std::vector<X18> contrib(k);
        X18 total = 0;
        for (size_t m = 0; m < k; ++m) {
            contrib[m] = x18::mul(modes_[m].weight_x18, normal_pdf(modes_[m], sample.value_x18));
            total += contrib[m];
        }
        if (total <= 0) continue;  // sample far outside every mode

        for (size_t m = 0; m < k; ++m) {
            resp[s][m] = x18::mul(sample.weight_x18, x18::div(contrib[m], total));
            mass[m] = x18::add(mass[m], resp[s][m]);
            first[m] = x18::add(first[m], x18::mul(resp[s][m], sample.value_x18));
        }
    }

    X18 min_stddev = x18::max((upper_x18_ - lower_x18_) / 1000, 1);
    std::vector<NormalMode> fitted = modes_;
    for (size_t m = 0; m < k; ++m) {
        if (mass[m] <= 0) {
            fitted[m].weight_x18 = weight_floor_x18_;
            continue;
        }
        X18 mean = x18::div(first[m], mass[m]);
        X18 second = 0;
        for (size_t s = 0; s < samples.size(); ++s) {
            if (resp[s][m] == 0) continue;
            X18 d = samples[s].value_x18 - mean;
            second = x18::add(second, x18::mul(resp[s][m], x18::mul(d, d)));
        }
        fitted[m].mean_x18 = mean;
        fitted[m].stddev_x18 = x18::max(x18::sqrt(x18::div(second, mass[m])), min_stddev);
        fitted[m].weight_x18 = x18::max(mass[m], weight_floor_x18_);
    }

    normalize_weights(fitted);
    return fitted;
}

} // namespace predix

#ifndef PREDIX_L2_HPP
#define PREDIX_L2_HPP

#include <cstdint>
#include <vector>

#include "config.hpp"
#include "simpson.hpp"
#include "types.hpp"

namespace predix {

struct NormalMode {
    X18 mean_x18 = 0;
    X18 stddev_x18 = X18_ONE;
    X18 weight_x18 = X18_ONE;
};

struct DensitySample {
    X18 value_x18 = 0;
    X18 weight_x18 = X18_ONE;
};

// =============================================================================
// L2DistributionPricer - continuous outcomes over a normal mixture
// =============================================================================
//
// Each mode is renormalized over the support [lower, upper] so the mixture
// integrates to one. A position on [lo, hi) is priced at the probability
// mass of that range.
//
// Buying (selling) shares of range R moves every mode's weight by
//     w_m <- w_m * (1 +/- (shares / L) * mass_m(R))
// then clamps at the weight floor and renormalizes.

class L2DistributionPricer {
public:
    L2DistributionPricer(X18 lower_x18, X18 upper_x18, std::vector<NormalMode> modes,
                         X18 liquidity_x18, uint32_t fee_bps, X18 weight_floor_x18,
                         const IntegrationConfig& integration = {});

    // Mixture density at x (zero outside the support)
    [[nodiscard]] X18 density(X18 x) const;

    // Probability mass of [lo, hi) clamped to the support
    [[nodiscard]] X18 probability(X18 lo, X18 hi) const;

    // Mass of one renormalized mode over [lo, hi)
    [[nodiscard]] X18 mode_mass(size_t mode, X18 lo, X18 hi) const;

    Quote quote(const OutcomeRef& range, Side side, X18 shares_x18) const;
    void apply(const Quote& q);

    // One responsibility pass of the current modes over weighted samples;
    // returns the refitted modes with weights summing to one.
    [[nodiscard]] std::vector<NormalMode> fit_modes(const std::vector<DensitySample>& samples) const;

    // Replaces the density; support masses are recomputed
    void set_modes(std::vector<NormalMode> modes);

    [[nodiscard]] const std::vector<NormalMode>& modes() const noexcept { return modes_; }
    [[nodiscard]] X18 lower() const noexcept { return lower_x18_; }
    [[nodiscard]] X18 upper() const noexcept { return upper_x18_; }
    [[nodiscard]] X18 liquidity() const noexcept { return liquidity_x18_; }
    [[nodiscard]] uint32_t fee_bps() const noexcept { return fee_bps_; }

private:
    static X18 normal_pdf(const NormalMode& mode, X18 x);
    static void normalize_weights(std::vector<NormalMode>& modes);
    static void validate_modes(const std::vector<NormalMode>& modes);

    X18 raw_mass(const NormalMode& mode, X18 lo, X18 hi) const;
    std::vector<X18> mode_masses(X18 lo, X18 hi) const;
    std::vector<NormalMode> reweighted(const std::vector<X18>& masses, Side side, X18 shares) const;
    void check_range(const OutcomeRef& range) const;

    X18 lower_x18_;
    X18 upper_x18_;
    std::vector<NormalMode> modes_;
    std::vector<X18> support_mass_x18_;
    X18 liquidity_x18_;
    uint32_t fee_bps_;
    X18 weight_floor_x18_;
    SimpsonIntegrator integrator_;
};

} // namespace predix

#endif // PREDIX_L2_HPP

#ifndef PREDIX_SIMPSON_HPP
#define PREDIX_SIMPSON_HPP

#include <cstdint>
#include <functional>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace predix {

struct Integral {
    X18 value_x18 = 0;
    X18 error_x18 = 0;       // Richardson estimate |S_2n - S_n| / 15
    uint32_t intervals = 0;  // intervals of the finest pass
    uint32_t refinements = 0;
    bool converged = false;
};

// =============================================================================
// SimpsonIntegrator - composite Simpson rule with Richardson refinement
// =============================================================================

class SimpsonIntegrator {
public:
    using Integrand = std::function<X18(X18)>;

    explicit SimpsonIntegrator(const IntegrationConfig& config = {});

    // One composite estimate over `points` intervals (even, 10..16)
    X18 estimate(const Integrand& f, X18 a, X18 b, uint32_t points) const;

    // Starts at config.points and doubles the interval count while the
    // error estimate exceeds config.tolerance, at most max_refinements times.
    // Returns the extrapolated S_2n + (S_2n - S_n) / 15.
    Integral integrate(const Integrand& f, X18 a, X18 b) const;

    // Simpson coefficients 1,4,2,...,2,4,1 for a supported point count
    static const std::vector<int>& weights(uint32_t points);

    [[nodiscard]] const IntegrationConfig& config() const noexcept { return config_; }

private:
    IntegrationConfig config_;
};

} // namespace predix

#endif // PREDIX_SIMPSON_HPP

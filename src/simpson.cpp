// =============================================================================
// simpson.cpp - Composite Simpson integration
// =============================================================================

#include "predix/simpson.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"

#include <array>
#include <string>

namespace predix {

namespace {

constexpr uint32_t MIN_POINTS = 10;
constexpr uint32_t MAX_POINTS = 16;

std::vector<int> build_weights(uint32_t n) {
    std::vector<int> w(n + 1);
    for (uint32_t k = 0; k <= n; ++k) {
        if (k == 0 || k == n) w[k] = 1;
        else w[k] = (k % 2 == 1) ? 4 : 2;
    }
    return w;
}

// 10, 12, 14, 16
const std::array<std::vector<int>, 4>& weight_table() {
    static const std::array<std::vector<int>, 4> table = {
        build_weights(10), build_weights(12), build_weights(14), build_weights(16)};
    return table;
}

void check_points(uint32_t points) {
    if (points < MIN_POINTS || points > MAX_POINTS || points % 2 != 0) {
        throw Error(ErrorCode::InvalidInput,
                    "Simpson point count must be even and within 10..16, got " + std::to_string(points));
    }
}

// Running sums that let each pass reuse the previous pass's nodes
struct Panel {
    X18 ends = 0;   // f(a) + f(b)
    X18 odd = 0;    // nodes with weight 4
    X18 even = 0;   // interior nodes with weight 2
    uint32_t n = 0;

    X18 value(X18 a, X18 b) const {
        X18 h = (b - a) / static_cast<X18>(n);
        X18 sum = x18::add(x18::add(ends, 4 * odd), 2 * even);
        return x18::mul(h, sum) / 3;
    }
};

} // namespace

SimpsonIntegrator::SimpsonIntegrator(const IntegrationConfig& config) : config_(config) {
    check_points(config_.points);
}

const std::vector<int>& SimpsonIntegrator::weights(uint32_t points) {
    check_points(points);
    return weight_table()[(points - MIN_POINTS) / 2];
}

X18 SimpsonIntegrator::estimate(const Integrand& f, X18 a, X18 b, uint32_t points) const {
    const std::vector<int>& w = weights(points);
    X18 h = (b - a) / static_cast<X18>(points);
    X18 sum = 0;
    for (uint32_t k = 0; k <= points; ++k) {
        sum = x18::add(sum, static_cast<X18>(w[k]) * f(a + static_cast<X18>(k) * h));
    }
    return x18::mul(h, sum) / 3;
}

Integral SimpsonIntegrator::integrate(const Integrand& f, X18 a, X18 b) const {
    Integral out;
    if (b <= a) {
        out.converged = true;
        return out;
    }

    // Initial pass over the precomputed weight vector
    const uint32_t n0 = config_.points;
    const std::vector<int>& w = weights(n0);
    Panel panel;
    panel.n = n0;
    X18 h = (b - a) / static_cast<X18>(n0);
    for (uint32_t k = 0; k <= n0; ++k) {
        X18 fx = f(a + static_cast<X18>(k) * h);
        if (w[k] == 1) panel.ends += fx;
        else if (w[k] == 4) panel.odd += fx;
        else panel.even += fx;
    }

    X18 coarse = panel.value(a, b);
    out.value_x18 = coarse;
    out.intervals = n0;
    out.converged = config_.max_refinements == 0;

    for (uint32_t pass = 1; pass <= config_.max_refinements; ++pass) {
        // Doubling: old nodes all become weight-2 nodes; new midpoints get weight 4
        Panel fine;
        fine.n = panel.n * 2;
        fine.ends = panel.ends;
        fine.even = panel.even + panel.odd;
        X18 fh = (b - a) / static_cast<X18>(fine.n);
        for (uint32_t k = 1; k < fine.n; k += 2) {
            fine.odd += f(a + static_cast<X18>(k) * fh);
        }

        X18 refined = fine.value(a, b);
        X18 diff = refined - coarse;
        out.error_x18 = x18::abs(diff) / 15;
        out.value_x18 = refined + diff / 15;
        out.intervals = fine.n;
        out.refinements = pass;

        if (out.error_x18 <= config_.tolerance_x18) {
            out.converged = true;
            return out;
        }
        panel = fine;
        coarse = refined;
    }
    return out;
}

} // namespace predix

#ifndef PREDIX_PMAMM_HPP
#define PREDIX_PMAMM_HPP

#include <cstdint>
#include <functional>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace predix {

// =============================================================================
// Newton-Raphson Solver
// =============================================================================

struct Residual {
    X18 value_x18;       // f(x)
    X18 derivative_x18;  // f'(x)
};

struct SolverResult {
    X18 root_x18;
    X18 residual_x18;
    uint32_t iterations;
};

// Iteration history across every successful solve
struct SolverStats {
    uint64_t solves = 0;
    uint64_t total_iterations = 0;
    uint32_t min_iterations = 0;
    uint32_t max_iterations = 0;

    [[nodiscard]] double average() const {
        return solves == 0 ? 0.0 : static_cast<double>(total_iterations) / static_cast<double>(solves);
    }
};

// x_{n+1} = x_n - lambda * f(x_n) / f'(x_n)
// lambda = damping while |f| > damping_threshold, 1 afterwards. A step that
// leaves the domain is halved until it lands inside. Converged when
// |f| < tolerance; more than max_iterations steps throws PricingDivergence.
class NewtonRaphsonSolver {
public:
    using Function = std::function<Residual(X18)>;
    using Domain = std::function<bool(X18)>;

    explicit NewtonRaphsonSolver(const SolverConfig& config = {});

    SolverResult solve(const Function& fn, X18 x0, const Domain& in_domain = {});

    [[nodiscard]] const SolverStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const SolverConfig& config() const noexcept { return config_; }

private:
    void record(uint32_t iterations);

    SolverConfig config_;
    SolverStats stats_;
};

// =============================================================================
// PmAmmPricer - constant-product pricing over complete sets, 2..64 outcomes
// =============================================================================
//
// spot(i) = (1/r_i) / sum_j (1/r_j)
//
// Buying x of outcome i mints D complete sets and releases x of outcome i:
//     (r_i + D - x)/r_i * prod_{j!=i} (r_j + D)/r_j = 1
// Selling x of outcome i burns D complete sets:
//     (r_i + x - D)/r_i * prod_{j!=i} (r_j - D)/r_j = 1
// A complete set is worth one quote unit, so D is the cost (proceeds).

class PmAmmPricer {
public:
    PmAmmPricer(std::vector<X18> reserves_x18, uint32_t fee_bps, const SolverConfig& solver = {});

    static PmAmmPricer uniform(uint32_t outcomes, X18 reserve_x18, uint32_t fee_bps,
                               const SolverConfig& solver = {});

    // Reserves proportional to 1/p_i whose geometric mean is `geometric_mean_x18`
    // (equivalently prod r_i = geometric_mean^N).
    static std::vector<X18> solve_for_reserves(X18 geometric_mean_x18,
                                               const std::vector<X18>& targets_x18);

    [[nodiscard]] size_t outcome_count() const noexcept { return reserves_x18_.size(); }
    [[nodiscard]] X18 price(uint32_t outcome) const;
    [[nodiscard]] std::vector<X18> prices() const;

    Quote quote_buy(uint32_t outcome, X18 shares_x18) const;
    Quote quote_sell(uint32_t outcome, X18 shares_x18) const;
    Quote quote(const OutcomeRef& outcome, Side side, X18 shares_x18) const;

    void apply(const Quote& q);

    [[nodiscard]] const std::vector<X18>& reserves() const noexcept { return reserves_x18_; }
    [[nodiscard]] uint32_t fee_bps() const noexcept { return fee_bps_; }
    [[nodiscard]] const SolverStats& solver_stats() const noexcept { return solver_.stats(); }

private:
    static std::vector<X18> normalized_prices(const std::vector<X18>& reserves);

    void check_outcome(uint32_t outcome) const;
    Quote make_quote(uint32_t outcome, Side side, X18 shares, const SolverResult& solved) const;
    std::vector<X18> reserves_after(uint32_t outcome, Side side, X18 shares, X18 sets) const;

    std::vector<X18> reserves_x18_;
    uint32_t fee_bps_;
    mutable NewtonRaphsonSolver solver_;  // records iteration history on quotes
};

} // namespace predix

#endif // PREDIX_PMAMM_HPP

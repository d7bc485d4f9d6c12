#ifndef PREDIX_COVERAGE_HPP
#define PREDIX_COVERAGE_HPP

#include <cstdint>
#include <deque>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace predix {

// =============================================================================
// Coverage Types
// =============================================================================

// Exposure weights per correlated market and a row-major n x n correlation
// matrix; only the upper triangle is read.
struct CorrelationInputs {
    std::vector<X18> weights_x18;
    std::vector<X18> correlations_x18;
};

enum class HaltReason : uint8_t {
    NONE = 0,
    BELOW_MINIMUM = 1,
    COVERAGE_DROP = 2
};

inline const char* to_string(HaltReason r) {
    switch (r) {
        case HaltReason::NONE: return "none";
        case HaltReason::BELOW_MINIMUM: return "below_minimum";
        case HaltReason::COVERAGE_DROP: return "coverage_drop";
    }
    return "unknown";
}

struct CoverageInputs {
    X18 vault_x18 = 0;
    X18 open_interest_x18 = 0;
    uint32_t outcome_count = 1;
    X18 corr_factor_x18 = 0;
};

struct CoverageMeasure {
    X18 coverage_x18 = 0;      // vault / (tail_loss * OI)
    X18 base_x18 = 0;          // vault / (0.5 * OI)
    X18 tail_loss_x18 = 0;
    X18 corr_factor_x18 = 0;
};

struct CoverageState {
    CoverageMeasure current;
    std::deque<X18> window;    // recent coverage ratios, oldest first
    bool halted = false;
    HaltReason reason = HaltReason::NONE;
    uint32_t cooldown = 0;     // cycles left on a drop halt
    uint64_t cycles = 0;
};

// =============================================================================
// CoverageEngine
// =============================================================================

class CoverageEngine {
public:
    explicit CoverageEngine(const CoverageConfig& config = {});

    // vault / (0.5 * OI); zero open interest gives the sentinel
    [[nodiscard]] X18 base_coverage(X18 vault_x18, X18 open_interest_x18) const;

    // sum_{i<j} w_i w_j max(0, rho_ij) / sum_{i<j} w_i w_j, in [0, 1]
    static X18 correlation_factor(const CorrelationInputs& inputs);
    static void validate(const CorrelationInputs& inputs);

    // 1 - (1/N)(1 - corr); a single binary pair counts as two outcomes
    static X18 tail_loss(uint32_t outcome_count, X18 corr_factor_x18);

    [[nodiscard]] CoverageMeasure measure(const CoverageInputs& inputs) const;

    // Next committed state: pushes the ratio into the window, latches a drop
    // halt for cooldown_cycles and flags coverage below the minimum.
    [[nodiscard]] CoverageState recompute(const CoverageState& prev, const CoverageInputs& inputs) const;

    // Halt status for a fresh measure under a committed state's drop latch
    [[nodiscard]] bool halted(const CoverageState& committed, const CoverageMeasure& fresh) const;
    [[nodiscard]] HaltReason halt_reason(const CoverageState& committed, const CoverageMeasure& fresh) const;

    [[nodiscard]] const CoverageConfig& config() const noexcept { return config_; }

private:
    CoverageConfig config_;
};

} // namespace predix

#endif // PREDIX_COVERAGE_HPP

#ifndef PREDIX_AMM_SELECTOR_HPP
#define PREDIX_AMM_SELECTOR_HPP

#include <cstdint>
#include <optional>

#include "types.hpp"

namespace predix {

// =============================================================================
// AMMSelector
// =============================================================================

// N = 1 -> LMSR; 2 <= N <= 64 discrete -> PM-AMM; continuous or N > 64 -> L2.
// N = 0 throws InvalidOutcomeCount.
struct AMMSelector {
    static AmmType select(uint32_t outcome_count, bool continuous);
};

// =============================================================================
// AmmSlot - write-once holder for a market's pricer type
// =============================================================================

class AmmSlot {
public:
    AmmSlot() = default;

    // Resolves the type from the market structure; a requested type that
    // disagrees is ignored. Any second assignment throws AMMAlreadySet.
    AmmType assign(uint32_t outcome_count, bool continuous,
                   std::optional<AmmType> requested = std::nullopt);

    [[nodiscard]] bool is_set() const noexcept { return type_.has_value(); }

    // Throws InvalidInput when unset
    [[nodiscard]] AmmType get() const;

private:
    std::optional<AmmType> type_;
};

} // namespace predix

#endif // PREDIX_AMM_SELECTOR_HPP

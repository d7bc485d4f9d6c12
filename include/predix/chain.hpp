#ifndef PREDIX_CHAIN_HPP
#define PREDIX_CHAIN_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace predix {

// =============================================================================
// Chain Types
// =============================================================================

// Legs live in an arena; a leg's id is its index in ChainPosition::legs and
// `depends_on` holds ids of other legs.
struct ChainLeg {
    LegRole role = LegRole::STAKE;
    std::optional<PositionId> position_id;
    std::vector<uint32_t> depends_on;
};

struct ChainPosition {
    ChainId chain_id = 0;
    std::vector<ChainLeg> legs;
};

struct LegClosure {
    uint32_t leg = 0;
    LegRole role = LegRole::STAKE;
    std::optional<PositionId> position_id;
    X18 notional_closed_x18 = 0;
    X18 pnl_x18 = 0;
    X18 margin_returned_x18 = 0;
};

// =============================================================================
// ChainUnwindCoordinator
// =============================================================================

class ChainUnwindCoordinator {
public:
    using CloseFn = std::function<LegClosure(uint32_t leg, const ChainLeg&)>;

    explicit ChainUnwindCoordinator(const ChainConfig& config = {});

    // Iterative three-color DFS; a back-edge throws CyclicChainDependency,
    // a dangling leg id throws InvalidInput.
    static void check_acyclic(const ChainPosition& chain);

    // Borrow legs, then leverage legs, then stake legs; stable within a role
    static std::vector<uint32_t> unwind_order(const ChainPosition& chain);

    [[nodiscard]] X18 role_multiplier(LegRole role) const;

    // Product of every leg's role multiplier
    [[nodiscard]] X18 chain_multiplier(const ChainPosition& chain) const;

    // Cycle check first, then `close` for each leg in unwind order. The
    // closer must stage its effects; nothing is closed when the check fails.
    std::vector<LegClosure> unwind(const ChainPosition& chain, const CloseFn& close) const;

private:
    ChainConfig config_;
};

} // namespace predix

#endif // PREDIX_CHAIN_HPP

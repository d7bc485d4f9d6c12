// =============================================================================
// amm_selector.cpp - Deterministic pricer selection
// =============================================================================

#include "predix/amm_selector.hpp"
#include "predix/error.hpp"
#include "predix/log.hpp"

#include <string>

namespace predix {

AmmType AMMSelector::select(uint32_t outcome_count, bool continuous) {
    if (outcome_count == 0) {
        throw Error(ErrorCode::InvalidOutcomeCount, "market needs at least one outcome");
    }
    if (continuous || outcome_count > limits::MAX_DISCRETE_OUTCOMES) return AmmType::L2;
    if (outcome_count == 1) return AmmType::LMSR;
    return AmmType::PMAMM;
}

AmmType AmmSlot::assign(uint32_t outcome_count, bool continuous, std::optional<AmmType> requested) {
    if (type_) {
        throw Error(ErrorCode::AMMAlreadySet,
                    std::string("pricer already set to ") + to_string(*type_));
    }
    AmmType resolved = AMMSelector::select(outcome_count, continuous);
    if (requested && *requested != resolved) {
        log::logger()->warn("requested pricer {} ignored, outcome structure selects {}",
                            to_string(*requested), to_string(resolved));
    }
    type_ = resolved;
    return resolved;
}

AmmType AmmSlot::get() const {
    if (!type_) {
        throw Error(ErrorCode::InvalidInput, "pricer type not assigned");
    }
    return *type_;
}

} // namespace predix

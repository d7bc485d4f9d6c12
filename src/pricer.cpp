// =============================================================================
// pricer.cpp - Pricer dispatch
// =============================================================================

#include "predix/pricer.hpp"

namespace predix {

namespace {

template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // namespace

AmmType Pricer::type() const noexcept {
    return std::visit(overloaded{
        [](const LmsrPricer&) { return AmmType::LMSR; },
        [](const PmAmmPricer&) { return AmmType::PMAMM; },
        [](const L2DistributionPricer&) { return AmmType::L2; },
    }, impl_);
}

X18 Pricer::spot(const OutcomeRef& outcome) const {
    return std::visit(overloaded{
        [&](const LmsrPricer& p) { return p.price(outcome.index); },
        [&](const PmAmmPricer& p) { return p.price(outcome.index); },
        [&](const L2DistributionPricer& p) { return p.probability(outcome.lower_x18, outcome.upper_x18); },
    }, impl_);
}

std::vector<X18> Pricer::prices() const {
    return std::visit(overloaded{
        [](const LmsrPricer& p) { return p.prices(); },
        [](const PmAmmPricer& p) { return p.prices(); },
        [](const L2DistributionPricer&) { return std::vector<X18>{}; },
    }, impl_);
}

Quote Pricer::quote(const OutcomeRef& outcome, Side side, X18 shares_x18) const {
    return std::visit([&](const auto& p) { return p.quote(outcome, side, shares_x18); }, impl_);
}

void Pricer::apply(const Quote& q) {
    std::visit([&](auto& p) { p.apply(q); }, impl_);
}

} // namespace predix

#ifndef PREDIX_PRICER_HPP
#define PREDIX_PRICER_HPP

#include <utility>
#include <variant>
#include <vector>

#include "l2.hpp"
#include "lmsr.hpp"
#include "pmamm.hpp"
#include "types.hpp"

namespace predix {

// =============================================================================
// Pricer - closed sum over the three market makers
// =============================================================================

class Pricer {
public:
    using Variant = std::variant<LmsrPricer, PmAmmPricer, L2DistributionPricer>;

    explicit Pricer(LmsrPricer p) : impl_(std::move(p)) {}
    explicit Pricer(PmAmmPricer p) : impl_(std::move(p)) {}
    explicit Pricer(L2DistributionPricer p) : impl_(std::move(p)) {}

    [[nodiscard]] AmmType type() const noexcept;

    // Spot price of a discrete outcome, or probability mass of an L2 range
    [[nodiscard]] X18 spot(const OutcomeRef& outcome) const;

    // Discrete outcome prices; empty for L2
    [[nodiscard]] std::vector<X18> prices() const;

    Quote quote(const OutcomeRef& outcome, Side side, X18 shares_x18) const;
    void apply(const Quote& q);

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&impl_); }

    template <typename T>
    [[nodiscard]] T* get_if() noexcept { return std::get_if<T>(&impl_); }

private:
    Variant impl_;
};

} // namespace predix

#endif // PREDIX_PRICER_HPP

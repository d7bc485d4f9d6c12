#ifndef PREDIX_LMSR_HPP
#define PREDIX_LMSR_HPP

#include <array>
#include <cstdint>
#include <vector>

#include "types.hpp"

namespace predix {

// =============================================================================
// LmsrPricer - logarithmic market scoring rule for one yes/no pair
// =============================================================================
//
// price(i) = e^(q_i/b) / sum_j e^(q_j/b)
// cost(q)  = b * ln(sum_j e^(q_j/b))
//
// Exponentials are shifted by max(q) so every argument is <= 0 and go
// through the ExpTable.

class LmsrPricer {
public:
    static constexpr uint32_t YES = 0;
    static constexpr uint32_t NO = 1;

    LmsrPricer(X18 liquidity_x18, uint32_t fee_bps, X18 q_yes_x18 = 0, X18 q_no_x18 = 0);

    [[nodiscard]] X18 price(uint32_t outcome) const;
    [[nodiscard]] std::vector<X18> prices() const;
    [[nodiscard]] X18 cost() const;

    Quote quote_buy(uint32_t outcome, X18 shares_x18) const;
    Quote quote_sell(uint32_t outcome, X18 shares_x18) const;
    Quote quote(const OutcomeRef& outcome, Side side, X18 shares_x18) const;

    // Commits a quote produced by this pricer's current state
    void apply(const Quote& q);

    [[nodiscard]] X18 quantity(uint32_t outcome) const;
    [[nodiscard]] X18 liquidity() const noexcept { return b_x18_; }
    [[nodiscard]] uint32_t fee_bps() const noexcept { return fee_bps_; }

private:
    static X18 cost_of(const std::array<X18, 2>& q, X18 b);
    static X18 price_of(const std::array<X18, 2>& q, X18 b, uint32_t outcome);

    void check_outcome(uint32_t outcome) const;

    std::array<X18, 2> q_x18_;
    X18 b_x18_;
    uint32_t fee_bps_;
};

} // namespace predix

#endif // PREDIX_LMSR_HPP

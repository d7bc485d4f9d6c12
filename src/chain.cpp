// =============================================================================
// chain.cpp - Linked-position unwind ordering and cycle detection
// =============================================================================

#include "predix/chain.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"
#include "predix/log.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace predix {

namespace {

enum class Color : uint8_t { WHITE, GRAY, BLACK };

int unwind_rank(LegRole role) {
    switch (role) {
        case LegRole::BORROW: return 0;
        case LegRole::LEVERAGE: return 1;
        case LegRole::STAKE: return 2;
    }
    return 3;
}

} // namespace

ChainUnwindCoordinator::ChainUnwindCoordinator(const ChainConfig& config) : config_(config) {}

void ChainUnwindCoordinator::check_acyclic(const ChainPosition& chain) {
    const size_t n = chain.legs.size();
    std::vector<Color> color(n, Color::WHITE);
    // (leg, next dependency to visit)
    std::vector<std::pair<uint32_t, size_t>> stack;

    for (uint32_t start = 0; start < n; ++start) {
        if (color[start] != Color::WHITE) continue;
        color[start] = Color::GRAY;
        stack.emplace_back(start, 0);

        while (!stack.empty()) {
            auto& [leg, next] = stack.back();
            const std::vector<uint32_t>& deps = chain.legs[leg].depends_on;
            if (next < deps.size()) {
                uint32_t dep = deps[next++];
                if (dep >= n) {
                    throw Error(ErrorCode::InvalidInput, "leg " + std::to_string(leg) +
                                " depends on unknown leg " + std::to_string(dep));
                }
                if (color[dep] == Color::GRAY) {
                    log::logger()->warn("chain {} rejected: cycle through legs {} -> {}",
                                        chain.chain_id, leg, dep);
                    throw Error(ErrorCode::CyclicChainDependency,
                                "back-edge from leg " + std::to_string(leg) + " to leg " + std::to_string(dep));
                }
                if (color[dep] == Color::WHITE) {
                    color[dep] = Color::GRAY;
                    stack.emplace_back(dep, 0);
                }
            } else {
                color[leg] = Color::BLACK;
                stack.pop_back();
            }
        }
    }
}

std::vector<uint32_t> ChainUnwindCoordinator::unwind_order(const ChainPosition& chain) {
    std::vector<uint32_t> order(chain.legs.size());
    for (uint32_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(), [&](uint32_t a, uint32_t b) {
        return unwind_rank(chain.legs[a].role) < unwind_rank(chain.legs[b].role);
    });
    return order;
}

X18 ChainUnwindCoordinator::role_multiplier(LegRole role) const {
    switch (role) {
        case LegRole::BORROW: return config_.borrow_multiplier_x18;
        case LegRole::LEVERAGE: return config_.leverage_multiplier_x18;
        case LegRole::STAKE: return config_.stake_multiplier_x18;
    }
    return X18_ONE;
}

X18 ChainUnwindCoordinator::chain_multiplier(const ChainPosition& chain) const {
    X18 m = X18_ONE;
    for (const auto& leg : chain.legs) m = x18::sat_mul(m, role_multiplier(leg.role));
    return m;
}

std::vector<LegClosure> ChainUnwindCoordinator::unwind(const ChainPosition& chain, const CloseFn& close) const {
    check_acyclic(chain);

    std::vector<LegClosure> closures;
    closures.reserve(chain.legs.size());
    for (uint32_t leg : unwind_order(chain)) {
        closures.push_back(close(leg, chain.legs[leg]));
    }
    return closures;
}

} // namespace predix

// =============================================================================
// codec.cpp - JSON encoding of engine requests and results
// =============================================================================

#include "predix/codec.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace predix {
namespace codec {

using json = nlohmann::json;

namespace {

[[noreturn]] void malformed(const std::string& what) {
    throw Error(ErrorCode::InvalidInput, what);
}

const json& field(const json& j, const char* key) {
    if (!j.is_object()) malformed(std::string("expected an object holding ") + key);
    auto it = j.find(key);
    if (it == j.end()) malformed(std::string("missing field ") + key);
    return *it;
}

uint64_t read_u64(const json& j, const char* key, uint64_t fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
        malformed(std::string(key) + " must be a non-negative integer");
    }
    return it->get<uint64_t>();
}

uint32_t read_u32(const json& j, const char* key, uint32_t fallback) {
    uint64_t v = read_u64(j, key, fallback);
    if (v > UINT32_MAX) malformed(std::string(key) + " out of range");
    return static_cast<uint32_t>(v);
}

X18 read_x18(const json& j, const char* key, X18 fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    return decode_x18(*it);
}

std::vector<X18> read_x18_array(const json& j, const char* key) {
    std::vector<X18> out;
    auto it = j.find(key);
    if (it == j.end()) return out;
    if (!it->is_array()) malformed(std::string(key) + " must be an array");
    for (const auto& v : *it) out.push_back(decode_x18(v));
    return out;
}

std::vector<NormalMode> read_modes(const json& j, const char* key) {
    std::vector<NormalMode> out;
    auto it = j.find(key);
    if (it == j.end()) return out;
    if (!it->is_array()) malformed(std::string(key) + " must be an array");
    for (const auto& m : *it) {
        NormalMode mode;
        mode.mean_x18 = decode_x18(field(m, "mean"));
        mode.stddev_x18 = decode_x18(field(m, "stddev"));
        mode.weight_x18 = read_x18(m, "weight", X18_ONE);
        out.push_back(mode);
    }
    return out;
}

AmmType parse_amm(const std::string& s) {
    if (s == "lmsr") return AmmType::LMSR;
    if (s == "pmamm") return AmmType::PMAMM;
    if (s == "l2") return AmmType::L2;
    malformed("unknown AMM type: " + s);
}

Side parse_side(const std::string& s) {
    if (s == "buy") return Side::BUY;
    if (s == "sell") return Side::SELL;
    malformed("unknown side: " + s);
}

LegRole parse_role(const std::string& s) {
    if (s == "stake") return LegRole::STAKE;
    if (s == "leverage") return LegRole::LEVERAGE;
    if (s == "borrow") return LegRole::BORROW;
    malformed("unknown leg role: " + s);
}

std::string read_string(const json& j, const char* key) {
    const json& v = field(j, key);
    if (!v.is_string()) malformed(std::string(key) + " must be a string");
    return v.get<std::string>();
}

json encode_outcome(const OutcomeRef& o) {
    if (o.upper_x18 > o.lower_x18) {
        return json{{"lower", encode_x18(o.lower_x18)}, {"upper", encode_x18(o.upper_x18)}};
    }
    return json{{"index", o.index}};
}

json encode_flags(const RiskFlags& f) {
    return json{{"at_risk", f.at_risk}, {"liquidatable", f.liquidatable}};
}

} // namespace

// =============================================================================
// Scalars
// =============================================================================

json encode_x18(X18 v) {
    return x18::to_string(v);
}

X18 decode_x18(const json& j) {
    if (j.is_string()) return x18::parse(j.get<std::string>());
    if (j.is_number_integer()) return x18::from_int(j.get<int64_t>());
    if (j.is_number_float()) return x18::parse(j.dump());
    malformed("expected a decimal number, got " + j.dump());
}

// =============================================================================
// Results
// =============================================================================

json encode(const Quote& q) {
    return json{
        {"outcome", encode_outcome(q.outcome)},
        {"side", to_string(q.side)},
        {"shares", encode_x18(q.shares_x18)},
        {"cost", encode_x18(q.cost_x18)},
        {"fee", encode_x18(q.fee_x18)},
        {"total", encode_x18(q.total_x18)},
        {"fill_price", encode_x18(q.fill_price_x18)},
        {"spot_before", encode_x18(q.spot_before_x18)},
        {"spot_after", encode_x18(q.spot_after_x18)},
        {"iterations", q.iterations}
    };
}

json encode(const Position& p) {
    json j{
        {"id", p.id},
        {"owner", p.owner},
        {"market_id", p.market_id},
        {"outcome", encode_outcome(p.outcome)},
        {"side", to_string(p.side)},
        {"notional", encode_x18(p.notional_x18)},
        {"entry_price", encode_x18(p.entry_price_x18)},
        {"leverage", p.base_leverage},
        {"margin", encode_x18(p.margin_x18)},
        {"mark_price", encode_x18(p.mark_price_x18)},
        {"pnl_pct", encode_x18(p.pnl_pct_x18)},
        {"pnl", encode_x18(p.pnl_abs_x18)},
        {"effective_leverage", encode_x18(p.effective_leverage_x18)},
        {"required_ratio", encode_x18(p.required_ratio_x18)},
        {"observed_ratio", encode_x18(p.observed_ratio_x18)},
        {"liquidation_price", encode_x18(p.liquidation_price_x18)},
        {"depth", p.depth},
        {"state", to_string(p.state)}
    };
    if (p.chain_id) j["chain_id"] = *p.chain_id;
    return j;
}

json encode(const TradeResult& r) {
    return json{
        {"fill_price", encode_x18(r.fill_price_x18)},
        {"quote", encode(r.quote)},
        {"position", encode(r.position)},
        {"leverage_cap", r.leverage_cap}
    };
}

json encode(const CycleReport& r) {
    json positions = json::array();
    for (const auto& p : r.positions) {
        positions.push_back(json{
            {"position_id", p.position_id},
            {"state", to_string(p.state)},
            {"flags", encode_flags(p.flags)},
            {"mark_price", encode_x18(p.mark_price_x18)},
            {"observed_ratio", encode_x18(p.observed_ratio_x18)},
            {"required_ratio", encode_x18(p.required_ratio_x18)},
            {"effective_leverage", encode_x18(p.effective_leverage_x18)}
        });
    }
    return json{
        {"market_id", r.market_id},
        {"timestamp", r.timestamp},
        {"coverage", encode_x18(r.coverage_x18)},
        {"halted", r.halted},
        {"reason", to_string(r.reason)},
        {"positions", positions}
    };
}

json encode(const LiquidationResult& r) {
    return json{
        {"position_id", r.position_id},
        {"keeper", r.keeper},
        {"liquidated", encode_x18(r.liquidated_x18)},
        {"incentive", encode_x18(r.incentive_x18)},
        {"remaining", encode_x18(r.remaining_x18)},
        {"margin_released", encode_x18(r.margin_released_x18)},
        {"vault_credit", encode_x18(r.vault_credit_x18)},
        {"period", r.period_index},
        {"status", to_string(r.status)}
    };
}

json encode(const LegClosure& c) {
    json j{
        {"leg", c.leg},
        {"role", to_string(c.role)},
        {"notional_closed", encode_x18(c.notional_closed_x18)},
        {"pnl", encode_x18(c.pnl_x18)},
        {"margin_returned", encode_x18(c.margin_returned_x18)}
    };
    j["position_id"] = c.position_id ? json(*c.position_id) : json(nullptr);
    return j;
}

json encode(const CoverageReport& r) {
    return json{
        {"market_id", r.market_id},
        {"ratio", encode_x18(r.ratio_x18)},
        {"base", encode_x18(r.base_x18)},
        {"tail_loss", encode_x18(r.tail_loss_x18)},
        {"halted", r.halted},
        {"reason", to_string(r.reason)},
        {"cooldown", r.cooldown}
    };
}

json encode(const VaultState& v) {
    return json{
        {"balance", encode_x18(v.balance_x18)},
        {"open_interest", encode_x18(v.open_interest_x18)}
    };
}

json encode(const EngineStats& s) {
    return json{
        {"markets", s.markets},
        {"open_positions", s.open_positions},
        {"chains", s.chains},
        {"trades", s.trades},
        {"price_updates", s.price_updates},
        {"liquidations", s.liquidations},
        {"total_liquidated", encode_x18(s.total_liquidated_x18)},
        {"total_incentives", encode_x18(s.total_incentives_x18)}
    };
}

// =============================================================================
// Requests
// =============================================================================

OutcomeRef decode_outcome(const json& j) {
    if (j.is_number_unsigned() || j.is_number_integer()) {
        if (j.get<int64_t>() < 0) malformed("outcome index must be non-negative");
        return OutcomeRef::discrete(j.get<uint32_t>());
    }
    if (!j.is_object()) malformed("outcome must be an index or a range object");
    if (j.contains("index")) return OutcomeRef::discrete(read_u32(j, "index", 0));
    return OutcomeRef::range(decode_x18(field(j, "lower")), decode_x18(field(j, "upper")));
}

MarketSpec decode_market(const json& j) {
    MarketSpec spec;
    spec.market_id = read_u64(j, "market_id", 0);
    spec.outcome_count = read_u32(j, "outcomes", 0);
    if (j.contains("continuous")) {
        if (!j["continuous"].is_boolean()) malformed("continuous must be a boolean");
        spec.continuous = j["continuous"].get<bool>();
    }
    if (j.contains("amm")) spec.requested_amm = parse_amm(read_string(j, "amm"));
    spec.initial_prices_x18 = read_x18_array(j, "prices");
    spec.initial_reserve_x18 = read_x18(j, "reserve", spec.initial_reserve_x18);
    spec.lower_x18 = read_x18(j, "lower", spec.lower_x18);
    spec.upper_x18 = read_x18(j, "upper", spec.upper_x18);
    spec.modes = read_modes(j, "modes");
    spec.initial_vault_x18 = read_x18(j, "vault", 0);
    return spec;
}

PriceUpdate decode_price_update(const json& j) {
    PriceUpdate u;
    u.market_id = read_u64(j, "market_id", 0);
    u.prices_x18 = read_x18_array(j, "prices");
    u.modes = read_modes(j, "modes");
    if (auto it = j.find("samples"); it != j.end()) {
        if (!it->is_array()) malformed("samples must be an array");
        for (const auto& s : *it) {
            DensitySample sample;
            sample.value_x18 = decode_x18(field(s, "value"));
            sample.weight_x18 = read_x18(s, "weight", X18_ONE);
            u.samples.push_back(sample);
        }
    }
    u.timestamp = read_u64(j, "timestamp", 0);
    if (j.contains("sigma")) u.sigma_x18 = decode_x18(j["sigma"]);
    return u;
}

TradeRequest decode_trade(const json& j) {
    TradeRequest r;
    r.market_id = read_u64(j, "market_id", 0);
    r.owner = read_u64(j, "owner", 0);
    r.outcome = decode_outcome(field(j, "outcome"));
    r.side = j.contains("side") ? parse_side(read_string(j, "side")) : Side::BUY;
    r.shares_x18 = decode_x18(field(j, "shares"));
    r.leverage = read_u32(j, "leverage", 1);
    r.max_slippage_bps = read_u32(j, "max_slippage_bps", r.max_slippage_bps);
    r.depth = read_u32(j, "depth", 0);
    return r;
}

ChainPosition decode_chain(const json& j) {
    ChainPosition chain;
    const json& legs = field(j, "legs");
    if (!legs.is_array()) malformed("legs must be an array");
    for (const auto& l : legs) {
        ChainLeg leg;
        leg.role = parse_role(read_string(l, "role"));
        if (l.contains("position_id") && !l["position_id"].is_null()) {
            leg.position_id = read_u64(l, "position_id", 0);
        }
        if (auto it = l.find("depends_on"); it != l.end()) {
            if (!it->is_array()) malformed("depends_on must be an array");
            for (const auto& d : *it) {
                if (!d.is_number_unsigned()) malformed("depends_on holds leg indices");
                leg.depends_on.push_back(d.get<uint32_t>());
            }
        }
        chain.legs.push_back(std::move(leg));
    }
    return chain;
}

CorrelationInputs decode_correlations(const json& j) {
    CorrelationInputs in;
    in.weights_x18 = read_x18_array(j, "weights");
    in.correlations_x18 = read_x18_array(j, "correlations");
    return in;
}

} // namespace codec
} // namespace predix

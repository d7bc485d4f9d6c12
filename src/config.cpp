// =============================================================================
// config.cpp - JSON configuration loading
// =============================================================================

#include "predix/config.hpp"
#include "predix/error.hpp"
#include "predix/fixed_point.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace predix {

using json = nlohmann::json;

namespace {

[[noreturn]] void bad_type(const std::string& section, const std::string& key) {
    throw Error(ErrorCode::ConfigError, "wrong type for " + section + "." + key);
}

// Numbers may be given as JSON numbers or as exact decimal strings.
void read_x18(const json& obj, const std::string& section, const std::string& key, X18& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    try {
        if (it->is_string()) {
            out = x18::parse(it->get<std::string>());
        } else if (it->is_number_integer()) {
            out = x18::from_int(it->get<int64_t>());
        } else if (it->is_number_float()) {
            out = x18::parse(it->dump());
        } else {
            bad_type(section, key);
        }
    } catch (const Error& e) {
        if (e.code() == ErrorCode::ConfigError) throw;
        throw Error(ErrorCode::ConfigError, section + "." + key + ": " + e.what());
    }
}

template <typename T>
void read_uint(const json& obj, const std::string& section, const std::string& key, T& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
        bad_type(section, key);
    }
    out = it->get<T>();
}

void read_string(const json& obj, const std::string& section, const std::string& key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_string()) bad_type(section, key);
    out = it->get<std::string>();
}

const json* section_of(const json& root, const std::string& name) {
    auto it = root.find(name);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) {
        throw Error(ErrorCode::ConfigError, "section " + name + " must be an object");
    }
    return &*it;
}

void require(bool cond, const std::string& what) {
    if (!cond) throw Error(ErrorCode::ConfigError, what);
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw Error(ErrorCode::ConfigError, "cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw Error(ErrorCode::ConfigError, std::string("invalid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw Error(ErrorCode::ConfigError, "config root must be an object");
    }

    Config config;

    if (const json* s = section_of(root, "general")) {
        read_string(*s, "general", "log_level", config.general.log_level);
    }
    if (const json* s = section_of(root, "pricing")) {
        read_x18(*s, "pricing", "lmsr_liquidity", config.pricing.lmsr_liquidity_x18);
        read_uint(*s, "pricing", "fee_bps", config.pricing.fee_bps);
        read_x18(*s, "pricing", "spread_tolerance", config.pricing.spread_tolerance_x18);
        read_x18(*s, "pricing", "l2_liquidity", config.pricing.l2_liquidity_x18);
        read_x18(*s, "pricing", "l2_weight_floor", config.pricing.l2_weight_floor_x18);
    }
    if (const json* s = section_of(root, "solver")) {
        read_uint(*s, "solver", "max_iterations", config.solver.max_iterations);
        read_x18(*s, "solver", "tolerance", config.solver.tolerance_x18);
        read_x18(*s, "solver", "damping", config.solver.damping_x18);
        read_x18(*s, "solver", "damping_threshold", config.solver.damping_threshold_x18);
    }
    if (const json* s = section_of(root, "integration")) {
        read_uint(*s, "integration", "points", config.integration.points);
        read_uint(*s, "integration", "max_refinements", config.integration.max_refinements);
        read_x18(*s, "integration", "tolerance", config.integration.tolerance_x18);
    }
    if (const json* s = section_of(root, "coverage")) {
        read_x18(*s, "coverage", "min_coverage", config.coverage.min_coverage_x18);
        read_x18(*s, "coverage", "drop_fraction", config.coverage.drop_fraction_x18);
        read_uint(*s, "coverage", "cooldown_cycles", config.coverage.cooldown_cycles);
        read_uint(*s, "coverage", "window", config.coverage.window);
        read_x18(*s, "coverage", "sentinel", config.coverage.sentinel_x18);
    }
    if (const json* s = section_of(root, "leverage")) {
        read_uint(*s, "leverage", "base_max", config.leverage.base_max);
        read_uint(*s, "leverage", "depth_bonus_bps", config.leverage.depth_bonus_bps);
    }
    if (const json* s = section_of(root, "liquidation")) {
        read_uint(*s, "liquidation", "cap_min_bps", config.liquidation.cap_min_bps);
        read_uint(*s, "liquidation", "cap_max_bps", config.liquidation.cap_max_bps);
        read_x18(*s, "liquidation", "sigma_scale", config.liquidation.sigma_scale_x18);
        read_uint(*s, "liquidation", "keeper_incentive_bps", config.liquidation.keeper_incentive_bps);
        read_uint(*s, "liquidation", "close_factor_bps", config.liquidation.close_factor_bps);
        read_uint(*s, "liquidation", "max_effective_leverage", config.liquidation.max_effective_leverage);
        read_x18(*s, "liquidation", "min_notional", config.liquidation.min_notional_x18);
        read_uint(*s, "liquidation", "period_seconds", config.liquidation.period_seconds);
        read_x18(*s, "liquidation", "maintenance_fraction", config.liquidation.maintenance_fraction_x18);
        read_x18(*s, "liquidation", "pnl_floor", config.liquidation.pnl_floor_x18);
        read_x18(*s, "liquidation", "position_count_step", config.liquidation.position_count_step_x18);
    }
    if (const json* s = section_of(root, "chain")) {
        read_x18(*s, "chain", "borrow_multiplier", config.chain.borrow_multiplier_x18);
        read_x18(*s, "chain", "leverage_multiplier", config.chain.leverage_multiplier_x18);
        read_x18(*s, "chain", "stake_multiplier", config.chain.stake_multiplier_x18);
    }

    config.validate();
    return config;
}

void Config::validate() const {
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    bool level_ok = false;
    for (const char* l : levels) {
        if (general.log_level == l) level_ok = true;
    }
    require(level_ok, "general.log_level must be a spdlog level name");

    require(pricing.lmsr_liquidity_x18 > 0, "pricing.lmsr_liquidity must be positive");
    require(pricing.fee_bps < limits::BPS_DENOMINATOR, "pricing.fee_bps must be below 10000");
    require(pricing.spread_tolerance_x18 >= 0, "pricing.spread_tolerance must be non-negative");
    require(pricing.l2_liquidity_x18 > 0, "pricing.l2_liquidity must be positive");
    require(pricing.l2_weight_floor_x18 > 0 && pricing.l2_weight_floor_x18 < X18_ONE,
            "pricing.l2_weight_floor must be in (0, 1)");

    require(solver.max_iterations >= 1, "solver.max_iterations must be at least 1");
    require(solver.tolerance_x18 > 0, "solver.tolerance must be positive");
    require(solver.damping_x18 > 0 && solver.damping_x18 <= X18_ONE, "solver.damping must be in (0, 1]");
    require(solver.damping_threshold_x18 >= solver.tolerance_x18,
            "solver.damping_threshold must not be below solver.tolerance");

    require(integration.points >= 10 && integration.points <= 16 && integration.points % 2 == 0,
            "integration.points must be even and within 10..16");
    require(integration.max_refinements <= 5, "integration.max_refinements must be at most 5");
    require(integration.tolerance_x18 >= X18_ONE / 1000000000000LL &&
            integration.tolerance_x18 <= X18_ONE / 1000000,
            "integration.tolerance must be within 1e-12..1e-6");

    require(coverage.min_coverage_x18 > 0, "coverage.min_coverage must be positive");
    require(coverage.drop_fraction_x18 > 0 && coverage.drop_fraction_x18 < X18_ONE,
            "coverage.drop_fraction must be in (0, 1)");
    require(coverage.window >= 1, "coverage.window must be at least 1");
    require(coverage.sentinel_x18 > 0, "coverage.sentinel must be positive");

    require(leverage.base_max >= 1, "leverage.base_max must be at least 1");

    require(liquidation.cap_min_bps <= liquidation.cap_max_bps &&
            liquidation.cap_max_bps <= limits::BPS_DENOMINATOR,
            "liquidation caps must satisfy cap_min <= cap_max <= 10000");
    require(liquidation.close_factor_bps >= 1 && liquidation.close_factor_bps <= limits::BPS_DENOMINATOR,
            "liquidation.close_factor_bps must be within 1..10000");
    require(liquidation.keeper_incentive_bps <= limits::BPS_DENOMINATOR,
            "liquidation.keeper_incentive_bps must be at most 10000");
    require(liquidation.max_effective_leverage >= 1, "liquidation.max_effective_leverage must be at least 1");
    require(liquidation.min_notional_x18 >= 0, "liquidation.min_notional must be non-negative");
    require(liquidation.period_seconds >= 1, "liquidation.period_seconds must be at least 1");
    require(liquidation.maintenance_fraction_x18 > 0, "liquidation.maintenance_fraction must be positive");
    require(liquidation.pnl_floor_x18 > 0 && liquidation.pnl_floor_x18 <= X18_ONE,
            "liquidation.pnl_floor must be in (0, 1]");
    require(liquidation.position_count_step_x18 >= 0, "liquidation.position_count_step must be non-negative");

    require(chain.borrow_multiplier_x18 >= X18_ONE && chain.leverage_multiplier_x18 >= X18_ONE &&
            chain.stake_multiplier_x18 >= X18_ONE, "chain multipliers must be at least 1");
}

}  // namespace predix

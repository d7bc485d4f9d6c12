// Predix scenario replay
//
// Runs a JSON scenario (engine config plus an ordered list of calls) through
// RiskEngine and prints one JSON result per call.

#include "predix/codec.hpp"
#include "predix/config.hpp"
#include "predix/engine.hpp"
#include "predix/error.hpp"
#include "predix/log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string scenario_path;
    std::string config_path;
    std::string log_level;
    bool pretty = false;
    bool keep_going = false;
};

//------------------------------------------------------------------------------
// Scenario
//------------------------------------------------------------------------------

json load_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw predix::Error(predix::ErrorCode::InvalidInput, "cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw predix::Error(predix::ErrorCode::InvalidInput, path + ": " + e.what());
    }
}

uint64_t id_arg(const json& call, const char* key) {
    auto it = call.find(key);
    if (it == call.end() || !it->is_number_unsigned()) {
        throw predix::Error(predix::ErrorCode::InvalidInput, std::string("call needs unsigned ") + key);
    }
    return it->get<uint64_t>();
}

json run_call(predix::RiskEngine& engine, const std::string& op, const json& call) {
    namespace codec = predix::codec;

    if (op == "create_market") {
        return predix::to_string(engine.create_market(codec::decode_market(call)));
    } else if (op == "update_price") {
        return codec::encode(engine.update_price(codec::decode_price_update(call)));
    } else if (op == "trade") {
        return codec::encode(engine.trade(codec::decode_trade(call)));
    } else if (op == "liquidate") {
        predix::X18 max_size = codec::decode_x18(call.at("max_size"));
        return codec::encode(engine.liquidate(id_arg(call, "position_id"), max_size, id_arg(call, "keeper")));
    } else if (op == "close") {
        return codec::encode(engine.close(id_arg(call, "position_id")));
    } else if (op == "register_chain") {
        return engine.register_chain(codec::decode_chain(call));
    } else if (op == "unwind_chain") {
        json closures = json::array();
        for (const auto& c : engine.unwind_chain(id_arg(call, "chain_id"))) {
            closures.push_back(codec::encode(c));
        }
        return closures;
    } else if (op == "deposit") {
        engine.deposit(id_arg(call, "market_id"), codec::decode_x18(call.at("amount")));
        return codec::encode(engine.vault(id_arg(call, "market_id")));
    } else if (op == "withdraw") {
        engine.withdraw(id_arg(call, "market_id"), codec::decode_x18(call.at("amount")));
        return codec::encode(engine.vault(id_arg(call, "market_id")));
    } else if (op == "set_correlations") {
        engine.set_correlations(id_arg(call, "market_id"), codec::decode_correlations(call));
        return codec::encode(engine.coverage(id_arg(call, "market_id")));
    } else if (op == "coverage") {
        return codec::encode(engine.coverage(id_arg(call, "market_id")));
    } else if (op == "position") {
        auto p = engine.position(id_arg(call, "position_id"));
        return p ? codec::encode(*p) : json(nullptr);
    } else if (op == "positions") {
        json out = json::array();
        for (const auto& p : engine.positions(id_arg(call, "market_id"))) out.push_back(codec::encode(p));
        return out;
    } else if (op == "vault") {
        return codec::encode(engine.vault(id_arg(call, "market_id")));
    } else if (op == "prices") {
        json out = json::array();
        for (predix::X18 p : engine.market_prices(id_arg(call, "market_id"))) out.push_back(codec::encode_x18(p));
        return out;
    } else if (op == "keeper_rewards") {
        return codec::encode_x18(engine.keeper_rewards(id_arg(call, "keeper")));
    } else if (op == "stats") {
        return codec::encode(engine.stats());
    }
    throw predix::Error(predix::ErrorCode::InvalidInput, "unknown op: " + op);
}

// Returns false when a call failed
bool replay(const Options& options) {
    json scenario = load_json(options.scenario_path);
    if (!scenario.is_object() || !scenario.contains("calls") || !scenario["calls"].is_array()) {
        throw predix::Error(predix::ErrorCode::InvalidInput, "scenario needs a \"calls\" array");
    }

    predix::Config config;
    if (!options.config_path.empty()) {
        config = predix::Config::from_file(options.config_path);
    } else if (scenario.contains("config")) {
        config = predix::Config::from_json(scenario["config"].dump());
    }
    if (!options.log_level.empty()) config.with_log_level(options.log_level);

    predix::RiskEngine engine(config);
    const int indent = options.pretty ? 2 : -1;
    bool ok = true;

    size_t index = 0;
    for (const auto& call : scenario["calls"]) {
        std::string op = call.is_object() ? call.value("op", "") : "";
        json out{{"call", index++}, {"op", op}};
        try {
            out["result"] = run_call(engine, op, call);
            out["ok"] = true;
        } catch (const predix::Error& e) {
            out["ok"] = false;
            out["error"] = predix::error_name(e.code());
            out["message"] = e.what();
        } catch (const json::exception& e) {
            out["ok"] = false;
            out["error"] = predix::error_name(predix::ErrorCode::InvalidInput);
            out["message"] = e.what();
        }
        std::cout << out.dump(indent) << "\n";

        if (!out["ok"].get<bool>()) {
            ok = false;
            if (!options.keep_going) break;
        }
    }
    return ok;
}

//------------------------------------------------------------------------------
// Command Line
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "Predix scenario replay\n\n"
              << "Usage: " << prog << " [options] <scenario.json>\n\n"
              << "Options:\n"
              << "  -c, --config <file>    Engine config (overrides the scenario's \"config\")\n"
              << "  -l, --log-level <lvl>  trace, debug, info, warn, error, critical, off\n"
              << "  -k, --keep-going       Continue after a failed call\n"
              << "  -p, --pretty           Indent JSON output\n"
              << "  -h, --help             Show this help message\n\n"
              << "Scenario:\n"
              << "  {\"config\": {...}, \"calls\": [{\"op\": \"create_market\", ...}, ...]}\n\n"
              << "Ops:\n"
              << "  create_market update_price trade liquidate close register_chain\n"
              << "  unwind_chain deposit withdraw set_correlations coverage position\n"
              << "  positions vault prices keeper_rewards stats\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-l" || arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "Missing log level argument\n";
                std::exit(1);
            }
            options.log_level = argv[++i];
        } else if (arg == "-k" || arg == "--keep-going") {
            options.keep_going = true;
        } else if (arg == "-p" || arg == "--pretty") {
            options.pretty = true;
        } else if (arg[0] != '-' && options.scenario_path.empty()) {
            options.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.scenario_path.empty()) {
        print_usage(argv[0]);
        std::exit(1);
    }
    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        return replay(options) ? 0 : 2;
    } catch (const predix::Error& e) {
        predix::log::logger()->error("{}", e.what());
        return 1;
    }
}

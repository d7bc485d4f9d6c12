#ifndef PREDIX_CODEC_HPP
#define PREDIX_CODEC_HPP

#include <nlohmann/json_fwd.hpp>

#include "engine.hpp"
#include "types.hpp"

namespace predix {
namespace codec {

// =============================================================================
// JSON codec for engine requests and results
// =============================================================================
//
// X18 values are written as exact decimal strings and read from strings or
// JSON numbers. Malformed input throws Error(InvalidInput).

nlohmann::json encode_x18(X18 v);
X18 decode_x18(const nlohmann::json& j);

nlohmann::json encode(const Quote& q);
nlohmann::json encode(const Position& p);
nlohmann::json encode(const TradeResult& r);
nlohmann::json encode(const CycleReport& r);
nlohmann::json encode(const LiquidationResult& r);
nlohmann::json encode(const LegClosure& c);
nlohmann::json encode(const CoverageReport& r);
nlohmann::json encode(const VaultState& v);
nlohmann::json encode(const EngineStats& s);

OutcomeRef decode_outcome(const nlohmann::json& j);
MarketSpec decode_market(const nlohmann::json& j);
PriceUpdate decode_price_update(const nlohmann::json& j);
TradeRequest decode_trade(const nlohmann::json& j);
ChainPosition decode_chain(const nlohmann::json& j);
CorrelationInputs decode_correlations(const nlohmann::json& j);

} // namespace codec
} // namespace predix

#endif // PREDIX_CODEC_HPP

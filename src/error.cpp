// =============================================================================
// error.cpp - Error taxonomy
// =============================================================================

#include "predix/error.hpp"

namespace predix {

const char* error_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidOutcomeCount: return "InvalidOutcomeCount";
        case ErrorCode::AMMAlreadySet: return "AMMAlreadySet";
        case ErrorCode::PricingDivergence: return "PricingDivergence";
        case ErrorCode::SlippageExceeded: return "SlippageExceeded";
        case ErrorCode::CoverageBelowThreshold: return "CoverageBelowThreshold";
        case ErrorCode::LiquidationCapExceeded: return "LiquidationCapExceeded";
        case ErrorCode::ArithmeticOverflow: return "ArithmeticOverflow";
        case ErrorCode::CyclicChainDependency: return "CyclicChainDependency";
        case ErrorCode::InvalidInput: return "InvalidInput";
        case ErrorCode::InsufficientLiquidity: return "InsufficientLiquidity";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::MarketNotFound: return "MarketNotFound";
        case ErrorCode::MarketExists: return "MarketExists";
        case ErrorCode::PositionNotFound: return "PositionNotFound";
        case ErrorCode::ChainNotFound: return "ChainNotFound";
        case ErrorCode::LeverageExceeded: return "LeverageExceeded";
        case ErrorCode::SpreadExceeded: return "SpreadExceeded";
        case ErrorCode::StaleUpdate: return "StaleUpdate";
        case ErrorCode::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string& msg)
    : std::runtime_error(std::string(error_name(code)) + ": " + msg), code_(code) {}

} // namespace predix

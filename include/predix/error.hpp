#ifndef PREDIX_ERROR_HPP
#define PREDIX_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace predix {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : uint8_t {
    InvalidOutcomeCount,
    AMMAlreadySet,
    PricingDivergence,
    SlippageExceeded,
    CoverageBelowThreshold,
    LiquidationCapExceeded,   // reported as a no-op status, never thrown
    ArithmeticOverflow,
    CyclicChainDependency,
    InvalidInput,
    InsufficientLiquidity,
    InsufficientBalance,
    MarketNotFound,
    MarketExists,
    PositionNotFound,
    ChainNotFound,
    LeverageExceeded,
    SpreadExceeded,
    StaleUpdate,
    ConfigError
};

const char* error_name(ErrorCode code) noexcept;

// =============================================================================
// Error
// =============================================================================

// Thrown by every fallible operation; a thrown call leaves no state behind.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace predix

#endif // PREDIX_ERROR_HPP

#ifndef AMM_ERRORS_HPP
#define AMM_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace amm {

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Pool lifecycle
constexpr int32_t POOL_NOT_INITIALIZED = -1;
constexpr int32_t POOL_ALREADY_INITIALIZED = -2;
constexpr int32_t CURRENCIES_OUT_OF_ORDER_OR_EQUAL = -3;
constexpr int32_t TICK_SPACING_TOO_LARGE = -4;
constexpr int32_t TICK_SPACING_TOO_SMALL = -5;

// Swap
constexpr int32_t SWAP_AMOUNT_CANNOT_BE_ZERO = -10;
constexpr int32_t PRICE_LIMIT_ALREADY_EXCEEDED = -11;
constexpr int32_t PRICE_LIMIT_OUT_OF_BOUNDS = -12;
constexpr int32_t INVALID_FEE_FOR_EXACT_OUT = -13;
constexpr int32_t NO_LIQUIDITY_TO_RECEIVE_FEES = -14;

// Ticks and positions
constexpr int32_t TICKS_MISORDERED = -20;
constexpr int32_t TICK_LOWER_OUT_OF_BOUNDS = -21;
constexpr int32_t TICK_UPPER_OUT_OF_BOUNDS = -22;
constexpr int32_t TICK_MISALIGNED = -23;
constexpr int32_t TICK_LIQUIDITY_OVERFLOW = -24;
constexpr int32_t CANNOT_UPDATE_EMPTY_POSITION = -25;
constexpr int32_t INVALID_TICK = -26;
constexpr int32_t INVALID_SQRT_PRICE = -27;

// Session discipline
constexpr int32_t ALREADY_UNLOCKED = -30;
constexpr int32_t MANAGER_LOCKED = -31;
constexpr int32_t CURRENCY_NOT_SETTLED = -32;
constexpr int32_t MUST_CLEAR_EXACT_POSITIVE_DELTA = -33;
constexpr int32_t SETTLE_UNDERFLOW = -34;

// Extensions
constexpr int32_t INVALID_HOOK_RESPONSE = -40;
constexpr int32_t HOOK_ADDRESS_NOT_VALID = -41;
constexpr int32_t HOOK_NOT_REGISTERED = -42;
constexpr int32_t HOOK_NOT_IMPLEMENTED = -43;
constexpr int32_t HOOK_CALL_FAILED = -44;
constexpr int32_t HOOK_DELTA_EXCEEDS_SWAP_AMOUNT = -45;
constexpr int32_t UNAUTHORIZED_DYNAMIC_LP_FEE_UPDATE = -46;

// Fees
constexpr int32_t LP_FEE_TOO_LARGE = -50;
constexpr int32_t PROTOCOL_FEE_TOO_LARGE = -51;
constexpr int32_t PROTOCOL_FEE_CURRENCY_SYNCED = -52;
constexpr int32_t INVALID_CALLER = -53;

// Arithmetic
constexpr int32_t SAFE_CAST_OVERFLOW = -60;
constexpr int32_t LIQUIDITY_UNDERFLOW = -61;
constexpr int32_t LIQUIDITY_OVERFLOW = -62;
constexpr int32_t MUL_DIV_OVERFLOW = -63;
constexpr int32_t PRICE_OVERFLOW = -64;
constexpr int32_t NOT_ENOUGH_LIQUIDITY = -65;
constexpr int32_t INVALID_PRICE_OR_LIQUIDITY = -66;

// Token collaborators
constexpr int32_t INSUFFICIENT_BALANCE = -70;
constexpr int32_t INSUFFICIENT_PERMISSION = -71;
constexpr int32_t COLLABORATOR_FAILED = -72;   // custody or claims threw a non-AmmError

// Kind name for a code, e.g. "PoolNotInitialized"
const char* name(int32_t code);
}

// =============================================================================
// AmmError
// =============================================================================

// Thrown by every failing operation. what() reads "Kind(detail)".
class AmmError : public std::runtime_error {
public:
    AmmError(int32_t code, const std::string& detail = {});

    int32_t code() const noexcept { return code_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    int32_t code_;
    std::string detail_;
};

[[noreturn]] void fail(int32_t code, const std::string& detail = {});

} // namespace amm

#endif // AMM_ERRORS_HPP

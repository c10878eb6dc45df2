// =============================================================================
// errors.cpp - Error kinds and AmmError
// =============================================================================

#include "amm/errors.hpp"

namespace amm {

namespace errors {

const char* name(int32_t code) {
    switch (code) {
    case OK: return "Ok";
    case POOL_NOT_INITIALIZED: return "PoolNotInitialized";
    case POOL_ALREADY_INITIALIZED: return "PoolAlreadyInitialized";
    case CURRENCIES_OUT_OF_ORDER_OR_EQUAL: return "CurrenciesOutOfOrderOrEqual";
    case TICK_SPACING_TOO_LARGE: return "TickSpacingTooLarge";
    case TICK_SPACING_TOO_SMALL: return "TickSpacingTooSmall";
    case SWAP_AMOUNT_CANNOT_BE_ZERO: return "SwapAmountCannotBeZero";
    case PRICE_LIMIT_ALREADY_EXCEEDED: return "PriceLimitAlreadyExceeded";
    case PRICE_LIMIT_OUT_OF_BOUNDS: return "PriceLimitOutOfBounds";
    case INVALID_FEE_FOR_EXACT_OUT: return "InvalidFeeForExactOut";
    case NO_LIQUIDITY_TO_RECEIVE_FEES: return "NoLiquidityToReceiveFees";
    case TICKS_MISORDERED: return "TicksMisordered";
    case TICK_LOWER_OUT_OF_BOUNDS: return "TickLowerOutOfBounds";
    case TICK_UPPER_OUT_OF_BOUNDS: return "TickUpperOutOfBounds";
    case TICK_MISALIGNED: return "TickMisaligned";
    case TICK_LIQUIDITY_OVERFLOW: return "TickLiquidityOverflow";
    case CANNOT_UPDATE_EMPTY_POSITION: return "CannotUpdateEmptyPosition";
    case INVALID_TICK: return "InvalidTick";
    case INVALID_SQRT_PRICE: return "InvalidSqrtPrice";
    case ALREADY_UNLOCKED: return "AlreadyUnlocked";
    case MANAGER_LOCKED: return "ManagerLocked";
    case CURRENCY_NOT_SETTLED: return "CurrencyNotSettled";
    case MUST_CLEAR_EXACT_POSITIVE_DELTA: return "MustClearExactPositiveDelta";
    case SETTLE_UNDERFLOW: return "SettleUnderflow";
    case INVALID_HOOK_RESPONSE: return "InvalidHookResponse";
    case HOOK_ADDRESS_NOT_VALID: return "HookAddressNotValid";
    case HOOK_NOT_REGISTERED: return "HookNotRegistered";
    case HOOK_NOT_IMPLEMENTED: return "HookNotImplemented";
    case HOOK_CALL_FAILED: return "HookCallFailed";
    case HOOK_DELTA_EXCEEDS_SWAP_AMOUNT: return "HookDeltaExceedsSwapAmount";
    case UNAUTHORIZED_DYNAMIC_LP_FEE_UPDATE: return "UnauthorizedDynamicLPFeeUpdate";
    case LP_FEE_TOO_LARGE: return "LPFeeTooLarge";
    case PROTOCOL_FEE_TOO_LARGE: return "ProtocolFeeTooLarge";
    case PROTOCOL_FEE_CURRENCY_SYNCED: return "ProtocolFeeCurrencySynced";
    case INVALID_CALLER: return "InvalidCaller";
    case SAFE_CAST_OVERFLOW: return "SafeCastOverflow";
    case LIQUIDITY_UNDERFLOW: return "LiquidityUnderflow";
    case LIQUIDITY_OVERFLOW: return "LiquidityOverflow";
    case MUL_DIV_OVERFLOW: return "MulDivOverflow";
    case PRICE_OVERFLOW: return "PriceOverflow";
    case NOT_ENOUGH_LIQUIDITY: return "NotEnoughLiquidity";
    case INVALID_PRICE_OR_LIQUIDITY: return "InvalidPriceOrLiquidity";
    case INSUFFICIENT_BALANCE: return "InsufficientBalance";
    case INSUFFICIENT_PERMISSION: return "InsufficientPermission";
    case COLLABORATOR_FAILED: return "CollaboratorFailed";
    default: return "Unknown";
    }
}

} // namespace errors

namespace {

std::string format_message(int32_t code, const std::string& detail) {
    std::string msg = errors::name(code);
    msg += '(';
    msg += detail;
    msg += ')';
    return msg;
}

} // anonymous namespace

AmmError::AmmError(int32_t code, const std::string& detail)
    : std::runtime_error(format_message(code, detail)),
      code_(code),
      detail_(detail) {}

void fail(int32_t code, const std::string& detail) {
    throw AmmError(code, detail);
}

} // namespace amm

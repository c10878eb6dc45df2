#ifndef AMM_MATH_HPP
#define AMM_MATH_HPP

#include "types.hpp"

namespace amm {

// Q64.96 and Q128.128 scaling factors
extern const U256 Q96;
extern const U256 Q128;

// =============================================================================
// Full-Precision Multiply/Divide (512-bit intermediate)
// =============================================================================

namespace full_math {

// floor(a * b / denominator); throws MulDivOverflow if the result exceeds 256 bits
U256 mul_div(const U256& a, const U256& b, const U256& denominator);

// ceil(a * b / denominator)
U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denominator);

// ceil(x / y), y != 0
U256 div_rounding_up(const U256& x, const U256& y);

// floor(a * b / denominator) truncated to 256 bits (wrapping accumulators)
U256 mul_div_wrapping(const U256& a, const U256& b, const U256& denominator);

} // namespace full_math

// =============================================================================
// Tick Math Utilities
// =============================================================================

namespace tick_math {

constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

// sqrt(1.0001^MIN_TICK) and sqrt(1.0001^MAX_TICK) as Q64.96
extern const U256 MIN_SQRT_PRICE;
extern const U256 MAX_SQRT_PRICE;

// Lowest / highest tick that is a multiple of tick_spacing
inline int32_t min_usable_tick(int32_t tick_spacing) {
    return (MIN_TICK / tick_spacing) * tick_spacing;
}
inline int32_t max_usable_tick(int32_t tick_spacing) {
    return (MAX_TICK / tick_spacing) * tick_spacing;
}

// sqrt(1.0001^tick) * 2^96, rounded up. Throws InvalidTick outside [MIN_TICK, MAX_TICK].
U256 get_sqrt_price_at_tick(int32_t tick);

// Greatest tick whose sqrt price is <= sqrt_price_x96.
// Throws InvalidSqrtPrice outside [MIN_SQRT_PRICE, MAX_SQRT_PRICE).
int32_t get_tick_at_sqrt_price(const U256& sqrt_price_x96);

} // namespace tick_math

// =============================================================================
// Liquidity Math
// =============================================================================

namespace liquidity_math {

// x + y, throws LiquidityUnderflow / LiquidityOverflow
U128 add_delta(U128 x, I128 y);

} // namespace liquidity_math

// =============================================================================
// Sqrt Price Math
// =============================================================================

namespace sqrt_price_math {

U256 get_next_sqrt_price_from_amount0_rounding_up(const U256& sqrt_price_x96, U128 liquidity,
                                                  const U256& amount, bool add);

U256 get_next_sqrt_price_from_amount1_rounding_down(const U256& sqrt_price_x96, U128 liquidity,
                                                    const U256& amount, bool add);

// Price after adding amount_in of the input currency
U256 get_next_sqrt_price_from_input(const U256& sqrt_price_x96, U128 liquidity,
                                    const U256& amount_in, bool zero_for_one);

// Price after removing amount_out of the output currency
U256 get_next_sqrt_price_from_output(const U256& sqrt_price_x96, U128 liquidity,
                                     const U256& amount_out, bool zero_for_one);

// L * (sqrt_b - sqrt_a) / (sqrt_a * sqrt_b)
U256 get_amount0_delta(U256 sqrt_price_a_x96, U256 sqrt_price_b_x96, U128 liquidity, bool round_up);

// L * (sqrt_b - sqrt_a)
U256 get_amount1_delta(U256 sqrt_price_a_x96, U256 sqrt_price_b_x96, U128 liquidity, bool round_up);

// Signed variants: adding liquidity yields a negative amount (owed by the caller)
I128 get_amount0_delta(const U256& sqrt_price_a_x96, const U256& sqrt_price_b_x96, I128 liquidity);
I128 get_amount1_delta(const U256& sqrt_price_a_x96, const U256& sqrt_price_b_x96, I128 liquidity);

} // namespace sqrt_price_math

// =============================================================================
// Swap Step Math
// =============================================================================

namespace swap_math {

constexpr uint32_t MAX_SWAP_FEE = 1000000;

struct SwapStep {
    U256 sqrt_price_next_x96;
    U256 amount_in;
    U256 amount_out;
    U256 fee_amount;
};

// Nearer of the next tick price and the caller's limit, in swap direction
inline U256 get_sqrt_price_target(bool zero_for_one, const U256& sqrt_price_next_x96,
                                  const U256& sqrt_price_limit_x96) {
    if (zero_for_one) {
        return sqrt_price_next_x96 < sqrt_price_limit_x96 ? sqrt_price_limit_x96 : sqrt_price_next_x96;
    }
    return sqrt_price_next_x96 > sqrt_price_limit_x96 ? sqrt_price_limit_x96 : sqrt_price_next_x96;
}

// One step toward sqrt_price_target. amount_remaining < 0 is exact input.
SwapStep compute_swap_step(const U256& sqrt_price_current_x96, const U256& sqrt_price_target_x96,
                           U128 liquidity, I128 amount_remaining, uint32_t fee_pips);

} // namespace swap_math

} // namespace amm

#endif // AMM_MATH_HPP

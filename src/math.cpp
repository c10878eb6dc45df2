// =============================================================================
// math.cpp - Exact fixed-point math for concentrated liquidity
// Integer-only: Q64.96 prices, Q128.128 fee growth, 512-bit intermediates
// =============================================================================

#include "amm/math.hpp"
#include "amm/errors.hpp"

#include <array>
#include <utility>

namespace amm {

const U256 Q96 = U256(1) << 96;
const U256 Q128 = U256(1) << 128;

namespace {

const U512 MAX_U256_AS_U512 = (U512(1) << 256) - 1;
const U256 MAX_U160 = (U256(1) << 160) - 1;

U256 narrow(const U512& v) {
    if (v > MAX_U256_AS_U512) {
        fail(errors::MUL_DIV_OVERFLOW, "result exceeds 256 bits");
    }
    return static_cast<U256>(v);
}

} // anonymous namespace

// =============================================================================
// Full-Precision Multiply/Divide
// =============================================================================

namespace full_math {

U256 mul_div(const U256& a, const U256& b, const U256& denominator) {
    if (denominator == 0) {
        fail(errors::MUL_DIV_OVERFLOW, "division by zero");
    }
    U512 product = U512(a) * U512(b);
    return narrow(product / U512(denominator));
}

U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denominator) {
    if (denominator == 0) {
        fail(errors::MUL_DIV_OVERFLOW, "division by zero");
    }
    U512 product = U512(a) * U512(b);
    U512 d(denominator);
    U512 q = product / d;
    if (product % d != 0) q += 1;
    return narrow(q);
}

U256 div_rounding_up(const U256& x, const U256& y) {
    if (y == 0) {
        fail(errors::MUL_DIV_OVERFLOW, "division by zero");
    }
    U256 q = x / y;
    if (x % y != 0) q += 1;
    return q;
}

U256 mul_div_wrapping(const U256& a, const U256& b, const U256& denominator) {
    if (denominator == 0) {
        fail(errors::MUL_DIV_OVERFLOW, "division by zero");
    }
    U512 q = (U512(a) * U512(b)) / U512(denominator);
    return static_cast<U256>(q & MAX_U256_AS_U512);
}

} // namespace full_math

// =============================================================================
// Tick Math
// =============================================================================

namespace tick_math {

const U256 MIN_SQRT_PRICE("4295128739");
const U256 MAX_SQRT_PRICE("1461446703485210103287273052203988822378723970342");

namespace {

// 2^128 / sqrt(1.0001)^(2^i) for i = 0..19, Q128.128
const std::array<U256, 20>& ratio_constants() {
    static const std::array<U256, 20> constants = {
        U256("0xfffcb933bd6fad37aa2d162d1a594001"),
        U256("0xfff97272373d413259a46990580e213a"),
        U256("0xfff2e50f5f656932ef12357cf3c7fdcc"),
        U256("0xffe5caca7e10e4e61c3624eaa0941cd0"),
        U256("0xffcb9843d60f6159c9db58835c926644"),
        U256("0xff973b41fa98c081472e6896dfb254c0"),
        U256("0xff2ea16466c96a3843ec78b326b52861"),
        U256("0xfe5dee046a99a2a811c461f1969c3053"),
        U256("0xfcbe86c7900a88aedcffc83b479aa3a4"),
        U256("0xf987a7253ac413176f2b074cf7815e54"),
        U256("0xf3392b0822b70005940c7a398e4b70f3"),
        U256("0xe7159475a2c29b7443b29c7fa6e889d9"),
        U256("0xd097f3bdfd2022b8845ad8f792aa5825"),
        U256("0xa9f746462d870fdf8a65dc1f90e061e5"),
        U256("0x70d869a156d2a1b890bb3df62baf32f7"),
        U256("0x31be135f97d08fd981231505542fcfa6"),
        U256("0x9aa508b5b7a84e1c677de54f3e99bc9"),
        U256("0x5d6af8dedb81196699c329225ee604"),
        U256("0x2216e584f5fa1ea926041bedfe98"),
        U256("0x48a170391f7dc42444e8fa2"),
    };
    return constants;
}

} // anonymous namespace

U256 get_sqrt_price_at_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        fail(errors::INVALID_TICK, "tick=" + std::to_string(tick));
    }
    uint32_t abs_tick = static_cast<uint32_t>(tick < 0 ? -static_cast<int64_t>(tick) : tick);

    const auto& constants = ratio_constants();
    U256 ratio = (abs_tick & 0x1) != 0 ? constants[0] : (U256(1) << 128);
    for (unsigned i = 1; i < constants.size(); ++i) {
        if ((abs_tick & (1u << i)) != 0) {
            ratio = (ratio * constants[i]) >> 128;
        }
    }

    if (tick > 0) ratio = (~U256(0)) / ratio;

    // Q128.128 -> Q64.96, rounding up so the inverse stays consistent
    U256 sqrt_price = ratio >> 32;
    if ((ratio & U256(0xFFFFFFFFu)) != 0) sqrt_price += 1;
    return sqrt_price;
}

int32_t get_tick_at_sqrt_price(const U256& sqrt_price_x96) {
    if (sqrt_price_x96 < MIN_SQRT_PRICE || sqrt_price_x96 >= MAX_SQRT_PRICE) {
        fail(errors::INVALID_SQRT_PRICE, "sqrt_price_x96=" + to_string(sqrt_price_x96));
    }
    // get_sqrt_price_at_tick is strictly increasing: bisect for the last tick <= price
    int32_t lo = MIN_TICK;
    int32_t hi = MAX_TICK - 1;
    while (lo < hi) {
        int32_t mid = lo + (hi - lo + 1) / 2;
        if (get_sqrt_price_at_tick(mid) <= sqrt_price_x96) {
            lo = mid;
        } else {
            hi = mid - 1;
        }
    }
    return lo;
}

} // namespace tick_math

// =============================================================================
// Liquidity Math
// =============================================================================

namespace liquidity_math {

U128 add_delta(U128 x, I128 y) {
    if (y < 0) {
        U128 magnitude = U128(0) - static_cast<U128>(y);
        if (magnitude > x) {
            fail(errors::LIQUIDITY_UNDERFLOW,
                 "liquidity=" + to_string(x) + " delta=" + to_string(y));
        }
        return x - magnitude;
    }
    U128 z = x + static_cast<U128>(y);
    if (z < x) {
        fail(errors::LIQUIDITY_OVERFLOW,
             "liquidity=" + to_string(x) + " delta=" + to_string(y));
    }
    return z;
}

} // namespace liquidity_math

// =============================================================================
// Sqrt Price Math
// =============================================================================

namespace sqrt_price_math {

namespace {

U256 checked_u160(const U512& v) {
    if (v > U512(MAX_U160)) {
        fail(errors::PRICE_OVERFLOW, "sqrt price exceeds 160 bits");
    }
    return static_cast<U256>(v);
}

U512 ceil_div(const U512& x, const U512& y) {
    U512 q = x / y;
    if (x % y != 0) q += 1;
    return q;
}

} // anonymous namespace

U256 get_next_sqrt_price_from_amount0_rounding_up(const U256& sqrt_price_x96, U128 liquidity,
                                                  const U256& amount, bool add) {
    // Short-circuit so the result is exactly the input price
    if (amount == 0) return sqrt_price_x96;

    U512 numerator1 = U512(to_u256(liquidity)) << 96;
    U512 product = U512(amount) * U512(sqrt_price_x96);

    if (add) {
        U512 denominator = numerator1 + product;
        return checked_u160(ceil_div(numerator1 * U512(sqrt_price_x96), denominator));
    }

    if (product >= numerator1) {
        fail(errors::PRICE_OVERFLOW, "amount0 out exceeds virtual reserves");
    }
    U512 denominator = numerator1 - product;
    return checked_u160(ceil_div(numerator1 * U512(sqrt_price_x96), denominator));
}

U256 get_next_sqrt_price_from_amount1_rounding_down(const U256& sqrt_price_x96, U128 liquidity,
                                                    const U256& amount, bool add) {
    U512 scaled = U512(amount) << 96;
    U512 l(to_u256(liquidity));

    if (add) {
        U512 quotient = scaled / l;
        return checked_u160(U512(sqrt_price_x96) + quotient);
    }

    U512 quotient = ceil_div(scaled, l);
    if (U512(sqrt_price_x96) <= quotient) {
        fail(errors::NOT_ENOUGH_LIQUIDITY, "amount1 out exceeds virtual reserves");
    }
    return static_cast<U256>(U512(sqrt_price_x96) - quotient);
}

U256 get_next_sqrt_price_from_input(const U256& sqrt_price_x96, U128 liquidity,
                                    const U256& amount_in, bool zero_for_one) {
    if (sqrt_price_x96 == 0 || liquidity == 0) {
        fail(errors::INVALID_PRICE_OR_LIQUIDITY);
    }
    // Round so the step never passes the target price
    return zero_for_one
        ? get_next_sqrt_price_from_amount0_rounding_up(sqrt_price_x96, liquidity, amount_in, true)
        : get_next_sqrt_price_from_amount1_rounding_down(sqrt_price_x96, liquidity, amount_in, true);
}

U256 get_next_sqrt_price_from_output(const U256& sqrt_price_x96, U128 liquidity,
                                     const U256& amount_out, bool zero_for_one) {
    if (sqrt_price_x96 == 0 || liquidity == 0) {
        fail(errors::INVALID_PRICE_OR_LIQUIDITY);
    }
    return zero_for_one
        ? get_next_sqrt_price_from_amount1_rounding_down(sqrt_price_x96, liquidity, amount_out, false)
        : get_next_sqrt_price_from_amount0_rounding_up(sqrt_price_x96, liquidity, amount_out, false);
}

U256 get_amount0_delta(U256 sqrt_price_a_x96, U256 sqrt_price_b_x96, U128 liquidity, bool round_up) {
    if (sqrt_price_a_x96 > sqrt_price_b_x96) std::swap(sqrt_price_a_x96, sqrt_price_b_x96);
    if (sqrt_price_a_x96 == 0) {
        fail(errors::INVALID_SQRT_PRICE, "sqrt_price=0");
    }

    U256 numerator1 = to_u256(liquidity) << 96;
    U256 numerator2 = sqrt_price_b_x96 - sqrt_price_a_x96;

    if (round_up) {
        return full_math::div_rounding_up(
            full_math::mul_div_rounding_up(numerator1, numerator2, sqrt_price_b_x96),
            sqrt_price_a_x96);
    }
    return full_math::mul_div(numerator1, numerator2, sqrt_price_b_x96) / sqrt_price_a_x96;
}

U256 get_amount1_delta(U256 sqrt_price_a_x96, U256 sqrt_price_b_x96, U128 liquidity, bool round_up) {
    if (sqrt_price_a_x96 > sqrt_price_b_x96) std::swap(sqrt_price_a_x96, sqrt_price_b_x96);
    U256 diff = sqrt_price_b_x96 - sqrt_price_a_x96;
    return round_up
        ? full_math::mul_div_rounding_up(to_u256(liquidity), diff, Q96)
        : full_math::mul_div(to_u256(liquidity), diff, Q96);
}

I128 get_amount0_delta(const U256& sqrt_price_a_x96, const U256& sqrt_price_b_x96, I128 liquidity) {
    if (liquidity < 0) {
        U128 magnitude = U128(0) - static_cast<U128>(liquidity);
        return to_i128(get_amount0_delta(sqrt_price_a_x96, sqrt_price_b_x96, magnitude, false));
    }
    return -to_i128(get_amount0_delta(sqrt_price_a_x96, sqrt_price_b_x96,
                                      static_cast<U128>(liquidity), true));
}

I128 get_amount1_delta(const U256& sqrt_price_a_x96, const U256& sqrt_price_b_x96, I128 liquidity) {
    if (liquidity < 0) {
        U128 magnitude = U128(0) - static_cast<U128>(liquidity);
        return to_i128(get_amount1_delta(sqrt_price_a_x96, sqrt_price_b_x96, magnitude, false));
    }
    return -to_i128(get_amount1_delta(sqrt_price_a_x96, sqrt_price_b_x96,
                                      static_cast<U128>(liquidity), true));
}

} // namespace sqrt_price_math

// =============================================================================
// Swap Step Math
// =============================================================================

namespace swap_math {

SwapStep compute_swap_step(const U256& sqrt_price_current_x96, const U256& sqrt_price_target_x96,
                           U128 liquidity, I128 amount_remaining, uint32_t fee_pips) {
    using namespace sqrt_price_math;

    SwapStep step;
    const bool zero_for_one = sqrt_price_current_x96 >= sqrt_price_target_x96;
    const bool exact_in = amount_remaining < 0;
    const U128 remaining_abs = exact_in
        ? U128(0) - static_cast<U128>(amount_remaining)
        : static_cast<U128>(amount_remaining);
    const U256 remaining = to_u256(remaining_abs);

    if (exact_in) {
        U256 amount_remaining_less_fee =
            full_math::mul_div(remaining, U256(MAX_SWAP_FEE - fee_pips), U256(MAX_SWAP_FEE));
        step.amount_in = zero_for_one
            ? get_amount0_delta(sqrt_price_target_x96, sqrt_price_current_x96, liquidity, true)
            : get_amount1_delta(sqrt_price_current_x96, sqrt_price_target_x96, liquidity, true);

        if (amount_remaining_less_fee >= step.amount_in) {
            // Full step to the target
            step.sqrt_price_next_x96 = sqrt_price_target_x96;
            step.fee_amount = fee_pips == MAX_SWAP_FEE
                ? step.amount_in
                : full_math::mul_div_rounding_up(step.amount_in, U256(fee_pips),
                                                 U256(MAX_SWAP_FEE - fee_pips));
        } else {
            step.amount_in = amount_remaining_less_fee;
            step.sqrt_price_next_x96 = get_next_sqrt_price_from_input(
                sqrt_price_current_x96, liquidity, amount_remaining_less_fee, zero_for_one);
            // Whatever is not swapped is taken as fee
            step.fee_amount = remaining - step.amount_in;
        }
        step.amount_out = zero_for_one
            ? get_amount1_delta(step.sqrt_price_next_x96, sqrt_price_current_x96, liquidity, false)
            : get_amount0_delta(sqrt_price_current_x96, step.sqrt_price_next_x96, liquidity, false);
    } else {
        step.amount_out = zero_for_one
            ? get_amount1_delta(sqrt_price_target_x96, sqrt_price_current_x96, liquidity, false)
            : get_amount0_delta(sqrt_price_current_x96, sqrt_price_target_x96, liquidity, false);

        if (remaining >= step.amount_out) {
            step.sqrt_price_next_x96 = sqrt_price_target_x96;
        } else {
            step.amount_out = remaining;
            step.sqrt_price_next_x96 = get_next_sqrt_price_from_output(
                sqrt_price_current_x96, liquidity, remaining, zero_for_one);
        }
        step.amount_in = zero_for_one
            ? get_amount0_delta(step.sqrt_price_next_x96, sqrt_price_current_x96, liquidity, true)
            : get_amount1_delta(sqrt_price_current_x96, step.sqrt_price_next_x96, liquidity, true);
        step.fee_amount = full_math::mul_div_rounding_up(step.amount_in, U256(fee_pips),
                                                         U256(MAX_SWAP_FEE - fee_pips));
    }
    return step;
}

} // namespace swap_math

} // namespace amm

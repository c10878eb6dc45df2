// =============================================================================
// pool.cpp - Concentrated-liquidity pool state transitions
// Tick-walking swap, range positions, donations
// =============================================================================

#include "amm/pool.hpp"
#include "amm/errors.hpp"
#include "amm/fees.hpp"
#include "amm/math.hpp"

namespace amm {

// =============================================================================
// Lifecycle
// =============================================================================

int32_t Pool::initialize(const U256& sqrt_price_x96, uint32_t lp_fee) {
    if (is_initialized()) {
        fail(errors::POOL_ALREADY_INITIALIZED);
    }
    int32_t tick = tick_math::get_tick_at_sqrt_price(sqrt_price_x96);
    slot0_ = Slot0()
        .with_sqrt_price_x96(sqrt_price_x96)
        .with_tick(tick)
        .with_protocol_fee(0)
        .with_lp_fee(lp_fee);
    return tick;
}

void Pool::check_initialized() const {
    if (!is_initialized()) {
        fail(errors::POOL_NOT_INITIALIZED);
    }
}

void Pool::set_protocol_fee(uint32_t protocol_fee) {
    check_initialized();
    slot0_ = slot0_.with_protocol_fee(protocol_fee);
}

void Pool::set_lp_fee(uint32_t lp_fee) {
    check_initialized();
    slot0_ = slot0_.with_lp_fee(lp_fee);
}

// =============================================================================
// Swap
// =============================================================================

Pool::SwapResult Pool::swap(const SwapInput& input) {
    const Slot0 slot0_start = slot0_;
    const bool zero_for_one = input.zero_for_one;

    uint32_t proto_fee = zero_for_one
        ? protocol_fee::zero_for_one(slot0_start.protocol_fee())
        : protocol_fee::one_for_zero(slot0_start.protocol_fee());

    uint32_t lp = lp_fee::is_override(input.lp_fee_override)
        ? lp_fee::remove_override_flag_and_validate(input.lp_fee_override)
        : slot0_start.lp_fee();

    SwapResult result;
    result.sqrt_price_x96 = slot0_start.sqrt_price_x96();
    result.tick = slot0_start.tick();
    result.liquidity = liquidity_;
    result.swap_fee = proto_fee == 0 ? lp : protocol_fee::calculate_swap_fee(proto_fee, lp);

    // A 100% fee leaves nothing to buy with
    if (result.swap_fee >= swap_math::MAX_SWAP_FEE && input.amount_specified > 0) {
        fail(errors::INVALID_FEE_FOR_EXACT_OUT, "swap_fee=" + std::to_string(result.swap_fee));
    }

    // Hook consumed the whole amount
    if (input.amount_specified == 0) return result;

    const U256& limit = input.sqrt_price_limit_x96;
    if (zero_for_one) {
        if (limit >= slot0_start.sqrt_price_x96()) {
            fail(errors::PRICE_LIMIT_ALREADY_EXCEEDED,
                 "current=" + to_string(slot0_start.sqrt_price_x96()) + " limit=" + to_string(limit));
        }
        if (limit <= tick_math::MIN_SQRT_PRICE) {
            fail(errors::PRICE_LIMIT_OUT_OF_BOUNDS, "limit=" + to_string(limit));
        }
    } else {
        if (limit <= slot0_start.sqrt_price_x96()) {
            fail(errors::PRICE_LIMIT_ALREADY_EXCEEDED,
                 "current=" + to_string(slot0_start.sqrt_price_x96()) + " limit=" + to_string(limit));
        }
        if (limit >= tick_math::MAX_SQRT_PRICE) {
            fail(errors::PRICE_LIMIT_OUT_OF_BOUNDS, "limit=" + to_string(limit));
        }
    }

    const bool exact_output = input.amount_specified > 0;
    I128 amount_specified_remaining = input.amount_specified;
    I128 amount_calculated = 0;
    U256 fee_growth_global = zero_for_one ? fee_growth_global0_x128_ : fee_growth_global1_x128_;

    while (amount_specified_remaining != 0 && result.sqrt_price_x96 != limit) {
        const U256 sqrt_price_start = result.sqrt_price_x96;

        auto [tick_next, initialized] = tick_bitmap::next_initialized_tick_within_one_word(
            tick_bitmap_, result.tick, input.tick_spacing, zero_for_one);

        // The bitmap has no notion of the global tick bounds
        if (tick_next <= tick_math::MIN_TICK) tick_next = tick_math::MIN_TICK;
        if (tick_next >= tick_math::MAX_TICK) tick_next = tick_math::MAX_TICK;

        const U256 sqrt_price_next = tick_math::get_sqrt_price_at_tick(tick_next);

        swap_math::SwapStep step = swap_math::compute_swap_step(
            result.sqrt_price_x96,
            swap_math::get_sqrt_price_target(zero_for_one, sqrt_price_next, limit),
            result.liquidity,
            amount_specified_remaining,
            result.swap_fee);
        result.sqrt_price_x96 = step.sqrt_price_next_x96;

        if (exact_output) {
            amount_specified_remaining = checked_sub(amount_specified_remaining, to_i128(step.amount_out));
            amount_calculated = checked_sub(amount_calculated, to_i128(step.amount_in + step.fee_amount));
        } else {
            amount_specified_remaining = checked_add(amount_specified_remaining,
                                                     to_i128(step.amount_in + step.fee_amount));
            amount_calculated = checked_add(amount_calculated, to_i128(step.amount_out));
        }

        // Protocol share comes out of the step fee before LPs are credited
        if (proto_fee > 0) {
            U256 protocol_share = result.swap_fee == proto_fee
                ? step.fee_amount
                : (step.amount_in + step.fee_amount) * proto_fee / protocol_fee::PIPS_DENOMINATOR;
            step.fee_amount -= protocol_share;
            result.amount_to_protocol += protocol_share;
        }

        if (result.liquidity > 0) {
            fee_growth_global += full_math::mul_div_wrapping(step.fee_amount, Q128,
                                                             to_u256(result.liquidity));
        }

        if (result.sqrt_price_x96 == sqrt_price_next) {
            if (initialized) {
                I128 liquidity_net = zero_for_one
                    ? cross_tick(tick_next, fee_growth_global, fee_growth_global1_x128_)
                    : cross_tick(tick_next, fee_growth_global0_x128_, fee_growth_global);
                // Moving left applies the net in reverse
                if (zero_for_one) liquidity_net = checked_neg(liquidity_net);
                result.liquidity = liquidity_math::add_delta(result.liquidity, liquidity_net);
            }
            result.tick = zero_for_one ? tick_next - 1 : tick_next;
        } else if (result.sqrt_price_x96 != sqrt_price_start) {
            result.tick = tick_math::get_tick_at_sqrt_price(result.sqrt_price_x96);
        }
    }

    slot0_ = slot0_start.with_tick(result.tick).with_sqrt_price_x96(result.sqrt_price_x96);
    liquidity_ = result.liquidity;
    if (zero_for_one) {
        fee_growth_global0_x128_ = fee_growth_global;
    } else {
        fee_growth_global1_x128_ = fee_growth_global;
    }

    I128 specified_used = checked_sub(input.amount_specified, amount_specified_remaining);
    if (zero_for_one != (input.amount_specified < 0)) {
        // Specified side is currency1
        result.delta = BalanceDelta(amount_calculated, specified_used);
    } else {
        result.delta = BalanceDelta(specified_used, amount_calculated);
    }
    return result;
}

// =============================================================================
// Modify Liquidity
// =============================================================================

void Pool::check_ticks(int32_t tick_lower, int32_t tick_upper) {
    if (tick_lower >= tick_upper) {
        fail(errors::TICKS_MISORDERED,
             "tick_lower=" + std::to_string(tick_lower) + " tick_upper=" + std::to_string(tick_upper));
    }
    if (tick_lower < tick_math::MIN_TICK) {
        fail(errors::TICK_LOWER_OUT_OF_BOUNDS, "tick_lower=" + std::to_string(tick_lower));
    }
    if (tick_upper > tick_math::MAX_TICK) {
        fail(errors::TICK_UPPER_OUT_OF_BOUNDS, "tick_upper=" + std::to_string(tick_upper));
    }
}

U128 Pool::tick_spacing_to_max_liquidity_per_tick(int32_t tick_spacing) {
    // Compressed bounds, the lower one floored
    int32_t min_compressed = tick_bitmap::compress(tick_math::MIN_TICK, tick_spacing);
    int32_t max_compressed = tick_math::MAX_TICK / tick_spacing;
    uint32_t num_ticks = static_cast<uint32_t>(max_compressed - min_compressed) + 1;
    return U128_MAX / num_ticks;
}

Pool::TickUpdate Pool::update_tick(int32_t tick, I128 liquidity_delta, bool upper) {
    TickInfo& info = ticks_[tick];

    U128 gross_before = info.liquidity_gross;
    U128 gross_after = liquidity_math::add_delta(gross_before, liquidity_delta);
    bool flipped = (gross_after == 0) != (gross_before == 0);

    if (gross_before == 0) {
        // By convention all growth before initialization happened below the tick
        if (tick <= slot0_.tick()) {
            info.fee_growth_outside0_x128 = fee_growth_global0_x128_;
            info.fee_growth_outside1_x128 = fee_growth_global1_x128_;
        }
    }

    info.liquidity_gross = gross_after;
    info.liquidity_net = upper
        ? checked_sub(info.liquidity_net, liquidity_delta)
        : checked_add(info.liquidity_net, liquidity_delta);

    return {flipped, gross_after};
}

I128 Pool::cross_tick(int32_t tick, const U256& fee_growth_global0_x128,
                      const U256& fee_growth_global1_x128) {
    TickInfo& info = ticks_[tick];
    info.fee_growth_outside0_x128 = fee_growth_global0_x128 - info.fee_growth_outside0_x128;
    info.fee_growth_outside1_x128 = fee_growth_global1_x128 - info.fee_growth_outside1_x128;
    return info.liquidity_net;
}

std::pair<U256, U256> Pool::fee_growth_inside(int32_t tick_lower, int32_t tick_upper) const {
    TickInfo lower = tick_info(tick_lower);
    TickInfo upper = tick_info(tick_upper);
    int32_t tick_current = slot0_.tick();

    // All subtraction wraps mod 2^256
    if (tick_current < tick_lower) {
        return {lower.fee_growth_outside0_x128 - upper.fee_growth_outside0_x128,
                lower.fee_growth_outside1_x128 - upper.fee_growth_outside1_x128};
    }
    if (tick_current >= tick_upper) {
        return {upper.fee_growth_outside0_x128 - lower.fee_growth_outside0_x128,
                upper.fee_growth_outside1_x128 - lower.fee_growth_outside1_x128};
    }
    return {fee_growth_global0_x128_ - lower.fee_growth_outside0_x128 - upper.fee_growth_outside0_x128,
            fee_growth_global1_x128_ - lower.fee_growth_outside1_x128 - upper.fee_growth_outside1_x128};
}

Pool::ModifyLiquidityResult Pool::modify_liquidity(const ModifyLiquidityInput& input) {
    check_ticks(input.tick_lower, input.tick_upper);
    if (input.tick_lower % input.tick_spacing != 0 || input.tick_upper % input.tick_spacing != 0) {
        fail(errors::TICK_MISALIGNED,
             "tick_lower=" + std::to_string(input.tick_lower) +
             " tick_upper=" + std::to_string(input.tick_upper) +
             " tick_spacing=" + std::to_string(input.tick_spacing));
    }

    const I128 liquidity_delta = input.liquidity_delta;
    TickUpdate lower{false, 0};
    TickUpdate upper{false, 0};

    if (liquidity_delta != 0) {
        lower = update_tick(input.tick_lower, liquidity_delta, false);
        upper = update_tick(input.tick_upper, liquidity_delta, true);

        if (liquidity_delta > 0) {
            U128 max_liquidity = tick_spacing_to_max_liquidity_per_tick(input.tick_spacing);
            if (lower.liquidity_gross_after > max_liquidity) {
                fail(errors::TICK_LIQUIDITY_OVERFLOW, "tick=" + std::to_string(input.tick_lower));
            }
            if (upper.liquidity_gross_after > max_liquidity) {
                fail(errors::TICK_LIQUIDITY_OVERFLOW, "tick=" + std::to_string(input.tick_upper));
            }
        }

        if (lower.flipped) tick_bitmap::flip_tick(tick_bitmap_, input.tick_lower, input.tick_spacing);
        if (upper.flipped) tick_bitmap::flip_tick(tick_bitmap_, input.tick_upper, input.tick_spacing);
    }

    ModifyLiquidityResult result;
    {
        auto [inside0, inside1] = fee_growth_inside(input.tick_lower, input.tick_upper);
        PositionKey key{input.owner, input.tick_lower, input.tick_upper, input.salt};
        FeesOwed owed = positions_[key].update(liquidity_delta, inside0, inside1);
        result.fees_accrued = BalanceDelta(to_i128(owed.amount0), to_i128(owed.amount1));
    }

    // Ticks with no remaining references carry no state
    if (liquidity_delta < 0) {
        if (lower.flipped) clear_tick(input.tick_lower);
        if (upper.flipped) clear_tick(input.tick_upper);
    }

    if (liquidity_delta != 0) {
        int32_t tick = slot0_.tick();
        U256 sqrt_price = slot0_.sqrt_price_x96();
        U256 sqrt_lower = tick_math::get_sqrt_price_at_tick(input.tick_lower);
        U256 sqrt_upper = tick_math::get_sqrt_price_at_tick(input.tick_upper);

        if (tick < input.tick_lower) {
            // Range above the price: only currency0
            result.principal = BalanceDelta(
                sqrt_price_math::get_amount0_delta(sqrt_lower, sqrt_upper, liquidity_delta), 0);
        } else if (tick < input.tick_upper) {
            result.principal = BalanceDelta(
                sqrt_price_math::get_amount0_delta(sqrt_price, sqrt_upper, liquidity_delta),
                sqrt_price_math::get_amount1_delta(sqrt_lower, sqrt_price, liquidity_delta));
            liquidity_ = liquidity_math::add_delta(liquidity_, liquidity_delta);
        } else {
            // Range below the price: only currency1
            result.principal = BalanceDelta(
                0, sqrt_price_math::get_amount1_delta(sqrt_lower, sqrt_upper, liquidity_delta));
        }
    }

    return result;
}

// =============================================================================
// Donate
// =============================================================================

BalanceDelta Pool::donate(U128 amount0, U128 amount1) {
    if (liquidity_ == 0) {
        fail(errors::NO_LIQUIDITY_TO_RECEIVE_FEES);
    }
    BalanceDelta delta(checked_neg(to_i128(amount0)), checked_neg(to_i128(amount1)));

    if (amount0 > 0) {
        fee_growth_global0_x128_ += full_math::mul_div_wrapping(to_u256(amount0), Q128, to_u256(liquidity_));
    }
    if (amount1 > 0) {
        fee_growth_global1_x128_ += full_math::mul_div_wrapping(to_u256(amount1), Q128, to_u256(liquidity_));
    }
    return delta;
}

// =============================================================================
// Queries
// =============================================================================

TickInfo Pool::tick_info(int32_t tick) const {
    auto it = ticks_.find(tick);
    return it == ticks_.end() ? TickInfo{} : it->second;
}

U256 Pool::bitmap_word(int16_t word) const {
    auto it = tick_bitmap_.find(word);
    return it == tick_bitmap_.end() ? U256(0) : it->second;
}

std::optional<PositionState> Pool::position(const PositionKey& key) const {
    auto it = positions_.find(key);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

} // namespace amm

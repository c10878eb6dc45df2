// =============================================================================
// position.cpp - Liquidity position fee accounting
// =============================================================================

#include "amm/position.hpp"
#include "amm/errors.hpp"
#include "amm/math.hpp"

namespace amm {

FeesOwed PositionState::update(I128 liquidity_delta,
                               const U256& fee_growth_inside0_x128,
                               const U256& fee_growth_inside1_x128) {
    if (liquidity_delta == 0 && liquidity == 0) {
        fail(errors::CANNOT_UPDATE_EMPTY_POSITION);
    }

    // Growth deltas wrap mod 2^256; fees beyond 128 bits are truncated
    FeesOwed owed;
    owed.amount0 = low_u128(full_math::mul_div(
        fee_growth_inside0_x128 - fee_growth_inside0_last_x128, to_u256(liquidity), Q128));
    owed.amount1 = low_u128(full_math::mul_div(
        fee_growth_inside1_x128 - fee_growth_inside1_last_x128, to_u256(liquidity), Q128));

    if (liquidity_delta != 0) {
        liquidity = liquidity_math::add_delta(liquidity, liquidity_delta);
    }
    fee_growth_inside0_last_x128 = fee_growth_inside0_x128;
    fee_growth_inside1_last_x128 = fee_growth_inside1_x128;
    return owed;
}

} // namespace amm

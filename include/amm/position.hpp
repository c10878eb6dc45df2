#ifndef AMM_POSITION_HPP
#define AMM_POSITION_HPP

#include <tuple>

#include "types.hpp"

namespace amm {

// =============================================================================
// Position Key
// =============================================================================

struct PositionKey {
    Address owner;
    int32_t tick_lower;
    int32_t tick_upper;
    uint64_t salt;           // Distinguishes positions of one owner over one range

    bool operator<(const PositionKey& other) const {
        return std::tie(owner, tick_lower, tick_upper, salt) <
               std::tie(other.owner, other.tick_lower, other.tick_upper, other.salt);
    }
    bool operator==(const PositionKey& other) const {
        return owner == other.owner && tick_lower == other.tick_lower &&
               tick_upper == other.tick_upper && salt == other.salt;
    }
};

// =============================================================================
// Position State
// =============================================================================

struct FeesOwed {
    U128 amount0;
    U128 amount1;
};

struct PositionState {
    U128 liquidity = 0;
    U256 fee_growth_inside0_last_x128{0};
    U256 fee_growth_inside1_last_x128{0};

    // Apply a liquidity change and snapshot fee growth.
    // Returns fees accrued since the last update, priced at the liquidity held
    // before this change. Zero delta on an empty position throws
    // CannotUpdateEmptyPosition.
    FeesOwed update(I128 liquidity_delta,
                    const U256& fee_growth_inside0_x128,
                    const U256& fee_growth_inside1_x128);
};

} // namespace amm

#endif // AMM_POSITION_HPP

#ifndef AMM_POOL_HPP
#define AMM_POOL_HPP

#include <map>
#include <optional>

#include "types.hpp"
#include "delta.hpp"
#include "slot0.hpp"
#include "position.hpp"
#include "tick_bitmap.hpp"

namespace amm {

// =============================================================================
// Tick Info
// =============================================================================

struct TickInfo {
    U128 liquidity_gross = 0;        // Total liquidity referencing this tick
    I128 liquidity_net = 0;          // Applied when crossed left to right
    U256 fee_growth_outside0_x128{0};
    U256 fee_growth_outside1_x128{0};
};

// =============================================================================
// Pool - Single Concentrated-Liquidity Pool State Machine
// =============================================================================
//
// Pure state transitions: no hooks, no ledger. Amounts in returned deltas
// follow the caller convention (negative = owed by the caller).

class Pool {
public:
    struct SwapInput {
        I128 amount_specified;       // < 0 exact input, > 0 exact output
        int32_t tick_spacing;
        bool zero_for_one;
        U256 sqrt_price_limit_x96;
        uint32_t lp_fee_override = 0;  // honoured only with OVERRIDE_FEE_FLAG set
    };

    struct SwapResult {
        BalanceDelta delta;
        U256 amount_to_protocol{0};  // Charged on the input currency
        uint32_t swap_fee = 0;       // Combined LP + protocol rate applied
        U256 sqrt_price_x96{0};
        int32_t tick = 0;
        U128 liquidity = 0;
    };

    struct ModifyLiquidityInput {
        Address owner;
        int32_t tick_lower;
        int32_t tick_upper;
        I128 liquidity_delta;
        int32_t tick_spacing;
        uint64_t salt;
    };

    struct ModifyLiquidityResult {
        BalanceDelta principal;      // Liquidity priced at the current sqrt price
        BalanceDelta fees_accrued;   // Always >= 0 per component
    };

    Pool() = default;

    // Sets the starting price and LP fee. Returns the starting tick.
    // Throws PoolAlreadyInitialized on a second call.
    int32_t initialize(const U256& sqrt_price_x96, uint32_t lp_fee);

    bool is_initialized() const { return slot0_.sqrt_price_x96() != 0; }
    void check_initialized() const;

    SwapResult swap(const SwapInput& input);

    ModifyLiquidityResult modify_liquidity(const ModifyLiquidityInput& input);

    // Distribute amounts to in-range liquidity. Throws NoLiquidityToReceiveFees.
    BalanceDelta donate(U128 amount0, U128 amount1);

    void set_protocol_fee(uint32_t protocol_fee);
    void set_lp_fee(uint32_t lp_fee);

    // =========================================================================
    // State Access
    // =========================================================================

    const Slot0& slot0() const { return slot0_; }
    U128 liquidity() const { return liquidity_; }
    const U256& fee_growth_global0_x128() const { return fee_growth_global0_x128_; }
    const U256& fee_growth_global1_x128() const { return fee_growth_global1_x128_; }

    TickInfo tick_info(int32_t tick) const;
    U256 bitmap_word(int16_t word) const;
    std::optional<PositionState> position(const PositionKey& key) const;

    // Fee growth per unit of liquidity accumulated inside [tick_lower, tick_upper)
    std::pair<U256, U256> fee_growth_inside(int32_t tick_lower, int32_t tick_upper) const;

    static void check_ticks(int32_t tick_lower, int32_t tick_upper);
    static U128 tick_spacing_to_max_liquidity_per_tick(int32_t tick_spacing);

private:
    struct TickUpdate {
        bool flipped;
        U128 liquidity_gross_after;
    };

    TickUpdate update_tick(int32_t tick, I128 liquidity_delta, bool upper);
    I128 cross_tick(int32_t tick, const U256& fee_growth_global0_x128,
                    const U256& fee_growth_global1_x128);
    void clear_tick(int32_t tick) { ticks_.erase(tick); }

    Slot0 slot0_;
    U256 fee_growth_global0_x128_{0};
    U256 fee_growth_global1_x128_{0};
    U128 liquidity_ = 0;
    std::map<int32_t, TickInfo> ticks_;
    TickBitmap tick_bitmap_;
    std::map<PositionKey, PositionState> positions_;
};

} // namespace amm

#endif // AMM_POOL_HPP

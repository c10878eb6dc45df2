#ifndef AMM_DELTA_HPP
#define AMM_DELTA_HPP

#include "types.hpp"

namespace amm {

// =============================================================================
// Balance Delta (two signed 128-bit amounts in one 256-bit word)
// =============================================================================
//
// Caller perspective: negative = owed to the engine, positive = owed to the
// caller. Packing puts amount0 in the high 128 bits and amount1 in the low
// 128 bits, both two's complement.

class BalanceDelta {
public:
    BalanceDelta() : amount0_(0), amount1_(0) {}
    BalanceDelta(I128 amount0, I128 amount1) : amount0_(amount0), amount1_(amount1) {}

    static BalanceDelta from_packed(const U256& packed);
    U256 packed() const;

    I128 amount0() const { return amount0_; }
    I128 amount1() const { return amount1_; }

    bool is_zero() const { return amount0_ == 0 && amount1_ == 0; }

    // Component-wise, throws SafeCastOverflow instead of wrapping
    BalanceDelta operator+(const BalanceDelta& other) const;
    BalanceDelta operator-(const BalanceDelta& other) const;

    bool operator==(const BalanceDelta& other) const {
        return amount0_ == other.amount0_ && amount1_ == other.amount1_;
    }
    bool operator!=(const BalanceDelta& other) const { return !(*this == other); }

private:
    I128 amount0_;
    I128 amount1_;
};

inline const BalanceDelta ZERO_DELTA{};

// =============================================================================
// Before-Swap Delta (hook adjustment to specified / unspecified currency)
// =============================================================================

class BeforeSwapDelta {
public:
    BeforeSwapDelta() : specified_(0), unspecified_(0) {}
    BeforeSwapDelta(I128 specified, I128 unspecified)
        : specified_(specified), unspecified_(unspecified) {}

    static BeforeSwapDelta from_packed(const U256& packed);
    U256 packed() const;

    I128 specified() const { return specified_; }
    I128 unspecified() const { return unspecified_; }

    bool operator==(const BeforeSwapDelta& other) const {
        return specified_ == other.specified_ && unspecified_ == other.unspecified_;
    }
    bool operator!=(const BeforeSwapDelta& other) const { return !(*this == other); }

private:
    I128 specified_;
    I128 unspecified_;
};

inline const BeforeSwapDelta ZERO_BEFORE_SWAP_DELTA{};

// Checked signed helpers shared by the ledger and the swap loop
I128 checked_add(I128 a, I128 b);
I128 checked_sub(I128 a, I128 b);
I128 checked_neg(I128 a);

} // namespace amm

#endif // AMM_DELTA_HPP

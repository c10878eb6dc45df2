#ifndef AMM_SLOT0_HPP
#define AMM_SLOT0_HPP

#include "types.hpp"

namespace amm {

// =============================================================================
// Slot0 - Packed Top-of-Book
// =============================================================================
//
// Layout, low bits first:
//   [0, 160)   sqrt_price_x96
//   [160, 184) tick (int24, two's complement)
//   [184, 196) protocol fee zero-for-one
//   [196, 208) protocol fee one-for-zero
//   [208, 232) lp fee

class Slot0 {
public:
    Slot0() = default;

    static Slot0 from_packed(const U256& packed) { return Slot0(packed); }
    const U256& packed() const { return packed_; }

    U256 sqrt_price_x96() const;
    int32_t tick() const;
    uint32_t protocol_fee() const;   // both 12-bit halves
    uint32_t lp_fee() const;

    // Setters return a new word; out-of-width values throw SafeCastOverflow
    Slot0 with_sqrt_price_x96(const U256& sqrt_price) const;
    Slot0 with_tick(int32_t tick) const;
    Slot0 with_protocol_fee(uint32_t fee) const;
    Slot0 with_lp_fee(uint32_t fee) const;

    bool operator==(const Slot0& other) const { return packed_ == other.packed_; }
    bool operator!=(const Slot0& other) const { return packed_ != other.packed_; }

private:
    explicit Slot0(const U256& packed) : packed_(packed) {}

    U256 packed_{0};
};

} // namespace amm

#endif // AMM_SLOT0_HPP

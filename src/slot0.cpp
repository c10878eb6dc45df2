// =============================================================================
// slot0.cpp - Packed top-of-book accessors
// =============================================================================

#include "amm/slot0.hpp"
#include "amm/errors.hpp"

namespace amm {

namespace {

constexpr unsigned TICK_OFFSET = 160;
constexpr unsigned PROTOCOL_FEE_OFFSET = 184;
constexpr unsigned LP_FEE_OFFSET = 208;

const U256& mask_bits(unsigned width) {
    static const U256 mask24 = (U256(1) << 24) - 1;
    static const U256 mask160 = (U256(1) << 160) - 1;
    return width == 24 ? mask24 : mask160;
}

U256 replace_field(const U256& word, unsigned offset, unsigned width, const U256& value) {
    const U256& mask = mask_bits(width);
    return (word & ~(mask << offset)) | ((value & mask) << offset);
}

uint32_t read_u24(const U256& word, unsigned offset) {
    return static_cast<uint32_t>((word >> offset) & mask_bits(24));
}

} // anonymous namespace

U256 Slot0::sqrt_price_x96() const {
    return packed_ & mask_bits(160);
}

int32_t Slot0::tick() const {
    uint32_t raw = read_u24(packed_, TICK_OFFSET);
    // Sign-extend from 24 bits
    if (raw & 0x800000u) raw |= 0xFF000000u;
    return static_cast<int32_t>(raw);
}

uint32_t Slot0::protocol_fee() const {
    return read_u24(packed_, PROTOCOL_FEE_OFFSET);
}

uint32_t Slot0::lp_fee() const {
    return read_u24(packed_, LP_FEE_OFFSET);
}

Slot0 Slot0::with_sqrt_price_x96(const U256& sqrt_price) const {
    if (sqrt_price > mask_bits(160)) {
        fail(errors::SAFE_CAST_OVERFLOW, "sqrt_price=" + to_string(sqrt_price));
    }
    return Slot0(replace_field(packed_, 0, 160, sqrt_price));
}

Slot0 Slot0::with_tick(int32_t tick) const {
    if (tick < -(1 << 23) || tick >= (1 << 23)) {
        fail(errors::SAFE_CAST_OVERFLOW, "tick=" + std::to_string(tick));
    }
    uint32_t raw = static_cast<uint32_t>(tick) & 0xFFFFFFu;
    return Slot0(replace_field(packed_, TICK_OFFSET, 24, U256(raw)));
}

Slot0 Slot0::with_protocol_fee(uint32_t fee) const {
    if (fee > 0xFFFFFFu) {
        fail(errors::SAFE_CAST_OVERFLOW, "protocol_fee=" + std::to_string(fee));
    }
    return Slot0(replace_field(packed_, PROTOCOL_FEE_OFFSET, 24, U256(fee)));
}

Slot0 Slot0::with_lp_fee(uint32_t fee) const {
    if (fee > 0xFFFFFFu) {
        fail(errors::SAFE_CAST_OVERFLOW, "lp_fee=" + std::to_string(fee));
    }
    return Slot0(replace_field(packed_, LP_FEE_OFFSET, 24, U256(fee)));
}

} // namespace amm

// =============================================================================
// delta.cpp - Packed delta value types
// =============================================================================

#include "amm/delta.hpp"
#include "amm/errors.hpp"

namespace amm {

namespace {

U256 pack_pair(I128 high, I128 low) {
    return (to_u256(static_cast<U128>(high)) << 128) | to_u256(static_cast<U128>(low));
}

I128 unpack_high(const U256& packed) {
    return static_cast<I128>(low_u128(packed >> 128));
}

I128 unpack_low(const U256& packed) {
    return static_cast<I128>(low_u128(packed));
}

} // anonymous namespace

I128 checked_add(I128 a, I128 b) {
    I128 r;
    if (__builtin_add_overflow(a, b, &r)) {
        fail(errors::SAFE_CAST_OVERFLOW, to_string(a) + " + " + to_string(b));
    }
    return r;
}

I128 checked_sub(I128 a, I128 b) {
    I128 r;
    if (__builtin_sub_overflow(a, b, &r)) {
        fail(errors::SAFE_CAST_OVERFLOW, to_string(a) + " - " + to_string(b));
    }
    return r;
}

I128 checked_neg(I128 a) {
    return checked_sub(0, a);
}

// =============================================================================
// BalanceDelta
// =============================================================================

BalanceDelta BalanceDelta::from_packed(const U256& packed) {
    return {unpack_high(packed), unpack_low(packed)};
}

U256 BalanceDelta::packed() const {
    return pack_pair(amount0_, amount1_);
}

BalanceDelta BalanceDelta::operator+(const BalanceDelta& other) const {
    return {checked_add(amount0_, other.amount0_), checked_add(amount1_, other.amount1_)};
}

BalanceDelta BalanceDelta::operator-(const BalanceDelta& other) const {
    return {checked_sub(amount0_, other.amount0_), checked_sub(amount1_, other.amount1_)};
}

// =============================================================================
// BeforeSwapDelta
// =============================================================================

BeforeSwapDelta BeforeSwapDelta::from_packed(const U256& packed) {
    return {unpack_high(packed), unpack_low(packed)};
}

U256 BeforeSwapDelta::packed() const {
    return pack_pair(specified_, unspecified_);
}

} // namespace amm

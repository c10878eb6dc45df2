#ifndef AMM_TICK_BITMAP_HPP
#define AMM_TICK_BITMAP_HPP

#include <map>
#include <utility>

#include "types.hpp"

namespace amm {

// =============================================================================
// Tick Bitmap
// =============================================================================
//
// One bit per compressed tick (tick / tick_spacing, floored). Bits are grouped
// into 256-bit words keyed by compressed >> 8.

using TickBitmap = std::map<int16_t, U256>;

namespace tick_bitmap {

// Floor division toward negative infinity
int32_t compress(int32_t tick, int32_t tick_spacing);

// (word index, bit index) of a compressed tick
std::pair<int16_t, uint8_t> position(int32_t compressed);

// Toggle the bit for `tick`. Throws TickMisaligned if tick % tick_spacing != 0.
void flip_tick(TickBitmap& bitmap, int32_t tick, int32_t tick_spacing);

bool is_initialized(const TickBitmap& bitmap, int32_t tick, int32_t tick_spacing);

// Next initialized tick in the same word as `tick`, searching left (lte) or
// right. Returns (tick, initialized); when nothing is set the word boundary
// is returned with initialized = false.
std::pair<int32_t, bool> next_initialized_tick_within_one_word(
    const TickBitmap& bitmap, int32_t tick, int32_t tick_spacing, bool lte);

} // namespace tick_bitmap

} // namespace amm

#endif // AMM_TICK_BITMAP_HPP

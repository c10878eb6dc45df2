// =============================================================================
// tick_bitmap.cpp - Packed initialized-tick index
// =============================================================================

#include "amm/tick_bitmap.hpp"
#include "amm/errors.hpp"

namespace amm {
namespace tick_bitmap {

namespace {

U256 word_at(const TickBitmap& bitmap, int16_t word) {
    auto it = bitmap.find(word);
    return it == bitmap.end() ? U256(0) : it->second;
}

} // anonymous namespace

int32_t compress(int32_t tick, int32_t tick_spacing) {
    int32_t compressed = tick / tick_spacing;
    if (tick < 0 && tick % tick_spacing != 0) --compressed;
    return compressed;
}

std::pair<int16_t, uint8_t> position(int32_t compressed) {
    // Arithmetic shift: negative ticks land in negative words
    int16_t word = static_cast<int16_t>(compressed >> 8);
    uint8_t bit = static_cast<uint8_t>(compressed & 0xFF);
    return {word, bit};
}

void flip_tick(TickBitmap& bitmap, int32_t tick, int32_t tick_spacing) {
    if (tick % tick_spacing != 0) {
        fail(errors::TICK_MISALIGNED,
             "tick=" + std::to_string(tick) + " tick_spacing=" + std::to_string(tick_spacing));
    }
    auto [word, bit] = position(tick / tick_spacing);
    U256& value = bitmap[word];
    value ^= U256(1) << bit;
    if (value == 0) bitmap.erase(word);
}

bool is_initialized(const TickBitmap& bitmap, int32_t tick, int32_t tick_spacing) {
    if (tick % tick_spacing != 0) return false;
    auto [word, bit] = position(tick / tick_spacing);
    return ((word_at(bitmap, word) >> bit) & 1) != 0;
}

std::pair<int32_t, bool> next_initialized_tick_within_one_word(
    const TickBitmap& bitmap, int32_t tick, int32_t tick_spacing, bool lte) {
    using boost::multiprecision::lsb;
    using boost::multiprecision::msb;

    int32_t compressed = compress(tick, tick_spacing);

    if (lte) {
        auto [word, bit] = position(compressed);
        // All bits at or to the right of the current bit
        U256 mask = (U256(1) << bit) - 1 + (U256(1) << bit);
        U256 masked = word_at(bitmap, word) & mask;

        bool initialized = masked != 0;
        int32_t next = initialized
            ? (compressed - static_cast<int32_t>(bit - msb(masked))) * tick_spacing
            : (compressed - static_cast<int32_t>(bit)) * tick_spacing;
        return {next, initialized};
    }

    // Start from the next compressed tick; the current one is not eligible
    auto [word, bit] = position(compressed + 1);
    U256 mask = ~((U256(1) << bit) - 1);
    U256 masked = word_at(bitmap, word) & mask;

    bool initialized = masked != 0;
    int32_t next = initialized
        ? (compressed + 1 + static_cast<int32_t>(lsb(masked) - bit)) * tick_spacing
        : (compressed + 1 + static_cast<int32_t>(255 - bit)) * tick_spacing;
    return {next, initialized};
}

} // namespace tick_bitmap
} // namespace amm

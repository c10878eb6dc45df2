#ifndef AMM_TYPES_HPP
#define AMM_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <functional>

#include <boost/multiprecision/cpp_int.hpp>

namespace amm {

// =============================================================================
// Integer Types
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// Fixed-width modular integers: arithmetic wraps mod 2^N
using U256 = boost::multiprecision::uint256_t;
using U512 = boost::multiprecision::uint512_t;

constexpr I128 I128_MAX = static_cast<I128>(~U128(0) >> 1);
constexpr I128 I128_MIN = -I128_MAX - 1;
constexpr U128 U128_MAX = ~U128(0);

// Widen a 128-bit value without going through boost's int128 overloads
inline U256 to_u256(U128 v) {
    return (U256(static_cast<uint64_t>(v >> 64)) << 64) | U256(static_cast<uint64_t>(v));
}

// Low 128 bits
inline U128 low_u128(const U256& v) {
    const U256 mask64(UINT64_MAX);
    U128 lo = static_cast<uint64_t>(v & mask64);
    U128 hi = static_cast<uint64_t>((v >> 64) & mask64);
    return (hi << 64) | lo;
}

// Checked narrowing, throws SafeCastOverflow
U128 to_u128(const U256& v);
I128 to_i128(const U256& v);
I128 to_i128(U128 v);

std::string to_string(I128 v);
std::string to_string(U128 v);
std::string to_string(const U256& v);

// =============================================================================
// Addresses
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Bytes = std::vector<uint8_t>;

inline bool is_zero_address(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// Parse "0x"-prefixed or bare hex, right-aligned into 20 bytes
Address address_from_hex(const std::string& hex);
std::string to_hex(const Address& a);

// Address whose low 8 bytes hold `v` (handy for fixtures)
Address address_from_u64(uint64_t v);

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_native() const { return is_zero_address(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
    bool operator>=(const Currency& other) const { return !(addr < other.addr); }
};

// Native asset (address(0))
inline const Currency NATIVE{};

struct AddressHash {
    size_t operator()(const Address& a) const {
        uint64_t h = 0;
        for (uint8_t b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

struct CurrencyHash {
    size_t operator()(const Currency& c) const { return AddressHash{}(c.addr); }
};

// =============================================================================
// Pool Identity
// =============================================================================

struct PoolId {
    std::array<uint8_t, 32> bytes{};

    bool operator==(const PoolId& other) const { return bytes == other.bytes; }
    bool operator!=(const PoolId& other) const { return bytes != other.bytes; }
    bool operator<(const PoolId& other) const { return bytes < other.bytes; }

    std::string to_hex() const;
};

struct PoolIdHash {
    size_t operator()(const PoolId& id) const {
        uint64_t h = 0;
        for (size_t i = 0; i < 8; ++i) h = (h << 8) | id.bytes[i];
        return static_cast<size_t>(h);
    }
};

struct PoolKey {
    Currency currency0;      // Sorted: currency0 < currency1
    Currency currency1;
    uint32_t fee;            // LP fee in pips, or lp_fee::DYNAMIC_FEE_FLAG
    int32_t tick_spacing;
    Address hooks;           // Hook address (0 = no hooks)

    // SHA-256 over five 32-byte big-endian words
    PoolId to_id() const;

    bool operator==(const PoolKey& other) const {
        return currency0 == other.currency0 &&
               currency1 == other.currency1 &&
               fee == other.fee &&
               tick_spacing == other.tick_spacing &&
               hooks == other.hooks;
    }
    bool operator!=(const PoolKey& other) const { return !(*this == other); }
};

// Tick spacing bounds
namespace tick_spacings {
constexpr int32_t MIN_TICK_SPACING = 1;
constexpr int32_t MAX_TICK_SPACING = 16383;
}

// =============================================================================
// Operation Parameters
// =============================================================================

struct SwapParams {
    bool zero_for_one;        // true = sell currency0 for currency1
    I128 amount_specified;    // negative = exact input, positive = exact output
    U256 sqrt_price_limit_x96;
};

struct ModifyLiquidityParams {
    int32_t tick_lower;
    int32_t tick_upper;
    I128 liquidity_delta;     // positive = add, negative = remove, 0 = poke
    uint64_t salt;            // For multiple positions at same range
};

} // namespace amm

namespace std {
template <>
struct hash<amm::PoolId> {
    size_t operator()(const amm::PoolId& id) const { return amm::PoolIdHash{}(id); }
};
template <>
struct hash<amm::Currency> {
    size_t operator()(const amm::Currency& c) const { return amm::CurrencyHash{}(c); }
};
} // namespace std

#endif // AMM_TYPES_HPP

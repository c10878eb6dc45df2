// =============================================================================
// types.cpp - Integer helpers, addresses and pool identity
// =============================================================================

#include "amm/types.hpp"
#include "amm/errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>

namespace amm {

// =============================================================================
// Checked Narrowing
// =============================================================================

U128 to_u128(const U256& v) {
    if (v > to_u256(U128_MAX)) {
        fail(errors::SAFE_CAST_OVERFLOW, "value=" + to_string(v));
    }
    return low_u128(v);
}

I128 to_i128(const U256& v) {
    if (v > to_u256(static_cast<U128>(I128_MAX))) {
        fail(errors::SAFE_CAST_OVERFLOW, "value=" + to_string(v));
    }
    return static_cast<I128>(low_u128(v));
}

I128 to_i128(U128 v) {
    if (v > static_cast<U128>(I128_MAX)) {
        fail(errors::SAFE_CAST_OVERFLOW, "value=" + to_string(v));
    }
    return static_cast<I128>(v);
}

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string s;
    while (v != 0) {
        s.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(s.begin(), s.end());
    return s;
}

std::string to_string(I128 v) {
    if (v >= 0) return to_string(static_cast<U128>(v));
    // Magnitude via unsigned negation so I128_MIN is representable
    U128 mag = U128(0) - static_cast<U128>(v);
    return "-" + to_string(mag);
}

std::string to_string(const U256& v) {
    return v.str();
}

// =============================================================================
// Addresses
// =============================================================================

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

constexpr char HEX_DIGITS[] = "0123456789abcdef";

template <size_t N>
std::string bytes_to_hex(const std::array<uint8_t, N>& bytes) {
    std::string s = "0x";
    s.reserve(2 + N * 2);
    for (uint8_t b : bytes) {
        s.push_back(HEX_DIGITS[b >> 4]);
        s.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return s;
}

// Left-pad an address into a 32-byte big-endian word
void put_address_word(uint8_t* out, const Address& a) {
    std::fill(out, out + 12, 0);
    std::copy(a.begin(), a.end(), out + 12);
}

void put_int_word(uint8_t* out, int64_t v) {
    uint8_t fill = v < 0 ? 0xFF : 0x00;
    std::fill(out, out + 24, fill);
    uint64_t u = static_cast<uint64_t>(v);
    for (int i = 0; i < 8; ++i) {
        out[31 - i] = static_cast<uint8_t>(u >> (8 * i));
    }
}

} // anonymous namespace

Address address_from_hex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.size() > 40) {
        throw std::invalid_argument("address too long: " + hex);
    }
    if (digits.size() % 2 != 0) digits.insert(digits.begin(), '0');

    Address addr{};
    size_t offset = 20 - digits.size() / 2;
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = hex_value(digits[i]);
        int lo = hex_value(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex address: " + hex);
        }
        addr[offset + i / 2] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& a) {
    return bytes_to_hex(a);
}

Address address_from_u64(uint64_t v) {
    Address addr{};
    for (int i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>(v >> (8 * i));
    }
    return addr;
}

// =============================================================================
// Pool Identity
// =============================================================================

std::string PoolId::to_hex() const {
    return bytes_to_hex(bytes);
}

PoolId PoolKey::to_id() const {
    std::array<uint8_t, 160> encoded{};
    put_address_word(encoded.data(), currency0.addr);
    put_address_word(encoded.data() + 32, currency1.addr);
    put_int_word(encoded.data() + 64, static_cast<int64_t>(fee));
    put_int_word(encoded.data() + 96, static_cast<int64_t>(tick_spacing));
    put_address_word(encoded.data() + 128, hooks);

    PoolId id;
    unsigned int len = 0;
    if (EVP_Digest(encoded.data(), encoded.size(), id.bytes.data(), &len,
                   EVP_sha256(), nullptr) != 1 || len != id.bytes.size()) {
        throw std::runtime_error("PoolKey: SHA-256 digest failed");
    }
    return id;
}

} // namespace amm

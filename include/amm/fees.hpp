#ifndef AMM_FEES_HPP
#define AMM_FEES_HPP

#include <cstdint>
#include <string>

#include "errors.hpp"

namespace amm {

// =============================================================================
// LP Fee (pips, 1e6 = 100%)
// =============================================================================

namespace lp_fee {

constexpr uint32_t MAX_LP_FEE = 1000000;
constexpr uint32_t DYNAMIC_FEE_FLAG = 0x800000;   // PoolKey.fee sentinel
constexpr uint32_t OVERRIDE_FEE_FLAG = 0x400000;  // set on a before-swap override
constexpr uint32_t REMOVE_OVERRIDE_MASK = 0xBFFFFF;

inline bool is_dynamic(uint32_t fee) { return fee == DYNAMIC_FEE_FLAG; }

inline bool is_valid(uint32_t fee) { return fee <= MAX_LP_FEE; }

inline void validate(uint32_t fee) {
    if (!is_valid(fee)) {
        fail(errors::LP_FEE_TOO_LARGE, "fee=" + std::to_string(fee));
    }
}

// Dynamic pools start at 0 until their hook sets a fee
inline uint32_t initial_fee(uint32_t key_fee) {
    if (is_dynamic(key_fee)) return 0;
    validate(key_fee);
    return key_fee;
}

inline bool is_override(uint32_t fee) { return (fee & OVERRIDE_FEE_FLAG) != 0; }

inline uint32_t remove_override_flag_and_validate(uint32_t fee) {
    uint32_t stripped = fee & REMOVE_OVERRIDE_MASK;
    validate(stripped);
    return stripped;
}

} // namespace lp_fee

// =============================================================================
// Protocol Fee (two 12-bit directional rates packed in 24 bits)
// =============================================================================

namespace protocol_fee {

constexpr uint32_t MAX_PROTOCOL_FEE = 1000;       // 0.1%
constexpr uint32_t PIPS_DENOMINATOR = 1000000;

inline uint32_t zero_for_one(uint32_t fee) { return fee & 0xFFF; }
inline uint32_t one_for_zero(uint32_t fee) { return (fee >> 12) & 0xFFF; }

inline uint32_t pack(uint32_t zero_for_one_fee, uint32_t one_for_zero_fee) {
    return (zero_for_one_fee & 0xFFF) | ((one_for_zero_fee & 0xFFF) << 12);
}

inline bool is_valid(uint32_t fee) {
    return fee <= 0xFFFFFF &&
           zero_for_one(fee) <= MAX_PROTOCOL_FEE &&
           one_for_zero(fee) <= MAX_PROTOCOL_FEE;
}

// Combined rate: protocol fee first, LP fee on the remainder
inline uint32_t calculate_swap_fee(uint32_t protocol, uint32_t lp) {
    uint64_t numerator = static_cast<uint64_t>(protocol) * lp;
    return static_cast<uint32_t>(protocol + lp - numerator / PIPS_DENOMINATOR);
}

} // namespace protocol_fee

} // namespace amm

#endif // AMM_FEES_HPP

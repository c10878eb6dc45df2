#ifndef AMM_HOOKS_HPP
#define AMM_HOOKS_HPP

#include <unordered_map>
#include <utility>

#include "types.hpp"
#include "delta.hpp"
#include "session.hpp"

namespace amm {

// =============================================================================
// Hook Permission Flags (low 14 bits of the hook address)
// =============================================================================

namespace hooks {

constexpr uint32_t BEFORE_INITIALIZE_FLAG = 1u << 13;
constexpr uint32_t AFTER_INITIALIZE_FLAG = 1u << 12;
constexpr uint32_t BEFORE_ADD_LIQUIDITY_FLAG = 1u << 11;
constexpr uint32_t AFTER_ADD_LIQUIDITY_FLAG = 1u << 10;
constexpr uint32_t BEFORE_REMOVE_LIQUIDITY_FLAG = 1u << 9;
constexpr uint32_t AFTER_REMOVE_LIQUIDITY_FLAG = 1u << 8;
constexpr uint32_t BEFORE_SWAP_FLAG = 1u << 7;
constexpr uint32_t AFTER_SWAP_FLAG = 1u << 6;
constexpr uint32_t BEFORE_DONATE_FLAG = 1u << 5;
constexpr uint32_t AFTER_DONATE_FLAG = 1u << 4;
constexpr uint32_t BEFORE_SWAP_RETURNS_DELTA_FLAG = 1u << 3;
constexpr uint32_t AFTER_SWAP_RETURNS_DELTA_FLAG = 1u << 2;
constexpr uint32_t AFTER_ADD_LIQUIDITY_RETURNS_DELTA_FLAG = 1u << 1;
constexpr uint32_t AFTER_REMOVE_LIQUIDITY_RETURNS_DELTA_FLAG = 1u << 0;

constexpr uint32_t ALL_HOOK_MASK = (1u << 14) - 1;

// Flag bits encoded in an address
inline uint32_t flags_of(const Address& hook_address) {
    return ((static_cast<uint32_t>(hook_address[18]) << 8) | hook_address[19]) & ALL_HOOK_MASK;
}

inline bool has_permission(const Address& hook_address, uint32_t flag) {
    return (flags_of(hook_address) & flag) != 0;
}

// Structural rules on an address/fee pair, independent of registration
bool is_valid_hook_address(const Address& hook_address, uint32_t fee);

// Replace the low 14 bits of `base` with `flags`
Address with_flags(Address base, uint32_t flags);

} // namespace hooks

struct HookPermissions {
    bool before_initialize = false;
    bool after_initialize = false;
    bool before_add_liquidity = false;
    bool after_add_liquidity = false;
    bool before_remove_liquidity = false;
    bool after_remove_liquidity = false;
    bool before_swap = false;
    bool after_swap = false;
    bool before_donate = false;
    bool after_donate = false;
    bool before_swap_returns_delta = false;
    bool after_swap_returns_delta = false;
    bool after_add_liquidity_returns_delta = false;
    bool after_remove_liquidity_returns_delta = false;

    uint32_t to_flags() const;
    static HookPermissions from_flags(uint32_t flags);
};

// =============================================================================
// Hook Callbacks
// =============================================================================

// Acknowledgement each callback must return: the tag of the callback itself
enum class HookAck : uint8_t {
    None = 0,
    BeforeInitialize,
    AfterInitialize,
    BeforeAddLiquidity,
    AfterAddLiquidity,
    BeforeRemoveLiquidity,
    AfterRemoveLiquidity,
    BeforeSwap,
    AfterSwap,
    BeforeDonate,
    AfterDonate,
};

const char* to_string(HookAck ack);

struct AfterModifyLiquidityResult {
    HookAck ack = HookAck::None;
    BalanceDelta delta;               // Read only with the returns-delta flag
};

struct BeforeSwapResult {
    HookAck ack = HookAck::None;
    BeforeSwapDelta delta;            // Read only with the returns-delta flag
    uint32_t lp_fee_override = 0;     // Read only on dynamic-fee pools
};

struct AfterSwapResult {
    HookAck ack = HookAck::None;
    I128 unspecified_delta = 0;       // Read only with the returns-delta flag
};

// Extension interface. Every callback is optional: the defaults throw
// HookNotImplemented, so only callbacks a hook declares get called.
// `session` acts as the hook while a callback runs; `sender` is the
// identity that triggered the operation.
class IHooks {
public:
    virtual ~IHooks() = default;

    // Self-declared capabilities, checked against the address at registration
    virtual HookPermissions get_hook_permissions() const = 0;

    virtual HookAck before_initialize(Session& session, const Address& sender, const PoolKey& key,
                                      const U256& sqrt_price_x96);
    virtual HookAck after_initialize(Session& session, const Address& sender, const PoolKey& key,
                                     const U256& sqrt_price_x96, int32_t tick);

    virtual HookAck before_add_liquidity(Session& session, const Address& sender, const PoolKey& key,
                                         const ModifyLiquidityParams& params, const Bytes& hook_data);
    virtual AfterModifyLiquidityResult after_add_liquidity(
        Session& session, const Address& sender, const PoolKey& key,
        const ModifyLiquidityParams& params, const BalanceDelta& delta,
        const BalanceDelta& fees_accrued, const Bytes& hook_data);

    virtual HookAck before_remove_liquidity(Session& session, const Address& sender, const PoolKey& key,
                                            const ModifyLiquidityParams& params, const Bytes& hook_data);
    virtual AfterModifyLiquidityResult after_remove_liquidity(
        Session& session, const Address& sender, const PoolKey& key,
        const ModifyLiquidityParams& params, const BalanceDelta& delta,
        const BalanceDelta& fees_accrued, const Bytes& hook_data);

    virtual BeforeSwapResult before_swap(Session& session, const Address& sender, const PoolKey& key,
                                         const SwapParams& params, const Bytes& hook_data);
    virtual AfterSwapResult after_swap(Session& session, const Address& sender, const PoolKey& key,
                                       const SwapParams& params, const BalanceDelta& delta,
                                       const Bytes& hook_data);

    virtual HookAck before_donate(Session& session, const Address& sender, const PoolKey& key,
                                  U128 amount0, U128 amount1, const Bytes& hook_data);
    virtual HookAck after_donate(Session& session, const Address& sender, const PoolKey& key,
                                 U128 amount0, U128 amount1, const Bytes& hook_data);
};

// =============================================================================
// Hook Registry and Dispatch
// =============================================================================

struct HookRegistration {
    Address address;
    IHooks* hooks;           // Not owned
    uint32_t flags;          // Capability set, equal to the address bits
};

class HookRegistry {
public:
    // Throws HookAddressNotValid if the declared permissions differ from the
    // address bits, or the address is zero / hooks is null
    void register_hooks(const Address& hook_address, IHooks* hooks);
    void unregister_hooks(const Address& hook_address);

    const HookRegistration* find(const Address& hook_address) const;

    // Pool-creation checks: structural validity, then registration
    void validate_pool_hooks(const PoolKey& key) const;

    // =========================================================================
    // Dispatch (no-ops when the flag is clear or the hook is the caller)
    // =========================================================================

    void before_initialize(Session& session, const PoolKey& key, const U256& sqrt_price_x96) const;
    void after_initialize(Session& session, const PoolKey& key, const U256& sqrt_price_x96,
                          int32_t tick) const;

    void before_modify_liquidity(Session& session, const PoolKey& key,
                                 const ModifyLiquidityParams& params, const Bytes& hook_data) const;

    // Returns (caller delta, hook delta)
    std::pair<BalanceDelta, BalanceDelta> after_modify_liquidity(
        Session& session, const PoolKey& key, const ModifyLiquidityParams& params,
        const BalanceDelta& delta, const BalanceDelta& fees_accrued, const Bytes& hook_data) const;

    struct BeforeSwapOutcome {
        I128 amount_to_swap;
        BeforeSwapDelta hook_return;
        uint32_t lp_fee_override;
    };
    BeforeSwapOutcome before_swap(Session& session, const PoolKey& key, const SwapParams& params,
                                  const Bytes& hook_data) const;

    // Returns (caller delta, hook delta)
    std::pair<BalanceDelta, BalanceDelta> after_swap(
        Session& session, const PoolKey& key, const SwapParams& params,
        const BalanceDelta& swap_delta, const Bytes& hook_data,
        const BeforeSwapDelta& before_swap_delta) const;

    void before_donate(Session& session, const PoolKey& key, U128 amount0, U128 amount1,
                       const Bytes& hook_data) const;
    void after_donate(Session& session, const PoolKey& key, U128 amount0, U128 amount1,
                      const Bytes& hook_data) const;

    size_t size() const { return registrations_.size(); }

private:
    // Registration to call for `key`, or nullptr when the caller is the hook
    // itself or there is no hook
    const HookRegistration* dispatch_target(const Session& session, const PoolKey& key) const;

    std::unordered_map<Address, HookRegistration, AddressHash> registrations_;
};

} // namespace amm

#endif // AMM_HOOKS_HPP

// =============================================================================
// hooks.cpp - Extension permissions, registration and dispatch
// =============================================================================

#include "amm/hooks.hpp"
#include "amm/errors.hpp"
#include "amm/fees.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace amm {

// =============================================================================
// Permission Flags
// =============================================================================

namespace hooks {

bool is_valid_hook_address(const Address& hook_address, uint32_t fee) {
    // A delta-returning callback is useless without its base callback
    if (!has_permission(hook_address, BEFORE_SWAP_FLAG) &&
        has_permission(hook_address, BEFORE_SWAP_RETURNS_DELTA_FLAG)) return false;
    if (!has_permission(hook_address, AFTER_SWAP_FLAG) &&
        has_permission(hook_address, AFTER_SWAP_RETURNS_DELTA_FLAG)) return false;
    if (!has_permission(hook_address, AFTER_ADD_LIQUIDITY_FLAG) &&
        has_permission(hook_address, AFTER_ADD_LIQUIDITY_RETURNS_DELTA_FLAG)) return false;
    if (!has_permission(hook_address, AFTER_REMOVE_LIQUIDITY_FLAG) &&
        has_permission(hook_address, AFTER_REMOVE_LIQUIDITY_RETURNS_DELTA_FLAG)) return false;

    if (is_zero_address(hook_address)) return !lp_fee::is_dynamic(fee);
    return flags_of(hook_address) != 0 || lp_fee::is_dynamic(fee);
}

Address with_flags(Address base, uint32_t flags) {
    flags &= ALL_HOOK_MASK;
    base[18] = static_cast<uint8_t>((base[18] & 0xC0) | (flags >> 8));
    base[19] = static_cast<uint8_t>(flags & 0xFF);
    return base;
}

} // namespace hooks

uint32_t HookPermissions::to_flags() const {
    using namespace hooks;
    uint32_t flags = 0;
    if (before_initialize) flags |= BEFORE_INITIALIZE_FLAG;
    if (after_initialize) flags |= AFTER_INITIALIZE_FLAG;
    if (before_add_liquidity) flags |= BEFORE_ADD_LIQUIDITY_FLAG;
    if (after_add_liquidity) flags |= AFTER_ADD_LIQUIDITY_FLAG;
    if (before_remove_liquidity) flags |= BEFORE_REMOVE_LIQUIDITY_FLAG;
    if (after_remove_liquidity) flags |= AFTER_REMOVE_LIQUIDITY_FLAG;
    if (before_swap) flags |= BEFORE_SWAP_FLAG;
    if (after_swap) flags |= AFTER_SWAP_FLAG;
    if (before_donate) flags |= BEFORE_DONATE_FLAG;
    if (after_donate) flags |= AFTER_DONATE_FLAG;
    if (before_swap_returns_delta) flags |= BEFORE_SWAP_RETURNS_DELTA_FLAG;
    if (after_swap_returns_delta) flags |= AFTER_SWAP_RETURNS_DELTA_FLAG;
    if (after_add_liquidity_returns_delta) flags |= AFTER_ADD_LIQUIDITY_RETURNS_DELTA_FLAG;
    if (after_remove_liquidity_returns_delta) flags |= AFTER_REMOVE_LIQUIDITY_RETURNS_DELTA_FLAG;
    return flags;
}

HookPermissions HookPermissions::from_flags(uint32_t flags) {
    using namespace hooks;
    HookPermissions p;
    p.before_initialize = (flags & BEFORE_INITIALIZE_FLAG) != 0;
    p.after_initialize = (flags & AFTER_INITIALIZE_FLAG) != 0;
    p.before_add_liquidity = (flags & BEFORE_ADD_LIQUIDITY_FLAG) != 0;
    p.after_add_liquidity = (flags & AFTER_ADD_LIQUIDITY_FLAG) != 0;
    p.before_remove_liquidity = (flags & BEFORE_REMOVE_LIQUIDITY_FLAG) != 0;
    p.after_remove_liquidity = (flags & AFTER_REMOVE_LIQUIDITY_FLAG) != 0;
    p.before_swap = (flags & BEFORE_SWAP_FLAG) != 0;
    p.after_swap = (flags & AFTER_SWAP_FLAG) != 0;
    p.before_donate = (flags & BEFORE_DONATE_FLAG) != 0;
    p.after_donate = (flags & AFTER_DONATE_FLAG) != 0;
    p.before_swap_returns_delta = (flags & BEFORE_SWAP_RETURNS_DELTA_FLAG) != 0;
    p.after_swap_returns_delta = (flags & AFTER_SWAP_RETURNS_DELTA_FLAG) != 0;
    p.after_add_liquidity_returns_delta = (flags & AFTER_ADD_LIQUIDITY_RETURNS_DELTA_FLAG) != 0;
    p.after_remove_liquidity_returns_delta = (flags & AFTER_REMOVE_LIQUIDITY_RETURNS_DELTA_FLAG) != 0;
    return p;
}

const char* to_string(HookAck ack) {
    switch (ack) {
    case HookAck::None: return "None";
    case HookAck::BeforeInitialize: return "BeforeInitialize";
    case HookAck::AfterInitialize: return "AfterInitialize";
    case HookAck::BeforeAddLiquidity: return "BeforeAddLiquidity";
    case HookAck::AfterAddLiquidity: return "AfterAddLiquidity";
    case HookAck::BeforeRemoveLiquidity: return "BeforeRemoveLiquidity";
    case HookAck::AfterRemoveLiquidity: return "AfterRemoveLiquidity";
    case HookAck::BeforeSwap: return "BeforeSwap";
    case HookAck::AfterSwap: return "AfterSwap";
    case HookAck::BeforeDonate: return "BeforeDonate";
    case HookAck::AfterDonate: return "AfterDonate";
    }
    return "Unknown";
}

// =============================================================================
// Default Callbacks
// =============================================================================

namespace {

[[noreturn]] void not_implemented(const char* callback) {
    fail(errors::HOOK_NOT_IMPLEMENTED, callback);
}

} // anonymous namespace

HookAck IHooks::before_initialize(Session&, const Address&, const PoolKey&, const U256&) {
    not_implemented("before_initialize");
}

HookAck IHooks::after_initialize(Session&, const Address&, const PoolKey&, const U256&, int32_t) {
    not_implemented("after_initialize");
}

HookAck IHooks::before_add_liquidity(Session&, const Address&, const PoolKey&,
                                     const ModifyLiquidityParams&, const Bytes&) {
    not_implemented("before_add_liquidity");
}

AfterModifyLiquidityResult IHooks::after_add_liquidity(Session&, const Address&, const PoolKey&,
                                                       const ModifyLiquidityParams&, const BalanceDelta&,
                                                       const BalanceDelta&, const Bytes&) {
    not_implemented("after_add_liquidity");
}

HookAck IHooks::before_remove_liquidity(Session&, const Address&, const PoolKey&,
                                        const ModifyLiquidityParams&, const Bytes&) {
    not_implemented("before_remove_liquidity");
}

AfterModifyLiquidityResult IHooks::after_remove_liquidity(Session&, const Address&, const PoolKey&,
                                                          const ModifyLiquidityParams&, const BalanceDelta&,
                                                          const BalanceDelta&, const Bytes&) {
    not_implemented("after_remove_liquidity");
}

BeforeSwapResult IHooks::before_swap(Session&, const Address&, const PoolKey&,
                                     const SwapParams&, const Bytes&) {
    not_implemented("before_swap");
}

AfterSwapResult IHooks::after_swap(Session&, const Address&, const PoolKey&, const SwapParams&,
                                   const BalanceDelta&, const Bytes&) {
    not_implemented("after_swap");
}

HookAck IHooks::before_donate(Session&, const Address&, const PoolKey&, U128, U128, const Bytes&) {
    not_implemented("before_donate");
}

HookAck IHooks::after_donate(Session&, const Address&, const PoolKey&, U128, U128, const Bytes&) {
    not_implemented("after_donate");
}

// =============================================================================
// Registration
// =============================================================================

void HookRegistry::register_hooks(const Address& hook_address, IHooks* hooks) {
    if (hooks == nullptr || is_zero_address(hook_address)) {
        fail(errors::HOOK_ADDRESS_NOT_VALID, "hooks=" + to_hex(hook_address));
    }

    uint32_t declared = hooks->get_hook_permissions().to_flags();
    uint32_t encoded = hooks::flags_of(hook_address);
    if (declared != encoded) {
        fail(errors::HOOK_ADDRESS_NOT_VALID,
             "hooks=" + to_hex(hook_address) + " declared=" + std::to_string(declared) +
             " encoded=" + std::to_string(encoded));
    }

    registrations_[hook_address] = HookRegistration{hook_address, hooks, encoded};
    spdlog::debug("Registered hooks {} flags={:#06x}", to_hex(hook_address), encoded);
}

void HookRegistry::unregister_hooks(const Address& hook_address) {
    if (registrations_.erase(hook_address) != 0) {
        spdlog::debug("Unregistered hooks {}", to_hex(hook_address));
    }
}

const HookRegistration* HookRegistry::find(const Address& hook_address) const {
    auto it = registrations_.find(hook_address);
    return it == registrations_.end() ? nullptr : &it->second;
}

void HookRegistry::validate_pool_hooks(const PoolKey& key) const {
    if (!hooks::is_valid_hook_address(key.hooks, key.fee)) {
        fail(errors::HOOK_ADDRESS_NOT_VALID,
             "hooks=" + to_hex(key.hooks) + " fee=" + std::to_string(key.fee));
    }
    if (!is_zero_address(key.hooks) && find(key.hooks) == nullptr) {
        fail(errors::HOOK_NOT_REGISTERED, "hooks=" + to_hex(key.hooks));
    }
}

// =============================================================================
// Dispatch
// =============================================================================

namespace {

// Run a callback as the hook; foreign exceptions become HookCallFailed
template <typename Fn>
auto call_hook(Session& session, const HookRegistration& reg, const char* callback, Fn&& fn)
    -> decltype(fn(*reg.hooks, Address{})) {
    Address sender = session.actor();
    ActorScope scope(session, reg.address);
    try {
        return fn(*reg.hooks, sender);
    } catch (const AmmError&) {
        throw;
    } catch (const std::exception& e) {
        fail(errors::HOOK_CALL_FAILED, std::string(callback) + ": " + e.what());
    }
}

void expect_ack(HookAck got, HookAck expected) {
    if (got != expected) {
        fail(errors::INVALID_HOOK_RESPONSE,
             std::string("expected=") + to_string(expected) + " got=" + to_string(got));
    }
}

bool has_flag(const HookRegistration& reg, uint32_t flag) {
    return (reg.flags & flag) != 0;
}

} // anonymous namespace

const HookRegistration* HookRegistry::dispatch_target(const Session& session, const PoolKey& key) const {
    if (is_zero_address(key.hooks)) return nullptr;
    // A hook acting on its own pool does not re-enter itself
    if (session.actor() == key.hooks) return nullptr;

    const HookRegistration* reg = find(key.hooks);
    if (reg == nullptr) {
        fail(errors::HOOK_NOT_REGISTERED, "hooks=" + to_hex(key.hooks));
    }
    return reg;
}

void HookRegistry::before_initialize(Session& session, const PoolKey& key,
                                     const U256& sqrt_price_x96) const {
    const HookRegistration* reg = dispatch_target(session, key);
    if (!reg || !has_flag(*reg, hooks::BEFORE_INITIALIZE_FLAG)) return;

    HookAck ack = call_hook(session, *reg, "before_initialize", [&](IHooks& h, const Address& sender) {
        return h.before_initialize(session, sender, key, sqrt_price_x96);
    });
    expect_ack(ack, HookAck::BeforeInitialize);
}

void HookRegistry::after_initialize(Session& session, const PoolKey& key,
                                    const U256& sqrt_price_x96, int32_t tick) const {
    const HookRegistration* reg = dispatch_target(session, key);
    if (!reg || !has_flag(*reg, hooks::AFTER_INITIALIZE_FLAG)) return;

    HookAck ack = call_hook(session, *reg, "after_initialize", [&](IHooks& h, const Address& sender) {
        return h.after_initialize(session, sender, key, sqrt_price_x96, tick);
    });
    expect_ack(ack, HookAck::AfterInitialize);
}

void HookRegistry::before_modify_liquidity(Session& session, const PoolKey& key,
                                           const ModifyLiquidityParams& params,
                                           const Bytes& hook_data) const {
    const HookRegistration* reg = dispatch_target(session, key);
    if (!reg) return;

    if (params.liquidity_delta > 0 && has_flag(*reg, hooks::BEFORE_ADD_LIQUIDITY_FLAG)) {
        HookAck ack = call_hook(session, *reg, "before_add_liquidity", [&](IHooks& h, const Address& sender) {
            return h.before_add_liquidity(session, sender, key, params, hook_data);
        });
        expect_ack(ack, HookAck::BeforeAddLiquidity);
    } else if (params.liquidity_delta <= 0 && has_flag(*reg, hooks::BEFORE_REMOVE_LIQUIDITY_FLAG)) {
        HookAck ack = call_hook(session, *reg, "before_remove_liquidity", [&](IHooks& h, const Address& sender) {
            return h.before_remove_liquidity(session, sender, key, params, hook_data);
        });
        expect_ack(ack, HookAck::BeforeRemoveLiquidity);
    }
}

std::pair<BalanceDelta, BalanceDelta> HookRegistry::after_modify_liquidity(
    Session& session, const PoolKey& key, const ModifyLiquidityParams& params,
    const BalanceDelta& delta, const BalanceDelta& fees_accrued, const Bytes& hook_data) const {
    const HookRegistration* reg = dispatch_target(session, key);
    if (!reg) return {delta, ZERO_DELTA};

    BalanceDelta hook_delta;
    if (params.liquidity_delta > 0) {
        if (has_flag(*reg, hooks::AFTER_ADD_LIQUIDITY_FLAG)) {
            AfterModifyLiquidityResult r = call_hook(session, *reg, "after_add_liquidity",
                [&](IHooks& h, const Address& sender) {
                    return h.after_add_liquidity(session, sender, key, params, delta, fees_accrued, hook_data);
                });
            expect_ack(r.ack, HookAck::AfterAddLiquidity);
            if (has_flag(*reg, hooks::AFTER_ADD_LIQUIDITY_RETURNS_DELTA_FLAG)) hook_delta = r.delta;
        }
    } else {
        if (has_flag(*reg, hooks::AFTER_REMOVE_LIQUIDITY_FLAG)) {
            AfterModifyLiquidityResult r = call_hook(session, *reg, "after_remove_liquidity",
                [&](IHooks& h, const Address& sender) {
                    return h.after_remove_liquidity(session, sender, key, params, delta, fees_accrued, hook_data);
                });
            expect_ack(r.ack, HookAck::AfterRemoveLiquidity);
            if (has_flag(*reg, hooks::AFTER_REMOVE_LIQUIDITY_RETURNS_DELTA_FLAG)) hook_delta = r.delta;
        }
    }

    return {delta - hook_delta, hook_delta};
}

HookRegistry::BeforeSwapOutcome HookRegistry::before_swap(Session& session, const PoolKey& key,
                                                         const SwapParams& params,
                                                         const Bytes& hook_data) const {
    BeforeSwapOutcome outcome{params.amount_specified, ZERO_BEFORE_SWAP_DELTA, 0};

    const HookRegistration* reg = dispatch_target(session, key);
    if (!reg || !has_flag(*reg, hooks::BEFORE_SWAP_FLAG)) return outcome;

    BeforeSwapResult r = call_hook(session, *reg, "before_swap", [&](IHooks& h, const Address& sender) {
        return h.before_swap(session, sender, key, params, hook_data);
    });
    expect_ack(r.ack, HookAck::BeforeSwap);

    if (lp_fee::is_dynamic(key.fee)) outcome.lp_fee_override = r.lp_fee_override;

    if (has_flag(*reg, hooks::BEFORE_SWAP_RETURNS_DELTA_FLAG)) {
        outcome.hook_return = r.delta;
        I128 specified = r.delta.specified();
        if (specified != 0) {
            bool exact_input = outcome.amount_to_swap < 0;
            outcome.amount_to_swap = checked_add(outcome.amount_to_swap, specified);
            // The hook may shrink the swap, never reverse it
            if (exact_input ? outcome.amount_to_swap > 0 : outcome.amount_to_swap < 0) {
                fail(errors::HOOK_DELTA_EXCEEDS_SWAP_AMOUNT,
                     "amount_specified=" + to_string(params.amount_specified) +
                     " hook_delta=" + to_string(specified));
            }
        }
    }
    return outcome;
}

std::pair<BalanceDelta, BalanceDelta> HookRegistry::after_swap(
    Session& session, const PoolKey& key, const SwapParams& params,
    const BalanceDelta& swap_delta, const Bytes& hook_data,
    const BeforeSwapDelta& before_swap_delta) const {
    const HookRegistration* reg = dispatch_target(session, key);
    if (!reg) return {swap_delta, ZERO_DELTA};

    I128 hook_delta_specified = before_swap_delta.specified();
    I128 hook_delta_unspecified = before_swap_delta.unspecified();

    if (has_flag(*reg, hooks::AFTER_SWAP_FLAG)) {
        AfterSwapResult r = call_hook(session, *reg, "after_swap", [&](IHooks& h, const Address& sender) {
            return h.after_swap(session, sender, key, params, swap_delta, hook_data);
        });
        expect_ack(r.ack, HookAck::AfterSwap);
        if (has_flag(*reg, hooks::AFTER_SWAP_RETURNS_DELTA_FLAG)) {
            hook_delta_unspecified = checked_add(hook_delta_unspecified, r.unspecified_delta);
        }
    }

    if (hook_delta_specified == 0 && hook_delta_unspecified == 0) {
        return {swap_delta, ZERO_DELTA};
    }

    // Specified currency is currency0 for exact-in zero-for-one and exact-out one-for-zero
    BalanceDelta hook_delta = ((params.amount_specified < 0) == params.zero_for_one)
        ? BalanceDelta(hook_delta_specified, hook_delta_unspecified)
        : BalanceDelta(hook_delta_unspecified, hook_delta_specified);
    return {swap_delta - hook_delta, hook_delta};
}

void HookRegistry::before_donate(Session& session, const PoolKey& key, U128 amount0, U128 amount1,
                                 const Bytes& hook_data) const {
    const HookRegistration* reg = dispatch_target(session, key);
    if (!reg || !has_flag(*reg, hooks::BEFORE_DONATE_FLAG)) return;

    HookAck ack = call_hook(session, *reg, "before_donate", [&](IHooks& h, const Address& sender) {
        return h.before_donate(session, sender, key, amount0, amount1, hook_data);
    });
    expect_ack(ack, HookAck::BeforeDonate);
}

void HookRegistry::after_donate(Session& session, const PoolKey& key, U128 amount0, U128 amount1,
                                const Bytes& hook_data) const {
    const HookRegistration* reg = dispatch_target(session, key);
    if (!reg || !has_flag(*reg, hooks::AFTER_DONATE_FLAG)) return;

    HookAck ack = call_hook(session, *reg, "after_donate", [&](IHooks& h, const Address& sender) {
        return h.after_donate(session, sender, key, amount0, amount1, hook_data);
    });
    expect_ack(ack, HookAck::AfterDonate);
}

} // namespace amm

#ifndef AMM_POOL_MANAGER_HPP
#define AMM_POOL_MANAGER_HPP

#include <atomic>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "types.hpp"
#include "delta.hpp"
#include "slot0.hpp"
#include "pool.hpp"
#include "pool_store.hpp"
#include "hooks.hpp"
#include "session.hpp"
#include "custody.hpp"
#include "claims.hpp"
#include "config.hpp"

namespace amm {

// Work performed while the manager is unlocked
class IUnlockCallback {
public:
    virtual ~IUnlockCallback() = default;
    virtual Bytes unlock_callback(Session& session, const Bytes& data) = 0;
};

// =============================================================================
// PoolManager - Singleton Concentrated-Liquidity Pool Manager
// =============================================================================
//
// All pools live in one engine. State-changing operations run inside an
// unlock() session and only record what each actor owes or is owed; tokens
// move through sync/settle/take (or claims mint/burn). The session commits
// only when every delta is back to zero, otherwise nothing it did survives.

class PoolManager {
public:
    PoolManager(IAssetCustody& custody, IClaimsToken& claims,
                const EngineConfig& config = EngineConfig{});
    ~PoolManager() = default;

    // Non-copyable
    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    // =========================================================================
    // Sessions
    // =========================================================================

    // Open a session for `locker`, run the callback once, require every delta
    // settled. Throws AlreadyUnlocked when a session is open, CurrencyNotSettled
    // when a delta remains.
    Bytes unlock(const Address& locker, IUnlockCallback& callback, const Bytes& data = {});

    using SessionFn = std::function<void(Session&)>;
    void unlock(const Address& locker, const SessionFn& fn);

    bool is_unlocked() const { return active_ != nullptr; }

    // =========================================================================
    // Pool Operations (inside a session)
    // =========================================================================

    // Returns the starting tick
    int32_t initialize(Session& session, const PoolKey& key, const U256& sqrt_price_x96);

    // Returns the caller's delta after hook adjustments
    BalanceDelta swap(Session& session, const PoolKey& key, const SwapParams& params,
                      const Bytes& hook_data = {});

    // Returns (caller delta, fees accrued). Caller delta includes the fees.
    std::pair<BalanceDelta, BalanceDelta> modify_liquidity(Session& session, const PoolKey& key,
                                                           const ModifyLiquidityParams& params,
                                                           const Bytes& hook_data = {});

    BalanceDelta donate(Session& session, const PoolKey& key, U128 amount0, U128 amount1,
                        const Bytes& hook_data = {});

    // =========================================================================
    // Flash Accounting (inside a session)
    // =========================================================================

    // Checkpoint the engine's balance of `currency` before paying in
    void sync(Session& session, const Currency& currency);

    // Credit what arrived since sync() to the caller / to `recipient`
    U256 settle(Session& session);
    U256 settle_for(Session& session, const Address& recipient);

    // Send tokens out, recording the debt
    void take(Session& session, const Currency& currency, const Address& to, U128 amount);

    // Forfeit a positive delta of exactly `amount`
    void clear(Session& session, const Currency& currency, U128 amount);

    // Leave value inside the engine as claims / spend claims
    void mint(Session& session, const Address& to, const Currency& currency, U128 amount);
    void burn(Session& session, const Address& from, const Currency& currency, U128 amount);

    // =========================================================================
    // Fees (no session required)
    // =========================================================================

    // Only the pool's hook, only on dynamic-fee pools
    void update_dynamic_lp_fee(const Address& caller, const PoolKey& key, uint32_t new_fee);

    void set_protocol_fee(const Address& caller, const PoolKey& key, uint32_t new_fee);

    // amount == 0 collects everything accrued. Returns the amount sent.
    U256 collect_protocol_fees(const Address& caller, const Address& recipient,
                               const Currency& currency, const U256& amount);

    U256 protocol_fees_accrued(const Currency& currency) const;

    // =========================================================================
    // Query Operations
    // =========================================================================

    std::optional<Slot0> get_slot0(const PoolId& id) const;
    std::optional<U128> get_liquidity(const PoolId& id) const;
    std::optional<std::pair<U256, U256>> get_fee_growth_globals(const PoolId& id) const;
    std::optional<TickInfo> get_tick_info(const PoolId& id, int32_t tick) const;
    std::optional<U256> get_tick_bitmap(const PoolId& id, int16_t word) const;
    std::optional<PositionState> get_position(const PoolId& id, const Address& owner,
                                              int32_t tick_lower, int32_t tick_upper,
                                              uint64_t salt = 0) const;
    std::optional<std::pair<U256, U256>> get_fee_growth_inside(const PoolId& id, int32_t tick_lower,
                                                               int32_t tick_upper) const;

    bool pool_exists(const PoolId& id) const;

    const Address& engine_address() const { return config_.engine_address; }
    const Address& protocol_fee_controller() const { return config_.protocol_fee_controller; }

    // =========================================================================
    // Hook Registration
    // =========================================================================

    void register_hooks(const Address& hook_addr, IHooks* hooks);
    void unregister_hooks(const Address& hook_addr);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
        uint64_t total_donations;
        uint64_t sessions_committed;
        uint64_t sessions_aborted;
    };
    Stats get_stats() const;

private:
    // Reject sessions other than the open one, then run `fn`; failures mark
    // the session so it cannot commit
    template <typename Fn>
    auto guarded(Session& session, Fn&& fn) -> decltype(fn());

    Pool& initialized_pool(const PoolKey& key);
    const Pool* initialized_pool(const PoolId& id) const;

    void account_pool_delta(Session& session, const PoolKey& key, const BalanceDelta& delta,
                            const Address& actor);

    void check_protocol_fee_controller(const Address& caller) const;

    EngineConfig config_;
    IAssetCustody& custody_;
    IClaimsToken& claims_;

    PoolStore store_;
    HookRegistry hooks_;

    // Everything rolled back when a session aborts
    std::vector<ITransactional*> participants_;

    Session* active_{nullptr};

    // Statistics
    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_liquidity_ops_{0};
    std::atomic<uint64_t> total_donations_{0};
    std::atomic<uint64_t> sessions_committed_{0};
    std::atomic<uint64_t> sessions_aborted_{0};
};

} // namespace amm

#endif // AMM_POOL_MANAGER_HPP

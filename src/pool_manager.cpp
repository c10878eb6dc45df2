// =============================================================================
// pool_manager.cpp - Singleton pool manager with flash accounting
// =============================================================================

#include "amm/pool_manager.hpp"
#include "amm/errors.hpp"
#include "amm/fees.hpp"
#include "amm/transactional.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace amm {

namespace {

// Adapts a plain function to the callback interface
class FunctionCallback : public IUnlockCallback {
public:
    explicit FunctionCallback(const PoolManager::SessionFn& fn) : fn_(fn) {}

    Bytes unlock_callback(Session& session, const Bytes&) override {
        fn_(session);
        return {};
    }

private:
    const PoolManager::SessionFn& fn_;
};

std::string describe_open_deltas(const Session& session) {
    std::string out;
    for (const auto& open : session.open_deltas()) {
        if (!out.empty()) out += ", ";
        out += to_hex(open.actor) + "/" + to_hex(open.currency.addr) + "=" + to_string(open.delta);
    }
    return out;
}

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

PoolManager::PoolManager(IAssetCustody& custody, IClaimsToken& claims, const EngineConfig& config)
    : config_(config), custody_(custody), claims_(claims) {
    participants_.push_back(&store_);
    // Collaborators that can roll back join the session transaction
    if (auto* t = dynamic_cast<ITransactional*>(&custody_)) participants_.push_back(t);
    if (auto* t = dynamic_cast<ITransactional*>(&claims_)) participants_.push_back(t);

    spdlog::info("PoolManager ready: engine={} controller={}",
                 to_hex(config_.engine_address), to_hex(config_.protocol_fee_controller));
}

// =============================================================================
// Sessions
// =============================================================================

Bytes PoolManager::unlock(const Address& locker, IUnlockCallback& callback, const Bytes& data) {
    if (active_ != nullptr) {
        fail(errors::ALREADY_UNLOCKED);
    }

    Session session(locker);
    StateTransaction txn(participants_);
    active_ = &session;

    struct ActiveReset {
        Session*& active;
        ~ActiveReset() { active = nullptr; }
    } reset{active_};

    spdlog::debug("Session opened by {}", to_hex(locker));

    try {
        Bytes result = callback.unlock_callback(session, data);

        if (session.failed()) {
            throw AmmError(session.failed_code(), session.failed_detail());
        }
        if (session.nonzero_delta_count() != 0) {
            fail(errors::CURRENCY_NOT_SETTLED, describe_open_deltas(session));
        }

        txn.commit();
        sessions_committed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Session committed for {}", to_hex(locker));
        return result;
    } catch (const std::exception& e) {
        sessions_aborted_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("Session aborted for {}: {}", to_hex(locker), e.what());
        throw;
    } catch (...) {
        sessions_aborted_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("Session aborted for {}: unknown exception", to_hex(locker));
        throw;
    }
}

void PoolManager::unlock(const Address& locker, const SessionFn& fn) {
    FunctionCallback callback(fn);
    unlock(locker, callback);
}

template <typename Fn>
auto PoolManager::guarded(Session& session, Fn&& fn) -> decltype(fn()) {
    if (active_ != &session) {
        fail(errors::MANAGER_LOCKED);
    }
    try {
        return fn();
    } catch (const AmmError& e) {
        session.mark_failed(e.code(), e.detail());
        throw;
    } catch (const std::exception& e) {
        session.mark_failed(errors::COLLABORATOR_FAILED, e.what());
        throw;
    } catch (...) {
        session.mark_failed(errors::COLLABORATOR_FAILED, "unknown exception");
        throw;
    }
}

// =============================================================================
// Internal Helpers
// =============================================================================

Pool& PoolManager::initialized_pool(const PoolKey& key) {
    Pool* pool = store_.find_mut(key.to_id());
    if (pool == nullptr || !pool->is_initialized()) {
        fail(errors::POOL_NOT_INITIALIZED, key.to_id().to_hex());
    }
    return *pool;
}

const Pool* PoolManager::initialized_pool(const PoolId& id) const {
    const Pool* pool = store_.find(id);
    if (pool == nullptr || !pool->is_initialized()) return nullptr;
    return pool;
}

void PoolManager::account_pool_delta(Session& session, const PoolKey& key,
                                     const BalanceDelta& delta, const Address& actor) {
    session.account_delta(key.currency0, delta.amount0(), actor);
    session.account_delta(key.currency1, delta.amount1(), actor);
}

// =============================================================================
// Initialize
// =============================================================================

int32_t PoolManager::initialize(Session& session, const PoolKey& key, const U256& sqrt_price_x96) {
    return guarded(session, [&]() {
        if (key.tick_spacing > tick_spacings::MAX_TICK_SPACING) {
            fail(errors::TICK_SPACING_TOO_LARGE, "tick_spacing=" + std::to_string(key.tick_spacing));
        }
        if (key.tick_spacing < tick_spacings::MIN_TICK_SPACING) {
            fail(errors::TICK_SPACING_TOO_SMALL, "tick_spacing=" + std::to_string(key.tick_spacing));
        }
        if (key.currency0 >= key.currency1) {
            fail(errors::CURRENCIES_OUT_OF_ORDER_OR_EQUAL,
                 "currency0=" + to_hex(key.currency0.addr) + " currency1=" + to_hex(key.currency1.addr));
        }
        hooks_.validate_pool_hooks(key);

        uint32_t lp = lp_fee::initial_fee(key.fee);

        hooks_.before_initialize(session, key, sqrt_price_x96);

        PoolId id = key.to_id();
        int32_t tick = store_.get_or_create(id).initialize(sqrt_price_x96, lp);

        spdlog::debug("Initialized pool {} sqrt_price={} tick={} fee={}",
                      id.to_hex(), to_string(sqrt_price_x96), tick, key.fee);

        hooks_.after_initialize(session, key, sqrt_price_x96, tick);
        return tick;
    });
}

// =============================================================================
// Swap
// =============================================================================

BalanceDelta PoolManager::swap(Session& session, const PoolKey& key, const SwapParams& params,
                               const Bytes& hook_data) {
    return guarded(session, [&]() {
        if (params.amount_specified == 0) {
            fail(errors::SWAP_AMOUNT_CANNOT_BE_ZERO);
        }
        initialized_pool(key);

        HookRegistry::BeforeSwapOutcome before = hooks_.before_swap(session, key, params, hook_data);

        // Looked up again: the hook may have touched the store
        Pool& pool = initialized_pool(key);
        Pool::SwapResult result = pool.swap(Pool::SwapInput{
            before.amount_to_swap,
            key.tick_spacing,
            params.zero_for_one,
            params.sqrt_price_limit_x96,
            before.lp_fee_override});

        if (result.amount_to_protocol > 0) {
            const Currency& input = params.zero_for_one ? key.currency0 : key.currency1;
            store_.add_protocol_fees(input, result.amount_to_protocol);
        }
        total_swaps_.fetch_add(1, std::memory_order_relaxed);

        auto [caller_delta, hook_delta] =
            hooks_.after_swap(session, key, params, result.delta, hook_data, before.hook_return);

        if (!hook_delta.is_zero()) account_pool_delta(session, key, hook_delta, key.hooks);
        account_pool_delta(session, key, caller_delta, session.actor());
        return caller_delta;
    });
}

// =============================================================================
// Modify Liquidity
// =============================================================================

std::pair<BalanceDelta, BalanceDelta> PoolManager::modify_liquidity(
    Session& session, const PoolKey& key, const ModifyLiquidityParams& params,
    const Bytes& hook_data) {
    return guarded(session, [&]() {
        initialized_pool(key);
        Pool::check_ticks(params.tick_lower, params.tick_upper);

        hooks_.before_modify_liquidity(session, key, params, hook_data);

        Pool& pool = initialized_pool(key);
        Pool::ModifyLiquidityResult result = pool.modify_liquidity(Pool::ModifyLiquidityInput{
            session.actor(),
            params.tick_lower,
            params.tick_upper,
            params.liquidity_delta,
            key.tick_spacing,
            params.salt});
        total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);

        BalanceDelta principal_and_fees = result.principal + result.fees_accrued;
        auto [caller_delta, hook_delta] = hooks_.after_modify_liquidity(
            session, key, params, principal_and_fees, result.fees_accrued, hook_data);

        if (!hook_delta.is_zero()) account_pool_delta(session, key, hook_delta, key.hooks);
        account_pool_delta(session, key, caller_delta, session.actor());
        return std::make_pair(caller_delta, result.fees_accrued);
    });
}

// =============================================================================
// Donate
// =============================================================================

BalanceDelta PoolManager::donate(Session& session, const PoolKey& key, U128 amount0, U128 amount1,
                                 const Bytes& hook_data) {
    return guarded(session, [&]() {
        initialized_pool(key);

        hooks_.before_donate(session, key, amount0, amount1, hook_data);

        BalanceDelta delta = initialized_pool(key).donate(amount0, amount1);
        account_pool_delta(session, key, delta, session.actor());
        total_donations_.fetch_add(1, std::memory_order_relaxed);

        hooks_.after_donate(session, key, amount0, amount1, hook_data);
        return delta;
    });
}

// =============================================================================
// Flash Accounting
// =============================================================================

void PoolManager::sync(Session& session, const Currency& currency) {
    guarded(session, [&]() {
        session.set_synced(currency, custody_.balance_of(currency, config_.engine_address));
    });
}

U256 PoolManager::settle(Session& session) {
    return settle_for(session, session.actor());
}

U256 PoolManager::settle_for(Session& session, const Address& recipient) {
    return guarded(session, [&]() -> U256 {
        // Nothing was checkpointed, so nothing can have been paid
        if (!session.synced_currency()) return U256(0);

        Currency currency = *session.synced_currency();
        U256 reserves_now = custody_.balance_of(currency, config_.engine_address);
        if (reserves_now < session.synced_reserves()) {
            fail(errors::SETTLE_UNDERFLOW,
                 "synced=" + to_string(session.synced_reserves()) + " now=" + to_string(reserves_now));
        }

        U256 paid = reserves_now - session.synced_reserves();
        I128 credit = to_i128(paid);
        session.clear_synced();
        session.account_delta(currency, credit, recipient);
        return paid;
    });
}

void PoolManager::take(Session& session, const Currency& currency, const Address& to, U128 amount) {
    guarded(session, [&]() {
        session.account_delta(currency, checked_neg(to_i128(amount)), session.actor());
        custody_.transfer(currency, config_.engine_address, to, to_u256(amount));
    });
}

void PoolManager::clear(Session& session, const Currency& currency, U128 amount) {
    guarded(session, [&]() {
        I128 expected = to_i128(amount);
        I128 current = session.currency_delta(session.actor(), currency);
        if (current != expected) {
            fail(errors::MUST_CLEAR_EXACT_POSITIVE_DELTA,
                 "delta=" + to_string(current) + " amount=" + to_string(amount));
        }
        session.account_delta(currency, checked_neg(expected), session.actor());
    });
}

void PoolManager::mint(Session& session, const Address& to, const Currency& currency, U128 amount) {
    guarded(session, [&]() {
        session.account_delta(currency, checked_neg(to_i128(amount)), session.actor());
        claims_.mint(to, currency, to_u256(amount));
    });
}

void PoolManager::burn(Session& session, const Address& from, const Currency& currency, U128 amount) {
    guarded(session, [&]() {
        session.account_delta(currency, to_i128(amount), session.actor());
        claims_.burn_from(session.actor(), from, currency, to_u256(amount));
    });
}

// =============================================================================
// Fees
// =============================================================================

void PoolManager::update_dynamic_lp_fee(const Address& caller, const PoolKey& key, uint32_t new_fee) {
    if (!lp_fee::is_dynamic(key.fee) || caller != key.hooks) {
        fail(errors::UNAUTHORIZED_DYNAMIC_LP_FEE_UPDATE, "caller=" + to_hex(caller));
    }
    lp_fee::validate(new_fee);
    initialized_pool(key).set_lp_fee(new_fee);
    spdlog::debug("Dynamic LP fee for {} set to {}", key.to_id().to_hex(), new_fee);
}

void PoolManager::check_protocol_fee_controller(const Address& caller) const {
    if (is_zero_address(config_.protocol_fee_controller) || caller != config_.protocol_fee_controller) {
        fail(errors::INVALID_CALLER, "caller=" + to_hex(caller));
    }
}

void PoolManager::set_protocol_fee(const Address& caller, const PoolKey& key, uint32_t new_fee) {
    check_protocol_fee_controller(caller);
    if (!protocol_fee::is_valid(new_fee)) {
        fail(errors::PROTOCOL_FEE_TOO_LARGE, "fee=" + std::to_string(new_fee));
    }
    initialized_pool(key).set_protocol_fee(new_fee);
    spdlog::info("Protocol fee for {} set to {}", key.to_id().to_hex(), new_fee);
}

U256 PoolManager::collect_protocol_fees(const Address& caller, const Address& recipient,
                                        const Currency& currency, const U256& amount) {
    check_protocol_fee_controller(caller);
    // A pending sync would count the payout as a payment
    if (active_ != nullptr && active_->synced_currency() && *active_->synced_currency() == currency) {
        fail(errors::PROTOCOL_FEE_CURRENCY_SYNCED, to_hex(currency.addr));
    }

    U256 accrued = store_.protocol_fees_accrued(currency);
    U256 amount_collected = amount == 0 ? accrued : amount;
    if (amount_collected > accrued) {
        fail(errors::INSUFFICIENT_BALANCE,
             "accrued=" + to_string(accrued) + " amount=" + to_string(amount_collected));
    }

    custody_.transfer(currency, config_.engine_address, recipient, amount_collected);
    store_.sub_protocol_fees(currency, amount_collected);

    spdlog::info("Collected {} protocol fees of {} to {}",
                 to_string(amount_collected), to_hex(currency.addr), to_hex(recipient));
    return amount_collected;
}

U256 PoolManager::protocol_fees_accrued(const Currency& currency) const {
    return store_.protocol_fees_accrued(currency);
}

// =============================================================================
// Query Operations
// =============================================================================

std::optional<Slot0> PoolManager::get_slot0(const PoolId& id) const {
    const Pool* pool = initialized_pool(id);
    return pool ? std::optional<Slot0>{pool->slot0()} : std::nullopt;
}

std::optional<U128> PoolManager::get_liquidity(const PoolId& id) const {
    const Pool* pool = initialized_pool(id);
    return pool ? std::optional<U128>{pool->liquidity()} : std::nullopt;
}

std::optional<std::pair<U256, U256>> PoolManager::get_fee_growth_globals(const PoolId& id) const {
    const Pool* pool = initialized_pool(id);
    if (!pool) return std::nullopt;
    return std::make_pair(pool->fee_growth_global0_x128(), pool->fee_growth_global1_x128());
}

std::optional<TickInfo> PoolManager::get_tick_info(const PoolId& id, int32_t tick) const {
    const Pool* pool = initialized_pool(id);
    return pool ? std::optional<TickInfo>{pool->tick_info(tick)} : std::nullopt;
}

std::optional<U256> PoolManager::get_tick_bitmap(const PoolId& id, int16_t word) const {
    const Pool* pool = initialized_pool(id);
    return pool ? std::optional<U256>{pool->bitmap_word(word)} : std::nullopt;
}

std::optional<PositionState> PoolManager::get_position(const PoolId& id, const Address& owner,
                                                       int32_t tick_lower, int32_t tick_upper,
                                                       uint64_t salt) const {
    const Pool* pool = initialized_pool(id);
    if (!pool) return std::nullopt;
    return pool->position(PositionKey{owner, tick_lower, tick_upper, salt});
}

std::optional<std::pair<U256, U256>> PoolManager::get_fee_growth_inside(const PoolId& id,
                                                                        int32_t tick_lower,
                                                                        int32_t tick_upper) const {
    const Pool* pool = initialized_pool(id);
    if (!pool) return std::nullopt;
    return pool->fee_growth_inside(tick_lower, tick_upper);
}

bool PoolManager::pool_exists(const PoolId& id) const {
    return initialized_pool(id) != nullptr;
}

// =============================================================================
// Hook Registration
// =============================================================================

void PoolManager::register_hooks(const Address& hook_addr, IHooks* hooks) {
    hooks_.register_hooks(hook_addr, hooks);
}

void PoolManager::unregister_hooks(const Address& hook_addr) {
    hooks_.unregister_hooks(hook_addr);
}

// =============================================================================
// Statistics
// =============================================================================

PoolManager::Stats PoolManager::get_stats() const {
    return Stats{
        static_cast<uint64_t>(store_.size()),
        total_swaps_.load(std::memory_order_relaxed),
        total_liquidity_ops_.load(std::memory_order_relaxed),
        total_donations_.load(std::memory_order_relaxed),
        sessions_committed_.load(std::memory_order_relaxed),
        sessions_aborted_.load(std::memory_order_relaxed),
    };
}

} // namespace amm

// amm - Pool Manager Tests

#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"

#include <stdexcept>

using namespace amm;
using namespace amm::test;

namespace {

template <typename Fn>
int32_t code_of(Fn&& fn) {
    try {
        fn();
    } catch (const AmmError& e) {
        return e.code();
    }
    return errors::OK;
}

I128 i128_pow2(unsigned n) { return static_cast<I128>(pow2_128(n)); }

// Counts swap callbacks; the acknowledgement it returns is configurable
class BeforeSwapOnlyHook : public IHooks {
public:
    HookPermissions get_hook_permissions() const override {
        HookPermissions p;
        p.before_swap = true;
        return p;
    }

    BeforeSwapResult before_swap(Session&, const Address&, const PoolKey&, const SwapParams&,
                                 const Bytes&) override {
        ++before_calls;
        return BeforeSwapResult{ack, ZERO_BEFORE_SWAP_DELTA, 0};
    }

    AfterSwapResult after_swap(Session&, const Address&, const PoolKey&, const SwapParams&,
                               const BalanceDelta&, const Bytes&) override {
        ++after_calls;
        return AfterSwapResult{HookAck::AfterSwap, 0};
    }

    HookAck ack = HookAck::BeforeSwap;
    int before_calls = 0;
    int after_calls = 0;
};

// Custody whose transfers can be switched to fail like an unreachable backend
class FlakyCustody : public InMemoryCustody {
public:
    void transfer(const Currency& currency, const Address& from, const Address& to,
                  const U256& amount) override {
        if (offline) throw std::runtime_error("custody offline");
        InMemoryCustody::transfer(currency, from, to, amount);
    }

    bool offline = false;
};

} // namespace

// =============================================================================
// Initialize
// =============================================================================

TEST_CASE("Initialize derives the tick from the price", "[manager][initialize]") {
    EngineFixture f;
    PoolKey key = make_key(3000, 60);

    int32_t tick = f.initialize(key, pow2(97));
    REQUIRE(tick == 13863);

    auto slot0 = f.manager.get_slot0(key.to_id());
    REQUIRE(slot0.has_value());
    REQUIRE(slot0->sqrt_price_x96() == pow2(97));
    REQUIRE(slot0->tick() == 13863);
    REQUIRE(slot0->lp_fee() == 3000);
    REQUIRE(slot0->protocol_fee() == 0);
    REQUIRE(*f.manager.get_liquidity(key.to_id()) == 0);

    SECTION("Second initialize fails") {
        REQUIRE(code_of([&] { f.initialize(key, PRICE_ONE); }) == errors::POOL_ALREADY_INITIALIZED);
        REQUIRE(f.manager.get_slot0(key.to_id())->sqrt_price_x96() == pow2(97));
    }

    SECTION("Same currencies, different key, different pool") {
        PoolKey other = make_key(500, 10);
        REQUIRE_FALSE(f.manager.pool_exists(other.to_id()));
        REQUIRE(f.initialize(other, pow2(95)) == -13864);
        REQUIRE(f.manager.get_stats().total_pools == 2);
    }
}

TEST_CASE("Initialize validates the key", "[manager][initialize]") {
    EngineFixture f;

    SECTION("Currency order") {
        PoolKey key = make_key(3000, 60);
        std::swap(key.currency0, key.currency1);
        REQUIRE(code_of([&] { f.initialize(key, PRICE_ONE); }) == errors::CURRENCIES_OUT_OF_ORDER_OR_EQUAL);

        key.currency0 = key.currency1;
        REQUIRE(code_of([&] { f.initialize(key, PRICE_ONE); }) == errors::CURRENCIES_OUT_OF_ORDER_OR_EQUAL);
    }

    SECTION("Tick spacing bounds") {
        REQUIRE(code_of([&] { f.initialize(make_key(3000, 0), PRICE_ONE); }) == errors::TICK_SPACING_TOO_SMALL);
        REQUIRE(code_of([&] { f.initialize(make_key(3000, 16384), PRICE_ONE); }) == errors::TICK_SPACING_TOO_LARGE);
    }

    SECTION("Fee and price bounds") {
        REQUIRE(code_of([&] { f.initialize(make_key(1000001, 60), PRICE_ONE); }) == errors::LP_FEE_TOO_LARGE);
        REQUIRE(code_of([&] { f.initialize(make_key(3000, 60), tick_math::MAX_SQRT_PRICE); }) ==
                errors::INVALID_SQRT_PRICE);
    }

    SECTION("Nothing is created on failure") {
        REQUIRE(code_of([&] { f.initialize(make_key(3000, 60), tick_math::MIN_SQRT_PRICE - 1); }) ==
                errors::INVALID_SQRT_PRICE);
        REQUIRE(f.manager.get_stats().total_pools == 0);
        REQUIRE_FALSE(f.manager.get_slot0(make_key(3000, 60).to_id()).has_value());
    }
}

// =============================================================================
// Liquidity
// =============================================================================

TEST_CASE("Adding and removing liquidity", "[manager][liquidity]") {
    EngineFixture f;
    PoolKey key = make_key(3000, 60);
    PoolId id = key.to_id();
    f.initialize(key, PRICE_ONE);

    const I128 L = i128_pow2(64);
    BalanceDelta added = f.add_liquidity(key, -600, 600, L);

    SECTION("In-range add owes both currencies") {
        REQUIRE(added.amount0() < 0);
        REQUIRE(added.amount1() < 0);
        REQUIRE(added.amount0() == sqrt_price_math::get_amount0_delta(
            PRICE_ONE, tick_math::get_sqrt_price_at_tick(600), L));
        REQUIRE(added.amount1() == sqrt_price_math::get_amount1_delta(
            tick_math::get_sqrt_price_at_tick(-600), PRICE_ONE, L));
        REQUIRE(*f.manager.get_liquidity(id) == pow2_128(64));
    }

    SECTION("Ticks and bitmap record the range") {
        TickInfo lower = *f.manager.get_tick_info(id, -600);
        TickInfo upper = *f.manager.get_tick_info(id, 600);
        REQUIRE(lower.liquidity_gross == pow2_128(64));
        REQUIRE(lower.liquidity_net == L);
        REQUIRE(upper.liquidity_net == -L);
        REQUIRE(*f.manager.get_tick_bitmap(id, -1) == pow2(246));
        REQUIRE(*f.manager.get_tick_bitmap(id, 0) == pow2(10));
        REQUIRE(f.manager.get_position(id, ALICE, -600, 600)->liquidity == pow2_128(64));
    }

    SECTION("Removal pays back at most what was paid in") {
        BalanceDelta removed;
        f.manager.unlock(ALICE, [&](Session& s) {
            removed = f.manager.modify_liquidity(s, key, ModifyLiquidityParams{-600, 600, -L, 0}).first;
            f.settle_deltas(s, key, ALICE);
        });
        REQUIRE(removed.amount0() > 0);
        REQUIRE(removed.amount0() <= -added.amount0());
        REQUIRE(removed.amount0() >= -added.amount0() - 1);
        REQUIRE(removed.amount1() <= -added.amount1());
        REQUIRE(removed.amount1() >= -added.amount1() - 1);

        REQUIRE(*f.manager.get_liquidity(id) == 0);
        REQUIRE(f.manager.get_tick_info(id, -600)->liquidity_gross == 0);
        REQUIRE(*f.manager.get_tick_bitmap(id, -1) == 0);
        REQUIRE(*f.manager.get_tick_bitmap(id, 0) == 0);
        // Emptied positions stay addressable
        REQUIRE(f.manager.get_position(id, ALICE, -600, 600)->liquidity == 0);
    }

    SECTION("Out-of-range add owes one currency") {
        BalanceDelta above = f.add_liquidity(key, 600, 1200, L);
        REQUIRE(above.amount0() < 0);
        REQUIRE(above.amount1() == 0);

        BalanceDelta below = f.add_liquidity(key, -1200, -600, L);
        REQUIRE(below.amount0() == 0);
        REQUIRE(below.amount1() < 0);
        REQUIRE(*f.manager.get_liquidity(id) == pow2_128(64));
    }

    SECTION("Salts keep positions apart") {
        f.add_liquidity(key, -600, 600, L, ALICE, 7);
        REQUIRE(f.manager.get_position(id, ALICE, -600, 600, 7)->liquidity == pow2_128(64));
        REQUIRE(f.manager.get_position(id, ALICE, -600, 600, 0)->liquidity == pow2_128(64));
        REQUIRE_FALSE(f.manager.get_position(id, BOB, -600, 600, 0).has_value());
        REQUIRE(*f.manager.get_liquidity(id) == pow2_128(65));
    }

    SECTION("Range errors") {
        REQUIRE(code_of([&] { f.add_liquidity(key, 600, -600, L); }) == errors::TICKS_MISORDERED);
        REQUIRE(code_of([&] { f.add_liquidity(key, -61, 600, L); }) == errors::TICK_MISALIGNED);
        REQUIRE(code_of([&] { f.add_liquidity(key, tick_math::MIN_TICK - 60, 600, L); }) ==
                errors::TICK_LOWER_OUT_OF_BOUNDS);
        REQUIRE(code_of([&] { f.add_liquidity(key, -600, tick_math::MAX_TICK + 60, L); }) ==
                errors::TICK_UPPER_OUT_OF_BOUNDS);
    }

    SECTION("Over-removal and empty pokes fail") {
        REQUIRE(code_of([&] { f.add_liquidity(key, -600, 600, -L - 1); }) == errors::LIQUIDITY_UNDERFLOW);
        REQUIRE(code_of([&] { f.add_liquidity(key, -600, 600, 0, BOB); }) ==
                errors::CANNOT_UPDATE_EMPTY_POSITION);
        REQUIRE(*f.manager.get_liquidity(id) == pow2_128(64));
    }

    SECTION("Uninitialized pool") {
        REQUIRE(code_of([&] { f.add_liquidity(make_key(500, 10), -600, 600, L); }) ==
                errors::POOL_NOT_INITIALIZED);
    }
}

TEST_CASE("Per-tick liquidity cap", "[manager][liquidity]") {
    SECTION("Cap by tick spacing") {
        REQUIRE(Pool::tick_spacing_to_max_liquidity_per_tick(1) ==
                low_u128(U256("191757530477355301479181766273477")));
        REQUIRE(Pool::tick_spacing_to_max_liquidity_per_tick(60) ==
                low_u128(U256("11505354575363080317263139282924270")));
        REQUIRE(Pool::tick_spacing_to_max_liquidity_per_tick(tick_spacings::MAX_TICK_SPACING) ==
                U128_MAX / 110);
    }

    SECTION("Adding past the cap fails") {
        EngineFixture f;
        PoolKey key = make_key(3000, tick_spacings::MAX_TICK_SPACING);
        f.initialize(key, PRICE_ONE);
        I128 over = static_cast<I128>(U128_MAX / 110) + 1;
        REQUIRE(code_of([&] {
            f.add_liquidity(key, tick_math::min_usable_tick(key.tick_spacing),
                            tick_math::max_usable_tick(key.tick_spacing), over);
        }) == errors::TICK_LIQUIDITY_OVERFLOW);
        REQUIRE(*f.manager.get_liquidity(key.to_id()) == 0);
    }
}

// =============================================================================
// Swaps
// =============================================================================

TEST_CASE("Exact-input swap within one range", "[manager][swap]") {
    EngineFixture f;
    PoolKey key = make_key(0, 200);
    PoolId id = key.to_id();
    f.initialize(key, PRICE_ONE);
    f.add_liquidity(key, -20000, 20000, i128_pow2(96));

    // Constant product within range: P1 = L*P0 / (L + a*P0), out = L*(P0 - P1)
    BalanceDelta delta;
    I128 owed_in = 0;
    I128 owed_out = 0;
    f.manager.unlock(BOB, [&](Session& s) {
        delta = f.manager.swap(s, key, exact_in(true, i128_pow2(96)));
        owed_in = s.currency_delta(BOB, TOKEN_A);
        owed_out = s.currency_delta(BOB, TOKEN_B);
        f.settle_deltas(s, key, BOB);
    });

    REQUIRE(delta == BalanceDelta(-i128_pow2(96), i128_pow2(95)));
    REQUIRE(owed_in == -i128_pow2(96));
    REQUIRE(owed_out == i128_pow2(95));

    Slot0 slot0 = *f.manager.get_slot0(id);
    REQUIRE(slot0.sqrt_price_x96() == pow2(95));
    REQUIRE(slot0.tick() == -13864);
    REQUIRE(*f.manager.get_liquidity(id) == pow2_128(96));

    REQUIRE(f.custody.balance_of(TOKEN_A, BOB) == pow2(120) - pow2(96));
    REQUIRE(f.custody.balance_of(TOKEN_B, BOB) == pow2(120) + pow2(95));
    REQUIRE(f.manager.get_stats().total_swaps == 1);
}

TEST_CASE("Opposite swaps that cancel need no transfers", "[manager][swap][session]") {
    EngineFixture f;
    PoolKey key = make_key(0, tick_spacings::MAX_TICK_SPACING);
    f.initialize(key, PRICE_ONE);
    f.add_liquidity(key, tick_math::min_usable_tick(key.tick_spacing),
                    tick_math::max_usable_tick(key.tick_spacing), i128_pow2(96));

    uint64_t transfers_before = f.custody.transfer_count();
    BalanceDelta first;
    BalanceDelta second;

    f.manager.unlock(BOB, [&](Session& s) {
        first = f.manager.swap(s, key, SwapParams{true, -i128_pow2(100), pow2(95)});
        second = f.manager.swap(s, key, SwapParams{false, -i128_pow2(95), PRICE_ONE});
        REQUIRE(s.nonzero_delta_count() == 0);
    });

    REQUIRE(first == BalanceDelta(-i128_pow2(96), i128_pow2(95)));
    REQUIRE(second == BalanceDelta(i128_pow2(96), -i128_pow2(95)));
    REQUIRE(f.custody.transfer_count() == transfers_before);
    REQUIRE(f.manager.get_slot0(key.to_id())->sqrt_price_x96() == PRICE_ONE);
    REQUIRE(f.manager.get_slot0(key.to_id())->tick() == 0);
}

TEST_CASE("Swap mechanics", "[manager][swap]") {
    EngineFixture f;
    PoolKey key = make_key(3000, 60);
    PoolId id = key.to_id();
    f.initialize(key, PRICE_ONE);

    const I128 L = i128_pow2(64);
    f.add_liquidity(key, -60, 60, L);
    f.add_liquidity(key, -600, 600, L);

    SECTION("Crossing a tick drops its liquidity and crossing back restores it") {
        f.swap(key, SwapParams{true, -i128_pow2(100), tick_math::get_sqrt_price_at_tick(-300)});
        REQUIRE(f.manager.get_slot0(id)->tick() == -300);
        REQUIRE(*f.manager.get_liquidity(id) == pow2_128(64));

        f.swap(key, SwapParams{false, -i128_pow2(100), PRICE_ONE});
        REQUIRE(f.manager.get_slot0(id)->tick() == 0);
        REQUIRE(*f.manager.get_liquidity(id) == pow2_128(65));
    }

    SECTION("Exact output delivers exactly the request") {
        BalanceDelta delta = f.swap(key, exact_out(true, 1000000));
        REQUIRE(delta.amount1() == 1000000);
        REQUIRE(delta.amount0() < -1000000);
    }

    SECTION("Fees accrue to in-range positions") {
        f.swap(key, exact_in(false, 1000000));
        auto growth = f.manager.get_fee_growth_globals(id);
        REQUIRE(growth->first == 0);
        REQUIRE(growth->second > 0);

        BalanceDelta fees;
        f.manager.unlock(ALICE, [&](Session& s) {
            fees = f.manager.modify_liquidity(s, key, ModifyLiquidityParams{-600, 600, 0, 0}).second;
            f.settle_deltas(s, key, ALICE);
        });
        // Two equal positions share the 3000-pip fee on 1e6
        REQUIRE(fees.amount0() == 0);
        REQUIRE(fees.amount1() >= 1499);
        REQUIRE(fees.amount1() <= 1500);
    }

    SECTION("Fee growth only moves forward") {
        U256 prev0 = 0;
        U256 prev1 = 0;
        for (int i = 0; i < 6; ++i) {
            f.swap(key, exact_in(i % 2 == 0, 250000));
            auto growth = *f.manager.get_fee_growth_globals(id);
            REQUIRE(growth.first >= prev0);
            REQUIRE(growth.second >= prev1);
            prev0 = growth.first;
            prev1 = growth.second;
        }
        REQUIRE(prev0 > 0);
        REQUIRE(prev1 > 0);
    }

    SECTION("Price limit checks") {
        REQUIRE(code_of([&] { f.swap(key, SwapParams{true, -1000, PRICE_ONE}); }) ==
                errors::PRICE_LIMIT_ALREADY_EXCEEDED);
        REQUIRE(code_of([&] { f.swap(key, SwapParams{true, -1000, tick_math::MIN_SQRT_PRICE}); }) ==
                errors::PRICE_LIMIT_OUT_OF_BOUNDS);
        REQUIRE(code_of([&] { f.swap(key, SwapParams{false, -1000, PRICE_ONE}); }) ==
                errors::PRICE_LIMIT_ALREADY_EXCEEDED);
        REQUIRE(code_of([&] { f.swap(key, SwapParams{false, -1000, tick_math::MAX_SQRT_PRICE}); }) ==
                errors::PRICE_LIMIT_OUT_OF_BOUNDS);
    }

    SECTION("Zero amount and unknown pools") {
        REQUIRE(code_of([&] { f.swap(key, exact_in(true, 0)); }) == errors::SWAP_AMOUNT_CANNOT_BE_ZERO);
        REQUIRE(code_of([&] { f.swap(make_key(500, 10), exact_in(true, 1000)); }) ==
                errors::POOL_NOT_INITIALIZED);
    }
}

TEST_CASE("Before-swap-only hook", "[manager][swap][hooks]") {
    EngineFixture f;
    BeforeSwapOnlyHook hook;
    Address addr = hooks::with_flags(address_from_u64(0xABCD0000), hooks::BEFORE_SWAP_FLAG);
    f.manager.register_hooks(addr, &hook);

    PoolKey key = make_key(3000, 60, addr);
    PoolId id = key.to_id();
    f.initialize(key, PRICE_ONE);
    f.add_liquidity(key, -600, 600, i128_pow2(64));

    Slot0 slot0_before = *f.manager.get_slot0(id);
    U128 liquidity_before = *f.manager.get_liquidity(id);

    SECTION("afterSwap is never called") {
        BalanceDelta delta = f.swap(key, exact_in(true, 1000));
        REQUIRE(delta.amount0() == -1000);
        REQUIRE(hook.before_calls == 1);
        REQUIRE(hook.after_calls == 0);
    }

    SECTION("Wrong acknowledgement aborts and leaves the pool untouched") {
        hook.ack = HookAck::AfterSwap;
        REQUIRE(code_of([&] { f.swap(key, exact_in(true, 1000)); }) == errors::INVALID_HOOK_RESPONSE);
        REQUIRE(*f.manager.get_slot0(id) == slot0_before);
        REQUIRE(*f.manager.get_liquidity(id) == liquidity_before);
        REQUIRE(hook.after_calls == 0);
    }
}

// =============================================================================
// Donate
// =============================================================================

TEST_CASE("Donations go to in-range liquidity", "[manager][donate]") {
    EngineFixture f;
    PoolKey key = make_key(3000, 60);
    PoolId id = key.to_id();
    f.initialize(key, PRICE_ONE);

    SECTION("No liquidity to receive them") {
        REQUIRE(code_of([&] {
            f.manager.unlock(BOB, [&](Session& s) { f.manager.donate(s, key, 1000, 0); });
        }) == errors::NO_LIQUIDITY_TO_RECEIVE_FEES);
    }

    SECTION("Donor pays, position collects") {
        f.add_liquidity(key, -600, 600, i128_pow2(64));

        BalanceDelta donated;
        f.manager.unlock(BOB, [&](Session& s) {
            donated = f.manager.donate(s, key, 1000, 0);
            f.settle_deltas(s, key, BOB);
        });
        REQUIRE(donated == BalanceDelta(-1000, 0));
        REQUIRE(f.manager.get_fee_growth_globals(id)->first == U256(1000) * pow2(64));

        BalanceDelta poke;
        f.manager.unlock(ALICE, [&](Session& s) {
            poke = f.manager.modify_liquidity(s, key, ModifyLiquidityParams{-600, 600, 0, 0}).first;
            f.settle_deltas(s, key, ALICE);
        });
        REQUIRE(poke == BalanceDelta(1000, 0));
        REQUIRE(f.manager.get_stats().total_donations == 1);
    }
}

// =============================================================================
// Flash Accounting
// =============================================================================

TEST_CASE("Unlock discipline", "[manager][session]") {
    EngineFixture f;

    SECTION("Nested unlock") {
        REQUIRE(code_of([&] {
            f.manager.unlock(ALICE, [&](Session&) { f.manager.unlock(BOB, [](Session&) {}); });
        }) == errors::ALREADY_UNLOCKED);
        REQUIRE_FALSE(f.manager.is_unlocked());
    }

    SECTION("Operations need the open session") {
        Session outside(ALICE);
        REQUIRE(code_of([&] { f.manager.sync(outside, TOKEN_A); }) == errors::MANAGER_LOCKED);
        REQUIRE(code_of([&] { f.manager.take(outside, TOKEN_A, ALICE, 1); }) == errors::MANAGER_LOCKED);
    }

    SECTION("Unsettled deltas abort and roll back") {
        REQUIRE(code_of([&] {
            f.manager.unlock(ALICE, [&](Session& s) { f.manager.mint(s, ALICE, TOKEN_A, 5); });
        }) == errors::CURRENCY_NOT_SETTLED);
        REQUIRE(f.claims.balance_of(ALICE, TOKEN_A) == 0);
        REQUIRE(f.manager.get_stats().sessions_aborted == 1);
    }

    SECTION("Empty session commits") {
        f.manager.unlock(ALICE, [](Session&) {});
        REQUIRE(f.manager.get_stats().sessions_committed == 1);
    }

    SECTION("Callback interface passes data through") {
        struct Echo : IUnlockCallback {
            Bytes unlock_callback(Session&, const Bytes& data) override { return data; }
        } echo;
        Bytes out = f.manager.unlock(ALICE, echo, Bytes{1, 2, 3});
        REQUIRE(out == Bytes{1, 2, 3});
    }
}

TEST_CASE("Sync, settle and take", "[manager][session]") {
    EngineFixture f;
    const Address engine = f.manager.engine_address();

    SECTION("Settle without sync credits nothing") {
        U256 paid = 1;
        f.manager.unlock(ALICE, [&](Session& s) { paid = f.manager.settle(s); });
        REQUIRE(paid == 0);
    }

    SECTION("Settle credits what arrived since sync") {
        I128 credited = 0;
        f.manager.unlock(ALICE, [&](Session& s) {
            f.manager.sync(s, TOKEN_A);
            f.custody.transfer(TOKEN_A, ALICE, engine, U256(250));
            REQUIRE(f.manager.settle(s) == 250);
            credited = s.currency_delta(ALICE, TOKEN_A);
            f.manager.take(s, TOKEN_A, BOB, 250);
        });
        REQUIRE(credited == 250);
        REQUIRE(f.custody.balance_of(TOKEN_A, BOB) == pow2(120) + 250);
        REQUIRE(f.custody.balance_of(TOKEN_A, engine) == 0);
    }

    SECTION("Settle for another recipient") {
        REQUIRE(code_of([&] {
            f.manager.unlock(ALICE, [&](Session& s) {
                f.manager.sync(s, TOKEN_A);
                f.custody.transfer(TOKEN_A, ALICE, engine, U256(10));
                f.manager.settle_for(s, BOB);
                REQUIRE(s.currency_delta(BOB, TOKEN_A) == 10);
                REQUIRE(s.currency_delta(ALICE, TOKEN_A) == 0);
            });
        }) == errors::CURRENCY_NOT_SETTLED);
        REQUIRE(f.custody.balance_of(TOKEN_A, ALICE) == pow2(120));
    }

    SECTION("Clear needs the exact positive delta") {
        REQUIRE(code_of([&] {
            f.manager.unlock(ALICE, [&](Session& s) {
                f.pay(s, TOKEN_A, ALICE, 99);
                f.manager.clear(s, TOKEN_A, 98);
            });
        }) == errors::MUST_CLEAR_EXACT_POSITIVE_DELTA);
        REQUIRE(f.custody.balance_of(TOKEN_A, ALICE) == pow2(120));
    }

    SECTION("Clear of the exact amount commits") {
        f.manager.unlock(ALICE, [&](Session& s) {
            f.pay(s, TOKEN_A, ALICE, 99);
            f.manager.clear(s, TOKEN_A, 99);
        });
        REQUIRE(f.custody.balance_of(TOKEN_A, engine) == 99);
    }

    SECTION("Taking more than the engine holds fails") {
        REQUIRE(code_of([&] {
            f.manager.unlock(ALICE, [&](Session& s) { f.manager.take(s, TOKEN_A, ALICE, 1); });
        }) == errors::INSUFFICIENT_BALANCE);
    }
}

TEST_CASE("Claims mint and burn", "[manager][claims]") {
    EngineFixture f;

    f.manager.unlock(ALICE, [&](Session& s) {
        f.pay(s, TOKEN_A, ALICE, 500);
        f.manager.mint(s, ALICE, TOKEN_A, 500);
    });
    REQUIRE(f.claims.balance_of(ALICE, TOKEN_A) == 500);
    REQUIRE(f.custody.balance_of(TOKEN_A, f.manager.engine_address()) == 500);

    SECTION("Burn pays for a take") {
        f.manager.unlock(ALICE, [&](Session& s) {
            f.manager.burn(s, ALICE, TOKEN_A, 200);
            f.manager.take(s, TOKEN_A, ALICE, 200);
        });
        REQUIRE(f.claims.balance_of(ALICE, TOKEN_A) == 300);
        REQUIRE(f.custody.balance_of(TOKEN_A, ALICE) == pow2(120) - 300);
    }

    SECTION("Burning another owner's claims needs permission") {
        REQUIRE(code_of([&] {
            f.manager.unlock(BOB, [&](Session& s) { f.manager.burn(s, ALICE, TOKEN_A, 1); });
        }) == errors::INSUFFICIENT_PERMISSION);

        f.claims.approve(ALICE, BOB, TOKEN_A, U256(100));
        f.manager.unlock(BOB, [&](Session& s) {
            f.manager.burn(s, ALICE, TOKEN_A, 100);
            f.manager.take(s, TOKEN_A, BOB, 100);
        });
        REQUIRE(f.claims.balance_of(ALICE, TOKEN_A) == 400);
        REQUIRE(f.custody.balance_of(TOKEN_A, BOB) == pow2(120) + 100);
    }
}

TEST_CASE("Aborted sessions leave no trace", "[manager][session]") {
    EngineFixture f;
    PoolKey key = make_key(3000, 60);
    PoolId id = key.to_id();
    f.initialize(key, PRICE_ONE);
    f.add_liquidity(key, -600, 600, i128_pow2(64));

    Slot0 slot0_before = *f.manager.get_slot0(id);
    U256 alice_a = f.custody.balance_of(TOKEN_A, ALICE);

    SECTION("Callback throws after real work") {
        REQUIRE_THROWS_AS(f.manager.unlock(ALICE, [&](Session& s) {
            f.manager.modify_liquidity(s, key, ModifyLiquidityParams{-1200, 1200, i128_pow2(64), 0});
            f.manager.swap(s, key, exact_in(true, 1000000));
            f.settle_deltas(s, key, ALICE);
            throw std::runtime_error("abort");
        }), std::runtime_error);

        REQUIRE(*f.manager.get_slot0(id) == slot0_before);
        REQUIRE(*f.manager.get_liquidity(id) == pow2_128(64));
        REQUIRE(f.manager.get_tick_info(id, -1200)->liquidity_gross == 0);
        REQUIRE(f.custody.balance_of(TOKEN_A, ALICE) == alice_a);
        REQUIRE_FALSE(f.manager.is_unlocked());
    }

    SECTION("A swallowed failure still aborts the session") {
        REQUIRE(code_of([&] {
            f.manager.unlock(BOB, [&](Session& s) {
                f.manager.swap(s, key, exact_in(true, 1000000));
                try {
                    f.manager.swap(s, key, SwapParams{true, -1000, PRICE_ONE});
                } catch (const AmmError&) {
                    // keep going as if nothing happened
                }
                f.settle_deltas(s, key, BOB);
            });
        }) == errors::PRICE_LIMIT_ALREADY_EXCEEDED);
        REQUIRE(*f.manager.get_slot0(id) == slot0_before);
        REQUIRE(f.custody.balance_of(TOKEN_A, BOB) == pow2(120));
    }
}

TEST_CASE("Collaborator failures abort the session", "[manager][session]") {
    FlakyCustody custody;
    ClaimsLedger claims;
    PoolManager manager(custody, claims, EngineFixture::make_config());
    custody.mint_to(TOKEN_A, manager.engine_address(), U256(1000));
    custody.mint_to(TOKEN_A, BOB, U256(1000));

    SECTION("A swallowed custody failure cannot commit the debit it left behind") {
        REQUIRE(code_of([&] {
            manager.unlock(BOB, [&](Session& s) {
                custody.offline = true;
                try {
                    manager.take(s, TOKEN_A, BOB, 100);
                } catch (const std::runtime_error&) {
                    // the take debited BOB before custody failed
                }
                REQUIRE(s.currency_delta(BOB, TOKEN_A) == -100);
                custody.offline = false;

                manager.sync(s, TOKEN_A);
                custody.transfer(TOKEN_A, BOB, manager.engine_address(), U256(100));
                manager.settle(s);
                REQUIRE(s.nonzero_delta_count() == 0);
            });
        }) == errors::COLLABORATOR_FAILED);

        REQUIRE(custody.balance_of(TOKEN_A, BOB) == 1000);
        REQUIRE(custody.balance_of(TOKEN_A, manager.engine_address()) == 1000);
        REQUIRE(manager.get_stats().sessions_committed == 0);
        REQUIRE(manager.get_stats().sessions_aborted == 1);
    }

    SECTION("An uncaught custody failure propagates and rolls back") {
        REQUIRE_THROWS_AS(manager.unlock(BOB, [&](Session& s) {
            custody.offline = true;
            manager.take(s, TOKEN_A, BOB, 100);
        }), std::runtime_error);

        REQUIRE(custody.balance_of(TOKEN_A, BOB) == 1000);
        REQUIRE_FALSE(manager.is_unlocked());
        REQUIRE(manager.get_stats().sessions_aborted == 1);
    }
}

// =============================================================================
// Protocol Fees
// =============================================================================

TEST_CASE("Protocol fees", "[manager][fees]") {
    EngineFixture f;
    PoolKey key = make_key(3000, 60);
    f.initialize(key, PRICE_ONE);
    f.add_liquidity(key, -600, 600, i128_pow2(64));

    SECTION("Only the controller sets them, within bounds") {
        REQUIRE(code_of([&] { f.manager.set_protocol_fee(ALICE, key, protocol_fee::pack(1000, 1000)); }) ==
                errors::INVALID_CALLER);
        REQUIRE(code_of([&] { f.manager.set_protocol_fee(CONTROLLER, key, protocol_fee::pack(1001, 0)); }) ==
                errors::PROTOCOL_FEE_TOO_LARGE);
        REQUIRE(code_of([&] { f.manager.set_protocol_fee(CONTROLLER, make_key(500, 10), 0); }) ==
                errors::POOL_NOT_INITIALIZED);
    }

    SECTION("Accrued on the input currency and collected by the controller") {
        f.manager.set_protocol_fee(CONTROLLER, key, protocol_fee::pack(1000, 1000));
        REQUIRE(f.manager.get_slot0(key.to_id())->protocol_fee() == protocol_fee::pack(1000, 1000));

        f.swap(key, exact_in(true, 1000000));
        REQUIRE(f.manager.protocol_fees_accrued(TOKEN_A) == 1000);
        REQUIRE(f.manager.protocol_fees_accrued(TOKEN_B) == 0);

        REQUIRE(code_of([&] { f.manager.collect_protocol_fees(ALICE, ALICE, TOKEN_A, U256(0)); }) ==
                errors::INVALID_CALLER);
        REQUIRE(code_of([&] { f.manager.collect_protocol_fees(CONTROLLER, CONTROLLER, TOKEN_A, U256(1001)); }) ==
                errors::INSUFFICIENT_BALANCE);

        REQUIRE(f.manager.collect_protocol_fees(CONTROLLER, CONTROLLER, TOKEN_A, U256(400)) == 400);
        REQUIRE(f.manager.collect_protocol_fees(CONTROLLER, CONTROLLER, TOKEN_A, U256(0)) == 600);
        REQUIRE(f.manager.protocol_fees_accrued(TOKEN_A) == 0);
        REQUIRE(f.custody.balance_of(TOKEN_A, CONTROLLER) == 1000);
    }

    SECTION("Not while the currency is synced") {
        REQUIRE(code_of([&] {
            f.manager.unlock(ALICE, [&](Session& s) {
                f.manager.sync(s, TOKEN_A);
                f.manager.collect_protocol_fees(CONTROLLER, CONTROLLER, TOKEN_A, U256(0));
            });
        }) == errors::PROTOCOL_FEE_CURRENCY_SYNCED);
    }

    SECTION("No controller configured") {
        InMemoryCustody custody;
        ClaimsLedger claims;
        PoolManager bare(custody, claims);
        REQUIRE(code_of([&] { bare.set_protocol_fee(Address{}, key, 0); }) == errors::INVALID_CALLER);
    }
}

// =============================================================================
// Queries
// =============================================================================

TEST_CASE("Queries on unknown pools are empty", "[manager][query]") {
    EngineFixture f;
    PoolId id = make_key(3000, 60).to_id();

    REQUIRE_FALSE(f.manager.pool_exists(id));
    REQUIRE_FALSE(f.manager.get_slot0(id).has_value());
    REQUIRE_FALSE(f.manager.get_liquidity(id).has_value());
    REQUIRE_FALSE(f.manager.get_fee_growth_globals(id).has_value());
    REQUIRE_FALSE(f.manager.get_tick_info(id, 0).has_value());
    REQUIRE_FALSE(f.manager.get_tick_bitmap(id, 0).has_value());
    REQUIRE_FALSE(f.manager.get_position(id, ALICE, -60, 60).has_value());
    REQUIRE_FALSE(f.manager.get_fee_growth_inside(id, -60, 60).has_value());
}

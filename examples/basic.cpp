// amm - Basic Usage Example
//
// Creates a pool, provides liquidity and swaps against it, settling every
// session through the in-memory custody.

#include <amm/amm.hpp>

#include <spdlog/spdlog.h>

#include <iostream>

namespace {

const amm::Address LP = amm::address_from_u64(0x1111);
const amm::Address TRADER = amm::address_from_u64(0x2222);
const amm::Currency USDC{amm::address_from_u64(0xA0)};
const amm::Currency WETH{amm::address_from_u64(0xB0)};

// Pay what the actor owes and take what it is owed on both currencies
void settle(amm::PoolManager& manager, amm::InMemoryCustody& custody, amm::Session& session,
            const amm::PoolKey& key, const amm::Address& wallet) {
    for (const amm::Currency& c : {key.currency0, key.currency1}) {
        amm::I128 delta = session.currency_delta(session.actor(), c);
        if (delta < 0) {
            manager.sync(session, c);
            custody.transfer(c, wallet, manager.engine_address(),
                             amm::to_u256(static_cast<amm::U128>(-delta)));
            manager.settle(session);
        } else if (delta > 0) {
            manager.take(session, c, wallet, static_cast<amm::U128>(delta));
        }
    }
}

void print_pool(const amm::PoolManager& manager, const amm::PoolKey& key) {
    amm::PoolId id = key.to_id();
    auto slot0 = manager.get_slot0(id);
    if (!slot0) {
        std::cout << "Pool " << id.to_hex() << " not initialized\n";
        return;
    }
    std::cout << "\n=== Pool " << id.to_hex().substr(0, 18) << "... ===\n";
    std::cout << "  sqrt_price_x96: " << slot0->sqrt_price_x96() << "\n";
    std::cout << "  tick:           " << slot0->tick() << "\n";
    std::cout << "  lp_fee:         " << slot0->lp_fee() << " pips\n";
    std::cout << "  liquidity:      " << amm::to_string(*manager.get_liquidity(id)) << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    amm::EngineConfig config;
    try {
        if (argc > 1) config = amm::EngineConfig::from_file(argv[1]);
        amm::init_logging(config.log_level);
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    amm::InMemoryCustody custody;
    amm::ClaimsLedger claims;
    amm::PoolManager manager(custody, claims, config);

    const amm::U256 funding = amm::U256(1) << 100;
    for (const amm::Address& user : {LP, TRADER}) {
        custody.mint_to(USDC, user, funding);
        custody.mint_to(WETH, user, funding);
    }

    amm::PoolKey key{USDC, WETH, 3000, 60, amm::Address{}};

    try {
        // Pool at price 1 with liquidity in [-6000, 6000]
        manager.unlock(LP, [&](amm::Session& s) {
            manager.initialize(s, key, amm::U256(1) << 96);
            auto [delta, fees] = manager.modify_liquidity(
                s, key, amm::ModifyLiquidityParams{-6000, 6000, static_cast<amm::I128>(1) << 80, 0});
            std::cout << "Added liquidity, owed: " << amm::to_string(delta.amount0()) << " / "
                      << amm::to_string(delta.amount1()) << "\n";
            settle(manager, custody, s, key, LP);
        });
        print_pool(manager, key);

        // Sell 1e18 USDC for WETH
        manager.unlock(TRADER, [&](amm::Session& s) {
            amm::BalanceDelta delta = manager.swap(
                s, key, amm::SwapParams{true, -static_cast<amm::I128>(1000000000000000000LL),
                                        amm::tick_math::MIN_SQRT_PRICE + 1});
            std::cout << "\nSwapped: paid " << amm::to_string(-delta.amount0()) << " USDC, received "
                      << amm::to_string(delta.amount1()) << " WETH\n";
            settle(manager, custody, s, key, TRADER);
        });
        print_pool(manager, key);
    } catch (const amm::AmmError& e) {
        spdlog::error("Session failed: {}", e.what());
        return 1;
    }

    auto stats = manager.get_stats();
    std::cout << "\nSessions committed: " << stats.sessions_committed
              << ", swaps: " << stats.total_swaps
              << ", liquidity ops: " << stats.total_liquidity_ops << "\n";
    return 0;
}

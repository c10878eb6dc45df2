#ifndef AMM_AMM_HPP
#define AMM_AMM_HPP

// =============================================================================
// amm - Singleton Concentrated-Liquidity Pool Manager
// =============================================================================

#include "types.hpp"
#include "errors.hpp"
#include "delta.hpp"
#include "fees.hpp"
#include "slot0.hpp"
#include "math.hpp"
#include "tick_bitmap.hpp"
#include "position.hpp"
#include "pool.hpp"
#include "session.hpp"
#include "transactional.hpp"
#include "custody.hpp"
#include "claims.hpp"
#include "pool_store.hpp"
#include "hooks.hpp"
#include "config.hpp"
#include "pool_manager.hpp"

namespace amm {

constexpr const char* VERSION = "1.0.0";

} // namespace amm

#endif // AMM_AMM_HPP

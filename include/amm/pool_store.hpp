#ifndef AMM_POOL_STORE_HPP
#define AMM_POOL_STORE_HPP

#include <map>
#include <optional>
#include <unordered_map>

#include "types.hpp"
#include "pool.hpp"
#include "transactional.hpp"

namespace amm {

// =============================================================================
// PoolStore - All Pools plus Protocol Fee Balances
// =============================================================================
//
// Inside a transaction the first mutable touch of a pool journals its prior
// value (or its absence); rollback restores exactly those entries.

class PoolStore : public ITransactional {
public:
    PoolStore() = default;

    const Pool* find(const PoolId& id) const;
    Pool* find_mut(const PoolId& id);

    // Creates an empty (uninitialized) pool when missing
    Pool& get_or_create(const PoolId& id);

    bool contains(const PoolId& id) const { return pools_.count(id) != 0; }
    size_t size() const { return pools_.size(); }

    // Protocol fees accrued per currency
    U256 protocol_fees_accrued(const Currency& currency) const;
    void add_protocol_fees(const Currency& currency, const U256& amount);
    void sub_protocol_fees(const Currency& currency, const U256& amount);

    void begin() override;
    void commit() override;
    void rollback() override;

private:
    void journal(const PoolId& id);

    std::unordered_map<PoolId, Pool, PoolIdHash> pools_;
    std::map<Currency, U256> protocol_fees_;

    bool in_transaction_ = false;
    std::unordered_map<PoolId, std::optional<Pool>, PoolIdHash> pool_journal_;
    std::optional<std::map<Currency, U256>> fees_snapshot_;
};

} // namespace amm

#endif // AMM_POOL_STORE_HPP

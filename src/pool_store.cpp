// =============================================================================
// pool_store.cpp - Journaled pool storage
// =============================================================================

#include "amm/pool_store.hpp"
#include "amm/errors.hpp"

namespace amm {

const Pool* PoolStore::find(const PoolId& id) const {
    auto it = pools_.find(id);
    return it == pools_.end() ? nullptr : &it->second;
}

Pool* PoolStore::find_mut(const PoolId& id) {
    auto it = pools_.find(id);
    if (it == pools_.end()) return nullptr;
    journal(id);
    return &it->second;
}

Pool& PoolStore::get_or_create(const PoolId& id) {
    journal(id);
    return pools_[id];
}

void PoolStore::journal(const PoolId& id) {
    if (!in_transaction_ || pool_journal_.count(id) != 0) return;

    auto it = pools_.find(id);
    if (it == pools_.end()) {
        pool_journal_.emplace(id, std::nullopt);
    } else {
        pool_journal_.emplace(id, it->second);
    }
}

// =============================================================================
// Protocol Fees
// =============================================================================

U256 PoolStore::protocol_fees_accrued(const Currency& currency) const {
    auto it = protocol_fees_.find(currency);
    return it == protocol_fees_.end() ? U256(0) : it->second;
}

void PoolStore::add_protocol_fees(const Currency& currency, const U256& amount) {
    if (amount == 0) return;
    if (in_transaction_ && !fees_snapshot_) fees_snapshot_ = protocol_fees_;
    protocol_fees_[currency] += amount;
}

void PoolStore::sub_protocol_fees(const Currency& currency, const U256& amount) {
    U256 accrued = protocol_fees_accrued(currency);
    if (accrued < amount) {
        fail(errors::INSUFFICIENT_BALANCE,
             "protocol fees accrued=" + to_string(accrued) + " amount=" + to_string(amount));
    }
    if (amount == 0) return;
    if (in_transaction_ && !fees_snapshot_) fees_snapshot_ = protocol_fees_;
    protocol_fees_[currency] = accrued - amount;
}

// =============================================================================
// Transactions
// =============================================================================

void PoolStore::begin() {
    in_transaction_ = true;
    pool_journal_.clear();
    fees_snapshot_.reset();
}

void PoolStore::commit() {
    in_transaction_ = false;
    pool_journal_.clear();
    fees_snapshot_.reset();
}

void PoolStore::rollback() {
    for (auto& [id, previous] : pool_journal_) {
        if (previous) {
            pools_[id] = std::move(*previous);
        } else {
            pools_.erase(id);
        }
    }
    if (fees_snapshot_) protocol_fees_ = std::move(*fees_snapshot_);

    in_transaction_ = false;
    pool_journal_.clear();
    fees_snapshot_.reset();
}

} // namespace amm

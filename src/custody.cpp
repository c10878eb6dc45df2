// =============================================================================
// custody.cpp - In-memory token custody
// =============================================================================

#include "amm/custody.hpp"
#include "amm/errors.hpp"

namespace amm {

U256 InMemoryCustody::balance_of(const Currency& currency, const Address& holder) const {
    auto it = balances_.find({currency, holder});
    return it == balances_.end() ? U256(0) : it->second;
}

void InMemoryCustody::transfer(const Currency& currency, const Address& from,
                               const Address& to, const U256& amount) {
    U256 from_balance = balance_of(currency, from);
    if (from_balance < amount) {
        fail(errors::INSUFFICIENT_BALANCE,
             "holder=" + to_hex(from) + " balance=" + to_string(from_balance) +
             " amount=" + to_string(amount));
    }
    if (amount == 0) return;

    balances_[{currency, from}] = from_balance - amount;
    balances_[{currency, to}] += amount;
    ++transfer_count_;
}

void InMemoryCustody::mint_to(const Currency& currency, const Address& holder, const U256& amount) {
    balances_[{currency, holder}] += amount;
}

void InMemoryCustody::begin() {
    snapshot_ = Snapshot{balances_, transfer_count_};
}

void InMemoryCustody::commit() {
    snapshot_.reset();
}

void InMemoryCustody::rollback() {
    if (!snapshot_) return;
    balances_ = std::move(snapshot_->balances);
    transfer_count_ = snapshot_->transfer_count;
    snapshot_.reset();
}

} // namespace amm

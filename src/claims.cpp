// =============================================================================
// claims.cpp - ClaimsLedger Implementation
// =============================================================================

#include "amm/claims.hpp"
#include "amm/errors.hpp"

namespace amm {

namespace {

const U256 UNLIMITED = ~U256(0);

} // anonymous namespace

// =============================================================================
// Queries
// =============================================================================

U256 ClaimsLedger::balance_of(const Address& owner, const Currency& id) const {
    auto it = state_.balances.find({owner, id});
    return it == state_.balances.end() ? U256(0) : it->second;
}

U256 ClaimsLedger::allowance(const Address& owner, const Address& spender, const Currency& id) const {
    auto it = state_.allowances.find(std::make_tuple(owner, spender, id));
    return it == state_.allowances.end() ? U256(0) : it->second;
}

bool ClaimsLedger::is_operator(const Address& owner, const Address& spender) const {
    return state_.operators.count({owner, spender}) != 0;
}

U256 ClaimsLedger::total_supply(const Currency& id) const {
    auto it = state_.supply.find(id);
    return it == state_.supply.end() ? U256(0) : it->second;
}

// =============================================================================
// Transfers
// =============================================================================

void ClaimsLedger::debit(const Address& owner, const Currency& id, const U256& amount) {
    U256 balance = balance_of(owner, id);
    if (balance < amount) {
        fail(errors::INSUFFICIENT_BALANCE,
             "owner=" + to_hex(owner) + " balance=" + to_string(balance) +
             " amount=" + to_string(amount));
    }
    U256 remaining = balance - amount;
    if (remaining == 0) {
        state_.balances.erase({owner, id});
    } else {
        state_.balances[{owner, id}] = remaining;
    }
}

void ClaimsLedger::spend_allowance(const Address& spender, const Address& from,
                                   const Currency& id, const U256& amount) {
    if (spender == from || is_operator(from, spender)) return;

    U256 allowed = allowance(from, spender, id);
    if (allowed == UNLIMITED) return;
    if (allowed < amount) {
        fail(errors::INSUFFICIENT_PERMISSION,
             "spender=" + to_hex(spender) + " allowance=" + to_string(allowed) +
             " amount=" + to_string(amount));
    }
    state_.allowances[std::make_tuple(from, spender, id)] = allowed - amount;
}

void ClaimsLedger::transfer(const Address& sender, const Address& to,
                            const Currency& id, const U256& amount) {
    debit(sender, id, amount);
    if (amount != 0) state_.balances[{to, id}] += amount;
}

void ClaimsLedger::transfer_from(const Address& spender, const Address& from, const Address& to,
                                 const Currency& id, const U256& amount) {
    spend_allowance(spender, from, id, amount);
    transfer(from, to, id, amount);
}

void ClaimsLedger::approve(const Address& owner, const Address& spender,
                           const Currency& id, const U256& amount) {
    state_.allowances[std::make_tuple(owner, spender, id)] = amount;
}

void ClaimsLedger::set_operator(const Address& owner, const Address& spender, bool approved) {
    if (approved) {
        state_.operators.insert({owner, spender});
    } else {
        state_.operators.erase({owner, spender});
    }
}

// =============================================================================
// Mint / Burn
// =============================================================================

void ClaimsLedger::mint(const Address& to, const Currency& id, const U256& amount) {
    if (amount == 0) return;
    state_.balances[{to, id}] += amount;
    state_.supply[id] += amount;
}

void ClaimsLedger::burn_from(const Address& spender, const Address& from,
                             const Currency& id, const U256& amount) {
    spend_allowance(spender, from, id, amount);
    debit(from, id, amount);
    if (amount != 0) state_.supply[id] -= amount;
}

// =============================================================================
// Transactions
// =============================================================================

void ClaimsLedger::begin() {
    snapshot_ = state_;
}

void ClaimsLedger::commit() {
    snapshot_.reset();
}

void ClaimsLedger::rollback() {
    if (!snapshot_) return;
    state_ = std::move(*snapshot_);
    snapshot_.reset();
}

} // namespace amm

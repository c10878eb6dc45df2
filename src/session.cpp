// =============================================================================
// session.cpp - Per-unlock currency delta ledger
// =============================================================================

#include "amm/session.hpp"
#include "amm/delta.hpp"

namespace amm {

Session::Session(const Address& locker) {
    actors_.push_back(locker);
}

void Session::pop_actor() {
    // The locker stays for the whole session
    if (actors_.size() > 1) actors_.pop_back();
}

void Session::account_delta(const Currency& currency, I128 amount, const Address& actor) {
    if (amount == 0) return;

    auto key = std::make_pair(actor, currency);
    auto it = deltas_.find(key);
    I128 previous = it == deltas_.end() ? 0 : it->second;
    I128 next = checked_add(previous, amount);

    if (next == 0) {
        --nonzero_count_;
        deltas_.erase(it);
    } else {
        if (previous == 0) {
            ++nonzero_count_;
            deltas_.emplace(key, next);
        } else {
            it->second = next;
        }
    }
}

I128 Session::currency_delta(const Address& actor, const Currency& currency) const {
    auto it = deltas_.find(std::make_pair(actor, currency));
    return it == deltas_.end() ? 0 : it->second;
}

std::vector<Session::OpenDelta> Session::open_deltas() const {
    std::vector<OpenDelta> out;
    out.reserve(deltas_.size());
    for (const auto& [key, delta] : deltas_) {
        out.push_back({key.first, key.second, delta});
    }
    return out;
}

void Session::set_synced(const Currency& currency, const U256& reserves) {
    synced_currency_ = currency;
    synced_reserves_ = reserves;
}

void Session::clear_synced() {
    synced_currency_.reset();
    synced_reserves_ = 0;
}

void Session::mark_failed(int32_t code, const std::string& detail) {
    // Keep the first failure; later ones are usually its consequences
    if (failed()) return;
    failed_code_ = code;
    failed_detail_ = detail;
}

} // namespace amm

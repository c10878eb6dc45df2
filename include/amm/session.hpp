#ifndef AMM_SESSION_HPP
#define AMM_SESSION_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace amm {

// =============================================================================
// Session - Flash Accounting Context for one unlock()
// =============================================================================
//
// Tracks what every actor owes (negative) or is owed (positive) per currency.
// An unlock succeeds only if every entry is back to zero.

class Session {
public:
    explicit Session(const Address& locker);

    // Non-copyable: operations identify the open session by address
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const Address& locker() const { return actors_.front(); }

    // Identity operations are performed as: the locker, or the hook being run
    const Address& actor() const { return actors_.back(); }
    void push_actor(const Address& actor) { actors_.push_back(actor); }
    void pop_actor();

    // =========================================================================
    // Currency Deltas
    // =========================================================================

    // Checked add; keeps the non-zero counter in step. Zero is a no-op.
    void account_delta(const Currency& currency, I128 amount, const Address& actor);

    I128 currency_delta(const Address& actor, const Currency& currency) const;
    uint64_t nonzero_delta_count() const { return nonzero_count_; }

    // (actor, currency, delta) for every open entry
    struct OpenDelta {
        Address actor;
        Currency currency;
        I128 delta;
    };
    std::vector<OpenDelta> open_deltas() const;

    // =========================================================================
    // Sync Checkpoint
    // =========================================================================

    void set_synced(const Currency& currency, const U256& reserves);
    void clear_synced();
    const std::optional<Currency>& synced_currency() const { return synced_currency_; }
    const U256& synced_reserves() const { return synced_reserves_; }

    // =========================================================================
    // Failure Tracking
    // =========================================================================

    // An operation failed inside this session. Its partial effects can only be
    // undone by rolling back the whole session, so unlock() refuses to commit.
    void mark_failed(int32_t code, const std::string& detail);
    bool failed() const { return failed_code_ != 0; }
    int32_t failed_code() const { return failed_code_; }
    const std::string& failed_detail() const { return failed_detail_; }

private:
    std::vector<Address> actors_;
    std::map<std::pair<Address, Currency>, I128> deltas_;
    uint64_t nonzero_count_ = 0;
    std::optional<Currency> synced_currency_;
    U256 synced_reserves_{0};
    int32_t failed_code_ = 0;
    std::string failed_detail_;
};

// Runs a hook under its own identity for the duration of a scope
class ActorScope {
public:
    ActorScope(Session& session, const Address& actor) : session_(session) {
        session_.push_actor(actor);
    }
    ~ActorScope() { session_.pop_actor(); }

    ActorScope(const ActorScope&) = delete;
    ActorScope& operator=(const ActorScope&) = delete;

private:
    Session& session_;
};

} // namespace amm

#endif // AMM_SESSION_HPP

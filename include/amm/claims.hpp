#ifndef AMM_CLAIMS_HPP
#define AMM_CLAIMS_HPP

#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <utility>

#include "types.hpp"
#include "transactional.hpp"

namespace amm {

// =============================================================================
// Claims Token - Multi-Token Ledger of Engine-Held Balances
// =============================================================================
//
// One token id per currency. Claims are minted when a session leaves value
// inside the engine instead of taking it out, and burned to pay with it.

class IClaimsToken {
public:
    virtual ~IClaimsToken() = default;

    virtual U256 balance_of(const Address& owner, const Currency& id) const = 0;
    virtual U256 allowance(const Address& owner, const Address& spender, const Currency& id) const = 0;
    virtual bool is_operator(const Address& owner, const Address& spender) const = 0;

    virtual void transfer(const Address& sender, const Address& to,
                          const Currency& id, const U256& amount) = 0;
    // Spender needs operator status or allowance (an unlimited allowance is not spent)
    virtual void transfer_from(const Address& spender, const Address& from, const Address& to,
                               const Currency& id, const U256& amount) = 0;
    virtual void approve(const Address& owner, const Address& spender,
                         const Currency& id, const U256& amount) = 0;
    virtual void set_operator(const Address& owner, const Address& spender, bool approved) = 0;

    virtual void mint(const Address& to, const Currency& id, const U256& amount) = 0;
    virtual void burn_from(const Address& spender, const Address& from,
                           const Currency& id, const U256& amount) = 0;
};

class ClaimsLedger : public IClaimsToken, public ITransactional {
public:
    ClaimsLedger() = default;

    U256 balance_of(const Address& owner, const Currency& id) const override;
    U256 allowance(const Address& owner, const Address& spender, const Currency& id) const override;
    bool is_operator(const Address& owner, const Address& spender) const override;

    void transfer(const Address& sender, const Address& to,
                  const Currency& id, const U256& amount) override;
    void transfer_from(const Address& spender, const Address& from, const Address& to,
                       const Currency& id, const U256& amount) override;
    void approve(const Address& owner, const Address& spender,
                 const Currency& id, const U256& amount) override;
    void set_operator(const Address& owner, const Address& spender, bool approved) override;

    void mint(const Address& to, const Currency& id, const U256& amount) override;
    void burn_from(const Address& spender, const Address& from,
                   const Currency& id, const U256& amount) override;

    // Sum of all balances of one id
    U256 total_supply(const Currency& id) const;

    void begin() override;
    void commit() override;
    void rollback() override;

private:
    using BalanceKey = std::pair<Address, Currency>;
    using AllowanceKey = std::tuple<Address, Address, Currency>;

    void spend_allowance(const Address& spender, const Address& from,
                         const Currency& id, const U256& amount);
    void debit(const Address& owner, const Currency& id, const U256& amount);

    struct State {
        std::map<BalanceKey, U256> balances;
        std::map<AllowanceKey, U256> allowances;
        std::set<std::pair<Address, Address>> operators;
        std::map<Currency, U256> supply;
    };

    State state_;
    std::optional<State> snapshot_;
};

} // namespace amm

#endif // AMM_CLAIMS_HPP

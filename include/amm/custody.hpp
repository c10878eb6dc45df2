#ifndef AMM_CUSTODY_HPP
#define AMM_CUSTODY_HPP

#include <map>
#include <optional>
#include <utility>

#include "types.hpp"
#include "transactional.hpp"

namespace amm {

// =============================================================================
// Asset Custody - External Token Balances
// =============================================================================

class IAssetCustody {
public:
    virtual ~IAssetCustody() = default;

    virtual U256 balance_of(const Currency& currency, const Address& holder) const = 0;

    // Throws InsufficientBalance when `from` holds less than `amount`
    virtual void transfer(const Currency& currency, const Address& from,
                          const Address& to, const U256& amount) = 0;
};

// Reference custody: balances held in memory, one map per (currency, holder)
class InMemoryCustody : public IAssetCustody, public ITransactional {
public:
    InMemoryCustody() = default;

    U256 balance_of(const Currency& currency, const Address& holder) const override;
    void transfer(const Currency& currency, const Address& from,
                  const Address& to, const U256& amount) override;

    // Credit `holder` out of thin air (fixtures, faucets)
    void mint_to(const Currency& currency, const Address& holder, const U256& amount);

    uint64_t transfer_count() const { return transfer_count_; }

    void begin() override;
    void commit() override;
    void rollback() override;

private:
    using BalanceKey = std::pair<Currency, Address>;

    std::map<BalanceKey, U256> balances_;
    uint64_t transfer_count_ = 0;

    struct Snapshot {
        std::map<BalanceKey, U256> balances;
        uint64_t transfer_count;
    };
    std::optional<Snapshot> snapshot_;
};

} // namespace amm

#endif // AMM_CUSTODY_HPP

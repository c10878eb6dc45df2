#ifndef AMM_TRANSACTIONAL_HPP
#define AMM_TRANSACTIONAL_HPP

#include <utility>
#include <vector>

namespace amm {

// =============================================================================
// Transactional State
// =============================================================================

// State that can be rolled back to the last begin()
class ITransactional {
public:
    virtual ~ITransactional() = default;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// Begins on construction; rolls every participant back unless commit() ran
class StateTransaction {
public:
    explicit StateTransaction(std::vector<ITransactional*> participants)
        : participants_(std::move(participants)) {
        for (ITransactional* p : participants_) p->begin();
    }

    ~StateTransaction() {
        if (!committed_) {
            for (ITransactional* p : participants_) p->rollback();
        }
    }

    StateTransaction(const StateTransaction&) = delete;
    StateTransaction& operator=(const StateTransaction&) = delete;

    void commit() {
        for (ITransactional* p : participants_) p->commit();
        committed_ = true;
    }

private:
    std::vector<ITransactional*> participants_;
    bool committed_ = false;
};

} // namespace amm

#endif // AMM_TRANSACTIONAL_HPP

#pragma once

#include "pool_types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace gp {

// Value movement between the pool's custody account and everyone else.
// Transfers may hand control to recipient code and must be treated as
// fallible. Savepoints give the caller host-level transaction semantics: a
// rollback undoes every movement recorded after the savepoint was taken.
class ValueTransfer {
public:
    using Savepoint = std::size_t;

    virtual ~ValueTransfer() = default;

    virtual bool receive(const Address& payer, Amount amount) = 0;
    virtual bool transfer(const Address& recipient, Amount amount) = 0;
    virtual Amount custodyBalance() const = 0;

    virtual Savepoint savepoint() = 0;
    virtual void rollback(Savepoint point) = 0;
    virtual void release(Savepoint point) = 0;
};

using ValueTransferPtr = std::shared_ptr<ValueTransfer>;

// In-process account book. Receive hooks stand in for recipient-supplied
// fallback logic; a hook that throws rejects the incoming transfer.
class Vault : public ValueTransfer {
public:
    using ReceiveHook = std::function<void(const Address& recipient, Amount amount)>;

    explicit Vault(Address custodyAccount);

    bool receive(const Address& payer, Amount amount) override;
    bool transfer(const Address& recipient, Amount amount) override;
    Amount custodyBalance() const override { return balanceOf(custody_); }

    Savepoint savepoint() override;
    void rollback(Savepoint point) override;
    void release(Savepoint point) override;

    void deposit(const Address& account, Amount amount);
    Amount balanceOf(const Address& account) const;
    const Address& custodyAccount() const { return custody_; }
    std::size_t openSavepoints() const { return openSavepoints_; }

    void setReceiveHook(const Address& account, ReceiveHook hook);
    void clearReceiveHook(const Address& account);

private:
    struct Movement {
        Address from;
        Address to;
        Amount amount;
    };

    bool move(const Address& from, const Address& to, Amount amount);
    void undo(const Movement& movement);

    Address custody_;
    std::map<Address, Amount> balances_;
    std::map<Address, ReceiveHook> hooks_;
    std::vector<Movement> journal_;
    std::size_t openSavepoints_ = 0;
};

} // namespace gp

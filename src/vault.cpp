#include "vault.hpp"

#include "checked_math.hpp"

#include <stdexcept>

namespace gp {

Vault::Vault(Address custodyAccount)
    : custody_(std::move(custodyAccount)) {
    if (custody_.empty()) {
        throw std::invalid_argument("custody account must not be empty");
    }
}

bool Vault::receive(const Address& payer, Amount amount) {
    if (payer == custody_) {
        return false;
    }
    return move(payer, custody_, amount);
}

bool Vault::transfer(const Address& recipient, Amount amount) {
    if (recipient.empty() || recipient == custody_) {
        return false;
    }
    Savepoint point = savepoint();
    if (!move(custody_, recipient, amount)) {
        release(point);
        return false;
    }

    auto hook = hooks_.find(recipient);
    if (hook != hooks_.end()) {
        // Copy so the hook may replace itself while running.
        ReceiveHook fallback = hook->second;
        // Any exception, whatever its type, is a rejection by the recipient.
        try {
            fallback(recipient, amount);
        } catch (...) {
            rollback(point);
            return false;
        }
    }
    release(point);
    return true;
}

bool Vault::move(const Address& from, const Address& to, Amount amount) {
    Amount available = balanceOf(from);
    if (amount > available) {
        return false;
    }
    Amount credited = checkedAdd(balanceOf(to), amount);
    balances_[from] = available - amount;
    balances_[to] = credited;
    if (openSavepoints_ > 0) {
        journal_.push_back(Movement{ from, to, amount });
    }
    return true;
}

void Vault::undo(const Movement& movement) {
    balances_[movement.to] = checkedSub(balanceOf(movement.to), movement.amount);
    balances_[movement.from] = checkedAdd(balanceOf(movement.from), movement.amount);
}

ValueTransfer::Savepoint Vault::savepoint() {
    ++openSavepoints_;
    return journal_.size();
}

void Vault::rollback(Savepoint point) {
    if (openSavepoints_ == 0 || point > journal_.size()) {
        throw std::logic_error("rollback without a matching savepoint");
    }
    while (journal_.size() > point) {
        undo(journal_.back());
        journal_.pop_back();
    }
    release(point);
}

void Vault::release(Savepoint point) {
    if (openSavepoints_ == 0 || point > journal_.size()) {
        throw std::logic_error("release without a matching savepoint");
    }
    --openSavepoints_;
    if (openSavepoints_ == 0) {
        journal_.clear();
    }
}

void Vault::deposit(const Address& account, Amount amount) {
    if (account.empty()) {
        throw std::invalid_argument("deposit account must not be empty");
    }
    balances_[account] = checkedAdd(balanceOf(account), amount);
}

Amount Vault::balanceOf(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

void Vault::setReceiveHook(const Address& account, ReceiveHook hook) {
    hooks_[account] = std::move(hook);
}

void Vault::clearReceiveHook(const Address& account) {
    hooks_.erase(account);
}

} // namespace gp

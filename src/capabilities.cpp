#include "capabilities.hpp"

#include "settlement_error.hpp"

#include <chrono>
#include <stdexcept>

namespace gp {

OperatorSet::OperatorSet(std::set<Address> operators)
    : operators_(std::move(operators)) {}

bool OperatorSet::isAuthorizedOperator(const Address& caller) const {
    return operators_.count(caller) != 0;
}

void OperatorSet::grant(const Address& account) {
    if (account.empty()) {
        throw std::invalid_argument("operator address must not be empty");
    }
    operators_.insert(account);
}

void OperatorSet::revoke(const Address& account) {
    operators_.erase(account);
}

CircuitBreaker::CircuitBreaker(AccessControlPtr access)
    : access_(std::move(access)) {
    if (!access_) {
        throw std::invalid_argument("circuit breaker requires an access control");
    }
}

void CircuitBreaker::pause(const Address& caller) {
    if (!access_->isAuthorizedOperator(caller)) {
        throw SettlementError(ErrorCode::Unauthorized, caller + " cannot pause");
    }
    paused_ = true;
}

void CircuitBreaker::unpause(const Address& caller) {
    if (!access_->isAuthorizedOperator(caller)) {
        throw SettlementError(ErrorCode::Unauthorized, caller + " cannot unpause");
    }
    paused_ = false;
}

void ReentrancyLock::enter() {
    if (held_) {
        throw SettlementError(ErrorCode::ReentrantCall, "operation already in progress");
    }
    held_ = true;
}

void ReentrancyLock::exit() {
    held_ = false;
}

ReentrancyScope::ReentrancyScope(ReentrancyGuard& guard)
    : guard_(guard) {
    guard_.enter();
}

ReentrancyScope::~ReentrancyScope() {
    guard_.exit();
}

Timestamp SystemClock::now() const {
    auto since = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(since).count());
}

} // namespace gp

#pragma once

#include "pool_types.hpp"

#include <memory>
#include <set>

namespace gp {

class AccessControl {
public:
    virtual ~AccessControl() = default;
    virtual bool isAuthorizedOperator(const Address& caller) const = 0;
};

class PauseSwitch {
public:
    virtual ~PauseSwitch() = default;
    virtual bool isPaused() const = 0;
};

class ReentrancyGuard {
public:
    virtual ~ReentrancyGuard() = default;
    // Throws SettlementError(ReentrantCall) when already entered.
    virtual void enter() = 0;
    virtual void exit() = 0;
};

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

using AccessControlPtr = std::shared_ptr<AccessControl>;
using PauseSwitchPtr = std::shared_ptr<PauseSwitch>;
using ReentrancyGuardPtr = std::shared_ptr<ReentrancyGuard>;
using ClockPtr = std::shared_ptr<Clock>;

class OperatorSet : public AccessControl {
public:
    OperatorSet() = default;
    explicit OperatorSet(std::set<Address> operators);

    bool isAuthorizedOperator(const Address& caller) const override;
    void grant(const Address& account);
    void revoke(const Address& account);

private:
    std::set<Address> operators_;
};

// Pause/unpause are themselves operator-gated through the supplied access control.
class CircuitBreaker : public PauseSwitch {
public:
    explicit CircuitBreaker(AccessControlPtr access);

    bool isPaused() const override { return paused_; }
    void pause(const Address& caller);
    void unpause(const Address& caller);

private:
    AccessControlPtr access_;
    bool paused_ = false;
};

class ReentrancyLock : public ReentrancyGuard {
public:
    void enter() override;
    void exit() override;
    bool held() const { return held_; }

private:
    bool held_ = false;
};

class ReentrancyScope {
public:
    explicit ReentrancyScope(ReentrancyGuard& guard);
    ~ReentrancyScope();

    ReentrancyScope(const ReentrancyScope&) = delete;
    ReentrancyScope& operator=(const ReentrancyScope&) = delete;

private:
    ReentrancyGuard& guard_;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_; }
    void advance(Timestamp seconds) { now_ += seconds; }

private:
    Timestamp now_;
};

} // namespace gp

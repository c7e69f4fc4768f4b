#pragma once

#include "audit_log.hpp"
#include "capabilities.hpp"
#include "notification.hpp"
#include "oracle.hpp"
#include "payout.hpp"
#include "pool_config.hpp"
#include "pool_ledger.hpp"
#include "vault.hpp"

#include <map>
#include <optional>
#include <vector>

namespace gp {

struct EngineCapabilities {
    AccessControlPtr access;
    PauseSwitchPtr pause;
    ReentrancyGuardPtr guard;
    ValueTransferPtr transfers;
    ClockPtr clock;
    OraclePtr oracle; // optional; needed only for resolutions without a supplied outcome
};

struct PoolTotals {
    Amount sideA = 0;
    Amount sideB = 0;
};

struct OddsView {
    std::uint64_t oddsA = 0;
    std::uint64_t oddsB = 0;
};

// Drives the event lifecycle on top of the pool ledger and performs every
// value transfer. Each public mutating call is a single transaction: it runs
// under the reentrancy guard and either commits fully or is rolled back
// (ledger, vault movements, audit entries and notifications) before the
// error propagates.
class SettlementEngine {
public:
    SettlementEngine(PoolConfig config, EngineCapabilities caps);

    EventId createEvent(const Address& caller);
    void placeBet(const Address& caller, Side side, Amount value);
    OracleObservation resolveEvent(const Address& caller,
                                   EventId eventId,
                                   std::optional<bool> outcome = std::nullopt);
    void cancelEvent(const Address& caller, EventId eventId);
    PayoutBreakdown claimWinnings(const Address& caller, EventId eventId);

    // Operator break-glass path, only while paused. Moves custody funds
    // without touching the ledger, so held-value accounting no longer
    // matches the custody balance afterwards.
    void emergencyWithdraw(const Address& caller, const Address& recipient, Amount amount);

    EventStatus eventStatus(EventId eventId) const;
    StakeView stakeOf(EventId eventId, const Address& bettor) const;
    PoolTotals poolTotals(EventId eventId) const;
    OddsView currentOdds(EventId eventId) const;
    Amount heldValue(EventId eventId) const;
    std::optional<EventId> currentEventId() const { return ledger_.latestEventId(); }
    std::optional<OracleObservation> observation(EventId eventId) const;
    Amount totalWithdrawn() const { return totalWithdrawn_; }

    const EventRecord& event(EventId eventId) const { return ledger_.event(eventId); }
    const PoolLedger& ledger() const { return ledger_; }
    const AuditLog& auditLog() const { return auditLog_; }
    std::string auditRoot() const { return auditLog_.merkleRoot(); }

    // The sink sees each committed notification after the operation has
    // released the reentrancy guard, so it may call back into the engine.
    // Exceptions it throws are logged and counted; they never change the
    // outcome of the operation that produced the notification.
    void setNotificationSink(NotificationSink sink) { sink_ = std::move(sink); }
    std::uint64_t sinkFailures() const { return sinkFailures_; }

private:
    class Transaction;

    void requireOperator(const Address& caller, const char* action) const;
    EventId requireActiveEvent() const;
    void emit(Notification note);
    std::vector<Notification> flushPending();
    void deliver(const std::vector<Notification>& committed);

    PoolConfig config_;
    EngineCapabilities caps_;
    PoolLedger ledger_;
    AuditLog auditLog_;
    NotificationSink sink_;
    std::vector<Notification> pending_;
    std::map<EventId, OracleObservation> observations_;
    std::uint64_t sequence_ = 0;
    Amount totalWithdrawn_ = 0;
    std::uint64_t sinkFailures_ = 0;
};

} // namespace gp

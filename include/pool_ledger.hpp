#pragma once

#include "pool_types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace gp {

struct BetRecord {
    Side side = Side::A;
    Amount amount = 0;
    bool claimed = false;
};

struct EventRecord {
    EventId id = 0;
    Timestamp startTime = 0;
    EventStatus status = EventStatus::Open;
    bool outcome = false; // true: side A won. Meaningful only once resolved.
    Amount totalStakeA = 0;
    Amount totalStakeB = 0;
    std::uint64_t oddsA = 0;
    std::uint64_t oddsB = 0;
    Amount paidOut = 0;
    std::map<Address, BetRecord> bets;
    std::vector<Address> participants; // first-bet order, no duplicates

    Amount sideTotal(Side side) const { return side == Side::A ? totalStakeA : totalStakeB; }
    Amount heldValue() const;
    bool isTerminal() const { return status != EventStatus::Open; }
};

struct StakeView {
    Side side = Side::A;
    Amount amount = 0;
};

// Enough of an event to undo one operation: the scalar fields, the length of
// the participant list and the prior records of the named bettors (nullopt if
// the bettor had none).
struct EventCheckpoint {
    EventId id = 0;
    EventStatus status = EventStatus::Open;
    bool outcome = false;
    Amount totalStakeA = 0;
    Amount totalStakeB = 0;
    std::uint64_t oddsA = 0;
    std::uint64_t oddsB = 0;
    Amount paidOut = 0;
    std::size_t participantCount = 0;
    std::vector<std::pair<Address, std::optional<BetRecord>>> bets;
};

struct LedgerLimits {
    Amount minBet = 1;
    Amount maxBet = 0; // 0 disables the upper bound
    std::uint64_t oddsScale = 1000;
};

// Per-event bookkeeping. Never moves funds; callers have already taken
// custody of any value recorded here.
class PoolLedger {
public:
    explicit PoolLedger(LedgerLimits limits = {});

    EventId openEvent(Timestamp startTime);
    void recordBet(EventId eventId, const Address& bettor, Side side, Amount amount);
    void recomputeOdds(EventId eventId);
    StakeView getStake(EventId eventId, const Address& bettor) const;

    void markResolved(EventId eventId, bool outcome);
    void markCancelled(EventId eventId);

    // Both return the stake that was settled and leave the record zeroed and
    // flagged as claimed.
    Amount consumeClaim(EventId eventId, const Address& bettor);
    Amount consumeRefund(EventId eventId, const Address& bettor);
    void recordPayout(EventId eventId, Amount amount);

    bool hasEvent(EventId eventId) const { return events_.count(eventId) != 0; }
    const EventRecord& event(EventId eventId) const;
    std::optional<EventId> latestEventId() const;
    const std::vector<Address>& participants(EventId eventId) const;
    Amount stakeSum(EventId eventId, Side side) const;

    // Cost is proportional to `bettors`, not to the size of the event.
    EventCheckpoint checkpoint(EventId eventId, const std::vector<Address>& bettors) const;
    void restore(const EventCheckpoint& saved);

private:
    EventRecord& mutableEvent(EventId eventId);
    void validateAmount(Amount amount) const;

    std::map<EventId, EventRecord> events_;
    EventId lastId_ = 0;
    LedgerLimits limits_;
};

} // namespace gp

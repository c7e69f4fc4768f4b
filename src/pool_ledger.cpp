#include "pool_ledger.hpp"

#include "checked_math.hpp"
#include "settlement_error.hpp"

#include <cstddef>
#include <sstream>
#include <stdexcept>

#include <boost/multiprecision/cpp_int.hpp>

namespace gp {

namespace {

using Wide = boost::multiprecision::checked_uint128_t;

std::string eventLabel(EventId eventId) {
    std::ostringstream oss;
    oss << "event " << eventId;
    return oss.str();
}

std::uint64_t scaledShare(Amount part, Amount total, std::uint64_t scale) {
    Wide scaled = Wide(part) * Wide(scale);
    scaled /= Wide(total);
    return scaled.convert_to<std::uint64_t>();
}

} // namespace

Amount EventRecord::heldValue() const {
    return checkedSub(checkedAdd(totalStakeA, totalStakeB), paidOut);
}

PoolLedger::PoolLedger(LedgerLimits limits)
    : limits_(limits) {
    if (limits_.oddsScale == 0 || limits_.oddsScale % 2 != 0) {
        throw std::invalid_argument("odds scale must be a positive even number");
    }
    if (limits_.minBet == 0) {
        limits_.minBet = 1;
    }
    if (limits_.maxBet != 0 && limits_.minBet > limits_.maxBet) {
        throw std::invalid_argument("minimum bet exceeds maximum bet");
    }
}

EventId PoolLedger::openEvent(Timestamp startTime) {
    EventRecord record;
    record.id = lastId_ + 1;
    record.startTime = startTime;
    record.oddsA = limits_.oddsScale / 2;
    record.oddsB = limits_.oddsScale / 2;
    events_.emplace(record.id, std::move(record));
    lastId_ += 1;
    return lastId_;
}

void PoolLedger::validateAmount(Amount amount) const {
    if (amount == 0) {
        throw SettlementError(ErrorCode::InvalidAmount, "stake must be positive");
    }
    if (amount < limits_.minBet) {
        std::ostringstream oss;
        oss << "stake " << amount << " below minimum " << limits_.minBet;
        throw SettlementError(ErrorCode::InvalidAmount, oss.str());
    }
    if (limits_.maxBet != 0 && amount > limits_.maxBet) {
        std::ostringstream oss;
        oss << "stake " << amount << " above maximum " << limits_.maxBet;
        throw SettlementError(ErrorCode::InvalidAmount, oss.str());
    }
}

void PoolLedger::recordBet(EventId eventId, const Address& bettor, Side side, Amount amount) {
    EventRecord& record = mutableEvent(eventId);
    if (record.status != EventStatus::Open) {
        throw SettlementError(ErrorCode::EventNotOpen, eventLabel(eventId));
    }
    validateAmount(amount);
    if (bettor.empty()) {
        throw std::invalid_argument("bettor address must not be empty");
    }

    auto existing = record.bets.find(bettor);
    if (existing != record.bets.end() && existing->second.amount > 0 &&
        existing->second.side != side) {
        throw SettlementError(ErrorCode::SideConflict,
                              bettor + " already holds a stake on side " +
                                  toString(existing->second.side));
    }

    Amount newSideTotal = checkedAdd(record.sideTotal(side), amount);
    Amount newStake = checkedAdd(existing == record.bets.end() ? 0 : existing->second.amount, amount);
    // The combined pool must also stay representable for held-value queries.
    (void)checkedAdd(newSideTotal, record.sideTotal(side == Side::A ? Side::B : Side::A));

    if (existing == record.bets.end()) {
        record.participants.push_back(bettor);
        existing = record.bets.emplace(bettor, BetRecord{}).first;
    }
    existing->second.side = side;
    existing->second.amount = newStake;
    if (side == Side::A) {
        record.totalStakeA = newSideTotal;
    } else {
        record.totalStakeB = newSideTotal;
    }
    recomputeOdds(eventId);
}

void PoolLedger::recomputeOdds(EventId eventId) {
    EventRecord& record = mutableEvent(eventId);
    Amount total = checkedAdd(record.totalStakeA, record.totalStakeB);
    if (total == 0) {
        record.oddsA = limits_.oddsScale / 2;
        record.oddsB = limits_.oddsScale / 2;
        return;
    }
    // Each side reports the opposing side's share of the pool.
    record.oddsA = scaledShare(record.totalStakeB, total, limits_.oddsScale);
    record.oddsB = scaledShare(record.totalStakeA, total, limits_.oddsScale);
}

StakeView PoolLedger::getStake(EventId eventId, const Address& bettor) const {
    const EventRecord& record = event(eventId);
    auto it = record.bets.find(bettor);
    if (it == record.bets.end()) {
        return StakeView{};
    }
    return StakeView{ it->second.side, it->second.amount };
}

void PoolLedger::markResolved(EventId eventId, bool outcome) {
    EventRecord& record = mutableEvent(eventId);
    if (record.status == EventStatus::Resolved) {
        throw SettlementError(ErrorCode::AlreadyResolved, eventLabel(eventId));
    }
    if (record.status == EventStatus::Cancelled) {
        throw SettlementError(ErrorCode::AlreadyTerminal, eventLabel(eventId) + " was cancelled");
    }
    record.status = EventStatus::Resolved;
    record.outcome = outcome;
}

void PoolLedger::markCancelled(EventId eventId) {
    EventRecord& record = mutableEvent(eventId);
    if (record.isTerminal()) {
        throw SettlementError(ErrorCode::AlreadyTerminal, eventLabel(eventId));
    }
    record.status = EventStatus::Cancelled;
}

Amount PoolLedger::consumeClaim(EventId eventId, const Address& bettor) {
    EventRecord& record = mutableEvent(eventId);
    if (record.status != EventStatus::Resolved) {
        throw SettlementError(ErrorCode::EventNotResolved, eventLabel(eventId));
    }
    auto it = record.bets.find(bettor);
    if (it != record.bets.end() && it->second.claimed) {
        throw SettlementError(ErrorCode::AlreadyClaimed, bettor + " on " + eventLabel(eventId));
    }
    if (it == record.bets.end() || it->second.amount == 0 ||
        it->second.side != winningSide(record.outcome)) {
        throw SettlementError(ErrorCode::NoWinningStake, bettor + " on " + eventLabel(eventId));
    }
    Amount stake = it->second.amount;
    it->second.claimed = true;
    it->second.amount = 0;
    return stake;
}

Amount PoolLedger::consumeRefund(EventId eventId, const Address& bettor) {
    EventRecord& record = mutableEvent(eventId);
    if (record.status != EventStatus::Cancelled) {
        throw SettlementError(ErrorCode::EventNotOpen, eventLabel(eventId) + " is not cancelled");
    }
    auto it = record.bets.find(bettor);
    if (it == record.bets.end()) {
        throw std::invalid_argument(bettor + " is not a participant of " + eventLabel(eventId));
    }
    if (it->second.claimed) {
        throw SettlementError(ErrorCode::AlreadyClaimed, bettor + " on " + eventLabel(eventId));
    }
    Amount stake = it->second.amount;
    it->second.claimed = true;
    it->second.amount = 0;
    return stake;
}

void PoolLedger::recordPayout(EventId eventId, Amount amount) {
    EventRecord& record = mutableEvent(eventId);
    Amount paid = checkedAdd(record.paidOut, amount);
    if (paid > checkedAdd(record.totalStakeA, record.totalStakeB)) {
        throw std::underflow_error("payout exceeds value held for " + eventLabel(eventId));
    }
    record.paidOut = paid;
}

const EventRecord& PoolLedger::event(EventId eventId) const {
    auto it = events_.find(eventId);
    if (it == events_.end()) {
        throw SettlementError(ErrorCode::UnknownEvent, eventLabel(eventId));
    }
    return it->second;
}

EventRecord& PoolLedger::mutableEvent(EventId eventId) {
    auto it = events_.find(eventId);
    if (it == events_.end()) {
        throw SettlementError(ErrorCode::UnknownEvent, eventLabel(eventId));
    }
    return it->second;
}

std::optional<EventId> PoolLedger::latestEventId() const {
    if (lastId_ == 0) {
        return std::nullopt;
    }
    return lastId_;
}

const std::vector<Address>& PoolLedger::participants(EventId eventId) const {
    return event(eventId).participants;
}

Amount PoolLedger::stakeSum(EventId eventId, Side side) const {
    const EventRecord& record = event(eventId);
    Amount sum = 0;
    for (const auto& [bettor, bet] : record.bets) {
        (void)bettor;
        if (bet.side == side) {
            sum = checkedAdd(sum, bet.amount);
        }
    }
    return sum;
}

EventCheckpoint PoolLedger::checkpoint(EventId eventId, const std::vector<Address>& bettors) const {
    const EventRecord& record = event(eventId);
    EventCheckpoint saved;
    saved.id = record.id;
    saved.status = record.status;
    saved.outcome = record.outcome;
    saved.totalStakeA = record.totalStakeA;
    saved.totalStakeB = record.totalStakeB;
    saved.oddsA = record.oddsA;
    saved.oddsB = record.oddsB;
    saved.paidOut = record.paidOut;
    saved.participantCount = record.participants.size();
    saved.bets.reserve(bettors.size());
    for (const auto& bettor : bettors) {
        auto it = record.bets.find(bettor);
        if (it == record.bets.end()) {
            saved.bets.emplace_back(bettor, std::nullopt);
        } else {
            saved.bets.emplace_back(bettor, it->second);
        }
    }
    return saved;
}

void PoolLedger::restore(const EventCheckpoint& saved) {
    EventRecord& record = mutableEvent(saved.id);
    record.status = saved.status;
    record.outcome = saved.outcome;
    record.totalStakeA = saved.totalStakeA;
    record.totalStakeB = saved.totalStakeB;
    record.oddsA = saved.oddsA;
    record.oddsB = saved.oddsB;
    record.paidOut = saved.paidOut;
    for (const auto& [bettor, bet] : saved.bets) {
        if (bet) {
            record.bets[bettor] = *bet;
        } else {
            record.bets.erase(bettor);
        }
    }
    if (record.participants.size() > saved.participantCount) {
        record.participants.erase(record.participants.begin() + static_cast<std::ptrdiff_t>(saved.participantCount),
                                  record.participants.end());
    }
}

} // namespace gp

#include "settlement_engine.hpp"

#include "checked_math.hpp"
#include "settlement_error.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace gp {

namespace {

std::string eventLabel(EventId eventId) {
    std::ostringstream oss;
    oss << "event " << eventId;
    return oss.str();
}

LedgerLimits limitsFrom(const PoolConfig& cfg) {
    LedgerLimits limits;
    limits.minBet = cfg.minBet;
    limits.maxBet = cfg.maxBet;
    limits.oddsScale = cfg.oddsScale;
    return limits;
}

const PoolConfig& validated(const PoolConfig& cfg) {
    validatePoolConfig(cfg);
    return cfg;
}

Side losingSide(Side winner) {
    return winner == Side::A ? Side::B : Side::A;
}

} // namespace

// Undo scope for one public operation. Holds a vault savepoint, a checkpoint
// of the event fields and bettor records being touched, and the
// notification high-water marks; anything not committed is put back when the
// scope unwinds.
class SettlementEngine::Transaction {
public:
    Transaction(SettlementEngine& engine,
                std::optional<EventId> touched,
                const std::vector<Address>& bettors = {})
        : engine_(engine)
        , backup_(touched ? std::optional<EventCheckpoint>(engine.ledger_.checkpoint(*touched, bettors))
                          : std::nullopt)
        , savepoint_(engine.caps_.transfers->savepoint())
        , sequence_(engine.sequence_)
        , withdrawn_(engine.totalWithdrawn_) {}

    ~Transaction() {
        if (committed_) {
            return;
        }
        engine_.caps_.transfers->rollback(savepoint_);
        if (backup_) {
            engine_.ledger_.restore(*backup_);
        }
        engine_.pending_.clear();
        engine_.sequence_ = sequence_;
        engine_.totalWithdrawn_ = withdrawn_;
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        engine_.caps_.transfers->release(savepoint_);
        committed_ = true;
    }

private:
    SettlementEngine& engine_;
    std::optional<EventCheckpoint> backup_;
    ValueTransfer::Savepoint savepoint_;
    std::uint64_t sequence_;
    Amount withdrawn_;
    bool committed_ = false;
};

SettlementEngine::SettlementEngine(PoolConfig config, EngineCapabilities caps)
    : config_(std::move(config))
    , caps_(std::move(caps))
    , ledger_(limitsFrom(validated(config_))) {
    if (!caps_.access || !caps_.pause || !caps_.guard || !caps_.transfers || !caps_.clock) {
        throw std::invalid_argument("settlement engine requires access, pause, guard, transfer and clock capabilities");
    }
}

void SettlementEngine::requireOperator(const Address& caller, const char* action) const {
    if (!caps_.access->isAuthorizedOperator(caller)) {
        throw SettlementError(ErrorCode::Unauthorized, caller + " may not " + action);
    }
}

EventId SettlementEngine::requireActiveEvent() const {
    auto latest = ledger_.latestEventId();
    if (!latest || ledger_.event(*latest).status != EventStatus::Open) {
        throw SettlementError(ErrorCode::NoActiveEvent, "no event is accepting bets");
    }
    return *latest;
}

void SettlementEngine::emit(Notification note) {
    note.sequence = ++sequence_;
    note.timestamp = caps_.clock->now();
    pending_.push_back(std::move(note));
}

std::vector<Notification> SettlementEngine::flushPending() {
    std::vector<Notification> ready;
    ready.swap(pending_);
    for (const auto& note : ready) {
        auditLog_.append(encodeNotification(note));
    }
    return ready;
}

// Runs once the guard is released. The operation has already committed, so a
// failing sink is logged and counted but never reported as the operation's
// failure.
void SettlementEngine::deliver(const std::vector<Notification>& committed) {
    NotificationSink sink = sink_;
    if (!sink) {
        return;
    }
    for (const auto& note : committed) {
        try {
            sink(note);
        } catch (const std::exception& ex) {
            ++sinkFailures_;
            std::cerr << "Notification sink failed on #" << note.sequence << " " << toString(note.kind)
                      << ": " << ex.what() << "\n";
        } catch (...) {
            ++sinkFailures_;
            std::cerr << "Notification sink failed on #" << note.sequence << " " << toString(note.kind)
                      << ": unknown exception\n";
        }
    }
}

EventId SettlementEngine::createEvent(const Address& caller) {
    EventId id = 0;
    std::vector<Notification> committed;
    {
        ReentrancyScope scope(*caps_.guard);
        requireOperator(caller, "create events");

        auto latest = ledger_.latestEventId();
        if (latest && !ledger_.event(*latest).isTerminal()) {
            throw SettlementError(ErrorCode::PriorEventUnterminated, eventLabel(*latest) + " is still open");
        }

        Transaction tx(*this, std::nullopt);
        id = ledger_.openEvent(caps_.clock->now());
        Notification note;
        note.kind = NotificationKind::EventCreated;
        note.eventId = id;
        note.account = caller;
        emit(std::move(note));
        tx.commit();
        committed = flushPending();
    }
    deliver(committed);
    return id;
}

void SettlementEngine::placeBet(const Address& caller, Side side, Amount value) {
    std::vector<Notification> committed;
    {
        ReentrancyScope scope(*caps_.guard);
        if (caps_.pause->isPaused()) {
            throw SettlementError(ErrorCode::SystemPaused, "betting is paused");
        }
        EventId id = requireActiveEvent();
        if (config_.bettingDuration != 0) {
            const EventRecord& record = ledger_.event(id);
            Timestamp now = caps_.clock->now();
            if (now >= record.startTime && now - record.startTime >= config_.bettingDuration) {
                throw SettlementError(ErrorCode::BettingWindowClosed, eventLabel(id));
            }
        }

        Transaction tx(*this, id, { caller });
        ledger_.recordBet(id, caller, side, value);
        if (!caps_.transfers->receive(caller, value)) {
            throw SettlementError(ErrorCode::InsufficientFunds, caller + " could not fund the stake");
        }
        Notification note;
        note.kind = NotificationKind::BetPlaced;
        note.eventId = id;
        note.account = caller;
        note.side = side;
        note.amount = value;
        emit(std::move(note));
        tx.commit();
        committed = flushPending();
    }
    deliver(committed);
}

OracleObservation SettlementEngine::resolveEvent(const Address& caller,
                                                 EventId eventId,
                                                 std::optional<bool> outcome) {
    OracleObservation observed;
    std::vector<Notification> committed;
    {
        ReentrancyScope scope(*caps_.guard);
        const bool timeBoxed = config_.bettingDuration != 0;
        // A supplied outcome is a trusted-oracle statement; without a deadline
        // there is no public resolution path either.
        if (outcome || !timeBoxed) {
            requireOperator(caller, "resolve events");
        }
        if (!ledger_.hasEvent(eventId)) {
            throw SettlementError(ErrorCode::NoActiveEvent, eventLabel(eventId) + " does not exist");
        }
        const EventRecord& record = ledger_.event(eventId);
        if (record.status == EventStatus::Resolved) {
            throw SettlementError(ErrorCode::AlreadyResolved, eventLabel(eventId));
        }
        if (record.status == EventStatus::Cancelled) {
            throw SettlementError(ErrorCode::AlreadyTerminal, eventLabel(eventId) + " was cancelled");
        }
        if (timeBoxed) {
            Timestamp now = caps_.clock->now();
            if (now < record.startTime || now - record.startTime < config_.bettingDuration) {
                throw SettlementError(ErrorCode::WindowNotElapsed, eventLabel(eventId));
            }
        }

        if (outcome) {
            observed.outcome = *outcome;
            observed.source = "operator:" + caller;
        } else {
            if (!caps_.oracle) {
                throw SettlementError(ErrorCode::OracleUnavailable, "no outcome oracle configured");
            }
            ResolutionContext ctx;
            ctx.eventId = eventId;
            ctx.now = caps_.clock->now();
            ctx.totalStakeA = record.totalStakeA;
            ctx.totalStakeB = record.totalStakeB;
            observed = caps_.oracle->decide(ctx);
        }

        Transaction tx(*this, eventId);
        ledger_.markResolved(eventId, observed.outcome);
        Notification note;
        note.kind = NotificationKind::EventResolved;
        note.eventId = eventId;
        note.account = caller;
        note.side = winningSide(observed.outcome);
        note.outcome = observed.outcome;
        note.detail = observed.source;
        if (!observed.evidence.empty()) {
            note.detail += ":" + observed.evidence;
        }
        emit(std::move(note));
        tx.commit();
        observations_[eventId] = observed;
        committed = flushPending();
    }
    deliver(committed);
    return observed;
}

void SettlementEngine::cancelEvent(const Address& caller, EventId eventId) {
    std::vector<Notification> committed;
    {
        ReentrancyScope scope(*caps_.guard);
        requireOperator(caller, "cancel events");
        if (ledger_.event(eventId).isTerminal()) {
            throw SettlementError(ErrorCode::AlreadyTerminal, eventLabel(eventId));
        }

        // Every participant is refunded, so the checkpoint covers them all.
        const std::vector<Address> participants = ledger_.participants(eventId);
        Transaction tx(*this, eventId, participants);
        ledger_.markCancelled(eventId);
        Notification cancelled;
        cancelled.kind = NotificationKind::EventCancelled;
        cancelled.eventId = eventId;
        cancelled.account = caller;
        emit(std::move(cancelled));

        struct Refund {
            Address bettor;
            Side side;
            Amount amount;
        };
        std::vector<Refund> refunds;
        refunds.reserve(participants.size());
        for (const auto& bettor : participants) {
            Side side = ledger_.getStake(eventId, bettor).side;
            Amount amount = ledger_.consumeRefund(eventId, bettor);
            if (amount == 0) {
                continue;
            }
            ledger_.recordPayout(eventId, amount);
            refunds.push_back({ bettor, side, amount });
        }

        for (const auto& refund : refunds) {
            if (!caps_.transfers->transfer(refund.bettor, refund.amount)) {
                throw SettlementError(ErrorCode::PayoutFailed, "refund to " + refund.bettor + " failed");
            }
            Notification note;
            note.kind = NotificationKind::StakeRefunded;
            note.eventId = eventId;
            note.account = refund.bettor;
            note.side = refund.side;
            note.amount = refund.amount;
            emit(std::move(note));
        }
        tx.commit();
        committed = flushPending();
    }
    deliver(committed);
}

PayoutBreakdown SettlementEngine::claimWinnings(const Address& caller, EventId eventId) {
    PayoutBreakdown payout;
    std::vector<Notification> committed;
    {
        ReentrancyScope scope(*caps_.guard);
        if (config_.pauseBlocksClaims && caps_.pause->isPaused()) {
            throw SettlementError(ErrorCode::SystemPaused, "claims are paused");
        }
        const EventRecord& record = ledger_.event(eventId);

        Transaction tx(*this, eventId, { caller });
        Amount stake = ledger_.consumeClaim(eventId, caller);
        Side winner = winningSide(record.outcome);
        payout = computePayout(stake,
                               record.sideTotal(winner),
                               record.sideTotal(losingSide(winner)),
                               config_.charitySplit);
        ledger_.recordPayout(eventId, checkedAdd(payout.user, payout.charity));

        Notification note;
        note.kind = NotificationKind::WinningsClaimed;
        note.eventId = eventId;
        note.account = caller;
        note.side = winner;
        note.amount = payout.user;
        note.charityAmount = payout.charity;
        emit(std::move(note));

        // State is final before any recipient code can run.
        if (payout.charity > 0 && !caps_.transfers->transfer(config_.charityAccount, payout.charity)) {
            throw SettlementError(ErrorCode::PayoutFailed, "charity transfer failed");
        }
        if (!caps_.transfers->transfer(caller, payout.user)) {
            throw SettlementError(ErrorCode::PayoutFailed, "payout to " + caller + " failed");
        }
        tx.commit();
        committed = flushPending();
    }
    deliver(committed);
    return payout;
}

void SettlementEngine::emergencyWithdraw(const Address& caller, const Address& recipient, Amount amount) {
    std::vector<Notification> committed;
    {
        ReentrancyScope scope(*caps_.guard);
        requireOperator(caller, "withdraw custody funds");
        if (!caps_.pause->isPaused()) {
            throw SettlementError(ErrorCode::NotPaused, "emergency withdrawal requires the pool to be paused");
        }
        if (amount == 0) {
            throw SettlementError(ErrorCode::InvalidAmount, "withdrawal must be positive");
        }
        if (amount > caps_.transfers->custodyBalance()) {
            throw SettlementError(ErrorCode::InsufficientFunds, "withdrawal exceeds custody balance");
        }

        Transaction tx(*this, std::nullopt);
        totalWithdrawn_ = checkedAdd(totalWithdrawn_, amount);
        Notification note;
        note.kind = NotificationKind::EmergencyWithdrawal;
        note.account = recipient;
        note.amount = amount;
        note.detail = "operator:" + caller;
        emit(std::move(note));
        if (!caps_.transfers->transfer(recipient, amount)) {
            throw SettlementError(ErrorCode::PayoutFailed, "withdrawal to " + recipient + " failed");
        }
        tx.commit();
        committed = flushPending();
    }
    deliver(committed);
}

EventStatus SettlementEngine::eventStatus(EventId eventId) const {
    return ledger_.event(eventId).status;
}

StakeView SettlementEngine::stakeOf(EventId eventId, const Address& bettor) const {
    return ledger_.getStake(eventId, bettor);
}

PoolTotals SettlementEngine::poolTotals(EventId eventId) const {
    const EventRecord& record = ledger_.event(eventId);
    return PoolTotals{ record.totalStakeA, record.totalStakeB };
}

OddsView SettlementEngine::currentOdds(EventId eventId) const {
    const EventRecord& record = ledger_.event(eventId);
    return OddsView{ record.oddsA, record.oddsB };
}

Amount SettlementEngine::heldValue(EventId eventId) const {
    return ledger_.event(eventId).heldValue();
}

std::optional<OracleObservation> SettlementEngine::observation(EventId eventId) const {
    auto it = observations_.find(eventId);
    if (it == observations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace gp

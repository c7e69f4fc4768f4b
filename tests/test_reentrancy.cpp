#include "pool_fixture.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using gp::ErrorCode;
using gp::Side;
using gp::testing::PoolFixture;
using gp::testing::errorCodeOf;

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "reentrancy_test failure: " << msg << std::endl;
    std::exit(1);
}

// Resolved 300/100 pool with "mallory" holding 100 on the winning side.
gp::EventId seedResolvedPool(PoolFixture& pool) {
    auto id = pool.engine->createEvent("operator");
    pool.bet("mallory", Side::A, 100);
    pool.bet("bob", Side::A, 200);
    pool.bet("carol", Side::B, 100);
    pool.engine->resolveEvent("operator", id, true);
    return id;
}

void checkReentrantClaimRejected() {
    PoolFixture pool;
    auto id = seedResolvedPool(pool);

    int reentries = 0;
    std::optional<ErrorCode> reentryResult;
    gp::StakeView stakeSeenDuringTransfer;
    pool.vault->setReceiveHook("mallory", [&](const gp::Address&, gp::Amount) {
        ++reentries;
        stakeSeenDuringTransfer = pool.engine->stakeOf(id, "mallory");
        reentryResult = errorCodeOf([&] { pool.engine->claimWinnings("mallory", id); });
        // Swallowing the failure keeps the outer transfer alive.
    });

    auto payout = pool.engine->claimWinnings("mallory", id);
    if (reentries != 1 || reentryResult != ErrorCode::ReentrantCall) {
        fail("nested claim should be rejected by the guard");
    }
    if (stakeSeenDuringTransfer.amount != 0) {
        fail("stake must already be zeroed when recipient code runs");
    }
    if (payout.user != 117 || pool.vault->balanceOf("mallory") != 117) {
        fail("original claim should complete exactly once");
    }
    if (pool.guard->held()) {
        fail("guard must be released after the claim");
    }

    pool.vault->clearReceiveHook("mallory");
    if (errorCodeOf([&] { pool.engine->claimWinnings("mallory", id); }) != ErrorCode::AlreadyClaimed) {
        fail("later claim must fail with AlreadyClaimed");
    }
}

void checkReentrantBetRejected() {
    PoolFixture pool;
    auto id = seedResolvedPool(pool);
    auto next = gp::EventId{ 0 };
    pool.vault->setReceiveHook("mallory", [&](const gp::Address&, gp::Amount) {
        if (errorCodeOf([&] { next = pool.engine->createEvent("operator"); }) != ErrorCode::ReentrantCall) {
            throw std::runtime_error("create slipped past the guard");
        }
        if (errorCodeOf([&] { pool.engine->placeBet("mallory", Side::A, 10); }) != ErrorCode::ReentrantCall) {
            throw std::runtime_error("bet slipped past the guard");
        }
    });
    pool.engine->claimWinnings("mallory", id);
    if (next != 0 || pool.engine->currentEventId() != id) {
        fail("no event may be created from inside a transfer");
    }
}

void checkFailedTransferRollsBack() {
    PoolFixture pool;
    auto id = seedResolvedPool(pool);
    auto logSize = pool.engine->auditLog().size();
    auto custody = pool.vault->custodyBalance();

    pool.vault->setReceiveHook("mallory", [](const gp::Address&, gp::Amount) {
        throw std::runtime_error("recipient rejects payment");
    });
    if (errorCodeOf([&] { pool.engine->claimWinnings("mallory", id); }) != ErrorCode::PayoutFailed) {
        fail("rejected transfer should surface as PayoutFailed");
    }

    const auto& bet = pool.engine->event(id).bets.at("mallory");
    if (bet.claimed || bet.amount != 100) {
        fail("failed claim must leave the stake record untouched");
    }
    if (pool.engine->event(id).paidOut != 0 || pool.engine->heldValue(id) != 400) {
        fail("failed claim must not count as paid");
    }
    // Charity leg already went through before the user leg failed.
    if (pool.vault->balanceOf("charity") != 0 || pool.vault->custodyBalance() != custody) {
        fail("failed claim must undo the charity transfer too");
    }
    if (pool.engine->auditLog().size() != logSize) {
        fail("failed claim must not be logged");
    }

    pool.vault->clearReceiveHook("mallory");
    auto payout = pool.engine->claimWinnings("mallory", id);
    if (payout.user != 117 || pool.vault->balanceOf("charity") != 16) {
        fail("claim should succeed once the recipient accepts funds");
    }
}

void checkRejectingCharityBlocksClaim() {
    PoolFixture pool;
    auto id = seedResolvedPool(pool);
    pool.vault->setReceiveHook("charity", [](const gp::Address&, gp::Amount) {
        throw std::runtime_error("charity wallet offline");
    });
    if (errorCodeOf([&] { pool.engine->claimWinnings("bob", id); }) != ErrorCode::PayoutFailed) {
        fail("charity transfer failure must fail the claim");
    }
    if (pool.vault->balanceOf("bob") != 0 || pool.engine->event(id).bets.at("bob").claimed) {
        fail("no partial payout may remain");
    }
}

void checkNonStandardHookExceptionRejectsTransfer() {
    PoolFixture pool;
    auto id = seedResolvedPool(pool);
    pool.vault->setReceiveHook("mallory", [](const gp::Address&, gp::Amount) { throw 7; });
    if (errorCodeOf([&] { pool.engine->claimWinnings("mallory", id); }) != ErrorCode::PayoutFailed) {
        fail("a hook throwing a non-standard exception still rejects the transfer");
    }
    if (pool.vault->openSavepoints() != 0) {
        fail("rejected transfer must close every savepoint");
    }
    if (pool.vault->balanceOf("charity") != 0 || pool.vault->custodyBalance() != 400) {
        fail("rejected transfer must be fully undone");
    }
}

void checkThrowingSinkKeepsCommittedBet() {
    PoolFixture pool;
    auto& engine = *pool.engine;
    auto id = engine.createEvent("operator");
    engine.setNotificationSink([](const gp::Notification&) { throw std::runtime_error("sink down"); });

    auto logSize = engine.auditLog().size();
    pool.fund("alice", 100);
    if (errorCodeOf([&] { engine.placeBet("alice", Side::A, 100); })) {
        fail("a failing sink must not fail a committed bet");
    }
    if (engine.poolTotals(id).sideA != 100 || pool.vault->balanceOf("alice") != 0 ||
        pool.vault->custodyBalance() != 100 || engine.auditLog().size() != logSize + 1) {
        fail("the bet should stand in full");
    }
    if (engine.sinkFailures() != 1 || pool.guard->held()) {
        fail("sink failure should be counted and the guard released");
    }

    engine.setNotificationSink([](const gp::Notification&) { throw 42; });
    pool.bet("bob", Side::B, 30);
    if (engine.poolTotals(id).sideB != 30 || engine.sinkFailures() != 2) {
        fail("non-standard sink exceptions are contained too");
    }
}

void checkSinkMayCallEngine() {
    PoolFixture pool;
    auto& engine = *pool.engine;
    auto id = engine.createEvent("operator");

    std::optional<ErrorCode> nested;
    bool cancelled = false;
    engine.setNotificationSink([&](const gp::Notification& note) {
        if (note.kind == gp::NotificationKind::BetPlaced && !cancelled) {
            cancelled = true;
            nested = errorCodeOf([&] { engine.cancelEvent("operator", id); });
        }
    });
    pool.bet("alice", Side::A, 25);
    if (!cancelled || nested) {
        fail("the sink runs outside the guard and may call the engine");
    }
    if (engine.eventStatus(id) != gp::EventStatus::Cancelled || pool.vault->balanceOf("alice") != 25) {
        fail("cancel issued from the sink should refund the bettor");
    }
    if (engine.sinkFailures() != 0) {
        fail("no sink failure expected");
    }
}

} // namespace

int main() {
    checkReentrantClaimRejected();
    checkReentrantBetRejected();
    checkFailedTransferRollsBack();
    checkRejectingCharityBlocksClaim();
    checkNonStandardHookExceptionRejectsTransfer();
    checkThrowingSinkKeepsCommittedBet();
    checkSinkMayCallEngine();
    std::cout << "reentrancy_test passed" << std::endl;
    return 0;
}

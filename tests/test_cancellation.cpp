#include "pool_fixture.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using gp::ErrorCode;
using gp::Side;
using gp::testing::PoolFixture;
using gp::testing::errorCodeOf;

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "cancellation_test failure: " << msg << std::endl;
    std::exit(1);
}

void checkRefundsOriginalStakes() {
    PoolFixture pool;
    auto& engine = *pool.engine;
    auto id = engine.createEvent("operator");
    pool.bet("alice", Side::A, 70);
    pool.bet("bob", Side::B, 20);
    pool.bet("alice", Side::A, 30);
    pool.bet("carol", Side::B, 5);

    std::vector<gp::Notification> refunds;
    engine.setNotificationSink([&](const gp::Notification& note) {
        if (note.kind == gp::NotificationKind::StakeRefunded) {
            refunds.push_back(note);
        }
    });

    if (errorCodeOf([&] { engine.cancelEvent("alice", id); }) != ErrorCode::Unauthorized) {
        fail("cancel is operator-only");
    }
    engine.cancelEvent("operator", id);

    if (pool.vault->balanceOf("alice") != 100 || pool.vault->balanceOf("bob") != 20 ||
        pool.vault->balanceOf("carol") != 5) {
        fail("every bettor should get the original stake back");
    }
    if (pool.vault->balanceOf("charity") != 0 || pool.vault->custodyBalance() != 0) {
        fail("refunds carry no charity share and empty custody");
    }
    if (engine.heldValue(id) != 0) {
        fail("cancelled event should hold nothing");
    }
    for (const auto& bettor : { "alice", "bob", "carol" }) {
        if (engine.stakeOf(id, bettor).amount != 0) {
            fail("refunded stake records must be zeroed");
        }
    }
    if (refunds.size() != 3 || refunds[0].account != "alice" || refunds[1].account != "bob" ||
        refunds[2].account != "carol") {
        fail("refunds should follow first-bet order");
    }

    if (errorCodeOf([&] { engine.cancelEvent("operator", id); }) != ErrorCode::AlreadyTerminal) {
        fail("second cancel must fail");
    }
    if (errorCodeOf([&] { engine.resolveEvent("operator", id, true); }) != ErrorCode::AlreadyTerminal) {
        fail("cancelled event cannot be resolved");
    }
    if (errorCodeOf([&] { engine.claimWinnings("alice", id); }) != ErrorCode::EventNotResolved) {
        fail("cancelled event has no winnings");
    }
    if (engine.createEvent("operator") != id + 1) {
        fail("a cancelled event is terminal, so a new one may start");
    }
}

void checkFailedRefundRevertsCancel() {
    PoolFixture pool;
    auto& engine = *pool.engine;
    auto id = engine.createEvent("operator");
    pool.bet("alice", Side::A, 40);
    pool.bet("mallory", Side::B, 60);

    pool.vault->setReceiveHook("mallory", [](const gp::Address&, gp::Amount) {
        throw std::runtime_error("refuses refunds");
    });
    auto logSize = engine.auditLog().size();
    if (errorCodeOf([&] { engine.cancelEvent("operator", id); }) != ErrorCode::PayoutFailed) {
        fail("failing refund should fail the cancel");
    }
    if (engine.eventStatus(id) != gp::EventStatus::Open) {
        fail("failed cancel must leave the event open");
    }
    if (pool.vault->balanceOf("alice") != 0 || pool.vault->custodyBalance() != 100) {
        fail("refunds already sent must be undone");
    }
    if (engine.stakeOf(id, "alice").amount != 40 || engine.auditLog().size() != logSize) {
        fail("stake records and audit log must be restored");
    }

    pool.vault->clearReceiveHook("mallory");
    engine.cancelEvent("operator", id);
    if (pool.vault->balanceOf("mallory") != 60) {
        fail("cancel should succeed once refunds are accepted");
    }
}

void checkPersistentRejecterBlocksCancel() {
    PoolFixture pool;
    auto& engine = *pool.engine;
    auto id = engine.createEvent("operator");
    pool.bet("alice", Side::A, 40);
    pool.bet("mallory", Side::B, 60);
    pool.vault->setReceiveHook("mallory", [](const gp::Address&, gp::Amount) {
        throw std::runtime_error("never accepts refunds");
    });

    for (int attempt = 0; attempt < 3; ++attempt) {
        if (errorCodeOf([&] { engine.cancelEvent("operator", id); }) != ErrorCode::PayoutFailed) {
            fail("a recipient that always rejects keeps the cancel failing");
        }
    }
    if (errorCodeOf([&] { engine.createEvent("operator"); }) != ErrorCode::PriorEventUnterminated) {
        fail("the stuck event blocks the next one");
    }

    // Resolution moves no funds, so it is the operator's way out.
    engine.resolveEvent("operator", id, true);
    if (engine.createEvent("operator") != id + 1) {
        fail("a resolved event frees the pool for the next one");
    }
    auto payout = engine.claimWinnings("alice", id);
    if (payout.user != 70 || payout.charity != 30 || pool.vault->balanceOf("alice") != 70) {
        fail("winners claim normally after the fallback resolution");
    }
}

void checkCancelEmptyEvent() {
    PoolFixture pool;
    auto id = pool.engine->createEvent("operator");
    pool.engine->cancelEvent("operator", id);
    if (pool.engine->eventStatus(id) != gp::EventStatus::Cancelled) {
        fail("an event without bets can be cancelled");
    }
    if (errorCodeOf([&] { pool.engine->cancelEvent("operator", 42); }) != ErrorCode::UnknownEvent) {
        fail("unknown event id must be rejected");
    }
}

} // namespace

int main() {
    checkRefundsOriginalStakes();
    checkFailedRefundRevertsCancel();
    checkPersistentRejecterBlocksCancel();
    checkCancelEmptyEvent();
    std::cout << "cancellation_test passed" << std::endl;
    return 0;
}

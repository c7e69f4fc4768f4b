#pragma once

#include "pool_types.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace gp {

enum class NotificationKind : std::uint8_t {
    EventCreated = 1,
    BetPlaced = 2,
    EventResolved = 3,
    EventCancelled = 4,
    WinningsClaimed = 5,
    StakeRefunded = 6,
    EmergencyWithdrawal = 7
};

struct Notification {
    NotificationKind kind = NotificationKind::EventCreated;
    std::uint64_t sequence = 0;
    EventId eventId = 0;
    Timestamp timestamp = 0;
    Address account;
    Side side = Side::A;
    Amount amount = 0;        // stake, user payout, refund or withdrawal
    Amount charityAmount = 0; // WinningsClaimed only
    bool outcome = false;     // EventResolved only
    std::string detail;
};

using NotificationSink = std::function<void(const Notification&)>;

const char* toString(NotificationKind kind);

// Canonical little-endian record:
// | kind u8 | sequence u64 | eventId u64 | timestamp u64 | side u8 | outcome u8 |
// | amount u64 | charityAmount u64 | len-prefixed account | len-prefixed detail |
std::string encodeNotification(const Notification& note);

std::string describe(const Notification& note);

} // namespace gp

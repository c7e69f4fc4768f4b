#include "notification.hpp"

#include <sstream>

namespace gp {

namespace {

void writeU8(std::string& out, std::uint8_t v) {
    out.push_back(static_cast<char>(v));
}

void writeU64(std::string& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

void writeString(std::string& out, const std::string& s) {
    writeU64(out, static_cast<std::uint64_t>(s.size()));
    out.append(s);
}

} // namespace

const char* toString(NotificationKind kind) {
    switch (kind) {
    case NotificationKind::EventCreated:
        return "event-created";
    case NotificationKind::BetPlaced:
        return "bet-placed";
    case NotificationKind::EventResolved:
        return "event-resolved";
    case NotificationKind::EventCancelled:
        return "event-cancelled";
    case NotificationKind::WinningsClaimed:
        return "winnings-claimed";
    case NotificationKind::StakeRefunded:
        return "stake-refunded";
    case NotificationKind::EmergencyWithdrawal:
        return "emergency-withdrawal";
    }
    return "unknown";
}

std::string encodeNotification(const Notification& note) {
    std::string out;
    out.reserve(64 + note.account.size() + note.detail.size());
    writeU8(out, static_cast<std::uint8_t>(note.kind));
    writeU64(out, note.sequence);
    writeU64(out, note.eventId);
    writeU64(out, note.timestamp);
    writeU8(out, note.side == Side::A ? 0 : 1);
    writeU8(out, note.outcome ? 1 : 0);
    writeU64(out, note.amount);
    writeU64(out, note.charityAmount);
    writeString(out, note.account);
    writeString(out, note.detail);
    return out;
}

std::string describe(const Notification& note) {
    std::ostringstream oss;
    oss << "#" << note.sequence << " " << toString(note.kind) << " event=" << note.eventId;
    switch (note.kind) {
    case NotificationKind::BetPlaced:
        oss << " bettor=" << note.account << " side=" << toString(note.side)
            << " stake=" << note.amount;
        break;
    case NotificationKind::EventResolved:
        oss << " winner=" << toString(winningSide(note.outcome));
        break;
    case NotificationKind::WinningsClaimed:
        oss << " bettor=" << note.account << " payout=" << note.amount
            << " charity=" << note.charityAmount;
        break;
    case NotificationKind::StakeRefunded:
        oss << " bettor=" << note.account << " refund=" << note.amount;
        break;
    case NotificationKind::EmergencyWithdrawal:
        oss << " recipient=" << note.account << " amount=" << note.amount;
        break;
    default:
        break;
    }
    if (!note.detail.empty()) {
        oss << " (" << note.detail << ")";
    }
    return oss.str();
}

} // namespace gp

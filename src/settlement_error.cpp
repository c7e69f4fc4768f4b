#include "settlement_error.hpp"

namespace gp {

namespace {

std::string formatMessage(ErrorCode code, const std::string& detail) {
    std::string out = toString(code);
    if (!detail.empty()) {
        out += ": ";
        out += detail;
    }
    return out;
}

} // namespace

const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::Unauthorized:
        return "Unauthorized";
    case ErrorCode::SystemPaused:
        return "SystemPaused";
    case ErrorCode::NotPaused:
        return "NotPaused";
    case ErrorCode::ReentrantCall:
        return "ReentrantCall";
    case ErrorCode::UnknownEvent:
        return "UnknownEvent";
    case ErrorCode::NoActiveEvent:
        return "NoActiveEvent";
    case ErrorCode::EventNotOpen:
        return "EventNotOpen";
    case ErrorCode::PriorEventUnterminated:
        return "PriorEventUnterminated";
    case ErrorCode::BettingWindowClosed:
        return "BettingWindowClosed";
    case ErrorCode::WindowNotElapsed:
        return "WindowNotElapsed";
    case ErrorCode::AlreadyResolved:
        return "AlreadyResolved";
    case ErrorCode::AlreadyTerminal:
        return "AlreadyTerminal";
    case ErrorCode::EventNotResolved:
        return "EventNotResolved";
    case ErrorCode::OracleUnavailable:
        return "OracleUnavailable";
    case ErrorCode::InvalidAmount:
        return "InvalidAmount";
    case ErrorCode::SideConflict:
        return "SideConflict";
    case ErrorCode::AlreadyClaimed:
        return "AlreadyClaimed";
    case ErrorCode::NoWinningStake:
        return "NoWinningStake";
    case ErrorCode::PayoutFailed:
        return "PayoutFailed";
    case ErrorCode::InsufficientFunds:
        return "InsufficientFunds";
    }
    return "UnknownError";
}

ErrorCategory categoryOf(ErrorCode code) {
    switch (code) {
    case ErrorCode::Unauthorized:
        return ErrorCategory::Authorization;
    case ErrorCode::InvalidAmount:
    case ErrorCode::UnknownEvent:
        return ErrorCategory::Validation;
    case ErrorCode::SideConflict:
    case ErrorCode::AlreadyClaimed:
    case ErrorCode::ReentrantCall:
        return ErrorCategory::Conflict;
    case ErrorCode::PayoutFailed:
    case ErrorCode::InsufficientFunds:
        return ErrorCategory::Transfer;
    default:
        return ErrorCategory::State;
    }
}

const char* toString(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::Authorization:
        return "authorization";
    case ErrorCategory::State:
        return "state";
    case ErrorCategory::Validation:
        return "validation";
    case ErrorCategory::Conflict:
        return "conflict";
    case ErrorCategory::Transfer:
        return "transfer";
    }
    return "unknown";
}

SettlementError::SettlementError(ErrorCode code, const std::string& detail)
    : std::runtime_error(formatMessage(code, detail))
    , code_(code) {}

} // namespace gp

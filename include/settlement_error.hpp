#pragma once

#include <stdexcept>
#include <string>

namespace gp {

enum class ErrorCategory { Authorization, State, Validation, Conflict, Transfer };

enum class ErrorCode {
    Unauthorized,
    SystemPaused,
    NotPaused,
    ReentrantCall,
    UnknownEvent,
    NoActiveEvent,
    EventNotOpen,
    PriorEventUnterminated,
    BettingWindowClosed,
    WindowNotElapsed,
    AlreadyResolved,
    AlreadyTerminal,
    EventNotResolved,
    OracleUnavailable,
    InvalidAmount,
    SideConflict,
    AlreadyClaimed,
    NoWinningStake,
    PayoutFailed,
    InsufficientFunds
};

const char* toString(ErrorCode code);
ErrorCategory categoryOf(ErrorCode code);
const char* toString(ErrorCategory category);

// Every rejected pool operation surfaces as a SettlementError; the operation
// has already been rolled back by the time it propagates.
class SettlementError : public std::runtime_error {
public:
    SettlementError(ErrorCode code, const std::string& detail);

    ErrorCode code() const { return code_; }
    ErrorCategory category() const { return categoryOf(code_); }

private:
    ErrorCode code_;
};

} // namespace gp

#pragma once
#include <stdexcept>
#include <string>
#include <variant>

enum class EscrowErrorCode {
    Unauthorized,
    InvalidState,
    TimingViolation,
    AmountMismatch,
    AlreadyInState,
    NotFound,
    InvalidArgument,
    TransferFailed,
    EventSinkFailure,
};

inline const char* to_cstr(EscrowErrorCode c) {
    switch (c) {
        case EscrowErrorCode::Unauthorized:     return "unauthorized";
        case EscrowErrorCode::InvalidState:     return "invalid_state";
        case EscrowErrorCode::TimingViolation:  return "timing_violation";
        case EscrowErrorCode::AmountMismatch:   return "amount_mismatch";
        case EscrowErrorCode::AlreadyInState:   return "already_in_state";
        case EscrowErrorCode::NotFound:         return "not_found";
        case EscrowErrorCode::InvalidArgument:  return "invalid_argument";
        case EscrowErrorCode::TransferFailed:   return "transfer_failed";
        case EscrowErrorCode::EventSinkFailure: return "event_sink_failure";
    }
    return "?";
}

struct EscrowError {
    EscrowErrorCode code;
    std::string message;
};

// Result of an engine write: either the committed value or the violated precondition.
template <typename T>
using Outcome = std::variant<T, EscrowError>;

// Raised by a value ledger or asset registry that refuses a movement.
class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised by an event sink that could not record an event.
class EventSinkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

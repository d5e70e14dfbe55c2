#pragma once
#include <initializer_list>
#include <utility>

#include "core/error.hpp"
#include "core/transaction.hpp"

// Runs `body(scope)` inside an OperationScope over `participants`. A ledger or
// event sink failure unwinds the scope (restoring every mutation made so far)
// and comes back as an EscrowError.
template <typename T, typename Body>
Outcome<T> run_in_scope(std::initializer_list<ITransactional*> participants, Body&& body) {
    try {
        OperationScope scope{participants};
        T result = std::forward<Body>(body)(scope);
        scope.commit();
        return result;
    } catch (const LedgerError& e) {
        return EscrowError{EscrowErrorCode::TransferFailed, e.what()};
    } catch (const EventSinkError& e) {
        return EscrowError{EscrowErrorCode::EventSinkFailure, e.what()};
    }
}

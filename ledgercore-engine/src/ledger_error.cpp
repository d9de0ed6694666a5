#include "ledger_error.hpp"

namespace ledgercore {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::UNBALANCED_ENTRY: return "UNBALANCED_ENTRY";
        case ErrorKind::ZERO_VALUE_ENTRY: return "ZERO_VALUE_ENTRY";
        case ErrorKind::INVALID_ACCOUNT: return "INVALID_ACCOUNT";
        case ErrorKind::INVALID_LINE: return "INVALID_LINE";
        case ErrorKind::PERIOD_CLOSED: return "PERIOD_CLOSED";
        case ErrorKind::PERIOD_HAS_UNPOSTED: return "PERIOD_HAS_UNPOSTED";
        case ErrorKind::ALREADY_REVERSED: return "ALREADY_REVERSED";
        case ErrorKind::NOT_POSTED: return "NOT_POSTED";
        case ErrorKind::REVERSAL_NOT_REVERSIBLE: return "REVERSAL_NOT_REVERSIBLE";
        case ErrorKind::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case ErrorKind::OVERPAYMENT: return "OVERPAYMENT";
        case ErrorKind::DUPLICATE_REFERENCE: return "DUPLICATE_REFERENCE";
        case ErrorKind::APPROVAL_DENIED: return "APPROVAL_DENIED";
        case ErrorKind::NOT_FOUND: return "NOT_FOUND";
        case ErrorKind::INVALID_STATE: return "INVALID_STATE";
        case ErrorKind::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case ErrorKind::TRANSACTION_TIMEOUT: return "TRANSACTION_TIMEOUT";
        case ErrorKind::PERSISTENCE_FAILURE: return "PERSISTENCE_FAILURE";
        case ErrorKind::CONFIG_ERROR: return "CONFIG_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace ledgercore

#include "journal.hpp"

namespace ledgercore {

std::string entry_status_to_string(EntryStatus status) {
    switch (status) {
        case EntryStatus::Draft: return "DRAFT";
        case EntryStatus::PendingApproval: return "PENDING_APPROVAL";
        case EntryStatus::Posted: return "POSTED";
        default: return "UNKNOWN";
    }
}

std::string period_status_to_string(PeriodStatus status) {
    switch (status) {
        case PeriodStatus::Open: return "OPEN";
        case PeriodStatus::SoftClose: return "SOFT_CLOSE";
        case PeriodStatus::HardClose: return "HARD_CLOSE";
        default: return "UNKNOWN";
    }
}

} // namespace ledgercore

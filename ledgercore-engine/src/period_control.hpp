#ifndef LEDGERCORE_PERIOD_CONTROL_HPP
#define LEDGERCORE_PERIOD_CONTROL_HPP

#include "calendar.hpp"
#include "journal.hpp"
#include "ledger_error.hpp"
#include "ledger_store.hpp"
#include <string>

namespace ledgercore {

// OPEN -> SOFT_CLOSE -> HARD_CLOSE, and OPEN -> HARD_CLOSE. Nothing else.
bool is_valid_period_transition(PeriodStatus from, PeriodStatus to);

// Status of the month containing `period`; absent rows are OPEN
PeriodStatus period_status(const LedgerStore& store, const PeriodKey& period);

PeriodStatus get_period_status(const LedgerContext& ctx, const Date& date);

// PERIOD_CLOSED when `date` falls in a HARD_CLOSE month. Checked by every
// write path at the moment of write.
Status check_period_open(const LedgerStore& store, const Date& date);

// DRAFT and PENDING_APPROVAL entries dated inside the period
size_t count_unposted_entries(const LedgerStore& store, const PeriodKey& period);

struct PeriodCloseRequest {
    int year;
    unsigned month;
    PeriodStatus close_type;    // SOFT_CLOSE or HARD_CLOSE
    std::string actor_id;
    std::string notes;
};

// Advance a period's status.
// Fails INVALID_STATE for a backward/same-state transition and
// PERIOD_HAS_UNPOSTED (detail "count") while unposted entries remain.
Result<FinancialPeriod> close_period(Transaction& txn, const PeriodCloseRequest& request);
Result<FinancialPeriod> close_period(LedgerContext& ctx, const PeriodCloseRequest& request);

} // namespace ledgercore

#endif // LEDGERCORE_PERIOD_CONTROL_HPP

#ifndef LEDGERCORE_REPAYMENT_ALLOCATOR_HPP
#define LEDGERCORE_REPAYMENT_ALLOCATOR_HPP

#include "account_registry.hpp"
#include "journal.hpp"
#include "ledger_error.hpp"
#include "money.hpp"
#include "products.hpp"
#include <string>
#include <vector>

namespace ledgercore {

// What one payment did to one installment
struct InstallmentAllocation {
    size_t schedule_index;          // position in the input schedule
    unsigned installment_number;
    Money interest_paid;
    Money principal_paid;
    InstallmentStatus new_status;
};

struct RepaymentAllocation {
    Money amount;
    Money interest_total;
    Money principal_total;
    std::vector<InstallmentAllocation> allocations;   // in application order
    std::vector<ScheduleEntry> updated_schedule;      // input schedule with the payment applied
    bool loan_settled;                                // nothing left due on any installment
};

// Outstanding total across all installments
Money total_outstanding(const std::vector<ScheduleEntry>& schedule);

// Status an installment should carry after paid amounts changed.
// Never moves backwards: a partly paid OVERDUE installment stays OVERDUE.
InstallmentStatus advance_status(const ScheduleEntry& entry);

// Apply `payment` to the schedule oldest-due-first, interest before principal
// within each installment, until the payment is used up.
//
// Fails INVALID_AMOUNT when the payment is not positive and OVERPAYMENT
// (detail "outstanding") when it exceeds the total outstanding.
// Pure: nothing is persisted.
Result<RepaymentAllocation> allocate_repayment(
    const std::vector<ScheduleEntry>& schedule,
    Money payment
);

// Ledger lines implied by an allocation:
//   Dr cash (amount); Cr loans receivable (principal); Cr interest income (interest)
std::vector<LineInput> repayment_lines(
    const RepaymentAllocation& allocation,
    AccountHandle cash,
    AccountHandle loans_receivable,
    AccountHandle interest_income,
    const std::string& reference
);

} // namespace ledgercore

#endif // LEDGERCORE_REPAYMENT_ALLOCATOR_HPP

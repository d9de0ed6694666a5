#include "repayment_allocator.hpp"
#include <algorithm>
#include <numeric>

namespace ledgercore {

Money total_outstanding(const std::vector<ScheduleEntry>& schedule) {
    Money total;
    for (const auto& entry : schedule) {
        total += entry.total_outstanding();
    }
    return total;
}

InstallmentStatus advance_status(const ScheduleEntry& entry) {
    InstallmentStatus target;
    if (entry.settled()) {
        target = InstallmentStatus::Paid;
    } else if (entry.principal_paid.is_positive() || entry.interest_paid.is_positive()) {
        target = InstallmentStatus::Partial;
    } else {
        target = InstallmentStatus::Pending;
    }
    return std::max(entry.status, target);
}

Result<RepaymentAllocation> allocate_repayment(
    const std::vector<ScheduleEntry>& schedule,
    Money payment
) {
    if (!payment.is_positive()) {
        return Result<RepaymentAllocation>::fail(
            ErrorKind::INVALID_AMOUNT,
            "Repayment amount must be positive",
            {{"amount", payment.to_string()}});
    }

    const Money outstanding = total_outstanding(schedule);
    if (payment > outstanding) {
        return Result<RepaymentAllocation>::fail(
            ErrorKind::OVERPAYMENT,
            "Repayment " + payment.to_string() + " exceeds outstanding " + outstanding.to_string(),
            {{"amount", payment.to_string()}, {"outstanding", outstanding.to_string()}});
    }

    // Oldest due first; installment number breaks ties
    std::vector<size_t> order(schedule.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&schedule](size_t a, size_t b) {
        if (schedule[a].due_date != schedule[b].due_date) {
            return schedule[a].due_date < schedule[b].due_date;
        }
        return schedule[a].installment_number < schedule[b].installment_number;
    });

    RepaymentAllocation allocation;
    allocation.amount = payment;
    allocation.updated_schedule = schedule;

    Money remaining = payment;
    for (size_t index : order) {
        if (remaining.is_zero()) {
            break;
        }
        ScheduleEntry& entry = allocation.updated_schedule[index];
        if (entry.settled()) {
            continue;
        }

        InstallmentAllocation applied;
        applied.schedule_index = index;
        applied.installment_number = entry.installment_number;

        applied.interest_paid = std::min(remaining, entry.interest_outstanding());
        remaining -= applied.interest_paid;
        applied.principal_paid = std::min(remaining, entry.principal_outstanding());
        remaining -= applied.principal_paid;

        entry.interest_paid += applied.interest_paid;
        entry.principal_paid += applied.principal_paid;
        entry.status = advance_status(entry);
        applied.new_status = entry.status;

        allocation.interest_total += applied.interest_paid;
        allocation.principal_total += applied.principal_paid;
        allocation.allocations.push_back(applied);
    }

    allocation.loan_settled = std::all_of(
        allocation.updated_schedule.begin(), allocation.updated_schedule.end(),
        [](const ScheduleEntry& entry) { return entry.settled(); });

    return Result<RepaymentAllocation>::ok(std::move(allocation));
}

std::vector<LineInput> repayment_lines(
    const RepaymentAllocation& allocation,
    AccountHandle cash,
    AccountHandle loans_receivable,
    AccountHandle interest_income,
    const std::string& reference
) {
    std::vector<LineInput> lines;
    lines.push_back(LineInput::debit_line(cash, allocation.amount, "Loan repayment received", reference));
    if (allocation.principal_total.is_positive()) {
        lines.push_back(LineInput::credit_line(loans_receivable, allocation.principal_total,
                                               "Principal repaid", reference));
    }
    if (allocation.interest_total.is_positive()) {
        lines.push_back(LineInput::credit_line(interest_income, allocation.interest_total,
                                               "Interest received", reference));
    }
    return lines;
}

} // namespace ledgercore

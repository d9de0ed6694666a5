#include "loan_service.hpp"
#include "../logger.hpp"
#include "../posting_engine.hpp"
#include "../reference_generator.hpp"
#include <algorithm>
#include <stdexcept>

namespace ledgercore {

namespace {

const char* SOURCE_MODULE = "loans";

Result<Loan> loan_not_found(uint64_t loan_id) {
    return Result<Loan>::fail(ErrorKind::NOT_FOUND, "Loan not found: " + std::to_string(loan_id),
                              {{"loan_id", std::to_string(loan_id)}});
}

bool has_overdue_installment(const std::vector<ScheduleEntry>& schedule) {
    return std::any_of(schedule.begin(), schedule.end(), [](const ScheduleEntry& entry) {
        return entry.status == InstallmentStatus::Overdue;
    });
}

} // namespace

LoanService::LoanService(LedgerContext& ctx, const RoleBindings& roles)
    : ctx_(ctx), roles_(roles) {}

const std::vector<AccountRole>& LoanService::required_roles() {
    static const std::vector<AccountRole> roles = {
        AccountRole::CashBank,
        AccountRole::LoansReceivable,
        AccountRole::InterestIncome,
        AccountRole::FeeIncome
    };
    return roles;
}

Result<Loan> LoanService::create_loan(const LoanApplication& application) {
    LogContext log_ctx("loan.create", application.created_by, SOURCE_MODULE);

    if (application.fees.is_negative() || application.fees >= application.terms.principal) {
        LedgerError error(ErrorKind::INVALID_AMOUNT,
                          "Fees must be at least zero and below the principal",
                          {{"fees", application.fees.to_string()},
                           {"principal", application.terms.principal.to_string()}});
        Logger::get_instance().log_rejected(log_ctx, error);
        return Result<Loan>::fail(error);
    }

    AmortizationSchedule schedule;
    try {
        schedule = calculate_schedule(application.terms);
    } catch (const std::invalid_argument& e) {
        LedgerError error(ErrorKind::INVALID_AMOUNT, e.what());
        Logger::get_instance().log_rejected(log_ctx, error);
        return Result<Loan>::fail(error);
    }

    auto result = with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        LedgerStore& store = txn.store();

        Loan loan;
        loan.id = txn.modify(store.next_record_id)++;
        loan.loan_number = next_reference(txn, prefix::LOAN, txn.today());
        loan.customer_id = application.customer_id;
        loan.principal = application.terms.principal;
        loan.fees = application.fees;
        loan.annual_rate = application.terms.annual_rate;
        loan.tenure_months = application.terms.tenure_months;
        loan.method = application.terms.method;
        loan.start_date = application.terms.start_date;
        loan.emi = schedule.emi;
        loan.total_interest = schedule.total_interest;
        loan.status = LoanStatus::PendingDisbursement;
        loan.created_by = application.created_by;

        std::vector<ScheduleEntry> installments;
        installments.reserve(schedule.installments.size());
        for (const auto& inst : schedule.installments) {
            ScheduleEntry entry;
            entry.loan_id = loan.id;
            entry.installment_number = inst.number;
            entry.due_date = inst.due_date;
            entry.principal_due = inst.principal_due;
            entry.interest_due = inst.interest_due;
            // Rounding can leave trailing installments with nothing due
            entry.status = entry.settled() ? InstallmentStatus::Paid : InstallmentStatus::Pending;
            installments.push_back(entry);
        }

        const uint64_t loan_id = loan.id;
        txn.insert(store.schedules, loan_id, std::move(installments));
        return Result<Loan>::ok(txn.insert(store.loans, loan_id, std::move(loan)));
    });

    if (!result) {
        Logger::get_instance().log_rejected(log_ctx, result.error());
        return result;
    }

    Logger::get_instance().log_workflow_event(log_ctx, "loan_created", {
        {"loan_number", result.value().loan_number},
        {"principal", result.value().principal.to_string()},
        {"emi", result.value().emi.to_string()},
        {"tenure_months", std::to_string(result.value().tenure_months)}
    });
    return result;
}

Result<DisbursementResult> LoanService::disburse(const DisbursementRequest& request) {
    LogContext log_ctx("loan.disburse", request.actor_id, SOURCE_MODULE);

    auto result = with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        auto cash = roles_.require(AccountRole::CashBank);
        auto receivable = roles_.require(AccountRole::LoansReceivable);
        auto fee_income = roles_.require(AccountRole::FeeIncome);
        for (const auto* role : {&cash, &receivable, &fee_income}) {
            if (!*role) {
                return Result<DisbursementResult>::fail(role->error());
            }
        }

        auto it = txn.store().loans.find(request.loan_id);
        if (it == txn.store().loans.end()) {
            return Result<DisbursementResult>::fail(loan_not_found(request.loan_id).error());
        }
        const Loan& loan = it->second;
        if (loan.status != LoanStatus::PendingDisbursement) {
            return Result<DisbursementResult>::fail(
                ErrorKind::INVALID_STATE,
                "Cannot disburse loan " + loan.loan_number + " with status " +
                    loan_status_to_string(loan.status),
                {{"status", loan_status_to_string(loan.status)}});
        }

        const Money disbursed = loan.principal - loan.fees;

        EntryRequest entry;
        entry.entry_date = request.date ? *request.date : txn.today();
        entry.auto_post = true;
        entry.metadata.description = "Loan disbursement - " + loan.loan_number;
        entry.metadata.source_module = SOURCE_MODULE;
        entry.metadata.source_type = "disbursement";
        entry.metadata.source_id = loan.loan_number;
        entry.metadata.created_by = request.actor_id;
        entry.lines.push_back(LineInput::debit_line(receivable.value(), loan.principal,
                                                    "Loan principal", loan.customer_id));
        entry.lines.push_back(LineInput::credit_line(cash.value(), disbursed,
                                                     "Disbursement to customer"));
        if (loan.fees.is_positive()) {
            entry.lines.push_back(LineInput::credit_line(fee_income.value(), loan.fees,
                                                         "Processing fees"));
        }

        auto posted = submit(txn, entry);
        if (!posted) {
            return Result<DisbursementResult>::fail(posted.error());
        }

        Loan& updated = txn.modify(it->second);
        updated.status = LoanStatus::Active;
        updated.disbursement_entry_id = posted.value().entry_id;

        return Result<DisbursementResult>::ok(
            DisbursementResult{posted.value().entry_id, posted.value().entry_number, disbursed});
    });

    if (!result) {
        Logger::get_instance().log_rejected(log_ctx, result.error());
        return result;
    }

    Logger::get_instance().log_workflow_event(log_ctx, "loan_disbursed", {
        {"loan_id", std::to_string(request.loan_id)},
        {"entry_number", result.value().entry_number},
        {"disbursed_amount", result.value().disbursed_amount.to_string()}
    });
    return result;
}

Result<RepaymentReceipt> LoanService::repay(const RepaymentRequest& request) {
    LogContext log_ctx("loan.repay", request.actor_id, SOURCE_MODULE);

    auto result = with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        auto cash = roles_.require(AccountRole::CashBank);
        auto receivable = roles_.require(AccountRole::LoansReceivable);
        auto interest_income = roles_.require(AccountRole::InterestIncome);
        for (const auto* role : {&cash, &receivable, &interest_income}) {
            if (!*role) {
                return Result<RepaymentReceipt>::fail(role->error());
            }
        }

        LedgerStore& store = txn.store();
        auto it = store.loans.find(request.loan_id);
        if (it == store.loans.end()) {
            return Result<RepaymentReceipt>::fail(loan_not_found(request.loan_id).error());
        }
        const Loan& loan = it->second;
        if (loan.status != LoanStatus::Active && loan.status != LoanStatus::Overdue) {
            return Result<RepaymentReceipt>::fail(
                ErrorKind::INVALID_STATE,
                "Cannot accept payment for loan " + loan.loan_number + " with status " +
                    loan_status_to_string(loan.status),
                {{"status", loan_status_to_string(loan.status)}});
        }

        std::vector<ScheduleEntry>& schedule = store.schedules.at(loan.id);
        auto allocation = allocate_repayment(schedule, request.amount);
        if (!allocation) {
            return Result<RepaymentReceipt>::fail(allocation.error());
        }
        const RepaymentAllocation& applied = allocation.value();

        const Date payment_date = request.date ? *request.date : txn.today();
        const std::string receipt_number = next_reference(txn, prefix::RECEIPT, payment_date);

        EntryRequest entry;
        entry.entry_date = payment_date;
        entry.auto_post = true;
        entry.metadata.description = "Loan repayment - " + loan.loan_number + " - " + receipt_number;
        entry.metadata.source_module = SOURCE_MODULE;
        entry.metadata.source_type = "repayment";
        entry.metadata.source_id = loan.loan_number;
        entry.metadata.created_by = request.actor_id;
        entry.metadata.external_reference = request.payment_reference;
        entry.lines = repayment_lines(applied, cash.value(), receivable.value(),
                                      interest_income.value(), loan.loan_number);

        auto posted = submit(txn, entry);
        if (!posted) {
            return Result<RepaymentReceipt>::fail(posted.error());
        }

        for (const auto& part : applied.allocations) {
            txn.modify(schedule[part.schedule_index]) = applied.updated_schedule[part.schedule_index];
        }

        Loan& updated = txn.modify(it->second);
        if (applied.loan_settled) {
            updated.status = LoanStatus::Closed;
        } else if (updated.status == LoanStatus::Overdue && !has_overdue_installment(schedule)) {
            updated.status = LoanStatus::Active;
        }

        RepaymentReceipt receipt;
        receipt.receipt_number = receipt_number;
        receipt.entry_id = posted.value().entry_id;
        receipt.entry_number = posted.value().entry_number;
        receipt.principal = applied.principal_total;
        receipt.interest = applied.interest_total;
        receipt.loan_status = updated.status;
        receipt.allocations = applied.allocations;
        return Result<RepaymentReceipt>::ok(receipt);
    });

    if (!result) {
        Logger::get_instance().log_rejected(log_ctx, result.error());
        return result;
    }

    Logger::get_instance().log_workflow_event(log_ctx, "loan_repayment", {
        {"loan_id", std::to_string(request.loan_id)},
        {"receipt_number", result.value().receipt_number},
        {"amount", request.amount.to_string()},
        {"principal", result.value().principal.to_string()},
        {"interest", result.value().interest.to_string()},
        {"loan_status", loan_status_to_string(result.value().loan_status)}
    });
    return result;
}

Result<size_t> LoanService::mark_overdue(uint64_t loan_id, const Date& as_of) {
    LogContext log_ctx("loan.mark_overdue", "", SOURCE_MODULE);

    return with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        LedgerStore& store = txn.store();
        auto it = store.loans.find(loan_id);
        if (it == store.loans.end()) {
            return Result<size_t>::fail(loan_not_found(loan_id).error());
        }
        if (it->second.status != LoanStatus::Active && it->second.status != LoanStatus::Overdue) {
            return Result<size_t>::ok(0);
        }

        size_t marked = 0;
        for (auto& entry : store.schedules.at(loan_id)) {
            const bool unpaid = !entry.settled() && (entry.status == InstallmentStatus::Pending ||
                                                     entry.status == InstallmentStatus::Partial);
            if (unpaid && entry.due_date < as_of) {
                txn.modify(entry).status = InstallmentStatus::Overdue;
                ++marked;
            }
        }

        if (marked > 0 && it->second.status == LoanStatus::Active) {
            txn.modify(it->second).status = LoanStatus::Overdue;
        }
        return Result<size_t>::ok(marked);
    });
}

Result<Loan> LoanService::get_loan(uint64_t loan_id) const {
    return ctx_.read([loan_id](const LedgerStore& store) {
        auto it = store.loans.find(loan_id);
        if (it == store.loans.end()) {
            return loan_not_found(loan_id);
        }
        return Result<Loan>::ok(it->second);
    });
}

Result<std::vector<ScheduleEntry>> LoanService::get_schedule(uint64_t loan_id) const {
    return ctx_.read([loan_id](const LedgerStore& store) {
        auto it = store.schedules.find(loan_id);
        if (it == store.schedules.end()) {
            return Result<std::vector<ScheduleEntry>>::fail(loan_not_found(loan_id).error());
        }
        return Result<std::vector<ScheduleEntry>>::ok(it->second);
    });
}

} // namespace ledgercore

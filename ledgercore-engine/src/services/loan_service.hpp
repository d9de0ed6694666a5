/**
 * @file loan_service.hpp
 * @brief Loan origination, disbursement and repayment against the ledger
 *
 * Each operation runs in one transaction: schedule and loan records change
 * only if the accompanying journal entry posts.
 */

#ifndef LEDGERCORE_SERVICES_LOAN_SERVICE_HPP
#define LEDGERCORE_SERVICES_LOAN_SERVICE_HPP

#include "../account_registry.hpp"
#include "../amortization.hpp"
#include "../ledger_store.hpp"
#include "../products.hpp"
#include "../repayment_allocator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledgercore {

struct LoanApplication {
    std::string customer_id;
    LoanTerms terms;
    Money fees;                 // deducted from the disbursed cash
    std::string created_by;
};

struct DisbursementRequest {
    uint64_t loan_id;
    std::string actor_id;
    std::optional<Date> date;   // defaults to today
};

struct DisbursementResult {
    EntryId entry_id;
    std::string entry_number;
    Money disbursed_amount;     // principal - fees
};

struct RepaymentRequest {
    uint64_t loan_id;
    Money amount;
    std::string payment_reference;  // idempotency key; a repeat fails DUPLICATE_REFERENCE
    std::string actor_id;
    std::optional<Date> date;
};

struct RepaymentReceipt {
    std::string receipt_number;
    EntryId entry_id;
    std::string entry_number;
    Money principal;
    Money interest;
    LoanStatus loan_status;
    std::vector<InstallmentAllocation> allocations;
};

class LoanService {
public:
    LoanService(LedgerContext& ctx, const RoleBindings& roles);

    // Roles every disbursement and repayment needs
    static const std::vector<AccountRole>& required_roles();

    /**
     * @brief Register a loan and its installment schedule
     *
     * Fails INVALID_AMOUNT for unusable terms or fees outside [0, principal).
     */
    Result<Loan> create_loan(const LoanApplication& application);

    /**
     * @brief Pay out a pending loan
     *
     * Dr loans receivable (principal); Cr cash (principal - fees); Cr fee income (fees)
     */
    Result<DisbursementResult> disburse(const DisbursementRequest& request);

    /**
     * @brief Apply a payment to the oldest installments, interest first
     *
     * Dr cash; Cr loans receivable (principal part); Cr interest income (interest part).
     * The loan closes when every installment is PAID.
     */
    Result<RepaymentReceipt> repay(const RepaymentRequest& request);

    /**
     * @brief Flag unpaid installments due before `as_of` as OVERDUE
     *
     * @return Number of installments newly marked
     */
    Result<size_t> mark_overdue(uint64_t loan_id, const Date& as_of);

    Result<Loan> get_loan(uint64_t loan_id) const;
    Result<std::vector<ScheduleEntry>> get_schedule(uint64_t loan_id) const;

private:
    LedgerContext& ctx_;
    RoleBindings roles_;
};

} // namespace ledgercore

#endif // LEDGERCORE_SERVICES_LOAN_SERVICE_HPP

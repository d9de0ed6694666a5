/**
 * @file batch_service.hpp
 * @brief End-of-day jobs over loans, savings and fixed deposits
 *
 * Every job collects its work list under the shared lock, then processes each
 * item in its own transaction. A failed item is logged and counted; it never
 * rolls back items that already committed.
 */

#ifndef LEDGERCORE_SERVICES_BATCH_SERVICE_HPP
#define LEDGERCORE_SERVICES_BATCH_SERVICE_HPP

#include "fixed_deposit_service.hpp"
#include "loan_service.hpp"
#include "savings_service.hpp"
#include <string>
#include <vector>

namespace ledgercore {

struct BatchFailure {
    uint64_t item_id;
    LedgerError error;
};

struct BatchSummary {
    std::string job;
    size_t processed = 0;       ///< Items that committed (including no-op items)
    size_t failed = 0;
    size_t affected = 0;        ///< Job-specific count: installments marked, deposits settled, ...
    Money total_amount;         ///< Interest accrued/credited or amounts paid out
    std::vector<BatchFailure> failures;
    double elapsed_ms = 0.0;
};

class BatchService {
public:
    BatchService(LedgerContext& ctx, LoanService& loans, SavingsService& savings,
                 FixedDepositService& deposits);

    // Flag installments due before `as_of` as OVERDUE; affected = installments marked
    BatchSummary mark_overdue(const Date& as_of);

    // Accrue FD interest up to `as_of`; total_amount = interest accrued
    BatchSummary accrue_fixed_deposits(const Date& as_of);

    // Settle deposits matured on or before `as_of`; total_amount = maturity amounts
    BatchSummary process_matured_deposits(const Date& as_of);

    // Credit one month of interest to every active savings account
    BatchSummary post_savings_interest(const Date& as_of);

    // The daily job sequence: overdue marking, FD accrual, maturities
    std::vector<BatchSummary> run_end_of_day(const Date& as_of);

private:
    LedgerContext& ctx_;
    LoanService& loans_;
    SavingsService& savings_;
    FixedDepositService& deposits_;
};

} // namespace ledgercore

#endif // LEDGERCORE_SERVICES_BATCH_SERVICE_HPP

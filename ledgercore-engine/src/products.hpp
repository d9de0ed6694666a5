#ifndef LEDGERCORE_PRODUCTS_HPP
#define LEDGERCORE_PRODUCTS_HPP

#include "amortization.hpp"
#include "calendar.hpp"
#include "journal.hpp"
#include "money.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace ledgercore {

// ============================================================================
// Loans
// ============================================================================

// Ordered so that status only ever moves to a higher rank
enum class InstallmentStatus : uint8_t {
    Pending = 0,
    Partial = 1,
    Overdue = 2,
    Paid = 3
};

std::string installment_status_to_string(InstallmentStatus status);

struct ScheduleEntry {
    uint64_t loan_id = 0;
    unsigned installment_number = 0;
    Date due_date;
    Money principal_due;
    Money interest_due;
    Money principal_paid;
    Money interest_paid;
    InstallmentStatus status = InstallmentStatus::Pending;

    Money principal_outstanding() const { return principal_due - principal_paid; }
    Money interest_outstanding() const { return interest_due - interest_paid; }
    Money total_outstanding() const { return principal_outstanding() + interest_outstanding(); }
    bool settled() const { return total_outstanding().is_zero(); }
};

enum class LoanStatus : uint8_t {
    PendingDisbursement = 0,
    Active = 1,
    Overdue = 2,
    Closed = 3
};

std::string loan_status_to_string(LoanStatus status);

struct Loan {
    uint64_t id = 0;
    std::string loan_number;
    std::string customer_id;
    Money principal;
    Money fees;
    Decimal annual_rate;
    unsigned tenure_months = 0;
    AmortizationMethod method = AmortizationMethod::ReducingBalance;
    Date start_date;
    Money emi;
    Money total_interest;
    LoanStatus status = LoanStatus::PendingDisbursement;
    std::optional<EntryId> disbursement_entry_id;
    std::string created_by;
};

// ============================================================================
// Savings
// ============================================================================

enum class SavingsStatus : uint8_t {
    Active = 0,
    Frozen = 1,
    Closed = 2
};

std::string savings_status_to_string(SavingsStatus status);

struct SavingsAccount {
    uint64_t id = 0;
    std::string account_number;
    std::string customer_id;
    Money balance;
    Money minimum_balance;
    Decimal annual_rate;
    bool withdrawals_allowed = true;
    SavingsStatus status = SavingsStatus::Active;
    std::optional<Date> last_interest_date;
};

// ============================================================================
// Fixed deposits
// ============================================================================

enum class MaturityInstruction : uint8_t {
    PayOut = 0,
    Rollover = 1
};

std::string maturity_instruction_to_string(MaturityInstruction instruction);
MaturityInstruction maturity_instruction_from_string(const std::string& text);  // throws std::invalid_argument

enum class DepositStatus : uint8_t {
    Active = 0,
    Matured = 1,
    RolledOver = 2,
    PrematureClosed = 3
};

std::string deposit_status_to_string(DepositStatus status);

struct FixedDeposit {
    uint64_t id = 0;
    std::string certificate_number;
    std::string customer_id;
    Money principal;
    Decimal annual_rate;
    unsigned tenure_days = 0;
    Date start_date;
    Date maturity_date;
    Money interest_amount;      // simple interest for the full tenure
    Money maturity_amount;      // principal + interest_amount
    Money accrued_interest;     // interest recognised in the ledger so far
    Date last_accrual_date;
    MaturityInstruction instruction = MaturityInstruction::PayOut;
    DepositStatus status = DepositStatus::Active;
    std::optional<uint64_t> rolled_over_to;
};

} // namespace ledgercore

#endif // LEDGERCORE_PRODUCTS_HPP

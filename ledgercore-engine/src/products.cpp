#include "products.hpp"
#include <stdexcept>

namespace ledgercore {

std::string installment_status_to_string(InstallmentStatus status) {
    switch (status) {
        case InstallmentStatus::Pending: return "PENDING";
        case InstallmentStatus::Partial: return "PARTIAL";
        case InstallmentStatus::Overdue: return "OVERDUE";
        case InstallmentStatus::Paid: return "PAID";
        default: return "UNKNOWN";
    }
}

std::string loan_status_to_string(LoanStatus status) {
    switch (status) {
        case LoanStatus::PendingDisbursement: return "PENDING_DISBURSEMENT";
        case LoanStatus::Active: return "ACTIVE";
        case LoanStatus::Overdue: return "OVERDUE";
        case LoanStatus::Closed: return "CLOSED";
        default: return "UNKNOWN";
    }
}

std::string savings_status_to_string(SavingsStatus status) {
    switch (status) {
        case SavingsStatus::Active: return "ACTIVE";
        case SavingsStatus::Frozen: return "FROZEN";
        case SavingsStatus::Closed: return "CLOSED";
        default: return "UNKNOWN";
    }
}

std::string maturity_instruction_to_string(MaturityInstruction instruction) {
    return instruction == MaturityInstruction::Rollover ? "ROLLOVER" : "PAY_OUT";
}

MaturityInstruction maturity_instruction_from_string(const std::string& text) {
    if (text == "PAY_OUT") return MaturityInstruction::PayOut;
    if (text == "ROLLOVER") return MaturityInstruction::Rollover;
    throw std::invalid_argument("Unknown maturity instruction: " + text);
}

std::string deposit_status_to_string(DepositStatus status) {
    switch (status) {
        case DepositStatus::Active: return "ACTIVE";
        case DepositStatus::Matured: return "MATURED";
        case DepositStatus::RolledOver: return "ROLLED_OVER";
        case DepositStatus::PrematureClosed: return "PREMATURE_CLOSED";
        default: return "UNKNOWN";
    }
}

} // namespace ledgercore

#ifndef LEDGERCORE_AMORTIZATION_HPP
#define LEDGERCORE_AMORTIZATION_HPP

#include "calendar.hpp"
#include "money.hpp"
#include <string>
#include <vector>

namespace ledgercore {

enum class AmortizationMethod : uint8_t {
    ReducingBalance = 0,
    FlatRate = 1
};

std::string amortization_method_to_string(AmortizationMethod method);
// Accepts "reducing" / "REDUCING_BALANCE" and "flat" / "FLAT_RATE"; throws std::invalid_argument
AmortizationMethod amortization_method_from_string(const std::string& text);

struct LoanTerms {
    Money principal;
    Decimal annual_rate;        // percent, e.g. 24 for 24% p.a.
    unsigned tenure_months;
    AmortizationMethod method;
    Date start_date;            // installment k falls due start_date + k months

    LoanTerms();
};

struct Installment {
    unsigned number;            // 1-based
    Date due_date;
    Money principal_due;
    Money interest_due;
    Money total_due;
    Money closing_balance;      // principal outstanding after this installment
};

struct AmortizationSchedule {
    Money emi;                  // equated monthly installment (flat: regular monthly installment)
    Money total_interest;
    Money total_repayment;
    std::vector<Installment> installments;
};

// Compute the full installment schedule for a loan
//
// Reducing balance:
//   r = annual_rate / 100 / 12
//   EMI = P·r·(1+r)^n / ((1+r)^n − 1), or P / n when r = 0
//   each period: interest = balance·r, principal = EMI − interest;
//   the final period takes the remaining balance so it closes at exactly zero
//
// Flat rate:
//   total interest = P · annual_rate/100 · n/12, principal and interest split
//   evenly; the final period absorbs the rounding remainder of both
//
// All money is rounded half-up to 2 d.p. from 50-digit decimal intermediates.
// Sum of principal_due always equals the principal exactly.
//
// Throws std::invalid_argument for principal <= 0, rate < 0 or tenure < 1.
AmortizationSchedule calculate_schedule(const LoanTerms& terms);

} // namespace ledgercore

#endif // LEDGERCORE_AMORTIZATION_HPP

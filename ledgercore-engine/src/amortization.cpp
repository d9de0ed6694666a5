#include "amortization.hpp"
#include <algorithm>
#include <stdexcept>

namespace ledgercore {

std::string amortization_method_to_string(AmortizationMethod method) {
    switch (method) {
        case AmortizationMethod::ReducingBalance: return "REDUCING_BALANCE";
        case AmortizationMethod::FlatRate: return "FLAT_RATE";
        default: return "UNKNOWN";
    }
}

AmortizationMethod amortization_method_from_string(const std::string& text) {
    if (text == "reducing" || text == "REDUCING_BALANCE") return AmortizationMethod::ReducingBalance;
    if (text == "flat" || text == "FLAT_RATE") return AmortizationMethod::FlatRate;
    throw std::invalid_argument("Unknown amortization method: " + text);
}

LoanTerms::LoanTerms()
    : principal(), annual_rate(0), tenure_months(0),
      method(AmortizationMethod::ReducingBalance), start_date() {}

namespace {

void validate_terms(const LoanTerms& terms) {
    if (!terms.principal.is_positive()) {
        throw std::invalid_argument("Principal must be positive, got " + terms.principal.to_string());
    }
    if (terms.annual_rate < 0) {
        throw std::invalid_argument("Interest rate must not be negative");
    }
    if (terms.tenure_months < 1) {
        throw std::invalid_argument("Tenure must be at least one month");
    }
}

AmortizationSchedule reducing_balance(const LoanTerms& terms) {
    const unsigned n = terms.tenure_months;
    const Decimal principal = terms.principal.to_decimal();
    const Decimal r = terms.annual_rate / 100 / 12;

    AmortizationSchedule schedule;
    if (r == 0) {
        schedule.emi = Money::from_decimal(principal / n);
    } else {
        // (1+r)^n by repeated multiplication keeps the result exact to 50 digits
        Decimal growth(1);
        for (unsigned i = 0; i < n; ++i) {
            growth *= (1 + r);
        }
        schedule.emi = Money::from_decimal(principal * r * growth / (growth - 1));
    }

    Money balance = terms.principal;
    schedule.installments.reserve(n);

    for (unsigned k = 1; k <= n; ++k) {
        Installment inst;
        inst.number = k;
        inst.due_date = terms.start_date.add_months(static_cast<int>(k));
        inst.interest_due = Money::from_decimal(balance.to_decimal() * r);

        if (k == n) {
            inst.principal_due = balance;
        } else {
            inst.principal_due = std::min(schedule.emi - inst.interest_due, balance);
        }

        balance -= inst.principal_due;
        inst.total_due = inst.principal_due + inst.interest_due;
        inst.closing_balance = balance;

        schedule.total_interest += inst.interest_due;
        schedule.installments.push_back(inst);
    }

    return schedule;
}

AmortizationSchedule flat_rate(const LoanTerms& terms) {
    const unsigned n = terms.tenure_months;
    const Decimal principal = terms.principal.to_decimal();

    const Money total_interest = Money::from_decimal(principal * terms.annual_rate / 100 * n / 12);
    const Money principal_each = Money::from_decimal(principal / n);
    const Money interest_each = Money::from_decimal(total_interest.to_decimal() / n);

    AmortizationSchedule schedule;
    schedule.emi = principal_each + interest_each;
    schedule.total_interest = total_interest;
    schedule.installments.reserve(n);

    Money principal_left = terms.principal;
    Money interest_left = total_interest;

    for (unsigned k = 1; k <= n; ++k) {
        Installment inst;
        inst.number = k;
        inst.due_date = terms.start_date.add_months(static_cast<int>(k));

        if (k == n) {
            inst.principal_due = principal_left;
            inst.interest_due = interest_left;
        } else {
            // Tiny principals can round each share above the remaining balance
            inst.principal_due = std::min(principal_each, principal_left);
            inst.interest_due = std::min(interest_each, interest_left);
        }

        principal_left -= inst.principal_due;
        interest_left -= inst.interest_due;
        inst.total_due = inst.principal_due + inst.interest_due;
        inst.closing_balance = principal_left;

        schedule.installments.push_back(inst);
    }

    return schedule;
}

} // namespace

AmortizationSchedule calculate_schedule(const LoanTerms& terms) {
    validate_terms(terms);

    AmortizationSchedule schedule = terms.method == AmortizationMethod::FlatRate
        ? flat_rate(terms)
        : reducing_balance(terms);

    schedule.total_repayment = terms.principal + schedule.total_interest;
    return schedule;
}

} // namespace ledgercore

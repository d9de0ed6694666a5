#include <catch2/catch_test_macros.hpp>
#include "amortization.hpp"
#include <stdexcept>

using namespace ledgercore;

namespace {

LoanTerms make_terms(const std::string& principal, const std::string& rate, unsigned months,
                     AmortizationMethod method) {
    LoanTerms terms;
    terms.principal = Money::parse(principal);
    terms.annual_rate = Decimal(rate);
    terms.tenure_months = months;
    terms.method = method;
    terms.start_date = Date(2024, 1, 15);
    return terms;
}

Money sum_principal(const AmortizationSchedule& schedule) {
    Money total;
    for (const auto& inst : schedule.installments) {
        total += inst.principal_due;
    }
    return total;
}

Money sum_interest(const AmortizationSchedule& schedule) {
    Money total;
    for (const auto& inst : schedule.installments) {
        total += inst.interest_due;
    }
    return total;
}

} // namespace

TEST_CASE("Reducing balance schedule", "[amortization]") {
    auto terms = make_terms("1200000", "24", 12, AmortizationMethod::ReducingBalance);
    auto schedule = calculate_schedule(terms);

    REQUIRE(schedule.installments.size() == 12);
    REQUIRE(schedule.emi.to_string() == "113471.52");

    SECTION("First installment is mostly interest") {
        const Installment& first = schedule.installments.front();
        REQUIRE(first.number == 1);
        REQUIRE(first.due_date == Date(2024, 2, 15));
        REQUIRE(first.interest_due.to_string() == "24000.00");
        REQUIRE(first.principal_due.to_string() == "89471.52");
        REQUIRE(first.total_due == schedule.emi);
        REQUIRE(first.closing_balance.to_string() == "1110528.48");
    }

    SECTION("Last installment clears the balance") {
        const Installment& last = schedule.installments.back();
        REQUIRE(last.number == 12);
        REQUIRE(last.due_date == Date(2025, 1, 15));
        REQUIRE(last.interest_due.to_string() == "2224.93");
        REQUIRE(last.principal_due.to_string() == "111246.54");
        REQUIRE(last.total_due.to_string() == "113471.47");
        REQUIRE(last.closing_balance.is_zero());
    }

    SECTION("Totals reconcile") {
        REQUIRE(sum_principal(schedule) == terms.principal);
        REQUIRE(sum_interest(schedule) == schedule.total_interest);
        REQUIRE(schedule.total_interest.to_string() == "161658.19");
        REQUIRE(schedule.total_repayment == terms.principal + schedule.total_interest);
    }
}

TEST_CASE("Zero-rate loan splits principal evenly", "[amortization]") {
    auto schedule = calculate_schedule(make_terms("1000", "0", 3, AmortizationMethod::ReducingBalance));

    REQUIRE(schedule.emi.to_string() == "333.33");
    REQUIRE(schedule.total_interest.is_zero());
    REQUIRE(schedule.installments[0].principal_due.to_string() == "333.33");
    REQUIRE(schedule.installments[2].principal_due.to_string() == "333.34");
    REQUIRE(schedule.installments[2].closing_balance.is_zero());
}

TEST_CASE("Flat rate schedule", "[amortization]") {
    auto terms = make_terms("100000", "12", 12, AmortizationMethod::FlatRate);
    auto schedule = calculate_schedule(terms);

    REQUIRE(schedule.total_interest.to_string() == "12000.00");
    REQUIRE(schedule.emi.to_string() == "9333.33");

    for (size_t i = 0; i < 11; ++i) {
        REQUIRE(schedule.installments[i].principal_due.to_string() == "8333.33");
        REQUIRE(schedule.installments[i].interest_due.to_string() == "1000.00");
    }

    // The final installment absorbs rounding
    REQUIRE(schedule.installments.back().principal_due.to_string() == "8333.37");
    REQUIRE(schedule.installments.back().interest_due.to_string() == "1000.00");
    REQUIRE(schedule.installments.back().closing_balance.is_zero());

    REQUIRE(sum_principal(schedule) == terms.principal);
    REQUIRE(sum_interest(schedule) == schedule.total_interest);
    REQUIRE(schedule.total_repayment.to_string() == "112000.00");
}

TEST_CASE("Schedule rejects unusable terms", "[amortization]") {
    REQUIRE_THROWS_AS(calculate_schedule(make_terms("0", "12", 12, AmortizationMethod::FlatRate)),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(calculate_schedule(make_terms("1000", "-1", 12, AmortizationMethod::ReducingBalance)),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(calculate_schedule(make_terms("1000", "12", 0, AmortizationMethod::ReducingBalance)),
                      std::invalid_argument);
}

TEST_CASE("Amortization method names", "[amortization]") {
    REQUIRE(amortization_method_from_string("reducing") == AmortizationMethod::ReducingBalance);
    REQUIRE(amortization_method_from_string("FLAT_RATE") == AmortizationMethod::FlatRate);
    REQUIRE(amortization_method_to_string(AmortizationMethod::ReducingBalance) == "REDUCING_BALANCE");
    REQUIRE_THROWS_AS(amortization_method_from_string("balloon"), std::invalid_argument);
}

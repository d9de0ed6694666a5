#include "deposit_interest.hpp"
#include <algorithm>

namespace ledgercore {

Money simple_interest(Money principal, const Decimal& annual_rate, int64_t days) {
    if (days <= 0) {
        return Money();
    }
    return Money::from_decimal(principal.to_decimal() * annual_rate / 100 * Decimal(days) / 365);
}

Money interest_earned_to(const FixedDeposit& deposit, const Date& as_of) {
    int64_t held = deposit.start_date.days_until(as_of);
    held = std::min<int64_t>(held, deposit.tenure_days);
    if (held <= 0) {
        return Money();
    }
    if (held == deposit.tenure_days) {
        return deposit.interest_amount;
    }
    return simple_interest(deposit.principal, deposit.annual_rate, held);
}

Money accrual_due(const FixedDeposit& deposit, const Date& as_of) {
    Money due = interest_earned_to(deposit, as_of) - deposit.accrued_interest;
    return due.is_negative() ? Money() : due;
}

PrematureSettlement premature_settlement(const FixedDeposit& deposit, const Date& as_of,
                                         const Decimal& penalty_rate) {
    PrematureSettlement settlement;
    settlement.interest_earned = interest_earned_to(deposit, as_of);
    settlement.penalty = Money::from_decimal(deposit.principal.to_decimal() * penalty_rate / 100);
    settlement.net_interest = settlement.interest_earned - settlement.penalty;
    if (settlement.net_interest.is_negative()) {
        settlement.net_interest = Money();
    }
    settlement.payout = deposit.principal + settlement.net_interest;
    return settlement;
}

Money monthly_savings_interest(Money balance, const Decimal& annual_rate) {
    if (!balance.is_positive()) {
        return Money();
    }
    return Money::from_decimal(balance.to_decimal() * annual_rate / 100 / 12);
}

} // namespace ledgercore

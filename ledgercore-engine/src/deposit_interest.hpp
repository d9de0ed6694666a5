#ifndef LEDGERCORE_DEPOSIT_INTEREST_HPP
#define LEDGERCORE_DEPOSIT_INTEREST_HPP

#include "calendar.hpp"
#include "money.hpp"
#include "products.hpp"
#include <cstdint>

namespace ledgercore {

// Actual/365 simple interest: P · R/100 · days/365, rounded half-up
Money simple_interest(Money principal, const Decimal& annual_rate, int64_t days);

// Interest a deposit has earned from its start date up to `as_of`,
// capped at the full tenure. Zero before the start date.
Money interest_earned_to(const FixedDeposit& deposit, const Date& as_of);

// Amount still to recognise so that accrued_interest reaches interest_earned_to(as_of).
// Accruing against the cumulative figure keeps per-day rounding from drifting.
Money accrual_due(const FixedDeposit& deposit, const Date& as_of);

struct PrematureSettlement {
    Money interest_earned;      // gross interest for the days actually held
    Money penalty;              // principal · penalty_rate / 100
    Money net_interest;         // max(0, earned − penalty)
    Money payout;               // principal + net_interest
};

// Settle a deposit withdrawn before maturity on `as_of`
PrematureSettlement premature_settlement(const FixedDeposit& deposit, const Date& as_of,
                                         const Decimal& penalty_rate);

// One month of savings interest: balance · R/100 / 12
Money monthly_savings_interest(Money balance, const Decimal& annual_rate);

} // namespace ledgercore

#endif // LEDGERCORE_DEPOSIT_INTEREST_HPP

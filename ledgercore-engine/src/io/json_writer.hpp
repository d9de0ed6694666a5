#ifndef LEDGERCORE_IO_JSON_WRITER_HPP
#define LEDGERCORE_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../amortization.hpp"
#include "../balance_projector.hpp"

namespace ledgercore {
namespace io {

// Amounts are written as JSON numbers with exactly two decimals

// Write an amortization schedule: terms, EMI, totals and one object per installment
void write_schedule_json(std::ostream& os, const LoanTerms& terms,
                         const AmortizationSchedule& schedule, bool pretty_print = true);

void write_schedule_json(const std::string& filepath, const LoanTerms& terms,
                         const AmortizationSchedule& schedule, bool pretty_print = true);

// Write a trial balance with its rows, totals and the balanced flag
void write_trial_balance_json(std::ostream& os, const TrialBalance& trial_balance,
                              bool pretty_print = true);

void write_trial_balance_json(const std::string& filepath, const TrialBalance& trial_balance,
                              bool pretty_print = true);

// Write one account's ledger with running balances
void write_account_ledger_json(std::ostream& os, const AccountLedger& ledger,
                               bool pretty_print = true);

// Escape a string for inclusion between JSON quotes
std::string escape_json(const std::string& value);

} // namespace io
} // namespace ledgercore

#endif // LEDGERCORE_IO_JSON_WRITER_HPP

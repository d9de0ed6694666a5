/**
 * @file balance_projector.hpp
 * @brief Read-side reconstruction of balances and reports from posted lines
 *
 * Nothing here reads the cached balances except verify_cached_balances(),
 * which compares them with the replay. All queries run under the shared lock
 * and see committed state only.
 */

#ifndef LEDGERCORE_BALANCE_PROJECTOR_HPP
#define LEDGERCORE_BALANCE_PROJECTOR_HPP

#include "account_registry.hpp"
#include "calendar.hpp"
#include "ledger_error.hpp"
#include "ledger_store.hpp"
#include "money.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledgercore {

struct AccountBalance {
    std::string code;
    std::string name;
    BalanceSide normal_side;
    Money opening_balance;
    Money debit_total;      // posted debits up to the date
    Money credit_total;     // posted credits up to the date
    Money balance;          // signed, positive on the normal side
};

// Replay of one account (header accounts aggregate their descendants)
AccountBalance replay_balance(const LedgerStore& store, const AccountRegistry& registry,
                              AccountHandle account, const std::optional<Date>& as_of);

/**
 * @brief Balance of an account as of a date, or up to now
 *
 * Without a date the result equals the cached running balance.
 * Fails NOT_FOUND for an unknown code.
 */
Result<AccountBalance> get_account_balance(const LedgerContext& ctx, const std::string& code,
                                           const std::optional<Date>& as_of = std::nullopt);

struct TrialBalanceRow {
    std::string code;
    std::string name;
    AccountType type;
    Money debit;
    Money credit;
};

struct TrialBalance {
    Date as_of;
    std::vector<TrialBalanceRow> rows;   // ordered by account code
    Money total_debit;
    Money total_credit;

    bool balanced() const { return total_debit == total_credit; }
};

// Every active, non-header account with a non-zero balance, each on its
// normal side; contra balances appear in the opposite column.
TrialBalance generate_trial_balance(const LedgerContext& ctx, const Date& as_of);

struct LedgerLine {
    Date entry_date;
    std::string entry_number;
    std::string description;
    Money debit;
    Money credit;
    Money running_balance;
};

struct AccountLedger {
    std::string code;
    std::string name;
    Date start;
    Date end;
    Money opening_balance;      // balance as of the day before start
    std::vector<LedgerLine> lines;
    Money closing_balance;
};

// Posted lines in [start, end] in posting order, with running balance.
// Fails NOT_FOUND for an unknown code, INVALID_STATE if start > end.
Result<AccountLedger> get_ledger(const LedgerContext& ctx, const std::string& code,
                                 const Date& start, const Date& end);

struct BalanceMismatch {
    std::string code;
    Money cached;
    Money replayed;
};

// Accounts whose cached balance disagrees with the replay of their history
std::vector<BalanceMismatch> verify_cached_balances(const LedgerContext& ctx);

} // namespace ledgercore

#endif // LEDGERCORE_BALANCE_PROJECTOR_HPP

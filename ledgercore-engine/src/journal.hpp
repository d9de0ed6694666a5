/**
 * @file journal.hpp
 * @brief Journal entries, lines and financial periods
 */

#ifndef LEDGERCORE_JOURNAL_HPP
#define LEDGERCORE_JOURNAL_HPP

#include "account_registry.hpp"
#include "calendar.hpp"
#include "money.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ledgercore {

using EntryId = uint64_t;

enum class EntryStatus : uint8_t {
    Draft = 0,
    PendingApproval = 1,
    Posted = 2
};

std::string entry_status_to_string(EntryStatus status);

/**
 * @brief One requested debit or credit
 *
 * The account is given either as a resolved handle (workflow services) or
 * as a code (manual entries); the handle wins when both are present.
 * Exactly one of debit/credit must be strictly positive.
 */
struct LineInput {
    std::optional<AccountHandle> account;
    std::string account_code;
    Money debit;
    Money credit;
    std::string description;
    std::string reference;  // customer / loan / account cross-reference

    static LineInput debit_line(AccountHandle account, Money amount,
                                const std::string& description = "",
                                const std::string& reference = "") {
        LineInput line;
        line.account = account;
        line.debit = amount;
        line.description = description;
        line.reference = reference;
        return line;
    }

    static LineInput credit_line(AccountHandle account, Money amount,
                                 const std::string& description = "",
                                 const std::string& reference = "") {
        LineInput line;
        line.account = account;
        line.credit = amount;
        line.description = description;
        line.reference = reference;
        return line;
    }
};

struct EntryMetadata {
    std::string description;
    std::string source_module;   // "loans", "savings", "fixed_deposits", "manual"
    std::string source_type;     // "disbursement", "repayment", ...
    std::string source_id;
    std::string created_by;
    std::string external_reference;  // idempotency key, unique when non-empty
};

struct JournalLine {
    unsigned line_number;
    AccountHandle account;
    Money debit;
    Money credit;
    std::string description;
    std::string reference;
};

struct JournalEntry {
    EntryId id = 0;
    std::string entry_number;
    Date entry_date;
    EntryStatus status = EntryStatus::Draft;
    bool reversed = false;
    std::optional<EntryId> reversal_entry_id;   // the entry that reverses this one
    std::optional<EntryId> reverses_entry_id;   // the entry this one reverses
    Money total_debit;
    Money total_credit;
    EntryMetadata metadata;
    std::string approved_by;
    std::string reversal_reason;
    uint64_t posting_sequence = 0;  // assigned at posting, orders same-day entries
    std::vector<JournalLine> lines;

    bool is_posted() const { return status == EntryStatus::Posted; }
    bool is_reversal() const { return reverses_entry_id.has_value(); }
};

// Identity of the acting user as supplied by the authentication layer
struct Actor {
    std::string id;
    int role_level = 0;
    Money approval_limit;
};

struct SubmitResult {
    EntryId entry_id;
    std::string entry_number;
    EntryStatus status;
};

enum class PeriodStatus : uint8_t {
    Open = 0,
    SoftClose = 1,
    HardClose = 2
};

std::string period_status_to_string(PeriodStatus status);

struct FinancialPeriod {
    PeriodKey key;
    PeriodStatus status = PeriodStatus::Open;
    std::string closed_by;
    std::string notes;
    std::optional<Date> closed_on;
};

} // namespace ledgercore

#endif // LEDGERCORE_JOURNAL_HPP

/**
 * @file posting_engine.hpp
 * @brief Journal posting engine: the only writer of account balances
 *
 * Entries go through two explicit phases:
 * - create_draft validates and stores header and lines with no balance effect
 * - post applies the balance deltas and flips the status to POSTED
 *
 * submit() with auto_post composes the two inside one transaction. Every
 * operation has a Transaction& form, for workflow services that post as part
 * of a larger unit of work, and a LedgerContext& form that runs in its own
 * transaction.
 */

#ifndef LEDGERCORE_POSTING_ENGINE_HPP
#define LEDGERCORE_POSTING_ENGINE_HPP

#include "calendar.hpp"
#include "journal.hpp"
#include "ledger_error.hpp"
#include "ledger_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledgercore {

struct EntryRequest {
    std::vector<LineInput> lines;
    Date entry_date;
    EntryMetadata metadata;
    bool auto_post = false;
};

/**
 * @brief Validate and store an entry as DRAFT
 *
 * Validation order:
 *   PERIOD_CLOSED     entry date in a HARD_CLOSE period
 *   INVALID_LINE      a line without exactly one strictly positive side
 *   UNBALANCED_ENTRY  sum(debit) != sum(credit) (details: total_debit, total_credit)
 *   ZERO_VALUE_ENTRY  balanced at zero
 *   INVALID_ACCOUNT   unknown, inactive or header account (details: codes)
 *   DUPLICATE_REFERENCE  external reference already used
 */
Result<SubmitResult> create_draft(Transaction& txn, const EntryRequest& request);

/**
 * @brief Create an entry, posting it immediately when request.auto_post is set
 */
Result<SubmitResult> submit(Transaction& txn, const EntryRequest& request);
Result<SubmitResult> submit(LedgerContext& ctx, const EntryRequest& request);

// DRAFT -> PENDING_APPROVAL
Status submit_for_approval(Transaction& txn, EntryId entry_id);
Status submit_for_approval(LedgerContext& ctx, EntryId entry_id);

/**
 * @brief Post a DRAFT or PENDING_APPROVAL entry
 *
 * Fails APPROVAL_DENIED when the approver created the entry or the entry
 * total exceeds their approval limit, INVALID_STATE when already posted,
 * PERIOD_CLOSED when the entry's period has been hard-closed since creation.
 */
Result<SubmitResult> post(Transaction& txn, EntryId entry_id, const Actor& approver);
Result<SubmitResult> post(LedgerContext& ctx, EntryId entry_id, const Actor& approver);

struct ReversalRequest {
    EntryId entry_id;
    std::string reason;
    std::string actor_id;
    std::optional<Date> effective_date;  // defaults to today
};

/**
 * @brief Post the mirror image of a posted entry and link the pair
 *
 * Fails NOT_POSTED, ALREADY_REVERSED or REVERSAL_NOT_REVERSIBLE (target is
 * itself a reversal). Entries generated by the loan, savings or fixed-deposit
 * services fail INVALID_STATE: their subledger would no longer match.
 */
Result<SubmitResult> reverse(Transaction& txn, const ReversalRequest& request);
Result<SubmitResult> reverse(LedgerContext& ctx, const ReversalRequest& request);

// Committed copy of an entry
Result<JournalEntry> get_entry(const LedgerContext& ctx, EntryId entry_id);

} // namespace ledgercore

#endif // LEDGERCORE_POSTING_ENGINE_HPP

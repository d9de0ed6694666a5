#include "posting_engine.hpp"
#include "logger.hpp"
#include "period_control.hpp"
#include "reference_generator.hpp"
#include <map>
#include <sstream>

namespace ledgercore {

namespace {

std::string join(const std::vector<std::string>& items) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << ",";
        oss << items[i];
    }
    return oss.str();
}

LogContext entry_log_context(const JournalEntry& entry, const std::string& operation,
                             const std::string& actor_id) {
    return LogContext(operation, actor_id, entry.metadata.source_module);
}

// Source modules that keep a subledger (schedules, account or deposit balances)
// in step with their entries
bool owned_by_subledger(const std::string& source_module) {
    return source_module == "loans" || source_module == "savings" || source_module == "fixed_deposits";
}

SubmitResult to_submit_result(const JournalEntry& entry) {
    return SubmitResult{entry.id, entry.entry_number, entry.status};
}

// Apply balance deltas and flip status. `entry` must already be snapshotted.
Status apply_posting(Transaction& txn, JournalEntry& entry, const std::string& approver_id) {
    Status period = check_period_open(txn.store(), entry.entry_date);
    if (!period) {
        return period;
    }

    std::map<AccountHandle, std::pair<Money, Money>> net;
    for (const auto& line : entry.lines) {
        auto& totals = net[line.account];
        totals.first += line.debit;
        totals.second += line.credit;
    }

    const AccountRegistry& registry = txn.registry();
    for (const auto& [handle, totals] : net) {
        const Account& account = registry.get(handle);
        txn.adjust_balance(handle, signed_delta(account.normal_side, totals.first, totals.second));
    }

    entry.status = EntryStatus::Posted;
    entry.approved_by = approver_id;
    entry.posting_sequence = txn.modify(txn.store().next_posting_sequence)++;

    const LogContext log_ctx = entry_log_context(entry, "post", approver_id);
    const std::string number = entry.entry_number;
    const Money total = entry.total_debit;
    txn.on_commit([log_ctx, number, total]() {
        Logger::get_instance().log_entry_posted(log_ctx, number, total);
    });

    return Status::ok();
}

template <typename R>
R log_if_rejected(R result, const LogContext& log_ctx) {
    if (!result.success()) {
        Logger::get_instance().log_rejected(log_ctx, result.error());
    }
    return result;
}

} // namespace

Result<SubmitResult> create_draft(Transaction& txn, const EntryRequest& request) {
    LedgerStore& store = txn.store();
    const AccountRegistry& registry = txn.registry();

    Status period = check_period_open(store, request.entry_date);
    if (!period) {
        return Result<SubmitResult>::fail(period.error());
    }

    for (size_t i = 0; i < request.lines.size(); ++i) {
        const LineInput& line = request.lines[i];
        const bool debit_side = line.debit.is_positive() && line.credit.is_zero();
        const bool credit_side = line.credit.is_positive() && line.debit.is_zero();
        if (!debit_side && !credit_side) {
            return Result<SubmitResult>::fail(
                ErrorKind::INVALID_LINE,
                "Line " + std::to_string(i + 1) + " must carry exactly one positive amount",
                {{"line", std::to_string(i + 1)},
                 {"debit", line.debit.to_string()},
                 {"credit", line.credit.to_string()}});
        }
    }

    Money total_debit;
    Money total_credit;
    for (const auto& line : request.lines) {
        total_debit += line.debit;
        total_credit += line.credit;
    }

    if (total_debit != total_credit) {
        return Result<SubmitResult>::fail(
            ErrorKind::UNBALANCED_ENTRY,
            "Entry is not balanced: debit " + total_debit.to_string() +
                " != credit " + total_credit.to_string(),
            {{"total_debit", total_debit.to_string()}, {"total_credit", total_credit.to_string()}});
    }

    if (total_debit.is_zero()) {
        return Result<SubmitResult>::fail(ErrorKind::ZERO_VALUE_ENTRY,
                                          "Entry has no value");
    }

    std::vector<JournalLine> lines;
    std::vector<std::string> invalid_codes;
    for (size_t i = 0; i < request.lines.size(); ++i) {
        const LineInput& input = request.lines[i];

        std::optional<AccountHandle> handle = input.account;
        if (!handle) {
            handle = registry.find(input.account_code);
        }
        if (!handle || handle->index >= registry.size()) {
            invalid_codes.push_back(input.account_code.empty() ? "<none>" : input.account_code);
            continue;
        }

        const Account& account = registry.get(*handle);
        if (!account.postable()) {
            invalid_codes.push_back(account.code);
            continue;
        }

        lines.push_back(JournalLine{static_cast<unsigned>(i + 1), *handle, input.debit,
                                    input.credit, input.description, input.reference});
    }

    if (!invalid_codes.empty()) {
        return Result<SubmitResult>::fail(
            ErrorKind::INVALID_ACCOUNT,
            "Accounts not found, inactive or header: " + join(invalid_codes),
            {{"codes", join(invalid_codes)}});
    }

    const std::string& external_ref = request.metadata.external_reference;
    if (!external_ref.empty() && store.external_references.count(external_ref) > 0) {
        const EntryId existing = store.external_references.at(external_ref);
        return Result<SubmitResult>::fail(
            ErrorKind::DUPLICATE_REFERENCE,
            "External reference already used: " + external_ref,
            {{"reference", external_ref},
             {"entry_number", store.entries.at(existing).entry_number}});
    }

    JournalEntry entry;
    entry.id = txn.modify(store.next_entry_id)++;
    entry.entry_number = next_reference(txn, prefix::JOURNAL_ENTRY, txn.today());
    entry.entry_date = request.entry_date;
    entry.status = EntryStatus::Draft;
    entry.total_debit = total_debit;
    entry.total_credit = total_credit;
    entry.metadata = request.metadata;
    entry.lines = std::move(lines);

    const EntryId entry_id = entry.id;
    JournalEntry& stored = txn.insert(store.entries, entry_id, std::move(entry));
    if (!external_ref.empty()) {
        txn.insert(store.external_references, external_ref, stored.id);
    }

    const LogContext log_ctx = entry_log_context(stored, "create_entry", stored.metadata.created_by);
    const std::string number = stored.entry_number;
    const Money total = stored.total_debit;
    const size_t line_count = stored.lines.size();
    txn.on_commit([log_ctx, number, total, line_count]() {
        Logger::get_instance().log_entry_created(log_ctx, number, "DRAFT", total, line_count);
    });

    return Result<SubmitResult>::ok(to_submit_result(stored));
}

Result<SubmitResult> submit(Transaction& txn, const EntryRequest& request) {
    auto draft = create_draft(txn, request);
    if (!draft || !request.auto_post) {
        return draft;
    }

    JournalEntry& entry = txn.modify(txn.store().entries.at(draft.value().entry_id));
    const std::string approver = entry.metadata.created_by.empty() ? "system" : entry.metadata.created_by;
    Status posted = apply_posting(txn, entry, approver);
    if (!posted) {
        return Result<SubmitResult>::fail(posted.error());
    }
    return Result<SubmitResult>::ok(to_submit_result(entry));
}

Result<SubmitResult> submit(LedgerContext& ctx, const EntryRequest& request) {
    LogContext log_ctx("submit", request.metadata.created_by, request.metadata.source_module);
    return log_if_rejected(
        with_transaction(ctx, log_ctx, [&request](Transaction& txn) {
            return submit(txn, request);
        }),
        log_ctx);
}

Status submit_for_approval(Transaction& txn, EntryId entry_id) {
    auto it = txn.store().entries.find(entry_id);
    if (it == txn.store().entries.end()) {
        return Status::fail(ErrorKind::NOT_FOUND, "Journal entry not found: " + std::to_string(entry_id));
    }
    if (it->second.status != EntryStatus::Draft) {
        return Status::fail(ErrorKind::INVALID_STATE,
                            "Only DRAFT entries can be submitted for approval, entry " +
                                it->second.entry_number + " is " +
                                entry_status_to_string(it->second.status),
                            {{"status", entry_status_to_string(it->second.status)}});
    }
    txn.modify(it->second).status = EntryStatus::PendingApproval;
    return Status::ok();
}

Status submit_for_approval(LedgerContext& ctx, EntryId entry_id) {
    LogContext log_ctx("submit_for_approval", "");
    return log_if_rejected(
        with_transaction(ctx, log_ctx, [entry_id](Transaction& txn) {
            return submit_for_approval(txn, entry_id);
        }),
        log_ctx);
}

Result<SubmitResult> post(Transaction& txn, EntryId entry_id, const Actor& approver) {
    auto it = txn.store().entries.find(entry_id);
    if (it == txn.store().entries.end()) {
        return Result<SubmitResult>::fail(ErrorKind::NOT_FOUND,
                                          "Journal entry not found: " + std::to_string(entry_id));
    }

    const JournalEntry& current = it->second;
    if (current.status == EntryStatus::Posted) {
        return Result<SubmitResult>::fail(ErrorKind::INVALID_STATE,
                                          "Entry " + current.entry_number + " is already posted",
                                          {{"status", "POSTED"}});
    }
    if (approver.id == current.metadata.created_by) {
        return Result<SubmitResult>::fail(ErrorKind::APPROVAL_DENIED,
                                          "Entries cannot be approved by their creator",
                                          {{"approver", approver.id}});
    }
    if (current.total_debit > approver.approval_limit) {
        return Result<SubmitResult>::fail(
            ErrorKind::APPROVAL_DENIED,
            "Entry total " + current.total_debit.to_string() + " exceeds approval limit " +
                approver.approval_limit.to_string(),
            {{"approver", approver.id},
             {"total", current.total_debit.to_string()},
             {"approval_limit", approver.approval_limit.to_string()}});
    }

    JournalEntry& entry = txn.modify(it->second);
    Status posted = apply_posting(txn, entry, approver.id);
    if (!posted) {
        return Result<SubmitResult>::fail(posted.error());
    }
    return Result<SubmitResult>::ok(to_submit_result(entry));
}

Result<SubmitResult> post(LedgerContext& ctx, EntryId entry_id, const Actor& approver) {
    LogContext log_ctx("post", approver.id);
    return log_if_rejected(
        with_transaction(ctx, log_ctx, [entry_id, &approver](Transaction& txn) {
            return post(txn, entry_id, approver);
        }),
        log_ctx);
}

Result<SubmitResult> reverse(Transaction& txn, const ReversalRequest& request) {
    auto it = txn.store().entries.find(request.entry_id);
    if (it == txn.store().entries.end()) {
        return Result<SubmitResult>::fail(ErrorKind::NOT_FOUND,
                                          "Journal entry not found: " + std::to_string(request.entry_id));
    }

    const JournalEntry& original = it->second;
    if (!original.is_posted()) {
        return Result<SubmitResult>::fail(ErrorKind::NOT_POSTED,
                                          "Only posted entries can be reversed, entry " +
                                              original.entry_number + " is " +
                                              entry_status_to_string(original.status),
                                          {{"status", entry_status_to_string(original.status)}});
    }
    if (original.reversed) {
        return Result<SubmitResult>::fail(ErrorKind::ALREADY_REVERSED,
                                          "Entry " + original.entry_number + " is already reversed",
                                          {{"entry_number", original.entry_number}});
    }
    if (original.is_reversal()) {
        return Result<SubmitResult>::fail(ErrorKind::REVERSAL_NOT_REVERSIBLE,
                                          "Entry " + original.entry_number +
                                              " is itself a reversal; post a new entry instead",
                                          {{"entry_number", original.entry_number}});
    }

    if (owned_by_subledger(original.metadata.source_module)) {
        return Result<SubmitResult>::fail(ErrorKind::INVALID_STATE,
                                          "Entry " + original.entry_number + " belongs to the " +
                                              original.metadata.source_module +
                                              " subledger and cannot be reversed directly",
                                          {{"entry_number", original.entry_number},
                                           {"source_module", original.metadata.source_module}});
    }

    EntryRequest mirror;
    mirror.entry_date = request.effective_date ? *request.effective_date : txn.today();
    mirror.auto_post = true;
    mirror.metadata.description = "Reversal of " + original.entry_number + ": " + request.reason;
    mirror.metadata.source_module = original.metadata.source_module;
    mirror.metadata.source_type = "reversal";
    mirror.metadata.source_id = original.entry_number;
    mirror.metadata.created_by = request.actor_id;

    for (const auto& line : original.lines) {
        LineInput swapped;
        swapped.account = line.account;
        swapped.debit = line.credit;
        swapped.credit = line.debit;
        swapped.description = line.description;
        swapped.reference = line.reference;
        mirror.lines.push_back(swapped);
    }

    auto reversal = submit(txn, mirror);
    if (!reversal) {
        return reversal;
    }

    const EntryId reversal_id = reversal.value().entry_id;
    JournalEntry& reversal_entry = txn.modify(txn.store().entries.at(reversal_id));
    reversal_entry.reverses_entry_id = request.entry_id;
    reversal_entry.reversal_reason = request.reason;

    JournalEntry& reversed = txn.modify(it->second);
    reversed.reversed = true;
    reversed.reversal_entry_id = reversal_id;
    reversed.reversal_reason = request.reason;

    const LogContext log_ctx = entry_log_context(reversed, "reverse", request.actor_id);
    const std::string original_number = reversed.entry_number;
    const std::string reversal_number = reversal_entry.entry_number;
    const std::string reason = request.reason;
    txn.on_commit([log_ctx, original_number, reversal_number, reason]() {
        Logger::get_instance().log_entry_reversed(log_ctx, original_number, reversal_number, reason);
    });

    return reversal;
}

Result<SubmitResult> reverse(LedgerContext& ctx, const ReversalRequest& request) {
    LogContext log_ctx("reverse", request.actor_id);
    return log_if_rejected(
        with_transaction(ctx, log_ctx, [&request](Transaction& txn) {
            return reverse(txn, request);
        }),
        log_ctx);
}

Result<JournalEntry> get_entry(const LedgerContext& ctx, EntryId entry_id) {
    return ctx.read([entry_id](const LedgerStore& store) {
        auto it = store.entries.find(entry_id);
        if (it == store.entries.end()) {
            return Result<JournalEntry>::fail(ErrorKind::NOT_FOUND,
                                              "Journal entry not found: " + std::to_string(entry_id));
        }
        return Result<JournalEntry>::ok(it->second);
    });
}

} // namespace ledgercore

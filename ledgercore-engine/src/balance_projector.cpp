#include "balance_projector.hpp"
#include <algorithm>

namespace ledgercore {

namespace {

AccountBalance replay_leaf(const LedgerStore& store, const Account& account,
                           const std::optional<Date>& as_of) {
    AccountBalance result;
    result.code = account.code;
    result.name = account.name;
    result.normal_side = account.normal_side;
    result.opening_balance = account.opening_balance;

    for (const auto& [id, entry] : store.entries) {
        if (!entry.is_posted()) {
            continue;
        }
        if (as_of && *as_of < entry.entry_date) {
            continue;
        }
        for (const auto& line : entry.lines) {
            if (line.account == account.handle) {
                result.debit_total += line.debit;
                result.credit_total += line.credit;
            }
        }
    }

    result.balance = account.opening_balance +
                     signed_delta(account.normal_side, result.debit_total, result.credit_total);
    return result;
}

} // namespace

AccountBalance replay_balance(const LedgerStore& store, const AccountRegistry& registry,
                              AccountHandle handle, const std::optional<Date>& as_of) {
    const Account& account = registry.get(handle);
    if (!account.header) {
        return replay_leaf(store, account, as_of);
    }

    AccountBalance result;
    result.code = account.code;
    result.name = account.name;
    result.normal_side = account.normal_side;

    for (AccountHandle child : registry.descendants(handle)) {
        const Account& member = registry.get(child);
        if (member.header) {
            continue;
        }
        AccountBalance leaf = replay_leaf(store, member, as_of);
        const bool same_side = member.normal_side == account.normal_side;
        result.opening_balance += same_side ? leaf.opening_balance : -leaf.opening_balance;
        result.balance += same_side ? leaf.balance : -leaf.balance;
        result.debit_total += leaf.debit_total;
        result.credit_total += leaf.credit_total;
    }
    return result;
}

Result<AccountBalance> get_account_balance(const LedgerContext& ctx, const std::string& code,
                                           const std::optional<Date>& as_of) {
    const AccountRegistry& registry = ctx.registry();
    auto handle = registry.find(code);
    if (!handle) {
        return Result<AccountBalance>::fail(ErrorKind::NOT_FOUND, "Account not found: " + code,
                                            {{"code", code}});
    }

    return Result<AccountBalance>::ok(ctx.read([&](const LedgerStore& store) {
        return replay_balance(store, registry, *handle, as_of);
    }));
}

TrialBalance generate_trial_balance(const LedgerContext& ctx, const Date& as_of) {
    const AccountRegistry& registry = ctx.registry();

    return ctx.read([&](const LedgerStore& store) {
        TrialBalance report;
        report.as_of = as_of;

        for (AccountHandle handle : registry.by_code()) {
            const Account& account = registry.get(handle);
            if (!account.postable()) {
                continue;
            }

            AccountBalance balance = replay_leaf(store, account, as_of);
            if (balance.balance.is_zero()) {
                continue;
            }

            // A negative balance is a contra balance and lands in the other column
            BalanceSide column = account.normal_side;
            if (balance.balance.is_negative()) {
                column = column == BalanceSide::Debit ? BalanceSide::Credit : BalanceSide::Debit;
            }

            TrialBalanceRow row;
            row.code = account.code;
            row.name = account.name;
            row.type = account.type;
            if (column == BalanceSide::Debit) {
                row.debit = balance.balance.abs();
            } else {
                row.credit = balance.balance.abs();
            }

            report.total_debit += row.debit;
            report.total_credit += row.credit;
            report.rows.push_back(row);
        }

        return report;
    });
}

Result<AccountLedger> get_ledger(const LedgerContext& ctx, const std::string& code,
                                 const Date& start, const Date& end) {
    if (end < start) {
        return Result<AccountLedger>::fail(
            ErrorKind::INVALID_STATE,
            "Ledger range start " + start.to_string() + " is after end " + end.to_string(),
            {{"start", start.to_string()}, {"end", end.to_string()}});
    }

    const AccountRegistry& registry = ctx.registry();
    auto handle = registry.find(code);
    if (!handle) {
        return Result<AccountLedger>::fail(ErrorKind::NOT_FOUND, "Account not found: " + code,
                                           {{"code", code}});
    }
    const Account& account = registry.get(*handle);

    return Result<AccountLedger>::ok(ctx.read([&](const LedgerStore& store) {
        AccountLedger ledger;
        ledger.code = account.code;
        ledger.name = account.name;
        ledger.start = start;
        ledger.end = end;
        // Entries dated on `start` belong to the period, not the opening figure
        ledger.opening_balance = replay_balance(store, registry, *handle, start.add_days(-1)).balance;

        struct Row {
            const JournalEntry* entry;
            const JournalLine* line;
        };
        std::vector<Row> rows;
        for (const auto& [id, entry] : store.entries) {
            if (!entry.is_posted() || entry.entry_date < start || end < entry.entry_date) {
                continue;
            }
            for (const auto& line : entry.lines) {
                if (line.account == *handle) {
                    rows.push_back(Row{&entry, &line});
                }
            }
        }

        std::sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
            if (a.entry->entry_date != b.entry->entry_date) {
                return a.entry->entry_date < b.entry->entry_date;
            }
            if (a.entry->posting_sequence != b.entry->posting_sequence) {
                return a.entry->posting_sequence < b.entry->posting_sequence;
            }
            return a.line->line_number < b.line->line_number;
        });

        Money running = ledger.opening_balance;
        for (const auto& row : rows) {
            running += signed_delta(account.normal_side, row.line->debit, row.line->credit);

            LedgerLine out;
            out.entry_date = row.entry->entry_date;
            out.entry_number = row.entry->entry_number;
            out.description = row.line->description.empty() ? row.entry->metadata.description
                                                            : row.line->description;
            out.debit = row.line->debit;
            out.credit = row.line->credit;
            out.running_balance = running;
            ledger.lines.push_back(out);
        }
        ledger.closing_balance = running;

        return ledger;
    }));
}

std::vector<BalanceMismatch> verify_cached_balances(const LedgerContext& ctx) {
    const AccountRegistry& registry = ctx.registry();

    return ctx.read([&](const LedgerStore& store) {
        std::vector<BalanceMismatch> mismatches;
        for (AccountHandle handle : registry.by_code()) {
            const Account& account = registry.get(handle);
            if (account.header) {
                continue;
            }
            const Money replayed = replay_leaf(store, account, std::nullopt).balance;
            const Money cached = store.balances.at(handle.index);
            if (cached != replayed) {
                mismatches.push_back(BalanceMismatch{account.code, cached, replayed});
            }
        }
        return mismatches;
    });
}

} // namespace ledgercore

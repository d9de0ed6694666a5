#include "savings_service.hpp"
#include "../deposit_interest.hpp"
#include "../logger.hpp"
#include "../posting_engine.hpp"
#include "../reference_generator.hpp"

namespace ledgercore {

namespace {

const char* SOURCE_MODULE = "savings";

LedgerError account_not_found(uint64_t account_id) {
    return LedgerError(ErrorKind::NOT_FOUND,
                       "Savings account not found: " + std::to_string(account_id),
                       {{"account_id", std::to_string(account_id)}});
}

Result<SavingsTransactionResult> fail(const LedgerError& error) {
    return Result<SavingsTransactionResult>::fail(error);
}

} // namespace

SavingsService::SavingsService(LedgerContext& ctx, const RoleBindings& roles)
    : ctx_(ctx), roles_(roles) {}

const std::vector<AccountRole>& SavingsService::required_roles() {
    static const std::vector<AccountRole> roles = {
        AccountRole::CashBank,
        AccountRole::SavingsLiability,
        AccountRole::InterestExpense
    };
    return roles;
}

Result<SavingsAccount> SavingsService::open_account(const SavingsAccountRequest& request) {
    LogContext log_ctx("savings.open", "", SOURCE_MODULE);

    if (request.minimum_balance.is_negative() || request.annual_rate < 0) {
        LedgerError error(ErrorKind::INVALID_AMOUNT, "Minimum balance and rate must not be negative");
        Logger::get_instance().log_rejected(log_ctx, error);
        return Result<SavingsAccount>::fail(error);
    }

    auto result = with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        LedgerStore& store = txn.store();

        SavingsAccount account;
        account.id = txn.modify(store.next_record_id)++;
        account.account_number = next_reference(txn, prefix::SAVINGS_ACCOUNT, txn.today());
        account.customer_id = request.customer_id;
        account.minimum_balance = request.minimum_balance;
        account.annual_rate = request.annual_rate;
        account.withdrawals_allowed = request.withdrawals_allowed;
        account.status = SavingsStatus::Active;

        const uint64_t id = account.id;
        return Result<SavingsAccount>::ok(txn.insert(store.savings_accounts, id, std::move(account)));
    });

    if (result) {
        Logger::get_instance().log_workflow_event(log_ctx, "savings_opened", {
            {"account_number", result.value().account_number}
        });
    }
    return result;
}

Result<SavingsTransactionResult> SavingsService::deposit(const SavingsTransactionRequest& request) {
    LogContext log_ctx("savings.deposit", request.actor_id, SOURCE_MODULE);

    auto result = with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        if (!request.amount.is_positive()) {
            return fail(LedgerError(ErrorKind::INVALID_AMOUNT, "Deposit amount must be positive",
                                    {{"amount", request.amount.to_string()}}));
        }

        auto cash = roles_.require(AccountRole::CashBank);
        auto liability = roles_.require(AccountRole::SavingsLiability);
        if (!cash) return fail(cash.error());
        if (!liability) return fail(liability.error());

        auto it = txn.store().savings_accounts.find(request.account_id);
        if (it == txn.store().savings_accounts.end()) {
            return fail(account_not_found(request.account_id));
        }
        if (it->second.status != SavingsStatus::Active) {
            return fail(LedgerError(ErrorKind::INVALID_STATE,
                                    "Account " + it->second.account_number + " is " +
                                        savings_status_to_string(it->second.status),
                                    {{"status", savings_status_to_string(it->second.status)}}));
        }

        const Date date = request.date ? *request.date : txn.today();
        const std::string number = next_reference(txn, prefix::SAVINGS_TRANSACTION, date);

        EntryRequest entry;
        entry.entry_date = date;
        entry.auto_post = true;
        entry.metadata.description = "Savings deposit - " + it->second.account_number + " - " + number;
        entry.metadata.source_module = SOURCE_MODULE;
        entry.metadata.source_type = "deposit";
        entry.metadata.source_id = it->second.account_number;
        entry.metadata.created_by = request.actor_id;
        entry.metadata.external_reference = request.reference;
        entry.lines.push_back(LineInput::debit_line(cash.value(), request.amount, "Cash deposit"));
        entry.lines.push_back(LineInput::credit_line(liability.value(), request.amount,
                                                     "Customer savings", it->second.account_number));

        auto posted = submit(txn, entry);
        if (!posted) {
            return fail(posted.error());
        }

        SavingsAccount& account = txn.modify(it->second);
        account.balance += request.amount;

        return Result<SavingsTransactionResult>::ok(SavingsTransactionResult{
            number, posted.value().entry_id, posted.value().entry_number, account.balance});
    });

    if (!result) {
        Logger::get_instance().log_rejected(log_ctx, result.error());
        return result;
    }

    Logger::get_instance().log_workflow_event(log_ctx, "savings_deposit", {
        {"transaction_number", result.value().transaction_number},
        {"amount", request.amount.to_string()},
        {"balance_after", result.value().balance_after.to_string()}
    });
    return result;
}

Result<SavingsTransactionResult> SavingsService::withdraw(const SavingsTransactionRequest& request) {
    LogContext log_ctx("savings.withdraw", request.actor_id, SOURCE_MODULE);

    auto result = with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        if (!request.amount.is_positive()) {
            return fail(LedgerError(ErrorKind::INVALID_AMOUNT, "Withdrawal amount must be positive",
                                    {{"amount", request.amount.to_string()}}));
        }

        auto cash = roles_.require(AccountRole::CashBank);
        auto liability = roles_.require(AccountRole::SavingsLiability);
        if (!cash) return fail(cash.error());
        if (!liability) return fail(liability.error());

        auto it = txn.store().savings_accounts.find(request.account_id);
        if (it == txn.store().savings_accounts.end()) {
            return fail(account_not_found(request.account_id));
        }
        const SavingsAccount& current = it->second;
        if (current.status != SavingsStatus::Active) {
            return fail(LedgerError(ErrorKind::INVALID_STATE,
                                    "Account " + current.account_number + " is " +
                                        savings_status_to_string(current.status),
                                    {{"status", savings_status_to_string(current.status)}}));
        }
        if (!current.withdrawals_allowed) {
            return fail(LedgerError(ErrorKind::INVALID_STATE,
                                    "Withdrawals are not allowed on account " + current.account_number));
        }
        if (request.amount > current.balance) {
            return fail(LedgerError(ErrorKind::INSUFFICIENT_BALANCE,
                                    "Insufficient balance: available " + current.balance.to_string(),
                                    {{"available", current.balance.to_string()},
                                     {"requested", request.amount.to_string()}}));
        }
        if (current.balance - request.amount < current.minimum_balance) {
            return fail(LedgerError(ErrorKind::INSUFFICIENT_BALANCE,
                                    "Withdrawal would breach minimum balance " +
                                        current.minimum_balance.to_string(),
                                    {{"available", (current.balance - current.minimum_balance).to_string()},
                                     {"minimum_balance", current.minimum_balance.to_string()},
                                     {"requested", request.amount.to_string()}}));
        }

        const Date date = request.date ? *request.date : txn.today();
        const std::string number = next_reference(txn, prefix::SAVINGS_TRANSACTION, date);

        EntryRequest entry;
        entry.entry_date = date;
        entry.auto_post = true;
        entry.metadata.description = "Savings withdrawal - " + current.account_number + " - " + number;
        entry.metadata.source_module = SOURCE_MODULE;
        entry.metadata.source_type = "withdrawal";
        entry.metadata.source_id = current.account_number;
        entry.metadata.created_by = request.actor_id;
        entry.metadata.external_reference = request.reference;
        entry.lines.push_back(LineInput::debit_line(liability.value(), request.amount,
                                                    "Customer savings", current.account_number));
        entry.lines.push_back(LineInput::credit_line(cash.value(), request.amount, "Cash withdrawal"));

        auto posted = submit(txn, entry);
        if (!posted) {
            return fail(posted.error());
        }

        SavingsAccount& account = txn.modify(it->second);
        account.balance -= request.amount;

        return Result<SavingsTransactionResult>::ok(SavingsTransactionResult{
            number, posted.value().entry_id, posted.value().entry_number, account.balance});
    });

    if (!result) {
        Logger::get_instance().log_rejected(log_ctx, result.error());
        return result;
    }

    Logger::get_instance().log_workflow_event(log_ctx, "savings_withdrawal", {
        {"transaction_number", result.value().transaction_number},
        {"amount", request.amount.to_string()},
        {"balance_after", result.value().balance_after.to_string()}
    });
    return result;
}

Result<Money> SavingsService::post_interest(uint64_t account_id, const Date& as_of) {
    LogContext log_ctx("savings.interest", "", SOURCE_MODULE);

    return with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        auto expense = roles_.require(AccountRole::InterestExpense);
        auto liability = roles_.require(AccountRole::SavingsLiability);
        if (!expense) return Result<Money>::fail(expense.error());
        if (!liability) return Result<Money>::fail(liability.error());

        auto it = txn.store().savings_accounts.find(account_id);
        if (it == txn.store().savings_accounts.end()) {
            return Result<Money>::fail(account_not_found(account_id));
        }
        const SavingsAccount& current = it->second;
        if (current.last_interest_date && current.last_interest_date->period() == as_of.period()) {
            return Result<Money>::fail(ErrorKind::INVALID_STATE,
                                       "Interest for " + as_of.period().to_string() +
                                           " already credited to " + current.account_number,
                                       {{"period", as_of.period().to_string()}});
        }

        const Money interest = current.status == SavingsStatus::Active
            ? monthly_savings_interest(current.balance, current.annual_rate)
            : Money();
        if (interest.is_zero()) {
            return Result<Money>::ok(interest);
        }

        EntryRequest entry;
        entry.entry_date = as_of;
        entry.auto_post = true;
        entry.metadata.description = "Savings interest " + as_of.period().to_string() + " - " +
                                     current.account_number;
        entry.metadata.source_module = SOURCE_MODULE;
        entry.metadata.source_type = "interest";
        entry.metadata.source_id = current.account_number;
        entry.metadata.created_by = "system";
        entry.lines.push_back(LineInput::debit_line(expense.value(), interest, "Interest on savings"));
        entry.lines.push_back(LineInput::credit_line(liability.value(), interest,
                                                     "Interest credited", current.account_number));

        auto posted = submit(txn, entry);
        if (!posted) {
            return Result<Money>::fail(posted.error());
        }

        SavingsAccount& account = txn.modify(it->second);
        account.balance += interest;
        account.last_interest_date = as_of;
        return Result<Money>::ok(interest);
    });
}

Result<SavingsAccount> SavingsService::get_account(uint64_t account_id) const {
    return ctx_.read([account_id](const LedgerStore& store) {
        auto it = store.savings_accounts.find(account_id);
        if (it == store.savings_accounts.end()) {
            return Result<SavingsAccount>::fail(account_not_found(account_id));
        }
        return Result<SavingsAccount>::ok(it->second);
    });
}

} // namespace ledgercore

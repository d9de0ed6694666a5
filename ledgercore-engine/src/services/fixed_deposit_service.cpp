#include "fixed_deposit_service.hpp"
#include "../logger.hpp"
#include "../posting_engine.hpp"
#include "../reference_generator.hpp"

namespace ledgercore {

namespace {

const char* SOURCE_MODULE = "fixed_deposits";

LedgerError deposit_not_found(uint64_t deposit_id) {
    return LedgerError(ErrorKind::NOT_FOUND,
                       "Fixed deposit not found: " + std::to_string(deposit_id),
                       {{"deposit_id", std::to_string(deposit_id)}});
}

LedgerError not_active(const FixedDeposit& deposit) {
    return LedgerError(ErrorKind::INVALID_STATE,
                       "Fixed deposit " + deposit.certificate_number + " is " +
                           deposit_status_to_string(deposit.status),
                       {{"status", deposit_status_to_string(deposit.status)}});
}

FixedDeposit open_deposit(Transaction& txn, const std::string& customer_id, Money principal,
                          const Decimal& annual_rate, unsigned tenure_days,
                          MaturityInstruction instruction, const Date& start) {
    FixedDeposit deposit;
    deposit.id = txn.modify(txn.store().next_record_id)++;
    deposit.certificate_number = next_reference(txn, prefix::FIXED_DEPOSIT, start);
    deposit.customer_id = customer_id;
    deposit.principal = principal;
    deposit.annual_rate = annual_rate;
    deposit.tenure_days = tenure_days;
    deposit.start_date = start;
    deposit.maturity_date = start.add_days(tenure_days);
    deposit.interest_amount = simple_interest(principal, annual_rate, tenure_days);
    deposit.maturity_amount = principal + deposit.interest_amount;
    deposit.last_accrual_date = start;
    deposit.instruction = instruction;
    deposit.status = DepositStatus::Active;
    return deposit;
}

} // namespace

FixedDepositService::FixedDepositService(LedgerContext& ctx, const RoleBindings& roles,
                                         const Decimal& premature_penalty_rate)
    : ctx_(ctx), roles_(roles), premature_penalty_rate_(premature_penalty_rate) {}

const std::vector<AccountRole>& FixedDepositService::required_roles() {
    static const std::vector<AccountRole> roles = {
        AccountRole::CashBank,
        AccountRole::FixedDepositLiability,
        AccountRole::InterestPayable,
        AccountRole::InterestExpense
    };
    return roles;
}

Result<FixedDeposit> FixedDepositService::create(const FixedDepositRequest& request) {
    LogContext log_ctx("fd.create", request.actor_id, SOURCE_MODULE);

    auto result = with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        if (!request.principal.is_positive() || request.annual_rate < 0 || request.tenure_days == 0) {
            return Result<FixedDeposit>::fail(
                ErrorKind::INVALID_AMOUNT,
                "Fixed deposit needs a positive principal and tenure and a non-negative rate",
                {{"principal", request.principal.to_string()},
                 {"tenure_days", std::to_string(request.tenure_days)}});
        }

        auto cash = roles_.require(AccountRole::CashBank);
        auto liability = roles_.require(AccountRole::FixedDepositLiability);
        if (!cash) return Result<FixedDeposit>::fail(cash.error());
        if (!liability) return Result<FixedDeposit>::fail(liability.error());

        const Date start = request.start_date ? *request.start_date : txn.today();
        FixedDeposit deposit = open_deposit(txn, request.customer_id, request.principal,
                                            request.annual_rate, request.tenure_days,
                                            request.instruction, start);

        EntryRequest entry;
        entry.entry_date = start;
        entry.auto_post = true;
        entry.metadata.description = "Fixed deposit placed - " + deposit.certificate_number;
        entry.metadata.source_module = SOURCE_MODULE;
        entry.metadata.source_type = "placement";
        entry.metadata.source_id = deposit.certificate_number;
        entry.metadata.created_by = request.actor_id;
        entry.lines.push_back(LineInput::debit_line(cash.value(), deposit.principal, "Deposit received"));
        entry.lines.push_back(LineInput::credit_line(liability.value(), deposit.principal,
                                                     "Fixed deposit liability",
                                                     deposit.certificate_number));

        auto posted = submit(txn, entry);
        if (!posted) {
            return Result<FixedDeposit>::fail(posted.error());
        }

        const uint64_t id = deposit.id;
        return Result<FixedDeposit>::ok(txn.insert(txn.store().fixed_deposits, id, std::move(deposit)));
    });

    if (!result) {
        Logger::get_instance().log_rejected(log_ctx, result.error());
        return result;
    }

    Logger::get_instance().log_workflow_event(log_ctx, "fd_created", {
        {"certificate_number", result.value().certificate_number},
        {"principal", result.value().principal.to_string()},
        {"maturity_date", result.value().maturity_date.to_string()},
        {"maturity_amount", result.value().maturity_amount.to_string()}
    });
    return result;
}

Result<Money> FixedDepositService::accrue_in(Transaction& txn, uint64_t deposit_id, const Date& as_of) {
    auto expense = roles_.require(AccountRole::InterestExpense);
    auto payable = roles_.require(AccountRole::InterestPayable);
    if (!expense) return Result<Money>::fail(expense.error());
    if (!payable) return Result<Money>::fail(payable.error());

    auto it = txn.store().fixed_deposits.find(deposit_id);
    if (it == txn.store().fixed_deposits.end()) {
        return Result<Money>::fail(deposit_not_found(deposit_id));
    }
    const FixedDeposit& current = it->second;
    if (current.status != DepositStatus::Active) {
        return Result<Money>::fail(not_active(current));
    }

    const Money due = accrual_due(current, as_of);
    if (due.is_zero()) {
        return Result<Money>::ok(due);
    }

    EntryRequest entry;
    entry.entry_date = as_of;
    entry.auto_post = true;
    entry.metadata.description = "Interest accrual - " + current.certificate_number;
    entry.metadata.source_module = SOURCE_MODULE;
    entry.metadata.source_type = "accrual";
    entry.metadata.source_id = current.certificate_number;
    entry.metadata.created_by = "system";
    entry.lines.push_back(LineInput::debit_line(expense.value(), due, "Interest on fixed deposit"));
    entry.lines.push_back(LineInput::credit_line(payable.value(), due, "Interest payable",
                                                 current.certificate_number));

    auto posted = submit(txn, entry);
    if (!posted) {
        return Result<Money>::fail(posted.error());
    }

    FixedDeposit& deposit = txn.modify(it->second);
    deposit.accrued_interest += due;
    deposit.last_accrual_date = as_of;
    return Result<Money>::ok(due);
}

Result<Money> FixedDepositService::accrue_interest(uint64_t deposit_id, const Date& as_of) {
    LogContext log_ctx("fd.accrue", "", SOURCE_MODULE);
    return with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        return accrue_in(txn, deposit_id, as_of);
    });
}

Result<MaturityResult> FixedDepositService::process_maturity(uint64_t deposit_id, const Date& as_of) {
    LogContext log_ctx("fd.maturity", "", SOURCE_MODULE);

    auto result = with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        auto cash = roles_.require(AccountRole::CashBank);
        auto liability = roles_.require(AccountRole::FixedDepositLiability);
        auto payable = roles_.require(AccountRole::InterestPayable);
        for (const auto* role : {&cash, &liability, &payable}) {
            if (!*role) {
                return Result<MaturityResult>::fail(role->error());
            }
        }

        auto it = txn.store().fixed_deposits.find(deposit_id);
        if (it == txn.store().fixed_deposits.end()) {
            return Result<MaturityResult>::fail(deposit_not_found(deposit_id));
        }
        if (it->second.status != DepositStatus::Active) {
            return Result<MaturityResult>::fail(not_active(it->second));
        }
        if (as_of < it->second.maturity_date) {
            return Result<MaturityResult>::fail(
                ErrorKind::INVALID_STATE,
                "Fixed deposit " + it->second.certificate_number + " matures on " +
                    it->second.maturity_date.to_string(),
                {{"maturity_date", it->second.maturity_date.to_string()}});
        }

        // Bring the accrual up to the full interest first
        auto accrued = accrue_in(txn, deposit_id, it->second.maturity_date);
        if (!accrued) {
            return Result<MaturityResult>::fail(accrued.error());
        }

        const FixedDeposit& current = it->second;
        const bool rollover = current.instruction == MaturityInstruction::Rollover;

        EntryRequest entry;
        entry.entry_date = as_of;
        entry.auto_post = true;
        entry.metadata.description = std::string(rollover ? "Fixed deposit rollover - " : "Fixed deposit payout - ") +
                                     current.certificate_number;
        entry.metadata.source_module = SOURCE_MODULE;
        entry.metadata.source_type = rollover ? "rollover" : "maturity";
        entry.metadata.source_id = current.certificate_number;
        entry.metadata.created_by = "system";
        entry.lines.push_back(LineInput::debit_line(liability.value(), current.principal,
                                                    "Deposit matured", current.certificate_number));
        if (current.accrued_interest.is_positive()) {
            entry.lines.push_back(LineInput::debit_line(payable.value(), current.accrued_interest,
                                                        "Interest released", current.certificate_number));
        }
        const Money maturity_amount = current.principal + current.accrued_interest;

        MaturityResult outcome;
        outcome.deposit_id = deposit_id;
        outcome.action = current.instruction;
        outcome.maturity_amount = maturity_amount;

        if (rollover) {
            FixedDeposit renewed = open_deposit(txn, current.customer_id, maturity_amount,
                                                current.annual_rate, current.tenure_days,
                                                current.instruction, current.maturity_date);
            entry.lines.push_back(LineInput::credit_line(liability.value(), maturity_amount,
                                                         "Rolled over", renewed.certificate_number));
            outcome.rollover_deposit_id = renewed.id;
            const uint64_t renewed_id = renewed.id;
            txn.insert(txn.store().fixed_deposits, renewed_id, std::move(renewed));
        } else {
            entry.lines.push_back(LineInput::credit_line(cash.value(), maturity_amount,
                                                         "Maturity payout", current.certificate_number));
        }

        auto posted = submit(txn, entry);
        if (!posted) {
            return Result<MaturityResult>::fail(posted.error());
        }
        outcome.entry_id = posted.value().entry_id;

        FixedDeposit& settled = txn.modify(it->second);
        settled.status = rollover ? DepositStatus::RolledOver : DepositStatus::Matured;
        settled.rolled_over_to = outcome.rollover_deposit_id;

        return Result<MaturityResult>::ok(outcome);
    });

    if (!result) {
        Logger::get_instance().log_rejected(log_ctx, result.error());
        return result;
    }

    Logger::get_instance().log_workflow_event(log_ctx, "fd_matured", {
        {"deposit_id", std::to_string(deposit_id)},
        {"action", maturity_instruction_to_string(result.value().action)},
        {"maturity_amount", result.value().maturity_amount.to_string()}
    });
    return result;
}

Result<PrematureWithdrawalResult> FixedDepositService::premature_withdrawal(
    uint64_t deposit_id,
    const std::string& actor_id,
    const std::optional<Date>& date
) {
    LogContext log_ctx("fd.premature_withdrawal", actor_id, SOURCE_MODULE);

    auto result = with_transaction(ctx_, log_ctx, [&](Transaction& txn) {
        auto cash = roles_.require(AccountRole::CashBank);
        auto liability = roles_.require(AccountRole::FixedDepositLiability);
        auto payable = roles_.require(AccountRole::InterestPayable);
        auto expense = roles_.require(AccountRole::InterestExpense);
        for (const auto* role : {&cash, &liability, &payable, &expense}) {
            if (!*role) {
                return Result<PrematureWithdrawalResult>::fail(role->error());
            }
        }

        auto it = txn.store().fixed_deposits.find(deposit_id);
        if (it == txn.store().fixed_deposits.end()) {
            return Result<PrematureWithdrawalResult>::fail(deposit_not_found(deposit_id));
        }
        const FixedDeposit& current = it->second;
        if (current.status != DepositStatus::Active) {
            return Result<PrematureWithdrawalResult>::fail(not_active(current));
        }

        const Date as_of = date ? *date : txn.today();
        if (as_of >= current.maturity_date) {
            return Result<PrematureWithdrawalResult>::fail(
                ErrorKind::INVALID_STATE,
                "Fixed deposit " + current.certificate_number + " has reached maturity",
                {{"maturity_date", current.maturity_date.to_string()}});
        }

        const PrematureSettlement settlement = premature_settlement(current, as_of, premature_penalty_rate_);

        EntryRequest entry;
        entry.entry_date = as_of;
        entry.auto_post = true;
        entry.metadata.description = "Premature withdrawal - " + current.certificate_number;
        entry.metadata.source_module = SOURCE_MODULE;
        entry.metadata.source_type = "premature_withdrawal";
        entry.metadata.source_id = current.certificate_number;
        entry.metadata.created_by = actor_id;
        entry.lines.push_back(LineInput::debit_line(liability.value(), current.principal,
                                                    "Deposit closed", current.certificate_number));
        if (current.accrued_interest.is_positive()) {
            entry.lines.push_back(LineInput::debit_line(payable.value(), current.accrued_interest,
                                                        "Accrued interest released"));
        }
        entry.lines.push_back(LineInput::credit_line(cash.value(), settlement.payout,
                                                     "Premature payout", current.certificate_number));

        // True up recognised interest to what is actually paid
        const Money adjustment = settlement.net_interest - current.accrued_interest;
        if (adjustment.is_positive()) {
            entry.lines.push_back(LineInput::debit_line(expense.value(), adjustment, "Interest true-up"));
        } else if (adjustment.is_negative()) {
            entry.lines.push_back(LineInput::credit_line(expense.value(), adjustment.abs(),
                                                         "Penalty and interest forfeited"));
        }

        auto posted = submit(txn, entry);
        if (!posted) {
            return Result<PrematureWithdrawalResult>::fail(posted.error());
        }

        FixedDeposit& closed = txn.modify(it->second);
        closed.status = DepositStatus::PrematureClosed;
        closed.accrued_interest = settlement.net_interest;
        closed.last_accrual_date = as_of;

        return Result<PrematureWithdrawalResult>::ok(
            PrematureWithdrawalResult{settlement, posted.value().entry_id, posted.value().entry_number});
    });

    if (!result) {
        Logger::get_instance().log_rejected(log_ctx, result.error());
        return result;
    }

    Logger::get_instance().log_workflow_event(log_ctx, "fd_premature_withdrawal", {
        {"deposit_id", std::to_string(deposit_id)},
        {"interest_earned", result.value().settlement.interest_earned.to_string()},
        {"penalty", result.value().settlement.penalty.to_string()},
        {"payout", result.value().settlement.payout.to_string()}
    });
    return result;
}

Result<FixedDeposit> FixedDepositService::get_deposit(uint64_t deposit_id) const {
    return ctx_.read([deposit_id](const LedgerStore& store) {
        auto it = store.fixed_deposits.find(deposit_id);
        if (it == store.fixed_deposits.end()) {
            return Result<FixedDeposit>::fail(deposit_not_found(deposit_id));
        }
        return Result<FixedDeposit>::ok(it->second);
    });
}

} // namespace ledgercore

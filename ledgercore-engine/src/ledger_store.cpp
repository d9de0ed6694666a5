#include "ledger_store.hpp"

namespace ledgercore {

LedgerContext::LedgerContext(std::shared_ptr<const AccountRegistry> registry,
                             const TransactionLimits& limits,
                             std::shared_ptr<const Clock> clock)
    : registry_(std::move(registry)),
      limits_(limits),
      clock_(std::move(clock)) {
    if (!registry_) {
        throw std::invalid_argument("LedgerContext requires an account registry");
    }
    if (!clock_) {
        throw std::invalid_argument("LedgerContext requires a clock");
    }

    store_.balances.reserve(registry_->size());
    for (const auto& account : registry_->accounts()) {
        store_.balances.push_back(account.opening_balance);
    }
}

Transaction::Transaction(LedgerContext& ctx, const LogContext& log_ctx)
    : ctx_(ctx),
      log_ctx_(log_ctx),
      lock_(ctx.mutex_, std::defer_lock),
      finished_(false) {
    lock_.try_lock_for(std::chrono::milliseconds(ctx.limits().max_wait_ms));
    start_time_ = std::chrono::steady_clock::now();
}

Transaction::~Transaction() {
    if (active()) {
        rollback("transaction abandoned");
    }
}

void Transaction::adjust_balance(AccountHandle account, Money delta) {
    Money& balance = ctx_.store_.balances.at(account.index);
    const Money previous = balance;
    balance += delta;
    undo_.push_back([&balance, previous]() { balance = previous; });
}

Status Transaction::commit() {
    if (!active()) {
        return Status::fail(ErrorKind::INVALID_STATE, "Transaction is not active");
    }

    auto elapsed = std::chrono::steady_clock::now() - start_time_;
    double elapsed_ms = std::chrono::duration<double, std::milli>(elapsed).count();
    if (elapsed_ms > static_cast<double>(ctx_.limits().timeout_ms)) {
        LedgerError error(ErrorKind::TRANSACTION_TIMEOUT,
                          "Transaction exceeded " + std::to_string(ctx_.limits().timeout_ms) + " ms",
                          {{"elapsed_ms", std::to_string(elapsed_ms)},
                           {"timeout_ms", std::to_string(ctx_.limits().timeout_ms)}});
        rollback(error.message);
        return Status::fail(error);
    }

    undo_.clear();
    finished_ = true;
    lock_.unlock();

    for (auto& action : on_commit_) {
        action();
    }
    on_commit_.clear();
    return Status::ok();
}

void Transaction::rollback(const std::string& reason) {
    if (!active()) {
        return;
    }

    const size_t undo_count = undo_.size();
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
        (*it)();
    }
    undo_.clear();
    on_commit_.clear();
    finished_ = true;
    lock_.unlock();

    Logger::get_instance().log_rollback(log_ctx_, reason, undo_count);
}

} // namespace ledgercore

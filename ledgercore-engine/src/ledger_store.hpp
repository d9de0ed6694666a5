/**
 * @file ledger_store.hpp
 * @brief Persisted ledger state and the bounded atomic transaction around it
 *
 * The LedgerContext owns:
 * - The chart of accounts (immutable after startup)
 * - The ledger store: cached balances, entries, periods, sequences, product records
 * - A reader/writer lock: writers hold it exclusively for a whole Transaction
 * - The clock used for "today"
 *
 * Every mutation goes through a Transaction, which journals an undo action per
 * change. rollback() replays the journal in reverse, so a failed or timed-out
 * operation leaves no trace. Readers take the shared lock and only ever see
 * committed state.
 *
 * Design Pattern: RAII unit of work with undo journal
 */

#ifndef LEDGERCORE_LEDGER_STORE_HPP
#define LEDGERCORE_LEDGER_STORE_HPP

#include "account_registry.hpp"
#include "calendar.hpp"
#include "journal.hpp"
#include "ledger_error.hpp"
#include "logger.hpp"
#include "products.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace ledgercore {

/**
 * @brief Source of the business date
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Date today() const = 0;
};

class SystemClock : public Clock {
public:
    Date today() const override { return Date::today(); }
};

// Clock pinned to a settable date, for batch replays and tests
class FixedClock : public Clock {
public:
    explicit FixedClock(const Date& date) : date_(date) {}

    Date today() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return date_;
    }

    void set(const Date& date) {
        std::lock_guard<std::mutex> lock(mutex_);
        date_ = date;
    }

private:
    mutable std::mutex mutex_;
    Date date_;
};

/**
 * @brief Transaction bounds
 */
struct TransactionLimits {
    size_t max_wait_ms;     ///< Longest wait for the write lock (default: 10s)
    size_t timeout_ms;      ///< Longest execution time before commit is refused (default: 30s)

    TransactionLimits()
        : max_wait_ms(10000),
          timeout_ms(30000) {}
};

/**
 * @brief Everything the ledger persists
 *
 * Entities live in std::map so references handed out by a Transaction stay
 * valid while other records are inserted.
 */
struct LedgerStore {
    std::vector<Money> balances;                        // indexed by AccountHandle
    std::map<EntryId, JournalEntry> entries;
    std::map<std::string, EntryId> external_references;
    std::map<PeriodKey, FinancialPeriod> periods;       // absent = OPEN
    std::map<std::string, uint64_t> sequences;          // "<prefix><yyyymmdd>" -> last issued
    EntryId next_entry_id = 1;
    uint64_t next_posting_sequence = 1;

    std::map<uint64_t, Loan> loans;
    std::map<uint64_t, std::vector<ScheduleEntry>> schedules;  // loan id -> installments
    std::map<uint64_t, SavingsAccount> savings_accounts;
    std::map<uint64_t, FixedDeposit> fixed_deposits;
    uint64_t next_record_id = 1;
};

class Transaction;

class LedgerContext {
public:
    LedgerContext(std::shared_ptr<const AccountRegistry> registry,
                  const TransactionLimits& limits = TransactionLimits(),
                  std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    LedgerContext(const LedgerContext&) = delete;
    LedgerContext& operator=(const LedgerContext&) = delete;

    const AccountRegistry& registry() const { return *registry_; }
    const TransactionLimits& limits() const { return limits_; }
    Date today() const { return clock_->today(); }

    /**
     * @brief Run a read-only function against committed state
     *
     * @param fn Callable taking const LedgerStore&
     * @return Whatever fn returns
     */
    template <typename Fn>
    auto read(Fn&& fn) const -> decltype(fn(std::declval<const LedgerStore&>())) {
        std::shared_lock<std::shared_timed_mutex> lock(mutex_);
        return fn(store_);
    }

private:
    friend class Transaction;

    std::shared_ptr<const AccountRegistry> registry_;
    TransactionLimits limits_;
    std::shared_ptr<const Clock> clock_;

    mutable std::shared_timed_mutex mutex_;
    LedgerStore store_;
};

/**
 * @brief Exclusive unit of work over the ledger store
 *
 * Usage Example:
 *   @code
 *   Transaction txn(ctx, LogContext("deposit", actor.id));
 *   if (!txn.acquired()) { ... TRANSACTION_TIMEOUT ... }
 *   txn.adjust_balance(cash, amount);
 *   txn.modify(txn.store().savings_accounts.at(id)).balance += amount;
 *   Status status = txn.commit();
 *   @endcode
 *
 * Destroying an uncommitted transaction rolls it back.
 */
class Transaction {
public:
    Transaction(LedgerContext& ctx, const LogContext& log_ctx = LogContext());
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // False when the write lock could not be taken within max_wait_ms
    bool acquired() const { return lock_.owns_lock(); }
    bool active() const { return acquired() && !finished_; }

    LedgerContext& context() { return ctx_; }
    const AccountRegistry& registry() const { return ctx_.registry(); }
    Date today() const { return ctx_.today(); }
    const LogContext& log_context() const { return log_ctx_; }

    // Direct store access. Mutate only through the helpers below.
    LedgerStore& store() { return ctx_.store_; }
    const LedgerStore& store() const { return ctx_.store_; }

    /**
     * @brief Snapshot an object before changing it
     *
     * @return The same object, now safe to mutate
     */
    template <typename T>
    T& modify(T& object) {
        undo_.push_back([&object, snapshot = object]() mutable { object = std::move(snapshot); });
        return object;
    }

    /**
     * @brief Insert a new record; rollback erases it
     *
     * @throws std::logic_error if the key already exists
     */
    template <typename K, typename V>
    V& insert(std::map<K, V>& map,
              const typename std::map<K, V>::key_type& key,
              typename std::map<K, V>::mapped_type value) {
        auto inserted = map.emplace(key, std::move(value));
        if (!inserted.second) {
            throw std::logic_error("Duplicate key inserted in ledger store");
        }
        undo_.push_back([&map, key]() { map.erase(key); });
        return inserted.first->second;
    }

    template <typename T>
    T& append(std::vector<T>& vec, T value) {
        vec.push_back(std::move(value));
        undo_.push_back([&vec]() { vec.pop_back(); });
        return vec.back();
    }

    // Apply a signed delta to an account's cached balance
    void adjust_balance(AccountHandle account, Money delta);

    // Run `action` once the transaction has committed (event logging)
    void on_commit(std::function<void()> action) { on_commit_.push_back(std::move(action)); }

    /**
     * @brief Make the changes permanent and release the lock
     *
     * Fails TRANSACTION_TIMEOUT (and rolls back) when the transaction ran past
     * timeout_ms.
     */
    Status commit();

    /**
     * @brief Undo every change made so far and release the lock
     */
    void rollback(const std::string& reason);

    size_t pending_changes() const { return undo_.size(); }

private:
    LedgerContext& ctx_;
    LogContext log_ctx_;
    std::unique_lock<std::shared_timed_mutex> lock_;
    std::chrono::steady_clock::time_point start_time_;
    std::vector<std::function<void()>> undo_;
    std::vector<std::function<void()>> on_commit_;
    bool finished_;
};

/**
 * @brief Run `fn` inside a transaction and commit it if it succeeds
 *
 * `fn` takes Transaction& and returns Result<T> or Status. A failed result
 * rolls back; an exception rolls back and becomes PERSISTENCE_FAILURE; a lock
 * wait past max_wait_ms returns TRANSACTION_TIMEOUT without running `fn`.
 * Rejections are left to the caller to log.
 */
template <typename Fn>
auto with_transaction(LedgerContext& ctx, const LogContext& log_ctx, Fn&& fn)
    -> decltype(fn(std::declval<Transaction&>())) {
    using ResultType = decltype(fn(std::declval<Transaction&>()));

    Transaction txn(ctx, log_ctx);
    if (!txn.acquired()) {
        LedgerError error(ErrorKind::TRANSACTION_TIMEOUT,
                          "Timed out waiting " + std::to_string(ctx.limits().max_wait_ms) +
                          " ms for the ledger write lock",
                          {{"max_wait_ms", std::to_string(ctx.limits().max_wait_ms)}});
        return ResultType::fail(error);
    }

    try {
        ResultType result = fn(txn);
        if (!result.success()) {
            txn.rollback(error_kind_to_string(result.kind()));
            return result;
        }
        Status committed = txn.commit();
        if (!committed.success()) {
            return ResultType::fail(committed.error());
        }
        return result;
    } catch (const std::exception& e) {
        txn.rollback(e.what());
        Logger::get_instance().log_error(log_ctx, e.what());
        return ResultType::fail(ErrorKind::PERSISTENCE_FAILURE,
                                std::string("Transaction failed: ") + e.what());
    }
}

} // namespace ledgercore

#endif // LEDGERCORE_LEDGER_STORE_HPP

#ifndef LEDGERCORE_SERVICES_SAVINGS_SERVICE_HPP
#define LEDGERCORE_SERVICES_SAVINGS_SERVICE_HPP

#include "../account_registry.hpp"
#include "../ledger_store.hpp"
#include "../products.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledgercore {

struct SavingsAccountRequest {
    std::string customer_id;
    Money minimum_balance;
    Decimal annual_rate;
    bool withdrawals_allowed = true;
};

struct SavingsTransactionRequest {
    uint64_t account_id;
    Money amount;
    std::string reference;      // optional idempotency key
    std::string actor_id;
    std::optional<Date> date;
};

struct SavingsTransactionResult {
    std::string transaction_number;
    EntryId entry_id;
    std::string entry_number;
    Money balance_after;
};

// Savings deposits, withdrawals and monthly interest.
// The account's subledger balance moves in the same transaction as the posting.
class SavingsService {
public:
    SavingsService(LedgerContext& ctx, const RoleBindings& roles);

    static const std::vector<AccountRole>& required_roles();

    Result<SavingsAccount> open_account(const SavingsAccountRequest& request);

    // Dr cash, Cr savings liability
    Result<SavingsTransactionResult> deposit(const SavingsTransactionRequest& request);

    // Dr savings liability, Cr cash. INSUFFICIENT_BALANCE on overdraw or when
    // the remaining balance would fall below the account minimum.
    Result<SavingsTransactionResult> withdraw(const SavingsTransactionRequest& request);

    // One month of interest for the month containing `as_of`:
    // Dr interest expense, Cr savings liability. Returns the amount credited
    // (zero posts nothing). INVALID_STATE if that month was already credited.
    Result<Money> post_interest(uint64_t account_id, const Date& as_of);

    Result<SavingsAccount> get_account(uint64_t account_id) const;

private:
    LedgerContext& ctx_;
    RoleBindings roles_;
};

} // namespace ledgercore

#endif // LEDGERCORE_SERVICES_SAVINGS_SERVICE_HPP

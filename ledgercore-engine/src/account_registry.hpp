/**
 * @file account_registry.hpp
 * @brief Chart of accounts and role bindings, resolved once at startup
 *
 * Accounts are looked up by code exactly once, while the registry is built.
 * From then on every component refers to accounts through AccountHandle, a
 * dense index that is valid for the lifetime of the registry. Workflow
 * services refer to accounts through roles ("cash_bank", "loans_receivable")
 * bound to codes in configuration.
 */

#ifndef LEDGERCORE_ACCOUNT_REGISTRY_HPP
#define LEDGERCORE_ACCOUNT_REGISTRY_HPP

#include "ledger_error.hpp"
#include "money.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ledgercore {

enum class AccountType : uint8_t {
    Asset = 0,
    Liability = 1,
    Equity = 2,
    Income = 3,
    Expense = 4
};

enum class BalanceSide : uint8_t {
    Debit = 0,
    Credit = 1
};

std::string account_type_to_string(AccountType type);
AccountType account_type_from_string(const std::string& text);  // throws std::invalid_argument
std::string balance_side_to_string(BalanceSide side);
BalanceSide balance_side_from_string(const std::string& text);  // throws std::invalid_argument

// Assets and expenses increase on the debit side, everything else on the credit side
BalanceSide default_normal_side(AccountType type);

// Stable handle into the registry
struct AccountHandle {
    uint32_t index;

    bool operator==(const AccountHandle& other) const { return index == other.index; }
    bool operator!=(const AccountHandle& other) const { return index != other.index; }
    bool operator<(const AccountHandle& other) const { return index < other.index; }
};

struct AccountDefinition {
    std::string code;
    std::string name;
    AccountType type;
    std::optional<BalanceSide> normal_side;  // defaults from type
    bool active = true;
    bool header = false;
    std::string parent_code;
    Money opening_balance;
};

struct Account {
    AccountHandle handle;
    std::string code;
    std::string name;
    AccountType type;
    BalanceSide normal_side;
    bool active;
    bool header;
    std::optional<AccountHandle> parent;
    Money opening_balance;

    bool postable() const { return active && !header; }
};

/**
 * @brief Signed balance effect of a debit/credit pair on an account
 *
 * (debit - credit) for debit-normal accounts, (credit - debit) otherwise.
 */
Money signed_delta(BalanceSide normal_side, Money debit, Money credit);

class AccountRegistry {
public:
    /**
     * @brief Build the registry from account definitions
     *
     * @throws ConfigurationError on duplicate codes, unknown parents, a parent
     *         that is not a header, an opening balance on a header or inactive
     *         account, or opening balances that do not balance
     */
    explicit AccountRegistry(const std::vector<AccountDefinition>& definitions);

    size_t size() const { return accounts_.size(); }

    const Account& get(AccountHandle handle) const;
    std::optional<AccountHandle> find(const std::string& code) const;

    // Accounts ordered by code
    const std::vector<AccountHandle>& by_code() const { return ordered_; }

    // Direct and indirect children of a header account
    std::vector<AccountHandle> descendants(AccountHandle header) const;

    const std::vector<Account>& accounts() const { return accounts_; }

private:
    std::vector<Account> accounts_;
    std::map<std::string, AccountHandle> by_code_;
    std::vector<AccountHandle> ordered_;
};

/**
 * @brief Workflow roles that must be bound to postable accounts
 */
enum class AccountRole {
    CashBank,
    LoansReceivable,
    InterestIncome,
    FeeIncome,
    SavingsLiability,
    FixedDepositLiability,
    InterestPayable,
    InterestExpense
};

std::string account_role_to_string(AccountRole role);
std::optional<AccountRole> account_role_from_string(const std::string& text);
const std::vector<AccountRole>& all_account_roles();

/**
 * @brief Role -> handle map produced once from configured role codes
 */
class RoleBindings {
public:
    RoleBindings() = default;

    /**
     * @brief Resolve role codes against the registry
     *
     * Every role in `required` must be bound to an active, postable account.
     *
     * @throws ConfigurationError listing every missing or unusable role
     */
    static RoleBindings resolve(const AccountRegistry& registry,
                                const std::map<AccountRole, std::string>& role_codes,
                                const std::vector<AccountRole>& required);

    // CONFIG_ERROR when the role was never bound
    Result<AccountHandle> require(AccountRole role) const;

    bool has(AccountRole role) const { return handles_.count(role) > 0; }

    void bind(AccountRole role, AccountHandle handle) { handles_[role] = handle; }

private:
    std::map<AccountRole, AccountHandle> handles_;
};

} // namespace ledgercore

#endif // LEDGERCORE_ACCOUNT_REGISTRY_HPP

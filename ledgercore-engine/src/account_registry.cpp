#include "account_registry.hpp"
#include <algorithm>
#include <sstream>

namespace ledgercore {

std::string account_type_to_string(AccountType type) {
    switch (type) {
        case AccountType::Asset: return "asset";
        case AccountType::Liability: return "liability";
        case AccountType::Equity: return "equity";
        case AccountType::Income: return "income";
        case AccountType::Expense: return "expense";
        default: return "unknown";
    }
}

AccountType account_type_from_string(const std::string& text) {
    if (text == "asset") return AccountType::Asset;
    if (text == "liability") return AccountType::Liability;
    if (text == "equity") return AccountType::Equity;
    if (text == "income") return AccountType::Income;
    if (text == "expense") return AccountType::Expense;
    throw std::invalid_argument("Unknown account type: " + text);
}

std::string balance_side_to_string(BalanceSide side) {
    return side == BalanceSide::Debit ? "debit" : "credit";
}

BalanceSide balance_side_from_string(const std::string& text) {
    if (text == "debit") return BalanceSide::Debit;
    if (text == "credit") return BalanceSide::Credit;
    throw std::invalid_argument("Unknown balance side: " + text);
}

BalanceSide default_normal_side(AccountType type) {
    switch (type) {
        case AccountType::Asset:
        case AccountType::Expense:
            return BalanceSide::Debit;
        default:
            return BalanceSide::Credit;
    }
}

Money signed_delta(BalanceSide normal_side, Money debit, Money credit) {
    return normal_side == BalanceSide::Debit ? debit - credit : credit - debit;
}

// ============================================================================
// AccountRegistry
// ============================================================================

AccountRegistry::AccountRegistry(const std::vector<AccountDefinition>& definitions) {
    accounts_.reserve(definitions.size());

    for (const auto& def : definitions) {
        if (def.code.empty()) {
            throw ConfigurationError("Account with empty code (name: '" + def.name + "')");
        }
        if (by_code_.count(def.code) > 0) {
            throw ConfigurationError("Duplicate account code: " + def.code);
        }
        if (def.header && !def.opening_balance.is_zero()) {
            throw ConfigurationError("Header account " + def.code + " cannot carry an opening balance");
        }
        if (!def.active && !def.opening_balance.is_zero()) {
            throw ConfigurationError("Inactive account " + def.code + " cannot carry an opening balance");
        }

        Account account;
        account.handle = AccountHandle{static_cast<uint32_t>(accounts_.size())};
        account.code = def.code;
        account.name = def.name;
        account.type = def.type;
        account.normal_side = def.normal_side ? *def.normal_side : default_normal_side(def.type);
        account.active = def.active;
        account.header = def.header;
        account.opening_balance = def.opening_balance;

        by_code_[account.code] = account.handle;
        accounts_.push_back(account);
    }

    // Opening balances must form a balanced trial balance on day one
    Money debit_total;
    Money credit_total;
    for (const auto& account : accounts_) {
        if (account.normal_side == BalanceSide::Debit) {
            debit_total += account.opening_balance;
        } else {
            credit_total += account.opening_balance;
        }
    }
    if (debit_total != credit_total) {
        throw ConfigurationError("Opening balances do not balance: debit " + debit_total.to_string() +
                                 ", credit " + credit_total.to_string());
    }

    // Parents resolve in a second pass so definitions may appear in any order
    for (size_t i = 0; i < definitions.size(); ++i) {
        const auto& parent_code = definitions[i].parent_code;
        if (parent_code.empty()) {
            continue;
        }
        auto it = by_code_.find(parent_code);
        if (it == by_code_.end()) {
            throw ConfigurationError("Account " + definitions[i].code +
                                     " references unknown parent " + parent_code);
        }
        if (!accounts_[it->second.index].header) {
            throw ConfigurationError("Parent account " + parent_code + " of " +
                                     definitions[i].code + " is not a header account");
        }
        accounts_[i].parent = it->second;
    }

    // Reject parent cycles
    for (const auto& account : accounts_) {
        size_t depth = 0;
        auto current = account.parent;
        while (current) {
            if (++depth > accounts_.size()) {
                throw ConfigurationError("Cycle in account hierarchy at " + account.code);
            }
            current = accounts_[current->index].parent;
        }
    }

    for (const auto& pair : by_code_) {
        ordered_.push_back(pair.second);
    }
}

const Account& AccountRegistry::get(AccountHandle handle) const {
    if (handle.index >= accounts_.size()) {
        throw std::out_of_range("Account handle out of range: " + std::to_string(handle.index));
    }
    return accounts_[handle.index];
}

std::optional<AccountHandle> AccountRegistry::find(const std::string& code) const {
    auto it = by_code_.find(code);
    if (it == by_code_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AccountHandle> AccountRegistry::descendants(AccountHandle header) const {
    std::vector<AccountHandle> result;
    for (const auto& account : accounts_) {
        auto current = account.parent;
        while (current) {
            if (*current == header) {
                result.push_back(account.handle);
                break;
            }
            current = accounts_[current->index].parent;
        }
    }
    return result;
}

// ============================================================================
// Roles
// ============================================================================

std::string account_role_to_string(AccountRole role) {
    switch (role) {
        case AccountRole::CashBank: return "cash_bank";
        case AccountRole::LoansReceivable: return "loans_receivable";
        case AccountRole::InterestIncome: return "interest_income";
        case AccountRole::FeeIncome: return "fee_income";
        case AccountRole::SavingsLiability: return "savings_liability";
        case AccountRole::FixedDepositLiability: return "fd_liability";
        case AccountRole::InterestPayable: return "interest_payable";
        case AccountRole::InterestExpense: return "interest_expense";
        default: return "unknown";
    }
}

std::optional<AccountRole> account_role_from_string(const std::string& text) {
    for (AccountRole role : all_account_roles()) {
        if (account_role_to_string(role) == text) {
            return role;
        }
    }
    return std::nullopt;
}

const std::vector<AccountRole>& all_account_roles() {
    static const std::vector<AccountRole> roles = {
        AccountRole::CashBank,
        AccountRole::LoansReceivable,
        AccountRole::InterestIncome,
        AccountRole::FeeIncome,
        AccountRole::SavingsLiability,
        AccountRole::FixedDepositLiability,
        AccountRole::InterestPayable,
        AccountRole::InterestExpense
    };
    return roles;
}

RoleBindings RoleBindings::resolve(const AccountRegistry& registry,
                                   const std::map<AccountRole, std::string>& role_codes,
                                   const std::vector<AccountRole>& required) {
    RoleBindings bindings;
    std::vector<std::string> problems;

    for (const auto& [role, code] : role_codes) {
        auto handle = registry.find(code);
        if (!handle) {
            problems.push_back(account_role_to_string(role) + " -> unknown account " + code);
            continue;
        }
        if (!registry.get(*handle).postable()) {
            problems.push_back(account_role_to_string(role) + " -> account " + code +
                               " is inactive or a header");
            continue;
        }
        bindings.bind(role, *handle);
    }

    for (AccountRole role : required) {
        if (role_codes.count(role) == 0) {
            problems.push_back(account_role_to_string(role) + " is not configured");
        }
    }

    if (!problems.empty()) {
        std::ostringstream oss;
        oss << "Unresolved account roles: ";
        for (size_t i = 0; i < problems.size(); ++i) {
            if (i > 0) oss << "; ";
            oss << problems[i];
        }
        throw ConfigurationError(oss.str());
    }

    return bindings;
}

Result<AccountHandle> RoleBindings::require(AccountRole role) const {
    auto it = handles_.find(role);
    if (it == handles_.end()) {
        return Result<AccountHandle>::fail(
            ErrorKind::CONFIG_ERROR,
            "Account role not provisioned: " + account_role_to_string(role),
            {{"role", account_role_to_string(role)}});
    }
    return Result<AccountHandle>::ok(it->second);
}

} // namespace ledgercore

/**
 * @file ledger_system.hpp
 * @brief Wires a LedgerConfig into a running ledger
 *
 * Owns the chart of accounts, the ledger context and the product services.
 * Configured roles are resolved once here; a role left out of the
 * configuration surfaces as CONFIG_ERROR from the first operation needing it.
 */

#ifndef LEDGERCORE_LEDGER_SYSTEM_HPP
#define LEDGERCORE_LEDGER_SYSTEM_HPP

#include "config_parser.hpp"
#include "ledger_store.hpp"
#include "services/batch_service.hpp"
#include "services/fixed_deposit_service.hpp"
#include "services/loan_service.hpp"
#include "services/savings_service.hpp"
#include <memory>

namespace ledgercore {

class LedgerSystem {
public:
    /**
     * @throws ConfigurationError for an invalid chart or unresolvable role code
     */
    explicit LedgerSystem(const LedgerConfig& config,
                          std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    LedgerSystem(const LedgerSystem&) = delete;
    LedgerSystem& operator=(const LedgerSystem&) = delete;

    const LedgerConfig& config() const { return config_; }
    LedgerContext& context() { return *context_; }
    const LedgerContext& context() const { return *context_; }
    const RoleBindings& roles() const { return roles_; }

    LoanService& loans() { return *loans_; }
    SavingsService& savings() { return *savings_; }
    FixedDepositService& fixed_deposits() { return *deposits_; }
    BatchService& batch() { return *batch_; }

private:
    LedgerConfig config_;
    std::shared_ptr<const AccountRegistry> registry_;
    std::unique_ptr<LedgerContext> context_;
    RoleBindings roles_;
    std::unique_ptr<LoanService> loans_;
    std::unique_ptr<SavingsService> savings_;
    std::unique_ptr<FixedDepositService> deposits_;
    std::unique_ptr<BatchService> batch_;
};

} // namespace ledgercore

#endif // LEDGERCORE_LEDGER_SYSTEM_HPP

#include "ledger_system.hpp"

namespace ledgercore {

LedgerSystem::LedgerSystem(const LedgerConfig& config, std::shared_ptr<const Clock> clock)
    : config_(config) {
    validate_ledger_config(config_);

    registry_ = std::make_shared<const AccountRegistry>(config_.accounts);
    context_ = std::make_unique<LedgerContext>(registry_, config_.transactions, std::move(clock));
    roles_ = RoleBindings::resolve(*registry_, config_.account_roles, {});

    loans_ = std::make_unique<LoanService>(*context_, roles_);
    savings_ = std::make_unique<SavingsService>(*context_, roles_);
    deposits_ = std::make_unique<FixedDepositService>(*context_, roles_, config_.premature_penalty_rate);
    batch_ = std::make_unique<BatchService>(*context_, *loans_, *savings_, *deposits_);
}

} // namespace ledgercore

#ifndef LEDGERCORE_SERVICES_FIXED_DEPOSIT_SERVICE_HPP
#define LEDGERCORE_SERVICES_FIXED_DEPOSIT_SERVICE_HPP

#include "../account_registry.hpp"
#include "../deposit_interest.hpp"
#include "../ledger_store.hpp"
#include "../products.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledgercore {

struct FixedDepositRequest {
    std::string customer_id;
    Money principal;
    Decimal annual_rate;
    unsigned tenure_days = 0;
    MaturityInstruction instruction = MaturityInstruction::PayOut;
    std::string actor_id;
    std::optional<Date> start_date;     // defaults to today
};

struct MaturityResult {
    uint64_t deposit_id;
    MaturityInstruction action;
    Money maturity_amount;
    EntryId entry_id;
    std::optional<uint64_t> rollover_deposit_id;
};

struct PrematureWithdrawalResult {
    PrematureSettlement settlement;
    EntryId entry_id;
    std::string entry_number;
};

/**
 * @brief Fixed-term deposits with simple interest
 *
 * Ledger effects:
 * - create:    Dr cash, Cr FD liability (principal)
 * - accrue:    Dr interest expense, Cr interest payable (interest earned since last accrual)
 * - maturity:  Dr FD liability (principal), Dr interest payable (interest), then
 *              PAY_OUT: Cr cash (maturity amount)
 *              ROLLOVER: Cr FD liability (maturity amount) for a new deposit
 * - premature: Dr FD liability, Dr interest payable (accrued), Cr cash (principal + net
 *              interest), the difference trued up against interest expense
 */
class FixedDepositService {
public:
    FixedDepositService(LedgerContext& ctx, const RoleBindings& roles,
                        const Decimal& premature_penalty_rate);

    static const std::vector<AccountRole>& required_roles();

    Result<FixedDeposit> create(const FixedDepositRequest& request);

    // Recognise interest earned up to `as_of`. Returns the amount accrued (zero posts nothing).
    Result<Money> accrue_interest(uint64_t deposit_id, const Date& as_of);

    // Settle a deposit whose maturity date is on or before `as_of`
    Result<MaturityResult> process_maturity(uint64_t deposit_id, const Date& as_of);

    // Close before maturity; penalty = principal · premature_penalty_rate / 100
    Result<PrematureWithdrawalResult> premature_withdrawal(uint64_t deposit_id,
                                                           const std::string& actor_id,
                                                           const std::optional<Date>& date = std::nullopt);

    Result<FixedDeposit> get_deposit(uint64_t deposit_id) const;

    const Decimal& premature_penalty_rate() const { return premature_penalty_rate_; }

private:
    Result<Money> accrue_in(Transaction& txn, uint64_t deposit_id, const Date& as_of);

    LedgerContext& ctx_;
    RoleBindings roles_;
    Decimal premature_penalty_rate_;
};

} // namespace ledgercore

#endif // LEDGERCORE_SERVICES_FIXED_DEPOSIT_SERVICE_HPP

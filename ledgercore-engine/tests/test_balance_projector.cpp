/**
 * @file test_balance_projector.cpp
 * @brief Unit tests for replayed balances, trial balance and account ledgers
 */

#include <catch2/catch_test_macros.hpp>
#include "balance_projector.hpp"
#include "posting_engine.hpp"
#include "test_support.hpp"
#include <stdexcept>

using namespace ledgercore;
using namespace ledgercore::testing;

namespace {

// Three postings across two months:
//   Jan 10  Dr 1300 / Cr 1100  100000.00
//   Jan 20  Dr 1100 / Cr 4100    2000.00
//   Feb 05  Dr 1100 / Cr 1300   30000.00
void seed_postings(LedgerFixture& fx) {
    REQUIRE(submit(*fx.ctx, fx.simple_entry("1300", "1100", "100000", Date(2024, 1, 10))).success());
    REQUIRE(submit(*fx.ctx, fx.simple_entry("1100", "4100", "2000", Date(2024, 1, 20))).success());
    REQUIRE(submit(*fx.ctx, fx.simple_entry("1100", "1300", "30000", Date(2024, 2, 5))).success());
}

} // namespace

TEST_CASE("Account balance as of a date", "[projector]") {
    LedgerFixture fx(Date(2024, 2, 10));
    seed_postings(fx);

    SECTION("Current balance") {
        auto cash = get_account_balance(*fx.ctx, "1100");
        REQUIRE(cash.success());
        REQUIRE(cash.value().opening_balance.to_string() == "500000.00");
        REQUIRE(cash.value().debit_total.to_string() == "32000.00");
        REQUIRE(cash.value().credit_total.to_string() == "100000.00");
        REQUIRE(cash.value().balance.to_string() == "432000.00");
    }

    SECTION("Historical balance ignores later postings") {
        auto receivable = get_account_balance(*fx.ctx, "1300", Date(2024, 1, 31));
        REQUIRE(receivable.value().balance.to_string() == "100000.00");

        auto before_any = get_account_balance(*fx.ctx, "1300", Date(2024, 1, 9));
        REQUIRE(before_any.value().balance.is_zero());
    }

    SECTION("Credit-normal accounts are positive on the credit side") {
        auto income = get_account_balance(*fx.ctx, "4100");
        REQUIRE(income.value().normal_side == BalanceSide::Credit);
        REQUIRE(income.value().balance.to_string() == "2000.00");
    }

    SECTION("Header accounts roll up their children") {
        auto assets = get_account_balance(*fx.ctx, "1000");
        REQUIRE(assets.value().balance.to_string() == "502000.00");
        REQUIRE(assets.value().opening_balance.to_string() == "500000.00");
    }

    SECTION("Unknown account") {
        REQUIRE(get_account_balance(*fx.ctx, "7777").kind() == ErrorKind::NOT_FOUND);
    }
}

TEST_CASE("Trial balance", "[projector]") {
    LedgerFixture fx(Date(2024, 2, 10));
    seed_postings(fx);

    TrialBalance tb = generate_trial_balance(*fx.ctx, Date(2024, 2, 29));
    REQUIRE(tb.balanced());
    REQUIRE(tb.total_debit.to_string() == "502000.00");

    REQUIRE(tb.rows.size() == 4);
    REQUIRE(tb.rows[0].code == "1100");
    REQUIRE(tb.rows[0].debit.to_string() == "432000.00");
    REQUIRE(tb.rows[1].code == "1300");
    REQUIRE(tb.rows[1].debit.to_string() == "70000.00");
    REQUIRE(tb.rows[2].code == "3100");
    REQUIRE(tb.rows[2].credit.to_string() == "500000.00");
    REQUIRE(tb.rows[3].code == "4100");
    REQUIRE(tb.rows[3].credit.to_string() == "2000.00");

    SECTION("Contra balances land in the opposite column") {
        REQUIRE(submit(*fx.ctx, fx.simple_entry("4100", "1100", "2500", Date(2024, 2, 10))).success());
        TrialBalance after = generate_trial_balance(*fx.ctx, Date(2024, 2, 29));
        REQUIRE(after.balanced());

        const auto& income = after.rows.back();
        REQUIRE(income.code == "4100");
        REQUIRE(income.credit.is_zero());
        REQUIRE(income.debit.to_string() == "500.00");
    }

    SECTION("Drafts are not counted") {
        REQUIRE(submit(*fx.ctx, fx.simple_entry("1300", "1100", "1", Date(2024, 2, 6), "clerk-1", false)).success());
        TrialBalance after = generate_trial_balance(*fx.ctx, Date(2024, 2, 29));
        REQUIRE(after.total_debit == tb.total_debit);
    }
}

TEST_CASE("Account ledger with running balance", "[projector]") {
    LedgerFixture fx(Date(2024, 2, 10));
    seed_postings(fx);

    auto ledger = get_ledger(*fx.ctx, "1100", Date(2024, 1, 20), Date(2024, 2, 29));
    REQUIRE(ledger.success());

    const AccountLedger& cash = ledger.value();
    // The Jan 10 posting is in the opening figure; the Jan 20 one is not
    REQUIRE(cash.opening_balance.to_string() == "400000.00");
    REQUIRE(cash.lines.size() == 2);
    REQUIRE(cash.lines[0].entry_date == Date(2024, 1, 20));
    REQUIRE(cash.lines[0].debit.to_string() == "2000.00");
    REQUIRE(cash.lines[0].running_balance.to_string() == "402000.00");
    REQUIRE(cash.lines[1].running_balance.to_string() == "432000.00");
    REQUIRE(cash.closing_balance.to_string() == "432000.00");

    SECTION("Same-day postings keep posting order") {
        REQUIRE(submit(*fx.ctx, fx.simple_entry("1100", "4100", "1", Date(2024, 2, 5))).success());
        auto again = get_ledger(*fx.ctx, "1100", Date(2024, 2, 5), Date(2024, 2, 5));
        REQUIRE(again.value().lines.size() == 2);
        REQUIRE(again.value().lines[0].debit.to_string() == "30000.00");
        REQUIRE(again.value().lines[1].debit.to_string() == "1.00");
    }

    SECTION("Bad ranges and codes") {
        auto backwards = get_ledger(*fx.ctx, "1100", Date(2024, 2, 1), Date(2024, 1, 1));
        REQUIRE(backwards.kind() == ErrorKind::INVALID_STATE);
        REQUIRE(backwards.error().detail("start") == "2024-02-01");
        REQUIRE(backwards.error().detail("end") == "2024-01-01");
        REQUIRE(get_ledger(*fx.ctx, "7777", Date(2024, 1, 1), Date(2024, 1, 31)).kind() ==
                ErrorKind::NOT_FOUND);
    }
}

TEST_CASE("Cached balances match a full replay", "[projector]") {
    LedgerFixture fx(Date(2024, 2, 10));
    seed_postings(fx);

    auto reversal = reverse(*fx.ctx, ReversalRequest{1, "test", "manager-1", std::nullopt});
    REQUIRE(reversal.success());

    REQUIRE(verify_cached_balances(*fx.ctx).empty());
    REQUIRE(fx.balance("1300").to_string() == "-30000.00");
}

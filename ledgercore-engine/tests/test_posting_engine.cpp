/**
 * @file test_posting_engine.cpp
 * @brief Unit tests for entry validation, approval, posting and reversal
 */

#include <catch2/catch_test_macros.hpp>
#include "posting_engine.hpp"
#include "period_control.hpp"
#include "test_support.hpp"

using namespace ledgercore;
using namespace ledgercore::testing;

TEST_CASE("Auto-posted entry moves cached balances", "[posting]") {
    LedgerFixture fx;

    auto result = submit(*fx.ctx, fx.simple_entry("1300", "1100", "25000", Date(2024, 1, 15)));
    REQUIRE(result.success());
    REQUIRE(result.value().status == EntryStatus::Posted);
    REQUIRE(result.value().entry_number == "JE20240115000001");

    REQUIRE(fx.balance("1300").to_string() == "25000.00");
    REQUIRE(fx.balance("1100").to_string() == "475000.00");

    auto entry = get_entry(*fx.ctx, result.value().entry_id);
    REQUIRE(entry.success());
    REQUIRE(entry.value().lines.size() == 2);
    REQUIRE(entry.value().lines[0].line_number == 1);
    REQUIRE(entry.value().total_debit == entry.value().total_credit);
    REQUIRE(entry.value().approved_by == "clerk-1");
    REQUIRE(entry.value().posting_sequence == 1);

    SECTION("Entry numbers follow a per-day sequence") {
        auto second = submit(*fx.ctx, fx.simple_entry("1300", "1100", "10", Date(2024, 1, 15)));
        REQUIRE(second.value().entry_number == "JE20240115000002");
    }
}

TEST_CASE("Entry validation", "[posting]") {
    LedgerFixture fx;
    const Date date(2024, 1, 15);

    SECTION("Unbalanced entry reports both totals") {
        EntryRequest request = fx.simple_entry("1300", "1100", "100", date);
        request.lines[1].credit = Money::parse("90");

        auto result = submit(*fx.ctx, request);
        REQUIRE(result.kind() == ErrorKind::UNBALANCED_ENTRY);
        REQUIRE(result.error().detail("total_debit") == "100.00");
        REQUIRE(result.error().detail("total_credit") == "90.00");
    }

    SECTION("Line with both sides") {
        EntryRequest request = fx.simple_entry("1300", "1100", "100", date);
        request.lines[0].credit = Money::parse("100");
        request.lines[1].debit = Money::parse("100");

        REQUIRE(submit(*fx.ctx, request).kind() == ErrorKind::INVALID_LINE);
    }

    SECTION("Line with no amount") {
        EntryRequest request = fx.simple_entry("1300", "1100", "100", date);
        request.lines.push_back(LineInput::debit_line(fx.handle("4100"), Money()));

        REQUIRE(submit(*fx.ctx, request).kind() == ErrorKind::INVALID_LINE);
    }

    SECTION("Empty entry has no value") {
        EntryRequest request;
        request.entry_date = date;
        REQUIRE(submit(*fx.ctx, request).kind() == ErrorKind::ZERO_VALUE_ENTRY);
    }

    SECTION("Unknown, inactive and header accounts are all named") {
        EntryRequest request;
        request.entry_date = date;
        request.metadata.created_by = "clerk-1";

        LineInput unknown;
        unknown.account_code = "8888";
        unknown.debit = Money::parse("10");
        request.lines.push_back(unknown);
        request.lines.push_back(LineInput::debit_line(fx.handle("9999"), Money::parse("10")));
        request.lines.push_back(LineInput::credit_line(fx.handle("1000"), Money::parse("20")));

        auto result = submit(*fx.ctx, request);
        REQUIRE(result.kind() == ErrorKind::INVALID_ACCOUNT);
        REQUIRE(result.error().detail("codes") == "8888,9999,1000");
    }

    SECTION("Lines may name accounts by code") {
        EntryRequest request;
        request.entry_date = date;
        request.auto_post = true;

        LineInput debit;
        debit.account_code = "1300";
        debit.debit = Money::parse("10");
        LineInput credit;
        credit.account_code = "1100";
        credit.credit = Money::parse("10");
        request.lines = {debit, credit};

        REQUIRE(submit(*fx.ctx, request).success());
        REQUIRE(fx.balance("1300").to_string() == "10.00");
    }

    SECTION("External references are single use") {
        EntryRequest request = fx.simple_entry("1300", "1100", "100", date);
        request.metadata.external_reference = "PAY-001";

        REQUIRE(submit(*fx.ctx, request).success());
        auto repeat = submit(*fx.ctx, request);
        REQUIRE(repeat.kind() == ErrorKind::DUPLICATE_REFERENCE);
        REQUIRE(repeat.error().detail("entry_number") == "JE20240115000001");
        REQUIRE(fx.balance("1300").to_string() == "100.00");
    }

    // Nothing from a rejected entry is left behind
    fx.ctx->read([](const LedgerStore& store) {
        for (const auto& pair : store.entries) {
            REQUIRE(pair.second.status == EntryStatus::Posted);
        }
        return 0;
    });
}

TEST_CASE("Approval workflow", "[posting]") {
    LedgerFixture fx;
    auto draft = submit(*fx.ctx, fx.simple_entry("1300", "1100", "50000", Date(2024, 1, 15), "clerk-1", false));
    REQUIRE(draft.success());
    REQUIRE(draft.value().status == EntryStatus::Draft);
    REQUIRE(fx.balance("1300").is_zero());

    const EntryId id = draft.value().entry_id;
    REQUIRE(submit_for_approval(*fx.ctx, id).success());
    REQUIRE(get_entry(*fx.ctx, id).value().status == EntryStatus::PendingApproval);
    REQUIRE(submit_for_approval(*fx.ctx, id).kind() == ErrorKind::INVALID_STATE);

    SECTION("Creator cannot approve") {
        Actor creator{"clerk-1", 3, Money::parse("1000000")};
        REQUIRE(post(*fx.ctx, id, creator).kind() == ErrorKind::APPROVAL_DENIED);
    }

    SECTION("Approver over their limit") {
        Actor junior{"officer-1", 2, Money::parse("49999.99")};
        auto result = post(*fx.ctx, id, junior);
        REQUIRE(result.kind() == ErrorKind::APPROVAL_DENIED);
        REQUIRE(result.error().detail("approval_limit") == "49999.99");
        REQUIRE(fx.balance("1300").is_zero());
    }

    SECTION("Approver within limit posts") {
        Actor manager{"manager-1", 3, Money::parse("50000")};
        auto result = post(*fx.ctx, id, manager);
        REQUIRE(result.success());
        REQUIRE(result.value().status == EntryStatus::Posted);
        REQUIRE(get_entry(*fx.ctx, id).value().approved_by == "manager-1");
        REQUIRE(fx.balance("1300").to_string() == "50000.00");

        REQUIRE(post(*fx.ctx, id, manager).kind() == ErrorKind::INVALID_STATE);
    }

    SECTION("Unknown entry") {
        Actor manager{"manager-1", 3, Money::parse("50000")};
        REQUIRE(post(*fx.ctx, 999, manager).kind() == ErrorKind::NOT_FOUND);
        REQUIRE(submit_for_approval(*fx.ctx, 999).kind() == ErrorKind::NOT_FOUND);
    }
}

TEST_CASE("Reversal mirrors the original", "[posting]") {
    LedgerFixture fx;
    auto original = submit(*fx.ctx, fx.simple_entry("1300", "1100", "1200", Date(2024, 1, 10)));
    REQUIRE(original.success());
    const EntryId original_id = original.value().entry_id;

    auto reversal = reverse(*fx.ctx, ReversalRequest{original_id, "Keyed twice", "manager-1", std::nullopt});
    REQUIRE(reversal.success());
    REQUIRE(reversal.value().status == EntryStatus::Posted);

    REQUIRE(fx.balance("1300").is_zero());
    REQUIRE(fx.balance("1100").to_string() == "500000.00");

    auto reversed_entry = get_entry(*fx.ctx, original_id).value();
    auto reversal_entry = get_entry(*fx.ctx, reversal.value().entry_id).value();
    REQUIRE(reversed_entry.reversed);
    REQUIRE(reversed_entry.reversal_entry_id == reversal.value().entry_id);
    REQUIRE(reversal_entry.reverses_entry_id == original_id);
    REQUIRE(reversal_entry.entry_date == Date(2024, 1, 15));
    REQUIRE(reversal_entry.lines[0].credit.to_string() == "1200.00");
    REQUIRE(reversal_entry.lines[1].debit.to_string() == "1200.00");

    SECTION("An entry reverses only once") {
        auto again = reverse(*fx.ctx, ReversalRequest{original_id, "again", "manager-1", std::nullopt});
        REQUIRE(again.kind() == ErrorKind::ALREADY_REVERSED);
    }

    SECTION("A reversal cannot itself be reversed") {
        auto chained = reverse(*fx.ctx, ReversalRequest{reversal.value().entry_id, "undo", "manager-1",
                                                        std::nullopt});
        REQUIRE(chained.kind() == ErrorKind::REVERSAL_NOT_REVERSIBLE);
    }
}

TEST_CASE("Only posted entries reverse", "[posting]") {
    LedgerFixture fx;
    auto draft = submit(*fx.ctx, fx.simple_entry("1300", "1100", "10", Date(2024, 1, 15), "clerk-1", false));

    auto result = reverse(*fx.ctx, ReversalRequest{draft.value().entry_id, "n/a", "manager-1", std::nullopt});
    REQUIRE(result.kind() == ErrorKind::NOT_POSTED);
    REQUIRE(reverse(*fx.ctx, ReversalRequest{42, "n/a", "manager-1", std::nullopt}).kind() ==
            ErrorKind::NOT_FOUND);
}

TEST_CASE("Hard-closed periods refuse postings", "[posting]") {
    LedgerFixture fx(Date(2024, 2, 10));
    REQUIRE(close_period(*fx.ctx, PeriodCloseRequest{2024, 1, PeriodStatus::HardClose, "cfo", "Jan close"}).success());

    auto result = submit(*fx.ctx, fx.simple_entry("1300", "1100", "10", Date(2024, 1, 31)));
    REQUIRE(result.kind() == ErrorKind::PERIOD_CLOSED);
    REQUIRE(result.error().detail("period") == "2024-01");

    REQUIRE(submit(*fx.ctx, fx.simple_entry("1300", "1100", "10", Date(2024, 2, 1))).success());

    SECTION("Reversal dated into a closed period is refused") {
        auto posted = submit(*fx.ctx, fx.simple_entry("1300", "1100", "5", Date(2024, 2, 2)));
        auto result2 = reverse(*fx.ctx, ReversalRequest{posted.value().entry_id, "late", "cfo", Date(2024, 1, 20)});
        REQUIRE(result2.kind() == ErrorKind::PERIOD_CLOSED);
        REQUIRE_FALSE(get_entry(*fx.ctx, posted.value().entry_id).value().reversed);
    }
}

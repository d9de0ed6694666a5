#include <catch2/catch_test_macros.hpp>
#include "period_control.hpp"
#include "posting_engine.hpp"
#include "test_support.hpp"

using namespace ledgercore;
using namespace ledgercore::testing;

TEST_CASE("Period transitions only move forward", "[period]") {
    REQUIRE(is_valid_period_transition(PeriodStatus::Open, PeriodStatus::SoftClose));
    REQUIRE(is_valid_period_transition(PeriodStatus::Open, PeriodStatus::HardClose));
    REQUIRE(is_valid_period_transition(PeriodStatus::SoftClose, PeriodStatus::HardClose));

    REQUIRE_FALSE(is_valid_period_transition(PeriodStatus::SoftClose, PeriodStatus::Open));
    REQUIRE_FALSE(is_valid_period_transition(PeriodStatus::HardClose, PeriodStatus::SoftClose));
    REQUIRE_FALSE(is_valid_period_transition(PeriodStatus::HardClose, PeriodStatus::HardClose));
    REQUIRE_FALSE(is_valid_period_transition(PeriodStatus::Open, PeriodStatus::Open));
}

TEST_CASE("Closing a period", "[period]") {
    LedgerFixture fx(Date(2024, 2, 5));
    const Date in_january(2024, 1, 20);

    REQUIRE(get_period_status(*fx.ctx, in_january) == PeriodStatus::Open);

    SECTION("Soft close still accepts postings") {
        auto closed = close_period(*fx.ctx, PeriodCloseRequest{2024, 1, PeriodStatus::SoftClose, "cfo", ""});
        REQUIRE(closed.success());
        REQUIRE(closed.value().status == PeriodStatus::SoftClose);
        REQUIRE(closed.value().closed_by == "cfo");
        REQUIRE(closed.value().closed_on == Date(2024, 2, 5));

        REQUIRE(submit(*fx.ctx, fx.simple_entry("1300", "1100", "10", in_january)).success());

        SECTION("and can then be hard closed") {
            auto hard = close_period(*fx.ctx, PeriodCloseRequest{2024, 1, PeriodStatus::HardClose, "cfo", "final"});
            REQUIRE(hard.success());
            REQUIRE(get_period_status(*fx.ctx, in_january) == PeriodStatus::HardClose);
            REQUIRE(submit(*fx.ctx, fx.simple_entry("1300", "1100", "10", in_january)).kind() ==
                    ErrorKind::PERIOD_CLOSED);
        }
    }

    SECTION("A hard-closed period cannot be reopened or closed again") {
        REQUIRE(close_period(*fx.ctx, PeriodCloseRequest{2024, 1, PeriodStatus::HardClose, "cfo", ""}).success());

        auto again = close_period(*fx.ctx, PeriodCloseRequest{2024, 1, PeriodStatus::SoftClose, "cfo", ""});
        REQUIRE(again.kind() == ErrorKind::INVALID_STATE);
        REQUIRE(again.error().detail("from") == "HARD_CLOSE");
        REQUIRE(again.error().detail("to") == "SOFT_CLOSE");
    }

    SECTION("Unposted entries block the close") {
        auto draft = submit(*fx.ctx, fx.simple_entry("1300", "1100", "10", in_january, "clerk-1", false));
        REQUIRE(draft.success());

        auto blocked = close_period(*fx.ctx, PeriodCloseRequest{2024, 1, PeriodStatus::HardClose, "cfo", ""});
        REQUIRE(blocked.kind() == ErrorKind::PERIOD_HAS_UNPOSTED);
        REQUIRE(blocked.error().detail("count") == "1");
        REQUIRE(get_period_status(*fx.ctx, in_january) == PeriodStatus::Open);

        // Drafts in other months do not count
        REQUIRE(fx.ctx->read([](const LedgerStore& store) {
            return count_unposted_entries(store, PeriodKey{2024, 2});
        }) == 0);
    }

    SECTION("Month out of range") {
        auto bad = close_period(*fx.ctx, PeriodCloseRequest{2024, 13, PeriodStatus::SoftClose, "cfo", ""});
        REQUIRE(bad.kind() == ErrorKind::INVALID_STATE);
    }

    // Other periods are unaffected
    REQUIRE(get_period_status(*fx.ctx, Date(2024, 2, 1)) == PeriodStatus::Open);
}

#include <catch2/catch_test_macros.hpp>
#include "calendar.hpp"
#include <stdexcept>

using namespace ledgercore;

TEST_CASE("Date parsing and formatting", "[calendar]") {
    Date d = Date::parse("2024-02-29");
    REQUIRE(d.year() == 2024);
    REQUIRE(d.month() == 2);
    REQUIRE(d.day() == 29);
    REQUIRE(d.to_string() == "2024-02-29");

    REQUIRE_THROWS_AS(Date::parse("2023-02-29"), std::invalid_argument);
    REQUIRE_THROWS_AS(Date::parse("2024-13-01"), std::invalid_argument);
    REQUIRE_THROWS_AS(Date::parse("2024/01/01"), std::invalid_argument);
    REQUIRE_THROWS_AS(Date::parse("2024-01-01T00"), std::invalid_argument);
    REQUIRE_THROWS_AS(Date(2024, 4, 31), std::invalid_argument);
}

TEST_CASE("Date arithmetic", "[calendar]") {
    SECTION("Month steps clamp to the last day") {
        REQUIRE(Date(2024, 1, 31).add_months(1) == Date(2024, 2, 29));
        REQUIRE(Date(2023, 1, 31).add_months(1) == Date(2023, 2, 28));
        REQUIRE(Date(2024, 1, 15).add_months(12) == Date(2025, 1, 15));
        REQUIRE(Date(2024, 3, 31).add_months(-1) == Date(2024, 2, 29));
        REQUIRE(Date(2024, 11, 30).add_months(3) == Date(2025, 2, 28));
    }

    SECTION("Day steps and differences") {
        REQUIRE(Date(2024, 2, 28).add_days(1) == Date(2024, 2, 29));
        REQUIRE(Date(2024, 12, 31).add_days(1) == Date(2025, 1, 1));
        REQUIRE(Date(2024, 1, 1).days_until(Date(2025, 1, 1)) == 366);
        REQUIRE(Date(2025, 1, 1).days_until(Date(2024, 1, 1)) == -366);
        REQUIRE(Date::from_days(0) == Date(1970, 1, 1));
        REQUIRE(Date(2024, 1, 1).add_days(-1) == Date(2023, 12, 31));
    }

    SECTION("Ordering") {
        REQUIRE(Date(2024, 1, 1) < Date(2024, 1, 2));
        REQUIRE(Date(2024, 1, 2) >= Date(2024, 1, 2));
        REQUIRE(Date(2023, 12, 31) <= Date(2024, 1, 1));
    }
}

TEST_CASE("Financial periods", "[calendar]") {
    PeriodKey march{2024, 3};
    REQUIRE(march.to_string() == "2024-03");
    REQUIRE(Date(2024, 3, 17).period() == march);
    REQUIRE(PeriodKey{2023, 12} < march);
    REQUIRE(first_day_of(march) == Date(2024, 3, 1));
    REQUIRE(last_day_of(PeriodKey{2024, 2}) == Date(2024, 2, 29));
    REQUIRE(days_in_month(2100, 2) == 28);
    REQUIRE(days_in_month(2000, 2) == 29);
    REQUIRE_THROWS_AS(days_in_month(2024, 0), std::invalid_argument);
}

#ifndef LEDGERCORE_CALENDAR_HPP
#define LEDGERCORE_CALENDAR_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace ledgercore {

// Accounting period key: one calendar month
struct PeriodKey {
    int year;
    unsigned month;  // 1..12

    bool operator==(const PeriodKey& other) const {
        return year == other.year && month == other.month;
    }
    bool operator!=(const PeriodKey& other) const { return !(*this == other); }
    bool operator<(const PeriodKey& other) const {
        return year != other.year ? year < other.year : month < other.month;
    }

    std::string to_string() const;  // "2024-03"
};

/**
 * @brief Civil (proleptic Gregorian) date without time of day
 *
 * Entry dates, due dates and period boundaries are all day-granular, so the
 * ledger never has to reason about time zones.
 */
class Date {
public:
    Date();  // 1970-01-01

    /**
     * @throws std::invalid_argument for an impossible date (e.g. 2023-02-29)
     */
    Date(int year, unsigned month, unsigned day);

    /**
     * @brief Parse ISO "YYYY-MM-DD"
     * @throws std::invalid_argument on malformed input
     */
    static Date parse(const std::string& text);

    static Date from_days(int64_t days_since_epoch);

    // Current local date from the system clock
    static Date today();

    int year() const { return year_; }
    unsigned month() const { return month_; }
    unsigned day() const { return day_; }

    int64_t days_since_epoch() const;

    // Calendar month arithmetic; day clamped to the target month's last day
    Date add_months(int months) const;
    Date add_days(int64_t days) const;

    // Signed number of days from this date to `other`
    int64_t days_until(const Date& other) const;

    PeriodKey period() const { return PeriodKey{year_, month_}; }

    std::string to_string() const;

    bool operator==(const Date& other) const { return days_since_epoch() == other.days_since_epoch(); }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const { return days_since_epoch() < other.days_since_epoch(); }
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator>=(const Date& other) const { return !(*this < other); }

private:
    int year_;
    unsigned month_;
    unsigned day_;
};

unsigned days_in_month(int year, unsigned month);
Date first_day_of(const PeriodKey& period);
Date last_day_of(const PeriodKey& period);

std::ostream& operator<<(std::ostream& os, const Date& date);

} // namespace ledgercore

#endif // LEDGERCORE_CALENDAR_HPP

#include "calendar.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ledgercore {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// Howard Hinnant's days_from_civil / civil_from_days
int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400) + (m <= 2);
}

} // namespace

std::string PeriodKey::to_string() const {
    std::ostringstream oss;
    oss << year << "-" << std::setw(2) << std::setfill('0') << month;
    return oss.str();
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Month out of range: " + std::to_string(month));
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return lengths[month - 1];
}

Date::Date() : year_(1970), month_(1), day_(1) {}

Date::Date(int year, unsigned month, unsigned day)
    : year_(year), month_(month), day_(day) {
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        throw std::invalid_argument("Invalid date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
}

Date Date::parse(const std::string& text) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    char trailing = 0;
    if (text.size() != 10 ||
        std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &trailing) != 3) {
        throw std::invalid_argument("Malformed date (expected YYYY-MM-DD): " + text);
    }
    return Date(year, month, day);
}

Date Date::from_days(int64_t days_since_epoch) {
    int y;
    unsigned m;
    unsigned d;
    civil_from_days(days_since_epoch, y, m, d);
    return Date(y, m, d);
}

Date Date::today() {
    auto now = std::chrono::system_clock::now();
    std::time_t time_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_now);
#else
    localtime_r(&time_now, &tm_buf);
#endif
    return Date(tm_buf.tm_year + 1900, static_cast<unsigned>(tm_buf.tm_mon + 1),
                static_cast<unsigned>(tm_buf.tm_mday));
}

int64_t Date::days_since_epoch() const {
    return days_from_civil(year_, month_, day_);
}

Date Date::add_months(int months) const {
    int64_t total = static_cast<int64_t>(year_) * 12 + (month_ - 1) + months;
    int year = static_cast<int>(total >= 0 ? total / 12 : (total - 11) / 12);
    unsigned month = static_cast<unsigned>(total - static_cast<int64_t>(year) * 12) + 1;
    unsigned day = std::min(day_, days_in_month(year, month));
    return Date(year, month, day);
}

Date Date::add_days(int64_t days) const {
    return from_days(days_since_epoch() + days);
}

int64_t Date::days_until(const Date& other) const {
    return other.days_since_epoch() - days_since_epoch();
}

std::string Date::to_string() const {
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << year_ << "-"
        << std::setw(2) << std::setfill('0') << month_ << "-"
        << std::setw(2) << std::setfill('0') << day_;
    return oss.str();
}

Date first_day_of(const PeriodKey& period) {
    return Date(period.year, period.month, 1);
}

Date last_day_of(const PeriodKey& period) {
    return Date(period.year, period.month, days_in_month(period.year, period.month));
}

std::ostream& operator<<(std::ostream& os, const Date& date) {
    return os << date.to_string();
}

} // namespace ledgercore

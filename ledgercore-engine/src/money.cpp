#include "money.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace ledgercore {

Decimal round_half_up(const Decimal& value, unsigned places) {
    Decimal scale(1);
    for (unsigned i = 0; i < places; ++i) {
        scale *= 10;
    }

    const Decimal half("0.5");
    Decimal scaled = value * scale;
    Decimal rounded;
    if (scaled < 0) {
        rounded = -boost::multiprecision::floor(-scaled + half);
    } else {
        rounded = boost::multiprecision::floor(scaled + half);
    }
    return rounded / scale;
}

Money Money::from_units(int64_t units) {
    if (units > std::numeric_limits<int64_t>::max() / 100 ||
        units < std::numeric_limits<int64_t>::min() / 100) {
        throw std::overflow_error("Money amount out of range: " + std::to_string(units));
    }
    return Money(units * 100);
}

Money Money::parse(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty money amount");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }

    int64_t units = 0;
    size_t integer_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (units > (std::numeric_limits<int64_t>::max() / 100 - 9) / 10) {
            throw std::invalid_argument("Money amount out of range: " + text);
        }
        units = units * 10 + (text[pos] - '0');
        ++integer_digits;
        ++pos;
    }

    int64_t fraction = 0;
    size_t fraction_digits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (fraction_digits == 2) {
                throw std::invalid_argument("Money amount has more than two decimals: " + text);
            }
            fraction = fraction * 10 + (text[pos] - '0');
            ++fraction_digits;
            ++pos;
        }
    }

    if (pos != text.size() || (integer_digits == 0 && fraction_digits == 0)) {
        throw std::invalid_argument("Malformed money amount: " + text);
    }
    if (fraction_digits == 1) {
        fraction *= 10;
    }

    int64_t cents = units * 100 + fraction;
    return Money(negative ? -cents : cents);
}

Money Money::from_decimal(const Decimal& value) {
    Decimal cents = round_half_up(value * 100, 0);
    if (cents > Decimal(std::numeric_limits<int64_t>::max()) ||
        cents < Decimal(std::numeric_limits<int64_t>::min())) {
        throw std::overflow_error("Money amount out of range");
    }
    return Money(cents.convert_to<int64_t>());
}

Decimal Money::to_decimal() const {
    return Decimal(cents_) / 100;
}

std::string Money::to_string() const {
    // Widen before negating so INT64_MIN does not overflow
    uint64_t magnitude = cents_ < 0
        ? static_cast<uint64_t>(-(cents_ + 1)) + 1
        : static_cast<uint64_t>(cents_);

    std::string fraction = std::to_string(magnitude % 100);
    if (fraction.size() < 2) {
        fraction.insert(0, "0");
    }
    return (cents_ < 0 ? "-" : "") + std::to_string(magnitude / 100) + "." + fraction;
}

Money Money::operator+(Money other) const {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();
    if ((other.cents_ > 0 && cents_ > max - other.cents_) ||
        (other.cents_ < 0 && cents_ < min - other.cents_)) {
        throw std::overflow_error("Money addition overflow");
    }
    return Money(cents_ + other.cents_);
}

Money Money::operator-(Money other) const {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    constexpr int64_t min = std::numeric_limits<int64_t>::min();
    if ((other.cents_ < 0 && cents_ > max + other.cents_) ||
        (other.cents_ > 0 && cents_ < min + other.cents_)) {
        throw std::overflow_error("Money subtraction overflow");
    }
    return Money(cents_ - other.cents_);
}

Money& Money::operator+=(Money other) {
    *this = *this + other;
    return *this;
}

Money& Money::operator-=(Money other) {
    *this = *this - other;
    return *this;
}

std::ostream& operator<<(std::ostream& os, const Money& amount) {
    return os << amount.to_string();
}

} // namespace ledgercore

#ifndef LEDGERCORE_MONEY_HPP
#define LEDGERCORE_MONEY_HPP

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <cstdint>
#include <ostream>
#include <string>

namespace ledgercore {

// 50 significant decimal digits. All intermediate interest and schedule maths
// runs in this type; binary floating point never touches a money value.
using Decimal = boost::multiprecision::cpp_dec_float_50;

// Round to `places` decimals, halves away from zero (1.005 -> 1.01, -1.005 -> -1.01)
Decimal round_half_up(const Decimal& value, unsigned places);

/**
 * @brief Exact base-currency amount held as signed minor units (cents)
 *
 * Two decimal places, no fractional cents. Conversions from Decimal always go
 * through round_half_up so a value computed twice rounds the same way twice.
 */
class Money {
public:
    constexpr Money() : cents_(0) {}

    static constexpr Money from_cents(int64_t cents) { return Money(cents); }
    static Money from_units(int64_t units);

    /**
     * @brief Parse "1234", "1234.5", "-0.01"
     * @throws std::invalid_argument on malformed input or more than two decimals
     */
    static Money parse(const std::string& text);

    // Round half up to the cent
    static Money from_decimal(const Decimal& value);

    int64_t cents() const { return cents_; }
    Decimal to_decimal() const;
    std::string to_string() const;

    bool is_zero() const { return cents_ == 0; }
    bool is_positive() const { return cents_ > 0; }
    bool is_negative() const { return cents_ < 0; }
    Money abs() const { return Money(cents_ < 0 ? -cents_ : cents_); }

    Money operator-() const { return Money(-cents_); }
    Money operator+(Money other) const;
    Money operator-(Money other) const;
    Money& operator+=(Money other);
    Money& operator-=(Money other);

    bool operator==(Money other) const { return cents_ == other.cents_; }
    bool operator!=(Money other) const { return cents_ != other.cents_; }
    bool operator<(Money other) const { return cents_ < other.cents_; }
    bool operator<=(Money other) const { return cents_ <= other.cents_; }
    bool operator>(Money other) const { return cents_ > other.cents_; }
    bool operator>=(Money other) const { return cents_ >= other.cents_; }

private:
    explicit constexpr Money(int64_t cents) : cents_(cents) {}

    int64_t cents_;
};

std::ostream& operator<<(std::ostream& os, const Money& amount);

} // namespace ledgercore

#endif // LEDGERCORE_MONEY_HPP

#pragma once
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <cstdint>
#include <ostream>
#include <string>

/// \file nexus/Money.hpp Fixed-point currency amounts and the decimal type used for intermediate arithmetic.

namespace nexus {

/** Decimal floating-point type with 50 significant digits, used for every intermediate monetary
 * calculation (tax, interest, penalties).  Expression templates are disabled so that `auto` and
 * temporaries behave like ordinary values.
 */
typedef boost::multiprecision::number<boost::multiprecision::cpp_dec_float<50>, boost::multiprecision::et_off> Decimal;

/** Rounds a decimal value to the given number of decimal places using half-up rounding (halves are
 * rounded away from zero, so 0.625 becomes 0.63 and -0.625 becomes -0.63).
 */
Decimal round_half_up(const Decimal &value, unsigned places);

/** Returns a fixed-notation string of `value` with at most `places` decimal places; trailing zeros
 * (and a trailing decimal point) are removed.
 */
std::string decimal_str(const Decimal &value, unsigned places);

/** A currency amount stored as a signed 64-bit count of the currency's minor unit (cents).  Money
 * values are never held in binary floating point: conversions from Decimal go through round(),
 * which applies half-up rounding to the minor unit.
 */
class Money final {
    public:
        /// Default construction gives a zero amount.
        constexpr Money() : cents_{0} {}

        /// Constructs a Money value from a count of cents.
        static constexpr Money fromCents(int64_t cents) { return Money(cents); }

        /** Rounds a decimal amount (in major units) to the nearest cent, rounding halves away from
         * zero.
         */
        static Money round(const Decimal &amount);

        /** Parses an amount such as "1234.56", "-3" or "0.005".  More than two decimal places are
         * rounded half-up.
         *
         * \throws std::invalid_argument if the string is not a plain decimal number.
         */
        static Money parse(const std::string &amount);

        /// The amount in cents.
        constexpr int64_t cents() const { return cents_; }

        /// The amount in major units as a Decimal.
        Decimal decimal() const;

        /// Returns the amount formatted with exactly two decimal places, e.g. "-12.05".
        std::string str() const;

        /// Returns true if the amount is exactly zero.
        constexpr bool zero() const { return cents_ == 0; }

        /// Adds another amount to this one.
        Money& operator+=(const Money &m) { cents_ += m.cents_; return *this; }
        /// Subtracts another amount from this one.
        Money& operator-=(const Money &m) { cents_ -= m.cents_; return *this; }

        constexpr Money operator+(const Money &m) const { return Money(cents_ + m.cents_); }
        constexpr Money operator-(const Money &m) const { return Money(cents_ - m.cents_); }
        constexpr Money operator-() const { return Money(-cents_); }

        constexpr bool operator==(const Money &m) const { return cents_ == m.cents_; }
        constexpr bool operator!=(const Money &m) const { return cents_ != m.cents_; }
        constexpr bool operator<(const Money &m) const { return cents_ < m.cents_; }
        constexpr bool operator<=(const Money &m) const { return cents_ <= m.cents_; }
        constexpr bool operator>(const Money &m) const { return cents_ > m.cents_; }
        constexpr bool operator>=(const Money &m) const { return cents_ >= m.cents_; }

    private:
        explicit constexpr Money(int64_t cents) : cents_{cents} {}
        int64_t cents_;
};

/// Writes Money::str() to the stream.
std::ostream& operator<<(std::ostream &out, const Money &m);

}

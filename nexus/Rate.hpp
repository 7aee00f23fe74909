#pragma once
#include "nexus/Money.hpp"
#include <string>

/// \file nexus/Rate.hpp Dimensionless and per-period rates.

namespace nexus {

/** A dimensionless proportion such as a sales tax rate or a penalty rate: 0.0625 means 6.25%.  A Rate
 * has no time unit; periodic interest rates use PeriodicRate instead.
 */
class Rate final {
    public:
        /// Default construction gives a zero rate.
        Rate() = default;
        /// Constructs a rate from a decimal proportion.
        explicit Rate(const Decimal &value) : value_{value} {}

        /** Parses a decimal proportion such as "0.0625".
         *
         * \throws std::invalid_argument if the value cannot be parsed.
         */
        static Rate parse(const std::string &value);

        /// The rate as a decimal proportion.
        const Decimal& value() const { return value_; }

        bool zero() const { return value_ == 0; }
        bool negative() const { return value_ < 0; }

        bool operator==(const Rate &r) const { return value_ == r.value_; }
        bool operator!=(const Rate &r) const { return value_ != r.value_; }

    private:
        Decimal value_{0};
};

/// Applies a rate to a monetary amount, giving the unrounded product.
inline Decimal operator*(const Money &amount, const Rate &rate) { return amount.decimal() * rate.value(); }

/// Time units for periodic rates.
namespace period {
    struct year {};  ///< Rate applies per year
    struct month {}; ///< Rate applies per month
    struct day {};   ///< Rate applies per day
}

/** An interest rate expressed per unit of time.  The period is part of the type, so an annual rate
 * cannot be passed where a monthly rate is expected; conversion between units is done explicitly
 * through monthly(), daily() and annualize().
 */
template <typename Period>
class PeriodicRate final {
    public:
        /// Default construction gives a zero rate.
        PeriodicRate() = default;
        /// Constructs a rate from a decimal proportion per period.
        explicit PeriodicRate(const Decimal &value) : value_{value} {}

        /// The rate per period as a decimal proportion.
        const Decimal& value() const { return value_; }

        bool zero() const { return value_ == 0; }
        bool negative() const { return value_ < 0; }

        bool operator==(const PeriodicRate &r) const { return value_ == r.value_; }
        bool operator!=(const PeriodicRate &r) const { return value_ != r.value_; }

    private:
        Decimal value_{0};
};

typedef PeriodicRate<period::year> AnnualRate;
typedef PeriodicRate<period::month> MonthlyRate;
typedef PeriodicRate<period::day> DailyRate;

/// Converts an annual rate to a monthly rate (annual / 12).
inline MonthlyRate monthly(const AnnualRate &annual) { return MonthlyRate(annual.value() / 12); }

/// Converts an annual rate to a daily rate (annual / 365).
inline DailyRate daily(const AnnualRate &annual) { return DailyRate(annual.value() / 365); }

/// Converts a monthly rate to an annual rate (monthly * 12).
inline AnnualRate annualize(const MonthlyRate &m) { return AnnualRate(m.value() * 12); }

}

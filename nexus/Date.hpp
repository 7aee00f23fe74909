#pragma once
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <string>

/// \file nexus/Date.hpp Calendar date type and the date arithmetic used by lookback windows.

namespace nexus {

/// Calendar dates, without time of day or time zone.
typedef boost::gregorian::date Date;

/** A month and day without a year, used for fiscal year ends and fixed annual measurement periods.
 * February 29 is permitted; in non-leap years it is treated as February 28.
 */
struct MonthDay {
    unsigned int month = 12; ///< Month, 1-12
    unsigned int day = 31;   ///< Day of the month

    /// Returns true if month and day form a valid date in a leap year.
    bool valid() const;

    /// Returns the date with this month and day in the given year, clamping Feb 29 to Feb 28.
    Date in(int year) const;

    /// Returns "MM-DD".
    std::string str() const;

    /** Parses "MM-DD" or "M-D".
     *
     * \throws std::invalid_argument if the value is not a valid month and day.
     */
    static MonthDay parse(const std::string &value);

    bool operator==(const MonthDay &o) const { return month == o.month and day == o.day; }
};

/** Parses an ISO date ("YYYY-MM-DD").  Anything after the first 10 characters (such as a time of
 * day) is ignored.
 *
 * \throws std::invalid_argument if the value is not a valid date.
 */
Date parse_date(const std::string &value);

/// Returns the date formatted as "YYYY-MM-DD".
std::string date_str(const Date &d);

/// Returns January 1 of the given year.
Date year_start(int year);

/// Returns the first day of the month following the month containing `d`.
Date first_of_next_month(const Date &d);

/** Returns the date `months` calendar months before `d`.  If the resulting month is shorter than the
 * day of `d`, the day is clamped to the last day of that month.
 */
Date subtract_months(const Date &d, unsigned int months);

/// Returns the number of days from `from` to `to` (negative if `to` precedes `from`).
long days_between(const Date &from, const Date &to);

/** Returns a sequential quarter index for the quarter containing `d`, such that consecutive
 * calendar quarters have consecutive indices: year*4 + (month-1)/3.
 */
int quarter_index(const Date &d);

/// Returns the first day of the quarter with the given quarter_index().
Date quarter_start(int index);

/** Returns the first day of the annual period, ending on `period_end` each year, that contains `d`.
 * The period end date itself belongs to the period it ends.
 */
Date fiscal_period_start(const Date &d, const MonthDay &period_end);

}

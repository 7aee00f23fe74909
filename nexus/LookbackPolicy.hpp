#pragma once
#include "nexus/Date.hpp"
#include <boost/variant/variant.hpp>
#include <string>

/// \file nexus/LookbackPolicy.hpp The measurement-period rules used by economic nexus thresholds.

namespace nexus {
/// Namespace for the lookback policy alternatives.
namespace lookback {

/** Sales in the calendar year before the evaluation year are measured.  A crossing found there
 * establishes nexus for the whole evaluation year.
 */
struct PreviousCalendarYear {};

/** Sales in the evaluation year to date are measured first; if they do not cross, the previous
 * calendar year is measured.
 */
struct CurrentOrPreviousCalendarYear {};

/** Sales in the `days` days ending on (and including) the evaluation date are measured. */
struct RollingWindow {
    unsigned int days = 365; ///< Window length in days; must be positive
};

/** Sales in the `quarters` complete calendar quarters immediately preceding the quarter of the
 * evaluation date are measured.  The window can only be evaluated once the jurisdiction's history
 * reaches back to the first of those quarters.
 */
struct QuarterWindow {
    unsigned int quarters = 4; ///< Number of preceding quarters; must be positive
};

/** Sales since the start of the annual period ending on `period_end` are measured.  If
 * `client_fiscal_year` is set, the period end is replaced by the fiscal year end supplied with the
 * evaluation, when one is supplied.
 */
struct FixedAnnualWindow {
    MonthDay period_end;             ///< Last day of each annual period
    bool client_fiscal_year = false; ///< Use the evaluation's fiscal year end, if given
};

}

/// One of the supported lookback rules.
typedef boost::variant<
    lookback::PreviousCalendarYear,
    lookback::CurrentOrPreviousCalendarYear,
    lookback::RollingWindow,
    lookback::QuarterWindow,
    lookback::FixedAnnualWindow
> LookbackPolicy;

/** Parses a lookback policy from its configuration spelling:
 *
 * - `previous-calendar-year`
 * - `current-or-previous-calendar-year`
 * - `rolling:DAYS`
 * - `quarters:N`
 * - `fixed:MM-DD`
 * - `fiscal` or `fiscal:MM-DD` (the evaluation's fiscal year end, with MM-DD, default 12-31, used
 *   when none is given)
 *
 * \throws std::invalid_argument if the value is not recognized.
 */
LookbackPolicy parse_lookback(const std::string &value);

/// Returns the configuration spelling of a policy; the inverse of parse_lookback().
std::string lookback_str(const LookbackPolicy &policy);

/** Checks the policy's parameters.
 *
 * \throws std::domain_error if a rolling window has zero days or a quarter window zero quarters.
 */
void check_lookback(const LookbackPolicy &policy);

}

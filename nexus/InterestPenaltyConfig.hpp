#pragma once
#include "nexus/Date.hpp"
#include "nexus/Money.hpp"
#include "nexus/PenaltyRule.hpp"
#include "nexus/Rate.hpp"
#include <boost/optional.hpp>
#include <map>
#include <string>
#include <vector>

namespace nexus {

/// Interest accrual methods.
enum class InterestMethod {
    simple,           ///< principal × annual rate × years
    compound_monthly, ///< compounding monthly at annual/12 over days/30.44 months
    compound_daily    ///< compounding daily at annual/365
};

/** Parses "simple", "compound_monthly" or "compound_daily" (hyphens are also accepted).
 *
 * \throws std::invalid_argument for any other value.
 */
InterestMethod parse_interest_method(const std::string &value);

/// Returns "simple", "compound_monthly" or "compound_daily".
std::string interest_method_name(InterestMethod m);

/// The amount a penalty rate applies to.
enum class PenaltyBase {
    tax_only,         ///< Base tax only
    tax_plus_interest ///< Base tax plus accrued interest
};

/** Parses "tax_only" (or "tax") and "tax_plus_interest" (hyphens are also accepted).
 *
 * \throws std::invalid_argument for any other value.
 */
PenaltyBase parse_penalty_base(const std::string &value);

/** A period during which a particular annual interest rate applies.  The period covers days in
 * [start, end).
 */
struct RatePeriod {
    Date start;              ///< First day of the period
    Date end;                ///< First day after the period
    AnnualRate annual_rate;  ///< Rate in effect during the period
};

/** Interest and penalty rules for a single jurisdiction.  Default-constructed values are the rules
 * applied when a jurisdiction has no interest configuration.
 */
struct InterestPenaltyConfig {
    /// Annual interest rate
    AnnualRate annual_interest_rate{Decimal("0.03")};

    /// Accrual method
    InterestMethod interest_method = InterestMethod::simple;

    /// Minimum interest charged, if any; not applied when rate periods are configured
    boost::optional<Money> interest_minimum;

    /** Flat late payment penalty rate applied to the penalty base.  Ignored when penalty_rules has
     * a late_payment rule.
     */
    Rate penalty_rate{Decimal("0.10")};

    /// Minimum of the flat late payment penalty, if any
    boost::optional<Money> penalty_min;

    /// Maximum of the flat late payment penalty, if any
    boost::optional<Money> penalty_max;

    /// Penalty rules by category
    std::map<PenaltyCategory, PenaltyRule> penalty_rules;

    /// Limit on the combined amount of some penalty categories, if any
    boost::optional<CombinedPenaltyCap> combined_penalty_cap;

    /// What the penalty rate applies to
    PenaltyBase penalty_base = PenaltyBase::tax_only;

    /// Whether interest is waived under a voluntary disclosure agreement
    bool vda_interest_waived = false;

    /// Whether penalties are waived under a voluntary disclosure agreement
    bool vda_penalties_waived = false;

    /// How many months before the VDA reference date liability is pursued
    unsigned int vda_lookback_months = 48;

    /** Historical rate schedule.  When non-empty, interest is accrued period by period at each
     * period's rate instead of at `annual_interest_rate`; days outside every period accrue nothing.
     */
    std::vector<RatePeriod> rate_periods;

    /** Returns the penalty rules in effect: `penalty_rules`, plus a flat late_payment rule built
     * from penalty_rate, penalty_min and penalty_max when `penalty_rules` has no late_payment rule
     * and the penalty rate is not zero.
     */
    std::map<PenaltyCategory, PenaltyRule> penaltyRules() const;

    /** Checks the configuration for invalid values.
     *
     * \param code the jurisdiction code, used in the exception message
     * \throws std::domain_error if a rate, amount or penalty bound is negative, if penalty_min
     * exceeds penalty_max, if a rate period ends before it starts, if a penalty rule is invalid, or
     * if a combined penalty cap covers no categories.
     */
    void check(const std::string &code) const;
};

}

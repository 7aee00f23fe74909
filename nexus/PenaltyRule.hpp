#pragma once
#include "nexus/Money.hpp"
#include "nexus/Rate.hpp"
#include <boost/optional.hpp>
#include <boost/variant/variant.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

/// \file nexus/PenaltyRule.hpp Penalty categories and the rules that compute each penalty.

namespace nexus {

/// The kinds of penalty a jurisdiction may assess on unpaid tax.
enum class PenaltyCategory {
    late_filing,
    late_payment,
    negligence,
    e_filing_failure,
    fraud,
    operating_without_permit,
    late_registration,
    unregistered_business,
    cost_of_collection,
    extended_delinquency
};

/** Parses a penalty category name such as "late_filing" (hyphens are also accepted).
 *
 * \throws std::invalid_argument for an unknown category.
 */
PenaltyCategory parse_penalty_category(const std::string &value);

/// Returns the category name, such as "late_filing".
std::string penalty_category_name(PenaltyCategory c);

/// Rounded penalty amounts by category.  Categories without a rule have no entry.
typedef std::map<PenaltyCategory, Money> PenaltyBreakdown;

/// How per-period penalties count elapsed periods.
enum class PenaltyPeriod {
    month,      ///< Whole months of 30.44 days
    thirty_days ///< Whole 30-day periods
};

/** Parses "month" or "30_days" (or "30-days").
 *
 * \throws std::invalid_argument for any other value.
 */
PenaltyPeriod parse_penalty_period(const std::string &value);

/// Returns the number of whole periods in `days` days.
long periods_elapsed(PenaltyPeriod period, long days);

/// Namespace for the penalty rule alternatives.
namespace penalty {

/// An extra rate charged once the penalty has been outstanding for more than `days` days.
struct AdditionalAfter {
    long days = 0; ///< Days that must be exceeded
    Rate rate;     ///< Extra rate on the penalty base
};

/** A percentage of the penalty base.  The percentage is limited to `max_rate`, then raised to
 * `minimum`, then increased by `additional` when it applies, and finally limited to `maximum`.
 */
struct Flat {
    Rate rate;
    boost::optional<Rate> max_rate;
    boost::optional<Money> minimum;
    boost::optional<Money> maximum;
    boost::optional<AdditionalAfter> additional;
};

/// A fixed amount regardless of the penalty base or the time outstanding.
struct FlatFee {
    Money amount;
};

/** `rate` for each elapsed period (at least one), limited to `max_rate`, applied to the penalty
 * base; then raised to `minimum` and increased by `additional_fee`.
 */
struct PerPeriod {
    Rate rate;
    PenaltyPeriod period = PenaltyPeriod::month;
    boost::optional<Rate> max_rate;
    boost::optional<Money> minimum;
    boost::optional<Money> additional_fee;
};

/// A fixed amount per day outstanding, up to `maximum`.
struct PerDay {
    Money amount;
    boost::optional<Money> maximum;
};

/// A rate that applies when the days outstanding are in [start_day, end_day].
struct Tier {
    long start_day = 0;
    boost::optional<long> end_day; ///< Unbounded when unset
    Rate rate;
};

/** The rate of the first tier containing the days outstanding, applied to the penalty base; no
 * penalty if no tier contains them.
 */
struct Tiered {
    std::vector<Tier> tiers;
};

/// A minimum that applies once the penalty has been outstanding for more than `after_days` days.
struct EscalatingMinimum {
    long after_days = 0;
    Money minimum;
};

/** `base_rate` plus `rate` for each elapsed period (possibly none), limited to `max_rate`, applied
 * to the penalty base; then raised to the largest applicable minimum.
 */
struct BasePlusPerPeriod {
    Rate base_rate;
    Rate rate;
    PenaltyPeriod period = PenaltyPeriod::month;
    boost::optional<Rate> max_rate;
    boost::optional<Money> minimum;
    std::vector<EscalatingMinimum> escalating_minimums;
};

}

/// One of the supported penalty rules.
typedef boost::variant<
    penalty::Flat,
    penalty::FlatFee,
    penalty::PerPeriod,
    penalty::PerDay,
    penalty::Tiered,
    penalty::BasePlusPerPeriod
> PenaltyRule;

/// Returns the rule's type name: "flat", "flat_fee", "per_period", "per_day", "tiered" or "base_plus_per_period".
std::string penalty_rule_type(const PenaltyRule &rule);

/** Returns the unrounded penalty a rule assesses on `base` after `days_late` days.
 *
 * \param rule the penalty rule
 * \param base the penalty base; the caller only assesses penalties on a positive base
 * \param days_late days outstanding; must be positive
 */
Decimal penalty_amount(const PenaltyRule &rule, const Money &base, long days_late);

/** Checks the rule's parameters.
 *
 * \throws std::domain_error for a negative rate or amount, a minimum above a maximum, or a tier
 * that ends before it starts.
 */
void check_penalty_rule(const PenaltyRule &rule);

/** A limit on the sum of some penalty categories, as a rate of the penalty base.  When the sum
 * exceeds the limit, each capped category is reduced in proportion to its share of the sum.
 */
struct CombinedPenaltyCap {
    Rate max_rate{Decimal(1)};
    std::set<PenaltyCategory> applies_to;

    /// Applies the cap to unrounded penalty amounts.
    void apply(std::map<PenaltyCategory, Decimal> &amounts, const Money &base) const;
};

}

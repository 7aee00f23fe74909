#pragma once
#include "nexus/Date.hpp"
#include "nexus/LookbackPolicy.hpp"
#include "nexus/Money.hpp"
#include "nexus/Rate.hpp"
#include <boost/optional.hpp>
#include <cstdint>
#include <string>

namespace nexus {

/// How the revenue and transaction-count threshold conditions combine.
enum class ThresholdOperator {
    any, ///< Either configured condition suffices ("or")
    all  ///< Every configured condition must hold on the same transaction ("and")
};

/** Parses a threshold operator: "or"/"any" or "and"/"all" (case-insensitive).
 *
 * \throws std::invalid_argument for any other value.
 */
ThresholdOperator parse_threshold_operator(const std::string &value);

/// Returns "or" or "and".
std::string threshold_operator_name(ThresholdOperator op);

/** Economic nexus rules and tax rate for a single jurisdiction.  The default-constructed values are
 * the generic rules applied to a jurisdiction that has no configuration: $100,000 or 200
 * transactions, measured over the current or previous calendar year, with a zero tax rate.
 */
struct JurisdictionConfig {
    /// The jurisdiction code, such as "CA"
    std::string code;

    /// Revenue threshold; unset means no revenue condition.
    boost::optional<Money> threshold_amount = Money::fromCents(100000 * 100);

    /// Transaction-count threshold; unset means no count condition.
    boost::optional<uint64_t> threshold_count = uint64_t{200};

    /// How the two threshold conditions combine.
    ThresholdOperator threshold_operator = ThresholdOperator::any;

    /// Measurement period rule
    LookbackPolicy lookback = lookback::CurrentOrPreviousCalendarYear();

    /// Sales tax rate applied to taxable sales
    Rate tax_rate;

    /** Date from which marketplace facilitators collect and remit on the seller's behalf.
     * Marketplace sales on or after this date are not taxable to the seller.  Unset means
     * marketplace sales are always taxable to the seller.
     */
    boost::optional<Date> marketplace_law_date;

    /// Whether marketplace sales count toward the nexus thresholds.
    bool marketplace_counts_toward_threshold = true;

    /** Checks the configuration for invalid values.
     *
     * \throws std::domain_error if a threshold or the tax rate is negative, or if the lookback
     * policy parameters are invalid.
     */
    void check() const;
};

}

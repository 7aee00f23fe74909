#pragma once
#include "nexus/InterestPenaltyConfig.hpp"
#include "nexus/JurisdictionConfig.hpp"
#include "nexus/Transaction.hpp"
#include <map>
#include <string>
#include <vector>

/// \file nexus/data/InputReader.hpp Readers for the normalized CSV inputs of nexus-cli.

namespace nexus { namespace data {

/** Reads transactions from a CSV file with columns `id,date,jurisdiction,amount` and an optional
 * `channel` column (`direct` or `marketplace`; empty or missing means direct).  An empty id is
 * replaced with "LINE<n>".
 *
 * \throws std::invalid_argument for malformed rows, with file and line number in the message
 * \throws std::ios_base::failure if the file cannot be read
 */
std::vector<TransactionRecord> read_transactions(const std::string &filename);

/** Reads jurisdiction configurations from a CSV file with columns
 * `jurisdiction,threshold_amount,threshold_count,operator,lookback,tax_rate,marketplace_law_date,marketplace_counts`.
 * Only `jurisdiction` is required.  Empty threshold, date and operator fields are unset (or
 * default); an empty lookback is `current-or-previous-calendar-year`; an empty tax rate is zero.
 * Values are parsed, not checked: JurisdictionConfig::check() is left to the engine.
 *
 * \throws std::invalid_argument for malformed rows or duplicate jurisdictions
 */
std::map<std::string, JurisdictionConfig> read_jurisdictions(const std::string &filename);

/** Reads interest and penalty configurations from a CSV file with columns
 * `jurisdiction,annual_rate,monthly_rate,method,interest_minimum,penalty_rate,penalty_min,penalty_max,penalty_base,vda_interest_waived,vda_penalties_waived,vda_lookback_months,combined_cap_rate,combined_cap_categories`.
 * Only `jurisdiction` is required; empty fields keep the InterestPenaltyConfig defaults.  If
 * `monthly_rate` is given instead of `annual_rate`, the annual rate is the monthly rate × 12; giving
 * both is an error.  `combined_cap_categories` is a `;`-separated list of penalty categories and
 * must be given together with `combined_cap_rate`.
 *
 * \throws std::invalid_argument for malformed rows or duplicate jurisdictions
 */
std::map<std::string, InterestPenaltyConfig> read_interest(const std::string &filename);

/** Reads interest rate periods from a CSV file with columns
 * `jurisdiction,start,end,annual_rate,monthly_rate` (exactly one of the two rates per row) and
 * appends them, sorted by start date, to the matching configurations in `configs`.
 *
 * \throws std::invalid_argument for malformed rows, or for a jurisdiction with no entry in
 * `configs`
 */
void read_rate_periods(const std::string &filename, std::map<std::string, InterestPenaltyConfig> &configs);

/** Reads penalty rules from a CSV file with columns
 * `jurisdiction,category,type,rate,rate_per_period,max_rate,minimum,maximum,amount,period,after_days,additional_rate,additional_fee,tiers,escalating_minimums`
 * and adds them to the matching configurations in `configs`.  The fields used depend on `type`:
 *
 * - `flat`: rate; optional max_rate, minimum, maximum, and after_days with additional_rate
 * - `flat_fee`: amount
 * - `per_period`: rate_per_period; optional period (`month` or `30_days`), max_rate, minimum, additional_fee
 * - `per_day`: amount; optional maximum
 * - `tiered`: tiers, such as `0-30:0.05;31-:0.10`
 * - `base_plus_per_period`: rate (the base rate) and rate_per_period; optional period, max_rate,
 *   minimum, escalating_minimums (such as `60:100;120:200`)
 *
 * Fields a type does not use must be empty.
 *
 * \throws std::invalid_argument for malformed rows, duplicate categories for a jurisdiction, or a
 * jurisdiction with no entry in `configs`
 */
void read_penalty_rules(const std::string &filename, std::map<std::string, InterestPenaltyConfig> &configs);

/** Parses a boolean field: true/false, yes/no, y/n or 1/0 (case-insensitive).
 *
 * \throws std::invalid_argument for any other value
 */
bool parse_bool(const std::string &value);

}}

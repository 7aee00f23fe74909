#pragma once
#include "nexus/Results.hpp"
#include <map>
#include <ostream>
#include <string>

/// \file nexus/data/ResultWriter.hpp CSV and table output of Engine results.

namespace nexus { namespace data {

/** Returns a value suitable for a CSV field: values containing a comma, quote or newline are
 * wrapped in double quotes, with embedded quotes doubled.
 */
std::string csv_fix(const std::string &value);

/** Writes one CSV row per jurisdiction-year, preceded by a header row.  A failed jurisdiction is
 * written as a single row with empty year fields and the failure in the `notes` column.  Output
 * depends only on the results, so equal results always produce identical output.
 */
void write_years_csv(std::ostream &out, const std::map<std::string, JurisdictionResult> &results);

/** Writes one CSV row per VDA jurisdiction-year, preceded by a header row. */
void write_vda_csv(std::ostream &out, const std::map<std::string, JurisdictionResult> &results);

/** Prints human-readable per-jurisdiction tables: the year results, the all-years rollup and, when
 * computed, the VDA alternative.
 */
void print_results(std::ostream &out, const std::map<std::string, JurisdictionResult> &results);

/** Prints a VDA summary table. */
void print_vda_summary(std::ostream &out, const VdaSummary &summary);

}}

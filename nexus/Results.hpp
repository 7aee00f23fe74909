#pragma once
#include "nexus/Date.hpp"
#include "nexus/InterestPenaltyConfig.hpp"
#include "nexus/Money.hpp"
#include "nexus/NexusTracker.hpp"
#include "nexus/PenaltyRule.hpp"
#include "nexus/Rate.hpp"
#include <boost/optional.hpp>
#include <cstdint>
#include <string>
#include <vector>

/// \file nexus/Results.hpp Records produced by Engine.

namespace nexus {

/// Nexus determination and liability for one jurisdiction-year.
struct NexusYearResult {
    int year;                                ///< Calendar year
    NexusType nexus_type = NexusType::none;  ///< Nexus basis
    boost::optional<Date> nexus_date;        ///< Date nexus was established
    boost::optional<Date> obligation_start;  ///< Date collection was required from
    boost::optional<int> first_nexus_year;   ///< First year of economic nexus
    boost::optional<std::string> crossing_transaction; ///< Id of the crossing transaction, in the establishment year

    Money total_sales;           ///< All sales
    Money direct_sales;          ///< Direct sales
    Money marketplace_sales;     ///< Marketplace sales
    uint64_t transaction_count = 0; ///< Number of transactions
    Money taxable_sales;         ///< Sales taxable to the seller
    Money base_tax;              ///< Tax on taxable sales
    Money interest;              ///< Accrued interest
    Money penalties;             ///< Penalties
    PenaltyBreakdown penalty_breakdown; ///< Penalties by category
    Money total_liability;       ///< base_tax + interest + penalties

    InterestMethod interest_method = InterestMethod::simple; ///< Accrual method
    AnnualRate effective_annual_rate;  ///< Annual rate in effect at the calculation date
    long days_outstanding = 0;         ///< Days from obligation start to the calculation date
};

/// The voluntary disclosure alternative for one jurisdiction-year.
struct VdaResult {
    int year;                                         ///< Calendar year
    boost::optional<Date> effective_obligation_start; ///< Obligation start after lookback truncation
    Money taxable_sales;            ///< Taxable sales from the effective start
    Money base_tax;                 ///< Tax on those sales
    Money interest;                 ///< Interest after any waiver
    Money penalties;                ///< Penalties after any waiver
    PenaltyBreakdown penalty_breakdown; ///< Penalties by category after any waiver
    Money total_liability;          ///< base_tax + interest + penalties
    Money standard_total_liability; ///< Standard total liability computed to the VDA reference date
    Money savings;                  ///< standard_total_liability − total_liability
};

/// Sums over every year of a jurisdiction.
struct YearRollup {
    Money total_sales;
    Money taxable_sales;
    Money base_tax;
    Money interest;
    Money penalties;
    PenaltyBreakdown penalty_breakdown;
    Money total_liability;
    unsigned int years_with_nexus = 0;
    /// The interest method of the most recent year
    boost::optional<InterestMethod> interest_method;
};

/// How far a jurisdiction's result can be relied on.
enum class Confidence {
    high,     ///< Computed from supplied configuration
    degraded, ///< Computed, but default configuration was substituted
    failed    ///< Evaluation failed; see the notes
};

/// Returns "high", "degraded" or "failed".
std::string confidence_name(Confidence c);

/// Everything computed for one jurisdiction.
struct JurisdictionResult {
    std::string code;                   ///< Jurisdiction code
    std::vector<NexusYearResult> years; ///< One entry per calendar year in the history
    YearRollup all_years;               ///< Sums over `years`
    std::vector<VdaResult> vda;         ///< VDA alternative per nexus year, when requested
    bool vda_requested = false;         ///< Whether the VDA alternative was computed
    Confidence confidence = Confidence::high;
    std::vector<std::string> notes;     ///< Defaults substituted, failure messages
};

/// One jurisdiction's contribution to a VdaSummary.
struct VdaBreakdown {
    std::string code;
    Money without_vda; ///< Standard liability at the VDA reference date
    Money with_vda;    ///< Liability under the VDA
    Money savings;     ///< without_vda − with_vda
    Money base_tax;    ///< VDA base tax
    Money interest;    ///< VDA interest
    Money penalties;   ///< VDA penalties
};

/// Totals of the VDA alternative over the selected jurisdictions.
struct VdaSummary {
    Money without_vda;
    Money with_vda;
    Money savings;
    /// savings as a percentage of without_vda, or 0 if without_vda is 0
    Decimal savings_percentage{0};
    /// Per-jurisdiction breakdown, sorted by savings (largest first), then by code
    std::vector<VdaBreakdown> jurisdictions;
};

}

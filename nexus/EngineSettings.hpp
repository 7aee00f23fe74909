#pragma once
#include "nexus/Date.hpp"
#include <boost/optional.hpp>
#include <map>
#include <set>
#include <string>

namespace nexus {

/** Per-analysis settings used by Engine. */
struct EngineSettings {
    /** The date interest and penalties are calculated to.  This must be set: a default-constructed
     * date is not a valid calculation date.
     */
    Date calculation_date;

    /** Whether to compute the voluntary disclosure agreement alternative. */
    bool vda = false;

    /** The date a voluntary disclosure is (or will be) filed.  VDA lookback truncation and VDA
     * interest are computed to this date; when unset, the calculation date is used.
     */
    boost::optional<Date> vda_filing_date;

    /** Jurisdictions to compute the VDA alternative for.  Empty means every jurisdiction. */
    std::set<std::string> vda_jurisdictions;

    /** The client's fiscal year end, used by fixed lookback windows marked as following the
     * client's fiscal year.
     */
    boost::optional<MonthDay> fiscal_year_end;

    /** Dates on which physical presence began, by jurisdiction code. */
    std::map<std::string, Date> physical_nexus;

    /** The number of worker threads used to evaluate jurisdictions.  0 evaluates every
     * jurisdiction in the calling thread.
     */
    unsigned int threads = 0;

    /// Returns the VDA filing date if set, otherwise the calculation date.
    Date vdaReferenceDate() const { return vda_filing_date ? *vda_filing_date : calculation_date; }

    /// Returns true if the VDA alternative should be computed for the given jurisdiction.
    bool vdaFor(const std::string &code) const {
        return vda and (vda_jurisdictions.empty() or vda_jurisdictions.count(code) > 0);
    }
};

}

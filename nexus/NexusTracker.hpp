#pragma once
#include "nexus/Date.hpp"
#include "nexus/JurisdictionConfig.hpp"
#include "nexus/LookbackWindow.hpp"
#include "nexus/ThresholdDetector.hpp"
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace nexus {

/// The basis on which a jurisdiction has nexus in a year.
enum class NexusType {
    none,     ///< No nexus
    economic, ///< Economic nexus only
    physical, ///< Physical presence only
    both      ///< Both economic nexus and physical presence
};

/// Returns "none", "economic", "physical" or "both".
std::string nexus_type_name(NexusType t);

/// Nexus status of a jurisdiction for a single calendar year.
struct YearNexus {
    int year;                                  ///< Calendar year
    NexusType type = NexusType::none;          ///< Nexus basis
    boost::optional<Date> nexus_date;          ///< Date nexus was established, if established this year or earlier
    boost::optional<Date> obligation_start;    ///< Date from which collection is required this year
    boost::optional<int> first_nexus_year;     ///< Year economic nexus was first established
    boost::optional<Crossing> crossing;        ///< The threshold crossing, in the establishment year only
};

/** Tracks a jurisdiction's nexus across the calendar years of its history.
 *
 * The tracker starts with no nexus.  Each year, until economic nexus is established, the
 * threshold detector is run; the year of the first crossing becomes the first nexus year and every
 * later year has nexus from January 1 without further threshold evaluation.  Nexus, once
 * established, is never lost.
 */
class NexusTracker final {
    public:
        /** Creates a tracker.
         *
         * \param window the jurisdiction's lookback window evaluator
         * \param config the jurisdiction configuration
         * \param physical_presence the date physical presence began, if any
         */
        NexusTracker(const LookbackWindow &window, const JurisdictionConfig &config,
                boost::optional<Date> physical_presence = boost::none);

        /** Returns one YearNexus for each calendar year present in the history, ascending. */
        std::vector<YearNexus> track() const;

        /** Returns the obligation start for a crossing on `nexus_date` evaluated for `year`: the
         * first day of the month after the crossing, but no earlier than January 1 of `year`.
         */
        static Date obligationStart(const Date &nexus_date, int year);

    private:
        void applyPhysical(YearNexus &yn) const;

        const LookbackWindow &window_;
        ThresholdDetector detector_;
        boost::optional<Date> physical_;
};

}

#include "nexus/NexusTracker.hpp"
#include <eris/debug.hpp>
#include <algorithm>

namespace nexus {

std::string nexus_type_name(NexusType t) {
    switch (t) {
        case NexusType::economic: return "economic";
        case NexusType::physical: return "physical";
        case NexusType::both: return "both";
        case NexusType::none: break;
    }
    return "none";
}

NexusTracker::NexusTracker(const LookbackWindow &window, const JurisdictionConfig &config, boost::optional<Date> physical_presence)
    : window_(window), detector_(window, config), physical_(physical_presence) {}

Date NexusTracker::obligationStart(const Date &nexus_date, int year) {
    return std::max(first_of_next_month(nexus_date), year_start(year));
}

std::vector<YearNexus> NexusTracker::track() const {
    std::vector<YearNexus> result;
    boost::optional<int> established;
    boost::optional<Date> nexus_date;

    for (int year : window_.years()) {
        YearNexus yn;
        yn.year = year;

        if (established) {
            yn.type = NexusType::economic;
            yn.first_nexus_year = established;
            yn.nexus_date = nexus_date;
            yn.obligation_start = year_start(year);
        }
        else if (auto crossing = detector_.detect(year)) {
            established = year;
            nexus_date = crossing->nexus_date;
            yn.type = NexusType::economic;
            yn.first_nexus_year = year;
            yn.nexus_date = crossing->nexus_date;
            yn.obligation_start = obligationStart(crossing->nexus_date, year);
            yn.crossing = crossing;
            ERIS_DBG("nexus established for " << year << " on " << date_str(crossing->nexus_date) <<
                    " by transaction " << crossing->transaction_id << (crossing->prior_period ? " (prior period)" : ""));
        }

        applyPhysical(yn);
        result.push_back(std::move(yn));
    }

    return result;
}

void NexusTracker::applyPhysical(YearNexus &yn) const {
    if (not physical_ or int(physical_->year()) > yn.year) return;

    Date physical_start = std::max(*physical_, year_start(yn.year));
    if (yn.type == NexusType::none) {
        yn.type = NexusType::physical;
        yn.nexus_date = physical_;
        yn.obligation_start = physical_start;
    }
    else {
        yn.type = NexusType::both;
        if (physical_start < *yn.obligation_start) yn.obligation_start = physical_start;
        if (*physical_ < *yn.nexus_date) yn.nexus_date = physical_;
    }
}

}

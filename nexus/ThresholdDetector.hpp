#pragma once
#include "nexus/Date.hpp"
#include "nexus/JurisdictionConfig.hpp"
#include "nexus/LookbackWindow.hpp"
#include <boost/optional.hpp>
#include <cstddef>
#include <string>

namespace nexus {

/// The transaction at which a jurisdiction's threshold condition first became true.
struct Crossing {
    Date nexus_date;            ///< Date of the crossing transaction
    std::string transaction_id; ///< Id of the crossing transaction
    WindowTotals totals;        ///< Window totals at the crossing
    bool prior_period;          ///< True if found in a year before the evaluation year
};

/** Finds the first transaction at which a jurisdiction's economic nexus threshold is met. */
class ThresholdDetector final {
    public:
        /** Creates a detector for a jurisdiction's window and configuration.  Both are referenced,
         * not copied.
         */
        ThresholdDetector(const LookbackWindow &window, const JurisdictionConfig &config)
            : window_(window), config_(config) {}

        /** Returns true if the totals meet the configured threshold.  Under ThresholdOperator::all
         * every configured condition must hold; unconfigured conditions are ignored, and a
         * configuration with no conditions at all is never met.
         */
        bool met(const WindowTotals &totals) const;

        /** Runs the policy's measurement passes for `year` and returns the first crossing, or an
         * empty optional if the threshold is never met.
         */
        boost::optional<Crossing> detect(int year) const;

        /** Scans candidates at history indices [first, last) in order, returning the first one
         * whose window meets the threshold.  Candidates that do not count toward the threshold or
         * whose window is not testable are skipped.
         */
        boost::optional<Crossing> scan(size_t first, size_t last, bool prior_period) const;

    private:
        const LookbackWindow &window_;
        const JurisdictionConfig &config_;
};

}

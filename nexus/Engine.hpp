#pragma once
#include "nexus/EngineSettings.hpp"
#include "nexus/InterestPenaltyConfig.hpp"
#include "nexus/JurisdictionConfig.hpp"
#include "nexus/Results.hpp"
#include "nexus/Transaction.hpp"
#include <eris/noncopyable.hpp>
#include <map>
#include <string>
#include <vector>

namespace nexus {

/** Jurisdiction and interest configuration, keyed by jurisdiction code. */
struct ConfigSet {
    /// Nexus rules and tax rates
    std::map<std::string, JurisdictionConfig> jurisdictions;
    /// Interest and penalty rules
    std::map<std::string, InterestPenaltyConfig> interest;
};

/** Runs the nexus determination and liability calculation for every jurisdiction in a set of
 * transactions.
 *
 * An Engine is constructed for a single analysis: it copies its settings and configuration and
 * holds no other state, so run() can be called repeatedly and always gives the same results.
 *
 * Jurisdictions are independent.  A jurisdiction without a JurisdictionConfig or
 * InterestPenaltyConfig is evaluated with default rules and marked Confidence::degraded; a
 * jurisdiction whose evaluation throws is marked Confidence::failed with the exception message in
 * its notes, without affecting any other jurisdiction.
 */
class Engine final : private eris::noncopyable {
    public:
        /// Creates an engine for the given settings and configuration.
        Engine(const EngineSettings &settings, const ConfigSet &configs);

        /// Read-only access to the settings
        const EngineSettings &settings{settings_};

        /** Evaluates every jurisdiction that appears in `transactions`.  When settings.threads is
         * positive, jurisdictions are evaluated in parallel on that many threads.
         *
         * \throws std::invalid_argument if the settings have no valid calculation date
         */
        std::map<std::string, JurisdictionResult> run(const std::vector<TransactionRecord> &transactions) const;

        /** Evaluates a single jurisdiction.  `transactions` must all belong to the jurisdiction; they
         * need not be in date order.  Never throws for evaluation errors: failures are reported in
         * the result.
         */
        JurisdictionResult evaluate(const std::string &code, std::vector<TransactionRecord> transactions) const;

        /** Summarizes the VDA alternative over the jurisdictions in `results` that have VDA
         * results.  Jurisdictions without any standard liability are omitted.
         */
        static VdaSummary vdaSummary(const std::map<std::string, JurisdictionResult> &results);

    private:
        // Evaluates into `result`; throws on failure.
        void evaluateInto(JurisdictionResult &result, std::vector<TransactionRecord> &transactions) const;

        EngineSettings settings_;
        ConfigSet configs_;
};

}

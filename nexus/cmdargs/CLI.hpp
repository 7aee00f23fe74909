#pragma once
#include "nexus/cmdargs/CmdArgs.hpp"
#include <boost/program_options/options_description.hpp>
#include <string>
#include <vector>

namespace boost { namespace program_options { class variables_map; } }
namespace nexus { struct EngineSettings; }

namespace nexus { namespace cmdargs {

/** CmdArgs subclass for the nexus-cli command-line arguments.  Analysis settings are stored in the
 * EngineSettings object given to the constructor; input file names and output options are stored
 * in the public members.
 *
 * Single-letter options used in this class:
 *     a c f i j p P r t T V
 * Used in CmdArgs base class:
 *     h
 */
class CLI : public CmdArgs {
    public:
        /// Constructor for cli arguments; takes the settings object to populate
        CLI(EngineSettings &s);

        /// The transactions CSV file
        std::string transactions;

        /// The jurisdiction configuration CSV file
        std::string jurisdictions;

        /// The interest and penalty configuration CSV file; empty if not given
        std::string interest;

        /// The interest rate period CSV file; empty if not given
        std::string rate_periods;

        /// The penalty rule CSV file; empty if not given
        std::string penalties;

        /// Whether to write CSV instead of tables
        bool csv = false;

        /// Overridden to add " -- command-line nexus calculator"
        virtual std::string versionSuffix() const override;

        /// Overridden to describe the required arguments
        virtual std::string usage() const override;

    protected:
        /// Adds CLI command-line options into the option descriptions
        virtual void addOptions() override;

        /// Overridden to parse date, fiscal year end and physical nexus values into the settings
        virtual void postParse(boost::program_options::variables_map &vars) override;

        /// The settings reference in which to store given values
        EngineSettings &s_;

    private:
        std::string as_of_, vda_filing_date_, vda_jurisdictions_, fiscal_year_end_;
        std::vector<std::string> physical_nexus_;
};

}}

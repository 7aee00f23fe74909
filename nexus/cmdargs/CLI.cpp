#include "nexus/cmdargs/CLI.hpp"
#include "nexus/EngineSettings.hpp"
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <stdexcept>

namespace nexus { namespace cmdargs {

namespace po = boost::program_options;

CLI::CLI(EngineSettings &s) : s_(s) {}

void CLI::addOptions() {
    CmdArgs::addOptions();

    po::options_description input("Input files"), analysis("Analysis"), vda("Voluntary disclosure"), output("Output");

    input.add_options()
        ("transactions,t", po::value(&transactions)->required()->value_name("FILE"), "CSV file of transactions: id,date,jurisdiction,amount[,channel]")
        ("jurisdictions,j", po::value(&jurisdictions)->required()->value_name("FILE"), "CSV file of jurisdiction thresholds, lookback rules and tax rates")
        ("interest,i", po::value(&interest)->value_name("FILE"), "CSV file of interest and penalty rules.  Jurisdictions without an entry use 3% simple interest and a 10% penalty.")
        ("rate-periods,r", po::value(&rate_periods)->value_name("FILE"), "CSV file of historical interest rate periods: jurisdiction,start,end,annual_rate[,monthly_rate]")
        ("penalties,P", po::value(&penalties)->value_name("FILE"), "CSV file of penalty rules by jurisdiction and category.  A late_payment rule replaces the flat penalty of the interest file.")
        ;
    options_.add(input);

    analysis.add_options()
        ("as-of,a", po::value(&as_of_)->required()->value_name("YYYY-MM-DD"), "The date interest and penalties are calculated to")
        ("fiscal-year-end,f", po::value(&fiscal_year_end_)->value_name("MM-DD"), "The client's fiscal year end, used by `fiscal' lookback rules")
        ("physical-nexus,p", value(physical_nexus_), "Physical presence start dates, as CODE=YYYY-MM-DD; may be repeated")
        ("threads,T", max<256>(s_.threads), "The number of jurisdictions to evaluate in parallel; 0 evaluates them sequentially")
        ;
    options_.add(analysis);

    vda.add_options()
        ("vda,V", value(s_.vda), "Also compute the voluntary disclosure agreement alternative")
        ("vda-filing-date", po::value(&vda_filing_date_)->value_name("YYYY-MM-DD"), "The VDA filing date; defaults to the --as-of date")
        ("vda-jurisdictions", po::value(&vda_jurisdictions_)->value_name("CODE,..."), "Jurisdictions to compute the VDA alternative for; default is all")
        ;
    options_.add(vda);

    output.add_options()
        ("csv,c", value(csv), "Write per-year results as CSV instead of tables")
        ;
    options_.add(output);
}

void CLI::postParse(boost::program_options::variables_map &vars) {
    CmdArgs::postParse(vars);

    try {
        s_.calculation_date = parse_date(as_of_);
        if (not vda_filing_date_.empty()) s_.vda_filing_date = parse_date(vda_filing_date_);
        if (not fiscal_year_end_.empty()) s_.fiscal_year_end = MonthDay::parse(fiscal_year_end_);
    }
    catch (const std::invalid_argument &e) {
        throw po::error(e.what());
    }

    for (const auto &code : split_list(vda_jurisdictions_)) s_.vda_jurisdictions.insert(code);
    if (not s_.vda_jurisdictions.empty()) s_.vda = true;

    for (const auto &pn : physical_nexus_) {
        auto eq = pn.find('=');
        if (eq == std::string::npos or eq == 0)
            throw po::invalid_option_value(pn);
        try {
            s_.physical_nexus[pn.substr(0, eq)] = parse_date(pn.substr(eq + 1));
        }
        catch (const std::invalid_argument &e) {
            throw po::error("--physical-nexus " + pn + ": " + e.what());
        }
    }
}

std::string CLI::versionSuffix() const {
    return " -- command-line nexus calculator";
}

std::string CLI::usage() const {
    std::string name = prog_name_;
    if (name.empty()) name = "nexus-cli";
    return "Usage: " + name + " -t TRANSACTIONS.csv -j JURISDICTIONS.csv -a YYYY-MM-DD [ARGS]";
}

}}

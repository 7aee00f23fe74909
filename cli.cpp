#include "nexus/Engine.hpp"
#include "nexus/EngineSettings.hpp"
#include "nexus/cmdargs/CLI.hpp"
#include "nexus/data/InputReader.hpp"
#include "nexus/data/ResultWriter.hpp"
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace nexus;

namespace fs = boost::filesystem;

// Reads an input file with the given reader, exiting with an error message if it fails.
template <typename F>
auto read_input(const std::string &what, const std::string &filename, F reader) -> decltype(reader(filename)) {
    if (not fs::is_regular_file(fs::path(filename))) {
        std::cerr << "Error: " << what << " file `" << filename << "' does not exist or is not a regular file\n";
        exit(1);
    }
    try {
        return reader(filename);
    }
    catch (std::exception &e) {
        std::cerr << "Unable to read " << what << " from `" << filename << "': " << e.what() << "\n";
        exit(1);
    }
}

int main(int argc, char *argv[]) {
    EngineSettings settings;
    cmdargs::CLI args(settings);
    try {
        args.parse(argc, argv);
    }
    catch (std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n\n" << args.usage() << "\nRun with --help for details.\n";
        exit(2);
    }

    auto transactions = read_input("transactions", args.transactions, data::read_transactions);

    ConfigSet configs;
    configs.jurisdictions = read_input("jurisdiction configuration", args.jurisdictions, data::read_jurisdictions);
    if (not args.interest.empty())
        configs.interest = read_input("interest configuration", args.interest, data::read_interest);
    if (not args.rate_periods.empty()) {
        read_input("interest rate periods", args.rate_periods,
                [&configs](const std::string &f) { data::read_rate_periods(f, configs.interest); return true; });
    }
    if (not args.penalties.empty()) {
        read_input("penalty rules", args.penalties,
                [&configs](const std::string &f) { data::read_penalty_rules(f, configs.interest); return true; });
    }

    Engine engine(settings, configs);
    std::map<std::string, JurisdictionResult> results;
    try {
        results = engine.run(transactions);
    }
    catch (std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit(1);
    }

    if (args.csv) {
        data::write_years_csv(std::cout, results);
        if (settings.vda) {
            std::cout << "\n";
            data::write_vda_csv(std::cout, results);
        }
    }
    else {
        std::cout << transactions.size() << " transactions in " << results.size() << " jurisdictions, as of "
            << date_str(settings.calculation_date) << "\n";
        data::print_results(std::cout, results);
        if (settings.vda) data::print_vda_summary(std::cout, Engine::vdaSummary(results));
    }

    bool any_failed = false;
    for (const auto &r : results) {
        if (r.second.confidence == Confidence::failed) {
            std::cerr << "Warning: evaluation of " << r.first << " failed\n";
            any_failed = true;
        }
    }

    return any_failed ? 3 : 0;
}

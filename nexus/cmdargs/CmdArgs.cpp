#include "nexus/cmdargs/CmdArgs.hpp"
#include "nexus/config.hpp"
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/errors.hpp>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace po = boost::program_options;

namespace nexus { namespace cmdargs {

void CmdArgs::addOptions() {
    po::options_description help("About");

    help.add_options()
        ("help,h", "Displays usage information.")
        ("version", "Displays version information.")
        ;

    options_.add(help);
}

void CmdArgs::postParse(boost::program_options::variables_map&) {}

void CmdArgs::parse(int argc, char const* const* argv) {
    if (options_.options().empty()) addOptions();

    prog_name_ = argv[0];

    po::variables_map vars;
    store(po::command_line_parser(argc, argv).options(options_).run(), vars);

    // Check for --help/--version before notify(), which would complain about missing required
    // options.
    if (vars.count("help") > 0) {
        std::cout << version() << "\n\n" << help();
        std::exit(0);
    }
    else if (vars.count("version") > 0) {
        std::cout << version() << "\n\n";
        std::exit(0);
    }

    notify(vars);

    postParse(vars);
}

std::string CmdArgs::version() const {
    std::ostringstream version;
    version << "nexus v" << VERSION[0] << "." << VERSION[1] << "." << VERSION[2] << versionSuffix();
    return version.str();
}

std::string CmdArgs::versionSuffix() const {
    return "";
}

std::string CmdArgs::usage() const {
    std::string name = prog_name_;
    if (name.empty()) name = "nexus";
    return "Usage: " + name + " [ARGS]";
}

std::string CmdArgs::help() const {
    std::ostringstream help;
    help << usage() << "\n";
    if (not options_.options().empty())
        help << "Supported arguments:\n" << options_ << "\n";
    return help.str();
}

}}

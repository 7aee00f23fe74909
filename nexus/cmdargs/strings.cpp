#include "nexus/cmdargs/strings.hpp"
#include <regex>
#include <sstream>
#include <string>

namespace nexus { namespace cmdargs {

std::vector<std::string> split_list(const std::string &list, char sep) {
    std::vector<std::string> results;
    std::stringstream ss(list);
    std::string val;
    while (std::getline(ss, val, sep)) {
        val = std::regex_replace(val, std::regex("^\\s+|\\s+$"), "");
        if (not val.empty()) results.push_back(val);
    }
    return results;
}

}}

#include "nexus/Rate.hpp"
#include <regex>
#include <stdexcept>

namespace nexus {

Rate Rate::parse(const std::string &value) {
    static const std::regex number("-?\\d+(\\.\\d+)?");
    if (not std::regex_match(value, number))
        throw std::invalid_argument("Invalid rate `" + value + "'");
    return Rate(Decimal(value));
}

}

#include "nexus/JurisdictionConfig.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nexus {

ThresholdOperator parse_threshold_operator(const std::string &value) {
    std::string lc(value);
    std::transform(lc.begin(), lc.end(), lc.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lc == "or" or lc == "any") return ThresholdOperator::any;
    if (lc == "and" or lc == "all") return ThresholdOperator::all;
    throw std::invalid_argument("Invalid threshold operator `" + value + "': expected `and' or `or'");
}

std::string threshold_operator_name(ThresholdOperator op) {
    return op == ThresholdOperator::all ? "and" : "or";
}

void JurisdictionConfig::check() const {
#define PROHIBIT(CONDITION) \
    if (CONDITION) throw std::domain_error("Invalid jurisdiction configuration for " + code + ": " #CONDITION)
    PROHIBIT(threshold_amount and *threshold_amount < Money());
    PROHIBIT(tax_rate.negative());
#undef PROHIBIT
    try {
        check_lookback(lookback);
    }
    catch (const std::domain_error &e) {
        throw std::domain_error(code + ": " + e.what());
    }
}

}

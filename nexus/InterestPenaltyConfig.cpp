#include "nexus/InterestPenaltyConfig.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nexus {

namespace {
// Lower-cases and converts '-' to '_'
std::string normalize(const std::string &value) {
    std::string n(value);
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return c == '-' ? '_' : std::tolower(c); });
    return n;
}
}

InterestMethod parse_interest_method(const std::string &value) {
    std::string n = normalize(value);
    if (n == "simple") return InterestMethod::simple;
    if (n == "compound_monthly") return InterestMethod::compound_monthly;
    if (n == "compound_daily") return InterestMethod::compound_daily;
    throw std::invalid_argument("Invalid interest method `" + value + "'");
}

std::string interest_method_name(InterestMethod m) {
    switch (m) {
        case InterestMethod::compound_monthly: return "compound_monthly";
        case InterestMethod::compound_daily: return "compound_daily";
        case InterestMethod::simple: break;
    }
    return "simple";
}

PenaltyBase parse_penalty_base(const std::string &value) {
    std::string n = normalize(value);
    if (n == "tax_only" or n == "tax") return PenaltyBase::tax_only;
    if (n == "tax_plus_interest") return PenaltyBase::tax_plus_interest;
    throw std::invalid_argument("Invalid penalty base `" + value + "'");
}

void InterestPenaltyConfig::check(const std::string &code) const {
#define PROHIBIT(CONDITION) \
    if (CONDITION) throw std::domain_error("Invalid interest configuration for " + code + ": " #CONDITION)
    PROHIBIT(annual_interest_rate.negative());
    PROHIBIT(interest_minimum and *interest_minimum < Money());
    PROHIBIT(penalty_rate.negative());
    PROHIBIT(penalty_min and *penalty_min < Money());
    PROHIBIT(penalty_max and *penalty_max < Money());
    PROHIBIT(penalty_min and penalty_max and *penalty_min > *penalty_max);
    for (const auto &p : rate_periods) {
        PROHIBIT(p.end < p.start);
        PROHIBIT(p.annual_rate.negative());
    }
    if (combined_penalty_cap) {
        PROHIBIT(combined_penalty_cap->max_rate.negative());
        PROHIBIT(combined_penalty_cap->applies_to.empty());
    }
#undef PROHIBIT

    for (const auto &r : penalty_rules) {
        try {
            check_penalty_rule(r.second);
        }
        catch (const std::domain_error &e) {
            throw std::domain_error("Invalid interest configuration for " + code + ": " + penalty_category_name(r.first) + ": " + e.what());
        }
    }
}

std::map<PenaltyCategory, PenaltyRule> InterestPenaltyConfig::penaltyRules() const {
    std::map<PenaltyCategory, PenaltyRule> rules(penalty_rules);
    if (not rules.count(PenaltyCategory::late_payment) and not penalty_rate.zero()) {
        penalty::Flat flat;
        flat.rate = penalty_rate;
        flat.minimum = penalty_min;
        flat.maximum = penalty_max;
        rules.emplace(PenaltyCategory::late_payment, flat);
    }
    return rules;
}

}

#include "nexus/LookbackPolicy.hpp"
#include <boost/variant/static_visitor.hpp>
#include <boost/variant/apply_visitor.hpp>
#include <regex>
#include <stdexcept>

namespace nexus {

using namespace lookback;

LookbackPolicy parse_lookback(const std::string &value) {
    static const std::regex rolling("rolling:(\\d+)"), quarters("quarters:(\\d+)"),
        fixed("fixed:(\\d{1,2}-\\d{1,2})"), fiscal("fiscal(?::(\\d{1,2}-\\d{1,2}))?");
    std::smatch m;

    if (value == "previous-calendar-year") return PreviousCalendarYear();
    if (value == "current-or-previous-calendar-year") return CurrentOrPreviousCalendarYear();
    if (std::regex_match(value, m, rolling)) {
        RollingWindow r;
        r.days = std::stoul(m[1]);
        return r;
    }
    if (std::regex_match(value, m, quarters)) {
        QuarterWindow q;
        q.quarters = std::stoul(m[1]);
        return q;
    }
    if (std::regex_match(value, m, fixed)) {
        FixedAnnualWindow f;
        f.period_end = MonthDay::parse(m[1]);
        return f;
    }
    if (std::regex_match(value, m, fiscal)) {
        FixedAnnualWindow f;
        if (m[1].matched) f.period_end = MonthDay::parse(m[1]);
        f.client_fiscal_year = true;
        return f;
    }
    throw std::invalid_argument("Invalid lookback policy `" + value + "'");
}

namespace {
class Describe : public boost::static_visitor<std::string> {
    public:
        std::string operator()(const PreviousCalendarYear&) const { return "previous-calendar-year"; }
        std::string operator()(const CurrentOrPreviousCalendarYear&) const { return "current-or-previous-calendar-year"; }
        std::string operator()(const RollingWindow &r) const { return "rolling:" + std::to_string(r.days); }
        std::string operator()(const QuarterWindow &q) const { return "quarters:" + std::to_string(q.quarters); }
        std::string operator()(const FixedAnnualWindow &f) const {
            return f.client_fiscal_year ? "fiscal:" + f.period_end.str() : "fixed:" + f.period_end.str();
        }
};

class Check : public boost::static_visitor<void> {
    public:
        void operator()(const RollingWindow &r) const {
            if (r.days == 0) throw std::domain_error("rolling lookback window must cover at least one day");
        }
        void operator()(const QuarterWindow &q) const {
            if (q.quarters == 0) throw std::domain_error("quarter lookback window must cover at least one quarter");
        }
        void operator()(const FixedAnnualWindow &f) const {
            if (not f.period_end.valid()) throw std::domain_error("fixed lookback window has an invalid period end " + f.period_end.str());
        }
        template <typename Calendar> void operator()(const Calendar&) const {}
};
}

std::string lookback_str(const LookbackPolicy &policy) {
    return boost::apply_visitor(Describe(), policy);
}

void check_lookback(const LookbackPolicy &policy) {
    boost::apply_visitor(Check(), policy);
}

}

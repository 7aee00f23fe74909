#include "nexus/Date.hpp"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <cstdio>
#include <regex>
#include <stdexcept>

namespace nexus {

namespace greg = boost::gregorian;

bool MonthDay::valid() const {
    if (month < 1 or month > 12 or day < 1) return false;
    return day <= greg::gregorian_calendar::end_of_month_day(2000, month);
}

Date MonthDay::in(int year) const {
    unsigned short last = greg::gregorian_calendar::end_of_month_day(year, month);
    return Date(year, month, day > last ? last : day);
}

std::string MonthDay::str() const {
    char buf[8];
    std::snprintf(buf, sizeof buf, "%02u-%02u", month % 100, day % 100);
    return buf;
}

MonthDay MonthDay::parse(const std::string &value) {
    static const std::regex md("(\\d{1,2})-(\\d{1,2})");
    std::smatch m;
    if (not std::regex_match(value, m, md))
        throw std::invalid_argument("Invalid month-day `" + value + "': expected MM-DD");
    MonthDay result;
    result.month = std::stoul(m[1]);
    result.day = std::stoul(m[2]);
    if (not result.valid())
        throw std::invalid_argument("Invalid month-day `" + value + "': no such date");
    return result;
}

Date parse_date(const std::string &value) {
    static const std::regex iso("(\\d{4})-(\\d{2})-(\\d{2})");
    std::smatch m;
    std::string head = value.substr(0, 10);
    if (not std::regex_match(head, m, iso))
        throw std::invalid_argument("Invalid date `" + value + "': expected YYYY-MM-DD");
    try {
        return Date(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]));
    }
    catch (const std::out_of_range &e) {
        throw std::invalid_argument("Invalid date `" + value + "': " + e.what());
    }
}

std::string date_str(const Date &d) {
    return greg::to_iso_extended_string(d);
}

Date year_start(int year) {
    return Date(year, 1, 1);
}

Date first_of_next_month(const Date &d) {
    return d.end_of_month() + greg::days(1);
}

Date subtract_months(const Date &d, unsigned int months) {
    int total = int(d.year()) * 12 + int(d.month()) - 1 - int(months);
    int year = total / 12, month = total % 12 + 1;
    unsigned short last = greg::gregorian_calendar::end_of_month_day(year, month);
    unsigned short day = d.day();
    return Date(year, month, day > last ? last : day);
}

long days_between(const Date &from, const Date &to) {
    return (to - from).days();
}

int quarter_index(const Date &d) {
    return int(d.year()) * 4 + (int(d.month()) - 1) / 3;
}

Date quarter_start(int index) {
    return Date(index / 4, (index % 4) * 3 + 1, 1);
}

Date fiscal_period_start(const Date &d, const MonthDay &period_end) {
    Date end = period_end.in(d.year());
    if (end < d) return end + greg::days(1);
    return period_end.in(int(d.year()) - 1) + greg::days(1);
}

}

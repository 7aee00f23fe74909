#include "nexus/Money.hpp"
#include <regex>
#include <sstream>
#include <stdexcept>

namespace nexus {

namespace mp = boost::multiprecision;

namespace {
// Returns value * 10^places rounded half away from zero to an integer.
Decimal scaled_half_up(const Decimal &value, unsigned places) {
    Decimal scaled = value * mp::pow(Decimal(10), places);
    return scaled < 0
        ? -mp::floor(-scaled + Decimal("0.5"))
        : mp::floor(scaled + Decimal("0.5"));
}
}

Decimal round_half_up(const Decimal &value, unsigned places) {
    return scaled_half_up(value, places) / mp::pow(Decimal(10), places);
}

std::string decimal_str(const Decimal &value, unsigned places) {
    long long units = scaled_half_up(value, places).convert_to<long long>();
    bool negative = units < 0;
    unsigned long long mag = negative ? -static_cast<unsigned long long>(units) : units;

    std::string digits = std::to_string(mag);
    if (digits.size() <= places) digits.insert(0, places + 1 - digits.size(), '0');

    std::string out = digits.substr(0, digits.size() - places);
    if (places > 0) {
        std::string frac = digits.substr(digits.size() - places);
        frac.erase(frac.find_last_not_of('0') + 1);
        if (not frac.empty()) out += "." + frac;
    }
    if (negative and out != "0") out.insert(0, 1, '-');
    return out;
}

Money Money::round(const Decimal &amount) {
    return Money(scaled_half_up(amount, 2).convert_to<int64_t>());
}

Money Money::parse(const std::string &amount) {
    static const std::regex number("\\s*-?\\d+(\\.\\d+)?\\s*");
    if (not std::regex_match(amount, number))
        throw std::invalid_argument("Invalid monetary amount `" + amount + "'");
    std::string trimmed = std::regex_replace(amount, std::regex("\\s+"), "");
    return round(Decimal(trimmed));
}

Decimal Money::decimal() const {
    return Decimal(cents_) / 100;
}

std::string Money::str() const {
    std::ostringstream out;
    uint64_t mag = cents_ < 0 ? -static_cast<uint64_t>(cents_) : cents_;
    if (cents_ < 0) out << '-';
    out << mag / 100 << '.';
    unsigned frac = mag % 100;
    if (frac < 10) out << '0';
    out << frac;
    return out.str();
}

std::ostream& operator<<(std::ostream &out, const Money &m) {
    return out << m.str();
}

}

#define BOOST_TEST_MODULE money
#include "nexus/Money.hpp"
#include "nexus/Rate.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>

using namespace nexus;

BOOST_AUTO_TEST_SUITE(money)

BOOST_AUTO_TEST_CASE(round_half_away_from_zero) {
    BOOST_CHECK_EQUAL(Money::round(Decimal("0.625")), Money::fromCents(63));
    BOOST_CHECK_EQUAL(Money::round(Decimal("-0.625")), Money::fromCents(-63));
    BOOST_CHECK_EQUAL(Money::round(Decimal("0.624999")), Money::fromCents(62));
    BOOST_CHECK_EQUAL(Money::round(Decimal("0.635")), Money::fromCents(64));
    BOOST_CHECK_EQUAL(Money::round(Decimal("1999.995")), Money::fromCents(200000));
    BOOST_CHECK_EQUAL(Money::round(Decimal(0)), Money());
}

BOOST_AUTO_TEST_CASE(parse) {
    BOOST_CHECK_EQUAL(Money::parse("1234.56").cents(), 123456);
    BOOST_CHECK_EQUAL(Money::parse("-3").cents(), -300);
    BOOST_CHECK_EQUAL(Money::parse("0.005").cents(), 1);
    BOOST_CHECK_EQUAL(Money::parse(" 12.5 ").cents(), 1250);
    BOOST_CHECK_EQUAL(Money::parse("100000").cents(), 10000000);

    BOOST_CHECK_THROW(Money::parse("abc"), std::invalid_argument);
    BOOST_CHECK_THROW(Money::parse("1e5"), std::invalid_argument);
    BOOST_CHECK_THROW(Money::parse("1.2.3"), std::invalid_argument);
    BOOST_CHECK_THROW(Money::parse(""), std::invalid_argument);
    BOOST_CHECK_THROW(Money::parse("$5"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(format) {
    BOOST_CHECK_EQUAL(Money::fromCents(-1205).str(), "-12.05");
    BOOST_CHECK_EQUAL(Money::fromCents(5).str(), "0.05");
    BOOST_CHECK_EQUAL(Money::fromCents(-5).str(), "-0.05");
    BOOST_CHECK_EQUAL(Money().str(), "0.00");
    BOOST_CHECK_EQUAL(Money::fromCents(12345678).str(), "123456.78");
}

BOOST_AUTO_TEST_CASE(arithmetic) {
    Money a = Money::fromCents(1050), b = Money::fromCents(250);
    BOOST_CHECK_EQUAL(a + b, Money::fromCents(1300));
    BOOST_CHECK_EQUAL(a - b, Money::fromCents(800));
    BOOST_CHECK_EQUAL(-a, Money::fromCents(-1050));
    a += b;
    BOOST_CHECK_EQUAL(a, Money::fromCents(1300));
    a -= b;
    a -= b;
    BOOST_CHECK_EQUAL(a, Money::fromCents(800));
    BOOST_CHECK(b < a);
    BOOST_CHECK(Money().zero());
    BOOST_CHECK(a.decimal() == Decimal("8"));
}

BOOST_AUTO_TEST_CASE(decimal_strings) {
    BOOST_CHECK_EQUAL(decimal_str(Decimal("0.0625"), 6), "0.0625");
    BOOST_CHECK_EQUAL(decimal_str(Decimal("0.03"), 6), "0.03");
    BOOST_CHECK_EQUAL(decimal_str(Decimal(12), 2), "12");
    BOOST_CHECK_EQUAL(decimal_str(Decimal("-0.5"), 2), "-0.5");
    BOOST_CHECK_EQUAL(decimal_str(Decimal("12.345"), 2), "12.35");
    BOOST_CHECK_EQUAL(decimal_str(Decimal("-0.001"), 2), "0");
}

BOOST_AUTO_TEST_CASE(tax_rate_application) {
    Rate r(Decimal("0.0625"));
    // 10.00 × 6.25% = 0.625, which rounds up (a banker's rounding would give 0.62)
    BOOST_CHECK_EQUAL(Money::round(Money::fromCents(1000) * r), Money::fromCents(63));
    BOOST_CHECK_EQUAL(Money::round(Money::fromCents(1001) * r), Money::fromCents(63));
    BOOST_CHECK_EQUAL(Money::round(Money::parse("120000") * Rate(Decimal("0.05"))), Money::parse("6000"));
}

BOOST_AUTO_TEST_CASE(rate_parsing) {
    BOOST_CHECK(Rate::parse("0.0625").value() == Decimal("0.0625"));
    BOOST_CHECK(Rate::parse("0").zero());
    BOOST_CHECK(Rate::parse("-0.01").negative());
    BOOST_CHECK_THROW(Rate::parse("6%"), std::invalid_argument);
    BOOST_CHECK_THROW(Rate::parse(""), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(periodic_rate_conversions) {
    AnnualRate annual(Decimal("0.18"));
    BOOST_CHECK(round_half_up(monthly(annual).value(), 12) == Decimal("0.015"));
    BOOST_CHECK(round_half_up(daily(AnnualRate(Decimal("0.0365"))).value(), 12) == Decimal("0.0001"));
    BOOST_CHECK(annualize(MonthlyRate(Decimal("0.01"))).value() == Decimal("0.12"));
    BOOST_CHECK(round_half_up(annualize(monthly(annual)).value(), 12) == annual.value());
}

BOOST_AUTO_TEST_SUITE_END()

#define BOOST_TEST_MODULE interest
#include "nexus/InterestCalculator.hpp"
#include "nexus/InterestPenaltyConfig.hpp"
#include "common.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>

using namespace nexus;

namespace {

InterestPenaltyConfig config(InterestMethod method = InterestMethod::simple, const char *annual = "0.03") {
    InterestPenaltyConfig c;
    c.interest_method = method;
    c.annual_interest_rate = AnnualRate(Decimal(annual));
    return c;
}

RatePeriod rate_period(const char *start, const char *end, const char *rate) {
    RatePeriod p;
    p.start = D(start);
    p.end = D(end);
    p.annual_rate = AnnualRate(Decimal(rate));
    return p;
}

}

BOOST_AUTO_TEST_SUITE(interest)

BOOST_AUTO_TEST_CASE(simple_interest) {
    Decimal i = InterestCalculator::simpleInterest(10000, AnnualRate(Decimal("0.03")), 730);
    BOOST_CHECK_EQUAL(Money::round(i), M("599.59"));

    auto c = config();
    InterestCalculator calc(c);
    BOOST_CHECK_EQUAL(Money::round(calc.interest(10000, c.annual_interest_rate, 730)), M("599.59"));
    BOOST_CHECK(calc.interest(10000, c.annual_interest_rate, 0) == 0);
    BOOST_CHECK(calc.interest(10000, c.annual_interest_rate, -5) == 0);
}

BOOST_AUTO_TEST_CASE(compound_monthly) {
    auto c = config(InterestMethod::compound_monthly, "0.18");
    InterestCalculator calc(c);
    Decimal i = calc.interest(10000, c.annual_interest_rate, 730);
    BOOST_CHECK(i > 4290 and i < 4292);

    // Compounding always exceeds simple interest at the same rate over more than a month
    BOOST_CHECK(i > InterestCalculator::simpleInterest(10000, c.annual_interest_rate, 730));
}

BOOST_AUTO_TEST_CASE(compound_daily) {
    auto c = config(InterestMethod::compound_daily);
    InterestCalculator calc(c);
    Decimal i = calc.interest(10000, c.annual_interest_rate, 730);
    BOOST_CHECK(i > 617 and i < 620);

    // One day of daily compounding is one day's rate
    Decimal one_day = InterestCalculator::compoundDailyInterest(10000, daily(c.annual_interest_rate), 1);
    BOOST_CHECK_EQUAL(Money::round(one_day), M("0.82"));
}

BOOST_AUTO_TEST_CASE(rate_periods) {
    auto c = config();
    c.rate_periods.push_back(rate_period("2020-01-01", "2021-01-01", "0.03"));
    c.rate_periods.push_back(rate_period("2021-01-01", "2022-01-01", "0.06"));
    InterestCalculator calc(c);

    // 184 days at 3% and 181 days at 6%
    BOOST_CHECK_EQUAL(Money::round(calc.accruedInterest(10000, D("2020-07-01"), D("2021-07-01"))), M("448.46"));
    // Days outside every period accrue nothing
    BOOST_CHECK(calc.accruedInterest(10000, D("2019-07-01"), D("2020-01-01")) == 0);

    BOOST_CHECK(calc.effectiveRate(D("2021-03-01")).value() == Decimal("0.06"));
    BOOST_CHECK(calc.effectiveRate(D("2020-03-01")).value() == Decimal("0.03"));
    BOOST_CHECK(calc.effectiveRate(D("2025-01-01")).value() == Decimal("0.03"));

    auto flat = config(InterestMethod::simple, "0.05");
    BOOST_CHECK(InterestCalculator(flat).effectiveRate(D("2025-01-01")).value() == Decimal("0.05"));
}

BOOST_AUTO_TEST_CASE(penalty_floor_and_cap) {
    auto c = config();
    c.penalty_min = M("100");
    InterestCalculator calc(c);
    BOOST_CHECK_EQUAL(calc.penalties(M("500"), 30).at(PenaltyCategory::late_payment), M("100"));
    BOOST_CHECK_EQUAL(calc.penalties(M("5000"), 30).at(PenaltyCategory::late_payment), M("500"));

    c.penalty_min = boost::none;
    c.penalty_max = M("5000");
    BOOST_CHECK_EQUAL(calc.penalties(M("100000"), 30).at(PenaltyCategory::late_payment), M("5000"));
    BOOST_CHECK_EQUAL(calc.penalties(M("1234.56"), 30).at(PenaltyCategory::late_payment), M("123.46"));

    c.penalty_rate = Rate();
    c.penalty_min = M("100");
    BOOST_CHECK(calc.penalties(M("500"), 30).empty());
}

BOOST_AUTO_TEST_CASE(accrual) {
    auto c = config();
    InterestCalculator calc(c);

    Accrual a = calc.accrue(M("1000"), D("2020-01-01"), D("2021-12-31"));
    BOOST_CHECK_EQUAL(a.days, 730);
    BOOST_CHECK_EQUAL(a.interest, M("59.96"));
    BOOST_CHECK_EQUAL(a.penalties, M("100"));

    c.penalty_base = PenaltyBase::tax_plus_interest;
    a = calc.accrue(M("1000"), D("2020-01-01"), D("2021-12-31"));
    BOOST_CHECK_EQUAL(a.penalties, M("106"));

    // No tax, no charges
    a = calc.accrue(Money(), D("2020-01-01"), D("2021-12-31"));
    BOOST_CHECK(a.interest.zero());
    BOOST_CHECK(a.penalties.zero());

    // Same-day or future obligations accrue nothing
    a = calc.accrue(M("1000"), D("2021-12-31"), D("2021-12-31"));
    BOOST_CHECK_EQUAL(a.days, 0);
    BOOST_CHECK(a.interest.zero());
    BOOST_CHECK(a.penalties.zero());
    a = calc.accrue(M("1000"), D("2022-06-01"), D("2021-12-31"));
    BOOST_CHECK_EQUAL(a.days, 0);
    BOOST_CHECK(a.penalties.zero());
}

BOOST_AUTO_TEST_CASE(voluntary_disclosure) {
    auto c = config();
    c.penalty_base = PenaltyBase::tax_plus_interest;
    InterestCalculator calc(c);

    BOOST_CHECK_EQUAL(calc.vdaEffectiveStart(D("2018-02-01"), D("2024-01-01")), D("2020-01-01"));
    BOOST_CHECK_EQUAL(calc.vdaEffectiveStart(D("2022-03-01"), D("2024-01-01")), D("2022-03-01"));
    c.vda_lookback_months = 36;
    BOOST_CHECK_EQUAL(calc.vdaEffectiveStart(D("2018-02-01"), D("2024-01-01")), D("2021-01-01"));

    // Without waivers the VDA accrual is the standard accrual
    Accrual standard = calc.accrue(M("1000"), D("2020-01-01"), D("2021-12-31"));
    Accrual vda = calc.accrueVda(M("1000"), D("2020-01-01"), D("2021-12-31"));
    BOOST_CHECK_EQUAL(vda.interest, standard.interest);
    BOOST_CHECK_EQUAL(vda.penalties, standard.penalties);

    c.vda_interest_waived = true;
    vda = calc.accrueVda(M("1000"), D("2020-01-01"), D("2021-12-31"));
    BOOST_CHECK(vda.interest.zero());
    BOOST_CHECK_EQUAL(vda.penalties, M("100"));

    c.vda_penalties_waived = true;
    vda = calc.accrueVda(M("1000"), D("2020-01-01"), D("2021-12-31"));
    BOOST_CHECK(vda.interest.zero());
    BOOST_CHECK(vda.penalties.zero());
    BOOST_CHECK_EQUAL(vda.days, 730);
}

BOOST_AUTO_TEST_CASE(configuration) {
    BOOST_CHECK(parse_interest_method("compound-daily") == InterestMethod::compound_daily);
    BOOST_CHECK(parse_interest_method("Simple") == InterestMethod::simple);
    BOOST_CHECK_THROW(parse_interest_method("continuous"), std::invalid_argument);
    BOOST_CHECK_EQUAL(interest_method_name(InterestMethod::compound_monthly), "compound_monthly");
    BOOST_CHECK(parse_penalty_base("tax") == PenaltyBase::tax_only);
    BOOST_CHECK(parse_penalty_base("tax-plus-interest") == PenaltyBase::tax_plus_interest);
    BOOST_CHECK_THROW(parse_penalty_base("interest"), std::invalid_argument);

    InterestPenaltyConfig c;
    BOOST_CHECK_NO_THROW(c.check("XX"));
    c.penalty_min = M("500");
    c.penalty_max = M("100");
    BOOST_CHECK_THROW(c.check("XX"), std::domain_error);
    c.penalty_max = boost::none;
    c.rate_periods.push_back(rate_period("2021-01-01", "2020-01-01", "0.03"));
    BOOST_CHECK_THROW(c.check("XX"), std::domain_error);
    c.rate_periods.clear();
    c.annual_interest_rate = AnnualRate(Decimal("-0.01"));
    BOOST_CHECK_THROW(c.check("XX"), std::domain_error);
}

BOOST_AUTO_TEST_SUITE_END()

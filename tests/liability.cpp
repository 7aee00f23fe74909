#define BOOST_TEST_MODULE liability
#include "nexus/JurisdictionConfig.hpp"
#include "nexus/LiabilityCalculator.hpp"
#include "common.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <vector>

using namespace nexus;

BOOST_AUTO_TEST_SUITE(liability)

BOOST_AUTO_TEST_CASE(marketplace_law_date) {
    JurisdictionConfig c;
    c.code = "XX";
    c.tax_rate = Rate::parse("0.0625");
    c.marketplace_law_date = D("2021-07-01");

    std::vector<TransactionRecord> year{
        txn("before-obligation", "2021-02-01", "1000"),
        txn("marketplace-before-law", "2021-04-01", "2000", Channel::marketplace),
        txn("marketplace-after-law", "2021-08-01", "3000", Channel::marketplace),
        txn("direct", "2021-09-01", "4000")};

    LiabilityCalculator calc(c);
    Date obligation = D("2021-03-01");
    BOOST_CHECK(not calc.taxable(year[0], obligation));
    BOOST_CHECK(calc.taxable(year[1], obligation));
    BOOST_CHECK(not calc.taxable(year[2], obligation));
    BOOST_CHECK(calc.taxable(year[3], obligation));

    YearLiability l = calc.calculate(year.cbegin(), year.cend(), obligation);
    BOOST_CHECK_EQUAL(l.total_sales, M("10000"));
    BOOST_CHECK_EQUAL(l.direct_sales, M("5000"));
    BOOST_CHECK_EQUAL(l.marketplace_sales, M("5000"));
    BOOST_CHECK_EQUAL(l.transaction_count, 4u);
    BOOST_CHECK_EQUAL(l.taxable_sales, M("6000"));
    BOOST_CHECK_EQUAL(l.base_tax, M("375"));

    // Without a law date every marketplace sale after the obligation start is the seller's
    c.marketplace_law_date = boost::none;
    l = calc.calculate(year.cbegin(), year.cend(), obligation);
    BOOST_CHECK_EQUAL(l.taxable_sales, M("9000"));
    BOOST_CHECK_EQUAL(l.base_tax, M("562.50"));
}

BOOST_AUTO_TEST_CASE(no_obligation) {
    JurisdictionConfig c;
    c.tax_rate = Rate::parse("0.07");
    std::vector<TransactionRecord> year{txn("a", "2021-02-01", "1000"), txn("b", "2021-03-01", "2000", Channel::marketplace)};
    YearLiability l = LiabilityCalculator(c).calculate(year.cbegin(), year.cend(), boost::none);
    BOOST_CHECK_EQUAL(l.total_sales, M("3000"));
    BOOST_CHECK_EQUAL(l.transaction_count, 2u);
    BOOST_CHECK(l.taxable_sales.zero());
    BOOST_CHECK(l.base_tax.zero());
}

BOOST_AUTO_TEST_CASE(base_tax_rounding) {
    JurisdictionConfig c;
    c.tax_rate = Rate::parse("0.0625");
    std::vector<TransactionRecord> year{txn("a", "2021-02-01", "10.10")};
    // 10.10 × 0.0625 = 0.63125
    YearLiability l = LiabilityCalculator(c).calculate(year.cbegin(), year.cend(), D("2021-01-01"));
    BOOST_CHECK_EQUAL(l.base_tax, M("0.63"));

    std::vector<TransactionRecord> half{txn("a", "2021-02-01", "10")};
    // 10 × 0.0625 = 0.625
    l = LiabilityCalculator(c).calculate(half.cbegin(), half.cend(), D("2021-01-01"));
    BOOST_CHECK_EQUAL(l.base_tax, M("0.63"));

    std::vector<TransactionRecord> none;
    l = LiabilityCalculator(c).calculate(none.cbegin(), none.cend(), D("2021-01-01"));
    BOOST_CHECK(l.base_tax.zero());
}

BOOST_AUTO_TEST_CASE(configuration_checks) {
    JurisdictionConfig c;
    c.code = "XX";
    BOOST_CHECK_NO_THROW(c.check());

    c.tax_rate = Rate::parse("-0.01");
    BOOST_CHECK_THROW(c.check(), std::domain_error);
    c.tax_rate = Rate();

    c.threshold_amount = M("-1");
    BOOST_CHECK_THROW(c.check(), std::domain_error);
    c.threshold_amount = boost::none;

    lookback::RollingWindow r;
    r.days = 0;
    c.lookback = r;
    BOOST_CHECK_THROW(c.check(), std::domain_error);

    BOOST_CHECK(parse_threshold_operator("AND") == ThresholdOperator::all);
    BOOST_CHECK(parse_threshold_operator("or") == ThresholdOperator::any);
    BOOST_CHECK_THROW(parse_threshold_operator("xor"), std::invalid_argument);
    BOOST_CHECK_EQUAL(threshold_operator_name(ThresholdOperator::all), "and");
}

BOOST_AUTO_TEST_SUITE_END()

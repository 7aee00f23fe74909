#define BOOST_TEST_MODULE lookback
#include "nexus/LookbackPolicy.hpp"
#include "nexus/LookbackWindow.hpp"
#include "common.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace nexus;

namespace {

// A deterministic, irregular history with same-day transactions, gaps, and every third
// transaction through a marketplace.
std::vector<TransactionRecord> irregular_history() {
    std::vector<TransactionRecord> h;
    Date d = D("2020-01-01");
    for (int i = 0; i < 300; i++) {
        d += boost::gregorian::days((i * 37) % 11);
        TransactionRecord t;
        t.id = "T" + std::to_string(i);
        t.date = d;
        t.jurisdiction = "XX";
        t.amount = Money::fromCents(100 + (i * 7919) % 500000);
        t.channel = i % 3 == 0 ? Channel::marketplace : Channel::direct;
        h.push_back(t);
    }
    return h;
}

// Recomputes window totals for candidate `i` by brute force.
WindowTotals brute_force(const LookbackWindow &w, size_t i) {
    const auto &h = w.history();
    WindowBounds b = w.bounds(h[i].date);
    WindowTotals totals;
    for (size_t j = 0; j <= i; j++) {
        if (h[j].date < b.from or (b.before and not (h[j].date < *b.before)) or not w.counts(h[j])) continue;
        totals.revenue += h[j].amount;
        totals.count++;
    }
    return totals;
}

void check_against_brute_force(const LookbackPolicy &policy) {
    auto h = irregular_history();
    LookbackWindow w(h, policy, false);
    LookbackWindow::Accumulator acc(w);
    for (size_t i = 0; i < h.size(); i++) {
        const WindowTotals &sliding = acc.advance(w.bounds(h[i].date), i);
        WindowTotals expected = brute_force(w, i);
        BOOST_REQUIRE_EQUAL(sliding.revenue, expected.revenue);
        BOOST_REQUIRE_EQUAL(sliding.count, expected.count);
    }
}

}

BOOST_AUTO_TEST_SUITE(lookback_window)

BOOST_AUTO_TEST_CASE(policy_spellings) {
    for (std::string s : {"previous-calendar-year", "current-or-previous-calendar-year", "rolling:365",
            "quarters:4", "fixed:09-30", "fiscal:06-30"}) {
        BOOST_CHECK_EQUAL(lookback_str(parse_lookback(s)), s);
    }
    BOOST_CHECK_EQUAL(lookback_str(parse_lookback("fiscal")), "fiscal:12-31");

    BOOST_CHECK_THROW(parse_lookback("rolling:"), std::invalid_argument);
    BOOST_CHECK_THROW(parse_lookback("weekly"), std::invalid_argument);
    BOOST_CHECK_THROW(parse_lookback("fixed:13-01"), std::invalid_argument);

    BOOST_CHECK_THROW(check_lookback(parse_lookback("rolling:0")), std::domain_error);
    BOOST_CHECK_THROW(check_lookback(parse_lookback("quarters:0")), std::domain_error);
    BOOST_CHECK_NO_THROW(check_lookback(parse_lookback("quarters:1")));
}

BOOST_AUTO_TEST_CASE(calendar_year_to_date) {
    std::vector<TransactionRecord> h{
        txn("a", "2020-11-01", "5000"),
        txn("b", "2021-01-05", "1000"),
        txn("c", "2021-03-01", "2000", Channel::marketplace),
        txn("d", "2021-07-01", "3000")};

    LookbackWindow w(h, lookback::CurrentOrPreviousCalendarYear());
    WindowTotals t = w.totalsAt(3);
    BOOST_CHECK_EQUAL(t.revenue, M("6000"));
    BOOST_CHECK_EQUAL(t.count, 3u);

    LookbackWindow direct_only(h, lookback::CurrentOrPreviousCalendarYear(), false);
    t = direct_only.totalsAt(3);
    BOOST_CHECK_EQUAL(t.revenue, M("4000"));
    BOOST_CHECK_EQUAL(t.count, 2u);

    auto passes = w.passes(2021);
    BOOST_REQUIRE_EQUAL(passes.size(), 2u);
    BOOST_CHECK_EQUAL(passes[0].year, 2021);
    BOOST_CHECK(not passes[0].prior_period);
    BOOST_CHECK_EQUAL(passes[1].year, 2020);
    BOOST_CHECK(passes[1].prior_period);

    LookbackWindow prev(h, lookback::PreviousCalendarYear());
    passes = prev.passes(2021);
    BOOST_REQUIRE_EQUAL(passes.size(), 1u);
    BOOST_CHECK_EQUAL(passes[0].year, 2020);
    BOOST_CHECK(passes[0].prior_period);

    BOOST_CHECK(w.yearRange(2021) == std::make_pair(size_t(1), size_t(4)));
    BOOST_CHECK(w.yearRange(2019) == std::make_pair(size_t(0), size_t(0)));
    BOOST_CHECK(w.yearRange(2022) == std::make_pair(size_t(4), size_t(4)));
    BOOST_CHECK(w.years() == std::vector<int>({2020, 2021}));
}

BOOST_AUTO_TEST_CASE(rolling_window_slides) {
    std::vector<TransactionRecord> h{
        txn("a", "2021-01-01", "60000"),
        txn("b", "2021-12-31", "30000"),
        txn("c", "2022-01-01", "20000"),
        txn("d", "2022-06-01", "60000")};
    lookback::RollingWindow r;
    r.days = 365;
    LookbackWindow w(h, r);

    BOOST_CHECK_EQUAL(w.bounds(D("2022-01-01")).from, D("2021-01-02"));
    BOOST_CHECK(not w.bounds(D("2022-01-01")).before);

    BOOST_CHECK_EQUAL(w.totalsAt(1).revenue, M("90000"));
    // a (2021-01-01) has left the window by 2022-01-01
    BOOST_CHECK_EQUAL(w.totalsAt(2).revenue, M("50000"));
    BOOST_CHECK_EQUAL(w.totalsAt(2).count, 2u);
    BOOST_CHECK_EQUAL(w.totalsAt(3).revenue, M("110000"));
    BOOST_CHECK_EQUAL(w.totalsAt(3).count, 3u);

    LookbackWindow::Accumulator acc(w);
    BOOST_CHECK_EQUAL(acc.advance(w.bounds(h[1].date), 1).revenue, M("90000"));
    BOOST_CHECK_EQUAL(acc.advance(w.bounds(h[2].date), 2).revenue, M("50000"));
    BOOST_CHECK_EQUAL(acc.advance(w.bounds(h[3].date), 3).revenue, M("110000"));
    BOOST_CHECK_THROW(acc.advance(w.bounds(h[0].date), 0), std::logic_error);
}

BOOST_AUTO_TEST_CASE(quarter_window_needs_history) {
    std::vector<TransactionRecord> h{
        txn("a", "2021-02-01", "50000"),
        txn("b", "2021-05-01", "30000"),
        txn("c", "2021-08-01", "30000"),
        txn("d", "2021-11-01", "1000"),
        txn("e", "2022-01-15", "1000")};
    lookback::QuarterWindow q;
    q.quarters = 4;
    LookbackWindow w(h, q);

    BOOST_CHECK(not w.bounds(D("2021-11-01")).testable);
    WindowBounds b = w.bounds(D("2022-01-15"));
    BOOST_CHECK(b.testable);
    BOOST_CHECK_EQUAL(b.from, D("2021-01-01"));
    BOOST_REQUIRE(b.before);
    BOOST_CHECK_EQUAL(*b.before, D("2022-01-01"));

    // The candidate's own quarter is not part of the window
    WindowTotals t = w.totalsAt(4);
    BOOST_CHECK_EQUAL(t.revenue, M("111000"));
    BOOST_CHECK_EQUAL(t.count, 4u);
}

BOOST_AUTO_TEST_CASE(fixed_annual_window) {
    std::vector<TransactionRecord> h{
        txn("a", "2021-09-30", "40000"),
        txn("b", "2021-10-15", "60000"),
        txn("c", "2022-03-01", "50000")};
    lookback::FixedAnnualWindow f;
    f.period_end = MonthDay::parse("09-30");
    LookbackWindow w(h, f);

    BOOST_CHECK_EQUAL(w.totalsAt(0).revenue, M("40000"));
    BOOST_CHECK_EQUAL(w.totalsAt(2).revenue, M("110000"));
    BOOST_CHECK_EQUAL(w.totalsAt(2).count, 2u);
}

BOOST_AUTO_TEST_CASE(sliding_matches_brute_force) {
    lookback::RollingWindow r;
    r.days = 30;
    check_against_brute_force(r);

    lookback::QuarterWindow q;
    q.quarters = 2;
    check_against_brute_force(q);

    lookback::FixedAnnualWindow f;
    f.period_end = MonthDay::parse("06-30");
    check_against_brute_force(f);

    check_against_brute_force(lookback::CurrentOrPreviousCalendarYear());
}

BOOST_AUTO_TEST_CASE(history_must_be_sorted) {
    std::vector<TransactionRecord> h{txn("a", "2021-02-01", "1"), txn("b", "2021-01-01", "1")};
    BOOST_CHECK_THROW(LookbackWindow(h, lookback::PreviousCalendarYear()), std::invalid_argument);

    std::vector<TransactionRecord> sorted{txn("a", "2021-01-01", "1"), txn("b", "2021-01-01", "1")};
    LookbackWindow w(sorted, lookback::PreviousCalendarYear());
    BOOST_CHECK_EQUAL(w.totalsAt(1).count, 2u);
    BOOST_CHECK_THROW(w.totalsAt(2), std::out_of_range);
}

BOOST_AUTO_TEST_SUITE_END()

#include "nexus/LookbackWindow.hpp"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>
#include <algorithm>
#include <stdexcept>

namespace nexus {

using namespace lookback;

namespace {

bool date_less(const TransactionRecord &t, const Date &d) { return t.date < d; }

class Passes : public boost::static_visitor<std::vector<MeasurementPass>> {
    public:
        explicit Passes(int year) : year_(year) {}
        std::vector<MeasurementPass> operator()(const PreviousCalendarYear&) const {
            return {{year_ - 1, true}};
        }
        std::vector<MeasurementPass> operator()(const CurrentOrPreviousCalendarYear&) const {
            return {{year_, false}, {year_ - 1, true}};
        }
        template <typename Window> std::vector<MeasurementPass> operator()(const Window&) const {
            return {{year_, false}};
        }
    private:
        int year_;
};

class Bounds : public boost::static_visitor<WindowBounds> {
    public:
        Bounds(const Date &date, const std::vector<TransactionRecord> &history) : date_(date), history_(history) {}

        WindowBounds operator()(const PreviousCalendarYear&) const { return yearToDate(); }
        WindowBounds operator()(const CurrentOrPreviousCalendarYear&) const { return yearToDate(); }

        WindowBounds operator()(const RollingWindow &r) const {
            WindowBounds b;
            b.from = date_ - boost::gregorian::days(long(r.days) - 1);
            return b;
        }

        WindowBounds operator()(const QuarterWindow &q) const {
            int current = quarter_index(date_), first = current - int(q.quarters);
            WindowBounds b;
            b.from = quarter_start(first);
            b.before = quarter_start(current);
            b.testable = not history_.empty() and quarter_index(history_.front().date) <= first;
            return b;
        }

        WindowBounds operator()(const FixedAnnualWindow &f) const {
            WindowBounds b;
            b.from = fiscal_period_start(date_, f.period_end);
            return b;
        }

    private:
        WindowBounds yearToDate() const {
            WindowBounds b;
            b.from = year_start(date_.year());
            return b;
        }
        const Date &date_;
        const std::vector<TransactionRecord> &history_;
};

}

LookbackWindow::LookbackWindow(const std::vector<TransactionRecord> &history, const LookbackPolicy &policy, bool marketplace_counts)
    : history_(history), policy_(policy), marketplace_counts_(marketplace_counts)
{
    for (size_t i = 1; i < history_.size(); i++) {
        if (history_[i].date < history_[i-1].date)
            throw std::invalid_argument("LookbackWindow: transaction history is not in chronological order (at `" + history_[i].id + "')");
    }
}

bool LookbackWindow::counts(const TransactionRecord &t) const {
    return marketplace_counts_ or t.channel != Channel::marketplace;
}

std::vector<MeasurementPass> LookbackWindow::passes(int year) const {
    return boost::apply_visitor(Passes(year), policy_);
}

WindowBounds LookbackWindow::bounds(const Date &date) const {
    return boost::apply_visitor(Bounds(date, history_), policy_);
}

std::pair<size_t, size_t> LookbackWindow::yearRange(int year) const {
    auto first = std::lower_bound(history_.begin(), history_.end(), year_start(year), date_less);
    auto last = std::lower_bound(first, history_.end(), year_start(year + 1), date_less);
    return {size_t(first - history_.begin()), size_t(last - history_.begin())};
}

std::vector<int> LookbackWindow::years() const {
    std::vector<int> ys;
    for (const auto &t : history_) {
        int y = t.date.year();
        if (ys.empty() or ys.back() != y) ys.push_back(y);
    }
    return ys;
}

WindowTotals LookbackWindow::totalsAt(size_t index) const {
    if (index >= history_.size()) throw std::out_of_range("LookbackWindow::totalsAt: invalid history index");
    Accumulator acc(*this);
    return acc.advance(bounds(history_[index].date), index);
}

const WindowTotals& LookbackWindow::Accumulator::advance(const WindowBounds &bounds, size_t through) {
    const auto &h = window_.history_;
    if (not started_) {
        lo_ = hi_ = std::lower_bound(h.begin(), h.end(), bounds.from, date_less) - h.begin();
        started_ = true;
    }
    else if (bounds.from < from_) {
        throw std::logic_error("LookbackWindow::Accumulator: window start cannot move backwards");
    }
    from_ = bounds.from;

    while (hi_ < h.size() and hi_ <= through and (not bounds.before or h[hi_].date < *bounds.before))
        add(h[hi_++]);

    while (lo_ < hi_ and h[lo_].date < from_)
        remove(h[lo_++]);

    return totals_;
}

void LookbackWindow::Accumulator::add(const TransactionRecord &t) {
    if (not window_.counts(t)) return;
    totals_.revenue += t.amount;
    totals_.count++;
}

void LookbackWindow::Accumulator::remove(const TransactionRecord &t) {
    if (not window_.counts(t)) return;
    totals_.revenue -= t.amount;
    totals_.count--;
}

}

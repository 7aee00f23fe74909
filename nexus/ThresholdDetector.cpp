#include "nexus/ThresholdDetector.hpp"

namespace nexus {

bool ThresholdDetector::met(const WindowTotals &totals) const {
    const auto &amount = config_.threshold_amount;
    const auto &count = config_.threshold_count;
    if (not amount and not count) return false;

    bool amount_met = amount and totals.revenue >= *amount;
    bool count_met = count and totals.count >= *count;

    if (config_.threshold_operator == ThresholdOperator::all)
        return (amount_met or not amount) and (count_met or not count);
    return amount_met or count_met;
}

boost::optional<Crossing> ThresholdDetector::detect(int year) const {
    for (const auto &pass : window_.passes(year)) {
        auto range = window_.yearRange(pass.year);
        auto crossing = scan(range.first, range.second, pass.prior_period);
        if (crossing) return crossing;
    }
    return boost::none;
}

boost::optional<Crossing> ThresholdDetector::scan(size_t first, size_t last, bool prior_period) const {
    const auto &h = window_.history();
    LookbackWindow::Accumulator acc(window_);
    for (size_t i = first; i < last and i < h.size(); i++) {
        if (not window_.counts(h[i])) continue;
        WindowBounds bounds = window_.bounds(h[i].date);
        if (not bounds.testable) continue;
        const WindowTotals &totals = acc.advance(bounds, i);
        if (met(totals)) {
            Crossing c;
            c.nexus_date = h[i].date;
            c.transaction_id = h[i].id;
            c.totals = totals;
            c.prior_period = prior_period;
            return c;
        }
    }
    return boost::none;
}

}

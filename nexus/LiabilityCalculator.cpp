#include "nexus/LiabilityCalculator.hpp"
#include "nexus/Rate.hpp"

namespace nexus {

bool LiabilityCalculator::taxable(const TransactionRecord &t, const Date &obligation_start) const {
    if (t.date < obligation_start) return false;
    if (t.channel == Channel::marketplace and config_.marketplace_law_date)
        return t.date < *config_.marketplace_law_date;
    return true;
}

YearLiability LiabilityCalculator::calculate(TransactionIterator first, TransactionIterator last,
        const boost::optional<Date> &obligation_start) const {
    YearLiability l;
    for (auto it = first; it != last; ++it) {
        const auto &t = *it;
        l.total_sales += t.amount;
        if (t.channel == Channel::marketplace) l.marketplace_sales += t.amount;
        else l.direct_sales += t.amount;
        l.transaction_count++;

        if (obligation_start and taxable(t, *obligation_start))
            l.taxable_sales += t.amount;
    }
    l.base_tax = Money::round(l.taxable_sales * config_.tax_rate);
    return l;
}

}

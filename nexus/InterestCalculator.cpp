#include "nexus/InterestCalculator.hpp"
#include <algorithm>

namespace nexus {

namespace mp = boost::multiprecision;

const Decimal InterestCalculator::days_per_year{"365.25"};
const Decimal InterestCalculator::days_per_month{"30.44"};

Decimal InterestCalculator::simpleInterest(const Decimal &principal, const AnnualRate &rate, long days) {
    return principal * rate.value() * Decimal(days) / days_per_year;
}

Decimal InterestCalculator::compoundMonthlyInterest(const Decimal &principal, const MonthlyRate &rate, long days) {
    Decimal months = Decimal(days) / days_per_month;
    return principal * (mp::pow(1 + rate.value(), months) - 1);
}

Decimal InterestCalculator::compoundDailyInterest(const Decimal &principal, const DailyRate &rate, long days) {
    return principal * (mp::pow(1 + rate.value(), Decimal(days)) - 1);
}

Decimal InterestCalculator::interest(const Decimal &principal, const AnnualRate &rate, long days) const {
    if (days <= 0) return 0;
    switch (config_.interest_method) {
        case InterestMethod::compound_monthly:
            return compoundMonthlyInterest(principal, monthly(rate), days);
        case InterestMethod::compound_daily:
            return compoundDailyInterest(principal, daily(rate), days);
        case InterestMethod::simple:
            break;
    }
    return simpleInterest(principal, rate, days);
}

Decimal InterestCalculator::accruedInterest(const Decimal &principal, const Date &from, const Date &to) const {
    if (config_.rate_periods.empty())
        return interest(principal, config_.annual_interest_rate, days_between(from, to));

    Decimal total = 0;
    for (const auto &p : config_.rate_periods) {
        Date start = std::max(from, p.start), end = std::min(to, p.end);
        if (start >= end) continue;
        total += interest(principal, p.annual_rate, days_between(start, end));
    }
    return total;
}

PenaltyBreakdown InterestCalculator::penalties(const Money &penalty_base, long days_late) const {
    std::map<PenaltyCategory, Decimal> amounts;
    for (const auto &r : config_.penaltyRules())
        amounts[r.first] = penalty_amount(r.second, penalty_base, days_late);

    if (config_.combined_penalty_cap) config_.combined_penalty_cap->apply(amounts, penalty_base);

    PenaltyBreakdown breakdown;
    for (const auto &a : amounts) breakdown[a.first] = Money::round(a.second);
    return breakdown;
}

AnnualRate InterestCalculator::effectiveRate(const Date &calculation_date) const {
    if (config_.rate_periods.empty()) return config_.annual_interest_rate;
    for (const auto &p : config_.rate_periods) {
        if (p.start <= calculation_date and calculation_date < p.end) return p.annual_rate;
    }
    return config_.rate_periods.front().annual_rate;
}

Accrual InterestCalculator::accrue(const Money &base_tax, const Date &obligation_start, const Date &calculation_date) const {
    return charges(base_tax, obligation_start, calculation_date, false, false);
}

Date InterestCalculator::vdaEffectiveStart(const Date &obligation_start, const Date &reference_date) const {
    return std::max(obligation_start, subtract_months(reference_date, config_.vda_lookback_months));
}

Accrual InterestCalculator::accrueVda(const Money &base_tax, const Date &effective_start, const Date &reference_date) const {
    return charges(base_tax, effective_start, reference_date, config_.vda_interest_waived, config_.vda_penalties_waived);
}

Accrual InterestCalculator::charges(const Money &base_tax, const Date &from, const Date &to, bool waive_interest, bool waive_penalties) const {
    Accrual a;
    long days = days_between(from, to);
    if (days <= 0) return a;
    a.days = days;
    if (base_tax <= Money()) return a;

    if (not waive_interest) {
        a.interest = Money::round(accruedInterest(base_tax.decimal(), from, to));
        if (config_.interest_minimum and config_.rate_periods.empty() and not config_.annual_interest_rate.zero()
                and a.interest < *config_.interest_minimum)
            a.interest = *config_.interest_minimum;
    }

    if (not waive_penalties) {
        Money base = base_tax;
        if (config_.penalty_base == PenaltyBase::tax_plus_interest) base += a.interest;
        a.penalty_breakdown = penalties(base, days);
        for (const auto &p : a.penalty_breakdown) a.penalties += p.second;
    }
    return a;
}

}

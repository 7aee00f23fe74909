#include "nexus/PenaltyRule.hpp"
#include <boost/variant/static_visitor.hpp>
#include <boost/variant/apply_visitor.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nexus {

using namespace penalty;

namespace {

const char *const category_names[] = {
    "late_filing", "late_payment", "negligence", "e_filing_failure", "fraud", "operating_without_permit",
    "late_registration", "unregistered_business", "cost_of_collection", "extended_delinquency"
};

std::string normalize(const std::string &value) {
    std::string n(value);
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return c == '-' ? '_' : std::tolower(c); });
    return n;
}

Decimal at_most(const Decimal &value, const boost::optional<Rate> &max) {
    return max and value > max->value() ? max->value() : value;
}

Decimal at_least(const Decimal &value, const boost::optional<Money> &min) {
    return min and value < min->decimal() ? min->decimal() : value;
}

class Amount : public boost::static_visitor<Decimal> {
    public:
        Amount(const Money &base, long days) : base_(base), days_(days) {}

        Decimal operator()(const Flat &f) const {
            Decimal p = base_.decimal() * at_most(f.rate.value(), f.max_rate);
            p = at_least(p, f.minimum);
            if (f.additional and days_ > f.additional->days) p += base_ * f.additional->rate;
            if (f.maximum and p > f.maximum->decimal()) p = f.maximum->decimal();
            return p;
        }

        Decimal operator()(const FlatFee &f) const { return f.amount.decimal(); }

        Decimal operator()(const PerPeriod &pp) const {
            long periods = std::max(1L, periods_elapsed(pp.period, days_));
            Decimal p = base_.decimal() * at_most(pp.rate.value() * periods, pp.max_rate);
            p = at_least(p, pp.minimum);
            if (pp.additional_fee) p += pp.additional_fee->decimal();
            return p;
        }

        Decimal operator()(const PerDay &pd) const {
            Decimal p = pd.amount.decimal() * days_;
            if (pd.maximum and p > pd.maximum->decimal()) p = pd.maximum->decimal();
            return p;
        }

        Decimal operator()(const Tiered &t) const {
            for (const auto &tier : t.tiers) {
                if (tier.start_day <= days_ and (not tier.end_day or days_ <= *tier.end_day))
                    return base_ * tier.rate;
            }
            return 0;
        }

        Decimal operator()(const BasePlusPerPeriod &b) const {
            long periods = periods_elapsed(b.period, days_);
            Decimal p = base_.decimal() * at_most(b.base_rate.value() + b.rate.value() * periods, b.max_rate);
            boost::optional<Money> minimum = b.minimum;
            for (const auto &esc : b.escalating_minimums) {
                if (days_ > esc.after_days and (not minimum or esc.minimum > *minimum)) minimum = esc.minimum;
            }
            return at_least(p, minimum);
        }

    private:
        const Money &base_;
        const long days_;
};

class TypeName : public boost::static_visitor<std::string> {
    public:
        std::string operator()(const Flat&) const { return "flat"; }
        std::string operator()(const FlatFee&) const { return "flat_fee"; }
        std::string operator()(const PerPeriod&) const { return "per_period"; }
        std::string operator()(const PerDay&) const { return "per_day"; }
        std::string operator()(const Tiered&) const { return "tiered"; }
        std::string operator()(const BasePlusPerPeriod&) const { return "base_plus_per_period"; }
};

#define PROHIBIT(CONDITION) \
    if (CONDITION) throw std::domain_error("Invalid " + TypeName()(r) + " penalty rule: " #CONDITION)

class Check : public boost::static_visitor<void> {
    public:
        void operator()(const Flat &r) const {
            PROHIBIT(r.rate.negative());
            PROHIBIT(r.max_rate and r.max_rate->negative());
            PROHIBIT(r.minimum and *r.minimum < Money());
            PROHIBIT(r.maximum and *r.maximum < Money());
            PROHIBIT(r.minimum and r.maximum and *r.minimum > *r.maximum);
            PROHIBIT(r.additional and (r.additional->days < 0 or r.additional->rate.negative()));
        }
        void operator()(const FlatFee &r) const {
            PROHIBIT(r.amount < Money());
        }
        void operator()(const PerPeriod &r) const {
            PROHIBIT(r.rate.negative());
            PROHIBIT(r.max_rate and r.max_rate->negative());
            PROHIBIT(r.minimum and *r.minimum < Money());
            PROHIBIT(r.additional_fee and *r.additional_fee < Money());
        }
        void operator()(const PerDay &r) const {
            PROHIBIT(r.amount < Money());
            PROHIBIT(r.maximum and *r.maximum < Money());
        }
        void operator()(const Tiered &r) const {
            PROHIBIT(r.tiers.empty());
            for (const auto &tier : r.tiers) {
                PROHIBIT(tier.start_day < 0);
                PROHIBIT(tier.end_day and *tier.end_day < tier.start_day);
                PROHIBIT(tier.rate.negative());
            }
        }
        void operator()(const BasePlusPerPeriod &r) const {
            PROHIBIT(r.base_rate.negative());
            PROHIBIT(r.rate.negative());
            PROHIBIT(r.max_rate and r.max_rate->negative());
            PROHIBIT(r.minimum and *r.minimum < Money());
            for (const auto &esc : r.escalating_minimums) {
                PROHIBIT(esc.after_days < 0 or esc.minimum < Money());
            }
        }
};

#undef PROHIBIT

}

PenaltyCategory parse_penalty_category(const std::string &value) {
    std::string n = normalize(value);
    for (size_t i = 0; i < sizeof(category_names) / sizeof(category_names[0]); i++) {
        if (n == category_names[i]) return static_cast<PenaltyCategory>(i);
    }
    throw std::invalid_argument("Invalid penalty category `" + value + "'");
}

std::string penalty_category_name(PenaltyCategory c) {
    return category_names[static_cast<size_t>(c)];
}

PenaltyPeriod parse_penalty_period(const std::string &value) {
    std::string n = normalize(value);
    if (n == "month") return PenaltyPeriod::month;
    if (n == "30_days") return PenaltyPeriod::thirty_days;
    throw std::invalid_argument("Invalid penalty period `" + value + "': expected `month' or `30_days'");
}

long periods_elapsed(PenaltyPeriod period, long days) {
    if (days <= 0) return 0;
    if (period == PenaltyPeriod::thirty_days) return days / 30;
    static const Decimal days_per_month{"30.44"};
    return (Decimal(days) / days_per_month).convert_to<long>();
}

std::string penalty_rule_type(const PenaltyRule &rule) {
    return boost::apply_visitor(TypeName(), rule);
}

Decimal penalty_amount(const PenaltyRule &rule, const Money &base, long days_late) {
    return boost::apply_visitor(Amount(base, days_late), rule);
}

void check_penalty_rule(const PenaltyRule &rule) {
    boost::apply_visitor(Check(), rule);
}

void CombinedPenaltyCap::apply(std::map<PenaltyCategory, Decimal> &amounts, const Money &base) const {
    Decimal combined = 0;
    for (const auto &a : amounts) {
        if (applies_to.count(a.first)) combined += a.second;
    }
    Decimal limit = base * max_rate;
    if (combined <= limit) return;

    for (auto &a : amounts) {
        if (applies_to.count(a.first)) a.second = a.second * limit / combined;
    }
}

}

#include "nexus/data/InputReader.hpp"
#include "nexus/data/CSVParser.hpp"
#include "nexus/Rate.hpp"
#include "nexus/cmdargs/strings.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <stdexcept>

namespace nexus { namespace data {

namespace {

// Calls `parse` on a field value, prefixing any std::invalid_argument message with the file, line
// and field name.
template <typename F>
auto parse_field(const CSVParser &csv, const std::string &name, const std::string &value, F parse) -> decltype(parse(value)) {
    try {
        return parse(value);
    }
    catch (const std::invalid_argument &e) {
        throw std::invalid_argument(csv.where() + name + ": " + e.what());
    }
    catch (const std::out_of_range &e) {
        throw std::invalid_argument(csv.where() + name + ": value out of range (" + e.what() + ")");
    }
}

uint64_t parse_count(const std::string &value) {
    if (value.empty() or not std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); }))
        throw std::invalid_argument("invalid count `" + value + "'");
    return std::stoull(value);
}

unsigned int parse_months(const std::string &value) {
    uint64_t m = parse_count(value);
    if (m > 1200) throw std::out_of_range("more than 1200 months");
    return static_cast<unsigned int>(m);
}

long parse_days(const std::string &value) {
    uint64_t d = parse_count(value);
    if (d > 100000) throw std::out_of_range("more than 100000 days");
    return static_cast<long>(d);
}

std::set<PenaltyCategory> parse_categories(const std::string &value) {
    std::set<PenaltyCategory> categories;
    for (const auto &c : cmdargs::split_list(value, ';')) categories.insert(parse_penalty_category(c));
    if (categories.empty()) throw std::invalid_argument("no penalty categories given");
    return categories;
}

// "0-30:0.05;31-60:0.10;61-:0.15"; an empty end day is unbounded
std::vector<penalty::Tier> parse_tiers(const std::string &value) {
    static const std::regex tier("(\\d+)-(\\d*):(.+)");
    std::vector<penalty::Tier> tiers;
    std::smatch m;
    for (const auto &t : cmdargs::split_list(value, ';')) {
        if (not std::regex_match(t, m, tier))
            throw std::invalid_argument("invalid tier `" + t + "': expected START-[END]:RATE");
        penalty::Tier pt;
        pt.start_day = parse_days(m[1]);
        if (m[2].length() > 0) pt.end_day = parse_days(m[2]);
        pt.rate = Rate::parse(m[3]);
        tiers.push_back(pt);
    }
    return tiers;
}

// "60:100;120:200"
std::vector<penalty::EscalatingMinimum> parse_escalating(const std::string &value) {
    static const std::regex esc("(\\d+):(.+)");
    std::vector<penalty::EscalatingMinimum> minimums;
    std::smatch m;
    for (const auto &e : cmdargs::split_list(value, ';')) {
        if (not std::regex_match(e, m, esc))
            throw std::invalid_argument("invalid escalating minimum `" + e + "': expected DAYS:AMOUNT");
        penalty::EscalatingMinimum em;
        em.after_days = parse_days(m[1]);
        em.minimum = Money::parse(m[2]);
        minimums.push_back(em);
    }
    return minimums;
}

// Reads the optional fields of a penalty rule row.  Fields a rule type does not use must be empty.
class RuleFields {
    public:
        RuleFields(const CSVParser &csv, const std::string &type) : csv_(csv), type_(type) {}

        // Returns the field value, or an empty string if the field is empty or missing
        const std::string& get(const std::string &name) {
            used_.insert(name);
            return csv_.field(name);
        }

        const std::string& required(const std::string &name) {
            used_.insert(name);
            const std::string &value = csv_.field(name);
            if (value.empty())
                throw std::invalid_argument(csv_.where() + "`" + name + "' is required for " + type_ + " penalty rules");
            return value;
        }

        boost::optional<Rate> rate(const std::string &name) {
            const std::string &value = get(name);
            if (value.empty()) return boost::none;
            return parse_field(csv_, name, value, Rate::parse);
        }

        boost::optional<Money> money(const std::string &name) {
            const std::string &value = get(name);
            if (value.empty()) return boost::none;
            return parse_field(csv_, name, value, Money::parse);
        }

        PenaltyPeriod period() {
            const std::string &value = get("period");
            if (value.empty()) return PenaltyPeriod::month;
            return parse_field(csv_, "period", value, parse_penalty_period);
        }

        // Throws if any rule field not read through this object has a value
        void checkUnused() const {
            static const char *const fields[] = {"rate", "rate_per_period", "max_rate", "minimum", "maximum", "amount",
                "period", "after_days", "additional_rate", "additional_fee", "tiers", "escalating_minimums"};
            for (const char *f : fields) {
                if (not used_.count(f) and not csv_.field(f).empty())
                    throw std::invalid_argument(csv_.where() + "`" + f + "' does not apply to " + type_ + " penalty rules");
            }
        }

    private:
        const CSVParser &csv_;
        const std::string type_;
        std::set<std::string> used_;
};

PenaltyRule read_rule(const CSVParser &csv) {
    const std::string &type = csv.required("type");
    RuleFields f(csv, type);
    PenaltyRule rule;

    if (type == "flat") {
        penalty::Flat r;
        r.rate = parse_field(csv, "rate", f.required("rate"), Rate::parse);
        r.max_rate = f.rate("max_rate");
        r.minimum = f.money("minimum");
        r.maximum = f.money("maximum");
        const std::string &after = f.get("after_days");
        boost::optional<Rate> additional = f.rate("additional_rate");
        if (after.empty() != not additional)
            throw std::invalid_argument(csv.where() + "after_days and additional_rate must be given together");
        if (additional) {
            penalty::AdditionalAfter a;
            a.days = parse_field(csv, "after_days", after, parse_days);
            a.rate = *additional;
            r.additional = a;
        }
        rule = r;
    }
    else if (type == "flat_fee") {
        penalty::FlatFee r;
        r.amount = parse_field(csv, "amount", f.required("amount"), Money::parse);
        rule = r;
    }
    else if (type == "per_period") {
        penalty::PerPeriod r;
        r.rate = parse_field(csv, "rate_per_period", f.required("rate_per_period"), Rate::parse);
        r.period = f.period();
        r.max_rate = f.rate("max_rate");
        r.minimum = f.money("minimum");
        r.additional_fee = f.money("additional_fee");
        rule = r;
    }
    else if (type == "per_day") {
        penalty::PerDay r;
        r.amount = parse_field(csv, "amount", f.required("amount"), Money::parse);
        r.maximum = f.money("maximum");
        rule = r;
    }
    else if (type == "tiered") {
        penalty::Tiered r;
        r.tiers = parse_field(csv, "tiers", f.required("tiers"), parse_tiers);
        rule = r;
    }
    else if (type == "base_plus_per_period") {
        penalty::BasePlusPerPeriod r;
        r.base_rate = parse_field(csv, "rate", f.required("rate"), Rate::parse);
        r.rate = parse_field(csv, "rate_per_period", f.required("rate_per_period"), Rate::parse);
        r.period = f.period();
        r.max_rate = f.rate("max_rate");
        r.minimum = f.money("minimum");
        const std::string &esc = f.get("escalating_minimums");
        if (not esc.empty()) r.escalating_minimums = parse_field(csv, "escalating_minimums", esc, parse_escalating);
        rule = r;
    }
    else {
        throw std::invalid_argument(csv.where() + "type: invalid penalty rule type `" + type + "'");
    }

    f.checkUnused();
    return rule;
}

}

bool parse_bool(const std::string &value) {
    std::string lc(value);
    std::transform(lc.begin(), lc.end(), lc.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lc == "true" or lc == "yes" or lc == "y" or lc == "1") return true;
    if (lc == "false" or lc == "no" or lc == "n" or lc == "0") return false;
    throw std::invalid_argument("invalid boolean value `" + value + "'");
}

std::vector<TransactionRecord> read_transactions(const std::string &filename) {
    CSVParser csv(filename);
    std::vector<TransactionRecord> transactions;
    while (csv.readRow()) {
        TransactionRecord t;
        t.id = csv.field("id");
        if (t.id.empty()) t.id = "LINE" + std::to_string(csv.lineno());
        t.date = parse_field(csv, "date", csv.required("date"), parse_date);
        t.jurisdiction = csv.required("jurisdiction");
        t.amount = parse_field(csv, "amount", csv.required("amount"), Money::parse);
        if (t.amount < Money())
            throw std::invalid_argument(csv.where() + "amount: negative amount " + t.amount.str());
        const std::string &channel = csv.field("channel");
        if (not channel.empty()) t.channel = parse_field(csv, "channel", channel, parse_channel);
        transactions.push_back(std::move(t));
    }
    return transactions;
}

std::map<std::string, JurisdictionConfig> read_jurisdictions(const std::string &filename) {
    CSVParser csv(filename);
    std::map<std::string, JurisdictionConfig> configs;
    while (csv.readRow()) {
        JurisdictionConfig c;
        c.code = csv.required("jurisdiction");

        const std::string &amount = csv.field("threshold_amount");
        c.threshold_amount = boost::none;
        if (not amount.empty()) c.threshold_amount = parse_field(csv, "threshold_amount", amount, Money::parse);

        const std::string &count = csv.field("threshold_count");
        c.threshold_count = boost::none;
        if (not count.empty()) c.threshold_count = parse_field(csv, "threshold_count", count, parse_count);

        const std::string &op = csv.field("operator");
        if (not op.empty()) c.threshold_operator = parse_field(csv, "operator", op, parse_threshold_operator);

        const std::string &lookback = csv.field("lookback");
        if (not lookback.empty()) c.lookback = parse_field(csv, "lookback", lookback, parse_lookback);

        const std::string &rate = csv.field("tax_rate");
        if (not rate.empty()) c.tax_rate = parse_field(csv, "tax_rate", rate, Rate::parse);

        const std::string &law = csv.field("marketplace_law_date");
        if (not law.empty()) c.marketplace_law_date = parse_field(csv, "marketplace_law_date", law, parse_date);

        const std::string &counts = csv.field("marketplace_counts");
        if (not counts.empty()) c.marketplace_counts_toward_threshold = parse_field(csv, "marketplace_counts", counts, parse_bool);

        if (configs.count(c.code))
            throw std::invalid_argument(csv.where() + "duplicate configuration for jurisdiction " + c.code);
        std::string code = c.code;
        configs.emplace(std::move(code), std::move(c));
    }
    return configs;
}

std::map<std::string, InterestPenaltyConfig> read_interest(const std::string &filename) {
    CSVParser csv(filename);
    std::map<std::string, InterestPenaltyConfig> configs;
    while (csv.readRow()) {
        InterestPenaltyConfig c;
        std::string code = csv.required("jurisdiction");

        const std::string &annual = csv.field("annual_rate"), &monthly = csv.field("monthly_rate");
        if (not annual.empty() and not monthly.empty())
            throw std::invalid_argument(csv.where() + "only one of annual_rate and monthly_rate may be given");
        if (not annual.empty())
            c.annual_interest_rate = AnnualRate(parse_field(csv, "annual_rate", annual, Rate::parse).value());
        else if (not monthly.empty())
            c.annual_interest_rate = annualize(MonthlyRate(parse_field(csv, "monthly_rate", monthly, Rate::parse).value()));

        const std::string &method = csv.field("method");
        if (not method.empty()) c.interest_method = parse_field(csv, "method", method, parse_interest_method);

        const std::string &penalty = csv.field("penalty_rate");
        if (not penalty.empty()) c.penalty_rate = parse_field(csv, "penalty_rate", penalty, Rate::parse);

        const std::string &pmin = csv.field("penalty_min"), &pmax = csv.field("penalty_max");
        if (not pmin.empty()) c.penalty_min = parse_field(csv, "penalty_min", pmin, Money::parse);
        if (not pmax.empty()) c.penalty_max = parse_field(csv, "penalty_max", pmax, Money::parse);

        const std::string &base = csv.field("penalty_base");
        if (not base.empty()) c.penalty_base = parse_field(csv, "penalty_base", base, parse_penalty_base);

        const std::string &wi = csv.field("vda_interest_waived"), &wp = csv.field("vda_penalties_waived");
        if (not wi.empty()) c.vda_interest_waived = parse_field(csv, "vda_interest_waived", wi, parse_bool);
        if (not wp.empty()) c.vda_penalties_waived = parse_field(csv, "vda_penalties_waived", wp, parse_bool);

        const std::string &months = csv.field("vda_lookback_months");
        if (not months.empty()) c.vda_lookback_months = parse_field(csv, "vda_lookback_months", months, parse_months);

        const std::string &imin = csv.field("interest_minimum");
        if (not imin.empty()) c.interest_minimum = parse_field(csv, "interest_minimum", imin, Money::parse);

        const std::string &cap_rate = csv.field("combined_cap_rate"), &cap_categories = csv.field("combined_cap_categories");
        if (cap_rate.empty() != cap_categories.empty())
            throw std::invalid_argument(csv.where() + "combined_cap_rate and combined_cap_categories must be given together");
        if (not cap_rate.empty()) {
            CombinedPenaltyCap cap;
            cap.max_rate = parse_field(csv, "combined_cap_rate", cap_rate, Rate::parse);
            cap.applies_to = parse_field(csv, "combined_cap_categories", cap_categories, parse_categories);
            c.combined_penalty_cap = cap;
        }

        if (configs.count(code))
            throw std::invalid_argument(csv.where() + "duplicate interest configuration for jurisdiction " + code);
        configs.emplace(std::move(code), std::move(c));
    }
    return configs;
}

void read_rate_periods(const std::string &filename, std::map<std::string, InterestPenaltyConfig> &configs) {
    CSVParser csv(filename);
    while (csv.readRow()) {
        const std::string &code = csv.required("jurisdiction");
        auto it = configs.find(code);
        if (it == configs.end())
            throw std::invalid_argument(csv.where() + "rate period for " + code + ", which has no interest configuration");

        RatePeriod p;
        p.start = parse_field(csv, "start", csv.required("start"), parse_date);
        p.end = parse_field(csv, "end", csv.required("end"), parse_date);

        const std::string &annual = csv.field("annual_rate"), &monthly = csv.field("monthly_rate");
        if (annual.empty() == monthly.empty())
            throw std::invalid_argument(csv.where() + "exactly one of annual_rate and monthly_rate must be given");
        if (not annual.empty())
            p.annual_rate = AnnualRate(parse_field(csv, "annual_rate", annual, Rate::parse).value());
        else
            p.annual_rate = annualize(MonthlyRate(parse_field(csv, "monthly_rate", monthly, Rate::parse).value()));

        it->second.rate_periods.push_back(p);
    }

    for (auto &c : configs) {
        std::stable_sort(c.second.rate_periods.begin(), c.second.rate_periods.end(),
                [](const RatePeriod &a, const RatePeriod &b) { return a.start < b.start; });
    }
}

void read_penalty_rules(const std::string &filename, std::map<std::string, InterestPenaltyConfig> &configs) {
    CSVParser csv(filename);
    while (csv.readRow()) {
        const std::string &code = csv.required("jurisdiction");
        auto it = configs.find(code);
        if (it == configs.end())
            throw std::invalid_argument(csv.where() + "penalty rule for " + code + ", which has no interest configuration");

        PenaltyCategory category = parse_field(csv, "category", csv.required("category"), parse_penalty_category);
        if (it->second.penalty_rules.count(category))
            throw std::invalid_argument(csv.where() + "duplicate " + penalty_category_name(category) + " penalty rule for " + code);
        it->second.penalty_rules.emplace(category, read_rule(csv));
    }
}

}}

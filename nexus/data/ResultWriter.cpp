#include "nexus/data/ResultWriter.hpp"
#include <iomanip>
#include <regex>

namespace nexus { namespace data {

namespace {

std::string opt_str(const boost::optional<Date> &d) { return d ? date_str(*d) : ""; }
std::string opt_str(const boost::optional<int> &y) { return y ? std::to_string(*y) : ""; }
std::string opt_str(const boost::optional<std::string> &s) { return s ? *s : ""; }

// "late_filing=50.00;late_payment=100.00"
std::string breakdown_str(const PenaltyBreakdown &breakdown) {
    std::string s;
    for (const auto &p : breakdown) {
        if (not s.empty()) s += ';';
        s += penalty_category_name(p.first) + "=" + p.second.str();
    }
    return s;
}

std::string join_notes(const std::vector<std::string> &notes) {
    std::string joined;
    for (const auto &n : notes) {
        if (not joined.empty()) joined += "; ";
        joined += n;
    }
    return joined;
}

}

std::string csv_fix(const std::string &value) {
    if (value.find_first_of(",\"\n") == std::string::npos) return value;
    return "\"" + std::regex_replace(value, std::regex("\""), "\"\"") + "\"";
}

void write_years_csv(std::ostream &out, const std::map<std::string, JurisdictionResult> &results) {
    out << "jurisdiction,confidence,year,nexus_type,nexus_date,obligation_start_date,first_nexus_year,crossing_transaction,"
        "total_sales,direct_sales,marketplace_sales,transaction_count,taxable_sales,base_tax,interest,penalties,"
        "total_liability,interest_method,annual_rate,days_outstanding,penalty_breakdown,notes\n";

    for (const auto &jr : results) {
        const JurisdictionResult &r = jr.second;
        std::string notes = csv_fix(join_notes(r.notes));
        if (r.confidence == Confidence::failed) {
            out << csv_fix(r.code) << "," << confidence_name(r.confidence) << std::string(20, ',') << notes << "\n";
            continue;
        }
        for (const auto &y : r.years) {
            out << csv_fix(r.code) << ',' << confidence_name(r.confidence) << ',' << y.year << ','
                << nexus_type_name(y.nexus_type) << ',' << opt_str(y.nexus_date) << ',' << opt_str(y.obligation_start) << ','
                << opt_str(y.first_nexus_year) << ',' << csv_fix(opt_str(y.crossing_transaction)) << ','
                << y.total_sales << ',' << y.direct_sales << ',' << y.marketplace_sales << ',' << y.transaction_count << ','
                << y.taxable_sales << ',' << y.base_tax << ',' << y.interest << ',' << y.penalties << ','
                << y.total_liability << ',' << interest_method_name(y.interest_method) << ','
                << decimal_str(y.effective_annual_rate.value(), 6) << ',' << y.days_outstanding << ','
                << breakdown_str(y.penalty_breakdown) << ',' << notes << '\n';
        }
    }
}

void write_vda_csv(std::ostream &out, const std::map<std::string, JurisdictionResult> &results) {
    out << "jurisdiction,year,effective_obligation_start,taxable_sales,base_tax,interest,penalties,total_liability,"
        "standard_total_liability,savings,penalty_breakdown\n";
    for (const auto &jr : results) {
        for (const auto &v : jr.second.vda) {
            out << csv_fix(jr.first) << ',' << v.year << ',' << opt_str(v.effective_obligation_start) << ','
                << v.taxable_sales << ',' << v.base_tax << ',' << v.interest << ',' << v.penalties << ','
                << v.total_liability << ',' << v.standard_total_liability << ',' << v.savings << ','
                << breakdown_str(v.penalty_breakdown) << '\n';
        }
    }
}

void print_results(std::ostream &out, const std::map<std::string, JurisdictionResult> &results) {
    out << std::right;
    for (const auto &jr : results) {
        const JurisdictionResult &r = jr.second;
        out << "\n" << r.code << " (confidence: " << confidence_name(r.confidence) << ")\n"
            << std::string(r.code.size() + 15 + confidence_name(r.confidence).size(), '=') << "\n";
        for (const auto &n : r.notes) out << "Note: " << n << "\n";
        if (r.confidence == Confidence::failed) continue;

#define ROW(YEAR, NEXUS, NDATE, OBL, SALES, TAXABLE, TAX, INTEREST, PENALTIES, TOTAL) \
        out << std::setw(6) << YEAR << std::setw(10) << NEXUS << std::setw(12) << NDATE << std::setw(12) << OBL \
            << std::setw(15) << SALES << std::setw(15) << TAXABLE << std::setw(13) << TAX << std::setw(12) << INTEREST \
            << std::setw(12) << PENALTIES << std::setw(15) << TOTAL << "\n"
        ROW("Year", "Nexus", "Nexus date", "Obligation", "Sales", "Taxable", "Tax", "Interest", "Penalties", "Total");
        for (const auto &y : r.years) {
            ROW(y.year, nexus_type_name(y.nexus_type), opt_str(y.nexus_date), opt_str(y.obligation_start),
                    y.total_sales, y.taxable_sales, y.base_tax, y.interest, y.penalties, y.total_liability);
        }
        const YearRollup &a = r.all_years;
        ROW("All", a.years_with_nexus, "", "", a.total_sales, a.taxable_sales, a.base_tax, a.interest, a.penalties, a.total_liability);
#undef ROW
        if (a.interest_method)
            out << "Interest method: " << interest_method_name(*a.interest_method) << "\n";
        if (not a.penalty_breakdown.empty()) {
            out << "Penalties by category:";
            bool first = true;
            for (const auto &p : a.penalty_breakdown) {
                out << (first ? " " : ", ") << penalty_category_name(p.first) << " " << p.second;
                first = false;
            }
            out << "\n";
        }

        if (r.vda_requested) {
            out << "\nVoluntary disclosure alternative:\n";
#define ROW(YEAR, START, TAXABLE, TAX, INTEREST, PENALTIES, TOTAL, STANDARD, SAVINGS) \
            out << std::setw(6) << YEAR << std::setw(12) << START << std::setw(15) << TAXABLE << std::setw(13) << TAX \
                << std::setw(12) << INTEREST << std::setw(12) << PENALTIES << std::setw(15) << TOTAL \
                << std::setw(15) << STANDARD << std::setw(15) << SAVINGS << "\n"
            ROW("Year", "Start", "Taxable", "Tax", "Interest", "Penalties", "VDA total", "Standard", "Savings");
            for (const auto &v : r.vda) {
                ROW(v.year, opt_str(v.effective_obligation_start), v.taxable_sales, v.base_tax, v.interest,
                        v.penalties, v.total_liability, v.standard_total_liability, v.savings);
            }
#undef ROW
        }
    }
}

void print_vda_summary(std::ostream &out, const VdaSummary &summary) {
    out << "\nVoluntary disclosure summary\n============================\n" << std::right;
    out << std::setw(12) << "Jurisdiction" << std::setw(15) << "Without VDA" << std::setw(15) << "With VDA"
        << std::setw(15) << "Savings" << "\n";
    for (const auto &b : summary.jurisdictions) {
        out << std::setw(12) << b.code << std::setw(15) << b.without_vda << std::setw(15) << b.with_vda
            << std::setw(15) << b.savings << "\n";
    }
    out << std::setw(12) << "Total" << std::setw(15) << summary.without_vda << std::setw(15) << summary.with_vda
        << std::setw(15) << summary.savings << "\n"
        << "Savings: " << decimal_str(summary.savings_percentage, 2) << "%\n";
}

}}

#include "nexus/Engine.hpp"
#include "nexus/InterestCalculator.hpp"
#include "nexus/LiabilityCalculator.hpp"
#include "nexus/LookbackWindow.hpp"
#include "nexus/NexusTracker.hpp"
#include <eris/debug.hpp>
#include <boost/variant/get.hpp>
#include <algorithm>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace nexus {

std::string confidence_name(Confidence c) {
    switch (c) {
        case Confidence::degraded: return "degraded";
        case Confidence::failed: return "failed";
        case Confidence::high: break;
    }
    return "high";
}

namespace {

void add_to_rollup(YearRollup &r, const NexusYearResult &y) {
    r.total_sales += y.total_sales;
    r.taxable_sales += y.taxable_sales;
    r.base_tax += y.base_tax;
    r.interest += y.interest;
    r.penalties += y.penalties;
    for (const auto &p : y.penalty_breakdown) r.penalty_breakdown[p.first] += p.second;
    r.total_liability += y.total_liability;
    if (y.nexus_type != NexusType::none) r.years_with_nexus++;
    r.interest_method = y.interest_method;
}

// A jurisdiction waiting to be evaluated by a worker thread
struct Job {
    const std::string *code;
    std::vector<TransactionRecord> *transactions;
    JurisdictionResult *result;
};

}

Engine::Engine(const EngineSettings &s, const ConfigSet &configs) : settings_(s), configs_(configs) {}

std::map<std::string, JurisdictionResult> Engine::run(const std::vector<TransactionRecord> &transactions) const {
    if (settings_.calculation_date.is_special())
        throw std::invalid_argument("Engine::run: a calculation date is required");

    std::map<std::string, std::vector<TransactionRecord>> by_code;
    for (const auto &t : transactions) by_code[t.jurisdiction].push_back(t);

    // All result entries are created up front so that worker threads only ever write to their own
    // (already existing) entry.
    std::map<std::string, JurisdictionResult> results;
    std::vector<Job> jobs;
    jobs.reserve(by_code.size());
    for (auto &j : by_code) jobs.push_back({&j.first, &j.second, &results[j.first]});

    if (settings_.threads == 0 or jobs.size() <= 1) {
        for (auto &job : jobs) *job.result = evaluate(*job.code, std::move(*job.transactions));
        return results;
    }

    auto next_job = jobs.begin();
    std::mutex next_job_mutex;
    auto worker = [&]() {
        next_job_mutex.lock();
        while (next_job != jobs.end()) {
            Job &job = *next_job++;
            next_job_mutex.unlock();
            *job.result = evaluate(*job.code, std::move(*job.transactions));
            next_job_mutex.lock();
        }
        next_job_mutex.unlock();
    };

    std::vector<std::thread> threads;
    unsigned int nthreads = std::min<size_t>(settings_.threads, jobs.size());
    for (unsigned int i = 0; i < nthreads; i++) threads.emplace_back(worker);
    for (auto &th : threads) {
        if (th.joinable()) th.join();
    }

    return results;
}

JurisdictionResult Engine::evaluate(const std::string &code, std::vector<TransactionRecord> transactions) const {
    JurisdictionResult result;
    result.code = code;
    try {
        evaluateInto(result, transactions);
    }
    catch (const std::exception &e) {
        ERIS_DBG("evaluation of " << code << " failed: " << e.what());
        result.years.clear();
        result.vda.clear();
        result.all_years = YearRollup();
        result.confidence = Confidence::failed;
        result.notes.push_back(e.what());
    }
    return result;
}

void Engine::evaluateInto(JurisdictionResult &result, std::vector<TransactionRecord> &transactions) const {
    const std::string &code = result.code;
    for (const auto &t : transactions) {
        if (t.jurisdiction != code)
            throw std::invalid_argument("transaction `" + t.id + "' belongs to " + t.jurisdiction + ", not " + code);
    }
    sort_chronologically(transactions);

    JurisdictionConfig jconfig;
    auto jit = configs_.jurisdictions.find(code);
    if (jit != configs_.jurisdictions.end()) jconfig = jit->second;
    else {
        result.confidence = Confidence::degraded;
        result.notes.push_back("no jurisdiction configuration: using default thresholds ($100,000 or 200 transactions) and a zero tax rate");
        ERIS_DBG("defaults substituted for jurisdiction configuration of " << code);
    }
    jconfig.code = code;
    auto *fixed = boost::get<lookback::FixedAnnualWindow>(&jconfig.lookback);
    if (fixed and fixed->client_fiscal_year and settings_.fiscal_year_end)
        fixed->period_end = *settings_.fiscal_year_end;
    jconfig.check();

    InterestPenaltyConfig iconfig;
    auto iit = configs_.interest.find(code);
    if (iit != configs_.interest.end()) iconfig = iit->second;
    else {
        result.confidence = Confidence::degraded;
        result.notes.push_back("no interest configuration: using 3% simple interest and a 10% penalty on tax");
        ERIS_DBG("defaults substituted for interest configuration of " << code);
    }
    iconfig.check(code);

    boost::optional<Date> physical;
    auto pit = settings_.physical_nexus.find(code);
    if (pit != settings_.physical_nexus.end()) physical = pit->second;

    LookbackWindow window(transactions, jconfig.lookback, jconfig.marketplace_counts_toward_threshold);
    NexusTracker tracker(window, jconfig, physical);
    LiabilityCalculator liability(jconfig);
    InterestCalculator interest(iconfig);

    const Date &calc_date = settings_.calculation_date;
    const Date vda_date = settings_.vdaReferenceDate();
    result.vda_requested = settings_.vdaFor(code);

    for (const auto &yn : tracker.track()) {
        auto range = window.yearRange(yn.year);
        TransactionIterator first = transactions.cbegin() + range.first, last = transactions.cbegin() + range.second;
        YearLiability yl = liability.calculate(first, last, yn.obligation_start);

        NexusYearResult r;
        r.year = yn.year;
        r.nexus_type = yn.type;
        r.nexus_date = yn.nexus_date;
        r.obligation_start = yn.obligation_start;
        r.first_nexus_year = yn.first_nexus_year;
        if (yn.crossing) r.crossing_transaction = yn.crossing->transaction_id;
        r.total_sales = yl.total_sales;
        r.direct_sales = yl.direct_sales;
        r.marketplace_sales = yl.marketplace_sales;
        r.transaction_count = yl.transaction_count;
        r.taxable_sales = yl.taxable_sales;
        r.base_tax = yl.base_tax;
        r.interest_method = iconfig.interest_method;
        r.effective_annual_rate = interest.effectiveRate(calc_date);
        if (yn.obligation_start) {
            Accrual a = interest.accrue(yl.base_tax, *yn.obligation_start, calc_date);
            r.interest = a.interest;
            r.penalties = a.penalties;
            r.penalty_breakdown = std::move(a.penalty_breakdown);
            r.days_outstanding = a.days;
        }
        r.total_liability = r.base_tax + r.interest + r.penalties;
        add_to_rollup(result.all_years, r);

        if (result.vda_requested and yn.obligation_start) {
            VdaResult v;
            v.year = yn.year;
            Date effective = interest.vdaEffectiveStart(*yn.obligation_start, vda_date);
            v.effective_obligation_start = effective;
            YearLiability vl = liability.calculate(first, last, effective);
            Accrual va = interest.accrueVda(vl.base_tax, effective, vda_date);
            v.taxable_sales = vl.taxable_sales;
            v.base_tax = vl.base_tax;
            v.interest = va.interest;
            v.penalties = va.penalties;
            v.penalty_breakdown = std::move(va.penalty_breakdown);
            v.total_liability = v.base_tax + v.interest + v.penalties;

            Accrual standard = interest.accrue(yl.base_tax, *yn.obligation_start, vda_date);
            v.standard_total_liability = yl.base_tax + standard.interest + standard.penalties;
            v.savings = v.standard_total_liability - v.total_liability;
            result.vda.push_back(std::move(v));
        }

        result.years.push_back(std::move(r));
    }
}

VdaSummary Engine::vdaSummary(const std::map<std::string, JurisdictionResult> &results) {
    VdaSummary s;
    for (const auto &jr : results) {
        const JurisdictionResult &r = jr.second;
        if (not r.vda_requested or r.confidence == Confidence::failed) continue;

        VdaBreakdown b;
        b.code = r.code;
        for (const auto &v : r.vda) {
            b.without_vda += v.standard_total_liability;
            b.with_vda += v.total_liability;
            b.base_tax += v.base_tax;
            b.interest += v.interest;
            b.penalties += v.penalties;
        }
        if (b.without_vda.zero()) continue;
        b.savings = b.without_vda - b.with_vda;

        s.without_vda += b.without_vda;
        s.with_vda += b.with_vda;
        s.savings += b.savings;
        s.jurisdictions.push_back(std::move(b));
    }

    if (not s.without_vda.zero())
        s.savings_percentage = round_half_up(s.savings.decimal() * 100 / s.without_vda.decimal(), 2);

    std::sort(s.jurisdictions.begin(), s.jurisdictions.end(), [](const VdaBreakdown &a, const VdaBreakdown &b) {
            return a.savings != b.savings ? a.savings > b.savings : a.code < b.code; });
    return s;
}

}

#pragma once
#include "nexus/Date.hpp"
#include "nexus/InterestPenaltyConfig.hpp"
#include "nexus/Money.hpp"
#include "nexus/PenaltyRule.hpp"
#include "nexus/Rate.hpp"

namespace nexus {

/// Interest and penalties accrued on a base tax amount.
struct Accrual {
    Money interest;  ///< Accrued interest, rounded to cents
    Money penalties; ///< Sum of penalty_breakdown
    PenaltyBreakdown penalty_breakdown; ///< Penalties by category, each rounded to cents
    long days = 0;   ///< Days outstanding (0 if the period is empty or negative)
};

/** Computes interest and penalties for a jurisdiction's interest configuration. */
class InterestCalculator final {
    public:
        /// Creates a calculator for the given configuration (referenced, not copied).
        explicit InterestCalculator(const InterestPenaltyConfig &config) : config_(config) {}

        /// Days per year used to convert days to years for simple interest.
        static const Decimal days_per_year;
        /// Average days per month used to convert days to months for monthly compounding.
        static const Decimal days_per_month;

        /// Simple interest: principal × rate × days / 365.25.
        static Decimal simpleInterest(const Decimal &principal, const AnnualRate &rate, long days);

        /// Monthly compounding: principal × ((1 + rate)^(days / 30.44) − 1).
        static Decimal compoundMonthlyInterest(const Decimal &principal, const MonthlyRate &rate, long days);

        /// Daily compounding: principal × ((1 + rate)^days − 1).
        static Decimal compoundDailyInterest(const Decimal &principal, const DailyRate &rate, long days);

        /** Unrounded interest on `principal` at the given annual rate for `days` days using the
         * configured method.  Returns 0 if `days` is not positive.
         */
        Decimal interest(const Decimal &principal, const AnnualRate &rate, long days) const;

        /** Unrounded interest accrued on `principal` over [from, to), using the configured rate
         * periods if there are any, otherwise the configured annual rate.
         */
        Decimal accruedInterest(const Decimal &principal, const Date &from, const Date &to) const;

        /** Penalties on the given penalty base after `days_late` days, by category.  Every rule in
         * InterestPenaltyConfig::penaltyRules() is assessed, the combined cap (if any) reduces the
         * categories it covers, and each amount is then rounded to cents.  With the default
         * configuration this is a single late_payment entry of base × penalty rate.
         */
        PenaltyBreakdown penalties(const Money &penalty_base, long days_late) const;

        /** The annual rate shown for a calculation date: the rate of the rate period containing the
         * date, the first period's rate if none contains it, or the configured annual rate when no
         * rate periods are configured.
         */
        AnnualRate effectiveRate(const Date &calculation_date) const;

        /** Accrues interest and penalties on `base_tax` from `obligation_start` to
         * `calculation_date`.  Both are zero if the base tax is not positive or no days have
         * elapsed.
         */
        Accrual accrue(const Money &base_tax, const Date &obligation_start, const Date &calculation_date) const;

        /** The obligation start under a voluntary disclosure agreement: the later of the standard
         * obligation start and `vda_lookback_months` months before the reference date.
         */
        Date vdaEffectiveStart(const Date &obligation_start, const Date &reference_date) const;

        /** Like accrue(), but applies the configured VDA interest and penalty waivers.  A waived
         * interest amount is also excluded from a tax_plus_interest penalty base.
         */
        Accrual accrueVda(const Money &base_tax, const Date &effective_start, const Date &reference_date) const;

    private:
        Accrual charges(const Money &base_tax, const Date &from, const Date &to, bool waive_interest, bool waive_penalties) const;

        const InterestPenaltyConfig &config_;
};

}

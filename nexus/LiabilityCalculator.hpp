#pragma once
#include "nexus/Date.hpp"
#include "nexus/JurisdictionConfig.hpp"
#include "nexus/Money.hpp"
#include "nexus/Transaction.hpp"
#include <boost/optional.hpp>
#include <cstdint>

namespace nexus {

/// Sales breakdown and base tax for one jurisdiction-year.
struct YearLiability {
    Money total_sales;           ///< All sales in the year
    Money direct_sales;          ///< Direct-channel sales in the year
    Money marketplace_sales;     ///< Marketplace-channel sales in the year
    uint64_t transaction_count = 0; ///< Number of transactions in the year
    Money taxable_sales;         ///< Sales the seller owes tax on
    Money base_tax;              ///< taxable_sales × tax rate, rounded to cents
};

/** Computes taxable sales and base tax for a jurisdiction-year. */
class LiabilityCalculator final {
    public:
        /// Creates a calculator for the given jurisdiction configuration (referenced, not copied).
        explicit LiabilityCalculator(const JurisdictionConfig &config) : config_(config) {}

        /** Returns true if the transaction is taxable to the seller given an obligation start:
         * it must be dated on or after the obligation start, and, if it is a marketplace sale
         * and a marketplace facilitator law date is configured, it must precede that date.
         */
        bool taxable(const TransactionRecord &t, const Date &obligation_start) const;

        /** Computes the liability over a year's transactions.  Without an obligation start nothing
         * is taxable, but the sales breakdown is still reported.
         */
        YearLiability calculate(TransactionIterator first, TransactionIterator last,
                const boost::optional<Date> &obligation_start) const;

    private:
        const JurisdictionConfig &config_;
};

}

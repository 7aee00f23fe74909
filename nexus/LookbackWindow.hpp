#pragma once
#include "nexus/Date.hpp"
#include "nexus/LookbackPolicy.hpp"
#include "nexus/Money.hpp"
#include "nexus/Transaction.hpp"
#include <boost/optional.hpp>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace nexus {

/// Revenue and transaction count accumulated over a lookback window.
struct WindowTotals {
    Money revenue;      ///< Sum of qualifying transaction amounts
    uint64_t count = 0; ///< Number of qualifying transactions
};

/** The span of history measured for a particular evaluation date.  The window always starts at
 * `from` (inclusive).  If `before` is set the window ends just before that date; otherwise it ends
 * with (and includes) the candidate transaction being evaluated.
 */
struct WindowBounds {
    Date from;                    ///< First date in the window
    boost::optional<Date> before; ///< Exclusive end date, if the window ends before the candidate
    bool testable = true;         ///< False if the history is too short to evaluate the window
};

/** One chronological scan of candidate transactions.  For each evaluation year a policy produces
 * one or two passes: the candidates are the transactions dated in `year`.
 */
struct MeasurementPass {
    int year;          ///< Calendar year whose transactions are the candidates
    bool prior_period; ///< True if `year` precedes the evaluation year
};

/** Computes lookback-window totals over one jurisdiction's chronological transaction history.
 *
 * The object keeps a reference to the history, which must outlive it and must be sorted by date.
 * Every policy is expressed as WindowBounds whose edges never move backwards as the candidate
 * advances, so windows are evaluated with the linear sliding Accumulator.
 */
class LookbackWindow final {
    public:
        /** Constructs a window evaluator.
         *
         * \param history the jurisdiction's transactions, in non-decreasing date order
         * \param policy the lookback rule
         * \param marketplace_counts whether marketplace transactions count toward the window
         * totals
         *
         * \throws std::invalid_argument if `history` is not sorted by date
         */
        LookbackWindow(const std::vector<TransactionRecord> &history, const LookbackPolicy &policy, bool marketplace_counts = true);

        /// The history this window measures
        const std::vector<TransactionRecord>& history() const { return history_; }

        /// The lookback policy
        const LookbackPolicy& policy() const { return policy_; }

        /// Returns true if the transaction counts toward window totals.
        bool counts(const TransactionRecord &t) const;

        /** Returns the candidate passes to make, in order, when evaluating the given year. */
        std::vector<MeasurementPass> passes(int year) const;

        /** Returns the bounds of the window evaluated at a candidate dated `date`. */
        WindowBounds bounds(const Date &date) const;

        /** Returns the index range [first, last) of history transactions dated in `year`. */
        std::pair<size_t, size_t> yearRange(int year) const;

        /// Returns the distinct calendar years present in the history, ascending.
        std::vector<int> years() const;

        /** Evaluates the window for the candidate at history index `index` from scratch.  This is
         * linear in the size of the history; scans should use an Accumulator instead.
         */
        WindowTotals totalsAt(size_t index) const;

        class Accumulator;

    private:
        const std::vector<TransactionRecord> &history_;
        LookbackPolicy policy_;
        bool marketplace_counts_;
};

/** Two-pointer sliding accumulator over a LookbackWindow's history.  Each call to advance() moves
 * the window's trailing edge up to the new `from` and its leading edge up to the new candidate (or
 * `before` date), adjusting the running totals for transactions entering and leaving the window.
 * Over a full scan every transaction enters and leaves at most once.
 */
class LookbackWindow::Accumulator final {
    public:
        /// Creates an empty accumulator for the given window.
        explicit Accumulator(const LookbackWindow &window) : window_(window) {}

        /** Advances the window and returns the updated totals.
         *
         * \param bounds the window bounds for the candidate
         * \param through the history index of the candidate; the window never extends past it
         *
         * \throws std::logic_error if `bounds.from` precedes the `from` of a previous call.
         */
        const WindowTotals& advance(const WindowBounds &bounds, size_t through);

        /// The totals as of the most recent advance()
        const WindowTotals& totals() const { return totals_; }

    private:
        void add(const TransactionRecord &t);
        void remove(const TransactionRecord &t);

        const LookbackWindow &window_;
        bool started_ = false;
        size_t lo_ = 0, hi_ = 0;
        Date from_;
        WindowTotals totals_;
};

}

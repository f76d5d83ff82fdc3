/**
 * @file valuation_series.hpp
 * @brief Date-indexed portfolio valuation series.
 *
 * The only input of the drawdown engine. Values are stored in an Eigen
 * vector aligned with a vector of dates; the series validates ordering
 * and value preconditions on construction and is immutable afterwards.
 */

#ifndef DRAWDOWN_DATA_VALUATION_SERIES_HPP
#define DRAWDOWN_DATA_VALUATION_SERIES_HPP

#include "core/date.hpp"

#include <Eigen/Dense>
#include <optional>
#include <vector>

namespace drawdown
{
    /**
     * @struct ValuationPoint
     * @brief One daily observation of total portfolio value.
     */
    struct ValuationPoint
    {
        Date date;    ///< Observation date
        double value; ///< Portfolio value (>= 0)
    };

    /**
     * @struct ReturnSeries
     * @brief Simple periodic returns with the end date of each period.
     */
    struct ReturnSeries
    {
        std::vector<Date> dates; ///< Date at the end of each return period
        Eigen::VectorXd returns; ///< r = value[i] / value[i-1] - 1

        size_t size() const { return dates.size(); }
        bool empty() const { return dates.empty(); }
    };

    /**
     * @class ValuationSeries
     * @brief Ordered, validated sequence of valuation points.
     *
     * Invariants enforced on construction:
     * - dates strictly increasing (no duplicates)
     * - values finite and non-negative
     *
     * @throws InvalidSeriesError from the constructors when an invariant
     *         is violated, carrying the offending date and value.
     */
    class ValuationSeries
    {
    public:
        /** @brief Empty series. */
        ValuationSeries() = default;

        explicit ValuationSeries(const std::vector<ValuationPoint> &points);

        /**
         * @brief Construct from parallel dates and values.
         * @throws std::invalid_argument If the sizes differ.
         */
        ValuationSeries(const std::vector<Date> &dates, const Eigen::VectorXd &values);

        ~ValuationSeries() = default;

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        size_t size() const { return dates_.size(); }
        bool empty() const { return dates_.empty(); }

        /**
         * @brief Observation at an index.
         * @throws std::out_of_range If index >= size().
         */
        ValuationPoint at(size_t index) const;

        ValuationPoint front() const { return at(0); }
        ValuationPoint back() const { return at(size() == 0 ? 0 : size() - 1); }

        const Date &date(size_t index) const { return dates_[index]; }
        double value(size_t index) const { return values_(static_cast<Eigen::Index>(index)); }

        const std::vector<Date> &dates() const { return dates_; }
        const Eigen::VectorXd &values() const { return values_; }

        std::vector<ValuationPoint> points() const;

        /**
         * @brief Index of an exact date, if present.
         */
        std::optional<size_t> find_date_index(const Date &date) const;

        /** ===========================================
         *  Derived Series
         *  ===========================================
         */

        /**
         * @brief Restrict the series to an inclusive date window.
         * @param start_date Lower bound, or nullopt for the beginning of the series.
         * @param end_date Upper bound, or nullopt for the end of the series.
         * @return New series, possibly empty.
         * @throws std::invalid_argument If start_date > end_date.
         */
        ValuationSeries filter_by_date(const std::optional<Date> &start_date,
                                       const std::optional<Date> &end_date) const;

        /**
         * @brief Simple daily returns.
         *
         * A return is skipped (not reported as zero) when the previous value
         * is zero, so the result may be shorter than size() - 1.
         */
        ReturnSeries daily_returns() const;

    private:
        void validate() const;

        std::vector<Date> dates_;
        Eigen::VectorXd values_;
    };

} // namespace drawdown

#endif // DRAWDOWN_DATA_VALUATION_SERIES_HPP

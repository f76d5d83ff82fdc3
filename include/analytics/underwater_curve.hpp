/**
 * @file underwater_curve.hpp
 * @brief Per-date drawdown relative to the running peak.
 *
 * The underwater curve is the basis for charting and for the
 * max/current drawdown statistics. Percentages follow the engine-wide
 * convention: signed fractions, 0.0 at or above the peak and negative
 * below it (-0.10 means 10% under the peak).
 */

#ifndef DRAWDOWN_ANALYTICS_UNDERWATER_CURVE_HPP
#define DRAWDOWN_ANALYTICS_UNDERWATER_CURVE_HPP

#include "analytics/high_water_mark.hpp"
#include "core/date.hpp"
#include "data/valuation_series.hpp"

#include <optional>
#include <vector>

namespace drawdown
{
    namespace analytics
    {

        /**
         * @struct UnderwaterPoint
         * @brief Drawdown state of one observation.
         */
        struct UnderwaterPoint
        {
            Date date;               ///< Observation date
            double portfolio_value;  ///< Observed value
            double peak_value;       ///< Running peak at this date
            double drawdown_amount;  ///< peak_value - portfolio_value (>= 0)
            double drawdown_percent; ///< -drawdown_amount / peak_value (<= 0)
        };

        /**
         * @class UnderwaterCurveBuilder
         * @brief Zips a series with its high-water marks into underwater points.
         *
         * Division by a non-positive peak is guarded and yields 0.
         */
        class UnderwaterCurveBuilder
        {
        public:
            /**
             * @throws std::invalid_argument If marks and series differ in size.
             */
            UnderwaterCurveBuilder(const ValuationSeries &series,
                                   const HighWaterMarkTracker &marks);

            ~UnderwaterCurveBuilder() = default;

            const std::vector<UnderwaterPoint> &points() const { return points_; }
            size_t size() const { return points_.size(); }
            bool empty() const { return points_.empty(); }

            /**
             * @brief Index of the deepest point (earliest on ties).
             * @return Index, or nullopt for an empty curve.
             */
            std::optional<size_t> deepest_index() const;

            /**
             * @brief Fraction of observations strictly below the running peak.
             * @return Value in [0, 1]; 0 for an empty curve.
             */
            double time_underwater_fraction() const;

        private:
            std::vector<UnderwaterPoint> points_;
        };

    } // namespace analytics
} // namespace drawdown

#endif // DRAWDOWN_ANALYTICS_UNDERWATER_CURVE_HPP

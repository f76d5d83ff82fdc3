/**
 * @file high_water_mark.hpp
 * @brief Running peak (high-water mark) of a valuation series.
 */

#ifndef DRAWDOWN_ANALYTICS_HIGH_WATER_MARK_HPP
#define DRAWDOWN_ANALYTICS_HIGH_WATER_MARK_HPP

#include "core/date.hpp"
#include "data/valuation_series.hpp"

#include <vector>

namespace drawdown
{
    namespace analytics
    {

        /**
         * @struct HighWaterMark
         * @brief Maximum value observed at or before an observation date.
         */
        struct HighWaterMark
        {
            Date date;         ///< Observation date
            double peak_value; ///< max(value[0..i])
            Date peak_date;    ///< Earliest date achieving peak_value
        };

        /**
         * @class HighWaterMarkTracker
         * @brief Single forward pass producing one HighWaterMark per observation.
         *
         * The peak only moves on a strictly greater value, so a later
         * observation that merely matches the peak keeps the earlier peak date.
         *
         * Usage:
         * @code
         *   HighWaterMarkTracker hwm(series);
         *   double peak = hwm.at(i).peak_value;
         * @endcode
         */
        class HighWaterMarkTracker
        {
        public:
            explicit HighWaterMarkTracker(const ValuationSeries &series);

            ~HighWaterMarkTracker() = default;

            const std::vector<HighWaterMark> &marks() const { return marks_; }

            /**
             * @brief High-water mark at an observation index.
             * @throws std::out_of_range If index >= size().
             */
            const HighWaterMark &at(size_t index) const { return marks_.at(index); }

            size_t size() const { return marks_.size(); }
            bool empty() const { return marks_.empty(); }

        private:
            std::vector<HighWaterMark> marks_;
        };

    } // namespace analytics
} // namespace drawdown

#endif // DRAWDOWN_ANALYTICS_HIGH_WATER_MARK_HPP

/**
 * @file high_water_mark.cpp
 * @brief Implementation of HighWaterMarkTracker.
 */

#include "analytics/high_water_mark.hpp"

namespace drawdown
{
    namespace analytics
    {

        HighWaterMarkTracker::HighWaterMarkTracker(const ValuationSeries &series)
        {
            if (series.empty())
            {
                return;
            }

            marks_.reserve(series.size());

            double peak = series.value(0);
            Date peak_date = series.date(0);

            for (size_t i = 0; i < series.size(); ++i)
            {
                if (series.value(i) > peak)
                {
                    peak = series.value(i);
                    peak_date = series.date(i);
                }
                marks_.push_back(HighWaterMark{series.date(i), peak, peak_date});
            }
        }

    } // namespace analytics
} // namespace drawdown

/**
 * @file underwater_curve.cpp
 * @brief Implementation of UnderwaterCurveBuilder.
 */

#include "analytics/underwater_curve.hpp"

#include <stdexcept>
#include <string>

namespace drawdown
{
    namespace analytics
    {

        UnderwaterCurveBuilder::UnderwaterCurveBuilder(const ValuationSeries &series,
                                                       const HighWaterMarkTracker &marks)
        {
            if (series.size() != marks.size())
            {
                throw std::invalid_argument(
                    "High-water mark count (" + std::to_string(marks.size()) + ") must match series size (" + std::to_string(series.size()) + ")");
            }

            points_.reserve(series.size());
            for (size_t i = 0; i < series.size(); ++i)
            {
                double value = series.value(i);
                double peak = marks.at(i).peak_value;
                double amount = peak - value;

                double percent = 0.0;
                if (peak > 0.0 && amount > 0.0)
                {
                    percent = -amount / peak;
                }

                points_.push_back(UnderwaterPoint{series.date(i), value, peak, amount, percent});
            }
        }

        std::optional<size_t> UnderwaterCurveBuilder::deepest_index() const
        {
            if (points_.empty())
            {
                return std::nullopt;
            }

            size_t deepest = 0;
            for (size_t i = 1; i < points_.size(); ++i)
            {
                if (points_[i].drawdown_percent < points_[deepest].drawdown_percent)
                {
                    deepest = i;
                }
            }
            return deepest;
        }

        double UnderwaterCurveBuilder::time_underwater_fraction() const
        {
            if (points_.empty())
            {
                return 0.0;
            }

            size_t underwater = 0;
            for (const auto &point : points_)
            {
                if (point.drawdown_amount > 0.0)
                {
                    ++underwater;
                }
            }
            return static_cast<double>(underwater) / static_cast<double>(points_.size());
        }

    } // namespace analytics
} // namespace drawdown

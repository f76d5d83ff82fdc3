/**
 * @file valuation_series.cpp
 * @brief Implementation of ValuationSeries.
 */

#include "data/valuation_series.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace drawdown
{

    // ================================
    // Constructors
    // ================================

    ValuationSeries::ValuationSeries(const std::vector<ValuationPoint> &points)
        : values_(static_cast<Eigen::Index>(points.size()))
    {
        dates_.reserve(points.size());
        for (size_t i = 0; i < points.size(); ++i)
        {
            dates_.push_back(points[i].date);
            values_(static_cast<Eigen::Index>(i)) = points[i].value;
        }
        validate();
    }

    ValuationSeries::ValuationSeries(const std::vector<Date> &dates, const Eigen::VectorXd &values)
        : dates_(dates), values_(values)
    {
        if (static_cast<Eigen::Index>(dates_.size()) != values_.size())
        {
            throw std::invalid_argument(
                "Dates size (" + std::to_string(dates_.size()) + ") must match values size (" + std::to_string(values_.size()) + ")");
        }
        validate();
    }

    // ================================
    // Data Access
    // ================================

    ValuationPoint ValuationSeries::at(size_t index) const
    {
        if (index >= dates_.size())
        {
            throw std::out_of_range(
                "Index " + std::to_string(index) + " out of range for series of size " + std::to_string(dates_.size()));
        }
        return ValuationPoint{dates_[index], value(index)};
    }

    std::vector<ValuationPoint> ValuationSeries::points() const
    {
        std::vector<ValuationPoint> result;
        result.reserve(dates_.size());
        for (size_t i = 0; i < dates_.size(); ++i)
        {
            result.push_back(ValuationPoint{dates_[i], value(i)});
        }
        return result;
    }

    std::optional<size_t> ValuationSeries::find_date_index(const Date &date) const
    {
        auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
        if (it == dates_.end() || *it != date)
        {
            return std::nullopt;
        }
        return static_cast<size_t>(std::distance(dates_.begin(), it));
    }

    // ================================
    // Derived Series
    // ================================

    ValuationSeries ValuationSeries::filter_by_date(const std::optional<Date> &start_date,
                                                    const std::optional<Date> &end_date) const
    {
        if (start_date && end_date && *start_date > *end_date)
        {
            throw std::invalid_argument(
                "Start date (" + start_date->to_string() + ") must not be after end date (" + end_date->to_string() + ")");
        }

        auto first = start_date ? std::lower_bound(dates_.begin(), dates_.end(), *start_date) : dates_.begin();
        auto last = end_date ? std::upper_bound(dates_.begin(), dates_.end(), *end_date) : dates_.end();

        if (first >= last)
        {
            return ValuationSeries();
        }

        auto start_idx = std::distance(dates_.begin(), first);
        auto count = std::distance(first, last);

        std::vector<Date> filtered_dates(first, last);
        Eigen::VectorXd filtered_values = values_.segment(start_idx, count);

        return ValuationSeries(filtered_dates, filtered_values);
    }

    ReturnSeries ValuationSeries::daily_returns() const
    {
        ReturnSeries result;
        if (dates_.size() < 2)
        {
            result.returns.resize(0);
            return result;
        }

        std::vector<double> returns;
        returns.reserve(dates_.size() - 1);
        result.dates.reserve(dates_.size() - 1);

        for (size_t i = 1; i < dates_.size(); ++i)
        {
            double previous = value(i - 1);
            if (previous == 0.0)
            {
                continue; // undefined, not zero
            }
            returns.push_back(value(i) / previous - 1.0);
            result.dates.push_back(dates_[i]);
        }

        result.returns = Eigen::Map<const Eigen::VectorXd>(returns.data(), static_cast<Eigen::Index>(returns.size()));
        return result;
    }

    // ================================
    // Validation
    // ================================

    void ValuationSeries::validate() const
    {
        for (size_t i = 0; i < dates_.size(); ++i)
        {
            double v = value(i);
            if (!std::isfinite(v))
            {
                throw InvalidSeriesError(
                    "Non-finite portfolio value on " + dates_[i].to_string(), dates_[i], v);
            }
            if (v < 0.0)
            {
                std::ostringstream oss;
                oss << "Negative portfolio value " << v << " on " << dates_[i];
                throw InvalidSeriesError(oss.str(), dates_[i], v);
            }
            if (i > 0)
            {
                if (dates_[i] == dates_[i - 1])
                {
                    throw InvalidSeriesError(
                        "Duplicate date in valuation series: " + dates_[i].to_string(), dates_[i], v);
                }
                if (dates_[i] < dates_[i - 1])
                {
                    throw InvalidSeriesError(
                        "Valuation series is not sorted: " + dates_[i].to_string() + " follows " + dates_[i - 1].to_string(),
                        dates_[i], v);
                }
            }
        }
    }

} // namespace drawdown

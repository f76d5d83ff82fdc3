/**
 * @file drawdown_analytics.cpp
 * @brief Implementation of the DrawdownAnalyticsFacade and its result.
 */

#include "analytics/drawdown_analytics.hpp"
#include "analytics/high_water_mark.hpp"
#include "core/errors.hpp"
#include "core/json_support.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace drawdown
{
    namespace analytics
    {

        namespace
        {
            /// An open episode may start at a recovery that only matched the peak.
            CurrentDrawdown make_current(const UnderwaterPoint &last, const HighWaterMark &mark,
                                         const std::optional<DrawdownEvent> &open_event)
            {
                CurrentDrawdown current;
                current.current_drawdown_percent = last.drawdown_percent;
                current.current_drawdown_amount = last.drawdown_amount;
                current.peak_value = mark.peak_value;
                current.peak_date = open_event ? open_event->peak_date : mark.peak_date;
                current.current_value = last.portfolio_value;
                current.current_date = last.date;
                current.days_in_drawdown = last.drawdown_amount > 0.0 ? last.date - current.peak_date : 0;
                return current;
            }
        } // anonymous namespace

        // ===================================================================
        // AnalyticsQuery
        // ===================================================================

        AnalyticsQuery AnalyticsQuery::for_period(const std::string &period, const Date &as_of)
        {
            AnalyticsQuery query;
            query.end_date = as_of;
            query.as_of = as_of;

            if (period == "1D")
                query.start_date = as_of.add_days(-1);
            else if (period == "7D")
                query.start_date = as_of.add_days(-7);
            else if (period == "1M")
                query.start_date = as_of.add_days(-30);
            else if (period == "3M")
                query.start_date = as_of.add_days(-90);
            else if (period == "6M")
                query.start_date = as_of.add_days(-180);
            else if (period == "1Y")
                query.start_date = as_of.add_days(-365);
            else if (period == "YTD")
                query.start_date = Date(as_of.year(), 1, 1);
            else if (period != "ALL")
            {
                throw std::invalid_argument(
                    "Unknown period '" + period + "', expected one of 1D, 7D, 1M, 3M, 6M, 1Y, YTD, ALL");
            }

            return query;
        }

        void AnalyticsQuery::validate() const
        {
            if (start_date && end_date && *start_date > *end_date)
            {
                throw std::invalid_argument(
                    "Start date (" + start_date->to_string() + ") must not be after end date (" + end_date->to_string() + ")");
            }
            if (!std::isfinite(min_drawdown_percent) || min_drawdown_percent < 0.0)
            {
                throw std::invalid_argument(
                    "Expected non-negative value for parameter 'min_drawdown_percent', got: " + std::to_string(min_drawdown_percent));
            }
            if (top_events < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'top_events', got: " + std::to_string(top_events));
            }
            if (thresholds)
            {
                thresholds->validate();
            }
        }

        // ===================================================================
        // AnalyticsResult
        // ===================================================================

        std::vector<DrawdownEvent> AnalyticsResult::top_drawdowns(int n) const
        {
            return analytics::top_drawdowns(events, n);
        }

        std::string AnalyticsResult::to_json(int indent) const
        {
            nlohmann::json j;

            j["window"]["start_date"] = optional_to_json(start_date);
            j["window"]["end_date"] = optional_to_json(end_date);
            j["window"]["num_observations"] = underwater_curve.size();

            j["current_drawdown"] = optional_to_json(current);
            j["events"] = events;
            j["has_open_event"] = has_open_event;
            j["underwater_curve"] = underwater_curve;
            j["statistics"] = statistics;
            j["benchmark"] = optional_to_json(benchmark);
            j["alerts"] = alerts;
            j["thresholds"] = thresholds ? thresholds->to_json() : nlohmann::json(nullptr);

            return j.dump(indent);
        }

        std::string AnalyticsResult::report() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Drawdown Analytics Report\n";
            oss << "=========================\n\n";

            if (!start_date || !end_date)
            {
                oss << "No observations in the requested window.\n";
                return oss.str();
            }

            oss << "Window: " << *start_date << " to " << *end_date
                << " (" << underwater_curve.size() << " observations)\n\n";

            if (current)
            {
                oss << "Current Drawdown:\n";
                oss << "  Drawdown:               " << std::setprecision(2)
                    << current->current_drawdown_percent * 100.0 << "% ("
                    << current->current_drawdown_amount << ")\n";
                oss << "  Peak:                   " << current->peak_value
                    << " on " << current->peak_date << "\n";
                oss << "  Current Value:          " << current->current_value
                    << " on " << current->current_date << "\n";
                oss << "  Days in Drawdown:       " << current->days_in_drawdown << "\n\n";
            }

            oss << format_statistics(statistics) << "\n";

            if (benchmark)
            {
                oss << format_comparison(*benchmark) << "\n";
            }

            int events_to_show = std::min(top_events, static_cast<int>(events.size()));
            if (events_to_show > 0)
            {
                auto sorted = top_drawdowns(events_to_show);

                oss << "Top " << events_to_show << " Drawdowns:\n";
                oss << "  " << std::left
                    << std::setw(6) << "Rank"
                    << std::setw(10) << "Depth"
                    << std::setw(14) << "Peak Date"
                    << std::setw(14) << "Trough Date"
                    << std::setw(14) << "Recovery"
                    << std::setw(10) << "Decline"
                    << std::setw(10) << "Recovery"
                    << "\n";
                oss << "  " << std::string(78, '-') << "\n";

                for (size_t i = 0; i < sorted.size(); ++i)
                {
                    const auto &e = sorted[i];
                    std::ostringstream depth;
                    depth << std::fixed << std::setprecision(2) << -e.max_drawdown_percent * 100.0 << "%";

                    oss << "  " << std::left
                        << std::setw(6) << (i + 1)
                        << std::setw(10) << depth.str()
                        << std::setw(14) << e.peak_date.to_string()
                        << std::setw(14) << e.trough_date.to_string()
                        << std::setw(14) << (e.recovery_date ? e.recovery_date->to_string() : "Unrecovered")
                        << std::setw(10) << e.duration_days;
                    if (e.recovery_days)
                    {
                        oss << std::setw(10) << *e.recovery_days;
                    }
                    else
                    {
                        oss << std::setw(10) << "N/A";
                    }
                    oss << "\n";
                }
                oss << std::right << "\n";
            }

            if (thresholds)
            {
                oss << "Alerts:\n";
                if (alerts.empty())
                {
                    oss << "  None (warning threshold " << std::setprecision(2)
                        << thresholds->warning_pct << "%)\n";
                }
                for (const auto &alert : alerts)
                {
                    oss << "  " << alert.message << "\n";
                }
            }

            return oss.str();
        }

        void to_json(nlohmann::json &j, const DrawdownEvent &event)
        {
            j = nlohmann::json::object();
            j["peak_value"] = event.peak_value;
            j["peak_date"] = event.peak_date;
            j["trough_value"] = event.trough_value;
            j["trough_date"] = event.trough_date;
            j["recovery_value"] = optional_to_json(event.recovery_value);
            j["recovery_date"] = optional_to_json(event.recovery_date);
            j["max_drawdown_amount"] = event.max_drawdown_amount;
            j["max_drawdown_percent"] = event.max_drawdown_percent;
            j["duration_days"] = event.duration_days;
            j["recovery_days"] = optional_to_json(event.recovery_days);
            j["total_days"] = optional_to_json(event.total_days);
            j["is_recovered"] = event.is_recovered;
        }

        void to_json(nlohmann::json &j, const UnderwaterPoint &point)
        {
            j = nlohmann::json::object();
            j["date"] = point.date;
            j["portfolio_value"] = point.portfolio_value;
            j["peak_value"] = point.peak_value;
            j["drawdown_amount"] = point.drawdown_amount;
            j["drawdown_percent"] = point.drawdown_percent;
        }

        void to_json(nlohmann::json &j, const CurrentDrawdown &current)
        {
            j = nlohmann::json::object();
            j["current_drawdown_percent"] = current.current_drawdown_percent;
            j["current_drawdown_amount"] = current.current_drawdown_amount;
            j["peak_value"] = current.peak_value;
            j["peak_date"] = current.peak_date;
            j["current_value"] = current.current_value;
            j["current_date"] = current.current_date;
            j["days_in_drawdown"] = current.days_in_drawdown;
        }

        // ===================================================================
        // DrawdownAnalyticsFacade
        // ===================================================================

        DrawdownAnalyticsFacade::DrawdownAnalyticsFacade(const StatisticsSettings &settings)
            : settings_(settings)
        {
            settings_.validate();
        }

        AnalyticsResult DrawdownAnalyticsFacade::analyze(const ValuationSeries &series,
                                                         const AnalyticsQuery &query) const
        {
            query.validate();

            ValuationSeries window = series.filter_by_date(query.start_date, query.end_date);
            validate_series(window);

            HighWaterMarkTracker marks(window);
            DrawdownSegmenter segmenter(window, marks);
            UnderwaterCurveBuilder curve(window, marks);

            AnalyticsResult result;
            result.events = filter_by_magnitude(segmenter.events(), query.min_drawdown_percent);
            result.has_open_event = !result.events.empty() && !result.events.back().is_recovered;
            result.underwater_curve = curve.points();
            result.statistics = PerformanceMetrics(window, marks, curve, result.events, settings_).statistics();
            result.thresholds = query.thresholds;
            result.top_events = query.top_events;

            if (window.empty())
            {
                return result;
            }

            result.start_date = window.front().date;
            result.end_date = window.back().date;
            result.current = make_current(curve.points().back(), marks.at(marks.size() - 1),
                                          segmenter.open_event());

            if (query.benchmark)
            {
                result.benchmark = BenchmarkAnalysis(window, *query.benchmark, settings_.trading_days_per_year).comparison();
            }

            if (query.thresholds)
            {
                alerts::AlertEvaluator evaluator(*query.thresholds);
                double magnitude = result.current->current_drawdown_amount * 100.0 / result.current->peak_value;
                result.alerts = evaluator.evaluate(magnitude, query.as_of.value_or(window.back().date));
            }

            return result;
        }

        AnalyticsResult DrawdownAnalyticsFacade::analyze(const ValuationSeriesProvider &provider,
                                                         const std::string &account_id,
                                                         const AnalyticsQuery &query) const
        {
            query.validate();
            ValuationSeries series = provider.load_series(account_id, query.start_date, query.end_date);
            return analyze(series, query);
        }

        CurrentDrawdown DrawdownAnalyticsFacade::current_drawdown(const ValuationSeries &series) const
        {
            if (series.empty())
            {
                throw InvalidSeriesError("Cannot compute the current drawdown of an empty series");
            }
            validate_series(series);

            HighWaterMarkTracker marks(series);
            UnderwaterCurveBuilder curve(series, marks);
            DrawdownSegmenter segmenter(series, marks);
            return make_current(curve.points().back(), marks.at(marks.size() - 1),
                                segmenter.open_event());
        }

        void DrawdownAnalyticsFacade::validate_series(const ValuationSeries &series)
        {
            // Ordering and sign are enforced by ValuationSeries itself. The running
            // peak starts at the first value, so it is positive everywhere iff the
            // first value is.
            if (!series.empty() && series.value(0) <= 0.0)
            {
                std::ostringstream oss;
                oss << "Series must start at a positive value for percentage drawdown, got "
                    << series.value(0) << " on " << series.date(0);
                throw InvalidSeriesError(oss.str(), series.date(0), series.value(0));
            }
        }

    } // namespace analytics
} // namespace drawdown

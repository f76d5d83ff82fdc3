/**
 * @file drawdown_analytics.hpp
 * @brief Entry point of the drawdown engine.
 *
 * DrawdownAnalyticsFacade runs the whole pipeline for one request:
 *
 *   series -> window -> HighWaterMarkTracker -> DrawdownSegmenter
 *          -> UnderwaterCurveBuilder -> PerformanceMetrics
 *          -> BenchmarkAnalysis (optional) -> AlertEvaluator (optional)
 *
 * and returns a single AnalyticsResult. The facade keeps no state
 * between calls; the same series and query always give the same result,
 * so concurrent calls need no coordination.
 *
 * Validation happens before any computation. A failure aborts the
 * request with an exception and no partial result.
 */

#ifndef DRAWDOWN_ANALYTICS_DRAWDOWN_ANALYTICS_HPP
#define DRAWDOWN_ANALYTICS_DRAWDOWN_ANALYTICS_HPP

#include "alerts/alert_evaluator.hpp"
#include "analytics/benchmark_analysis.hpp"
#include "analytics/drawdown_segmenter.hpp"
#include "analytics/performance_metrics.hpp"
#include "analytics/underwater_curve.hpp"
#include "core/date.hpp"
#include "data/series_provider.hpp"
#include "data/valuation_series.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace drawdown
{
    namespace analytics
    {

        /**
         * @struct AnalyticsQuery
         * @brief Window and options of one analytics request.
         */
        struct AnalyticsQuery
        {
            std::optional<Date> start_date;                         ///< Inclusive window start
            std::optional<Date> end_date;                           ///< Inclusive window end
            double min_drawdown_percent = 0.0;                      ///< Event materiality, unsigned percent (5.0 = 5%)
            std::optional<ValuationSeries> benchmark;               ///< Series to compare against
            std::optional<alerts::AlertThresholdConfig> thresholds; ///< Enables alert evaluation
            std::optional<Date> as_of;                              ///< Alert timestamp; last observation if unset
            int top_events = 5;                                     ///< Events listed in report()

            /**
             * @brief Query covering a named trailing period ending at as_of.
             *
             * Periods: 1D, 7D, 1M (30 days), 3M (90), 6M (180), 1Y (365),
             * YTD (from January 1st of as_of's year) and ALL.
             *
             * @throws std::invalid_argument For an unknown period.
             */
            static AnalyticsQuery for_period(const std::string &period, const Date &as_of);

            /**
             * @throws std::invalid_argument For an inverted window, a negative or
             *         non-finite min_drawdown_percent, or top_events < 1.
             * @throws InvalidThresholdConfigError For invalid thresholds.
             */
            void validate() const;
        };

        /**
         * @struct CurrentDrawdown
         * @brief Drawdown state at the last observation of the window.
         */
        struct CurrentDrawdown
        {
            double current_drawdown_percent; ///< <= 0
            double current_drawdown_amount;  ///< >= 0
            double peak_value;
            Date peak_date;
            double current_value;
            Date current_date;
            int days_in_drawdown; ///< current_date - peak_date, 0 at a peak
        };

        /**
         * @struct AnalyticsResult
         * @brief Everything computed for one request.
         */
        struct AnalyticsResult
        {
            std::optional<Date> start_date; ///< First observation in the window
            std::optional<Date> end_date;   ///< Last observation in the window

            std::optional<CurrentDrawdown> current; ///< Empty for an empty window
            std::vector<DrawdownEvent> events;      ///< Chronological, materiality-filtered
            bool has_open_event = false;            ///< Last listed event is unrecovered
            std::vector<UnderwaterPoint> underwater_curve;
            PerformanceStatistics statistics;
            std::optional<BenchmarkComparison> benchmark;
            std::vector<alerts::Alert> alerts;                      ///< Lowest severity first
            std::optional<alerts::AlertThresholdConfig> thresholds; ///< Echo of the query
            int top_events = 5;

            /**
             * @brief The n deepest listed events, deepest first.
             * @throws std::invalid_argument If n < 1.
             */
            std::vector<DrawdownEvent> top_drawdowns(int n) const;

            /** @brief JSON document consumed by the API layer. */
            std::string to_json(int indent = 2) const;

            /** @brief Human readable multi-section report. */
            std::string report() const;
        };

        void to_json(nlohmann::json &j, const DrawdownEvent &event);
        void to_json(nlohmann::json &j, const UnderwaterPoint &point);
        void to_json(nlohmann::json &j, const CurrentDrawdown &current);

        /**
         * @class DrawdownAnalyticsFacade
         * @brief Orchestrates the engine for one series and query.
         *
         * Usage:
         * @code
         *   DrawdownAnalyticsFacade facade;
         *   auto query = AnalyticsQuery::for_period("1Y", Date::parse("2024-12-31"));
         *   query.thresholds = alerts::AlertThresholdConfig{};
         *   AnalyticsResult result = facade.analyze(series, query);
         *   std::cout << result.report();
         * @endcode
         */
        class DrawdownAnalyticsFacade
        {
        public:
            /**
             * @throws std::invalid_argument If the settings are invalid.
             */
            explicit DrawdownAnalyticsFacade(const StatisticsSettings &settings = StatisticsSettings());

            /**
             * @brief Analyze a series over the query window.
             *
             * An empty window gives an empty result with undefined statistics.
             *
             * @throws InvalidSeriesError If the window starts at a non-positive value.
             * @throws InvalidThresholdConfigError If the query thresholds are invalid.
             * @throws std::invalid_argument If the query is otherwise invalid.
             */
            AnalyticsResult analyze(const ValuationSeries &series, const AnalyticsQuery &query) const;

            /**
             * @brief Load the window from a provider, then analyze it.
             */
            AnalyticsResult analyze(const ValuationSeriesProvider &provider,
                                    const std::string &account_id,
                                    const AnalyticsQuery &query) const;

            /**
             * @brief Current drawdown of a whole series.
             * @throws InvalidSeriesError If the series is empty or starts at a non-positive value.
             */
            CurrentDrawdown current_drawdown(const ValuationSeries &series) const;

            const StatisticsSettings &settings() const { return settings_; }

        private:
            static void validate_series(const ValuationSeries &series);

            StatisticsSettings settings_;
        };

    } // namespace analytics
} // namespace drawdown

#endif // DRAWDOWN_ANALYTICS_DRAWDOWN_ANALYTICS_HPP

/**
 * @file performance_metrics.hpp
 * @brief Aggregate return, risk and drawdown statistics of a valuation series.
 *
 * Statistics are a pure function of the series, its underwater curve,
 * the (filtered) drawdown events and the settings. Anything that cannot
 * be computed from the available history is reported as an empty
 * optional rather than zero, so "insufficient history" stays distinct
 * from "no risk".
 *
 * Volatility-style figures annualize with trading_days_per_year
 * (default 252); annualized_return compounds over calendar days (365).
 */

#ifndef DRAWDOWN_ANALYTICS_PERFORMANCE_METRICS_HPP
#define DRAWDOWN_ANALYTICS_PERFORMANCE_METRICS_HPP

#include "analytics/drawdown_segmenter.hpp"
#include "analytics/high_water_mark.hpp"
#include "analytics/underwater_curve.hpp"
#include "core/date.hpp"
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
         * @struct StatisticsSettings
         * @brief Parameters of the risk-adjusted metrics.
         */
        struct StatisticsSettings
        {
            double risk_free_rate = 0.0;     ///< Annualized risk-free rate as a fraction
            int trading_days_per_year = 252; ///< Annualization factor for daily returns

            /**
             * @throws std::invalid_argument If trading_days_per_year <= 0 or the rate is not finite.
             */
            void validate() const;
        };

        /**
         * @struct MaxDrawdownPeriod
         * @brief Peak and trough dates of the deepest underwater point.
         */
        struct MaxDrawdownPeriod
        {
            Date peak_date;
            Date trough_date;
        };

        /**
         * @struct PerformanceStatistics
         * @brief Aggregate statistics record.
         *
         * Percentages are signed fractions (drawdowns are <= 0).
         */
        struct PerformanceStatistics
        {
            int total_events = 0;                           ///< Events after materiality filtering
            std::optional<double> max_drawdown_percent;     ///< Minimum of the underwater curve
            std::optional<double> max_drawdown_amount;      ///< Amount at that point
            double average_drawdown_percent = 0.0;          ///< Mean depth of closed events
            double average_recovery_days = 0.0;             ///< Mean recovery_days of closed events
            int longest_drawdown_days = 0;                  ///< Max duration_days of closed events
            std::optional<double> current_drawdown_percent; ///< Last point of the underwater curve
            std::optional<double> volatility_annualized;    ///< Sample std of daily returns * sqrt(N)
            std::optional<double> sharpe_ratio;             ///< (mean * N - rf) / volatility
            std::optional<double> time_weighted_return;     ///< prod(1 + r) - 1

            std::optional<double> total_return;             ///< last / first - 1
            std::optional<double> annualized_return;        ///< Geometric, 365-day basis
            std::optional<double> sortino_ratio;            ///< (mean * N - rf) / downside deviation
            double time_in_drawdown_fraction = 0.0;         ///< Share of observations below peak
            int unrecovered_events = 0;                     ///< Events still open
            std::optional<double> last_7_days;              ///< Return over the last 7 observations
            std::optional<double> last_30_days;             ///< Return over the last 30 observations
            std::optional<MaxDrawdownPeriod> max_drawdown_period;

            int num_observations = 0;                       ///< Points in the window
            int num_returns = 0;                            ///< Defined daily returns
        };

        void to_json(nlohmann::json &j, const PerformanceStatistics &stats);

        /**
         * @brief Formatted multi-line summary; undefined figures print as N/A.
         */
        std::string format_statistics(const PerformanceStatistics &stats);

        /**
         * @class PerformanceMetrics
         * @brief Computes a PerformanceStatistics record.
         *
         * Usage:
         * @code
         *   HighWaterMarkTracker hwm(series);
         *   UnderwaterCurveBuilder curve(series, hwm);
         *   DrawdownSegmenter segmenter(series, hwm);
         *   PerformanceMetrics metrics(series, hwm, curve, segmenter.events());
         *   auto sharpe = metrics.statistics().sharpe_ratio;
         * @endcode
         *
         * Thread safety: Instances are immutable after construction.
         */
        class PerformanceMetrics
        {
        public:
            // ---------------------------------------------------------------
            // Constructors
            // ---------------------------------------------------------------

            /**
             * @brief Compute statistics for a series.
             * @param series Valuation series of the analysis window (may be empty).
             * @param marks High-water marks of the same series.
             * @param curve Underwater curve of the same series.
             * @param events Events the aggregates are computed over.
             * @param settings Risk-free rate and annualization factor.
             * @throws std::invalid_argument If settings are invalid or the
             *         series, marks and curve differ in size.
             */
            PerformanceMetrics(const ValuationSeries &series,
                               const HighWaterMarkTracker &marks,
                               const UnderwaterCurveBuilder &curve,
                               const std::vector<DrawdownEvent> &events,
                               const StatisticsSettings &settings = StatisticsSettings());

            ~PerformanceMetrics() = default;

            const PerformanceStatistics &statistics() const { return stats_; }
            const StatisticsSettings &settings() const { return settings_; }

            // ---------------------------------------------------------------
            // Export
            // ---------------------------------------------------------------

            /** @brief Same as format_statistics(statistics()). */
            std::string summary() const;

        private:
            void compute_return_metrics(const ValuationSeries &series);
            void compute_drawdown_metrics(const HighWaterMarkTracker &marks,
                                          const UnderwaterCurveBuilder &curve);
            void compute_event_aggregates(const std::vector<DrawdownEvent> &events);

            StatisticsSettings settings_;
            PerformanceStatistics stats_;
        };

        /**
         * @brief Return between two observations counted from the end of the series.
         * @param lookback Number of observations in the window (>= 2).
         * @return last / value[size - lookback] - 1, or nullopt if the series is
         *         shorter than lookback or the start value is 0.
         */
        std::optional<double> trailing_return(const ValuationSeries &series, size_t lookback);

    } // namespace analytics
} // namespace drawdown

#endif // DRAWDOWN_ANALYTICS_PERFORMANCE_METRICS_HPP

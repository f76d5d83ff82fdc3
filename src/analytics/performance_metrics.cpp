/**
 * @file performance_metrics.cpp
 * @brief Implementation of the PerformanceMetrics class.
 *
 * Daily returns skip periods whose starting value is zero. Volatility
 * uses the sample (n - 1) standard deviation and needs at least two
 * returns; a zero volatility is reported as computed but leaves the
 * Sharpe ratio undefined.
 */

#include "analytics/performance_metrics.hpp"
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

            const double EPSILON = 1e-18;

            void print_percent(std::ostringstream &oss, const std::optional<double> &value)
            {
                if (value)
                {
                    oss << std::setprecision(4) << *value * 100.0 << "%\n";
                }
                else
                {
                    oss << "N/A\n";
                }
            }

            void print_ratio(std::ostringstream &oss, const std::optional<double> &value)
            {
                if (value)
                {
                    oss << std::setprecision(4) << *value << "\n";
                }
                else
                {
                    oss << "N/A\n";
                }
            }

        } // anonymous namespace

        // ===================================================================
        // StatisticsSettings
        // ===================================================================

        void StatisticsSettings::validate() const
        {
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year));
            }
            if (!std::isfinite(risk_free_rate))
            {
                throw std::invalid_argument("Parameter 'risk_free_rate' must be finite");
            }
        }

        // ===================================================================
        // Constructors
        // ===================================================================

        PerformanceMetrics::PerformanceMetrics(const ValuationSeries &series,
                                               const HighWaterMarkTracker &marks,
                                               const UnderwaterCurveBuilder &curve,
                                               const std::vector<DrawdownEvent> &events,
                                               const StatisticsSettings &settings)
            : settings_(settings)
        {
            settings_.validate();

            if (marks.size() != series.size() || curve.size() != series.size())
            {
                throw std::invalid_argument(
                    "Series size (" + std::to_string(series.size()) + "), high-water mark count (" + std::to_string(marks.size()) + ") and curve size (" + std::to_string(curve.size()) + ") must match");
            }

            stats_.num_observations = static_cast<int>(series.size());

            compute_return_metrics(series);
            compute_drawdown_metrics(marks, curve);
            compute_event_aggregates(events);
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        void PerformanceMetrics::compute_return_metrics(const ValuationSeries &series)
        {
            if (series.size() >= 2)
            {
                double first = series.front().value;
                if (first > 0.0)
                {
                    stats_.total_return = series.back().value / first - 1.0;

                    int days = series.back().date - series.front().date;
                    if (days > 0)
                    {
                        // CAGR on a calendar-day basis
                        stats_.annualized_return = std::pow(1.0 + *stats_.total_return, 365.0 / static_cast<double>(days)) - 1.0;
                    }
                }
            }

            stats_.last_7_days = trailing_return(series, 7);
            stats_.last_30_days = trailing_return(series, 30);

            ReturnSeries daily = series.daily_returns();
            const Eigen::VectorXd &r = daily.returns;
            Eigen::Index n = r.size();
            stats_.num_returns = static_cast<int>(n);

            if (n == 0)
            {
                return;
            }

            stats_.time_weighted_return = (r.array() + 1.0).prod() - 1.0;

            if (n < 2)
            {
                return;
            }

            double periods = static_cast<double>(settings_.trading_days_per_year);
            double mean = r.mean();
            double variance = (r.array() - mean).square().sum() / static_cast<double>(n - 1);
            double volatility = std::sqrt(variance) * std::sqrt(periods);
            stats_.volatility_annualized = volatility;

            if (volatility > EPSILON)
            {
                stats_.sharpe_ratio = (mean * periods - settings_.risk_free_rate) / volatility;
            }

            // Downside deviation: root mean square of the negative returns
            Eigen::ArrayXd negative = r.array().min(0.0);
            Eigen::Index downside_count = (r.array() < 0.0).count();
            if (downside_count > 0)
            {
                double downside_deviation = std::sqrt(negative.square().sum() / static_cast<double>(downside_count)) * std::sqrt(periods);
                if (downside_deviation > EPSILON)
                {
                    stats_.sortino_ratio = (mean * periods - settings_.risk_free_rate) / downside_deviation;
                }
            }
        }

        void PerformanceMetrics::compute_drawdown_metrics(const HighWaterMarkTracker &marks,
                                                          const UnderwaterCurveBuilder &curve)
        {
            if (curve.empty())
            {
                return;
            }

            const auto &points = curve.points();
            stats_.current_drawdown_percent = points.back().drawdown_percent;
            stats_.time_in_drawdown_fraction = curve.time_underwater_fraction();

            size_t deepest = *curve.deepest_index();
            stats_.max_drawdown_percent = points[deepest].drawdown_percent;
            stats_.max_drawdown_amount = points[deepest].drawdown_amount;

            if (points[deepest].drawdown_percent < 0.0)
            {
                stats_.max_drawdown_period = MaxDrawdownPeriod{marks.at(deepest).peak_date, points[deepest].date};
            }
        }

        void PerformanceMetrics::compute_event_aggregates(const std::vector<DrawdownEvent> &events)
        {
            stats_.total_events = static_cast<int>(events.size());

            double sum_percent = 0.0;
            double sum_recovery = 0.0;
            int closed = 0;

            for (const auto &event : events)
            {
                if (!event.is_recovered)
                {
                    ++stats_.unrecovered_events;
                    continue;
                }

                ++closed;
                sum_percent += event.max_drawdown_percent;
                sum_recovery += static_cast<double>(event.recovery_days.value_or(0));
                stats_.longest_drawdown_days = std::max(stats_.longest_drawdown_days, event.duration_days);
            }

            if (closed > 0)
            {
                stats_.average_drawdown_percent = sum_percent / static_cast<double>(closed);
                stats_.average_recovery_days = sum_recovery / static_cast<double>(closed);
            }
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string PerformanceMetrics::summary() const
        {
            return format_statistics(stats_);
        }

        // ===================================================================
        // Free functions
        // ===================================================================

        std::string format_statistics(const PerformanceStatistics &stats)
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Performance Summary\n";
            oss << "===================\n";
            oss << "\n";

            oss << "Return Metrics:\n";
            oss << "  Total Return:          ";
            print_percent(oss, stats.total_return);
            oss << "  Annualized Return:     ";
            print_percent(oss, stats.annualized_return);
            oss << "  Time-Weighted Return:  ";
            print_percent(oss, stats.time_weighted_return);
            oss << "  Last 7 Observations:   ";
            print_percent(oss, stats.last_7_days);
            oss << "  Last 30 Observations:  ";
            print_percent(oss, stats.last_30_days);
            oss << "\n";

            oss << "Risk Metrics:\n";
            oss << "  Annualized Vol:        ";
            print_percent(oss, stats.volatility_annualized);
            oss << "  Max Drawdown:          ";
            print_percent(oss, stats.max_drawdown_percent);
            oss << "  Current Drawdown:      ";
            print_percent(oss, stats.current_drawdown_percent);
            oss << "  Time in Drawdown:      " << std::setprecision(2)
                << stats.time_in_drawdown_fraction * 100.0 << "%\n";
            oss << "\n";

            oss << "Risk-Adjusted Metrics:\n";
            oss << "  Sharpe Ratio:          ";
            print_ratio(oss, stats.sharpe_ratio);
            oss << "  Sortino Ratio:         ";
            print_ratio(oss, stats.sortino_ratio);
            oss << "\n";

            oss << "Drawdown Events:\n";
            oss << "  Total Events:          " << stats.total_events << "\n";
            oss << "  Unrecovered Events:    " << stats.unrecovered_events << "\n";
            oss << "  Average Depth:         " << std::setprecision(4)
                << stats.average_drawdown_percent * 100.0 << "%\n";
            oss << "  Avg Recovery Duration: " << std::setprecision(1)
                << stats.average_recovery_days << " days\n";
            oss << "  Longest Decline:       " << stats.longest_drawdown_days << " days\n";

            return oss.str();
        }

        std::optional<double> trailing_return(const ValuationSeries &series, size_t lookback)
        {
            if (lookback < 2 || series.size() < lookback)
            {
                return std::nullopt;
            }

            double start = series.value(series.size() - lookback);
            if (start <= 0.0)
            {
                return std::nullopt;
            }
            return series.back().value / start - 1.0;
        }

        void to_json(nlohmann::json &j, const PerformanceStatistics &stats)
        {
            j = nlohmann::json::object();
            j["total_events"] = stats.total_events;
            j["max_drawdown_percent"] = optional_to_json(stats.max_drawdown_percent);
            j["max_drawdown_amount"] = optional_to_json(stats.max_drawdown_amount);
            j["average_drawdown_percent"] = stats.average_drawdown_percent;
            j["average_recovery_days"] = stats.average_recovery_days;
            j["longest_drawdown_days"] = stats.longest_drawdown_days;
            j["current_drawdown_percent"] = optional_to_json(stats.current_drawdown_percent);
            j["volatility_annualized"] = optional_to_json(stats.volatility_annualized);
            j["sharpe_ratio"] = optional_to_json(stats.sharpe_ratio);
            j["time_weighted_return"] = optional_to_json(stats.time_weighted_return);

            j["total_return"] = optional_to_json(stats.total_return);
            j["annualized_return"] = optional_to_json(stats.annualized_return);
            j["sortino_ratio"] = optional_to_json(stats.sortino_ratio);
            j["time_in_drawdown_fraction"] = stats.time_in_drawdown_fraction;
            j["unrecovered_events"] = stats.unrecovered_events;
            j["periodic_returns"]["last_7_days"] = optional_to_json(stats.last_7_days);
            j["periodic_returns"]["last_30_days"] = optional_to_json(stats.last_30_days);

            if (stats.max_drawdown_period)
            {
                j["max_drawdown_period"]["peak_date"] = stats.max_drawdown_period->peak_date;
                j["max_drawdown_period"]["trough_date"] = stats.max_drawdown_period->trough_date;
            }
            else
            {
                j["max_drawdown_period"] = nullptr;
            }

            j["num_observations"] = stats.num_observations;
            j["num_returns"] = stats.num_returns;
        }

    } // namespace analytics
} // namespace drawdown

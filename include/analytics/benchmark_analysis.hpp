/**
 * @file benchmark_analysis.hpp
 * @brief Portfolio performance relative to a benchmark valuation series.
 *
 * The two series are aligned on their common dates before any return is
 * computed, so a benchmark with holidays or a different start date can
 * be compared directly. Beta and correlation use sample moments:
 *
 *   beta = cov(R_p, R_b) / var(R_b)
 *   corr = cov(R_p, R_b) / (std(R_p) * std(R_b))
 */

#ifndef DRAWDOWN_ANALYTICS_BENCHMARK_ANALYSIS_HPP
#define DRAWDOWN_ANALYTICS_BENCHMARK_ANALYSIS_HPP

#include "data/valuation_series.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace drawdown
{
    namespace analytics
    {

        /**
         * @struct BenchmarkComparison
         * @brief Relative performance record; undefined figures are empty.
         */
        struct BenchmarkComparison
        {
            int aligned_observations = 0;             ///< Dates present in both series
            std::optional<double> portfolio_return;   ///< Time-weighted return over aligned dates
            std::optional<double> benchmark_return;   ///< Time-weighted return of the benchmark
            std::optional<double> relative_return;    ///< portfolio_return - benchmark_return
            std::optional<bool> outperformed;         ///< relative_return > 0
            std::optional<double> beta;               ///< Market sensitivity
            std::optional<double> correlation;        ///< Pearson correlation of daily returns
            std::optional<double> tracking_error;     ///< Annualized std of excess returns
            std::optional<double> information_ratio;  ///< Annualized excess return / tracking error
        };

        void to_json(nlohmann::json &j, const BenchmarkComparison &comparison);

        std::string format_comparison(const BenchmarkComparison &comparison);

        /**
         * @class BenchmarkAnalysis
         * @brief Computes a BenchmarkComparison from two valuation series.
         *
         * Usage:
         * @code
         *   BenchmarkAnalysis bench(portfolio, spy);
         *   if (bench.comparison().beta) { ... }
         * @endcode
         *
         * Thread safety: Instances are immutable after construction.
         */
        class BenchmarkAnalysis
        {
        public:
            /**
             * @param portfolio Portfolio valuation series.
             * @param benchmark Benchmark valuation series (prices or index levels).
             * @param trading_days_per_year Annualization factor (default 252).
             * @throws std::invalid_argument If trading_days_per_year <= 0.
             */
            BenchmarkAnalysis(const ValuationSeries &portfolio,
                              const ValuationSeries &benchmark,
                              int trading_days_per_year = 252);

            ~BenchmarkAnalysis() = default;

            const BenchmarkComparison &comparison() const { return comparison_; }

            /** @brief Portfolio daily returns on aligned dates. */
            const Eigen::VectorXd &portfolio_returns() const { return portfolio_returns_; }

            /** @brief Benchmark daily returns on aligned dates. */
            const Eigen::VectorXd &benchmark_returns() const { return benchmark_returns_; }

            std::string summary() const;

        private:
            void align(const ValuationSeries &portfolio, const ValuationSeries &benchmark);
            void compute_relative_returns();
            void compute_regression_metrics();

            int trading_days_per_year_;
            Eigen::VectorXd portfolio_returns_;
            Eigen::VectorXd benchmark_returns_;
            BenchmarkComparison comparison_;
        };

    } // namespace analytics
} // namespace drawdown

#endif // DRAWDOWN_ANALYTICS_BENCHMARK_ANALYSIS_HPP

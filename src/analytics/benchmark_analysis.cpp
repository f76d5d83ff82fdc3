/**
 * @file benchmark_analysis.cpp
 * @brief Implementation of the BenchmarkAnalysis class.
 */

#include "analytics/benchmark_analysis.hpp"
#include "core/json_support.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace drawdown
{
    namespace analytics
    {

        namespace
        {
            const double EPSILON = 1e-18;

            double sample_covariance(const Eigen::VectorXd &x, const Eigen::VectorXd &y)
            {
                Eigen::Index n = x.size();
                return ((x.array() - x.mean()) * (y.array() - y.mean())).sum() / static_cast<double>(n - 1);
            }
        } // anonymous namespace

        // ===================================================================
        // Constructors
        // ===================================================================

        BenchmarkAnalysis::BenchmarkAnalysis(const ValuationSeries &portfolio,
                                             const ValuationSeries &benchmark,
                                             int trading_days_per_year)
            : trading_days_per_year_(trading_days_per_year)
        {
            if (trading_days_per_year <= 0)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'trading_days_per_year', got: " + std::to_string(trading_days_per_year));
            }

            align(portfolio, benchmark);
            compute_relative_returns();
            compute_regression_metrics();
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string BenchmarkAnalysis::summary() const
        {
            return format_comparison(comparison_);
        }

        std::string format_comparison(const BenchmarkComparison &comparison)
        {
            auto print = [](std::ostringstream &oss, const std::optional<double> &v, double scale, const char *suffix)
            {
                if (v)
                    oss << std::setprecision(4) << *v * scale << suffix << "\n";
                else
                    oss << "N/A\n";
            };

            std::ostringstream oss;
            oss << std::fixed;

            oss << "Benchmark Comparison\n";
            oss << "====================\n\n";
            oss << "  Aligned Observations: " << comparison.aligned_observations << "\n";
            oss << "  Portfolio Return:     ";
            print(oss, comparison.portfolio_return, 100.0, "%");
            oss << "  Benchmark Return:     ";
            print(oss, comparison.benchmark_return, 100.0, "%");
            oss << "  Relative Return:      ";
            print(oss, comparison.relative_return, 100.0, "%");
            oss << "  Beta:                 ";
            print(oss, comparison.beta, 1.0, "");
            oss << "  Correlation:          ";
            print(oss, comparison.correlation, 1.0, "");
            oss << "  Tracking Error:       ";
            print(oss, comparison.tracking_error, 100.0, "%");
            oss << "  Information Ratio:    ";
            print(oss, comparison.information_ratio, 1.0, "");

            return oss.str();
        }

        // ===================================================================
        // Private Helpers
        // ===================================================================

        void BenchmarkAnalysis::align(const ValuationSeries &portfolio, const ValuationSeries &benchmark)
        {
            std::vector<double> p_values;
            std::vector<double> b_values;

            size_t i = 0;
            size_t j = 0;
            while (i < portfolio.size() && j < benchmark.size())
            {
                if (portfolio.date(i) < benchmark.date(j))
                {
                    ++i;
                }
                else if (benchmark.date(j) < portfolio.date(i))
                {
                    ++j;
                }
                else
                {
                    p_values.push_back(portfolio.value(i));
                    b_values.push_back(benchmark.value(j));
                    ++i;
                    ++j;
                }
            }

            comparison_.aligned_observations = static_cast<int>(p_values.size());

            std::vector<double> p_returns;
            std::vector<double> b_returns;
            for (size_t k = 1; k < p_values.size(); ++k)
            {
                if (p_values[k - 1] == 0.0 || b_values[k - 1] == 0.0)
                {
                    continue;
                }
                p_returns.push_back(p_values[k] / p_values[k - 1] - 1.0);
                b_returns.push_back(b_values[k] / b_values[k - 1] - 1.0);
            }

            portfolio_returns_ = Eigen::Map<const Eigen::VectorXd>(p_returns.data(), static_cast<Eigen::Index>(p_returns.size()));
            benchmark_returns_ = Eigen::Map<const Eigen::VectorXd>(b_returns.data(), static_cast<Eigen::Index>(b_returns.size()));
        }

        void BenchmarkAnalysis::compute_relative_returns()
        {
            if (portfolio_returns_.size() == 0)
            {
                return;
            }

            double p_twr = (portfolio_returns_.array() + 1.0).prod() - 1.0;
            double b_twr = (benchmark_returns_.array() + 1.0).prod() - 1.0;

            comparison_.portfolio_return = p_twr;
            comparison_.benchmark_return = b_twr;
            comparison_.relative_return = p_twr - b_twr;
            comparison_.outperformed = p_twr > b_twr;
        }

        void BenchmarkAnalysis::compute_regression_metrics()
        {
            Eigen::Index n = portfolio_returns_.size();
            if (n < 2)
            {
                return;
            }

            double periods = static_cast<double>(trading_days_per_year_);

            double var_p = sample_covariance(portfolio_returns_, portfolio_returns_);
            double var_b = sample_covariance(benchmark_returns_, benchmark_returns_);
            double cov_pb = sample_covariance(portfolio_returns_, benchmark_returns_);

            if (var_b > EPSILON)
            {
                comparison_.beta = cov_pb / var_b;
                if (var_p > EPSILON)
                {
                    comparison_.correlation = cov_pb / std::sqrt(var_p * var_b);
                }
            }

            Eigen::VectorXd excess = portfolio_returns_ - benchmark_returns_;
            double tracking_error = std::sqrt(sample_covariance(excess, excess)) * std::sqrt(periods);
            comparison_.tracking_error = tracking_error;

            if (tracking_error > EPSILON)
            {
                comparison_.information_ratio = excess.mean() * periods / tracking_error;
            }
        }

        void to_json(nlohmann::json &j, const BenchmarkComparison &comparison)
        {
            j = nlohmann::json::object();
            j["aligned_observations"] = comparison.aligned_observations;
            j["portfolio_return"] = optional_to_json(comparison.portfolio_return);
            j["benchmark_return"] = optional_to_json(comparison.benchmark_return);
            j["relative_return"] = optional_to_json(comparison.relative_return);
            j["outperformed"] = optional_to_json(comparison.outperformed);
            j["beta"] = optional_to_json(comparison.beta);
            j["correlation"] = optional_to_json(comparison.correlation);
            j["tracking_error"] = optional_to_json(comparison.tracking_error);
            j["information_ratio"] = optional_to_json(comparison.information_ratio);
        }

    } // namespace analytics
} // namespace drawdown

/**
 * @file test_benchmark_analysis.cpp
 * @brief Unit tests for BenchmarkAnalysis
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/benchmark_analysis.hpp"
#include "series_fixtures.hpp"

#include <stdexcept>

using namespace drawdown;
using namespace drawdown::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("BenchmarkAnalysis against itself", "[BenchmarkAnalysis]") {
    auto series = testing::daily_series({100.0, 110.0, 99.0, 105.0});
    BenchmarkAnalysis bench(series, series);
    const auto &c = bench.comparison();

    REQUIRE(c.aligned_observations == 4);
    REQUIRE(bench.portfolio_returns().size() == 3);
    REQUIRE_THAT(*c.beta, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(*c.correlation, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(*c.tracking_error, WithinAbs(0.0, 1e-12));
    REQUIRE_FALSE(c.information_ratio.has_value());
    REQUIRE_THAT(*c.relative_return, WithinAbs(0.0, 1e-12));
    REQUIRE_FALSE(*c.outperformed);
}

TEST_CASE("BenchmarkAnalysis with a leveraged portfolio", "[BenchmarkAnalysis]") {
    // Benchmark returns +10%, -10%, +10%; portfolio returns twice that
    auto benchmark = testing::daily_series({100.0, 110.0, 99.0, 108.9});
    auto portfolio = testing::daily_series({100.0, 120.0, 96.0, 115.2});
    BenchmarkAnalysis bench(portfolio, benchmark);
    const auto &c = bench.comparison();

    REQUIRE_THAT(*c.beta, WithinAbs(2.0, 1e-9));
    REQUIRE_THAT(*c.correlation, WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(*c.portfolio_return, WithinAbs(0.152, 1e-9));
    REQUIRE_THAT(*c.benchmark_return, WithinAbs(0.089, 1e-9));
    REQUIRE_THAT(*c.relative_return, WithinAbs(0.063, 1e-9));
    REQUIRE(*c.outperformed);
    REQUIRE(*c.tracking_error > 0.0);
    REQUIRE(c.information_ratio.has_value());

    SECTION("JSON export") {
        nlohmann::json j = c;
        REQUIRE(j["aligned_observations"] == 4);
        REQUIRE(j["outperformed"] == true);
        REQUIRE(j["beta"].is_number());
    }
}

TEST_CASE("BenchmarkAnalysis date alignment", "[BenchmarkAnalysis]") {
    std::vector<ValuationPoint> portfolio = {
        {Date::parse("2024-01-01"), 100.0},
        {Date::parse("2024-01-02"), 101.0},
        {Date::parse("2024-01-03"), 102.0},
        {Date::parse("2024-01-04"), 103.0},
        {Date::parse("2024-01-05"), 104.0}};
    std::vector<ValuationPoint> benchmark = {
        {Date::parse("2024-01-02"), 50.0},
        {Date::parse("2024-01-03"), 51.0},
        {Date::parse("2024-01-05"), 49.0},
        {Date::parse("2024-01-06"), 48.0}};

    BenchmarkAnalysis bench{ValuationSeries(portfolio), ValuationSeries(benchmark)};
    const auto &c = bench.comparison();

    REQUIRE(c.aligned_observations == 3);
    REQUIRE(bench.portfolio_returns().size() == 2);
    REQUIRE_THAT(bench.portfolio_returns()(1), WithinAbs(104.0 / 102.0 - 1.0, 1e-12));
    REQUIRE_THAT(bench.benchmark_returns()(1), WithinAbs(49.0 / 51.0 - 1.0, 1e-12));
    REQUIRE_THAT(*c.portfolio_return, WithinAbs(104.0 / 101.0 - 1.0, 1e-12));
}

TEST_CASE("BenchmarkAnalysis with too little overlap", "[BenchmarkAnalysis]") {
    SECTION("No common dates") {
        auto portfolio = testing::daily_series({100.0, 101.0}, "2024-01-01");
        auto benchmark = testing::daily_series({100.0, 101.0}, "2024-02-01");
        BenchmarkAnalysis bench(portfolio, benchmark);
        REQUIRE(bench.comparison().aligned_observations == 0);
        REQUIRE_FALSE(bench.comparison().portfolio_return.has_value());
        REQUIRE_FALSE(bench.comparison().beta.has_value());
    }

    SECTION("Single return defines relative return only") {
        auto portfolio = testing::daily_series({100.0, 101.0});
        auto benchmark = testing::daily_series({100.0, 102.0});
        BenchmarkAnalysis bench(portfolio, benchmark);
        REQUIRE_THAT(*bench.comparison().relative_return, WithinAbs(-0.01, 1e-12));
        REQUIRE_FALSE(bench.comparison().beta.has_value());
        REQUIRE_FALSE(bench.comparison().tracking_error.has_value());
    }

    SECTION("Flat benchmark leaves beta undefined") {
        auto portfolio = testing::daily_series({100.0, 101.0, 99.0});
        auto benchmark = testing::daily_series({100.0, 100.0, 100.0});
        BenchmarkAnalysis bench(portfolio, benchmark);
        REQUIRE_FALSE(bench.comparison().beta.has_value());
        REQUIRE_FALSE(bench.comparison().correlation.has_value());
        REQUIRE(bench.comparison().tracking_error.has_value());
    }

    SECTION("Invalid annualization factor") {
        auto series = testing::daily_series({100.0, 101.0});
        REQUIRE_THROWS_AS(BenchmarkAnalysis(series, series, 0), std::invalid_argument);
    }
}

/**
 * @file test_valuation_series.cpp
 * @brief Unit tests for ValuationSeries
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/errors.hpp"
#include "data/valuation_series.hpp"
#include "series_fixtures.hpp"
#include <cmath>
#include <limits>

using namespace drawdown;
using Catch::Matchers::WithinAbs;

TEST_CASE("ValuationSeries construction", "[ValuationSeries]") {
    SECTION("Empty series") {
        ValuationSeries series;
        REQUIRE(series.empty());
        REQUIRE(series.size() == 0);
        REQUIRE_THROWS_AS(series.at(0), std::out_of_range);
    }

    SECTION("Stores points in order") {
        auto series = testing::daily_series({100.0, 101.5, 99.0});
        REQUIRE(series.size() == 3);
        REQUIRE(series.front().date == Date::parse("2024-01-01"));
        REQUIRE(series.back().date == Date::parse("2024-01-03"));
        REQUIRE_THAT(series.value(1), WithinAbs(101.5, 1e-12));
        REQUIRE(series.values().size() == 3);
        REQUIRE(series.points().size() == 3);
    }

    SECTION("Zero values are allowed") {
        auto series = testing::daily_series({0.0, 50.0});
        REQUIRE(series.size() == 2);
    }

    SECTION("Rejects duplicate dates") {
        Date d = Date::parse("2024-01-01");
        std::vector<ValuationPoint> points = {{d, 100.0}, {d, 101.0}};
        REQUIRE_THROWS_AS(ValuationSeries(points), InvalidSeriesError);
    }

    SECTION("Rejects unsorted dates and reports the offending date") {
        std::vector<ValuationPoint> points = {
            {Date::parse("2024-01-02"), 100.0},
            {Date::parse("2024-01-01"), 101.0}};
        try {
            ValuationSeries series(points);
            FAIL("Expected InvalidSeriesError");
        } catch (const InvalidSeriesError &e) {
            REQUIRE(e.date().has_value());
            REQUIRE(*e.date() == Date::parse("2024-01-01"));
            REQUIRE(e.value().has_value());
            REQUIRE_THAT(*e.value(), WithinAbs(101.0, 1e-12));
        }
    }

    SECTION("Rejects negative and non-finite values") {
        REQUIRE_THROWS_AS(testing::daily_series({100.0, -1.0}), InvalidSeriesError);
        REQUIRE_THROWS_AS(testing::daily_series({100.0, std::numeric_limits<double>::quiet_NaN()}), InvalidSeriesError);
        REQUIRE_THROWS_AS(testing::daily_series({std::numeric_limits<double>::infinity()}), InvalidSeriesError);
    }

    SECTION("Parallel constructor checks sizes") {
        std::vector<Date> dates = {Date::parse("2024-01-01")};
        Eigen::VectorXd values(2);
        values << 1.0, 2.0;
        REQUIRE_THROWS_AS(ValuationSeries(dates, values), std::invalid_argument);
    }
}

TEST_CASE("ValuationSeries filtering", "[ValuationSeries]") {
    auto series = testing::daily_series({100.0, 101.0, 102.0, 103.0, 104.0}, "2024-03-01");

    SECTION("Inclusive window") {
        auto window = series.filter_by_date(Date::parse("2024-03-02"), Date::parse("2024-03-04"));
        REQUIRE(window.size() == 3);
        REQUIRE(window.front().date == Date::parse("2024-03-02"));
        REQUIRE(window.back().date == Date::parse("2024-03-04"));
        REQUIRE_THAT(window.value(0), WithinAbs(101.0, 1e-12));
    }

    SECTION("Open bounds") {
        REQUIRE(series.filter_by_date(std::nullopt, std::nullopt).size() == 5);
        REQUIRE(series.filter_by_date(Date::parse("2024-03-04"), std::nullopt).size() == 2);
        REQUIRE(series.filter_by_date(std::nullopt, Date::parse("2024-03-01")).size() == 1);
    }

    SECTION("Window outside the data is empty") {
        REQUIRE(series.filter_by_date(Date::parse("2025-01-01"), std::nullopt).empty());
        REQUIRE(series.filter_by_date(std::nullopt, Date::parse("2023-01-01")).empty());
    }

    SECTION("Inverted window throws") {
        REQUIRE_THROWS_AS(series.filter_by_date(Date::parse("2024-03-04"), Date::parse("2024-03-02")),
                          std::invalid_argument);
    }

    SECTION("Date lookup") {
        REQUIRE(series.find_date_index(Date::parse("2024-03-03")) == std::optional<size_t>(2));
        REQUIRE_FALSE(series.find_date_index(Date::parse("2024-04-01")).has_value());
    }
}

TEST_CASE("ValuationSeries daily returns", "[ValuationSeries]") {
    SECTION("Simple returns dated at the end of each period") {
        auto series = testing::daily_series({100.0, 110.0, 99.0});
        auto returns = series.daily_returns();
        REQUIRE(returns.size() == 2);
        REQUIRE(returns.dates[0] == Date::parse("2024-01-02"));
        REQUIRE_THAT(returns.returns(0), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(returns.returns(1), WithinAbs(-0.10, 1e-12));
    }

    SECTION("Return after a zero value is skipped, not zero") {
        auto series = testing::daily_series({100.0, 0.0, 50.0, 55.0});
        auto returns = series.daily_returns();
        REQUIRE(returns.size() == 2);
        REQUIRE_THAT(returns.returns(0), WithinAbs(-1.0, 1e-12));
        REQUIRE(returns.dates[1] == Date::parse("2024-01-04"));
        REQUIRE_THAT(returns.returns(1), WithinAbs(0.10, 1e-12));
    }

    SECTION("Fewer than two points gives no returns") {
        REQUIRE(testing::daily_series({100.0}).daily_returns().empty());
        REQUIRE(ValuationSeries().daily_returns().empty());
    }
}

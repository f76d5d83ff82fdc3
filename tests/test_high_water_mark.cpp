/**
 * @file test_high_water_mark.cpp
 * @brief Unit tests for HighWaterMarkTracker
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/high_water_mark.hpp"
#include "series_fixtures.hpp"

#include <stdexcept>

using namespace drawdown;
using namespace drawdown::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("HighWaterMarkTracker running peak", "[HighWaterMark]") {
    SECTION("Empty input gives empty output") {
        HighWaterMarkTracker hwm{ValuationSeries()};
        REQUIRE(hwm.empty());
        REQUIRE(hwm.size() == 0);
    }

    SECTION("Peak follows new highs and holds through declines") {
        auto series = testing::daily_series({100.0, 110.0, 90.0, 95.0, 112.0});
        HighWaterMarkTracker hwm(series);

        REQUIRE(hwm.size() == 5);
        REQUIRE_THAT(hwm.at(0).peak_value, WithinAbs(100.0, 1e-12));
        REQUIRE_THAT(hwm.at(2).peak_value, WithinAbs(110.0, 1e-12));
        REQUIRE(hwm.at(2).peak_date == Date::parse("2024-01-02"));
        REQUIRE(hwm.at(3).date == Date::parse("2024-01-04"));
        REQUIRE_THAT(hwm.at(4).peak_value, WithinAbs(112.0, 1e-12));
        REQUIRE(hwm.at(4).peak_date == Date::parse("2024-01-05"));
    }

    SECTION("Matching the peak keeps the earliest peak date") {
        auto series = testing::daily_series({100.0, 120.0, 110.0, 120.0});
        HighWaterMarkTracker hwm(series);
        REQUIRE(hwm.at(3).peak_date == Date::parse("2024-01-02"));
    }

    SECTION("Out of range access throws") {
        HighWaterMarkTracker hwm(testing::daily_series({100.0}));
        REQUIRE_THROWS_AS(hwm.at(1), std::out_of_range);
    }
}

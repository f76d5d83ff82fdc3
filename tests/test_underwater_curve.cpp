/**
 * @file test_underwater_curve.cpp
 * @brief Unit tests for UnderwaterCurveBuilder
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/underwater_curve.hpp"
#include "series_fixtures.hpp"

#include <stdexcept>

using namespace drawdown;
using namespace drawdown::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("Underwater curve points", "[UnderwaterCurve]") {
    auto series = testing::daily_series({100.0, 110.0, 90.0, 95.0, 112.0});
    HighWaterMarkTracker hwm(series);
    UnderwaterCurveBuilder curve(series, hwm);

    REQUIRE(curve.size() == series.size());

    SECTION("Points at a new peak are zero") {
        REQUIRE(curve.points()[0].drawdown_percent == 0.0);
        REQUIRE(curve.points()[1].drawdown_percent == 0.0);
        REQUIRE(curve.points()[4].drawdown_percent == 0.0);
        REQUIRE(curve.points()[4].drawdown_amount == 0.0);
    }

    SECTION("Points below the peak are negative fractions") {
        const auto &trough = curve.points()[2];
        REQUIRE(trough.date == Date::parse("2024-01-03"));
        REQUIRE_THAT(trough.portfolio_value, WithinAbs(90.0, 1e-12));
        REQUIRE_THAT(trough.peak_value, WithinAbs(110.0, 1e-12));
        REQUIRE_THAT(trough.drawdown_amount, WithinAbs(20.0, 1e-12));
        REQUIRE_THAT(trough.drawdown_percent, WithinAbs(-0.181818, 1e-6));

        REQUIRE_THAT(curve.points()[3].drawdown_percent, WithinAbs(-15.0 / 110.0, 1e-12));
    }

    SECTION("Deepest point and time under water") {
        REQUIRE(curve.deepest_index() == std::optional<size_t>(2));
        REQUIRE_THAT(curve.time_underwater_fraction(), WithinAbs(0.4, 1e-12));
    }

    SECTION("No point is ever above zero") {
        for (const auto &point : curve.points()) {
            REQUIRE(point.drawdown_percent <= 0.0);
            REQUIRE(point.drawdown_amount >= 0.0);
        }
    }
}

TEST_CASE("Underwater curve edge cases", "[UnderwaterCurve]") {
    SECTION("Empty series") {
        ValuationSeries empty;
        HighWaterMarkTracker hwm(empty);
        UnderwaterCurveBuilder curve(empty, hwm);
        REQUIRE(curve.empty());
        REQUIRE_FALSE(curve.deepest_index().has_value());
        REQUIRE(curve.time_underwater_fraction() == 0.0);
    }

    SECTION("Zero peak is guarded") {
        auto series = testing::daily_series({0.0, 0.0});
        HighWaterMarkTracker hwm(series);
        UnderwaterCurveBuilder curve(series, hwm);
        REQUIRE(curve.points()[1].drawdown_percent == 0.0);
    }

    SECTION("Deepest point ties keep the earliest") {
        auto series = testing::daily_series({100.0, 80.0, 90.0, 80.0});
        HighWaterMarkTracker hwm(series);
        UnderwaterCurveBuilder curve(series, hwm);
        REQUIRE(curve.deepest_index() == std::optional<size_t>(1));
    }

    SECTION("Size mismatch throws") {
        auto series = testing::daily_series({100.0, 90.0});
        HighWaterMarkTracker hwm(testing::daily_series({100.0}));
        REQUIRE_THROWS_AS(UnderwaterCurveBuilder(series, hwm), std::invalid_argument);
    }
}

/**
 * @file test_drawdown_segmenter.cpp
 * @brief Unit tests for DrawdownSegmenter and the event helpers
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/drawdown_segmenter.hpp"
#include "core/errors.hpp"
#include "series_fixtures.hpp"

using namespace drawdown;
using namespace drawdown::analytics;
using Catch::Matchers::WithinAbs;

namespace
{
    SegmentationResult segment(const ValuationSeries &series)
    {
        HighWaterMarkTracker hwm(series);
        return DrawdownSegmenter(series, hwm).result();
    }
}

TEST_CASE("Segmenter closes a recovered drawdown", "[Segmenter]") {
    // 100, 110, 90, 95, 112 on consecutive days
    auto series = testing::daily_series({100.0, 110.0, 90.0, 95.0, 112.0});
    auto result = segment(series);

    REQUIRE(result.events.size() == 1);
    REQUIRE_FALSE(result.has_open_event);
    REQUIRE_FALSE(result.open_event().has_value());

    const auto &e = result.events[0];
    REQUIRE_THAT(e.peak_value, WithinAbs(110.0, 1e-12));
    REQUIRE(e.peak_date == Date::parse("2024-01-02"));
    REQUIRE(e.peak_index == 1);
    REQUIRE_THAT(e.trough_value, WithinAbs(90.0, 1e-12));
    REQUIRE(e.trough_date == Date::parse("2024-01-03"));
    REQUIRE(e.trough_index == 2);
    REQUIRE(e.recovery_value.has_value());
    REQUIRE_THAT(*e.recovery_value, WithinAbs(112.0, 1e-12));
    REQUIRE(*e.recovery_date == Date::parse("2024-01-05"));
    REQUIRE(*e.recovery_index == 4);
    REQUIRE_THAT(e.max_drawdown_amount, WithinAbs(20.0, 1e-12));
    REQUIRE_THAT(e.max_drawdown_percent, WithinAbs(-20.0 / 110.0, 1e-12));
    REQUIRE_THAT(e.max_drawdown_percent, WithinAbs(-0.1818, 1e-4));
    REQUIRE(e.duration_days == 1);
    REQUIRE(*e.recovery_days == 2);
    REQUIRE(*e.total_days == 3);
    REQUIRE(e.is_recovered);
}

TEST_CASE("Segmenter reports an open drawdown at the end of the series", "[Segmenter]") {
    auto series = testing::daily_series({100.0, 110.0, 90.0, 95.0});
    auto result = segment(series);

    REQUIRE(result.events.size() == 1);
    REQUIRE(result.has_open_event);

    auto open = result.open_event();
    REQUIRE(open.has_value());
    REQUIRE_THAT(open->trough_value, WithinAbs(90.0, 1e-12));
    REQUIRE_FALSE(open->recovery_value.has_value());
    REQUIRE_FALSE(open->recovery_date.has_value());
    REQUIRE_FALSE(open->recovery_days.has_value());
    REQUIRE_FALSE(open->total_days.has_value());
    REQUIRE_FALSE(open->is_recovered);
}

TEST_CASE("Segmenter edge cases", "[Segmenter]") {
    SECTION("Fewer than two points gives no events") {
        REQUIRE(segment(ValuationSeries()).events.empty());
        REQUIRE(segment(testing::daily_series({100.0})).events.empty());
    }

    SECTION("Strictly increasing series has no events") {
        REQUIRE(segment(testing::daily_series({100.0, 101.0, 102.0, 150.0})).events.empty());
    }

    SECTION("Touching the peak exactly without a decline emits nothing") {
        REQUIRE(segment(testing::daily_series({100.0, 100.0, 100.0})).events.empty());
    }

    SECTION("Recovery to exactly the peak closes the event") {
        auto result = segment(testing::daily_series({100.0, 80.0, 100.0}));
        REQUIRE(result.events.size() == 1);
        REQUIRE(result.events[0].is_recovered);
        REQUIRE_THAT(*result.events[0].recovery_value, WithinAbs(100.0, 1e-12));
    }

    SECTION("An event after an exact recovery starts at the recovery date") {
        auto result = segment(testing::daily_series({100.0, 90.0, 100.0, 95.0}));
        REQUIRE(result.events.size() == 2);
        REQUIRE(*result.events[0].recovery_index == 2);

        const auto &second = result.events[1];
        REQUIRE(second.peak_index == 2);
        REQUIRE(second.peak_date == Date::parse("2024-01-03"));
        REQUIRE_THAT(second.peak_value, WithinAbs(100.0, 1e-12));
        REQUIRE(second.duration_days == 1);
        REQUIRE(second.peak_index >= *result.events[0].recovery_index);
        REQUIRE_FALSE(second.is_recovered);
    }

    SECTION("Equal lows keep the earliest trough date") {
        auto result = segment(testing::daily_series({100.0, 90.0, 95.0, 90.0, 101.0}));
        REQUIRE(result.events.size() == 1);
        REQUIRE(result.events[0].trough_date == Date::parse("2024-01-02"));
        REQUIRE(result.events[0].duration_days == 1);
        REQUIRE(*result.events[0].recovery_days == 3);
    }

    SECTION("A new event starts only after a new peak is broken") {
        auto result = segment(testing::daily_series({100.0, 90.0, 105.0, 108.0, 99.0, 104.0, 96.0}));
        REQUIRE(result.events.size() == 2);

        const auto &first = result.events[0];
        REQUIRE_THAT(first.peak_value, WithinAbs(100.0, 1e-12));
        REQUIRE(first.is_recovered);
        REQUIRE(*first.recovery_date == Date::parse("2024-01-03"));

        const auto &second = result.events[1];
        REQUIRE_THAT(second.peak_value, WithinAbs(108.0, 1e-12));
        REQUIRE(second.peak_index == 3);
        REQUIRE_THAT(second.trough_value, WithinAbs(96.0, 1e-12));
        REQUIRE(second.trough_index == 6);
        REQUIRE_FALSE(second.is_recovered);
        REQUIRE(result.has_open_event);
    }

    SECTION("Non-positive running peak is rejected") {
        auto series = testing::daily_series({0.0, 0.0, 10.0});
        HighWaterMarkTracker hwm(series);
        REQUIRE_THROWS_AS(DrawdownSegmenter(series, hwm), InvalidSeriesError);
    }

    SECTION("Mismatched high-water marks are rejected") {
        auto series = testing::daily_series({100.0, 90.0});
        HighWaterMarkTracker hwm(testing::daily_series({100.0}));
        REQUIRE_THROWS_AS(DrawdownSegmenter(series, hwm), std::invalid_argument);
    }

    SECTION("Day counts use calendar dates, not observation counts") {
        std::vector<ValuationPoint> points = {
            {Date::parse("2024-01-05"), 100.0},  // Friday
            {Date::parse("2024-01-08"), 95.0},   // Monday
            {Date::parse("2024-01-15"), 101.0}};
        auto result = segment(ValuationSeries(points));
        REQUIRE(result.events.size() == 1);
        REQUIRE(result.events[0].duration_days == 3);
        REQUIRE(*result.events[0].recovery_days == 7);
        REQUIRE(*result.events[0].total_days == 10);
    }
}

TEST_CASE("Event selection helpers", "[Segmenter]") {
    // Depths: 10%, 2%, 25% (open)
    auto series = testing::daily_series({100.0, 90.0, 101.0, 98.98, 102.0, 76.5});
    auto events = segment(series).events;
    REQUIRE(events.size() == 3);

    SECTION("Magnitude filter uses unsigned percent") {
        auto material = filter_by_magnitude(events, 5.0);
        REQUIRE(material.size() == 2);
        REQUIRE_THAT(material[0].peak_value, WithinAbs(100.0, 1e-12));
        REQUIRE_THAT(material[1].peak_value, WithinAbs(102.0, 1e-12));

        REQUIRE(filter_by_magnitude(events, 0.0).size() == 3);
        REQUIRE(filter_by_magnitude(events, 50.0).empty());
        REQUIRE_THROWS_AS(filter_by_magnitude(events, -1.0), std::invalid_argument);
    }

    SECTION("Magnitude exactly at the threshold is kept") {
        auto boundary = segment(testing::daily_series({100.0, 71.0})).events;
        REQUIRE(boundary.size() == 1);
        REQUIRE(filter_by_magnitude(boundary, 29.0).size() == 1);
        REQUIRE(filter_by_magnitude(boundary, 29.000001).empty());
    }

    SECTION("Top drawdowns are deepest first") {
        auto top = top_drawdowns(events, 2);
        REQUIRE(top.size() == 2);
        REQUIRE_THAT(top[0].max_drawdown_percent, WithinAbs(-0.25, 1e-12));
        REQUIRE_THAT(top[1].max_drawdown_percent, WithinAbs(-0.10, 1e-12));

        REQUIRE(top_drawdowns(events, 10).size() == 3);
        REQUIRE_THROWS_AS(top_drawdowns(events, 0), std::invalid_argument);
    }
}

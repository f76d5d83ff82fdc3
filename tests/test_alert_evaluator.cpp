/**
 * @file test_alert_evaluator.cpp
 * @brief Unit tests for AlertEvaluator, AlertThresholdConfig and the threshold store
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "alerts/alert_evaluator.hpp"
#include "alerts/threshold_store.hpp"
#include "core/errors.hpp"

#include <stdexcept>

using namespace drawdown;
using namespace drawdown::alerts;
using Catch::Matchers::WithinAbs;

TEST_CASE("AlertThresholdConfig validation", "[Alerts]") {
    SECTION("Defaults are valid") {
        AlertThresholdConfig config;
        REQUIRE_NOTHROW(config.validate());
        REQUIRE(config.warning_pct == 15.0);
        REQUIRE(config.critical_pct == 20.0);
        REQUIRE(config.emergency_pct == 25.0);
    }

    SECTION("Tiers out of order are rejected") {
        AlertThresholdConfig config{20.0, 15.0, 25.0};
        REQUIRE_THROWS_AS(config.validate(), InvalidThresholdConfigError);
        REQUIRE_THROWS_AS(AlertEvaluator(config), InvalidThresholdConfigError);
    }

    SECTION("Equal tiers are rejected") {
        AlertThresholdConfig config{15.0, 15.0, 25.0};
        REQUIRE_THROWS_AS(config.validate(), InvalidThresholdConfigError);
    }

    SECTION("Tiers outside (0, 100] are rejected") {
        REQUIRE_THROWS_AS((AlertThresholdConfig{0.0, 20.0, 25.0}.validate()), InvalidThresholdConfigError);
        REQUIRE_THROWS_AS((AlertThresholdConfig{15.0, 20.0, 120.0}.validate()), InvalidThresholdConfigError);
        REQUIRE_NOTHROW(AlertThresholdConfig{50.0, 75.0, 100.0}.validate());
    }

    SECTION("JSON round trip keeps the tiers") {
        nlohmann::json j = {{"warning_threshold", 10.0}, {"critical_threshold", 30.0}};
        auto config = AlertThresholdConfig::from_json(j);
        REQUIRE(config.warning_pct == 10.0);
        REQUIRE(config.critical_pct == 30.0);
        REQUIRE(config.emergency_pct == 25.0);
        REQUIRE_THROWS_AS(AlertThresholdConfig::from_json({{"critical_threshold", 40.0}}),
                          InvalidThresholdConfigError);
    }
}

TEST_CASE("AlertEvaluator tiers", "[Alerts]") {
    AlertEvaluator evaluator(AlertThresholdConfig{15.0, 20.0, 25.0});
    Date today = Date::parse("2024-06-28");

    SECTION("Below every tier") {
        REQUIRE(evaluator.evaluate(0.0, today).empty());
        REQUIRE(evaluator.evaluate(14.99, today).empty());
    }

    SECTION("Single warning") {
        auto alerts = evaluator.evaluate(16.5, today);
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].level == AlertLevel::WARNING);
        REQUIRE(alerts[0].threshold == 15.0);
        REQUIRE_THAT(alerts[0].current_drawdown_percent, WithinAbs(16.5, 1e-12));
        REQUIRE(alerts[0].message == "WARNING: Drawdown of 16.50% exceeds warning threshold of 15.00%");
        REQUIRE(alerts[0].triggered_at == today);
    }

    SECTION("Multiple tiers, lowest first") {
        auto alerts = evaluator.evaluate(22.0, today);
        REQUIRE(alerts.size() == 2);
        REQUIRE(alerts[0].level == AlertLevel::WARNING);
        REQUIRE(alerts[1].level == AlertLevel::CRITICAL);
    }

    SECTION("Threshold is inclusive") {
        auto alerts = evaluator.evaluate(25.0, today);
        REQUIRE(alerts.size() == 3);
        REQUIRE(alerts[2].level == AlertLevel::EMERGENCY);
        REQUIRE(alerts[2].message == "EMERGENCY: Drawdown of 25.00% exceeds emergency threshold of 25.00%");
    }

    SECTION("Negative magnitude is rejected") {
        REQUIRE_THROWS_AS(evaluator.evaluate(-1.0, today), std::invalid_argument);
    }

    SECTION("JSON export") {
        nlohmann::json j = evaluator.evaluate(16.5, today)[0];
        REQUIRE(j["level"] == "warning");
        REQUIRE(j["threshold"] == 15.0);
        REQUIRE(j["triggered_at"] == "2024-06-28");
    }
}

TEST_CASE("Alert level names", "[Alerts]") {
    REQUIRE(to_string(AlertLevel::CRITICAL) == "critical");
    REQUIRE(alert_level_from_string("emergency") == AlertLevel::EMERGENCY);
    REQUIRE_THROWS_AS(alert_level_from_string("severe"), std::invalid_argument);
}

TEST_CASE("ConfiguredThresholdStore lookup", "[Alerts]") {
    AlertThresholdConfig strict{5.0, 10.0, 15.0};

    SECTION("User entry wins over the default") {
        ConfiguredThresholdStore store(AlertThresholdConfig(), {{"alice", strict}});
        REQUIRE(*store.thresholds_for("alice") == strict);
        REQUIRE(*store.thresholds_for("bob") == AlertThresholdConfig());
    }

    SECTION("No default means alerting is off for unknown users") {
        ConfiguredThresholdStore store(std::nullopt, {{"alice", strict}});
        REQUIRE_FALSE(store.thresholds_for("bob").has_value());
    }

    SECTION("Invalid configurations are rejected up front") {
        AlertThresholdConfig broken{20.0, 15.0, 25.0};
        REQUIRE_THROWS_AS(ConfiguredThresholdStore(broken), InvalidThresholdConfigError);
    }
}

/**
 * @file alert_evaluator.cpp
 * @brief Implementation of AlertEvaluator and AlertThresholdConfig.
 */

#include "alerts/alert_evaluator.hpp"
#include "core/errors.hpp"
#include "core/json_support.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace drawdown
{
    namespace alerts
    {

        namespace
        {
            std::string format_percent(double value)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(2) << value << "%";
                return oss.str();
            }

            std::string make_message(AlertLevel level, double magnitude, double threshold)
            {
                std::string name = to_string(level);
                std::string upper = name;
                for (auto &c : upper)
                {
                    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                }
                return upper + ": Drawdown of " + format_percent(magnitude) + " exceeds " + name + " threshold of " + format_percent(threshold);
            }
        } // anonymous namespace

        // ===================================================================
        // AlertLevel
        // ===================================================================

        std::string to_string(AlertLevel level)
        {
            switch (level)
            {
            case AlertLevel::WARNING:
                return "warning";
            case AlertLevel::CRITICAL:
                return "critical";
            case AlertLevel::EMERGENCY:
                return "emergency";
            }
            throw std::invalid_argument("Unknown alert level");
        }

        AlertLevel alert_level_from_string(const std::string &name)
        {
            if (name == "warning")
                return AlertLevel::WARNING;
            if (name == "critical")
                return AlertLevel::CRITICAL;
            if (name == "emergency")
                return AlertLevel::EMERGENCY;
            throw std::invalid_argument("Unknown alert level: '" + name + "'");
        }

        // ===================================================================
        // AlertThresholdConfig
        // ===================================================================

        void AlertThresholdConfig::validate() const
        {
            const double tiers[] = {warning_pct, critical_pct, emergency_pct};
            for (double t : tiers)
            {
                if (!std::isfinite(t) || t <= 0.0 || t > 100.0)
                {
                    throw InvalidThresholdConfigError(
                        "Alert thresholds must lie in (0, 100], got: " + std::to_string(t));
                }
            }
            if (!(warning_pct < critical_pct && critical_pct < emergency_pct))
            {
                throw InvalidThresholdConfigError(
                    "Alert thresholds must be strictly increasing (warning < critical < emergency), got: " + std::to_string(warning_pct) + ", " + std::to_string(critical_pct) + ", " + std::to_string(emergency_pct));
            }
        }

        AlertThresholdConfig AlertThresholdConfig::from_json(const nlohmann::json &j)
        {
            AlertThresholdConfig config;
            config.warning_pct = j.value("warning_threshold", 15.0);
            config.critical_pct = j.value("critical_threshold", 20.0);
            config.emergency_pct = j.value("emergency_threshold", 25.0);
            config.validate();
            return config;
        }

        nlohmann::json AlertThresholdConfig::to_json() const
        {
            nlohmann::json j;
            j["warning_threshold"] = warning_pct;
            j["critical_threshold"] = critical_pct;
            j["emergency_threshold"] = emergency_pct;
            return j;
        }

        void to_json(nlohmann::json &j, const Alert &alert)
        {
            j = nlohmann::json::object();
            j["level"] = to_string(alert.level);
            j["threshold"] = alert.threshold;
            j["current_drawdown_percent"] = alert.current_drawdown_percent;
            j["message"] = alert.message;
            j["triggered_at"] = alert.triggered_at;
        }

        // ===================================================================
        // AlertEvaluator
        // ===================================================================

        AlertEvaluator::AlertEvaluator(const AlertThresholdConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        std::vector<Alert> AlertEvaluator::evaluate(double current_drawdown_percent,
                                                    const Date &triggered_at) const
        {
            if (!std::isfinite(current_drawdown_percent) || current_drawdown_percent < 0.0)
            {
                throw std::invalid_argument(
                    "Expected non-negative drawdown magnitude, got: " + std::to_string(current_drawdown_percent));
            }

            const std::pair<AlertLevel, double> tiers[] = {
                {AlertLevel::WARNING, config_.warning_pct},
                {AlertLevel::CRITICAL, config_.critical_pct},
                {AlertLevel::EMERGENCY, config_.emergency_pct}};

            std::vector<Alert> alerts;
            for (const auto &[level, threshold] : tiers)
            {
                if (current_drawdown_percent >= threshold)
                {
                    alerts.push_back(Alert{level, threshold, current_drawdown_percent,
                                           make_message(level, current_drawdown_percent, threshold),
                                           triggered_at});
                }
            }
            return alerts;
        }

    } // namespace alerts
} // namespace drawdown

/**
 * @file alert_evaluator.hpp
 * @brief Threshold-tier alerts on the current drawdown.
 *
 * Thresholds and the evaluated drawdown are unsigned percent magnitudes
 * (16.5 means a drawdown of 16.5%). Evaluation is side-effect free;
 * dispatching notifications is left to the caller.
 */

#pragma once

#include "core/date.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace drawdown
{
    namespace alerts
    {

        /**
         * @enum AlertLevel
         * @brief Alert tiers in increasing severity.
         */
        enum class AlertLevel
        {
            WARNING,
            CRITICAL,
            EMERGENCY
        };

        /** @brief Lowercase name used in JSON ("warning", "critical", "emergency"). */
        std::string to_string(AlertLevel level);

        /**
         * @brief Parse a level name (case-sensitive, lowercase).
         * @throws std::invalid_argument For an unknown name.
         */
        AlertLevel alert_level_from_string(const std::string &name);

        /**
         * @struct AlertThresholdConfig
         * @brief Per-user threshold tiers, in percent.
         */
        struct AlertThresholdConfig
        {
            double warning_pct = 15.0;
            double critical_pct = 20.0;
            double emergency_pct = 25.0;

            /**
             * @brief Check 0 < warning < critical < emergency <= 100.
             * @throws InvalidThresholdConfigError If the tiers are misconfigured.
             */
            void validate() const;

            /**
             * @brief Read warning_threshold / critical_threshold / emergency_threshold.
             *
             * Missing keys keep their defaults. The result is validated.
             *
             * @throws InvalidThresholdConfigError If the tiers are misconfigured.
             */
            static AlertThresholdConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;

            bool operator==(const AlertThresholdConfig &other) const
            {
                return warning_pct == other.warning_pct && critical_pct == other.critical_pct && emergency_pct == other.emergency_pct;
            }
        };

        /**
         * @struct Alert
         * @brief One breached tier.
         */
        struct Alert
        {
            AlertLevel level;
            double threshold;                ///< Threshold of the tier, percent
            double current_drawdown_percent; ///< Evaluated magnitude, percent
            std::string message;
            Date triggered_at;
        };

        void to_json(nlohmann::json &j, const Alert &alert);

        /**
         * @class AlertEvaluator
         * @brief Compares a drawdown magnitude with the configured tiers.
         *
         * Usage:
         * @code
         *   AlertEvaluator evaluator(AlertThresholdConfig{15.0, 20.0, 25.0});
         *   auto alerts = evaluator.evaluate(22.0, today); // warning, critical
         * @endcode
         */
        class AlertEvaluator
        {
        public:
            /**
             * @throws InvalidThresholdConfigError If the configuration is invalid.
             */
            explicit AlertEvaluator(const AlertThresholdConfig &config);

            /**
             * @brief Breached tiers, lowest severity first.
             * @param current_drawdown_percent Unsigned magnitude in percent.
             * @param triggered_at Timestamp stamped on every alert.
             * @throws std::invalid_argument If the magnitude is negative or not finite.
             *
             * A tier is breached when the magnitude is at or above its threshold.
             */
            std::vector<Alert> evaluate(double current_drawdown_percent,
                                        const Date &triggered_at) const;

            const AlertThresholdConfig &config() const { return config_; }

        private:
            AlertThresholdConfig config_;
        };

    } // namespace alerts
} // namespace drawdown

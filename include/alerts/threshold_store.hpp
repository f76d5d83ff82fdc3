/**
 * @file threshold_store.hpp
 * @brief Port supplying per-user alert threshold configuration.
 */

#pragma once

#include "alerts/alert_evaluator.hpp"

#include <map>
#include <optional>
#include <string>

namespace drawdown
{
    namespace alerts
    {

        /**
         * @class AlertThresholdStore
         * @brief Abstract read-only source of threshold configuration
         */
        class AlertThresholdStore
        {
        public:
            virtual ~AlertThresholdStore() = default;

            /**
             * @brief Thresholds configured for a user
             * @return Configuration, or nullopt when alerting is not configured
             */
            virtual std::optional<AlertThresholdConfig> thresholds_for(const std::string &user_id) const = 0;
        };

        /**
         * @class ConfiguredThresholdStore
         * @brief Store built from the configuration file
         *
         * A user without an entry falls back to the default configuration.
         */
        class ConfiguredThresholdStore : public AlertThresholdStore
        {
        public:
            /**
             * @throws InvalidThresholdConfigError if any configuration is invalid
             */
            ConfiguredThresholdStore(std::optional<AlertThresholdConfig> default_config,
                                     std::map<std::string, AlertThresholdConfig> user_configs = {});

            std::optional<AlertThresholdConfig> thresholds_for(const std::string &user_id) const override;

        private:
            std::optional<AlertThresholdConfig> default_config_;
            std::map<std::string, AlertThresholdConfig> user_configs_;
        };

    } // namespace alerts
} // namespace drawdown

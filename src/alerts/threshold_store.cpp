/**
 * @file threshold_store.cpp
 * @brief Implementation of ConfiguredThresholdStore
 */

#include "alerts/threshold_store.hpp"

#include <utility>

namespace drawdown
{
    namespace alerts
    {

        ConfiguredThresholdStore::ConfiguredThresholdStore(std::optional<AlertThresholdConfig> default_config,
                                                           std::map<std::string, AlertThresholdConfig> user_configs)
            : default_config_(std::move(default_config)), user_configs_(std::move(user_configs))
        {
            if (default_config_)
            {
                default_config_->validate();
            }
            for (const auto &[user_id, config] : user_configs_)
            {
                config.validate();
            }
        }

        std::optional<AlertThresholdConfig> ConfiguredThresholdStore::thresholds_for(const std::string &user_id) const
        {
            auto it = user_configs_.find(user_id);
            if (it != user_configs_.end())
            {
                return it->second;
            }
            return default_config_;
        }

    } // namespace alerts
} // namespace drawdown

/**
 * @file errors.hpp
 * @brief Domain exceptions raised by the drawdown engine.
 */

#ifndef DRAWDOWN_CORE_ERRORS_HPP
#define DRAWDOWN_CORE_ERRORS_HPP

#include "core/date.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace drawdown
{

    /**
     * @class InvalidSeriesError
     * @brief A valuation series violates an ordering or value precondition.
     *
     * Carries the offending observation (when one can be identified) so
     * upstream data-quality problems can be diagnosed.
     */
    class InvalidSeriesError : public std::invalid_argument
    {
    public:
        explicit InvalidSeriesError(const std::string &message,
                                    std::optional<Date> date = std::nullopt,
                                    std::optional<double> value = std::nullopt)
            : std::invalid_argument(message), date_(date), value_(value)
        {
        }

        const std::optional<Date> &date() const { return date_; }
        const std::optional<double> &value() const { return value_; }

    private:
        std::optional<Date> date_;
        std::optional<double> value_;
    };

    /**
     * @class InvalidThresholdConfigError
     * @brief Alert tiers are out of range or not strictly increasing.
     */
    class InvalidThresholdConfigError : public std::invalid_argument
    {
    public:
        explicit InvalidThresholdConfigError(const std::string &message)
            : std::invalid_argument(message)
        {
        }
    };

} // namespace drawdown

#endif // DRAWDOWN_CORE_ERRORS_HPP

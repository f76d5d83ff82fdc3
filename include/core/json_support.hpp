/**
 * @file json_support.hpp
 * @brief nlohmann::json conversions shared by the engine's records.
 *
 * Dates serialize as "YYYY-MM-DD" strings. Optional values serialize as
 * null when empty so "not computable" stays distinct from zero.
 */

#ifndef DRAWDOWN_CORE_JSON_SUPPORT_HPP
#define DRAWDOWN_CORE_JSON_SUPPORT_HPP

#include "core/date.hpp"

#include <nlohmann/json.hpp>
#include <optional>

namespace drawdown
{

    inline void to_json(nlohmann::json &j, const Date &date)
    {
        j = date.to_string();
    }

    inline void from_json(const nlohmann::json &j, Date &date)
    {
        date = Date::parse(j.get<std::string>());
    }

    template <typename T>
    nlohmann::json optional_to_json(const std::optional<T> &value)
    {
        if (!value)
        {
            return nullptr;
        }
        return nlohmann::json(*value);
    }

} // namespace drawdown

#endif // DRAWDOWN_CORE_JSON_SUPPORT_HPP

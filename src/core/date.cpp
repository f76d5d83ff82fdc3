/**
 * @file date.cpp
 * @brief Implementation of the Date value type.
 *
 * Civil-to-serial conversion uses the era-based algorithm (400-year
 * cycles of 146097 days), valid for the full range of int years.
 */

#include "core/date.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace drawdown
{

    Date::Date() : serial_(0)
    {
    }

    Date::Date(int year, int month, int day) : serial_(0)
    {
        if (month < 1 || month > 12)
        {
            throw std::invalid_argument("Month out of range [1, 12]: " + std::to_string(month));
        }
        if (day < 1 || day > days_in_month(year, month))
        {
            throw std::invalid_argument(
                "Day " + std::to_string(day) + " out of range for " + std::to_string(year) + "-" + std::to_string(month));
        }
        serial_ = days_from_civil(year, month, day);
    }

    Date Date::parse(const std::string &text)
    {
        if (text.length() != 10 || text[4] != '-' || text[7] != '-')
        {
            throw std::invalid_argument("Expected date in YYYY-MM-DD format, got: '" + text + "'");
        }
        for (size_t i = 0; i < text.length(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(text[i])))
            {
                throw std::invalid_argument("Expected date in YYYY-MM-DD format, got: '" + text + "'");
            }
        }

        int year = std::stoi(text.substr(0, 4));
        int month = std::stoi(text.substr(5, 2));
        int day = std::stoi(text.substr(8, 2));
        return Date(year, month, day);
    }

    bool Date::is_valid(const std::string &text)
    {
        try
        {
            parse(text);
            return true;
        }
        catch (const std::invalid_argument &)
        {
            return false;
        }
    }

    Date Date::from_serial(long serial)
    {
        return Date(serial);
    }

    void Date::civil_from_days(long serial, int &year, int &month, int &day)
    {
        long z = serial + 719468;
        long era = (z >= 0 ? z : z - 146096) / 146097;
        long doe = z - era * 146097;
        long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        long mp = (5 * doy + 2) / 153;

        day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
        month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
        year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
    }

    int Date::year() const
    {
        int y, m, d;
        civil_from_days(serial_, y, m, d);
        return y;
    }

    int Date::month() const
    {
        int y, m, d;
        civil_from_days(serial_, y, m, d);
        return m;
    }

    int Date::day() const
    {
        int y, m, d;
        civil_from_days(serial_, y, m, d);
        return d;
    }

    Date Date::add_days(long days) const
    {
        return Date(serial_ + days);
    }

    std::string Date::to_string() const
    {
        int y, m, d;
        civil_from_days(serial_, y, m, d);

        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", y, m, d);
        return std::string(buffer);
    }

    long Date::days_from_civil(int year, int month, int day)
    {
        long y = static_cast<long>(year) - (month <= 2 ? 1 : 0);
        long era = (y >= 0 ? y : y - 399) / 400;
        long yoe = y - era * 400;
        long mp = (month + 9) % 12; // March = 0
        long doy = (153 * mp + 2) / 5 + day - 1;
        long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    bool Date::is_leap_year(int year)
    {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    int Date::days_in_month(int year, int month)
    {
        static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && is_leap_year(year))
        {
            return 29;
        }
        return DAYS[month - 1];
    }

} // namespace drawdown

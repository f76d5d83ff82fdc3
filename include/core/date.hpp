/**
 * @file date.hpp
 * @brief Calendar date value type used to index valuation series.
 *
 * Dates are proleptic Gregorian calendar days stored as a day count
 * relative to 1970-01-01. Differences between dates are exclusive
 * (simple subtraction), so consecutive days differ by 1.
 */

#ifndef DRAWDOWN_CORE_DATE_HPP
#define DRAWDOWN_CORE_DATE_HPP

#include <ostream>
#include <string>

namespace drawdown
{

    /**
     * @class Date
     * @brief Immutable calendar date with day arithmetic.
     *
     * Usage:
     * @code
     *   Date d = Date::parse("2024-03-01");
     *   Date next = d.add_days(1);
     *   int gap = next - d; // 1
     * @endcode
     */
    class Date
    {
    public:
        /** @brief Construct 1970-01-01. */
        Date();

        /**
         * @brief Construct from calendar components.
         * @throws std::invalid_argument If the components do not form a valid date.
         */
        Date(int year, int month, int day);

        /**
         * @brief Parse a YYYY-MM-DD string.
         * @throws std::invalid_argument If the string is malformed or not a valid date.
         */
        static Date parse(const std::string &text);

        /**
         * @brief Check a string for YYYY-MM-DD shape and calendar validity.
         */
        static bool is_valid(const std::string &text);

        /** @brief Construct from a day count relative to 1970-01-01. */
        static Date from_serial(long serial);

        int year() const;
        int month() const;
        int day() const;

        /** @brief Days since 1970-01-01 (negative before). */
        long serial() const { return serial_; }

        Date add_days(long days) const;

        /** @brief Format as YYYY-MM-DD. */
        std::string to_string() const;

        bool operator==(const Date &other) const { return serial_ == other.serial_; }
        bool operator!=(const Date &other) const { return serial_ != other.serial_; }
        bool operator<(const Date &other) const { return serial_ < other.serial_; }
        bool operator<=(const Date &other) const { return serial_ <= other.serial_; }
        bool operator>(const Date &other) const { return serial_ > other.serial_; }
        bool operator>=(const Date &other) const { return serial_ >= other.serial_; }

        /** @brief Exclusive difference in days (this - other). */
        int operator-(const Date &other) const { return static_cast<int>(serial_ - other.serial_); }

    private:
        explicit Date(long serial) : serial_(serial) {}

        static long days_from_civil(int year, int month, int day);
        static void civil_from_days(long serial, int &year, int &month, int &day);
        static bool is_leap_year(int year);
        static int days_in_month(int year, int month);

        long serial_;
    };

    inline std::ostream &operator<<(std::ostream &os, const Date &date)
    {
        return os << date.to_string();
    }

} // namespace drawdown

#endif // DRAWDOWN_CORE_DATE_HPP

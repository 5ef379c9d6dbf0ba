#pragma once

/// @file time_system.hpp
/// @brief Calendar arithmetic, UTC conversion and Julian Dates.

#include "core/types.hpp"

#include <compare>

namespace natal::astro
{
    /// @brief Proleptic Gregorian calendar date.
    struct CalendarDate
    {
        i32 year;
        i32 month;  ///< 1..12
        i32 day;    ///< 1..31

        auto operator<=>(const CalendarDate&) const = default;
    };

    /// @brief Wall-clock time of day, minute resolution.
    struct LocalTime
    {
        i32 hour;   ///< 0..23
        i32 minute; ///< 0..59

        auto operator<=>(const LocalTime&) const = default;
    };

    /// @brief A calendar date paired with a time of day.
    struct CivilTime
    {
        CalendarDate date;
        LocalTime    time;

        auto operator<=>(const CivilTime&) const = default;
    };

    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for calendar and astronomical time computations.
    ///
    /// Julian Dates are built from the chronological day number (integer
    /// Gregorian algorithm) shifted by half a day so civil midnight lands on
    /// the .5 boundary.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Gregorian leap-year rule.
        [[nodiscard]] static bool is_leap_year(i32 year);

        /// @brief Number of days in the given month, or 0 for an invalid month.
        [[nodiscard]] static i32 days_in_month(i32 year, i32 month);

        /// @brief True for year >= 1, month in [1,12] and day within the month.
        [[nodiscard]] static bool is_valid_date(const CalendarDate& date);

        /// @brief True for hour in [0,23] and minute in [0,59].
        [[nodiscard]] static bool is_valid_time(const LocalTime& time);

        /// @brief Chronological Julian Day Number of a calendar date.
        ///
        /// a = (14 - month) / 12, y = year - a, m = month + 12a - 3,
        /// jdn = day + (153m + 2)/5 + 365y + y/4 - y/100 + y/400 + 1721119
        /// (all divisions integer). The day number changes at noon.
        [[nodiscard]] static i64 day_number(i32 year, i32 month, i32 day);

        /// @brief Inverse of day_number() for the proleptic Gregorian calendar.
        [[nodiscard]] static CalendarDate date_from_day_number(i64 jdn);

        /// @brief Julian Date from a UTC calendar date and time of day.
        ///
        /// JD = day_number - 0.5 + (hour + minute / 60) / 24.
        /// Hour and minute must already be expressed in UTC.
        [[nodiscard]] static f64 julian_date(i32 year, i32 month, i32 day, i32 hour, i32 minute);

        /// @brief Julian Date of a UTC civil time.
        [[nodiscard]] static f64 julian_date(const CivilTime& utc);

        /// @brief Convert civil date/time (UTC, with seconds) to Julian Date.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// Seconds are rounded to the nearest millisecond.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Shift a civil time by a number of minutes, rolling the date over.
        [[nodiscard]] static CivilTime add_minutes(const CivilTime& civil, i32 minutes);

        /// @brief Local civil time to UTC.
        /// @param utc_offset_minutes Offset of the local zone, east positive (IST = +330).
        [[nodiscard]] static CivilTime local_to_utc(const CivilTime& local, i32 utc_offset_minutes);

        /// @brief Today's date according to the UTC system clock.
        [[nodiscard]] static CalendarDate today_utc();
    };

} // namespace natal::astro

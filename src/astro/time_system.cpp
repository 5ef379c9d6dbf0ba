/// @file time_system.cpp
/// @brief Calendar arithmetic, Julian Dates and the system clock.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <chrono>
#include <cmath>

namespace natal::astro
{

namespace
{

// Floor division for possibly negative numerators (positive divisor).
i64 floor_div(i64 numerator, i64 divisor)
{
    i64 quotient = numerator / divisor;
    if ((numerator % divisor) != 0 && numerator < 0)
    {
        --quotient;
    }
    return quotient;
}

constexpr i64 kMillisPerDay  = time_constants::kSecondsPerDay * 1000;
constexpr i64 kMillisPerHour = 3600 * 1000;
constexpr i64 kMillisPerMin  = 60 * 1000;

// JDN of 1970-01-01
constexpr i64 kUnixEpochDayNumber = 2440588;

} // anonymous namespace

// -----------------------------------------------------------------
// Calendar validity
// -----------------------------------------------------------------

bool TimeSystem::is_leap_year(i32 year)
{
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

i32 TimeSystem::days_in_month(i32 year, i32 month)
{
    switch (month)
    {
        case 1: case 3: case 5: case 7: case 8: case 10: case 12:
            return 31;
        case 4: case 6: case 9: case 11:
            return 30;
        case 2:
            return is_leap_year(year) ? 29 : 28;
        default:
            return 0;
    }
}

bool TimeSystem::is_valid_date(const CalendarDate& date)
{
    if (date.year < 1 || date.month < 1 || date.month > 12)
    {
        return false;
    }
    return date.day >= 1 && date.day <= days_in_month(date.year, date.month);
}

bool TimeSystem::is_valid_time(const LocalTime& time)
{
    return time.hour >= 0 && time.hour < time_constants::kHoursPerDay
        && time.minute >= 0 && time.minute < time_constants::kMinutesPerHour;
}

// -----------------------------------------------------------------
// Chronological day number (integer Gregorian algorithm)
//
// March-based year so the leap day falls at the end:
//   a = (14 - month) / 12     -> 1 for Jan/Feb, 0 otherwise
//   y = year - a
//   m = month + 12a - 3       -> 0 = March ... 11 = February
//
// y >= 0 for every supported date (year >= 1), so integer
// division here is floor division.
// -----------------------------------------------------------------

i64 TimeSystem::day_number(i32 year, i32 month, i32 day)
{
    const i64 a = (14 - month) / 12;
    const i64 y = static_cast<i64>(year) - a;
    const i64 m = month + 12 * a - 3;

    return day
         + (153 * m + 2) / 5
         + 365 * y
         + y / 4
         - y / 100
         + y / 400
         + 1721119;
}

// -----------------------------------------------------------------
// Day number -> calendar date (Richards, proleptic Gregorian)
// -----------------------------------------------------------------

CalendarDate TimeSystem::date_from_day_number(i64 jdn)
{
    const i64 f = jdn + 1401 + (((4 * jdn + 274277) / 146097) * 3) / 4 - 38;
    const i64 e = 4 * f + 3;
    const i64 g = (e % 1461) / 4;
    const i64 h = 5 * g + 2;

    const i64 day   = (h % 153) / 5 + 1;
    const i64 month = ((h / 153 + 2) % 12) + 1;
    const i64 year  = e / 1461 - 4716 + (12 + 2 - month) / 12;

    return CalendarDate{
        .year  = static_cast<i32>(year),
        .month = static_cast<i32>(month),
        .day   = static_cast<i32>(day),
    };
}

// -----------------------------------------------------------------
// Julian Date
// -----------------------------------------------------------------

f64 TimeSystem::julian_date(i32 year, i32 month, i32 day, i32 hour, i32 minute)
{
    const i64 jdn = day_number(year, month, day);

    const f64 day_fraction = (static_cast<f64>(hour)
                            + static_cast<f64>(minute) / 60.0) / 24.0;

    // Day number starts at noon; civil midnight is half a day earlier
    return static_cast<f64>(jdn) - 0.5 + day_fraction;
}

f64 TimeSystem::julian_date(const CivilTime& utc)
{
    return julian_date(utc.date.year, utc.date.month, utc.date.day,
                       utc.time.hour, utc.time.minute);
}

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    const i64 jdn = day_number(dt.year, dt.month, dt.day);

    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    return static_cast<f64>(jdn) - 0.5 + day_fraction;
}

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    i64 jdn = static_cast<i64>(std::floor(jd_plus));
    const f64 fraction = jd_plus - static_cast<f64>(jdn);

    i64 millis = std::llround(fraction * static_cast<f64>(kMillisPerDay));
    if (millis >= kMillisPerDay)
    {
        millis -= kMillisPerDay;
        ++jdn;
    }

    const CalendarDate date = date_from_day_number(jdn);

    return DateTime{
        .year   = date.year,
        .month  = date.month,
        .day    = date.day,
        .hour   = static_cast<i32>(millis / kMillisPerHour),
        .minute = static_cast<i32>((millis % kMillisPerHour) / kMillisPerMin),
        .second = static_cast<f64>(millis % kMillisPerMin) / 1000.0,
    };
}

// -----------------------------------------------------------------
// Civil time arithmetic
// -----------------------------------------------------------------

CivilTime TimeSystem::add_minutes(const CivilTime& civil, i32 minutes)
{
    const i64 minute_of_day = static_cast<i64>(civil.time.hour) * time_constants::kMinutesPerHour
                            + civil.time.minute
                            + minutes;

    const i64 day_shift = floor_div(minute_of_day, time_constants::kMinutesPerDay);
    const i64 wrapped   = minute_of_day - day_shift * time_constants::kMinutesPerDay;

    const i64 jdn = day_number(civil.date.year, civil.date.month, civil.date.day) + day_shift;

    return CivilTime{
        .date = date_from_day_number(jdn),
        .time = LocalTime{
            .hour   = static_cast<i32>(wrapped / time_constants::kMinutesPerHour),
            .minute = static_cast<i32>(wrapped % time_constants::kMinutesPerHour),
        },
    };
}

CivilTime TimeSystem::local_to_utc(const CivilTime& local, i32 utc_offset_minutes)
{
    return add_minutes(local, -utc_offset_minutes);
}

// -----------------------------------------------------------------
// System clock
// -----------------------------------------------------------------

CalendarDate TimeSystem::today_utc()
{
    using namespace std::chrono;

    const auto since_epoch = system_clock::now().time_since_epoch();
    const i64 seconds = duration_cast<std::chrono::seconds>(since_epoch).count();

    return date_from_day_number(kUnixEpochDayNumber + floor_div(seconds, time_constants::kSecondsPerDay));
}

} // namespace natal::astro

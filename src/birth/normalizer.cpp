/// @file normalizer.cpp
/// @brief Birth data validation and UTC conversion.

#include "birth/normalizer.hpp"

#include "birth/place_parser.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cmath>
#include <utility>
#include <vector>

namespace natal::birth
{

using core::Error;
using core::ErrorCode;
using core::Result;

namespace
{

// Real-world offsets span UTC-12:00 (Baker Island) to UTC+14:00 (Line Islands)
constexpr i32 kMinOffsetMinutes = -12 * time_constants::kMinutesPerHour;
constexpr i32 kMaxOffsetMinutes =  14 * time_constants::kMinutesPerHour;

Error reject(ErrorCode code, std::string message)
{
    NATAL_CORE_DEBUG("Normalizer: {} ({})", message, core::error_code_name(code));
    return Error{.code = code, .message = std::move(message)};
}

std::vector<std::string_view> split(std::string_view text, char delimiter)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t pos = text.find(delimiter, start);
        if (pos == std::string_view::npos)
        {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::optional<i32> parse_field(std::string_view sv, std::size_t max_digits)
{
    if (sv.empty() || sv.size() > max_digits)
    {
        return std::nullopt;
    }

    i32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

bool has_timezone_input(const RawBirthProfile& raw)
{
    return raw.utc_offset_minutes.has_value() || !PlaceParser::trim(raw.timezone_id).empty();
}

bool in_range(f64 value, f64 low, f64 high)
{
    // Written so NaN fails
    return value >= low && value <= high;
}

} // anonymous namespace

BirthMomentNormalizer::BirthMomentNormalizer(const TimezoneResolver& resolver, NormalizerConfig config)
    : m_resolver(resolver)
    , m_config(config)
{
}

// -----------------------------------------------------------------
// normalize
// -----------------------------------------------------------------

Result<BirthMoment> BirthMomentNormalizer::normalize(const RawBirthProfile& raw) const
{
    return normalize(raw, astro::TimeSystem::today_utc());
}

Result<BirthMoment> BirthMomentNormalizer::normalize(const RawBirthProfile& raw,
                                                     const astro::CalendarDate& today) const
{
    // 1. Calendar date
    if (!raw.date)
    {
        return reject(ErrorCode::IncompleteBirthData, "birth date is required");
    }

    const astro::CalendarDate date = *raw.date;
    if (!astro::TimeSystem::is_valid_date(date))
    {
        return reject(ErrorCode::InvalidCalendarDate,
                      fmt::format("{:04d}-{:02d}-{:02d} is not a calendar date",
                                  date.year, date.month, date.day));
    }

    if (auto window = validate_birth_date(date, today, m_config.max_age_years); !window)
    {
        return reject(window.error().code, window.error().message);
    }

    // 2. Local time (optional)
    TimePrecision precision = TimePrecision::Exact;
    astro::LocalTime local_time = m_config.default_local_time;
    if (raw.local_time)
    {
        local_time = *raw.local_time;
        if (!astro::TimeSystem::is_valid_time(local_time))
        {
            return reject(ErrorCode::InvalidLocalTime,
                          fmt::format("{:02d}:{:02d} is not a time of day",
                                      local_time.hour, local_time.minute));
        }
    }
    else
    {
        precision = TimePrecision::Defaulted;
    }

    // 3. UTC offset
    auto offset = resolve_offset(raw, date, local_time);
    if (!offset)
    {
        return offset.error();
    }

    // Without an identifier the offset is recorded as one; no input at all means UTC
    std::string timezone_id(PlaceParser::trim(raw.timezone_id));
    if (timezone_id.empty())
    {
        timezone_id = FixedOffsetTimezoneResolver::format_offset(*offset);
    }

    // 4. Place and coordinates
    auto place = build_place(raw, timezone_id);
    if (!place)
    {
        return place.error();
    }

    // 5. Completeness for full chart generation
    if (m_config.require_full_chart)
    {
        const bool has_coordinates = place.value() && place.value()->has_coordinates();
        if (!has_coordinates)
        {
            return reject(ErrorCode::IncompleteBirthData, "birth coordinates are required for a full chart");
        }
        if (!has_timezone_input(raw))
        {
            return reject(ErrorCode::IncompleteBirthData, "birth timezone is required for a full chart");
        }
    }

    const astro::CivilTime local{.date = date, .time = local_time};

    return BirthMoment{
        .full_name          = raw.full_name,
        .date               = date,
        .local_time         = local_time,
        .time_precision     = precision,
        .utc_offset_minutes = *offset,
        .utc                = astro::TimeSystem::local_to_utc(local, *offset),
        .place              = std::move(place.value()),
    };
}

// -----------------------------------------------------------------
// Birth date window
// -----------------------------------------------------------------

Result<void> BirthMomentNormalizer::validate_birth_date(const astro::CalendarDate& date,
                                                        const astro::CalendarDate& today,
                                                        i32 max_age_years)
{
    if (date > today)
    {
        return Error{
            .code    = ErrorCode::FutureBirthDate,
            .message = fmt::format("birth date {:04d}-{:02d}-{:02d} is in the future",
                                   date.year, date.month, date.day),
        };
    }

    // Same month and day, max_age_years earlier; lexicographic comparison
    // also handles a 29 February "today"
    const astro::CalendarDate earliest{
        .year  = today.year - max_age_years,
        .month = today.month,
        .day   = today.day,
    };

    if (date < earliest)
    {
        return Error{
            .code    = ErrorCode::BirthDateTooOld,
            .message = fmt::format("birth date {:04d}-{:02d}-{:02d} is more than {} years ago",
                                   date.year, date.month, date.day, max_age_years),
        };
    }

    return {};
}

// -----------------------------------------------------------------
// Offset: explicit value, else resolver, else UTC
// -----------------------------------------------------------------

Result<i32> BirthMomentNormalizer::resolve_offset(const RawBirthProfile& raw,
                                                  const astro::CalendarDate& date,
                                                  const astro::LocalTime& time) const
{
    i32 offset = 0;

    if (raw.utc_offset_minutes)
    {
        offset = *raw.utc_offset_minutes;
    }
    else if (const auto id = PlaceParser::trim(raw.timezone_id); !id.empty())
    {
        const auto resolved = m_resolver.utc_offset_minutes(id, date, time);
        if (!resolved)
        {
            return reject(ErrorCode::UnknownTimezone, fmt::format("unknown timezone '{}'", id));
        }
        offset = *resolved;
    }

    if (offset < kMinOffsetMinutes || offset > kMaxOffsetMinutes)
    {
        return reject(ErrorCode::UnknownTimezone,
                      fmt::format("UTC offset of {} minutes is outside -12:00..+14:00", offset));
    }

    return offset;
}

// -----------------------------------------------------------------
// Place: parsed name + validated coordinates
// -----------------------------------------------------------------

Result<std::optional<Place>> BirthMomentNormalizer::build_place(const RawBirthProfile& raw,
                                                                const std::string& timezone_id)
{
    const bool has_lat = raw.latitude_deg.has_value();
    const bool has_lon = raw.longitude_deg.has_value();

    if (has_lat != has_lon)
    {
        return reject(ErrorCode::InvalidCoordinates, "latitude and longitude must be given together");
    }
    if (has_lat && !in_range(*raw.latitude_deg, -90.0, 90.0))
    {
        return reject(ErrorCode::InvalidCoordinates,
                      fmt::format("latitude {} is outside [-90, 90]", *raw.latitude_deg));
    }
    if (has_lon && !in_range(*raw.longitude_deg, -180.0, 180.0))
    {
        return reject(ErrorCode::InvalidCoordinates,
                      fmt::format("longitude {} is outside [-180, 180]", *raw.longitude_deg));
    }

    const std::string_view name = PlaceParser::trim(raw.place_name);

    if (name.empty() && !has_lat && !has_timezone_input(raw))
    {
        return std::optional<Place>{};
    }

    Place place{
        .raw_name             = std::string(name),
        .city                 = {},
        .state                = std::nullopt,
        .country              = {},
        .latitude_deg         = raw.latitude_deg,
        .longitude_deg        = raw.longitude_deg,
        .resolved_timezone_id = timezone_id,
    };

    if (!name.empty())
    {
        ParsedPlaceName parsed = PlaceParser::parse(name);
        if (!parsed.is_usable())
        {
            return reject(ErrorCode::MalformedPlaceName,
                          fmt::format("place name '{}' has no city", name));
        }
        place.city    = std::move(parsed.city);
        place.state   = std::move(parsed.state);
        place.country = std::move(parsed.country);
    }

    return std::optional<Place>(std::move(place));
}

// -----------------------------------------------------------------
// Text fields
// -----------------------------------------------------------------

Result<astro::CalendarDate> BirthMomentNormalizer::parse_calendar_date(std::string_view text)
{
    const auto parts = split(PlaceParser::trim(text), '-');
    if (parts.size() == 3)
    {
        const auto year  = parse_field(parts[0], 4);
        const auto month = parse_field(parts[1], 2);
        const auto day   = parse_field(parts[2], 2);

        if (year && month && day)
        {
            const astro::CalendarDate date{.year = *year, .month = *month, .day = *day};
            if (astro::TimeSystem::is_valid_date(date))
            {
                return date;
            }
        }
    }

    return Error{
        .code    = ErrorCode::InvalidCalendarDate,
        .message = fmt::format("'{}' is not a YYYY-MM-DD date", text),
    };
}

Result<astro::LocalTime> BirthMomentNormalizer::parse_local_time(std::string_view text)
{
    const auto parts = split(PlaceParser::trim(text), ':');
    if (parts.size() == 2 || parts.size() == 3)
    {
        const auto hour   = parse_field(parts[0], 2);
        const auto minute = parse_field(parts[1], 2);
        const bool seconds_ok = parts.size() == 2 || parse_field(parts[2], 2).has_value();

        if (hour && minute && seconds_ok)
        {
            const astro::LocalTime time{.hour = *hour, .minute = *minute};
            if (astro::TimeSystem::is_valid_time(time))
            {
                return time;
            }
        }
    }

    return Error{
        .code    = ErrorCode::InvalidLocalTime,
        .message = fmt::format("'{}' is not an HH:MM time", text),
    };
}

} // namespace natal::birth

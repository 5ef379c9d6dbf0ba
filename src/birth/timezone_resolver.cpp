/// @file timezone_resolver.cpp
/// @brief Fixed-offset identifiers and IANA timezone database lookups.

#include "birth/timezone_resolver.hpp"

#include "birth/place_parser.hpp"
#include "core/logger.hpp"

#include <date/tz.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

namespace natal::birth
{

namespace
{

constexpr i32 kMaxOffsetHours = 14;

std::string to_upper(std::string_view sv)
{
    std::string upper(sv);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

std::optional<i32> parse_digits(std::string_view sv)
{
    // from_chars would accept a second sign
    if (sv.empty() || !std::isdigit(static_cast<unsigned char>(sv.front())))
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

// "+5", "+05", "+0530", "+05:30", "-3:30"
std::optional<i32> parse_signed_offset(std::string_view body)
{
    if (body.size() < 2 || (body.front() != '+' && body.front() != '-'))
    {
        return std::nullopt;
    }

    const i32 sign = (body.front() == '-') ? -1 : 1;
    body.remove_prefix(1);

    std::string_view hours_part = body;
    std::string_view minutes_part;

    if (const auto colon = body.find(':'); colon != std::string_view::npos)
    {
        hours_part   = body.substr(0, colon);
        minutes_part = body.substr(colon + 1);
        if (minutes_part.size() != 2)
        {
            return std::nullopt;
        }
    }
    else if (body.size() == 4)
    {
        hours_part   = body.substr(0, 2);
        minutes_part = body.substr(2);
    }

    if (hours_part.empty() || hours_part.size() > 2)
    {
        return std::nullopt;
    }

    const auto hours = parse_digits(hours_part);
    const auto minutes = minutes_part.empty() ? std::optional<i32>{0} : parse_digits(minutes_part);

    if (!hours || !minutes || *hours > kMaxOffsetHours || *minutes >= time_constants::kMinutesPerHour)
    {
        return std::nullopt;
    }

    return sign * (*hours * time_constants::kMinutesPerHour + *minutes);
}

} // anonymous namespace

std::optional<i32> FixedOffsetTimezoneResolver::utc_offset_minutes(
    std::string_view timezone_id,
    const astro::CalendarDate& /*local_date*/,
    const astro::LocalTime& /*local_time*/) const
{
    return parse_offset(timezone_id);
}

std::optional<i32> FixedOffsetTimezoneResolver::parse_offset(std::string_view timezone_id)
{
    const std::string id = to_upper(PlaceParser::trim(timezone_id));
    if (id.empty())
    {
        return std::nullopt;
    }

    constexpr std::array<std::string_view, 6> kZeroOffsetIds = {
        "UTC", "GMT", "UT", "Z", "ETC/UTC", "ETC/GMT",
    };
    if (std::find(kZeroOffsetIds.begin(), kZeroOffsetIds.end(), id) != kZeroOffsetIds.end())
    {
        return 0;
    }

    const std::string_view view(id);

    // Etc/GMT zones carry whole hours with the POSIX (inverted) sign
    constexpr std::string_view kEtcGmt = "ETC/GMT";
    if (view.starts_with(kEtcGmt))
    {
        const std::string_view body = view.substr(kEtcGmt.size());
        if (body.find(':') != std::string_view::npos || body.size() > 3)
        {
            return std::nullopt;
        }
        const auto offset = parse_signed_offset(body);
        if (!offset)
        {
            return std::nullopt;
        }
        return -*offset;
    }

    for (const std::string_view prefix : {std::string_view("UTC"), std::string_view("GMT")})
    {
        if (view.starts_with(prefix))
        {
            return parse_signed_offset(view.substr(prefix.size()));
        }
    }

    return parse_signed_offset(view);
}

std::string FixedOffsetTimezoneResolver::format_offset(i32 offset_minutes)
{
    if (offset_minutes == 0)
    {
        return "UTC";
    }

    const char sign = offset_minutes < 0 ? '-' : '+';
    const i32 magnitude = std::abs(offset_minutes);
    return fmt::format("UTC{}{:02d}:{:02d}", sign,
                       magnitude / time_constants::kMinutesPerHour,
                       magnitude % time_constants::kMinutesPerHour);
}

// -----------------------------------------------------------------
// IANA timezone database
// -----------------------------------------------------------------

std::optional<i32> TzdbTimezoneResolver::utc_offset_minutes(
    std::string_view timezone_id,
    const astro::CalendarDate& local_date,
    const astro::LocalTime& local_time) const
{
    if (const auto fixed = FixedOffsetTimezoneResolver::parse_offset(timezone_id))
    {
        return fixed;
    }

    const std::string id(PlaceParser::trim(timezone_id));
    if (id.empty())
    {
        return std::nullopt;
    }

    const date::time_zone* zone = nullptr;
    try
    {
        zone = date::locate_zone(id);
    }
    catch (const std::runtime_error& e)
    {
        NATAL_CORE_DEBUG("TimezoneResolver: {}", e.what());
        return std::nullopt;
    }

    const date::year_month_day ymd{
        date::year{local_date.year},
        date::month{static_cast<unsigned>(local_date.month)},
        date::day{static_cast<unsigned>(local_date.day)},
    };
    const date::local_seconds wall = date::local_days{ymd}
                                   + std::chrono::hours{local_time.hour}
                                   + std::chrono::minutes{local_time.minute};

    // first is the rule in force before a gap, and the earlier instant of an overlap
    const date::local_info info = zone->get_info(wall);
    if (info.result != date::local_info::unique)
    {
        NATAL_CORE_DEBUG("TimezoneResolver: {:04d}-{:02d}-{:02d} {:02d}:{:02d} is {} in {}",
                         local_date.year, local_date.month, local_date.day,
                         local_time.hour, local_time.minute,
                         info.result == date::local_info::nonexistent ? "skipped" : "repeated", id);
    }

    const auto offset = std::chrono::duration_cast<std::chrono::minutes>(info.first.offset);
    return static_cast<i32>(offset.count());
}

} // namespace natal::birth

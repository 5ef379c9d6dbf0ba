/// @file zodiac.cpp
/// @brief Zodiac sign mapping and degree formatting.

#include "astro/zodiac.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cmath>

namespace natal::astro
{

namespace
{

constexpr std::array<const char*, zodiac_constants::kSignCount> kSignNames = {
    "Aries", "Taurus", "Gemini", "Cancer", "Leo", "Virgo",
    "Libra", "Scorpio", "Sagittarius", "Capricorn", "Aquarius", "Pisces",
};

constexpr std::array<const char*, zodiac_constants::kSignCount> kSignAbbreviations = {
    "Ari", "Tau", "Gem", "Can", "Leo", "Vir",
    "Lib", "Sco", "Sag", "Cap", "Aqu", "Pis",
};

// Absorbs representation error such as 50.99999999 arc-minutes
constexpr f64 kMinuteEpsilon = 1e-9;

} // anonymous namespace

// -----------------------------------------------------------------
// Normalize to [0, 360)
//
// fmod keeps the sign of the dividend, so negative inputs need one
// wrap. A tiny negative value wraps to 360.0 exactly after rounding;
// that case folds back to 0.
// -----------------------------------------------------------------

f64 Zodiac::normalize_degrees(f64 deg)
{
    f64 normalized = std::fmod(deg, astro_constants::kFullCircleDeg);
    if (normalized < 0.0)
    {
        normalized += astro_constants::kFullCircleDeg;
    }
    if (normalized >= astro_constants::kFullCircleDeg)
    {
        normalized = 0.0;
    }
    return normalized;
}

// -----------------------------------------------------------------
// Longitude -> (sign, degree within sign)
//
// sign = floor(lon / 30), degree = lon - sign * 30.
// lon / 30 can round up to the next integer when lon sits one ulp
// below a sign cusp; the degree then comes out negative and the
// sign is stepped back.
// -----------------------------------------------------------------

SignDegree Zodiac::sign_degree(f64 longitude_deg)
{
    const f64 lon = normalize_degrees(longitude_deg);

    i32 index = static_cast<i32>(std::floor(lon / zodiac_constants::kDegreesPerSign));
    if (index >= zodiac_constants::kSignCount)
    {
        index = zodiac_constants::kSignCount - 1;
    }

    f64 degree = lon - static_cast<f64>(index) * zodiac_constants::kDegreesPerSign;
    if (degree < 0.0 && index > 0)
    {
        --index;
        degree = lon - static_cast<f64>(index) * zodiac_constants::kDegreesPerSign;
    }
    if (degree < 0.0)
    {
        degree = 0.0;
    }

    return SignDegree{
        .sign_index     = index,
        .degree_in_sign = degree,
    };
}

const char* Zodiac::sign_name(ZodiacSign sign)
{
    return kSignNames[static_cast<std::size_t>(sign)];
}

const char* Zodiac::sign_abbreviation(ZodiacSign sign)
{
    return kSignAbbreviations[static_cast<std::size_t>(sign)];
}

DegreesMinutes Zodiac::to_degrees_minutes(f64 deg)
{
    const f64 whole = std::floor(deg);
    i32 minutes = static_cast<i32>(std::floor((deg - whole) * 60.0 + kMinuteEpsilon));
    i32 degrees = static_cast<i32>(whole);

    if (minutes >= 60)
    {
        minutes -= 60;
        ++degrees;
    }

    return DegreesMinutes{
        .degrees = degrees,
        .minutes = minutes,
    };
}

std::string Zodiac::format_longitude(f64 longitude_deg)
{
    const auto dm = to_degrees_minutes(normalize_degrees(longitude_deg));
    return fmt::format("{:03d}°{:02d}′", dm.degrees, dm.minutes);
}

std::string Zodiac::format_sign_position(f64 longitude_deg)
{
    const SignDegree sd = sign_degree(longitude_deg);
    const auto dm = to_degrees_minutes(sd.degree_in_sign);
    return fmt::format("{:02d}°{:02d}′ {}", dm.degrees, dm.minutes, sign_abbreviation(sd.sign()));
}

} // namespace natal::astro

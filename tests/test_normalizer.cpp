/// @file test_normalizer.cpp
/// @brief Unit tests for natal::birth::BirthMomentNormalizer.
///
/// Covers the birth date window, UTC conversion, timezone resolution,
/// coordinate and place validation, and the text field parsers.

#include <doctest/doctest.h>

#include "birth/normalizer.hpp"
#include "birth/timezone_resolver.hpp"
#include "core/error.hpp"
#include "test_helpers.hpp"

#include <limits>
#include <optional>

using namespace natal;
using namespace natal::birth;
using natal::core::ErrorCategory;
using natal::core::ErrorCode;
using natal::test::example_profile;
using natal::test::kToday;

// =================================================================
// Example native
// =================================================================

TEST_CASE("Example native: 07:00 IST on 24 Dec 1999 is 01:30 UTC")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    const auto moment = normalizer.normalize(example_profile(), kToday);
    REQUIRE(moment.has_value());

    CHECK(moment->full_name == "Example Native");
    CHECK(moment->date == astro::CalendarDate{.year = 1999, .month = 12, .day = 24});
    CHECK(moment->local_time == astro::LocalTime{.hour = 7, .minute = 0});
    CHECK(moment->time_precision == TimePrecision::Exact);
    CHECK(moment->is_time_known());
    CHECK(moment->utc_offset_minutes == 330);
    CHECK(moment->utc.date == astro::CalendarDate{.year = 1999, .month = 12, .day = 24});
    CHECK(moment->utc.time == astro::LocalTime{.hour = 1, .minute = 30});

    REQUIRE(moment->place.has_value());
    CHECK(moment->place->city == "New Delhi");
    CHECK(moment->place->state == "Delhi");
    CHECK(moment->place->country == "India");
    CHECK(moment->place->resolved_timezone_id == "Asia/Kolkata");
    CHECK(moment->is_complete());
}

TEST_CASE("Normalization is deterministic")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    const auto first  = normalizer.normalize(example_profile(), kToday);
    const auto second = normalizer.normalize(example_profile(), kToday);

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first == *second);
}

// =================================================================
// Birth date window
// =================================================================

TEST_CASE("Birth date in the future is rejected")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.date = astro::CalendarDate{.year = 2026, .month = 10, .day = 20};

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE_FALSE(moment.has_value());
    CHECK(moment.error().code == ErrorCode::FutureBirthDate);
    CHECK(moment.error().category() == ErrorCategory::Validation);
}

TEST_CASE("Birth date of today is accepted")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.date = kToday;

    CHECK(normalizer.normalize(raw, kToday).has_value());
}

TEST_CASE("Birth date 121 years ago is rejected")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.date = astro::CalendarDate{.year = kToday.year - 121, .month = kToday.month, .day = kToday.day};

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE_FALSE(moment.has_value());
    CHECK(moment.error().code == ErrorCode::BirthDateTooOld);
}

TEST_CASE("Age window edge is exactly 120 years")
{
    const astro::CalendarDate edge{.year = kToday.year - 120, .month = kToday.month, .day = kToday.day};
    const astro::CalendarDate day_before{.year = kToday.year - 120, .month = kToday.month, .day = kToday.day - 1};

    CHECK(BirthMomentNormalizer::validate_birth_date(edge, kToday, 120).has_value());

    const auto too_old = BirthMomentNormalizer::validate_birth_date(day_before, kToday, 120);
    REQUIRE_FALSE(too_old.has_value());
    CHECK(too_old.error().code == ErrorCode::BirthDateTooOld);
}

TEST_CASE("Configured age window is honoured")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver, {.max_age_years = 20});

    const auto moment = normalizer.normalize(example_profile(), kToday);
    REQUIRE_FALSE(moment.has_value());
    CHECK(moment.error().code == ErrorCode::BirthDateTooOld);
}

// =================================================================
// Date and time fields
// =================================================================

TEST_CASE("Missing birth date")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.date.reset();

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE_FALSE(moment.has_value());
    CHECK(moment.error().code == ErrorCode::IncompleteBirthData);
}

TEST_CASE("Impossible calendar date")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.date = astro::CalendarDate{.year = 2023, .month = 2, .day = 29};

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE_FALSE(moment.has_value());
    CHECK(moment.error().code == ErrorCode::InvalidCalendarDate);
}

TEST_CASE("Impossible local time")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.local_time = astro::LocalTime{.hour = 24, .minute = 0};

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE_FALSE(moment.has_value());
    CHECK(moment.error().code == ErrorCode::InvalidLocalTime);
}

TEST_CASE("Unknown birth time falls back to the configured default")
{
    const TzdbTimezoneResolver resolver;

    auto raw = example_profile();
    raw.local_time.reset();

    SUBCASE("Default midnight")
    {
        const BirthMomentNormalizer normalizer(resolver);
        const auto moment = normalizer.normalize(raw, kToday);
        REQUIRE(moment.has_value());

        CHECK(moment->time_precision == TimePrecision::Defaulted);
        CHECK_FALSE(moment->is_time_known());
        CHECK(moment->local_time == astro::LocalTime{.hour = 0, .minute = 0});
        CHECK(moment->utc.date == astro::CalendarDate{.year = 1999, .month = 12, .day = 23});
        CHECK(moment->utc.time == astro::LocalTime{.hour = 18, .minute = 30});
    }

    SUBCASE("Configured noon")
    {
        const BirthMomentNormalizer normalizer(resolver, {.default_local_time = {.hour = 12, .minute = 0}});
        const auto moment = normalizer.normalize(raw, kToday);
        REQUIRE(moment.has_value());

        CHECK(moment->time_precision == TimePrecision::Defaulted);
        CHECK(moment->utc.time == astro::LocalTime{.hour = 6, .minute = 30});
    }
}

// =================================================================
// UTC offset
// =================================================================

TEST_CASE("Explicit offset takes precedence over the timezone id")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.timezone_id = "Europe/Paris";
    raw.utc_offset_minutes = -300;

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE(moment.has_value());
    CHECK(moment->utc_offset_minutes == -300);
    CHECK(moment->utc.time == astro::LocalTime{.hour = 12, .minute = 0});
    CHECK(moment->place->resolved_timezone_id == "Europe/Paris");
}

TEST_CASE("Offset comes from the timezone database when none is given")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.utc_offset_minutes.reset();
    raw.timezone_id = "Europe/Paris";

    SUBCASE("Winter")
    {
        const auto moment = normalizer.normalize(raw, kToday);
        REQUIRE(moment.has_value());
        CHECK(moment->utc_offset_minutes == 60);
        CHECK(moment->utc.time == astro::LocalTime{.hour = 6, .minute = 0});
    }

    SUBCASE("Summer")
    {
        raw.date = astro::CalendarDate{.year = 1999, .month = 7, .day = 14};
        const auto moment = normalizer.normalize(raw, kToday);
        REQUIRE(moment.has_value());
        CHECK(moment->utc_offset_minutes == 120);
        CHECK(moment->utc.time == astro::LocalTime{.hour = 5, .minute = 0});
    }
}

TEST_CASE("Region zone follows daylight saving at the birth date")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.timezone_id = "America/New_York";
    raw.place_name = "New York, NY, USA";
    raw.latitude_deg = 40.7128;
    raw.longitude_deg = -74.0060;

    SUBCASE("Eastern daylight time")
    {
        raw.date = astro::CalendarDate{.year = 1999, .month = 7, .day = 4};
        raw.local_time = astro::LocalTime{.hour = 21, .minute = 15};

        const auto moment = normalizer.normalize(raw, kToday);
        REQUIRE(moment.has_value());
        CHECK(moment->utc_offset_minutes == -240);
        CHECK(moment->utc.date == astro::CalendarDate{.year = 1999, .month = 7, .day = 5});
        CHECK(moment->utc.time == astro::LocalTime{.hour = 1, .minute = 15});
    }

    SUBCASE("Eastern standard time")
    {
        raw.date = astro::CalendarDate{.year = 2000, .month = 1, .day = 15};
        raw.local_time = astro::LocalTime{.hour = 9, .minute = 0};

        const auto moment = normalizer.normalize(raw, kToday);
        REQUIRE(moment.has_value());
        CHECK(moment->utc_offset_minutes == -300);
        CHECK(moment->utc.time == astro::LocalTime{.hour = 14, .minute = 0});
    }
}

TEST_CASE("Unresolvable timezone id")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    for (const char* id : {"Asia/Atlantis", "IST", "UTC+15", "Europe"})
    {
        CAPTURE(id);
        auto raw = example_profile();
        raw.timezone_id = id;

        const auto moment = normalizer.normalize(raw, kToday);
        REQUIRE_FALSE(moment.has_value());
        CHECK(moment.error().code == ErrorCode::UnknownTimezone);
    }
}

TEST_CASE("Offset outside -12:00..+14:00")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.utc_offset_minutes = 15 * 60;

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE_FALSE(moment.has_value());
    CHECK(moment.error().code == ErrorCode::UnknownTimezone);
}

TEST_CASE("Explicit offset without an id is recorded as a fixed-offset id")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.timezone_id.clear();
    raw.utc_offset_minutes = 330;

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE(moment.has_value());
    CHECK(moment->utc.time == astro::LocalTime{.hour = 1, .minute = 30});
    CHECK(moment->place->resolved_timezone_id == "UTC+05:30");
    CHECK(moment->is_complete());
}

TEST_CASE("No offset and no id means UTC")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.timezone_id.clear();
    raw.utc_offset_minutes.reset();

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE(moment.has_value());
    CHECK(moment->utc_offset_minutes == 0);
    CHECK(moment->utc.time == moment->local_time);
    REQUIRE(moment->place.has_value());
    CHECK(moment->place->resolved_timezone_id == "UTC");
    CHECK(moment->is_complete());
}

// =================================================================
// Coordinates and place
// =================================================================

TEST_CASE("Coordinates must be paired and in range")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();

    SUBCASE("Latitude without longitude")
    {
        raw.longitude_deg.reset();
    }
    SUBCASE("Latitude beyond the pole")
    {
        raw.latitude_deg = 91.0;
    }
    SUBCASE("Longitude beyond the antimeridian")
    {
        raw.longitude_deg = -180.5;
    }
    SUBCASE("NaN latitude")
    {
        raw.latitude_deg = std::numeric_limits<f64>::quiet_NaN();
    }

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE_FALSE(moment.has_value());
    CHECK(moment.error().code == ErrorCode::InvalidCoordinates);
}

TEST_CASE("Place name without a usable segment")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.place_name = " , , ";

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE_FALSE(moment.has_value());
    CHECK(moment.error().code == ErrorCode::MalformedPlaceName);
}

TEST_CASE("Coordinates without a place name still make a place")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    auto raw = example_profile();
    raw.place_name.clear();

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE(moment.has_value());
    REQUIRE(moment->place.has_value());
    CHECK(moment->place->city.empty());
    CHECK(moment->place->has_coordinates());
    CHECK(moment->is_complete());
}

TEST_CASE("Nothing about the place gives no place at all")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver);

    const RawBirthProfile raw{
        .full_name          = "Date Only",
        .date               = astro::CalendarDate{.year = 1985, .month = 6, .day = 1},
        .local_time         = std::nullopt,
        .timezone_id        = {},
        .utc_offset_minutes = std::nullopt,
        .place_name         = {},
        .latitude_deg       = std::nullopt,
        .longitude_deg      = std::nullopt,
    };

    const auto moment = normalizer.normalize(raw, kToday);
    REQUIRE(moment.has_value());
    CHECK_FALSE(moment->place.has_value());
    CHECK_FALSE(moment->is_complete());
}

TEST_CASE("Full-chart policy requires coordinates and a timezone")
{
    const TzdbTimezoneResolver resolver;
    const BirthMomentNormalizer normalizer(resolver, {.require_full_chart = true});

    SUBCASE("Complete profile passes")
    {
        CHECK(normalizer.normalize(example_profile(), kToday).has_value());
    }

    SUBCASE("Missing coordinates")
    {
        auto raw = example_profile();
        raw.latitude_deg.reset();
        raw.longitude_deg.reset();

        const auto moment = normalizer.normalize(raw, kToday);
        REQUIRE_FALSE(moment.has_value());
        CHECK(moment.error().code == ErrorCode::IncompleteBirthData);
    }

    SUBCASE("Missing timezone")
    {
        auto raw = example_profile();
        raw.timezone_id.clear();
        raw.utc_offset_minutes.reset();

        const auto moment = normalizer.normalize(raw, kToday);
        REQUIRE_FALSE(moment.has_value());
        CHECK(moment.error().code == ErrorCode::IncompleteBirthData);
    }
}

// =================================================================
// Text field parsers
// =================================================================

TEST_CASE("parse_calendar_date")
{
    const auto date = BirthMomentNormalizer::parse_calendar_date(" 1999-12-24 ");
    REQUIRE(date.has_value());
    CHECK(*date == astro::CalendarDate{.year = 1999, .month = 12, .day = 24});

    for (const char* text : {"", "1999-12", "1999/12/24", "1999-13-01", "1999-02-30", "99999-01-01", "1999-1a-01"})
    {
        CAPTURE(text);
        const auto bad = BirthMomentNormalizer::parse_calendar_date(text);
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == ErrorCode::InvalidCalendarDate);
    }
}

TEST_CASE("parse_local_time")
{
    const auto hhmm = BirthMomentNormalizer::parse_local_time("07:00");
    REQUIRE(hhmm.has_value());
    CHECK(*hhmm == astro::LocalTime{.hour = 7, .minute = 0});

    const auto hhmmss = BirthMomentNormalizer::parse_local_time("23:59:59");
    REQUIRE(hhmmss.has_value());
    CHECK(*hhmmss == astro::LocalTime{.hour = 23, .minute = 59});

    for (const char* text : {"", "7", "24:00", "12:60", "12:30:xx", "12-30", "1:2:3:4"})
    {
        CAPTURE(text);
        const auto bad = BirthMomentNormalizer::parse_local_time(text);
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == ErrorCode::InvalidLocalTime);
    }
}

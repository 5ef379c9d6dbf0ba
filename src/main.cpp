// src/main.cpp - Natal birth-chart pipeline demo
//
// Runs the conversion pipeline on the example native:
//  1. Normalize the raw birth profile (local time -> UTC)
//  2. Load tropical longitudes from an ephemeris CSV
//  3. Assemble the sidereal chart
//  4. Print both zodiacs side by side

#include "astro/planet.hpp"
#include "astro/time_system.hpp"
#include "astro/zodiac.hpp"
#include "birth/normalizer.hpp"
#include "birth/timezone_resolver.hpp"
#include "chart/chart_assembler.hpp"
#include "chart/ephemeris_source.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "ephemeris/ephemeris_loader.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#ifndef NATAL_DATA_DIR
#define NATAL_DATA_DIR "data"
#endif

using namespace natal;

namespace
{

void print_error(const core::Error& error)
{
    NATAL_ERROR("{}: {}", core::error_code_name(error.code), error.message);
}

} // anonymous namespace

int main(int argc, char** argv)
{
    core::Logger::init();
    NATAL_INFO("Natal v0.1 starting");

    std::cout << "================================================================\n"
              << "  NATAL v0.1 - Sidereal Birth Chart Pipeline\n"
              << "================================================================\n\n";

    // -----------------------------------------------------------------------
    // 1. Normalize birth data: 24 Dec 1999, 07:00 Asia/Kolkata, New Delhi
    // -----------------------------------------------------------------------
    const birth::RawBirthProfile raw{
        .full_name          = "Example Native",
        .date               = astro::CalendarDate{.year = 1999, .month = 12, .day = 24},
        .local_time         = astro::LocalTime{.hour = 7, .minute = 0},
        .timezone_id        = "Asia/Kolkata",
        .utc_offset_minutes = std::nullopt,
        .place_name         = "New Delhi, Delhi, India",
        .latitude_deg       = 28.6139,
        .longitude_deg      = 77.2090,
    };

    const birth::TzdbTimezoneResolver resolver;
    const birth::BirthMomentNormalizer normalizer(resolver, {.require_full_chart = true});

    const auto moment = normalizer.normalize(raw);
    if (!moment)
    {
        print_error(moment.error());
        core::Logger::shutdown();
        return 1;
    }

    const auto& place = *moment->place;
    std::cout << "Native: " << moment->full_name << "\n"
              << "  Place: " << place.city << ", " << place.state.value_or("-") << ", " << place.country << "\n"
              << std::fixed << std::setprecision(4)
              << "  Lat: " << *place.latitude_deg << " deg N\n"
              << "  Lon: " << *place.longitude_deg << " deg E\n"
              << "  Zone: " << place.resolved_timezone_id << " ("
              << birth::FixedOffsetTimezoneResolver::format_offset(moment->utc_offset_minutes) << ")\n"
              << std::setfill('0')
              << "  Local: " << moment->date.year << "-" << std::setw(2) << moment->date.month << "-"
              << std::setw(2) << moment->date.day << " " << std::setw(2) << moment->local_time.hour << ":"
              << std::setw(2) << moment->local_time.minute << "\n"
              << "  UTC:   " << moment->utc.date.year << "-" << std::setw(2) << moment->utc.date.month << "-"
              << std::setw(2) << moment->utc.date.day << " " << std::setw(2) << moment->utc.time.hour << ":"
              << std::setw(2) << moment->utc.time.minute << "\n\n"
              << std::setfill(' ');

    // -----------------------------------------------------------------------
    // 2. Load tropical longitudes
    // -----------------------------------------------------------------------
    const std::filesystem::path csv_path = (argc > 1)
        ? std::filesystem::path(argv[1])
        : std::filesystem::path(NATAL_DATA_DIR) / "ephemeris" / "example_1999-12-24.csv";

    std::cout << "Loading ephemeris " << csv_path.string() << "...\n";
    auto tropical = ephemeris::EphemerisLoader::load_csv(csv_path);
    if (!tropical)
    {
        NATAL_ERROR("Could not load ephemeris from {}", csv_path.string());
        core::Logger::shutdown();
        return 1;
    }
    std::cout << "  Loaded " << tropical->size() << " tropical positions.\n\n";

    // -----------------------------------------------------------------------
    // 3. Assemble the chart (classical seven; the sample file has no nodes)
    // -----------------------------------------------------------------------
    const chart::ChartAssembler assembler({
        .ayanamsa = {},
        .planets  = {astro::Planet::Sun, astro::Planet::Moon, astro::Planet::Mercury, astro::Planet::Venus,
                     astro::Planet::Mars, astro::Planet::Jupiter, astro::Planet::Saturn},
    });

    chart::StaticEphemerisSource source(std::move(*tropical));
    const auto bundle = assembler.generate(*moment, source);
    if (!bundle)
    {
        print_error(bundle.error());
        core::Logger::shutdown();
        return 1;
    }

    std::cout << std::fixed << std::setprecision(4)
              << "Julian Date: " << bundle->julian_date << "\n"
              << "Ayanamsa:    " << bundle->ayanamsa_deg << " deg (Lahiri, linear)\n\n";

    // -----------------------------------------------------------------------
    // 4. Tropical vs sidereal table
    // -----------------------------------------------------------------------
    std::cout << std::left
              << std::setw(10) << "Planet"
              << std::setw(12) << "Tropical" << std::setw(16) << "Trop. sign"
              << std::setw(12) << "Sidereal" << "Sid. sign\n"
              << "----------------------------------------------------------------\n";

    for (const auto& position : bundle->positions)
    {
        std::cout << std::setw(10) << astro::planet_name(position.planet)
                  << std::setw(12) << astro::Zodiac::format_longitude(position.tropical_longitude_deg)
                  << std::setw(16) << astro::Zodiac::format_sign_position(position.tropical_longitude_deg)
                  << std::setw(12) << astro::Zodiac::format_longitude(position.longitude_deg)
                  << astro::Zodiac::format_sign_position(position.longitude_deg) << "\n";
    }

    std::cout << "\n================================================================\n"
              << "  Chart complete.\n"
              << "================================================================\n";

    NATAL_INFO("Natal shutting down");
    core::Logger::shutdown();
    return 0;
}

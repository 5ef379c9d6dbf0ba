#pragma once

/// @file test_helpers.hpp
/// @brief Shared fixtures: temporary files and the 24 Dec 1999 example native.

#include "astro/planet.hpp"
#include "astro/sidereal_mapper.hpp"
#include "astro/time_system.hpp"
#include "birth/normalizer.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace natal::test
{
    // =================================================================
    // Temporary CSV file, removed on destruction
    // =================================================================

    class TempCsvFile
    {
    public:
        explicit TempCsvFile(const std::string& filename, const std::string& content)
            : m_path(std::filesystem::temp_directory_path() / filename)
        {
            std::ofstream file(m_path);
            file << content;
        }

        ~TempCsvFile()
        {
            std::error_code ec;
            std::filesystem::remove(m_path, ec);
        }

        [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

        TempCsvFile(const TempCsvFile&) = delete;
        TempCsvFile& operator=(const TempCsvFile&) = delete;

    private:
        std::filesystem::path m_path;
    };

    // =================================================================
    // Example native: 24 Dec 1999, 07:00 Asia/Kolkata (UTC+05:30), New Delhi
    // =================================================================

    /// Fixed "today" so date-window checks do not depend on the clock.
    inline constexpr astro::CalendarDate kToday{.year = 2026, .month = 10, .day = 19};

    inline birth::RawBirthProfile example_profile()
    {
        return birth::RawBirthProfile{
            .full_name          = "Example Native",
            .date               = astro::CalendarDate{.year = 1999, .month = 12, .day = 24},
            .local_time         = astro::LocalTime{.hour = 7, .minute = 0},
            .timezone_id        = "Asia/Kolkata",
            .utc_offset_minutes = std::nullopt,
            .place_name         = "New Delhi, Delhi, India",
            .latitude_deg       = 28.6139,
            .longitude_deg      = 77.2090,
        };
    }

    /// Tropical longitudes for the example native (degrees).
    inline std::vector<astro::TropicalPosition> example_tropical()
    {
        using astro::Planet;
        return {
            {.planet = Planet::Sun,     .longitude_deg = 271.7},
            {.planet = Planet::Moon,    .longitude_deg = 109.7},
            {.planet = Planet::Mercury, .longitude_deg = 258.8333},
            {.planet = Planet::Venus,   .longitude_deg = 231.3333},
            {.planet = Planet::Mars,    .longitude_deg = 321.3667},
            {.planet = Planet::Jupiter, .longitude_deg = 25.0167},
            {.planet = Planet::Saturn,  .longitude_deg = 40.6167},
        };
    }

    /// Planets present in example_tropical(), in file order.
    inline std::vector<astro::Planet> example_planets()
    {
        using astro::Planet;
        return {Planet::Sun, Planet::Moon, Planet::Mercury, Planet::Venus,
                Planet::Mars, Planet::Jupiter, Planet::Saturn};
    }

} // namespace natal::test

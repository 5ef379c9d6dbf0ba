/// @file ephemeris_loader.cpp
/// @brief Implementation of the CSV ephemeris loader.

#include "ephemeris/ephemeris_loader.hpp"

#include "astro/planet.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <string>

namespace natal::ephemeris
{

// -----------------------------------------------------------------
// Load CSV: Planet,Longitude_deg
// -----------------------------------------------------------------

std::optional<std::vector<astro::TropicalPosition>>
EphemerisLoader::load_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        NATAL_CORE_ERROR("EphemerisLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(file, line))
    {
        NATAL_CORE_ERROR("EphemerisLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    // Header must name the planet column first
    const auto header = split_columns(line);
    if (!header || !iequals(header->first, "Planet"))
    {
        NATAL_CORE_ERROR("EphemerisLoader: Expected 'Planet,Longitude_deg' header in {}, got: {}",
                         path.string(), line);
        return std::nullopt;
    }

    std::vector<astro::TropicalPosition> positions;
    u32 line_number = 1;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        const std::string_view content = trim(line);
        if (content.empty() || content.front() == '#')
        {
            continue;
        }

        const auto columns = split_columns(content);
        if (!columns)
        {
            NATAL_CORE_WARN("EphemerisLoader: Malformed line {}: {}", line_number, content);
            ++skipped;
            continue;
        }

        const auto planet = astro::parse_planet(columns->first);
        if (!planet)
        {
            NATAL_CORE_WARN("EphemerisLoader: Unknown planet '{}' on line {}", columns->first, line_number);
            ++skipped;
            continue;
        }

        const auto longitude = parse_f64(columns->second);
        if (!longitude)
        {
            NATAL_CORE_WARN("EphemerisLoader: Bad longitude '{}' for {} on line {}",
                            columns->second, astro::planet_name(*planet), line_number);
            ++skipped;
            continue;
        }

        positions.push_back(astro::TropicalPosition{
            .planet        = *planet,
            .longitude_deg = *longitude,
        });
    }

    if (positions.empty())
    {
        NATAL_CORE_ERROR("EphemerisLoader: No valid positions found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        NATAL_CORE_WARN("EphemerisLoader: Skipped {} of {} data lines in {}",
                        skipped, skipped + positions.size(), path.string());
    }

    NATAL_CORE_INFO("EphemerisLoader: Loaded {} positions from {}", positions.size(), path.string());

    return positions;
}

// -----------------------------------------------------------------
// Utility: split "name,value" into two trimmed columns
// -----------------------------------------------------------------

std::optional<std::pair<std::string_view, std::string_view>>
EphemerisLoader::split_columns(std::string_view line)
{
    const std::size_t comma = line.find(',');
    if (comma == std::string_view::npos)
    {
        return std::nullopt;
    }

    const std::string_view name  = trim(line.substr(0, comma));
    const std::string_view value = trim(line.substr(comma + 1));

    if (name.empty() || value.empty() || value.find(',') != std::string_view::npos)
    {
        return std::nullopt;
    }
    return std::pair{name, value};
}

bool EphemerisLoader::iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view EphemerisLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> EphemerisLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }

    return value;
}

} // namespace natal::ephemeris

/// @file planet.cpp
/// @brief Planet names and lookup.

#include "astro/planet.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace natal::astro
{

const char* planet_name(Planet planet)
{
    switch (planet)
    {
        case Planet::Sun:     return "Sun";
        case Planet::Moon:    return "Moon";
        case Planet::Mercury: return "Mercury";
        case Planet::Venus:   return "Venus";
        case Planet::Mars:    return "Mars";
        case Planet::Jupiter: return "Jupiter";
        case Planet::Saturn:  return "Saturn";
        case Planet::Uranus:  return "Uranus";
        case Planet::Neptune: return "Neptune";
        case Planet::Pluto:   return "Pluto";
        case Planet::Rahu:    return "Rahu";
        case Planet::Ketu:    return "Ketu";
    }
    return "Unknown";
}

std::optional<Planet> parse_planet(std::string_view name)
{
    // Lowercase and drop separators so "North Node", "north_node" and
    // "NorthNode" compare equal
    std::string key;
    key.reserve(name.size());
    for (const char c : name)
    {
        if (c == ' ' || c == '_' || c == '-' || c == '\t')
        {
            continue;
        }
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (key == "northnode")
    {
        return Planet::Rahu;
    }
    if (key == "southnode")
    {
        return Planet::Ketu;
    }

    const auto it = std::find_if(kAllPlanets.begin(), kAllPlanets.end(), [&key](Planet planet) {
        std::string candidate = planet_name(planet);
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return candidate == key;
    });

    if (it == kAllPlanets.end())
    {
        return std::nullopt;
    }
    return *it;
}

} // namespace natal::astro

#pragma once

/// @file planet.hpp
/// @brief Chart bodies reported by the ephemeris collaborator.

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace natal::astro
{
    /// @brief Bodies a chart can carry. Rahu is the mean north lunar node,
    /// Ketu the point opposite it.
    enum class Planet : u8
    {
        Sun, Moon, Mercury, Venus, Mars, Jupiter, Saturn,
        Uranus, Neptune, Pluto, Rahu, Ketu,
    };

    inline constexpr std::array<Planet, 12> kAllPlanets = {
        Planet::Sun, Planet::Moon, Planet::Mercury, Planet::Venus,
        Planet::Mars, Planet::Jupiter, Planet::Saturn, Planet::Uranus,
        Planet::Neptune, Planet::Pluto, Planet::Rahu, Planet::Ketu,
    };

    /// Classical grahas used for a sidereal chart.
    inline constexpr std::array<Planet, 9> kVedicPlanets = {
        Planet::Sun, Planet::Moon, Planet::Mars, Planet::Mercury,
        Planet::Jupiter, Planet::Venus, Planet::Saturn, Planet::Rahu,
        Planet::Ketu,
    };

    [[nodiscard]] const char* planet_name(Planet planet);

    /// @brief Case-insensitive lookup. Also accepts "North Node"/"South Node"
    /// (with space, underscore or nothing between the words) for Rahu/Ketu.
    [[nodiscard]] std::optional<Planet> parse_planet(std::string_view name);

} // namespace natal::astro

#pragma once

/// @file chart_bundle.hpp
/// @brief Everything a chart view needs for one birth moment.

#include "astro/planet.hpp"
#include "astro/sidereal_mapper.hpp"
#include "birth/birth_moment.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <vector>

namespace natal::chart
{
    /// @brief A birth moment with its Julian Date, ayanamsa and sidereal positions.
    ///
    /// Positions follow the order the planets were requested in, one per planet.
    struct ChartBundle
    {
        birth::BirthMoment                   moment;
        f64                                  julian_date  = 0.0;
        f64                                  ayanamsa_deg = 0.0;
        std::vector<astro::SiderealPosition> positions;

        /// @brief Position of a planet, or nullptr if it was not requested.
        [[nodiscard]] const astro::SiderealPosition* find(astro::Planet planet) const
        {
            const auto it = std::find_if(positions.begin(), positions.end(),
                                         [planet](const astro::SiderealPosition& p) { return p.planet == planet; });
            return it != positions.end() ? &*it : nullptr;
        }

        bool operator==(const ChartBundle&) const = default;
    };

} // namespace natal::chart

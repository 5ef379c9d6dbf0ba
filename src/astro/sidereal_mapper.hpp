#pragma once

/// @file sidereal_mapper.hpp
/// @brief Tropical ecliptic longitudes -> sidereal sign positions.

#include "astro/planet.hpp"
#include "astro/zodiac.hpp"
#include "core/types.hpp"

#include <span>
#include <vector>

namespace natal::astro
{
    /// @brief Ecliptic longitude of a body measured from the vernal equinox.
    /// Supplied by the ephemeris collaborator.
    struct TropicalPosition
    {
        Planet planet;
        f64    longitude_deg;   ///< Expected in [0, 360); any finite value is accepted

        auto operator<=>(const TropicalPosition&) const = default;
    };

    /// @brief A body's position in the fixed-star zodiac.
    ///
    /// Keeps the (normalized) tropical longitude alongside so both
    /// zodiacs can be shown from one record.
    struct SiderealPosition
    {
        Planet planet;
        f64    tropical_longitude_deg;  ///< [0, 360)
        f64    longitude_deg;           ///< Sidereal, [0, 360)
        i32    sign_index;              ///< 0 = Aries ... 11 = Pisces
        f64    degree_in_sign;          ///< [0, 30)

        [[nodiscard]] ZodiacSign sign() const { return static_cast<ZodiacSign>(sign_index); }

        /// @brief Sign of the tropical longitude.
        [[nodiscard]] SignDegree tropical_sign_degree() const { return Zodiac::sign_degree(tropical_longitude_deg); }

        auto operator<=>(const SiderealPosition&) const = default;
    };

    /// @brief Static utility class applying the ayanamsa to tropical positions.
    class SiderealMapper
    {
    public:
        SiderealMapper() = delete;

        /// @brief sidereal = normalize(tropical - ayanamsa), then split into sign/degree.
        [[nodiscard]] static SiderealPosition to_sidereal(const TropicalPosition& tropical, f64 ayanamsa_deg);

        /// @brief One SiderealPosition per input, in input order.
        [[nodiscard]] static std::vector<SiderealPosition> to_sidereal(
            std::span<const TropicalPosition> tropical, f64 ayanamsa_deg);
    };

} // namespace natal::astro

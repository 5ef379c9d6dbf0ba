/// @file sidereal_mapper.cpp
/// @brief Implementation of the tropical -> sidereal conversion.

#include "astro/sidereal_mapper.hpp"

#include <algorithm>
#include <iterator>

namespace natal::astro
{

SiderealPosition SiderealMapper::to_sidereal(const TropicalPosition& tropical, f64 ayanamsa_deg)
{
    const f64 sidereal = Zodiac::normalize_degrees(tropical.longitude_deg - ayanamsa_deg);
    const SignDegree sd = Zodiac::sign_degree(sidereal);

    return SiderealPosition{
        .planet                 = tropical.planet,
        .tropical_longitude_deg = Zodiac::normalize_degrees(tropical.longitude_deg),
        .longitude_deg          = sidereal,
        .sign_index             = sd.sign_index,
        .degree_in_sign         = sd.degree_in_sign,
    };
}

std::vector<SiderealPosition> SiderealMapper::to_sidereal(
    std::span<const TropicalPosition> tropical, f64 ayanamsa_deg)
{
    std::vector<SiderealPosition> result;
    result.reserve(tropical.size());

    std::transform(tropical.begin(), tropical.end(), std::back_inserter(result),
                   [ayanamsa_deg](const TropicalPosition& position) {
                       return to_sidereal(position, ayanamsa_deg);
                   });

    return result;
}

} // namespace natal::astro

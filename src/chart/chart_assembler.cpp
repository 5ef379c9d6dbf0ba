/// @file chart_assembler.cpp
/// @brief Chart assembly and ephemeris response validation.

#include "chart/chart_assembler.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <optional>
#include <utility>

namespace natal::chart
{

using core::Error;
using core::ErrorCode;
using core::Result;

namespace
{

std::vector<astro::Planet> unique_in_order(std::span<const astro::Planet> planets)
{
    std::vector<astro::Planet> unique;
    unique.reserve(planets.size());
    for (const astro::Planet planet : planets)
    {
        if (std::find(unique.begin(), unique.end(), planet) == unique.end())
        {
            unique.push_back(planet);
        }
    }
    return unique;
}

Error incomplete_birth_data()
{
    return Error{
        .code    = ErrorCode::IncompleteBirthData,
        .message = "birth coordinates and timezone are required for chart generation",
    };
}

} // anonymous namespace

ChartAssembler::ChartAssembler(ChartConfig config)
    : m_config(std::move(config))
{
}

// -----------------------------------------------------------------
// assemble
// -----------------------------------------------------------------

Result<ChartBundle> ChartAssembler::assemble(
    const birth::BirthMoment& moment,
    std::span<const astro::TropicalPosition> ephemeris) const
{
    return assemble(moment, m_config.planets, ephemeris);
}

Result<ChartBundle> ChartAssembler::assemble(
    const birth::BirthMoment& moment,
    std::span<const astro::Planet> requested,
    std::span<const astro::TropicalPosition> ephemeris) const
{
    if (!moment.is_complete())
    {
        NATAL_CORE_WARN("ChartAssembler: Birth data for '{}' is incomplete", moment.full_name);
        return incomplete_birth_data();
    }

    const std::vector<astro::Planet> planets = unique_in_order(requested);

    // No planet may appear twice in the response
    std::array<bool, astro::kAllPlanets.size()> seen{};
    for (const auto& position : ephemeris)
    {
        const auto index = static_cast<std::size_t>(position.planet);
        if (index >= seen.size())
        {
            NATAL_CORE_WARN("ChartAssembler: Ephemeris returned unknown planet id {}", index);
            return Error{
                .code    = ErrorCode::IncompleteEphemerisData,
                .message = fmt::format("ephemeris returned unknown planet id {}", index),
            };
        }

        auto& flag = seen[index];
        if (flag)
        {
            NATAL_CORE_WARN("ChartAssembler: Ephemeris returned {} twice", astro::planet_name(position.planet));
            return Error{
                .code    = ErrorCode::DuplicateEphemerisEntry,
                .message = fmt::format("ephemeris returned {} more than once", astro::planet_name(position.planet)),
            };
        }
        flag = true;
    }

    if (ephemeris.size() < planets.size())
    {
        NATAL_CORE_WARN("ChartAssembler: Ephemeris returned {} of {} requested positions",
                        ephemeris.size(), planets.size());
        return Error{
            .code    = ErrorCode::IncompleteEphemerisData,
            .message = fmt::format("ephemeris returned {} of {} requested positions",
                                   ephemeris.size(), planets.size()),
        };
    }

    // Pick the requested planets, in request order
    std::vector<astro::TropicalPosition> selected;
    selected.reserve(planets.size());
    for (const astro::Planet planet : planets)
    {
        const auto it = std::find_if(ephemeris.begin(), ephemeris.end(),
                                     [planet](const astro::TropicalPosition& p) { return p.planet == planet; });

        if (it == ephemeris.end() || !std::isfinite(it->longitude_deg))
        {
            const char* reason = (it == ephemeris.end()) ? "missing" : "not a finite longitude";
            NATAL_CORE_WARN("ChartAssembler: {} {} in ephemeris response", astro::planet_name(planet), reason);
            return Error{
                .code    = ErrorCode::IncompleteEphemerisData,
                .message = fmt::format("{} {} in ephemeris response", astro::planet_name(planet), reason),
            };
        }
        selected.push_back(*it);
    }

    if (ephemeris.size() > selected.size())
    {
        NATAL_CORE_DEBUG("ChartAssembler: Ignoring {} unrequested ephemeris positions",
                         ephemeris.size() - selected.size());
    }

    // Ayanamsa is keyed by the birth year as the user entered it
    const f64 jd       = astro::TimeSystem::julian_date(moment.utc);
    const f64 ayanamsa = astro::Ayanamsa::for_date(moment.date, m_config.ayanamsa);

    ChartBundle bundle{
        .moment       = moment,
        .julian_date  = jd,
        .ayanamsa_deg = ayanamsa,
        .positions    = astro::SiderealMapper::to_sidereal(selected, ayanamsa),
    };

    NATAL_CORE_INFO("ChartAssembler: Chart for '{}' (JD {:.4f}, ayanamsa {:.4f}°, {} positions)",
                    moment.full_name, jd, ayanamsa, bundle.positions.size());

    return bundle;
}

// -----------------------------------------------------------------
// generate: request -> fetch -> assemble
// -----------------------------------------------------------------

Result<ChartBundle> ChartAssembler::generate(const birth::BirthMoment& moment, EphemerisSource& source) const
{
    auto request = make_request(moment, m_config.planets);
    if (!request)
    {
        return request.error();
    }

    auto response = source.fetch(*request);
    if (!response)
    {
        NATAL_CORE_WARN("ChartAssembler: Ephemeris fetch failed: {}", response.error().message);
        return response.error();
    }

    return assemble(moment, m_config.planets, response.value());
}

Result<EphemerisRequest> ChartAssembler::make_request(
    const birth::BirthMoment& moment,
    std::span<const astro::Planet> planets)
{
    if (!moment.is_complete())
    {
        return incomplete_birth_data();
    }

    return EphemerisRequest{
        .local_date    = moment.date,
        .local_time    = moment.local_time,
        .utc           = moment.utc,
        .latitude_deg  = *moment.place->latitude_deg,
        .longitude_deg = *moment.place->longitude_deg,
        .timezone_id   = moment.place->resolved_timezone_id,
        .planets       = unique_in_order(planets),
    };
}

} // namespace natal::chart

#pragma once

/// @file ephemeris_source.hpp
/// @brief Boundary to the service that supplies tropical planetary longitudes.

#include "astro/planet.hpp"
#include "astro/sidereal_mapper.hpp"
#include "astro/time_system.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace natal::chart
{
    /// @brief What the ephemeris service is asked for.
    ///
    /// Positions are expected at the exact UTC instant, not a rounded one.
    struct EphemerisRequest
    {
        astro::CalendarDate        local_date;
        astro::LocalTime           local_time;
        astro::CivilTime           utc;
        f64                        latitude_deg  = 0.0;
        f64                        longitude_deg = 0.0;
        std::string                timezone_id;
        std::vector<astro::Planet> planets;
    };

    /// @brief Supplier of tropical longitudes (remote service, file, fixture).
    ///
    /// Implementations own transport, caching and retry; the pipeline calls
    /// fetch() once per chart and reports whatever comes back.
    class EphemerisSource
    {
    public:
        virtual ~EphemerisSource() = default;

        [[nodiscard]] virtual core::Result<std::vector<astro::TropicalPosition>> fetch(
            const EphemerisRequest& request) = 0;
    };

    /// @brief Returns the same preloaded positions for every request.
    class StaticEphemerisSource final : public EphemerisSource
    {
    public:
        explicit StaticEphemerisSource(std::vector<astro::TropicalPosition> positions)
            : m_positions(std::move(positions))
        {
        }

        [[nodiscard]] core::Result<std::vector<astro::TropicalPosition>> fetch(
            const EphemerisRequest& /*request*/) override
        {
            ++m_fetch_count;
            return m_positions;
        }

        [[nodiscard]] std::size_t fetch_count() const { return m_fetch_count; }

    private:
        std::vector<astro::TropicalPosition> m_positions;
        std::size_t                          m_fetch_count = 0;
    };

} // namespace natal::chart

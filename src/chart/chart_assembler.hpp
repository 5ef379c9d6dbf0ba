#pragma once

/// @file chart_assembler.hpp
/// @brief Combines a birth moment and ephemeris data into a ChartBundle.

#include "astro/ayanamsa.hpp"
#include "astro/planet.hpp"
#include "astro/sidereal_mapper.hpp"
#include "birth/birth_moment.hpp"
#include "chart/chart_bundle.hpp"
#include "chart/ephemeris_source.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <span>
#include <vector>

namespace natal::chart
{
    /// @brief Chart assembly settings.
    struct ChartConfig
    {
        astro::AyanamsaModel       ayanamsa;
        std::vector<astro::Planet> planets{astro::kVedicPlanets.begin(), astro::kVedicPlanets.end()};
    };

    /// @brief Builds ChartBundles and checks the ephemeris response against the request.
    ///
    /// Never retries and never substitutes default positions: a short or
    /// inconsistent ephemeris response is reported to the caller as
    /// IncompleteEphemerisData or DuplicateEphemerisEntry.
    class ChartAssembler
    {
    public:
        explicit ChartAssembler(ChartConfig config = {});

        /// @brief Assemble a chart for explicitly requested planets.
        ///
        /// Repeated planets in the request are collapsed to their first
        /// occurrence. Ephemeris entries for planets that were not
        /// requested are ignored.
        [[nodiscard]] core::Result<ChartBundle> assemble(
            const birth::BirthMoment& moment,
            std::span<const astro::Planet> requested,
            std::span<const astro::TropicalPosition> ephemeris) const;

        /// @brief Assemble a chart for the configured planets.
        [[nodiscard]] core::Result<ChartBundle> assemble(
            const birth::BirthMoment& moment,
            std::span<const astro::TropicalPosition> ephemeris) const;

        /// @brief Fetch the configured planets from `source`, then assemble.
        [[nodiscard]] core::Result<ChartBundle> generate(
            const birth::BirthMoment& moment,
            EphemerisSource& source) const;

        /// @brief Ephemeris request for a complete birth moment.
        [[nodiscard]] static core::Result<EphemerisRequest> make_request(
            const birth::BirthMoment& moment,
            std::span<const astro::Planet> planets);

        [[nodiscard]] const ChartConfig& config() const { return m_config; }

    private:
        ChartConfig m_config;
    };

} // namespace natal::chart

#pragma once

/// @file ayanamsa.hpp
/// @brief Precession offset between the tropical and sidereal zodiacs.

#include "astro/time_system.hpp"
#include "core/types.hpp"

namespace natal::astro
{
    /// @brief Parameters of a linear ayanamsa model.
    ///
    /// The defaults approximate the Lahiri ayanamsa: 22.46° in 1900,
    /// growing 0.0139°/year (≈ 50.3″/year). This is not the published
    /// Lahiri table; error against it grows with distance from 1900 and
    /// is a few arc-minutes across the 20th and 21st centuries.
    struct AyanamsaModel
    {
        f64 base_year         = 1900.0;
        f64 base_value_deg    = 22.46;
        f64 rate_deg_per_year = 0.0139;

        bool operator==(const AyanamsaModel&) const = default;
    };

    /// @brief Static utility class computing the ayanamsa for a year.
    class Ayanamsa
    {
    public:
        Ayanamsa() = delete;

        /// @brief Ayanamsa in degrees for a (possibly fractional) calendar year.
        /// @return base_value + (year - base_year) * rate
        [[nodiscard]] static f64 for_year(f64 year, const AyanamsaModel& model = {});

        /// @brief Ayanamsa for the calendar year of a date. Month and day are ignored.
        [[nodiscard]] static f64 for_date(const CalendarDate& date, const AyanamsaModel& model = {});
    };

} // namespace natal::astro

#pragma once

/// @file birth_moment.hpp
/// @brief Validated birth data that feeds the chart pipeline.

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>

namespace natal::birth
{
    /// @brief Whether the birth time was supplied or filled in with a default.
    enum class TimePrecision : u8
    {
        Exact,      ///< Time given by the user
        Defaulted,  ///< No time given; the configured default was used
    };

    /// @brief Birth place after parsing and coordinate validation.
    struct Place
    {
        std::string                raw_name;     ///< As entered, may be empty
        std::string                city;
        std::optional<std::string> state;
        std::string                country;
        std::optional<f64>         latitude_deg;   ///< [-90, 90], north positive
        std::optional<f64>         longitude_deg;  ///< [-180, 180], east positive
        std::string                resolved_timezone_id;

        [[nodiscard]] bool has_coordinates() const
        {
            return latitude_deg.has_value() && longitude_deg.has_value();
        }

        auto operator<=>(const Place&) const = default;
    };

    /// @brief One person's birth instant, local and UTC.
    ///
    /// Created by BirthMomentNormalizer only; never modified afterwards.
    /// The birth date is guaranteed to be no later than the creation day and
    /// within the configured age window of it.
    struct BirthMoment
    {
        std::string          full_name;
        astro::CalendarDate  date;
        astro::LocalTime     local_time;
        TimePrecision        time_precision = TimePrecision::Exact;
        i32                  utc_offset_minutes = 0;  ///< East positive
        astro::CivilTime     utc;                     ///< date + local_time - offset
        std::optional<Place> place;

        /// @brief True when coordinates and a timezone are known,
        /// i.e. a full chart can be requested.
        [[nodiscard]] bool is_complete() const
        {
            return place.has_value()
                && place->has_coordinates()
                && !place->resolved_timezone_id.empty();
        }

        [[nodiscard]] bool is_time_known() const { return time_precision == TimePrecision::Exact; }

        auto operator<=>(const BirthMoment&) const = default;
    };

} // namespace natal::birth

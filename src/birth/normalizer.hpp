#pragma once

/// @file normalizer.hpp
/// @brief Raw profile fields -> validated BirthMoment.

#include "astro/time_system.hpp"
#include "birth/birth_moment.hpp"
#include "birth/timezone_resolver.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace natal::birth
{
    /// @brief Birth data as the profile layer collects it. Everything except
    /// the date may be missing.
    struct RawBirthProfile
    {
        std::string                        full_name;
        std::optional<astro::CalendarDate> date;
        std::optional<astro::LocalTime>    local_time;
        std::string                        timezone_id;         ///< IANA-style or fixed-offset identifier
        std::optional<i32>                 utc_offset_minutes;  ///< Takes precedence over timezone_id
        std::string                        place_name;          ///< "City, State, Country"
        std::optional<f64>                 latitude_deg;
        std::optional<f64>                 longitude_deg;
    };

    /// @brief Normalizer policy.
    struct NormalizerConfig
    {
        i32              max_age_years      = 120;
        astro::LocalTime default_local_time = {.hour = 0, .minute = 0};
        bool             require_full_chart = false;  ///< Demand coordinates and timezone
    };

    /// @brief Validates raw profile fields and derives the UTC birth instant.
    ///
    /// Pure apart from trace logging: the same input and `today` always give
    /// the same result.
    class BirthMomentNormalizer
    {
    public:
        /// @param resolver Used only when the profile has no explicit offset.
        ///                 Must outlive the normalizer.
        explicit BirthMomentNormalizer(const TimezoneResolver& resolver, NormalizerConfig config = {});

        /// @brief Normalize against an explicit "today".
        [[nodiscard]] core::Result<BirthMoment> normalize(const RawBirthProfile& raw,
                                                          const astro::CalendarDate& today) const;

        /// @brief Normalize against today's UTC date.
        [[nodiscard]] core::Result<BirthMoment> normalize(const RawBirthProfile& raw) const;

        [[nodiscard]] const NormalizerConfig& config() const { return m_config; }

        /// @brief Reject dates after `today` or more than `max_age_years` before it.
        [[nodiscard]] static core::Result<void> validate_birth_date(const astro::CalendarDate& date,
                                                                    const astro::CalendarDate& today,
                                                                    i32 max_age_years);

        /// @brief Parse "YYYY-MM-DD".
        [[nodiscard]] static core::Result<astro::CalendarDate> parse_calendar_date(std::string_view text);

        /// @brief Parse "HH:MM" (24-hour; a trailing ":SS" is accepted and ignored).
        [[nodiscard]] static core::Result<astro::LocalTime> parse_local_time(std::string_view text);

    private:
        [[nodiscard]] core::Result<i32> resolve_offset(const RawBirthProfile& raw,
                                                       const astro::CalendarDate& date,
                                                       const astro::LocalTime& time) const;

        [[nodiscard]] static core::Result<std::optional<Place>> build_place(const RawBirthProfile& raw,
                                                                            const std::string& timezone_id);

        const TimezoneResolver& m_resolver;
        NormalizerConfig        m_config;
    };

} // namespace natal::birth

#pragma once

/// @file timezone_resolver.hpp
/// @brief Timezone identifier -> UTC offset lookup (fixed offsets and IANA zones).

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace natal::birth
{
    /// @brief Resolves a timezone identifier to the UTC offset in force at a
    /// local date and time.
    class TimezoneResolver
    {
    public:
        virtual ~TimezoneResolver() = default;

        /// @return Offset in minutes, east positive, or std::nullopt when the
        ///         identifier is not known to this resolver.
        [[nodiscard]] virtual std::optional<i32> utc_offset_minutes(
            std::string_view timezone_id,
            const astro::CalendarDate& local_date,
            const astro::LocalTime& local_time) const = 0;
    };

    /// @brief Resolver for identifiers that spell out a fixed offset.
    ///
    /// Accepts "UTC", "GMT", "UT", "Z", "Etc/UTC", "Etc/GMT",
    /// "UTC±H[H][[:]MM]", "GMT±H[H][[:]MM]", "±HH:MM" and "Etc/GMT±N"
    /// (POSIX sign: Etc/GMT-5 is five hours east of UTC).
    /// The local date and time are ignored.
    class FixedOffsetTimezoneResolver final : public TimezoneResolver
    {
    public:
        [[nodiscard]] std::optional<i32> utc_offset_minutes(
            std::string_view timezone_id,
            const astro::CalendarDate& local_date,
            const astro::LocalTime& local_time) const override;

        /// @brief Offset encoded in the identifier, without any range policy.
        [[nodiscard]] static std::optional<i32> parse_offset(std::string_view timezone_id);

        /// @brief Render an offset as an identifier: 330 -> "UTC+05:30", 0 -> "UTC".
        [[nodiscard]] static std::string format_offset(i32 offset_minutes);
    };

    /// @brief Resolver backed by the IANA timezone database.
    ///
    /// Region zones ("Asia/Kolkata", "America/New_York") get the standard or
    /// daylight offset in force at the local date and time. Identifiers that
    /// spell out a fixed offset are answered without a database lookup.
    ///
    /// A local time skipped by a spring-forward transition takes the offset
    /// in force before the gap. A repeated local time takes the earlier of
    /// its two instants.
    class TzdbTimezoneResolver final : public TimezoneResolver
    {
    public:
        [[nodiscard]] std::optional<i32> utc_offset_minutes(
            std::string_view timezone_id,
            const astro::CalendarDate& local_date,
            const astro::LocalTime& local_time) const override;
    };

} // namespace natal::birth

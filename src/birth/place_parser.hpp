#pragma once

/// @file place_parser.hpp
/// @brief Splits free-text "City, State, Country" place names.

#include <optional>
#include <string>
#include <string_view>

namespace natal::birth
{
    /// @brief Components recovered from a place name.
    struct ParsedPlaceName
    {
        std::string                city;     ///< Empty when nothing usable was found
        std::optional<std::string> state;
        std::string                country;  ///< "Unknown" when nothing usable was found

        [[nodiscard]] bool is_usable() const { return !city.empty(); }
    };

    /// @brief Best-effort place name splitter.
    ///
    /// Segments are comma separated, trimmed, and empty ones dropped.
    /// First segment is the city, last the country; with three or more
    /// segments the second-to-last is the state. Naming conventions that
    /// do not follow this order are parsed wrongly; callers that need
    /// exact components should take them from a geocoder.
    class PlaceParser
    {
    public:
        PlaceParser() = delete;

        static constexpr std::string_view kUnknownCountry = "Unknown";

        [[nodiscard]] static ParsedPlaceName parse(std::string_view raw);

        /// @brief Strip leading and trailing whitespace.
        [[nodiscard]] static std::string_view trim(std::string_view sv);
    };

} // namespace natal::birth

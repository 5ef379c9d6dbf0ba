#pragma once

/// @file ephemeris_loader.hpp
/// @brief Loads tropical planetary longitudes from CSV files.

#include "astro/sidereal_mapper.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace natal::ephemeris
{
    /// @brief Static utility class for reading ephemeris snapshots saved as CSV.
    class EphemerisLoader
    {
    public:
        EphemerisLoader() = delete;

        /// @brief Load tropical positions from a CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   Planet, Longitude_deg
        ///
        /// Planet names go through parse_planet(), so "Sun", "moon" and
        /// "North Node" are all accepted. Blank lines and lines starting
        /// with '#' are ignored. Lines with an unknown planet, a non-finite
        /// longitude or extra columns are skipped with a warning. Repeated
        /// planets are kept; chart assembly rejects them.
        ///
        /// @param path Path to the CSV file.
        /// @return Positions in file order, std::nullopt on failure.
        [[nodiscard]] static std::optional<std::vector<astro::TropicalPosition>>
            load_csv(const std::filesystem::path& path);

    private:
        /// @brief Split "name,value" into trimmed, non-empty columns.
        [[nodiscard]] static std::optional<std::pair<std::string_view, std::string_view>>
            split_columns(std::string_view line);

        /// @brief ASCII case-insensitive comparison.
        [[nodiscard]] static bool iequals(std::string_view a, std::string_view b);

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a finite f64 value from a trimmed string_view.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace natal::ephemeris

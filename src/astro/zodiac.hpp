#pragma once

/// @file zodiac.hpp
/// @brief Zodiac signs and longitude -> (sign, degree-within-sign) mapping.

#include "core/types.hpp"

#include <string>

namespace natal::astro
{
    /// @brief The twelve signs in ecliptic order, Aries at 0°.
    enum class ZodiacSign : u8
    {
        Aries, Taurus, Gemini, Cancer, Leo, Virgo,
        Libra, Scorpio, Sagittarius, Capricorn, Aquarius, Pisces,
    };

    /// @brief A longitude split into its sign and the offset within it.
    struct SignDegree
    {
        i32 sign_index;     ///< 0 = Aries ... 11 = Pisces
        f64 degree_in_sign; ///< [0, 30)

        [[nodiscard]] ZodiacSign sign() const { return static_cast<ZodiacSign>(sign_index); }
    };

    /// @brief Whole degrees and truncated arc-minutes of an angle.
    struct DegreesMinutes
    {
        i32 degrees;
        i32 minutes;
    };

    class Zodiac
    {
    public:
        Zodiac() = delete;

        /// @brief Wrap any finite angle into [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 deg);

        /// @brief Split a longitude into sign and degree-within-sign.
        /// The longitude is normalized first, so any finite input is accepted.
        /// Guarantees 0 <= sign_index <= 11 and 0 <= degree_in_sign < 30.
        [[nodiscard]] static SignDegree sign_degree(f64 longitude_deg);

        [[nodiscard]] static const char* sign_name(ZodiacSign sign);

        /// @brief Three-letter abbreviation ("Ari", "Sag", ...).
        [[nodiscard]] static const char* sign_abbreviation(ZodiacSign sign);

        /// @brief Degrees and arc-minutes, both truncated. 7.86° -> 7°51′.
        [[nodiscard]] static DegreesMinutes to_degrees_minutes(f64 deg);

        /// @brief Longitude as zero-padded degrees and minutes: "247°51′".
        [[nodiscard]] static std::string format_longitude(f64 longitude_deg);

        /// @brief Position within its sign: "07°51′ Sag".
        [[nodiscard]] static std::string format_sign_position(f64 longitude_deg);
    };

} // namespace natal::astro

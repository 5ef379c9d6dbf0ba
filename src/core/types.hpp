#pragma once

#include <cstdint>

namespace natal
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kFullCircleDeg = 360.0;
    }

    // Zodiac geometry
    namespace zodiac_constants
    {
        constexpr i32 kSignCount      = 12;
        constexpr f64 kDegreesPerSign = 30.0;
    }

    // Civil time
    namespace time_constants
    {
        constexpr i32 kMinutesPerHour = 60;
        constexpr i32 kHoursPerDay    = 24;
        constexpr i32 kMinutesPerDay  = kMinutesPerHour * kHoursPerDay;
        constexpr i64 kSecondsPerDay  = 86400;
    }
}

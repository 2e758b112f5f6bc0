#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace skybrief
{
    // Precision aliases
    using f64 = double;
    using u8  = uint8_t;
    using u32 = uint32_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Heliocentric/geocentric position vectors (AU)
    using Vec3d = glm::dvec3;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kTwoPi       = 2.0 * kPi;
        constexpr f64 kHalfPi      = kPi / 2.0;
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kHourToRad   = kPi / 12.0;
        constexpr f64 kRadToHour   = 12.0 / kPi;
        constexpr f64 kJ2000       = 2451545.0;     // Julian Date of J2000.0 epoch
        constexpr f64 kUnixEpochJd = 2440587.5;     // 1970-01-01 00:00 UTC
        constexpr f64 kSecondsPerDay = 86400.0;
        constexpr f64 kDaysPerCentury = 36525.0;
        constexpr f64 kObliquityJ2000Deg = 23.43928;  // Mean obliquity of the ecliptic
    }
}

#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Date, sidereal time, angle normalization.

#include "core/types.hpp"

#include <chrono>

namespace skybrief::astro
{
    /// @brief Static utility class for astronomical time computations.
    ///
    /// Julian Date conversion follows Meeus (Astronomical Algorithms, Ch. 7) for
    /// calendar dates and a fixed Unix-epoch offset for system-clock time points.
    /// Sidereal time uses the IAU 1982 GMST expression.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Gregorian calendar date plus UT hours → Julian Date.
        [[nodiscard]] static f64 to_julian_date(const std::chrono::year_month_day& date,
                                                f64 hours_ut = 0.0);

        /// @brief UTC time point → Julian Date.
        [[nodiscard]] static f64 to_julian_date(std::chrono::sys_seconds utc);

        /// @brief Julian Date → UTC time point, rounded to the nearest second.
        [[nodiscard]] static std::chrono::sys_seconds to_sys_seconds(f64 jd);

        /// @brief Julian Date → Gregorian calendar date of the UT day containing it.
        [[nodiscard]] static std::chrono::year_month_day to_calendar_date(f64 jd);

        /// @brief T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Days elapsed since J2000.0 (may be negative).
        [[nodiscard]] static f64 days_since_j2000(f64 jd);

        /// @brief Greenwich Mean Sidereal Time in radians, [0, 2π).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time in radians, [0, 2π).
        /// @param longitude_rad East-positive longitude.
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);

        /// @brief Wrap an angle to [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);

        /// @brief Wrap an angle to [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 angle);
    };

} // namespace skybrief::astro

#pragma once

/// @file solar.hpp
/// @brief Low-order solar position and twilight-angle crossings.

#include "astro/coordinates.hpp"
#include "astro/event_time.hpp"
#include "core/types.hpp"

#include <chrono>

namespace skybrief::astro
{
    struct SolarPosition
    {
        EquatorialCoord equatorial;
        f64 apparent_longitude_deg;
        f64 equation_of_time_min;   ///< Apparent minus mean solar time
    };

    /// @brief Morning and evening crossing of one altitude threshold.
    struct SolarCrossings
    {
        EventTime morning;  ///< Rising through the threshold (dawn, sunrise)
        EventTime evening;  ///< Setting through the threshold (sunset, dusk)
    };

    /// @brief Sun position from the NOAA/Meeus low-precision series
    /// (Astronomical Algorithms, Ch. 25), good to about 0.01°.
    ///
    /// Rise/set and twilight crossings are found by bisecting the altitude
    /// function on either side of local transit.
    class Solar
    {
    public:
        Solar() = delete;

        // Altitude thresholds (degrees). Sunrise uses the geometric horizon.
        static constexpr f64 kHorizonDeg       = 0.0;
        static constexpr f64 kCivilDeg         = -6.0;
        static constexpr f64 kNauticalDeg      = -12.0;
        static constexpr f64 kAstronomicalDeg  = -18.0;

        [[nodiscard]] static SolarPosition position(f64 jd);

        /// @brief Geometric altitude of the Sun's centre (degrees).
        [[nodiscard]] static f64 altitude_deg(f64 jd, const ObserverLocation& observer);

        /// @brief Julian Date of the upper transit nearest local noon of @p local_date.
        [[nodiscard]] static f64 transit_jd(const std::chrono::year_month_day& local_date,
                                            std::chrono::minutes utc_offset,
                                            const ObserverLocation& observer);

        /// @brief Morning/evening crossings of @p threshold_deg around @p transit.
        ///
        /// If the Sun is below the threshold even at transit both sides are
        /// AlwaysBelow; if it never drops below it within ±12 h of transit the
        /// missing side is AlwaysAbove.
        [[nodiscard]] static SolarCrossings crossings(f64 transit,
                                                      const ObserverLocation& observer,
                                                      f64 threshold_deg,
                                                      std::chrono::minutes utc_offset);
    };

} // namespace skybrief::astro

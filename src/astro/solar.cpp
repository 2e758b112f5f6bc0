/// @file solar.cpp
/// @brief Implementation of solar position, transit and twilight crossings.

#include "astro/solar.hpp"

#include "astro/root_finding.hpp"
#include "astro/time_system.hpp"

#include <cmath>

namespace skybrief::astro
{

namespace
{
    constexpr i32 kTransitIterations = 3;

    f64 sin_deg(f64 deg) { return std::sin(deg * astro_constants::kDegToRad); }
    f64 cos_deg(f64 deg) { return std::cos(deg * astro_constants::kDegToRad); }

} // namespace

// -----------------------------------------------------------------
// Position
//
// L0 = 280.46646 + 36000.76983 T + 0.0003032 T²     (mean longitude)
// M  = 357.52911 + 35999.05029 T - 0.0001537 T²     (mean anomaly)
// C  = equation of centre, 3 terms
// λ  = L0 + C - 0.00569 - 0.00478 sin Ω              (apparent longitude)
// ε  = ε0 + 0.00256 cos Ω
// -----------------------------------------------------------------

SolarPosition Solar::position(f64 jd)
{
    const f64 t = TimeSystem::julian_centuries(jd);

    const f64 mean_longitude = TimeSystem::normalize_degrees(
        280.46646 + t * (36000.76983 + t * 0.0003032));
    const f64 mean_anomaly = 357.52911 + t * (35999.05029 - 0.0001537 * t);

    const f64 centre = sin_deg(mean_anomaly) * (1.914602 - t * (0.004817 + 0.000014 * t))
                     + sin_deg(2.0 * mean_anomaly) * (0.019993 - 0.000101 * t)
                     + sin_deg(3.0 * mean_anomaly) * 0.000289;

    const f64 omega = 125.04 - 1934.136 * t;
    const f64 apparent_longitude = mean_longitude + centre - 0.00569 - 0.00478 * sin_deg(omega);

    const f64 mean_obliquity = 23.0 + (26.0 + (21.448 - t * (46.815 + t * (0.00059 - t * 0.001813))) / 60.0) / 60.0;
    const f64 obliquity = mean_obliquity + 0.00256 * cos_deg(omega);

    const EquatorialCoord eq = Coordinates::ecliptic_to_equatorial(
        apparent_longitude * astro_constants::kDegToRad, 0.0, obliquity * astro_constants::kDegToRad);

    // Equation of time from mean longitude vs. right ascension, wrapped to ±180°
    f64 eot_deg = mean_longitude - 0.0057183 - eq.ra * astro_constants::kRadToDeg;
    eot_deg = TimeSystem::normalize_degrees(eot_deg + 180.0) - 180.0;

    return SolarPosition{
        .equatorial             = eq,
        .apparent_longitude_deg = TimeSystem::normalize_degrees(apparent_longitude),
        .equation_of_time_min   = 4.0 * eot_deg,
    };
}

f64 Solar::altitude_deg(f64 jd, const ObserverLocation& observer)
{
    const auto hz = Coordinates::to_horizontal(position(jd).equatorial, observer, jd);
    return hz.alt * astro_constants::kRadToDeg;
}

// -----------------------------------------------------------------
// Transit: UT minutes = 720 - 4·longitude - EoT, refined a few times
// because EoT depends on the date it is evaluated at.
// -----------------------------------------------------------------

f64 Solar::transit_jd(const std::chrono::year_month_day& local_date,
                      std::chrono::minutes utc_offset,
                      const ObserverLocation& observer)
{
    const f64 local_midnight = TimeSystem::to_julian_date(local_date)
                             - static_cast<f64>(utc_offset.count()) / 1440.0;
    const f64 local_noon = local_midnight + 0.5;
    const f64 longitude_deg = observer.longitude_rad * astro_constants::kRadToDeg;

    f64 transit = local_noon;
    for (i32 i = 0; i < kTransitIterations; ++i)
    {
        const f64 ut_midnight = std::floor(transit - 0.5) + 0.5;
        f64 candidate = ut_midnight
                      + (720.0 - 4.0 * longitude_deg - position(transit).equation_of_time_min) / 1440.0;

        // Keep the transit that belongs to this local date
        while (candidate - local_noon > 0.5)
        {
            candidate -= 1.0;
        }
        while (local_noon - candidate > 0.5)
        {
            candidate += 1.0;
        }
        transit = candidate;
    }

    return transit;
}

SolarCrossings Solar::crossings(f64 transit,
                                const ObserverLocation& observer,
                                f64 threshold_deg,
                                std::chrono::minutes utc_offset)
{
    const AltitudeFunction altitude = [&observer](f64 jd) { return altitude_deg(jd, observer); };

    if (altitude(transit) < threshold_deg)
    {
        return SolarCrossings{
            .morning = NoEvent{NoEventReason::AlwaysBelow},
            .evening = NoEvent{NoEventReason::AlwaysBelow},
        };
    }

    const auto to_event = [utc_offset](const std::optional<f64>& jd) -> EventTime
    {
        if (jd)
        {
            return Instant::from_julian_date(*jd, utc_offset);
        }
        return NoEvent{NoEventReason::AlwaysAbove};
    };

    return SolarCrossings{
        .morning = to_event(RootFinder::bisect(altitude, threshold_deg, transit - 0.5, transit)),
        .evening = to_event(RootFinder::bisect(altitude, threshold_deg, transit, transit + 0.5)),
    };
}

} // namespace skybrief::astro

/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include <cmath>

namespace skybrief::astro
{

// -----------------------------------------------------------------
// Calendar date → JD (Meeus, Ch. 7)
//
// January and February count as months 13 and 14 of the previous
// year; B is the Gregorian correction 2 - A + A/4.
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const std::chrono::year_month_day& date, f64 hours_ut)
{
    i32 y = static_cast<i32>(date.year());
    i32 m = static_cast<i32>(static_cast<unsigned>(date.month()));
    const auto d = static_cast<f64>(static_cast<unsigned>(date.day()));

    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + d
         + hours_ut / 24.0
         + static_cast<f64>(b)
         - 1524.5;
}

f64 TimeSystem::to_julian_date(std::chrono::sys_seconds utc)
{
    const auto secs = static_cast<f64>(utc.time_since_epoch().count());
    return astro_constants::kUnixEpochJd + secs / astro_constants::kSecondsPerDay;
}

std::chrono::sys_seconds TimeSystem::to_sys_seconds(f64 jd)
{
    const f64 secs = (jd - astro_constants::kUnixEpochJd) * astro_constants::kSecondsPerDay;
    return std::chrono::sys_seconds{std::chrono::seconds{std::llround(secs)}};
}

std::chrono::year_month_day TimeSystem::to_calendar_date(f64 jd)
{
    return std::chrono::year_month_day{std::chrono::floor<std::chrono::days>(to_sys_seconds(jd))};
}

f64 TimeSystem::julian_centuries(f64 jd)
{
    return days_since_j2000(jd) / astro_constants::kDaysPerCentury;
}

f64 TimeSystem::days_since_j2000(f64 jd)
{
    return jd - astro_constants::kJ2000;
}

// -----------------------------------------------------------------
// GMST (IAU 1982), degrees:
//   280.46061837 + 360.98564736629 d + 0.000387933 T² - T³ / 38710000
// -----------------------------------------------------------------

f64 TimeSystem::gmst(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = days_since_j2000(jd);

    const f64 gmst_deg = 280.46061837
                       + 360.98564736629 * d
                       + 0.000387933 * t * t
                       - (t * t * t) / 38710000.0;

    return normalize_degrees(gmst_deg) * astro_constants::kDegToRad;
}

f64 TimeSystem::lmst(f64 jd, f64 longitude_rad)
{
    return normalize_radians(gmst(jd) + longitude_rad);
}

f64 TimeSystem::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

f64 TimeSystem::normalize_degrees(f64 angle)
{
    angle = std::fmod(angle, 360.0);
    if (angle < 0.0)
    {
        angle += 360.0;
    }
    return angle;
}

} // namespace skybrief::astro

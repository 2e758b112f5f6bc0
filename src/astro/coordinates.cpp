/// @file coordinates.cpp
/// @brief Implementation of coordinate transformations.

#include "astro/coordinates.hpp"

#include "astro/time_system.hpp"

#include <algorithm>
#include <cmath>

namespace skybrief::astro
{

// -----------------------------------------------------------------
// Equatorial → Horizontal
//
// H = LST - RA
// sin(alt) = sin(dec) sin(lat) + cos(dec) cos(lat) cos(H)
// az = atan2(-cos(dec) sin(H), sin(dec) cos(lat) - cos(dec) sin(lat) cos(H))
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    const ObserverLocation& observer,
    f64 local_sidereal_time_rad)
{
    const f64 hour_angle = local_sidereal_time_rad - eq.ra;

    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_lat = std::sin(observer.latitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);

    const f64 sin_alt = sin_dec * sin_lat + cos_dec * cos_lat * std::cos(hour_angle);

    const f64 az = std::atan2(-cos_dec * std::sin(hour_angle),
                              sin_dec * cos_lat - cos_dec * sin_lat * std::cos(hour_angle));

    return HorizontalCoord{
        .alt = std::asin(std::clamp(sin_alt, -1.0, 1.0)),
        .az  = TimeSystem::normalize_radians(az),
    };
}

HorizontalCoord Coordinates::to_horizontal(
    const EquatorialCoord& eq,
    const ObserverLocation& observer,
    f64 jd)
{
    return equatorial_to_horizontal(eq, observer, TimeSystem::lmst(jd, observer.longitude_rad));
}

// -----------------------------------------------------------------
// Ecliptic (λ, β) → Equatorial (α, δ)
//
// α = atan2(sin λ cos ε - tan β sin ε, cos λ)
// δ = asin(sin β cos ε + cos β sin ε sin λ)
// -----------------------------------------------------------------

EquatorialCoord Coordinates::ecliptic_to_equatorial(
    f64 longitude_rad, f64 latitude_rad, f64 obliquity_rad)
{
    const f64 sin_eps = std::sin(obliquity_rad);
    const f64 cos_eps = std::cos(obliquity_rad);

    const f64 ra = std::atan2(std::sin(longitude_rad) * cos_eps - std::tan(latitude_rad) * sin_eps,
                              std::cos(longitude_rad));
    const f64 sin_dec = std::sin(latitude_rad) * cos_eps
                      + std::cos(latitude_rad) * sin_eps * std::sin(longitude_rad);

    return EquatorialCoord{
        .ra  = TimeSystem::normalize_radians(ra),
        .dec = std::asin(std::clamp(sin_dec, -1.0, 1.0)),
    };
}

EquatorialCoord Coordinates::ecliptic_vector_to_equatorial(const Vec3d& ecliptic, f64 obliquity_rad)
{
    const f64 sin_eps = std::sin(obliquity_rad);
    const f64 cos_eps = std::cos(obliquity_rad);

    // Rotate about the x axis (vernal equinox direction)
    const Vec3d eq{
        ecliptic.x,
        ecliptic.y * cos_eps - ecliptic.z * sin_eps,
        ecliptic.y * sin_eps + ecliptic.z * cos_eps,
    };

    const f64 r = glm::length(eq);
    return EquatorialCoord{
        .ra  = TimeSystem::normalize_radians(std::atan2(eq.y, eq.x)),
        .dec = r > 0.0 ? std::asin(std::clamp(eq.z / r, -1.0, 1.0)) : 0.0,
    };
}

f64 Coordinates::angle_between(const Vec3d& a, const Vec3d& b)
{
    const f64 denom = glm::length(a) * glm::length(b);
    if (denom <= 0.0)
    {
        return 0.0;
    }
    return std::acos(std::clamp(glm::dot(a, b) / denom, -1.0, 1.0));
}

} // namespace skybrief::astro

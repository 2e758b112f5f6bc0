#pragma once

/// @file coordinates.hpp
/// @brief Coordinate transforms: Ecliptic → Equatorial → Horizontal.

#include "core/types.hpp"

namespace skybrief::astro
{
    /// @brief Equatorial coordinate of date.
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude (radians, negative = below horizon)
        f64 az;     ///< Azimuth (radians, 0=North, π/2=East)
    };

    /// @brief Observer geographic location in radians.
    struct ObserverLocation
    {
        f64 latitude_rad;   ///< North positive
        f64 longitude_rad;  ///< East positive
    };

    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Equatorial (RA/Dec) → Horizontal (Alt/Az) at a given LST.
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            const ObserverLocation& observer,
            f64 local_sidereal_time_rad
        );

        /// @brief Equatorial → Horizontal at a Julian Date (computes LMST).
        [[nodiscard]] static HorizontalCoord to_horizontal(
            const EquatorialCoord& eq,
            const ObserverLocation& observer,
            f64 jd
        );

        /// @brief Ecliptic longitude/latitude → Equatorial, given the obliquity.
        /// All arguments in radians.
        [[nodiscard]] static EquatorialCoord ecliptic_to_equatorial(
            f64 longitude_rad, f64 latitude_rad, f64 obliquity_rad);

        /// @brief Rectangular ecliptic vector → Equatorial RA/Dec.
        [[nodiscard]] static EquatorialCoord ecliptic_vector_to_equatorial(
            const Vec3d& ecliptic, f64 obliquity_rad);

        /// @brief Angle between two unit-free direction vectors (radians).
        [[nodiscard]] static f64 angle_between(const Vec3d& a, const Vec3d& b);
    };

} // namespace skybrief::astro

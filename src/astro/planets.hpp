#pragma once

/// @file planets.hpp
/// @brief Mean-element planet positions and apparent magnitudes.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace skybrief::astro
{
    enum class Planet : u8
    {
        Mercury,
        Venus,
        Mars,
        Jupiter,
        Saturn,
        Uranus,
        Neptune,
    };

    inline constexpr std::array<Planet, 7> kAllPlanets{
        Planet::Mercury, Planet::Venus, Planet::Mars, Planet::Jupiter,
        Planet::Saturn, Planet::Uranus, Planet::Neptune,
    };

    /// @brief Geocentric state of one planet at one Julian Date.
    struct PlanetPosition
    {
        EquatorialCoord equatorial;
        f64 sun_distance_au;
        f64 earth_distance_au;
        f64 phase_angle_deg;    ///< Sun-planet-Earth angle
        f64 elongation_deg;     ///< Sun-Earth-planet angle
        f64 magnitude;
    };

    /// @brief Keplerian propagation of JPL mean elements (Standish, valid
    /// 1800-2050), no perturbations. Positions are good to a fraction of a
    /// degree, enough for rise/set and naked-eye visibility.
    class Planets
    {
    public:
        Planets() = delete;

        [[nodiscard]] static PlanetPosition position(Planet planet, f64 jd);

        /// @brief Heliocentric ecliptic J2000 vector (AU).
        [[nodiscard]] static Vec3d heliocentric(Planet planet, f64 jd);

        /// @brief Heliocentric ecliptic vector of the Earth-Moon barycentre (AU).
        [[nodiscard]] static Vec3d earth_heliocentric(f64 jd);

        [[nodiscard]] static f64 altitude_deg(Planet planet, f64 jd, const ObserverLocation& observer);

        [[nodiscard]] static std::string_view name(Planet planet);

        /// @brief Case-insensitive lookup by English name.
        [[nodiscard]] static std::optional<Planet> from_name(std::string_view name);
    };

} // namespace skybrief::astro

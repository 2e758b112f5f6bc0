/// @file planets.cpp
/// @brief Implementation of mean-element planet positions.

#include "astro/planets.hpp"

#include "astro/time_system.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>

namespace skybrief::astro
{

namespace
{
    /// @brief Element value at J2000 plus its rate per Julian century.
    struct Element
    {
        f64 at_epoch;
        f64 per_century;

        [[nodiscard]] f64 at(f64 t) const { return at_epoch + per_century * t; }
    };

    struct OrbitalElements
    {
        Element semi_major_axis;    ///< a (AU)
        Element eccentricity;       ///< e
        Element inclination;        ///< I (deg)
        Element mean_longitude;     ///< L (deg)
        Element perihelion;         ///< ϖ, longitude of perihelion (deg)
        Element ascending_node;     ///< Ω (deg)
    };

    struct Photometry
    {
        f64 absolute_magnitude;                 ///< V(1,0)
        std::function<f64(f64)> phase_term;     ///< Correction for phase angle (deg)
    };

    // JPL "Keplerian Elements for Approximate Positions of the Major Planets", Table 1
    constexpr std::array<OrbitalElements, 7> kElements{{
        // Mercury
        {{0.38709927, 0.00000037}, {0.20563593, 0.00001906}, {7.00497902, -0.00594749},
         {252.25032350, 149472.67411175}, {77.45779628, 0.16047689}, {48.33076593, -0.12534081}},
        // Venus
        {{0.72333566, 0.00000390}, {0.00677672, -0.00004107}, {3.39467605, -0.00078890},
         {181.97909950, 58517.81538729}, {131.60246718, 0.00268329}, {76.67984255, -0.27769418}},
        // Mars
        {{1.52371034, 0.00001847}, {0.09339410, 0.00007882}, {1.84969142, -0.00813131},
         {-4.55343205, 19140.30268499}, {-23.94362959, 0.44441088}, {49.55953891, -0.29257343}},
        // Jupiter
        {{5.20288700, -0.00011607}, {0.04838624, -0.00013253}, {1.30439695, -0.00183714},
         {34.39644051, 3034.74612775}, {14.72847983, 0.21252668}, {100.47390909, 0.20469106}},
        // Saturn
        {{9.53667594, -0.00125060}, {0.05386179, -0.00050991}, {2.48599187, 0.00193609},
         {49.95424423, 1222.49362201}, {92.59887831, -0.41897216}, {113.66242448, -0.28867794}},
        // Uranus
        {{19.18916464, -0.00196176}, {0.04725744, -0.00004397}, {0.77263783, -0.00242939},
         {313.23810451, 428.48202785}, {170.95427630, 0.40805281}, {74.01692503, 0.04240589}},
        // Neptune
        {{30.06992276, 0.00026291}, {0.00859048, 0.00005105}, {1.77004347, 0.00035372},
         {-55.12002969, 218.45945325}, {44.96476227, -0.32241464}, {131.78422574, -0.00508664}},
    }};

    constexpr OrbitalElements kEarthMoonBarycentre{
        {1.00000261, 0.00000562}, {0.01671123, -0.00004392}, {-0.00001531, -0.01294668},
        {100.46457166, 35999.37244981}, {102.93768193, 0.32327364}, {0.0, 0.0}};

    // Mallama & Hilton style V(1,0) with polynomial phase laws
    const std::array<Photometry, 7>& photometry()
    {
        static const std::array<Photometry, 7> kTable{{
            {-0.42, [](f64 a) { return 0.038 * a - 0.000273 * a * a + 0.000002 * a * a * a; }},
            {-4.40, [](f64 a) { return 0.0009 * a + 0.000239 * a * a - 0.00000065 * a * a * a; }},
            {-1.52, [](f64 a) { return 0.016 * a; }},
            {-9.40, [](f64 a) { return 0.005 * a; }},
            {-8.88, [](f64 a) { return 0.044 * a; }},
            {-7.19, [](f64 a) { return 0.002 * a; }},
            {-6.87, [](f64) { return 0.0; }},
        }};
        return kTable;
    }

    constexpr i32 kKeplerIterations = 10;
    constexpr f64 kKeplerToleranceDeg = 1e-8;

    /// @brief Solve M = E - e sin E (degrees) by Newton iteration.
    f64 solve_kepler(f64 mean_anomaly_deg, f64 eccentricity)
    {
        const f64 e_deg = eccentricity * astro_constants::kRadToDeg;
        f64 ecc_anomaly = mean_anomaly_deg + e_deg * std::sin(mean_anomaly_deg * astro_constants::kDegToRad);

        for (i32 i = 0; i < kKeplerIterations; ++i)
        {
            const f64 delta_m = mean_anomaly_deg
                              - (ecc_anomaly - e_deg * std::sin(ecc_anomaly * astro_constants::kDegToRad));
            const f64 delta_e = delta_m / (1.0 - eccentricity * std::cos(ecc_anomaly * astro_constants::kDegToRad));
            ecc_anomaly += delta_e;
            if (std::abs(delta_e) < kKeplerToleranceDeg)
            {
                break;
            }
        }
        return ecc_anomaly;
    }

    Vec3d propagate(const OrbitalElements& el, f64 jd)
    {
        const f64 t = TimeSystem::julian_centuries(jd);

        const f64 a     = el.semi_major_axis.at(t);
        const f64 e     = el.eccentricity.at(t);
        const f64 incl  = el.inclination.at(t) * astro_constants::kDegToRad;
        const f64 peri  = el.perihelion.at(t);
        const f64 node  = el.ascending_node.at(t);

        // Mean anomaly in [-180, 180)
        const f64 mean_anomaly = TimeSystem::normalize_degrees(el.mean_longitude.at(t) - peri + 180.0) - 180.0;
        const f64 arg_peri = (peri - node) * astro_constants::kDegToRad;
        const f64 node_rad = node * astro_constants::kDegToRad;

        const f64 ecc_anomaly = solve_kepler(mean_anomaly, e) * astro_constants::kDegToRad;

        // Orbital-plane coordinates, x toward perihelion
        const f64 xp = a * (std::cos(ecc_anomaly) - e);
        const f64 yp = a * std::sqrt(1.0 - e * e) * std::sin(ecc_anomaly);

        const f64 cw = std::cos(arg_peri);
        const f64 sw = std::sin(arg_peri);
        const f64 cn = std::cos(node_rad);
        const f64 sn = std::sin(node_rad);
        const f64 ci = std::cos(incl);
        const f64 si = std::sin(incl);

        return Vec3d{
            (cw * cn - sw * sn * ci) * xp + (-sw * cn - cw * sn * ci) * yp,
            (cw * sn + sw * cn * ci) * xp + (-sw * sn + cw * cn * ci) * yp,
            (sw * si) * xp + (cw * si) * yp,
        };
    }

    std::size_t index_of(Planet planet)
    {
        return static_cast<std::size_t>(planet);
    }

} // namespace

Vec3d Planets::heliocentric(Planet planet, f64 jd)
{
    return propagate(kElements[index_of(planet)], jd);
}

Vec3d Planets::earth_heliocentric(f64 jd)
{
    return propagate(kEarthMoonBarycentre, jd);
}

// -----------------------------------------------------------------
// Geocentric state
//
// Phase angle α:  cos α = (r² + Δ² - R²) / (2 r Δ)
// Magnitude:      V = V(1,0) + 5 log10(r Δ) + f(α)
// -----------------------------------------------------------------

PlanetPosition Planets::position(Planet planet, f64 jd)
{
    const Vec3d helio = heliocentric(planet, jd);
    const Vec3d earth = earth_heliocentric(jd);
    const Vec3d geo = helio - earth;

    const f64 r = glm::length(helio);
    const f64 delta = glm::length(geo);
    const f64 big_r = glm::length(earth);

    const f64 cos_phase = std::clamp((r * r + delta * delta - big_r * big_r) / (2.0 * r * delta), -1.0, 1.0);
    const f64 phase_angle = std::acos(cos_phase) * astro_constants::kRadToDeg;

    const auto& phot = photometry()[index_of(planet)];
    const f64 magnitude = phot.absolute_magnitude + 5.0 * std::log10(r * delta) + phot.phase_term(phase_angle);

    const f64 elongation = Coordinates::angle_between(geo, -earth) * astro_constants::kRadToDeg;

    return PlanetPosition{
        .equatorial        = Coordinates::ecliptic_vector_to_equatorial(
                                 geo, astro_constants::kObliquityJ2000Deg * astro_constants::kDegToRad),
        .sun_distance_au   = r,
        .earth_distance_au = delta,
        .phase_angle_deg   = phase_angle,
        .elongation_deg    = elongation,
        .magnitude         = magnitude,
    };
}

f64 Planets::altitude_deg(Planet planet, f64 jd, const ObserverLocation& observer)
{
    const auto pos = position(planet, jd);
    return Coordinates::to_horizontal(pos.equatorial, observer, jd).alt * astro_constants::kRadToDeg;
}

std::string_view Planets::name(Planet planet)
{
    switch (planet)
    {
        case Planet::Mercury: return "Mercury";
        case Planet::Venus:   return "Venus";
        case Planet::Mars:    return "Mars";
        case Planet::Jupiter: return "Jupiter";
        case Planet::Saturn:  return "Saturn";
        case Planet::Uranus:  return "Uranus";
        case Planet::Neptune: return "Neptune";
    }
    return "Unknown";
}

std::optional<Planet> Planets::from_name(std::string_view text)
{
    const auto iequals = [](std::string_view a, std::string_view b)
    {
        return a.size() == b.size()
            && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y)
               {
                   return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
               });
    };

    for (const Planet planet : kAllPlanets)
    {
        if (iequals(name(planet), text))
        {
            return planet;
        }
    }
    return std::nullopt;
}

} // namespace skybrief::astro

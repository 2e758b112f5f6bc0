#pragma once

/// @file lunar.hpp
/// @brief Synodic-month phase model and low-precision lunar position.

#include "astro/coordinates.hpp"
#include "astro/event_time.hpp"
#include "core/types.hpp"

#include <chrono>
#include <string_view>
#include <vector>

namespace skybrief::astro
{
    /// @brief Eight 45° phase bins, New centred on 0°, Full on 180°.
    enum class MoonPhase : u8
    {
        New,
        WaxingCrescent,
        FirstQuarter,
        WaxingGibbous,
        Full,
        WaningGibbous,
        LastQuarter,
        WaningCrescent,
    };

    struct LunarPhase
    {
        f64       age_days;         ///< Days since the previous new moon
        f64       phase_angle_deg;  ///< 0 = new, 180 = full
        f64       illumination;     ///< Illuminated fraction [0, 1]
        MoonPhase phase;
    };

    /// @brief A principal phase (new, quarters, full) at a given instant.
    struct PhaseEvent
    {
        MoonPhase phase;
        Instant   at;
    };

    class Lunar
    {
    public:
        Lunar() = delete;

        static constexpr f64 kSynodicMonthDays   = 29.53058867;
        static constexpr f64 kReferenceNewMoonJd = 2451550.259722;  // 2000-01-06 18:14 UTC

        /// @brief Rise/set threshold: parallax minus refraction minus semi-diameter.
        static constexpr f64 kHorizonDeg = 0.125;

        /// @brief Phase from synodic interpolation off the reference new moon.
        [[nodiscard]] static LunarPhase phase(f64 jd);

        /// @brief Bin an elongation angle (any real value, period 360°).
        [[nodiscard]] static MoonPhase phase_from_angle(f64 phase_angle_deg);

        /// @brief (1 - cos θ) / 2
        [[nodiscard]] static f64 illumination_from_angle(f64 phase_angle_deg);

        /// @brief Principal phases strictly after @p from and within @p window.
        [[nodiscard]] static std::vector<PhaseEvent> upcoming_phases(
            const Instant& from, std::chrono::days window);

        /// @brief Geocentric RA/Dec, accurate to a few tenths of a degree.
        [[nodiscard]] static EquatorialCoord position(f64 jd);

        /// @brief Earth-Moon distance (km).
        [[nodiscard]] static f64 distance_km(f64 jd);

        [[nodiscard]] static f64 altitude_deg(f64 jd, const ObserverLocation& observer);

        [[nodiscard]] static std::string_view phase_name(MoonPhase phase);
    };

} // namespace skybrief::astro

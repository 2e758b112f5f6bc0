/// @file lunar.cpp
/// @brief Implementation of the lunar phase model and position series.

#include "astro/lunar.hpp"

#include "astro/time_system.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace skybrief::astro
{

namespace
{
    constexpr f64 kPhaseBinDeg = 45.0;
    constexpr f64 kQuarterDays = Lunar::kSynodicMonthDays / 4.0;
    constexpr f64 kLunarObliquityDeg = 23.4397;

} // namespace

LunarPhase Lunar::phase(f64 jd)
{
    const f64 age = std::fmod(std::fmod(jd - kReferenceNewMoonJd, kSynodicMonthDays) + kSynodicMonthDays,
                              kSynodicMonthDays);
    const f64 angle = age / kSynodicMonthDays * 360.0;

    return LunarPhase{
        .age_days        = age,
        .phase_angle_deg = angle,
        .illumination    = illumination_from_angle(angle),
        .phase           = phase_from_angle(angle),
    };
}

MoonPhase Lunar::phase_from_angle(f64 phase_angle_deg)
{
    // Shift by half a bin so New spans [-22.5°, 22.5°)
    const f64 shifted = TimeSystem::normalize_degrees(phase_angle_deg + kPhaseBinDeg / 2.0);
    const auto bin = static_cast<i32>(std::floor(shifted / kPhaseBinDeg)) % 8;
    return static_cast<MoonPhase>(bin);
}

f64 Lunar::illumination_from_angle(f64 phase_angle_deg)
{
    const f64 value = 0.5 * (1.0 - std::cos(phase_angle_deg * astro_constants::kDegToRad));
    return std::clamp(value, 0.0, 1.0);
}

// -----------------------------------------------------------------
// Principal phases sit at exact quarter-month ages in the synodic
// model, so the next one is a closed-form step, not a search.
// -----------------------------------------------------------------

std::vector<PhaseEvent> Lunar::upcoming_phases(const Instant& from, std::chrono::days window)
{
    constexpr std::array<MoonPhase, 4> kPrincipal{
        MoonPhase::New, MoonPhase::FirstQuarter, MoonPhase::Full, MoonPhase::LastQuarter};

    const f64 start = from.julian_date();
    const f64 end = start + static_cast<f64>(window.count());
    const f64 elapsed_quarters = (start - kReferenceNewMoonJd) / kQuarterDays;

    std::vector<PhaseEvent> events;
    for (auto k = static_cast<i64>(std::floor(elapsed_quarters)) + 1;; ++k)
    {
        const f64 jd = kReferenceNewMoonJd + static_cast<f64>(k) * kQuarterDays;
        if (jd > end)
        {
            break;
        }
        const auto index = static_cast<std::size_t>(((k % 4) + 4) % 4);
        events.push_back(PhaseEvent{
            .phase = kPrincipal[index],
            .at    = Instant::from_julian_date(jd, from.utc_offset()),
        });
    }
    return events;
}

// -----------------------------------------------------------------
// Position (low-precision series, d = days since J2000)
//
// L = 218.316 + 13.176396 d     mean longitude
// M = 134.963 + 13.064993 d     mean anomaly
// F =  93.272 + 13.229350 d     argument of latitude
// λ = L + 6.289 sin M,  β = 5.128 sin F
// -----------------------------------------------------------------

EquatorialCoord Lunar::position(f64 jd)
{
    const f64 d = TimeSystem::days_since_j2000(jd);

    const f64 mean_longitude = 218.316 + 13.176396 * d;
    const f64 mean_anomaly   = 134.963 + 13.064993 * d;
    const f64 arg_latitude   = 93.272 + 13.229350 * d;

    const f64 lambda = (mean_longitude + 6.289 * std::sin(mean_anomaly * astro_constants::kDegToRad))
                     * astro_constants::kDegToRad;
    const f64 beta = 5.128 * std::sin(arg_latitude * astro_constants::kDegToRad) * astro_constants::kDegToRad;

    return Coordinates::ecliptic_to_equatorial(lambda, beta, kLunarObliquityDeg * astro_constants::kDegToRad);
}

f64 Lunar::distance_km(f64 jd)
{
    const f64 d = TimeSystem::days_since_j2000(jd);
    const f64 mean_anomaly = 134.963 + 13.064993 * d;
    return 385001.0 - 20905.0 * std::cos(mean_anomaly * astro_constants::kDegToRad);
}

f64 Lunar::altitude_deg(f64 jd, const ObserverLocation& observer)
{
    return Coordinates::to_horizontal(position(jd), observer, jd).alt * astro_constants::kRadToDeg;
}

std::string_view Lunar::phase_name(MoonPhase phase)
{
    switch (phase)
    {
        case MoonPhase::New:            return "New Moon";
        case MoonPhase::WaxingCrescent: return "Waxing Crescent";
        case MoonPhase::FirstQuarter:   return "First Quarter";
        case MoonPhase::WaxingGibbous:  return "Waxing Gibbous";
        case MoonPhase::Full:           return "Full Moon";
        case MoonPhase::WaningGibbous:  return "Waning Gibbous";
        case MoonPhase::LastQuarter:    return "Last Quarter";
        case MoonPhase::WaningCrescent: return "Waning Crescent";
    }
    return "Unknown";
}

} // namespace skybrief::astro

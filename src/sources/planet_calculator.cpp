/// @file planet_calculator.cpp
/// @brief Implementation of the planet visibility calculator.

#include "sources/planet_calculator.hpp"

#include "astro/coordinates.hpp"
#include "astro/root_finding.hpp"
#include "astro/solar.hpp"
#include "sources/payload.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>
#include <utility>

namespace skybrief::sources
{

namespace
{
    constexpr f64 kSampleStepDays  = 15.0 / 1440.0;
    constexpr f64 kRiseSetStepDays = 10.0 / 1440.0;
    constexpr i32 kSamplesPerNight = 96;

    /// @brief Julian Dates across the 24 h from local noon where the Sun is below -6°.
    std::vector<f64> dark_samples(f64 start_jd, const astro::ObserverLocation& observer)
    {
        std::vector<f64> samples;
        for (i32 i = 0; i <= kSamplesPerNight; ++i)
        {
            const f64 jd = start_jd + kSampleStepDays * static_cast<f64>(i);
            if (astro::Solar::altitude_deg(jd, observer) < PlanetCalculator::kDarkSunAltitudeDeg)
            {
                samples.push_back(jd);
            }
        }
        return samples;
    }

    std::string_view compass_point(f64 azimuth_rad)
    {
        static constexpr std::array<std::string_view, 8> kPoints{
            "north", "north-east", "east", "south-east", "south", "south-west", "west", "north-west"};
        const f64 deg = azimuth_rad * astro_constants::kRadToDeg;
        const auto index = static_cast<std::size_t>(std::lround(deg / 45.0)) % kPoints.size();
        return kPoints[index];
    }

    /// @brief Noon at or before @p at, in local time.
    astro::Instant night_start(const astro::Instant& at)
    {
        constexpr std::chrono::hours kNoon{12};
        const auto noon = at.local_midnight() + kNoon;
        return at < noon ? noon - std::chrono::hours{24} : noon;
    }

    PlanetVisibility evaluate(astro::Planet planet,
                              const CalculationContext& ctx,
                              const std::vector<f64>& dark,
                              f64 start_jd,
                              std::optional<f64> magnitude_override)
    {
        const auto observer = ctx.location.observer();
        const f64 jd = ctx.instant.julian_date();
        const auto pos = astro::Planets::position(planet, jd);
        const f64 magnitude = magnitude_override.value_or(pos.magnitude);

        const astro::AltitudeFunction altitude = [planet, &observer](f64 t)
        {
            return astro::Planets::altitude_deg(planet, t, observer);
        };
        const auto events = astro::RootFinder::rise_and_set(
            altitude, PlanetCalculator::kHorizonDeg, start_jd, ctx.instant.utc_offset(), kRiseSetStepDays);

        // Sample the dark part of the night
        std::vector<f64> seen;
        f64 best_jd = 0.0;
        f64 best_alt = -90.0;
        for (const f64 t : dark)
        {
            const f64 alt = altitude(t);
            if (alt >= PlanetCalculator::kMinAltitudeDeg)
            {
                seen.push_back(t);
                if (alt > best_alt)
                {
                    best_alt = alt;
                    best_jd = t;
                }
            }
        }

        const bool visible = !seen.empty()
                          && magnitude <= PlanetCalculator::kNakedEyeLimitMag
                          && pos.elongation_deg >= PlanetCalculator::kMinElongationDeg;

        SkyWindow window = SkyWindow::NotVisible;
        std::optional<astro::Instant> best_time;
        std::string hint;

        if (visible)
        {
            const f64 fraction = static_cast<f64>(seen.size()) / static_cast<f64>(dark.size());
            const f64 dark_mid = 0.5 * (dark.front() + dark.back());
            f64 seen_mean = 0.0;
            for (const f64 t : seen)
            {
                seen_mean += t;
            }
            seen_mean /= static_cast<f64>(seen.size());

            if (fraction >= PlanetCalculator::kAllNightFraction)
            {
                window = SkyWindow::AllNight;
            }
            else
            {
                window = seen_mean < dark_mid ? SkyWindow::Evening : SkyWindow::Morning;
            }

            best_time = astro::Instant::from_julian_date(best_jd, ctx.instant.utc_offset());
            const auto hz = astro::Coordinates::to_horizontal(
                astro::Planets::position(planet, best_jd).equatorial, observer, best_jd);
            const std::string_view where = compass_point(hz.az);

            switch (window)
            {
                case SkyWindow::AllNight:
                    hint = fmt::format("Visible most of the night, highest around {} in the {}",
                                       best_time->to_local_hhmm(), where);
                    break;
                case SkyWindow::Evening:
                    hint = fmt::format("Evening sky, best around {} in the {}", best_time->to_local_hhmm(), where);
                    break;
                case SkyWindow::Morning:
                    hint = fmt::format("Morning sky, best around {} in the {}", best_time->to_local_hhmm(), where);
                    break;
                case SkyWindow::NotVisible:
                    break;
            }
        }
        else if (pos.elongation_deg < PlanetCalculator::kMinElongationDeg)
        {
            hint = "Too close to the Sun";
        }
        else if (magnitude > PlanetCalculator::kNakedEyeLimitMag)
        {
            hint = "Too faint for the naked eye";
        }
        else if (dark.empty())
        {
            hint = "The sky does not get dark enough tonight";
        }
        else
        {
            hint = "Below the horizon during darkness";
        }

        return PlanetVisibility{
            .planet         = planet,
            .visible        = visible,
            .rise           = events.rise,
            .set            = events.set,
            .magnitude      = magnitude,
            .elongation_deg = pos.elongation_deg,
            .altitude_deg   = altitude(jd),
            .distance_au    = pos.earth_distance_au,
            .window         = window,
            .best_time      = best_time,
            .hint           = std::move(hint),
        };
    }

} // namespace

std::string_view to_string(SkyWindow window)
{
    switch (window)
    {
        case SkyWindow::Evening:    return "evening";
        case SkyWindow::Morning:    return "morning";
        case SkyWindow::AllNight:   return "all_night";
        case SkyWindow::NotVisible: return "not_visible";
    }
    return "unknown";
}

std::string_view PlanetVisibility::brightness() const
{
    if (magnitude < -3.0) return "very bright";
    if (magnitude < -1.0) return "bright";
    if (magnitude < 1.0)  return "moderate";
    return "dim";
}

std::vector<PlanetVisibility> PlanetReport::visible() const
{
    std::vector<PlanetVisibility> out;
    std::copy_if(planets.begin(), planets.end(), std::back_inserter(out),
                 [](const PlanetVisibility& p) { return p.visible; });
    return out;
}

const PlanetVisibility* PlanetReport::find(astro::Planet planet) const
{
    const auto it = std::find_if(planets.begin(), planets.end(),
                                 [planet](const PlanetVisibility& p) { return p.planet == planet; });
    return it == planets.end() ? nullptr : &*it;
}

// -----------------------------------------------------------------
// PlanetCalculator
// -----------------------------------------------------------------

PlanetCalculator::PlanetCalculator(std::shared_ptr<net::JsonFetcher> fetcher, core::SourceSettings settings)
    : Calculator<PlanetReport>(std::move(fetcher), std::move(settings))
{
}

PlanetReport PlanetCalculator::build_report(const CalculationContext& ctx,
                                            const std::vector<std::pair<astro::Planet, f64>>& magnitude_overrides)
{
    const f64 start_jd = night_start(ctx.instant).julian_date();
    const auto dark = dark_samples(start_jd, ctx.location.observer());

    PlanetReport report;
    report.planets.reserve(astro::kAllPlanets.size());

    for (const auto planet : astro::kAllPlanets)
    {
        std::optional<f64> override_mag;
        for (const auto& [p, mag] : magnitude_overrides)
        {
            if (p == planet)
            {
                override_mag = mag;
            }
        }
        report.planets.push_back(evaluate(planet, ctx, dark, start_jd, override_mag));
    }

    std::stable_sort(report.planets.begin(), report.planets.end(),
                     [](const PlanetVisibility& a, const PlanetVisibility& b) { return a.magnitude < b.magnitude; });
    return report;
}

std::optional<PlanetReport> PlanetCalculator::compute_local(const CalculationContext& ctx) const
{
    return build_report(ctx);
}

LiveOutcome<PlanetReport> PlanetCalculator::compute_live(const CalculationContext& ctx, SourceFetcher& fetcher) const
{
    const std::string url = SourceFetcher::with_query(settings().url, {
        {"latitude", fmt::format("{:.4f}", ctx.location.latitude_deg)},
        {"longitude", fmt::format("{:.4f}", ctx.location.longitude_deg)},
        {"time", ctx.instant.with_offset(std::chrono::minutes{0}).to_iso8601()},
    });

    auto doc = fetcher.get_json(url);
    if (auto* failure = std::get_if<SourceFailure>(&doc))
    {
        return std::move(*failure);
    }
    return parse_visible_planets(std::get<nlohmann::json>(doc), ctx);
}

LiveOutcome<PlanetReport> PlanetCalculator::parse_visible_planets(const nlohmann::json& doc,
                                                                  const CalculationContext& ctx)
{
    if (!doc.is_object() || !doc.contains("data") || !doc["data"].is_array())
    {
        return SourceFailure{FailureKind::MalformedPayload, "missing 'data' array"};
    }

    std::vector<std::pair<astro::Planet, f64>> magnitudes;
    for (const auto& body : doc["data"])
    {
        const auto name = payload::string_at(body, "name");
        if (!name)
        {
            return SourceFailure{FailureKind::MalformedPayload, "body without a name"};
        }

        // The service also lists the Moon and bright stars
        const auto planet = astro::Planets::from_name(*name);
        if (!planet)
        {
            continue;
        }

        const auto magnitude = payload::number_at(body, "magnitude");
        if (!magnitude)
        {
            return SourceFailure{FailureKind::MalformedPayload, "no magnitude for " + *name};
        }
        magnitudes.emplace_back(*planet, *magnitude);
    }

    return build_report(ctx, magnitudes);
}

} // namespace skybrief::sources

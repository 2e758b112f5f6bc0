/// @file moon_calculator.cpp
/// @brief Implementation of the Moon calculator.

#include "sources/moon_calculator.hpp"

#include "astro/root_finding.hpp"
#include "sources/payload.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace skybrief::sources
{

namespace
{
    constexpr f64 kRiseSetScanStepDays = 10.0 / 1440.0;  // 10 minutes

    std::string lowercase(std::string_view text)
    {
        std::string out{text};
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string iso_date(const std::chrono::year_month_day& date)
    {
        return fmt::format("{:04}-{:02}-{:02}",
                           static_cast<i32>(date.year()),
                           static_cast<unsigned>(date.month()),
                           static_cast<unsigned>(date.day()));
    }

} // namespace

MoonCalculator::MoonCalculator(std::shared_ptr<net::JsonFetcher> fetcher, core::SourceSettings settings)
    : Calculator<MoonState>(std::move(fetcher), std::move(settings))
{
}

// -----------------------------------------------------------------
// Local: synodic phase, position series for altitude and rise/set
// -----------------------------------------------------------------

std::optional<MoonState> MoonCalculator::compute_local(const CalculationContext& ctx) const
{
    const auto observer = ctx.location.observer();
    const f64 jd = ctx.instant.julian_date();
    const auto lunar = astro::Lunar::phase(jd);

    const astro::AltitudeFunction altitude = [&observer](f64 t) { return astro::Lunar::altitude_deg(t, observer); };
    const auto events = astro::RootFinder::rise_and_set(
        altitude, astro::Lunar::kHorizonDeg,
        ctx.instant.local_midnight().julian_date(), ctx.instant.utc_offset(), kRiseSetScanStepDays);

    return MoonState{
        .phase           = lunar.phase,
        .illumination    = lunar.illumination,
        .age_days        = lunar.age_days,
        .phase_angle_deg = lunar.phase_angle_deg,
        .altitude_deg    = altitude(jd),
        .rise            = events.rise,
        .set             = events.set,
        .upcoming        = astro::Lunar::upcoming_phases(ctx.instant, kUpcomingWindow),
    };
}

// -----------------------------------------------------------------
// Live: USNO /api/rstt/oneday?date=YYYY-MM-DD&coords=lat,lon&tz=h
// -----------------------------------------------------------------

LiveOutcome<MoonState> MoonCalculator::compute_live(const CalculationContext& ctx, SourceFetcher& fetcher) const
{
    const std::string url = SourceFetcher::with_query(settings().url, {
        {"date", iso_date(ctx.instant.local_date())},
        {"coords", fmt::format("{:.4f},{:.4f}", ctx.location.latitude_deg, ctx.location.longitude_deg)},
        {"tz", fmt::format("{:g}", static_cast<f64>(ctx.instant.utc_offset().count()) / 60.0)},
    });

    auto doc = fetcher.get_json(url);
    if (auto* failure = std::get_if<SourceFailure>(&doc))
    {
        return std::move(*failure);
    }
    return parse_usno(std::get<nlohmann::json>(doc), ctx);
}

LiveOutcome<MoonState> MoonCalculator::parse_usno(const nlohmann::json& doc, const CalculationContext& ctx)
{
    const auto malformed = [](std::string detail) { return SourceFailure{FailureKind::MalformedPayload, std::move(detail)}; };

    if (!doc.is_object() || !doc.contains("properties") || !doc["properties"].is_object())
    {
        return malformed("missing 'properties'");
    }
    const auto& props = doc["properties"];
    if (!props.contains("data") || !props["data"].is_object())
    {
        return malformed("missing 'properties.data'");
    }
    const auto& data = props["data"];

    const auto phase_name = payload::string_at(data, "curphase");
    const auto phase = phase_name ? parse_phase_name(*phase_name) : std::nullopt;
    if (!phase)
    {
        return malformed("missing or unknown 'curphase'");
    }

    const auto percent = payload::number_at(data, "fracillum");
    if (!percent || *percent < 0.0 || *percent > 100.0)
    {
        return malformed("missing or out-of-range 'fracillum'");
    }

    // Geometry the service does not report comes from the local model
    const f64 jd = ctx.instant.julian_date();
    const auto lunar = astro::Lunar::phase(jd);
    const f64 altitude = astro::Lunar::altitude_deg(jd, ctx.location.observer());

    std::optional<astro::Instant> rise;
    std::optional<astro::Instant> set;
    if (data.contains("moondata"))
    {
        if (!data["moondata"].is_array())
        {
            return malformed("'moondata' is not an array");
        }
        for (const auto& entry : data["moondata"])
        {
            const auto phen = payload::string_at(entry, "phen");
            const auto time = payload::string_at(entry, "time");
            if (!phen || !time)
            {
                return malformed("'moondata' entry without phen/time");
            }
            if (*phen != "Rise" && *phen != "Set")
            {
                continue;
            }

            const auto since_midnight = payload::parse_hhmm(*time);
            if (!since_midnight)
            {
                return malformed("bad moondata time '" + *time + "'");
            }
            const auto at = astro::Instant::from_local(ctx.instant.local_date(), *since_midnight,
                                                       ctx.instant.utc_offset());
            if (!at)
            {
                return malformed("moondata time outside the day");
            }
            (*phen == "Rise" ? rise : set) = *at;
        }
    }

    const astro::NoEvent missing = (rise || set)
        ? astro::NoEvent{astro::NoEventReason::NotInWindow}
        : astro::NoEvent{altitude > astro::Lunar::kHorizonDeg ? astro::NoEventReason::AlwaysAbove
                                                               : astro::NoEventReason::AlwaysBelow};

    const auto to_event = [&missing](const std::optional<astro::Instant>& at) -> astro::EventTime
    {
        if (at)
        {
            return *at;
        }
        return missing;
    };

    return MoonState{
        .phase           = *phase,
        .illumination    = *percent / 100.0,
        .age_days        = lunar.age_days,
        .phase_angle_deg = lunar.phase_angle_deg,
        .altitude_deg    = altitude,
        .rise            = to_event(rise),
        .set             = to_event(set),
        .upcoming        = astro::Lunar::upcoming_phases(ctx.instant, kUpcomingWindow),
    };
}

std::optional<astro::MoonPhase> MoonCalculator::parse_phase_name(std::string_view name)
{
    const std::string key = lowercase(name);

    if (key == "new moon" || key == "new")                                   return astro::MoonPhase::New;
    if (key == "waxing crescent")                                            return astro::MoonPhase::WaxingCrescent;
    if (key == "first quarter")                                              return astro::MoonPhase::FirstQuarter;
    if (key == "waxing gibbous")                                             return astro::MoonPhase::WaxingGibbous;
    if (key == "full moon" || key == "full")                                 return astro::MoonPhase::Full;
    if (key == "waning gibbous")                                             return astro::MoonPhase::WaningGibbous;
    if (key == "last quarter" || key == "third quarter")                     return astro::MoonPhase::LastQuarter;
    if (key == "waning crescent")                                            return astro::MoonPhase::WaningCrescent;
    return std::nullopt;
}

} // namespace skybrief::sources

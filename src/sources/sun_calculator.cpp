/// @file sun_calculator.cpp
/// @brief Implementation of the Sun calculator and twilight helpers.

#include "sources/sun_calculator.hpp"

#include "astro/solar.hpp"
#include "astro/time_system.hpp"
#include "sources/payload.hpp"

#include <fmt/format.h>

#include <array>
#include <string>

namespace skybrief::sources
{

namespace
{
    // sunrise-sunset.org reports a crossing that does not happen as the epoch
    constexpr std::string_view kNoEventSentinel = "1970-01-01T00:00:01+00:00";

    /// @brief Is the Sun below the threshold whose crossings are @p dawn / @p dusk?
    bool below_threshold(const astro::EventTime& dawn, const astro::EventTime& dusk, const astro::Instant& at)
    {
        const auto side = [](const astro::EventTime& event, auto&& compare)
        {
            if (const auto* t = std::get_if<astro::Instant>(&event))
            {
                return compare(*t);
            }
            return std::get<astro::NoEvent>(event).reason == astro::NoEventReason::AlwaysBelow;
        };

        const bool before_dawn = side(dawn, [&at](const astro::Instant& t) { return at < t; });
        const bool after_dusk  = side(dusk, [&at](const astro::Instant& t) { return at >= t; });
        return before_dawn || after_dusk;
    }

    std::chrono::seconds day_length_of(const astro::EventTime& sunrise,
                                       const astro::EventTime& sunset,
                                       const astro::Instant& noon)
    {
        constexpr std::chrono::seconds kHalfDay{12 * 3600};

        const auto rise = astro::instant_of(sunrise);
        const auto set = astro::instant_of(sunset);

        if (rise && set)
        {
            return *set - *rise;
        }
        if (!rise && !set)
        {
            const bool always_above = std::get<astro::NoEvent>(sunrise).reason == astro::NoEventReason::AlwaysAbove;
            return always_above ? 2 * kHalfDay : std::chrono::seconds{0};
        }
        // One side only: the Sun stays up until the search window edge
        return rise ? (noon + kHalfDay) - *rise : *set - (noon - kHalfDay);
    }

    std::string iso_date(const std::chrono::year_month_day& date)
    {
        return fmt::format("{:04}-{:02}-{:02}",
                           static_cast<i32>(date.year()),
                           static_cast<unsigned>(date.month()),
                           static_cast<unsigned>(date.day()));
    }

} // namespace

std::string_view to_string(TwilightStage stage)
{
    switch (stage)
    {
        case TwilightStage::Day:          return "day";
        case TwilightStage::Civil:        return "civil_twilight";
        case TwilightStage::Nautical:     return "nautical_twilight";
        case TwilightStage::Astronomical: return "astronomical_twilight";
        case TwilightStage::Night:        return "night";
    }
    return "unknown";
}

bool SunTimes::is_ordered() const
{
    const std::array<const astro::EventTime*, 8> sequence{
        &astronomical_dawn, &nautical_dawn, &civil_dawn, &sunrise,
        &sunset, &civil_dusk, &nautical_dusk, &astronomical_dusk,
    };

    std::optional<astro::Instant> previous;
    for (const auto* event : sequence)
    {
        const auto at = astro::instant_of(*event);
        if (!at)
        {
            continue;
        }
        if (previous && *at < *previous)
        {
            return false;
        }
        previous = at;
    }
    return true;
}

TwilightStage classify(const SunTimes& times, const astro::Instant& at)
{
    if (below_threshold(times.astronomical_dawn, times.astronomical_dusk, at))
    {
        return TwilightStage::Night;
    }
    if (below_threshold(times.nautical_dawn, times.nautical_dusk, at))
    {
        return TwilightStage::Astronomical;
    }
    if (below_threshold(times.civil_dawn, times.civil_dusk, at))
    {
        return TwilightStage::Nautical;
    }
    if (below_threshold(times.sunrise, times.sunset, at))
    {
        return TwilightStage::Civil;
    }
    return TwilightStage::Day;
}

std::optional<DarkSkyWindow> dark_sky_window(const SunTimes& times)
{
    constexpr std::chrono::seconds kHalfDay{12 * 3600};

    const auto dusk = astro::instant_of(times.astronomical_dusk);
    const auto dawn = astro::instant_of(times.astronomical_dawn);

    if (dusk && dawn)
    {
        return DarkSkyWindow{.begins = *dusk, .ends = *dawn + 2 * kHalfDay};
    }

    // Polar night: dark around the clock
    const auto* dusk_none = std::get_if<astro::NoEvent>(&times.astronomical_dusk);
    const auto* dawn_none = std::get_if<astro::NoEvent>(&times.astronomical_dawn);
    if (dusk_none && dawn_none
        && dusk_none->reason == astro::NoEventReason::AlwaysBelow
        && dawn_none->reason == astro::NoEventReason::AlwaysBelow)
    {
        return DarkSkyWindow{.begins = times.solar_noon - kHalfDay, .ends = times.solar_noon + kHalfDay};
    }

    return std::nullopt;
}

// -----------------------------------------------------------------
// SunCalculator
// -----------------------------------------------------------------

SunCalculator::SunCalculator(std::shared_ptr<net::JsonFetcher> fetcher, core::SourceSettings settings)
    : Calculator<SunTimes>(std::move(fetcher), std::move(settings))
{
}

SunTimes SunCalculator::compute_for_day(const GeoLocation& location,
                                        const std::chrono::year_month_day& local_date,
                                        std::chrono::minutes utc_offset)
{
    using astro::Solar;

    const auto observer = location.observer();
    const f64 transit = Solar::transit_jd(local_date, utc_offset, observer);

    const auto horizon      = Solar::crossings(transit, observer, Solar::kHorizonDeg, utc_offset);
    const auto civil        = Solar::crossings(transit, observer, Solar::kCivilDeg, utc_offset);
    const auto nautical     = Solar::crossings(transit, observer, Solar::kNauticalDeg, utc_offset);
    const auto astronomical = Solar::crossings(transit, observer, Solar::kAstronomicalDeg, utc_offset);

    const auto noon = astro::Instant::from_julian_date(transit, utc_offset);

    return SunTimes{
        .astronomical_dawn = astronomical.morning,
        .nautical_dawn     = nautical.morning,
        .civil_dawn        = civil.morning,
        .sunrise           = horizon.morning,
        .sunset            = horizon.evening,
        .civil_dusk        = civil.evening,
        .nautical_dusk     = nautical.evening,
        .astronomical_dusk = astronomical.evening,
        .solar_noon        = noon,
        .day_length        = day_length_of(horizon.morning, horizon.evening, noon),
    };
}

std::optional<SunTimes> SunCalculator::compute_local(const CalculationContext& ctx) const
{
    return compute_for_day(ctx.location, ctx.instant.local_date(), ctx.instant.utc_offset());
}

// -----------------------------------------------------------------
// Live: sunrise-sunset.org /json?lat=&lng=&date=&formatted=0
// -----------------------------------------------------------------

LiveOutcome<SunTimes> SunCalculator::compute_live(const CalculationContext& ctx, SourceFetcher& fetcher) const
{
    const std::string url = SourceFetcher::with_query(settings().url, {
        {"lat", fmt::format("{:.4f}", ctx.location.latitude_deg)},
        {"lng", fmt::format("{:.4f}", ctx.location.longitude_deg)},
        {"date", iso_date(ctx.instant.local_date())},
        {"formatted", "0"},
    });

    auto doc = fetcher.get_json(url);
    if (auto* failure = std::get_if<SourceFailure>(&doc))
    {
        return std::move(*failure);
    }
    return parse_sunrise_sunset(std::get<nlohmann::json>(doc), ctx);
}

LiveOutcome<SunTimes> SunCalculator::parse_sunrise_sunset(const nlohmann::json& doc, const CalculationContext& ctx)
{
    const auto malformed = [](std::string detail) { return SourceFailure{FailureKind::MalformedPayload, std::move(detail)}; };

    const auto status = payload::string_at(doc, "status");
    if (!status || *status != "OK")
    {
        return malformed("status is not OK");
    }
    if (!doc.contains("results") || !doc["results"].is_object())
    {
        return malformed("missing 'results'");
    }
    const auto& results = doc["results"];

    const auto day_length = payload::number_at(results, "day_length");
    if (!day_length || *day_length < 0.0)
    {
        return malformed("missing 'day_length'");
    }

    const astro::NoEvent missing{*day_length <= 0.0 ? astro::NoEventReason::AlwaysBelow
                                                    : astro::NoEventReason::AlwaysAbove};
    const auto offset = ctx.instant.utc_offset();

    bool ok = true;
    std::string bad_field;
    const auto event_at = [&](const char* key) -> astro::EventTime
    {
        const auto text = payload::string_at(results, key);
        if (text && *text == kNoEventSentinel)
        {
            return missing;
        }
        const auto at = payload::instant_at(results, key);
        if (!at)
        {
            ok = false;
            bad_field = key;
            return missing;
        }
        return at->with_offset(offset);
    };

    SunTimes times{
        .astronomical_dawn = event_at("astronomical_twilight_begin"),
        .nautical_dawn     = event_at("nautical_twilight_begin"),
        .civil_dawn        = event_at("civil_twilight_begin"),
        .sunrise           = event_at("sunrise"),
        .sunset            = event_at("sunset"),
        .civil_dusk        = event_at("civil_twilight_end"),
        .nautical_dusk     = event_at("nautical_twilight_end"),
        .astronomical_dusk = event_at("astronomical_twilight_end"),
        .solar_noon        = ctx.instant,
        .day_length        = std::chrono::seconds{static_cast<i64>(*day_length)},
    };

    if (!ok)
    {
        return malformed("bad timestamp in '" + bad_field + "'");
    }

    const auto noon = payload::instant_at(results, "solar_noon");
    if (!noon)
    {
        return malformed("missing 'solar_noon'");
    }
    times.solar_noon = noon->with_offset(offset);

    if (!times.is_ordered())
    {
        return malformed("twilight events out of order");
    }
    return times;
}

} // namespace skybrief::sources

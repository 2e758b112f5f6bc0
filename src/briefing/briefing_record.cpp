/// @file briefing_record.cpp
/// @brief JSON serialization of briefings and domain values.

#include "briefing/briefing_record.hpp"

#include <fmt/format.h>

#include <string>

namespace skybrief::briefing
{

namespace
{
    using nlohmann::json;

    json opt(const std::optional<f64>& value)
    {
        return value ? json(*value) : json(nullptr);
    }

    json opt(const std::optional<i32>& value)
    {
        return value ? json(*value) : json(nullptr);
    }

    json opt(const std::optional<astro::Instant>& value)
    {
        return value ? json(value->to_iso8601()) : json(nullptr);
    }

    std::string iso_date(const std::chrono::year_month_day& date)
    {
        return fmt::format("{:04}-{:02}-{:02}", static_cast<i32>(date.year()),
                           static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
    }

    std::string month_day(const std::chrono::month_day& md)
    {
        return fmt::format("{:02}-{:02}", static_cast<unsigned>(md.month()), static_cast<unsigned>(md.day()));
    }

    // -----------------------------------------------------------------
    // Domain values
    // -----------------------------------------------------------------

    json moon_record(const sources::MoonState& moon)
    {
        json upcoming = json::array();
        for (const auto& event : moon.upcoming)
        {
            upcoming.push_back({{"phase", astro::Lunar::phase_name(event.phase)}, {"time", event.at.to_iso8601()}});
        }
        return {
            {"phase", astro::Lunar::phase_name(moon.phase)},
            {"illumination", moon.illumination},
            {"age_days", moon.age_days},
            {"phase_angle_deg", moon.phase_angle_deg},
            {"altitude_deg", moon.altitude_deg},
            {"is_up", moon.is_up()},
            {"rise", to_record(moon.rise)},
            {"set", to_record(moon.set)},
            {"upcoming_phases", std::move(upcoming)},
        };
    }

    json sun_record(const sources::SunTimes& sun, const astro::Instant& at)
    {
        json record{
            {"astronomical_dawn", to_record(sun.astronomical_dawn)},
            {"nautical_dawn", to_record(sun.nautical_dawn)},
            {"civil_dawn", to_record(sun.civil_dawn)},
            {"sunrise", to_record(sun.sunrise)},
            {"sunset", to_record(sun.sunset)},
            {"civil_dusk", to_record(sun.civil_dusk)},
            {"nautical_dusk", to_record(sun.nautical_dusk)},
            {"astronomical_dusk", to_record(sun.astronomical_dusk)},
            {"solar_noon", sun.solar_noon.to_iso8601()},
            {"day_length_seconds", sun.day_length.count()},
            {"twilight_stage", sources::to_string(sources::classify(sun, at))},
            {"dark_window", nullptr},
        };
        if (const auto dark = sources::dark_sky_window(sun))
        {
            record["dark_window"] = {
                {"begins", dark->begins.to_iso8601()},
                {"ends", dark->ends.to_iso8601()},
                {"duration_minutes", std::chrono::duration_cast<std::chrono::minutes>(dark->duration()).count()},
                {"best_time", dark->best_time().to_iso8601()},
            };
        }
        return record;
    }

    json planets_record(const sources::PlanetReport& report)
    {
        json planets = json::array();
        for (const auto& p : report.planets)
        {
            planets.push_back({
                {"name", p.name()},
                {"visible", p.visible},
                {"magnitude", p.magnitude},
                {"brightness", p.brightness()},
                {"elongation_deg", p.elongation_deg},
                {"altitude_deg", p.altitude_deg},
                {"distance_au", p.distance_au},
                {"window", sources::to_string(p.window)},
                {"best_time", opt(p.best_time)},
                {"hint", p.hint},
                {"rise", to_record(p.rise)},
                {"set", to_record(p.set)},
            });
        }
        return {{"planets", std::move(planets)}};
    }

    json shower_record(const sources::ShowerActivity& activity)
    {
        const auto& s = activity.shower;
        return {
            {"name", s.name},
            {"active_start", month_day(s.active_start)},
            {"active_end", month_day(s.active_end)},
            {"peak", month_day(s.peak)},
            {"zhr", s.zhr},
            {"parent_body", s.parent_body},
            {"radiant", s.radiant},
            {"speed_km_s", s.speed_km_s},
            {"days_to_peak", activity.days_to_peak},
            {"effective_zhr", activity.effective_zhr},
            {"rating", calendar::to_string(activity.rating)},
        };
    }

    json meteors_record(const sources::MeteorOutlook& outlook)
    {
        json active = json::array();
        json upcoming = json::array();
        for (const auto& a : outlook.active)
        {
            active.push_back(shower_record(a));
        }
        for (const auto& a : outlook.upcoming)
        {
            upcoming.push_back(shower_record(a));
        }
        return {{"active", std::move(active)}, {"upcoming", std::move(upcoming)}};
    }

    json eclipse_record(const sources::EclipseSighting& sighting, std::chrono::minutes offset)
    {
        const auto& e = sighting.event;
        json regions = json::array();
        for (const auto& region : e.regions)
        {
            regions.push_back(region);
        }
        return {
            {"kind", calendar::to_string(e.kind)},
            {"date", iso_date(e.date)},
            {"maximum", e.maximum.with_offset(offset).to_iso8601()},
            {"duration_minutes", opt(e.duration_minutes)},
            {"magnitude", e.magnitude},
            {"regions", std::move(regions)},
            {"notes", e.notes},
            {"days_until", sighting.days_until},
            {"above_horizon_at_maximum", sighting.above_horizon_at_maximum},
        };
    }

    json eclipses_record(const sources::EclipseOutlook& outlook, std::chrono::minutes offset)
    {
        json today = json::array();
        json upcoming = json::array();
        for (const auto& s : outlook.today)
        {
            today.push_back(eclipse_record(s, offset));
        }
        for (const auto& s : outlook.upcoming)
        {
            upcoming.push_back(eclipse_record(s, offset));
        }
        return {{"today", std::move(today)}, {"upcoming", std::move(upcoming)}, {"covered", outlook.covered}};
    }

    json space_weather_record(const sources::SpaceWeather& sw)
    {
        json wind = nullptr;
        if (sw.solar_wind)
        {
            wind = {
                {"speed_km_s", opt(sw.solar_wind->speed_km_s)},
                {"density_p_cm3", opt(sw.solar_wind->density_p_cm3)},
                {"temperature_k", opt(sw.solar_wind->temperature_k)},
                {"elevated", sw.solar_wind->elevated()},
            };
        }
        return {
            {"kp", sw.kp},
            {"observed_at", sw.observed_at.to_iso8601()},
            {"kp_forecast_max", opt(sw.kp_forecast_max)},
            {"kp_24h_max", sw.kp_24h_max()},
            {"level", sources::to_string(sw.level)},
            {"solar_wind", std::move(wind)},
            {"aurora_latitude_deg", sw.aurora_latitude_deg},
            {"aurora_visible", sw.aurora_visible},
        };
    }

    json weather_record(const sources::WeatherState& weather)
    {
        const auto category = weather.category();
        return {
            {"current_cloud_pct", opt(weather.current_cloud_pct)},
            {"night_mean_cloud_pct", opt(weather.night_mean_cloud_pct)},
            {"night_min_cloud_pct", opt(weather.night_min_cloud_pct)},
            {"clearest_hour", opt(weather.clearest_hour)},
            {"night_hours", weather.night_hours},
            {"category", category ? json(sources::to_string(*category)) : json(nullptr)},
        };
    }

    /// @brief {"provenance", "failure", "data"} for one domain.
    template <typename T, typename Fn>
    json domain_record(const sources::SourceResult<T>& result, Fn&& serialize)
    {
        json failure = nullptr;
        if (const auto& f = result.failure())
        {
            failure = {{"kind", sources::to_string(f->kind)}, {"detail", f->detail}};
        }
        const auto* value = result.get();
        return {
            {"provenance", sources::to_string(result.provenance())},
            {"failure", std::move(failure)},
            {"data", value ? serialize(*value) : json(nullptr)},
        };
    }

    json location_record(const sources::GeoLocation& location)
    {
        return {
            {"latitude", location.latitude_deg},
            {"longitude", location.longitude_deg},
            {"elevation_m", opt(location.elevation_m)},
            {"utc_offset_minutes", opt(location.utc_offset_minutes)},
        };
    }

} // namespace

json to_record(const astro::EventTime& event)
{
    if (const auto* at = std::get_if<astro::Instant>(&event))
    {
        return {{"status", "occurs"}, {"time", at->to_iso8601()}};
    }
    return {{"status", astro::to_string(std::get<astro::NoEvent>(event).reason)}, {"time", nullptr}};
}

json to_record(const ViewingConditionsScore& score)
{
    json breakdown = json::array();
    for (const auto& f : score.breakdown)
    {
        breakdown.push_back({
            {"factor", to_string(f.factor)},
            {"sub_score", f.sub_score},
            {"weight", f.weight},
            {"normalized_weight", f.normalized_weight},
            {"contribution", f.contribution},
        });
    }
    json recommendations = json::array();
    for (const auto& r : score.recommendations)
    {
        recommendations.push_back(r);
    }
    return {
        {"total", score.total},
        {"category", to_string(score.category)},
        {"raw", score.raw},
        {"breakdown", std::move(breakdown)},
        {"recommendations", std::move(recommendations)},
    };
}

json to_record(const DailyBriefing& briefing)
{
    const auto& r = briefing.results();
    const auto offset = briefing.instant().utc_offset();

    json provenance = json::object();
    for (const auto& entry : briefing.provenance().entries)
    {
        provenance[std::string{sources::to_string(entry.domain)}] = sources::to_string(entry.provenance);
    }

    return {
        {"instant", briefing.instant().to_iso8601()},
        {"location", location_record(briefing.location())},
        {"provenance", std::move(provenance)},
        {"moon", domain_record(r.moon, moon_record)},
        {"sun", domain_record(r.sun, [&briefing](const sources::SunTimes& s) { return sun_record(s, briefing.instant()); })},
        {"planets", domain_record(r.planets, planets_record)},
        {"meteor_showers", domain_record(r.meteor_showers, meteors_record)},
        {"eclipses", domain_record(r.eclipses, [offset](const sources::EclipseOutlook& e) { return eclipses_record(e, offset); })},
        {"space_weather", domain_record(r.space_weather, space_weather_record)},
        {"weather", domain_record(r.weather, weather_record)},
        {"score", briefing.score() ? to_record(*briefing.score()) : json(nullptr)},
        {"narrative", briefing.narrative()},
        {"elapsed_ms", briefing.elapsed().count()},
    };
}

json to_record(const TonightSummary& summary)
{
    json planets = json::array();
    for (const auto& p : summary.visible_planets)
    {
        planets.push_back({
            {"name", p.name()},
            {"magnitude", p.magnitude},
            {"window", sources::to_string(p.window)},
            {"best_time", opt(p.best_time)},
        });
    }
    json showers = json::array();
    for (const auto& a : summary.active_showers)
    {
        showers.push_back(shower_record(a));
    }

    json dark = nullptr;
    if (summary.dark_window)
    {
        dark = {
            {"begins", summary.dark_window->begins.to_iso8601()},
            {"ends", summary.dark_window->ends.to_iso8601()},
            {"best_time", summary.dark_window->best_time().to_iso8601()},
        };
    }

    return {
        {"instant", summary.instant.to_iso8601()},
        {"moon", summary.moon ? moon_record(*summary.moon) : json(nullptr)},
        {"dark_window", std::move(dark)},
        {"visible_planets", std::move(planets)},
        {"active_showers", std::move(showers)},
        {"kp", opt(summary.kp)},
        {"aurora_visible", summary.aurora_visible ? json(*summary.aurora_visible) : json(nullptr)},
        {"score", summary.score ? to_record(*summary.score) : json(nullptr)},
        {"narrative", summary.narrative},
    };
}

} // namespace skybrief::briefing

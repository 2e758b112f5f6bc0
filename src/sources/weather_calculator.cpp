/// @file weather_calculator.cpp
/// @brief Open-Meteo hourly cloud cover parsing.

#include "sources/weather_calculator.hpp"

#include "sources/payload.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace skybrief::sources
{

namespace
{
    constexpr std::chrono::hours kLookahead{24};

    struct HourSample
    {
        astro::Instant     start;
        std::optional<f64> cloud_pct;
        bool               is_day;
    };

} // namespace

std::string_view to_string(CloudCategory category)
{
    switch (category)
    {
        case CloudCategory::Clear:        return "clear";
        case CloudCategory::PartlyCloudy: return "partly_cloudy";
        case CloudCategory::MostlyCloudy: return "mostly_cloudy";
        case CloudCategory::Overcast:     return "overcast";
    }
    return "unknown";
}

CloudCategory categorize_cloud(f64 cloud_pct)
{
    if (cloud_pct < 25.0) return CloudCategory::Clear;
    if (cloud_pct < 50.0) return CloudCategory::PartlyCloudy;
    if (cloud_pct < 75.0) return CloudCategory::MostlyCloudy;
    return CloudCategory::Overcast;
}

std::optional<f64> WeatherState::cloud_for_scoring() const
{
    return current_cloud_pct ? current_cloud_pct : night_mean_cloud_pct;
}

std::optional<CloudCategory> WeatherState::category() const
{
    const auto cloud = cloud_for_scoring();
    if (!cloud)
    {
        return std::nullopt;
    }
    return categorize_cloud(*cloud);
}

// -----------------------------------------------------------------
// WeatherCalculator
// -----------------------------------------------------------------

WeatherCalculator::WeatherCalculator(std::shared_ptr<net::JsonFetcher> fetcher, core::SourceSettings settings)
    : Calculator<WeatherState>(std::move(fetcher), std::move(settings))
{
}

LiveOutcome<WeatherState> WeatherCalculator::compute_live(const CalculationContext& ctx, SourceFetcher& fetcher) const
{
    const std::string url = SourceFetcher::with_query(settings().url, {
        {"latitude", fmt::format("{:.4f}", ctx.location.latitude_deg)},
        {"longitude", fmt::format("{:.4f}", ctx.location.longitude_deg)},
        {"hourly", "cloud_cover,is_day"},
        {"forecast_days", "2"},
        {"timezone", "UTC"},
    });

    auto doc = fetcher.get_json(url);
    if (auto* failure = std::get_if<SourceFailure>(&doc))
    {
        return std::move(*failure);
    }
    return parse_open_meteo(std::get<nlohmann::json>(doc), ctx);
}

LiveOutcome<WeatherState> WeatherCalculator::parse_open_meteo(const nlohmann::json& doc,
                                                              const CalculationContext& ctx)
{
    const auto malformed = [](std::string detail) { return SourceFailure{FailureKind::MalformedPayload, std::move(detail)}; };

    if (!doc.is_object() || !doc.contains("hourly") || !doc["hourly"].is_object())
    {
        return malformed("missing 'hourly'");
    }
    const auto& hourly = doc["hourly"];
    for (const char* key : {"time", "cloud_cover", "is_day"})
    {
        if (!hourly.contains(key) || !hourly[key].is_array())
        {
            return malformed(fmt::format("missing 'hourly.{}'", key));
        }
    }

    const auto& times = hourly["time"];
    const auto& clouds = hourly["cloud_cover"];
    const auto& day_flags = hourly["is_day"];
    if (clouds.size() != times.size() || day_flags.size() != times.size())
    {
        return malformed("hourly arrays differ in length");
    }

    std::vector<HourSample> samples;
    samples.reserve(times.size());
    for (std::size_t i = 0; i < times.size(); ++i)
    {
        if (!times[i].is_string())
        {
            return malformed("non-string hourly time");
        }
        // Requested with timezone=UTC; the times carry no designator
        const auto start = astro::Instant::parse_iso8601(times[i].get_ref<const std::string&>(), std::chrono::minutes{0});
        const auto is_day = payload::as_number(day_flags[i]);
        if (!start || !is_day)
        {
            return malformed(fmt::format("bad hourly entry {}", i));
        }
        samples.push_back(HourSample{
            .start     = start->with_offset(ctx.instant.utc_offset()),
            .cloud_pct = payload::as_number(clouds[i]),
            .is_day    = *is_day != 0.0,
        });
    }

    const auto window_start = ctx.instant - std::chrono::hours{1};
    const auto window_end = ctx.instant + kLookahead;

    WeatherState state;
    bool in_night = false;
    bool night_done = false;
    f64 night_sum = 0.0;
    i32 night_valid = 0;

    for (const auto& hour : samples)
    {
        // Keep the hour containing the instant and the following 24 h
        if (hour.start <= window_start || hour.start >= window_end)
        {
            continue;
        }

        if (hour.start <= ctx.instant && ctx.instant < hour.start + std::chrono::hours{1})
        {
            state.current_cloud_pct = hour.cloud_pct;
        }

        if (night_done)
        {
            continue;
        }
        if (hour.is_day)
        {
            night_done = in_night;
            continue;
        }

        in_night = true;
        ++state.night_hours;
        if (hour.cloud_pct)
        {
            night_sum += *hour.cloud_pct;
            ++night_valid;
            if (!state.night_min_cloud_pct || *hour.cloud_pct < *state.night_min_cloud_pct)
            {
                state.night_min_cloud_pct = hour.cloud_pct;
                state.clearest_hour = hour.start;
            }
        }
    }

    if (night_valid > 0)
    {
        state.night_mean_cloud_pct = night_sum / static_cast<f64>(night_valid);
    }
    if (!state.cloud_for_scoring())
    {
        return malformed("no cloud cover for the requested time");
    }
    return state;
}

} // namespace skybrief::sources

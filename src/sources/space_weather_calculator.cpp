/// @file space_weather_calculator.cpp
/// @brief NOAA SWPC product parsing and aurora estimate.

#include "sources/space_weather_calculator.hpp"

#include "sources/payload.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace skybrief::sources
{

namespace
{
    constexpr f64 kAuroraBaseLatitude = 67.0;
    constexpr f64 kAuroraDegPerKp     = 3.0;
    constexpr f64 kAuroraMinLatitude  = 40.0;

    constexpr std::chrono::hours kForecastSpan{24};

    /// @brief One product row: timestamp plus the requested columns.
    struct Row
    {
        std::optional<astro::Instant>   time;
        std::vector<std::optional<f64>> values;
    };

    bool iequals(std::string_view a, std::string_view b)
    {
        return a.size() == b.size()
            && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y)
               {
                   return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
               });
    }

    std::optional<astro::Instant> time_of(const nlohmann::json& value)
    {
        if (!value.is_string())
        {
            return std::nullopt;
        }
        // SWPC time tags are UTC without a zone designator
        return astro::Instant::parse_iso8601(value.get_ref<const std::string&>(), std::chrono::minutes{0});
    }

    /// @brief Read a SWPC product, either an array of arrays led by a header
    /// row or an array of objects. Column names match case-insensitively.
    std::optional<std::vector<Row>> read_table(const nlohmann::json& doc,
                                               std::initializer_list<std::string_view> columns)
    {
        if (!doc.is_array())
        {
            return std::nullopt;
        }
        std::vector<Row> rows;
        if (doc.empty())
        {
            return rows;
        }

        if (doc.front().is_array())
        {
            const auto& header = doc.front();
            const auto index_of = [&header](std::string_view name) -> std::optional<std::size_t>
            {
                for (std::size_t i = 0; i < header.size(); ++i)
                {
                    if (header[i].is_string() && iequals(header[i].get_ref<const std::string&>(), name))
                    {
                        return i;
                    }
                }
                return std::nullopt;
            };

            const auto time_col = index_of("time_tag");
            if (!time_col)
            {
                return std::nullopt;
            }
            std::vector<std::optional<std::size_t>> cols;
            for (const auto name : columns)
            {
                cols.push_back(index_of(name));
            }

            for (std::size_t r = 1; r < doc.size(); ++r)
            {
                const auto& raw = doc[r];
                if (!raw.is_array())
                {
                    return std::nullopt;
                }
                Row row{.time = *time_col < raw.size() ? time_of(raw[*time_col]) : std::nullopt, .values = {}};
                for (const auto& col : cols)
                {
                    row.values.push_back(col && *col < raw.size() ? payload::as_number(raw[*col]) : std::nullopt);
                }
                rows.push_back(std::move(row));
            }
            return rows;
        }

        for (const auto& raw : doc)
        {
            if (!raw.is_object())
            {
                return std::nullopt;
            }
            Row row{.time = std::nullopt, .values = {}};
            if (const auto it = raw.find("time_tag"); it != raw.end())
            {
                row.time = time_of(*it);
            }
            for (const auto name : columns)
            {
                std::optional<f64> value;
                for (auto it = raw.begin(); it != raw.end(); ++it)
                {
                    if (iequals(it.key(), name))
                    {
                        value = payload::as_number(it.value());
                        break;
                    }
                }
                row.values.push_back(value);
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }

    std::string product_url(const std::string& base, std::string_view product)
    {
        std::string url = base;
        if (!url.empty() && url.back() != '/')
        {
            url += '/';
        }
        url += product;
        return url;
    }

} // namespace

std::string_view to_string(GeomagneticLevel level)
{
    switch (level)
    {
        case GeomagneticLevel::Quiet:         return "quiet";
        case GeomagneticLevel::Unsettled:     return "unsettled";
        case GeomagneticLevel::Active:        return "active";
        case GeomagneticLevel::MinorStorm:    return "minor_storm";
        case GeomagneticLevel::ModerateStorm: return "moderate_storm";
        case GeomagneticLevel::StrongStorm:   return "strong_storm";
        case GeomagneticLevel::SevereStorm:   return "severe_storm";
        case GeomagneticLevel::ExtremeStorm:  return "extreme_storm";
    }
    return "unknown";
}

std::string_view describe(GeomagneticLevel level)
{
    switch (level)
    {
        case GeomagneticLevel::Quiet:         return "quiet";
        case GeomagneticLevel::Unsettled:     return "unsettled";
        case GeomagneticLevel::Active:        return "active";
        case GeomagneticLevel::MinorStorm:    return "minor storm (G1)";
        case GeomagneticLevel::ModerateStorm: return "moderate storm (G2)";
        case GeomagneticLevel::StrongStorm:   return "strong storm (G3)";
        case GeomagneticLevel::SevereStorm:   return "severe storm (G4)";
        case GeomagneticLevel::ExtremeStorm:  return "extreme storm (G5)";
    }
    return "unknown";
}

bool SolarWind::elevated() const
{
    return (speed_km_s && *speed_km_s > 500.0) || (density_p_cm3 && *density_p_cm3 > 10.0);
}

f64 SpaceWeather::kp_24h_max() const
{
    return kp_forecast_max ? std::max(kp, *kp_forecast_max) : kp;
}

// -----------------------------------------------------------------
// SpaceWeatherCalculator
// -----------------------------------------------------------------

SpaceWeatherCalculator::SpaceWeatherCalculator(std::shared_ptr<net::JsonFetcher> fetcher,
                                               core::SourceSettings settings)
    : Calculator<SpaceWeather>(std::move(fetcher), std::move(settings))
{
}

GeomagneticLevel SpaceWeatherCalculator::level_for(f64 kp)
{
    if (kp < 2.0) return GeomagneticLevel::Quiet;
    if (kp < 4.0) return GeomagneticLevel::Unsettled;
    if (kp < 5.0) return GeomagneticLevel::Active;
    if (kp < 6.0) return GeomagneticLevel::MinorStorm;
    if (kp < 7.0) return GeomagneticLevel::ModerateStorm;
    if (kp < 8.0) return GeomagneticLevel::StrongStorm;
    if (kp < 9.0) return GeomagneticLevel::SevereStorm;
    return GeomagneticLevel::ExtremeStorm;
}

f64 SpaceWeatherCalculator::aurora_latitude(f64 kp)
{
    return std::max(kAuroraMinLatitude, kAuroraBaseLatitude - kAuroraDegPerKp * kp);
}

LiveOutcome<SpaceWeather> SpaceWeatherCalculator::from_products(const nlohmann::json& kp_index,
                                                                const nlohmann::json* forecast,
                                                                const nlohmann::json* plasma,
                                                                const CalculationContext& ctx)
{
    const auto kp_rows = read_table(kp_index, {"kp"});
    if (!kp_rows)
    {
        return SourceFailure{FailureKind::MalformedPayload, "Kp product is not a table"};
    }

    // Latest row with both a timestamp and a value
    const auto latest = std::find_if(kp_rows->rbegin(), kp_rows->rend(),
                                     [](const Row& r) { return r.time && r.values[0]; });
    if (latest == kp_rows->rend())
    {
        return SourceFailure{FailureKind::MalformedPayload, "no Kp reading"};
    }
    const f64 kp = *latest->values[0];
    if (kp < 0.0 || kp > 9.0)
    {
        return SourceFailure{FailureKind::MalformedPayload, "Kp out of range"};
    }

    SpaceWeather weather{
        .kp                  = kp,
        .observed_at         = latest->time->with_offset(ctx.instant.utc_offset()),
        .kp_forecast_max     = std::nullopt,
        .level               = level_for(kp),
        .solar_wind          = std::nullopt,
        .aurora_latitude_deg = 0.0,
        .aurora_visible      = false,
    };

    if (forecast)
    {
        if (const auto rows = read_table(*forecast, {"kp"}))
        {
            const auto until = ctx.instant + kForecastSpan;
            for (const auto& row : *rows)
            {
                if (row.time && row.values[0] && *row.time >= ctx.instant && *row.time <= until)
                {
                    weather.kp_forecast_max = std::max(weather.kp_forecast_max.value_or(0.0), *row.values[0]);
                }
            }
        }
        else
        {
            SKB_CORE_WARN("space_weather: Kp forecast product is not a table, ignored");
        }
    }

    if (plasma)
    {
        if (const auto rows = read_table(*plasma, {"density", "speed", "temperature"}))
        {
            const auto last = std::find_if(rows->rbegin(), rows->rend(),
                                           [](const Row& r) { return r.values[1].has_value(); });
            if (last != rows->rend())
            {
                weather.solar_wind = SolarWind{
                    .speed_km_s    = last->values[1],
                    .density_p_cm3 = last->values[0],
                    .temperature_k = last->values[2],
                };
            }
        }
        else
        {
            SKB_CORE_WARN("space_weather: plasma product is not a table, ignored");
        }
    }

    weather.aurora_latitude_deg = aurora_latitude(weather.kp_24h_max());
    weather.aurora_visible = std::abs(ctx.location.latitude_deg) >= weather.aurora_latitude_deg;
    return weather;
}

LiveOutcome<SpaceWeather> SpaceWeatherCalculator::compute_live(const CalculationContext& ctx,
                                                               SourceFetcher& fetcher) const
{
    auto kp_doc = fetcher.get_json(product_url(settings().url, kKpProduct));
    if (auto* failure = std::get_if<SourceFailure>(&kp_doc))
    {
        return std::move(*failure);
    }

    // Optional products: a failure leaves their fields empty
    const auto optional_product = [&](std::string_view product) -> std::optional<nlohmann::json>
    {
        if (fetcher.stop_requested())
        {
            return std::nullopt;
        }
        auto doc = fetcher.get_json(product_url(settings().url, product));
        if (auto* failure = std::get_if<SourceFailure>(&doc))
        {
            SKB_CORE_WARN("space_weather: {} unavailable ({}): {}", product, to_string(failure->kind), failure->detail);
            return std::nullopt;
        }
        return std::get<nlohmann::json>(std::move(doc));
    };

    const auto forecast = optional_product(kForecastProduct);
    const auto plasma = optional_product(kPlasmaProduct);

    return from_products(std::get<nlohmann::json>(kp_doc),
                         forecast ? &*forecast : nullptr,
                         plasma ? &*plasma : nullptr,
                         ctx);
}

} // namespace skybrief::sources

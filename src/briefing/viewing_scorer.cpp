/// @file viewing_scorer.cpp
/// @brief Implementation of the viewing conditions score.

#include "briefing/viewing_scorer.hpp"

#include "astro/lunar.hpp"

#include <algorithm>
#include <cmath>

namespace skybrief::briefing
{

namespace
{
    constexpr f64 kAuroraBaseLatitude = 67.0;
    constexpr f64 kAuroraDegPerKp     = 3.0;
    constexpr f64 kAuroraHeadroomShare = 0.5;

    std::vector<std::string> recommendations_for(const ScoringInputs& in)
    {
        std::vector<std::string> out;

        if (in.cloud_cover_pct)
        {
            const f64 cloud = *in.cloud_cover_pct;
            if (cloud > 75.0)
            {
                out.emplace_back("Heavy cloud cover, wait for clearer skies");
            }
            else if (cloud > 50.0)
            {
                out.emplace_back("Significant clouds, viewing may be intermittent");
            }
            else if (cloud > 25.0)
            {
                out.emplace_back("Some clouds, find gaps for observing");
            }
        }

        if (in.moon_illumination)
        {
            const f64 illum_pct = *in.moon_illumination * 100.0;
            if (illum_pct > 80.0 && in.moon_up())
            {
                out.emplace_back("Bright moon, best for planets and the Moon itself");
            }
            else if (illum_pct > 50.0 && in.moon_up())
            {
                out.emplace_back("Moon is up, deep sky objects may be washed out");
            }
            else if (illum_pct < 20.0)
            {
                out.emplace_back("Dark moon, great for galaxies and nebulae");
            }
        }

        if (in.darkness && *in.darkness != sources::TwilightStage::Night)
        {
            out.emplace_back("Not fully dark, brighter objects only");
        }

        if (in.cloud_cover_pct && *in.cloud_cover_pct < 20.0
            && in.moon_illumination && *in.moon_illumination < 0.3)
        {
            out.emplace_back("Excellent for deep sky observing");
        }
        return out;
    }

} // namespace

std::string_view to_string(ScoreCategory category)
{
    switch (category)
    {
        case ScoreCategory::Poor:      return "Poor";
        case ScoreCategory::Fair:      return "Fair";
        case ScoreCategory::Good:      return "Good";
        case ScoreCategory::Excellent: return "Excellent";
    }
    return "Unknown";
}

std::string_view to_string(ScoreFactor factor)
{
    switch (factor)
    {
        case ScoreFactor::CloudCover:     return "cloud_cover";
        case ScoreFactor::Moon:           return "moon";
        case ScoreFactor::LightPollution: return "light_pollution";
        case ScoreFactor::Baseline:       return "baseline";
        case ScoreFactor::Darkness:       return "darkness";
        case ScoreFactor::Aurora:         return "aurora";
    }
    return "unknown";
}

bool ScoringInputs::moon_up() const
{
    return !moon_altitude_deg || *moon_altitude_deg > astro::Lunar::kHorizonDeg;
}

ScoringInputs ScoringInputs::from_results(const SourceResults& results,
                                          const sources::GeoLocation& location,
                                          const astro::Instant& instant,
                                          std::optional<i32> bortle)
{
    ScoringInputs in;
    in.bortle = bortle;
    in.latitude_deg = location.latitude_deg;

    if (const auto* weather = results.weather.get())
    {
        in.cloud_cover_pct = weather->cloud_for_scoring();
    }
    if (const auto* moon = results.moon.get())
    {
        in.moon_illumination = moon->illumination;
        in.moon_altitude_deg = moon->altitude_deg;
    }
    if (const auto* sun = results.sun.get())
    {
        in.darkness = sources::classify(*sun, instant);
    }
    if (const auto* space = results.space_weather.get())
    {
        in.kp = space->kp;
    }
    return in;
}

const FactorContribution* ViewingConditionsScore::find(ScoreFactor factor) const
{
    const auto it = std::find_if(breakdown.begin(), breakdown.end(),
                                 [factor](const FactorContribution& f) { return f.factor == factor; });
    return it == breakdown.end() ? nullptr : &*it;
}

// -----------------------------------------------------------------
// ViewingScorer
// -----------------------------------------------------------------

ScoreCategory ViewingScorer::categorize(i32 total)
{
    if (total >= kExcellentMin) return ScoreCategory::Excellent;
    if (total >= kGoodMin)      return ScoreCategory::Good;
    if (total >= kFairMin)      return ScoreCategory::Fair;
    return ScoreCategory::Poor;
}

f64 ViewingScorer::darkness_multiplier(sources::TwilightStage stage)
{
    switch (stage)
    {
        case sources::TwilightStage::Night:        return 1.0;
        case sources::TwilightStage::Astronomical: return 0.85;
        case sources::TwilightStage::Nautical:     return 0.6;
        case sources::TwilightStage::Civil:        return 0.35;
        case sources::TwilightStage::Day:          return 0.1;
    }
    return 1.0;
}

f64 ViewingScorer::aurora_strength(f64 kp, f64 latitude_deg)
{
    const f64 kp_needed = (kAuroraBaseLatitude - std::abs(latitude_deg)) / kAuroraDegPerKp;
    return std::clamp((kp - kp_needed + 1.0) / 3.0, 0.0, 1.0);
}

std::optional<ViewingConditionsScore> ViewingScorer::score(const ScoringInputs& in)
{
    struct Weighted
    {
        ScoreFactor factor;
        f64         sub;
        f64         weight;
    };

    std::vector<Weighted> weighted;
    if (in.cloud_cover_pct)
    {
        weighted.push_back({ScoreFactor::CloudCover, 100.0 - std::clamp(*in.cloud_cover_pct, 0.0, 100.0), kCloudWeight});
    }
    if (in.moon_illumination)
    {
        const f64 illum = std::clamp(*in.moon_illumination, 0.0, 1.0);
        const f64 sub = in.moon_up() ? 100.0 * (1.0 - std::pow(illum, kMoonExponent)) : 100.0;
        weighted.push_back({ScoreFactor::Moon, sub, kMoonWeight});
    }
    if (in.bortle)
    {
        const f64 bortle = std::clamp(static_cast<f64>(*in.bortle), 1.0, 9.0);
        weighted.push_back({ScoreFactor::LightPollution, 100.0 * (9.0 - bortle) / 8.0, kLightPollutionWeight});
    }

    if (weighted.empty() && !in.darkness && !in.kp)
    {
        return std::nullopt;
    }

    ViewingConditionsScore result{
        .total           = 0,
        .category        = ScoreCategory::Poor,
        .raw             = 0.0,
        .breakdown       = {},
        .recommendations = recommendations_for(in),
    };

    // Weighted base, renormalized over the factors present
    f64 base = 0.0;
    if (weighted.empty())
    {
        base = kNeutralBase;
        result.breakdown.push_back({ScoreFactor::Baseline, kNeutralBase, 0.0, 0.0, kNeutralBase});
    }
    else
    {
        f64 weight_sum = 0.0;
        for (const auto& w : weighted)
        {
            weight_sum += w.weight;
        }
        for (const auto& w : weighted)
        {
            const f64 share = w.weight / weight_sum;
            base += w.sub * share;
            result.breakdown.push_back({w.factor, w.sub, w.weight, share, w.sub * share});
        }
    }

    const f64 multiplier = in.darkness ? darkness_multiplier(*in.darkness) : 1.0;
    const f64 dimmed = base * multiplier;
    if (in.darkness)
    {
        result.breakdown.push_back({ScoreFactor::Darkness, multiplier * 100.0, 0.0, 0.0, dimmed - base});
    }

    f64 bonus = 0.0;
    if (in.kp)
    {
        const f64 strength = aurora_strength(*in.kp, in.latitude_deg);
        bonus = (100.0 - dimmed) * kAuroraHeadroomShare * strength * multiplier;
        result.breakdown.push_back({ScoreFactor::Aurora, strength * 100.0, 0.0, 0.0, bonus});
    }

    result.raw = dimmed + bonus;
    result.total = static_cast<i32>(std::lround(std::clamp(result.raw, 0.0, 100.0)));
    result.category = categorize(result.total);
    return result;
}

} // namespace skybrief::briefing

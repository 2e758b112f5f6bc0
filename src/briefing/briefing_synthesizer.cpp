/// @file briefing_synthesizer.cpp
/// @brief Narrative templates and the tonight projection.

#include "briefing/briefing_synthesizer.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <cmath>
#include <string_view>
#include <utility>

namespace skybrief::briefing
{

namespace
{
    using Sentences = std::vector<std::string>;

    constexpr std::string_view kNothingAvailable = "Sky data is currently unavailable. Please check back later.";

    constexpr std::array<std::string_view, 7> kWeekdays{
        "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};
    constexpr std::array<std::string_view, 12> kMonths{
        "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December"};

    std::string month_day_text(const std::chrono::year_month_day& date)
    {
        return fmt::format("{} {}", kMonths[static_cast<unsigned>(date.month()) - 1], static_cast<unsigned>(date.day()));
    }

    std::string long_date(const std::chrono::year_month_day& date)
    {
        const std::chrono::weekday weekday{std::chrono::sys_days{date}};
        return fmt::format("{}, {}, {}", kWeekdays[weekday.c_encoding()], month_day_text(date),
                           static_cast<i32>(date.year()));
    }

    std::string hours_minutes(std::chrono::seconds span)
    {
        const auto total_min = std::chrono::duration_cast<std::chrono::minutes>(span).count();
        return fmt::format("{}h {}m", total_min / 60, total_min % 60);
    }

    std::string lower_first(std::string_view text)
    {
        std::string out{text};
        if (!out.empty())
        {
            out.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(out.front())));
        }
        return out;
    }

    std::string upper_first(std::string text)
    {
        if (!text.empty())
        {
            text.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(text.front())));
        }
        return text;
    }

    std::string join(const Sentences& sentences)
    {
        std::string out;
        for (const auto& s : sentences)
        {
            if (!out.empty())
            {
                out += ' ';
            }
            out += s;
        }
        return out;
    }

    std::string plural(i64 n, std::string_view unit)
    {
        return fmt::format("{} {}{}", n, unit, n == 1 ? "" : "s");
    }

    // -----------------------------------------------------------------
    // Per-domain sentences
    // -----------------------------------------------------------------

    void sun_sentences(const sources::SunTimes& sun, Sentences& out)
    {
        const auto rise = astro::instant_of(sun.sunrise);
        const auto set = astro::instant_of(sun.sunset);

        if (rise && set)
        {
            out.push_back(fmt::format("Sunrise at {}, sunset at {} ({} of daylight).",
                                      rise->to_local_hhmm(), set->to_local_hhmm(), hours_minutes(sun.day_length)));
        }
        else if (!rise && !set)
        {
            const auto reason = std::get<astro::NoEvent>(sun.sunrise).reason;
            if (reason == astro::NoEventReason::AlwaysAbove)
            {
                out.emplace_back("The Sun stays above the horizon all day.");
            }
            else if (reason == astro::NoEventReason::AlwaysBelow)
            {
                out.emplace_back("The Sun stays below the horizon all day.");
            }
        }
        else if (rise)
        {
            out.push_back(fmt::format("Sunrise at {}.", rise->to_local_hhmm()));
        }
        else
        {
            out.push_back(fmt::format("Sunset at {}.", set->to_local_hhmm()));
        }

        const auto dark = sources::dark_sky_window(sun);
        if (!dark)
        {
            out.emplace_back("The sky does not get fully dark tonight.");
        }
        else if (astro::occurs(sun.astronomical_dusk))
        {
            out.push_back(fmt::format("Astronomical darkness runs from {} to {}.",
                                      dark->begins.to_local_hhmm(), dark->ends.to_local_hhmm()));
        }
        else
        {
            out.emplace_back("The sky stays fully dark around the clock.");
        }
    }

    std::string moon_phase_sentence(const sources::MoonState& moon)
    {
        return fmt::format("The moon phase is {} ({}% illuminated).",
                           astro::Lunar::phase_name(moon.phase), std::lround(moon.illumination * 100.0));
    }

    void moon_sentences(const sources::MoonState& moon, Sentences& out)
    {
        out.push_back(moon_phase_sentence(moon));

        const auto rise = astro::instant_of(moon.rise);
        const auto set = astro::instant_of(moon.set);
        if (rise && set)
        {
            out.push_back(fmt::format("Moonrise at {} and moonset at {}.", rise->to_local_hhmm(), set->to_local_hhmm()));
            return;
        }
        if (rise)
        {
            out.push_back(fmt::format("Moonrise at {}.", rise->to_local_hhmm()));
            return;
        }
        if (set)
        {
            out.push_back(fmt::format("Moonset at {}.", set->to_local_hhmm()));
            return;
        }

        const auto reason = std::get<astro::NoEvent>(moon.rise).reason;
        if (reason == astro::NoEventReason::AlwaysAbove)
        {
            out.emplace_back("The Moon stays above the horizon all day.");
        }
        else if (reason == astro::NoEventReason::AlwaysBelow)
        {
            out.emplace_back("The Moon does not rise today.");
        }
    }

    void eclipse_sentences(const sources::EclipseOutlook& eclipses, std::chrono::minutes offset, Sentences& out)
    {
        for (const auto& sighting : eclipses.today)
        {
            const auto& event = sighting.event;
            const std::string_view body = event.is_solar() ? "Sun" : "Moon";
            out.push_back(fmt::format("{} today, greatest at {}, visible from {}.",
                                      calendar::display_name(event.kind),
                                      event.maximum.with_offset(offset).to_local_hhmm(),
                                      event.region_text()));
            if (sighting.above_horizon_at_maximum)
            {
                out.push_back(fmt::format("The {} is above your horizon at that time.", body));
            }
            else
            {
                out.push_back(fmt::format("The {} is below your horizon at that time.", body));
            }
        }

        if (eclipses.today.empty() && !eclipses.upcoming.empty())
        {
            const auto& next = eclipses.upcoming.front();
            if (next.days_until <= BriefingSynthesizer::kEclipseMentionDays)
            {
                out.push_back(fmt::format("A {} is coming up on {}, {} from now.",
                                          lower_first(calendar::display_name(next.event.kind)),
                                          month_day_text(next.event.date),
                                          plural(next.days_until, "day")));
            }
        }
    }

    void planet_sentences(const sources::PlanetReport& report, Sentences& out)
    {
        const auto visible = report.visible();
        if (visible.empty())
        {
            out.emplace_back("No planets are well placed for viewing tonight.");
            return;
        }

        std::vector<std::string> names;
        for (const auto& p : visible)
        {
            names.emplace_back(p.name());
        }
        out.push_back(fmt::format("{} {} visible tonight.",
                                  BriefingSynthesizer::join_names(names), names.size() == 1 ? "is" : "are"));

        // Report is brightest first
        const auto& brightest = visible.front();
        if (visible.size() > 1)
        {
            out.push_back(fmt::format("{} is the brightest, {}.", brightest.name(), lower_first(brightest.hint)));
        }
        else
        {
            out.push_back(fmt::format("{}.", brightest.hint));
        }
    }

    std::string shower_peak_text(const sources::ShowerActivity& activity)
    {
        if (activity.days_to_peak == 0)
        {
            return fmt::format("peaking tonight with up to {} meteors per hour", activity.shower.zhr);
        }
        if (activity.days_to_peak > 0)
        {
            return fmt::format("peaking in {}", plural(activity.days_to_peak, "day"));
        }
        return "past its peak";
    }

    void meteor_sentences(const sources::MeteorOutlook& meteors, Sentences& out)
    {
        if (meteors.active.empty())
        {
            return;
        }

        if (meteors.active.size() == 1)
        {
            const auto& only = meteors.active.front();
            out.push_back(fmt::format("The {} meteor shower is active, {}.", only.shower.name, shower_peak_text(only)));
            return;
        }

        std::vector<std::string> names;
        for (const auto& a : meteors.active)
        {
            names.push_back(a.shower.name);
        }
        const auto& strongest = meteors.active.front();
        out.push_back(fmt::format("The {} meteor showers are active.", BriefingSynthesizer::join_names(names)));
        out.push_back(fmt::format("The {} are the strongest, {}.", strongest.shower.name, shower_peak_text(strongest)));
    }

    void space_weather_sentences(const sources::SpaceWeather& space, Sentences& out)
    {
        if (space.kp >= BriefingSynthesizer::kStormKp)
        {
            out.push_back(fmt::format("A geomagnetic {} is in progress (Kp {:.1f}).", describe(space.level), space.kp));
            if (space.aurora_visible)
            {
                out.emplace_back("Aurora may be visible from your location.");
            }
            else
            {
                out.push_back(fmt::format("Aurora may be visible at latitudes above about {:.0f} degrees.",
                                          space.aurora_latitude_deg));
            }
        }
        else if (space.kp >= BriefingSynthesizer::kNotableKp)
        {
            out.push_back(fmt::format("Geomagnetic activity is elevated (Kp {:.1f}), aurora possible at high latitudes.",
                                      space.kp));
        }
        else if (space.kp_forecast_max && *space.kp_forecast_max >= BriefingSynthesizer::kStormKp)
        {
            out.push_back(fmt::format("A geomagnetic storm is forecast within 24 hours (Kp up to {:.1f}).",
                                      *space.kp_forecast_max));
        }
    }

    void viewing_sentences(const ViewingConditionsScore& score, const sources::WeatherState* weather, Sentences& out)
    {
        out.push_back(fmt::format("Viewing conditions are {} ({}/100).",
                                  lower_first(to_string(score.category)), score.total));

        const auto cloud = weather ? weather->cloud_for_scoring() : std::nullopt;
        if (cloud && *cloud >= 75.0)
        {
            out.emplace_back("Heavy cloud cover is expected.");
        }
        else if (cloud && *cloud >= 50.0)
        {
            out.emplace_back("Clouds may interrupt viewing.");
        }
    }

    void caveat_sentence(const ProvenanceSummary& provenance, Sentences& out)
    {
        const auto missing = provenance.unavailable();
        if (missing.empty())
        {
            return;
        }
        std::vector<std::string> names;
        for (const auto domain : missing)
        {
            names.emplace_back(sources::display_name(domain));
        }
        out.push_back(fmt::format("{} data {} currently unavailable.",
                                  upper_first(BriefingSynthesizer::join_names(names)),
                                  names.size() == 1 ? "is" : "are"));
    }

} // namespace

// -----------------------------------------------------------------
// DailyBriefing
// -----------------------------------------------------------------

DailyBriefing::DailyBriefing(OrchestratorResult run,
                             std::optional<ViewingConditionsScore> score,
                             std::string narrative)
    : m_run(std::move(run))
    , m_score(std::move(score))
    , m_narrative(std::move(narrative))
{
}

// -----------------------------------------------------------------
// BriefingSynthesizer
// -----------------------------------------------------------------

std::string BriefingSynthesizer::join_names(const std::vector<std::string>& names)
{
    std::string text;
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
        {
            text += (i + 1 == names.size()) ? " and " : ", ";
        }
        text += names[i];
    }
    return text;
}

std::string BriefingSynthesizer::narrate(const OrchestratorResult& run,
                                         const std::optional<ViewingConditionsScore>& score)
{
    if (run.provenance.all_unavailable())
    {
        return std::string{kNothingAvailable};
    }

    const auto& r = run.results;
    Sentences out;
    out.push_back(fmt::format("Sky briefing for {}.", long_date(run.instant.local_date())));

    if (const auto* sun = r.sun.get())
    {
        sun_sentences(*sun, out);
    }
    if (const auto* moon = r.moon.get())
    {
        moon_sentences(*moon, out);
    }
    if (const auto* eclipses = r.eclipses.get())
    {
        eclipse_sentences(*eclipses, run.instant.utc_offset(), out);
    }
    if (const auto* planets = r.planets.get())
    {
        planet_sentences(*planets, out);
    }
    if (const auto* meteors = r.meteor_showers.get())
    {
        meteor_sentences(*meteors, out);
    }
    if (const auto* space = r.space_weather.get())
    {
        space_weather_sentences(*space, out);
    }
    if (score)
    {
        viewing_sentences(*score, r.weather.get(), out);
    }
    caveat_sentence(run.provenance, out);

    return join(out);
}

std::string BriefingSynthesizer::narrate_tonight(const TonightSummary& summary)
{
    Sentences out;

    if (summary.moon)
    {
        out.push_back(moon_phase_sentence(*summary.moon));
    }
    if (summary.dark_window)
    {
        out.push_back(fmt::format("Darkness from {} to {}, best viewing around {}.",
                                  summary.dark_window->begins.to_local_hhmm(),
                                  summary.dark_window->ends.to_local_hhmm(),
                                  summary.dark_window->best_time().to_local_hhmm()));
    }
    if (!summary.visible_planets.empty())
    {
        std::vector<std::string> names;
        for (const auto& p : summary.visible_planets)
        {
            names.emplace_back(p.name());
        }
        out.push_back(fmt::format("{} {} visible.", join_names(names), names.size() == 1 ? "is" : "are"));
    }
    if (!summary.active_showers.empty())
    {
        std::vector<std::string> names;
        for (const auto& a : summary.active_showers)
        {
            names.push_back(a.shower.name);
        }
        out.push_back(fmt::format("The {} meteor shower{} active.", join_names(names),
                                  names.size() == 1 ? " is" : "s are"));
    }
    if (summary.aurora_visible.value_or(false))
    {
        out.emplace_back("Aurora may be visible from your location.");
    }
    if (summary.score)
    {
        out.push_back(fmt::format("Viewing conditions are {} ({}/100).",
                                  lower_first(to_string(summary.score->category)), summary.score->total));
    }

    if (out.empty())
    {
        return std::string{kNothingAvailable};
    }
    return join(out);
}

DailyBriefing BriefingSynthesizer::synthesize(OrchestratorResult run, std::optional<i32> bortle)
{
    const auto inputs = ScoringInputs::from_results(run.results, run.location, run.instant, bortle);
    auto score = ViewingScorer::score(inputs);
    auto narrative = narrate(run, score);
    return DailyBriefing{std::move(run), std::move(score), std::move(narrative)};
}

TonightSummary BriefingSynthesizer::tonight(const DailyBriefing& briefing)
{
    const auto& r = briefing.results();

    TonightSummary summary{
        .instant         = briefing.instant(),
        .moon            = std::nullopt,
        .dark_window     = std::nullopt,
        .visible_planets = {},
        .active_showers  = {},
        .kp              = std::nullopt,
        .aurora_visible  = std::nullopt,
        .score           = briefing.score(),
        .narrative       = {},
    };

    if (const auto* moon = r.moon.get())
    {
        summary.moon = *moon;
    }
    if (const auto* sun = r.sun.get())
    {
        summary.dark_window = sources::dark_sky_window(*sun);
    }
    if (const auto* planets = r.planets.get())
    {
        summary.visible_planets = planets->visible();
    }
    if (const auto* meteors = r.meteor_showers.get())
    {
        summary.active_showers = meteors->active;
    }
    if (const auto* space = r.space_weather.get())
    {
        summary.kp = space->kp;
        summary.aurora_visible = space->aurora_visible;
    }

    summary.narrative = narrate_tonight(summary);
    return summary;
}

} // namespace skybrief::briefing

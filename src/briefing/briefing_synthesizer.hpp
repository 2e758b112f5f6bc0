#pragma once

/// @file briefing_synthesizer.hpp
/// @brief Assembles the daily briefing and its spoken-style narrative.

#include "briefing/source_orchestrator.hpp"
#include "briefing/viewing_scorer.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace skybrief::briefing
{
    /// @brief Everything known about the sky for one (location, instant).
    /// Immutable: a refresh produces a new briefing.
    class DailyBriefing
    {
    public:
        DailyBriefing(OrchestratorResult run,
                      std::optional<ViewingConditionsScore> score,
                      std::string narrative);

        [[nodiscard]] const sources::GeoLocation& location() const { return m_run.location; }
        [[nodiscard]] const astro::Instant& instant() const { return m_run.instant; }
        [[nodiscard]] const SourceResults& results() const { return m_run.results; }
        [[nodiscard]] const ProvenanceSummary& provenance() const { return m_run.provenance; }
        [[nodiscard]] std::chrono::milliseconds elapsed() const { return m_run.elapsed; }

        /// @brief std::nullopt when no scoring input was available.
        [[nodiscard]] const std::optional<ViewingConditionsScore>& score() const { return m_score; }

        [[nodiscard]] const std::string& narrative() const { return m_narrative; }

    private:
        OrchestratorResult                    m_run;
        std::optional<ViewingConditionsScore> m_score;
        std::string                           m_narrative;
    };

    /// @brief The "is it worth going out tonight" projection of a briefing.
    struct TonightSummary
    {
        astro::Instant                          instant;
        std::optional<sources::MoonState>       moon;
        std::optional<sources::DarkSkyWindow>   dark_window;
        std::vector<sources::PlanetVisibility>  visible_planets;
        std::vector<sources::ShowerActivity>    active_showers;
        std::optional<f64>                      kp;
        std::optional<bool>                     aurora_visible;
        std::optional<ViewingConditionsScore>   score;
        std::string                             narrative;
    };

    /// @brief Stateless transform of an orchestrator run into a briefing.
    class BriefingSynthesizer
    {
    public:
        BriefingSynthesizer() = delete;

        /// @brief Kp at or above this gets a space-weather sentence.
        static constexpr f64 kNotableKp = 4.0;
        static constexpr f64 kStormKp   = 5.0;

        /// @brief Upcoming eclipses closer than this are mentioned.
        static constexpr i32 kEclipseMentionDays = 30;

        [[nodiscard]] static DailyBriefing synthesize(OrchestratorResult run, std::optional<i32> bortle = std::nullopt);

        [[nodiscard]] static TonightSummary tonight(const DailyBriefing& briefing);

        /// @brief Full narrative: date, sun, moon, eclipses, planets, meteor
        /// showers, space weather, viewing conditions, then one caveat naming
        /// the unavailable domains.
        [[nodiscard]] static std::string narrate(const OrchestratorResult& run,
                                                 const std::optional<ViewingConditionsScore>& score);

        [[nodiscard]] static std::string narrate_tonight(const TonightSummary& summary);

        /// @brief "A", "A and B", "A, B and C".
        [[nodiscard]] static std::string join_names(const std::vector<std::string>& names);
    };

} // namespace skybrief::briefing

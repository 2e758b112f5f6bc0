#pragma once

/// @file viewing_scorer.hpp
/// @brief Fuses cloud, moon, darkness, light pollution and Kp into a 0-100 rating.

#include "briefing/source_orchestrator.hpp"
#include "sources/sun_calculator.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skybrief::briefing
{
    enum class ScoreCategory : u8
    {
        Poor,        ///< 0-39
        Fair,        ///< 40-59
        Good,        ///< 60-79
        Excellent,   ///< 80-100
    };

    [[nodiscard]] std::string_view to_string(ScoreCategory category);

    enum class ScoreFactor : u8
    {
        CloudCover,
        Moon,
        LightPollution,
        Baseline,        ///< Neutral 50 when no weighted factor is present
        Darkness,
        Aurora,
    };

    [[nodiscard]] std::string_view to_string(ScoreFactor factor);

    /// @brief What the scorer reads. Every field is optional; absent ones
    /// drop out of the rating.
    struct ScoringInputs
    {
        std::optional<f64>                    cloud_cover_pct;
        std::optional<f64>                    moon_illumination;    ///< [0, 1]
        std::optional<f64>                    moon_altitude_deg;    ///< Absent: treat the Moon as up
        std::optional<sources::TwilightStage> darkness;
        std::optional<f64>                    kp;
        std::optional<i32>                    bortle;               ///< 1 (pristine) .. 9 (inner city)
        f64                                   latitude_deg = 0.0;

        /// @brief Pull the inputs out of one orchestrator run.
        [[nodiscard]] static ScoringInputs from_results(const SourceResults& results,
                                                        const sources::GeoLocation& location,
                                                        const astro::Instant& instant,
                                                        std::optional<i32> bortle);

        [[nodiscard]] bool moon_up() const;
    };

    /// @brief One line of the breakdown. Contributions sum to the unrounded score.
    struct FactorContribution
    {
        ScoreFactor factor;
        f64         sub_score;          ///< 0-100; the multiplier ×100 for darkness
        f64         weight;             ///< Nominal weight, 0 for non-weighted factors
        f64         normalized_weight;  ///< Weight share among the present factors
        f64         contribution;
    };

    struct ViewingConditionsScore
    {
        i32                             total;          ///< Rounded, clamped to [0, 100]
        ScoreCategory                   category;
        f64                             raw;            ///< Sum of the contributions
        std::vector<FactorContribution> breakdown;
        std::vector<std::string>        recommendations;

        [[nodiscard]] const FactorContribution* find(ScoreFactor factor) const;
    };

    class ViewingScorer
    {
    public:
        ViewingScorer() = delete;

        static constexpr f64 kCloudWeight          = 50.0;
        static constexpr f64 kMoonWeight           = 30.0;
        static constexpr f64 kLightPollutionWeight = 20.0;
        static constexpr f64 kNeutralBase          = 50.0;
        static constexpr f64 kMoonExponent         = 0.7;

        static constexpr i32 kFairMin      = 40;
        static constexpr i32 kGoodMin      = 60;
        static constexpr i32 kExcellentMin = 80;

        /// @return std::nullopt (UNAVAILABLE) iff no input is present.
        [[nodiscard]] static std::optional<ViewingConditionsScore> score(const ScoringInputs& inputs);

        [[nodiscard]] static ScoreCategory categorize(i32 total);

        /// @brief Night 1.0, Astronomical 0.85, Nautical 0.6, Civil 0.35, Day 0.1.
        [[nodiscard]] static f64 darkness_multiplier(sources::TwilightStage stage);

        /// @brief 0 (Kp too low for this latitude) .. 1 (well above the threshold).
        [[nodiscard]] static f64 aurora_strength(f64 kp, f64 latitude_deg);
    };

} // namespace skybrief::briefing

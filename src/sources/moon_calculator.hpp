#pragma once

/// @file moon_calculator.hpp
/// @brief Moon phase, illumination and rise/set for the observer's day.

#include "astro/event_time.hpp"
#include "astro/lunar.hpp"
#include "sources/calculator.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace skybrief::sources
{
    struct MoonState
    {
        astro::MoonPhase phase;
        f64              illumination;      ///< [0, 1]
        f64              age_days;
        f64              phase_angle_deg;
        f64              altitude_deg;      ///< At the calculation instant
        astro::EventTime rise;
        astro::EventTime set;
        std::vector<astro::PhaseEvent> upcoming;    ///< Principal phases in the next 30 days

        [[nodiscard]] bool is_up() const { return altitude_deg > astro::Lunar::kHorizonDeg; }
    };

    /// @brief Live: USNO one-day rise/set/transit service. Local: synodic phase
    /// model plus low-precision position for rise/set.
    class MoonCalculator final : public Calculator<MoonState>
    {
    public:
        static constexpr std::chrono::days kUpcomingWindow{30};

        MoonCalculator(std::shared_ptr<net::JsonFetcher> fetcher, core::SourceSettings settings);

        [[nodiscard]] Domain domain() const override { return Domain::Moon; }
        [[nodiscard]] bool has_live_source() const override { return true; }
        [[nodiscard]] bool has_local_algorithm() const override { return true; }

        /// @brief Parse a USNO oneday payload for @p ctx's local date.
        [[nodiscard]] static LiveOutcome<MoonState> parse_usno(const nlohmann::json& doc,
                                                               const CalculationContext& ctx);

        /// @brief "Waxing Gibbous", "Full Moon", ... → phase.
        [[nodiscard]] static std::optional<astro::MoonPhase> parse_phase_name(std::string_view name);

    protected:
        [[nodiscard]] LiveOutcome<MoonState> compute_live(const CalculationContext& ctx,
                                                          SourceFetcher& fetcher) const override;
        [[nodiscard]] std::optional<MoonState> compute_local(const CalculationContext& ctx) const override;
    };

} // namespace skybrief::sources

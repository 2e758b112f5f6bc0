#pragma once

/// @file planet_calculator.hpp
/// @brief Naked-eye visibility of the seven planets for the coming night.

#include "astro/event_time.hpp"
#include "astro/planets.hpp"
#include "sources/calculator.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skybrief::sources
{
    enum class SkyWindow : u8
    {
        Evening,
        Morning,
        AllNight,
        NotVisible,
    };

    [[nodiscard]] std::string_view to_string(SkyWindow window);

    struct PlanetVisibility
    {
        astro::Planet                 planet;
        bool                          visible;
        astro::EventTime              rise;
        astro::EventTime              set;
        f64                           magnitude;
        f64                           elongation_deg;
        f64                           altitude_deg;     ///< At the calculation instant
        f64                           distance_au;
        SkyWindow                     window;
        std::optional<astro::Instant> best_time;        ///< Highest dark-sky sample
        std::string                   hint;

        [[nodiscard]] std::string_view name() const { return astro::Planets::name(planet); }

        /// @brief "very bright", "bright", "moderate" or "dim".
        [[nodiscard]] std::string_view brightness() const;
    };

    /// @brief All seven planets, brightest first.
    struct PlanetReport
    {
        std::vector<PlanetVisibility> planets;

        [[nodiscard]] std::vector<PlanetVisibility> visible() const;
        [[nodiscard]] const PlanetVisibility* find(astro::Planet planet) const;
    };

    /// @brief Live: a visible-planets JSON service listing bodies above the
    /// horizon now. Local: mean-element positions sampled across the night.
    class PlanetCalculator final : public Calculator<PlanetReport>
    {
    public:
        static constexpr f64 kNakedEyeLimitMag    = 6.0;
        static constexpr f64 kMinElongationDeg    = 10.0;
        static constexpr f64 kMinAltitudeDeg      = 10.0;
        static constexpr f64 kDarkSunAltitudeDeg  = -6.0;
        static constexpr f64 kHorizonDeg          = -0.5667;  // Refraction at the horizon
        static constexpr f64 kAllNightFraction    = 0.9;

        PlanetCalculator(std::shared_ptr<net::JsonFetcher> fetcher, core::SourceSettings settings);

        [[nodiscard]] Domain domain() const override { return Domain::Planets; }
        [[nodiscard]] bool has_live_source() const override { return true; }
        [[nodiscard]] bool has_local_algorithm() const override { return true; }

        /// @brief Local report with magnitudes optionally overridden per planet.
        [[nodiscard]] static PlanetReport build_report(
            const CalculationContext& ctx,
            const std::vector<std::pair<astro::Planet, f64>>& magnitude_overrides = {});

        [[nodiscard]] static LiveOutcome<PlanetReport> parse_visible_planets(const nlohmann::json& doc,
                                                                             const CalculationContext& ctx);

    protected:
        [[nodiscard]] LiveOutcome<PlanetReport> compute_live(const CalculationContext& ctx,
                                                             SourceFetcher& fetcher) const override;
        [[nodiscard]] std::optional<PlanetReport> compute_local(const CalculationContext& ctx) const override;
    };

} // namespace skybrief::sources

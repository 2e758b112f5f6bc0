#pragma once

/// @file space_weather_calculator.hpp
/// @brief Geomagnetic activity, solar wind and aurora visibility from NOAA SWPC.

#include "astro/instant.hpp"
#include "sources/calculator.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace skybrief::sources
{
    /// @brief NOAA scale by Kp: Quiet < 2, Unsettled < 4, Active < 5, then
    /// G1 (5) .. G5 (9) storms.
    enum class GeomagneticLevel : u8
    {
        Quiet,
        Unsettled,
        Active,
        MinorStorm,      ///< G1
        ModerateStorm,   ///< G2
        StrongStorm,     ///< G3
        SevereStorm,     ///< G4
        ExtremeStorm,    ///< G5
    };

    [[nodiscard]] std::string_view to_string(GeomagneticLevel level);

    /// @brief "minor storm", "quiet", ... for prose.
    [[nodiscard]] std::string_view describe(GeomagneticLevel level);

    struct SolarWind
    {
        std::optional<f64> speed_km_s;
        std::optional<f64> density_p_cm3;
        std::optional<f64> temperature_k;

        /// @brief Speed above 500 km/s or density above 10 p/cm³.
        [[nodiscard]] bool elevated() const;
    };

    struct SpaceWeather
    {
        f64                       kp;                ///< Latest observed planetary Kp
        astro::Instant            observed_at;
        std::optional<f64>        kp_forecast_max;   ///< Highest forecast Kp in the next 24 h
        GeomagneticLevel          level;
        std::optional<SolarWind>  solar_wind;
        f64                       aurora_latitude_deg;
        bool                      aurora_visible;

        /// @brief max(kp, kp_forecast_max).
        [[nodiscard]] f64 kp_24h_max() const;
    };

    /// @brief Live only. The planetary Kp product is mandatory; the Kp
    /// forecast and the 7-day plasma product only add detail.
    class SpaceWeatherCalculator final : public Calculator<SpaceWeather>
    {
    public:
        static constexpr std::string_view kKpProduct       = "noaa-planetary-k-index.json";
        static constexpr std::string_view kForecastProduct = "noaa-planetary-k-index-forecast.json";
        static constexpr std::string_view kPlasmaProduct   = "solar-wind/plasma-7-day.json";

        SpaceWeatherCalculator(std::shared_ptr<net::JsonFetcher> fetcher, core::SourceSettings settings);

        [[nodiscard]] Domain domain() const override { return Domain::SpaceWeather; }
        [[nodiscard]] bool has_live_source() const override { return true; }

        [[nodiscard]] static GeomagneticLevel level_for(f64 kp);

        /// @brief Lowest geomagnetic latitude where aurora may be overhead:
        /// max(40, 67 - 3·Kp).
        [[nodiscard]] static f64 aurora_latitude(f64 kp);

        /// @brief Assemble from the three NOAA products; @p forecast and
        /// @p plasma may be null.
        [[nodiscard]] static LiveOutcome<SpaceWeather> from_products(const nlohmann::json& kp_index,
                                                                     const nlohmann::json* forecast,
                                                                     const nlohmann::json* plasma,
                                                                     const CalculationContext& ctx);

    protected:
        [[nodiscard]] LiveOutcome<SpaceWeather> compute_live(const CalculationContext& ctx,
                                                             SourceFetcher& fetcher) const override;
    };

} // namespace skybrief::sources

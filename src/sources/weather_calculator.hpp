#pragma once

/// @file weather_calculator.hpp
/// @brief Cloud cover for the coming night from the Open-Meteo hourly forecast.

#include "astro/instant.hpp"
#include "sources/calculator.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>

namespace skybrief::sources
{
    /// @brief Clear < 25 %, PartlyCloudy < 50 %, MostlyCloudy < 75 %, Overcast.
    enum class CloudCategory : u8
    {
        Clear,
        PartlyCloudy,
        MostlyCloudy,
        Overcast,
    };

    [[nodiscard]] std::string_view to_string(CloudCategory category);
    [[nodiscard]] CloudCategory categorize_cloud(f64 cloud_pct);

    struct WeatherState
    {
        std::optional<f64>            current_cloud_pct;     ///< Hour containing the instant
        std::optional<f64>            night_mean_cloud_pct;
        std::optional<f64>            night_min_cloud_pct;
        std::optional<astro::Instant> clearest_hour;         ///< Start of the clearest night hour
        i32                           night_hours = 0;

        /// @brief Current cloud cover, else the night mean.
        [[nodiscard]] std::optional<f64> cloud_for_scoring() const;

        [[nodiscard]] std::optional<CloudCategory> category() const;
    };

    /// @brief Live only: there is no offline cloud model.
    class WeatherCalculator final : public Calculator<WeatherState>
    {
    public:
        WeatherCalculator(std::shared_ptr<net::JsonFetcher> fetcher, core::SourceSettings settings);

        [[nodiscard]] Domain domain() const override { return Domain::Weather; }
        [[nodiscard]] bool has_live_source() const override { return true; }

        /// @brief Parse an hourly forecast with cloud_cover and is_day in UTC.
        ///
        /// The night is the first contiguous run of is_day == 0 hours within
        /// the 24 h starting at the hour that contains the instant.
        [[nodiscard]] static LiveOutcome<WeatherState> parse_open_meteo(const nlohmann::json& doc,
                                                                        const CalculationContext& ctx);

    protected:
        [[nodiscard]] LiveOutcome<WeatherState> compute_live(const CalculationContext& ctx,
                                                             SourceFetcher& fetcher) const override;
    };

} // namespace skybrief::sources

#pragma once

/// @file config.hpp
/// @brief Engine configuration and its JSON loader.

#include "core/types.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace skybrief::core
{
    /// @brief Live endpoint settings for one domain.
    struct SourceSettings
    {
        bool                      enabled = true;
        std::string               url;
        std::chrono::milliseconds timeout{10000};
        bool                      retry_on_network_error = true;
    };

    struct LocationSettings
    {
        f64                 latitude_deg  = 0.0;
        f64                 longitude_deg = 0.0;
        std::optional<f64>  elevation_m;
        std::optional<i32>  utc_offset_minutes;
    };

    namespace default_endpoints
    {
        inline constexpr std::string_view kMoon          = "https://aa.usno.navy.mil/api/rstt/oneday";
        inline constexpr std::string_view kSun           = "https://api.sunrise-sunset.org/json";
        inline constexpr std::string_view kPlanets       = "https://api.visibleplanets.dev/v3";
        inline constexpr std::string_view kSpaceWeather  = "https://services.swpc.noaa.gov/products";
        inline constexpr std::string_view kWeather       = "https://api.open-meteo.com/v1/forecast";
    }

    struct EngineConfig
    {
        LocationSettings location;

        SourceSettings moon{.url = std::string{default_endpoints::kMoon}};
        SourceSettings sun{.url = std::string{default_endpoints::kSun}};
        SourceSettings planets{.url = std::string{default_endpoints::kPlanets}};
        SourceSettings space_weather{.url = std::string{default_endpoints::kSpaceWeather},
                                     .timeout = std::chrono::milliseconds{15000}};
        SourceSettings weather{.url = std::string{default_endpoints::kWeather}};

        bool               parallel = true;
        std::optional<i32> bortle;
        i32                meteor_lookahead_days = 60;
        i32                eclipse_horizon_days  = 365;

        spdlog::level::level_enum log_level = spdlog::level::info;
    };

    /// @brief Reads EngineConfig from JSON. Missing keys keep their defaults;
    /// keys of the wrong type or out of range are logged and ignored.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        /// @brief Load and parse a JSON config file.
        /// @return std::nullopt if the file cannot be read or is not valid JSON.
        [[nodiscard]] static std::optional<EngineConfig> load(const std::filesystem::path& path);

        /// @brief Overlay a parsed JSON document onto the defaults.
        [[nodiscard]] static EngineConfig from_json(const nlohmann::json& doc);

        /// @brief "trace" .. "critical", "off".
        [[nodiscard]] static std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);
    };

} // namespace skybrief::core

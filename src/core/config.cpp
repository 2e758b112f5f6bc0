/// @file config.cpp
/// @brief Implementation of the JSON configuration loader.

#include "core/config.hpp"

#include "core/logger.hpp"

#include <fstream>
#include <type_traits>

namespace skybrief::core
{

namespace
{
    using json = nlohmann::json;

    constexpr i32 kMinBortle = 1;
    constexpr i32 kMaxBortle = 9;

    /// @brief Copy doc[key] into @p out when present and of type T.
    /// @return true if @p out was assigned.
    template <typename T>
    bool read_value(const json& doc, const char* key, T& out)
    {
        const auto it = doc.find(key);
        if (it == doc.end() || it->is_null())
        {
            return false;
        }

        bool type_ok = false;
        if constexpr (std::is_same_v<T, bool>)
        {
            type_ok = it->is_boolean();
        }
        else if constexpr (std::is_integral_v<T>)
        {
            type_ok = it->is_number_integer();
        }
        else if constexpr (std::is_floating_point_v<T>)
        {
            type_ok = it->is_number();
        }
        else
        {
            type_ok = it->is_string();
        }

        if (!type_ok)
        {
            SKB_CORE_WARN("ConfigLoader: '{}' has the wrong type ({}), keeping default", key, it->type_name());
            return false;
        }
        out = it->get<T>();
        return true;
    }

    template <typename T>
    void read_optional(const json& doc, const char* key, std::optional<T>& out)
    {
        T value{};
        if (read_value(doc, key, value))
        {
            out = value;
        }
    }

    void read_source(const json& sources, const char* key, SourceSettings& out)
    {
        const auto it = sources.find(key);
        if (it == sources.end())
        {
            return;
        }
        if (!it->is_object())
        {
            SKB_CORE_WARN("ConfigLoader: sources.{} must be an object", key);
            return;
        }

        read_value(*it, "enabled", out.enabled);
        read_value(*it, "url", out.url);
        read_value(*it, "retry_on_network_error", out.retry_on_network_error);

        i64 timeout_ms = 0;
        if (read_value(*it, "timeout_ms", timeout_ms))
        {
            if (timeout_ms > 0)
            {
                out.timeout = std::chrono::milliseconds{timeout_ms};
            }
            else
            {
                SKB_CORE_WARN("ConfigLoader: sources.{}.timeout_ms must be positive", key);
            }
        }
    }

} // namespace

std::optional<EngineConfig> ConfigLoader::load(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SKB_CORE_ERROR("ConfigLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    const json doc = json::parse(file, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object())
    {
        SKB_CORE_ERROR("ConfigLoader: {} is not a JSON object", path.string());
        return std::nullopt;
    }

    SKB_CORE_INFO("ConfigLoader: Loaded {}", path.string());
    return from_json(doc);
}

EngineConfig ConfigLoader::from_json(const json& doc)
{
    EngineConfig cfg;
    if (!doc.is_object())
    {
        return cfg;
    }

    // -----------------------------------------------------------------
    // Location
    // -----------------------------------------------------------------
    if (const auto it = doc.find("location"); it != doc.end() && it->is_object())
    {
        read_value(*it, "latitude", cfg.location.latitude_deg);
        read_value(*it, "longitude", cfg.location.longitude_deg);
        read_optional(*it, "elevation_m", cfg.location.elevation_m);
        read_optional(*it, "utc_offset_minutes", cfg.location.utc_offset_minutes);
    }

    // -----------------------------------------------------------------
    // Sources
    // -----------------------------------------------------------------
    if (const auto it = doc.find("sources"); it != doc.end() && it->is_object())
    {
        read_source(*it, "moon", cfg.moon);
        read_source(*it, "sun", cfg.sun);
        read_source(*it, "planets", cfg.planets);
        read_source(*it, "space_weather", cfg.space_weather);
        read_source(*it, "weather", cfg.weather);
    }

    // -----------------------------------------------------------------
    // Engine
    // -----------------------------------------------------------------
    read_value(doc, "parallel", cfg.parallel);
    read_value(doc, "meteor_lookahead_days", cfg.meteor_lookahead_days);
    read_value(doc, "eclipse_horizon_days", cfg.eclipse_horizon_days);

    read_optional(doc, "bortle", cfg.bortle);
    if (cfg.bortle && (*cfg.bortle < kMinBortle || *cfg.bortle > kMaxBortle))
    {
        SKB_CORE_WARN("ConfigLoader: bortle {} outside [{}, {}], ignoring", *cfg.bortle, kMinBortle, kMaxBortle);
        cfg.bortle.reset();
    }

    if (cfg.meteor_lookahead_days < 0)
    {
        cfg.meteor_lookahead_days = 0;
    }
    if (cfg.eclipse_horizon_days < 0)
    {
        cfg.eclipse_horizon_days = 0;
    }

    if (const auto it = doc.find("log"); it != doc.end() && it->is_object())
    {
        std::string level_name;
        read_value(*it, "level", level_name);
        if (!level_name.empty())
        {
            if (const auto level = parse_log_level(level_name))
            {
                cfg.log_level = *level;
            }
            else
            {
                SKB_CORE_WARN("ConfigLoader: unknown log level '{}'", level_name);
            }
        }
    }

    return cfg;
}

std::optional<spdlog::level::level_enum> ConfigLoader::parse_log_level(std::string_view name)
{
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return std::nullopt;
}

} // namespace skybrief::core

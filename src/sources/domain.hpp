#pragma once

/// @file domain.hpp
/// @brief The data domains a briefing is assembled from.

#include "core/types.hpp"

#include <array>
#include <string_view>

namespace skybrief::sources
{
    enum class Domain : u8
    {
        Moon,
        Sun,
        Planets,
        MeteorShowers,
        Eclipses,
        SpaceWeather,
        Weather,
    };

    inline constexpr std::array<Domain, 7> kAllDomains{
        Domain::Moon, Domain::Sun, Domain::Planets, Domain::MeteorShowers,
        Domain::Eclipses, Domain::SpaceWeather, Domain::Weather,
    };

    /// @brief snake_case key used in records and logs.
    [[nodiscard]] constexpr std::string_view to_string(Domain domain)
    {
        switch (domain)
        {
            case Domain::Moon:          return "moon";
            case Domain::Sun:           return "sun";
            case Domain::Planets:       return "planets";
            case Domain::MeteorShowers: return "meteor_showers";
            case Domain::Eclipses:      return "eclipses";
            case Domain::SpaceWeather:  return "space_weather";
            case Domain::Weather:       return "weather";
        }
        return "unknown";
    }

    /// @brief Human wording for narrative caveats.
    [[nodiscard]] constexpr std::string_view display_name(Domain domain)
    {
        switch (domain)
        {
            case Domain::Moon:          return "moon";
            case Domain::Sun:           return "sun and twilight";
            case Domain::Planets:       return "planet";
            case Domain::MeteorShowers: return "meteor shower";
            case Domain::Eclipses:      return "eclipse";
            case Domain::SpaceWeather:  return "space weather";
            case Domain::Weather:       return "cloud cover";
        }
        return "unknown";
    }

} // namespace skybrief::sources

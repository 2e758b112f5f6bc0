#pragma once

/// @file geo_location.hpp
/// @brief Observer location value and whole-run input validation.

#include "astro/coordinates.hpp"
#include "astro/instant.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace skybrief::sources
{
    /// @brief Geographic location in degrees. Passed by value everywhere.
    struct GeoLocation
    {
        f64                latitude_deg  = 0.0;   ///< [-90, 90], north positive
        f64                longitude_deg = 0.0;   ///< [-180, 180], east positive
        std::optional<f64> elevation_m;
        std::optional<i32> utc_offset_minutes;    ///< Overrides the instant's own offset

        [[nodiscard]] astro::ObserverLocation observer() const;
    };

    /// @brief Earliest and latest supported calculation years.
    inline constexpr i32 kMinSupportedYear = 1900;
    inline constexpr i32 kMaxSupportedYear = 2100;

    /// @return A description of what is wrong, or std::nullopt if the location is usable.
    [[nodiscard]] std::optional<std::string> validate(const GeoLocation& location);

    /// @return A description of what is wrong, or std::nullopt if the instant is usable.
    [[nodiscard]] std::optional<std::string> validate(const astro::Instant& instant);

    /// @brief Throws InvalidInputError if either input is unusable.
    void require_valid(const GeoLocation& location, const astro::Instant& instant);

    /// @brief The instant as seen from @p location: the location's offset if it
    /// has one, else the instant's own.
    [[nodiscard]] astro::Instant local_instant(const GeoLocation& location, const astro::Instant& instant);

} // namespace skybrief::sources

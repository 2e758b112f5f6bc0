/// @file geo_location.cpp
/// @brief GeoLocation helpers and input validation.

#include "sources/geo_location.hpp"

#include "core/errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdlib>

namespace skybrief::sources
{

astro::ObserverLocation GeoLocation::observer() const
{
    return astro::ObserverLocation{
        .latitude_rad  = latitude_deg * astro_constants::kDegToRad,
        .longitude_rad = longitude_deg * astro_constants::kDegToRad,
    };
}

std::optional<std::string> validate(const GeoLocation& location)
{
    if (!std::isfinite(location.latitude_deg) || location.latitude_deg < -90.0 || location.latitude_deg > 90.0)
    {
        return fmt::format("latitude {} is outside [-90, 90]", location.latitude_deg);
    }
    if (!std::isfinite(location.longitude_deg) || location.longitude_deg < -180.0 || location.longitude_deg > 180.0)
    {
        return fmt::format("longitude {} is outside [-180, 180]", location.longitude_deg);
    }
    if (location.elevation_m && !std::isfinite(*location.elevation_m))
    {
        return std::string{"elevation is not a finite number"};
    }
    if (location.utc_offset_minutes
        && std::abs(*location.utc_offset_minutes) > astro::Instant::kMaxUtcOffset.count())
    {
        return fmt::format("UTC offset {} min is outside ±14 h", *location.utc_offset_minutes);
    }
    return std::nullopt;
}

std::optional<std::string> validate(const astro::Instant& instant)
{
    const auto year = static_cast<i32>(instant.local_date().year());
    if (year < kMinSupportedYear || year > kMaxSupportedYear)
    {
        return fmt::format("year {} is outside the supported range {}-{}",
                           year, kMinSupportedYear, kMaxSupportedYear);
    }
    return std::nullopt;
}

void require_valid(const GeoLocation& location, const astro::Instant& instant)
{
    if (auto problem = validate(location))
    {
        throw InvalidInputError("invalid location: " + *problem);
    }
    if (auto problem = validate(instant))
    {
        throw InvalidInputError("invalid instant: " + *problem);
    }
}

astro::Instant local_instant(const GeoLocation& location, const astro::Instant& instant)
{
    if (location.utc_offset_minutes)
    {
        return instant.with_offset(std::chrono::minutes{*location.utc_offset_minutes});
    }
    return instant;
}

} // namespace skybrief::sources
